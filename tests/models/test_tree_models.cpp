#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "agri-yield/models/decision_tree.hpp"
#include "agri-yield/models/model_readers.hpp"
#include "common/artifact_helpers.hpp"

#include <cmath>
#include <limits>
#include <stdexcept>

using namespace agriyield::models;
using Catch::Matchers::WithinAbs;

namespace {

const double kNaN = std::numeric_limits<double>::quiet_NaN();

// Two trees over (x0, x1). Tree 0: x0 <= 0.5 ? 1 : (x1 <= 2 ? 2 : 3), missing
// routed as NaN (default left at the root). Tree 1: a single leaf of 0.25.
const char *const kLightGBMModel = R"(tree
version=v4
num_class=1
num_tree_per_iteration=1
label_index=0
max_feature_idx=1
objective=regression
feature_names=province_name_An_Giang temp_range
feature_infos=[0:1] [1:12]

Tree=0
num_leaves=3
num_cat=0
split_feature=0 1
split_gain=1 1
threshold=0.5 2
decision_type=10 4
left_child=-1 -2
right_child=1 -3
leaf_value=1 2 3
leaf_weight=1 1 1
leaf_count=1 1 1
internal_value=0 0
internal_weight=0 0
internal_count=3 2
is_linear=0
shrinkage=1

Tree=1
num_leaves=1
num_cat=0
split_feature=
split_gain=
threshold=
decision_type=
left_child=
right_child=
leaf_value=0.25
leaf_weight=0
leaf_count=0
internal_value=
internal_weight=
internal_count=
is_linear=0
shrinkage=1

end of trees

feature_importances:
province_name_An_Giang=1
temp_range=1
)";

std::string lightgbmWithHeader(const std::string &from, const std::string &to) {
	std::string text = kLightGBMModel;
	text.replace(text.find(from), from.size(), to);
	return text;
}

// One tree: x1 < 5 ? -1 : 1, missing goes right; base_score 0.5.
const char *const kXGBoostModel = R"({
  "learner": {
    "attributes": {},
    "feature_names": ["temp_range", "precipitation"],
    "feature_types": ["float", "float"],
    "gradient_booster": {
      "model": {
        "gbtree_model_param": {"num_parallel_tree": "1", "num_trees": "1"},
        "iteration_indptr": [0, 1],
        "tree_info": [0],
        "trees": [{
          "base_weights": [0.0, -1.0, 1.0],
          "categories": [],
          "categories_nodes": [],
          "categories_segments": [],
          "categories_sizes": [],
          "default_left": [0, 0, 0],
          "id": 0,
          "left_children": [1, -1, -1],
          "loss_changes": [1.0, 0.0, 0.0],
          "parents": [2147483647, 0, 0],
          "right_children": [2, -1, -1],
          "split_conditions": [5.0, -1.0, 1.0],
          "split_indices": [1, 0, 0],
          "split_type": [0, 0, 0],
          "sum_hessian": [3.0, 1.0, 2.0],
          "tree_param": {"num_deleted": "0", "num_feature": "2", "num_nodes": "3", "size_leaf_vector": "1"}
        }]
      },
      "name": "gbtree"
    },
    "learner_model_param": {"base_score": "5E-1", "boost_from_average": "1", "num_class": "0",
                            "num_feature": "2", "num_target": "1"},
    "objective": {"name": "reg:squarederror", "reg_loss_param": {"scale_pos_weight": "1"}}
  },
  "version": [2, 0, 3]
})";

std::string xgboostWith(const std::string &from, const std::string &to) {
	std::string text = kXGBoostModel;
	text.replace(text.find(from), from.size(), to);
	return text;
}

// Depth-2 oblivious tree over (a, b) plus a constant stump.
const char *const kCatBoostModel = R"({
  "features_info": {
    "float_features": [
      {"feature_index": 0, "flat_feature_index": 0, "feature_id": "a", "nan_value_treatment": "AsTrue",
       "borders": [1.0]},
      {"feature_index": 1, "flat_feature_index": 1, "feature_id": "b", "nan_value_treatment": "AsFalse",
       "borders": [10.0]}
    ]
  },
  "oblivious_trees": [
    {"splits": [{"float_feature_index": 0, "border": 1.0, "split_type": "FloatFeature"},
                {"float_feature_index": 1, "border": 10.0, "split_type": "FloatFeature"}],
     "leaf_values": [0.0, 1.0, 2.0, 3.0]},
    {"leaf_values": [0.5]}
  ],
  "scale_and_bias": [2.0, [10.0]]
})";

// Two stumps on x0 (threshold 1.5) averaged; second has missing routing.
const char *const kForestModel = R"({
  "format": "random_forest",
  "feature_names": ["temp_range"],
  "n_features": 1,
  "trees": [
    {"children_left": [1, -1, -1], "children_right": [2, -1, -1], "feature": [0, -2, -2],
     "threshold": [1.5, -2.0, -2.0], "value": [[[5.0]], [[2.0]], [[4.0]]]},
    {"children_left": [1, -1, -1], "children_right": [2, -1, -1], "feature": [0, -2, -2],
     "threshold": [1.5, -2.0, -2.0], "value": [[[5.0]], [[6.0]], [[8.0]]],
     "missing_go_to_left": [1, 0, 0]}
  ]
})";

} // namespace

TEST_CASE("DecisionTree goes left at the threshold") {
	std::vector<DecisionTree::Node> nodes(3);
	nodes[0].left = 1;
	nodes[0].right = 2;
	nodes[0].feature = 0;
	nodes[0].threshold = 1.0;
	nodes[1].value = -1.0;
	nodes[2].value = 1.0;

	const DecisionTree tree(nodes);
	REQUIRE(tree.evaluate({1.0}) == -1.0);
	REQUIRE(tree.evaluate({1.5}) == 1.0);
	// NaN fails every comparison
	REQUIRE(tree.evaluate({kNaN}) == 1.0);
	REQUIRE(tree.maxFeatureIndex() == 0);
}

TEST_CASE("DecisionTree routes missing values by policy") {
	std::vector<DecisionTree::Node> nodes(3);
	nodes[0].left = 1;
	nodes[0].right = 2;
	nodes[0].feature = 0;
	nodes[0].threshold = -1.0;
	nodes[0].default_left = true;
	nodes[1].value = 10.0;
	nodes[2].value = 20.0;

	REQUIRE(DecisionTree(nodes).evaluate({kNaN}) == 20.0);

	nodes[0].missing = DecisionTree::MissingPolicy::NanToDefault;
	REQUIRE(DecisionTree(nodes).evaluate({kNaN}) == 10.0);
	REQUIRE(DecisionTree(nodes).evaluate({0.0}) == 20.0);
}

TEST_CASE("DecisionTree rejects malformed node arrays") {
	REQUIRE_THROWS_AS(DecisionTree({}), std::invalid_argument);

	std::vector<DecisionTree::Node> cyclic(2);
	cyclic[0].left = 0;
	cyclic[0].right = 1;
	cyclic[0].feature = 0;
	REQUIRE_THROWS_AS(DecisionTree(cyclic), std::invalid_argument);

	std::vector<DecisionTree::Node> out_of_range(2);
	out_of_range[0].left = 1;
	out_of_range[0].right = 5;
	out_of_range[0].feature = 0;
	REQUIRE_THROWS_AS(DecisionTree(out_of_range), std::invalid_argument);
}

TEST_CASE("LightGBM booster sums trees and keeps feature names", "[models][lightgbm]") {
	const auto model = readLightGBMText(kLightGBMModel);
	REQUIRE(model->getName() == "LightGBM");
	REQUIRE(model->numFeatures() == 2);
	REQUIRE(model->featureNames() == std::vector<std::string>{"province_name_An_Giang", "temp_range"});

	REQUIRE_THAT(model->predict({0.0, 1.0}), WithinAbs(1.25, 1e-12));
	REQUIRE_THAT(model->predict({1.0, 2.0}), WithinAbs(2.25, 1e-12));
	REQUIRE_THAT(model->predict({1.0, 2.5}), WithinAbs(3.25, 1e-12));
	// Root is NaN-missing with default left, second split is zero-missing with default right
	REQUIRE_THAT(model->predict({kNaN, 9.0}), WithinAbs(1.25, 1e-12));
	REQUIRE_THAT(model->predict({1.0, 0.0}), WithinAbs(3.25, 1e-12));

	REQUIRE_THROWS_AS(model->predict({1.0}), std::invalid_argument);
}

TEST_CASE("LightGBM booster averages random-forest boosters", "[models][lightgbm]") {
	const auto model =
	    readLightGBMText(lightgbmWithHeader("objective=regression\n", "objective=regression\naverage_output\n"));
	REQUIRE_THAT(model->predict({0.0, 0.0}), WithinAbs((1.0 + 0.25) / 2.0, 1e-12));
}

TEST_CASE("LightGBM booster drops generated column names", "[models][lightgbm]") {
	const auto model = readLightGBMText(
	    lightgbmWithHeader("feature_names=province_name_An_Giang temp_range", "feature_names=Column_0 Column_1"));
	REQUIRE_FALSE(model->featureNames().has_value());
	REQUIRE(model->numFeatures() == 2);
}

TEST_CASE("LightGBM booster rejects malformed and multi-class models", "[models][lightgbm]") {
	REQUIRE_THROWS_AS(readLightGBMText(lightgbmWithHeader("leaf_value=1 2 3", "leaf_value=1 2")),
	                  std::invalid_argument);
	REQUIRE_THROWS_AS(readLightGBMText(lightgbmWithHeader("num_class=1\nnum_tree_per_iteration=1",
	                                                      "num_class=2\nnum_tree_per_iteration=2")),
	                  std::invalid_argument);
	REQUIRE_THROWS_AS(readLightGBMText("tree\nversion=v4\n"), std::invalid_argument);
}

TEST_CASE("XGBoost booster applies the base score and its own split rule", "[models][xgboost]") {
	const auto model = readXGBoostJson(kXGBoostModel);
	REQUIRE(model->getName() == "XGBoost");
	REQUIRE(model->numFeatures() == 2);
	REQUIRE(model->featureNames() == std::vector<std::string>{"temp_range", "precipitation"});

	REQUIRE_THAT(model->predict({0.0, 4.0}), WithinAbs(-0.5, 1e-6));
	REQUIRE_THAT(model->predict({0.0, 5.0}), WithinAbs(1.5, 1e-6));
	REQUIRE_THAT(model->predict({0.0, kNaN}), WithinAbs(1.5, 1e-6));
	REQUIRE_THROWS_AS(model->predict({0.0}), std::invalid_argument);
}

TEST_CASE("XGBoost booster compares in single precision", "[models][xgboost]") {
	const auto model = readXGBoostJson(xgboostWith(R"("split_conditions": [5.0,)", R"("split_conditions": [1E-1,)"));
	// 0.09999999999 rounds to the stored 0.1f, which is not below the threshold
	REQUIRE_THAT(model->predict({0.0, 0.09999999999}), WithinAbs(1.5, 1e-6));
	REQUIRE_THAT(model->predict({0.0, 0.09}), WithinAbs(-0.5, 1e-6));
}

TEST_CASE("XGBoost booster without feature names", "[models][xgboost]") {
	const auto model = readXGBoostJson(xgboostWith(R"("feature_names": ["temp_range", "precipitation"],
    "feature_types": ["float", "float"],)",
	                                               R"("feature_names": [],
    "feature_types": [],)"));
	REQUIRE_FALSE(model->featureNames().has_value());
	REQUIRE(model->numFeatures() == 2);
}

TEST_CASE("XGBoost booster rejects malformed models", "[models][xgboost]") {
	REQUIRE_THROWS_AS(readXGBoostJson("{}"), std::invalid_argument);
	REQUIRE_THROWS_AS(readXGBoostJson("{ not json"), std::invalid_argument);
}

TEST_CASE("CatBoost JSON model evaluates oblivious trees") {
	const auto model = readCatBoostJson(kCatBoostModel);
	REQUIRE(model->getName() == "CatBoost");
	REQUIRE(model->featureNames() == std::vector<std::string>{"a", "b"});

	// leaf index: bit0 = a > 1, bit1 = b > 10; prediction = 2 * (leaf + 0.5) + 10
	REQUIRE(model->predict({0.0, 0.0}) == 11.0);
	REQUIRE(model->predict({2.0, 0.0}) == 13.0);
	REQUIRE(model->predict({0.0, 11.0}) == 15.0);
	REQUIRE(model->predict({2.0, 11.0}) == 17.0);
	// Border values are not above the border
	REQUIRE(model->predict({1.0, 10.0}) == 11.0);
	REQUIRE(model->predict({kNaN, kNaN}) == 13.0);
}

TEST_CASE("CatBoost JSON model rejects categorical features") {
	std::string text = kCatBoostModel;
	const std::string from = R"("features_info": {)";
	text.replace(text.find(from), from.size(),
	             R"("features_info": {"categorical_features": [{"feature_index": 0, "flat_feature_index": 2}],)");
	REQUIRE_THROWS_AS(readCatBoostJson(text), std::invalid_argument);

	std::string wrong_leaves = kCatBoostModel;
	wrong_leaves.replace(wrong_leaves.find("[0.0, 1.0, 2.0, 3.0]"), 20, "[0.0, 1.0, 2.0]");
	REQUIRE_THROWS_AS(readCatBoostJson(wrong_leaves), std::invalid_argument);
}

TEST_CASE("Random forest JSON model averages its trees") {
	const auto model = readRandomForestJson(kForestModel);
	REQUIRE(model->getName() == "RandomForest");
	REQUIRE(model->featureNames() == std::vector<std::string>{"temp_range"});

	REQUIRE(model->predict({1.5}) == 4.0);
	REQUIRE(model->predict({2.0}) == 6.0);
	// First tree sends NaN right, second follows missing_go_to_left
	REQUIRE(model->predict({kNaN}) == 5.0);
}

TEST_CASE("Random forest JSON model validates its layout") {
	REQUIRE_THROWS_AS(readRandomForestJson(R"({"format": "gradient_boosting", "n_features": 1, "trees": []})"),
	                  std::invalid_argument);
	REQUIRE_THROWS_AS(readRandomForestJson(R"({"trees": []})"), std::invalid_argument);
	REQUIRE_THROWS_AS(readRandomForestJson(R"({"n_features": 1, "trees": []})"), std::invalid_argument);
	REQUIRE_THROWS_AS(readRandomForestJson(tests::helpers::constantForestJson(1.0, R"(["a", "b"])", 1)),
	                  std::invalid_argument);
}

TEST_CASE("Model formats parse by name and load from disk") {
	REQUIRE(parseModelFormat("lightgbm") == ModelFormat::LightGBMText);
	REQUIRE(parseModelFormat("random_forest") == ModelFormat::RandomForestJson);
	REQUIRE(toString(ModelFormat::CatBoostJson) == "catboost");
	REQUIRE_THROWS_AS(parseModelFormat("onnx"), std::invalid_argument);

	tests::helpers::TempDir dir;
	const auto lgb = dir.file("lgb_yield_model.txt");
	tests::helpers::writeFile(lgb, kLightGBMModel);
	REQUIRE_THAT(loadModel(lgb, ModelFormat::LightGBMText)->predict({0.0, 0.0}), WithinAbs(1.25, 1e-12));

	const auto xgb = dir.file("xgb_yield_model.json");
	tests::helpers::writeFile(xgb, kXGBoostModel);
	REQUIRE_THAT(loadModel(xgb, ModelFormat::XGBoostJson)->predict({0.0, 4.0}), WithinAbs(-0.5, 1e-6));

	const auto forest = dir.file("rf.json");
	tests::helpers::writeFile(forest, tests::helpers::constantForestJson(3.0, R"(["temp_range"])", 1));
	REQUIRE_THAT(loadModel(forest, ModelFormat::RandomForestJson)->predict({7.0}), WithinAbs(3.0, 1e-12));

	REQUIRE_THROWS_AS(loadModel(dir.file("absent.json"), ModelFormat::XGBoostJson), std::runtime_error);
	REQUIRE_THROWS_AS(loadModel(lgb, ModelFormat::XGBoostJson), std::invalid_argument);
}
