#include <catch2/catch_test_macros.hpp>

#include "agri-yield/models/decision_tree.hpp"
#include "agri-yield/models/model_bank.hpp"
#include "common/artifact_helpers.hpp"

#include <cmath>
#include <limits>
#include <stdexcept>

using namespace agriyield::models;
using agriyield::core::FeatureFrame;

namespace {

/// Returns a fixed value; records nothing about its input.
class ConstantRegressor final : public IRegressor {
public:
	ConstantRegressor(double value, std::size_t width) : value_(value), width_(width) {
	}

	double predict(const std::vector<double> &row) const override {
		checkRowWidth("Constant", row, width_);
		return value_;
	}

	std::optional<std::vector<std::string>> featureNames() const override {
		return std::nullopt;
	}

	std::size_t numFeatures() const override {
		return width_;
	}

	std::string getName() const override {
		return "Constant";
	}

private:
	double value_;
	std::size_t width_;
};

/// Returns the sum of weighted inputs so that column order is observable.
class WeightedSumRegressor final : public IRegressor {
public:
	explicit WeightedSumRegressor(std::vector<double> weights) : weights_(std::move(weights)) {
	}

	double predict(const std::vector<double> &row) const override {
		checkRowWidth("WeightedSum", row, weights_.size());
		double sum = 0.0;
		for (std::size_t i = 0; i < row.size(); ++i) {
			sum += weights_[i] * row[i];
		}
		return sum;
	}

	std::optional<std::vector<std::string>> featureNames() const override {
		return std::nullopt;
	}

	std::size_t numFeatures() const override {
		return weights_.size();
	}

	std::string getName() const override {
		return "WeightedSum";
	}

private:
	std::vector<double> weights_;
};

ModelEntry entry(const std::string &name, std::shared_ptr<const IRegressor> model,
                 std::optional<std::vector<std::string>> expected = std::nullopt) {
	ModelEntry result;
	result.name = name;
	result.model = std::move(model);
	result.expected_columns = std::move(expected);
	return result;
}

FeatureFrame scaledRow() {
	FeatureFrame frame;
	frame.setNumeric("temp_range", {2.0});
	frame.setNumeric("province_name_An Giang", {1.0});
	frame.setNumeric("precipitation", {10.0});
	return frame;
}

ModelSpec forestSpec(std::vector<std::vector<std::string>> candidates) {
	ModelSpec spec;
	spec.name = "rf";
	spec.format = ModelFormat::RandomForestJson;
	spec.candidates = std::move(candidates);
	return spec;
}

} // namespace

TEST_CASE("File patterns support star and question mark") {
	REQUIRE(matchesPattern("xgb_yield_model.json", "xgb_yield_model.json"));
	REQUIRE(matchesPattern("model_v2.cbm.json", "*.cbm.json"));
	REQUIRE(matchesPattern("best_random_forest_2024.json", "*random_forest*.json"));
	REQUIRE(matchesPattern("rf_1.json", "rf_?.json"));
	REQUIRE_FALSE(matchesPattern("rf_10.json", "rf_?.json"));
	REQUIRE_FALSE(matchesPattern("model.cbm", "*.cbm.json"));
	REQUIRE(matchesPattern("", "*"));
	REQUIRE_FALSE(matchesPattern("a", ""));
}

TEST_CASE("Column name rewrite only touches prefixed columns") {
	ColumnNameRewrite rewrite;
	rewrite.prefixes = {"province_name_"};
	REQUIRE(rewrite.apply("province_name_Ba Ria Vung Tau") == "province_name_Ba_Ria_Vung_Tau");
	REQUIRE(rewrite.apply("season spring") == "season spring");
}

TEST_CASE("Model file selection prefers the newest match of the first matching group") {
	tests::helpers::TempDir dir;
	const auto old_file = dir.file("old_random_forest.json");
	const auto new_file = dir.file("new_random_forest.json");
	tests::helpers::writeFile(old_file, "{}");
	tests::helpers::writeFile(new_file, "{}");
	tests::helpers::ageFile(old_file, 3600);
	tests::helpers::writeFile(dir.file("rf_fallback.json"), "{}");
	// Sidecars never count as models, however new
	tests::helpers::writeFile(dir.file("x_random_forest.json.columns.json"), "[]");

	const auto spec = forestSpec({{"*random_forest*.json"}, {"rf_*.json"}});
	REQUIRE(selectModelFile(dir.path().string(), spec) == new_file);

	tests::helpers::ageFile(new_file, 7200);
	REQUIRE(selectModelFile(dir.path().string(), spec) == old_file);

	const auto fallback = forestSpec({{"*.nothing"}, {"rf_*.json"}});
	REQUIRE(selectModelFile(dir.path().string(), fallback) == dir.file("rf_fallback.json"));

	REQUIRE_FALSE(selectModelFile(dir.path().string(), forestSpec({{"*.cbm.json"}})).has_value());
	REQUIRE_FALSE(selectModelFile(dir.file("absent"), spec).has_value());
}

TEST_CASE("Column sidecars accept arrays and feature_names objects") {
	tests::helpers::TempDir dir;
	const auto model = dir.file("model.json");
	REQUIRE_FALSE(readColumnsSidecar(model).has_value());

	tests::helpers::writeFile(model + ".columns.json", R"(["b", "a"])");
	REQUIRE(readColumnsSidecar(model) == std::vector<std::string>{"b", "a"});

	tests::helpers::writeFile(model + ".columns.json", R"({"feature_names": ["c"]})");
	REQUIRE(readColumnsSidecar(model) == std::vector<std::string>{"c"});

	tests::helpers::writeFile(model + ".columns.json", R"({"columns": 3})");
	REQUIRE_THROWS_AS(readColumnsSidecar(model), std::invalid_argument);
}

TEST_CASE("Aligned rows follow the model's declared order") {
	const auto model = std::make_shared<WeightedSumRegressor>(std::vector<double>{1.0, 100.0});
	const auto bank_entry = entry("m", model, std::vector<std::string>{"precipitation", "temp_range"});

	REQUIRE(ModelBank::alignRow(bank_entry, scaledRow()) == std::vector<double>{10.0, 2.0});
}

TEST_CASE("Aligned rows drop expected columns the frame lacks before the width check") {
	const auto bank_entry = entry("m", std::make_shared<ConstantRegressor>(0.0, 1),
	                              std::vector<std::string>{"temp_range", "never_seen"});
	REQUIRE(ModelBank::alignRow(bank_entry, scaledRow()) == std::vector<double>{2.0});

	const auto too_wide = entry("m", std::make_shared<ConstantRegressor>(0.0, 2),
	                            std::vector<std::string>{"temp_range", "never_seen"});
	REQUIRE_THROWS_AS(ModelBank::alignRow(too_wide, scaledRow()), std::invalid_argument);
}

TEST_CASE("Aligned rows apply the column name rewrite") {
	auto bank_entry = entry("lgb", std::make_shared<ConstantRegressor>(0.0, 2),
	                        std::vector<std::string>{"province_name_An_Giang", "temp_range"});
	REQUIRE_THROWS_AS(ModelBank::alignRow(bank_entry, scaledRow()), std::invalid_argument);

	bank_entry.column_name_rewrite = ColumnNameRewrite{{"province_name_"}, ' ', '_'};
	REQUIRE(ModelBank::alignRow(bank_entry, scaledRow()) == std::vector<double>{1.0, 2.0});
}

TEST_CASE("Unconstrained models take every column in frame order") {
	const auto bank_entry = entry("m", std::make_shared<ConstantRegressor>(0.0, 3));
	REQUIRE(ModelBank::alignRow(bank_entry, scaledRow()) == std::vector<double>{2.0, 1.0, 10.0});

	auto frame = scaledRow();
	frame.setText("season", {"spring"});
	const auto wider = entry("m", std::make_shared<ConstantRegressor>(0.0, 4));
	REQUIRE_THROWS_AS(ModelBank::alignRow(wider, frame), std::invalid_argument);
}

TEST_CASE("Scoring skips failing and non-finite models") {
	ModelBank bank;
	bank.add(entry("good", std::make_shared<ConstantRegressor>(1.5, 3)));
	bank.add(entry("wrong_width", std::make_shared<ConstantRegressor>(2.0, 5)));
	bank.add(entry("nan", std::make_shared<ConstantRegressor>(std::numeric_limits<double>::quiet_NaN(), 3)));
	bank.add(entry("inf", std::make_shared<ConstantRegressor>(std::numeric_limits<double>::infinity(), 3)));

	const auto predictions = bank.score(scaledRow());
	REQUIRE(predictions.size() == 1);
	REQUIRE(predictions.at("good") == 1.5);
}

TEST_CASE("Model bank rejects duplicate names and null models") {
	ModelBank bank;
	bank.add(entry("rf", std::make_shared<ConstantRegressor>(1.0, 1)));
	REQUIRE(bank.contains("rf"));
	REQUIRE_THROWS_AS(bank.add(entry("rf", std::make_shared<ConstantRegressor>(2.0, 1))), std::invalid_argument);
	REQUIRE_THROWS_AS(bank.add(entry("lgb", nullptr)), std::invalid_argument);
	REQUIRE(bank.names() == std::vector<std::string>{"rf"});
}

TEST_CASE("Model bank loads what it can find and skips the rest") {
	tests::helpers::TempDir dir;
	tests::helpers::writeFile(dir.file("rf_main.json"),
	                          tests::helpers::constantForestJson(3.0, R"(["temp_range"])", 1));
	tests::helpers::writeFile(dir.file("broken.cbm.json"), "{ not json");

	ModelSpec cat;
	cat.name = "cat";
	cat.format = ModelFormat::CatBoostJson;
	cat.candidates = {{"*.cbm.json"}};

	ModelSpec xgb;
	xgb.name = "xgb";
	xgb.format = ModelFormat::XGBoostJson;
	xgb.candidates = {{"xgb_yield_model.json"}};

	const auto bank = ModelBank::load(dir.path().string(), {forestSpec({{"rf_*.json"}}), cat, xgb});
	REQUIRE(bank.names() == std::vector<std::string>{"rf"});
	const auto &rf = bank.entries().front();
	REQUIRE(rf.source == dir.file("rf_main.json"));
	REQUIRE(rf.expected_columns == std::vector<std::string>{"temp_range"});

	const auto predictions = bank.score(scaledRow());
	REQUIRE(predictions.at("rf") == 3.0);
}

TEST_CASE("Column sidecar overrides the names recorded in the model") {
	tests::helpers::TempDir dir;
	const auto path = dir.file("rf_main.json");
	tests::helpers::writeFile(path, tests::helpers::constantForestJson(3.0, R"(["temp_range"])", 1));
	tests::helpers::writeFile(path + ".columns.json", R"(["precipitation"])");

	const auto bank = ModelBank::load(dir.path().string(), {forestSpec({{"rf_*.json"}})});
	REQUIRE(bank.entries().front().expected_columns == std::vector<std::string>{"precipitation"});
}

TEST_CASE("Model bank from a missing directory is empty") {
	tests::helpers::TempDir dir;
	const auto bank = ModelBank::load(dir.file("absent"), {forestSpec({{"rf_*.json"}})});
	REQUIRE(bank.empty());
	REQUIRE(bank.score(scaledRow()).empty());
}
