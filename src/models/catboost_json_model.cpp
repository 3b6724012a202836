#include "agri-yield/models/decision_tree.hpp"
#include "agri-yield/models/model_readers.hpp"
#include "agri-yield/models/oblivious_trees.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cmath>
#include <stdexcept>

using json = nlohmann::json;

namespace agriyield::models {

ObliviousTreeEnsemble::ObliviousTreeEnsemble(std::vector<Tree> trees, std::size_t num_features,
                                             std::optional<std::vector<std::string>> feature_names, double scale,
                                             double bias)
	: trees_(std::move(trees)), num_features_(num_features), feature_names_(std::move(feature_names)),
	  scale_(scale), bias_(bias) {
	if (trees_.empty()) {
		throw std::invalid_argument("CatBoost model contains no trees.");
	}
	for (const auto &tree : trees_) {
		if (tree.splits.size() >= 32 || tree.leaf_values.size() != (std::size_t{1} << tree.splits.size())) {
			throw std::invalid_argument("CatBoost tree of depth " + std::to_string(tree.splits.size()) + " has " +
			                            std::to_string(tree.leaf_values.size()) + " leaf values.");
		}
		for (const auto &split : tree.splits) {
			if (split.feature >= num_features_) {
				throw std::invalid_argument("CatBoost model splits on a feature beyond its feature count.");
			}
		}
	}
}

double ObliviousTreeEnsemble::predict(const std::vector<double> &row) const {
	checkRowWidth("CatBoost", row, num_features_);
	double sum = 0.0;
	for (const auto &tree : trees_) {
		std::size_t leaf = 0;
		for (std::size_t depth = 0; depth < tree.splits.size(); ++depth) {
			const auto &split = tree.splits[depth];
			const double value = row[split.feature];
			const bool bit = std::isnan(value) ? split.nan_is_true : value > split.border;
			leaf |= static_cast<std::size_t>(bit) << depth;
		}
		sum += tree.leaf_values[leaf];
	}
	return scale_ * sum + bias_;
}

std::optional<std::vector<std::string>> ObliviousTreeEnsemble::featureNames() const {
	return feature_names_;
}

std::size_t ObliviousTreeEnsemble::numFeatures() const {
	return num_features_;
}

std::string ObliviousTreeEnsemble::getName() const {
	return "CatBoost";
}

namespace {

struct FloatFeatureInfo {
	std::size_t input_index = 0;
	std::string name;
	bool nan_is_true = false;
};

std::vector<FloatFeatureInfo> parseFloatFeatures(const json &features_info) {
	if (features_info.contains("categorical_features") && !features_info.at("categorical_features").empty()) {
		throw std::invalid_argument("CatBoost models with categorical features are not supported.");
	}
	std::vector<FloatFeatureInfo> features;
	for (const auto &feature : features_info.value("float_features", json::array())) {
		FloatFeatureInfo info;
		info.input_index = feature.contains("flat_feature_index") ? feature.at("flat_feature_index").get<std::size_t>()
		                                                          : feature.at("feature_index").get<std::size_t>();
		info.name = feature.value("feature_id", std::string());
		const auto treatment = feature.value("nan_value_treatment", std::string("AsIs"));
		if (treatment == "AsTrue") {
			info.nan_is_true = true;
		} else if (treatment != "AsIs" && treatment != "AsFalse") {
			throw std::invalid_argument("Unknown CatBoost nan_value_treatment '" + treatment + "'.");
		}
		features.push_back(std::move(info));
	}
	return features;
}

} // namespace

std::unique_ptr<IRegressor> readCatBoostJson(const std::string &text) {
	try {
		const json root = json::parse(text);
		const auto features = parseFloatFeatures(root.at("features_info"));

		std::size_t num_features = 0;
		for (const auto &feature : features) {
			num_features = std::max(num_features, feature.input_index + 1);
		}
		std::vector<std::string> names(num_features);
		for (const auto &feature : features) {
			names[feature.input_index] = feature.name;
		}
		const bool named = !names.empty() && std::none_of(names.begin(), names.end(), [](const std::string &name) {
			return name.empty();
		});

		std::vector<ObliviousTreeEnsemble::Tree> trees;
		for (const auto &tree_json : root.at("oblivious_trees")) {
			ObliviousTreeEnsemble::Tree tree;
			for (const auto &split_json : tree_json.value("splits", json::array())) {
				const auto type = split_json.value("split_type", std::string("FloatFeature"));
				if (type != "FloatFeature") {
					throw std::invalid_argument("CatBoost split type '" + type + "' is not supported.");
				}
				const auto index = split_json.at("float_feature_index").get<std::size_t>();
				if (index >= features.size()) {
					throw std::invalid_argument("CatBoost split references an unknown float feature.");
				}
				ObliviousTreeEnsemble::Split split;
				split.feature = features[index].input_index;
				split.border = split_json.at("border").get<double>();
				split.nan_is_true = features[index].nan_is_true;
				tree.splits.push_back(split);
			}
			tree.leaf_values = tree_json.at("leaf_values").get<std::vector<double>>();
			trees.push_back(std::move(tree));
		}

		double scale = 1.0;
		double bias = 0.0;
		if (root.contains("scale_and_bias")) {
			const auto &scale_and_bias = root.at("scale_and_bias");
			scale = scale_and_bias.at(0).get<double>();
			const auto &bias_json = scale_and_bias.at(1);
			if (bias_json.is_array()) {
				if (bias_json.size() > 1) {
					throw std::invalid_argument("Multi-dimensional CatBoost models are not supported.");
				}
				bias = bias_json.empty() ? 0.0 : bias_json.at(0).get<double>();
			} else {
				bias = bias_json.get<double>();
			}
		}

		std::optional<std::vector<std::string>> feature_names;
		if (named) {
			feature_names = std::move(names);
		}
		return std::make_unique<ObliviousTreeEnsemble>(std::move(trees), num_features, std::move(feature_names), scale,
		                                               bias);
	} catch (const json::exception &e) {
		throw std::invalid_argument(std::string("Malformed CatBoost model: ") + e.what());
	}
}

} // namespace agriyield::models
