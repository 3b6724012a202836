#include "agri-yield/models/decision_tree.hpp"
#include "agri-yield/models/model_readers.hpp"

#include <nlohmann/json.hpp>

#include <stdexcept>

using json = nlohmann::json;

namespace agriyield::models {

namespace {

// scikit-learn's TREE_LEAF marker
constexpr int kTreeLeaf = -1;

// tree_.value is shaped (nodes, outputs, classes); regression keeps [0][0].
double leafValue(const json &value) {
	const json *current = &value;
	while (current->is_array()) {
		if (current->empty()) {
			throw std::invalid_argument("Random forest model: empty node value.");
		}
		if (current->size() > 1) {
			throw std::invalid_argument("Random forest model: multi-output trees are not supported.");
		}
		current = &current->at(0);
	}
	return current->get<double>();
}

DecisionTree parseTree(const json &tree) {
	const auto left = tree.at("children_left").get<std::vector<int>>();
	const auto right = tree.at("children_right").get<std::vector<int>>();
	const auto feature = tree.at("feature").get<std::vector<int>>();
	const auto threshold = tree.at("threshold").get<std::vector<double>>();
	const auto &values = tree.at("value");
	const std::size_t count = left.size();
	if (right.size() != count || feature.size() != count || threshold.size() != count || values.size() != count) {
		throw std::invalid_argument("Random forest model: tree arrays have different lengths.");
	}
	const bool has_missing = tree.contains("missing_go_to_left");
	if (has_missing && tree.at("missing_go_to_left").size() != count) {
		throw std::invalid_argument("Random forest model: missing_go_to_left has the wrong length.");
	}

	std::vector<DecisionTree::Node> nodes(count);
	for (std::size_t i = 0; i < count; ++i) {
		auto &node = nodes[i];
		if (left[i] == kTreeLeaf) {
			node.value = leafValue(values.at(i));
			continue;
		}
		node.left = left[i];
		node.right = right[i];
		node.feature = feature[i];
		node.threshold = threshold[i];
		if (has_missing) {
			const auto &go_left = tree.at("missing_go_to_left").at(i);
			node.default_left = go_left.is_boolean() ? go_left.get<bool>() : go_left.get<int>() != 0;
			node.missing = DecisionTree::MissingPolicy::NanToDefault;
		}
	}
	return DecisionTree(std::move(nodes));
}

} // namespace

std::unique_ptr<IRegressor> readRandomForestJson(const std::string &text) {
	try {
		const json root = json::parse(text);
		const auto format = root.value("format", std::string("random_forest"));
		if (format != "random_forest") {
			throw std::invalid_argument("Random forest model: unexpected format '" + format + "'.");
		}

		std::optional<std::vector<std::string>> feature_names;
		if (root.contains("feature_names") && !root.at("feature_names").is_null()) {
			feature_names = root.at("feature_names").get<std::vector<std::string>>();
		}
		std::size_t num_features = 0;
		if (root.contains("n_features")) {
			num_features = root.at("n_features").get<std::size_t>();
		} else if (feature_names) {
			num_features = feature_names->size();
		} else {
			throw std::invalid_argument("Random forest model: neither n_features nor feature_names is given.");
		}

		std::vector<DecisionTree> trees;
		for (const auto &tree : root.at("trees")) {
			trees.push_back(parseTree(tree));
		}
		return std::make_unique<TreeEnsembleRegressor>("RandomForest", std::move(trees), num_features,
		                                               std::move(feature_names), true);
	} catch (const json::exception &e) {
		throw std::invalid_argument(std::string("Malformed random forest model: ") + e.what());
	}
}

} // namespace agriyield::models
