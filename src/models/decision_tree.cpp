#include "agri-yield/models/decision_tree.hpp"

#include <cmath>
#include <stdexcept>
#include <string>

namespace agriyield::models {

void checkRowWidth(const std::string &family, const std::vector<double> &row, std::size_t expected) {
	if (row.size() != expected) {
		throw std::invalid_argument(family + " model expects " + std::to_string(expected) + " features, got " +
		                            std::to_string(row.size()) + ".");
	}
}

DecisionTree::DecisionTree(std::vector<Node> nodes) : nodes_(std::move(nodes)) {
	if (nodes_.empty()) {
		throw std::invalid_argument("DecisionTree: a tree needs at least one node.");
	}
	const auto count = static_cast<int>(nodes_.size());
	for (int i = 0; i < count; ++i) {
		const Node &node = nodes_[static_cast<std::size_t>(i)];
		if (node.isLeaf()) {
			continue;
		}
		// Children always come after their parent, which rules out cycles.
		if (node.left <= i || node.left >= count || node.right <= i || node.right >= count) {
			throw std::invalid_argument("DecisionTree: node " + std::to_string(i) + " has an invalid child index.");
		}
		if (node.feature < 0) {
			throw std::invalid_argument("DecisionTree: node " + std::to_string(i) + " splits on a negative feature.");
		}
	}
}

double DecisionTree::evaluate(const std::vector<double> &row) const {
	const Node *node = &nodes_.front();
	while (!node->isLeaf()) {
		const double value = row[static_cast<std::size_t>(node->feature)];
		bool go_left;
		if (node->missing == MissingPolicy::NanToDefault && std::isnan(value)) {
			go_left = node->default_left;
		} else {
			go_left = value <= node->threshold;
		}
		node = &nodes_[static_cast<std::size_t>(go_left ? node->left : node->right)];
	}
	return node->value;
}

int DecisionTree::maxFeatureIndex() const noexcept {
	int max_index = -1;
	for (const auto &node : nodes_) {
		if (!node.isLeaf() && node.feature > max_index) {
			max_index = node.feature;
		}
	}
	return max_index;
}

TreeEnsembleRegressor::TreeEnsembleRegressor(std::string family, std::vector<DecisionTree> trees,
                                             std::size_t num_features,
                                             std::optional<std::vector<std::string>> feature_names,
                                             bool average)
	: family_(std::move(family)), trees_(std::move(trees)), num_features_(num_features),
	  feature_names_(std::move(feature_names)), average_(average) {
	if (trees_.empty()) {
		throw std::invalid_argument(family_ + " model contains no trees.");
	}
	if (feature_names_ && feature_names_->size() != num_features_) {
		throw std::invalid_argument(family_ + " model lists " + std::to_string(feature_names_->size()) +
		                            " feature names for " + std::to_string(num_features_) + " features.");
	}
	for (const auto &tree : trees_) {
		if (tree.maxFeatureIndex() >= static_cast<int>(num_features_)) {
			throw std::invalid_argument(family_ + " model splits on a feature beyond its feature count.");
		}
	}
}

double TreeEnsembleRegressor::predict(const std::vector<double> &row) const {
	checkRowWidth(family_, row, num_features_);
	double sum = 0.0;
	for (const auto &tree : trees_) {
		sum += tree.evaluate(row);
	}
	if (average_) {
		sum /= static_cast<double>(trees_.size());
	}
	return sum;
}

std::optional<std::vector<std::string>> TreeEnsembleRegressor::featureNames() const {
	return feature_names_;
}

std::size_t TreeEnsembleRegressor::numFeatures() const {
	return num_features_;
}

std::string TreeEnsembleRegressor::getName() const {
	return family_;
}

} // namespace agriyield::models
