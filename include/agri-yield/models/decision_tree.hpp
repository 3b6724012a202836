#pragma once

#include "agri-yield/models/iregressor.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace agriyield::models {

/**
 * @class DecisionTree
 * @brief A binary regression tree stored as a flat node array, root at 0.
 *
 * Leaves have no children. A row goes left when value <= threshold; the
 * missing-value routing is chosen per node by the reader.
 */
class DecisionTree {
public:
	enum class MissingPolicy : std::uint8_t {
		CompareAsIs, ///< NaN fails the comparison and goes right
		NanToDefault ///< NaN follows the default child
	};

	struct Node {
		int left = -1;
		int right = -1;
		int feature = -1;
		double threshold = 0.0;
		double value = 0.0;
		bool default_left = false;
		MissingPolicy missing = MissingPolicy::CompareAsIs;

		bool isLeaf() const noexcept {
			return left < 0;
		}
	};

	explicit DecisionTree(std::vector<Node> nodes);

	double evaluate(const std::vector<double> &row) const;

	/// Largest feature index referenced by a split, -1 for a single leaf.
	int maxFeatureIndex() const noexcept;

	std::size_t size() const noexcept {
		return nodes_.size();
	}

private:
	std::vector<Node> nodes_;
};

/**
 * @class TreeEnsembleRegressor
 * @brief Sum (or mean, for averaged forests) of decision trees.
 */
class TreeEnsembleRegressor final : public IRegressor {
public:
	TreeEnsembleRegressor(std::string family, std::vector<DecisionTree> trees, std::size_t num_features,
	                      std::optional<std::vector<std::string>> feature_names, bool average);

	double predict(const std::vector<double> &row) const override;
	std::optional<std::vector<std::string>> featureNames() const override;
	std::size_t numFeatures() const override;
	std::string getName() const override;

	std::size_t treeCount() const noexcept {
		return trees_.size();
	}

private:
	std::string family_;
	std::vector<DecisionTree> trees_;
	std::size_t num_features_;
	std::optional<std::vector<std::string>> feature_names_;
	bool average_;
};

/// Throws std::invalid_argument unless the row has exactly @p expected values.
void checkRowWidth(const std::string &family, const std::vector<double> &row, std::size_t expected);

} // namespace agriyield::models
