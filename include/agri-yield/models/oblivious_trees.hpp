#pragma once

#include "agri-yield/models/iregressor.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace agriyield::models {

/**
 * @class ObliviousTreeEnsemble
 * @brief Symmetric (oblivious) trees as used by CatBoost.
 *
 * Every level of a tree applies the same float split. The leaf index has
 * bit j set when the value of split j is strictly above its border.
 */
class ObliviousTreeEnsemble final : public IRegressor {
public:
	struct Split {
		std::size_t feature = 0;
		double border = 0.0;
		/// Bit value used for a missing input
		bool nan_is_true = false;
	};

	struct Tree {
		std::vector<Split> splits;
		std::vector<double> leaf_values;
	};

	/// @throws std::invalid_argument if a tree's leaf count is not 2^depth
	ObliviousTreeEnsemble(std::vector<Tree> trees, std::size_t num_features,
	                      std::optional<std::vector<std::string>> feature_names, double scale = 1.0,
	                      double bias = 0.0);

	double predict(const std::vector<double> &row) const override;
	std::optional<std::vector<std::string>> featureNames() const override;
	std::size_t numFeatures() const override;
	std::string getName() const override;

private:
	std::vector<Tree> trees_;
	std::size_t num_features_;
	std::optional<std::vector<std::string>> feature_names_;
	double scale_;
	double bias_;
};

} // namespace agriyield::models
