#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace agriyield::models {

/**
 * @struct EnsembleConfig
 * @brief Configured weight per model name. Unlisted models weigh 0.
 */
struct EnsembleConfig {
	std::map<std::string, double> weights = defaultWeights();

	/// The deployed weights: only lgb and rf contribute.
	static std::map<std::string, double> defaultWeights();

	/// @throws std::invalid_argument on a negative or non-finite weight
	void validate() const;
};

/**
 * @class WeightedEnsemble
 * @brief Normalized weighted average over the models that produced a prediction.
 *
 * Weights are renormalized over the present models. If all of them weigh 0
 * the present predictions are averaged with equal weights.
 *
 * @example
 * ```cpp
 * WeightedEnsemble ensemble;
 * auto combined = ensemble.combine({{"lgb", 1.2}, {"rf", 1.0}});
 * // 0.5076 * 1.2 + 0.4924 * 1.0
 * ```
 */
class WeightedEnsemble {
public:
	/// @throws std::invalid_argument if @p config is invalid
	explicit WeightedEnsemble(EnsembleConfig config = EnsembleConfig{});

	/**
	 * @brief Combines per-model predictions.
	 * @return nullopt only when @p predictions is empty.
	 */
	std::optional<double> combine(const std::map<std::string, double> &predictions) const;

	/// Normalized weights that combine() applies to the given present models.
	std::map<std::string, double> effectiveWeights(const std::vector<std::string> &present) const;

	const EnsembleConfig &config() const noexcept {
		return config_;
	}

private:
	double weightOf(const std::string &name) const;

	EnsembleConfig config_;
};

} // namespace agriyield::models
