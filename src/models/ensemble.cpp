#include "agri-yield/models/ensemble.hpp"
#include "agri-yield/utils/logging.hpp"

#include <cmath>
#include <stdexcept>

namespace agriyield::models {

std::map<std::string, double> EnsembleConfig::defaultWeights() {
	return {{"xgb", 0.0}, {"lgb", 0.5076}, {"cat", 0.0}, {"rf", 0.4924}};
}

void EnsembleConfig::validate() const {
	for (const auto &[name, weight] : weights) {
		if (!std::isfinite(weight) || weight < 0.0) {
			throw std::invalid_argument("Ensemble weight for '" + name + "' must be finite and non-negative.");
		}
	}
}

WeightedEnsemble::WeightedEnsemble(EnsembleConfig config) : config_(std::move(config)) {
	config_.validate();
}

double WeightedEnsemble::weightOf(const std::string &name) const {
	auto it = config_.weights.find(name);
	return it == config_.weights.end() ? 0.0 : it->second;
}

std::map<std::string, double> WeightedEnsemble::effectiveWeights(const std::vector<std::string> &present) const {
	std::map<std::string, double> weights;
	if (present.empty()) {
		return weights;
	}

	double total = 0.0;
	for (const auto &name : present) {
		total += weightOf(name);
	}
	for (const auto &name : present) {
		weights[name] = total > 0.0 ? weightOf(name) / total : 1.0 / static_cast<double>(present.size());
	}
	return weights;
}

std::optional<double> WeightedEnsemble::combine(const std::map<std::string, double> &predictions) const {
	if (predictions.empty()) {
		return std::nullopt;
	}

	std::vector<std::string> present;
	for (const auto &[name, prediction] : predictions) {
		present.push_back(name);
	}
	const auto weights = effectiveWeights(present);

	double combined = 0.0;
	for (const auto &[name, prediction] : predictions) {
		combined += weights.at(name) * prediction;
	}
	AGRIYIELD_DEBUG("Ensemble of {} models: {}", predictions.size(), combined);
	return combined;
}

} // namespace agriyield::models
