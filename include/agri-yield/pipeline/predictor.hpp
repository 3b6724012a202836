#pragma once

#include "agri-yield/config/pipeline_config.hpp"
#include "agri-yield/core/feature_frame.hpp"
#include "agri-yield/core/observation.hpp"
#include "agri-yield/models/ensemble.hpp"
#include "agri-yield/models/model_bank.hpp"
#include "agri-yield/transform/feature_transform.hpp"

#include <memory>
#include <optional>

namespace agriyield::pipeline {

/**
 * @struct PipelineResources
 * @brief Everything a Predictor reads while predicting.
 *
 * Any part may be absent: without a preprocessor the engineered row is
 * scored unscaled, and without history every prediction fails.
 */
struct PipelineResources {
	std::optional<core::FeatureFrame> history;
	std::shared_ptr<const transform::IFeatureTransform> preprocessor;
	models::ModelBank models;
};

/**
 * @class Predictor
 * @brief Long-lived owner of the history and fitted artifacts; turns one
 *        observation into a yield and production estimate.
 *
 * A predictor is loaded exactly once. After that it is immutable, so a
 * single instance can serve concurrent predict() calls: each call works on
 * its own copy of the history.
 *
 * @example
 * ```cpp
 * auto predictor = std::make_shared<Predictor>(config::loadPipelineConfig("pipeline.json"));
 * predictor->load();
 * if (auto result = predictor->predict(observation)) {
 *     std::cout << result->production_tonnes << "\n";
 * }
 * ```
 */
class Predictor {
public:
	enum class State {
		Unloaded,
		Ready
	};

	/// @throws std::invalid_argument if @p config is invalid
	explicit Predictor(config::PipelineConfig config = config::PipelineConfig{});

	/**
	 * @brief Loads history, preprocessor and models from the configured paths.
	 *
	 * Missing or unreadable artifacts are logged and left absent.
	 *
	 * @throws std::runtime_error if the predictor is already loaded.
	 */
	void load();

	/**
	 * @brief Adopts resources built elsewhere.
	 * @throws std::runtime_error if the predictor is already loaded.
	 */
	void load(PipelineResources resources);

	State state() const noexcept {
		return state_;
	}

	bool isReady() const noexcept {
		return state_ == State::Ready;
	}

	bool hasHistory() const noexcept {
		return resources_.history.has_value();
	}

	bool hasPreprocessor() const noexcept {
		return resources_.preprocessor != nullptr;
	}

	const std::optional<core::FeatureFrame> &history() const noexcept {
		return resources_.history;
	}

	const models::ModelBank &models() const noexcept {
		return resources_.models;
	}

	const config::PipelineConfig &config() const noexcept {
		return config_;
	}

	/**
	 * @brief Predicts yield (t/ha) and production (t) for one observation.
	 *
	 * @return nullopt when no model produced a usable prediction.
	 * @throws std::runtime_error if the predictor is not loaded or has no history.
	 * @throws std::invalid_argument if the observation or the derived
	 *         features are invalid.
	 */
	std::optional<core::PredictionResult> predict(const core::Observation &input) const;

private:
	void ensureUnloaded() const;

	config::PipelineConfig config_;
	models::WeightedEnsemble ensemble_;
	PipelineResources resources_;
	State state_ = State::Unloaded;
};

} // namespace agriyield::pipeline
