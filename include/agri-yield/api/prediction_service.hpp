#pragma once

#include "agri-yield/core/observation.hpp"
#include "agri-yield/pipeline/predictor.hpp"

#include <nlohmann/json.hpp>

#include <memory>
#include <optional>
#include <string>

namespace agriyield::api {

/**
 * @struct PredictionOutcome
 * @brief Result of one request: a prediction, or the reason there is none.
 *
 * Keeps "unavailable" distinct from a genuine zero prediction.
 */
struct PredictionOutcome {
	enum class Status {
		Ok,
		Unavailable
	};

	Status status = Status::Unavailable;
	std::optional<core::PredictionResult> result;
	std::string reason;
	double area_thousand_ha = 0.0;

	bool ok() const noexcept {
		return status == Status::Ok;
	}

	static PredictionOutcome success(core::PredictionResult result, double area_thousand_ha);
	static PredictionOutcome unavailable(std::string reason, double area_thousand_ha);
};

/**
 * @struct PredictionResponse
 * @brief The response body of the prediction endpoint.
 */
struct PredictionResponse {
	double predicted_production = 0.0;
	double predicted_yield = 0.0;
	double predicted_area = 0.0;

	/// Zero production and yield when the outcome has no prediction.
	static PredictionResponse fromOutcome(const PredictionOutcome &outcome);
};

/**
 * @class PredictionService
 * @brief Request-level entry point over a shared, already loaded Predictor.
 *
 * No failure of the pipeline escapes evaluate() or respond().
 */
class PredictionService {
public:
	/// @throws std::invalid_argument if @p predictor is null
	explicit PredictionService(std::shared_ptr<const pipeline::Predictor> predictor);

	PredictionOutcome evaluate(const core::Observation &observation) const;

	/// Parses the request body first; parse errors are reported as Unavailable.
	PredictionOutcome evaluate(const nlohmann::json &request) const;

	PredictionResponse respond(const core::Observation &observation) const;

	const pipeline::Predictor &predictor() const noexcept {
		return *predictor_;
	}

private:
	std::shared_ptr<const pipeline::Predictor> predictor_;
};

/**
 * @brief Reads an observation from a request body.
 *
 * Every boundary key is required except yield_ta_per_ha (default 0); unknown
 * keys are ignored.
 *
 * @throws std::invalid_argument on a missing or mistyped key.
 */
core::Observation observationFromJson(const nlohmann::json &request);

nlohmann::json toJson(const core::Observation &observation);
nlohmann::json toJson(const PredictionResponse &response);

/// The response body plus "status" and, when unavailable, "reason".
nlohmann::json toJson(const PredictionOutcome &outcome);

} // namespace agriyield::api
