#include "agri-yield/api/prediction_service.hpp"
#include "agri-yield/utils/logging.hpp"

#include <cmath>
#include <limits>
#include <stdexcept>

using json = nlohmann::json;

namespace agriyield::api {

namespace {

const json &requireKey(const json &request, const char *key) {
	auto it = request.find(key);
	if (it == request.end() || it->is_null()) {
		throw std::invalid_argument(std::string("Missing field '") + key + "'.");
	}
	return *it;
}

std::string requireString(const json &request, const char *key) {
	const auto &value = requireKey(request, key);
	if (!value.is_string()) {
		throw std::invalid_argument(std::string("Field '") + key + "' must be a string.");
	}
	return value.get<std::string>();
}

double requireNumber(const json &request, const char *key) {
	const auto &value = requireKey(request, key);
	if (!value.is_number()) {
		throw std::invalid_argument(std::string("Field '") + key + "' must be a number.");
	}
	return value.get<double>();
}

int requireInteger(const json &request, const char *key) {
	const double value = requireNumber(request, key);
	if (std::floor(value) != value) {
		throw std::invalid_argument(std::string("Field '") + key + "' must be an integer.");
	}
	if (value < static_cast<double>(std::numeric_limits<int>::min()) ||
	    value > static_cast<double>(std::numeric_limits<int>::max())) {
		throw std::invalid_argument(std::string("Field '") + key + "' is out of range.");
	}
	return static_cast<int>(value);
}

} // namespace

PredictionOutcome PredictionOutcome::success(core::PredictionResult result, double area_thousand_ha) {
	PredictionOutcome outcome;
	outcome.status = Status::Ok;
	outcome.result = result;
	outcome.area_thousand_ha = area_thousand_ha;
	return outcome;
}

PredictionOutcome PredictionOutcome::unavailable(std::string reason, double area_thousand_ha) {
	PredictionOutcome outcome;
	outcome.status = Status::Unavailable;
	outcome.reason = std::move(reason);
	outcome.area_thousand_ha = area_thousand_ha;
	return outcome;
}

PredictionResponse PredictionResponse::fromOutcome(const PredictionOutcome &outcome) {
	PredictionResponse response;
	response.predicted_area = outcome.area_thousand_ha;
	if (outcome.ok() && outcome.result) {
		response.predicted_production = outcome.result->production_tonnes;
		response.predicted_yield = outcome.result->yield_ton_per_ha;
	}
	return response;
}

PredictionService::PredictionService(std::shared_ptr<const pipeline::Predictor> predictor)
	: predictor_(std::move(predictor)) {
	if (!predictor_) {
		throw std::invalid_argument("PredictionService requires a predictor");
	}
}

PredictionOutcome PredictionService::evaluate(const core::Observation &observation) const {
	try {
		auto result = predictor_->predict(observation);
		if (!result) {
			return PredictionOutcome::unavailable("No model produced a prediction", observation.area_thousand_ha);
		}
		return PredictionOutcome::success(*result, observation.area_thousand_ha);
	} catch (const std::exception &e) {
		AGRIYIELD_ERROR("Prediction failed: {}", e.what());
		return PredictionOutcome::unavailable(e.what(), observation.area_thousand_ha);
	}
}

PredictionOutcome PredictionService::evaluate(const json &request) const {
	core::Observation observation;
	try {
		observation = observationFromJson(request);
	} catch (const std::exception &e) {
		AGRIYIELD_WARN("Rejected prediction request: {}", e.what());
		double area = 0.0;
		if (request.is_object() && request.contains("area_thousand_ha") && request.at("area_thousand_ha").is_number()) {
			area = request.at("area_thousand_ha").get<double>();
		}
		return PredictionOutcome::unavailable(e.what(), area);
	}
	return evaluate(observation);
}

PredictionResponse PredictionService::respond(const core::Observation &observation) const {
	return PredictionResponse::fromOutcome(evaluate(observation));
}

core::Observation observationFromJson(const json &request) {
	if (!request.is_object()) {
		throw std::invalid_argument("Prediction request must be a JSON object.");
	}
	core::Observation observation;
	observation.province_name = requireString(request, "province_name");
	observation.year = requireInteger(request, "year");
	observation.commodity = requireString(request, "commodity");
	observation.season = requireString(request, "season");
	for (const auto &field : core::Observation::numericFields()) {
		if (std::string(field.name) == "yield_ta_per_ha" && !request.contains(field.name)) {
			continue;
		}
		observation.*field.member = requireNumber(request, field.name);
	}
	return observation;
}

json toJson(const core::Observation &observation) {
	json body = {{"province_name", observation.province_name},
	             {"year", observation.year},
	             {"commodity", observation.commodity},
	             {"season", observation.season}};
	for (const auto &field : core::Observation::numericFields()) {
		body[field.name] = observation.*field.member;
	}
	return body;
}

json toJson(const PredictionResponse &response) {
	return {{"predicted_production", response.predicted_production},
	        {"predicted_yield", response.predicted_yield},
	        {"predicted_area", response.predicted_area}};
}

json toJson(const PredictionOutcome &outcome) {
	json body = toJson(PredictionResponse::fromOutcome(outcome));
	body["status"] = outcome.ok() ? "ok" : "unavailable";
	if (!outcome.ok()) {
		body["reason"] = outcome.reason;
	}
	return body;
}

} // namespace agriyield::api
