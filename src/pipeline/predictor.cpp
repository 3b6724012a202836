#include "agri-yield/pipeline/predictor.hpp"
#include "agri-yield/features/feature_engineering.hpp"
#include "agri-yield/io/csv_reader.hpp"
#include "agri-yield/transform/preprocessing.hpp"
#include "agri-yield/transform/transformers.hpp"
#include "agri-yield/utils/logging.hpp"

#include <filesystem>
#include <stdexcept>

namespace agriyield::pipeline {

namespace {

std::optional<core::FeatureFrame> loadHistory(const std::string &path) {
	try {
		auto history = io::readCsv(path);
		AGRIYIELD_INFO("Loaded {} historical records from {}", history.rows(), path);
		return history;
	} catch (const std::exception &e) {
		AGRIYIELD_WARN("Historical data unavailable ({}); predictions will fail until it is provided", e.what());
		return std::nullopt;
	}
}

std::shared_ptr<const transform::IFeatureTransform> loadPreprocessor(const std::string &path) {
	std::error_code ec;
	if (!std::filesystem::exists(path, ec)) {
		AGRIYIELD_WARN("Preprocessor {} not found; engineered features will be scored unscaled", path);
		return nullptr;
	}
	try {
		auto preprocessor = std::make_shared<const transform::ColumnTransformer>(transform::ColumnTransformer::load(path));
		AGRIYIELD_INFO("Loaded preprocessor from {}", path);
		return preprocessor;
	} catch (const std::exception &e) {
		AGRIYIELD_WARN("Failed to load preprocessor {} ({}); engineered features will be scored unscaled", path,
		               e.what());
		return nullptr;
	}
}

} // namespace

Predictor::Predictor(config::PipelineConfig config)
	: config_(std::move(config)), ensemble_(config_.ensemble) {
	config_.validate();
}

void Predictor::ensureUnloaded() const {
	if (state_ != State::Unloaded) {
		throw std::runtime_error("Predictor is already loaded");
	}
}

void Predictor::load() {
	ensureUnloaded();
	PipelineResources resources;
	resources.history = loadHistory(config_.history_path);
	resources.preprocessor = loadPreprocessor(config_.preprocessor_path);
	resources.models = models::ModelBank::load(config_.models_directory, config_.models);
	load(std::move(resources));
}

void Predictor::load(PipelineResources resources) {
	ensureUnloaded();
	resources_ = std::move(resources);
	state_ = State::Ready;

	const auto weights = ensemble_.effectiveWeights(resources_.models.names());
	for (const auto &[name, weight] : weights) {
		AGRIYIELD_INFO("Ensemble member '{}' with weight {:.4f}", name, weight);
	}
	if (resources_.models.empty()) {
		AGRIYIELD_WARN("No models loaded; every prediction will be unavailable");
	}
}

std::optional<core::PredictionResult> Predictor::predict(const core::Observation &input) const {
	if (state_ != State::Ready) {
		throw std::runtime_error("Predictor must be loaded before predict");
	}
	if (!resources_.history) {
		throw std::runtime_error("Historical data is not loaded; temporal features cannot be derived");
	}
	input.validate();

	const auto engineered = features::processSingleInput(input, *resources_.history, config_.features);
	const auto scaled = transform::applyPreprocessor(resources_.preprocessor.get(), engineered);
	const auto predictions = resources_.models.score(scaled);

	const auto combined = ensemble_.combine(predictions);
	if (!combined) {
		AGRIYIELD_WARN("No model produced a prediction for {} / {} / {} {}", input.province_name, input.commodity,
		               input.season, input.year);
		return std::nullopt;
	}

	core::PredictionResult result;
	result.yield_ton_per_ha = transform::Log1p::inverse(*combined);
	result.production_tonnes = result.yield_ton_per_ha * input.area_thousand_ha * 1000.0;
	return result;
}

} // namespace agriyield::pipeline
