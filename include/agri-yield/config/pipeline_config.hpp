#pragma once

#include "agri-yield/features/feature_engineering.hpp"
#include "agri-yield/models/ensemble.hpp"
#include "agri-yield/models/model_bank.hpp"

#include <string>
#include <vector>

namespace agriyield::config {

/**
 * @struct PipelineConfig
 * @brief Artifact locations and tunables of one predictor instance.
 *
 * Defaults mirror the deployed layout: a CSV history under data/ and every
 * fitted artifact under models/.
 */
struct PipelineConfig {
	std::string history_path = "data/final_sau_missingvalues.csv";
	std::string preprocessor_path = "models/preprocessor.json";
	std::string models_directory = "models";

	features::FeatureEngineeringConfig features;
	models::EnsembleConfig ensemble;
	std::vector<models::ModelSpec> models = defaultModelSpecs();

	/// xgb, lgb, cat and rf with their default file patterns.
	static std::vector<models::ModelSpec> defaultModelSpecs();

	/// @throws std::invalid_argument on invalid windows, keys, weights or model specs
	void validate() const;
};

/**
 * @brief Parses a JSON configuration; absent keys keep their defaults.
 *
 * Relative paths are resolved against @p base_directory when it is not empty.
 *
 * @throws std::invalid_argument on malformed JSON or invalid values.
 */
PipelineConfig parsePipelineConfig(const std::string &text, const std::string &base_directory = "");

/**
 * @brief Reads a JSON configuration file, resolving relative paths against
 *        the file's directory.
 * @throws std::runtime_error if the file cannot be read.
 */
PipelineConfig loadPipelineConfig(const std::string &path);

} // namespace agriyield::config
