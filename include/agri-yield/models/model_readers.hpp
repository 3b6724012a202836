#pragma once

#include "agri-yield/models/iregressor.hpp"

#include <memory>
#include <string>

namespace agriyield::models {

/**
 * @enum ModelFormat
 * @brief Artifact formats the model readers understand.
 *
 * LightGBM and XGBoost artifacts are loaded and scored by the libraries
 * themselves; CatBoost and forest artifacts are read natively.
 */
enum class ModelFormat {
	LightGBMText,     ///< LightGBM Booster.save_model() text dump
	XGBoostJson,      ///< XGBoost Booster.save_model() (JSON or UBJSON)
	CatBoostJson,     ///< CatBoost save_model(format="json")
	RandomForestJson  ///< scikit-learn forest tree arrays dumped as JSON
};

/**
 * @brief Parses a format name ("lightgbm", "xgboost", "catboost", "random_forest").
 * @throws std::invalid_argument for an unknown name.
 */
ModelFormat parseModelFormat(const std::string &name);
std::string toString(ModelFormat format);

/// @throws std::invalid_argument on malformed or unsupported content
std::unique_ptr<IRegressor> readLightGBMText(const std::string &text);
std::unique_ptr<IRegressor> loadLightGBMFile(const std::string &path);
std::unique_ptr<IRegressor> readXGBoostJson(const std::string &text);
std::unique_ptr<IRegressor> loadXGBoostFile(const std::string &path);
std::unique_ptr<IRegressor> readCatBoostJson(const std::string &text);
std::unique_ptr<IRegressor> readRandomForestJson(const std::string &text);

/**
 * @brief Reads a model artifact from disk.
 * @throws std::runtime_error if the file cannot be opened.
 * @throws std::invalid_argument if its content is malformed.
 */
std::unique_ptr<IRegressor> loadModel(const std::string &path, ModelFormat format);

} // namespace agriyield::models
