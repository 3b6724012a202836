#include "agri-yield/models/model_readers.hpp"
#include "agri-yield/utils/logging.hpp"

#include <fstream>
#include <sstream>
#include <stdexcept>

namespace agriyield::models {

ModelFormat parseModelFormat(const std::string &name) {
	if (name == "lightgbm") {
		return ModelFormat::LightGBMText;
	}
	if (name == "xgboost") {
		return ModelFormat::XGBoostJson;
	}
	if (name == "catboost") {
		return ModelFormat::CatBoostJson;
	}
	if (name == "random_forest") {
		return ModelFormat::RandomForestJson;
	}
	throw std::invalid_argument("Unknown model format '" + name + "'.");
}

std::string toString(ModelFormat format) {
	switch (format) {
	case ModelFormat::LightGBMText:
		return "lightgbm";
	case ModelFormat::XGBoostJson:
		return "xgboost";
	case ModelFormat::CatBoostJson:
		return "catboost";
	case ModelFormat::RandomForestJson:
		return "random_forest";
	}
	return "unknown";
}

std::unique_ptr<IRegressor> loadModel(const std::string &path, ModelFormat format) {
	std::ifstream file(path);
	if (!file.is_open()) {
		throw std::runtime_error("Could not open model file: " + path);
	}

	std::unique_ptr<IRegressor> model;
	switch (format) {
	case ModelFormat::LightGBMText:
		model = loadLightGBMFile(path);
		break;
	case ModelFormat::XGBoostJson:
		model = loadXGBoostFile(path);
		break;
	default: {
		std::ostringstream buffer;
		buffer << file.rdbuf();
		model = format == ModelFormat::CatBoostJson ? readCatBoostJson(buffer.str())
		                                            : readRandomForestJson(buffer.str());
		break;
	}
	}
	AGRIYIELD_DEBUG("Read {} model with {} features from {}", model->getName(), model->numFeatures(), path);
	return model;
}

} // namespace agriyield::models
