#include "agri-yield/models/decision_tree.hpp"
#include "agri-yield/models/model_readers.hpp"

#include <LightGBM/c_api.h>

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace agriyield::models {

namespace {

constexpr std::size_t kNameBufferLength = 256;

std::string lastError() {
	const char *message = LGBM_GetLastError();
	return message ? message : "unknown error";
}

// Names LightGBM generates when none were given carry no alignment information.
bool generatedNames(const std::vector<std::string> &names) {
	for (std::size_t i = 0; i < names.size(); ++i) {
		if (names[i] != "Column_" + std::to_string(i)) {
			return false;
		}
	}
	return true;
}

/**
 * @class LightGBMRegressor
 * @brief Owns a LightGBM booster and scores single rows through the C API.
 */
class LightGBMRegressor final : public IRegressor {
public:
	explicit LightGBMRegressor(BoosterHandle booster) : booster_(booster, &LGBM_BoosterFree) {
		int num_classes = 0;
		if (LGBM_BoosterGetNumClasses(booster_.get(), &num_classes) != 0) {
			throw std::invalid_argument("LightGBM model: " + lastError());
		}
		if (num_classes != 1) {
			throw std::invalid_argument("LightGBM model: multi-class models are not supported.");
		}
		int num_features = 0;
		if (LGBM_BoosterGetNumFeature(booster_.get(), &num_features) != 0 || num_features <= 0) {
			throw std::invalid_argument("LightGBM model: cannot read the feature count.");
		}
		num_features_ = static_cast<std::size_t>(num_features);
		readFeatureNames();
	}

	double predict(const std::vector<double> &row) const override {
		checkRowWidth(getName(), row, num_features_);
		std::lock_guard<std::mutex> lock(mutex_);
		int64_t out_len = 0;
		double out = 0.0;
		if (LGBM_BoosterPredictForMatSingleRow(booster_.get(), row.data(), C_API_DTYPE_FLOAT64,
		                                       static_cast<int32_t>(num_features_), 1, C_API_PREDICT_NORMAL, 0,
		                                       -1, "", &out_len, &out) != 0) {
			throw std::runtime_error("LightGBM prediction failed: " + lastError());
		}
		if (out_len != 1) {
			throw std::runtime_error("LightGBM prediction returned " + std::to_string(out_len) + " values.");
		}
		return out;
	}

	std::optional<std::vector<std::string>> featureNames() const override {
		return feature_names_;
	}

	std::size_t numFeatures() const override {
		return num_features_;
	}

	std::string getName() const override {
		return "LightGBM";
	}

private:
	void readFeatureNames() {
		std::size_t buffer_length = kNameBufferLength;
		for (int attempt = 0; attempt < 2; ++attempt) {
			std::vector<std::vector<char>> buffers(num_features_, std::vector<char>(buffer_length));
			std::vector<char *> pointers(num_features_);
			for (std::size_t i = 0; i < num_features_; ++i) {
				pointers[i] = buffers[i].data();
			}
			int out_len = 0;
			std::size_t required = 0;
			if (LGBM_BoosterGetFeatureNames(booster_.get(), static_cast<int>(num_features_), &out_len, buffer_length,
			                                &required, pointers.data()) != 0) {
				throw std::invalid_argument("LightGBM model: " + lastError());
			}
			if (required > buffer_length) {
				// Some names were truncated; retry with room for the longest one
				buffer_length = required;
				continue;
			}
			std::vector<std::string> names(pointers.begin(), pointers.begin() + out_len);
			if (!names.empty() && !generatedNames(names)) {
				feature_names_ = std::move(names);
			}
			return;
		}
		throw std::invalid_argument("LightGBM model: cannot read the feature names.");
	}

	std::unique_ptr<void, int (*)(BoosterHandle)> booster_;
	std::size_t num_features_ = 0;
	std::optional<std::vector<std::string>> feature_names_;
	mutable std::mutex mutex_;
};

} // namespace

std::unique_ptr<IRegressor> readLightGBMText(const std::string &text) {
	int iterations = 0;
	BoosterHandle booster = nullptr;
	if (LGBM_BoosterLoadModelFromString(text.c_str(), &iterations, &booster) != 0 || booster == nullptr) {
		throw std::invalid_argument("Malformed LightGBM model: " + lastError());
	}
	return std::make_unique<LightGBMRegressor>(booster);
}

std::unique_ptr<IRegressor> loadLightGBMFile(const std::string &path) {
	int iterations = 0;
	BoosterHandle booster = nullptr;
	if (LGBM_BoosterCreateFromModelfile(path.c_str(), &iterations, &booster) != 0 || booster == nullptr) {
		throw std::invalid_argument("Malformed LightGBM model " + path + ": " + lastError());
	}
	return std::make_unique<LightGBMRegressor>(booster);
}

} // namespace agriyield::models
