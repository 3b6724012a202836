#include "agri-yield/models/decision_tree.hpp"
#include "agri-yield/models/model_readers.hpp"

#include <xgboost/c_api.h>

#include <cmath>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace agriyield::models {

namespace {

// Plain value prediction over every tree
const char *const kPredictConfig =
    R"({"type": 0, "training": false, "iteration_begin": 0, "iteration_end": 0, "strict_shape": false})";

std::string lastError() {
	const char *message = XGBGetLastError();
	return message ? message : "unknown error";
}

using MatrixGuard = std::unique_ptr<void, int (*)(DMatrixHandle)>;

/**
 * @class XGBoostRegressor
 * @brief Owns an XGBoost booster and scores single rows through the C API.
 *
 * Rows are handed to XGBoost as float32 with NaN as the missing marker, so
 * split decisions are the library's own.
 */
class XGBoostRegressor final : public IRegressor {
public:
	XGBoostRegressor() {
		if (XGBoosterCreate(nullptr, 0, &booster_) != 0) {
			throw std::runtime_error("XGBoost: cannot create a booster: " + lastError());
		}
	}

	~XGBoostRegressor() override {
		XGBoosterFree(booster_);
	}

	XGBoostRegressor(const XGBoostRegressor &) = delete;
	XGBoostRegressor &operator=(const XGBoostRegressor &) = delete;

	void loadFile(const std::string &path) {
		if (XGBoosterLoadModel(booster_, path.c_str()) != 0) {
			throw std::invalid_argument("Malformed XGBoost model " + path + ": " + lastError());
		}
		readMetadata();
	}

	void loadBuffer(const std::string &text) {
		if (XGBoosterLoadModelFromBuffer(booster_, text.data(), static_cast<bst_ulong>(text.size())) != 0) {
			throw std::invalid_argument("Malformed XGBoost model: " + lastError());
		}
		readMetadata();
	}

	double predict(const std::vector<double> &row) const override {
		checkRowWidth(getName(), row, num_features_);
		const std::vector<float> values(row.begin(), row.end());

		std::lock_guard<std::mutex> lock(mutex_);
		DMatrixHandle matrix = nullptr;
		if (XGDMatrixCreateFromMat(values.data(), 1, static_cast<bst_ulong>(num_features_), std::nanf(""),
		                           &matrix) != 0) {
			throw std::runtime_error("XGBoost: cannot build the input matrix: " + lastError());
		}
		const MatrixGuard guard(matrix, &XGDMatrixFree);

		const bst_ulong *shape = nullptr;
		bst_ulong dimension = 0;
		const float *result = nullptr;
		if (XGBoosterPredictFromDMatrix(booster_, matrix, kPredictConfig, &shape, &dimension, &result) != 0) {
			throw std::runtime_error("XGBoost prediction failed: " + lastError());
		}
		bst_ulong count = 1;
		for (bst_ulong i = 0; i < dimension; ++i) {
			count *= shape[i];
		}
		if (count != 1) {
			throw std::runtime_error("XGBoost prediction returned " + std::to_string(count) + " values.");
		}
		return static_cast<double>(result[0]);
	}

	std::optional<std::vector<std::string>> featureNames() const override {
		return feature_names_;
	}

	std::size_t numFeatures() const override {
		return num_features_;
	}

	std::string getName() const override {
		return "XGBoost";
	}

private:
	void readMetadata() {
		bst_ulong num_features = 0;
		if (XGBoosterGetNumFeature(booster_, &num_features) != 0 || num_features == 0) {
			throw std::invalid_argument("XGBoost model: cannot read the feature count.");
		}
		num_features_ = static_cast<std::size_t>(num_features);

		bst_ulong length = 0;
		const char **names = nullptr;
		if (XGBoosterGetStrFeatureInfo(booster_, "feature_name", &length, &names) != 0) {
			throw std::invalid_argument("XGBoost model: " + lastError());
		}
		if (length > 0) {
			feature_names_ = std::vector<std::string>(names, names + length);
		}
	}

	BoosterHandle booster_ = nullptr;
	std::size_t num_features_ = 0;
	std::optional<std::vector<std::string>> feature_names_;
	mutable std::mutex mutex_;
};

} // namespace

std::unique_ptr<IRegressor> readXGBoostJson(const std::string &text) {
	auto model = std::make_unique<XGBoostRegressor>();
	model->loadBuffer(text);
	return model;
}

std::unique_ptr<IRegressor> loadXGBoostFile(const std::string &path) {
	auto model = std::make_unique<XGBoostRegressor>();
	model->loadFile(path);
	return model;
}

} // namespace agriyield::models
