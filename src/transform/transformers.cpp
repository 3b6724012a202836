#include "agri-yield/transform/transformers.hpp"
#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>

namespace agriyield::transform {

// ============================================================================
// Log1p
// ============================================================================

void Log1p::fit(const std::vector<double> &) {
	// Stateless
}

double Log1p::forward(double value) {
	if (std::isnan(value)) {
		return value;
	}
	return std::log1p(std::max(value, 0.0));
}

double Log1p::inverse(double value) {
	if (std::isnan(value)) {
		return value;
	}
	return std::expm1(value);
}

void Log1p::transform(std::vector<double> &data) const {
	for (double &value : data) {
		value = forward(value);
	}
}

void Log1p::inverseTransform(std::vector<double> &data) const {
	for (double &value : data) {
		value = inverse(value);
	}
}

// ============================================================================
// ConstantImputer
// ============================================================================

ConstantImputer::ConstantImputer(double fill_value) : fill_value_(fill_value) {
}

void ConstantImputer::fit(const std::vector<double> &data) {
	if (fill_value_) {
		return;
	}
	double sum = 0.0;
	std::size_t count = 0;
	for (double value : data) {
		if (!std::isnan(value)) {
			sum += value;
			++count;
		}
	}
	fill_value_ = count > 0 ? sum / static_cast<double>(count) : 0.0;
}

void ConstantImputer::transform(std::vector<double> &data) const {
	if (!fill_value_) {
		throw std::runtime_error("ConstantImputer must be fitted before transform");
	}
	for (double &value : data) {
		if (std::isnan(value)) {
			value = *fill_value_;
		}
	}
}

void ConstantImputer::inverseTransform(std::vector<double> &) const {
	// Imputation cannot be undone
}

// ============================================================================
// MinMaxScaler
// ============================================================================

MinMaxScaler::MinMaxScaler()
	: output_min_(0.0), output_max_(1.0), has_params_(false),
	  input_min_(0.0), input_max_(1.0), scale_factor_(1.0), offset_(0.0) {
}

MinMaxScaler &MinMaxScaler::withScaledRange(double min, double max) {
	if (!(min < max)) {
		throw std::invalid_argument("MinMaxScaler: scaled range minimum must be below maximum");
	}
	output_min_ = min;
	output_max_ = max;
	if (has_params_) {
		computeScale(input_min_, input_max_);
	}
	return *this;
}

MinMaxScaler &MinMaxScaler::withDataRange(double min, double max) {
	input_min_ = min;
	input_max_ = max;
	has_params_ = true;
	computeScale(min, max);
	return *this;
}

void MinMaxScaler::fit(const std::vector<double> &data) {
	if (has_params_) {
		return;
	}

	double min_val = std::numeric_limits<double>::max();
	double max_val = std::numeric_limits<double>::lowest();
	for (double value : data) {
		if (!std::isnan(value)) {
			min_val = std::min(min_val, value);
			max_val = std::max(max_val, value);
		}
	}

	if (min_val == std::numeric_limits<double>::max()) {
		// All NaNs
		input_min_ = 0.0;
		input_max_ = 1.0;
	} else {
		input_min_ = min_val;
		input_max_ = max_val;
	}

	has_params_ = true;
	computeScale(input_min_, input_max_);
}

void MinMaxScaler::transform(std::vector<double> &data) const {
	ensureParams();
	for (double &value : data) {
		if (std::isnan(value)) {
			continue;
		}
		value = scale_factor_ * value + offset_;
	}
}

void MinMaxScaler::inverseTransform(std::vector<double> &data) const {
	ensureParams();
	for (double &value : data) {
		if (std::isnan(value)) {
			continue;
		}
		value = (value - offset_) / scale_factor_;
	}
}

void MinMaxScaler::ensureParams() const {
	if (!has_params_) {
		throw std::runtime_error("MinMaxScaler must be fitted before transform");
	}
}

void MinMaxScaler::computeScale(double input_min, double input_max) {
	double data_range = input_max - input_min;
	if (std::abs(data_range) < std::numeric_limits<double>::epsilon()) {
		// Constant feature: unit range, as in scikit-learn
		data_range = 1.0;
	}
	scale_factor_ = (output_max_ - output_min_) / data_range;
	offset_ = output_min_ - scale_factor_ * input_min;
}

// ============================================================================
// StandardScaleParams
// ============================================================================

StandardScaleParams StandardScaleParams::fromData(const std::vector<double> &data) {
	StandardScaleParams params;

	double sum = 0.0;
	std::size_t count = 0;
	for (double value : data) {
		if (!std::isnan(value)) {
			sum += value;
			++count;
		}
	}

	if (count == 0) {
		return params;
	}

	params.mean = sum / static_cast<double>(count);

	double variance = 0.0;
	for (double value : data) {
		if (!std::isnan(value)) {
			const double diff = value - params.mean;
			variance += diff * diff;
		}
	}
	params.scale = std::sqrt(variance / static_cast<double>(count));
	return params;
}

// ============================================================================
// StandardScaler
// ============================================================================

StandardScaler::StandardScaler() : params_(std::nullopt) {
}

StandardScaler &StandardScaler::withParameters(StandardScaleParams params) {
	params_ = params;
	return *this;
}

void StandardScaler::fit(const std::vector<double> &data) {
	params_ = StandardScaleParams::fromData(data);
}

double StandardScaler::effectiveScale() const {
	// Zero variance divides by one
	return std::abs(params_->scale) < std::numeric_limits<double>::epsilon() ? 1.0 : params_->scale;
}

void StandardScaler::transform(std::vector<double> &data) const {
	ensureParams();
	const double mean = params_->mean;
	const double scale = effectiveScale();
	for (double &value : data) {
		if (std::isnan(value)) {
			continue;
		}
		value = (value - mean) / scale;
	}
}

void StandardScaler::inverseTransform(std::vector<double> &data) const {
	ensureParams();
	const double mean = params_->mean;
	const double scale = effectiveScale();
	for (double &value : data) {
		if (std::isnan(value)) {
			continue;
		}
		value = value * scale + mean;
	}
}

void StandardScaler::ensureParams() const {
	if (!params_.has_value()) {
		throw std::runtime_error("StandardScaler must be fitted before transform");
	}
}

} // namespace agriyield::transform
