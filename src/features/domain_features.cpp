#include "agri-yield/features/feature_engineering.hpp"
#include "agri-yield/features/temporal_math.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>
#include <unordered_map>

namespace agriyield::features {

namespace {

constexpr double kEpsilon = 1e-6;
constexpr double kHeatStressThreshold = 35.0;
constexpr double kColdStressThreshold = 20.0;

const core::FeatureFrame::NumericColumn &requireNumeric(const core::FeatureFrame &frame, const std::string &name) {
	if (!frame.isNumeric(name)) {
		throw std::invalid_argument("Domain features require numeric column '" + name + "'.");
	}
	return frame.numeric(name);
}

// Clips at zero, keeping missing values missing.
double clipLower(double value) {
	return std::isnan(value) ? value : std::max(value, 0.0);
}

Series soilQualityIndex(const core::FeatureFrame &frame) {
	std::vector<const Series *> soil_columns;
	for (const auto &name : frame.numericColumnNames()) {
		if (name.rfind("soil_", 0) == 0 && name.find("scaled") == std::string::npos) {
			soil_columns.push_back(&frame.numeric(name));
		}
	}
	Series index(frame.rows(), std::numeric_limits<double>::quiet_NaN());
	for (std::size_t row = 0; row < frame.rows(); ++row) {
		double sum = 0.0;
		std::size_t count = 0;
		for (const auto *column : soil_columns) {
			const double value = (*column)[row];
			if (!std::isnan(value)) {
				sum += value;
				++count;
			}
		}
		if (count > 0) {
			index[row] = sum / static_cast<double>(count);
		}
	}
	return index;
}

Series provinceAnomaly(const core::FeatureFrame &frame, const Series &avg_temperature) {
	const auto &provinces = frame.text("province_name");
	std::unordered_map<std::string, std::pair<double, std::size_t>> totals;
	for (std::size_t row = 0; row < frame.rows(); ++row) {
		if (core::isMissing(provinces[row]) || std::isnan(avg_temperature[row])) {
			continue;
		}
		auto &entry = totals[provinces[row]];
		entry.first += avg_temperature[row];
		++entry.second;
	}
	Series anomaly(frame.rows(), std::numeric_limits<double>::quiet_NaN());
	for (std::size_t row = 0; row < frame.rows(); ++row) {
		auto it = totals.find(provinces[row]);
		if (it == totals.end() || core::isMissing(provinces[row])) {
			continue;
		}
		anomaly[row] = avg_temperature[row] - it->second.first / static_cast<double>(it->second.second);
	}
	return anomaly;
}

} // namespace

void createDomainFeatures(core::FeatureFrame &frame) {
	const std::size_t rows = frame.rows();
	frame.setNumeric("soil_quality_index", soilQualityIndex(frame));

	// Copies: the frame grows below
	const Series max_temp = requireNumeric(frame, "max_temperature");
	const Series min_temp = requireNumeric(frame, "min_temperature");
	const Series avg_temp = requireNumeric(frame, "avg_temperature");
	const Series wet_bulb = requireNumeric(frame, "wet_bulb_temperature");
	const Series precipitation = requireNumeric(frame, "precipitation");
	const Series solar = requireNumeric(frame, "solar_radiation");

	Series temp_range(rows);
	Series humidity_deficit(rows);
	Series precipitation_efficiency(rows);
	Series season_length_proxy(rows);
	Series heat_stress(rows);
	Series cold_stress(rows);
	Series wetness_index(rows);
	for (std::size_t row = 0; row < rows; ++row) {
		temp_range[row] = max_temp[row] - min_temp[row];
		humidity_deficit[row] = avg_temp[row] - wet_bulb[row];
		precipitation_efficiency[row] = precipitation[row] / (avg_temp[row] + kEpsilon);
		season_length_proxy[row] = precipitation[row] * solar[row];
		heat_stress[row] = clipLower(max_temp[row] - kHeatStressThreshold);
		cold_stress[row] = clipLower(kColdStressThreshold - min_temp[row]);
		wetness_index[row] = precipitation[row] * humidity_deficit[row];
	}

	frame.setNumeric("temp_range", std::move(temp_range));
	frame.setNumeric("humidity_deficit", std::move(humidity_deficit));
	frame.setNumeric("precipitation_efficiency", std::move(precipitation_efficiency));
	if (frame.hasColumn("province_name") && !frame.isNumeric("province_name")) {
		frame.setNumeric("temp_anomaly", provinceAnomaly(frame, avg_temp));
	}
	frame.setNumeric("season_length_proxy", std::move(season_length_proxy));
	frame.setNumeric("heat_stress", std::move(heat_stress));
	frame.setNumeric("cold_stress", std::move(cold_stress));
	frame.setNumeric("wetness_index", std::move(wetness_index));

	for (const auto &name : frame.numericColumnNames()) {
		ReplaceInfinities(frame.numeric(name));
	}
}

} // namespace agriyield::features
