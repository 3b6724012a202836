#pragma once

#include "agri-yield/core/feature_frame.hpp"

#include <string>
#include <vector>

namespace agriyield::core {

enum class FieldGroup {
	Climate,
	Soil,
	Agriculture
};

struct Observation;

/// A numeric input field together with the member that stores it.
struct NumericField {
	const char *name;
	double Observation::*member;
	FieldGroup group;
};

/**
 * @struct Observation
 * @brief One user-supplied row for a (province, commodity, season, year) target.
 *
 * Field names match the raw historical schema so the row can be appended to
 * the historical table without renaming.
 */
struct Observation {
	std::string province_name;
	int year = 0;
	std::string commodity;
	std::string season;

	double avg_temperature = 0.0;
	double min_temperature = 0.0;
	double max_temperature = 0.0;
	double surface_temperature = 0.0;
	double wet_bulb_temperature = 0.0;
	double precipitation = 0.0;
	double solar_radiation = 0.0;
	double relative_humidity = 0.0;
	double wind_speed = 0.0;
	double surface_pressure = 0.0;

	double surface_elevation = 0.0;
	double avg_ndvi = 0.0;
	double soil_ph_level = 0.0;
	double soil_organic_carbon = 0.0;
	double soil_nitrogen_content = 0.0;
	double soil_sand_ratio = 0.0;
	double soil_clay_ratio = 0.0;

	/// Raw yield in the "per 10 ha" unit; unknown at prediction time.
	double yield_ta_per_ha = 0.0;
	double area_thousand_ha = 0.0;

	/// Numeric fields in boundary order.
	static const std::vector<NumericField> &numericFields();

	/**
	 * @brief Checks the boundary contract: non-empty keys, a positive year
	 *        and a finite, positive area.
	 * @throws std::invalid_argument describing the first violation.
	 */
	void validate() const;

	/// Builds a one-row frame in boundary field order.
	FeatureFrame toFrame() const;
};

/**
 * @struct PredictionResult
 * @brief Ensemble output converted back to original units.
 */
struct PredictionResult {
	double yield_ton_per_ha = 0.0;
	double production_tonnes = 0.0;
};

} // namespace agriyield::core
