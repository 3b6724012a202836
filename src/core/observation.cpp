#include "agri-yield/core/observation.hpp"

#include <cmath>
#include <stdexcept>

namespace agriyield::core {

const std::vector<NumericField> &Observation::numericFields() {
	static const std::vector<NumericField> fields{
	    {"avg_temperature", &Observation::avg_temperature, FieldGroup::Climate},
	    {"min_temperature", &Observation::min_temperature, FieldGroup::Climate},
	    {"max_temperature", &Observation::max_temperature, FieldGroup::Climate},
	    {"surface_temperature", &Observation::surface_temperature, FieldGroup::Climate},
	    {"wet_bulb_temperature", &Observation::wet_bulb_temperature, FieldGroup::Climate},
	    {"precipitation", &Observation::precipitation, FieldGroup::Climate},
	    {"solar_radiation", &Observation::solar_radiation, FieldGroup::Climate},
	    {"relative_humidity", &Observation::relative_humidity, FieldGroup::Climate},
	    {"wind_speed", &Observation::wind_speed, FieldGroup::Climate},
	    {"surface_pressure", &Observation::surface_pressure, FieldGroup::Climate},
	    {"surface_elevation", &Observation::surface_elevation, FieldGroup::Soil},
	    {"avg_ndvi", &Observation::avg_ndvi, FieldGroup::Soil},
	    {"soil_ph_level", &Observation::soil_ph_level, FieldGroup::Soil},
	    {"soil_organic_carbon", &Observation::soil_organic_carbon, FieldGroup::Soil},
	    {"soil_nitrogen_content", &Observation::soil_nitrogen_content, FieldGroup::Soil},
	    {"soil_sand_ratio", &Observation::soil_sand_ratio, FieldGroup::Soil},
	    {"soil_clay_ratio", &Observation::soil_clay_ratio, FieldGroup::Soil},
	    {"yield_ta_per_ha", &Observation::yield_ta_per_ha, FieldGroup::Agriculture},
	    {"area_thousand_ha", &Observation::area_thousand_ha, FieldGroup::Agriculture},
	};
	return fields;
}

void Observation::validate() const {
	if (province_name.empty()) {
		throw std::invalid_argument("Observation: province_name must not be empty.");
	}
	if (commodity.empty()) {
		throw std::invalid_argument("Observation: commodity must not be empty.");
	}
	if (season.empty()) {
		throw std::invalid_argument("Observation: season must not be empty.");
	}
	if (year <= 0) {
		throw std::invalid_argument("Observation: year must be positive.");
	}
	for (const auto &field : numericFields()) {
		if (!std::isfinite(this->*field.member)) {
			throw std::invalid_argument(std::string("Observation: ") + field.name + " must be finite.");
		}
	}
	if (area_thousand_ha <= 0.0) {
		throw std::invalid_argument("Observation: area_thousand_ha must be positive.");
	}
}

FeatureFrame Observation::toFrame() const {
	FeatureFrame frame;
	frame.setText("province_name", {province_name});
	frame.setNumeric("year", {static_cast<double>(year)});
	frame.setText("commodity", {commodity});
	frame.setText("season", {season});
	for (const auto &field : numericFields()) {
		frame.setNumeric(field.name, {this->*field.member});
	}
	return frame;
}

} // namespace agriyield::core
