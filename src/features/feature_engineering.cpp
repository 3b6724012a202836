#include "agri-yield/features/feature_engineering.hpp"
#include "agri-yield/transform/transformers.hpp"
#include "agri-yield/utils/logging.hpp"

#include <stdexcept>

namespace agriyield::features {

namespace {

const char *const kProductionColumn = "production_thousand_tonnes";
const char *const kRawYieldColumn = "yield_ta_per_ha";
const char *const kYieldColumn = "yield_ton_per_ha";
const char *const kAreaColumn = "area_thousand_ha";

bool startsWith(const std::string &value, const char *prefix) {
	return value.rfind(prefix, 0) == 0;
}

} // namespace

void FeatureEngineeringConfig::validate() const {
	if (windows.empty()) {
		throw std::invalid_argument("FeatureEngineeringConfig: at least one window is required.");
	}
	for (int w : windows) {
		if (w <= 0) {
			throw std::invalid_argument("FeatureEngineeringConfig: windows must be positive.");
		}
	}
	if (group_keys.empty()) {
		throw std::invalid_argument("FeatureEngineeringConfig: grouping keys must not be empty.");
	}
	if (year_column.empty()) {
		throw std::invalid_argument("FeatureEngineeringConfig: year column must be named.");
	}
}

CombinedSeries combineWithHistory(const core::FeatureFrame &history, const core::FeatureFrame &input) {
	if (input.rows() != 1) {
		throw std::invalid_argument("combineWithHistory: input must contain exactly one row.");
	}
	CombinedSeries series;
	series.frame = history.concat(input);
	series.input_row = history.rows();
	return series;
}

void initialCleaning(core::FeatureFrame &frame) {
	frame.dropColumnsIf([](const std::string &name) {
		return startsWith(name, "latitude") || startsWith(name, "longitude");
	});
	frame.dropColumn(kProductionColumn);

	if (frame.isNumeric(kRawYieldColumn)) {
		auto yield = frame.numeric(kRawYieldColumn);
		for (double &value : yield) {
			value /= 10.0;
		}
		frame.setNumeric(kYieldColumn, std::move(yield));
		frame.dropColumn(kRawYieldColumn);
	}
}

void logTransform(core::FeatureFrame &frame) {
	const transform::Log1p log1p;
	for (const char *column : {kYieldColumn, kAreaColumn}) {
		if (!frame.isNumeric(column)) {
			continue;
		}
		auto values = frame.numeric(column);
		log1p.transform(values);
		frame.setNumeric(std::string("log1p_") + column, std::move(values));
	}
	frame.dropColumn(kYieldColumn);
	frame.dropColumn(kAreaColumn);
}

core::FeatureFrame processSingleInput(const core::FeatureFrame &input_row, const core::FeatureFrame &history,
                                      const FeatureEngineeringConfig &config) {
	config.validate();
	CombinedSeries series = combineWithHistory(history, input_row);

	if (!series.frame.hasColumn(config.year_column)) {
		throw std::invalid_argument("Column '" + config.year_column + "' is required.");
	}
	if (!series.frame.isNumeric(config.year_column)) {
		throw std::invalid_argument("Column '" + config.year_column + "' must be numeric.");
	}
	// Province-level statistics must not see the input's year or later
	restrictToEarlierYears(series, config.year_column);

	initialCleaning(series.frame);
	logTransform(series.frame);
	createDomainFeatures(series.frame);

	restrictToInputGroup(series, config.group_keys, config.year_column);
	createTemporalFeatures(series, config);

	auto engineered = series.frame.selectRows({series.input_row});
	AGRIYIELD_DEBUG("Engineered input row has {} columns ({} history rows in its group)", engineered.columns(),
	                series.frame.rows() - 1);
	return engineered;
}

core::FeatureFrame processSingleInput(const core::Observation &input, const core::FeatureFrame &history,
                                      const FeatureEngineeringConfig &config) {
	return processSingleInput(input.toFrame(), history, config);
}

} // namespace agriyield::features
