#pragma once

#include "agri-yield/core/feature_frame.hpp"
#include "agri-yield/core/observation.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace agriyield::features {

/**
 * @struct FeatureEngineeringConfig
 * @brief Parameters of the temporal feature derivation.
 */
struct FeatureEngineeringConfig {
	/// Window sizes for lag/mean/delta features
	std::vector<int> windows{1, 2, 3, 4, 5, 6, 7};

	/// Columns that identify one independent yearly series
	std::vector<std::string> group_keys{"province_name", "commodity", "season"};

	std::string year_column = "year";

	/// @throws std::invalid_argument on a non-positive window or an empty key list
	void validate() const;
};

/**
 * @struct CombinedSeries
 * @brief Private copy of the history with the input observation appended.
 *
 * The input row is tracked by index so that it survives sorting without an
 * extra tag column in the frame.
 */
struct CombinedSeries {
	core::FeatureFrame frame;
	std::size_t input_row = 0;

	/// Reorders the rows and keeps input_row pointing at the same observation.
	void permute(const std::vector<std::size_t> &order);
};

CombinedSeries combineWithHistory(const core::FeatureFrame &history, const core::FeatureFrame &input);

/**
 * @brief Drops geolocation and production columns and converts the raw
 *        "per 10 ha" yield into yield_ton_per_ha.
 */
void initialCleaning(core::FeatureFrame &frame);

/**
 * @brief Replaces yield_ton_per_ha and area_thousand_ha with
 *        log1p_<column> = log1p(max(value, 0)).
 */
void logTransform(core::FeatureFrame &frame);

/**
 * @brief Adds the row-wise agronomic features (soil quality, temperature
 *        range, stress indices, ...). temp_anomaly is relative to the
 *        province mean over the whole frame, so callers restrict the frame
 *        to the rows the input may see first.
 * @throws std::invalid_argument if a required climate column is absent.
 */
void createDomainFeatures(core::FeatureFrame &frame);

/**
 * @brief Stable order of the rows by (group keys..., year), missing keys last.
 */
std::vector<std::size_t> sortOrder(const core::FeatureFrame &frame, const std::vector<std::string> &group_keys,
                                   const std::string &year_column);

/**
 * @brief Keeps the input row and every row, of any group, from a strictly
 *        earlier year. Rows without a year are dropped.
 */
void restrictToEarlierYears(CombinedSeries &series, const std::string &year_column);

/**
 * @brief Keeps the input row and the rows of its group from strictly
 *        earlier years.
 *
 * Groups are derived independently, so dropping other series leaves the
 * input row's temporal features unchanged. Rows of the same or a later year
 * (or without a year) are dropped so that the input can only see the past.
 */
void restrictToInputGroup(CombinedSeries &series, const std::vector<std::string> &group_keys,
                          const std::string &year_column);

/**
 * @brief Sorts the series by (group keys, year) and appends
 *        <col>_lag_<w>, <col>_mean_<w> and <col>_delta_<w> for every numeric
 *        column except the year and grouping keys.
 *
 * Every derived value for a row only reads strictly earlier rows of its group.
 *
 * @throws std::invalid_argument if the year column or all grouping keys are absent.
 */
void createTemporalFeatures(CombinedSeries &series, const FeatureEngineeringConfig &config);

/**
 * @brief Runs the full derivation for one observation against the history
 *        and returns the engineered input row.
 *
 * @p history is copied; nothing derived here is visible to later calls.
 */
core::FeatureFrame processSingleInput(const core::Observation &input, const core::FeatureFrame &history,
                                      const FeatureEngineeringConfig &config = {});

core::FeatureFrame processSingleInput(const core::FeatureFrame &input_row, const core::FeatureFrame &history,
                                      const FeatureEngineeringConfig &config = {});

} // namespace agriyield::features
