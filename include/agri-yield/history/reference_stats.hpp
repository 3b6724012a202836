#pragma once

#include "agri-yield/core/feature_frame.hpp"
#include "agri-yield/core/observation.hpp"

#include <map>
#include <optional>
#include <string>

namespace agriyield::history {

/**
 * @brief Mean of every numeric column over the rows of one province.
 *
 * Missing cells are skipped; a column with no value for the province is left
 * out. The year column is excluded.
 */
std::map<std::string, double> provinceClimateMeans(const core::FeatureFrame &history, const std::string &province);

/**
 * @brief Replaces every climate field of @p observation that is exactly 0
 *        with the province mean of that field, when one exists.
 * @return The number of fields filled.
 */
std::size_t fillFromProvinceMeans(core::Observation &observation, const std::map<std::string, double> &means);

/**
 * @struct ReferenceRecord
 * @brief Reported production and yield of one past season, in output units.
 */
struct ReferenceRecord {
	int year = 0;
	double production_tonnes = 0.0;
	double yield_ton_per_ha = 0.0;
};

/**
 * @brief The most recent recorded season before @p year for the group, or
 *        the latest season overall when none is earlier.
 *
 * Missing values are reported as 0.
 *
 * @return nullopt if the group has no rows.
 */
std::optional<ReferenceRecord> latestReference(const core::FeatureFrame &history, const std::string &province,
                                               const std::string &commodity, const std::string &season, int year);

} // namespace agriyield::history
