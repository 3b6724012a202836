#pragma once

#include <cstddef>
#include <limits>
#include <vector>

namespace agriyield::features {

using Series = std::vector<double>;

/// Marks a row that belongs to no group.
inline constexpr std::size_t kNoGroup = std::numeric_limits<std::size_t>::max();

/**
 * Position of each row inside its group, for rows already sorted so that each
 * group is contiguous. @p group_ids holds one id per row (kNoGroup for rows
 * without a complete key); positions restart at 0 whenever the id changes.
 */
std::vector<std::size_t> GroupPositions(const std::vector<std::size_t> &group_ids);

/// Value @p periods rows earlier in the same group, NaN when there is none.
Series LagWithinGroup(const Series &values, const std::vector<std::size_t> &positions, std::size_t periods);

/**
 * Mean of up to @p window values strictly before each row in its group.
 * Missing values inside the window are skipped; NaN if all are missing or
 * the row is first in its group.
 */
Series ShiftedRollingMean(const Series &values, const std::vector<std::size_t> &positions, std::size_t window);

/// lag(1) - lag(window + 1) within the group.
Series LaggedDelta(const Series &values, const std::vector<std::size_t> &positions, std::size_t window);

/// Replaces +/-infinity by NaN in place.
void ReplaceInfinities(Series &values);

} // namespace agriyield::features
