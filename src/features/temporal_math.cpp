#include "agri-yield/features/temporal_math.hpp"

#include <cmath>

namespace agriyield::features {

namespace {

constexpr double kNaN = std::numeric_limits<double>::quiet_NaN();

bool hasPrior(const std::vector<std::size_t> &positions, std::size_t row, std::size_t periods) {
	return positions[row] != kNoGroup && positions[row] >= periods;
}

} // namespace

std::vector<std::size_t> GroupPositions(const std::vector<std::size_t> &group_ids) {
	std::vector<std::size_t> positions(group_ids.size(), kNoGroup);
	for (std::size_t row = 0; row < group_ids.size(); ++row) {
		if (group_ids[row] == kNoGroup) {
			continue;
		}
		if (row > 0 && group_ids[row - 1] == group_ids[row]) {
			positions[row] = positions[row - 1] + 1;
		} else {
			positions[row] = 0;
		}
	}
	return positions;
}

Series LagWithinGroup(const Series &values, const std::vector<std::size_t> &positions, std::size_t periods) {
	Series result(values.size(), kNaN);
	for (std::size_t row = 0; row < values.size(); ++row) {
		if (hasPrior(positions, row, periods)) {
			result[row] = values[row - periods];
		}
	}
	return result;
}

Series ShiftedRollingMean(const Series &values, const std::vector<std::size_t> &positions, std::size_t window) {
	Series result(values.size(), kNaN);
	for (std::size_t row = 0; row < values.size(); ++row) {
		if (positions[row] == kNoGroup) {
			continue;
		}
		double sum = 0.0;
		std::size_t count = 0;
		for (std::size_t back = 1; back <= window && hasPrior(positions, row, back); ++back) {
			const double value = values[row - back];
			if (!std::isnan(value)) {
				sum += value;
				++count;
			}
		}
		if (count > 0) {
			result[row] = sum / static_cast<double>(count);
		}
	}
	return result;
}

Series LaggedDelta(const Series &values, const std::vector<std::size_t> &positions, std::size_t window) {
	Series result(values.size(), kNaN);
	for (std::size_t row = 0; row < values.size(); ++row) {
		if (hasPrior(positions, row, window + 1)) {
			result[row] = values[row - 1] - values[row - window - 1];
		}
	}
	return result;
}

void ReplaceInfinities(Series &values) {
	for (double &value : values) {
		if (std::isinf(value)) {
			value = kNaN;
		}
	}
}

} // namespace agriyield::features
