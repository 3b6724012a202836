#include "agri-yield/features/feature_engineering.hpp"
#include "agri-yield/features/temporal_math.hpp"
#include "agri-yield/utils/logging.hpp"

#include <algorithm>
#include <numeric>
#include <stdexcept>
#include <unordered_set>

namespace agriyield::features {

namespace {

// Three-way comparison of one cell, missing values ordered last.
int compareCells(const core::FeatureFrame &frame, const std::string &column, std::size_t lhs, std::size_t rhs) {
	if (frame.isNumeric(column)) {
		const auto &values = frame.numeric(column);
		const bool lhs_missing = core::isMissing(values[lhs]);
		const bool rhs_missing = core::isMissing(values[rhs]);
		if (lhs_missing || rhs_missing) {
			return static_cast<int>(lhs_missing) - static_cast<int>(rhs_missing);
		}
		return values[lhs] < values[rhs] ? -1 : (values[rhs] < values[lhs] ? 1 : 0);
	}
	const auto &values = frame.text(column);
	const bool lhs_missing = core::isMissing(values[lhs]);
	const bool rhs_missing = core::isMissing(values[rhs]);
	if (lhs_missing || rhs_missing) {
		return static_cast<int>(lhs_missing) - static_cast<int>(rhs_missing);
	}
	return values[lhs].compare(values[rhs]);
}

bool keyMissing(const core::FeatureFrame &frame, const std::vector<std::string> &keys, std::size_t row) {
	for (const auto &key : keys) {
		const bool missing = frame.isNumeric(key) ? core::isMissing(frame.numeric(key)[row])
		                                          : core::isMissing(frame.text(key)[row]);
		if (missing) {
			return true;
		}
	}
	return false;
}

bool sameKey(const core::FeatureFrame &frame, const std::vector<std::string> &keys, std::size_t lhs,
             std::size_t rhs) {
	for (const auto &key : keys) {
		if (compareCells(frame, key, lhs, rhs) != 0) {
			return false;
		}
	}
	return true;
}

std::vector<std::string> presentKeys(const core::FeatureFrame &frame, const std::vector<std::string> &group_keys) {
	std::vector<std::string> keys;
	for (const auto &key : group_keys) {
		if (frame.hasColumn(key)) {
			keys.push_back(key);
		}
	}
	return keys;
}

// Group id per row of a frame already sorted by its keys.
std::vector<std::size_t> groupIds(const core::FeatureFrame &frame, const std::vector<std::string> &keys) {
	std::vector<std::size_t> ids(frame.rows(), kNoGroup);
	std::size_t next_id = 0;
	for (std::size_t row = 0; row < frame.rows(); ++row) {
		if (keyMissing(frame, keys, row)) {
			continue;
		}
		if (row > 0 && ids[row - 1] != kNoGroup && sameKey(frame, keys, row - 1, row)) {
			ids[row] = ids[row - 1];
		} else {
			ids[row] = next_id++;
		}
	}
	return ids;
}

} // namespace

void CombinedSeries::permute(const std::vector<std::size_t> &order) {
	if (order.size() != frame.rows()) {
		throw std::invalid_argument("CombinedSeries: permutation size does not match row count.");
	}
	auto it = std::find(order.begin(), order.end(), input_row);
	if (it == order.end()) {
		throw std::invalid_argument("CombinedSeries: permutation drops the input row.");
	}
	frame = frame.selectRows(order);
	input_row = static_cast<std::size_t>(std::distance(order.begin(), it));
}

std::vector<std::size_t> sortOrder(const core::FeatureFrame &frame, const std::vector<std::string> &group_keys,
                                   const std::string &year_column) {
	std::vector<std::string> columns = presentKeys(frame, group_keys);
	columns.push_back(year_column);

	std::vector<std::size_t> order(frame.rows());
	std::iota(order.begin(), order.end(), 0);
	std::stable_sort(order.begin(), order.end(), [&](std::size_t lhs, std::size_t rhs) {
		for (const auto &column : columns) {
			const int cmp = compareCells(frame, column, lhs, rhs);
			if (cmp != 0) {
				return cmp < 0;
			}
		}
		return false;
	});
	return order;
}

void restrictToEarlierYears(CombinedSeries &series, const std::string &year_column) {
	const auto &years = series.frame.numeric(year_column);
	const double input_year = years[series.input_row];

	std::vector<std::size_t> rows;
	std::size_t input_position = 0;
	for (std::size_t row = 0; row < series.frame.rows(); ++row) {
		if (row == series.input_row) {
			input_position = rows.size();
			rows.push_back(row);
		} else if (years[row] < input_year) {
			rows.push_back(row);
		}
	}
	series.frame = series.frame.selectRows(rows);
	series.input_row = input_position;
}

void restrictToInputGroup(CombinedSeries &series, const std::vector<std::string> &group_keys,
                          const std::string &year_column) {
	const auto keys = presentKeys(series.frame, group_keys);
	const auto &years = series.frame.numeric(year_column);
	const double input_year = years[series.input_row];

	std::vector<std::size_t> rows;
	std::size_t input_position = 0;
	for (std::size_t row = 0; row < series.frame.rows(); ++row) {
		if (row == series.input_row) {
			input_position = rows.size();
			rows.push_back(row);
		} else if (years[row] < input_year && sameKey(series.frame, keys, row, series.input_row)) {
			rows.push_back(row);
		}
	}
	series.frame = series.frame.selectRows(rows);
	series.input_row = input_position;
}

void createTemporalFeatures(CombinedSeries &series, const FeatureEngineeringConfig &config) {
	config.validate();
	auto &frame = series.frame;
	if (!frame.hasColumn(config.year_column)) {
		throw std::invalid_argument("Column '" + config.year_column + "' is required.");
	}
	const auto keys = presentKeys(frame, config.group_keys);
	if (keys.empty()) {
		throw std::invalid_argument("Grouping keys missing.");
	}

	const std::unordered_set<std::string> excluded = [&] {
		std::unordered_set<std::string> names(keys.begin(), keys.end());
		names.insert(config.year_column);
		return names;
	}();
	std::vector<std::string> base_columns;
	for (const auto &name : frame.numericColumnNames()) {
		if (excluded.count(name) == 0) {
			base_columns.push_back(name);
		}
	}

	series.permute(sortOrder(frame, keys, config.year_column));
	const auto positions = GroupPositions(groupIds(frame, keys));

	for (const auto &column : base_columns) {
		// Copy: adding columns may reallocate the frame's storage
		const Series values = frame.numeric(column);
		for (int w : config.windows) {
			const auto window = static_cast<std::size_t>(w);
			const std::string suffix = "_" + std::to_string(w);

			Series lag = LagWithinGroup(values, positions, window);
			Series mean = ShiftedRollingMean(values, positions, window);
			Series delta = LaggedDelta(values, positions, window);
			ReplaceInfinities(lag);
			ReplaceInfinities(mean);
			ReplaceInfinities(delta);

			frame.setNumeric(column + "_lag" + suffix, std::move(lag));
			frame.setNumeric(column + "_mean" + suffix, std::move(mean));
			frame.setNumeric(column + "_delta" + suffix, std::move(delta));
		}
	}

	AGRIYIELD_DEBUG("Derived {} temporal features from {} base columns over {} rows",
	                base_columns.size() * config.windows.size() * 3, base_columns.size(), frame.rows());
}

} // namespace agriyield::features
