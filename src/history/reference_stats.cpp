#include "agri-yield/history/reference_stats.hpp"

#include <cmath>
#include <limits>
#include <vector>

namespace agriyield::history {

namespace {

bool textEquals(const core::FeatureFrame &frame, const std::string &column, std::size_t row,
                const std::string &expected) {
	return frame.hasColumn(column) && !frame.isNumeric(column) && frame.text(column)[row] == expected;
}

double cellOrZero(const core::FeatureFrame &frame, const std::string &column, std::size_t row) {
	if (!frame.hasColumn(column) || !frame.isNumeric(column)) {
		return 0.0;
	}
	const double value = frame.numeric(column)[row];
	return std::isnan(value) ? 0.0 : value;
}

// Years that are missing or would not fit an int are skipped
bool representableYear(double year) {
	return !std::isnan(year) && year >= static_cast<double>(std::numeric_limits<int>::min()) &&
	       year <= static_cast<double>(std::numeric_limits<int>::max());
}

} // namespace

std::map<std::string, double> provinceClimateMeans(const core::FeatureFrame &history, const std::string &province) {
	std::vector<std::size_t> rows;
	for (std::size_t row = 0; row < history.rows(); ++row) {
		if (textEquals(history, "province_name", row, province)) {
			rows.push_back(row);
		}
	}

	std::map<std::string, double> means;
	for (const auto &column : history.numericColumnNames()) {
		if (column == "year") {
			continue;
		}
		const auto &values = history.numeric(column);
		double sum = 0.0;
		std::size_t count = 0;
		for (std::size_t row : rows) {
			if (!std::isnan(values[row])) {
				sum += values[row];
				++count;
			}
		}
		if (count > 0) {
			means[column] = sum / static_cast<double>(count);
		}
	}
	return means;
}

std::size_t fillFromProvinceMeans(core::Observation &observation, const std::map<std::string, double> &means) {
	std::size_t filled = 0;
	for (const auto &field : core::Observation::numericFields()) {
		if (field.group != core::FieldGroup::Climate || observation.*field.member != 0.0) {
			continue;
		}
		auto it = means.find(field.name);
		if (it != means.end()) {
			observation.*field.member = it->second;
			++filled;
		}
	}
	return filled;
}

std::optional<ReferenceRecord> latestReference(const core::FeatureFrame &history, const std::string &province,
                                               const std::string &commodity, const std::string &season, int year) {
	if (!history.hasColumn("year") || !history.isNumeric("year")) {
		return std::nullopt;
	}
	const auto &years = history.numeric("year");

	std::optional<std::size_t> before;
	std::optional<std::size_t> latest;
	for (std::size_t row = 0; row < history.rows(); ++row) {
		if (!textEquals(history, "province_name", row, province) || !textEquals(history, "commodity", row, commodity) ||
		    !textEquals(history, "season", row, season) || !representableYear(years[row])) {
			continue;
		}
		if (!latest || years[row] > years[*latest]) {
			latest = row;
		}
		if (years[row] < year && (!before || years[row] > years[*before])) {
			before = row;
		}
	}
	if (!latest) {
		return std::nullopt;
	}

	const std::size_t row = before ? *before : *latest;
	ReferenceRecord record;
	record.year = static_cast<int>(years[row]);
	record.production_tonnes = cellOrZero(history, "production_thousand_tonnes", row) * 1000.0;
	record.yield_ton_per_ha = cellOrZero(history, "yield_ta_per_ha", row) / 10.0;
	return record;
}

} // namespace agriyield::history
