#include "agri-yield/io/csv_reader.hpp"
#include "agri-yield/utils/logging.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <fstream>
#include <optional>
#include <stdexcept>

namespace agriyield::io {

namespace {

std::string trim(const std::string &value) {
	auto begin = std::find_if_not(value.begin(), value.end(), [](unsigned char c) { return std::isspace(c); });
	auto end = std::find_if_not(value.rbegin(), value.rend(), [](unsigned char c) { return std::isspace(c); }).base();
	return begin < end ? std::string(begin, end) : std::string();
}

// Reads one logical record; returns false at end of input.
bool readRecord(std::istream &input, char delimiter, std::vector<std::string> &fields) {
	fields.clear();
	std::string field;
	bool in_quotes = false;
	bool any = false;
	char c;
	while (input.get(c)) {
		any = true;
		if (in_quotes) {
			if (c == '"') {
				if (input.peek() == '"') {
					input.get(c);
					field.push_back('"');
				} else {
					in_quotes = false;
				}
			} else {
				field.push_back(c);
			}
			continue;
		}
		if (c == '"') {
			in_quotes = true;
		} else if (c == delimiter) {
			fields.push_back(std::move(field));
			field.clear();
		} else if (c == '\n') {
			break;
		} else if (c != '\r') {
			field.push_back(c);
		}
	}
	if (in_quotes) {
		throw std::invalid_argument("CSV: unterminated quoted field.");
	}
	if (!any) {
		return false;
	}
	fields.push_back(std::move(field));
	return true;
}

std::optional<double> parseNumber(const std::string &cell) {
	if (cell.empty()) {
		return std::nullopt;
	}
	errno = 0;
	char *end = nullptr;
	const double value = std::strtod(cell.c_str(), &end);
	if (end != cell.c_str() + cell.size() || errno == ERANGE) {
		return std::nullopt;
	}
	return value;
}

} // namespace

core::FeatureFrame parseCsv(std::istream &input, const CsvOptions &options) {
	std::vector<std::string> header;
	if (!readRecord(input, options.delimiter, header)) {
		throw std::invalid_argument("CSV: input has no header row.");
	}
	for (auto &name : header) {
		name = trim(name);
	}
	if (!header.empty() && header.front().size() >= 3 && header.front().compare(0, 3, "\xEF\xBB\xBF") == 0) {
		header.front().erase(0, 3);
	}

	std::vector<std::vector<std::string>> cells(header.size());
	std::vector<std::string> record;
	std::size_t line = 1;
	while (readRecord(input, options.delimiter, record)) {
		++line;
		if (record.size() == 1 && trim(record.front()).empty()) {
			continue;
		}
		if (record.size() != header.size()) {
			throw std::invalid_argument("CSV: record " + std::to_string(line) + " has " +
			                            std::to_string(record.size()) + " fields, expected " +
			                            std::to_string(header.size()) + ".");
		}
		for (std::size_t col = 0; col < header.size(); ++col) {
			std::string cell = trim(record[col]);
			const bool missing = std::find(options.missing_tokens.begin(), options.missing_tokens.end(), cell) !=
			                     options.missing_tokens.end();
			cells[col].push_back(missing ? std::string() : std::move(cell));
		}
	}

	core::FeatureFrame frame;
	for (std::size_t col = 0; col < header.size(); ++col) {
		core::FeatureFrame::NumericColumn numbers;
		numbers.reserve(cells[col].size());
		bool numeric = true;
		for (const auto &cell : cells[col]) {
			if (cell.empty()) {
				numbers.push_back(core::kMissing);
				continue;
			}
			auto value = parseNumber(cell);
			if (!value) {
				numeric = false;
				break;
			}
			numbers.push_back(*value);
		}
		if (numeric) {
			frame.setNumeric(header[col], std::move(numbers));
		} else {
			frame.setText(header[col], std::move(cells[col]));
		}
	}
	return frame;
}

core::FeatureFrame readCsv(const std::filesystem::path &path, const CsvOptions &options) {
	std::ifstream file(path);
	if (!file.is_open()) {
		throw std::runtime_error("CSV: cannot open '" + path.string() + "'.");
	}
	auto frame = parseCsv(file, options);
	AGRIYIELD_DEBUG("Read {} rows x {} columns from {}", frame.rows(), frame.columns(), path.string());
	return frame;
}

} // namespace agriyield::io
