#pragma once

#include "agri-yield/core/feature_frame.hpp"

#include <filesystem>
#include <istream>
#include <string>
#include <vector>

namespace agriyield::io {

struct CsvOptions {
	char delimiter = ',';
	/// Cell spellings treated as missing, in addition to the empty cell.
	std::vector<std::string> missing_tokens{"NA", "NaN", "nan", "null", "None"};
};

/**
 * @brief Parses CSV text with a header row into a FeatureFrame.
 *
 * Quoted fields may contain delimiters, doubled quotes and line breaks.
 * A column is numeric when every non-missing cell parses as a number,
 * otherwise it is a text column.
 *
 * @throws std::invalid_argument on a missing header, ragged rows or an
 *         unterminated quote.
 */
core::FeatureFrame parseCsv(std::istream &input, const CsvOptions &options = {});

/**
 * @brief Reads a CSV file into a FeatureFrame.
 * @throws std::runtime_error if the file cannot be opened.
 */
core::FeatureFrame readCsv(const std::filesystem::path &path, const CsvOptions &options = {});

} // namespace agriyield::io
