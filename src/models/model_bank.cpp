#include "agri-yield/models/model_bank.hpp"
#include "agri-yield/utils/logging.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <unordered_map>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace agriyield::models {

namespace {

const std::string kSidecarSuffix = ".columns.json";

bool isSidecar(const std::string &file_name) {
	return file_name.size() > kSidecarSuffix.size() &&
	       file_name.compare(file_name.size() - kSidecarSuffix.size(), kSidecarSuffix.size(), kSidecarSuffix) == 0;
}

} // namespace

std::string ColumnNameRewrite::apply(const std::string &column) const {
	for (const auto &prefix : prefixes) {
		if (column.rfind(prefix, 0) == 0) {
			std::string rewritten = column;
			std::replace(rewritten.begin(), rewritten.end(), from, to);
			return rewritten;
		}
	}
	return column;
}

bool matchesPattern(const std::string &name, const std::string &pattern) {
	std::size_t n = 0;
	std::size_t p = 0;
	std::size_t star = std::string::npos;
	std::size_t resume = 0;
	while (n < name.size()) {
		if (p < pattern.size() && (pattern[p] == '?' || pattern[p] == name[n])) {
			++n;
			++p;
		} else if (p < pattern.size() && pattern[p] == '*') {
			star = p++;
			resume = n;
		} else if (star != std::string::npos) {
			p = star + 1;
			n = ++resume;
		} else {
			return false;
		}
	}
	while (p < pattern.size() && pattern[p] == '*') {
		++p;
	}
	return p == pattern.size();
}

std::optional<std::string> selectModelFile(const std::string &directory, const ModelSpec &spec) {
	std::error_code ec;
	if (!fs::is_directory(directory, ec)) {
		return std::nullopt;
	}

	for (const auto &group : spec.candidates) {
		std::optional<fs::path> best;
		fs::file_time_type best_time;
		for (const auto &item : fs::directory_iterator(directory, ec)) {
			if (!item.is_regular_file(ec)) {
				continue;
			}
			const auto file_name = item.path().filename().string();
			if (isSidecar(file_name)) {
				continue;
			}
			const bool matched = std::any_of(group.begin(), group.end(), [&](const std::string &pattern) {
				return matchesPattern(file_name, pattern);
			});
			if (!matched) {
				continue;
			}
			const auto modified = item.last_write_time(ec);
			// Newest wins, ties go to the lexicographically last name
			if (!best || modified > best_time || (modified == best_time && item.path() > *best)) {
				best = item.path();
				best_time = modified;
			}
		}
		if (best) {
			return best->string();
		}
	}
	return std::nullopt;
}

std::optional<std::vector<std::string>> readColumnsSidecar(const std::string &model_path) {
	const std::string sidecar = model_path + kSidecarSuffix;
	std::ifstream file(sidecar);
	if (!file.is_open()) {
		return std::nullopt;
	}
	try {
		json root;
		file >> root;
		if (root.is_object()) {
			return root.at("feature_names").get<std::vector<std::string>>();
		}
		return root.get<std::vector<std::string>>();
	} catch (const json::exception &e) {
		throw std::invalid_argument("Malformed column sidecar " + sidecar + ": " + e.what());
	}
}

ModelBank::ModelBank(std::vector<ModelEntry> entries) {
	for (auto &entry : entries) {
		add(std::move(entry));
	}
}

ModelBank ModelBank::load(const std::string &directory, const std::vector<ModelSpec> &specs) {
	ModelBank bank;
	std::error_code ec;
	if (!fs::is_directory(directory, ec)) {
		AGRIYIELD_WARN("Model directory {} does not exist; no models loaded", directory);
		return bank;
	}

	for (const auto &spec : specs) {
		const auto path = selectModelFile(directory, spec);
		if (!path) {
			AGRIYIELD_WARN("No {} model file for '{}' in {}", toString(spec.format), spec.name, directory);
			continue;
		}
		try {
			ModelEntry entry;
			entry.name = spec.name;
			entry.model = loadModel(*path, spec.format);
			entry.expected_columns = readColumnsSidecar(*path);
			if (!entry.expected_columns) {
				entry.expected_columns = entry.model->featureNames();
			}
			entry.column_name_rewrite = spec.column_name_rewrite;
			entry.source = *path;
			bank.add(std::move(entry));
			AGRIYIELD_INFO("Loaded model '{}' from {}", spec.name, *path);
		} catch (const std::exception &e) {
			AGRIYIELD_WARN("Failed to load model '{}' from {}: {}", spec.name, *path, e.what());
		}
	}
	return bank;
}

void ModelBank::add(ModelEntry entry) {
	if (!entry.model) {
		throw std::invalid_argument("Model entry '" + entry.name + "' has no model.");
	}
	if (contains(entry.name)) {
		throw std::invalid_argument("Model '" + entry.name + "' is already in the bank.");
	}
	entries_.push_back(std::move(entry));
}

bool ModelBank::contains(const std::string &name) const {
	return std::any_of(entries_.begin(), entries_.end(), [&](const ModelEntry &entry) {
		return entry.name == name;
	});
}

std::vector<std::string> ModelBank::names() const {
	std::vector<std::string> result;
	for (const auto &entry : entries_) {
		result.push_back(entry.name);
	}
	return result;
}

std::vector<double> ModelBank::alignRow(const ModelEntry &entry, const core::FeatureFrame &frame) {
	if (frame.rows() == 0) {
		throw std::invalid_argument("No feature row to score.");
	}

	std::unordered_map<std::string, std::string> available;
	for (const auto &column : frame.columnNames()) {
		const auto renamed = entry.column_name_rewrite ? entry.column_name_rewrite->apply(column) : column;
		if (!available.emplace(renamed, column).second) {
			throw std::invalid_argument("Renaming produces duplicate column '" + renamed + "'.");
		}
	}

	auto value = [&](const std::string &column) {
		if (!frame.isNumeric(column)) {
			throw std::invalid_argument("Column '" + column + "' is not numeric.");
		}
		return frame.numeric(column).front();
	};

	std::vector<double> row;
	if (entry.expected_columns) {
		for (const auto &expected : *entry.expected_columns) {
			auto it = available.find(expected);
			if (it != available.end()) {
				row.push_back(value(it->second));
			}
		}
	} else {
		for (const auto &column : frame.columnNames()) {
			row.push_back(value(column));
		}
	}

	if (row.size() != entry.model->numFeatures()) {
		throw std::invalid_argument("Aligned " + std::to_string(row.size()) + " columns but the model expects " +
		                            std::to_string(entry.model->numFeatures()) + ".");
	}
	return row;
}

std::map<std::string, double> ModelBank::score(const core::FeatureFrame &frame) const {
	std::map<std::string, double> predictions;
	for (const auto &entry : entries_) {
		try {
			const double prediction = entry.model->predict(alignRow(entry, frame));
			if (!std::isfinite(prediction)) {
				AGRIYIELD_WARN("Model '{}' produced a non-finite prediction; skipping it", entry.name);
				continue;
			}
			AGRIYIELD_DEBUG("Model '{}' predicted {}", entry.name, prediction);
			predictions.emplace(entry.name, prediction);
		} catch (const std::exception &e) {
			AGRIYIELD_WARN("Model '{}' failed to score: {}", entry.name, e.what());
		}
	}
	return predictions;
}

} // namespace agriyield::models
