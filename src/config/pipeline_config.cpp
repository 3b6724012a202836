#include "agri-yield/config/pipeline_config.hpp"
#include "agri-yield/utils/logging.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <fstream>
#include <set>
#include <sstream>
#include <stdexcept>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace agriyield::config {

namespace {

std::string resolve(const std::string &path, const std::string &base_directory) {
	if (base_directory.empty() || path.empty() || fs::path(path).is_absolute()) {
		return path;
	}
	return (fs::path(base_directory) / path).lexically_normal().string();
}

// Accepts ["a", "b"] as a single group or [["a"], ["b"]] as ordered groups.
std::vector<std::vector<std::string>> parseCandidates(const json &candidates) {
	std::vector<std::vector<std::string>> groups;
	for (const auto &item : candidates) {
		if (item.is_string()) {
			if (groups.empty()) {
				groups.emplace_back();
			}
			groups.front().push_back(item.get<std::string>());
		} else {
			groups.push_back(item.get<std::vector<std::string>>());
		}
	}
	return groups;
}

models::ColumnNameRewrite parseRewrite(const json &spec) {
	models::ColumnNameRewrite rewrite;
	rewrite.prefixes = spec.at("prefixes").get<std::vector<std::string>>();
	const auto from = spec.value("from", std::string(" "));
	const auto to = spec.value("to", std::string("_"));
	if (from.size() != 1 || to.size() != 1) {
		throw std::invalid_argument("column_name_rewrite 'from' and 'to' must be single characters.");
	}
	rewrite.from = from.front();
	rewrite.to = to.front();
	return rewrite;
}

models::ModelSpec parseModelSpec(const json &spec) {
	models::ModelSpec model;
	model.name = spec.at("name").get<std::string>();
	model.format = models::parseModelFormat(spec.at("format").get<std::string>());
	model.candidates = parseCandidates(spec.at("candidates"));
	if (spec.contains("column_name_rewrite") && !spec.at("column_name_rewrite").is_null()) {
		model.column_name_rewrite = parseRewrite(spec.at("column_name_rewrite"));
	}
	return model;
}

} // namespace

std::vector<models::ModelSpec> PipelineConfig::defaultModelSpecs() {
	models::ColumnNameRewrite province_rewrite;
	province_rewrite.prefixes = {"province_name_"};

	return {
	    {"xgb", models::ModelFormat::XGBoostJson, {{"xgb_yield_model.json"}}, std::nullopt},
	    {"lgb", models::ModelFormat::LightGBMText, {{"lgb_yield_model.txt"}}, province_rewrite},
	    {"cat", models::ModelFormat::CatBoostJson, {{"*.cbm.json"}}, std::nullopt},
	    {"rf", models::ModelFormat::RandomForestJson, {{"*random_forest*.json"}, {"rf_*.json"}}, std::nullopt},
	};
}

void PipelineConfig::validate() const {
	features.validate();
	ensemble.validate();
	std::set<std::string> names;
	for (const auto &model : models) {
		if (model.name.empty()) {
			throw std::invalid_argument("Model specs need a name.");
		}
		if (!names.insert(model.name).second) {
			throw std::invalid_argument("Model '" + model.name + "' is configured twice.");
		}
		if (model.candidates.empty()) {
			throw std::invalid_argument("Model '" + model.name + "' has no candidate file patterns.");
		}
	}
}

PipelineConfig parsePipelineConfig(const std::string &text, const std::string &base_directory) {
	PipelineConfig config;
	try {
		const json root = json::parse(text);
		if (!root.is_object()) {
			throw std::invalid_argument("Pipeline configuration must be a JSON object.");
		}
		config.history_path = root.value("history", config.history_path);
		config.preprocessor_path = root.value("preprocessor", config.preprocessor_path);
		config.models_directory = root.value("models_directory", config.models_directory);

		config.features.windows = root.value("windows", config.features.windows);
		config.features.group_keys = root.value("group_keys", config.features.group_keys);
		config.features.year_column = root.value("year_column", config.features.year_column);

		if (root.contains("weights")) {
			config.ensemble.weights = root.at("weights").get<std::map<std::string, double>>();
		}
		if (root.contains("models")) {
			config.models.clear();
			for (const auto &spec : root.at("models")) {
				config.models.push_back(parseModelSpec(spec));
			}
		}
	} catch (const json::exception &e) {
		throw std::invalid_argument(std::string("Invalid pipeline configuration: ") + e.what());
	}

	config.history_path = resolve(config.history_path, base_directory);
	config.preprocessor_path = resolve(config.preprocessor_path, base_directory);
	config.models_directory = resolve(config.models_directory, base_directory);
	config.validate();
	return config;
}

PipelineConfig loadPipelineConfig(const std::string &path) {
	std::ifstream file(path);
	if (!file.is_open()) {
		throw std::runtime_error("Could not open configuration file: " + path);
	}
	std::ostringstream buffer;
	buffer << file.rdbuf();
	auto base = fs::path(path).parent_path().string();
	if (base.empty()) {
		base = ".";
	}
	AGRIYIELD_DEBUG("Reading pipeline configuration from {}", path);
	return parsePipelineConfig(buffer.str(), base);
}

} // namespace agriyield::config
