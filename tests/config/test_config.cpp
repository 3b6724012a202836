#include <catch2/catch_test_macros.hpp>

#include "agri-yield/config/pipeline_config.hpp"
#include "common/artifact_helpers.hpp"

#include <filesystem>
#include <stdexcept>

using namespace agriyield::config;
using agriyield::models::ModelFormat;

TEST_CASE("Default configuration matches the deployed layout") {
	const PipelineConfig config;
	REQUIRE_NOTHROW(config.validate());
	REQUIRE(config.history_path == "data/final_sau_missingvalues.csv");
	REQUIRE(config.preprocessor_path == "models/preprocessor.json");
	REQUIRE(config.models_directory == "models");
	REQUIRE(config.features.windows == std::vector<int>{1, 2, 3, 4, 5, 6, 7});
	REQUIRE(config.features.group_keys == std::vector<std::string>{"province_name", "commodity", "season"});

	REQUIRE(config.models.size() == 4);
	const auto &lgb = config.models[1];
	REQUIRE(lgb.name == "lgb");
	REQUIRE(lgb.format == ModelFormat::LightGBMText);
	REQUIRE(lgb.column_name_rewrite.has_value());
	REQUIRE(lgb.column_name_rewrite->apply("province_name_An Giang") == "province_name_An_Giang");

	const auto &rf = config.models[3];
	REQUIRE(rf.candidates.size() == 2);
	REQUIRE(rf.candidates[1] == std::vector<std::string>{"rf_*.json"});
}

TEST_CASE("Absent keys keep their defaults") {
	const auto config = parsePipelineConfig(R"({"windows": [1, 3]})");
	REQUIRE(config.features.windows == std::vector<int>{1, 3});
	REQUIRE(config.history_path == "data/final_sau_missingvalues.csv");
	REQUIRE(config.ensemble.weights.at("lgb") == 0.5076);
	REQUIRE(config.models.size() == 4);
}

TEST_CASE("Configured models and weights replace the defaults") {
	const auto config = parsePipelineConfig(R"({
	  "weights": {"rf": 1.0},
	  "models": [
	    {"name": "rf", "format": "random_forest", "candidates": ["forest_*.json", "rf.json"]},
	    {"name": "lgb", "format": "lightgbm", "candidates": [["lgb_new.txt"], ["lgb_*.txt"]],
	     "column_name_rewrite": {"prefixes": ["province_name_", "season_"], "from": " ", "to": "-"}}
	  ]
	})");

	REQUIRE(config.ensemble.weights.size() == 1);
	REQUIRE(config.models.size() == 2);
	REQUIRE(config.models[0].candidates ==
	        std::vector<std::vector<std::string>>{{"forest_*.json", "rf.json"}});
	REQUIRE_FALSE(config.models[0].column_name_rewrite.has_value());
	REQUIRE(config.models[1].candidates.size() == 2);
	REQUIRE(config.models[1].column_name_rewrite->apply("season_late winter") == "season_late-winter");
}

TEST_CASE("Relative paths resolve against the base directory") {
	const auto config = parsePipelineConfig(R"({"history": "history.csv", "preprocessor": "/abs/pre.json"})",
	                                        "/srv/agri");
	REQUIRE(config.history_path == "/srv/agri/history.csv");
	REQUIRE(config.preprocessor_path == "/abs/pre.json");
	REQUIRE(config.models_directory == "/srv/agri/models");
}

TEST_CASE("Invalid configurations are rejected") {
	REQUIRE_THROWS_AS(parsePipelineConfig("[1, 2]"), std::invalid_argument);
	REQUIRE_THROWS_AS(parsePipelineConfig("{bad"), std::invalid_argument);
	REQUIRE_THROWS_AS(parsePipelineConfig(R"({"windows": []})"), std::invalid_argument);
	REQUIRE_THROWS_AS(parsePipelineConfig(R"({"windows": [0, 1]})"), std::invalid_argument);
	REQUIRE_THROWS_AS(parsePipelineConfig(R"({"group_keys": []})"), std::invalid_argument);
	REQUIRE_THROWS_AS(parsePipelineConfig(R"({"weights": {"lgb": -1}})"), std::invalid_argument);
	REQUIRE_THROWS_AS(parsePipelineConfig(R"({"weights": {"lgb": "high"}})"), std::invalid_argument);
	REQUIRE_THROWS_AS(parsePipelineConfig(R"({"models": [{"name": "x", "format": "onnx", "candidates": ["x"]}]})"),
	                  std::invalid_argument);
	REQUIRE_THROWS_AS(parsePipelineConfig(R"({"models": [{"name": "x", "format": "xgboost", "candidates": []}]})"),
	                  std::invalid_argument);
	REQUIRE_THROWS_AS(parsePipelineConfig(R"({"models": [
	    {"name": "x", "format": "xgboost", "candidates": ["a"]},
	    {"name": "x", "format": "catboost", "candidates": ["b"]}]})"),
	                  std::invalid_argument);
	REQUIRE_THROWS_AS(parsePipelineConfig(R"({"models": [{"name": "x", "format": "xgboost", "candidates": ["a"],
	    "column_name_rewrite": {"prefixes": ["p"], "from": "ab"}}]})"),
	                  std::invalid_argument);
}

TEST_CASE("Configuration files resolve paths next to themselves") {
	tests::helpers::TempDir dir;
	const auto path = dir.file("agri-yield.json");
	tests::helpers::writeFile(path, R"({"models_directory": "artifacts"})");

	const auto config = loadPipelineConfig(path);
	REQUIRE(std::filesystem::path(config.models_directory) ==
	        (dir.path() / "artifacts").lexically_normal());
	REQUIRE(std::filesystem::path(config.history_path) ==
	        (dir.path() / "data/final_sau_missingvalues.csv").lexically_normal());

	REQUIRE_THROWS_AS(loadPipelineConfig(dir.file("absent.json")), std::runtime_error);
}
