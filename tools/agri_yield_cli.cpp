#include "agri-yield/api/prediction_service.hpp"
#include "agri-yield/config/pipeline_config.hpp"
#include "agri-yield/history/reference_stats.hpp"
#include "agri-yield/pipeline/predictor.hpp"
#include "agri-yield/utils/logging.hpp"

#include <nlohmann/json.hpp>

#include <fstream>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

namespace {

constexpr int kExitOk = 0;
constexpr int kExitError = 1;
constexpr int kExitUnavailable = 2;

struct Args {
	std::string config_path;
	std::string input_path;
	bool verbose = false;
	bool fill_climate = false;
	bool reference = false;
	bool help = false;
};

void printUsage() {
	std::cout << "Usage: agri-yield-predict --config <pipeline.json> --input <request.json> [options]\n"
	             "\n"
	             "Loads the prediction pipeline once, evaluates one request and prints the\n"
	             "response as JSON. Use '-' as input to read the request from stdin.\n"
	             "\n"
	             "Options:\n"
	             "  --fill-climate  replace climate fields that are 0 with the province's historical means\n"
	             "  --reference     add the latest recorded season of the group to the output\n"
	             "  --verbose, -v   debug logging\n"
	             "\n"
	             "Exit status: 0 prediction produced, 2 prediction unavailable, 1 usage or\n"
	             "configuration error.\n";
}

Args parseArgs(int argc, char **argv) {
	Args args;
	for (int i = 1; i < argc; ++i) {
		const std::string key = argv[i];
		auto need = [&](const std::string &flag) -> std::string {
			if (i + 1 >= argc) {
				throw std::invalid_argument("Missing value for " + flag);
			}
			return std::string(argv[++i]);
		};
		if (key == "--help" || key == "-h") {
			args.help = true;
		} else if (key == "--config") {
			args.config_path = need(key);
		} else if (key == "--input") {
			args.input_path = need(key);
		} else if (key == "--verbose" || key == "-v") {
			args.verbose = true;
		} else if (key == "--fill-climate") {
			args.fill_climate = true;
		} else if (key == "--reference") {
			args.reference = true;
		} else {
			throw std::invalid_argument("Unknown argument: " + key);
		}
	}
	if (!args.help && (args.config_path.empty() || args.input_path.empty())) {
		throw std::invalid_argument("Both --config and --input are required");
	}
	return args;
}

nlohmann::json readRequest(const std::string &path) {
	try {
		if (path == "-") {
			return nlohmann::json::parse(std::cin);
		}
		std::ifstream file(path);
		if (!file.is_open()) {
			throw std::runtime_error("Could not open request file: " + path);
		}
		return nlohmann::json::parse(file);
	} catch (const nlohmann::json::parse_error &e) {
		throw std::invalid_argument("Request is not valid JSON: " + std::string(e.what()));
	}
}

} // namespace

int main(int argc, char **argv) {
	Args args;
	try {
		args = parseArgs(argc, argv);
	} catch (const std::exception &e) {
		std::cerr << e.what() << "\n\n";
		printUsage();
		return kExitError;
	}
	if (args.help) {
		printUsage();
		return kExitOk;
	}

	agriyield::utils::Logging::init(args.verbose ? spdlog::level::debug : spdlog::level::warn);

	try {
		auto predictor = std::make_shared<agriyield::pipeline::Predictor>(
		    agriyield::config::loadPipelineConfig(args.config_path));
		predictor->load();
		const agriyield::api::PredictionService service(predictor);

		const auto request = readRequest(args.input_path);
		agriyield::core::Observation observation;
		try {
			observation = agriyield::api::observationFromJson(request);
		} catch (const std::invalid_argument &) {
			// The service reports the rejected request in the response body
			const auto outcome = service.evaluate(request);
			std::cout << agriyield::api::toJson(outcome).dump(2) << std::endl;
			return kExitUnavailable;
		}

		const auto &history = predictor->history();
		if (args.fill_climate && history) {
			const auto means = agriyield::history::provinceClimateMeans(*history, observation.province_name);
			const auto filled = agriyield::history::fillFromProvinceMeans(observation, means);
			AGRIYIELD_INFO("Filled {} climate fields from {} means", filled, observation.province_name);
		}

		const auto outcome = service.evaluate(observation);
		auto body = agriyield::api::toJson(outcome);
		if (args.reference && history) {
			const auto reference = agriyield::history::latestReference(
			    *history, observation.province_name, observation.commodity, observation.season, observation.year);
			if (reference) {
				body["reference"] = {{"year", reference->year},
				                     {"production_tonnes", reference->production_tonnes},
				                     {"yield_ton_per_ha", reference->yield_ton_per_ha}};
			}
		}
		std::cout << body.dump(2) << std::endl;
		return outcome.ok() ? kExitOk : kExitUnavailable;
	} catch (const std::exception &e) {
		AGRIYIELD_ERROR("{}", e.what());
		std::cerr << "agri-yield-predict: " << e.what() << std::endl;
		return kExitError;
	}
}
