#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "agri-yield/features/feature_engineering.hpp"
#include "common/frame_helpers.hpp"

#include <cmath>
#include <stdexcept>

using namespace agriyield::features;
using agriyield::core::FeatureFrame;
using Catch::Matchers::WithinAbs;

namespace {

FeatureFrame frameWithTemperatures(double max_temperature, double min_temperature) {
	auto observation = tests::helpers::makeObservation("An Giang", 2018);
	observation.max_temperature = max_temperature;
	observation.min_temperature = min_temperature;
	return observation.toFrame();
}

} // namespace

TEST_CASE("Domain features follow the agronomic formulas", "[features][domain]") {
	auto frame = tests::helpers::makeObservation("An Giang", 2018).toFrame();
	createDomainFeatures(frame);

	REQUIRE_THAT(frame.numeric("soil_quality_index")[0], WithinAbs((5.5 + 1.5 + 0.2 + 0.3 + 0.4) / 5.0, 1e-12));
	REQUIRE(frame.numeric("temp_range")[0] == 11.0);
	REQUIRE(frame.numeric("humidity_deficit")[0] == 3.0);
	REQUIRE_THAT(frame.numeric("precipitation_efficiency")[0], WithinAbs(5.0 / (27.0 + 1e-6), 1e-12));
	REQUIRE(frame.numeric("season_length_proxy")[0] == 90.0);
	REQUIRE(frame.numeric("wetness_index")[0] == 15.0);
	REQUIRE(frame.numeric("temp_anomaly")[0] == 0.0);
}

TEST_CASE("Domain features are appended in a fixed order", "[features][domain]") {
	auto frame = tests::helpers::makeObservation("An Giang", 2018).toFrame();
	const auto raw_columns = frame.columns();
	createDomainFeatures(frame);

	const std::vector<std::string> expected{"soil_quality_index",  "temp_range",   "humidity_deficit",
	                                        "precipitation_efficiency", "temp_anomaly", "season_length_proxy",
	                                        "heat_stress",          "cold_stress",  "wetness_index"};
	REQUIRE(frame.columns() == raw_columns + expected.size());
	for (std::size_t i = 0; i < expected.size(); ++i) {
		REQUIRE(frame.columnNames()[raw_columns + i] == expected[i]);
	}
}

TEST_CASE("Heat and cold stress are zero inside the comfort band", "[features][domain]") {
	SECTION("at the thresholds") {
		auto frame = frameWithTemperatures(35.0, 20.0);
		createDomainFeatures(frame);
		REQUIRE(frame.numeric("heat_stress")[0] == 0.0);
		REQUIRE(frame.numeric("cold_stress")[0] == 0.0);
	}
	SECTION("well inside") {
		auto frame = frameWithTemperatures(30.0, 25.0);
		createDomainFeatures(frame);
		REQUIRE(frame.numeric("heat_stress")[0] == 0.0);
		REQUIRE(frame.numeric("cold_stress")[0] == 0.0);
	}
	SECTION("outside") {
		auto frame = frameWithTemperatures(36.5, 18.0);
		createDomainFeatures(frame);
		REQUIRE(frame.numeric("heat_stress")[0] > 0.0);
		REQUIRE(frame.numeric("heat_stress")[0] == 1.5);
		REQUIRE(frame.numeric("cold_stress")[0] > 0.0);
		REQUIRE(frame.numeric("cold_stress")[0] == 2.0);
	}
}

TEST_CASE("Temperature anomaly is relative to the province mean", "[features][domain]") {
	auto first = tests::helpers::makeObservation("An Giang", 2017);
	auto second = tests::helpers::makeObservation("An Giang", 2018);
	auto other = tests::helpers::makeObservation("Dong Thap", 2018);
	first.avg_temperature = 27.0;
	second.avg_temperature = 29.0;
	other.avg_temperature = 40.0;

	auto frame = first.toFrame().concat(second.toFrame()).concat(other.toFrame());
	createDomainFeatures(frame);

	const auto &anomaly = frame.numeric("temp_anomaly");
	REQUIRE(anomaly[0] == -1.0);
	REQUIRE(anomaly[1] == 1.0);
	REQUIRE(anomaly[2] == 0.0);
}

TEST_CASE("Temperature anomaly needs the province column", "[features][domain]") {
	auto frame = tests::helpers::makeObservation("An Giang", 2018).toFrame();
	frame.dropColumn("province_name");
	createDomainFeatures(frame);
	REQUIRE_FALSE(frame.hasColumn("temp_anomaly"));
	REQUIRE(frame.hasColumn("wetness_index"));
}

TEST_CASE("Infinite domain values become missing", "[features][domain]") {
	auto observation = tests::helpers::makeObservation("An Giang", 2018);
	observation.avg_temperature = -1e-6;
	auto frame = observation.toFrame();
	createDomainFeatures(frame);
	REQUIRE(std::isnan(frame.numeric("precipitation_efficiency")[0]));
}

TEST_CASE("Missing soil columns give a missing soil index", "[features][domain]") {
	auto frame = tests::helpers::makeObservation("An Giang", 2018).toFrame();
	frame.dropColumnsIf([](const std::string &name) { return name.rfind("soil_", 0) == 0; });
	createDomainFeatures(frame);
	REQUIRE(std::isnan(frame.numeric("soil_quality_index")[0]));
}

TEST_CASE("Domain features require the climate columns", "[features][domain]") {
	auto frame = tests::helpers::makeObservation("An Giang", 2018).toFrame();
	frame.dropColumn("wet_bulb_temperature");
	REQUIRE_THROWS_AS(createDomainFeatures(frame), std::invalid_argument);
}
