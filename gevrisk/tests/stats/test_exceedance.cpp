#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "gevrisk/stats/exceedance.hpp"

#include <cmath>
#include <limits>
#include <optional>
#include <stdexcept>

using gevrisk::distributions::GevParameters;
using gevrisk::stats::kReturnPeriodCap;
using gevrisk::stats::overtoppingRisk;
using gevrisk::stats::toReturnPeriod;

TEST_CASE("overtoppingRisk is a probability that falls with the threshold", "[stats][exceedance]") {
	for (const GevParameters &params : {GevParameters{90.0, 10.0, 0.1}, GevParameters{190.0, 15.0, -0.05},
	                                    GevParameters{140.0, 5.0, 0.0}}) {
		double previous = 1.0;
		for (double threshold = 0.0; threshold <= 400.0; threshold += 2.5) {
			const double risk = overtoppingRisk(threshold, params);
			REQUIRE(risk >= 0.0);
			REQUIRE(risk <= 1.0);
			REQUIRE(risk <= previous);
			previous = risk;
		}
	}
}

TEST_CASE("overtoppingRisk matches the analytic exceedance", "[stats][exceedance]") {
	REQUIRE(overtoppingRisk(140.0, GevParameters{140.0, 5.0, 0.0}) == Catch::Approx(1.0 - std::exp(-1.0)));

	const double t = 1.0 + 0.1 * (100.0 - 90.0) / 10.0;
	const double expected = 1.0 - std::exp(-std::pow(t, -1.0 / 0.1));
	REQUIRE(overtoppingRisk(100.0, GevParameters{90.0, 10.0, 0.1}) == Catch::Approx(expected));
}

TEST_CASE("overtoppingRisk saturates outside the support", "[stats][exceedance][support]") {
	// Lower bound at -2.
	REQUIRE(overtoppingRisk(-10.0, GevParameters{0.0, 1.0, 0.5}) == 1.0);
	// Upper bound at 2.
	REQUIRE(overtoppingRisk(10.0, GevParameters{0.0, 1.0, -0.5}) == 0.0);

	REQUIRE_THROWS_AS(overtoppingRisk(std::numeric_limits<double>::quiet_NaN(), GevParameters{}),
	                  std::invalid_argument);
}

TEST_CASE("toReturnPeriod inverts and rounds the risk", "[stats][exceedance][return_period]") {
	REQUIRE(toReturnPeriod(1.0) == 1.0);
	REQUIRE(toReturnPeriod(0.25) == 4.0);
	REQUIRE(toReturnPeriod(0.3) == Catch::Approx(3.333).margin(1e-12));
	REQUIRE(toReturnPeriod(0.0007) == Catch::Approx(1428.571).margin(1e-9));

	SECTION("zero risk maps to the cap") {
		REQUIRE(toReturnPeriod(0.0) == kReturnPeriodCap);
		REQUIRE(toReturnPeriod(0.0) == 1e12);
		REQUIRE(toReturnPeriod(std::numeric_limits<double>::denorm_min()) == kReturnPeriodCap);
	}

	SECTION("absent stays absent") {
		REQUIRE_FALSE(toReturnPeriod(std::optional<double>{}).has_value());
		REQUIRE(toReturnPeriod(std::optional<double>{0.5}) == std::optional<double>{2.0});
	}

	SECTION("out of range") {
		REQUIRE_THROWS_AS(toReturnPeriod(-0.1), std::invalid_argument);
		REQUIRE_THROWS_AS(toReturnPeriod(1.5), std::invalid_argument);
		REQUIRE_THROWS_AS(toReturnPeriod(std::numeric_limits<double>::quiet_NaN()), std::invalid_argument);
	}
}
