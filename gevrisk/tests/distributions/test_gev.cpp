#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "gevrisk/distributions/gev.hpp"

#include <cmath>
#include <limits>
#include <random>
#include <stdexcept>

using gevrisk::distributions::GevDistribution;
using gevrisk::distributions::GevParameters;

TEST_CASE("GevDistribution rejects invalid parameters", "[distributions][gev]") {
	REQUIRE_THROWS_AS(GevDistribution({0.0, 0.0, 0.1}), std::invalid_argument);
	REQUIRE_THROWS_AS(GevDistribution({0.0, -1.0, 0.1}), std::invalid_argument);
	REQUIRE_THROWS_AS(GevDistribution({std::numeric_limits<double>::quiet_NaN(), 1.0, 0.0}), std::invalid_argument);
	REQUIRE_THROWS_AS(GevDistribution({0.0, 1.0, std::numeric_limits<double>::infinity()}), std::invalid_argument);
	REQUIRE_NOTHROW(GevDistribution({0.0, 1.0, 0.0}));
}

TEST_CASE("GevDistribution Gumbel case matches the closed form", "[distributions][gev][gumbel]") {
	const GevDistribution dist({140.0, 5.0, 0.0});
	REQUIRE(dist.parameters().isGumbel());

	REQUIRE(dist.cdf(140.0) == Catch::Approx(std::exp(-1.0)));
	REQUIRE(dist.survival(140.0) == Catch::Approx(1.0 - std::exp(-1.0)));
	REQUIRE(dist.cdf(150.0) == Catch::Approx(std::exp(-std::exp(-2.0))));
	REQUIRE(dist.pdf(140.0) == Catch::Approx(std::exp(-1.0) / 5.0));
	REQUIRE(std::isinf(dist.lowerBound()));
	REQUIRE(std::isinf(dist.upperBound()));

	// Shapes inside the tolerance use the same limit form.
	const GevDistribution near({140.0, 5.0, 1e-9});
	REQUIRE(near.cdf(150.0) == Catch::Approx(dist.cdf(150.0)));
}

TEST_CASE("GevDistribution honours the support boundaries", "[distributions][gev][support]") {
	SECTION("positive shape has a lower bound") {
		const GevDistribution dist({0.0, 1.0, 0.5});
		REQUIRE(dist.lowerBound() == Catch::Approx(-2.0));
		REQUIRE(std::isinf(dist.upperBound()));
		REQUIRE(dist.cdf(-3.0) == 0.0);
		REQUIRE(dist.survival(-3.0) == 1.0);
		REQUIRE(dist.pdf(-3.0) == 0.0);
		REQUIRE(std::isinf(dist.logPdf(-3.0)));
	}

	SECTION("negative shape has an upper bound") {
		const GevDistribution dist({0.0, 1.0, -0.5});
		REQUIRE(dist.upperBound() == Catch::Approx(2.0));
		REQUIRE(std::isinf(dist.lowerBound()));
		REQUIRE(dist.cdf(3.0) == 1.0);
		REQUIRE(dist.survival(3.0) == 0.0);
		REQUIRE(dist.logPdf(3.0) < 0.0);
		REQUIRE(std::isinf(dist.logPdf(3.0)));
	}
}

TEST_CASE("GevDistribution quantile inverts the cdf", "[distributions][gev][quantile]") {
	for (double shape : {-0.3, -0.05, 0.0, 0.1, 0.4}) {
		const GevDistribution dist({90.0, 10.0, shape});
		for (double p : {0.01, 0.25, 0.5, 0.9, 0.999}) {
			REQUIRE(dist.cdf(dist.quantile(p)) == Catch::Approx(p).epsilon(1e-10));
		}
	}

	const GevDistribution dist({90.0, 10.0, 0.1});
	REQUIRE(dist.returnLevel(100.0) == Catch::Approx(dist.quantile(0.99)));
	REQUIRE_THROWS_AS(dist.quantile(0.0), std::invalid_argument);
	REQUIRE_THROWS_AS(dist.quantile(1.0), std::invalid_argument);
	REQUIRE_THROWS_AS(dist.returnLevel(1.0), std::invalid_argument);
}

TEST_CASE("GevDistribution survival keeps precision in the far tail", "[distributions][gev][tail]") {
	const GevDistribution dist({0.0, 1.0, 0.0});
	const double x = 40.0;
	// 1 - exp(-exp(-40)) is about exp(-40); 1 - cdf would round to zero.
	REQUIRE(dist.survival(x) > 0.0);
	REQUIRE(dist.survival(x) == Catch::Approx(std::exp(-40.0)).epsilon(1e-6));
}

TEST_CASE("GevDistribution sampling is reproducible and within support", "[distributions][gev][sample]") {
	const GevDistribution dist({0.0, 1.0, -0.5});
	std::mt19937 first(7);
	std::mt19937 second(7);
	const auto a = dist.sample(200, first);
	const auto b = dist.sample(200, second);

	REQUIRE(a.size() == 200);
	REQUIRE(a == b);
	for (double x : a) {
		REQUIRE(x <= dist.upperBound());
	}
}
