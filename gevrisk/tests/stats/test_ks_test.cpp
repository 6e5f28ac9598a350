#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "common/gev_fixtures.hpp"
#include "gevrisk/errors.hpp"
#include "gevrisk/estimation/gev_fitter.hpp"
#include "gevrisk/stats/ks_test.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>
#include <vector>

using namespace gevrisk::stats;

TEST_CASE("ksStatistic measures the largest cdf gap", "[stats][ks]") {
	const auto uniform = [](double x) { return std::min(1.0, std::max(0.0, x)); };

	// Perfectly spread sample: every gap is 1/(2n).
	REQUIRE(ksStatistic({0.125, 0.375, 0.625, 0.875}, uniform) == Catch::Approx(0.125));

	// All mass at zero: the empirical cdf jumps to 1 where F is 0.
	REQUIRE(ksStatistic({0.0, 0.0, 0.0}, uniform) == Catch::Approx(1.0));

	REQUIRE_THROWS_AS(ksStatistic({}, uniform), std::invalid_argument);
	REQUIRE_THROWS_AS(ksStatistic({0.1, std::numeric_limits<double>::quiet_NaN()}, uniform), std::invalid_argument);
}

TEST_CASE("kolmogorovCdf matches tabulated values", "[stats][ks][kolmogorov]") {
	REQUIRE(kolmogorovCdf(0.0) == 0.0);
	REQUIRE(kolmogorovCdf(-1.0) == 0.0);
	REQUIRE(kolmogorovCdf(1.3581) == Catch::Approx(0.95).margin(1e-4));
	REQUIRE(kolmogorovCdf(1.2238) == Catch::Approx(0.90).margin(1e-4));
	REQUIRE(kolmogorovCdf(0.5) == Catch::Approx(0.0361).margin(1e-4));
	REQUIRE(kolmogorovCdf(3.0) == Catch::Approx(1.0).margin(1e-7));

	// Both series branches agree where they meet.
	REQUIRE(kolmogorovCdf(0.999999) == Catch::Approx(kolmogorovCdf(1.000001)).margin(1e-5));
}

TEST_CASE("kolmogorovExactCdf matches the published example", "[stats][ks][exact]") {
	REQUIRE(kolmogorovExactCdf(10, 0.274) == Catch::Approx(0.6284796154565043).epsilon(1e-10));
	REQUIRE(kolmogorovExactCdf(30, 0.0) == 0.0);
	REQUIRE(kolmogorovExactCdf(30, 1.0) == 1.0);
	REQUIRE_THROWS_AS(kolmogorovExactCdf(0, 0.5), std::invalid_argument);

	// Converges to the limiting distribution for large n.
	const std::size_t n = 400;
	const double d = 1.3581 / std::sqrt(static_cast<double>(n));
	REQUIRE(kolmogorovExactCdf(n, d) == Catch::Approx(kolmogorovCdf(1.3581)).margin(0.01));
}

TEST_CASE("ksTest p-values lie in the unit interval", "[stats][ks]") {
	const auto sample = tests::helpers::sampleGev(90.0, 10.0, 0.1, 30, 19);

	const auto good = ksTest(sample, gevrisk::distributions::GevParameters{90.0, 10.0, 0.1});
	REQUIRE(good.p_value >= 0.0);
	REQUIRE(good.p_value <= 1.0);
	REQUIRE(good.statistic > 0.0);

	// A distribution far from the sample is rejected.
	const auto bad = ksTest(sample, gevrisk::distributions::GevParameters{300.0, 1.0, 0.0});
	REQUIRE(bad.statistic == Catch::Approx(1.0).margin(1e-6));
	REQUIRE(bad.p_value < 1e-6);

	KsTestOptions exact;
	exact.method = KsMethod::Exact;
	const auto good_exact = ksTest(sample, gevrisk::distributions::GevParameters{90.0, 10.0, 0.1}, exact);
	REQUIRE(good_exact.statistic == Catch::Approx(good.statistic));
	REQUIRE(good_exact.p_value >= 0.0);
	REQUIRE(good_exact.p_value <= 1.0);
}

TEST_CASE("Fitted GEV samples pass the KS test", "[stats][ks][roundtrip]") {
	const gevrisk::estimation::GevFitter fitter;
	int trials = 0;
	int passed = 0;
	for (unsigned int seed = 1; seed <= 60; ++seed) {
		const auto sample = tests::helpers::sampleGev(190.0, 15.0, -0.05, 30, seed);
		++trials;
		try {
			const auto fit = fitter.fit(sample);
			if (ksPValue(sample, fit) > 0.05) {
				++passed;
			}
		} catch (const gevrisk::FitError &) {
			// Counts as a failed trial.
		}
	}
	REQUIRE(passed >= trials * 9 / 10);
}
