#pragma once

#include <limits>
#include <random>
#include <vector>

namespace gevrisk::distributions {

/// Shapes closer to zero than this use the Gumbel limit form.
inline constexpr double kGumbelShapeTolerance = 1e-6;

/**
 * @brief Parameters of a Generalized Extreme Value distribution.
 *
 * F(x) = exp(-(1 + shape * (x - location) / scale)^(-1 / shape)), defined where
 * 1 + shape * (x - location) / scale > 0; Gumbel when shape == 0.
 */
struct GevParameters {
	double location = 0.0; ///< mu
	double scale = 1.0;    ///< beta, strictly positive
	double shape = 0.0;    ///< xi

	bool isValid() const;
	bool isGumbel() const;
};

/**
 * @class GevDistribution
 * @brief Density, distribution and quantile functions of the GEV family.
 */
class GevDistribution {
public:
	/**
	 * @throws std::invalid_argument if scale <= 0 or any parameter is not finite.
	 */
	explicit GevDistribution(GevParameters params);

	const GevParameters &parameters() const {
		return params_;
	}

	/// Cumulative distribution function, honouring the support boundaries.
	double cdf(double x) const;

	/// Upper tail 1 - F(x), computed without cancellation for large x.
	double survival(double x) const;

	double pdf(double x) const;

	/// Log density; -infinity outside the support.
	double logPdf(double x) const;

	/// Inverse CDF for p in (0, 1).
	double quantile(double p) const;

	/**
	 * @brief Level exceeded on average once every `period` steps.
	 * @param period Return period, must be > 1.
	 */
	double returnLevel(double period) const;

	/// Lower support bound (finite only when shape > 0).
	double lowerBound() const;

	/// Upper support bound (finite only when shape < 0).
	double upperBound() const;

	/// Inverse-transform draws.
	std::vector<double> sample(std::size_t count, std::mt19937 &rng) const;

private:
	// 1 + shape * (x - location) / scale
	double reducedVariate(double x) const;

	GevParameters params_;
};

} // namespace gevrisk::distributions
