#pragma once

#include "gevrisk/distributions/gev.hpp"
#include "gevrisk/errors.hpp"

#include <array>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace gevrisk::estimation {

enum class FitMethod {
	NelderMead,      ///< simplex search on the log-likelihood
	NelderMeadLbfgs  ///< simplex search followed by an L-BFGS-B polish
};

std::string describe(FitMethod method);

/**
 * @brief Outcome of one maximum-likelihood GEV fit.
 */
struct GevFit {
	distributions::GevParameters params;
	double negative_log_likelihood = 0.0;
	std::size_t sample_size = 0;
	int iterations = 0;
	FitMethod method = FitMethod::NelderMead;
	bool polished = false;
	/// Standard errors of (location, scale, shape) from the observed information.
	std::optional<std::array<double, 3>> standard_errors;
};

/**
 * @class GevFitter
 * @brief Maximum-likelihood estimation of GEV parameters.
 *
 * The sample is standardized before optimizing, the scale is searched on the log
 * scale, and the starting point comes from the method of moments for the Gumbel
 * case with a small positive shape. Every failure mode (too few values, non-finite
 * values, zero variance, no convergence within the iteration cap, singular
 * information matrix) is reported as FitError.
 */
class GevFitter {
public:
	struct Options {
		FitMethod method = FitMethod::NelderMead;
		int max_iterations = 5000;
		double tolerance = 1e-10;
		double initial_shape = 0.1;
		bool compute_standard_errors = true;
	};

	GevFitter();
	explicit GevFitter(Options options);

	GevFit fit(const std::vector<double> &sample) const;

	const Options &options() const {
		return options_;
	}

	/**
	 * @brief GEV negative log-likelihood of a sample.
	 * @return +infinity when any observation lies outside the support.
	 */
	static double negativeLogLikelihood(const std::vector<double> &sample, const distributions::GevParameters &params);

	static constexpr std::size_t kMinSampleSize = 3;

private:
	std::optional<std::array<double, 3>> standardErrors(const std::vector<double> &sample,
	                                                    const distributions::GevParameters &params) const;

	Options options_;
};

} // namespace gevrisk::estimation
