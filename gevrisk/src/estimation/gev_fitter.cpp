#include "gevrisk/estimation/gev_fitter.hpp"
#include "gevrisk/optimization/lbfgs_optimizer.hpp"
#include "gevrisk/utils/logging.hpp"
#include "gevrisk/utils/nelder_mead.hpp"

#include <Eigen/Dense>
#include <algorithm>
#include <cmath>
#include <limits>
#include <numeric>
#include <stdexcept>

namespace gevrisk::estimation {

namespace {

constexpr double kPenalty = 1e10;
constexpr double kEulerGamma = 0.57721566490153286;
constexpr double kPi = 3.14159265358979323846;

// Search space on the standardized scale, theta = (location, log scale, shape).
// Below shape -1 the likelihood is unbounded near the upper endpoint.
const std::vector<double> kLowerBounds{-50.0, -20.0, -1.0};
const std::vector<double> kUpperBounds{50.0, 5.0, 5.0};

double standardizedObjective(const std::vector<double> &z, const std::vector<double> &theta) {
	const double mu = theta[0];
	const double log_beta = theta[1];
	const double xi = theta[2];
	if (!std::isfinite(mu) || !std::isfinite(log_beta) || !std::isfinite(xi)) {
		return kPenalty;
	}
	const double beta = std::exp(log_beta);
	double total = static_cast<double>(z.size()) * log_beta;

	if (std::abs(xi) < distributions::kGumbelShapeTolerance) {
		for (double x : z) {
			const double s = (x - mu) / beta;
			total += s + std::exp(-s);
		}
	} else {
		for (double x : z) {
			const double t = 1.0 + xi * (x - mu) / beta;
			if (t <= 0.0) {
				return kPenalty;
			}
			const double log_t = std::log(t);
			total += (1.0 + 1.0 / xi) * log_t + std::exp(-log_t / xi);
		}
	}
	return std::isfinite(total) ? std::min(total, kPenalty) : kPenalty;
}

// Same objective with its analytic gradient, for the quasi-Newton polish.
double standardizedObjectiveWithGradient(const std::vector<double> &z, const std::vector<double> &theta,
                                         std::vector<double> &grad) {
	grad.assign(3, 0.0);
	const double value = standardizedObjective(z, theta);
	if (value >= kPenalty) {
		return value;
	}

	const double mu = theta[0];
	const double xi = theta[2];
	const double beta = std::exp(theta[1]);

	if (std::abs(xi) < distributions::kGumbelShapeTolerance) {
		for (double x : z) {
			const double s = (x - mu) / beta;
			const double e = std::exp(-s);
			grad[0] += (e - 1.0) / beta;
			grad[1] += 1.0 + s * (e - 1.0);
			grad[2] += s - 0.5 * s * s * (1.0 - e);
		}
		return value;
	}

	for (double x : z) {
		const double s = (x - mu) / beta;
		const double y = 1.0 + xi * s;
		const double log_y = std::log(y);
		const double w = std::exp(-log_y / xi); // y^(-1/xi)
		const double common = (w - (1.0 + xi)) / y;
		grad[0] += common / beta;
		grad[1] += 1.0 + s * common;
		grad[2] += -log_y / (xi * xi) + (1.0 + 1.0 / xi) * s / y + w * (log_y / (xi * xi) - s / (xi * y));
	}
	return value;
}

} // namespace

std::string describe(FitMethod method) {
	switch (method) {
	case FitMethod::NelderMead:
		return "nelder-mead";
	case FitMethod::NelderMeadLbfgs:
		return "nelder-mead+lbfgs";
	default:
		return "unknown";
	}
}

GevFitter::GevFitter() : GevFitter(Options{}) {
}

GevFitter::GevFitter(Options options) : options_(options) {
	if (options_.max_iterations <= 0) {
		throw std::invalid_argument("GevFitter: max_iterations must be positive.");
	}
	if (!(options_.tolerance > 0.0)) {
		throw std::invalid_argument("GevFitter: tolerance must be positive.");
	}
	if (!std::isfinite(options_.initial_shape)) {
		throw std::invalid_argument("GevFitter: initial_shape must be finite.");
	}
}

double GevFitter::negativeLogLikelihood(const std::vector<double> &sample,
                                        const distributions::GevParameters &params) {
	if (!params.isValid()) {
		return std::numeric_limits<double>::infinity();
	}
	const distributions::GevDistribution dist(params);
	double total = 0.0;
	for (double x : sample) {
		total -= dist.logPdf(x);
	}
	return total;
}

GevFit GevFitter::fit(const std::vector<double> &sample) const {
	const std::size_t n = sample.size();
	if (n < kMinSampleSize) {
		throw FitError("GEV fit needs at least " + std::to_string(kMinSampleSize) + " observations, got " +
		               std::to_string(n) + ".");
	}
	for (double x : sample) {
		if (!std::isfinite(x)) {
			throw FitError("GEV fit sample contains a missing or non-finite value.");
		}
	}

	const double mean = std::accumulate(sample.begin(), sample.end(), 0.0) / static_cast<double>(n);
	double ss = 0.0;
	for (double x : sample) {
		ss += (x - mean) * (x - mean);
	}
	const double sd = std::sqrt(ss / static_cast<double>(n - 1));
	if (!(sd > 1e-12 * std::max(1.0, std::abs(mean)))) {
		throw FitError("GEV fit sample has zero variance.");
	}

	std::vector<double> z;
	z.reserve(n);
	for (double x : sample) {
		z.push_back((x - mean) / sd);
	}

	const double beta0 = std::sqrt(6.0) / kPi;
	std::vector<double> theta0{-kEulerGamma * beta0, std::log(beta0), options_.initial_shape};
	auto objective = [&z](const std::vector<double> &theta) { return standardizedObjective(z, theta); };
	if (objective(theta0) >= kPenalty) {
		// The moment start lies outside the support for this shape; the Gumbel start never does.
		theta0[2] = 0.0;
	}

	utils::NelderMeadOptimizer::Options nm_options;
	nm_options.max_iterations = options_.max_iterations;
	nm_options.tolerance = options_.tolerance;
	nm_options.steps = {0.1, 0.1, 0.1};

	const utils::NelderMeadOptimizer optimizer;
	const auto simplex = optimizer.minimize(objective, theta0, nm_options, kLowerBounds, kUpperBounds);
	if (!simplex.converged) {
		throw FitError("GEV likelihood search did not converge within " + std::to_string(options_.max_iterations) +
		               " iterations.");
	}
	if (!(simplex.value < kPenalty)) {
		throw FitError("GEV likelihood search ended outside the distribution support.");
	}

	GevFit result;
	result.method = options_.method;
	result.sample_size = n;
	result.iterations = simplex.iterations;

	std::vector<double> theta = simplex.best;
	double objective_value = simplex.value;

	if (options_.method == FitMethod::NelderMeadLbfgs) {
		auto with_gradient = [&z](const std::vector<double> &point, std::vector<double> &grad) {
			return standardizedObjectiveWithGradient(z, point, grad);
		};
		const auto polish = optimization::LBFGSOptimizer::minimize(with_gradient, theta, kLowerBounds, kUpperBounds);
		if (polish.converged && polish.fx < objective_value) {
			theta = polish.x;
			objective_value = polish.fx;
			result.polished = true;
			result.iterations += polish.iterations;
		} else {
			GEVRISK_DEBUG("GEV fit: L-BFGS polish not applied ({})", polish.message);
		}
	}

	result.params.location = mean + sd * theta[0];
	result.params.scale = sd * std::exp(theta[1]);
	result.params.shape = theta[2];
	if (!result.params.isValid()) {
		throw FitError("GEV fit produced non-finite parameters.");
	}
	result.negative_log_likelihood = objective_value + static_cast<double>(n) * std::log(sd);

	if (options_.compute_standard_errors) {
		result.standard_errors = standardErrors(sample, result.params);
	}

	GEVRISK_DEBUG("GEV fit: n={} mu={:.4f} beta={:.4f} xi={:.4f} nll={:.4f} iterations={}", n,
	              result.params.location, result.params.scale, result.params.shape,
	              result.negative_log_likelihood, result.iterations);
	return result;
}

std::optional<std::array<double, 3>> GevFitter::standardErrors(const std::vector<double> &sample,
                                                                const distributions::GevParameters &params) const {
	const std::array<double, 3> point{params.location, params.scale, params.shape};
	const std::array<double, 3> step{1e-4 * std::max(1.0, std::abs(params.location)),
	                                 1e-4 * std::max(1.0, params.scale), 1e-4};

	auto nll = [&sample](std::array<double, 3> p) {
		return negativeLogLikelihood(sample, distributions::GevParameters{p[0], p[1], p[2]});
	};
	auto shifted = [&](int i, double di, int j, double dj) {
		auto p = point;
		p[i] += di * step[i];
		p[j] += dj * step[j];
		return nll(p);
	};

	const double center = nll(point);
	Eigen::Matrix3d hessian;
	for (int i = 0; i < 3; ++i) {
		hessian(i, i) = (shifted(i, 1.0, i, 0.0) - 2.0 * center + shifted(i, -1.0, i, 0.0)) / (step[i] * step[i]);
		for (int j = i + 1; j < 3; ++j) {
			const double value = (shifted(i, 1.0, j, 1.0) - shifted(i, 1.0, j, -1.0) - shifted(i, -1.0, j, 1.0) +
			                      shifted(i, -1.0, j, -1.0)) /
			                     (4.0 * step[i] * step[j]);
			hessian(i, j) = value;
			hessian(j, i) = value;
		}
	}

	if (!hessian.allFinite()) {
		// The optimum sits on the support boundary; the information matrix is undefined there.
		GEVRISK_DEBUG("GEV fit: observed information not finite, standard errors unavailable");
		return std::nullopt;
	}

	const Eigen::FullPivLU<Eigen::Matrix3d> lu(hessian);
	if (!lu.isInvertible()) {
		throw FitError("GEV fit information matrix is singular.");
	}
	const Eigen::Matrix3d covariance = lu.inverse();

	std::array<double, 3> errors{};
	for (int i = 0; i < 3; ++i) {
		if (!(covariance(i, i) > 0.0)) {
			GEVRISK_DEBUG("GEV fit: covariance not positive definite, standard errors unavailable");
			return std::nullopt;
		}
		errors[static_cast<std::size_t>(i)] = std::sqrt(covariance(i, i));
	}
	return errors;
}

} // namespace gevrisk::estimation
