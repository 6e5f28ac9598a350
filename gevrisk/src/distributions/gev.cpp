#include "gevrisk/distributions/gev.hpp"

#include <cmath>
#include <stdexcept>

namespace gevrisk::distributions {

bool GevParameters::isValid() const {
	return std::isfinite(location) && std::isfinite(scale) && std::isfinite(shape) && scale > 0.0;
}

bool GevParameters::isGumbel() const {
	return std::abs(shape) < kGumbelShapeTolerance;
}

GevDistribution::GevDistribution(GevParameters params) : params_(params) {
	if (!params_.isValid()) {
		throw std::invalid_argument("GEV parameters must be finite with a positive scale.");
	}
}

double GevDistribution::reducedVariate(double x) const {
	return 1.0 + params_.shape * (x - params_.location) / params_.scale;
}

double GevDistribution::cdf(double x) const {
	if (std::isnan(x)) {
		return std::numeric_limits<double>::quiet_NaN();
	}
	if (params_.isGumbel()) {
		const double z = (x - params_.location) / params_.scale;
		return std::exp(-std::exp(-z));
	}
	const double t = reducedVariate(x);
	if (t <= 0.0) {
		// Below the lower bound (shape > 0) or above the upper bound (shape < 0).
		return params_.shape > 0.0 ? 0.0 : 1.0;
	}
	return std::exp(-std::pow(t, -1.0 / params_.shape));
}

double GevDistribution::survival(double x) const {
	if (std::isnan(x)) {
		return std::numeric_limits<double>::quiet_NaN();
	}
	if (params_.isGumbel()) {
		const double z = (x - params_.location) / params_.scale;
		return -std::expm1(-std::exp(-z));
	}
	const double t = reducedVariate(x);
	if (t <= 0.0) {
		return params_.shape > 0.0 ? 1.0 : 0.0;
	}
	return -std::expm1(-std::pow(t, -1.0 / params_.shape));
}

double GevDistribution::logPdf(double x) const {
	const double log_scale = std::log(params_.scale);
	if (params_.isGumbel()) {
		const double z = (x - params_.location) / params_.scale;
		return -log_scale - z - std::exp(-z);
	}
	const double t = reducedVariate(x);
	if (!(t > 0.0)) {
		return -std::numeric_limits<double>::infinity();
	}
	const double log_t = std::log(t);
	return -log_scale - (1.0 + 1.0 / params_.shape) * log_t - std::exp(-log_t / params_.shape);
}

double GevDistribution::pdf(double x) const {
	return std::exp(logPdf(x));
}

double GevDistribution::quantile(double p) const {
	if (!(p > 0.0 && p < 1.0)) {
		throw std::invalid_argument("GEV quantile requires a probability in (0, 1).");
	}
	const double y = -std::log(p);
	if (params_.isGumbel()) {
		return params_.location - params_.scale * std::log(y);
	}
	return params_.location + params_.scale * (std::pow(y, -params_.shape) - 1.0) / params_.shape;
}

double GevDistribution::returnLevel(double period) const {
	if (!(period > 1.0)) {
		throw std::invalid_argument("Return period must be greater than one step.");
	}
	return quantile(1.0 - 1.0 / period);
}

double GevDistribution::lowerBound() const {
	if (params_.isGumbel() || params_.shape < 0.0) {
		return -std::numeric_limits<double>::infinity();
	}
	return params_.location - params_.scale / params_.shape;
}

double GevDistribution::upperBound() const {
	if (params_.isGumbel() || params_.shape > 0.0) {
		return std::numeric_limits<double>::infinity();
	}
	return params_.location - params_.scale / params_.shape;
}

std::vector<double> GevDistribution::sample(std::size_t count, std::mt19937 &rng) const {
	std::uniform_real_distribution<double> uniform(0.0, 1.0);
	std::vector<double> draws;
	draws.reserve(count);
	while (draws.size() < count) {
		const double u = uniform(rng);
		if (u <= 0.0) {
			continue;
		}
		draws.push_back(quantile(u));
	}
	return draws;
}

} // namespace gevrisk::distributions
