#include "gevrisk/stats/exceedance.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace gevrisk::stats {

double overtoppingRisk(double threshold, const distributions::GevParameters &params) {
	if (std::isnan(threshold)) {
		throw std::invalid_argument("Overtopping threshold must not be NaN.");
	}
	const distributions::GevDistribution dist(params);
	return std::clamp(dist.survival(threshold), 0.0, 1.0);
}

double overtoppingRisk(double threshold, const estimation::GevFit &fit) {
	return overtoppingRisk(threshold, fit.params);
}

double toReturnPeriod(double risk) {
	if (!(risk >= 0.0 && risk <= 1.0)) {
		throw std::invalid_argument("Exceedance probability must lie in [0, 1].");
	}
	if (risk == 0.0) {
		return kReturnPeriodCap;
	}
	const double period = 1.0 / risk;
	if (!std::isfinite(period)) {
		// Subnormal risk.
		return kReturnPeriodCap;
	}
	if (period > 1e15) {
		// Already beyond the precision of three decimals.
		return period;
	}
	return std::round(period * 1000.0) / 1000.0;
}

std::optional<double> toReturnPeriod(const std::optional<double> &risk) {
	if (!risk) {
		return std::nullopt;
	}
	return toReturnPeriod(*risk);
}

} // namespace gevrisk::stats
