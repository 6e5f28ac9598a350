#pragma once

#include "gevrisk/distributions/gev.hpp"
#include "gevrisk/estimation/gev_fitter.hpp"

#include <optional>

namespace gevrisk::stats {

/// Return period reported for a zero exceedance probability.
inline constexpr double kReturnPeriodCap = 1e12;

/**
 * @brief Probability that the level exceeds `threshold`, 1 - F(threshold).
 *
 * Always within [0, 1]: 1 below the lower support bound of a positive-shape fit,
 * 0 above the upper bound of a negative-shape fit.
 */
double overtoppingRisk(double threshold, const distributions::GevParameters &params);

double overtoppingRisk(double threshold, const estimation::GevFit &fit);

/**
 * @brief Converts an exceedance probability to a return period, 1 / risk rounded
 * to three decimals.
 *
 * A zero risk maps to kReturnPeriodCap.
 * @throws std::invalid_argument if risk is outside [0, 1] or NaN.
 */
double toReturnPeriod(double risk);

/// Absent risk stays absent.
std::optional<double> toReturnPeriod(const std::optional<double> &risk);

} // namespace gevrisk::stats
