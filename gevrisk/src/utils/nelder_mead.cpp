#include "gevrisk/utils/nelder_mead.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace gevrisk::utils {

namespace {

// NaN would break the strict weak ordering of the simplex sort.
double sanitize(double value) {
	return std::isnan(value) ? std::numeric_limits<double>::max() : value;
}

} // namespace

void NelderMeadOptimizer::clampToBounds(std::vector<double> &point,
                                        const std::vector<double> &lower,
                                        const std::vector<double> &upper) {
	for (std::size_t i = 0; i < point.size(); ++i) {
		if (i < lower.size()) {
			point[i] = std::max(lower[i], point[i]);
		}
		if (i < upper.size()) {
			point[i] = std::min(upper[i], point[i]);
		}
	}
}

double NelderMeadOptimizer::valueSpread(const std::vector<Vertex> &simplex) {
	double mean = 0.0;
	for (const auto &vertex : simplex) {
		mean += vertex.value;
	}
	mean /= static_cast<double>(simplex.size());

	double accum = 0.0;
	for (const auto &vertex : simplex) {
		const double diff = vertex.value - mean;
		accum += diff * diff;
	}
	return std::sqrt(accum / static_cast<double>(simplex.size()));
}

NelderMeadOptimizer::Result NelderMeadOptimizer::minimize(const Objective &objective,
                                                          const std::vector<double> &initial,
                                                          const Options &options,
                                                          const std::vector<double> &lower_bounds,
                                                          const std::vector<double> &upper_bounds) const {
	Result result;
	if (initial.empty()) {
		return result;
	}

	const std::size_t n = initial.size();
	if (!options.steps.empty() && options.steps.size() != n) {
		throw std::invalid_argument("NelderMeadOptimizer: steps must match the parameter count.");
	}

	auto evaluate = [&](const std::vector<double> &point) {
		++result.evaluations;
		return sanitize(objective(point));
	};

	std::vector<Vertex> simplex;
	simplex.reserve(n + 1);

	std::vector<double> origin = initial;
	clampToBounds(origin, lower_bounds, upper_bounds);
	simplex.push_back({origin, evaluate(origin)});
	for (std::size_t i = 0; i < n; ++i) {
		std::vector<double> vertex = origin;
		vertex[i] += options.steps.empty() ? options.step : options.steps[i];
		clampToBounds(vertex, lower_bounds, upper_bounds);
		const double value = evaluate(vertex);
		simplex.push_back({std::move(vertex), value});
	}

	const auto by_value = [](const Vertex &lhs, const Vertex &rhs) { return lhs.value < rhs.value; };
	std::sort(simplex.begin(), simplex.end(), by_value);

	std::vector<double> center(n);
	for (int iter = 0; iter < options.max_iterations; ++iter) {
		result.iterations = iter + 1;

		if (valueSpread(simplex) < options.tolerance) {
			result.converged = true;
			break;
		}

		// Centroid of every vertex but the worst.
		std::fill(center.begin(), center.end(), 0.0);
		for (std::size_t v = 0; v < n; ++v) {
			for (std::size_t j = 0; j < n; ++j) {
				center[j] += simplex[v].point[j];
			}
		}
		for (double &c : center) {
			c /= static_cast<double>(n);
		}

		const Vertex &worst = simplex.back();
		auto along = [&](double coefficient, const std::vector<double> &from) {
			std::vector<double> point(n);
			for (std::size_t j = 0; j < n; ++j) {
				point[j] = center[j] + coefficient * (from[j] - center[j]);
			}
			clampToBounds(point, lower_bounds, upper_bounds);
			return point;
		};

		auto reflected = along(-options.alpha, worst.point);
		const double reflected_value = evaluate(reflected);

		if (reflected_value < simplex.front().value) {
			auto expanded = along(options.gamma, reflected);
			const double expanded_value = evaluate(expanded);
			if (expanded_value < reflected_value) {
				simplex.back() = {std::move(expanded), expanded_value};
			} else {
				simplex.back() = {std::move(reflected), reflected_value};
			}
		} else if (reflected_value < simplex[n - 1].value) {
			simplex.back() = {std::move(reflected), reflected_value};
		} else {
			auto contracted = along(options.rho, worst.point);
			const double contracted_value = evaluate(contracted);
			if (contracted_value < worst.value) {
				simplex.back() = {std::move(contracted), contracted_value};
			} else {
				const std::vector<double> best = simplex.front().point;
				for (std::size_t v = 1; v < simplex.size(); ++v) {
					for (std::size_t j = 0; j < n; ++j) {
						simplex[v].point[j] = best[j] + options.sigma * (simplex[v].point[j] - best[j]);
					}
					clampToBounds(simplex[v].point, lower_bounds, upper_bounds);
					simplex[v].value = evaluate(simplex[v].point);
				}
			}
		}

		std::sort(simplex.begin(), simplex.end(), by_value);
	}

	result.best = simplex.front().point;
	result.value = simplex.front().value;
	return result;
}

} // namespace gevrisk::utils
