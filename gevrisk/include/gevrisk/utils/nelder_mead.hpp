#pragma once

#include <functional>
#include <limits>
#include <vector>

namespace gevrisk::utils {

/**
 * @brief Derivative-free simplex minimizer used for likelihood maximization.
 *
 * The iteration count is bounded by Options::max_iterations so a search that
 * cannot settle returns with converged == false instead of looping.
 */
class NelderMeadOptimizer {
public:
	struct Options {
		double alpha = 1.0;      // reflection
		double gamma = 2.0;      // expansion
		double rho = 0.5;        // contraction
		double sigma = 0.5;      // shrink
		double step = 0.1;       // initial simplex step
		std::vector<double> steps; // per-coordinate steps, overrides step when set
		int max_iterations = 5000;
		double tolerance = 1e-10; // spread of vertex values
	};

	struct Result {
		std::vector<double> best;
		double value = std::numeric_limits<double>::quiet_NaN();
		int iterations = 0;
		int evaluations = 0;
		bool converged = false;
	};

	using Objective = std::function<double(const std::vector<double> &)>;

	Result minimize(const Objective &objective,
	                const std::vector<double> &initial,
	                const Options &options,
	                const std::vector<double> &lower_bounds = {},
	                const std::vector<double> &upper_bounds = {}) const;

private:
	struct Vertex {
		std::vector<double> point;
		double value;
	};

	static void clampToBounds(std::vector<double> &point,
	                          const std::vector<double> &lower,
	                          const std::vector<double> &upper);

	static double valueSpread(const std::vector<Vertex> &simplex);
};

} // namespace gevrisk::utils
