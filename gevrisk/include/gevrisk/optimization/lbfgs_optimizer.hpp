#pragma once

#include <functional>
#include <string>
#include <vector>

namespace gevrisk::optimization {

/**
 * @brief Box-constrained L-BFGS-B minimizer.
 *
 * Thin wrapper around the LBFGS++ solver. The GEV fitter uses it to polish a
 * Nelder-Mead optimum with the analytic likelihood gradient.
 */
class LBFGSOptimizer {
public:
	struct Result {
		std::vector<double> x;
		double fx = 0.0;
		int iterations = 0;
		bool converged = false;
		std::string message;
	};

	struct Options {
		int max_iterations;
		double epsilon;     // gradient norm tolerance
		int m;              // L-BFGS memory
		double ftol;        // sufficient decrease in the line search
		int max_linesearch;

		Options() : max_iterations(200), epsilon(1e-6), m(6), ftol(1e-4), max_linesearch(30) {
		}
	};

	/// objective(x, grad) returns f(x) and writes the gradient into grad.
	using Objective = std::function<double(const std::vector<double> &, std::vector<double> &)>;

	static Result minimize(const Objective &objective,
	                       const std::vector<double> &x0,
	                       const std::vector<double> &lower,
	                       const std::vector<double> &upper,
	                       const Options &options = Options());

private:
	static void projectBounds(std::vector<double> &x,
	                          const std::vector<double> &lower,
	                          const std::vector<double> &upper);
};

} // namespace gevrisk::optimization
