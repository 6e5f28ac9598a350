#include "gevrisk/optimization/lbfgs_optimizer.hpp"
#include "gevrisk/utils/logging.hpp"

#include <Eigen/Core>
#include <LBFGSB.h>
#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>

namespace gevrisk::optimization {

void LBFGSOptimizer::projectBounds(std::vector<double> &x,
                                   const std::vector<double> &lower,
                                   const std::vector<double> &upper) {
	for (std::size_t i = 0; i < x.size(); ++i) {
		x[i] = std::max(lower[i], std::min(x[i], upper[i]));
	}
}

LBFGSOptimizer::Result LBFGSOptimizer::minimize(const Objective &objective,
                                                const std::vector<double> &x0,
                                                const std::vector<double> &lower,
                                                const std::vector<double> &upper,
                                                const Options &options) {
	if (x0.empty() || lower.size() != x0.size() || upper.size() != x0.size()) {
		throw std::invalid_argument("LBFGSOptimizer: start point and bounds must be non-empty and equal length.");
	}

	const Eigen::Index n = static_cast<Eigen::Index>(x0.size());
	Eigen::VectorXd x = Eigen::Map<const Eigen::VectorXd>(x0.data(), n);
	const Eigen::VectorXd lb = Eigen::Map<const Eigen::VectorXd>(lower.data(), n);
	const Eigen::VectorXd ub = Eigen::Map<const Eigen::VectorXd>(upper.data(), n);
	x = x.cwiseMax(lb).cwiseMin(ub);

	LBFGSpp::LBFGSBParam<double> param;
	param.max_iterations = options.max_iterations;
	param.epsilon = options.epsilon;
	param.epsilon_rel = options.epsilon;
	param.m = options.m;
	param.ftol = options.ftol;
	param.wolfe = 0.9;
	param.max_linesearch = options.max_linesearch;

	LBFGSpp::LBFGSBSolver<double> solver(param);

	std::vector<double> x_buffer(x0.size());
	std::vector<double> grad_buffer(x0.size());
	auto eigen_objective = [&](const Eigen::VectorXd &point, Eigen::VectorXd &grad) {
		std::copy(point.data(), point.data() + n, x_buffer.begin());
		std::fill(grad_buffer.begin(), grad_buffer.end(), 0.0);
		const double fx = objective(x_buffer, grad_buffer);
		grad = Eigen::Map<const Eigen::VectorXd>(grad_buffer.data(), n);
		return fx;
	};

	Result result;
	double fx = 0.0;
	try {
		result.iterations = solver.minimize(eigen_objective, x, fx, lb, ub);
		result.fx = fx;
		result.converged = std::isfinite(fx) && result.iterations < options.max_iterations;
		result.message = result.converged ? "Converged" : "Iteration limit reached";
	} catch (const std::exception &e) {
		// LBFGS++ reports line-search breakdown by throwing.
		result.converged = false;
		result.fx = std::numeric_limits<double>::quiet_NaN();
		result.message = std::string("Failed: ") + e.what();
	}
	GEVRISK_TRACE("LBFGS: {} after {} iterations", result.message, result.iterations);

	result.x.assign(x.data(), x.data() + n);
	projectBounds(result.x, lower, upper);
	return result;
}

} // namespace gevrisk::optimization
