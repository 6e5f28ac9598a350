#pragma once

#include "gevrisk/core/structure.hpp"
#include "gevrisk/core/window.hpp"
#include "gevrisk/estimation/gev_fitter.hpp"
#include "gevrisk/stats/ks_test.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace gevrisk::analysis {

/**
 * @struct WindowStatistic
 * @brief Goodness of fit and overtopping probability of one (structure, window) pair.
 *
 * Both values are absent when the window could not be fitted.
 */
struct WindowStatistic {
	std::optional<double> ks_p_value;
	std::optional<double> overtopping_risk;

	// Diagnostics for the parameter report.
	std::optional<double> ks_statistic;
	std::optional<estimation::GevFit> fit;
	std::string failure;

	bool isPresent() const {
		return ks_p_value.has_value() && overtopping_risk.has_value();
	}

	static WindowStatistic absent(std::string reason);
};

struct RollingWindowOptions {
	std::size_t step = 1;
	estimation::GevFitter::Options fitter;
	stats::KsTestOptions ks;
};

/**
 * @class RollingWindowAnalyzer
 * @brief Fits, tests and scores every window of one observation series.
 *
 * A window that cannot be fitted (FitError) or is not fully covered by the series
 * (InsufficientDataError) yields an absent statistic; the remaining windows are
 * still analyzed. The output always has plan().windowCount() entries in window order.
 */
class RollingWindowAnalyzer {
public:
	explicit RollingWindowAnalyzer(RollingWindowOptions options = {});

	std::vector<WindowStatistic> analyze(const core::ObservationSeries &series, double threshold) const;

	WindowStatistic analyzeWindow(const core::ObservationSeries &series, double threshold,
	                              const core::WindowSpec &window) const;

	const core::WindowPlan &plan() const {
		return plan_;
	}

	const RollingWindowOptions &options() const {
		return options_;
	}

private:
	RollingWindowOptions options_;
	core::WindowPlan plan_;
	estimation::GevFitter fitter_;
};

/**
 * @class RollingWindowAnalyzerBuilder
 * @brief Fluent configuration of a RollingWindowAnalyzer.
 */
class RollingWindowAnalyzerBuilder {
public:
	/**
	 * @brief Sets the stride between sliding windows.
	 * @param step Positive number of observations.
	 */
	RollingWindowAnalyzerBuilder &withStep(std::size_t step);

	RollingWindowAnalyzerBuilder &withFitMethod(estimation::FitMethod method);

	/**
	 * @brief Caps the likelihood search. A fit that does not settle within the
	 * cap fails for its window.
	 */
	RollingWindowAnalyzerBuilder &withMaxIterations(int max_iterations);

	RollingWindowAnalyzerBuilder &withKsMethod(stats::KsMethod method);

	RollingWindowAnalyzerBuilder &withStandardErrors(bool enabled);

	/**
	 * @brief Creates the analyzer.
	 * @throws std::invalid_argument for an invalid configuration.
	 */
	std::unique_ptr<RollingWindowAnalyzer> build() const;

private:
	RollingWindowOptions options_;
};

} // namespace gevrisk::analysis
