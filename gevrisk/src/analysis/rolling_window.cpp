#include "gevrisk/analysis/rolling_window.hpp"
#include "gevrisk/errors.hpp"
#include "gevrisk/stats/exceedance.hpp"
#include "gevrisk/utils/logging.hpp"

#include <utility>

namespace gevrisk::analysis {

WindowStatistic WindowStatistic::absent(std::string reason) {
	WindowStatistic statistic;
	statistic.failure = std::move(reason);
	return statistic;
}

RollingWindowAnalyzer::RollingWindowAnalyzer(RollingWindowOptions options)
    : options_(std::move(options)), plan_(options_.step), fitter_(options_.fitter) {
}

WindowStatistic RollingWindowAnalyzer::analyzeWindow(const core::ObservationSeries &series, double threshold,
                                                     const core::WindowSpec &window) const {
	try {
		const auto sample = core::WindowPlan::extract(series, window);
		auto fit = fitter_.fit(sample);

		const auto ks = stats::ksTest(sample, fit, options_.ks);
		WindowStatistic statistic;
		statistic.ks_p_value = ks.p_value;
		statistic.ks_statistic = ks.statistic;
		statistic.overtopping_risk = stats::overtoppingRisk(threshold, fit);
		statistic.fit = std::move(fit);
		return statistic;
	} catch (const FitError &e) {
		GEVRISK_DEBUG("Window {}: fit failed: {}", window.index + 1, e.what());
		return WindowStatistic::absent(e.what());
	} catch (const InsufficientDataError &e) {
		GEVRISK_DEBUG("Window {}: {}", window.index + 1, e.what());
		return WindowStatistic::absent(e.what());
	}
}

std::vector<WindowStatistic> RollingWindowAnalyzer::analyze(const core::ObservationSeries &series,
                                                            double threshold) const {
	std::vector<WindowStatistic> statistics;
	statistics.reserve(plan_.windowCount());
	for (const auto &window : plan_.windows()) {
		statistics.push_back(analyzeWindow(series, threshold, window));
	}
	return statistics;
}

// --- Builder Implementation ---

RollingWindowAnalyzerBuilder &RollingWindowAnalyzerBuilder::withStep(std::size_t step) {
	options_.step = step;
	return *this;
}

RollingWindowAnalyzerBuilder &RollingWindowAnalyzerBuilder::withFitMethod(estimation::FitMethod method) {
	options_.fitter.method = method;
	return *this;
}

RollingWindowAnalyzerBuilder &RollingWindowAnalyzerBuilder::withMaxIterations(int max_iterations) {
	options_.fitter.max_iterations = max_iterations;
	return *this;
}

RollingWindowAnalyzerBuilder &RollingWindowAnalyzerBuilder::withKsMethod(stats::KsMethod method) {
	options_.ks.method = method;
	return *this;
}

RollingWindowAnalyzerBuilder &RollingWindowAnalyzerBuilder::withStandardErrors(bool enabled) {
	options_.fitter.compute_standard_errors = enabled;
	return *this;
}

std::unique_ptr<RollingWindowAnalyzer> RollingWindowAnalyzerBuilder::build() const {
	GEVRISK_DEBUG("Building RollingWindowAnalyzer with step {} and {} fitting.", options_.step,
	              estimation::describe(options_.fitter.method));
	return std::make_unique<RollingWindowAnalyzer>(options_);
}

} // namespace gevrisk::analysis
