#include "gevrisk/analysis/batch_runner.hpp"
#include "gevrisk/errors.hpp"
#include "gevrisk/utils/logging.hpp"

#include <algorithm>
#include <atomic>
#include <exception>
#include <mutex>
#include <string>
#include <thread>

namespace gevrisk::analysis {

BatchRunner::BatchRunner(const RollingWindowAnalyzer &analyzer) : BatchRunner(analyzer, Options{}) {
}

BatchRunner::BatchRunner(const RollingWindowAnalyzer &analyzer, Options options)
    : analyzer_(analyzer), options_(options) {
}

std::size_t BatchRunner::workerCount(std::size_t task_count) const {
	std::size_t workers = options_.threads;
	if (workers == 0) {
		workers = std::max<std::size_t>(1, std::thread::hardware_concurrency());
	}
	return std::max<std::size_t>(1, std::min(workers, task_count));
}

StructureStatistics BatchRunner::run(const std::vector<core::Structure> &structures,
                                     const core::ObservationTable &observations) const {
	if (structures.size() != observations.columnCount()) {
		throw MalformedInputError("Structure metadata has " + std::to_string(structures.size()) +
		                          " rows but the observation table has " +
		                          std::to_string(observations.columnCount()) + " series columns.");
	}

	const auto &plan = analyzer_.plan();
	const std::size_t window_count = plan.windowCount();
	const std::size_t task_count = structures.size() * window_count;

	StructureStatistics results(structures.size(), std::vector<WindowStatistic>(window_count));
	if (task_count == 0) {
		return results;
	}

	auto run_task = [&](std::size_t task) {
		const std::size_t s = task / window_count;
		const std::size_t w = task % window_count;
		results[s][w] = analyzer_.analyzeWindow(observations.columns[s], structures[s].crest_elevation, plan.window(w));
	};

	const std::size_t workers = workerCount(task_count);
	GEVRISK_DEBUG("BatchRunner: {} structures x {} windows on {} worker(s)", structures.size(), window_count, workers);

	if (workers == 1) {
		for (std::size_t task = 0; task < task_count; ++task) {
			run_task(task);
		}
	} else {
		// Make sure the logger exists before workers race to create it.
		utils::Logging::getLogger();

		std::atomic<std::size_t> next_task{0};
		std::atomic<bool> stop{false};
		std::mutex error_mutex;
		std::exception_ptr first_error;

		auto worker = [&]() {
			while (!stop.load()) {
				const std::size_t task = next_task.fetch_add(1);
				if (task >= task_count) {
					return;
				}
				try {
					run_task(task);
				} catch (...) {
					std::lock_guard<std::mutex> lock(error_mutex);
					if (!first_error) {
						first_error = std::current_exception();
					}
					stop.store(true);
				}
			}
		};

		std::vector<std::thread> pool;
		pool.reserve(workers);
		for (std::size_t i = 0; i < workers; ++i) {
			pool.emplace_back(worker);
		}
		for (auto &thread : pool) {
			thread.join();
		}
		if (first_error) {
			std::rethrow_exception(first_error);
		}
	}

	for (std::size_t s = 0; s < structures.size(); ++s) {
		const auto fitted = std::count_if(results[s].begin(), results[s].end(),
		                                  [](const WindowStatistic &statistic) { return statistic.isPresent(); });
		if (fitted == 0) {
			GEVRISK_WARN("{}: no window could be fitted", structures[s].name);
		} else {
			GEVRISK_INFO("{}: {}/{} windows fitted", structures[s].name, fitted, window_count);
		}
	}
	return results;
}

} // namespace gevrisk::analysis
