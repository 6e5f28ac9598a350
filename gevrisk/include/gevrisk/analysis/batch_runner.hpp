#pragma once

#include "gevrisk/analysis/rolling_window.hpp"
#include "gevrisk/core/structure.hpp"

#include <cstddef>
#include <vector>

namespace gevrisk::analysis {

/// Window statistics per structure, outer index = structure, inner = window.
using StructureStatistics = std::vector<std::vector<WindowStatistic>>;

/**
 * @class BatchRunner
 * @brief Analyzes every structure of a run on a pool of worker threads.
 *
 * Each (structure, window) fit is an independent task. Workers claim task
 * numbers from a shared counter and write into the slot owned by that task, so
 * the returned statistics are in structure and window order no matter which
 * worker finished first.
 */
class BatchRunner {
public:
	struct Options {
		/// Worker count; 0 selects the hardware concurrency, 1 runs on the calling thread.
		std::size_t threads = 0;
	};

	explicit BatchRunner(const RollingWindowAnalyzer &analyzer);
	BatchRunner(const RollingWindowAnalyzer &analyzer, Options options);

	/**
	 * @throws MalformedInputError if the structure count differs from the
	 * observation column count.
	 */
	StructureStatistics run(const std::vector<core::Structure> &structures,
	                        const core::ObservationTable &observations) const;

	std::size_t workerCount(std::size_t task_count) const;

private:
	const RollingWindowAnalyzer &analyzer_;
	Options options_;
};

} // namespace gevrisk::analysis
