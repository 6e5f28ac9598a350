#include "csv_tables.hpp"
#include "run_config.hpp"

#include "gevrisk/analysis/batch_runner.hpp"
#include "gevrisk/analysis/result_table.hpp"
#include "gevrisk/analysis/rolling_window.hpp"
#include "gevrisk/utils/logging.hpp"

#include <exception>
#include <iostream>
#include <stdexcept>

namespace {

constexpr int kExitOk = 0;
constexpr int kExitFailure = 1;
constexpr int kExitUsage = 2;

int run(const gevrisk::io::RunConfig &config) {
	using namespace gevrisk;

	const auto structures = io::readStructures(config.info_path, config.columns);
	const auto observations = io::readObservations(config.data_path);
	io::validateAlignment(structures, observations);
	GEVRISK_INFO("Loaded {} structures with {} observations each", structures.size(), observations.rowCount());

	const auto analyzer = analysis::RollingWindowAnalyzerBuilder()
	                          .withStep(config.step)
	                          .withFitMethod(config.fit_method)
	                          .withKsMethod(config.ks_method)
	                          .build();

	analysis::BatchRunner::Options runner_options;
	runner_options.threads = config.threads;
	const analysis::BatchRunner runner(*analyzer, runner_options);

	const auto statistics = runner.run(structures, observations);
	const auto results = analysis::ResultAssembler::assemble(structures, statistics);

	io::writeTable(config.out_path, results.toTable());
	if (!config.return_periods_path.empty()) {
		io::writeTable(config.return_periods_path, analysis::ResultAssembler::returnPeriods(results));
	}
	if (!config.params_path.empty()) {
		io::writeTable(config.params_path,
		               analysis::ResultAssembler::parameters(structures, statistics, analyzer->plan()));
	}
	return kExitOk;
}

} // namespace

int main(int argc, char *argv[]) {
	const std::string program = argc > 0 ? argv[0] : "gevrisk_cli";

	gevrisk::io::RunConfig config;
	try {
		config = gevrisk::io::parseArguments(argc, argv);
	} catch (const std::invalid_argument &e) {
		std::cerr << program << ": " << e.what() << "\n\n" << gevrisk::io::usage(program);
		return kExitUsage;
	}

	if (config.show_help) {
		std::cout << gevrisk::io::usage(program);
		return kExitOk;
	}

	gevrisk::utils::Logging::init(config.log_level);

	try {
		return run(config);
	} catch (const std::exception &e) {
		GEVRISK_ERROR("{}", e.what());
		return kExitFailure;
	}
}
