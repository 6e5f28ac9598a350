#pragma once

#include "csv_tables.hpp"
#include "gevrisk/estimation/gev_fitter.hpp"
#include "gevrisk/stats/ks_test.hpp"

#include <spdlog/spdlog.h>

#include <cstddef>
#include <string>
#include <vector>

namespace gevrisk::io {

/**
 * @struct RunConfig
 * @brief Settings of one command-line run.
 */
struct RunConfig {
	std::string info_path = "dam_info.csv";
	std::string data_path = "dam_data.csv";
	std::string out_path;

	// Optional companion tables; empty disables them.
	std::string return_periods_path;
	std::string params_path;

	MetadataColumns columns;

	std::size_t step = 1;
	std::size_t threads = 0;
	estimation::FitMethod fit_method = estimation::FitMethod::NelderMead;
	stats::KsMethod ks_method = stats::KsMethod::Asymptotic;

	spdlog::level::level_enum log_level = spdlog::level::info;
	bool show_help = false;
};

/**
 * @brief Parses the command line.
 * @throws std::invalid_argument for unknown flags, missing values, a zero step
 * or a missing --out.
 */
RunConfig parseArguments(int argc, const char *const argv[]);

std::string usage(const std::string &program);

} // namespace gevrisk::io
