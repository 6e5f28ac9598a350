#include "run_config.hpp"

#include <cerrno>
#include <cstdlib>
#include <sstream>
#include <stdexcept>

namespace gevrisk::io {

namespace {

std::size_t parseCount(const std::string &flag, const std::string &text) {
	if (text.empty() || text.front() == '-') {
		throw std::invalid_argument(flag + " expects a non-negative integer, got '" + text + "'");
	}
	char *end = nullptr;
	errno = 0;
	const unsigned long long value = std::strtoull(text.c_str(), &end, 10);
	if (errno != 0 || end != text.c_str() + text.size()) {
		throw std::invalid_argument(flag + " expects a non-negative integer, got '" + text + "'");
	}
	return static_cast<std::size_t>(value);
}

} // namespace

RunConfig parseArguments(int argc, const char *const argv[]) {
	RunConfig config;

	for (int i = 1; i < argc; ++i) {
		const std::string arg = argv[i];

		auto value = [&]() -> std::string {
			if (i + 1 >= argc) {
				throw std::invalid_argument(arg + " requires a value");
			}
			return argv[++i];
		};

		if (arg == "--help" || arg == "-h") {
			config.show_help = true;
		} else if (arg == "--info") {
			config.info_path = value();
		} else if (arg == "--data") {
			config.data_path = value();
		} else if (arg == "--out") {
			config.out_path = value();
		} else if (arg == "--return-periods-out") {
			config.return_periods_path = value();
		} else if (arg == "--params-out") {
			config.params_path = value();
		} else if (arg == "--crest-column") {
			config.columns.crest_elevation = value();
		} else if (arg == "--step") {
			config.step = parseCount(arg, value());
			if (config.step == 0) {
				throw std::invalid_argument("--step must be a positive integer");
			}
		} else if (arg == "--threads") {
			config.threads = parseCount(arg, value());
		} else if (arg == "--ks-exact") {
			config.ks_method = stats::KsMethod::Exact;
		} else if (arg == "--polish") {
			config.fit_method = estimation::FitMethod::NelderMeadLbfgs;
		} else if (arg == "--verbose" || arg == "-v") {
			config.log_level = spdlog::level::debug;
		} else if (arg == "--quiet" || arg == "-q") {
			config.log_level = spdlog::level::warn;
		} else {
			throw std::invalid_argument("Unknown argument '" + arg + "'");
		}
	}

	if (!config.show_help && config.out_path.empty()) {
		throw std::invalid_argument("--out is required");
	}
	return config;
}

std::string usage(const std::string &program) {
	std::ostringstream out;
	out << "Usage: " << program << " --out <path> [options]\n"
	    << "\n"
	    << "Fits a GEV distribution to rolling windows of each structure's water levels\n"
	    << "and reports the goodness of fit and crest overtopping probability per window.\n"
	    << "\n"
	    << "Options:\n"
	    << "  --info <path>                Structure metadata CSV (default dam_info.csv)\n"
	    << "  --data <path>                Observation CSV, first column is a row index (default dam_data.csv)\n"
	    << "  --out <path>                 Result CSV\n"
	    << "  --return-periods-out <path>  Also write return periods per window\n"
	    << "  --params-out <path>          Also write fitted parameters per window\n"
	    << "  --crest-column <name>        Metadata column holding the crest elevation (default TOPDAM_FT)\n"
	    << "  --step <n>                   Stride between sliding windows (default 1)\n"
	    << "  --threads <n>                Worker threads, 0 = hardware concurrency (default 0)\n"
	    << "  --ks-exact                   Exact finite-sample KS p-values\n"
	    << "  --polish                     Refine each fit with L-BFGS-B\n"
	    << "  --verbose, -v                Debug logging\n"
	    << "  --quiet, -q                  Warnings and errors only\n"
	    << "  --help, -h                   Show this message\n";
	return out.str();
}

} // namespace gevrisk::io
