#include "gevrisk/utils/logging.hpp"

#include <mutex>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace gevrisk::utils {

std::shared_ptr<spdlog::logger> Logging::logger_;

namespace {
std::mutex &loggerMutex() {
	static std::mutex mutex;
	return mutex;
}
} // namespace

void Logging::init(spdlog::level::level_enum level) {
	std::lock_guard<std::mutex> lock(loggerMutex());
	if (!logger_) {
		// A logger registered by an earlier instance of the library wins.
		logger_ = spdlog::get("gevrisk");
		if (!logger_) {
			logger_ = spdlog::stdout_color_mt("gevrisk");
		}
	}
	logger_->set_level(level);
	logger_->flush_on(level);
}

std::shared_ptr<spdlog::logger> &Logging::getLogger() {
	if (!logger_) {
		// Initialize with default level if not already done.
		init();
	}
	return logger_;
}

} // namespace gevrisk::utils
