#pragma once

#include <spdlog/spdlog.h>
#include <memory>

namespace gevrisk::utils {

/**
 * @class Logging
 * @brief Provides a singleton interface to the spdlog logging library.
 *
 * Every component of the library logs through the same "gevrisk" logger so the
 * host program can set one level for the whole run.
 */
class Logging {
public:
	/**
	 * @brief Gets the singleton logger instance.
	 * @return A shared pointer to the spdlog logger.
	 */
	static std::shared_ptr<spdlog::logger> &getLogger();

	/**
	 * @brief Initializes the logger with a specific logging level.
	 * @param level The minimum level of messages to log.
	 */
	static void init(spdlog::level::level_enum level = spdlog::level::info);

private:
	Logging() = default;

	static std::shared_ptr<spdlog::logger> logger_;
};

} // namespace gevrisk::utils

// --- Logger Macros for convenient access ---
#define GEVRISK_TRACE(...)    gevrisk::utils::Logging::getLogger()->trace(__VA_ARGS__)
#define GEVRISK_DEBUG(...)    gevrisk::utils::Logging::getLogger()->debug(__VA_ARGS__)
#define GEVRISK_INFO(...)     gevrisk::utils::Logging::getLogger()->info(__VA_ARGS__)
#define GEVRISK_WARN(...)     gevrisk::utils::Logging::getLogger()->warn(__VA_ARGS__)
#define GEVRISK_ERROR(...)    gevrisk::utils::Logging::getLogger()->error(__VA_ARGS__)
#define GEVRISK_CRITICAL(...) gevrisk::utils::Logging::getLogger()->critical(__VA_ARGS__)
