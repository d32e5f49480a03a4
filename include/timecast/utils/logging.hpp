#pragma once

#include <spdlog/spdlog.h>

#include <memory>
#include <mutex>

namespace timecast::utils {

/**
 * @class Logging
 * @brief Provides a singleton interface to the spdlog logging library.
 *
 * A single logger instance is shared by the whole library, including the
 * worker threads of concurrent pipeline runs. It can be configured at startup.
 */
class Logging {
public:
	/**
	 * @brief Gets the singleton logger instance, creating it on first use.
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

	static void create();

	static std::shared_ptr<spdlog::logger> logger_;
	static std::once_flag once_;
};

} // namespace timecast::utils

// --- Logger Macros for convenient access ---
#define TIMECAST_TRACE(...)    timecast::utils::Logging::getLogger()->trace(__VA_ARGS__)
#define TIMECAST_DEBUG(...)    timecast::utils::Logging::getLogger()->debug(__VA_ARGS__)
#define TIMECAST_INFO(...)     timecast::utils::Logging::getLogger()->info(__VA_ARGS__)
#define TIMECAST_WARN(...)     timecast::utils::Logging::getLogger()->warn(__VA_ARGS__)
#define TIMECAST_ERROR(...)    timecast::utils::Logging::getLogger()->error(__VA_ARGS__)
#define TIMECAST_CRITICAL(...) timecast::utils::Logging::getLogger()->critical(__VA_ARGS__)
