#pragma once

#include <spdlog/spdlog.h>
#include <memory>

namespace tabstat::utils {

/**
 * @class Logging
 * @brief Provides a singleton interface to the spdlog logging library.
 *
 * All engines share one logger named "tabstat". It starts at the warn level so
 * library calls stay silent unless the host application raises the level.
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
	static void init(spdlog::level::level_enum level = spdlog::level::warn);

private:
	Logging() = default;

	static std::shared_ptr<spdlog::logger> logger_;
};

} // namespace tabstat::utils

#define TABSTAT_TRACE(...)    tabstat::utils::Logging::getLogger()->trace(__VA_ARGS__)
#define TABSTAT_DEBUG(...)    tabstat::utils::Logging::getLogger()->debug(__VA_ARGS__)
#define TABSTAT_INFO(...)     tabstat::utils::Logging::getLogger()->info(__VA_ARGS__)
#define TABSTAT_WARN(...)     tabstat::utils::Logging::getLogger()->warn(__VA_ARGS__)
#define TABSTAT_ERROR(...)    tabstat::utils::Logging::getLogger()->error(__VA_ARGS__)
#define TABSTAT_CRITICAL(...) tabstat::utils::Logging::getLogger()->critical(__VA_ARGS__)
