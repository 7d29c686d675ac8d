#pragma once

#include <spdlog/spdlog.h>

#include <memory>
#include <string>

namespace atsa::utils {

/**
 * @class Logging
 * @brief Provides a singleton interface to the spdlog logging library.
 *
 * All components log through one logger named "atsa", created exactly once
 * on first use (from any thread) and configurable at startup.
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

	/**
	 * @brief Initializes the logger from a level name ("trace" ... "off").
	 *
	 * Unknown names fall back to "info".
	 */
	static void init(const std::string &level_name);

private:
	Logging() = default;

	static void ensureCreated();

	static std::shared_ptr<spdlog::logger> logger_;
};

} // namespace atsa::utils

#define ATSA_TRACE(...)    atsa::utils::Logging::getLogger()->trace(__VA_ARGS__)
#define ATSA_DEBUG(...)    atsa::utils::Logging::getLogger()->debug(__VA_ARGS__)
#define ATSA_INFO(...)     atsa::utils::Logging::getLogger()->info(__VA_ARGS__)
#define ATSA_WARN(...)     atsa::utils::Logging::getLogger()->warn(__VA_ARGS__)
#define ATSA_ERROR(...)    atsa::utils::Logging::getLogger()->error(__VA_ARGS__)
#define ATSA_CRITICAL(...) atsa::utils::Logging::getLogger()->critical(__VA_ARGS__)
