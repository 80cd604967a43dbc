#ifndef AGENTFLEET_UTILS_LOGGING_HPP
#define AGENTFLEET_UTILS_LOGGING_HPP

#include <spdlog/spdlog.h>
#include <string>
#include "agentfleet/utils/result.hpp"

// Logging macros take an fmt-style format string followed by its arguments.
#define AGENTFLEET_LOG_DEBUG(...)    ::agentfleet::utils::logger()->debug(__VA_ARGS__)
#define AGENTFLEET_LOG_INFO(...)     ::agentfleet::utils::logger()->info(__VA_ARGS__)
#define AGENTFLEET_LOG_WARN(...)     ::agentfleet::utils::logger()->warn(__VA_ARGS__)
#define AGENTFLEET_LOG_ERROR(...)    ::agentfleet::utils::logger()->error(__VA_ARGS__)
#define AGENTFLEET_LOG_CRITICAL(...) ::agentfleet::utils::logger()->critical(__VA_ARGS__)

namespace agentfleet {
namespace utils {

/**
 * @brief Returns the process-wide "agentfleet" logger, creating it on first use.
 */
std::shared_ptr<spdlog::logger> logger();

/**
 * @brief Configures the logger with a stdout color sink at the given level.
 *
 * Safe to call more than once; later calls only change the level.
 */
void initLogging(spdlog::level::level_enum level);

/**
 * @brief Maps "trace", "debug", "info", "warn", "error", "critical" or "off" to a level.
 */
Result<spdlog::level::level_enum> parseLogLevel(const std::string& name);

} // namespace utils
} // namespace agentfleet

#endif // AGENTFLEET_UTILS_LOGGING_HPP
