#include "agentfleet/utils/logging.hpp"
#include <spdlog/sinks/stdout_color_sinks.h>
#include <mutex>

namespace agentfleet {
namespace utils {

namespace {
    constexpr const char* kLoggerName = "agentfleet";
    std::once_flag loggerInitFlag;
}

std::shared_ptr<spdlog::logger> logger() {
    std::call_once(loggerInitFlag, []() {
        if (!spdlog::get(kLoggerName)) {
            auto created = spdlog::stdout_color_mt(kLoggerName);
            created->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v");
            created->set_level(spdlog::level::info);
        }
    });
    return spdlog::get(kLoggerName);
}

void initLogging(spdlog::level::level_enum level) {
    auto log = logger();
    log->set_level(level);
    log->flush_on(spdlog::level::warn);
}

Result<spdlog::level::level_enum> parseLogLevel(const std::string& name) {
    if (name == "trace") return spdlog::level::trace;
    if (name == "debug") return spdlog::level::debug;
    if (name == "info") return spdlog::level::info;
    if (name == "warn") return spdlog::level::warn;
    if (name == "error") return spdlog::level::err;
    if (name == "critical") return spdlog::level::critical;
    if (name == "off") return spdlog::level::off;
    return Error(ErrorCode::ValidationError, "unknown log level: " + name);
}

} // namespace utils
} // namespace agentfleet
