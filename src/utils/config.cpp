#include "agentfleet/utils/config.hpp"
#include "agentfleet/utils/crypto.hpp"
#include "agentfleet/utils/logging.hpp"
#include <nlohmann/json.hpp>
#include <fstream>
#include <limits>
#include <sstream>

namespace agentfleet {
namespace utils {

namespace {

Error invalid(const std::string& key, const std::string& why) {
    return Error(ErrorCode::ValidationError, "config key '" + key + "': " + why);
}

} // namespace

ServerConfig defaultServerConfig() {
    return ServerConfig{};
}

Result<ServerConfig> parseServerConfig(const std::string& json) {
    nlohmann::json doc;
    try {
        doc = nlohmann::json::parse(json);
    } catch (const nlohmann::json::parse_error& e) {
        return Error(ErrorCode::ValidationError, std::string("config is not valid JSON: ") + e.what());
    }
    if (!doc.is_object()) {
        return Error(ErrorCode::ValidationError, "config root must be an object");
    }

    ServerConfig config = defaultServerConfig();

    if (doc.contains("listenAddress")) {
        const auto& v = doc["listenAddress"];
        if (!v.is_string() || v.get<std::string>().empty()) {
            return invalid("listenAddress", "must be a non-empty string");
        }
        config.listenAddress = v.get<std::string>();
    }

    if (doc.contains("listenPort")) {
        const auto& v = doc["listenPort"];
        if (!v.is_number_integer() || v.get<int64_t>() < 0 ||
            v.get<int64_t>() > std::numeric_limits<uint16_t>::max()) {
            return invalid("listenPort", "must be an integer in [0, 65535]");
        }
        config.listenPort = static_cast<uint16_t>(v.get<int64_t>());
    }

    if (doc.contains("livenessThresholdMs")) {
        const auto& v = doc["livenessThresholdMs"];
        if (!v.is_number_integer() || v.get<int64_t>() <= 0) {
            return invalid("livenessThresholdMs", "must be a positive integer");
        }
        config.livenessThreshold = std::chrono::milliseconds(v.get<int64_t>());
    }

    if (doc.contains("maxCommandsPerReply")) {
        const auto& v = doc["maxCommandsPerReply"];
        if (!v.is_number_integer() || v.get<int64_t>() <= 0) {
            return invalid("maxCommandsPerReply", "must be a positive integer");
        }
        config.maxCommandsPerReply = static_cast<std::size_t>(v.get<int64_t>());
    }

    if (doc.contains("shardCount")) {
        const auto& v = doc["shardCount"];
        if (!v.is_number_integer() || v.get<int64_t>() <= 0 || v.get<int64_t>() > 4096) {
            return invalid("shardCount", "must be an integer in [1, 4096]");
        }
        config.shardCount = static_cast<std::size_t>(v.get<int64_t>());
    }

    if (doc.contains("cursorSecret")) {
        const auto& v = doc["cursorSecret"];
        if (!v.is_string()) {
            return invalid("cursorSecret", "must be a hex string");
        }
        auto decoded = fromHex(v.get<std::string>());
        if (decoded.has_error() || decoded.value().size() < 16) {
            return invalid("cursorSecret", "must be at least 16 hex-encoded bytes");
        }
        config.cursorSecretHex = v.get<std::string>();
    }

    if (doc.contains("commandJournalPath")) {
        const auto& v = doc["commandJournalPath"];
        if (v.is_null()) {
            config.commandJournalPath.reset();
        } else if (v.is_string() && !v.get<std::string>().empty()) {
            config.commandJournalPath = v.get<std::string>();
        } else {
            return invalid("commandJournalPath", "must be a non-empty string or null");
        }
    }

    if (doc.contains("logLevel")) {
        const auto& v = doc["logLevel"];
        if (!v.is_string() || parseLogLevel(v.get<std::string>()).has_error()) {
            return invalid("logLevel", "must be one of trace, debug, info, warn, error, critical, off");
        }
        config.logLevel = v.get<std::string>();
    }

    return config;
}

Result<ServerConfig> loadServerConfig(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        return Error(ErrorCode::StorageError, "cannot open config file " + path);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    if (file.bad()) {
        return Error(ErrorCode::StorageError, "cannot read config file " + path);
    }
    return parseServerConfig(buffer.str());
}

} // namespace utils
} // namespace agentfleet
