#ifndef AGENTFLEET_UTILS_CONFIG_HPP
#define AGENTFLEET_UTILS_CONFIG_HPP

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include "agentfleet/utils/result.hpp"

namespace agentfleet {
namespace utils {

/**
 * @brief Runtime configuration of the control plane daemon.
 */
struct ServerConfig {
    /**
     * @brief Address the session listener binds to.
     */
    std::string listenAddress{"0.0.0.0"};

    /**
     * @brief TCP port of the session listener (0 means system-assigned).
     */
    uint16_t listenPort{4320};

    /**
     * @brief Maximum gap since last communication before a connection counts as dead.
     *
     * Twice the 30 second polling interval agents are expected to use.
     */
    std::chrono::milliseconds livenessThreshold{std::chrono::seconds(60)};

    /**
     * @brief Upper bound on command entries carried by one reply.
     */
    std::size_t maxCommandsPerReply{16};

    /**
     * @brief Number of lock shards in the concurrent registries.
     */
    std::size_t shardCount{16};

    /**
     * @brief Hex-encoded secret used to sign continuation tokens.
     *
     * When empty a random secret is generated at startup, which invalidates
     * tokens issued by a previous process.
     */
    std::string cursorSecretHex;

    /**
     * @brief Append-only command journal; commands are kept in memory only when unset.
     */
    std::optional<std::string> commandJournalPath;

    std::string logLevel{"info"};
};

ServerConfig defaultServerConfig();

/**
 * @brief Loads a ServerConfig from a JSON file.
 *
 * Missing keys keep their defaults and unknown keys are ignored.
 *
 * @return StorageError if the file cannot be read, ValidationError on bad JSON,
 *         wrong types or out-of-range values
 */
Result<ServerConfig> loadServerConfig(const std::string& path);

/**
 * @brief Same as loadServerConfig but from an in-memory JSON document.
 */
Result<ServerConfig> parseServerConfig(const std::string& json);

} // namespace utils
} // namespace agentfleet

#endif // AGENTFLEET_UTILS_CONFIG_HPP
