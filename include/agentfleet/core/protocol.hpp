#ifndef AGENTFLEET_CORE_PROTOCOL_HPP
#define AGENTFLEET_CORE_PROTOCOL_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "agentfleet/core/agent_group.hpp"
#include "agentfleet/core/command.hpp"

namespace agentfleet {
namespace core {

/**
 * @brief Self-description an agent sends when it first identifies itself.
 */
struct AgentDescription {
    Attributes identifyingAttributes;
    Attributes nonIdentifyingAttributes;
};

/**
 * @brief Inbound message from an agent.
 */
struct AgentToServer {
    std::string instanceId;
    std::optional<AgentDescription> description;
    std::optional<std::string> reportedConfigHash;  ///< Hash of the configuration the agent applied
    std::optional<uint64_t> sequenceNum;
    std::vector<std::string> acknowledgedCommandIds;
};

/**
 * @brief Configuration pushed to an agent together with its content hash.
 */
struct RemoteConfig {
    std::string body;
    std::string contentType;
    std::string configHash;
};

struct CommandEntry {
    std::string id;
    CommandKind kind{CommandKind::UpdateAgentConfig};
    nlohmann::json data;
};

enum class ServerErrorType {
    BadRequest,
    Unavailable
};

const char* serverErrorTypeName(ServerErrorType type);

/**
 * @brief In-band error indication. The message never carries internal detail.
 */
struct ServerErrorResponse {
    ServerErrorType type{ServerErrorType::BadRequest};
    std::string message;
};

/**
 * @brief Outbound reply to an agent.
 */
struct ServerToAgent {
    static constexpr uint32_t kReportFullState = 1;

    std::string instanceId;
    std::optional<RemoteConfig> remoteConfig;
    std::vector<CommandEntry> commands;
    std::optional<ServerErrorResponse> error;
    uint32_t flags{0};

    bool reportFullStateRequested() const { return (flags & kReportFullState) != 0; }
};

} // namespace core
} // namespace agentfleet

#endif // AGENTFLEET_CORE_PROTOCOL_HPP
