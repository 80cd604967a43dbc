#ifndef AGENTFLEET_CORE_COMMAND_HPP
#define AGENTFLEET_CORE_COMMAND_HPP

#include <string>
#include <nlohmann/json.hpp>
#include "agentfleet/utils/clock.hpp"
#include "agentfleet/utils/result.hpp"

namespace agentfleet {
namespace core {

/**
 * @brief Kind of administrative instruction queued for an agent.
 */
enum class CommandKind {
    UpdateAgentConfig,  ///< data carries "remoteConfig"
    ReportFullState,    ///< ask the agent to resend its complete state
    Restart             ///< ask the agent to restart itself
};

const char* commandKindName(CommandKind kind);
Result<CommandKind> parseCommandKind(const std::string& name);

/**
 * @brief Write-once record of a command issued to one agent instance.
 */
struct Command {
    std::string id;
    CommandKind kind{CommandKind::UpdateAgentConfig};
    std::string targetInstanceId;
    nlohmann::json data;
    utils::Clock::TimePoint createdAt{};

    /**
     * @brief Key giving the (createdAt, id) total order as a plain string comparison.
     */
    std::string orderKey() const;
};

nlohmann::json commandToJson(const Command& command);

/**
 * @brief Checks that a payload is a JSON object (or null) that can be serialized.
 *
 * Payloads are opaque, but every string in them, keys included, must be valid
 * UTF-8 so the command can be written to the journal and sent to the agent.
 *
 * @return ValidationError otherwise
 */
Result<void> validateCommandData(const nlohmann::json& data);

/**
 * @return ValidationError if a field is missing or of the wrong type
 */
Result<Command> commandFromJson(const nlohmann::json& j);

} // namespace core
} // namespace agentfleet

#endif // AGENTFLEET_CORE_COMMAND_HPP
