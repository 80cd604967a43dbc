#ifndef AGENTFLEET_CORE_COMMAND_AUDIT_LOG_HPP
#define AGENTFLEET_CORE_COMMAND_AUDIT_LOG_HPP

#include <string>
#include <vector>
#include "agentfleet/core/command.hpp"
#include "agentfleet/core/list_options.hpp"
#include "agentfleet/utils/result.hpp"

namespace agentfleet {
namespace core {

/**
 * @brief Append-only store of commands issued to agents.
 *
 * Stored commands are never mutated or overwritten. Saves from any number of
 * threads never lose writes or hand out the same id twice.
 */
class CommandAuditLog {
public:
    virtual ~CommandAuditLog() = default;

    /**
     * @brief Assigns an id and creation timestamp, persists, and returns the stored command.
     * @return ValidationError for an empty target, StorageError if persistence fails
     */
    virtual Result<Command> saveCommand(CommandKind kind,
                                        const std::string& targetInstanceId,
                                        const nlohmann::json& data) = 0;

    /**
     * @return NotFound if no command has this id
     */
    virtual Result<Command> getCommand(const std::string& id) const = 0;

    /**
     * @brief Every command ever issued to the instance, in creation order.
     */
    virtual Result<std::vector<Command>> getCommandsByInstanceUid(const std::string& instanceId) const = 0;

    /**
     * @brief At most limit commands for the instance whose Command::orderKey() is
     *        greater than afterKey, in creation order.
     *
     * An empty afterKey reads from the first command.
     */
    virtual Result<std::vector<Command>> getCommandsByInstanceUidAfter(const std::string& instanceId,
                                                                       const std::string& afterKey,
                                                                       std::size_t limit) const = 0;

    /**
     * @brief Global listing in (createdAt, id) order.
     */
    virtual Result<ListResponse<Command>> listCommands(const ListOptions& options) const = 0;
};

} // namespace core
} // namespace agentfleet

#endif // AGENTFLEET_CORE_COMMAND_AUDIT_LOG_HPP
