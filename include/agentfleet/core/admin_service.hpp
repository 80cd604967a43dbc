#ifndef AGENTFLEET_CORE_ADMIN_SERVICE_HPP
#define AGENTFLEET_CORE_ADMIN_SERVICE_HPP

#include <string>
#include <nlohmann/json.hpp>
#include "agentfleet/core/agent_group_store.hpp"
#include "agentfleet/core/agent_store.hpp"
#include "agentfleet/core/command_audit_log.hpp"
#include "agentfleet/core/connection_registry.hpp"
#include "agentfleet/core/selector_resolver.hpp"
#include "agentfleet/utils/clock.hpp"

namespace agentfleet {
namespace core {

/**
 * @brief Status code and JSON body ready to be written by an HTTP adapter.
 *
 * Errors carry {"error": <code name>, "message": <text>} and the status from
 * utils::httpStatusFor.
 */
struct AdminResponse {
    int status{200};
    nlohmann::json body;

    bool ok() const { return status >= 200 && status < 300; }
};

nlohmann::json connectionToJson(const Connection& connection);
nlohmann::json agentToJson(const Agent& agent);
nlohmann::json agentGroupStatusToJson(const AgentGroupStatus& status);

/**
 * @brief Administrative read/write surface over the control plane core.
 *
 * Every listing answers with the envelope {items, continue, remainingItemCount}.
 */
class AdminService {
public:
    /**
     * All collaborators must outlive the service.
     */
    AdminService(CommandAuditLog& auditLog,
                 const ConnectionRegistry& registry,
                 const AgentStore& agents,
                 AgentGroupStore& groups,
                 const SelectorResolver& resolver,
                 const utils::Clock& clock);

    /**
     * @brief Queues an UpdateAgentConfig command.
     *
     * @param request {"targetInstanceId": string, "remoteConfig": any}
     */
    AdminResponse updateAgentConfig(const nlohmann::json& request);

    AdminResponse issueCommand(const std::string& kind,
                               const std::string& targetInstanceId,
                               const nlohmann::json& data);
    AdminResponse getCommand(const std::string& id) const;
    AdminResponse listCommands(const ListOptions& options) const;
    AdminResponse listCommandsForInstance(const std::string& instanceId) const;

    AdminResponse listConnections(const ListOptions& options) const;
    AdminResponse getConnection(const std::string& connId) const;

    AdminResponse getAgent(const std::string& instanceId) const;
    AdminResponse listAgents(const ListOptions& options) const;
    AdminResponse listAgentsBySelector(const AgentSelector& selector, const ListOptions& options) const;

    /**
     * @brief Lists the agents the group's selector matches, on both attribute maps.
     *
     * Deleted groups are still addressable, so their former members can be found.
     */
    AdminResponse listAgentsByAgentGroup(const std::string& name, const ListOptions& options) const;

    AdminResponse createAgentGroup(const nlohmann::json& request, const std::string& actingUser);
    AdminResponse updateAgentGroup(const std::string& name,
                                   const nlohmann::json& request,
                                   const std::string& actingUser);
    AdminResponse deleteAgentGroup(const std::string& name, const std::string& actingUser);
    /**
     * @brief Group body plus a "status" object counting the agents its selector matches.
     */
    AdminResponse getAgentGroup(const std::string& name) const;
    AdminResponse listAgentGroups(const ListOptions& options, bool includeDeleted = false) const;

    /**
     * @brief Shows which group an agent with these identifying attributes would receive.
     */
    AdminResponse resolveAgentGroup(const Attributes& identifyingAttributes) const;

    static AdminResponse errorResponse(const Error& error);

private:
    CommandAuditLog& auditLog_;
    const ConnectionRegistry& registry_;
    const AgentStore& agents_;
    AgentGroupStore& groups_;
    const SelectorResolver& resolver_;
    const utils::Clock& clock_;
};

} // namespace core
} // namespace agentfleet

#endif // AGENTFLEET_CORE_ADMIN_SERVICE_HPP
