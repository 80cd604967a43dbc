#ifndef AGENTFLEET_CORE_AGENT_STORE_HPP
#define AGENTFLEET_CORE_AGENT_STORE_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "agentfleet/core/connection_registry.hpp"
#include "agentfleet/core/list_options.hpp"
#include "agentfleet/core/protocol.hpp"
#include "agentfleet/utils/clock.hpp"
#include "agentfleet/utils/result.hpp"

namespace agentfleet {
namespace core {

/**
 * @brief What the control plane last learned about one agent instance.
 *
 * Records outlive connections, so an agent that went away can still be inspected.
 */
struct Agent {
    std::string instanceId;
    AgentDescription description;
    std::optional<std::string> reportedConfigHash;          ///< Configuration the agent last said it applied
    std::optional<std::string> effectiveAgentGroup;         ///< Group resolved at the last report
    std::optional<Connection::ConnectionId> connectionId;   ///< Set while a connection carries the agent
    utils::Clock::TimePoint firstSeenAt{};
    utils::Clock::TimePoint lastReportedAt{};

    bool connected() const { return connectionId.has_value(); }
};

/**
 * @brief One message's worth of agent state, as seen by the session handler.
 */
struct AgentReport {
    std::string instanceId;
    Connection::ConnectionId connectionId;
    std::optional<AgentDescription> description;    ///< Absent keeps the stored description
    std::optional<std::string> reportedConfigHash;  ///< Absent keeps the stored hash
    std::optional<std::string> effectiveAgentGroup; ///< Always replaces the stored group
    utils::Clock::TimePoint at{};
};

/**
 * @brief Agent counts for one agent group.
 *
 * numAgents = numConnectedAgents + numNotConnectedAgents and
 * numConnectedAgents = numHealthyAgents + numUnhealthyAgents. A connected agent
 * is healthy while its connection is within the liveness threshold.
 */
struct AgentGroupStatus {
    int64_t numAgents{0};
    int64_t numConnectedAgents{0};
    int64_t numHealthyAgents{0};
    int64_t numUnhealthyAgents{0};
    int64_t numNotConnectedAgents{0};
};

/**
 * @brief Filters agents by both attribute maps of a selector.
 *
 * Group resolution only looks at identifying attributes; operator filtering also
 * requires every non-identifying selector key to match.
 */
bool agentMatchesSelector(const Agent& agent, const AgentSelector& selector);

AgentGroupStatus summarizeAgents(const std::vector<Agent>& agents,
                                 const ConnectionRegistry& registry,
                                 utils::Clock::TimePoint now);

/**
 * @brief Store of agent records keyed by instance id.
 */
class AgentStore {
public:
    virtual ~AgentStore() = default;

    /**
     * @brief Creates or updates the record for report.instanceId.
     * @return The stored record, or ValidationError for an empty instance id
     */
    virtual Result<Agent> recordReport(const AgentReport& report) = 0;

    /**
     * @brief Clears the agent's connection if it is still connId.
     *
     * A newer connection of the same agent is left alone.
     */
    virtual void markDisconnected(const std::string& instanceId,
                                  const Connection::ConnectionId& connId) = 0;

    /**
     * @return NotFound if the instance never identified itself
     */
    virtual Result<Agent> getAgent(const std::string& instanceId) const = 0;

    /**
     * @brief Paginated listing by instance id.
     */
    virtual Result<ListResponse<Agent>> listAgents(const ListOptions& options) const = 0;

    /**
     * @brief Paginated listing by instance id of the agents agentMatchesSelector accepts.
     */
    virtual Result<ListResponse<Agent>> listAgentsBySelector(const AgentSelector& selector,
                                                             const ListOptions& options) const = 0;

    virtual std::size_t size() const = 0;
};

} // namespace core
} // namespace agentfleet

#endif // AGENTFLEET_CORE_AGENT_STORE_HPP
