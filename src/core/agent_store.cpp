#include "agentfleet/core/agent_store.hpp"

namespace agentfleet {
namespace core {

namespace {
    bool containsAll(const Attributes& have, const Attributes& want) {
        for (const auto& [key, value] : want) {
            auto it = have.find(key);
            if (it == have.end() || it->second != value) {
                return false;
            }
        }
        return true;
    }
}

bool agentMatchesSelector(const Agent& agent, const AgentSelector& selector) {
    return containsAll(agent.description.identifyingAttributes, selector.identifyingAttributes) &&
           containsAll(agent.description.nonIdentifyingAttributes, selector.nonIdentifyingAttributes);
}

AgentGroupStatus summarizeAgents(const std::vector<Agent>& agents,
                                 const ConnectionRegistry& registry,
                                 utils::Clock::TimePoint now) {
    AgentGroupStatus status;
    for (const auto& agent : agents) {
        ++status.numAgents;
        if (!agent.connected()) {
            ++status.numNotConnectedAgents;
            continue;
        }
        auto alive = registry.isAlive(*agent.connectionId, now);
        if (alive.has_error()) {
            // Connection closed between the snapshot and this read
            ++status.numNotConnectedAgents;
            continue;
        }
        ++status.numConnectedAgents;
        if (alive.value()) {
            ++status.numHealthyAgents;
        } else {
            ++status.numUnhealthyAgents;
        }
    }
    return status;
}

} // namespace core
} // namespace agentfleet
