#include "agentfleet/core/selector_resolver.hpp"

namespace agentfleet {
namespace core {

bool PrioritySelectorResolver::matches(const Attributes& agentAttributes, const AgentSelector& selector) {
    for (const auto& required : selector.identifyingAttributes) {
        auto it = agentAttributes.find(required.first);
        if (it == agentAttributes.end() || it->second != required.second) {
            return false;
        }
    }
    return true;
}

std::optional<AgentGroup> PrioritySelectorResolver::resolve(const Attributes& agentAttributes,
                                                            const std::vector<AgentGroup>& candidates) const {
    const AgentGroup* best = nullptr;
    for (const auto& group : candidates) {
        if (group.isDeleted() || !matches(agentAttributes, group.selector)) {
            continue;
        }
        if (best == nullptr
            || group.priority > best->priority
            || (group.priority == best->priority && group.name < best->name)) {
            best = &group;
        }
    }

    if (best == nullptr) {
        return std::nullopt;
    }
    return *best;
}

} // namespace core
} // namespace agentfleet
