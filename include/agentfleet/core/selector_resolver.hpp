#ifndef AGENTFLEET_CORE_SELECTOR_RESOLVER_HPP
#define AGENTFLEET_CORE_SELECTOR_RESOLVER_HPP

#include <optional>
#include <vector>
#include "agentfleet/core/agent_group.hpp"

namespace agentfleet {
namespace core {

/**
 * @brief Picks the single agent group whose configuration applies to an agent.
 */
class SelectorResolver {
public:
    virtual ~SelectorResolver() = default;

    /**
     * @brief Resolves the effective group for an agent.
     *
     * @param agentAttributes Identifying attributes reported by the agent
     * @param candidates Groups to consider; deleted groups are skipped
     * @return The winning group, or std::nullopt when nothing matches
     */
    virtual std::optional<AgentGroup> resolve(const Attributes& agentAttributes,
                                              const std::vector<AgentGroup>& candidates) const = 0;
};

/**
 * @brief Highest priority wins; equal priorities fall back to the smallest name.
 *
 * Stateless and thread-safe.
 */
class PrioritySelectorResolver : public SelectorResolver {
public:
    std::optional<AgentGroup> resolve(const Attributes& agentAttributes,
                                      const std::vector<AgentGroup>& candidates) const override;

    /**
     * @brief True when every identifying selector key is present with an equal value.
     *
     * Non-identifying selector attributes are ignored.
     */
    static bool matches(const Attributes& agentAttributes, const AgentSelector& selector);
};

} // namespace core
} // namespace agentfleet

#endif // AGENTFLEET_CORE_SELECTOR_RESOLVER_HPP
