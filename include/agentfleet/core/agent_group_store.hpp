#ifndef AGENTFLEET_CORE_AGENT_GROUP_STORE_HPP
#define AGENTFLEET_CORE_AGENT_GROUP_STORE_HPP

#include <map>
#include <memory>
#include <shared_mutex>
#include <string>
#include <vector>
#include "agentfleet/core/agent_group.hpp"
#include "agentfleet/core/list_options.hpp"
#include "agentfleet/core/pagination_cursor.hpp"

namespace agentfleet {
namespace core {

/**
 * @brief Immutable view of the non-deleted agent groups at one point in time.
 */
using AgentGroupSnapshot = std::shared_ptr<const std::vector<AgentGroup>>;

/**
 * @brief CRUD store for agent groups with soft delete.
 */
class AgentGroupStore {
public:
    virtual ~AgentGroupStore() = default;

    /**
     * @return ValidationError for an invalid group, AlreadyExists if the name is
     *         taken, including by a deleted group
     */
    virtual Result<AgentGroup> createAgentGroup(const AgentGroup& group) = 0;

    /**
     * @brief Replaces selector, priority, attributes and configuration.
     *
     * The Created condition of the stored group is kept and an Updated condition
     * is upserted.
     *
     * @return NotFound if the group is absent or deleted
     */
    virtual Result<AgentGroup> updateAgentGroup(const AgentGroup& group,
                                                utils::Clock::TimePoint updatedAt,
                                                const std::string& updatedBy) = 0;

    /**
     * @brief Soft-deletes the group; deleting a deleted group changes nothing.
     * @return NotFound if the group never existed
     */
    virtual Result<void> deleteAgentGroup(const std::string& name,
                                          utils::Clock::TimePoint deletedAt,
                                          const std::string& deletedBy) = 0;

    /**
     * @brief Looks a group up by name, deleted or not.
     */
    virtual Result<AgentGroup> getAgentGroup(const std::string& name) const = 0;

    /**
     * @brief Paginated listing by name; deleted groups only when includeDeleted is set.
     */
    virtual Result<ListResponse<AgentGroup>> listAgentGroups(const ListOptions& options,
                                                             bool includeDeleted = false) const = 0;

    virtual AgentGroupSnapshot activeSnapshot() const = 0;
};

/**
 * @brief AgentGroupStore held in memory.
 *
 * Writers rebuild and publish a new snapshot, so readers of activeSnapshot()
 * never take the store lock while matching.
 */
class InMemoryAgentGroupStore : public AgentGroupStore {
public:
    explicit InMemoryAgentGroupStore(PaginationCursor cursor);

    Result<AgentGroup> createAgentGroup(const AgentGroup& group) override;
    Result<AgentGroup> updateAgentGroup(const AgentGroup& group,
                                        utils::Clock::TimePoint updatedAt,
                                        const std::string& updatedBy) override;
    Result<void> deleteAgentGroup(const std::string& name,
                                  utils::Clock::TimePoint deletedAt,
                                  const std::string& deletedBy) override;
    Result<AgentGroup> getAgentGroup(const std::string& name) const override;
    Result<ListResponse<AgentGroup>> listAgentGroups(const ListOptions& options,
                                                     bool includeDeleted = false) const override;
    AgentGroupSnapshot activeSnapshot() const override;

private:
    // Caller holds mutex_ exclusively.
    void publishSnapshot();

    PaginationCursor cursor_;
    mutable std::shared_mutex mutex_;
    std::map<std::string, AgentGroup> groups_;
    AgentGroupSnapshot snapshot_;
};

} // namespace core
} // namespace agentfleet

#endif // AGENTFLEET_CORE_AGENT_GROUP_STORE_HPP
