#include "agentfleet/core/agent_group_store.hpp"
#include "agentfleet/utils/logging.hpp"
#include <atomic>
#include <mutex>

namespace agentfleet {
namespace core {

InMemoryAgentGroupStore::InMemoryAgentGroupStore(PaginationCursor cursor)
    : cursor_(std::move(cursor)),
      snapshot_(std::make_shared<const std::vector<AgentGroup>>()) {}

void InMemoryAgentGroupStore::publishSnapshot() {
    auto active = std::make_shared<std::vector<AgentGroup>>();
    for (const auto& entry : groups_) {
        if (!entry.second.isDeleted()) {
            active->push_back(entry.second);
        }
    }
    std::atomic_store(&snapshot_, AgentGroupSnapshot(std::move(active)));
}

Result<AgentGroup> InMemoryAgentGroupStore::createAgentGroup(const AgentGroup& group) {
    auto valid = validateAgentGroup(group);
    if (valid.has_error()) {
        return valid.error();
    }
    if (group.isDeleted()) {
        return Error(ErrorCode::ValidationError, "cannot create a deleted agent group");
    }

    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto inserted = groups_.emplace(group.name, group);
    if (!inserted.second) {
        return Error(ErrorCode::AlreadyExists, "agent group " + group.name + " already exists");
    }
    publishSnapshot();

    AGENTFLEET_LOG_INFO("created agent group {} (priority {})", group.name, group.priority);
    return inserted.first->second;
}

Result<AgentGroup> InMemoryAgentGroupStore::updateAgentGroup(const AgentGroup& group,
                                                             utils::Clock::TimePoint updatedAt,
                                                             const std::string& updatedBy) {
    auto valid = validateAgentGroup(group);
    if (valid.has_error()) {
        return valid.error();
    }

    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto it = groups_.find(group.name);
    if (it == groups_.end() || it->second.isDeleted()) {
        return Error(ErrorCode::NotFound, "agent group " + group.name + " not found");
    }

    AgentGroup& stored = it->second;
    stored.priority = group.priority;
    stored.attributes = group.attributes;
    stored.selector = group.selector;
    stored.remoteConfig = group.remoteConfig;
    stored.upsertCondition(Condition{ConditionType::Updated, ConditionStatus::True, updatedAt,
                                     updatedBy, "Agent group updated"});
    publishSnapshot();

    AGENTFLEET_LOG_INFO("updated agent group {} by {}", group.name, updatedBy);
    return stored;
}

Result<void> InMemoryAgentGroupStore::deleteAgentGroup(const std::string& name,
                                                       utils::Clock::TimePoint deletedAt,
                                                       const std::string& deletedBy) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto it = groups_.find(name);
    if (it == groups_.end()) {
        return Error(ErrorCode::NotFound, "agent group " + name + " not found");
    }
    if (it->second.isDeleted()) {
        return Result<void>();
    }

    it->second.markDeleted(deletedAt, deletedBy);
    publishSnapshot();

    AGENTFLEET_LOG_INFO("deleted agent group {} by {}", name, deletedBy);
    return Result<void>();
}

Result<AgentGroup> InMemoryAgentGroupStore::getAgentGroup(const std::string& name) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = groups_.find(name);
    if (it == groups_.end()) {
        return Error(ErrorCode::NotFound, "agent group " + name + " not found");
    }
    return it->second;
}

Result<ListResponse<AgentGroup>> InMemoryAgentGroupStore::listAgentGroups(const ListOptions& options,
                                                                          bool includeDeleted) const {
    std::vector<AgentGroup> sorted;
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        sorted.reserve(groups_.size());
        for (const auto& entry : groups_) {
            if (includeDeleted || !entry.second.isDeleted()) {
                sorted.push_back(entry.second);
            }
        }
    }
    return paginate(sorted, [](const AgentGroup& g) -> const std::string& { return g.name; },
                    options, cursor_);
}

AgentGroupSnapshot InMemoryAgentGroupStore::activeSnapshot() const {
    return std::atomic_load(&snapshot_);
}

} // namespace core
} // namespace agentfleet
