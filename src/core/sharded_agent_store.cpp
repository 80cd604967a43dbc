#include "agentfleet/core/sharded_agent_store.hpp"
#include "agentfleet/utils/logging.hpp"
#include <algorithm>
#include <functional>
#include <mutex>
#include <stdexcept>

namespace agentfleet {
namespace core {

ShardedAgentStore::ShardedAgentStore(PaginationCursor cursor, std::size_t shardCount)
    : cursor_(std::move(cursor)) {
    if (shardCount == 0) {
        throw std::invalid_argument("shard count must be positive");
    }
    shards_.reserve(shardCount);
    for (std::size_t i = 0; i < shardCount; ++i) {
        shards_.push_back(std::make_unique<Shard>());
    }
}

ShardedAgentStore::Shard& ShardedAgentStore::shardFor(const std::string& instanceId) const {
    return *shards_[std::hash<std::string>{}(instanceId) % shards_.size()];
}

Result<Agent> ShardedAgentStore::recordReport(const AgentReport& report) {
    if (report.instanceId.empty()) {
        return Error(ErrorCode::ValidationError, "instance id must not be empty");
    }

    Shard& shard = shardFor(report.instanceId);
    std::unique_lock<std::shared_mutex> lock(shard.mutex);
    auto inserted = shard.agents.try_emplace(report.instanceId);
    Agent& agent = inserted.first->second;
    if (inserted.second) {
        agent.instanceId = report.instanceId;
        agent.firstSeenAt = report.at;
        AGENTFLEET_LOG_INFO("first report from agent {}", report.instanceId);
    }

    if (report.description) {
        agent.description = *report.description;
    }
    if (report.reportedConfigHash) {
        agent.reportedConfigHash = report.reportedConfigHash;
    }
    agent.effectiveAgentGroup = report.effectiveAgentGroup;
    agent.connectionId = report.connectionId;
    agent.lastReportedAt = std::max(agent.lastReportedAt, report.at);
    return agent;
}

void ShardedAgentStore::markDisconnected(const std::string& instanceId,
                                         const Connection::ConnectionId& connId) {
    Shard& shard = shardFor(instanceId);
    std::unique_lock<std::shared_mutex> lock(shard.mutex);
    auto it = shard.agents.find(instanceId);
    if (it == shard.agents.end() || it->second.connectionId != connId) {
        return;  // already reconnected elsewhere
    }
    it->second.connectionId.reset();
    AGENTFLEET_LOG_DEBUG("agent {} disconnected from {}", instanceId, connId);
}

Result<Agent> ShardedAgentStore::getAgent(const std::string& instanceId) const {
    Shard& shard = shardFor(instanceId);
    std::shared_lock<std::shared_mutex> lock(shard.mutex);
    auto it = shard.agents.find(instanceId);
    if (it == shard.agents.end()) {
        return Error(ErrorCode::NotFound, "agent " + instanceId + " not found");
    }
    return it->second;
}

template <typename Predicate>
Result<ListResponse<Agent>> ShardedAgentStore::collect(Predicate keep,
                                                       const ListOptions& options) const {
    std::vector<Agent> all;
    for (const auto& shard : shards_) {
        std::shared_lock<std::shared_mutex> lock(shard->mutex);
        for (const auto& entry : shard->agents) {
            if (keep(entry.second)) {
                all.push_back(entry.second);
            }
        }
    }

    std::sort(all.begin(), all.end(),
              [](const Agent& a, const Agent& b) { return a.instanceId < b.instanceId; });

    return paginate(all, [](const Agent& a) -> const std::string& { return a.instanceId; },
                    options, cursor_);
}

Result<ListResponse<Agent>> ShardedAgentStore::listAgents(const ListOptions& options) const {
    return collect([](const Agent&) { return true; }, options);
}

Result<ListResponse<Agent>> ShardedAgentStore::listAgentsBySelector(const AgentSelector& selector,
                                                                    const ListOptions& options) const {
    return collect([&selector](const Agent& agent) { return agentMatchesSelector(agent, selector); },
                   options);
}

std::size_t ShardedAgentStore::size() const {
    std::size_t total = 0;
    for (const auto& shard : shards_) {
        std::shared_lock<std::shared_mutex> lock(shard->mutex);
        total += shard->agents.size();
    }
    return total;
}

} // namespace core
} // namespace agentfleet
