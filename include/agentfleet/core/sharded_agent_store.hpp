#ifndef AGENTFLEET_CORE_SHARDED_AGENT_STORE_HPP
#define AGENTFLEET_CORE_SHARDED_AGENT_STORE_HPP

#include <memory>
#include <shared_mutex>
#include <unordered_map>
#include <vector>
#include "agentfleet/core/agent_store.hpp"
#include "agentfleet/core/pagination_cursor.hpp"

namespace agentfleet {
namespace core {

/**
 * @brief AgentStore held in memory and partitioned by instance id.
 *
 * Reports for different agents only contend when their ids share a shard.
 * Listings lock one shard at a time and sort the collected records.
 */
class ShardedAgentStore : public AgentStore {
public:
    /**
     * @param cursor Codec for list continuation tokens
     * @param shardCount Number of lock shards, must be positive
     * @throws std::invalid_argument if shardCount is zero
     */
    explicit ShardedAgentStore(PaginationCursor cursor, std::size_t shardCount = 16);
    ~ShardedAgentStore() override = default;

    // Prevent copying
    ShardedAgentStore(const ShardedAgentStore&) = delete;
    ShardedAgentStore& operator=(const ShardedAgentStore&) = delete;

    Result<Agent> recordReport(const AgentReport& report) override;
    void markDisconnected(const std::string& instanceId,
                          const Connection::ConnectionId& connId) override;
    Result<Agent> getAgent(const std::string& instanceId) const override;
    Result<ListResponse<Agent>> listAgents(const ListOptions& options) const override;
    Result<ListResponse<Agent>> listAgentsBySelector(const AgentSelector& selector,
                                                     const ListOptions& options) const override;
    std::size_t size() const override;

private:
    struct Shard {
        mutable std::shared_mutex mutex;
        std::unordered_map<std::string, Agent> agents;
    };

    Shard& shardFor(const std::string& instanceId) const;

    template <typename Predicate>
    Result<ListResponse<Agent>> collect(Predicate keep, const ListOptions& options) const;

    PaginationCursor cursor_;
    std::vector<std::unique_ptr<Shard>> shards_;
};

} // namespace core
} // namespace agentfleet

#endif // AGENTFLEET_CORE_SHARDED_AGENT_STORE_HPP
