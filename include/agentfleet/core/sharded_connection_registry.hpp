#ifndef AGENTFLEET_CORE_SHARDED_CONNECTION_REGISTRY_HPP
#define AGENTFLEET_CORE_SHARDED_CONNECTION_REGISTRY_HPP

#include <memory>
#include <shared_mutex>
#include <unordered_map>
#include <vector>
#include "agentfleet/core/connection_registry.hpp"
#include "agentfleet/core/pagination_cursor.hpp"

namespace agentfleet {
namespace core {

/**
 * @brief ConnectionRegistry partitioned into independently locked shards.
 *
 * A connection id always maps to the same shard, so register/touch/unregister
 * for different ids contend only when they hash to the same shard. Reads that
 * span the whole registry (list, getByInstanceId) lock one shard at a time and
 * therefore see a per-shard consistent snapshot.
 */
class ShardedConnectionRegistry : public ConnectionRegistry {
public:
    /**
     * @param livenessThreshold Maximum silence before a connection counts as dead
     * @param cursor Codec for list continuation tokens
     * @param shardCount Number of lock shards, must be positive
     * @throws std::invalid_argument if shardCount is zero
     */
    ShardedConnectionRegistry(std::chrono::milliseconds livenessThreshold,
                              PaginationCursor cursor,
                              std::size_t shardCount = 16);
    ~ShardedConnectionRegistry() override = default;

    // Prevent copying
    ShardedConnectionRegistry(const ShardedConnectionRegistry&) = delete;
    ShardedConnectionRegistry& operator=(const ShardedConnectionRegistry&) = delete;

    Result<void> registerConnection(const Connection::ConnectionId& connId,
                                    utils::Clock::TimePoint now) override;
    Result<void> bindInstance(const Connection::ConnectionId& connId,
                              const std::string& instanceId) override;
    void touch(const Connection::ConnectionId& connId, utils::Clock::TimePoint now) override;
    void unregister(const Connection::ConnectionId& connId) override;

    Result<ListResponse<Connection>> list(const ListOptions& options,
                                          utils::Clock::TimePoint now) const override;
    Result<Connection> get(const Connection::ConnectionId& connId,
                           utils::Clock::TimePoint now) const override;
    Result<Connection> getByInstanceId(const std::string& instanceId,
                                       utils::Clock::TimePoint now) const override;
    Result<bool> isAlive(const Connection::ConnectionId& connId,
                         utils::Clock::TimePoint now) const override;
    std::size_t size() const override;

    std::chrono::milliseconds livenessThreshold() const { return livenessThreshold_; }

private:
    struct Entry {
        std::optional<std::string> instanceId;
        utils::Clock::TimePoint lastCommunicatedAt;
    };

    struct Shard {
        mutable std::shared_mutex mutex;
        std::unordered_map<Connection::ConnectionId, Entry> entries;
    };

    Shard& shardFor(const Connection::ConnectionId& connId) const;
    Connection snapshot(const Connection::ConnectionId& connId, const Entry& entry,
                        utils::Clock::TimePoint now) const;

    std::chrono::milliseconds livenessThreshold_;
    PaginationCursor cursor_;
    std::vector<std::unique_ptr<Shard>> shards_;
};

} // namespace core
} // namespace agentfleet

#endif // AGENTFLEET_CORE_SHARDED_CONNECTION_REGISTRY_HPP
