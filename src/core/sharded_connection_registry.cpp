#include "agentfleet/core/sharded_connection_registry.hpp"
#include "agentfleet/utils/logging.hpp"
#include <algorithm>
#include <functional>
#include <mutex>
#include <stdexcept>

namespace agentfleet {
namespace core {

ShardedConnectionRegistry::ShardedConnectionRegistry(std::chrono::milliseconds livenessThreshold,
                                                     PaginationCursor cursor,
                                                     std::size_t shardCount)
    : livenessThreshold_(livenessThreshold), cursor_(std::move(cursor)) {
    if (shardCount == 0) {
        throw std::invalid_argument("shard count must be positive");
    }
    shards_.reserve(shardCount);
    for (std::size_t i = 0; i < shardCount; ++i) {
        shards_.push_back(std::make_unique<Shard>());
    }
}

ShardedConnectionRegistry::Shard& ShardedConnectionRegistry::shardFor(
    const Connection::ConnectionId& connId) const {
    return *shards_[std::hash<std::string>{}(connId) % shards_.size()];
}

Connection ShardedConnectionRegistry::snapshot(const Connection::ConnectionId& connId,
                                               const Entry& entry,
                                               utils::Clock::TimePoint now) const {
    Connection connection;
    connection.id = connId;
    connection.instanceId = entry.instanceId;
    connection.lastCommunicatedAt = entry.lastCommunicatedAt;
    connection.alive = connection.isAlive(now, livenessThreshold_);
    return connection;
}

Result<void> ShardedConnectionRegistry::registerConnection(const Connection::ConnectionId& connId,
                                                           utils::Clock::TimePoint now) {
    if (connId.empty()) {
        return Error(ErrorCode::ValidationError, "connection id must not be empty");
    }

    Shard& shard = shardFor(connId);
    std::unique_lock<std::shared_mutex> lock(shard.mutex);
    auto inserted = shard.entries.emplace(connId, Entry{std::nullopt, now});
    if (!inserted.second) {
        return Error(ErrorCode::AlreadyExists, "connection " + connId + " is already registered");
    }

    AGENTFLEET_LOG_DEBUG("registered connection {}", connId);
    return Result<void>();
}

Result<void> ShardedConnectionRegistry::bindInstance(const Connection::ConnectionId& connId,
                                                     const std::string& instanceId) {
    if (instanceId.empty()) {
        return Error(ErrorCode::ValidationError, "instance id must not be empty");
    }

    Shard& shard = shardFor(connId);
    std::unique_lock<std::shared_mutex> lock(shard.mutex);
    auto it = shard.entries.find(connId);
    if (it == shard.entries.end()) {
        return Error(ErrorCode::NotRegistered, "connection " + connId + " is not registered");
    }

    auto& bound = it->second.instanceId;
    if (bound && *bound != instanceId) {
        return Error(ErrorCode::ValidationError,
                     "connection " + connId + " is already bound to instance " + *bound);
    }
    bound = instanceId;

    AGENTFLEET_LOG_DEBUG("bound connection {} to instance {}", connId, instanceId);
    return Result<void>();
}

void ShardedConnectionRegistry::touch(const Connection::ConnectionId& connId,
                                      utils::Clock::TimePoint now) {
    Shard& shard = shardFor(connId);
    std::unique_lock<std::shared_mutex> lock(shard.mutex);
    auto it = shard.entries.find(connId);
    if (it == shard.entries.end()) {
        return;  // raced with close
    }
    it->second.lastCommunicatedAt = std::max(it->second.lastCommunicatedAt, now);
}

void ShardedConnectionRegistry::unregister(const Connection::ConnectionId& connId) {
    Shard& shard = shardFor(connId);
    std::unique_lock<std::shared_mutex> lock(shard.mutex);
    if (shard.entries.erase(connId) > 0) {
        AGENTFLEET_LOG_DEBUG("unregistered connection {}", connId);
    }
}

Result<ListResponse<Connection>> ShardedConnectionRegistry::list(const ListOptions& options,
                                                                 utils::Clock::TimePoint now) const {
    std::vector<Connection> all;
    for (const auto& shard : shards_) {
        std::shared_lock<std::shared_mutex> lock(shard->mutex);
        for (const auto& [connId, entry] : shard->entries) {
            all.push_back(snapshot(connId, entry, now));
        }
    }

    std::sort(all.begin(), all.end(),
              [](const Connection& a, const Connection& b) { return a.id < b.id; });

    return paginate(all, [](const Connection& c) -> const std::string& { return c.id; },
                    options, cursor_);
}

Result<Connection> ShardedConnectionRegistry::get(const Connection::ConnectionId& connId,
                                                  utils::Clock::TimePoint now) const {
    Shard& shard = shardFor(connId);
    std::shared_lock<std::shared_mutex> lock(shard.mutex);
    auto it = shard.entries.find(connId);
    if (it == shard.entries.end()) {
        return Error(ErrorCode::NotFound, "connection " + connId + " not found");
    }
    return snapshot(connId, it->second, now);
}

Result<Connection> ShardedConnectionRegistry::getByInstanceId(const std::string& instanceId,
                                                              utils::Clock::TimePoint now) const {
    for (const auto& shard : shards_) {
        std::shared_lock<std::shared_mutex> lock(shard->mutex);
        for (const auto& [connId, entry] : shard->entries) {
            if (entry.instanceId && *entry.instanceId == instanceId) {
                return snapshot(connId, entry, now);
            }
        }
    }
    return Error(ErrorCode::NotFound, "no connection for instance " + instanceId);
}

Result<bool> ShardedConnectionRegistry::isAlive(const Connection::ConnectionId& connId,
                                                utils::Clock::TimePoint now) const {
    auto connection = get(connId, now);
    if (connection.has_error()) {
        return connection.error();
    }
    return connection.value().alive;
}

std::size_t ShardedConnectionRegistry::size() const {
    std::size_t total = 0;
    for (const auto& shard : shards_) {
        std::shared_lock<std::shared_mutex> lock(shard->mutex);
        total += shard->entries.size();
    }
    return total;
}

} // namespace core
} // namespace agentfleet
