#ifndef AGENTFLEET_CORE_CONNECTION_REGISTRY_HPP
#define AGENTFLEET_CORE_CONNECTION_REGISTRY_HPP

#include <chrono>
#include <optional>
#include <string>
#include "agentfleet/core/list_options.hpp"
#include "agentfleet/utils/clock.hpp"
#include "agentfleet/utils/result.hpp"

namespace agentfleet {
namespace core {

/**
 * @brief Snapshot of one live transport session.
 */
struct Connection {
    using ConnectionId = std::string;

    ConnectionId id;
    std::optional<std::string> instanceId;  ///< Unknown until the agent identifies itself
    utils::Clock::TimePoint lastCommunicatedAt{};
    bool alive{false};                      ///< Computed against the "now" of the read

    bool isAlive(utils::Clock::TimePoint now, std::chrono::milliseconds threshold) const {
        return (now - lastCommunicatedAt) < threshold;
    }
};

/**
 * @brief Tracks one entry per live transport session.
 *
 * Implementations must tolerate arbitrary concurrent churn: callers for
 * different connection ids must not serialize on a single lock.
 */
class ConnectionRegistry {
public:
    virtual ~ConnectionRegistry() = default;

    /**
     * @brief Creates an entry with unknown instance id.
     * @return AlreadyExists if the id is already registered
     */
    virtual Result<void> registerConnection(const Connection::ConnectionId& connId,
                                            utils::Clock::TimePoint now) = 0;

    /**
     * @brief Records the agent instance id carried by an identifying message.
     * @return NotRegistered if connId is unknown, ValidationError if it is
     *         already bound to a different instance
     */
    virtual Result<void> bindInstance(const Connection::ConnectionId& connId,
                                      const std::string& instanceId) = 0;

    /**
     * @brief Refreshes lastCommunicatedAt; a no-op for removed connections.
     */
    virtual void touch(const Connection::ConnectionId& connId, utils::Clock::TimePoint now) = 0;

    /**
     * @brief Removes the entry. Idempotent.
     */
    virtual void unregister(const Connection::ConnectionId& connId) = 0;

    /**
     * @brief Paginated snapshot ordered by connection id, alive computed against now.
     */
    virtual Result<ListResponse<Connection>> list(const ListOptions& options,
                                                  utils::Clock::TimePoint now) const = 0;

    virtual Result<Connection> get(const Connection::ConnectionId& connId,
                                   utils::Clock::TimePoint now) const = 0;

    virtual Result<Connection> getByInstanceId(const std::string& instanceId,
                                               utils::Clock::TimePoint now) const = 0;

    /**
     * @return NotFound if the connection is not registered
     */
    virtual Result<bool> isAlive(const Connection::ConnectionId& connId,
                                 utils::Clock::TimePoint now) const = 0;

    virtual std::size_t size() const = 0;
};

} // namespace core
} // namespace agentfleet

#endif // AGENTFLEET_CORE_CONNECTION_REGISTRY_HPP
