#ifndef AGENTFLEET_CORE_SESSION_HANDLER_HPP
#define AGENTFLEET_CORE_SESSION_HANDLER_HPP

#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>
#include "agentfleet/core/agent_group_store.hpp"
#include "agentfleet/core/agent_store.hpp"
#include "agentfleet/core/command_audit_log.hpp"
#include "agentfleet/core/connection_registry.hpp"
#include "agentfleet/core/protocol.hpp"
#include "agentfleet/core/selector_resolver.hpp"
#include "agentfleet/utils/clock.hpp"

namespace agentfleet {
namespace core {

enum class SessionState {
    Connected,   ///< Transport established, agent identity unknown
    Identified,  ///< Self-description received, instance id bound
    Closed       ///< Terminal
};

const char* sessionStateName(SessionState state);

struct SessionHandlerConfig {
    std::size_t maxCommandsPerReply{16};
    std::size_t shardCount{16};
};

/**
 * @brief How far an instance has acknowledged its command stream.
 *
 * Every command whose order key is at or below the watermark is acknowledged.
 * Acknowledgements that arrived out of order are held until the gap closes.
 */
struct DeliveryProgress {
    std::string watermark;              ///< Empty until the first command is acknowledged in order
    std::size_t acknowledgedAhead{0};   ///< Acknowledged commands past the watermark
};

/**
 * @brief Per-connection protocol state machine.
 *
 * Every transport event for a connection is forwarded here. A connection's
 * events must be delivered sequentially; events for different connections may
 * arrive concurrently and only contend on hash-selected shards.
 *
 * The handler never fails a message outward: malformed or invalid input is
 * answered with a generic BadRequest reply and the connection stays usable.
 */
class SessionHandler {
public:
    /**
     * All collaborators must outlive the handler.
     *
     * @throws std::invalid_argument if config.shardCount or config.maxCommandsPerReply is zero
     */
    SessionHandler(ConnectionRegistry& registry,
                   AgentStore& agents,
                   CommandAuditLog& auditLog,
                   const SelectorResolver& resolver,
                   const AgentGroupStore& groups,
                   const utils::Clock& clock,
                   SessionHandlerConfig config = SessionHandlerConfig());

    // Prevent copying
    SessionHandler(const SessionHandler&) = delete;
    SessionHandler& operator=(const SessionHandler&) = delete;

    /**
     * @brief Registers the connection and starts its session in Connected.
     * @return The registry error if the connection id is already in use
     */
    Result<void> onConnected(const Connection::ConnectionId& connId);

    ServerToAgent onMessage(const Connection::ConnectionId& connId, const AgentToServer& message);

    /**
     * @brief Decodes a raw frame and handles it, answering undecodable frames with BadRequest.
     */
    ServerToAgent onFrame(const Connection::ConnectionId& connId, const std::string& frame);

    /**
     * @brief Unregisters the connection and forgets its session. Idempotent.
     *
     * Later events for the id are rejected like those for an unknown connection.
     */
    void onConnectionClosed(const Connection::ConnectionId& connId);

    /**
     * @return NotFound for unknown or closed connections
     */
    Result<SessionState> sessionState(const Connection::ConnectionId& connId) const;

    /**
     * @brief Acknowledgement progress of the instance, across all its connections.
     */
    DeliveryProgress deliveryProgress(const std::string& instanceId) const;

    /**
     * @brief Generic BadRequest reply; carries no detail about the cause.
     */
    static ServerToAgent rejection(const std::string& instanceId);

private:
    struct Session {
        SessionState state{SessionState::Connected};
        std::optional<std::string> instanceId;
        std::optional<uint64_t> lastSequenceNum;
        std::optional<std::string> lastReportedConfigHash;
        Attributes identifyingAttributes;
    };

    struct SessionShard {
        mutable std::mutex mutex;
        std::unordered_map<Connection::ConnectionId, Session> sessions;
    };

    struct DeliveryLedger {
        std::string watermark;
        std::set<std::string> acknowledgedAhead;  // order keys
    };

    struct LedgerShard {
        mutable std::mutex mutex;
        std::unordered_map<std::string, DeliveryLedger> ledgers;
    };

    SessionShard& sessionShardFor(const Connection::ConnectionId& connId) const;
    LedgerShard& ledgerShardFor(const std::string& instanceId) const;

    void recordAcknowledgements(const std::string& instanceId, const std::vector<std::string>& ids);
    void recordAgentReport(const Connection::ConnectionId& connId,
                           const AgentToServer& message,
                           const std::optional<AgentGroup>& group,
                           utils::Clock::TimePoint now);
    static std::optional<RemoteConfig> effectiveConfig(const std::optional<AgentGroup>& group,
                                                       const std::optional<std::string>& reportedHash);
    void appendPendingCommands(const std::string& instanceId, ServerToAgent& reply) const;

    ConnectionRegistry& registry_;
    AgentStore& agents_;
    CommandAuditLog& auditLog_;
    const SelectorResolver& resolver_;
    const AgentGroupStore& groups_;
    const utils::Clock& clock_;
    SessionHandlerConfig config_;

    std::vector<std::unique_ptr<SessionShard>> sessionShards_;
    std::vector<std::unique_ptr<LedgerShard>> ledgerShards_;
};

} // namespace core
} // namespace agentfleet

#endif // AGENTFLEET_CORE_SESSION_HANDLER_HPP
