#include "agentfleet/core/session_handler.hpp"
#include "agentfleet/core/message_codec.hpp"
#include "agentfleet/utils/crypto.hpp"
#include "agentfleet/utils/logging.hpp"
#include <functional>
#include <stdexcept>

namespace agentfleet {
namespace core {

namespace {
    // Agents only ever see this text; the cause stays in the server log.
    constexpr const char* kBadRequestMessage = "request rejected";
}

const char* sessionStateName(SessionState state) {
    switch (state) {
        case SessionState::Connected: return "Connected";
        case SessionState::Identified: return "Identified";
        case SessionState::Closed: return "Closed";
    }
    return "Unknown";
}

SessionHandler::SessionHandler(ConnectionRegistry& registry,
                               AgentStore& agents,
                               CommandAuditLog& auditLog,
                               const SelectorResolver& resolver,
                               const AgentGroupStore& groups,
                               const utils::Clock& clock,
                               SessionHandlerConfig config)
    : registry_(registry),
      agents_(agents),
      auditLog_(auditLog),
      resolver_(resolver),
      groups_(groups),
      clock_(clock),
      config_(config) {
    if (config_.shardCount == 0) {
        throw std::invalid_argument("shard count must be positive");
    }
    if (config_.maxCommandsPerReply == 0) {
        throw std::invalid_argument("max commands per reply must be positive");
    }
    for (std::size_t i = 0; i < config_.shardCount; ++i) {
        sessionShards_.push_back(std::make_unique<SessionShard>());
        ledgerShards_.push_back(std::make_unique<LedgerShard>());
    }
}

SessionHandler::SessionShard& SessionHandler::sessionShardFor(const Connection::ConnectionId& connId) const {
    return *sessionShards_[std::hash<std::string>{}(connId) % sessionShards_.size()];
}

SessionHandler::LedgerShard& SessionHandler::ledgerShardFor(const std::string& instanceId) const {
    return *ledgerShards_[std::hash<std::string>{}(instanceId) % ledgerShards_.size()];
}

ServerToAgent SessionHandler::rejection(const std::string& instanceId) {
    ServerToAgent reply;
    reply.instanceId = instanceId;
    reply.error = ServerErrorResponse{ServerErrorType::BadRequest, kBadRequestMessage};
    return reply;
}

Result<void> SessionHandler::onConnected(const Connection::ConnectionId& connId) {
    auto registered = registry_.registerConnection(connId, clock_.now());
    if (registered.has_error()) {
        AGENTFLEET_LOG_WARN("rejecting connection {}: {}", connId, registered.error().message);
        return registered;
    }

    SessionShard& shard = sessionShardFor(connId);
    std::lock_guard<std::mutex> lock(shard.mutex);
    shard.sessions[connId] = Session();

    AGENTFLEET_LOG_DEBUG("session {} connected", connId);
    return Result<void>();
}

ServerToAgent SessionHandler::onFrame(const Connection::ConnectionId& connId, const std::string& frame) {
    auto decoded = MessageCodec::decodeAgentToServer(frame);
    if (decoded.has_error()) {
        AGENTFLEET_LOG_WARN("malformed message on connection {}: {}", connId, decoded.error().message);
        bool known = false;
        {
            SessionShard& shard = sessionShardFor(connId);
            std::lock_guard<std::mutex> lock(shard.mutex);
            known = shard.sessions.count(connId) > 0;
        }
        if (known) {
            registry_.touch(connId, clock_.now());
        }
        return rejection("");
    }
    return onMessage(connId, decoded.value());
}

ServerToAgent SessionHandler::onMessage(const Connection::ConnectionId& connId, const AgentToServer& message) {
    auto now = clock_.now();
    SessionShard& shard = sessionShardFor(connId);

    Session session;
    {
        std::lock_guard<std::mutex> lock(shard.mutex);
        auto it = shard.sessions.find(connId);
        if (it == shard.sessions.end() || it->second.state == SessionState::Closed) {
            AGENTFLEET_LOG_WARN("message for unknown connection {}", connId);
            return rejection(message.instanceId);
        }
        session = it->second;
    }

    registry_.touch(connId, now);

    ServerToAgent reply;
    reply.instanceId = message.instanceId;

    if (message.sequenceNum && session.lastSequenceNum) {
        uint64_t seq = *message.sequenceNum;
        uint64_t last = *session.lastSequenceNum;
        if (seq <= last) {
            AGENTFLEET_LOG_DEBUG("ignoring duplicate sequence {} on connection {}", seq, connId);
            return reply;
        }
        if (seq > last + 1) {
            AGENTFLEET_LOG_INFO("sequence gap on connection {} ({} -> {}), requesting full state",
                                connId, last, seq);
            reply.flags |= ServerToAgent::kReportFullState;
        }
    }
    if (message.sequenceNum) {
        session.lastSequenceNum = message.sequenceNum;
    }

    if (session.state == SessionState::Connected) {
        if (message.description) {
            auto bound = registry_.bindInstance(connId, message.instanceId);
            if (bound.has_error()) {
                AGENTFLEET_LOG_WARN("cannot bind connection {} to {}: {}",
                                    connId, message.instanceId, bound.error().message);
                return rejection(message.instanceId);
            }
            session.state = SessionState::Identified;
            session.instanceId = message.instanceId;
            AGENTFLEET_LOG_INFO("connection {} identified as {}", connId, message.instanceId);
        } else {
            // Nothing is known about the agent yet.
            reply.flags |= ServerToAgent::kReportFullState;
        }
    } else if (session.instanceId != message.instanceId) {
        AGENTFLEET_LOG_WARN("connection {} is bound to {} but received a message for {}",
                            connId, session.instanceId.value_or(""), message.instanceId);
        return rejection(message.instanceId);
    }

    if (message.description) {
        session.identifyingAttributes = message.description->identifyingAttributes;
    }
    if (message.reportedConfigHash) {
        session.lastReportedConfigHash = message.reportedConfigHash;
    }

    {
        std::lock_guard<std::mutex> lock(shard.mutex);
        auto it = shard.sessions.find(connId);
        if (it == shard.sessions.end()) {
            // Closed while the message was in flight.
            return rejection(message.instanceId);
        }
        it->second = session;
    }

    if (session.state != SessionState::Identified) {
        return reply;
    }

    AgentGroupSnapshot snapshot = groups_.activeSnapshot();
    auto group = resolver_.resolve(session.identifyingAttributes, *snapshot);

    recordAgentReport(connId, message, group, now);
    recordAcknowledgements(*session.instanceId, message.acknowledgedCommandIds);
    reply.remoteConfig = effectiveConfig(group, session.lastReportedConfigHash);
    appendPendingCommands(*session.instanceId, reply);
    return reply;
}

void SessionHandler::onConnectionClosed(const Connection::ConnectionId& connId) {
    registry_.unregister(connId);

    std::optional<std::string> instanceId;
    {
        SessionShard& shard = sessionShardFor(connId);
        std::lock_guard<std::mutex> lock(shard.mutex);
        auto it = shard.sessions.find(connId);
        if (it == shard.sessions.end()) {
            return;
        }
        instanceId = it->second.instanceId;
        shard.sessions.erase(it);
    }

    if (instanceId) {
        agents_.markDisconnected(*instanceId, connId);
    }
    AGENTFLEET_LOG_DEBUG("session {} closed", connId);
}

Result<SessionState> SessionHandler::sessionState(const Connection::ConnectionId& connId) const {
    SessionShard& shard = sessionShardFor(connId);
    std::lock_guard<std::mutex> lock(shard.mutex);
    auto it = shard.sessions.find(connId);
    if (it == shard.sessions.end()) {
        return Error(ErrorCode::NotFound, "no session for connection " + connId);
    }
    return it->second.state;
}

DeliveryProgress SessionHandler::deliveryProgress(const std::string& instanceId) const {
    LedgerShard& shard = ledgerShardFor(instanceId);
    std::lock_guard<std::mutex> lock(shard.mutex);
    auto it = shard.ledgers.find(instanceId);
    if (it == shard.ledgers.end()) {
        return DeliveryProgress();
    }
    return DeliveryProgress{it->second.watermark, it->second.acknowledgedAhead.size()};
}

void SessionHandler::recordAgentReport(const Connection::ConnectionId& connId,
                                       const AgentToServer& message,
                                       const std::optional<AgentGroup>& group,
                                       utils::Clock::TimePoint now) {
    AgentReport report;
    report.instanceId = message.instanceId;
    report.connectionId = connId;
    report.description = message.description;
    report.reportedConfigHash = message.reportedConfigHash;
    if (group) {
        report.effectiveAgentGroup = group->name;
    }
    report.at = now;

    auto recorded = agents_.recordReport(report);
    if (recorded.has_error()) {
        AGENTFLEET_LOG_ERROR("cannot record report from {}: {}",
                             message.instanceId, recorded.error().message);
    }
}

void SessionHandler::recordAcknowledgements(const std::string& instanceId,
                                            const std::vector<std::string>& ids) {
    std::vector<std::string> keys;
    for (const auto& id : ids) {
        auto command = auditLog_.getCommand(id);
        if (command.has_error()) {
            AGENTFLEET_LOG_DEBUG("{} acknowledged unknown command {}", instanceId, id);
            continue;
        }
        if (command.value().targetInstanceId != instanceId) {
            AGENTFLEET_LOG_WARN("{} acknowledged command {} addressed to {}",
                                instanceId, id, command.value().targetInstanceId);
            continue;
        }
        keys.push_back(command.value().orderKey());
    }
    if (keys.empty()) {
        return;
    }

    LedgerShard& shard = ledgerShardFor(instanceId);
    std::lock_guard<std::mutex> lock(shard.mutex);
    auto& ledger = shard.ledgers[instanceId];
    for (auto& key : keys) {
        if (key > ledger.watermark) {
            ledger.acknowledgedAhead.insert(std::move(key));
        }
    }
}

std::optional<RemoteConfig> SessionHandler::effectiveConfig(
    const std::optional<AgentGroup>& group,
    const std::optional<std::string>& reportedHash) {
    if (!group || !group->remoteConfig) {
        return std::nullopt;
    }

    std::string hash = utils::sha256Hex(group->remoteConfig->body);
    if (reportedHash && *reportedHash == hash) {
        return std::nullopt;
    }
    return RemoteConfig{group->remoteConfig->body, group->remoteConfig->contentType, hash};
}

void SessionHandler::appendPendingCommands(const std::string& instanceId, ServerToAgent& reply) const {
    LedgerShard& shard = ledgerShardFor(instanceId);
    DeliveryLedger ledger;
    {
        std::lock_guard<std::mutex> lock(shard.mutex);
        auto it = shard.ledgers.find(instanceId);
        if (it != shard.ledgers.end()) {
            ledger = it->second;
        }
    }

    // Enough to fill a reply even if every acknowledged-ahead command comes first.
    std::size_t limit = config_.maxCommandsPerReply + ledger.acknowledgedAhead.size();
    auto commands = auditLog_.getCommandsByInstanceUidAfter(instanceId, ledger.watermark, limit);
    if (commands.has_error()) {
        AGENTFLEET_LOG_ERROR("cannot load commands for {}: {}", instanceId, commands.error().message);
        return;
    }

    std::string watermark = ledger.watermark;
    bool contiguous = true;
    for (const auto& command : commands.value()) {
        std::string key = command.orderKey();
        if (ledger.acknowledgedAhead.count(key) > 0) {
            if (contiguous) {
                watermark = key;
            }
            continue;
        }
        contiguous = false;
        if (reply.commands.size() >= config_.maxCommandsPerReply) {
            break;
        }
        reply.commands.push_back(CommandEntry{command.id, command.kind, command.data});
        if (command.kind == CommandKind::ReportFullState) {
            reply.flags |= ServerToAgent::kReportFullState;
        }
    }

    if (watermark == ledger.watermark) {
        return;
    }
    std::lock_guard<std::mutex> lock(shard.mutex);
    auto& stored = shard.ledgers[instanceId];
    if (watermark > stored.watermark) {
        stored.watermark = watermark;
        stored.acknowledgedAhead.erase(stored.acknowledgedAhead.begin(),
                                       stored.acknowledgedAhead.upper_bound(watermark));
    }
}

} // namespace core
} // namespace agentfleet
