#include "agentfleet/core/in_memory_command_audit_log.hpp"
#include "agentfleet/utils/logging.hpp"
#include "agentfleet/utils/uuid.hpp"
#include <functional>
#include <mutex>
#include <stdexcept>

namespace agentfleet {
namespace core {

namespace {
    // A UUIDv4 collision is astronomically unlikely; a few retries only guard a broken RNG.
    constexpr int kMaxIdAttempts = 4;
}

InMemoryCommandAuditLog::InMemoryCommandAuditLog(const utils::Clock& clock,
                                                 PaginationCursor cursor,
                                                 std::size_t shardCount)
    : clock_(clock), cursor_(std::move(cursor)) {
    if (shardCount == 0) {
        throw std::invalid_argument("shard count must be positive");
    }
    for (std::size_t i = 0; i < shardCount; ++i) {
        idShards_.push_back(std::make_unique<IdShard>());
        instanceShards_.push_back(std::make_unique<InstanceShard>());
    }
}

Result<std::unique_ptr<InMemoryCommandAuditLog>> InMemoryCommandAuditLog::withJournal(
    const utils::Clock& clock,
    PaginationCursor cursor,
    std::size_t shardCount,
    const std::string& journalPath) {
    auto log = std::make_unique<InMemoryCommandAuditLog>(clock, std::move(cursor), shardCount);
    auto journal = std::make_unique<CommandJournal>(journalPath);

    auto replayed = journal->replay();
    if (replayed.has_error()) {
        return replayed.error();
    }
    for (const auto& command : replayed.value()) {
        auto ptr = std::make_shared<const Command>(command);
        std::string key = ptr->orderKey();
        if (!log->ordered_.emplace(key, ptr).second) {
            return Error(ErrorCode::StorageError, "duplicate command " + command.id + " in journal");
        }
        log->index(ptr, key);
        if (!log->hasLast_ || command.createdAt > log->lastCreatedAt_) {
            log->lastCreatedAt_ = command.createdAt;
            log->hasLast_ = true;
        }
    }

    auto opened = journal->open();
    if (opened.has_error()) {
        return opened.error();
    }
    log->journal_ = std::move(journal);
    return log;
}

InMemoryCommandAuditLog::IdShard& InMemoryCommandAuditLog::idShardFor(const std::string& id) const {
    return *idShards_[std::hash<std::string>{}(id) % idShards_.size()];
}

InMemoryCommandAuditLog::InstanceShard& InMemoryCommandAuditLog::instanceShardFor(
    const std::string& instanceId) const {
    return *instanceShards_[std::hash<std::string>{}(instanceId) % instanceShards_.size()];
}

void InMemoryCommandAuditLog::index(const CommandPtr& command, const std::string& key) {
    {
        IdShard& shard = idShardFor(command->id);
        std::unique_lock<std::shared_mutex> lock(shard.mutex);
        shard.byId.emplace(command->id, command);
    }
    {
        InstanceShard& shard = instanceShardFor(command->targetInstanceId);
        std::unique_lock<std::shared_mutex> lock(shard.mutex);
        shard.byInstance[command->targetInstanceId].emplace(key, command);
    }
}

Result<Command> InMemoryCommandAuditLog::saveCommand(CommandKind kind,
                                                     const std::string& targetInstanceId,
                                                     const nlohmann::json& data) {
    if (targetInstanceId.empty()) {
        return Error(ErrorCode::ValidationError, "target instance id must not be empty");
    }
    auto valid = validateCommandData(data);
    if (valid.has_error()) {
        return valid.error();
    }

    CommandPtr stored;
    std::string key;
    {
        std::unique_lock<std::shared_mutex> orderLock(orderMutex_);

        auto command = std::make_shared<Command>();
        command->kind = kind;
        command->targetInstanceId = targetInstanceId;
        command->data = data.is_null() ? nlohmann::json::object() : data;

        auto now = clock_.now();
        if (hasLast_ && now <= lastCreatedAt_) {
            now = lastCreatedAt_ + utils::Clock::Duration(1);
        }
        command->createdAt = now;

        // Every save holds orderLock, so an id seen as free here stays free until inserted.
        for (int attempt = 0; attempt < kMaxIdAttempts && command->id.empty(); ++attempt) {
            std::string id = utils::generateUuid();
            IdShard& shard = idShardFor(id);
            std::shared_lock<std::shared_mutex> lock(shard.mutex);
            if (shard.byId.find(id) == shard.byId.end()) {
                command->id = id;
            }
        }
        if (command->id.empty()) {
            return Error(ErrorCode::StorageError, "could not allocate a unique command id");
        }

        if (journal_) {
            auto appended = journal_->append(*command);
            if (appended.has_error()) {
                AGENTFLEET_LOG_ERROR("failed to journal command for {}: {}",
                                     targetInstanceId, appended.error().message);
                return appended.error();
            }
        }

        stored = command;
        key = stored->orderKey();
        {
            IdShard& shard = idShardFor(stored->id);
            std::unique_lock<std::shared_mutex> lock(shard.mutex);
            shard.byId.emplace(stored->id, stored);
        }
        ordered_.emplace(key, stored);
        lastCreatedAt_ = stored->createdAt;
        hasLast_ = true;

        // Indexed under orderLock so per-instance readers never see a later key before an earlier one.
        InstanceShard& shard = instanceShardFor(stored->targetInstanceId);
        std::unique_lock<std::shared_mutex> lock(shard.mutex);
        shard.byInstance[stored->targetInstanceId].emplace(key, stored);
    }

    AGENTFLEET_LOG_INFO("saved command {} ({}) for instance {}",
                        stored->id, commandKindName(kind), targetInstanceId);
    return *stored;
}

Result<Command> InMemoryCommandAuditLog::getCommand(const std::string& id) const {
    IdShard& shard = idShardFor(id);
    std::shared_lock<std::shared_mutex> lock(shard.mutex);
    auto it = shard.byId.find(id);
    if (it == shard.byId.end()) {
        return Error(ErrorCode::NotFound, "command " + id + " not found");
    }
    return *it->second;
}

Result<std::vector<Command>> InMemoryCommandAuditLog::getCommandsByInstanceUid(
    const std::string& instanceId) const {
    std::vector<Command> commands;
    InstanceShard& shard = instanceShardFor(instanceId);
    std::shared_lock<std::shared_mutex> lock(shard.mutex);
    auto it = shard.byInstance.find(instanceId);
    if (it != shard.byInstance.end()) {
        commands.reserve(it->second.size());
        for (const auto& entry : it->second) {
            commands.push_back(*entry.second);
        }
    }
    return commands;
}

Result<std::vector<Command>> InMemoryCommandAuditLog::getCommandsByInstanceUidAfter(
    const std::string& instanceId,
    const std::string& afterKey,
    std::size_t limit) const {
    std::vector<Command> commands;
    InstanceShard& shard = instanceShardFor(instanceId);
    std::shared_lock<std::shared_mutex> lock(shard.mutex);
    auto it = shard.byInstance.find(instanceId);
    if (it == shard.byInstance.end()) {
        return commands;
    }
    for (auto entry = it->second.upper_bound(afterKey);
         entry != it->second.end() && commands.size() < limit; ++entry) {
        commands.push_back(*entry->second);
    }
    return commands;
}

Result<ListResponse<Command>> InMemoryCommandAuditLog::listCommands(const ListOptions& options) const {
    using Keyed = std::pair<std::string, CommandPtr>;
    std::vector<Keyed> snapshot;
    {
        std::shared_lock<std::shared_mutex> lock(orderMutex_);
        snapshot.assign(ordered_.begin(), ordered_.end());
    }

    auto page = paginate(snapshot, [](const Keyed& k) -> const std::string& { return k.first; },
                         options, cursor_);
    if (page.has_error()) {
        return page.error();
    }

    ListResponse<Command> response;
    response.items.reserve(page.value().items.size());
    for (const auto& keyed : page.value().items) {
        response.items.push_back(*keyed.second);
    }
    response.continueToken = page.value().continueToken;
    response.remainingItemCount = page.value().remainingItemCount;
    return response;
}

std::size_t InMemoryCommandAuditLog::size() const {
    std::shared_lock<std::shared_mutex> lock(orderMutex_);
    return ordered_.size();
}

} // namespace core
} // namespace agentfleet
