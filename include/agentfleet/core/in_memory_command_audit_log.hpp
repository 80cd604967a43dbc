#ifndef AGENTFLEET_CORE_IN_MEMORY_COMMAND_AUDIT_LOG_HPP
#define AGENTFLEET_CORE_IN_MEMORY_COMMAND_AUDIT_LOG_HPP

#include <map>
#include <memory>
#include <shared_mutex>
#include <unordered_map>
#include <vector>
#include "agentfleet/core/command_audit_log.hpp"
#include "agentfleet/core/command_journal.hpp"
#include "agentfleet/core/pagination_cursor.hpp"
#include "agentfleet/utils/clock.hpp"

namespace agentfleet {
namespace core {

/**
 * @brief CommandAuditLog held in memory, optionally mirrored to a CommandJournal.
 *
 * Lookups by id and by target instance go through independently locked shards.
 * Saves are serialized only for the short step that assigns the id and the
 * creation timestamp and appends to the global ordered index; this is what
 * makes creation timestamps strictly increasing and pagination append-only.
 */
class InMemoryCommandAuditLog : public CommandAuditLog {
public:
    /**
     * @param clock Source of creation timestamps; must outlive the log
     * @param cursor Codec for list continuation tokens
     * @param shardCount Number of lock shards, must be positive
     */
    InMemoryCommandAuditLog(const utils::Clock& clock,
                            PaginationCursor cursor,
                            std::size_t shardCount = 16);
    ~InMemoryCommandAuditLog() override = default;

    // Prevent copying
    InMemoryCommandAuditLog(const InMemoryCommandAuditLog&) = delete;
    InMemoryCommandAuditLog& operator=(const InMemoryCommandAuditLog&) = delete;

    /**
     * @brief Creates a log backed by the journal at journalPath, replaying its contents.
     * @return StorageError if the journal cannot be replayed or opened
     */
    static Result<std::unique_ptr<InMemoryCommandAuditLog>> withJournal(
        const utils::Clock& clock,
        PaginationCursor cursor,
        std::size_t shardCount,
        const std::string& journalPath);

    Result<Command> saveCommand(CommandKind kind,
                                const std::string& targetInstanceId,
                                const nlohmann::json& data) override;
    Result<Command> getCommand(const std::string& id) const override;
    Result<std::vector<Command>> getCommandsByInstanceUid(const std::string& instanceId) const override;
    Result<std::vector<Command>> getCommandsByInstanceUidAfter(const std::string& instanceId,
                                                               const std::string& afterKey,
                                                               std::size_t limit) const override;
    Result<ListResponse<Command>> listCommands(const ListOptions& options) const override;

    std::size_t size() const;

private:
    using CommandPtr = std::shared_ptr<const Command>;

    struct IdShard {
        mutable std::shared_mutex mutex;
        std::unordered_map<std::string, CommandPtr> byId;
    };

    struct InstanceShard {
        mutable std::shared_mutex mutex;
        // Per instance, commands keyed by orderKey so iteration is creation order.
        std::unordered_map<std::string, std::map<std::string, CommandPtr>> byInstance;
    };

    IdShard& idShardFor(const std::string& id) const;
    InstanceShard& instanceShardFor(const std::string& instanceId) const;
    void index(const CommandPtr& command, const std::string& key);

    const utils::Clock& clock_;
    PaginationCursor cursor_;
    std::unique_ptr<CommandJournal> journal_;

    std::vector<std::unique_ptr<IdShard>> idShards_;
    std::vector<std::unique_ptr<InstanceShard>> instanceShards_;

    // Guards ordered_ and lastCreatedAt_; held by writers only for id/timestamp assignment.
    mutable std::shared_mutex orderMutex_;
    std::map<std::string, CommandPtr> ordered_;
    utils::Clock::TimePoint lastCreatedAt_{};
    bool hasLast_{false};
};

} // namespace core
} // namespace agentfleet

#endif // AGENTFLEET_CORE_IN_MEMORY_COMMAND_AUDIT_LOG_HPP
