#pragma once

#include <gmock/gmock.h>
#include "agentfleet/core/command_audit_log.hpp"

namespace agentfleet {
namespace core {

class MockCommandAuditLog : public CommandAuditLog {
public:
    MOCK_METHOD(Result<Command>, saveCommand,
                (CommandKind kind, const std::string& targetInstanceId, const nlohmann::json& data),
                (override));
    MOCK_METHOD(Result<Command>, getCommand, (const std::string& id), (const, override));
    MOCK_METHOD(Result<std::vector<Command>>, getCommandsByInstanceUid,
                (const std::string& instanceId), (const, override));
    MOCK_METHOD(Result<std::vector<Command>>, getCommandsByInstanceUidAfter,
                (const std::string& instanceId, const std::string& afterKey, std::size_t limit),
                (const, override));
    MOCK_METHOD(Result<ListResponse<Command>>, listCommands, (const ListOptions& options),
                (const, override));
};

} // namespace core
} // namespace agentfleet
