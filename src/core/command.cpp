#include "agentfleet/core/command.hpp"
#include <cstdio>

namespace agentfleet {
namespace core {

const char* commandKindName(CommandKind kind) {
    switch (kind) {
        case CommandKind::UpdateAgentConfig:
            return "UpdateAgentConfig";
        case CommandKind::ReportFullState:
            return "ReportFullState";
        case CommandKind::Restart:
            return "Restart";
    }
    return "Unknown";
}

Result<CommandKind> parseCommandKind(const std::string& name) {
    if (name == "UpdateAgentConfig") return CommandKind::UpdateAgentConfig;
    if (name == "ReportFullState") return CommandKind::ReportFullState;
    if (name == "Restart") return CommandKind::Restart;
    return Error(ErrorCode::ValidationError, "unknown command kind: " + name);
}

std::string Command::orderKey() const {
    // Nanoseconds since epoch, zero padded so that string order equals numeric order.
    auto nanos = std::chrono::duration_cast<std::chrono::nanoseconds>(
        createdAt.time_since_epoch()).count();
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%020lld", static_cast<long long>(nanos));
    return std::string(buf) + "/" + id;
}

nlohmann::json commandToJson(const Command& command) {
    auto nanos = std::chrono::duration_cast<std::chrono::nanoseconds>(
        command.createdAt.time_since_epoch()).count();
    return nlohmann::json{
        {"id", command.id},
        {"kind", commandKindName(command.kind)},
        {"targetInstanceId", command.targetInstanceId},
        {"data", command.data},
        {"createdAtUnixNano", static_cast<int64_t>(nanos)}
    };
}

Result<void> validateCommandData(const nlohmann::json& data) {
    if (!data.is_null() && !data.is_object()) {
        return Error(ErrorCode::ValidationError, "command data must be a JSON object");
    }
    try {
        // dump() walks the whole tree and throws on the first invalid UTF-8 string.
        data.dump();
    } catch (const nlohmann::json::type_error& e) {
        return Error(ErrorCode::ValidationError, std::string("command data is not valid UTF-8: ") + e.what());
    }
    return Result<void>();
}

Result<Command> commandFromJson(const nlohmann::json& j) {
    if (!j.is_object()) {
        return Error(ErrorCode::ValidationError, "command must be a JSON object");
    }
    auto stringField = [&j](const char* key) -> const nlohmann::json* {
        auto it = j.find(key);
        if (it == j.end() || !it->is_string()) {
            return nullptr;
        }
        return &*it;
    };

    const auto* id = stringField("id");
    const auto* kind = stringField("kind");
    const auto* target = stringField("targetInstanceId");
    auto created = j.find("createdAtUnixNano");
    if (!id || !kind || !target || created == j.end() || !created->is_number_integer()) {
        return Error(ErrorCode::ValidationError, "command is missing required fields");
    }

    auto parsedKind = parseCommandKind(kind->get<std::string>());
    if (parsedKind.has_error()) {
        return parsedKind.error();
    }

    Command command;
    command.id = id->get<std::string>();
    command.kind = parsedKind.value();
    command.targetInstanceId = target->get<std::string>();
    command.data = j.value("data", nlohmann::json::object());
    command.createdAt = utils::Clock::TimePoint(std::chrono::duration_cast<utils::Clock::Duration>(
        std::chrono::nanoseconds(created->get<int64_t>())));
    return command;
}

} // namespace core
} // namespace agentfleet
