#include "agentfleet/core/message_codec.hpp"

namespace agentfleet {
namespace core {

namespace {
    using nlohmann::json;

    Error protocolError(const std::string& what) {
        return Error(ErrorCode::ProtocolError, what);
    }

    // Invalid UTF-8 handed in by local callers is replaced with U+FFFD instead of throwing.
    std::string dumpFrame(const json& j) {
        return j.dump(-1, ' ', false, json::error_handler_t::replace);
    }

    Result<Attributes> readAttributes(const json& j, const char* field) {
        Attributes attrs;
        auto it = j.find(field);
        if (it == j.end() || it->is_null()) {
            return attrs;
        }
        if (!it->is_object()) {
            return protocolError(std::string(field) + " must be an object");
        }
        for (auto entry = it->begin(); entry != it->end(); ++entry) {
            if (!entry.value().is_string()) {
                return protocolError(std::string(field) + "." + entry.key() + " must be a string");
            }
            attrs.emplace(entry.key(), entry.value().get<std::string>());
        }
        return attrs;
    }

    Result<std::optional<std::string>> readOptionalString(const json& j, const char* field) {
        auto it = j.find(field);
        if (it == j.end() || it->is_null()) {
            return std::optional<std::string>();
        }
        if (!it->is_string()) {
            return protocolError(std::string(field) + " must be a string");
        }
        return std::optional<std::string>(it->get<std::string>());
    }

    Result<json> parseObject(const std::string& frame) {
        json j = json::parse(frame, nullptr, false);
        if (j.is_discarded()) {
            return protocolError("frame is not valid JSON");
        }
        if (!j.is_object()) {
            return protocolError("frame must be a JSON object");
        }
        return j;
    }

    Result<ServerErrorType> parseServerErrorType(const std::string& name) {
        if (name == "BadRequest") return ServerErrorType::BadRequest;
        if (name == "Unavailable") return ServerErrorType::Unavailable;
        return protocolError("unknown error type: " + name);
    }
}

const char* serverErrorTypeName(ServerErrorType type) {
    switch (type) {
        case ServerErrorType::BadRequest: return "BadRequest";
        case ServerErrorType::Unavailable: return "Unavailable";
    }
    return "Unknown";
}

Result<AgentToServer> MessageCodec::decodeAgentToServer(const std::string& frame) {
    auto parsed = parseObject(frame);
    if (parsed.has_error()) {
        return parsed.error();
    }
    const json& j = parsed.value();

    AgentToServer message;

    auto instance = j.find("instanceId");
    if (instance == j.end() || !instance->is_string() || instance->get<std::string>().empty()) {
        return protocolError("instanceId must be a non-empty string");
    }
    message.instanceId = instance->get<std::string>();

    auto description = j.find("agentDescription");
    if (description != j.end() && !description->is_null()) {
        if (!description->is_object()) {
            return protocolError("agentDescription must be an object");
        }
        auto identifying = readAttributes(*description, "identifyingAttributes");
        if (identifying.has_error()) {
            return identifying.error();
        }
        auto nonIdentifying = readAttributes(*description, "nonIdentifyingAttributes");
        if (nonIdentifying.has_error()) {
            return nonIdentifying.error();
        }
        message.description = AgentDescription{identifying.value(), nonIdentifying.value()};
    }

    auto hash = readOptionalString(j, "reportedConfigHash");
    if (hash.has_error()) {
        return hash.error();
    }
    message.reportedConfigHash = hash.value();

    auto seq = j.find("sequenceNum");
    if (seq != j.end() && !seq->is_null()) {
        if (!seq->is_number_unsigned()) {
            return protocolError("sequenceNum must be a non-negative integer");
        }
        message.sequenceNum = seq->get<uint64_t>();
    }

    auto acks = j.find("acknowledgedCommandIds");
    if (acks != j.end() && !acks->is_null()) {
        if (!acks->is_array()) {
            return protocolError("acknowledgedCommandIds must be an array");
        }
        for (const auto& id : *acks) {
            if (!id.is_string()) {
                return protocolError("acknowledgedCommandIds must contain strings");
            }
            message.acknowledgedCommandIds.push_back(id.get<std::string>());
        }
    }

    return message;
}

std::string MessageCodec::encodeAgentToServer(const AgentToServer& message) {
    json j = {{"instanceId", message.instanceId}};
    if (message.description) {
        j["agentDescription"] = {
            {"identifyingAttributes", message.description->identifyingAttributes},
            {"nonIdentifyingAttributes", message.description->nonIdentifyingAttributes}
        };
    }
    if (message.reportedConfigHash) {
        j["reportedConfigHash"] = *message.reportedConfigHash;
    }
    if (message.sequenceNum) {
        j["sequenceNum"] = *message.sequenceNum;
    }
    if (!message.acknowledgedCommandIds.empty()) {
        j["acknowledgedCommandIds"] = message.acknowledgedCommandIds;
    }
    return dumpFrame(j);
}

Result<ServerToAgent> MessageCodec::decodeServerToAgent(const std::string& frame) {
    auto parsed = parseObject(frame);
    if (parsed.has_error()) {
        return parsed.error();
    }
    const json& j = parsed.value();

    ServerToAgent message;

    auto instance = readOptionalString(j, "instanceId");
    if (instance.has_error()) {
        return instance.error();
    }
    message.instanceId = instance.value().value_or("");

    auto config = j.find("remoteConfig");
    if (config != j.end() && !config->is_null()) {
        if (!config->is_object()) {
            return protocolError("remoteConfig must be an object");
        }
        auto body = readOptionalString(*config, "body");
        auto contentType = readOptionalString(*config, "contentType");
        auto configHash = readOptionalString(*config, "configHash");
        if (body.has_error() || contentType.has_error() || configHash.has_error()) {
            return protocolError("remoteConfig fields must be strings");
        }
        RemoteConfig remote;
        remote.body = body.value().value_or("");
        remote.contentType = contentType.value().value_or("");
        remote.configHash = configHash.value().value_or("");
        message.remoteConfig = remote;
    }

    auto commands = j.find("commands");
    if (commands != j.end() && !commands->is_null()) {
        if (!commands->is_array()) {
            return protocolError("commands must be an array");
        }
        for (const auto& entry : *commands) {
            if (!entry.is_object()) {
                return protocolError("command entries must be objects");
            }
            auto id = readOptionalString(entry, "id");
            auto kind = readOptionalString(entry, "kind");
            if (id.has_error() || kind.has_error() || !id.value() || !kind.value()) {
                return protocolError("command entries need id and kind");
            }
            auto parsedKind = parseCommandKind(*kind.value());
            if (parsedKind.has_error()) {
                return protocolError(parsedKind.error().message);
            }
            message.commands.push_back(CommandEntry{*id.value(), parsedKind.value(),
                                                    entry.value("data", json::object())});
        }
    }

    auto error = j.find("errorResponse");
    if (error != j.end() && !error->is_null()) {
        if (!error->is_object()) {
            return protocolError("errorResponse must be an object");
        }
        auto type = readOptionalString(*error, "type");
        auto text = readOptionalString(*error, "message");
        if (type.has_error() || text.has_error() || !type.value()) {
            return protocolError("errorResponse needs a type");
        }
        auto parsedType = parseServerErrorType(*type.value());
        if (parsedType.has_error()) {
            return parsedType.error();
        }
        message.error = ServerErrorResponse{parsedType.value(), text.value().value_or("")};
    }

    auto flags = j.find("flags");
    if (flags != j.end() && !flags->is_null()) {
        if (!flags->is_number_unsigned()) {
            return protocolError("flags must be a non-negative integer");
        }
        message.flags = flags->get<uint32_t>();
    }

    return message;
}

std::string MessageCodec::encodeServerToAgent(const ServerToAgent& message) {
    json j = {{"instanceId", message.instanceId}, {"flags", message.flags}};
    if (message.remoteConfig) {
        j["remoteConfig"] = {
            {"body", message.remoteConfig->body},
            {"contentType", message.remoteConfig->contentType},
            {"configHash", message.remoteConfig->configHash}
        };
    }
    if (!message.commands.empty()) {
        json commands = json::array();
        for (const auto& entry : message.commands) {
            commands.push_back({
                {"id", entry.id},
                {"kind", commandKindName(entry.kind)},
                {"data", entry.data}
            });
        }
        j["commands"] = commands;
    }
    if (message.error) {
        j["errorResponse"] = {
            {"type", serverErrorTypeName(message.error->type)},
            {"message", message.error->message}
        };
    }
    return dumpFrame(j);
}

} // namespace core
} // namespace agentfleet
