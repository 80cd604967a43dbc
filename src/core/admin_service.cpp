#include "agentfleet/core/admin_service.hpp"

namespace agentfleet {
namespace core {

namespace {
    constexpr int kStatusOk = 200;
    constexpr int kStatusCreated = 201;
    constexpr int kStatusNoContent = 204;

    template <typename T, typename ToJson>
    nlohmann::json listEnvelope(const ListResponse<T>& page, ToJson toJson) {
        nlohmann::json items = nlohmann::json::array();
        for (const auto& item : page.items) {
            items.push_back(toJson(item));
        }
        return nlohmann::json{
            {"items", items},
            {"continue", page.continueToken},
            {"remainingItemCount", page.remainingItemCount}
        };
    }

    int64_t toUnixNano(utils::Clock::TimePoint t) {
        return std::chrono::duration_cast<std::chrono::nanoseconds>(t.time_since_epoch()).count();
    }
}

nlohmann::json connectionToJson(const Connection& connection) {
    nlohmann::json j = {
        {"id", connection.id},
        {"instanceId", nullptr},
        {"lastCommunicatedAtUnixNano", toUnixNano(connection.lastCommunicatedAt)},
        {"alive", connection.alive}
    };
    if (connection.instanceId) {
        j["instanceId"] = *connection.instanceId;
    }
    return j;
}

nlohmann::json agentToJson(const Agent& agent) {
    nlohmann::json j = {
        {"instanceId", agent.instanceId},
        {"description", {
            {"identifyingAttributes", agent.description.identifyingAttributes},
            {"nonIdentifyingAttributes", agent.description.nonIdentifyingAttributes}
        }},
        {"reportedConfigHash", nullptr},
        {"effectiveAgentGroup", nullptr},
        {"connectionId", nullptr},
        {"connected", agent.connected()},
        {"firstSeenAtUnixNano", toUnixNano(agent.firstSeenAt)},
        {"lastReportedAtUnixNano", toUnixNano(agent.lastReportedAt)}
    };
    if (agent.reportedConfigHash) {
        j["reportedConfigHash"] = *agent.reportedConfigHash;
    }
    if (agent.effectiveAgentGroup) {
        j["effectiveAgentGroup"] = *agent.effectiveAgentGroup;
    }
    if (agent.connectionId) {
        j["connectionId"] = *agent.connectionId;
    }
    return j;
}

nlohmann::json agentGroupStatusToJson(const AgentGroupStatus& status) {
    return nlohmann::json{
        {"numAgents", status.numAgents},
        {"numConnectedAgents", status.numConnectedAgents},
        {"numHealthyAgents", status.numHealthyAgents},
        {"numUnhealthyAgents", status.numUnhealthyAgents},
        {"numNotConnectedAgents", status.numNotConnectedAgents}
    };
}

AdminService::AdminService(CommandAuditLog& auditLog,
                           const ConnectionRegistry& registry,
                           const AgentStore& agents,
                           AgentGroupStore& groups,
                           const SelectorResolver& resolver,
                           const utils::Clock& clock)
    : auditLog_(auditLog),
      registry_(registry),
      agents_(agents),
      groups_(groups),
      resolver_(resolver),
      clock_(clock) {}

AdminResponse AdminService::errorResponse(const Error& error) {
    return AdminResponse{utils::httpStatusFor(error.code),
                         nlohmann::json{{"error", utils::errorCodeName(error.code)},
                                        {"message", error.message}}};
}

AdminResponse AdminService::updateAgentConfig(const nlohmann::json& request) {
    if (!request.is_object()) {
        return errorResponse(Error(ErrorCode::ValidationError, "request must be a JSON object"));
    }
    auto target = request.find("targetInstanceId");
    if (target == request.end() || !target->is_string()) {
        return errorResponse(Error(ErrorCode::ValidationError, "targetInstanceId must be a string"));
    }
    auto remoteConfig = request.find("remoteConfig");
    if (remoteConfig == request.end() || remoteConfig->is_null()) {
        return errorResponse(Error(ErrorCode::ValidationError, "remoteConfig is required"));
    }

    nlohmann::json data = {{"remoteConfig", *remoteConfig}};
    auto saved = auditLog_.saveCommand(CommandKind::UpdateAgentConfig, target->get<std::string>(), data);
    if (saved.has_error()) {
        return errorResponse(saved.error());
    }
    return AdminResponse{kStatusCreated, commandToJson(saved.value())};
}

AdminResponse AdminService::issueCommand(const std::string& kind,
                                         const std::string& targetInstanceId,
                                         const nlohmann::json& data) {
    auto parsed = parseCommandKind(kind);
    if (parsed.has_error()) {
        return errorResponse(parsed.error());
    }
    auto saved = auditLog_.saveCommand(parsed.value(), targetInstanceId, data);
    if (saved.has_error()) {
        return errorResponse(saved.error());
    }
    return AdminResponse{kStatusCreated, commandToJson(saved.value())};
}

AdminResponse AdminService::getCommand(const std::string& id) const {
    auto command = auditLog_.getCommand(id);
    if (command.has_error()) {
        return errorResponse(command.error());
    }
    return AdminResponse{kStatusOk, commandToJson(command.value())};
}

AdminResponse AdminService::listCommands(const ListOptions& options) const {
    auto page = auditLog_.listCommands(options);
    if (page.has_error()) {
        return errorResponse(page.error());
    }
    return AdminResponse{kStatusOk, listEnvelope(page.value(), commandToJson)};
}

AdminResponse AdminService::listCommandsForInstance(const std::string& instanceId) const {
    auto commands = auditLog_.getCommandsByInstanceUid(instanceId);
    if (commands.has_error()) {
        return errorResponse(commands.error());
    }
    ListResponse<Command> page;
    page.items = commands.value();
    return AdminResponse{kStatusOk, listEnvelope(page, commandToJson)};
}

AdminResponse AdminService::listConnections(const ListOptions& options) const {
    auto page = registry_.list(options, clock_.now());
    if (page.has_error()) {
        return errorResponse(page.error());
    }
    return AdminResponse{kStatusOk, listEnvelope(page.value(), connectionToJson)};
}

AdminResponse AdminService::getConnection(const std::string& connId) const {
    auto connection = registry_.get(connId, clock_.now());
    if (connection.has_error()) {
        return errorResponse(connection.error());
    }
    return AdminResponse{kStatusOk, connectionToJson(connection.value())};
}

AdminResponse AdminService::getAgent(const std::string& instanceId) const {
    auto agent = agents_.getAgent(instanceId);
    if (agent.has_error()) {
        return errorResponse(agent.error());
    }
    return AdminResponse{kStatusOk, agentToJson(agent.value())};
}

AdminResponse AdminService::listAgents(const ListOptions& options) const {
    auto page = agents_.listAgents(options);
    if (page.has_error()) {
        return errorResponse(page.error());
    }
    return AdminResponse{kStatusOk, listEnvelope(page.value(), agentToJson)};
}

AdminResponse AdminService::listAgentsBySelector(const AgentSelector& selector,
                                                 const ListOptions& options) const {
    auto page = agents_.listAgentsBySelector(selector, options);
    if (page.has_error()) {
        return errorResponse(page.error());
    }
    return AdminResponse{kStatusOk, listEnvelope(page.value(), agentToJson)};
}

AdminResponse AdminService::listAgentsByAgentGroup(const std::string& name,
                                                   const ListOptions& options) const {
    auto group = groups_.getAgentGroup(name);
    if (group.has_error()) {
        return errorResponse(group.error());
    }
    return listAgentsBySelector(group.value().selector, options);
}

AdminResponse AdminService::createAgentGroup(const nlohmann::json& request, const std::string& actingUser) {
    auto parsed = agentGroupFromJson(request);
    if (parsed.has_error()) {
        return errorResponse(parsed.error());
    }
    const AgentGroup& input = parsed.value();

    AgentGroup group = AgentGroup::create(input.name, input.priority, input.selector,
                                          input.remoteConfig, clock_.now(), actingUser);
    group.attributes = input.attributes;

    auto created = groups_.createAgentGroup(group);
    if (created.has_error()) {
        return errorResponse(created.error());
    }
    return AdminResponse{kStatusCreated, agentGroupToJson(created.value())};
}

AdminResponse AdminService::updateAgentGroup(const std::string& name,
                                             const nlohmann::json& request,
                                             const std::string& actingUser) {
    auto parsed = agentGroupFromJson(request);
    if (parsed.has_error()) {
        return errorResponse(parsed.error());
    }
    if (parsed.value().name != name) {
        return errorResponse(Error(ErrorCode::ValidationError,
                                   "name in body does not match " + name));
    }

    auto updated = groups_.updateAgentGroup(parsed.value(), clock_.now(), actingUser);
    if (updated.has_error()) {
        return errorResponse(updated.error());
    }
    return AdminResponse{kStatusOk, agentGroupToJson(updated.value())};
}

AdminResponse AdminService::deleteAgentGroup(const std::string& name, const std::string& actingUser) {
    auto deleted = groups_.deleteAgentGroup(name, clock_.now(), actingUser);
    if (deleted.has_error()) {
        return errorResponse(deleted.error());
    }
    return AdminResponse{kStatusNoContent, nullptr};
}

AdminResponse AdminService::getAgentGroup(const std::string& name) const {
    auto group = groups_.getAgentGroup(name);
    if (group.has_error()) {
        return errorResponse(group.error());
    }
    auto members = agents_.listAgentsBySelector(group.value().selector, ListOptions());
    if (members.has_error()) {
        return errorResponse(members.error());
    }

    nlohmann::json body = agentGroupToJson(group.value());
    body["status"] = agentGroupStatusToJson(
        summarizeAgents(members.value().items, registry_, clock_.now()));
    return AdminResponse{kStatusOk, body};
}

AdminResponse AdminService::listAgentGroups(const ListOptions& options, bool includeDeleted) const {
    auto page = groups_.listAgentGroups(options, includeDeleted);
    if (page.has_error()) {
        return errorResponse(page.error());
    }
    return AdminResponse{kStatusOk, listEnvelope(page.value(), agentGroupToJson)};
}

AdminResponse AdminService::resolveAgentGroup(const Attributes& identifyingAttributes) const {
    AgentGroupSnapshot snapshot = groups_.activeSnapshot();
    auto group = resolver_.resolve(identifyingAttributes, *snapshot);
    if (!group) {
        return errorResponse(Error(ErrorCode::NotFound, "no agent group matches"));
    }
    return AdminResponse{kStatusOk, agentGroupToJson(*group)};
}

} // namespace core
} // namespace agentfleet
