#include "agentfleet/core/agent_group.hpp"
#include <limits>

namespace agentfleet {
namespace core {

namespace {
    constexpr std::size_t kMaxNameLength = 253;

    bool isNameChar(char c) {
        return (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '-' || c == '.';
    }

    bool isAlnum(char c) {
        return (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9');
    }

    int64_t toUnixNano(utils::Clock::TimePoint t) {
        return std::chrono::duration_cast<std::chrono::nanoseconds>(t.time_since_epoch()).count();
    }

    Result<Attributes> readAttributes(const nlohmann::json& parent, const char* field,
                                      const std::string& path) {
        Attributes attrs;
        auto it = parent.find(field);
        if (it == parent.end() || it->is_null()) {
            return attrs;
        }
        if (!it->is_object()) {
            return Error(ErrorCode::ValidationError, path + " must be an object");
        }
        for (auto entry = it->begin(); entry != it->end(); ++entry) {
            if (!entry.value().is_string()) {
                return Error(ErrorCode::ValidationError, path + "." + entry.key() + " must be a string");
            }
            attrs.emplace(entry.key(), entry.value().get<std::string>());
        }
        return attrs;
    }

    Result<void> validateKeys(const Attributes& attrs, const std::string& field) {
        for (const auto& entry : attrs) {
            if (entry.first.empty()) {
                return Error(ErrorCode::ValidationError, field + " contains an empty key");
            }
        }
        return Result<void>();
    }
}

const char* conditionTypeName(ConditionType type) {
    switch (type) {
        case ConditionType::Created: return "Created";
        case ConditionType::Updated: return "Updated";
        case ConditionType::Deleted: return "Deleted";
    }
    return "Unknown";
}

const char* conditionStatusName(ConditionStatus status) {
    switch (status) {
        case ConditionStatus::True: return "True";
        case ConditionStatus::False: return "False";
        case ConditionStatus::Unknown: return "Unknown";
    }
    return "Unknown";
}

AgentGroup AgentGroup::create(std::string name,
                              int priority,
                              AgentSelector selector,
                              std::optional<RemoteConfigPayload> remoteConfig,
                              utils::Clock::TimePoint createdAt,
                              const std::string& createdBy) {
    AgentGroup group;
    group.name = std::move(name);
    group.priority = priority;
    group.selector = std::move(selector);
    group.remoteConfig = std::move(remoteConfig);
    group.upsertCondition(Condition{ConditionType::Created, ConditionStatus::True, createdAt,
                                    createdBy, "Agent group created"});
    return group;
}

void AgentGroup::markDeleted(utils::Clock::TimePoint at, const std::string& by) {
    if (isDeleted()) {
        return;
    }
    lifecycle = DeletedLifecycle{at, by};
    upsertCondition(Condition{ConditionType::Deleted, ConditionStatus::True, at, by,
                              "Agent group deleted"});
}

void AgentGroup::upsertCondition(Condition condition) {
    ConditionType type = condition.type;
    conditions[type] = std::move(condition);
}

std::optional<utils::Clock::TimePoint> AgentGroup::createdAt() const {
    auto it = conditions.find(ConditionType::Created);
    if (it == conditions.end() || it->second.status != ConditionStatus::True) {
        return std::nullopt;
    }
    return it->second.lastTransitionTime;
}

std::string AgentGroup::createdBy() const {
    auto it = conditions.find(ConditionType::Created);
    if (it == conditions.end() || it->second.status != ConditionStatus::True) {
        return "";
    }
    return it->second.reason;
}

std::optional<utils::Clock::TimePoint> AgentGroup::deletedAt() const {
    if (const auto* deleted = std::get_if<DeletedLifecycle>(&lifecycle)) {
        return deleted->deletedAt;
    }
    return std::nullopt;
}

std::optional<std::string> AgentGroup::deletedBy() const {
    if (const auto* deleted = std::get_if<DeletedLifecycle>(&lifecycle)) {
        return deleted->deletedBy;
    }
    return std::nullopt;
}

Result<void> validateAgentGroup(const AgentGroup& group) {
    const std::string& name = group.name;
    if (name.empty() || name.size() > kMaxNameLength) {
        return Error(ErrorCode::ValidationError, "name must be 1-253 characters");
    }
    for (char c : name) {
        if (!isNameChar(c)) {
            return Error(ErrorCode::ValidationError,
                         "name may only contain lowercase letters, digits, '-' and '.'");
        }
    }
    if (!isAlnum(name.front()) || !isAlnum(name.back())) {
        return Error(ErrorCode::ValidationError, "name must start and end with a letter or digit");
    }
    if (group.priority < 0) {
        return Error(ErrorCode::ValidationError, "priority must not be negative");
    }

    auto checked = validateKeys(group.selector.identifyingAttributes, "selector.identifyingAttributes");
    if (checked.has_error()) return checked;
    checked = validateKeys(group.selector.nonIdentifyingAttributes, "selector.nonIdentifyingAttributes");
    if (checked.has_error()) return checked;
    return validateKeys(group.attributes, "attributes");
}

nlohmann::json agentGroupToJson(const AgentGroup& group) {
    nlohmann::json conditions = nlohmann::json::array();
    for (const auto& [type, condition] : group.conditions) {
        conditions.push_back({
            {"type", conditionTypeName(type)},
            {"status", conditionStatusName(condition.status)},
            {"lastTransitionTimeUnixNano", toUnixNano(condition.lastTransitionTime)},
            {"reason", condition.reason},
            {"message", condition.message}
        });
    }

    nlohmann::json j = {
        {"name", group.name},
        {"priority", group.priority},
        {"attributes", group.attributes},
        {"selector", {
            {"identifyingAttributes", group.selector.identifyingAttributes},
            {"nonIdentifyingAttributes", group.selector.nonIdentifyingAttributes}
        }},
        {"conditions", conditions}
    };

    if (group.remoteConfig) {
        j["remoteConfig"] = {
            {"body", group.remoteConfig->body},
            {"contentType", group.remoteConfig->contentType}
        };
    }
    if (const auto* deleted = std::get_if<DeletedLifecycle>(&group.lifecycle)) {
        j["deletedAtUnixNano"] = toUnixNano(deleted->deletedAt);
        j["deletedBy"] = deleted->deletedBy;
    }
    return j;
}

Result<AgentGroup> agentGroupFromJson(const nlohmann::json& j) {
    if (!j.is_object()) {
        return Error(ErrorCode::ValidationError, "agent group must be a JSON object");
    }

    AgentGroup group;

    auto name = j.find("name");
    if (name == j.end() || !name->is_string()) {
        return Error(ErrorCode::ValidationError, "name must be a string");
    }
    group.name = name->get<std::string>();

    auto priority = j.find("priority");
    if (priority != j.end() && !priority->is_null()) {
        if (!priority->is_number_integer()) {
            return Error(ErrorCode::ValidationError, "priority must be an integer");
        }
        auto value = priority->get<int64_t>();
        if (value < 0 || value > std::numeric_limits<int>::max()) {
            return Error(ErrorCode::ValidationError, "priority is out of range");
        }
        group.priority = static_cast<int>(value);
    }

    auto attributes = readAttributes(j, "attributes", "attributes");
    if (attributes.has_error()) {
        return attributes.error();
    }
    group.attributes = attributes.value();

    auto selector = j.find("selector");
    if (selector != j.end() && !selector->is_null()) {
        if (!selector->is_object()) {
            return Error(ErrorCode::ValidationError, "selector must be an object");
        }
        auto identifying = readAttributes(*selector, "identifyingAttributes",
                                          "selector.identifyingAttributes");
        if (identifying.has_error()) {
            return identifying.error();
        }
        auto nonIdentifying = readAttributes(*selector, "nonIdentifyingAttributes",
                                             "selector.nonIdentifyingAttributes");
        if (nonIdentifying.has_error()) {
            return nonIdentifying.error();
        }
        group.selector = AgentSelector{identifying.value(), nonIdentifying.value()};
    }

    auto config = j.find("remoteConfig");
    if (config != j.end() && !config->is_null()) {
        if (!config->is_object()) {
            return Error(ErrorCode::ValidationError, "remoteConfig must be an object");
        }
        auto body = config->find("body");
        if (body == config->end() || !body->is_string()) {
            return Error(ErrorCode::ValidationError, "remoteConfig.body must be a string");
        }
        RemoteConfigPayload payload;
        payload.body = body->get<std::string>();
        auto contentType = config->find("contentType");
        if (contentType != config->end() && !contentType->is_null()) {
            if (!contentType->is_string()) {
                return Error(ErrorCode::ValidationError, "remoteConfig.contentType must be a string");
            }
            payload.contentType = contentType->get<std::string>();
        }
        group.remoteConfig = payload;
    }

    return group;
}

} // namespace core
} // namespace agentfleet
