#ifndef AGENTFLEET_CORE_AGENT_GROUP_HPP
#define AGENTFLEET_CORE_AGENT_GROUP_HPP

#include <map>
#include <optional>
#include <string>
#include <variant>
#include <nlohmann/json.hpp>
#include "agentfleet/utils/clock.hpp"
#include "agentfleet/utils/result.hpp"

namespace agentfleet {
namespace core {

using Attributes = std::map<std::string, std::string>;

/**
 * @brief Attribute-equality criteria used to pick agents for a group.
 *
 * Only identifyingAttributes take part in matching; nonIdentifyingAttributes
 * are kept for operators to display and filter on.
 */
struct AgentSelector {
    Attributes identifyingAttributes;
    Attributes nonIdentifyingAttributes;
};

/**
 * @brief Configuration body pushed to agents of a group.
 */
struct RemoteConfigPayload {
    std::string body;
    std::string contentType{"text/yaml"};
};

enum class ConditionType {
    Created,
    Updated,
    Deleted
};

enum class ConditionStatus {
    True,
    False,
    Unknown
};

const char* conditionTypeName(ConditionType type);
const char* conditionStatusName(ConditionStatus status);

struct Condition {
    ConditionType type{ConditionType::Created};
    ConditionStatus status{ConditionStatus::Unknown};
    utils::Clock::TimePoint lastTransitionTime{};
    std::string reason;   ///< User or system that triggered the transition
    std::string message;
};

struct ActiveLifecycle {};

struct DeletedLifecycle {
    utils::Clock::TimePoint deletedAt{};
    std::string deletedBy;
};

using AgentGroupLifecycle = std::variant<ActiveLifecycle, DeletedLifecycle>;

/**
 * @brief Named policy object that matches agents and supplies their configuration.
 *
 * Deleted groups stay addressable by name but never take part in matching.
 */
struct AgentGroup {
    std::string name;
    int priority{0};  ///< Higher wins when several groups match
    Attributes attributes;
    AgentSelector selector;
    std::optional<RemoteConfigPayload> remoteConfig;
    std::map<ConditionType, Condition> conditions;
    AgentGroupLifecycle lifecycle{ActiveLifecycle{}};

    static AgentGroup create(std::string name,
                             int priority,
                             AgentSelector selector,
                             std::optional<RemoteConfigPayload> remoteConfig,
                             utils::Clock::TimePoint createdAt,
                             const std::string& createdBy);

    bool isDeleted() const { return std::holds_alternative<DeletedLifecycle>(lifecycle); }

    /**
     * @brief Tombstones the group. A group that is already deleted keeps its first stamp.
     */
    void markDeleted(utils::Clock::TimePoint deletedAt, const std::string& deletedBy);

    // Replaces any existing condition of the same type.
    void upsertCondition(Condition condition);

    std::optional<utils::Clock::TimePoint> createdAt() const;
    std::string createdBy() const;
    std::optional<utils::Clock::TimePoint> deletedAt() const;
    std::optional<std::string> deletedBy() const;
};

/**
 * @return ValidationError describing the first invalid field
 */
Result<void> validateAgentGroup(const AgentGroup& group);

nlohmann::json agentGroupToJson(const AgentGroup& group);

/**
 * @brief Reads the user-settable fields of a group from a request body.
 *
 * Conditions and lifecycle are never taken from input; the result is active
 * and has no conditions.
 *
 * @return ValidationError for missing or mistyped fields
 */
Result<AgentGroup> agentGroupFromJson(const nlohmann::json& j);

} // namespace core
} // namespace agentfleet

#endif // AGENTFLEET_CORE_AGENT_GROUP_HPP
