#include "agentfleet/core/admin_service.hpp"
#include "agentfleet/core/agent_group_store.hpp"
#include "agentfleet/core/in_memory_command_audit_log.hpp"
#include "agentfleet/core/message_codec.hpp"
#include "agentfleet/core/selector_resolver.hpp"
#include "agentfleet/core/session_handler.hpp"
#include "agentfleet/core/sharded_agent_store.hpp"
#include "agentfleet/core/sharded_connection_registry.hpp"
#include <iostream>

using namespace agentfleet;
using namespace agentfleet::core;

int main() {
    utils::SystemClock clock;
    PaginationCursor cursor = PaginationCursor::withRandomSecret();

    ShardedConnectionRegistry registry(std::chrono::seconds(60), cursor);
    ShardedAgentStore agents(cursor);
    InMemoryCommandAuditLog auditLog(clock, cursor);
    InMemoryAgentGroupStore groups(cursor);
    PrioritySelectorResolver resolver;
    SessionHandler handler(registry, agents, auditLog, resolver, groups, clock);
    AdminService admin(auditLog, registry, agents, groups, resolver, clock);

    // An operator creates a group for production collectors
    auto created = admin.createAgentGroup({
        {"name", "prod-collectors"},
        {"priority", 5},
        {"selector", {{"identifyingAttributes", {{"env", "prod"}}}}},
        {"remoteConfig", {{"body", "receivers: [otlp]\n"}}}
    }, "admin");
    std::cout << "create group: " << created.status << "\n";

    // An agent connects and describes itself
    auto connected = handler.onConnected("conn-1");
    if (connected.has_error()) {
        std::cerr << "connect failed: " << connected.error().message << "\n";
        return 1;
    }

    AgentToServer hello;
    hello.instanceId = "agent-1";
    hello.description = AgentDescription{{{"env", "prod"}}, {{"host.name", "node-a"}}};
    hello.sequenceNum = 1;

    ServerToAgent reply = handler.onMessage("conn-1", hello);
    std::cout << "first reply: " << MessageCodec::encodeServerToAgent(reply) << "\n";

    // Queue a restart and poll again, reporting the applied configuration
    auto issued = admin.issueCommand("Restart", "agent-1", nlohmann::json::object());
    std::cout << "issue command: " << issued.status << "\n";

    AgentToServer poll;
    poll.instanceId = "agent-1";
    poll.sequenceNum = 2;
    if (reply.remoteConfig) {
        poll.reportedConfigHash = reply.remoteConfig->configHash;
    }
    reply = handler.onMessage("conn-1", poll);
    std::cout << "second reply: " << MessageCodec::encodeServerToAgent(reply) << "\n";

    std::cout << "connections: " << admin.listConnections(ListOptions{}).body.dump(2) << "\n";
    std::cout << "group members: " << admin.listAgentsByAgentGroup("prod-collectors", ListOptions{}).body.dump(2) << "\n";

    handler.onConnectionClosed("conn-1");
    std::cout << "group status: " << admin.getAgentGroup("prod-collectors").body["status"].dump() << "\n";
    return 0;
}
