#include <gtest/gtest.h>
#include "agentfleet/core/admin_service.hpp"
#include "agentfleet/core/in_memory_command_audit_log.hpp"
#include "agentfleet/core/sharded_agent_store.hpp"
#include "agentfleet/core/sharded_connection_registry.hpp"

using namespace agentfleet;
using namespace agentfleet::core;

class AdminServiceTest : public ::testing::Test {
protected:
    nlohmann::json prodGroup(int priority = 5) {
        return {
            {"name", "prod"},
            {"priority", priority},
            {"attributes", {{"owner", "platform"}}},
            {"selector", {{"identifyingAttributes", {{"env", "prod"}}}}},
            {"remoteConfig", {{"body", "a: 1"}}}
        };
    }

    utils::ManualClock clock{utils::Clock::TimePoint(std::chrono::seconds(1700000000))};
    PaginationCursor cursor{utils::Bytes(32, 0x61)};
    void reportAgent(const std::string& instanceId, const std::string& connId,
                     Attributes identifying, Attributes nonIdentifying) {
        ASSERT_TRUE(registry.registerConnection(connId, clock.now()).has_value());
        AgentReport report;
        report.instanceId = instanceId;
        report.connectionId = connId;
        report.description = AgentDescription{std::move(identifying), std::move(nonIdentifying)};
        report.at = clock.now();
        ASSERT_TRUE(agents.recordReport(report).has_value());
    }

    ShardedConnectionRegistry registry{std::chrono::seconds(60), cursor, 4};
    ShardedAgentStore agents{cursor, 4};
    InMemoryCommandAuditLog auditLog{clock, cursor, 4};
    InMemoryAgentGroupStore groups{cursor};
    PrioritySelectorResolver resolver;
    AdminService admin{auditLog, registry, agents, groups, resolver, clock};
};

TEST_F(AdminServiceTest, UpdateAgentConfigQueuesCommand) {
    AdminResponse response = admin.updateAgentConfig({
        {"targetInstanceId", "agent-1"},
        {"remoteConfig", {{"body", "x: 1"}}}
    });
    ASSERT_EQ(response.status, 201);
    EXPECT_EQ(response.body["kind"], "UpdateAgentConfig");
    EXPECT_EQ(response.body["data"]["remoteConfig"]["body"], "x: 1");

    std::string id = response.body["id"].get<std::string>();
    AdminResponse fetched = admin.getCommand(id);
    EXPECT_EQ(fetched.status, 200);
    EXPECT_EQ(fetched.body["targetInstanceId"], "agent-1");
}

TEST_F(AdminServiceTest, UpdateAgentConfigValidatesRequest) {
    EXPECT_EQ(admin.updateAgentConfig({{"remoteConfig", "x"}}).status, 400);
    EXPECT_EQ(admin.updateAgentConfig({{"targetInstanceId", "agent-1"}}).status, 400);
    EXPECT_EQ(admin.updateAgentConfig(nlohmann::json::array()).status, 400);
}

TEST_F(AdminServiceTest, ErrorsMapToHttpStatus) {
    AdminResponse missing = admin.getCommand("nope");
    EXPECT_EQ(missing.status, 404);
    EXPECT_EQ(missing.body["error"], "NotFound");
    EXPECT_TRUE(missing.body["message"].is_string());

    EXPECT_EQ(admin.issueCommand("Explode", "agent-1", nullptr).status, 400);
    EXPECT_EQ(admin.listCommands(ListOptions{5, "garbage"}).status, 400);
    EXPECT_EQ(admin.listCommands(ListOptions{-1, ""}).status, 400);
    EXPECT_EQ(admin.getConnection("nope").status, 404);
}

TEST_F(AdminServiceTest, ListEnvelopeShape) {
    for (int i = 0; i < 3; ++i) {
        ASSERT_EQ(admin.issueCommand("Restart", "agent-1", nullptr).status, 201);
    }

    AdminResponse page = admin.listCommands(ListOptions{2, ""});
    ASSERT_EQ(page.status, 200);
    EXPECT_EQ(page.body["items"].size(), 2u);
    EXPECT_EQ(page.body["remainingItemCount"], 1);
    ASSERT_TRUE(page.body["continue"].is_string());

    AdminResponse rest = admin.listCommands(ListOptions{2, page.body["continue"].get<std::string>()});
    ASSERT_EQ(rest.status, 200);
    EXPECT_EQ(rest.body["items"].size(), 1u);
    EXPECT_EQ(rest.body["continue"], "");

    AdminResponse byInstance = admin.listCommandsForInstance("agent-1");
    EXPECT_EQ(byInstance.body["items"].size(), 3u);
    EXPECT_EQ(byInstance.body["remainingItemCount"], 0);
}

TEST_F(AdminServiceTest, ConnectionsReportLiveness) {
    ASSERT_TRUE(registry.registerConnection("c1", clock.now()).has_value());
    ASSERT_TRUE(registry.bindInstance("c1", "agent-1").has_value());
    clock.advance(std::chrono::seconds(30));
    ASSERT_TRUE(registry.registerConnection("c2", clock.now()).has_value());
    clock.advance(std::chrono::seconds(31));

    AdminResponse list = admin.listConnections(ListOptions{});
    ASSERT_EQ(list.status, 200);
    ASSERT_EQ(list.body["items"].size(), 2u);
    EXPECT_EQ(list.body["items"][0]["id"], "c1");
    EXPECT_EQ(list.body["items"][0]["instanceId"], "agent-1");
    EXPECT_EQ(list.body["items"][0]["alive"], false);
    EXPECT_TRUE(list.body["items"][1]["instanceId"].is_null());
    EXPECT_EQ(list.body["items"][1]["alive"], true);
}

TEST_F(AdminServiceTest, AgentGroupLifecycle) {
    AdminResponse created = admin.createAgentGroup(prodGroup(), "alice");
    ASSERT_EQ(created.status, 201);
    EXPECT_EQ(created.body["conditions"][0]["type"], "Created");
    EXPECT_EQ(created.body["conditions"][0]["reason"], "alice");
    EXPECT_EQ(created.body["attributes"]["owner"], "platform");

    EXPECT_EQ(admin.createAgentGroup(prodGroup(), "alice").status, 409);

    clock.advance(std::chrono::seconds(1));
    AdminResponse updated = admin.updateAgentGroup("prod", prodGroup(7), "bob");
    ASSERT_EQ(updated.status, 200);
    EXPECT_EQ(updated.body["priority"], 7);
    EXPECT_EQ(updated.body["conditions"].size(), 2u);
    EXPECT_EQ(updated.body["conditions"][0]["reason"], "alice");

    EXPECT_EQ(admin.updateAgentGroup("other", prodGroup(), "bob").status, 400);

    AdminResponse resolved = admin.resolveAgentGroup({{"env", "prod"}});
    ASSERT_EQ(resolved.status, 200);
    EXPECT_EQ(resolved.body["name"], "prod");

    EXPECT_EQ(admin.deleteAgentGroup("prod", "carol").status, 204);
    EXPECT_EQ(admin.deleteAgentGroup("prod", "carol").status, 204);
    EXPECT_EQ(admin.deleteAgentGroup("ghost", "carol").status, 404);

    AdminResponse tombstone = admin.getAgentGroup("prod");
    ASSERT_EQ(tombstone.status, 200);
    EXPECT_EQ(tombstone.body["deletedBy"], "carol");

    EXPECT_EQ(admin.listAgentGroups(ListOptions{}).body["items"].size(), 0u);
    EXPECT_EQ(admin.listAgentGroups(ListOptions{}, true).body["items"].size(), 1u);
    EXPECT_EQ(admin.resolveAgentGroup({{"env", "prod"}}).status, 404);
    EXPECT_EQ(admin.updateAgentGroup("prod", prodGroup(), "bob").status, 404);
}

TEST_F(AdminServiceTest, AgentGroupValidation) {
    nlohmann::json badName = prodGroup();
    badName["name"] = "Not Valid";
    EXPECT_EQ(admin.createAgentGroup(badName, "alice").status, 400);

    nlohmann::json badPriority = prodGroup();
    badPriority["priority"] = "high";
    EXPECT_EQ(admin.createAgentGroup(badPriority, "alice").status, 400);

    nlohmann::json badSelector = prodGroup();
    badSelector["selector"]["identifyingAttributes"]["env"] = 3;
    EXPECT_EQ(admin.createAgentGroup(badSelector, "alice").status, 400);
}

TEST_F(AdminServiceTest, AgentsAreListedAndFetched) {
    reportAgent("agent-b", "c2", {{"env", "dev"}}, {});
    reportAgent("agent-a", "c1", {{"env", "prod"}}, {{"host.name", "node-a"}});

    AdminResponse fetched = admin.getAgent("agent-a");
    ASSERT_EQ(fetched.status, 200);
    EXPECT_EQ(fetched.body["instanceId"], "agent-a");
    EXPECT_EQ(fetched.body["description"]["identifyingAttributes"]["env"], "prod");
    EXPECT_EQ(fetched.body["description"]["nonIdentifyingAttributes"]["host.name"], "node-a");
    EXPECT_EQ(fetched.body["connectionId"], "c1");
    EXPECT_EQ(fetched.body["connected"], true);
    EXPECT_TRUE(fetched.body["reportedConfigHash"].is_null());

    EXPECT_EQ(admin.getAgent("ghost").status, 404);

    AdminResponse page = admin.listAgents(ListOptions{1, ""});
    ASSERT_EQ(page.status, 200);
    ASSERT_EQ(page.body["items"].size(), 1u);
    EXPECT_EQ(page.body["items"][0]["instanceId"], "agent-a");
    EXPECT_EQ(page.body["remainingItemCount"], 1);

    AdminResponse rest = admin.listAgents(ListOptions{0, page.body["continue"].get<std::string>()});
    ASSERT_EQ(rest.body["items"].size(), 1u);
    EXPECT_EQ(rest.body["items"][0]["instanceId"], "agent-b");

    EXPECT_EQ(admin.listAgents(ListOptions{1, "garbage"}).status, 400);

    AdminResponse byHost = admin.listAgentsBySelector(AgentSelector{{}, {{"host.name", "node-a"}}}, ListOptions{});
    ASSERT_EQ(byHost.body["items"].size(), 1u);
    EXPECT_EQ(byHost.body["items"][0]["instanceId"], "agent-a");
}

TEST_F(AdminServiceTest, AgentsByGroupAndGroupStatus) {
    ASSERT_EQ(admin.createAgentGroup(prodGroup(), "alice").status, 201);
    reportAgent("agent-1", "c1", {{"env", "prod"}}, {});
    reportAgent("agent-2", "c2", {{"env", "prod"}}, {});
    reportAgent("agent-3", "c3", {{"env", "prod"}}, {});
    reportAgent("agent-4", "c4", {{"env", "dev"}}, {});

    agents.markDisconnected("agent-3", "c3");
    registry.unregister("c3");
    clock.advance(std::chrono::seconds(61));
    registry.touch("c1", clock.now());

    AdminResponse members = admin.listAgentsByAgentGroup("prod", ListOptions{});
    ASSERT_EQ(members.status, 200);
    ASSERT_EQ(members.body["items"].size(), 3u);
    EXPECT_EQ(members.body["items"][0]["instanceId"], "agent-1");
    EXPECT_EQ(members.body["items"][2]["instanceId"], "agent-3");

    AdminResponse group = admin.getAgentGroup("prod");
    ASSERT_EQ(group.status, 200);
    const nlohmann::json& status = group.body["status"];
    EXPECT_EQ(status["numAgents"], 3);
    EXPECT_EQ(status["numConnectedAgents"], 2);
    EXPECT_EQ(status["numHealthyAgents"], 1);
    EXPECT_EQ(status["numUnhealthyAgents"], 1);
    EXPECT_EQ(status["numNotConnectedAgents"], 1);

    EXPECT_EQ(admin.listAgentsByAgentGroup("ghost", ListOptions{}).status, 404);

    ASSERT_EQ(admin.deleteAgentGroup("prod", "carol").status, 204);
    EXPECT_EQ(admin.listAgentsByAgentGroup("prod", ListOptions{}).body["items"].size(), 3u);
}
