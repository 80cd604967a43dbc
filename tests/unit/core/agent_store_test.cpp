#include <gtest/gtest.h>
#include "agentfleet/core/sharded_agent_store.hpp"
#include "agentfleet/core/sharded_connection_registry.hpp"
#include <thread>
#include <vector>

using namespace agentfleet;
using namespace agentfleet::core;
using std::chrono::milliseconds;

namespace {

AgentReport report(const std::string& instanceId,
                   const std::string& connId,
                   Attributes identifying,
                   Attributes nonIdentifying,
                   utils::Clock::TimePoint at) {
    AgentReport r;
    r.instanceId = instanceId;
    r.connectionId = connId;
    r.description = AgentDescription{std::move(identifying), std::move(nonIdentifying)};
    r.at = at;
    return r;
}

} // namespace

class AgentStoreTest : public ::testing::Test {
protected:
    const utils::Clock::TimePoint t0{std::chrono::seconds(1700000000)};
    PaginationCursor cursor{utils::Bytes(32, 0x61)};
    ShardedAgentStore store{cursor, 4};
};

TEST_F(AgentStoreTest, FirstReportCreatesRecord) {
    auto recorded = store.recordReport(report("agent-1", "c1", {{"env", "prod"}}, {{"os", "linux"}}, t0));
    ASSERT_TRUE(recorded.has_value());

    auto agent = store.getAgent("agent-1");
    ASSERT_TRUE(agent.has_value());
    EXPECT_EQ(agent.value().instanceId, "agent-1");
    EXPECT_EQ(agent.value().description.nonIdentifyingAttributes.at("os"), "linux");
    EXPECT_EQ(agent.value().connectionId, std::string("c1"));
    EXPECT_EQ(agent.value().firstSeenAt, t0);
    EXPECT_EQ(agent.value().lastReportedAt, t0);
    EXPECT_EQ(store.size(), 1u);
}

TEST_F(AgentStoreTest, EmptyInstanceIdIsRejected) {
    auto recorded = store.recordReport(report("", "c1", {}, {}, t0));
    ASSERT_TRUE(recorded.has_error());
    EXPECT_EQ(recorded.error().code, ErrorCode::ValidationError);
    EXPECT_EQ(store.size(), 0u);
}

TEST_F(AgentStoreTest, PartialReportKeepsStoredFields) {
    AgentReport first = report("agent-1", "c1", {{"env", "prod"}}, {}, t0);
    first.reportedConfigHash = "abc";
    first.effectiveAgentGroup = "prod";
    ASSERT_TRUE(store.recordReport(first).has_value());

    AgentReport poll;
    poll.instanceId = "agent-1";
    poll.connectionId = "c1";
    poll.at = t0 + milliseconds(500);
    ASSERT_TRUE(store.recordReport(poll).has_value());

    auto agent = store.getAgent("agent-1").value();
    EXPECT_EQ(agent.description.identifyingAttributes.at("env"), "prod");
    EXPECT_EQ(agent.reportedConfigHash, std::string("abc"));
    EXPECT_FALSE(agent.effectiveAgentGroup.has_value());
    EXPECT_EQ(agent.firstSeenAt, t0);
    EXPECT_EQ(agent.lastReportedAt, t0 + milliseconds(500));
}

TEST_F(AgentStoreTest, UnknownAgentIsNotFound) {
    auto agent = store.getAgent("ghost");
    ASSERT_TRUE(agent.has_error());
    EXPECT_EQ(agent.error().code, ErrorCode::NotFound);
}

TEST_F(AgentStoreTest, DisconnectOnlyClearsMatchingConnection) {
    ASSERT_TRUE(store.recordReport(report("agent-1", "c1", {}, {}, t0)).has_value());
    ASSERT_TRUE(store.recordReport(report("agent-1", "c2", {}, {}, t0)).has_value());

    store.markDisconnected("agent-1", "c1");
    EXPECT_EQ(store.getAgent("agent-1").value().connectionId, std::string("c2"));

    store.markDisconnected("agent-1", "c2");
    EXPECT_FALSE(store.getAgent("agent-1").value().connected());

    store.markDisconnected("ghost", "c9");
    EXPECT_EQ(store.size(), 1u);
}

TEST_F(AgentStoreTest, ListingIsPagedByInstanceId) {
    for (const char* id : {"agent-c", "agent-a", "agent-d", "agent-b"}) {
        ASSERT_TRUE(store.recordReport(report(id, std::string("conn-") + id, {}, {}, t0)).has_value());
    }

    auto first = store.listAgents(ListOptions{3, ""});
    ASSERT_TRUE(first.has_value());
    ASSERT_EQ(first.value().items.size(), 3u);
    EXPECT_EQ(first.value().items[0].instanceId, "agent-a");
    EXPECT_EQ(first.value().items[2].instanceId, "agent-c");
    EXPECT_EQ(first.value().remainingItemCount, 1);
    ASSERT_FALSE(first.value().continueToken.empty());

    auto second = store.listAgents(ListOptions{0, first.value().continueToken});
    ASSERT_TRUE(second.has_value());
    ASSERT_EQ(second.value().items.size(), 1u);
    EXPECT_EQ(second.value().items[0].instanceId, "agent-d");
    EXPECT_TRUE(second.value().continueToken.empty());

    auto tampered = store.listAgents(ListOptions{3, first.value().continueToken + "x"});
    ASSERT_TRUE(tampered.has_error());
    EXPECT_EQ(tampered.error().code, ErrorCode::InvalidCursor);
}

TEST_F(AgentStoreTest, SelectorMatchesBothAttributeMaps) {
    ASSERT_TRUE(store.recordReport(report("a1", "c1", {{"env", "prod"}}, {{"region", "eu"}}, t0)).has_value());
    ASSERT_TRUE(store.recordReport(report("a2", "c2", {{"env", "prod"}}, {{"region", "us"}}, t0)).has_value());
    ASSERT_TRUE(store.recordReport(report("a3", "c3", {{"env", "dev"}}, {{"region", "eu"}}, t0)).has_value());

    auto prod = store.listAgentsBySelector(AgentSelector{{{"env", "prod"}}, {}}, ListOptions());
    ASSERT_TRUE(prod.has_value());
    EXPECT_EQ(prod.value().items.size(), 2u);

    auto prodEu = store.listAgentsBySelector(AgentSelector{{{"env", "prod"}}, {{"region", "eu"}}}, ListOptions());
    ASSERT_TRUE(prodEu.has_value());
    ASSERT_EQ(prodEu.value().items.size(), 1u);
    EXPECT_EQ(prodEu.value().items[0].instanceId, "a1");

    auto everyone = store.listAgentsBySelector(AgentSelector(), ListOptions());
    EXPECT_EQ(everyone.value().items.size(), 3u);
}

TEST(AgentGroupStatusTest, CountsByConnectionHealth) {
    const utils::Clock::TimePoint t0{std::chrono::seconds(1700000000)};
    ShardedConnectionRegistry registry{milliseconds(1000), PaginationCursor(utils::Bytes(32, 0x62)), 4};
    ASSERT_TRUE(registry.registerConnection("fresh", t0).has_value());
    ASSERT_TRUE(registry.registerConnection("stale", t0 - milliseconds(5000)).has_value());

    std::vector<Agent> agents(4);
    agents[0].instanceId = "healthy";
    agents[0].connectionId = "fresh";
    agents[1].instanceId = "unhealthy";
    agents[1].connectionId = "stale";
    agents[2].instanceId = "offline";
    agents[3].instanceId = "closed-meanwhile";
    agents[3].connectionId = "gone";

    AgentGroupStatus status = summarizeAgents(agents, registry, t0);
    EXPECT_EQ(status.numAgents, 4);
    EXPECT_EQ(status.numConnectedAgents, 2);
    EXPECT_EQ(status.numHealthyAgents, 1);
    EXPECT_EQ(status.numUnhealthyAgents, 1);
    EXPECT_EQ(status.numNotConnectedAgents, 2);
}

TEST_F(AgentStoreTest, ConcurrentReportsFromManyAgents) {
    constexpr int kThreads = 8;
    constexpr int kPerThread = 100;
    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([this, t]() {
            for (int i = 0; i < kPerThread; ++i) {
                std::string id = "agent-" + std::to_string(t) + "-" + std::to_string(i);
                store.recordReport(report(id, "c-" + id, {}, {}, t0));
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }
    EXPECT_EQ(store.size(), static_cast<std::size_t>(kThreads * kPerThread));
}
