#include <gtest/gtest.h>
#include "agentfleet/core/sharded_connection_registry.hpp"
#include <atomic>
#include <thread>
#include <vector>

using namespace agentfleet;
using namespace agentfleet::core;
using std::chrono::milliseconds;

class ConnectionRegistryTest : public ::testing::Test {
protected:
    const milliseconds threshold{60000};
    const utils::Clock::TimePoint t0{std::chrono::seconds(1700000000)};
    ShardedConnectionRegistry registry{threshold, PaginationCursor(utils::Bytes(32, 0x11)), 4};
};

TEST_F(ConnectionRegistryTest, RegisterCreatesUnboundEntry) {
    ASSERT_TRUE(registry.registerConnection("c1", t0).has_value());

    auto connection = registry.get("c1", t0);
    ASSERT_TRUE(connection.has_value());
    EXPECT_EQ(connection.value().id, "c1");
    EXPECT_FALSE(connection.value().instanceId.has_value());
    EXPECT_EQ(connection.value().lastCommunicatedAt, t0);
    EXPECT_TRUE(connection.value().alive);
    EXPECT_EQ(registry.size(), 1u);
}

TEST_F(ConnectionRegistryTest, DuplicateRegisterFails) {
    ASSERT_TRUE(registry.registerConnection("c1", t0).has_value());
    auto again = registry.registerConnection("c1", t0);
    ASSERT_TRUE(again.has_error());
    EXPECT_EQ(again.error().code, ErrorCode::AlreadyExists);
}

TEST_F(ConnectionRegistryTest, LivenessAroundThreshold) {
    ASSERT_TRUE(registry.registerConnection("c1", t0).has_value());

    auto before = registry.isAlive("c1", t0 + threshold - milliseconds(1));
    ASSERT_TRUE(before.has_value());
    EXPECT_TRUE(before.value());

    auto at = registry.isAlive("c1", t0 + threshold);
    ASSERT_TRUE(at.has_value());
    EXPECT_FALSE(at.value());

    auto after = registry.isAlive("c1", t0 + threshold + milliseconds(1));
    ASSERT_TRUE(after.has_value());
    EXPECT_FALSE(after.value());
}

TEST_F(ConnectionRegistryTest, TouchExtendsLiveness) {
    ASSERT_TRUE(registry.registerConnection("c1", t0).has_value());
    registry.touch("c1", t0 + milliseconds(50000));

    auto alive = registry.isAlive("c1", t0 + threshold + milliseconds(1));
    ASSERT_TRUE(alive.has_value());
    EXPECT_TRUE(alive.value());
}

TEST_F(ConnectionRegistryTest, TouchNeverMovesBackwards) {
    ASSERT_TRUE(registry.registerConnection("c1", t0 + milliseconds(10)).has_value());
    registry.touch("c1", t0);
    EXPECT_EQ(registry.get("c1", t0).value().lastCommunicatedAt, t0 + milliseconds(10));
}

TEST_F(ConnectionRegistryTest, TouchAfterUnregisterIsNoOp) {
    ASSERT_TRUE(registry.registerConnection("c1", t0).has_value());
    registry.unregister("c1");
    registry.touch("c1", t0);
    EXPECT_EQ(registry.size(), 0u);
    EXPECT_EQ(registry.get("c1", t0).error().code, ErrorCode::NotFound);
}

TEST_F(ConnectionRegistryTest, UnregisterIsIdempotent) {
    ASSERT_TRUE(registry.registerConnection("c1", t0).has_value());
    registry.unregister("c1");
    registry.unregister("c1");
    registry.unregister("never-registered");
    EXPECT_EQ(registry.size(), 0u);
}

TEST_F(ConnectionRegistryTest, BindInstance) {
    auto unknown = registry.bindInstance("c1", "agent-1");
    ASSERT_TRUE(unknown.has_error());
    EXPECT_EQ(unknown.error().code, ErrorCode::NotRegistered);

    ASSERT_TRUE(registry.registerConnection("c1", t0).has_value());
    ASSERT_TRUE(registry.bindInstance("c1", "agent-1").has_value());
    EXPECT_TRUE(registry.bindInstance("c1", "agent-1").has_value());

    auto conflicting = registry.bindInstance("c1", "agent-2");
    ASSERT_TRUE(conflicting.has_error());
    EXPECT_EQ(conflicting.error().code, ErrorCode::ValidationError);

    auto byInstance = registry.getByInstanceId("agent-1", t0);
    ASSERT_TRUE(byInstance.has_value());
    EXPECT_EQ(byInstance.value().id, "c1");
    EXPECT_EQ(registry.getByInstanceId("agent-2", t0).error().code, ErrorCode::NotFound);
}

TEST_F(ConnectionRegistryTest, IsAliveUnknownIsNotFound) {
    auto alive = registry.isAlive("ghost", t0);
    ASSERT_TRUE(alive.has_error());
    EXPECT_EQ(alive.error().code, ErrorCode::NotFound);
}

TEST_F(ConnectionRegistryTest, ListIsSortedAndPaginated) {
    for (const char* id : {"c3", "c1", "c5", "c2", "c4"}) {
        ASSERT_TRUE(registry.registerConnection(id, t0).has_value());
    }
    registry.touch("c2", t0 + milliseconds(90000));

    auto first = registry.list(ListOptions{2, ""}, t0 + milliseconds(90000));
    ASSERT_TRUE(first.has_value());
    ASSERT_EQ(first.value().items.size(), 2u);
    EXPECT_EQ(first.value().items[0].id, "c1");
    EXPECT_FALSE(first.value().items[0].alive);
    EXPECT_EQ(first.value().items[1].id, "c2");
    EXPECT_TRUE(first.value().items[1].alive);
    EXPECT_EQ(first.value().remainingItemCount, 3);

    auto rest = registry.list(ListOptions{10, first.value().continueToken}, t0);
    ASSERT_TRUE(rest.has_value());
    ASSERT_EQ(rest.value().items.size(), 3u);
    EXPECT_EQ(rest.value().items[0].id, "c3");
    EXPECT_EQ(rest.value().items[2].id, "c5");
    EXPECT_TRUE(rest.value().continueToken.empty());
}

TEST_F(ConnectionRegistryTest, ZeroShardsThrows) {
    EXPECT_THROW(
        { ShardedConnectionRegistry bad(threshold, PaginationCursor(utils::Bytes(32, 1)), 0); },
        std::invalid_argument);
}

TEST_F(ConnectionRegistryTest, ConcurrentChurn) {
    constexpr int kThreads = 8;
    constexpr int kPerThread = 500;
    std::vector<std::thread> threads;
    std::atomic<int> failures{0};

    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&, t]() {
            for (int i = 0; i < kPerThread; ++i) {
                std::string id = "conn-" + std::to_string(t) + "-" + std::to_string(i);
                if (registry.registerConnection(id, t0).has_error()) {
                    ++failures;
                }
                registry.touch(id, t0 + milliseconds(i));
                if (registry.bindInstance(id, "agent-" + id).has_error()) {
                    ++failures;
                }
                if (i % 2 == 0) {
                    registry.unregister(id);
                }
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(failures.load(), 0);
    EXPECT_EQ(registry.size(), static_cast<std::size_t>(kThreads * kPerThread / 2));
    auto all = registry.list(ListOptions{}, t0);
    ASSERT_TRUE(all.has_value());
    EXPECT_EQ(all.value().items.size(), registry.size());
}
