#include <gtest/gtest.h>
#include "agentfleet/core/agent_group_store.hpp"

using namespace agentfleet;
using namespace agentfleet::core;
using std::chrono::seconds;

class AgentGroupStoreTest : public ::testing::Test {
protected:
    AgentGroup makeGroup(const std::string& name, int priority,
                         Attributes selector = {{"env", "prod"}}) {
        return AgentGroup::create(name, priority, AgentSelector{selector, {}},
                                  RemoteConfigPayload{"exporters: [otlp]", "text/yaml"}, t0, "alice");
    }

    const utils::Clock::TimePoint t0{seconds(1700000000)};
    InMemoryAgentGroupStore store{PaginationCursor(utils::Bytes(32, 0x31))};
};

TEST_F(AgentGroupStoreTest, CreateAndGet) {
    auto created = store.createAgentGroup(makeGroup("prod", 5));
    ASSERT_TRUE(created.has_value());

    auto fetched = store.getAgentGroup("prod");
    ASSERT_TRUE(fetched.has_value());
    EXPECT_EQ(fetched.value().priority, 5);
    EXPECT_EQ(fetched.value().createdBy(), "alice");
    EXPECT_EQ(fetched.value().createdAt(), t0);
    EXPECT_FALSE(fetched.value().isDeleted());

    auto& conditions = fetched.value().conditions;
    ASSERT_EQ(conditions.count(ConditionType::Created), 1u);
    EXPECT_EQ(conditions.at(ConditionType::Created).status, ConditionStatus::True);
}

TEST_F(AgentGroupStoreTest, DuplicateCreateFails) {
    ASSERT_TRUE(store.createAgentGroup(makeGroup("prod", 5)).has_value());
    auto again = store.createAgentGroup(makeGroup("prod", 1));
    ASSERT_TRUE(again.has_error());
    EXPECT_EQ(again.error().code, ErrorCode::AlreadyExists);
}

TEST_F(AgentGroupStoreTest, ValidationErrors) {
    std::vector<std::string> badNames = {"", "Prod", "-prod", "prod-", "pr_od", std::string(254, 'a')};
    for (const auto& name : badNames) {
        auto created = store.createAgentGroup(makeGroup(name, 1));
        ASSERT_TRUE(created.has_error()) << name;
        EXPECT_EQ(created.error().code, ErrorCode::ValidationError) << name;
    }

    auto negative = store.createAgentGroup(makeGroup("prod", -1));
    ASSERT_TRUE(negative.has_error());
    EXPECT_EQ(negative.error().code, ErrorCode::ValidationError);

    auto emptyKey = store.createAgentGroup(makeGroup("prod", 1, {{"", "x"}}));
    ASSERT_TRUE(emptyKey.has_error());
    EXPECT_EQ(emptyKey.error().code, ErrorCode::ValidationError);

    EXPECT_TRUE(store.createAgentGroup(makeGroup("a.b-c9", 0)).has_value());
}

TEST_F(AgentGroupStoreTest, UpdateKeepsCreatedCondition) {
    ASSERT_TRUE(store.createAgentGroup(makeGroup("prod", 5)).has_value());

    AgentGroup change = makeGroup("prod", 9, {{"env", "staging"}});
    auto updated = store.updateAgentGroup(change, t0 + seconds(30), "bob");
    ASSERT_TRUE(updated.has_value());
    EXPECT_EQ(updated.value().priority, 9);
    EXPECT_EQ(updated.value().selector.identifyingAttributes.at("env"), "staging");
    EXPECT_EQ(updated.value().createdBy(), "alice");
    EXPECT_EQ(updated.value().createdAt(), t0);

    const auto& updatedCondition = updated.value().conditions.at(ConditionType::Updated);
    EXPECT_EQ(updatedCondition.reason, "bob");
    EXPECT_EQ(updatedCondition.lastTransitionTime, t0 + seconds(30));
}

TEST_F(AgentGroupStoreTest, UpdateMissingOrDeletedIsNotFound) {
    auto missing = store.updateAgentGroup(makeGroup("prod", 1), t0, "bob");
    ASSERT_TRUE(missing.has_error());
    EXPECT_EQ(missing.error().code, ErrorCode::NotFound);

    ASSERT_TRUE(store.createAgentGroup(makeGroup("prod", 1)).has_value());
    ASSERT_TRUE(store.deleteAgentGroup("prod", t0, "bob").has_value());
    auto deleted = store.updateAgentGroup(makeGroup("prod", 2), t0, "bob");
    ASSERT_TRUE(deleted.has_error());
    EXPECT_EQ(deleted.error().code, ErrorCode::NotFound);
}

TEST_F(AgentGroupStoreTest, SoftDeleteKeepsGroupAddressable) {
    ASSERT_TRUE(store.createAgentGroup(makeGroup("prod", 1)).has_value());
    ASSERT_TRUE(store.deleteAgentGroup("prod", t0 + seconds(5), "carol").has_value());
    ASSERT_TRUE(store.deleteAgentGroup("prod", t0 + seconds(50), "dave").has_value());

    auto fetched = store.getAgentGroup("prod");
    ASSERT_TRUE(fetched.has_value());
    EXPECT_TRUE(fetched.value().isDeleted());
    EXPECT_EQ(fetched.value().deletedAt(), t0 + seconds(5));
    EXPECT_EQ(fetched.value().deletedBy(), std::string("carol"));
    EXPECT_EQ(fetched.value().conditions.at(ConditionType::Deleted).status, ConditionStatus::True);

    auto recreate = store.createAgentGroup(makeGroup("prod", 1));
    ASSERT_TRUE(recreate.has_error());
    EXPECT_EQ(recreate.error().code, ErrorCode::AlreadyExists);

    auto missing = store.deleteAgentGroup("other", t0, "carol");
    ASSERT_TRUE(missing.has_error());
    EXPECT_EQ(missing.error().code, ErrorCode::NotFound);
}

TEST_F(AgentGroupStoreTest, ListingHidesDeletedByDefault) {
    for (const char* name : {"c", "a", "b", "d"}) {
        ASSERT_TRUE(store.createAgentGroup(makeGroup(name, 1)).has_value());
    }
    ASSERT_TRUE(store.deleteAgentGroup("b", t0, "carol").has_value());

    auto active = store.listAgentGroups(ListOptions{});
    ASSERT_TRUE(active.has_value());
    ASSERT_EQ(active.value().items.size(), 3u);
    EXPECT_EQ(active.value().items[0].name, "a");
    EXPECT_EQ(active.value().items[1].name, "c");

    auto everything = store.listAgentGroups(ListOptions{2, ""}, true);
    ASSERT_TRUE(everything.has_value());
    ASSERT_EQ(everything.value().items.size(), 2u);
    EXPECT_EQ(everything.value().items[1].name, "b");
    EXPECT_EQ(everything.value().remainingItemCount, 2);

    auto next = store.listAgentGroups(ListOptions{2, everything.value().continueToken}, true);
    ASSERT_TRUE(next.has_value());
    ASSERT_EQ(next.value().items.size(), 2u);
    EXPECT_EQ(next.value().items[0].name, "c");
    EXPECT_TRUE(next.value().continueToken.empty());
}

TEST_F(AgentGroupStoreTest, SnapshotIsImmutable) {
    ASSERT_TRUE(store.createAgentGroup(makeGroup("prod", 1)).has_value());
    AgentGroupSnapshot before = store.activeSnapshot();
    ASSERT_EQ(before->size(), 1u);

    ASSERT_TRUE(store.deleteAgentGroup("prod", t0, "carol").has_value());
    EXPECT_EQ(before->size(), 1u);
    EXPECT_TRUE(store.activeSnapshot()->empty());
}
