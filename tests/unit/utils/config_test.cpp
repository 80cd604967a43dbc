#include <gtest/gtest.h>
#include "agentfleet/utils/config.hpp"
#include "agentfleet/utils/logging.hpp"

using namespace agentfleet;
using namespace agentfleet::utils;

TEST(ConfigTest, Defaults) {
    ServerConfig config = defaultServerConfig();
    EXPECT_EQ(config.listenAddress, "0.0.0.0");
    EXPECT_EQ(config.listenPort, 4320);
    EXPECT_EQ(config.livenessThreshold, std::chrono::seconds(60));
    EXPECT_EQ(config.maxCommandsPerReply, 16u);
    EXPECT_EQ(config.shardCount, 16u);
    EXPECT_TRUE(config.cursorSecretHex.empty());
    EXPECT_FALSE(config.commandJournalPath.has_value());
    EXPECT_EQ(config.logLevel, "info");
}

TEST(ConfigTest, ParsesEveryKey) {
    auto parsed = parseServerConfig(R"({
        "listenAddress": "127.0.0.1",
        "listenPort": 0,
        "livenessThresholdMs": 1500,
        "maxCommandsPerReply": 4,
        "shardCount": 2,
        "cursorSecret": "000102030405060708090a0b0c0d0e0f",
        "commandJournalPath": "/var/lib/agentfleet/commands.jsonl",
        "logLevel": "debug",
        "somethingElse": true
    })");
    ASSERT_TRUE(parsed.has_value()) << parsed.error().message;

    const ServerConfig& config = parsed.value();
    EXPECT_EQ(config.listenAddress, "127.0.0.1");
    EXPECT_EQ(config.listenPort, 0);
    EXPECT_EQ(config.livenessThreshold, std::chrono::milliseconds(1500));
    EXPECT_EQ(config.maxCommandsPerReply, 4u);
    EXPECT_EQ(config.shardCount, 2u);
    EXPECT_EQ(config.cursorSecretHex, "000102030405060708090a0b0c0d0e0f");
    EXPECT_EQ(config.commandJournalPath, std::string("/var/lib/agentfleet/commands.jsonl"));
    EXPECT_EQ(config.logLevel, "debug");
}

TEST(ConfigTest, RejectsBadValues) {
    const char* documents[] = {
        "not json",
        "[]",
        R"({"listenPort": 70000})",
        R"({"listenPort": "80"})",
        R"({"livenessThresholdMs": 0})",
        R"({"maxCommandsPerReply": -3})",
        R"({"shardCount": 0})",
        R"({"cursorSecret": "abcd"})",
        R"({"cursorSecret": "zz"})",
        R"({"commandJournalPath": ""})",
        R"({"logLevel": "verbose"})"
    };
    for (const char* document : documents) {
        auto parsed = parseServerConfig(document);
        ASSERT_TRUE(parsed.has_error()) << document;
        EXPECT_EQ(parsed.error().code, ErrorCode::ValidationError) << document;
    }
}

TEST(ConfigTest, ErrorNamesTheKey) {
    auto parsed = parseServerConfig(R"({"shardCount": 0})");
    ASSERT_TRUE(parsed.has_error());
    EXPECT_NE(parsed.error().message.find("shardCount"), std::string::npos);
}

TEST(ConfigTest, MissingFileIsStorageError) {
    auto loaded = loadServerConfig("/nonexistent/agentfleet.json");
    ASSERT_TRUE(loaded.has_error());
    EXPECT_EQ(loaded.error().code, ErrorCode::StorageError);
}

TEST(ConfigTest, LogLevels) {
    EXPECT_EQ(parseLogLevel("warn").value(), spdlog::level::warn);
    EXPECT_EQ(parseLogLevel("error").value(), spdlog::level::err);
    EXPECT_TRUE(parseLogLevel("loud").has_error());
}

TEST(ResultTest, HttpStatusMapping) {
    EXPECT_EQ(httpStatusFor(ErrorCode::NotFound), 404);
    EXPECT_EQ(httpStatusFor(ErrorCode::NotRegistered), 404);
    EXPECT_EQ(httpStatusFor(ErrorCode::AlreadyExists), 409);
    EXPECT_EQ(httpStatusFor(ErrorCode::InvalidCursor), 400);
    EXPECT_EQ(httpStatusFor(ErrorCode::ValidationError), 400);
    EXPECT_EQ(httpStatusFor(ErrorCode::ProtocolError), 400);
    EXPECT_EQ(httpStatusFor(ErrorCode::StorageError), 500);
    EXPECT_STREQ(errorCodeName(ErrorCode::InvalidCursor), "InvalidCursor");
}
