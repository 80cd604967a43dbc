#include "agentfleet/core/agent_group_store.hpp"
#include "agentfleet/core/in_memory_command_audit_log.hpp"
#include "agentfleet/core/selector_resolver.hpp"
#include "agentfleet/core/session_handler.hpp"
#include "agentfleet/core/session_server.hpp"
#include "agentfleet/core/sharded_connection_registry.hpp"
#include "agentfleet/core/sharded_agent_store.hpp"
#include "agentfleet/utils/clock.hpp"
#include "agentfleet/utils/config.hpp"
#include "agentfleet/utils/crypto.hpp"
#include "agentfleet/utils/logging.hpp"
#include <csignal>
#include <exception>
#include <iostream>
#include <memory>
#include <pthread.h>
#include <stdexcept>

using namespace agentfleet;

namespace {

core::PaginationCursor makeCursor(const utils::ServerConfig& config) {
    if (config.cursorSecretHex.empty()) {
        AGENTFLEET_LOG_WARN("no cursorSecret configured, continuation tokens will not survive a restart");
        return core::PaginationCursor::withRandomSecret();
    }
    auto secret = utils::fromHex(config.cursorSecretHex);
    if (secret.has_error()) {
        throw std::invalid_argument("cursorSecret: " + secret.error().message);
    }
    return core::PaginationCursor(secret.value());
}

std::unique_ptr<core::InMemoryCommandAuditLog> makeAuditLog(const utils::ServerConfig& config,
                                                            const utils::Clock& clock,
                                                            core::PaginationCursor cursor) {
    if (!config.commandJournalPath) {
        return std::make_unique<core::InMemoryCommandAuditLog>(clock, std::move(cursor), config.shardCount);
    }
    auto log = core::InMemoryCommandAuditLog::withJournal(clock, std::move(cursor), config.shardCount,
                                                          *config.commandJournalPath);
    if (log.has_error()) {
        throw std::runtime_error("command journal: " + log.error().message);
    }
    return std::move(log.value());
}

} // namespace

int main(int argc, char** argv) {
    if (argc > 2) {
        std::cerr << "usage: " << argv[0] << " [config.json]" << std::endl;
        return 2;
    }

    utils::ServerConfig config = utils::defaultServerConfig();
    if (argc == 2) {
        auto loaded = utils::loadServerConfig(argv[1]);
        if (loaded.has_error()) {
            std::cerr << "failed to load " << argv[1] << ": " << loaded.error().message << std::endl;
            return 1;
        }
        config = loaded.value();
    }

    auto level = utils::parseLogLevel(config.logLevel);
    if (level.has_error()) {
        std::cerr << level.error().message << std::endl;
        return 1;
    }
    utils::initLogging(level.value());

    // Block termination signals before any thread starts so only sigwait sees them.
    sigset_t signals;
    sigemptyset(&signals);
    sigaddset(&signals, SIGINT);
    sigaddset(&signals, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &signals, nullptr);

    try {
        utils::SystemClock clock;
        core::PaginationCursor cursor = makeCursor(config);

        core::ShardedConnectionRegistry registry(config.livenessThreshold, cursor, config.shardCount);
        core::ShardedAgentStore agents(cursor, config.shardCount);
        auto auditLog = makeAuditLog(config, clock, cursor);
        core::InMemoryAgentGroupStore groups(cursor);
        core::PrioritySelectorResolver resolver;

        core::SessionHandlerConfig handlerConfig;
        handlerConfig.maxCommandsPerReply = config.maxCommandsPerReply;
        handlerConfig.shardCount = config.shardCount;
        core::SessionHandler handler(registry, agents, *auditLog, resolver, groups, clock, handlerConfig);

        core::SessionServer server(handler, config.listenAddress, config.listenPort);
        server.start();

        int received = 0;
        sigwait(&signals, &received);
        AGENTFLEET_LOG_INFO("received signal {}, shutting down", received);
        server.stop();
    } catch (const std::exception& e) {
        AGENTFLEET_LOG_CRITICAL("agentfleetd failed: {}", e.what());
        return 1;
    }

    return 0;
}
