#include <benchmark/benchmark.h>
#include "agentfleet/core/in_memory_command_audit_log.hpp"
#include "agentfleet/core/selector_resolver.hpp"
#include "agentfleet/core/sharded_connection_registry.hpp"
#include "agentfleet/utils/clock.hpp"
#include <string>
#include <vector>

using namespace agentfleet;
using namespace agentfleet::core;

namespace {

PaginationCursor benchCursor() {
    return PaginationCursor(utils::Bytes(32, 0x5a));
}

} // namespace

// Register, touch and unregister one connection per iteration
static void BM_ConnectionChurn(benchmark::State& state) {
    ShardedConnectionRegistry registry(std::chrono::seconds(60), benchCursor(),
                                       static_cast<std::size_t>(state.range(0)));
    utils::SystemClock clock;
    std::size_t i = 0;
    for (auto _ : state) {
        std::string connId = "conn-" + std::to_string(i++);
        auto registered = registry.registerConnection(connId, clock.now());
        benchmark::DoNotOptimize(registered);
        registry.touch(connId, clock.now());
        registry.unregister(connId);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_ConnectionChurn)
    ->Arg(1)     // Single lock
    ->Arg(16);   // Default sharding

static void BM_ConnectionListPage(benchmark::State& state) {
    ShardedConnectionRegistry registry(std::chrono::seconds(60), benchCursor());
    utils::SystemClock clock;
    for (int64_t i = 0; i < state.range(0); ++i) {
        auto registered = registry.registerConnection("conn-" + std::to_string(i), clock.now());
        if (registered.has_error()) {
            state.SkipWithError(registered.error().message.c_str());
            return;
        }
    }

    ListOptions options;
    options.limit = 100;
    for (auto _ : state) {
        auto page = registry.list(options, clock.now());
        benchmark::DoNotOptimize(page);
    }
}
BENCHMARK(BM_ConnectionListPage)
    ->Arg(1000)
    ->Arg(100000)
    ->Unit(benchmark::kMicrosecond);

static void BM_SaveCommand(benchmark::State& state) {
    utils::SystemClock clock;
    InMemoryCommandAuditLog auditLog(clock, benchCursor());
    std::size_t i = 0;
    for (auto _ : state) {
        auto saved = auditLog.saveCommand(CommandKind::Restart,
                                          "agent-" + std::to_string(i++ % 1024), nullptr);
        benchmark::DoNotOptimize(saved);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_SaveCommand);

static void BM_ResolveAgentGroup(benchmark::State& state) {
    utils::SystemClock clock;
    std::vector<AgentGroup> groups;
    for (int64_t i = 0; i < state.range(0); ++i) {
        groups.push_back(AgentGroup::create(
            "group-" + std::to_string(i), static_cast<int>(i % 10),
            AgentSelector{{{"env", "prod"}, {"zone", "z" + std::to_string(i % 8)}}, {}},
            std::nullopt, clock.now(), "bench"));
    }

    PrioritySelectorResolver resolver;
    Attributes agent{{"env", "prod"}, {"zone", "z3"}, {"host.name", "node-a"}};
    for (auto _ : state) {
        auto resolved = resolver.resolve(agent, groups);
        benchmark::DoNotOptimize(resolved);
    }
}
BENCHMARK(BM_ResolveAgentGroup)
    ->Arg(10)
    ->Arg(1000)
    ->Unit(benchmark::kMicrosecond);

BENCHMARK_MAIN();
