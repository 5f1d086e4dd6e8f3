/**
 * @file test_engine.cpp
 * @brief Unit tests for engine wiring: lifecycle, substrate factory, reuse rule.
 */

#include "engine/engine.hpp"
#include "substrate/process_substrate.hpp"
#include "substrate/simulated_substrate.hpp"

#include <gtest/gtest.h>
#include <filesystem>

using namespace execution_engine;

namespace {

class NullPipeline : public ITelemetryPipeline {
public:
    Result<void> push(const ExecutionMetrics&) override { return {}; }
    void flush() override {}
};

Config simulated_config(const std::filesystem::path& root) {
    Config config;
    config.nodes = {NodeConfig{.id = "n1", .max_units = 2, .substrate = "simulated"}};
    config.isolation.scratch_root = root;
    config.executor.thread_count = 2;
    config.pool.prewarm_interval_ms = 60000;
    return config;
}

Engine<MockMonitor>::Options options(Config config) {
    Engine<MockMonitor>::Options opts;
    opts.config = std::move(config);
    opts.telemetry = std::make_unique<NullPipeline>();
    return opts;
}

}  // namespace

// ─── Reuse rule ──────────────────────────────

TEST(UnitReusableTest, OnlyCleanCompletedRuns) {
    ExecutionResult result;
    result.state = ExecutionState::Completed;
    EXPECT_TRUE(unit_reusable(result, true));
    EXPECT_FALSE(unit_reusable(result, false));

    result.exit_code = 1;
    EXPECT_TRUE(unit_reusable(result, true));   // a failing program is still clean

    result.violations.push_back({ViolationKind::Network, "blocked"});
    EXPECT_FALSE(unit_reusable(result, true));

    for (auto state : {ExecutionState::TimedOut, ExecutionState::Killed, ExecutionState::Crashed}) {
        ExecutionResult other;
        other.state = state;
        EXPECT_FALSE(unit_reusable(other, true)) << to_string(state);
    }
}

// ─── Substrate factory ───────────────────────

TEST(MakeSubstrateTest, BuildsConfiguredKind) {
    IsolationConfig isolation;
    isolation.scratch_root = std::filesystem::temp_directory_path() / "ee_test_factory";

    auto process = make_substrate(NodeConfig{.id = "p", .substrate = "process"}, isolation,
                                  Logger(nullptr));
    ASSERT_TRUE(process.has_value());
    EXPECT_EQ((*process)->name(), "process");

    auto simulated = make_substrate(NodeConfig{.id = "s", .substrate = "simulated"}, isolation,
                                    Logger(nullptr));
    ASSERT_TRUE(simulated.has_value());
    EXPECT_EQ((*simulated)->name(), "simulated");

    auto unknown = make_substrate(NodeConfig{.id = "x", .substrate = "firecracker"}, isolation,
                                  Logger(nullptr));
    ASSERT_FALSE(unknown.has_value());
    EXPECT_EQ(unknown.error().code, ErrorCode::InvalidArgument);
    std::filesystem::remove_all(isolation.scratch_root);
}

// ─── Lifecycle ───────────────────────────────

class EngineLifecycleTest : public ::testing::Test {
protected:
    std::filesystem::path root_;

    void SetUp() override {
        root_ = std::filesystem::temp_directory_path() / "ee_test_engine";
        std::filesystem::remove_all(root_);
    }
    void TearDown() override { std::filesystem::remove_all(root_); }
};

TEST_F(EngineLifecycleTest, StartStop) {
    Engine<MockMonitor> engine(options(simulated_config(root_)));
    EXPECT_FALSE(engine.is_running());
    ASSERT_TRUE(engine.start().has_value());
    EXPECT_TRUE(engine.is_running());
    EXPECT_FALSE(engine.start().has_value());

    auto health = engine.health();
    EXPECT_TRUE(health.healthy);
    ASSERT_EQ(health.nodes.size(), 1u);
    EXPECT_EQ(health.nodes[0].node_id, "n1");
    EXPECT_EQ(health.active_requests, 0u);

    engine.stop();
    engine.stop();
    EXPECT_FALSE(engine.is_running());
    EXPECT_FALSE(engine.health().healthy);
}

TEST_F(EngineLifecycleTest, UnknownPolicyFailsStart) {
    auto config = simulated_config(root_);
    config.scheduler.policy = "random";
    Engine<MockMonitor> engine(options(std::move(config)));
    auto started = engine.start();
    ASSERT_FALSE(started.has_value());
    EXPECT_EQ(started.error().code, ErrorCode::InvalidArgument);
}

TEST_F(EngineLifecycleTest, UnknownSubstrateFailsStart) {
    auto config = simulated_config(root_);
    config.nodes[0].substrate = "vm";
    Engine<MockMonitor> engine(options(std::move(config)));
    EXPECT_FALSE(engine.start().has_value());
}

TEST_F(EngineLifecycleTest, RejectsWorkWhenStopped) {
    Engine<MockMonitor> engine(options(simulated_config(root_)));
    ExecutionRequest request;
    request.request_id = "r1";
    request.runtime = "shell";
    request.source.inline_code = "true";

    auto sync = engine.submit(request);
    ASSERT_FALSE(sync.has_value());
    EXPECT_EQ(sync.error().code, ErrorCode::Cancelled);

    auto async = engine.submit_async(request).get();
    ASSERT_FALSE(async.has_value());
    EXPECT_EQ(async.error().code, ErrorCode::Cancelled);
    EXPECT_FALSE(engine.cancel("r1"));
}

TEST_F(EngineLifecycleTest, SubstrateOverrideAndAccessors) {
    auto opts = options(simulated_config(root_));
    opts.substrates["n1"] = std::make_unique<SimulatedSubstrate>(
        SimulatedSubstrate::Options{.units_root = root_ / "override"});
    auto* injected = opts.substrates["n1"].get();

    Engine<MockMonitor> engine(std::move(opts));
    EXPECT_EQ(engine.substrate("n1"), injected);
    EXPECT_NE(engine.pool("n1"), nullptr);
    EXPECT_NE(engine.monitor("n1"), nullptr);
    EXPECT_EQ(engine.pool("missing"), nullptr);
    EXPECT_EQ(engine.monitor("missing"), nullptr);
    EXPECT_EQ(engine.pool_stats().size(), 1u);
    EXPECT_EQ(engine.pool_stats()[0].max_units, 2u);
}

TEST_F(EngineLifecycleTest, MaintenanceRefreshesHostSnapshots) {
    Engine<MockMonitor> engine(options(simulated_config(root_)));
    engine.monitor("n1")->set_cpu(63.0f);
    engine.maintenance().tick();
    auto health = engine.health();
    ASSERT_EQ(health.nodes.size(), 1u);
    EXPECT_FLOAT_EQ(health.nodes[0].host.cpu_usage_percent, 63.0f);
}
