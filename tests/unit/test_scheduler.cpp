/**
 * @file test_scheduler.cpp
 * @brief Unit tests for ranking, the placement policies, the node registry
 *        and the placement scheduler.
 */

#include "scheduler/least_loaded_policy.hpp"
#include "scheduler/node_registry.hpp"
#include "scheduler/placement_scheduler.hpp"
#include "scheduler/weighted_policy.hpp"
#include "substrate/simulated_substrate.hpp"

#include <gtest/gtest.h>
#include <filesystem>

using namespace execution_engine;
using namespace std::chrono_literals;

// ─── Test Fixtures ───────────────────────────

namespace {

constexpr uint64_t kGiB = 1024ULL * 1024 * 1024;

NodeView make_node(const std::string& id, float cpu_pct = 0.0f, size_t warm = 0) {
    NodeView node;
    node.node_id = id;
    node.host.node_id = id;
    node.host.cpu_usage_percent = cpu_pct;
    node.host.memory_total_bytes = 16 * kGiB;
    node.host.memory_available_bytes = 16 * kGiB;
    node.cpu_capacity_millicores = 8000;
    node.memory_capacity_bytes = 16 * kGiB;
    node.warm_units = warm;
    return node;
}

PlacementQuery make_query(uint32_t millicores = 1000, uint64_t memory = kGiB) {
    PlacementQuery query;
    query.runtime = "python3";
    query.cpu_millicores = millicores;
    query.memory_bytes = memory;
    return query;
}

std::vector<NodeId> ids(const std::vector<RankedNode>& ranked) {
    std::vector<NodeId> out;
    for (const auto& r : ranked) out.push_back(r.node_id);
    return out;
}

}  // namespace

// ─── Eligibility and ordering ────────────────

TEST(RankingTest, Eligibility) {
    auto query = make_query();
    auto node = make_node("a");
    EXPECT_TRUE(is_eligible(node, query));

    node.degraded = true;
    EXPECT_FALSE(is_eligible(node, query));
    node.degraded = false;

    query.excluded = {"a"};
    EXPECT_FALSE(is_eligible(node, query));
    query.excluded.clear();

    node.cpu_committed_millicores = 7500;
    EXPECT_FALSE(is_eligible(node, query));
    node.cpu_committed_millicores = 7000;
    EXPECT_TRUE(is_eligible(node, query));   // exactly fits

    node.memory_committed_bytes = 15 * kGiB + 1;
    EXPECT_FALSE(is_eligible(node, query));
}

TEST(RankingTest, NearTiesGoToLeastLoaded) {
    std::vector<RankedNode> ranked = {
        {.node_id = "c", .score = 0.5f, .load = 0.0f},
        {.node_id = "a", .score = 0.9f, .load = 0.6f},
        {.node_id = "b", .score = 0.9005f, .load = 0.2f},
        {.node_id = "d", .score = 0.9f, .load = 0.6f},
    };
    order_ranking(ranked, 1e-3f);
    EXPECT_EQ(ids(ranked), (std::vector<NodeId>{"b", "a", "d", "c"}));

    // With no tolerance the raw score decides
    order_ranking(ranked, 0.0f);
    EXPECT_EQ(ranked.front().node_id, "b");
    EXPECT_EQ(ranked.back().node_id, "c");
}

TEST(RankingTest, HeadroomUsesTighterOfCommittedAndHost) {
    auto node = make_node("a", 75.0f);
    EXPECT_NEAR(node.cpu_headroom(), 0.25f, 1e-5f);
    node.cpu_committed_millicores = 7000;
    EXPECT_NEAR(node.cpu_headroom(), 0.125f, 1e-5f);

    node.host.memory_available_bytes = 4 * kGiB;
    EXPECT_NEAR(node.memory_headroom(), 0.25f, 1e-5f);
    EXPECT_NEAR(node.load(), 1.0f - (0.125f + 0.25f) / 2.0f, 1e-5f);
}

// ─── WeightedPolicy ──────────────────────────

TEST(WeightedPolicyTest, Name) {
    EXPECT_EQ(WeightedPolicy{SchedulerConfig{}}.name(), "weighted");
}

TEST(WeightedPolicyTest, ScoreCombinesSignals) {
    WeightedPolicy policy{SchedulerConfig{}};
    auto query = make_query();

    auto idle = make_node("a", 0.0f, 2);
    // warm 2/4, full headroom, no failures, no affinity
    EXPECT_NEAR(policy.score(idle, query), 0.4f * 0.5f + 0.3f + 0.2f, 1e-5f);

    idle.failure_rate = 0.5f;
    EXPECT_NEAR(policy.score(idle, query), 0.4f * 0.5f + 0.3f + 0.1f, 1e-5f);

    idle.served_workspace = true;
    EXPECT_NEAR(policy.score(idle, query), 0.4f * 0.5f + 0.3f + 0.1f + 0.1f, 1e-5f);
}

TEST(WeightedPolicyTest, WarmSaturates) {
    WeightedPolicy policy{SchedulerConfig{}};
    auto query = make_query();
    EXPECT_FLOAT_EQ(policy.score(make_node("a", 0.0f, 4), query),
                    policy.score(make_node("a", 0.0f, 40), query));
    EXPECT_LT(policy.score(make_node("a", 0.0f, 1), query),
              policy.score(make_node("a", 0.0f, 4), query));
}

TEST(WeightedPolicyTest, PrefersWarmNode) {
    WeightedPolicy policy{SchedulerConfig{}};
    std::vector<NodeView> nodes = {make_node("a", 10.0f, 0), make_node("b", 30.0f, 3)};
    auto ranked = policy.rank(make_query(), nodes);
    ASSERT_EQ(ranked.size(), 2u);
    EXPECT_EQ(ranked[0].node_id, "b");
    EXPECT_TRUE(ranked[0].warm);
    EXPECT_FALSE(ranked[1].warm);
}

TEST(WeightedPolicyTest, ExplicitAffinityBreaksEvenNodes) {
    WeightedPolicy policy{SchedulerConfig{}};
    std::vector<NodeView> nodes = {make_node("a"), make_node("b")};
    auto query = make_query();
    EXPECT_EQ(policy.rank(query, nodes).front().node_id, "a");

    query.affinity = {"b"};
    EXPECT_EQ(policy.rank(query, nodes).front().node_id, "b");
}

TEST(WeightedPolicyTest, SkipsIneligibleNodes) {
    WeightedPolicy policy{SchedulerConfig{}};
    auto degraded = make_node("a", 0.0f, 4);
    degraded.degraded = true;
    auto full = make_node("b");
    full.cpu_committed_millicores = 8000;
    std::vector<NodeView> nodes = {degraded, full, make_node("c", 90.0f)};

    auto ranked = policy.rank(make_query(), nodes);
    EXPECT_EQ(ids(ranked), std::vector<NodeId>{"c"});
    EXPECT_TRUE(policy.rank(make_query(), {}).empty());
}

// ─── LeastLoadedPolicy ───────────────────────

TEST(LeastLoadedPolicyTest, IgnoresWarmUnits) {
    LeastLoadedPolicy policy;
    EXPECT_EQ(policy.name(), "least_loaded");
    std::vector<NodeView> nodes = {make_node("a", 60.0f, 4), make_node("b", 10.0f, 0),
                                   make_node("c", 30.0f, 1)};
    auto ranked = policy.rank(make_query(), nodes);
    EXPECT_EQ(ids(ranked), (std::vector<NodeId>{"b", "c", "a"}));
    EXPECT_TRUE(ranked.back().warm);
}

TEST(MakePolicyTest, SelectsByName) {
    SchedulerConfig config;
    auto weighted = make_policy(config);
    ASSERT_TRUE(weighted.has_value());
    EXPECT_EQ((*weighted)->name(), "weighted");

    config.policy = "least_loaded";
    auto least = make_policy(config);
    ASSERT_TRUE(least.has_value());
    EXPECT_EQ((*least)->name(), "least_loaded");

    config.policy = "random";
    auto unknown = make_policy(config);
    ASSERT_FALSE(unknown.has_value());
    EXPECT_EQ(unknown.error().code, ErrorCode::InvalidArgument);
}

// ─── NodeRegistry ────────────────────────────

class NodeRegistryTest : public ::testing::Test {
protected:
    SchedulerConfig config_;
    std::unique_ptr<NodeRegistry> registry_;

    void SetUp() override {
        config_.failure_window = 4;
        config_.degraded_after_failures = 3;
        registry_ = std::make_unique<NodeRegistry>(config_);
        registry_->add_node(NodeConfig{.id = "a", .cpu_millicores = 2000, .memory_mb = 1024});
        registry_->add_node(NodeConfig{.id = "b", .cpu_millicores = 4000, .memory_mb = 4096});
    }
};

TEST_F(NodeRegistryTest, RegistrationOrder) {
    EXPECT_EQ(registry_->node_ids(), (std::vector<NodeId>{"a", "b"}));
    EXPECT_EQ(registry_->size(), 2u);
    EXPECT_TRUE(registry_->has_node("b"));
    EXPECT_FALSE(registry_->has_node("z"));
}

TEST_F(NodeRegistryTest, ReserveWithinCapacity) {
    const uint64_t mb = 1024 * 1024;
    EXPECT_TRUE(registry_->reserve("a", 1500, 512 * mb));
    EXPECT_FALSE(registry_->reserve("a", 1000, 10 * mb));   // cpu
    EXPECT_FALSE(registry_->reserve("a", 100, 600 * mb));   // memory
    EXPECT_TRUE(registry_->reserve("a", 500, 512 * mb));
    EXPECT_FALSE(registry_->reserve("z", 1, 1));

    auto health = registry_->health();
    EXPECT_EQ(health[0].cpu_committed_millicores, 2000u);
    EXPECT_EQ(health[0].memory_committed_bytes, 1024 * mb);

    registry_->unreserve("a", 1500, 512 * mb);
    registry_->unreserve("a", 5000, 5000 * mb);    // never goes negative
    health = registry_->health();
    EXPECT_EQ(health[0].cpu_committed_millicores, 0u);
    EXPECT_EQ(health[0].memory_committed_bytes, 0u);
}

TEST_F(NodeRegistryTest, ConsecutiveSetupFailuresDegrade) {
    EXPECT_FALSE(registry_->record_failure("a", true));
    EXPECT_FALSE(registry_->record_failure("a", true));
    registry_->record_success("a");                       // resets the streak
    EXPECT_FALSE(registry_->record_failure("a", true));
    EXPECT_FALSE(registry_->record_failure("a", true));
    EXPECT_TRUE(registry_->record_failure("a", true));
    EXPECT_FALSE(registry_->record_failure("a", true));   // only the transition reports
    EXPECT_TRUE(registry_->is_degraded("a"));
    EXPECT_EQ(registry_->degraded_nodes(), std::vector<NodeId>{"a"});

    registry_->clear_degraded("a");
    EXPECT_FALSE(registry_->is_degraded("a"));
    EXPECT_EQ(registry_->health()[0].consecutive_setup_failures, 0u);
    EXPECT_FLOAT_EQ(registry_->health()[0].failure_rate, 0.0f);
}

TEST_F(NodeRegistryTest, PlacementFailuresDoNotDegrade) {
    for (int i = 0; i < 10; ++i) registry_->record_failure("b", false);
    EXPECT_FALSE(registry_->is_degraded("b"));
    EXPECT_FLOAT_EQ(registry_->health()[1].failure_rate, 1.0f);
}

TEST_F(NodeRegistryTest, FailureRateOverWindow) {
    registry_->record_failure("b", false);
    registry_->record_success("b");
    EXPECT_FLOAT_EQ(registry_->health()[1].failure_rate, 0.5f);
    for (int i = 0; i < 4; ++i) registry_->record_success("b");
    EXPECT_FLOAT_EQ(registry_->health()[1].failure_rate, 0.0f);
}

TEST_F(NodeRegistryTest, ViewsCarryLocalityAndWarmCounts) {
    registry_->remember_workspace("ws-1", "b");
    registry_->remember_workspace("", "a");
    EXPECT_TRUE(registry_->workspace_node("ws-1") == NodeId{"b"});
    EXPECT_FALSE(registry_->workspace_node("ws-2").has_value());

    ResourceSnapshot snap;
    snap.cpu_usage_percent = 42.0f;
    registry_->update_snapshot("a", snap);

    auto query = make_query();
    query.workspace_id = "ws-1";
    auto views = registry_->views(query, [](const NodeId& id) -> size_t {
        return id == "a" ? 3 : 0;
    });
    ASSERT_EQ(views.size(), 2u);
    EXPECT_EQ(views[0].warm_units, 3u);
    EXPECT_FLOAT_EQ(views[0].host.cpu_usage_percent, 42.0f);
    EXPECT_EQ(views[0].host.node_id, "a");
    EXPECT_FALSE(views[0].served_workspace);
    EXPECT_TRUE(views[1].served_workspace);
    EXPECT_EQ(views[1].memory_capacity_bytes, 4096ULL * 1024 * 1024);
}

// ─── PlacementScheduler ──────────────────────

class PlacementSchedulerTest : public ::testing::Test {
protected:
    std::filesystem::path root_;
    SchedulerConfig config_;
    PoolConfig pool_config_;
    RuntimeProfile runtime_{.id = "python3", .image = "python", .command = {"python3"}};
    std::unique_ptr<SimulatedSubstrate> substrate_a_;
    std::unique_ptr<SimulatedSubstrate> substrate_b_;
    std::unique_ptr<PoolManager> pool_a_;
    std::unique_ptr<PoolManager> pool_b_;
    std::unique_ptr<NodeRegistry> registry_;
    std::unique_ptr<PlacementScheduler> scheduler_;

    void SetUp() override {
        root_ = std::filesystem::temp_directory_path() / "ee_test_placement";
        std::filesystem::remove_all(root_);
        config_.scheduling_timeout_ms = 2000;
        pool_config_.safety_factor = 1.0f;
        substrate_a_ = std::make_unique<SimulatedSubstrate>(SimulatedSubstrate::Options{root_ / "a"});
        substrate_b_ = std::make_unique<SimulatedSubstrate>(SimulatedSubstrate::Options{root_ / "b"});
        build(4);
    }
    void TearDown() override {
        scheduler_.reset();
        pool_a_.reset();
        pool_b_.reset();
        substrate_a_.reset();
        substrate_b_.reset();
        std::filesystem::remove_all(root_);
    }

    void build(uint32_t max_units) {
        scheduler_.reset();
        pool_a_ = std::make_unique<PoolManager>("a", max_units, pool_config_, *substrate_a_,
                                                Logger(nullptr));
        pool_b_ = std::make_unique<PoolManager>("b", max_units, pool_config_, *substrate_b_,
                                                Logger(nullptr));
        registry_ = std::make_unique<NodeRegistry>(config_);
        registry_->add_node(NodeConfig{.id = "a", .substrate = "simulated"});
        registry_->add_node(NodeConfig{.id = "b", .substrate = "simulated"});
        auto policy = make_policy(config_);
        ASSERT_TRUE(policy.has_value());
        scheduler_ = std::make_unique<PlacementScheduler>(config_, std::move(*policy),
                                                          *registry_, Logger(nullptr));
        scheduler_->add_pool(*pool_a_);
        scheduler_->add_pool(*pool_b_);
    }

    static ResourceGrant grant(uint32_t millicores = 500) {
        return ResourceGrant{.tier = "ephemeral", .timeout_ms = 1000, .memory_mb = 256,
                             .cpu_millicores = millicores, .disk_mb = 64, .max_processes = 16,
                             .max_file_size_mb = 16};
    }

    static ExecutionRequest request() {
        ExecutionRequest r;
        r.request_id = "req-1";
        r.runtime = "python3";
        r.source.inline_code = "print(1)";
        return r;
    }

    PoolManager& pool(const NodeId& id) { return id == "a" ? *pool_a_ : *pool_b_; }

    void release(Placement& placement, ReleaseOutcome outcome = ReleaseOutcome::Clean) {
        auto g = grant();
        registry_->unreserve(placement.node_id, g.cpu_millicores, g.memory_bytes());
        ASSERT_TRUE(pool(placement.node_id).release(std::move(placement.unit), outcome));
    }
};

TEST_F(PlacementSchedulerTest, ColdStartOnBestNode) {
    auto placement = scheduler_->place(runtime_, grant(), request());
    ASSERT_TRUE(placement.has_value()) << placement.error().message;
    EXPECT_EQ(placement->node_id, "a");
    EXPECT_FALSE(placement->served_warm);
    EXPECT_EQ(placement->attempts, 1u);
    EXPECT_TRUE(placement->unit);
    EXPECT_EQ(registry_->health()[0].cpu_committed_millicores, 500u);
    release(*placement);
    EXPECT_EQ(registry_->health()[0].cpu_committed_millicores, 0u);
}

TEST_F(PlacementSchedulerTest, PrefersWarmUnits) {
    ASSERT_EQ(pool_b_->prewarm(runtime_, 1), 1u);
    ASSERT_TRUE(pool_b_->wait_idle(2000ms));

    auto placement = scheduler_->place(runtime_, grant(), request());
    ASSERT_TRUE(placement.has_value());
    EXPECT_EQ(placement->node_id, "b");
    EXPECT_TRUE(placement->served_warm);
    EXPECT_EQ(substrate_a_->units_created(), 0u);
    release(*placement);
}

TEST_F(PlacementSchedulerTest, HonoursAffinity) {
    auto r = request();
    r.affinity = {"b"};
    auto placement = scheduler_->place(runtime_, grant(), r);
    ASSERT_TRUE(placement.has_value());
    EXPECT_EQ(placement->node_id, "b");
    release(*placement);
}

TEST_F(PlacementSchedulerTest, ReschedulesAfterCreationFailure) {
    substrate_a_->fail_next_creates(1);
    auto placement = scheduler_->place(runtime_, grant(), request());
    ASSERT_TRUE(placement.has_value()) << placement.error().message;
    EXPECT_EQ(placement->node_id, "b");
    EXPECT_EQ(placement->attempts, 2u);
    EXPECT_GT(registry_->health()[0].failure_rate, 0.0f);
    EXPECT_EQ(registry_->health()[0].cpu_committed_millicores, 0u);
    release(*placement);
}

TEST_F(PlacementSchedulerTest, RescheduleBudgetExhausted) {
    config_.max_reschedules = 0;
    build(4);
    substrate_a_->fail_next_creates(1);
    auto placement = scheduler_->place(runtime_, grant(), request());
    ASSERT_FALSE(placement.has_value());
    EXPECT_EQ(placement.error().code, ErrorCode::NoAvailableCapacity);
}

TEST_F(PlacementSchedulerTest, AllPoolsFullIsBackpressure) {
    build(1);
    auto first = scheduler_->place(runtime_, grant(), request());
    auto second = scheduler_->place(runtime_, grant(), request());
    ASSERT_TRUE(first.has_value());
    ASSERT_TRUE(second.has_value());
    EXPECT_NE(first->node_id, second->node_id);

    auto third = scheduler_->place(runtime_, grant(), request());
    ASSERT_FALSE(third.has_value());
    EXPECT_EQ(third.error().code, ErrorCode::PoolExhausted);

    release(*first);
    release(*second);
}

TEST_F(PlacementSchedulerTest, NoEligibleNode) {
    auto placement = scheduler_->place(runtime_, grant(64000), request());
    ASSERT_FALSE(placement.has_value());
    EXPECT_EQ(placement.error().code, ErrorCode::NoAvailableCapacity);
    EXPECT_EQ(substrate_a_->units_created() + substrate_b_->units_created(), 0u);
}

TEST_F(PlacementSchedulerTest, SkipsDegradedNode) {
    registry_->mark_degraded("a");
    auto placement = scheduler_->place(runtime_, grant(), request());
    ASSERT_TRUE(placement.has_value());
    EXPECT_EQ(placement->node_id, "b");
    release(*placement);
}

TEST_F(PlacementSchedulerTest, ColdStartDeadline) {
    config_.scheduling_timeout_ms = 50;
    build(4);
    substrate_a_->set_create_latency(400ms);
    auto placement = scheduler_->place(runtime_, grant(), request());
    ASSERT_FALSE(placement.has_value());
    EXPECT_EQ(placement.error().code, ErrorCode::SchedulingTimeout);
    EXPECT_EQ(registry_->health()[0].cpu_committed_millicores, 0u);
    ASSERT_TRUE(pool_a_->wait_idle(2000ms));
}

TEST_F(PlacementSchedulerTest, StoppedBeforePlacement) {
    std::stop_source source;
    source.request_stop();
    auto placement = scheduler_->place(runtime_, grant(), request(), source.get_token());
    ASSERT_FALSE(placement.has_value());
    EXPECT_EQ(placement.error().code, ErrorCode::Cancelled);
}
