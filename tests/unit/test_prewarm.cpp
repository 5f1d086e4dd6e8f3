/**
 * @file test_prewarm.cpp
 * @brief Unit tests for demand prediction and the prewarm/maintenance loop.
 */

#include "pool/demand_predictor.hpp"
#include "pool/prewarm_controller.hpp"
#include "substrate/simulated_substrate.hpp"

#include <gtest/gtest.h>
#include <filesystem>
#include <thread>

using namespace execution_engine;
using namespace std::chrono_literals;

// ─── EwmaPredictor ───────────────────────────

TEST(EwmaPredictorTest, UnknownRuntimeForecastsZero) {
    EwmaPredictor predictor(0.3);
    EXPECT_DOUBLE_EQ(predictor.forecast("python3"), 0.0);
    predictor.roll();
    EXPECT_DOUBLE_EQ(predictor.forecast("python3"), 0.0);
}

TEST(EwmaPredictorTest, FoldsIntervalCounts) {
    EwmaPredictor predictor(0.5);
    for (int i = 0; i < 4; ++i) predictor.record_request("python3");
    EXPECT_DOUBLE_EQ(predictor.forecast("python3"), 0.0);   // not rolled yet

    predictor.roll();
    EXPECT_DOUBLE_EQ(predictor.forecast("python3"), 2.0);

    // An idle interval decays the forecast
    predictor.roll();
    EXPECT_DOUBLE_EQ(predictor.forecast("python3"), 1.0);

    for (int i = 0; i < 3; ++i) predictor.record_request("python3");
    predictor.roll();
    EXPECT_DOUBLE_EQ(predictor.forecast("python3"), 2.0);
}

TEST(EwmaPredictorTest, RuntimesAreIndependent) {
    EwmaPredictor predictor(1.0);
    predictor.record_request("python3");
    predictor.record_request("node");
    predictor.record_request("node");
    predictor.roll();
    EXPECT_DOUBLE_EQ(predictor.forecast("python3"), 1.0);
    EXPECT_DOUBLE_EQ(predictor.forecast("node"), 2.0);
}

TEST(EwmaPredictorTest, AlphaIsClamped) {
    EwmaPredictor predictor(0.0);
    for (int i = 0; i < 100; ++i) predictor.record_request("shell");
    predictor.roll();
    EXPECT_NEAR(predictor.forecast("shell"), 1.0, 1e-9);
}

// ─── PrewarmController ───────────────────────

class PrewarmControllerTest : public ::testing::Test {
protected:
    std::filesystem::path root_;
    PoolConfig config_;
    std::unique_ptr<SimulatedSubstrate> substrate_a_;
    std::unique_ptr<SimulatedSubstrate> substrate_b_;
    std::unique_ptr<PoolManager> pool_a_;
    std::unique_ptr<PoolManager> pool_b_;
    NodeRegistry registry_{SchedulerConfig{}};
    EwmaPredictor predictor_{1.0};

    void SetUp() override {
        root_ = std::filesystem::temp_directory_path() / "ee_test_prewarm";
        std::filesystem::remove_all(root_);
        config_.safety_factor = 1.0f;
        substrate_a_ = std::make_unique<SimulatedSubstrate>(SimulatedSubstrate::Options{root_ / "a"});
        substrate_b_ = std::make_unique<SimulatedSubstrate>(SimulatedSubstrate::Options{root_ / "b"});
        pool_a_ = std::make_unique<PoolManager>("a", 8, config_, *substrate_a_, Logger(nullptr));
        pool_b_ = std::make_unique<PoolManager>("b", 8, config_, *substrate_b_, Logger(nullptr));
        registry_.add_node(NodeConfig{.id = "a", .substrate = "simulated"});
        registry_.add_node(NodeConfig{.id = "b", .substrate = "simulated"});
    }
    void TearDown() override {
        pool_a_.reset();
        pool_b_.reset();
        substrate_a_.reset();
        substrate_b_.reset();
        std::filesystem::remove_all(root_);
    }

    std::unique_ptr<PrewarmController> controller(std::vector<RuntimeProfile> runtimes) {
        auto c = std::make_unique<PrewarmController>(config_, std::move(runtimes), predictor_,
                                                     registry_, Logger(nullptr));
        c->add_node(*pool_a_, *substrate_a_);
        c->add_node(*pool_b_, *substrate_b_);
        return c;
    }

    void settle() {
        ASSERT_TRUE(pool_a_->wait_idle(2000ms));
        ASSERT_TRUE(pool_b_->wait_idle(2000ms));
    }

    static RuntimeProfile python(uint32_t min_warm = 0) {
        return RuntimeProfile{.id = "python3", .image = "python", .command = {"python3"},
                              .min_warm = min_warm};
    }
};

TEST_F(PrewarmControllerTest, KeepsMinimumWarm) {
    auto c = controller({python(1)});
    c->tick();
    settle();
    EXPECT_EQ(pool_a_->warm_count("python3"), 1u);
    EXPECT_EQ(pool_b_->warm_count("python3"), 1u);

    // Already at target: no further creations
    c->tick();
    settle();
    EXPECT_EQ(substrate_a_->units_created() + substrate_b_->units_created(), 2u);
    EXPECT_EQ(c->ticks(), 2u);
}

TEST_F(PrewarmControllerTest, SplitsForecastAcrossHealthyNodes) {
    auto c = controller({python()});
    for (int i = 0; i < 5; ++i) predictor_.record_request("python3");
    c->tick();
    settle();
    // ceil(5 / 2) per node
    EXPECT_EQ(pool_a_->warm_count("python3"), 3u);
    EXPECT_EQ(pool_b_->warm_count("python3"), 3u);
}

TEST_F(PrewarmControllerTest, NoDemandNoPrewarm) {
    auto c = controller({python()});
    c->tick();
    settle();
    EXPECT_EQ(substrate_a_->units_created(), 0u);
    EXPECT_EQ(substrate_b_->units_created(), 0u);
}

TEST_F(PrewarmControllerTest, FallingDemandShrinksToMinimum) {
    auto c = controller({python(1)});
    for (int i = 0; i < 6; ++i) predictor_.record_request("python3");
    c->tick();
    settle();
    EXPECT_EQ(pool_a_->warm_count("python3"), 3u);
    EXPECT_EQ(pool_b_->warm_count("python3"), 3u);

    // Alpha 1.0: an idle interval forecasts zero, leaving only min_warm
    c->tick();
    settle();
    EXPECT_EQ(pool_a_->warm_count("python3"), 1u);
    EXPECT_EQ(pool_b_->warm_count("python3"), 1u);
    EXPECT_EQ(substrate_a_->units_destroyed() + substrate_b_->units_destroyed(), 4u);
}

TEST_F(PrewarmControllerTest, DegradedNodeSkippedUntilHealthCheckPasses) {
    auto c = controller({python()});
    registry_.mark_degraded("b");
    substrate_b_->set_healthy(false);

    for (int i = 0; i < 4; ++i) predictor_.record_request("python3");
    c->tick();
    settle();
    // The whole forecast lands on the one healthy node
    EXPECT_EQ(pool_a_->warm_count("python3"), 4u);
    EXPECT_EQ(pool_b_->warm_count("python3"), 0u);
    EXPECT_TRUE(registry_.is_degraded("b"));

    substrate_b_->set_healthy(true);
    c->tick();
    EXPECT_FALSE(registry_.is_degraded("b"));
}

TEST_F(PrewarmControllerTest, ReapsExpiredUnits) {
    config_.idle_ttl_ms = 20;
    pool_a_ = std::make_unique<PoolManager>("a", 8, config_, *substrate_a_, Logger(nullptr));
    ASSERT_EQ(pool_a_->prewarm(python(), 2), 2u);
    settle();

    auto c = controller({python()});
    std::this_thread::sleep_for(60ms);
    c->tick();
    EXPECT_EQ(pool_a_->warm_count("python3"), 0u);
    settle();
    EXPECT_EQ(substrate_a_->units_destroyed(), 2u);
}

TEST_F(PrewarmControllerTest, HookRunsEveryTick) {
    auto c = controller({python()});
    int calls = 0;
    c->set_tick_hook([&calls] { ++calls; });
    c->tick();
    c->tick();
    EXPECT_EQ(calls, 2);
}

TEST_F(PrewarmControllerTest, BackgroundLoop) {
    config_.prewarm_interval_ms = 5;
    auto c = controller({python(1)});
    c->start();
    c->start();
    auto deadline = SteadyClock::now() + 2s;
    while (c->ticks() < 3 && SteadyClock::now() < deadline) {
        std::this_thread::sleep_for(5ms);
    }
    c->stop();
    EXPECT_GE(c->ticks(), 3u);
    const auto after_stop = c->ticks();
    std::this_thread::sleep_for(30ms);
    EXPECT_EQ(c->ticks(), after_stop);
    settle();
    EXPECT_EQ(pool_a_->warm_count("python3"), 1u);
}
