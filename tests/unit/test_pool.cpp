/**
 * @file test_pool.cpp
 * @brief Unit tests for PoolManager and PoolUnitHandle.
 */

#include "pool/pool_manager.hpp"
#include "substrate/simulated_substrate.hpp"

#include <gtest/gtest.h>
#include <atomic>
#include <filesystem>
#include <mutex>
#include <set>
#include <thread>

using namespace execution_engine;
using namespace std::chrono_literals;

namespace {

RuntimeProfile runtime(const std::string& id) {
    return RuntimeProfile{.id = id, .image = id, .command = {id, "{entry}"}};
}

SteadyTime in(std::chrono::milliseconds ms) { return SteadyClock::now() + ms; }

}  // namespace

class PoolManagerTest : public ::testing::Test {
protected:
    std::filesystem::path root_;
    std::unique_ptr<SimulatedSubstrate> substrate_;
    std::unique_ptr<PoolManager> pool_;
    PoolConfig config_;
    RuntimeProfile python_ = runtime("python3");
    RuntimeProfile shell_ = runtime("shell");

    void SetUp() override {
        root_ = std::filesystem::temp_directory_path() / "ee_test_pool";
        std::filesystem::remove_all(root_);
        substrate_ = std::make_unique<SimulatedSubstrate>(SimulatedSubstrate::Options{root_});
        make_pool(4);
    }
    void TearDown() override {
        pool_.reset();
        substrate_.reset();
        std::filesystem::remove_all(root_);
    }

    void make_pool(uint32_t max_units) {
        pool_.reset();
        pool_ = std::make_unique<PoolManager>("node-a", max_units, config_, *substrate_,
                                              Logger(nullptr));
    }

    PoolUnitHandle take(const RuntimeProfile& rt) {
        auto handle = pool_->acquire(rt, in(2000ms));
        EXPECT_TRUE(handle.has_value()) << handle.error().message;
        return handle ? std::move(*handle) : PoolUnitHandle{};
    }

    void give_back(PoolUnitHandle handle, ReleaseOutcome outcome = ReleaseOutcome::Clean) {
        auto released = pool_->release(std::move(handle), outcome);
        EXPECT_TRUE(released.has_value());
    }
};

TEST_F(PoolManagerTest, ColdStartThenWarmReuse) {
    auto first = take(python_);
    ASSERT_TRUE(first);
    EXPECT_FALSE(first.served_warm());
    EXPECT_EQ(first.node_id(), "node-a");
    const auto id = first.id();
    give_back(std::move(first));
    EXPECT_EQ(pool_->warm_count("python3"), 1u);

    auto second = take(python_);
    EXPECT_TRUE(second.served_warm());
    EXPECT_EQ(second.id(), id);
    EXPECT_EQ(second.reuse_count(), 1u);
    give_back(std::move(second));

    auto stats = pool_->stats();
    EXPECT_EQ(stats.cold_starts, 1u);
    EXPECT_EQ(stats.warm_hits, 1u);
    EXPECT_EQ(stats.created_total, 1u);
    EXPECT_EQ(stats.warm, 1u);
    EXPECT_EQ(stats.warm_by_runtime.at("python3"), 1u);
}

TEST_F(PoolManagerTest, DirtyUnitIsNeverReused) {
    auto handle = take(python_);
    const auto id = handle.id();
    give_back(std::move(handle), ReleaseOutcome::Dirty);

    EXPECT_EQ(pool_->warm_count("python3"), 0u);
    ASSERT_TRUE(pool_->wait_idle(2000ms));
    EXPECT_EQ(substrate_->units_destroyed(), 1u);

    auto next = take(python_);
    EXPECT_NE(next.id(), id);
    EXPECT_FALSE(next.served_warm());
    give_back(std::move(next));
}

TEST_F(PoolManagerTest, WarmUnitsServedFifo) {
    auto a = take(python_);
    auto b = take(python_);
    const auto a_id = a.id();
    const auto b_id = b.id();
    give_back(std::move(a));
    give_back(std::move(b));

    auto first = pool_->try_acquire_warm("python3");
    auto second = pool_->try_acquire_warm("python3");
    ASSERT_TRUE(first.has_value());
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(first->id(), a_id);
    EXPECT_EQ(second->id(), b_id);
    EXPECT_FALSE(pool_->try_acquire_warm("python3").has_value());
    give_back(std::move(*first));
    give_back(std::move(*second));
}

TEST_F(PoolManagerTest, ExhaustedAtCeiling) {
    make_pool(2);
    auto a = take(python_);
    auto b = take(python_);

    auto c = pool_->acquire(python_, in(500ms));
    ASSERT_FALSE(c.has_value());
    EXPECT_EQ(c.error().code, ErrorCode::PoolExhausted);
    EXPECT_TRUE(c.error().is_retryable());
    EXPECT_EQ(pool_->stats().exhausted, 1u);

    give_back(std::move(a));
    give_back(std::move(b));
}

TEST_F(PoolManagerTest, EvictsOtherRuntimeAtCeiling) {
    make_pool(1);
    give_back(take(python_));
    ASSERT_EQ(pool_->warm_count("python3"), 1u);

    auto handle = take(shell_);
    ASSERT_TRUE(handle);
    EXPECT_EQ(handle.unit().runtime, "shell");
    EXPECT_EQ(pool_->warm_count("python3"), 0u);
    give_back(std::move(handle));
    ASSERT_TRUE(pool_->wait_idle(2000ms));
    EXPECT_EQ(substrate_->units_destroyed(), 1u);
}

TEST_F(PoolManagerTest, DeadlineWhileCreating) {
    substrate_->set_create_latency(300ms);
    auto handle = pool_->acquire(python_, in(30ms));
    ASSERT_FALSE(handle.has_value());
    EXPECT_EQ(handle.error().code, ErrorCode::SchedulingTimeout);

    // The abandoned creation still lands in the warm pool
    ASSERT_TRUE(pool_->wait_idle(2000ms));
    EXPECT_EQ(pool_->warm_count("python3"), 1u);
}

TEST_F(PoolManagerTest, StopRequestCancelsWait) {
    substrate_->set_create_latency(300ms);
    std::stop_source source;
    std::jthread canceller([&source] {
        std::this_thread::sleep_for(30ms);
        source.request_stop();
    });
    auto handle = pool_->acquire(python_, in(5000ms), source.get_token());
    ASSERT_FALSE(handle.has_value());
    EXPECT_EQ(handle.error().code, ErrorCode::Cancelled);
    ASSERT_TRUE(pool_->wait_idle(2000ms));
}

TEST_F(PoolManagerTest, CreationFailureIsCapacityError) {
    substrate_->fail_next_creates(1);
    auto handle = pool_->acquire(python_, in(2000ms));
    ASSERT_FALSE(handle.has_value());
    EXPECT_EQ(handle.error().code, ErrorCode::NoAvailableCapacity);
    EXPECT_EQ(pool_->stats().creation_failures, 1u);
    EXPECT_EQ(pool_->stats().occupied(), 0u);
}

TEST_F(PoolManagerTest, ReuseBudgetRetiresUnit) {
    config_.max_unit_reuses = 2;
    make_pool(4);
    give_back(take(python_));
    EXPECT_EQ(pool_->warm_count("python3"), 1u);
    give_back(take(python_));
    EXPECT_EQ(pool_->warm_count("python3"), 0u);
    ASSERT_TRUE(pool_->wait_idle(2000ms));
    EXPECT_EQ(substrate_->units_destroyed(), 1u);
}

TEST_F(PoolManagerTest, ReapsIdleUnits) {
    config_.idle_ttl_ms = 20;
    config_.safety_factor = 1.0f;
    make_pool(4);
    EXPECT_EQ(pool_->prewarm(python_, 2), 2u);
    ASSERT_TRUE(pool_->wait_idle(2000ms));
    EXPECT_EQ(pool_->warm_count("python3"), 2u);

    std::this_thread::sleep_for(60ms);
    EXPECT_EQ(pool_->reap_expired(), 2u);
    EXPECT_EQ(pool_->warm_count("python3"), 0u);
}

TEST_F(PoolManagerTest, PrewarmAppliesSafetyFactorAndCapacity) {
    config_.safety_factor = 1.5f;
    make_pool(4);
    EXPECT_EQ(pool_->prewarm(python_, 2), 3u);
    EXPECT_EQ(pool_->prewarm(python_, 2), 0u);    // creations in flight count
    EXPECT_EQ(pool_->prewarm(shell_, 4), 1u);     // one slot left
    ASSERT_TRUE(pool_->wait_idle(2000ms));
    EXPECT_EQ(pool_->stats().warm, 4u);
}

TEST_F(PoolManagerTest, PrewarmShrinksSurplusWarmUnits) {
    config_.safety_factor = 1.0f;
    make_pool(8);
    EXPECT_EQ(pool_->prewarm(python_, 6), 6u);
    ASSERT_TRUE(pool_->wait_idle(2000ms));
    EXPECT_EQ(pool_->warm_count("python3"), 6u);

    EXPECT_EQ(pool_->prewarm(python_, 1), 0u);
    EXPECT_EQ(pool_->warm_count("python3"), 1u);
    ASSERT_TRUE(pool_->wait_idle(2000ms));
    EXPECT_EQ(substrate_->units_destroyed(), 5u);

    auto survivor = take(python_);
    ASSERT_TRUE(survivor);
    EXPECT_TRUE(survivor.served_warm());
    give_back(std::move(survivor));

    EXPECT_EQ(pool_->prewarm(python_, 0), 0u);
    EXPECT_EQ(pool_->warm_count("python3"), 0u);
    ASSERT_TRUE(pool_->wait_idle(2000ms));
    EXPECT_EQ(substrate_->units_destroyed(), 6u);
    EXPECT_EQ(pool_->stats().warm, 0u);
}

TEST_F(PoolManagerTest, PrewarmShrinkLeavesOtherRuntimesAlone) {
    config_.safety_factor = 1.0f;
    make_pool(8);
    EXPECT_EQ(pool_->prewarm(python_, 2), 2u);
    EXPECT_EQ(pool_->prewarm(shell_, 2), 2u);
    ASSERT_TRUE(pool_->wait_idle(2000ms));

    EXPECT_EQ(pool_->prewarm(python_, 0), 0u);
    ASSERT_TRUE(pool_->wait_idle(2000ms));
    EXPECT_EQ(pool_->warm_count("python3"), 0u);
    EXPECT_EQ(pool_->warm_count("shell"), 2u);
}

TEST_F(PoolManagerTest, DroppedHandleIsDestroyed) {
    {
        auto handle = take(python_);
        ASSERT_TRUE(handle);
    }
    EXPECT_EQ(pool_->stats().acquired, 0u);
    EXPECT_EQ(pool_->warm_count("python3"), 0u);
    ASSERT_TRUE(pool_->wait_idle(2000ms));
    EXPECT_EQ(substrate_->units_destroyed(), 1u);
}

TEST_F(PoolManagerTest, RejectsForeignAndEmptyHandles) {
    PoolManager other("node-b", 2, config_, *substrate_, Logger(nullptr));
    auto foreign = other.acquire(python_, in(2000ms));
    ASSERT_TRUE(foreign.has_value());

    auto released = pool_->release(std::move(*foreign), ReleaseOutcome::Clean);
    ASSERT_FALSE(released.has_value());
    EXPECT_EQ(released.error().code, ErrorCode::InvalidArgument);

    auto empty = pool_->release(PoolUnitHandle{}, ReleaseOutcome::Clean);
    ASSERT_FALSE(empty.has_value());
    EXPECT_EQ(empty.error().code, ErrorCode::InvalidArgument);
    // The rejected handle was consumed without release; its drop marked the unit dirty
    ASSERT_TRUE(other.wait_idle(2000ms));
    EXPECT_EQ(other.stats().acquired, 0u);
}

TEST_F(PoolManagerTest, ShutdownFailsAcquisitions) {
    give_back(take(python_));
    pool_->shutdown();
    pool_->shutdown();

    auto handle = pool_->acquire(python_, in(500ms));
    ASSERT_FALSE(handle.has_value());
    EXPECT_EQ(handle.error().code, ErrorCode::Cancelled);
    EXPECT_FALSE(pool_->try_acquire_warm("python3").has_value());
    ASSERT_TRUE(pool_->wait_idle(2000ms));
    EXPECT_EQ(substrate_->units_destroyed(), 1u);
}

TEST_F(PoolManagerTest, ConcurrentAcquireNeverSharesUnits) {
    constexpr int kThreads = 8;
    constexpr int kRounds = 25;
    make_pool(4);

    std::mutex held_mutex;
    std::set<UnitId> held;
    std::atomic<int> shared{0};
    std::atomic<int> served{0};
    std::atomic<int> unexpected{0};

    {
        std::vector<std::jthread> threads;
        for (int t = 0; t < kThreads; ++t) {
            threads.emplace_back([&] {
                for (int i = 0; i < kRounds; ++i) {
                    auto handle = pool_->acquire(python_, in(5000ms));
                    if (!handle) {
                        if (handle.error().code != ErrorCode::PoolExhausted) unexpected.fetch_add(1);
                        std::this_thread::yield();
                        continue;
                    }
                    {
                        std::lock_guard lock(held_mutex);
                        if (!held.insert(handle->id()).second) shared.fetch_add(1);
                    }
                    std::this_thread::sleep_for(100us);
                    {
                        std::lock_guard lock(held_mutex);
                        held.erase(handle->id());
                    }
                    if (pool_->release(std::move(*handle), ReleaseOutcome::Clean)) {
                        served.fetch_add(1);
                    }
                }
            });
        }
    }

    EXPECT_EQ(shared.load(), 0);
    EXPECT_EQ(unexpected.load(), 0);
    EXPECT_GT(served.load(), 0);
    auto stats = pool_->stats();
    EXPECT_LE(stats.created_total, 4u);
    EXPECT_EQ(stats.acquired, 0u);
    EXPECT_LE(stats.occupied(), 4u);
}
