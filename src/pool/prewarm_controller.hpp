/**
 * @file prewarm_controller.hpp
 * @brief Periodic maintenance: prewarming, expiry reaping and degraded-node probes.
 */

#pragma once

#include "core/config.hpp"
#include "core/logger.hpp"
#include "pool/demand_predictor.hpp"
#include "pool/pool_manager.hpp"
#include "scheduler/node_registry.hpp"
#include "substrate/substrate.hpp"

#include <atomic>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

namespace execution_engine {

/**
 * @brief Drives every node pool toward its forecast warm count.
 *
 * Each tick: roll the predictor; for every runtime compute a per-node
 * target max(min_warm, ceil(forecast / healthy_nodes)) and prewarm healthy
 * nodes toward it; reap expired units everywhere; probe degraded nodes'
 * substrates and clear the flag on success.
 */
class PrewarmController {
public:
    PrewarmController(PoolConfig config, std::vector<RuntimeProfile> runtimes,
                      IDemandPredictor& predictor, NodeRegistry& registry, Logger logger);
    ~PrewarmController();

    PrewarmController(const PrewarmController&) = delete;
    PrewarmController& operator=(const PrewarmController&) = delete;

    /// Both must outlive the controller.
    void add_node(PoolManager& pool, IIsolationSubstrate& substrate);

    /// Invoked at the start of every tick (e.g. to refresh host snapshots).
    void set_tick_hook(std::function<void()> hook);

    /// Run one maintenance pass on the calling thread.
    void tick();

    void start();
    void stop();

    [[nodiscard]] uint64_t ticks() const noexcept { return ticks_.load(); }

private:
    struct NodeEntry {
        PoolManager* pool;
        IIsolationSubstrate* substrate;
    };

    void loop(std::stop_token stop);

    PoolConfig config_;
    std::vector<RuntimeProfile> runtimes_;
    IDemandPredictor& predictor_;
    NodeRegistry& registry_;
    Logger logger_;

    std::vector<NodeEntry> nodes_;
    std::function<void()> hook_;
    std::mutex tick_mutex_;
    std::mutex sleep_mutex_;
    std::condition_variable_any sleep_cv_;
    std::atomic<uint64_t> ticks_{0};
    std::jthread thread_;
};

}  // namespace execution_engine
