/**
 * @file prewarm_controller.cpp
 * @brief PrewarmController implementation.
 */

#include "pool/prewarm_controller.hpp"

#include <algorithm>
#include <cmath>

namespace execution_engine {

PrewarmController::PrewarmController(PoolConfig config, std::vector<RuntimeProfile> runtimes,
                                     IDemandPredictor& predictor, NodeRegistry& registry,
                                     Logger logger)
    : config_(config)
    , runtimes_(std::move(runtimes))
    , predictor_(predictor)
    , registry_(registry)
    , logger_(std::move(logger)) {}

PrewarmController::~PrewarmController() {
    stop();
}

void PrewarmController::add_node(PoolManager& pool, IIsolationSubstrate& substrate) {
    std::lock_guard lock(tick_mutex_);
    nodes_.push_back(NodeEntry{&pool, &substrate});
}

void PrewarmController::set_tick_hook(std::function<void()> hook) {
    std::lock_guard lock(tick_mutex_);
    hook_ = std::move(hook);
}

void PrewarmController::tick() {
    std::lock_guard lock(tick_mutex_);
    if (hook_) hook_();

    predictor_.roll();

    std::vector<NodeEntry> healthy;
    for (const auto& node : nodes_) {
        if (!registry_.is_degraded(node.pool->node_id())) healthy.push_back(node);
    }

    if (!healthy.empty()) {
        for (const auto& runtime : runtimes_) {
            double share = predictor_.forecast(runtime.id) / static_cast<double>(healthy.size());
            auto target = std::max<uint32_t>(runtime.min_warm,
                                             static_cast<uint32_t>(std::ceil(share)));
            for (const auto& node : healthy) {
                node.pool->prewarm(runtime, target);
            }
        }
    }

    for (const auto& node : nodes_) {
        if (auto reaped = node.pool->reap_expired(); reaped > 0) {
            logger_.debug("reaped " + std::to_string(reaped) + " expired units on "
                          + node.pool->node_id());
        }

        const auto& id = node.pool->node_id();
        if (!registry_.is_degraded(id)) continue;
        if (auto probe = node.substrate->probe(); probe) {
            registry_.clear_degraded(id);
            logger_.info("node " + id + " passed its health probe, no longer degraded");
        } else {
            logger_.warn("node " + id + " still degraded: " + probe.error().message);
        }
    }

    ticks_.fetch_add(1);
}

void PrewarmController::start() {
    if (thread_.joinable()) return;
    thread_ = std::jthread([this](std::stop_token stop) { loop(stop); });
    logger_.info("maintenance loop started, interval "
                 + std::to_string(config_.prewarm_interval_ms) + "ms");
}

void PrewarmController::stop() {
    if (thread_.joinable()) {
        thread_.request_stop();
        sleep_cv_.notify_all();
        thread_.join();
    }
}

void PrewarmController::loop(std::stop_token stop) {
    const auto interval = std::chrono::milliseconds(std::max<uint32_t>(config_.prewarm_interval_ms, 1));
    while (!stop.stop_requested()) {
        tick();
        std::unique_lock lock(sleep_mutex_);
        sleep_cv_.wait_for(lock, stop, interval, [] { return false; });
    }
}

}  // namespace execution_engine
