/**
 * @file placement_scheduler.hpp
 * @brief Chooses a node and acquires a unit from its pool.
 *
 * Warm path: try warm units on ranked nodes, best first. Otherwise a cold
 * start on the best node, bounded by the scheduling timeout. A failed
 * acquisition is retried against the remaining candidates.
 */

#pragma once

#include "allocator/resource_allocator.hpp"
#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/result.hpp"
#include "pool/pool_manager.hpp"
#include "request/execution_request.hpp"
#include "scheduler/node_registry.hpp"
#include "scheduler/scheduler.hpp"

#include <memory>
#include <stop_token>
#include <unordered_map>

namespace execution_engine {

/**
 * @brief A unit reserved on a node for one request.
 *
 * The grant's cpu and memory stay committed on the node until the engine
 * unreserves them.
 */
struct Placement {
    NodeId node_id;
    PoolUnitHandle unit;
    bool served_warm = false;
    uint32_t attempts = 0;
    float score = 0.0f;
};

/// Policy named in the scheduler configuration.
[[nodiscard]] Result<std::unique_ptr<ISchedulingPolicy>> make_policy(const SchedulerConfig& config);

class PlacementScheduler {
public:
    PlacementScheduler(SchedulerConfig config, std::unique_ptr<ISchedulingPolicy> policy,
                       NodeRegistry& registry, Logger logger);

    /// Register a node's pool. The pool must outlive the scheduler.
    void add_pool(PoolManager& pool);

    /**
     * @brief Place a request.
     *
     * @return SchedulingTimeout when the cold start misses the deadline,
     *         PoolExhausted when every attempt hit pool backpressure,
     *         NoAvailableCapacity otherwise, Cancelled on stop request.
     */
    Result<Placement> place(const RuntimeProfile& runtime,
                            const ResourceGrant& grant,
                            const ExecutionRequest& request,
                            std::stop_token stop = {});

    [[nodiscard]] const ISchedulingPolicy& policy() const noexcept { return *policy_; }

private:
    SchedulerConfig config_;
    std::unique_ptr<ISchedulingPolicy> policy_;
    NodeRegistry& registry_;
    Logger logger_;
    std::unordered_map<NodeId, PoolManager*> pools_;
};

}  // namespace execution_engine
