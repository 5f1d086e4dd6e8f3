/**
 * @file placement_scheduler.cpp
 * @brief PlacementScheduler implementation.
 */

#include "scheduler/placement_scheduler.hpp"

#include "scheduler/least_loaded_policy.hpp"
#include "scheduler/weighted_policy.hpp"

namespace execution_engine {

Result<std::unique_ptr<ISchedulingPolicy>> make_policy(const SchedulerConfig& config) {
    if (config.policy == "weighted") {
        return std::unique_ptr<ISchedulingPolicy>(std::make_unique<WeightedPolicy>(config));
    }
    if (config.policy == "least_loaded") {
        return std::unique_ptr<ISchedulingPolicy>(std::make_unique<LeastLoadedPolicy>());
    }
    return Error{ErrorCode::InvalidArgument, "unknown scheduler policy '" + config.policy + "'"};
}

PlacementScheduler::PlacementScheduler(SchedulerConfig config,
                                       std::unique_ptr<ISchedulingPolicy> policy,
                                       NodeRegistry& registry, Logger logger)
    : config_(std::move(config))
    , policy_(std::move(policy))
    , registry_(registry)
    , logger_(std::move(logger)) {}

void PlacementScheduler::add_pool(PoolManager& pool) {
    pools_[pool.node_id()] = &pool;
}

Result<Placement> PlacementScheduler::place(const RuntimeProfile& runtime,
                                            const ResourceGrant& grant,
                                            const ExecutionRequest& request,
                                            std::stop_token stop) {
    PlacementQuery query{
        .runtime = runtime.id,
        .cpu_millicores = grant.cpu_millicores,
        .memory_bytes = grant.memory_bytes(),
        .affinity = request.affinity,
        .workspace_id = request.workspace_id,
        .excluded = {},
    };

    const auto deadline = SteadyClock::now()
                        + std::chrono::milliseconds(config_.scheduling_timeout_ms);
    const auto warm_units = [this, &runtime](const NodeId& id) -> size_t {
        auto it = pools_.find(id);
        return it == pools_.end() ? 0 : it->second->warm_count(runtime.id);
    };

    uint32_t attempts = 0;
    bool all_exhausted = true;
    std::optional<Error> last_error;

    while (attempts <= config_.max_reschedules) {
        if (stop.stop_requested()) {
            return Error{ErrorCode::Cancelled, "placement cancelled"};
        }

        auto views = registry_.views(query, warm_units);
        auto ranked = policy_->rank(query, views);
        std::erase_if(ranked, [this](const RankedNode& n) { return !pools_.contains(n.node_id); });
        if (ranked.empty()) break;
        ++attempts;

        // Warm path
        for (const auto& candidate : ranked) {
            if (!candidate.warm) continue;
            if (!registry_.reserve(candidate.node_id, query.cpu_millicores, query.memory_bytes)) {
                continue;
            }
            if (auto handle = pools_.at(candidate.node_id)->try_acquire_warm(runtime.id)) {
                return Placement{candidate.node_id, std::move(*handle), true, attempts,
                                 candidate.score};
            }
            registry_.unreserve(candidate.node_id, query.cpu_millicores, query.memory_bytes);
        }

        // Cold start on the best node
        const auto& best = ranked.front();
        if (!registry_.reserve(best.node_id, query.cpu_millicores, query.memory_bytes)) {
            query.excluded.push_back(best.node_id);
            continue;
        }

        auto acquired = pools_.at(best.node_id)->acquire(runtime, deadline, stop);
        if (acquired) {
            const bool warm = acquired->served_warm();
            return Placement{best.node_id, std::move(*acquired), warm, attempts, best.score};
        }
        registry_.unreserve(best.node_id, query.cpu_millicores, query.memory_bytes);

        const auto& error = acquired.error();
        if (error.code == ErrorCode::Cancelled || error.code == ErrorCode::SchedulingTimeout) {
            if (error.code == ErrorCode::SchedulingTimeout) registry_.record_failure(best.node_id, false);
            return error;
        }
        if (error.code != ErrorCode::PoolExhausted) {
            all_exhausted = false;
            registry_.record_failure(best.node_id, false);
        }
        logger_.warn("acquisition on " + best.node_id + " failed for " + request.request_id
                     + ": " + error.message);
        last_error = error;
        query.excluded.push_back(best.node_id);
    }

    if (last_error && all_exhausted) {
        return Error{ErrorCode::PoolExhausted, last_error->message};
    }
    std::string detail = last_error ? last_error->message : "no eligible node";
    return Error{ErrorCode::NoAvailableCapacity,
                 "no capacity for " + runtime.id + " after " + std::to_string(attempts)
                 + " attempt(s): " + detail};
}

}  // namespace execution_engine
