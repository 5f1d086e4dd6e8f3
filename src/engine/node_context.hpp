/**
 * @file node_context.hpp
 * @brief Per-node wiring: substrate and pool, plus engine health reports.
 */

#pragma once

#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/result.hpp"
#include "pool/pool_manager.hpp"
#include "scheduler/node_registry.hpp"
#include "substrate/substrate.hpp"

#include <memory>
#include <vector>

namespace execution_engine {

/**
 * @brief One execution node. The pool is declared after the substrate so it
 *        is destroyed (and drained) first.
 */
struct NodeContext {
    NodeConfig config;
    std::unique_ptr<IIsolationSubstrate> substrate;
    std::unique_ptr<PoolManager> pool;
};

struct EngineHealth {
    bool healthy = false;                ///< At least one node accepts work
    std::vector<NodeHealth> nodes;
    size_t active_requests = 0;
    uint64_t telemetry_dropped = 0;
};

/// Substrate named in the node configuration, rooted at scratch_root/<node id>.
[[nodiscard]] Result<std::unique_ptr<IIsolationSubstrate>> make_substrate(
    const NodeConfig& node, const IsolationConfig& isolation, Logger logger);

/// Whether a finished execution leaves its unit fit for reuse.
[[nodiscard]] bool unit_reusable(const ExecutionResult& result, bool teardown_ok) noexcept;

}  // namespace execution_engine
