/**
 * @file node_registry.hpp
 * @brief Thread-safe live view of the execution nodes.
 *
 * Tracks per node: capacity and committed resources, the latest host
 * snapshot, a sliding window of placement outcomes, consecutive sandbox
 * setup failures and the degraded flag. Read by the scheduler, written by
 * the engine and its maintenance loop.
 */

#pragma once

#include "core/config.hpp"
#include "core/types.hpp"
#include "scheduler/scheduler.hpp"

#include <deque>
#include <functional>
#include <optional>
#include <shared_mutex>
#include <unordered_map>
#include <vector>

namespace execution_engine {

struct NodeHealth {
    NodeId node_id;
    bool degraded = false;
    float failure_rate = 0.0f;
    uint32_t consecutive_setup_failures = 0;
    uint32_t cpu_committed_millicores = 0;
    uint64_t memory_committed_bytes = 0;
    ResourceSnapshot host;
};

class NodeRegistry {
public:
    explicit NodeRegistry(SchedulerConfig config);

    void add_node(const NodeConfig& node);
    void update_snapshot(const NodeId& id, ResourceSnapshot snapshot);

    /// Commit resources if the node still has room. Returns false otherwise.
    [[nodiscard]] bool reserve(const NodeId& id, uint32_t cpu_millicores, uint64_t memory_bytes);
    void unreserve(const NodeId& id, uint32_t cpu_millicores, uint64_t memory_bytes);

    void record_success(const NodeId& id);

    /**
     * @brief Record a failed placement or sandbox setup.
     * @return True if this failure made the node degraded.
     */
    bool record_failure(const NodeId& id, bool setup_failure);

    void mark_degraded(const NodeId& id);
    void clear_degraded(const NodeId& id);
    [[nodiscard]] bool is_degraded(const NodeId& id) const;

    void remember_workspace(const std::string& workspace_id, const NodeId& id);
    [[nodiscard]] std::optional<NodeId> workspace_node(const std::string& workspace_id) const;

    /// Views for a query; `warm_units` is filled from the callback.
    [[nodiscard]] std::vector<NodeView> views(
        const PlacementQuery& query,
        const std::function<size_t(const NodeId&)>& warm_units) const;

    [[nodiscard]] std::vector<NodeHealth> health() const;
    [[nodiscard]] std::vector<NodeId> node_ids() const;
    [[nodiscard]] std::vector<NodeId> degraded_nodes() const;
    [[nodiscard]] size_t size() const noexcept;
    [[nodiscard]] bool has_node(const NodeId& id) const;

private:
    struct NodeState {
        NodeConfig config;
        ResourceSnapshot host;
        uint32_t cpu_committed = 0;
        uint64_t memory_committed = 0;
        std::deque<bool> outcomes;           ///< true = failure, newest at the back
        uint32_t consecutive_setup_failures = 0;
        bool degraded = false;

        [[nodiscard]] float failure_rate() const noexcept;
    };

    void push_outcome(NodeState& node, bool failure) const;

    SchedulerConfig config_;
    mutable std::shared_mutex mutex_;
    std::unordered_map<NodeId, NodeState> nodes_;
    std::vector<NodeId> order_;                          ///< Registration order
    std::unordered_map<std::string, NodeId> workspaces_;
};

}  // namespace execution_engine
