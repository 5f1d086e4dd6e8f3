/**
 * @file node_registry.cpp
 * @brief NodeRegistry implementation.
 */

#include "scheduler/node_registry.hpp"

#include <algorithm>
#include <mutex>

namespace execution_engine {

namespace {

constexpr uint64_t kBytesPerMb = 1024ULL * 1024ULL;

}  // anonymous namespace

float NodeRegistry::NodeState::failure_rate() const noexcept {
    if (outcomes.empty()) return 0.0f;
    auto failures = std::count(outcomes.begin(), outcomes.end(), true);
    return static_cast<float>(failures) / static_cast<float>(outcomes.size());
}

NodeRegistry::NodeRegistry(SchedulerConfig config)
    : config_(std::move(config)) {}

void NodeRegistry::add_node(const NodeConfig& node) {
    std::unique_lock lock(mutex_);
    auto [it, inserted] = nodes_.try_emplace(node.id);
    it->second.config = node;
    it->second.host.node_id = node.id;
    if (inserted) order_.push_back(node.id);
}

void NodeRegistry::update_snapshot(const NodeId& id, ResourceSnapshot snapshot) {
    std::unique_lock lock(mutex_);
    auto it = nodes_.find(id);
    if (it != nodes_.end()) {
        snapshot.node_id = id;
        it->second.host = std::move(snapshot);
    }
}

bool NodeRegistry::reserve(const NodeId& id, uint32_t cpu_millicores, uint64_t memory_bytes) {
    std::unique_lock lock(mutex_);
    auto it = nodes_.find(id);
    if (it == nodes_.end()) return false;

    auto& node = it->second;
    const uint64_t memory_capacity = node.config.memory_mb * kBytesPerMb;
    if (node.cpu_committed + cpu_millicores > node.config.cpu_millicores
        || node.memory_committed + memory_bytes > memory_capacity) {
        return false;
    }
    node.cpu_committed += cpu_millicores;
    node.memory_committed += memory_bytes;
    return true;
}

void NodeRegistry::unreserve(const NodeId& id, uint32_t cpu_millicores, uint64_t memory_bytes) {
    std::unique_lock lock(mutex_);
    auto it = nodes_.find(id);
    if (it == nodes_.end()) return;
    auto& node = it->second;
    node.cpu_committed -= std::min(node.cpu_committed, cpu_millicores);
    node.memory_committed -= std::min(node.memory_committed, memory_bytes);
}

void NodeRegistry::record_success(const NodeId& id) {
    std::unique_lock lock(mutex_);
    auto it = nodes_.find(id);
    if (it == nodes_.end()) return;
    push_outcome(it->second, false);
    it->second.consecutive_setup_failures = 0;
}

bool NodeRegistry::record_failure(const NodeId& id, bool setup_failure) {
    std::unique_lock lock(mutex_);
    auto it = nodes_.find(id);
    if (it == nodes_.end()) return false;

    auto& node = it->second;
    push_outcome(node, true);
    if (!setup_failure) return false;

    ++node.consecutive_setup_failures;
    if (!node.degraded && config_.degraded_after_failures > 0
        && node.consecutive_setup_failures >= config_.degraded_after_failures) {
        node.degraded = true;
        return true;
    }
    return false;
}

void NodeRegistry::mark_degraded(const NodeId& id) {
    std::unique_lock lock(mutex_);
    auto it = nodes_.find(id);
    if (it != nodes_.end()) it->second.degraded = true;
}

void NodeRegistry::clear_degraded(const NodeId& id) {
    std::unique_lock lock(mutex_);
    auto it = nodes_.find(id);
    if (it == nodes_.end()) return;
    it->second.degraded = false;
    it->second.consecutive_setup_failures = 0;
    it->second.outcomes.clear();
}

bool NodeRegistry::is_degraded(const NodeId& id) const {
    std::shared_lock lock(mutex_);
    auto it = nodes_.find(id);
    return it != nodes_.end() && it->second.degraded;
}

void NodeRegistry::remember_workspace(const std::string& workspace_id, const NodeId& id) {
    if (workspace_id.empty()) return;
    std::unique_lock lock(mutex_);
    workspaces_[workspace_id] = id;
}

std::optional<NodeId> NodeRegistry::workspace_node(const std::string& workspace_id) const {
    std::shared_lock lock(mutex_);
    auto it = workspaces_.find(workspace_id);
    if (it == workspaces_.end()) return std::nullopt;
    return it->second;
}

std::vector<NodeView> NodeRegistry::views(
    const PlacementQuery& query,
    const std::function<size_t(const NodeId&)>& warm_units) const {
    std::shared_lock lock(mutex_);

    std::optional<NodeId> locality;
    if (!query.workspace_id.empty()) {
        auto ws = workspaces_.find(query.workspace_id);
        if (ws != workspaces_.end()) locality = ws->second;
    }

    std::vector<NodeView> result;
    result.reserve(order_.size());
    for (const auto& id : order_) {
        const auto& node = nodes_.at(id);
        result.push_back(NodeView{
            .node_id = id,
            .host = node.host,
            .cpu_capacity_millicores = node.config.cpu_millicores,
            .memory_capacity_bytes = node.config.memory_mb * kBytesPerMb,
            .cpu_committed_millicores = node.cpu_committed,
            .memory_committed_bytes = node.memory_committed,
            .warm_units = warm_units ? warm_units(id) : 0,
            .failure_rate = node.failure_rate(),
            .degraded = node.degraded,
            .served_workspace = locality && *locality == id,
            .labels = node.config.labels,
        });
    }
    return result;
}

std::vector<NodeHealth> NodeRegistry::health() const {
    std::shared_lock lock(mutex_);
    std::vector<NodeHealth> result;
    result.reserve(order_.size());
    for (const auto& id : order_) {
        const auto& node = nodes_.at(id);
        result.push_back(NodeHealth{
            .node_id = id,
            .degraded = node.degraded,
            .failure_rate = node.failure_rate(),
            .consecutive_setup_failures = node.consecutive_setup_failures,
            .cpu_committed_millicores = node.cpu_committed,
            .memory_committed_bytes = node.memory_committed,
            .host = node.host,
        });
    }
    return result;
}

std::vector<NodeId> NodeRegistry::node_ids() const {
    std::shared_lock lock(mutex_);
    return order_;
}

std::vector<NodeId> NodeRegistry::degraded_nodes() const {
    std::shared_lock lock(mutex_);
    std::vector<NodeId> result;
    for (const auto& id : order_) {
        if (nodes_.at(id).degraded) result.push_back(id);
    }
    return result;
}

size_t NodeRegistry::size() const noexcept {
    std::shared_lock lock(mutex_);
    return order_.size();
}

bool NodeRegistry::has_node(const NodeId& id) const {
    std::shared_lock lock(mutex_);
    return nodes_.count(id) > 0;
}

void NodeRegistry::push_outcome(NodeState& node, bool failure) const {
    node.outcomes.push_back(failure);
    const size_t window = std::max<uint32_t>(config_.failure_window, 1);
    while (node.outcomes.size() > window) {
        node.outcomes.pop_front();
    }
}

}  // namespace execution_engine
