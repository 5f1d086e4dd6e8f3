/**
 * @file mock_monitor.cpp
 * @brief MockMonitor implementation: configurable host snapshots for testing.
 */

#include "resource_monitor/monitor.hpp"

namespace execution_engine {

MockMonitor::MockMonitor(NodeId node_id, uint32_t /*sampling_interval_ms*/)
    : node_id_(std::move(node_id)) {
    // A lightly loaded 8-core build host
    static_snapshot_.node_id = node_id_;
    static_snapshot_.memory_total_bytes = 16ULL * 1024 * 1024 * 1024;
    static_snapshot_.memory_available_bytes = 12ULL * 1024 * 1024 * 1024;
    static_snapshot_.cpu_usage_percent = 20.0f;
    static_snapshot_.load_average_1m = 1.0f;
}

Result<ResourceSnapshot> MockMonitor::read() {
    std::lock_guard lock(mutex_);
    if (use_static_) {
        static_snapshot_.timestamp = std::chrono::system_clock::now();
        return static_snapshot_;
    }
    if (index_ >= sequence_.size()) {
        return Error{ErrorCode::NotFound, "Mock sequence exhausted"};
    }
    auto snap = sequence_[index_++];
    snap.timestamp = std::chrono::system_clock::now();
    return snap;
}

float MockMonitor::cpu_usage() {
    std::lock_guard lock(mutex_);
    return use_static_ ? static_snapshot_.cpu_usage_percent
                       : (index_ > 0 && index_ <= sequence_.size()
                              ? sequence_[index_ - 1].cpu_usage_percent
                              : 0.0f);
}

uint64_t MockMonitor::memory_available() {
    std::lock_guard lock(mutex_);
    return use_static_ ? static_snapshot_.memory_available_bytes
                       : (index_ > 0 && index_ <= sequence_.size()
                              ? sequence_[index_ - 1].memory_available_bytes
                              : 0);
}

void MockMonitor::start() { /* no-op for mock */ }
void MockMonitor::stop()  { /* no-op for mock */ }

void MockMonitor::push_snapshot(ResourceSnapshot snapshot) {
    std::lock_guard lock(mutex_);
    use_static_ = false;
    snapshot.node_id = node_id_;
    sequence_.push_back(std::move(snapshot));
}

void MockMonitor::set_static_snapshot(ResourceSnapshot snapshot) {
    std::lock_guard lock(mutex_);
    use_static_ = true;
    snapshot.node_id = node_id_;
    static_snapshot_ = std::move(snapshot);
}

void MockMonitor::set_cpu(float percent) {
    std::lock_guard lock(mutex_);
    static_snapshot_.cpu_usage_percent = percent;
}

void MockMonitor::set_memory(uint64_t available, uint64_t total) {
    std::lock_guard lock(mutex_);
    static_snapshot_.memory_available_bytes = available;
    static_snapshot_.memory_total_bytes = total;
}

void MockMonitor::set_load_average(float load) {
    std::lock_guard lock(mutex_);
    static_snapshot_.load_average_1m = load;
}

}  // namespace execution_engine
