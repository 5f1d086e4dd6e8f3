/**
 * @file linux_monitor.cpp
 * @brief LinuxMonitor and the procfs parsers behind it.
 */

#include "resource_monitor/monitor.hpp"

#include <algorithm>
#include <charconv>
#include <fstream>
#include <iterator>
#include <sstream>
#include <string>

namespace execution_engine {

namespace procfs {

namespace {

// Splits on spaces and tabs; empty fields are skipped.
std::vector<std::string_view> fields(std::string_view line) {
    std::vector<std::string_view> out;
    size_t pos = 0;
    while (pos < line.size()) {
        auto start = line.find_first_not_of(" \t", pos);
        if (start == std::string_view::npos) break;
        auto end = line.find_first_of(" \t\n", start);
        if (end == std::string_view::npos) end = line.size();
        out.push_back(line.substr(start, end - start));
        pos = end;
    }
    return out;
}

std::optional<uint64_t> to_u64(std::string_view text) {
    uint64_t value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size()) return std::nullopt;
    return value;
}

}  // anonymous namespace

std::optional<CpuTimes> parse_cpu_times(std::string_view line) {
    auto f = fields(line);
    if (f.size() < 5 || f[0] != "cpu") return std::nullopt;

    // user nice system idle iowait irq softirq steal; guest time is already in user
    CpuTimes times;
    for (size_t i = 1; i < f.size() && i <= 8; ++i) {
        auto value = to_u64(f[i]);
        if (!value) return std::nullopt;
        times.total += *value;
        if (i != 4 && i != 5) times.busy += *value;
    }
    return times;
}

float cpu_busy_percent(const CpuTimes& prev, const CpuTimes& curr) noexcept {
    if (curr.total <= prev.total || curr.busy < prev.busy) return 0.0f;
    auto busy = static_cast<float>(curr.busy - prev.busy);
    auto total = static_cast<float>(curr.total - prev.total);
    return busy >= total ? 100.0f : 100.0f * busy / total;
}

std::optional<MemInfo> parse_meminfo(std::istream& in) {
    std::optional<uint64_t> total_kb;
    std::optional<uint64_t> available_kb;
    std::string line;
    while (std::getline(in, line) && !(total_kb && available_kb)) {
        auto f = fields(line);
        if (f.size() < 2) continue;
        if (f[0] == "MemTotal:") total_kb = to_u64(f[1]);
        else if (f[0] == "MemAvailable:") available_kb = to_u64(f[1]);
    }
    if (!total_kb) return std::nullopt;

    MemInfo info;
    info.total_bytes = *total_kb * 1024;
    // Kernels before 3.14 lack MemAvailable
    info.available_bytes = std::min(available_kb.value_or(0) * 1024, info.total_bytes);
    return info;
}

std::optional<float> parse_loadavg(std::string_view content) {
    auto f = fields(content);
    if (f.empty()) return std::nullopt;
    float load = 0.0f;
    auto [ptr, ec] = std::from_chars(f[0].data(), f[0].data() + f[0].size(), load);
    if (ec != std::errc{} || load < 0.0f) return std::nullopt;
    return load;
}

}  // namespace procfs

// ─────────────────────────────────────────────
// LinuxMonitor
// ─────────────────────────────────────────────

LinuxMonitor::LinuxMonitor(NodeId node_id, uint32_t sampling_interval_ms,
                           std::filesystem::path proc_root)
    : node_id_(std::move(node_id)),
      interval_(std::max<uint32_t>(sampling_interval_ms, 10)),
      proc_root_(std::move(proc_root)) {}

LinuxMonitor::~LinuxMonitor() {
    stop();
}

void LinuxMonitor::start() {
    if (sampling_thread_.joinable()) return;
    (void)sample();
    sampling_thread_ = std::jthread([this](std::stop_token stop) { sampling_loop(stop); });
}

void LinuxMonitor::stop() {
    if (!sampling_thread_.joinable()) return;
    sampling_thread_.request_stop();
    wake_.notify_all();
    sampling_thread_.join();
}

Result<ResourceSnapshot> LinuxMonitor::read() {
    auto snapshot = latest_.load();
    if (!snapshot) {
        return Error{ErrorCode::NotFound, "no host sample for " + node_id_};
    }
    return *snapshot;
}

float LinuxMonitor::cpu_usage() {
    auto snapshot = latest_.load();
    return snapshot ? snapshot->cpu_usage_percent : 0.0f;
}

uint64_t LinuxMonitor::memory_available() {
    auto snapshot = latest_.load();
    return snapshot ? snapshot->memory_available_bytes : 0;
}

Result<ResourceSnapshot> LinuxMonitor::sample() {
    std::lock_guard lock(sample_mutex_);

    std::ifstream meminfo(proc_root_ / "meminfo");
    auto mem = meminfo ? procfs::parse_meminfo(meminfo) : std::nullopt;
    if (!mem) {
        ++failed_samples_;
        return Error{ErrorCode::NotFound, "cannot read " + (proc_root_ / "meminfo").string()};
    }

    ResourceSnapshot snap;
    snap.node_id = node_id_;
    snap.timestamp = std::chrono::system_clock::now();
    snap.memory_total_bytes = mem->total_bytes;
    snap.memory_available_bytes = mem->available_bytes;

    std::ifstream stat(proc_root_ / "stat");
    std::string cpu_line;
    if (stat && std::getline(stat, cpu_line)) {
        if (auto curr = procfs::parse_cpu_times(cpu_line)) {
            if (prev_cpu_) snap.cpu_usage_percent = procfs::cpu_busy_percent(*prev_cpu_, *curr);
            prev_cpu_ = curr;
        }
    }

    std::ifstream loadavg(proc_root_ / "loadavg");
    std::string content((std::istreambuf_iterator<char>(loadavg)), std::istreambuf_iterator<char>());
    snap.load_average_1m = procfs::parse_loadavg(content).value_or(0.0f);

    latest_.store(std::make_shared<const ResourceSnapshot>(snap));
    return snap;
}

void LinuxMonitor::sampling_loop(std::stop_token stop) {
    std::unique_lock lock(wait_mutex_);
    while (!wake_.wait_for(lock, stop, interval_, [] { return false; })) {
        if (stop.stop_requested()) break;
        lock.unlock();
        (void)sample();
        lock.lock();
    }
}

}  // namespace execution_engine
