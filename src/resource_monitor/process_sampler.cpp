/**
 * @file process_sampler.cpp
 * @brief Reads /proc/<pid>/status.
 */

#include "resource_monitor/process_sampler.hpp"

#include <fstream>
#include <sstream>
#include <string>

namespace execution_engine {

namespace {

uint64_t parse_field(const std::string& line, size_t prefix_len) {
    std::istringstream iss(line.substr(prefix_len));
    uint64_t value = 0;
    iss >> value;
    return value;
}

}  // namespace

std::optional<ProcessSample> sample_process(pid_t pid) {
    std::ifstream status("/proc/" + std::to_string(pid) + "/status");
    if (!status.is_open()) return std::nullopt;

    ProcessSample sample;
    std::string line;
    while (std::getline(status, line)) {
        if (line.starts_with("VmHWM:")) {
            sample.peak_rss_bytes = parse_field(line, 6) * 1024;
        } else if (line.starts_with("voluntary_ctxt_switches:")) {
            sample.voluntary_context_switches = parse_field(line, 24);
        } else if (line.starts_with("nonvoluntary_ctxt_switches:")) {
            sample.involuntary_context_switches = parse_field(line, 27);
        }
    }
    return sample;
}

ProcessCounters counters_from_rusage(const struct rusage& usage) noexcept {
    ProcessCounters counters;
    counters.voluntary_context_switches = static_cast<uint64_t>(usage.ru_nvcsw);
    counters.involuntary_context_switches = static_cast<uint64_t>(usage.ru_nivcsw);
    counters.minor_page_faults = static_cast<uint64_t>(usage.ru_minflt);
    counters.major_page_faults = static_cast<uint64_t>(usage.ru_majflt);
    return counters;
}

}  // namespace execution_engine
