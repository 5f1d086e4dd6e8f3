/**
 * @file process_sampler.hpp
 * @brief Per-process counters read from /proc/<pid> and getrusage data.
 */

#pragma once

#include "request/execution_result.hpp"

#include <cstdint>
#include <optional>
#include <sys/resource.h>
#include <sys/types.h>

namespace execution_engine {

struct ProcessSample {
    uint64_t peak_rss_bytes{0};              ///< VmHWM
    uint64_t voluntary_context_switches{0};
    uint64_t involuntary_context_switches{0};
};

/**
 * @brief Sample a live process. Returns nullopt once the process is gone.
 */
[[nodiscard]] std::optional<ProcessSample> sample_process(pid_t pid);

/// Counters for a reaped child; syscalls stay unset.
[[nodiscard]] ProcessCounters counters_from_rusage(const struct rusage& usage) noexcept;

}  // namespace execution_engine
