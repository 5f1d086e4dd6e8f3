/**
 * @file syscall_filter.hpp
 * @brief Default-deny seccomp allow-list for guest processes, built on libseccomp.
 *
 * The filter context is assembled in the parent and loaded in the forked
 * child right before exec.
 *
 * Filter layout:
 *   1. Foreign architectures (and the x32 ABI on x86_64) kill the process.
 *   2. If network is denied, socket(2) on anything but AF_UNIX fails with EACCES.
 *   3. Allowed syscalls return ALLOW.
 *   4. Everything else traps (SIGSYS), which the supervisor records as a
 *      policy violation.
 */

#pragma once

#include "core/result.hpp"

#include <seccomp.h>

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace execution_engine {

/// Resolve a known syscall name for the build architecture.
[[nodiscard]] std::optional<long> syscall_number(std::string_view name);

/// Names allowed by every filter.
[[nodiscard]] std::vector<std::string_view> base_allowed_syscalls();

class SyscallFilter {
public:
    /**
     * @brief Assemble a filter.
     * @param extra_syscalls Additional names allowed for a runtime.
     * @param deny_network   Restrict socket(2) to AF_UNIX.
     * @return InvalidArgument for unknown names or when seccomp is unavailable.
     */
    static Result<SyscallFilter> build(const std::vector<std::string>& extra_syscalls,
                                       bool deny_network);

    /// True when the kernel and libseccomp support filtering.
    [[nodiscard]] static bool supported() noexcept;

    ~SyscallFilter();
    SyscallFilter(SyscallFilter&& other) noexcept;
    SyscallFilter& operator=(SyscallFilter&& other) noexcept;
    SyscallFilter(const SyscallFilter&) = delete;
    SyscallFilter& operator=(const SyscallFilter&) = delete;

    /**
     * @brief Load the filter on the calling process (no_new_privs is set too).
     * @return 0 on success, errno otherwise.
     */
    [[nodiscard]] int install() const noexcept;

    [[nodiscard]] size_t rule_count() const noexcept { return rules_; }

private:
    explicit SyscallFilter(scmp_filter_ctx ctx) noexcept;

    scmp_filter_ctx ctx_ = nullptr;
    size_t rules_ = 0;
};

}  // namespace execution_engine
