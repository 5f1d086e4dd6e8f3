/**
 * @file syscall_filter.cpp
 * @brief libseccomp filter assembly and loading.
 */

#include "substrate/syscall_filter.hpp"

#include <cerrno>
#include <iterator>
#include <string>
#include <sys/socket.h>
#include <utility>

namespace execution_engine {

namespace {

constexpr std::string_view kBaseAllowed[] = {
    // File and descriptor I/O
    "read", "write", "readv", "writev", "pread64", "pwrite64", "preadv", "pwritev", "open",
    "openat", "close", "close_range", "lseek", "stat", "fstat", "lstat", "newfstatat", "statx",
    "access", "faccessat", "faccessat2", "readlink", "readlinkat", "getdents", "getdents64",
    "dup", "dup2", "dup3", "fcntl", "ioctl", "pipe", "pipe2", "poll", "ppoll", "select",
    "pselect6", "epoll_create", "epoll_create1", "epoll_ctl", "epoll_wait", "epoll_pwait",
    "eventfd", "eventfd2", "mkdir", "mkdirat", "rmdir", "unlink", "unlinkat", "rename",
    "renameat", "renameat2", "link", "linkat", "symlink", "symlinkat", "chdir", "fchdir",
    "getcwd", "ftruncate", "truncate", "fsync", "fdatasync", "chmod", "fchmod", "fchmodat",
    "umask", "statfs", "fstatfs", "sendfile", "copy_file_range", "fadvise64", "flock",
    "utimensat",
    // Memory management
    "brk", "mmap", "munmap", "mremap", "mprotect", "madvise", "membarrier",
    // Signal handling
    "rt_sigaction", "rt_sigprocmask", "rt_sigreturn", "rt_sigsuspend", "sigaltstack", "kill",
    "tgkill", "tkill",
    // Timing
    "nanosleep", "clock_nanosleep", "clock_gettime", "clock_getres", "gettimeofday", "time",
    "times", "getitimer", "setitimer", "alarm",
    // Process creation, identity and exit
    "fork", "vfork", "clone", "clone3", "execve", "execveat", "exit", "exit_group", "wait4",
    "waitid", "getpid", "getppid", "gettid", "getpgrp", "getpgid", "setpgid", "getsid",
    "getuid", "geteuid", "getgid", "getegid", "getgroups", "getresuid", "getresgid",
    "arch_prctl", "set_tid_address", "set_robust_list", "get_robust_list", "futex",
    "sched_yield", "sched_getaffinity", "prlimit64", "getrlimit", "getrusage", "uname",
    "sysinfo", "getrandom", "rseq",
    // Socket calls (socket itself is filtered on its domain)
    "socketpair", "connect", "bind", "listen", "accept", "accept4", "sendto", "recvfrom",
    "sendmsg", "recvmsg", "shutdown", "getsockname", "getpeername", "setsockopt", "getsockopt",
};

// Not allowed by default; runtimes may opt in through extra_syscalls.
constexpr std::string_view kOptional[] = {
    "ptrace", "mount", "umount2", "pivot_root", "chroot", "unshare", "setns", "reboot",
    "kexec_load", "init_module", "finit_module", "delete_module", "acct", "swapon", "swapoff",
    "sethostname", "setdomainname", "bpf", "perf_event_open", "process_vm_readv",
    "process_vm_writev", "keyctl", "add_key", "request_key", "personality", "userfaultfd",
    "socket", "prctl", "seccomp", "mlock", "munlock", "mlockall", "munlockall", "setuid",
    "setgid", "setreuid", "setregid", "setresuid", "setresgid", "setgroups", "capset", "chown",
    "fchown", "lchown", "fchownat", "mknod", "mknodat",
};

bool known_name(std::string_view name) noexcept {
    for (auto entry : kBaseAllowed) {
        if (entry == name) return true;
    }
    for (auto entry : kOptional) {
        if (entry == name) return true;
    }
    return false;
}

Error seccomp_error(std::string_view what, int rc) {
    return Error{ErrorCode::InvalidArgument,
                 "seccomp filter: " + std::string(what) + " failed (errno " + std::to_string(-rc) + ")"};
}

}  // namespace

std::optional<long> syscall_number(std::string_view name) {
    if (!known_name(name)) return std::nullopt;
    int nr = seccomp_syscall_resolve_name(std::string(name).c_str());
    if (nr == __NR_SCMP_ERROR || nr < 0) return std::nullopt;
    return nr;
}

std::vector<std::string_view> base_allowed_syscalls() {
    return {std::begin(kBaseAllowed), std::end(kBaseAllowed)};
}

bool SyscallFilter::supported() noexcept {
    return seccomp_api_get() >= 1;
}

SyscallFilter::SyscallFilter(scmp_filter_ctx ctx) noexcept : ctx_(ctx) {}

SyscallFilter::~SyscallFilter() {
    if (ctx_) seccomp_release(ctx_);
}

SyscallFilter::SyscallFilter(SyscallFilter&& other) noexcept
    : ctx_(std::exchange(other.ctx_, nullptr))
    , rules_(std::exchange(other.rules_, 0)) {}

SyscallFilter& SyscallFilter::operator=(SyscallFilter&& other) noexcept {
    if (this != &other) {
        if (ctx_) seccomp_release(ctx_);
        ctx_ = std::exchange(other.ctx_, nullptr);
        rules_ = std::exchange(other.rules_, 0);
    }
    return *this;
}

Result<SyscallFilter> SyscallFilter::build(const std::vector<std::string>& extra_syscalls,
                                           bool deny_network) {
    if (!supported()) {
        return Error{ErrorCode::InvalidArgument, "seccomp filter: kernel or library lacks seccomp support"};
    }

    std::vector<int> extra;
    for (const auto& name : extra_syscalls) {
        auto nr = syscall_number(name);
        if (!nr) {
            return Error{ErrorCode::InvalidArgument, "seccomp filter: unknown syscall '" + name + "'"};
        }
        extra.push_back(static_cast<int>(*nr));
    }

    // Anything not allowed traps with SIGSYS, which the supervisor records as a violation.
    scmp_filter_ctx ctx = seccomp_init(SCMP_ACT_TRAP);
    if (!ctx) {
        return Error{ErrorCode::InvalidArgument, "seccomp filter: seccomp_init failed"};
    }
    SyscallFilter filter(ctx);

    // Foreign architectures (and x32 on x86_64) kill the whole process.
    if (int rc = seccomp_attr_set(ctx, SCMP_FLTATR_ACT_BADARCH, SCMP_ACT_KILL_PROCESS); rc != 0) {
        return seccomp_error("setting the bad-arch action", rc);
    }

    auto allow = [&](int nr) -> int {
        int rc = seccomp_rule_add(ctx, SCMP_ACT_ALLOW, nr, 0);
        if (rc == 0) ++filter.rules_;
        return rc;
    };

    for (auto name : kBaseAllowed) {
        int nr = seccomp_syscall_resolve_name(std::string(name).c_str());
        // Names the build architecture does not have are skipped.
        if (nr == __NR_SCMP_ERROR || nr < 0) continue;
        if (int rc = allow(nr); rc != 0) return seccomp_error("allowing " + std::string(name), rc);
    }
    for (int nr : extra) {
        if (int rc = allow(nr); rc != 0) return seccomp_error("allowing an extra syscall", rc);
    }

    if (deny_network) {
        int rc = seccomp_rule_add(ctx, SCMP_ACT_ALLOW, SCMP_SYS(socket), 1,
                                  SCMP_A0(SCMP_CMP_EQ, AF_UNIX));
        if (rc == 0) {
            ++filter.rules_;
            rc = seccomp_rule_add(ctx, SCMP_ACT_ERRNO(EACCES), SCMP_SYS(socket), 1,
                                  SCMP_A0(SCMP_CMP_NE, AF_UNIX));
        }
        if (rc != 0) return seccomp_error("restricting socket", rc);
        ++filter.rules_;
    } else if (int rc = allow(SCMP_SYS(socket)); rc != 0) {
        return seccomp_error("allowing socket", rc);
    }

    return filter;
}

int SyscallFilter::install() const noexcept {
    if (!ctx_) return EINVAL;
    // seccomp_load also sets no_new_privs (SCMP_FLTATR_CTL_NNP defaults on).
    int rc = seccomp_load(ctx_);
    return rc == 0 ? 0 : -rc;
}

}  // namespace execution_engine
