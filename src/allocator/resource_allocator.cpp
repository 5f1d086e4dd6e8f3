/**
 * @file resource_allocator.cpp
 * @brief Constraint validation and tier defaulting.
 */

#include "allocator/resource_allocator.hpp"

#include <cctype>
#include <charconv>

namespace execution_engine {

namespace {

bool is_host_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '-' || c == '.' || c == '_';
}

bool is_valid_hostname(std::string_view host) {
    if (host.empty() || host.size() > 253) return false;
    if (host.starts_with("*.")) host.remove_prefix(2);
    if (host.empty() || host.front() == '.' || host.back() == '.') return false;
    for (char c : host) {
        if (!is_host_char(c)) return false;
    }
    return host.find("..") == std::string_view::npos;
}

bool is_valid_ipv6(std::string_view addr) {
    if (addr.empty()) return false;
    for (char c : addr) {
        if (!std::isxdigit(static_cast<unsigned char>(c)) && c != ':' && c != '.') return false;
    }
    return addr.find(':') != std::string_view::npos;
}

std::optional<uint16_t> parse_port(std::string_view text) {
    unsigned value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size()) return std::nullopt;
    if (value == 0 || value > 65535) return std::nullopt;
    return static_cast<uint16_t>(value);
}

/// Apply the tier default when unset, then enforce (0, max].
template <typename T>
Result<T> resolve(const char* name, std::optional<T> declared, T tier_default, T maximum) {
    T value = declared.value_or(tier_default);
    if (value == 0) {
        return Error{ErrorCode::ConstraintViolation, std::string{name} + " must be positive"};
    }
    if (value > maximum) {
        return Error{ErrorCode::ConstraintViolation,
                     std::string{name} + "=" + std::to_string(value)
                     + " exceeds platform maximum " + std::to_string(maximum)};
    }
    return value;
}

}  // namespace

// ─────────────────────────────────────────────
// NetworkEndpoint
// ─────────────────────────────────────────────

std::string NetworkEndpoint::to_string() const {
    std::string text = host.find(':') != std::string::npos ? "[" + host + "]" : host;
    if (port) text += ":" + std::to_string(*port);
    return text;
}

std::optional<NetworkEndpoint> parse_endpoint(std::string_view text) {
    NetworkEndpoint endpoint;

    if (text.starts_with('[')) {
        auto close = text.find(']');
        if (close == std::string_view::npos) return std::nullopt;
        auto addr = text.substr(1, close - 1);
        if (!is_valid_ipv6(addr)) return std::nullopt;
        endpoint.host = std::string{addr};
        auto rest = text.substr(close + 1);
        if (!rest.empty()) {
            if (rest.front() != ':') return std::nullopt;
            endpoint.port = parse_port(rest.substr(1));
            if (!endpoint.port) return std::nullopt;
        }
        return endpoint;
    }

    auto colon = text.rfind(':');
    auto host = text.substr(0, colon);
    if (!is_valid_hostname(host)) return std::nullopt;
    endpoint.host = std::string{host};
    if (colon != std::string_view::npos) {
        endpoint.port = parse_port(text.substr(colon + 1));
        if (!endpoint.port) return std::nullopt;
    }
    return endpoint;
}

// ─────────────────────────────────────────────
// ResourceAllocator
// ─────────────────────────────────────────────

ResourceAllocator::ResourceAllocator(LimitsConfig limits, std::vector<TierProfile> tiers)
    : limits_(limits), tiers_(std::move(tiers)) {}

const TierProfile* ResourceAllocator::find_tier(std::string_view name) const noexcept {
    for (const auto& tier : tiers_) {
        if (tier.name == name) return &tier;
    }
    return nullptr;
}

Result<ResourceGrant> ResourceAllocator::allocate(
    const ExecutionConstraints& constraints,
    std::string_view workspace_type,
    const TierProfile* tier_override) const {

    const TierProfile* tier = tier_override ? tier_override : find_tier(workspace_type);
    if (!tier) {
        return Error{ErrorCode::ConstraintViolation,
                     "unknown workspace type '" + std::string{workspace_type} + "'"};
    }

    ResourceGrant grant;
    grant.tier = tier->name;

    auto timeout = resolve<uint32_t>("timeout_ms", constraints.timeout_ms,
                                     tier->timeout_ms, limits_.max_timeout_ms);
    if (!timeout) return timeout.error();
    grant.timeout_ms = *timeout;

    auto memory = resolve<uint64_t>("memory_mb", constraints.memory_mb,
                                    tier->memory_mb, limits_.max_memory_mb);
    if (!memory) return memory.error();
    grant.memory_mb = *memory;

    auto cpu = resolve<uint32_t>("cpu_millicores", constraints.cpu_millicores,
                                 tier->cpu_millicores, limits_.max_cpu_millicores);
    if (!cpu) return cpu.error();
    grant.cpu_millicores = *cpu;

    auto disk = resolve<uint64_t>("disk_mb", constraints.disk_mb,
                                  tier->disk_mb, limits_.max_disk_mb);
    if (!disk) return disk.error();
    grant.disk_mb = *disk;

    auto procs = resolve<uint32_t>("max_processes", constraints.max_processes,
                                   tier->max_processes, limits_.max_processes);
    if (!procs) return procs.error();
    grant.max_processes = *procs;

    auto fsize = resolve<uint64_t>("max_file_size_mb", constraints.max_file_size_mb,
                                   tier->max_file_size_mb, limits_.max_file_size_mb);
    if (!fsize) return fsize.error();
    grant.max_file_size_mb = *fsize;

    grant.network_enabled = constraints.network_enabled;
    if (!constraints.network_allow_list.empty() && !constraints.network_enabled) {
        return Error{ErrorCode::ConstraintViolation,
                     "network_allow_list given while network is disabled"};
    }
    for (const auto& entry : constraints.network_allow_list) {
        auto endpoint = parse_endpoint(entry);
        if (!endpoint) {
            return Error{ErrorCode::ConstraintViolation,
                         "invalid network allow-list entry '" + entry + "'"};
        }
        grant.network_allow_list.push_back(std::move(*endpoint));
    }

    return grant;
}

}  // namespace execution_engine
