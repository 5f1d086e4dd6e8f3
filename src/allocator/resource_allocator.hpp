/**
 * @file resource_allocator.hpp
 * @brief Resolves declared constraints into a concrete ResourceGrant.
 *
 * Pure function of the request constraints, the workspace tier and the
 * static platform limits. Runs before any scheduling or pool interaction,
 * so a rejected request never touches a node.
 */

#pragma once

#include "core/config.hpp"
#include "core/result.hpp"
#include "request/execution_request.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace execution_engine {

/**
 * @brief One parsed network allow-list destination.
 */
struct NetworkEndpoint {
    std::string host;
    std::optional<uint16_t> port;

    [[nodiscard]] std::string to_string() const;
};

/// Parse "host", "host:port" or "[v6-addr]:port". Returns nullopt when malformed.
[[nodiscard]] std::optional<NetworkEndpoint> parse_endpoint(std::string_view text);

/**
 * @brief Every constraint resolved to a concrete value.
 */
struct ResourceGrant {
    std::string tier;
    uint32_t timeout_ms = 0;
    uint64_t memory_mb = 0;
    uint32_t cpu_millicores = 0;
    uint64_t disk_mb = 0;
    uint32_t max_processes = 0;
    uint64_t max_file_size_mb = 0;
    bool network_enabled = false;
    std::vector<NetworkEndpoint> network_allow_list;   ///< Empty + enabled = unrestricted

    [[nodiscard]] uint64_t memory_bytes() const noexcept { return memory_mb * 1024 * 1024; }
    [[nodiscard]] uint64_t disk_bytes() const noexcept { return disk_mb * 1024 * 1024; }
    [[nodiscard]] uint64_t max_file_size_bytes() const noexcept {
        return max_file_size_mb * 1024 * 1024;
    }
};

class ResourceAllocator {
public:
    ResourceAllocator(LimitsConfig limits, std::vector<TierProfile> tiers);

    /**
     * @brief Resolve constraints for a workspace type.
     *
     * @param tier_override Defaults supplied by the workspace service; when
     *        null the configured tier named `workspace_type` is used.
     * @return ConstraintViolation on any zero value, any value above the
     *         platform maximum, an unknown tier, or a malformed allow-list entry.
     */
    [[nodiscard]] Result<ResourceGrant> allocate(
        const ExecutionConstraints& constraints,
        std::string_view workspace_type,
        const TierProfile* tier_override = nullptr) const;

    [[nodiscard]] const LimitsConfig& limits() const noexcept { return limits_; }
    [[nodiscard]] const TierProfile* find_tier(std::string_view name) const noexcept;

private:
    LimitsConfig limits_;
    std::vector<TierProfile> tiers_;
};

}  // namespace execution_engine
