/**
 * @file execution_request.hpp
 * @brief Inbound request model: what to run and under which constraints.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace execution_engine {

// ─────────────────────────────────────────────
// Source Payload
// ─────────────────────────────────────────────

enum class SourceKind : uint8_t {
    InlineCode,
    FileSet,
    RepositoryRef,   ///< Resolved through the workspace service
    ArchiveRef       ///< Resolved through the workspace service
};

[[nodiscard]] constexpr std::string_view to_string(SourceKind kind) noexcept {
    switch (kind) {
        case SourceKind::InlineCode:    return "inline";
        case SourceKind::FileSet:       return "files";
        case SourceKind::RepositoryRef: return "repository";
        case SourceKind::ArchiveRef:    return "archive";
    }
    return "unknown";
}

struct SourceFile {
    std::string path;                ///< Relative to the scratch area
    std::string content;
    bool executable = false;
};

struct SourcePayload {
    SourceKind kind = SourceKind::InlineCode;
    std::string inline_code;
    std::vector<SourceFile> files;
    std::string reference;           ///< Repository URL[@rev] or archive location
};

// ─────────────────────────────────────────────
// Constraints
// ─────────────────────────────────────────────

/**
 * @brief Declared limits. Unset fields are filled from the workspace tier.
 */
struct ExecutionConstraints {
    std::optional<uint32_t> timeout_ms;
    std::optional<uint64_t> memory_mb;
    std::optional<uint32_t> cpu_millicores;
    std::optional<uint64_t> disk_mb;
    std::optional<uint32_t> max_processes;
    std::optional<uint64_t> max_file_size_mb;
    bool network_enabled = false;
    std::vector<std::string> network_allow_list;   ///< "host" or "host:port"
};

/**
 * @brief Expected behaviour checked against a completed run.
 */
struct TestCase {
    std::string name;
    std::optional<std::string> expected_stdout;
    std::optional<int> expected_exit_code;
    std::map<std::string, std::string> expected_files;
    bool trim_whitespace = true;
};

// ─────────────────────────────────────────────
// ExecutionRequest
// ─────────────────────────────────────────────

/**
 * @brief A request to run user code. Treated as immutable once accepted.
 */
struct ExecutionRequest {
    RequestId request_id;
    std::string tenant_id;
    std::string user_id;
    std::string workspace_id;
    std::string workspace_type = "ephemeral";

    RuntimeId runtime;
    SourcePayload source;
    std::string entry_point;          ///< Defaults to the runtime's source file
    std::vector<std::string> args;
    std::string stdin_data;

    ExecutionConstraints constraints;
    std::vector<std::string> outputs; ///< Artifact paths read back after the run
    std::vector<TestCase> test_cases;

    std::vector<NodeId> affinity;     ///< Preferred nodes, best first
    std::map<std::string, std::string> metadata;
};

/**
 * @brief Structural validation (ids, source consistency, path safety).
 *
 * Does not look at resource limits; see ResourceAllocator for those.
 */
Result<void> validate_request(const ExecutionRequest& request);

/**
 * @brief True for a non-empty relative path without "..", "." or empty segments.
 */
[[nodiscard]] bool is_safe_relative_path(std::string_view path) noexcept;

}  // namespace execution_engine
