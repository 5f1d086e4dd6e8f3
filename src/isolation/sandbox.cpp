/**
 * @file sandbox.cpp
 * @brief Sandbox teardown.
 */

#include "isolation/sandbox.hpp"

namespace execution_engine {

Sandbox::Sandbox(IIsolationSubstrate& substrate, UnitInstance unit, SandboxPolicy policy,
                 uint64_t initial_disk_bytes, Logger logger)
    : substrate_(substrate)
    , unit_(std::move(unit))
    , policy_(std::move(policy))
    , initial_disk_bytes_(initial_disk_bytes)
    , logger_(std::move(logger)) {}

Sandbox::~Sandbox() {
    if (!torn_down_) {
        auto result = teardown();
        if (!result) {
            logger_.error("sandbox teardown on destruction failed: " + result.error().message);
        }
    }
}

Result<void> Sandbox::teardown() {
    if (torn_down_) return {};
    torn_down_ = true;

    std::string failure;
    auto released = substrate_.release_policy(unit_);
    if (!released) {
        failure = "release_policy: " + released.error().message;
    }

    std::error_code ec;
    std::filesystem::remove_all(policy_.scratch_dir, ec);
    if (ec) {
        if (!failure.empty()) failure += "; ";
        failure += "remove scratch: " + ec.message();
    }

    if (!failure.empty()) {
        return Error{ErrorCode::Internal, "sandbox teardown on unit " + unit_.id + ": " + failure};
    }
    return {};
}

uint64_t directory_size(const std::filesystem::path& root) {
    namespace fs = std::filesystem;
    uint64_t total = 0;
    std::error_code ec;
    for (auto it = fs::recursive_directory_iterator(root, fs::directory_options::skip_permission_denied, ec);
         !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
        std::error_code entry_ec;
        if (it->is_symlink(entry_ec) || !it->is_regular_file(entry_ec)) continue;
        auto size = it->file_size(entry_ec);
        if (!entry_ec) total += size;
    }
    return total;
}

}  // namespace execution_engine
