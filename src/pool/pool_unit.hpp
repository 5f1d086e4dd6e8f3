/**
 * @file pool_unit.hpp
 * @brief Pool unit record and the move-only handle lent to executions.
 */

#pragma once

#include "core/types.hpp"
#include "substrate/substrate.hpp"

#include <cstdint>
#include <string_view>

namespace execution_engine {

class PoolManager;

/**
 * @brief A unit as tracked by its owning PoolManager. Never leaves the pool.
 */
struct PoolUnit {
    UnitInstance instance;
    NodeId node_id;
    UnitState state = UnitState::Cold;
    SteadyTime created_at;
    SteadyTime last_used;
    uint32_t reuse_count = 0;
};

enum class ReleaseOutcome : uint8_t {
    Clean,         ///< Sandbox torn down, unit may return to the warm pool
    Dirty          ///< Anything else; the unit is destroyed
};

[[nodiscard]] constexpr std::string_view to_string(ReleaseOutcome outcome) noexcept {
    return outcome == ReleaseOutcome::Clean ? "clean" : "dirty";
}

/**
 * @brief Exclusive lease on an acquired unit.
 *
 * Must be given back through PoolManager::release(). A handle destroyed
 * while still holding a unit releases it as dirty and logs an error.
 * The owning pool must outlive every handle it issued.
 */
class PoolUnitHandle {
public:
    PoolUnitHandle() = default;
    ~PoolUnitHandle();

    PoolUnitHandle(PoolUnitHandle&& other) noexcept;
    PoolUnitHandle& operator=(PoolUnitHandle&& other) noexcept;

    PoolUnitHandle(const PoolUnitHandle&) = delete;
    PoolUnitHandle& operator=(const PoolUnitHandle&) = delete;

    [[nodiscard]] explicit operator bool() const noexcept { return pool_ != nullptr; }

    [[nodiscard]] const UnitInstance& unit() const noexcept { return unit_; }
    [[nodiscard]] const UnitId& id() const noexcept { return unit_.id; }
    [[nodiscard]] const NodeId& node_id() const noexcept { return node_id_; }
    [[nodiscard]] bool served_warm() const noexcept { return served_warm_; }
    [[nodiscard]] uint32_t reuse_count() const noexcept { return reuse_count_; }

private:
    friend class PoolManager;

    PoolUnitHandle(PoolManager* pool, UnitInstance unit, NodeId node_id,
                   bool served_warm, uint32_t reuse_count);

    void drop() noexcept;

    PoolManager* pool_ = nullptr;
    UnitInstance unit_;
    NodeId node_id_;
    bool served_warm_ = false;
    uint32_t reuse_count_ = 0;
};

}  // namespace execution_engine
