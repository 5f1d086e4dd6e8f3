/**
 * @file pool_manager.hpp
 * @brief Per-node pool of pre-provisioned execution units.
 *
 * One mutex guards the unit table, the FIFO warm lists and the counters.
 * Substrate create/destroy calls run outside the lock on the pool's own
 * creation workers; waiters block on a condition variable.
 *
 * Unit lifecycle: Cold → Warm ⇄ Acquired → Destroying. A unit released
 * dirty is destroyed and never becomes Warm again.
 */

#pragma once

#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/result.hpp"
#include "executor/thread_pool.hpp"
#include "pool/pool_unit.hpp"
#include "substrate/substrate.hpp"

#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <unordered_map>

namespace execution_engine {

struct PoolStats {
    NodeId node_id;
    uint32_t max_units = 0;
    size_t warm = 0;
    size_t acquired = 0;
    size_t creating = 0;
    size_t destroying = 0;
    uint64_t created_total = 0;
    uint64_t destroyed_total = 0;
    uint64_t creation_failures = 0;
    uint64_t warm_hits = 0;
    uint64_t cold_starts = 0;
    uint64_t exhausted = 0;
    std::unordered_map<RuntimeId, size_t> warm_by_runtime;

    /// Units counted against the ceiling.
    [[nodiscard]] size_t occupied() const noexcept { return warm + acquired + creating; }
};

class PoolManager {
public:
    PoolManager(NodeId node_id, uint32_t max_units, PoolConfig config,
                IIsolationSubstrate& substrate, Logger logger);
    ~PoolManager();

    PoolManager(const PoolManager&) = delete;
    PoolManager& operator=(const PoolManager&) = delete;

    /**
     * @brief Take a unit for `runtime`, waiting for a cold start if none is warm.
     *
     * Warm units are handed out oldest-released first. When at the ceiling,
     * a warm unit of another runtime is evicted to make room.
     *
     * @return PoolExhausted at the ceiling with nothing freeable,
     *         SchedulingTimeout when `deadline` passes,
     *         NoAvailableCapacity when the substrate fails to create the unit,
     *         Cancelled on stop request or shutdown.
     */
    Result<PoolUnitHandle> acquire(const RuntimeProfile& runtime, SteadyTime deadline,
                                   std::stop_token stop = {});

    /// Non-blocking warm-only acquisition.
    [[nodiscard]] std::optional<PoolUnitHandle> try_acquire_warm(const RuntimeId& runtime);

    /**
     * @brief Give a unit back. Clean units return to the warm list unless
     *        they exceeded their age or reuse budget; all others are destroyed.
     * @return InvalidArgument for an empty handle or one from another pool.
     */
    Result<void> release(PoolUnitHandle handle, ReleaseOutcome outcome);

    /**
     * @brief Converge warm + creating units for `runtime` toward
     *        ceil(target_count × safety_factor). Missing units are created,
     *        bounded by free capacity; surplus warm units are destroyed,
     *        oldest first.
     * @return Number of creations started.
     */
    uint32_t prewarm(const RuntimeProfile& runtime, uint32_t target_count);

    /// Destroy warm units past the idle TTL or the maximum age.
    size_t reap_expired();

    [[nodiscard]] PoolStats stats() const;
    [[nodiscard]] size_t warm_count(const RuntimeId& runtime) const;
    [[nodiscard]] const NodeId& node_id() const noexcept { return node_id_; }

    /// Wait until no creation or destruction is in flight.
    bool wait_idle(std::chrono::milliseconds timeout);

    /// Destroy warm units and fail pending and future acquisitions. Idempotent.
    void shutdown();

private:
    friend class PoolUnitHandle;

    struct CreationTicket {
        std::optional<UnitId> unit;
        std::optional<Error> error;
        bool abandoned = false;
    };

    UnitId next_unit_id();
    std::optional<PoolUnitHandle> pop_warm_locked(const RuntimeId& runtime);
    PoolUnitHandle lend_locked(PoolUnit& unit, bool served_warm);
    bool evict_foreign_warm_locked(const RuntimeId& runtime);
    void start_creation_locked(const RuntimeProfile& runtime,
                               std::shared_ptr<CreationTicket> ticket);
    void schedule_destroy_locked(PoolUnit unit, std::string_view reason);
    void retire_locked(const UnitId& id, bool clean);
    void return_ticket_unit_locked(CreationTicket& ticket);
    void release_dropped(const UnitId& id) noexcept;

    NodeId node_id_;
    uint32_t max_units_;
    PoolConfig config_;
    IIsolationSubstrate& substrate_;
    Logger logger_;

    mutable std::mutex mutex_;
    std::condition_variable_any cv_;
    std::unordered_map<UnitId, PoolUnit> units_;        ///< Cold, Warm and Acquired units
    std::unordered_map<RuntimeId, std::deque<UnitId>> warm_;
    size_t creating_ = 0;
    size_t destroying_ = 0;
    uint64_t events_ = 0;                               ///< Bumped on every state change
    uint64_t next_serial_ = 0;
    bool shutdown_ = false;

    uint64_t created_total_ = 0;
    uint64_t destroyed_total_ = 0;
    uint64_t creation_failures_ = 0;
    uint64_t warm_hits_ = 0;
    uint64_t cold_starts_ = 0;
    uint64_t exhausted_ = 0;

    // Declared last: destroyed (and drained) first, while the state above is alive.
    ThreadPool workers_;
};

}  // namespace execution_engine
