/**
 * @file pool_manager.cpp
 * @brief PoolManager and PoolUnitHandle implementation.
 */

#include "pool/pool_manager.hpp"

#include <algorithm>
#include <cmath>
#include <utility>

namespace execution_engine {

// ─────────────────────────────────────────────
// PoolUnitHandle
// ─────────────────────────────────────────────

PoolUnitHandle::PoolUnitHandle(PoolManager* pool, UnitInstance unit, NodeId node_id,
                               bool served_warm, uint32_t reuse_count)
    : pool_(pool)
    , unit_(std::move(unit))
    , node_id_(std::move(node_id))
    , served_warm_(served_warm)
    , reuse_count_(reuse_count) {}

PoolUnitHandle::~PoolUnitHandle() {
    drop();
}

PoolUnitHandle::PoolUnitHandle(PoolUnitHandle&& other) noexcept
    : pool_(std::exchange(other.pool_, nullptr))
    , unit_(std::move(other.unit_))
    , node_id_(std::move(other.node_id_))
    , served_warm_(other.served_warm_)
    , reuse_count_(other.reuse_count_) {}

PoolUnitHandle& PoolUnitHandle::operator=(PoolUnitHandle&& other) noexcept {
    if (this != &other) {
        drop();
        pool_ = std::exchange(other.pool_, nullptr);
        unit_ = std::move(other.unit_);
        node_id_ = std::move(other.node_id_);
        served_warm_ = other.served_warm_;
        reuse_count_ = other.reuse_count_;
    }
    return *this;
}

void PoolUnitHandle::drop() noexcept {
    if (auto* pool = std::exchange(pool_, nullptr)) {
        pool->release_dropped(unit_.id);
    }
}

// ─────────────────────────────────────────────
// PoolManager
// ─────────────────────────────────────────────

PoolManager::PoolManager(NodeId node_id, uint32_t max_units, PoolConfig config,
                         IIsolationSubstrate& substrate, Logger logger)
    : node_id_(std::move(node_id))
    , max_units_(max_units)
    , config_(config)
    , substrate_(substrate)
    , logger_(std::move(logger))
    , workers_(std::max<uint32_t>(config.creation_workers, 1)) {}

PoolManager::~PoolManager() {
    shutdown();
    std::lock_guard lock(mutex_);
    if (!units_.empty()) {
        logger_.warn("pool " + node_id_ + " destroyed with " + std::to_string(units_.size())
                     + " units outstanding");
    }
}

Result<PoolUnitHandle> PoolManager::acquire(const RuntimeProfile& runtime, SteadyTime deadline,
                                            std::stop_token stop) {
    std::unique_lock lock(mutex_);
    std::shared_ptr<CreationTicket> ticket;

    auto abandon = [&] {
        if (!ticket) return;
        ticket->abandoned = true;
        return_ticket_unit_locked(*ticket);
    };

    while (true) {
        if (shutdown_) {
            abandon();
            return Error{ErrorCode::Cancelled, "pool " + node_id_ + " is shut down"};
        }
        if (ticket && ticket->unit) {
            auto it = units_.find(*ticket->unit);
            if (it != units_.end()) {
                ++cold_starts_;
                return lend_locked(it->second, false);
            }
            ticket.reset();
        } else if (ticket && ticket->error) {
            return Error{ErrorCode::NoAvailableCapacity,
                         "unit creation on " + node_id_ + " failed: " + ticket->error->message};
        }

        if (auto handle = pop_warm_locked(runtime.id)) {
            abandon();
            return std::move(*handle);
        }

        if (!ticket) {
            if (units_.size() < max_units_ || evict_foreign_warm_locked(runtime.id)) {
                ticket = std::make_shared<CreationTicket>();
                start_creation_locked(runtime, ticket);
            } else if (creating_ == 0) {
                ++exhausted_;
                return Error{ErrorCode::PoolExhausted,
                             "pool " + node_id_ + " at its ceiling of "
                             + std::to_string(max_units_) + " units"};
            }
        }

        const auto seen = events_;
        const bool changed = cv_.wait_until(lock, stop, deadline, [&] { return events_ != seen; });

        if (stop.stop_requested()) {
            abandon();
            return Error{ErrorCode::Cancelled, "acquisition cancelled"};
        }
        if (!changed && SteadyClock::now() >= deadline) {
            if (ticket && ticket->unit) continue;
            abandon();
            return Error{ErrorCode::SchedulingTimeout,
                         "no " + runtime.id + " unit ready on " + node_id_ + " before the deadline"};
        }
    }
}

std::optional<PoolUnitHandle> PoolManager::try_acquire_warm(const RuntimeId& runtime) {
    std::lock_guard lock(mutex_);
    if (shutdown_) return std::nullopt;
    return pop_warm_locked(runtime);
}

Result<void> PoolManager::release(PoolUnitHandle handle, ReleaseOutcome outcome) {
    if (!handle) {
        return Error{ErrorCode::InvalidArgument, "release of an empty unit handle"};
    }
    if (handle.pool_ != this) {
        return Error{ErrorCode::InvalidArgument,
                     "unit " + handle.id() + " does not belong to pool " + node_id_};
    }
    handle.pool_ = nullptr;

    std::lock_guard lock(mutex_);
    auto it = units_.find(handle.id());
    if (it == units_.end() || it->second.state != UnitState::Acquired) {
        return Error{ErrorCode::Internal, "unit " + handle.id() + " is not acquired"};
    }
    retire_locked(handle.id(), outcome == ReleaseOutcome::Clean);
    return {};
}

uint32_t PoolManager::prewarm(const RuntimeProfile& runtime, uint32_t target_count) {
    std::lock_guard lock(mutex_);
    if (shutdown_) return 0;

    auto desired = static_cast<size_t>(
        std::ceil(static_cast<double>(target_count) * config_.safety_factor));
    desired = std::min<size_t>(desired, max_units_);

    auto& warm = warm_[runtime.id];
    size_t have = warm.size();
    for (const auto& [id, unit] : units_) {
        if (unit.state == UnitState::Cold && unit.instance.runtime == runtime.id) ++have;
    }

    if (have > desired) {
        // Oldest idle units go first; units still being created are left alone.
        size_t shrink = std::min(have - desired, warm.size());
        for (size_t i = 0; i < shrink; ++i) {
            auto it = units_.find(warm.front());
            warm.pop_front();
            if (it == units_.end()) continue;
            PoolUnit victim = std::move(it->second);
            units_.erase(it);
            schedule_destroy_locked(std::move(victim), "prewarm shrink");
        }
        if (shrink > 0) {
            logger_.debug("shrinking " + runtime.id + " on " + node_id_ + " by "
                          + std::to_string(shrink) + " warm units");
            ++events_;
            cv_.notify_all();
        }
        return 0;
    }
    if (have == desired) return 0;

    const size_t free = max_units_ > units_.size() ? max_units_ - units_.size() : 0;
    const auto count = static_cast<uint32_t>(std::min(desired - have, free));
    for (uint32_t i = 0; i < count; ++i) {
        start_creation_locked(runtime, nullptr);
    }
    if (count > 0) {
        logger_.debug("prewarming " + std::to_string(count) + " " + runtime.id + " units on "
                      + node_id_);
    }
    return count;
}

size_t PoolManager::reap_expired() {
    std::lock_guard lock(mutex_);
    const auto now = SteadyClock::now();
    const auto idle_ttl = std::chrono::milliseconds(config_.idle_ttl_ms);
    const auto max_age = std::chrono::milliseconds(config_.max_unit_age_ms);

    size_t reaped = 0;
    for (auto& [runtime, ids] : warm_) {
        for (auto it = ids.begin(); it != ids.end();) {
            auto unit_it = units_.find(*it);
            if (unit_it == units_.end()) {
                it = ids.erase(it);
                continue;
            }
            const auto& unit = unit_it->second;
            const bool idle = now - unit.last_used > idle_ttl;
            const bool old = now - unit.created_at > max_age;
            if (!idle && !old) {
                ++it;
                continue;
            }
            PoolUnit victim = std::move(unit_it->second);
            units_.erase(unit_it);
            it = ids.erase(it);
            schedule_destroy_locked(std::move(victim), idle ? "idle ttl" : "max age");
            ++reaped;
        }
    }
    if (reaped > 0) {
        ++events_;
        cv_.notify_all();
    }
    return reaped;
}

PoolStats PoolManager::stats() const {
    std::lock_guard lock(mutex_);
    PoolStats s;
    s.node_id = node_id_;
    s.max_units = max_units_;
    for (const auto& [id, unit] : units_) {
        switch (unit.state) {
            case UnitState::Warm:     ++s.warm; break;
            case UnitState::Acquired: ++s.acquired; break;
            case UnitState::Cold:     ++s.creating; break;
            default: break;
        }
    }
    s.destroying = destroying_;
    s.created_total = created_total_;
    s.destroyed_total = destroyed_total_;
    s.creation_failures = creation_failures_;
    s.warm_hits = warm_hits_;
    s.cold_starts = cold_starts_;
    s.exhausted = exhausted_;
    for (const auto& [runtime, ids] : warm_) {
        if (!ids.empty()) s.warm_by_runtime[runtime] = ids.size();
    }
    return s;
}

size_t PoolManager::warm_count(const RuntimeId& runtime) const {
    std::lock_guard lock(mutex_);
    auto it = warm_.find(runtime);
    return it == warm_.end() ? 0 : it->second.size();
}

bool PoolManager::wait_idle(std::chrono::milliseconds timeout) {
    std::unique_lock lock(mutex_);
    return cv_.wait_for(lock, timeout, [this] { return creating_ == 0 && destroying_ == 0; });
}

void PoolManager::shutdown() {
    std::lock_guard lock(mutex_);
    if (shutdown_) return;
    shutdown_ = true;

    size_t drained = 0;
    for (auto& [runtime, ids] : warm_) {
        for (const auto& id : ids) {
            auto it = units_.find(id);
            if (it == units_.end()) continue;
            PoolUnit unit = std::move(it->second);
            units_.erase(it);
            schedule_destroy_locked(std::move(unit), "shutdown");
            ++drained;
        }
    }
    warm_.clear();
    ++events_;
    cv_.notify_all();
    logger_.info("pool " + node_id_ + " shut down, destroying " + std::to_string(drained)
                 + " warm units");
}

// ── Private ──────────────────────────────────

UnitId PoolManager::next_unit_id() {
    return node_id_ + "-u" + std::to_string(++next_serial_);
}

std::optional<PoolUnitHandle> PoolManager::pop_warm_locked(const RuntimeId& runtime) {
    auto it = warm_.find(runtime);
    if (it == warm_.end()) return std::nullopt;

    auto& ids = it->second;
    while (!ids.empty()) {
        auto id = std::move(ids.front());
        ids.pop_front();
        auto unit_it = units_.find(id);
        if (unit_it == units_.end() || unit_it->second.state != UnitState::Warm) continue;
        ++warm_hits_;
        return lend_locked(unit_it->second, true);
    }
    return std::nullopt;
}

PoolUnitHandle PoolManager::lend_locked(PoolUnit& unit, bool served_warm) {
    unit.state = UnitState::Acquired;
    unit.last_used = SteadyClock::now();
    return PoolUnitHandle(this, unit.instance, node_id_, served_warm, unit.reuse_count);
}

bool PoolManager::evict_foreign_warm_locked(const RuntimeId& runtime) {
    std::deque<UnitId>* victim_list = nullptr;
    SteadyTime oldest = SteadyTime::max();

    for (auto& [other, ids] : warm_) {
        if (other == runtime || ids.empty()) continue;
        auto it = units_.find(ids.front());
        if (it != units_.end() && it->second.last_used < oldest) {
            oldest = it->second.last_used;
            victim_list = &ids;
        }
    }
    if (!victim_list) return false;

    auto id = std::move(victim_list->front());
    victim_list->pop_front();
    auto it = units_.find(id);
    PoolUnit victim = std::move(it->second);
    units_.erase(it);
    schedule_destroy_locked(std::move(victim), "evicted for " + runtime);
    return true;
}

void PoolManager::start_creation_locked(const RuntimeProfile& runtime,
                                        std::shared_ptr<CreationTicket> ticket) {
    const auto id = next_unit_id();
    const auto now = SteadyClock::now();
    units_.emplace(id, PoolUnit{
        .instance = UnitInstance{id, runtime.id, {}},
        .node_id = node_id_,
        .state = UnitState::Cold,
        .created_at = now,
        .last_used = now,
        .reuse_count = 0,
    });
    ++creating_;

    workers_.submit([this, runtime, id, ticket = std::move(ticket)] {
        auto created = substrate_.create(runtime, id);

        std::lock_guard lock(mutex_);
        --creating_;
        ++events_;
        auto it = units_.find(id);

        if (!created) {
            ++creation_failures_;
            units_.erase(it);
            if (ticket) ticket->error = created.error();
            logger_.warn("unit creation " + id + " failed: " + created.error().message);
            cv_.notify_all();
            return;
        }

        ++created_total_;
        auto& unit = it->second;
        unit.instance = std::move(*created);
        unit.created_at = SteadyClock::now();
        unit.last_used = unit.created_at;

        if (shutdown_) {
            PoolUnit orphan = std::move(unit);
            units_.erase(it);
            schedule_destroy_locked(std::move(orphan), "shutdown");
        } else if (ticket && !ticket->abandoned) {
            unit.state = UnitState::Acquired;
            ticket->unit = id;
        } else {
            unit.state = UnitState::Warm;
            warm_[unit.instance.runtime].push_back(id);
        }
        cv_.notify_all();
    });
}

void PoolManager::schedule_destroy_locked(PoolUnit unit, std::string_view reason) {
    unit.state = UnitState::Destroying;
    ++destroying_;
    logger_.debug("destroying unit " + unit.instance.id + " (" + std::string(reason) + ")");

    workers_.submit([this, unit = std::move(unit)] {
        auto destroyed = substrate_.destroy(unit.instance);
        if (!destroyed) {
            logger_.error("substrate failed to destroy unit " + unit.instance.id + ": "
                          + destroyed.error().message);
        }
        std::lock_guard lock(mutex_);
        --destroying_;
        ++destroyed_total_;
        ++events_;
        cv_.notify_all();
    });
}

void PoolManager::retire_locked(const UnitId& id, bool clean) {
    auto it = units_.find(id);
    if (it == units_.end()) return;

    auto& unit = it->second;
    ++unit.reuse_count;
    const auto now = SteadyClock::now();
    const bool too_old = now - unit.created_at > std::chrono::milliseconds(config_.max_unit_age_ms);
    const bool spent = config_.max_unit_reuses > 0 && unit.reuse_count >= config_.max_unit_reuses;

    if (clean && !shutdown_ && !too_old && !spent) {
        unit.state = UnitState::Warm;
        unit.last_used = now;
        warm_[unit.instance.runtime].push_back(id);
    } else {
        std::string_view reason = !clean   ? "released dirty"
                                : shutdown_ ? "shutdown"
                                : too_old  ? "max age"
                                           : "reuse budget spent";
        PoolUnit retired = std::move(unit);
        units_.erase(it);
        schedule_destroy_locked(std::move(retired), reason);
    }
    ++events_;
    cv_.notify_all();
}

void PoolManager::return_ticket_unit_locked(CreationTicket& ticket) {
    if (!ticket.unit) return;
    auto it = units_.find(*ticket.unit);
    ticket.unit.reset();
    if (it == units_.end()) return;

    auto& unit = it->second;
    if (shutdown_) {
        PoolUnit orphan = std::move(unit);
        units_.erase(it);
        schedule_destroy_locked(std::move(orphan), "shutdown");
        return;
    }
    unit.state = UnitState::Warm;
    unit.last_used = SteadyClock::now();
    warm_[unit.instance.runtime].push_back(unit.instance.id);
    ++events_;
    cv_.notify_all();
}

void PoolManager::release_dropped(const UnitId& id) noexcept {
    logger_.error("unit " + id + " on " + node_id_ + " dropped without release; destroying it");
    std::lock_guard lock(mutex_);
    retire_locked(id, false);
}

}  // namespace execution_engine
