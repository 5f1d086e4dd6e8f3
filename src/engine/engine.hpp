/**
 * @file engine.hpp
 * @brief Top-level Engine facade: ties all modules together.
 *
 * Provides a single entry point for:
 *   1. Submitting execution requests (sync or async) and cancelling them
 *   2. Reporting node health and pool statistics
 *   3. Running the maintenance loop (host sampling, prewarm, reaping, probes)
 *
 * Request flow: allocate → place (warm or cold unit) → prepare sandbox →
 * supervise → teardown → release unit → record telemetry.
 *
 * Template-parameterized on MonitorT for testability (LinuxMonitor or MockMonitor).
 */

#pragma once

#include "allocator/resource_allocator.hpp"
#include "core/concepts.hpp"
#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "engine/node_context.hpp"
#include "executor/thread_pool.hpp"
#include "isolation/isolation_enforcer.hpp"
#include "pool/demand_predictor.hpp"
#include "pool/pool_manager.hpp"
#include "pool/prewarm_controller.hpp"
#include "request/execution_request.hpp"
#include "request/execution_result.hpp"
#include "resource_monitor/monitor.hpp"
#include "scheduler/node_registry.hpp"
#include "scheduler/placement_scheduler.hpp"
#include "supervisor/execution_supervisor.hpp"
#include "telemetry/json_sink.hpp"
#include "telemetry/telemetry_collector.hpp"
#include "telemetry/telemetry_pipeline.hpp"
#include "workspace/workspace_service.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <unordered_map>
#include <vector>

namespace execution_engine {

/**
 * @brief The top-level Engine that wires all modules together.
 *
 * Template parameters allow injecting MockMonitor for testing.
 */
template <ResourceMonitorLike MonitorT = LinuxMonitor>
class Engine {
public:
    struct Options {
        Config config;
        std::unique_ptr<ILogSink> log_sink;
        LogLevel log_level = LogLevel::Info;

        /// Null: NDJSON files in telemetry.log_dir.
        std::unique_ptr<ITelemetryPipeline> telemetry;
        /// Null: StaticWorkspaceService over the configured tiers.
        std::unique_ptr<IWorkspaceService> workspace;
        /// Null: EwmaPredictor with pool.ewma_alpha.
        std::unique_ptr<IDemandPredictor> predictor;
        /// Per-node substrate overrides; other nodes use their configured substrate.
        std::map<NodeId, std::unique_ptr<IIsolationSubstrate>> substrates;
    };

    explicit Engine(Options opts);
    ~Engine();

    // Non-copyable, non-movable
    Engine(const Engine&) = delete;
    Engine& operator=(const Engine&) = delete;

    // ── Lifecycle ────────────────────────────
    Result<void> start();
    void stop();
    [[nodiscard]] bool is_running() const noexcept { return running_.load(); }

    // ── Request Submission ───────────────────

    /**
     * @brief Run a request to completion on the calling thread.
     *
     * Rejections (InvalidArgument, ConstraintViolation) happen before any
     * pool interaction and emit no telemetry. Every accepted request emits
     * exactly one metrics record, whether it produced a result or an error.
     */
    Result<ExecutionResult> submit(const ExecutionRequest& request);

    /// Validate synchronously, then run on the executor pool.
    std::future<Result<ExecutionResult>> submit_async(ExecutionRequest request);

    /// Request cancellation. Returns false if the request is not in flight.
    bool cancel(const RequestId& request_id);

    // ── Introspection ────────────────────────
    [[nodiscard]] EngineHealth health() const;
    [[nodiscard]] std::vector<PoolStats> pool_stats() const;

    // ── Accessors (for testing) ─────────────
    MonitorT* monitor(const NodeId& node_id);
    IIsolationSubstrate* substrate(const NodeId& node_id);
    PoolManager* pool(const NodeId& node_id);
    NodeRegistry& registry() { return registry_; }
    TelemetryCollector& telemetry() { return telemetry_; }
    PrewarmController& maintenance() { return maintenance_; }
    IDemandPredictor& predictor() { return *predictor_; }
    Logger& logger() { return logger_; }
    const Config& config() const { return config_; }

private:
    static constexpr std::chrono::seconds kDrainTimeout{10};

    struct Admission {
        const RuntimeProfile* runtime;
        ResourceGrant grant;
    };

    Result<Admission> admit(const ExecutionRequest& request);
    Result<ExecutionResult> execute(const ExecutionRequest& request, const Admission& admission,
                                    SteadyTime accepted_at, std::stop_token stop);
    Result<ExecutionResult> fail(ExecutionMetrics& metrics, const Error& error);

    Result<std::stop_token> register_active(const RequestId& id);
    void unregister_active(const RequestId& id);

    NodeContext* node(const NodeId& id);
    ResourceSnapshot sample_host(const NodeId& id);
    void refresh_snapshots();
    bool backoff(std::chrono::milliseconds delay, std::stop_token stop);

    Config config_;
    Logger logger_;
    std::optional<Error> init_error_;

    std::unique_ptr<IWorkspaceService> workspace_;
    std::unique_ptr<ITelemetryPipeline> pipeline_;
    std::unique_ptr<IDemandPredictor> predictor_;

    ResourceAllocator allocator_;
    IsolationEnforcer enforcer_;
    ExecutionSupervisor supervisor_;
    NodeRegistry registry_;

    std::vector<std::unique_ptr<NodeContext>> nodes_;
    std::unordered_map<NodeId, std::unique_ptr<MonitorT>> monitors_;
    std::unique_ptr<PlacementScheduler> scheduler_;

    TelemetryCollector telemetry_;
    PrewarmController maintenance_;

    mutable std::mutex active_mutex_;
    std::condition_variable active_cv_;
    std::unordered_map<RequestId, std::stop_source> active_;

    std::atomic<bool> running_{false};

    // Declared last: drained first, while everything it uses is alive.
    ThreadPool executor_;
};

// ═══════════════════════════════════════════════
// Template Implementation
// ═══════════════════════════════════════════════

namespace detail {

inline std::unique_ptr<ITelemetryPipeline> default_pipeline(const TelemetryConfig& telemetry) {
    return std::make_unique<NdjsonTelemetryPipeline>(std::make_unique<JsonFileSink>(
        telemetry.log_dir, telemetry.metrics_prefix, telemetry.max_file_size_mb,
        telemetry.rotate_count));
}

inline Duration elapsed_since(SteadyTime start) {
    return std::chrono::duration_cast<Duration>(SteadyClock::now() - start);
}

}  // namespace detail

template <ResourceMonitorLike MonitorT>
Engine<MonitorT>::Engine(Options opts)
    : config_(std::move(opts.config))
    , logger_(std::move(opts.log_sink), opts.log_level)
    , workspace_(opts.workspace ? std::move(opts.workspace)
                                : std::unique_ptr<IWorkspaceService>(
                                      std::make_unique<StaticWorkspaceService>(config_.tiers)))
    , pipeline_(opts.telemetry ? std::move(opts.telemetry)
                               : detail::default_pipeline(config_.telemetry))
    , predictor_(opts.predictor ? std::move(opts.predictor)
                                : std::unique_ptr<IDemandPredictor>(
                                      std::make_unique<EwmaPredictor>(config_.pool.ewma_alpha)))
    , allocator_(config_.limits, config_.tiers)
    , enforcer_(config_.isolation, workspace_.get(), logger_.for_component("isolation"))
    , supervisor_(config_.supervisor, logger_.for_component("supervisor"))
    , registry_(config_.scheduler)
    , telemetry_(*pipeline_, config_.telemetry.buffer_capacity, logger_.for_component("telemetry"))
    , maintenance_(config_.pool, config_.runtimes, *predictor_, registry_,
                   logger_.for_component("maintenance"))
    , executor_(config_.executor.thread_count, config_.executor.queue_capacity) {

    auto policy = make_policy(config_.scheduler);
    if (!policy) {
        init_error_ = policy.error();
        return;
    }
    scheduler_ = std::make_unique<PlacementScheduler>(config_.scheduler, std::move(*policy),
                                                      registry_,
                                                      logger_.for_component("scheduler"));

    for (const auto& node_config : config_.nodes) {
        auto context = std::make_unique<NodeContext>();
        context->config = node_config;

        auto override_it = opts.substrates.find(node_config.id);
        if (override_it != opts.substrates.end()) {
            context->substrate = std::move(override_it->second);
        } else {
            auto made = make_substrate(node_config, config_.isolation,
                                       logger_.for_component("substrate." + node_config.id));
            if (!made) {
                init_error_ = made.error();
                return;
            }
            context->substrate = std::move(*made);
        }

        context->pool = std::make_unique<PoolManager>(
            node_config.id, node_config.max_units, config_.pool, *context->substrate,
            logger_.for_component("pool." + node_config.id));

        registry_.add_node(node_config);
        scheduler_->add_pool(*context->pool);
        maintenance_.add_node(*context->pool, *context->substrate);
        monitors_.emplace(node_config.id, std::make_unique<MonitorT>(
            node_config.id, config_.monitor.sampling_interval_ms));
        nodes_.push_back(std::move(context));
    }

    maintenance_.set_tick_hook([this] { refresh_snapshots(); });
}

template <ResourceMonitorLike MonitorT>
Engine<MonitorT>::~Engine() {
    stop();
}

template <ResourceMonitorLike MonitorT>
Result<void> Engine<MonitorT>::start() {
    if (init_error_) {
        return *init_error_;
    }
    if (running_.exchange(true)) {
        return Error{"Already running"};
    }

    logger_.info("Engine starting: nodes=" + std::to_string(nodes_.size())
                 + " policy=" + std::string(scheduler_->policy().name())
                 + " workers=" + std::to_string(executor_.thread_count()));

    for (auto& [id, monitor] : monitors_) {
        monitor->start();
    }
    telemetry_.start();
    refresh_snapshots();
    maintenance_.start();

    logger_.info("Engine started successfully");
    return Result<void>{};
}

template <ResourceMonitorLike MonitorT>
void Engine<MonitorT>::stop() {
    if (!running_.exchange(false)) return;

    logger_.info("Engine shutting down...");
    {
        std::unique_lock lock(active_mutex_);
        for (auto& [id, source] : active_) {
            source.request_stop();
        }
        if (!active_cv_.wait_for(lock, kDrainTimeout, [this] { return active_.empty(); })) {
            logger_.warn(std::to_string(active_.size()) + " requests still in flight at shutdown");
        }
    }
    maintenance_.stop();
    for (auto& context : nodes_) {
        context->pool->shutdown();
    }
    for (auto& [id, monitor] : monitors_) {
        monitor->stop();
    }
    telemetry_.stop();
    logger_.info("Engine stopped");
    logger_.flush();
}

// ── Submission ───────────────────────────────

template <ResourceMonitorLike MonitorT>
Result<ExecutionResult> Engine<MonitorT>::submit(const ExecutionRequest& request) {
    const auto accepted_at = SteadyClock::now();
    if (!running_.load()) {
        return Error{ErrorCode::Cancelled, "engine is not running"};
    }

    auto admission = admit(request);
    if (!admission) return admission.error();

    auto token = register_active(request.request_id);
    if (!token) return token.error();

    auto result = execute(request, *admission, accepted_at, *token);
    unregister_active(request.request_id);
    return result;
}

template <ResourceMonitorLike MonitorT>
std::future<Result<ExecutionResult>> Engine<MonitorT>::submit_async(ExecutionRequest request) {
    const auto accepted_at = SteadyClock::now();
    auto ready = [](Error error) {
        std::promise<Result<ExecutionResult>> promise;
        promise.set_value(std::move(error));
        return promise.get_future();
    };

    if (!running_.load()) {
        return ready(Error{ErrorCode::Cancelled, "engine is not running"});
    }
    auto admission = admit(request);
    if (!admission) return ready(admission.error());

    auto token = register_active(request.request_id);
    if (!token) return ready(token.error());

    const RequestId id = request.request_id;
    auto future = executor_.try_submit(
        [this, request = std::move(request), admission = *admission, accepted_at,
         stop = *token]() -> Result<ExecutionResult> {
            auto result = execute(request, admission, accepted_at, stop);
            unregister_active(request.request_id);
            return result;
        });
    if (!future) {
        unregister_active(id);
        return ready(Error{ErrorCode::PoolExhausted, "executor queue is full"});
    }
    return std::move(*future);
}

template <ResourceMonitorLike MonitorT>
bool Engine<MonitorT>::cancel(const RequestId& request_id) {
    std::lock_guard lock(active_mutex_);
    auto it = active_.find(request_id);
    if (it == active_.end()) return false;
    logger_.info("cancelling " + request_id);
    return it->second.request_stop() || it->second.stop_requested();
}

// ── Request Flow ─────────────────────────────

template <ResourceMonitorLike MonitorT>
auto Engine<MonitorT>::admit(const ExecutionRequest& request) -> Result<Admission> {
    if (auto valid = validate_request(request); !valid) {
        return valid.error();
    }
    const auto* runtime = config_.find_runtime(request.runtime);
    if (!runtime) {
        return Error{ErrorCode::InvalidArgument, "unknown runtime '" + request.runtime + "'"};
    }

    auto tier_override = workspace_->tier_defaults(request.workspace_type);
    auto grant = allocator_.allocate(request.constraints, request.workspace_type,
                                     tier_override ? &*tier_override : nullptr);
    if (!grant) {
        logger_.info("rejected " + request.request_id + ": " + grant.error().message);
        return grant.error();
    }
    return Admission{runtime, std::move(*grant)};
}

template <ResourceMonitorLike MonitorT>
Result<ExecutionResult> Engine<MonitorT>::execute(const ExecutionRequest& request,
                                                  const Admission& admission,
                                                  SteadyTime accepted_at,
                                                  std::stop_token stop) {
    const auto& runtime = *admission.runtime;
    const auto& grant = admission.grant;
    predictor_->record_request(runtime.id);

    ExecutionMetrics metrics;
    metrics.request_id = request.request_id;
    metrics.tenant_id = request.tenant_id;
    metrics.runtime = runtime.id;
    metrics.phases.queue = detail::elapsed_since(accepted_at);

    uint32_t setup_failures = 0;
    uint32_t timeout_retries = 0;
    auto delay = std::chrono::milliseconds(config_.scheduler.retry_backoff_ms);

    while (true) {
        // ── Placement
        const auto placing_at = SteadyClock::now();
        auto placed = scheduler_->place(runtime, grant, request, stop);
        metrics.phases.acquisition += detail::elapsed_since(placing_at);

        if (!placed) {
            const auto& error = placed.error();
            if (error.code == ErrorCode::SchedulingTimeout
                && timeout_retries < config_.scheduler.timeout_retries) {
                ++timeout_retries;
                logger_.info("retrying placement of " + request.request_id + " in "
                             + std::to_string(delay.count()) + "ms");
                if (backoff(delay, stop)) {
                    delay *= 2;
                    continue;
                }
                return fail(metrics, Error{ErrorCode::Cancelled, "cancelled during backoff"});
            }
            return fail(metrics, error);
        }

        Placement placement = std::move(*placed);
        NodeContext* context = node(placement.node_id);
        metrics.node_id = placement.node_id;
        metrics.unit_id = placement.unit.id();
        metrics.served_warm = placement.served_warm;
        metrics.scheduling_attempts += placement.attempts;
        metrics.host_before = sample_host(placement.node_id);

        auto release_unit = [&](ReleaseOutcome outcome) {
            auto released = context->pool->release(std::move(placement.unit), outcome);
            if (!released) {
                logger_.error("release of unit " + metrics.unit_id + " failed: "
                              + released.error().message);
            }
            registry_.unreserve(placement.node_id, grant.cpu_millicores, grant.memory_bytes());
        };

        // ── Sandbox setup
        const auto setup_at = SteadyClock::now();
        auto sandbox = enforcer_.prepare(*context->substrate, placement.unit.unit(), runtime,
                                         grant, request);
        metrics.phases.setup += detail::elapsed_since(setup_at);

        if (!sandbox) {
            const auto error = sandbox.error();
            if (error.code != ErrorCode::SandboxSetupFailed) {
                release_unit(ReleaseOutcome::Clean);
                return fail(metrics, error);
            }
            release_unit(ReleaseOutcome::Dirty);
            if (registry_.record_failure(placement.node_id, true)) {
                logger_.warn("node " + placement.node_id + " marked degraded");
            }
            logger_.warn("sandbox setup for " + request.request_id + " failed on "
                         + metrics.unit_id + ": " + error.message);
            if (++setup_failures <= 1 && !stop.stop_requested()) continue;
            return fail(metrics, error);
        }

        // ── Run
        auto run = supervisor_.run(*context->substrate, **sandbox, runtime, request, grant, stop);
        const auto cleanup_at = SteadyClock::now();
        auto torn_down = (*sandbox)->teardown();
        if (!torn_down) {
            logger_.error("teardown of " + metrics.unit_id + " failed: "
                          + torn_down.error().message);
        }
        sandbox->reset();

        if (!run) {
            const auto error = run.error();
            release_unit(ReleaseOutcome::Dirty);
            metrics.phases.cleanup += detail::elapsed_since(cleanup_at);
            if (error.code == ErrorCode::SandboxSetupFailed) {
                registry_.record_failure(placement.node_id, true);
                if (++setup_failures <= 1 && !stop.stop_requested()) continue;
            }
            return fail(metrics, error);
        }

        ExecutionResult result = std::move(*run);
        const bool reusable = unit_reusable(result, static_cast<bool>(torn_down));
        release_unit(reusable ? ReleaseOutcome::Clean : ReleaseOutcome::Dirty);
        registry_.record_success(placement.node_id);
        registry_.remember_workspace(request.workspace_id, placement.node_id);

        metrics.phases.run = result.metrics.phases.run;
        metrics.phases.cleanup += detail::elapsed_since(cleanup_at);
        metrics.usage = result.metrics.usage;
        metrics.counters = result.metrics.counters;
        metrics.host_after = sample_host(placement.node_id);
        metrics.outcome = std::string(to_string(result.state));
        metrics.recorded_at = std::chrono::system_clock::now();

        result.node_id = placement.node_id;
        result.metrics = metrics;
        telemetry_.record(std::move(metrics));
        return result;
    }
}

template <ResourceMonitorLike MonitorT>
Result<ExecutionResult> Engine<MonitorT>::fail(ExecutionMetrics& metrics, const Error& error) {
    metrics.outcome = std::string(to_string(error.code));
    metrics.recorded_at = std::chrono::system_clock::now();
    if (!metrics.node_id.empty()) {
        metrics.host_after = sample_host(metrics.node_id);
    }
    logger_.warn("execution " + metrics.request_id + " failed: " + error.message);
    telemetry_.record(metrics);
    return error;
}

// ── Cancellation registry ───────────────────

template <ResourceMonitorLike MonitorT>
Result<std::stop_token> Engine<MonitorT>::register_active(const RequestId& id) {
    std::lock_guard lock(active_mutex_);
    auto [it, inserted] = active_.try_emplace(id);
    if (!inserted) {
        return Error{ErrorCode::InvalidArgument, "request " + id + " is already in flight"};
    }
    return it->second.get_token();
}

template <ResourceMonitorLike MonitorT>
void Engine<MonitorT>::unregister_active(const RequestId& id) {
    {
        std::lock_guard lock(active_mutex_);
        active_.erase(id);
    }
    active_cv_.notify_all();
}

// ── Introspection ────────────────────────────

template <ResourceMonitorLike MonitorT>
EngineHealth Engine<MonitorT>::health() const {
    EngineHealth report;
    report.nodes = registry_.health();
    for (const auto& node_health : report.nodes) {
        if (!node_health.degraded) report.healthy = true;
    }
    report.healthy = report.healthy && running_.load();
    {
        std::lock_guard lock(active_mutex_);
        report.active_requests = active_.size();
    }
    report.telemetry_dropped = telemetry_.dropped();
    return report;
}

template <ResourceMonitorLike MonitorT>
std::vector<PoolStats> Engine<MonitorT>::pool_stats() const {
    std::vector<PoolStats> stats;
    stats.reserve(nodes_.size());
    for (const auto& context : nodes_) {
        stats.push_back(context->pool->stats());
    }
    return stats;
}

template <ResourceMonitorLike MonitorT>
MonitorT* Engine<MonitorT>::monitor(const NodeId& node_id) {
    auto it = monitors_.find(node_id);
    return it == monitors_.end() ? nullptr : it->second.get();
}

template <ResourceMonitorLike MonitorT>
IIsolationSubstrate* Engine<MonitorT>::substrate(const NodeId& node_id) {
    auto* context = node(node_id);
    return context ? context->substrate.get() : nullptr;
}

template <ResourceMonitorLike MonitorT>
PoolManager* Engine<MonitorT>::pool(const NodeId& node_id) {
    auto* context = node(node_id);
    return context ? context->pool.get() : nullptr;
}

// ── Private helpers ──────────────────────────

template <ResourceMonitorLike MonitorT>
NodeContext* Engine<MonitorT>::node(const NodeId& id) {
    for (auto& context : nodes_) {
        if (context->config.id == id) return context.get();
    }
    return nullptr;
}

template <ResourceMonitorLike MonitorT>
ResourceSnapshot Engine<MonitorT>::sample_host(const NodeId& id) {
    auto* mon = monitor(id);
    if (!mon) return ResourceSnapshot{.node_id = id};
    auto snap = mon->read();
    if (!snap) return ResourceSnapshot{.node_id = id};
    return *snap;
}

template <ResourceMonitorLike MonitorT>
void Engine<MonitorT>::refresh_snapshots() {
    for (auto& [id, mon] : monitors_) {
        if (auto snap = mon->read(); snap) {
            registry_.update_snapshot(id, *snap);
        }
    }
}

template <ResourceMonitorLike MonitorT>
bool Engine<MonitorT>::backoff(std::chrono::milliseconds delay, std::stop_token stop) {
    std::mutex mutex;
    std::condition_variable_any cv;
    std::unique_lock lock(mutex);
    cv.wait_for(lock, stop, delay, [] { return false; });
    return !stop.stop_requested();
}

}  // namespace execution_engine
