/**
 * @file main.cpp
 * @brief execution_engine daemon entry point.
 *
 * Wires all modules into a running engine:
 *   Config → Logger → Monitors → Substrates → Pools → Scheduler → Supervisor → Telemetry
 *
 * Modes:
 *   --run <file>   execute one source file and print its result
 *   --demo         drive a burst of requests through simulated nodes
 *   (default)      keep pools warm and report status until SIGINT/SIGTERM
 */

#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/types.hpp"
#include "engine/engine.hpp"
#include "resource_monitor/monitor.hpp"
#include "substrate/simulated_substrate.hpp"
#include "telemetry/json_sink.hpp"

#include <unistd.h>

#include <csignal>
#include <filesystem>
#include <fstream>
#include <future>
#include <iostream>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

using namespace execution_engine;

namespace {

volatile std::sig_atomic_t g_shutdown_requested = 0;

void signal_handler(int /*signal*/) {
    g_shutdown_requested = 1;
}

struct CLIArgs {
    std::filesystem::path config_path = "config/default.toml";
    std::string node_id;
    std::string log_level;
    std::string log_dir;
    bool demo_mode = false;

    std::filesystem::path run_file;
    std::string runtime;
    std::string workspace_type;
    std::optional<uint32_t> timeout_ms;
    std::optional<uint64_t> memory_mb;
    bool network = false;
    std::vector<std::string> args;
};

CLIArgs parse_args(int argc, char* argv[]) {
    CLIArgs args;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            args.config_path = argv[++i];
        } else if (arg == "--node-id" && i + 1 < argc) {
            args.node_id = argv[++i];
        } else if (arg == "--log-level" && i + 1 < argc) {
            args.log_level = argv[++i];
        } else if (arg == "--log-dir" && i + 1 < argc) {
            args.log_dir = argv[++i];
        } else if (arg == "--demo") {
            args.demo_mode = true;
        } else if (arg == "--run" && i + 1 < argc) {
            args.run_file = argv[++i];
        } else if (arg == "--runtime" && i + 1 < argc) {
            args.runtime = argv[++i];
        } else if (arg == "--tier" && i + 1 < argc) {
            args.workspace_type = argv[++i];
        } else if (arg == "--timeout-ms" && i + 1 < argc) {
            args.timeout_ms = static_cast<uint32_t>(std::stoul(argv[++i]));
        } else if (arg == "--memory-mb" && i + 1 < argc) {
            args.memory_mb = static_cast<uint64_t>(std::stoull(argv[++i]));
        } else if (arg == "--network") {
            args.network = true;
        } else if (arg == "--") {
            for (++i; i < argc; ++i) args.args.emplace_back(argv[i]);
        } else if (arg == "--help" || arg == "-h") {
            std::cout << "Usage: execution_engine [OPTIONS] [-- ARGS...]\n"
                      << "  --config <path>      Configuration file (default: config/default.toml)\n"
                      << "  --node-id <id>       Rename the first configured node\n"
                      << "  --log-level <level>  debug, info, warn or error\n"
                      << "  --log-dir <path>     Log and metrics output directory\n"
                      << "  --run <file>         Execute one source file, print the result, exit\n"
                      << "  --runtime <id>       Runtime for --run (default: first configured)\n"
                      << "  --tier <name>        Workspace tier for --run\n"
                      << "  --timeout-ms <ms>    Timeout for --run\n"
                      << "  --memory-mb <mb>     Memory limit for --run\n"
                      << "  --network            Enable network for --run\n"
                      << "  --demo               Run a burst of requests on simulated nodes, then exit\n"
                      << "  --help, -h           Show this help message\n";
            std::exit(0);
        } else {
            std::cerr << "Unknown or incomplete option: " << arg << std::endl;
            std::exit(2);
        }
    }
    return args;
}

std::optional<std::string> read_file(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) return std::nullopt;
    std::ostringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

void print_result(const ExecutionResult& result) {
    std::cout << result.stdout_data;
    if (!result.stderr_data.empty()) std::cerr << result.stderr_data;

    std::cerr << "--- " << result.request_id << " on " << result.node_id
              << ": " << to_string(result.state);
    if (result.exit_code) std::cerr << " exit=" << *result.exit_code;
    if (result.signal) std::cerr << " signal=" << *result.signal;
    std::cerr << " run=" << result.metrics.phases.run.count() << "us"
              << " total=" << result.metrics.phases.total().count() << "us"
              << (result.metrics.served_warm ? " (warm)" : " (cold)") << "\n";
    for (const auto& violation : result.violations) {
        std::cerr << "    violation[" << to_string(violation.kind) << "]: "
                  << violation.detail << "\n";
    }
    for (const auto& missing : result.missing_artifacts) {
        std::cerr << "    missing artifact: " << missing << "\n";
    }
}

void log_pool_status(const std::vector<PoolStats>& stats, Logger& logger) {
    for (const auto& s : stats) {
        logger.info("Pool " + s.node_id + ": " + std::to_string(s.warm) + " warm, "
                    + std::to_string(s.acquired) + " acquired, "
                    + std::to_string(s.occupied()) + "/" + std::to_string(s.max_units)
                    + " occupied, " + std::to_string(s.warm_hits) + " warm hits, "
                    + std::to_string(s.cold_starts) + " cold starts");
    }
}

/**
 * @brief Execute one file on the configured nodes and print the outcome.
 * @return Process exit code: the guest's exit code, or 1 on engine error.
 */
template <typename MonitorT>
int run_single(Engine<MonitorT>& engine, const CLIArgs& args) {
    auto code = read_file(args.run_file);
    if (!code) {
        std::cerr << "Cannot read " << args.run_file << std::endl;
        return 1;
    }

    if (args.runtime.empty() && engine.config().runtimes.empty()) {
        std::cerr << "No runtimes configured" << std::endl;
        return 1;
    }

    ExecutionRequest request;
    request.request_id = "cli-" + std::to_string(::getpid());
    request.tenant_id = "cli";
    request.user_id = "cli";
    request.runtime = args.runtime.empty() ? engine.config().runtimes.front().id : args.runtime;
    if (!args.workspace_type.empty()) request.workspace_type = args.workspace_type;
    request.source.kind = SourceKind::InlineCode;
    request.source.inline_code = std::move(*code);
    request.args = args.args;
    request.constraints.timeout_ms = args.timeout_ms;
    request.constraints.memory_mb = args.memory_mb;
    request.constraints.network_enabled = args.network;
    if (!::isatty(STDIN_FILENO)) {
        std::ostringstream in;
        in << std::cin.rdbuf();
        request.stdin_data = in.str();
    }

    auto future = engine.submit_async(request);
    while (future.wait_for(std::chrono::milliseconds(50)) != std::future_status::ready) {
        if (g_shutdown_requested) {
            engine.cancel(request.request_id);
            g_shutdown_requested = 0;
        }
    }
    auto result = future.get();
    if (!result) {
        std::cerr << "Execution failed [" << to_string(result.error().code) << "]: "
                  << result.error().message << std::endl;
        return 1;
    }
    print_result(*result);
    if (result->state != ExecutionState::Completed) return 1;
    return result->exit_code.value_or(1);
}

/**
 * @brief Run a demo: two simulated nodes, a burst of concurrent requests,
 *        a timeout, a blocked network call, and pool statistics.
 */
int run_demo(Config config, std::unique_ptr<ILogSink> sink, LogLevel level) {
    if (config.runtimes.empty()) config.runtimes = default_runtimes();
    for (auto& node : config.nodes) node.substrate = "simulated";
    if (config.nodes.size() < 2) {
        NodeConfig second = config.nodes.front();
        second.id = config.nodes.front().id + "-b";
        config.nodes.push_back(second);
    }
    for (auto& runtime : config.runtimes) runtime.min_warm = 1;
    config.monitor.mock = true;

    Engine<MockMonitor>::Options opts;
    opts.config = config;
    opts.log_sink = std::move(sink);
    opts.log_level = level;
    Engine<MockMonitor> engine(std::move(opts));

    for (const auto& node : config.nodes) {
        auto* sim = dynamic_cast<SimulatedSubstrate*>(engine.substrate(node.id));
        if (!sim) continue;
        sim->set_create_latency(std::chrono::milliseconds(150));
        sim->set_script([](const GuestCommand& command) {
            GuestBehavior behavior;
            behavior.run_time = std::chrono::milliseconds(40);
            behavior.stdout_data = "hello from " + command.argv.front() + "\n";
            if (command.stdin_data == "sleep") behavior.run_time = std::chrono::seconds(5);
            if (command.stdin_data == "curl") behavior.network_target = "example.com:443";
            return behavior;
        });
    }

    auto& logger = engine.logger();
    if (auto started = engine.start(); !started) {
        std::cerr << "Engine failed to start: " << started.error().message << std::endl;
        return 1;
    }
    logger.info("=== Demo Mode ===");

    // Let the maintenance loop warm the pools
    engine.maintenance().tick();
    for (const auto& node : config.nodes) {
        auto* pool = engine.pool(node.id);
        if (pool && !pool->wait_idle(std::chrono::seconds(2))) {
            logger.warn("Pool " + node.id + " still creating units");
        }
    }
    log_pool_status(engine.pool_stats(), logger);

    auto make_request = [&](const std::string& id, const std::string& stdin_data) {
        ExecutionRequest request;
        request.request_id = id;
        request.tenant_id = "demo";
        request.user_id = "demo";
        request.runtime = config.runtimes.front().id;
        request.source.inline_code = "echo demo";
        request.stdin_data = stdin_data;
        request.constraints.timeout_ms = 1000;
        return request;
    };

    std::vector<std::future<Result<ExecutionResult>>> futures;
    for (int i = 0; i < 8; ++i) {
        futures.push_back(engine.submit_async(make_request("demo-" + std::to_string(i), "")));
    }
    futures.push_back(engine.submit_async(make_request("demo-timeout", "sleep")));
    auto blocked = make_request("demo-egress", "curl");
    blocked.constraints.network_enabled = true;
    blocked.constraints.network_allow_list = {"pypi.org:443"};
    futures.push_back(engine.submit_async(blocked));

    size_t warm = 0;
    for (auto& future : futures) {
        auto result = future.get();
        if (!result) {
            logger.warn("request failed: " + result.error().message);
            continue;
        }
        if (result->metrics.served_warm) ++warm;
        logger.info(result->request_id + " -> " + std::string(to_string(result->state))
                    + " on " + result->node_id
                    + (result->metrics.served_warm ? " (warm)" : " (cold)")
                    + (result->violations.empty() ? "" : " violations="
                       + std::to_string(result->violations.size())));
    }
    logger.info("Warm hits: " + std::to_string(warm) + "/" + std::to_string(futures.size()));
    log_pool_status(engine.pool_stats(), logger);

    engine.stop();
    logger.info("=== Demo Complete ===");
    return 0;
}

/**
 * @brief Keep the engine running until a shutdown signal, logging status.
 */
template <typename MonitorT>
int serve(Engine<MonitorT>& engine) {
    auto& logger = engine.logger();
    logger.info("Entering main loop. Press Ctrl+C to shutdown.");

    uint64_t loop_count = 0;
    while (!g_shutdown_requested) {
        // Periodic status logging (every 30 seconds at 100ms intervals)
        if (loop_count % 300 == 0 && loop_count > 0) {
            auto health = engine.health();
            logger.info("Status: " + std::string(health.healthy ? "healthy" : "unhealthy")
                        + ", " + std::to_string(health.active_requests) + " active, "
                        + std::to_string(health.telemetry_dropped) + " telemetry drops");
            log_pool_status(engine.pool_stats(), logger);
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        ++loop_count;
    }

    logger.info("Shutdown requested. Cleaning up...");
    engine.stop();
    return 0;
}

template <typename MonitorT>
int run_engine(Config config, std::unique_ptr<ILogSink> sink, LogLevel level,
               const CLIArgs& args) {
    typename Engine<MonitorT>::Options opts;
    opts.config = std::move(config);
    opts.log_sink = std::move(sink);
    opts.log_level = level;
    Engine<MonitorT> engine(std::move(opts));

    if (auto started = engine.start(); !started) {
        std::cerr << "Engine failed to start: " << started.error().message << std::endl;
        return 1;
    }
    if (!args.run_file.empty()) {
        int code = run_single(engine, args);
        engine.stop();
        return code;
    }
    return serve(engine);
}

}  // namespace

int main(int argc, char* argv[]) {
    auto args = parse_args(argc, argv);

    // Load configuration
    auto config_result = load_config(args.config_path);
    if (!config_result) {
        std::cerr << "Failed to load config: " << config_result.error().message << std::endl;
        std::cerr << "Using default configuration." << std::endl;
    }
    auto config = config_result ? *config_result : default_config();

    // Apply CLI overrides
    if (!args.node_id.empty()) config.nodes.front().id = args.node_id;
    if (!args.log_dir.empty()) config.telemetry.log_dir = args.log_dir;
    if (!args.log_level.empty()) config.telemetry.log_level = args.log_level;

    auto level = parse_log_level(config.telemetry.log_level);
    if (!level) {
        std::cerr << "Unknown log level '" << config.telemetry.log_level << "'" << std::endl;
        return 2;
    }

    // ── Initialize Log Sink ──────────────────
    // --run keeps stdout for the guest's output
    std::unique_ptr<ILogSink> log_sink;
    if (!args.run_file.empty() || !args.log_dir.empty()) {
        log_sink = std::make_unique<JsonFileSink>(config.telemetry.log_dir, "execution_engine");
    } else {
        log_sink = std::make_unique<StdoutSink>();
    }

    // Register signal handlers
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    if (args.demo_mode) {
        return run_demo(std::move(config), std::move(log_sink), *level);
    }
    if (config.monitor.mock) {
        return run_engine<MockMonitor>(std::move(config), std::move(log_sink), *level, args);
    }
    return run_engine<LinuxMonitor>(std::move(config), std::move(log_sink), *level, args);
}
