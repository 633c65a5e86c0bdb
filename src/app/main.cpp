/**
 * @file main.cpp
 * @brief AgentDispatch daemon entry point.
 *
 * Wires all modules into a complete dispatch pipeline:
 *   Config → Logger → EventRecorder → Registry → Router → HealthMonitor → TaskManager
 *
 * No network transport ships with the core, so the daemon drives an
 * in-process ScriptedInvoker.
 */

#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/types.hpp"
#include "invoker/scripted_invoker.hpp"
#include "orchestrator/coordinator.hpp"
#include "telemetry/json_sink.hpp"

#include <chrono>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

using namespace agent_dispatch;

namespace {

volatile std::sig_atomic_t g_shutdown_requested = 0;

void signal_handler(int /*signal*/) {
    g_shutdown_requested = 1;
}

void print_banner() {
    std::cout << R"(
  ╔═══════════════════════════════════════════╗
  ║           AgentDispatch v1.0.0            ║
  ║   Priority Task Orchestration for         ║
  ║   Capability-Routed Agents                ║
  ╚═══════════════════════════════════════════╝
)" << std::endl;
}

struct CLIArgs {
    std::filesystem::path config_path = "config/default.toml";
    std::string log_dir;
    std::string log_level;
    bool demo_mode = false;
};

CLIArgs parse_args(int argc, char* argv[]) {
    CLIArgs args;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            args.config_path = argv[++i];
        } else if (arg == "--log-dir" && i + 1 < argc) {
            args.log_dir = argv[++i];
        } else if (arg == "--log-level" && i + 1 < argc) {
            args.log_level = argv[++i];
        } else if (arg == "--demo") {
            args.demo_mode = true;
        } else if (arg == "--help" || arg == "-h") {
            std::cout << "Usage: agent_dispatch [OPTIONS]\n"
                      << "  --config <path>      Configuration file (default: config/default.toml)\n"
                      << "  --log-dir <path>     Log output directory\n"
                      << "  --log-level <level>  debug | info | warn | error\n"
                      << "  --demo               Run a small workload against scripted agents, then exit\n"
                      << "  --help, -h           Show this help message\n";
            std::exit(0);
        }
    }
    return args;
}

AgentDescriptor make_agent(const AgentId& id,
                           std::vector<CapabilityDeclaration> capabilities,
                           std::vector<std::string> tags = {}) {
    AgentDescriptor agent;
    agent.agent_id = id;
    agent.endpoint = "inproc://" + id;
    agent.capabilities = std::move(capabilities);
    agent.tags = std::move(tags);
    return agent;
}

void register_demo_agents(Coordinator& coordinator, ScriptedInvoker& invoker, Logger& logger) {
    invoker.script_capability("docs.summarize.text", InvokeScript{.latency = Duration{40}, .result = "summary"});
    invoker.script_capability("code.review.diff", InvokeScript{.latency = Duration{60}, .fail_first = 1,
                                                               .result = "lgtm"});
    invoker.script_capability("data.extract.table", InvokeScript{.latency = Duration{20}, .result = "rows"});
    invoker.script_capability("report.compose.markdown", InvokeScript{.latency = Duration{30}, .result = "# report"});
    invoker.script_probe("flaky-worker", ProbeScript{.reachable = false});

    std::vector<AgentDescriptor> agents{
        make_agent("writer-1", {{"docs.summarize.text", 0.9}, {"report.compose.markdown", 0.8}}, {"writer"}),
        make_agent("writer-2", {{"docs.summarize.text", 0.7}}, {"writer"}),
        make_agent("reviewer-1", {{"code.review.diff", 0.95}}, {"reviewer"}),
        make_agent("extractor-1", {{"data.extract.table", 0.85}}, {"data"}),
        make_agent("flaky-worker", {{"data.extract.table", 0.99}}, {"data"}),
    };

    for (auto& agent : agents) {
        auto id = agent.agent_id;
        if (auto registered = coordinator.register_agent(std::move(agent)); !registered) {
            logger.error("Could not register " + id + ": " + registered.error().message);
        }
    }
}

/**
 * @brief Run a single demo: register scripted agents, submit a small
 *        dependency graph across all priority lanes and wait for it.
 */
int run_demo(Coordinator& coordinator, ScriptedInvoker& invoker, Logger& logger) {
    logger.info("=== Demo Mode ===");

    register_demo_agents(coordinator, invoker, logger);
    coordinator.health_monitor().probe_all();

    auto stats = coordinator.registry_stats();
    logger.info("Registry: " + std::to_string(stats.total_agents) + " agents, "
                + std::to_string(stats.healthy) + " healthy, "
                + std::to_string(stats.degraded) + " degraded, "
                + std::to_string(stats.total_capabilities) + " capabilities");

    const ContextId ctx = "demo-session";
    auto extract = coordinator.create_task("data.extract.table", ctx, Priority::High);
    auto summarize = coordinator.create_task("docs.summarize.text", ctx, Priority::Medium);
    auto review = coordinator.create_task("code.review.diff", ctx, Priority::Medium);
    if (!extract || !summarize || !review) {
        logger.error("Demo task creation failed");
        return 1;
    }
    auto report = coordinator.create_task(TaskRequest{
        .capability_id = "report.compose.markdown",
        .context_id = ctx,
        .priority = Priority::Low,
        .dependencies = {*extract, *summarize, *review},
        .payload = R"({"format":"markdown"})",
        .metadata = {{"requested_by", "demo"}}
    });
    auto urgent = coordinator.create_task("docs.summarize.text", ctx, Priority::Urgent);
    if (!report || !urgent) {
        logger.error("Demo task creation failed");
        return 1;
    }

    auto stream = coordinator.stream_status(*report);
    if (!stream) {
        logger.error("Cannot follow " + *report + ": " + stream.error().message);
        return 1;
    }

    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(30);
    while (!stream->finished() && !g_shutdown_requested
           && std::chrono::steady_clock::now() < deadline) {
        if (auto event = stream->next(Duration{200})) {
            logger.info(event->task_id + ": " + std::string{to_string(event->from)} + " -> "
                        + std::string{to_string(event->to)} + " (" + event->reason + ")");
        }
    }

    for (const auto& task : coordinator.tasks_in_context(ctx)) {
        std::cout << "  " << task.id << "  " << task.capability_id
                  << "  [" << to_string(task.priority) << "]  "
                  << to_string(task.state)
                  << "  agent=" << task.assigned_agent.value_or("-")
                  << "  retries=" << task.retry_count << "\n";
    }

    auto ms = coordinator.manager_stats();
    std::cout << "  completed=" << ms.count(TaskState::Completed)
              << " failed=" << ms.count(TaskState::Failed)
              << " retry_rate=" << ms.retry_rate
              << " mean_queue_to_complete_ms=" << ms.mean_queue_to_complete_ms << std::endl;

    logger.info("=== Demo Complete ===");
    return 0;
}

}  // namespace

int main(int argc, char* argv[]) {
    print_banner();

    auto args = parse_args(argc, argv);

    // Load configuration
    Config config = default_config();
    if (std::filesystem::exists(args.config_path)) {
        auto config_result = load_config(args.config_path);
        if (!config_result) {
            std::cerr << "Failed to load config: " << config_result.error().message << std::endl;
            return 1;
        }
        config = *config_result;
    } else {
        std::cerr << "Config " << args.config_path << " not found, using defaults." << std::endl;
    }

    // Apply CLI overrides
    if (!args.log_dir.empty()) config.telemetry.log_dir = args.log_dir;
    if (!args.log_level.empty()) config.telemetry.log_level = args.log_level;

    if (auto valid = validate_config(config); !valid) {
        std::cerr << "Invalid configuration: " << valid.error().message << std::endl;
        return 1;
    }
    auto level = parse_log_level(config.telemetry.log_level).value_or(LogLevel::Info);

    // ── Initialize sinks ─────────────────────
    std::unique_ptr<ILogSink> log_sink;
    std::unique_ptr<ILogSink> event_sink;
    if (!config.telemetry.log_dir.empty()) {
        log_sink = std::make_unique<JsonFileSink>(config.telemetry.log_dir, "agent_dispatch",
                                                  config.telemetry.max_file_size_mb,
                                                  config.telemetry.rotate_count);
        event_sink = std::make_unique<JsonFileSink>(config.telemetry.log_dir, "events",
                                                    config.telemetry.max_file_size_mb,
                                                    config.telemetry.rotate_count);
    } else {
        log_sink = std::make_unique<StdoutSink>();
        event_sink = std::make_unique<StdoutSink>();
    }

    auto invoker = std::make_shared<ScriptedInvoker>();
    Coordinator coordinator(Coordinator::Options{
        .config = config,
        .log_sink = std::move(log_sink),
        .event_sink = std::move(event_sink),
        .log_level = level,
        .invoker = invoker
    });
    auto& logger = coordinator.logger();
    logger.info("AgentDispatch starting...");
    logger.info("Max concurrent tasks: " + std::to_string(config.scheduler.max_concurrent_tasks));
    logger.info("Router weights: confidence " + std::to_string(config.router.confidence_weight)
                + ", latency " + std::to_string(config.router.latency_weight));

    // Register signal handlers
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    if (auto started = coordinator.start(); !started) {
        std::cerr << "Failed to start: " << started.error().message << std::endl;
        return 1;
    }

    // ── Demo mode shortcut ───────────────────
    if (args.demo_mode) {
        int rc = run_demo(coordinator, *invoker, logger);
        coordinator.shutdown();
        return rc;
    }

    // ── Main Loop ────────────────────────────
    logger.info("Entering main loop. Press Ctrl+C to shutdown.");

    uint64_t loop_count = 0;
    while (!g_shutdown_requested) {
        // Periodic status logging (every 30 seconds at 100ms intervals)
        if (loop_count % 300 == 0 && loop_count > 0) {
            auto reg = coordinator.registry_stats();
            auto tasks = coordinator.manager_stats();
            logger.info("Status: " + std::to_string(reg.total_agents) + " agents ("
                        + std::to_string(reg.healthy) + " healthy), "
                        + std::to_string(tasks.running) + " running, "
                        + std::to_string(tasks.count(TaskState::Queued)) + " queued, "
                        + std::to_string(tasks.count(TaskState::Blocked)) + " blocked");
        }

        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        ++loop_count;
    }

    // ── Graceful Shutdown ────────────────────
    logger.info("Shutdown requested. Cleaning up...");
    coordinator.shutdown();
    return 0;
}
