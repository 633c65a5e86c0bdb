/**
 * @file coordinator.hpp
 * @brief Top-level Coordinator facade: ties all modules together.
 *
 * Provides a single entry point for:
 *   1. Registering agents and inspecting the registry
 *   2. Creating, cancelling and observing tasks
 *   3. Starting and stopping the health monitor and the scheduler thread
 *
 * The transport is injected as an IAgentInvoker so tests and the demo can
 * use the ScriptedInvoker.
 */

#pragma once

#include "core/clock.hpp"
#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "health/health_monitor.hpp"
#include "invoker/agent_invoker.hpp"
#include "registry/capability_registry.hpp"
#include "registry/capability_router.hpp"
#include "scheduler/task_manager.hpp"
#include "telemetry/event_recorder.hpp"

#include <atomic>
#include <memory>
#include <vector>

namespace agent_dispatch {

class Coordinator {
public:
    struct Options {
        Config config;
        std::unique_ptr<ILogSink> log_sink;
        std::unique_ptr<ILogSink> event_sink;     ///< Null or telemetry.record_events = false → discarded
        LogLevel log_level = LogLevel::Info;
        std::shared_ptr<IAgentInvoker> invoker;   ///< Required
    };

    explicit Coordinator(Options opts);
    ~Coordinator();

    // Non-copyable, non-movable
    Coordinator(const Coordinator&) = delete;
    Coordinator& operator=(const Coordinator&) = delete;

    // ── Lifecycle ────────────────────────────
    Result<void> start();
    void shutdown();
    [[nodiscard]] bool is_running() const noexcept { return running_.load(); }

    // ── Registry ─────────────────────────────
    Result<void> register_agent(AgentDescriptor descriptor);
    bool deregister_agent(const AgentId& id);
    [[nodiscard]] RegistryStats registry_stats() const;
    [[nodiscard]] Result<AgentDescriptor> route(const CapabilityId& capability) const;

    // ── Tasks ────────────────────────────────
    Result<TaskId> create_task(TaskRequest request);
    Result<TaskId> create_task(const CapabilityId& capability_id,
                               const ContextId& context_id,
                               Priority priority,
                               std::vector<TaskId> dependencies = {},
                               std::optional<Duration> timeout = std::nullopt,
                               std::optional<uint32_t> max_retries = std::nullopt);
    Result<void> add_dependency(const TaskId& task_id, const TaskId& depends_on);
    Result<void> cancel_task(const TaskId& task_id);
    [[nodiscard]] Result<Task> get_task(const TaskId& task_id) const;
    [[nodiscard]] Result<StatusStream> stream_status(const TaskId& task_id);
    [[nodiscard]] ManagerStats manager_stats() const;
    [[nodiscard]] std::vector<Task> tasks_in_context(const ContextId& context_id) const;

    // ── Accessors (for testing) ─────────────
    CapabilityRegistry& registry() { return registry_; }
    HealthMonitor& health_monitor() { return monitor_; }
    TaskManager& task_manager() { return manager_; }
    Logger& logger() { return logger_; }
    EventRecorder& events() { return events_; }
    const Config& config() const { return config_; }

private:
    Config config_;
    Logger logger_;
    EventRecorder events_;
    SteadyClock clock_;
    std::shared_ptr<IAgentInvoker> invoker_;

    CapabilityRegistry registry_;
    CapabilityRouter router_;
    HealthMonitor monitor_;
    TaskManager manager_;

    std::atomic<bool> running_{false};
};

}  // namespace agent_dispatch
