/**
 * @file coordinator.cpp
 * @brief Coordinator implementation.
 */

#include "orchestrator/coordinator.hpp"

#include "telemetry/json_sink.hpp"

#include <stdexcept>

namespace agent_dispatch {

namespace {

std::unique_ptr<ILogSink> sink_or_null(std::unique_ptr<ILogSink> sink, bool enabled) {
    if (!enabled || !sink) {
        return std::make_unique<NullSink>();
    }
    return sink;
}

std::shared_ptr<IAgentInvoker> require_invoker(std::shared_ptr<IAgentInvoker> invoker) {
    if (!invoker) {
        throw std::invalid_argument("Coordinator requires an IAgentInvoker");
    }
    return invoker;
}

}  // anonymous namespace

Coordinator::Coordinator(Options opts)
    : config_(std::move(opts.config))
    , logger_(sink_or_null(std::move(opts.log_sink), true), opts.log_level)
    , events_(sink_or_null(std::move(opts.event_sink), config_.telemetry.record_events))
    , invoker_(require_invoker(std::move(opts.invoker)))
    , registry_(config_.registry.latency_ema_weight, clock_)
    , router_(registry_, config_.router)
    , monitor_(registry_, *invoker_, config_.health, logger_, events_)
    , manager_(config_.scheduler, router_, *invoker_, events_, logger_, clock_) {
}

Coordinator::~Coordinator() {
    shutdown();
}

// ─────────────────────────────────────────────
// Lifecycle
// ─────────────────────────────────────────────

Result<void> Coordinator::start() {
    if (auto valid = validate_config(config_); !valid) {
        logger_.error("Refusing to start: " + valid.error().message);
        return valid.error();
    }
    if (running_.exchange(true)) {
        return Error{ErrorCode::Validation, "Already running"};
    }

    logger_.info("Coordinator starting: " + std::to_string(registry_.size()) + " agent(s) registered");

    if (auto started = manager_.start(); !started) {
        running_.store(false);
        return started.error();
    }

    if (config_.health.enabled) {
        monitor_.start();
    } else {
        logger_.info("Health monitor disabled");
    }

    logger_.info("Coordinator started successfully");
    return Result<void>{};
}

void Coordinator::shutdown() {
    if (!running_.exchange(false)) return;

    logger_.info("Coordinator shutting down...");
    monitor_.stop();
    manager_.shutdown();

    auto stats = manager_.manager_stats();
    events_.record_custom("coordinator_stopped",
        "{\"tasks\":" + std::to_string(stats.total_tasks)
        + ",\"completed\":" + std::to_string(stats.count(TaskState::Completed))
        + ",\"failed\":" + std::to_string(stats.count(TaskState::Failed))
        + ",\"cancelled\":" + std::to_string(stats.count(TaskState::Cancelled)) + "}");
    events_.flush();

    logger_.info("Coordinator stopped");
    logger_.flush();
}

// ─────────────────────────────────────────────
// Registry
// ─────────────────────────────────────────────

Result<void> Coordinator::register_agent(AgentDescriptor descriptor) {
    auto id = descriptor.agent_id;
    auto capability_count = descriptor.capabilities.size();

    auto registered = registry_.register_agent(std::move(descriptor));
    if (!registered) {
        logger_.warn("Rejected agent registration: " + registered.error().message);
        return registered;
    }

    events_.record_agent_registered(id, capability_count);
    monitor_.reset_agent(id);
    logger_.info("Agent registered: " + id + " (" + std::to_string(capability_count) + " capabilities)");
    return registered;
}

bool Coordinator::deregister_agent(const AgentId& id) {
    if (!registry_.deregister_agent(id)) return false;

    events_.record_agent_deregistered(id);
    logger_.info("Agent deregistered: " + id);
    return true;
}

RegistryStats Coordinator::registry_stats() const {
    return registry_.stats();
}

Result<AgentDescriptor> Coordinator::route(const CapabilityId& capability) const {
    return router_.route(capability);
}

// ─────────────────────────────────────────────
// Tasks
// ─────────────────────────────────────────────

Result<TaskId> Coordinator::create_task(TaskRequest request) {
    return manager_.create_task(std::move(request));
}

Result<TaskId> Coordinator::create_task(const CapabilityId& capability_id,
                                        const ContextId& context_id,
                                        Priority priority,
                                        std::vector<TaskId> dependencies,
                                        std::optional<Duration> timeout,
                                        std::optional<uint32_t> max_retries) {
    return manager_.create_task(capability_id, context_id, priority,
                                std::move(dependencies), timeout, max_retries);
}

Result<void> Coordinator::add_dependency(const TaskId& task_id, const TaskId& depends_on) {
    return manager_.add_dependency(task_id, depends_on);
}

Result<void> Coordinator::cancel_task(const TaskId& task_id) {
    return manager_.cancel_task(task_id);
}

Result<Task> Coordinator::get_task(const TaskId& task_id) const {
    return manager_.get_task(task_id);
}

Result<StatusStream> Coordinator::stream_status(const TaskId& task_id) {
    return manager_.stream_status(task_id);
}

ManagerStats Coordinator::manager_stats() const {
    return manager_.manager_stats();
}

std::vector<Task> Coordinator::tasks_in_context(const ContextId& context_id) const {
    return manager_.tasks_in_context(context_id);
}

}  // namespace agent_dispatch
