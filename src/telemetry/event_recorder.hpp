/**
 * @file event_recorder.hpp
 * @brief Structured lifecycle events for tasks and agents, as NDJSON.
 */

#pragma once

#include "core/logger.hpp"
#include "core/result.hpp"
#include "core/types.hpp"

#include <atomic>
#include <memory>
#include <mutex>
#include <optional>

namespace agent_dispatch {

/**
 * @brief Collects and writes structured observability events.
 *
 * One JSON object per line, each with an "event" field. Anomalies (late
 * completions, stale timers) are also counted so tests and health checks
 * can read them without parsing output.
 */
class EventRecorder {
public:
    explicit EventRecorder(std::unique_ptr<ILogSink> sink);

    void record_task_transition(const TaskId& id, const ContextId& context,
                                TaskState from, TaskState to,
                                std::string_view reason = {});
    void record_task_created(const TaskId& id, const ContextId& context,
                             const CapabilityId& capability, Priority priority,
                             TaskState initial);
    void record_dispatch(const TaskId& id, const AgentId& agent, uint32_t attempt);
    void record_retry(const TaskId& id, uint32_t retry_count, Duration delay, const Error& cause);
    void record_cascade(const TaskId& root, TaskState terminal, size_t affected);

    void record_agent_registered(const AgentId& agent, size_t capability_count);
    void record_agent_deregistered(const AgentId& agent);
    void record_agent_health(const AgentId& agent, HealthStatus from, HealthStatus to,
                             std::optional<Duration> latency);

    void record_anomaly(std::string_view kind, const TaskId& id, std::string_view detail);
    void record_custom(std::string_view event, std::string_view json_payload);

    [[nodiscard]] uint64_t anomaly_count() const noexcept { return anomalies_.load(); }

    void flush();

private:
    void emit(std::string_view json_line);

    std::unique_ptr<ILogSink> sink_;
    std::mutex write_mutex_;
    std::atomic<uint64_t> anomalies_{0};
};

}  // namespace agent_dispatch
