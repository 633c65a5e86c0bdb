/**
 * @file event_recorder.cpp
 * @brief EventRecorder implementation.
 */

#include "telemetry/event_recorder.hpp"

#include <sstream>

namespace agent_dispatch {

EventRecorder::EventRecorder(std::unique_ptr<ILogSink> sink)
    : sink_(std::move(sink)) {}

void EventRecorder::record_task_transition(const TaskId& id, const ContextId& context,
                                           TaskState from, TaskState to,
                                           std::string_view reason) {
    std::ostringstream oss;
    oss << R"({"event":"task_state_change")"
        << R"(,"task":")" << escape_json(id) << "\""
        << R"(,"context":")" << escape_json(context) << "\""
        << R"(,"from":")" << to_string(from) << "\""
        << R"(,"to":")" << to_string(to) << "\"";
    if (!reason.empty()) {
        oss << R"(,"reason":")" << escape_json(reason) << "\"";
    }
    oss << "}";
    emit(oss.str());
}

void EventRecorder::record_task_created(const TaskId& id, const ContextId& context,
                                        const CapabilityId& capability, Priority priority,
                                        TaskState initial) {
    std::ostringstream oss;
    oss << R"({"event":"task_created")"
        << R"(,"task":")" << escape_json(id) << "\""
        << R"(,"context":")" << escape_json(context) << "\""
        << R"(,"capability":")" << escape_json(capability) << "\""
        << R"(,"priority":")" << to_string(priority) << "\""
        << R"(,"state":")" << to_string(initial) << "\""
        << "}";
    emit(oss.str());
}

void EventRecorder::record_dispatch(const TaskId& id, const AgentId& agent, uint32_t attempt) {
    std::ostringstream oss;
    oss << R"({"event":"task_dispatch")"
        << R"(,"task":")" << escape_json(id) << "\""
        << R"(,"agent":")" << escape_json(agent) << "\""
        << R"(,"attempt":)" << attempt
        << "}";
    emit(oss.str());
}

void EventRecorder::record_retry(const TaskId& id, uint32_t retry_count, Duration delay,
                                 const Error& cause) {
    std::ostringstream oss;
    oss << R"({"event":"task_retry")"
        << R"(,"task":")" << escape_json(id) << "\""
        << R"(,"retry_count":)" << retry_count
        << R"(,"delay_ms":)" << delay.count()
        << R"(,"cause":")" << to_string(cause.code) << "\""
        << R"(,"error":")" << escape_json(cause.message) << "\""
        << "}";
    emit(oss.str());
}

void EventRecorder::record_cascade(const TaskId& root, TaskState terminal, size_t affected) {
    std::ostringstream oss;
    oss << R"({"event":"task_cascade")"
        << R"(,"root":")" << escape_json(root) << "\""
        << R"(,"state":")" << to_string(terminal) << "\""
        << R"(,"affected":)" << affected
        << "}";
    emit(oss.str());
}

void EventRecorder::record_agent_registered(const AgentId& agent, size_t capability_count) {
    std::ostringstream oss;
    oss << R"({"event":"agent_registered")"
        << R"(,"agent":")" << escape_json(agent) << "\""
        << R"(,"capabilities":)" << capability_count
        << "}";
    emit(oss.str());
}

void EventRecorder::record_agent_deregistered(const AgentId& agent) {
    std::ostringstream oss;
    oss << R"({"event":"agent_deregistered")"
        << R"(,"agent":")" << escape_json(agent) << "\""
        << "}";
    emit(oss.str());
}

void EventRecorder::record_agent_health(const AgentId& agent, HealthStatus from, HealthStatus to,
                                        std::optional<Duration> latency) {
    std::ostringstream oss;
    oss << R"({"event":"agent_health")"
        << R"(,"agent":")" << escape_json(agent) << "\""
        << R"(,"from":")" << to_string(from) << "\""
        << R"(,"to":")" << to_string(to) << "\"";
    if (latency) {
        oss << R"(,"latency_ms":)" << latency->count();
    }
    oss << "}";
    emit(oss.str());
}

void EventRecorder::record_anomaly(std::string_view kind, const TaskId& id, std::string_view detail) {
    anomalies_.fetch_add(1);
    std::ostringstream oss;
    oss << R"({"event":"anomaly")"
        << R"(,"kind":")" << escape_json(kind) << "\""
        << R"(,"task":")" << escape_json(id) << "\""
        << R"(,"detail":")" << escape_json(detail) << "\""
        << "}";
    emit(oss.str());
}

void EventRecorder::record_custom(std::string_view event, std::string_view json_payload) {
    std::ostringstream oss;
    oss << R"({"event":")" << escape_json(event) << "\""
        << R"(,"data":)" << json_payload
        << "}";
    emit(oss.str());
}

void EventRecorder::emit(std::string_view json_line) {
    std::lock_guard lock(write_mutex_);
    sink_->write(json_line);
}

void EventRecorder::flush() {
    std::lock_guard lock(write_mutex_);
    sink_->flush();
}

}  // namespace agent_dispatch
