/**
 * @file scripted_invoker.cpp
 * @brief ScriptedInvoker implementation.
 */

#include "invoker/scripted_invoker.hpp"

#include <algorithm>
#include <chrono>
#include <thread>

namespace agent_dispatch {

namespace {

/// Sleep for `duration` or until `stop` fires. Returns true if stopped.
bool interruptible_wait(std::stop_token stop, Duration duration) {
    std::mutex m;
    std::condition_variable_any cv;
    std::unique_lock lock(m);
    return cv.wait_for(lock, stop, duration, [] { return false; }) || stop.stop_requested();
}

}  // anonymous namespace

Result<Payload> ScriptedInvoker::invoke(const Invocation& call) {
    InvokeScript script;
    uint32_t attempt_no = 0;
    size_t record_idx = 0;
    {
        std::lock_guard lock(mutex_);
        script = script_for(call.capability_id);
        attempt_no = ++attempts_seen_[call.task_id];
        record_idx = records_.size();
        records_.push_back(InvocationRecord{
            .task_id = call.task_id,
            .attempt = call.attempt,
            .agent_id = call.agent.agent_id,
            .capability_id = call.capability_id,
            .cancelled = false
        });
        ++in_flight_;
    }
    cv_.notify_all();

    bool stopped = false;
    bool hung = script.outcome == InvokeScript::Outcome::Hang && attempt_no > script.fail_first;
    if (hung) {
        if (call.stop.stop_possible()) {
            std::mutex m;
            std::condition_variable_any cv;
            std::unique_lock lock(m);
            cv.wait(lock, call.stop, [] { return false; });
            stopped = true;
        } else {
            stopped = interruptible_wait(call.stop, call.timeout);
        }
    } else if (script.latency.count() > 0) {
        stopped = interruptible_wait(call.stop, script.latency);
    }

    {
        std::lock_guard lock(mutex_);
        records_[record_idx].cancelled = stopped;
        --in_flight_;
    }
    cv_.notify_all();

    if (stopped) {
        return Error{ErrorCode::Cancelled, "invocation cancelled"};
    }
    if (hung) {
        return Error{ErrorCode::Timeout, "agent did not answer within " +
                     std::to_string(call.timeout.count()) + "ms"};
    }
    if (attempt_no <= script.fail_first || script.outcome == InvokeScript::Outcome::Fail) {
        return Error{ErrorCode::Dispatch, script.error};
    }
    return Payload{script.result};
}

Result<HealthSample> ScriptedInvoker::probe(const AgentDescriptor& agent, Duration timeout) {
    ProbeScript script;
    {
        std::lock_guard lock(mutex_);
        ++probe_counts_[agent.agent_id];
        if (auto it = probe_scripts_.find(agent.agent_id); it != probe_scripts_.end()) {
            script = it->second;
        }
    }

    if (script.latency > timeout) {
        std::this_thread::sleep_for(timeout);
        return Error{ErrorCode::Timeout, "probe timed out for " + agent.agent_id};
    }
    std::this_thread::sleep_for(script.latency);

    if (!script.reachable) {
        return Error{ErrorCode::Dispatch, "agent " + agent.agent_id + " unreachable"};
    }
    return HealthSample{.latency = script.latency};
}

// ─────────────────────────────────────────────
// Scripting
// ─────────────────────────────────────────────

void ScriptedInvoker::script_capability(const CapabilityId& capability, InvokeScript script) {
    std::lock_guard lock(mutex_);
    capability_scripts_[capability] = std::move(script);
}

void ScriptedInvoker::script_default(InvokeScript script) {
    std::lock_guard lock(mutex_);
    default_script_ = std::move(script);
}

void ScriptedInvoker::script_probe(const AgentId& agent, ProbeScript script) {
    std::lock_guard lock(mutex_);
    probe_scripts_[agent] = script;
}

InvokeScript ScriptedInvoker::script_for(const CapabilityId& capability) const {
    if (auto it = capability_scripts_.find(capability); it != capability_scripts_.end()) {
        return it->second;
    }
    return default_script_;
}

// ─────────────────────────────────────────────
// Inspection
// ─────────────────────────────────────────────

std::vector<InvocationRecord> ScriptedInvoker::invocations() const {
    std::lock_guard lock(mutex_);
    return records_;
}

std::vector<TaskId> ScriptedInvoker::dispatch_order() const {
    std::lock_guard lock(mutex_);
    std::vector<TaskId> order;
    order.reserve(records_.size());
    for (const auto& r : records_) order.push_back(r.task_id);
    return order;
}

size_t ScriptedInvoker::invocation_count(const TaskId& task_id) const {
    std::lock_guard lock(mutex_);
    return static_cast<size_t>(std::count_if(records_.begin(), records_.end(),
        [&](const InvocationRecord& r) { return r.task_id == task_id; }));
}

size_t ScriptedInvoker::probe_count(const AgentId& agent) const {
    std::lock_guard lock(mutex_);
    auto it = probe_counts_.find(agent);
    return it == probe_counts_.end() ? 0 : it->second;
}

size_t ScriptedInvoker::in_flight() const {
    std::lock_guard lock(mutex_);
    return in_flight_;
}

bool ScriptedInvoker::wait_for_invocations(size_t count, Duration timeout) const {
    std::unique_lock lock(mutex_);
    return cv_.wait_for(lock, timeout, [&] { return records_.size() >= count; });
}

}  // namespace agent_dispatch
