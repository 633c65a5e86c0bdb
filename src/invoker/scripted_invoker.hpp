/**
 * @file scripted_invoker.hpp
 * @brief In-process IAgentInvoker with scripted behaviour.
 *
 * Used by the daemon's demo mode and by the tests. Behaviour is configured
 * per capability (invocations) and per agent (probes); every invocation is
 * recorded in dispatch order.
 */

#pragma once

#include "invoker/agent_invoker.hpp"

#include <condition_variable>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace agent_dispatch {

struct InvokeScript {
    enum class Outcome : uint8_t {
        Succeed,
        Fail,
        Hang        ///< Block until the stop token fires
    };

    Outcome outcome = Outcome::Succeed;
    Duration latency{0};
    uint32_t fail_first = 0;              ///< Fail this many attempts per task, then follow `outcome`
    std::string result = "ok";
    std::string error = "scripted failure";
};

struct ProbeScript {
    bool reachable = true;
    Duration latency{1};
};

struct InvocationRecord {
    TaskId task_id;
    uint32_t attempt;
    AgentId agent_id;
    CapabilityId capability_id;
    bool cancelled = false;               ///< Stop token fired before the call returned
};

class ScriptedInvoker : public IAgentInvoker {
public:
    ScriptedInvoker() = default;

    Result<Payload> invoke(const Invocation& call) override;
    Result<HealthSample> probe(const AgentDescriptor& agent, Duration timeout) override;

    // ── Scripting ─────────────────────────────
    void script_capability(const CapabilityId& capability, InvokeScript script);
    void script_default(InvokeScript script);
    void script_probe(const AgentId& agent, ProbeScript script);

    // ── Inspection ────────────────────────────
    [[nodiscard]] std::vector<InvocationRecord> invocations() const;
    [[nodiscard]] std::vector<TaskId> dispatch_order() const;
    [[nodiscard]] size_t invocation_count(const TaskId& task_id) const;
    [[nodiscard]] size_t probe_count(const AgentId& agent) const;
    [[nodiscard]] size_t in_flight() const;

    /// Block until `count` invocations have started or `timeout` passes.
    bool wait_for_invocations(size_t count, Duration timeout) const;

private:
    InvokeScript script_for(const CapabilityId& capability) const;

    mutable std::mutex mutex_;
    mutable std::condition_variable cv_;
    InvokeScript default_script_;
    std::unordered_map<CapabilityId, InvokeScript> capability_scripts_;
    std::unordered_map<AgentId, ProbeScript> probe_scripts_;
    std::unordered_map<TaskId, uint32_t> attempts_seen_;
    std::unordered_map<AgentId, size_t> probe_counts_;
    std::vector<InvocationRecord> records_;
    size_t in_flight_{0};
};

}  // namespace agent_dispatch
