/**
 * @file health_monitor.hpp
 * @brief Periodic agent liveness probing.
 *
 * Runs a dedicated std::jthread that probes every registered agent through
 * IAgentInvoker::probe and writes the outcome into the CapabilityRegistry.
 * Dispatch never waits on it: the router only reads whatever health the
 * registry holds at the time.
 */

#pragma once

#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/types.hpp"
#include "executor/thread_pool.hpp"
#include "invoker/agent_invoker.hpp"
#include "registry/capability_registry.hpp"
#include "telemetry/event_recorder.hpp"

#include <condition_variable>
#include <mutex>
#include <optional>
#include <thread>
#include <unordered_map>

namespace agent_dispatch {

/**
 * @brief Per-agent probe bookkeeping.
 *
 * The interval doubles on every failed probe (capped at max_backoff) and
 * snaps back to the base interval on the first success.
 */
struct ProbeState {
    uint32_t consecutive_failures{0};
    Duration interval{0};
    SteadyTime next_probe_at{};
};

class HealthMonitor {
public:
    HealthMonitor(CapabilityRegistry& registry,
                  IAgentInvoker& invoker,
                  HealthConfig config,
                  Logger& logger,
                  EventRecorder& events,
                  size_t probe_workers = 4);
    ~HealthMonitor();

    // Non-copyable
    HealthMonitor(const HealthMonitor&) = delete;
    HealthMonitor& operator=(const HealthMonitor&) = delete;

    void start();
    void stop();
    [[nodiscard]] bool is_running() const noexcept;

    /// Probe every agent whose next probe is due. Returns the number probed.
    size_t run_probe_cycle();

    /// Probe every registered agent now, ignoring backoff.
    size_t probe_all();

    /// Forget an agent's backoff so it is probed on the next cycle.
    void reset_agent(const AgentId& id);

    /// Wake the monitor thread early.
    void wake();

    [[nodiscard]] std::optional<ProbeState> probe_state(const AgentId& id) const;

private:
    void monitor_loop(std::stop_token stop);
    size_t probe_agents(bool only_due);
    void apply_outcome(const AgentDescriptor& agent, const Result<HealthSample>& outcome);
    [[nodiscard]] SteadyTime next_wake() const;

    CapabilityRegistry& registry_;
    IAgentInvoker& invoker_;
    HealthConfig config_;
    Logger& logger_;
    EventRecorder& events_;

    ThreadPool probe_pool_;
    std::mutex cycle_mutex_;               // one probe cycle at a time
    mutable std::mutex state_mutex_;
    std::condition_variable_any wake_cv_;
    bool wake_requested_{false};
    std::unordered_map<AgentId, ProbeState> states_;
    std::jthread monitor_thread_;
};

}  // namespace agent_dispatch
