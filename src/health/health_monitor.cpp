/**
 * @file health_monitor.cpp
 * @brief HealthMonitor implementation.
 *
 * Probe outcome → registry health:
 *   success                         → HEALTHY, latency folded into the average
 *   failure, below the threshold    → DEGRADED
 *   failure, threshold reached      → UNREACHABLE
 */

#include "health/health_monitor.hpp"

#include <algorithm>
#include <chrono>
#include <exception>
#include <future>
#include <vector>

namespace agent_dispatch {

namespace {

// Slack on top of the probe timeout before a probe future is abandoned.
constexpr Duration kProbeGrace{50};

}  // anonymous namespace

HealthMonitor::HealthMonitor(CapabilityRegistry& registry,
                             IAgentInvoker& invoker,
                             HealthConfig config,
                             Logger& logger,
                             EventRecorder& events,
                             size_t probe_workers)
    : registry_(registry)
    , invoker_(invoker)
    , config_(config)
    , logger_(logger)
    , events_(events)
    , probe_pool_(std::max<size_t>(probe_workers, 1)) {}

HealthMonitor::~HealthMonitor() {
    stop();
}

void HealthMonitor::start() {
    if (monitor_thread_.joinable()) return;
    logger_.info("Health monitor starting (interval "
                 + std::to_string(config_.probe_interval_ms) + "ms, threshold "
                 + std::to_string(config_.failure_threshold) + ")");
    monitor_thread_ = std::jthread([this](std::stop_token stop) {
        monitor_loop(stop);
    });
}

void HealthMonitor::stop() {
    if (!monitor_thread_.joinable()) return;
    monitor_thread_.request_stop();
    wake_cv_.notify_all();
    monitor_thread_.join();
    monitor_thread_ = std::jthread{};
    logger_.info("Health monitor stopped");
}

bool HealthMonitor::is_running() const noexcept {
    return monitor_thread_.joinable();
}

void HealthMonitor::wake() {
    {
        std::lock_guard lock(state_mutex_);
        wake_requested_ = true;
    }
    wake_cv_.notify_all();
}

void HealthMonitor::reset_agent(const AgentId& id) {
    {
        std::lock_guard lock(state_mutex_);
        states_.erase(id);
    }
    wake();
}

std::optional<ProbeState> HealthMonitor::probe_state(const AgentId& id) const {
    std::lock_guard lock(state_mutex_);
    auto it = states_.find(id);
    if (it == states_.end()) return std::nullopt;
    return it->second;
}

size_t HealthMonitor::run_probe_cycle() {
    return probe_agents(true);
}

size_t HealthMonitor::probe_all() {
    return probe_agents(false);
}

size_t HealthMonitor::probe_agents(bool only_due) {
    std::lock_guard cycle_lock(cycle_mutex_);

    auto agents = registry_.list_agents();
    auto now = std::chrono::steady_clock::now();

    std::vector<AgentDescriptor> due;
    {
        std::lock_guard lock(state_mutex_);
        // Drop bookkeeping for agents that have been deregistered.
        std::erase_if(states_, [&](const auto& entry) {
            return std::none_of(agents.begin(), agents.end(),
                [&](const AgentDescriptor& a) { return a.agent_id == entry.first; });
        });

        for (auto& agent : agents) {
            auto it = states_.find(agent.agent_id);
            if (!only_due || it == states_.end() || it->second.next_probe_at <= now) {
                due.push_back(std::move(agent));
            }
        }
    }

    if (due.empty()) return 0;

    const Duration timeout{config_.probe_timeout_ms};
    std::vector<std::future<Result<HealthSample>>> futures;
    futures.reserve(due.size());
    for (const auto& agent : due) {
        futures.push_back(probe_pool_.submit([&invoker = invoker_, agent, timeout]() {
            return invoker.probe(agent, timeout);
        }));
    }

    for (size_t i = 0; i < due.size(); ++i) {
        auto& future = futures[i];
        if (future.wait_for(timeout + kProbeGrace) != std::future_status::ready) {
            apply_outcome(due[i], Error{ErrorCode::Timeout, "probe exceeded "
                                        + std::to_string(timeout.count()) + "ms"});
            continue;
        }
        try {
            apply_outcome(due[i], future.get());
        } catch (const std::exception& ex) {
            apply_outcome(due[i], Error{ErrorCode::Dispatch,
                                        std::string{"probe raised: "} + ex.what()});
        }
    }

    return due.size();
}

void HealthMonitor::apply_outcome(const AgentDescriptor& agent, const Result<HealthSample>& outcome) {
    const Duration base{config_.probe_interval_ms};
    const Duration cap{config_.max_backoff_ms};

    HealthStatus next_status;
    std::optional<Duration> latency;
    uint32_t failures = 0;
    {
        std::lock_guard lock(state_mutex_);
        auto& state = states_[agent.agent_id];
        if (state.interval.count() == 0) state.interval = base;

        if (outcome.has_value()) {
            state.consecutive_failures = 0;
            state.interval = base;
            next_status = HealthStatus::Healthy;
            latency = outcome->latency;
        } else {
            ++state.consecutive_failures;
            state.interval = std::min(state.interval * 2, cap);
            next_status = state.consecutive_failures >= config_.failure_threshold
                ? HealthStatus::Unreachable
                : HealthStatus::Degraded;
        }
        failures = state.consecutive_failures;
        state.next_probe_at = std::chrono::steady_clock::now() + state.interval;
    }

    if (!registry_.update_health(agent.agent_id, next_status, latency)) {
        return;  // deregistered while the probe was in flight
    }

    if (agent.health != next_status) {
        events_.record_agent_health(agent.agent_id, agent.health, next_status, latency);
        if (next_status == HealthStatus::Healthy) {
            logger_.info("Agent " + agent.agent_id + " is healthy");
        } else {
            logger_.warn("Agent " + agent.agent_id + " is " + std::string{to_string(next_status)}
                         + " after " + std::to_string(failures) + " failed probe(s): "
                         + outcome.error().message);
        }
    }
}

SteadyTime HealthMonitor::next_wake() const {
    auto now = std::chrono::steady_clock::now();
    auto earliest = now + Duration{config_.probe_interval_ms};
    std::lock_guard lock(state_mutex_);
    for (const auto& [id, state] : states_) {
        earliest = std::min(earliest, state.next_probe_at);
    }
    return earliest;
}

void HealthMonitor::monitor_loop(std::stop_token stop) {
    while (!stop.stop_requested()) {
        run_probe_cycle();

        auto deadline = next_wake();
        std::unique_lock lock(state_mutex_);
        wake_cv_.wait_until(lock, stop, deadline, [this] { return wake_requested_; });
        wake_requested_ = false;
    }
}

}  // namespace agent_dispatch
