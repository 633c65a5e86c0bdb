/**
 * @file test_health_monitor.cpp
 * @brief Unit tests for HealthMonitor probe cycles, backoff and recovery.
 */

#include "health/health_monitor.hpp"
#include "invoker/scripted_invoker.hpp"
#include "telemetry/json_sink.hpp"

#include <gtest/gtest.h>
#include <chrono>
#include <thread>

using namespace agent_dispatch;

class HealthMonitorTest : public ::testing::Test {
protected:
    HealthConfig config_{
        .enabled = true,
        .probe_interval_ms = 50,
        .probe_timeout_ms = 20,
        .failure_threshold = 3,
        .max_backoff_ms = 400
    };
    CapabilityRegistry registry_;
    ScriptedInvoker invoker_;
    MemorySink* events_sink_ = nullptr;
    std::unique_ptr<Logger> logger_;
    std::unique_ptr<EventRecorder> events_;
    std::unique_ptr<HealthMonitor> monitor_;

    void SetUp() override {
        logger_ = std::make_unique<Logger>(std::make_unique<NullSink>(), LogLevel::Debug);
        auto sink = std::make_unique<MemorySink>();
        events_sink_ = sink.get();
        events_ = std::make_unique<EventRecorder>(std::move(sink));
        monitor_ = std::make_unique<HealthMonitor>(registry_, invoker_, config_, *logger_, *events_);
    }

    void TearDown() override {
        monitor_->stop();
    }

    void add_agent(const AgentId& id) {
        AgentDescriptor agent;
        agent.agent_id = id;
        agent.capabilities = {{"x", 0.9}};
        ASSERT_TRUE(registry_.register_agent(agent).has_value());
    }

    HealthStatus health_of(const AgentId& id) {
        return registry_.get_agent(id).value().health;
    }
};

TEST_F(HealthMonitorTest, SuccessfulProbeMarksHealthy) {
    add_agent("a");
    invoker_.script_probe("a", ProbeScript{.reachable = true, .latency = Duration{2}});

    EXPECT_EQ(monitor_->run_probe_cycle(), 1u);

    auto agent = registry_.get_agent("a");
    ASSERT_TRUE(agent.has_value());
    EXPECT_EQ(agent->health, HealthStatus::Healthy);
    EXPECT_EQ(agent->avg_response_time, Duration{2});
    EXPECT_TRUE(agent->last_probe_time.has_value());
    EXPECT_EQ(events_sink_->count_containing("\"agent_health\""), 1u);
}

TEST_F(HealthMonitorTest, ProbesOnlyDueAgents) {
    add_agent("a");
    EXPECT_EQ(monitor_->run_probe_cycle(), 1u);
    // Next probe is a full interval away.
    EXPECT_EQ(monitor_->run_probe_cycle(), 0u);
    EXPECT_EQ(invoker_.probe_count("a"), 1u);

    std::this_thread::sleep_for(std::chrono::milliseconds(70));
    EXPECT_EQ(monitor_->run_probe_cycle(), 1u);
}

TEST_F(HealthMonitorTest, FailuresDegradeThenMarkUnreachable) {
    add_agent("a");
    invoker_.script_probe("a", ProbeScript{.reachable = false});

    monitor_->probe_all();
    EXPECT_EQ(health_of("a"), HealthStatus::Degraded);
    monitor_->probe_all();
    EXPECT_EQ(health_of("a"), HealthStatus::Degraded);
    monitor_->probe_all();
    EXPECT_EQ(health_of("a"), HealthStatus::Unreachable);

    auto state = monitor_->probe_state("a");
    ASSERT_TRUE(state.has_value());
    EXPECT_EQ(state->consecutive_failures, 3u);
    EXPECT_EQ(state->interval, Duration{400});

    // One more failure keeps the interval at the cap.
    monitor_->probe_all();
    EXPECT_EQ(monitor_->probe_state("a")->interval, Duration{400});
}

TEST_F(HealthMonitorTest, RecoveryResetsBackoff) {
    add_agent("a");
    invoker_.script_probe("a", ProbeScript{.reachable = false});
    monitor_->probe_all();
    monitor_->probe_all();
    monitor_->probe_all();
    ASSERT_EQ(health_of("a"), HealthStatus::Unreachable);

    invoker_.script_probe("a", ProbeScript{.reachable = true, .latency = Duration{1}});
    monitor_->probe_all();

    EXPECT_EQ(health_of("a"), HealthStatus::Healthy);
    auto state = monitor_->probe_state("a");
    ASSERT_TRUE(state.has_value());
    EXPECT_EQ(state->consecutive_failures, 0u);
    EXPECT_EQ(state->interval, Duration{50});
}

TEST_F(HealthMonitorTest, SlowProbeCountsAsFailure) {
    add_agent("a");
    invoker_.script_probe("a", ProbeScript{.reachable = true, .latency = Duration{200}});

    monitor_->run_probe_cycle();
    auto agent = registry_.get_agent("a");
    EXPECT_EQ(agent->health, HealthStatus::Degraded);
    EXPECT_EQ(agent->latency_samples, 0u);
}

TEST_F(HealthMonitorTest, DeregisteredAgentStateIsDropped) {
    add_agent("a");
    add_agent("b");
    monitor_->run_probe_cycle();
    ASSERT_TRUE(monitor_->probe_state("a").has_value());

    registry_.deregister_agent("a");
    monitor_->run_probe_cycle();
    EXPECT_FALSE(monitor_->probe_state("a").has_value());
    EXPECT_TRUE(monitor_->probe_state("b").has_value());
}

TEST_F(HealthMonitorTest, ResetAgentMakesItDueAgain) {
    add_agent("a");
    monitor_->run_probe_cycle();
    EXPECT_EQ(monitor_->run_probe_cycle(), 0u);

    monitor_->reset_agent("a");
    EXPECT_EQ(monitor_->run_probe_cycle(), 1u);
}

TEST_F(HealthMonitorTest, BackgroundThreadProbes) {
    add_agent("a");
    monitor_->start();
    EXPECT_TRUE(monitor_->is_running());

    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(2);
    while (health_of("a") != HealthStatus::Healthy && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    EXPECT_EQ(health_of("a"), HealthStatus::Healthy);

    monitor_->stop();
    EXPECT_FALSE(monitor_->is_running());
}

TEST_F(HealthMonitorTest, WakePicksUpNewAgentsPromptly) {
    monitor_->start();
    std::this_thread::sleep_for(std::chrono::milliseconds(10));

    add_agent("late");
    monitor_->reset_agent("late");

    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(2);
    while (health_of("late") == HealthStatus::Unknown && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    EXPECT_EQ(health_of("late"), HealthStatus::Healthy);
}
