/**
 * @file test_coordinator.cpp
 * @brief Integration tests exercising the full dispatch pipeline through
 *        the Coordinator facade.
 */

#include "orchestrator/coordinator.hpp"
#include "core/config.hpp"
#include "core/types.hpp"
#include "invoker/scripted_invoker.hpp"
#include "telemetry/json_sink.hpp"

#include <gtest/gtest.h>
#include <chrono>
#include <stdexcept>
#include <thread>

using namespace agent_dispatch;
using namespace std::chrono_literals;

namespace {

Config test_config() {
    Config config = default_config();
    config.scheduler.max_concurrent_tasks = 4;
    config.scheduler.default_timeout_ms = 2000;
    config.scheduler.retry_base_delay_ms = 5;
    config.scheduler.retry_max_delay_ms = 20;
    config.health.probe_interval_ms = 10000;
    config.health.probe_timeout_ms = 200;
    config.health.failure_threshold = 1;
    config.health.max_backoff_ms = 60000;
    config.telemetry.log_dir.clear();
    return config;
}

AgentDescriptor agent(const AgentId& id, std::vector<CapabilityDeclaration> caps) {
    AgentDescriptor a;
    a.agent_id = id;
    a.endpoint = "inproc://" + id;
    a.capabilities = std::move(caps);
    return a;
}

}  // namespace

class CoordinatorIntegration : public ::testing::Test {
protected:
    std::shared_ptr<ScriptedInvoker> invoker_ = std::make_shared<ScriptedInvoker>();
    MemorySink* event_lines_ = nullptr;

    std::unique_ptr<Coordinator> make(Config config = test_config()) {
        auto sink = std::make_unique<MemorySink>();
        event_lines_ = sink.get();
        return std::make_unique<Coordinator>(Coordinator::Options{
            .config = std::move(config),
            .log_sink = std::make_unique<NullSink>(),
            .event_sink = std::move(sink),
            .log_level = LogLevel::Debug,
            .invoker = invoker_
        });
    }

    static bool wait_for(Coordinator& c, const TaskId& id, TaskState state,
                         Duration timeout = 3000ms) {
        auto deadline = std::chrono::steady_clock::now() + timeout;
        while (std::chrono::steady_clock::now() < deadline) {
            if (c.get_task(id).value().state == state) return true;
            std::this_thread::sleep_for(2ms);
        }
        return c.get_task(id).value().state == state;
    }
};

// ═══════════════════════════════════════════════
// Routing & Dispatch
// ═══════════════════════════════════════════════

TEST_F(CoordinatorIntegration, UrgentTaskRunsOnHealthyAgent) {
    auto c = make();
    ASSERT_TRUE(c->register_agent(agent("A1", {{"x", 0.9}})).has_value());
    c->health_monitor().probe_all();
    EXPECT_EQ(c->registry().get_agent("A1")->health, HealthStatus::Healthy);

    ASSERT_TRUE(c->start().has_value());
    auto id = c->create_task("x", "ctx", Priority::Urgent);
    ASSERT_TRUE(id.has_value());

    ASSERT_TRUE(wait_for(*c, *id, TaskState::Completed));
    auto task = c->get_task(*id).value();
    EXPECT_EQ(task.assigned_agent, std::optional<AgentId>{"A1"});
    EXPECT_EQ(task.retry_count, 0u);
    EXPECT_EQ(event_lines_->count_containing(R"("event":"task_dispatch")"), 1u);
    EXPECT_EQ(event_lines_->count_containing(R"("event":"agent_registered")"), 1u);
}

TEST_F(CoordinatorIntegration, UnreachableAgentIsNeverChosen) {
    invoker_->script_probe("A1", ProbeScript{.reachable = false});
    auto c = make();
    ASSERT_TRUE(c->register_agent(agent("A1", {{"x", 0.99}})).has_value());
    ASSERT_TRUE(c->register_agent(agent("A2", {{"x", 0.4}})).has_value());
    c->health_monitor().probe_all();

    EXPECT_EQ(c->registry().get_agent("A1")->health, HealthStatus::Unreachable);
    auto routed = c->route("x");
    ASSERT_TRUE(routed.has_value());
    EXPECT_EQ(routed->agent_id, "A2");

    ASSERT_TRUE(c->start().has_value());
    auto id = c->create_task("x", "ctx", Priority::High);
    ASSERT_TRUE(id.has_value());
    ASSERT_TRUE(wait_for(*c, *id, TaskState::Completed));
    EXPECT_EQ(c->get_task(*id).value().assigned_agent, std::optional<AgentId>{"A2"});
    EXPECT_EQ(invoker_->invocations().front().agent_id, "A2");
}

TEST_F(CoordinatorIntegration, ReRegistrationReplacesCapabilities) {
    auto c = make();
    ASSERT_TRUE(c->register_agent(agent("A1", {{"x", 0.9}})).has_value());
    ASSERT_TRUE(c->register_agent(agent("A1", {{"y", 0.5}})).has_value());

    auto stats = c->registry_stats();
    EXPECT_EQ(stats.total_agents, 1u);
    EXPECT_EQ(stats.capability_coverage.count("x"), 0u);
    EXPECT_EQ(stats.capability_coverage.at("y"), 1u);

    auto missing = c->route("x");
    ASSERT_FALSE(missing.has_value());
    EXPECT_EQ(missing.error().code, ErrorCode::NotFound);
    EXPECT_EQ(c->route("y")->agent_id, "A1");
}

TEST_F(CoordinatorIntegration, DeregisteredAgentStopsReceivingWork) {
    auto c = make();
    ASSERT_TRUE(c->register_agent(agent("A1", {{"x", 0.9}})).has_value());
    EXPECT_TRUE(c->deregister_agent("A1"));
    EXPECT_FALSE(c->deregister_agent("A1"));

    ASSERT_TRUE(c->start().has_value());
    auto id = c->create_task("x", "ctx", Priority::Medium, {}, std::nullopt, 1u);
    ASSERT_TRUE(id.has_value());
    ASSERT_TRUE(wait_for(*c, *id, TaskState::Failed));
    EXPECT_EQ(c->get_task(*id).value().error->code, ErrorCode::NotFound);
    EXPECT_TRUE(invoker_->invocations().empty());
}

// ═══════════════════════════════════════════════
// Task Graphs
// ═══════════════════════════════════════════════

TEST_F(CoordinatorIntegration, FanInPipelineCompletesInOrder) {
    invoker_->script_capability("extract", InvokeScript{.latency = 20ms, .result = "rows"});
    invoker_->script_capability("review", InvokeScript{.fail_first = 1, .result = "lgtm"});
    auto c = make();
    ASSERT_TRUE(c->register_agent(agent("worker", {{"extract", 0.9}, {"review", 0.9},
                                                   {"report", 0.9}})).has_value());
    ASSERT_TRUE(c->start().has_value());

    auto extract = c->create_task("extract", "session", Priority::High);
    auto review = c->create_task("review", "session", Priority::Medium);
    ASSERT_TRUE(extract && review);
    auto report = c->create_task(TaskRequest{
        .capability_id = "report",
        .context_id = "session",
        .priority = Priority::Urgent,
        .dependencies = {*extract, *review},
        .payload = "{}"
    });
    ASSERT_TRUE(report.has_value());

    auto stream = c->stream_status(*report);
    ASSERT_TRUE(stream.has_value());
    std::optional<TaskEvent> last;
    while (auto event = stream->next(3000ms)) last = event;

    ASSERT_TRUE(last.has_value());
    EXPECT_EQ(last->to, TaskState::Completed);
    EXPECT_EQ(invoker_->dispatch_order().back(), *report);
    EXPECT_EQ(c->get_task(*review).value().retry_count, 1u);

    auto tasks = c->tasks_in_context("session");
    ASSERT_EQ(tasks.size(), 3u);
    for (const auto& task : tasks) {
        EXPECT_EQ(task.state, TaskState::Completed) << task.id;
    }

    auto stats = c->manager_stats();
    EXPECT_EQ(stats.count(TaskState::Completed), 3u);
    EXPECT_EQ(stats.running, 0u);
}

TEST_F(CoordinatorIntegration, FailureCascadesThroughCoordinator) {
    invoker_->script_capability("bad", InvokeScript{.outcome = InvokeScript::Outcome::Fail});
    auto c = make();
    ASSERT_TRUE(c->register_agent(agent("A1", {{"bad", 1.0}, {"x", 1.0}})).has_value());
    ASSERT_TRUE(c->start().has_value());

    auto root = c->create_task("bad", "ctx", Priority::High, {}, std::nullopt, 0u);
    ASSERT_TRUE(root.has_value());
    auto child = c->create_task("x", "ctx", Priority::High, {*root});
    ASSERT_TRUE(child.has_value());

    ASSERT_TRUE(wait_for(*c, *child, TaskState::Failed));
    EXPECT_EQ(c->get_task(*child).value().error->code, ErrorCode::DependencyFailed);
    EXPECT_EQ(invoker_->invocation_count(*child), 0u);

    auto cycle = c->add_dependency(*root, *child);
    ASSERT_FALSE(cycle.has_value());
}

// ═══════════════════════════════════════════════
// Lifecycle
// ═══════════════════════════════════════════════

TEST_F(CoordinatorIntegration, StartRejectsInvalidConfig) {
    auto config = test_config();
    config.scheduler.max_concurrent_tasks = 0;
    auto c = make(config);

    auto started = c->start();
    ASSERT_FALSE(started.has_value());
    EXPECT_EQ(started.error().code, ErrorCode::Config);
    EXPECT_FALSE(c->is_running());
}

TEST_F(CoordinatorIntegration, StartTwiceIsRejected) {
    auto c = make();
    ASSERT_TRUE(c->start().has_value());
    auto again = c->start();
    ASSERT_FALSE(again.has_value());
    EXPECT_EQ(again.error().code, ErrorCode::Validation);
    EXPECT_TRUE(c->is_running());
}

TEST_F(CoordinatorIntegration, HealthMonitorCanBeDisabled) {
    auto config = test_config();
    config.health.enabled = false;
    auto c = make(config);
    ASSERT_TRUE(c->register_agent(agent("A1", {{"x", 0.9}})).has_value());
    ASSERT_TRUE(c->start().has_value());
    EXPECT_FALSE(c->health_monitor().is_running());

    auto id = c->create_task("x", "ctx", Priority::Low);
    ASSERT_TRUE(id.has_value());
    ASSERT_TRUE(wait_for(*c, *id, TaskState::Completed));
    EXPECT_EQ(c->registry().get_agent("A1")->health, HealthStatus::Unknown);
    EXPECT_EQ(invoker_->probe_count("A1"), 0u);
}

TEST_F(CoordinatorIntegration, ShutdownIsIdempotentAndRecordsSummary) {
    auto c = make();
    ASSERT_TRUE(c->register_agent(agent("A1", {{"x", 0.9}})).has_value());
    ASSERT_TRUE(c->start().has_value());
    auto id = c->create_task("x", "ctx", Priority::Medium);
    ASSERT_TRUE(id.has_value());
    ASSERT_TRUE(wait_for(*c, *id, TaskState::Completed));

    c->shutdown();
    c->shutdown();
    EXPECT_FALSE(c->is_running());
    EXPECT_EQ(event_lines_->count_containing(R"("event":"coordinator_stopped")"), 1u);
    EXPECT_EQ(event_lines_->count_containing(R"("completed":1)"), 1u);
}

TEST_F(CoordinatorIntegration, RequiresInvoker) {
    EXPECT_THROW(Coordinator(Coordinator::Options{.config = test_config()}), std::invalid_argument);
}
