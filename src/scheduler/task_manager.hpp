/**
 * @file task_manager.hpp
 * @brief Task lifecycle: creation, dependency gating, priority dispatch,
 *        retries, timeouts, cascades and cancellation.
 *
 * Every state change happens inside one critical section guarded by
 * `mutex_`. A dedicated scheduler thread drains the wake-event channel,
 * fires due timers and dispatches from the priority lanes; it sleeps on a
 * condition variable until the next event or timer deadline. Invocations
 * run on a ThreadPool of `max_concurrent_tasks` workers and report back
 * through the same channel.
 *
 * State machine:
 *
 *   create ──► BLOCKED ──(deps completed)──► QUEUED ──(dispatch)──► RUNNING
 *     │                                        ▲                      │
 *     └────────────────► QUEUED                └──(retry after delay)─┤
 *                                                                     ├──► COMPLETED
 *                                                                     └──► FAILED
 *   any non-terminal ──(cancel)──► CANCELLED
 */

#pragma once

#include "core/clock.hpp"
#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/result.hpp"
#include "executor/thread_pool.hpp"
#include "invoker/agent_invoker.hpp"
#include "registry/capability_router.hpp"
#include "scheduler/priority_lanes.hpp"
#include "scheduler/status_stream.hpp"
#include "scheduler/task.hpp"
#include "scheduler/task_graph.hpp"
#include "telemetry/event_recorder.hpp"

#include <condition_variable>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <queue>
#include <stop_token>
#include <thread>
#include <unordered_map>
#include <vector>

namespace agent_dispatch {

class TaskManager {
public:
    TaskManager(SchedulerConfig config,
                const CapabilityRouter& router,
                IAgentInvoker& invoker,
                EventRecorder& events,
                Logger& logger,
                const IClock& clock);
    ~TaskManager();

    // Non-copyable
    TaskManager(const TaskManager&) = delete;
    TaskManager& operator=(const TaskManager&) = delete;

    // ── Lifecycle ─────────────────────────────

    /// Start the worker pool and the scheduler thread. Tasks created before start wait in their lanes.
    Result<void> start();

    /// Stop dispatching, signal every running invocation and join all threads.
    void shutdown();

    [[nodiscard]] bool is_running() const;

    // ── Operations ────────────────────────────

    Result<TaskId> create_task(TaskRequest request);
    Result<TaskId> create_task(const CapabilityId& capability_id,
                               const ContextId& context_id,
                               Priority priority,
                               std::vector<TaskId> dependencies = {},
                               std::optional<Duration> timeout = std::nullopt,
                               std::optional<uint32_t> max_retries = std::nullopt);

    /// Make a task that has not been dispatched yet wait for `depends_on` as well.
    Result<void> add_dependency(const TaskId& task_id, const TaskId& depends_on);

    Result<void> cancel_task(const TaskId& task_id);

    [[nodiscard]] Result<Task> get_task(const TaskId& task_id) const;
    [[nodiscard]] Result<StatusStream> stream_status(const TaskId& task_id);
    [[nodiscard]] ManagerStats manager_stats() const;
    /// Status channels still held for delivery, including ones whose stream was dropped but not yet pruned.
    [[nodiscard]] size_t subscriber_count() const;
    [[nodiscard]] std::vector<Task> tasks_in_context(const ContextId& context_id) const;

    /// Retry delay after the `retry_count`-th failure: min(base * 2^retry_count, cap).
    [[nodiscard]] Duration backoff_delay(uint32_t retry_count) const;

private:
    struct Entry {
        Task task;
        uint32_t attempt = 0;                     ///< Dispatch counter; stale reports carry an older value
        std::optional<std::stop_source> stop;     ///< Set while RUNNING
        bool retry_pending = false;               ///< QUEUED but waiting out a backoff delay
        std::optional<SteadyTime> resolved_at;    ///< When the current attempt's report was applied
    };

    struct WakeEvent {
        enum class Kind : uint8_t {
            TaskCreated,
            TaskCompleted,
            DependencyUnblocked,
            Cancelled,
            Shutdown
        };

        Kind kind;
        TaskId task_id;
        uint32_t attempt = 0;
        std::optional<Result<Payload>> outcome;
    };

    struct Timer {
        enum class Kind : uint8_t { Timeout, RetryDue };

        SteadyTime due;
        Kind kind;
        TaskId task_id;
        uint32_t attempt;

        bool operator>(const Timer& other) const { return due > other.due; }
    };

    // ── Scheduler thread ──────────────────────
    void scheduler_loop(std::stop_token stop);
    void handle_event_locked(WakeEvent& event);
    void fire_due_timers_locked();
    void dispatch_ready_locked();

    // ── Transitions (mutex_ held) ─────────────
    void start_attempt_locked(Entry& entry, const AgentDescriptor& agent);
    void complete_locked(Entry& entry, Payload result);
    void handle_failure_locked(Entry& entry, Error error);
    void finish_locked(Entry& entry, TaskState terminal, Error error);
    void cascade_locked(const TaskId& root, TaskState terminal, const Error& error);
    void promote_dependents_locked(const TaskId& completed);
    void enqueue_locked(Entry& entry, std::string_view reason);
    void transition_locked(Entry& entry, TaskState to, std::string_view reason);
    void publish_locked(const Entry& entry, TaskState from, std::string_view reason);
    void prune_subscribers_locked();
    void release_running_locked(Entry& entry);
    void post_event_locked(WakeEvent event);

    [[nodiscard]] bool dependencies_completed_locked(const Task& task) const;
    [[nodiscard]] Result<void> validate_request(const TaskRequest& request) const;
    [[nodiscard]] TaskId next_task_id_locked();

    void on_invocation_finished(const TaskId& task_id, uint32_t attempt, Result<Payload> outcome);

    SchedulerConfig config_;
    const CapabilityRouter& router_;
    IAgentInvoker& invoker_;
    EventRecorder& events_;
    Logger& logger_;
    const IClock& clock_;

    mutable std::mutex mutex_;
    std::condition_variable_any wake_cv_;
    std::deque<WakeEvent> wake_events_;
    std::priority_queue<Timer, std::vector<Timer>, std::greater<>> timers_;

    std::unordered_map<TaskId, Entry> tasks_;
    std::vector<TaskId> creation_order_;
    std::unordered_map<ContextId, std::vector<TaskId>> by_context_;
    std::unordered_map<TaskId, std::vector<std::weak_ptr<StatusChannel>>> subscribers_;
    TaskGraph graph_;
    PriorityLanes lanes_;
    size_t running_{0};
    uint64_t next_id_{1};
    bool started_{false};
    bool stopped_{false};

    std::unique_ptr<ThreadPool> pool_;
    std::jthread scheduler_thread_;
};

}  // namespace agent_dispatch
