/**
 * @file task_manager.cpp
 * @brief TaskManager implementation.
 *
 * Locking: every method with a `_locked` suffix expects `mutex_` to be
 * held. The only code that runs outside it is the invocation itself, on a
 * pool worker, which re-enters through on_invocation_finished().
 */

#include "scheduler/task_manager.hpp"

#include <algorithm>
#include <exception>
#include <iomanip>
#include <sstream>

namespace agent_dispatch {

namespace {

Result<Payload> invoke_guarded(IAgentInvoker& invoker, const Invocation& call) {
    try {
        return invoker.invoke(call);
    } catch (const std::exception& ex) {
        return Error{ErrorCode::Dispatch, std::string{"invoker raised: "} + ex.what()};
    }
}

std::string describe(const Error& error) {
    return std::string{to_string(error.code)} + ": " + error.message;
}

}  // anonymous namespace

TaskManager::TaskManager(SchedulerConfig config,
                         const CapabilityRouter& router,
                         IAgentInvoker& invoker,
                         EventRecorder& events,
                         Logger& logger,
                         const IClock& clock)
    : config_(config)
    , router_(router)
    , invoker_(invoker)
    , events_(events)
    , logger_(logger)
    , clock_(clock)
    , lanes_(config.lane_depth_limit) {}

TaskManager::~TaskManager() {
    shutdown();
}

// ─────────────────────────────────────────────
// Lifecycle
// ─────────────────────────────────────────────

Result<void> TaskManager::start() {
    std::lock_guard lock(mutex_);
    if (stopped_) {
        return Error{ErrorCode::Validation, "task manager cannot be restarted after shutdown"};
    }
    if (started_) {
        return Error{ErrorCode::Validation, "task manager is already running"};
    }

    pool_ = std::make_unique<ThreadPool>(config_.max_concurrent_tasks);
    started_ = true;
    scheduler_thread_ = std::jthread([this](std::stop_token stop) {
        scheduler_loop(stop);
    });

    logger_.info("Task manager started (" + std::to_string(config_.max_concurrent_tasks)
                 + " concurrent, " + std::to_string(lanes_.total()) + " task(s) waiting)");
    return {};
}

void TaskManager::shutdown() {
    {
        std::lock_guard lock(mutex_);
        if (stopped_) return;
        stopped_ = true;
        if (!started_) return;

        size_t signalled = 0;
        for (auto& [id, entry] : tasks_) {
            if (entry.stop) {
                entry.stop->request_stop();
                ++signalled;
            }
        }
        post_event_locked(WakeEvent{.kind = WakeEvent::Kind::Shutdown});
        logger_.info("Task manager shutting down (" + std::to_string(signalled)
                     + " running invocation(s) signalled)");
    }

    if (scheduler_thread_.joinable()) {
        scheduler_thread_.request_stop();
        scheduler_thread_.join();
    }
    if (pool_) {
        pool_->shutdown();
    }
}

bool TaskManager::is_running() const {
    std::lock_guard lock(mutex_);
    return started_ && !stopped_;
}

// ─────────────────────────────────────────────
// Creation
// ─────────────────────────────────────────────

Result<void> TaskManager::validate_request(const TaskRequest& request) const {
    if (request.capability_id.empty()) {
        return Error{ErrorCode::Validation, "capability_id must not be empty"};
    }
    if (!is_valid(request.priority)) {
        return Error{ErrorCode::Validation, "priority out of range: "
                     + std::to_string(static_cast<int>(request.priority))};
    }
    if (request.timeout && request.timeout->count() <= 0) {
        return Error{ErrorCode::Validation, "timeout must be positive"};
    }
    if (request.max_retries && *request.max_retries > config_.max_retries_ceiling) {
        return Error{ErrorCode::Validation, "max_retries " + std::to_string(*request.max_retries)
                     + " exceeds the ceiling of " + std::to_string(config_.max_retries_ceiling)};
    }
    return {};
}

TaskId TaskManager::next_task_id_locked() {
    std::ostringstream oss;
    oss << "task-" << std::setw(6) << std::setfill('0') << next_id_;
    return oss.str();
}

Result<TaskId> TaskManager::create_task(TaskRequest request) {
    if (auto valid = validate_request(request); !valid) {
        return valid.error();
    }

    std::lock_guard lock(mutex_);
    if (stopped_) {
        return Error{ErrorCode::ResourceExhausted, "task manager has been shut down"};
    }

    std::vector<TaskId> deps;
    for (auto& dep : request.dependencies) {
        if (std::find(deps.begin(), deps.end(), dep) == deps.end()) {
            deps.push_back(std::move(dep));
        }
    }

    bool dep_failed = false;
    bool dep_cancelled = false;
    bool all_completed = true;
    for (const auto& dep : deps) {
        auto it = tasks_.find(dep);
        if (it == tasks_.end()) {
            return Error{ErrorCode::Validation, "unknown dependency: " + dep};
        }
        switch (it->second.task.state) {
            case TaskState::Completed: break;
            case TaskState::Failed:    dep_failed = true; all_completed = false; break;
            case TaskState::Cancelled: dep_cancelled = true; all_completed = false; break;
            default:                   all_completed = false; break;
        }
    }

    TaskId id = next_task_id_locked();
    if (graph_.would_create_cycle(id, deps)) {
        return Error{ErrorCode::Cycle, "dependencies of " + id + " would form a cycle"};
    }

    TaskState initial = dep_failed    ? TaskState::Failed
                      : dep_cancelled ? TaskState::Cancelled
                      : all_completed ? TaskState::Queued
                                      : TaskState::Blocked;

    if (initial == TaskState::Queued && lanes_.is_full(request.priority)) {
        return Error{ErrorCode::ResourceExhausted, std::string{to_string(request.priority)}
                     + " lane is at its depth limit of " + std::to_string(lanes_.depth_limit())};
    }

    ++next_id_;
    auto now = clock_.wall_now();

    Entry entry;
    auto& task = entry.task;
    task.id = id;
    task.context_id = std::move(request.context_id);
    task.capability_id = std::move(request.capability_id);
    task.priority = request.priority;
    task.dependencies = deps;
    task.state = initial;
    task.payload = std::move(request.payload);
    task.metadata = std::move(request.metadata);
    task.created_at = now;
    task.max_retries = request.max_retries.value_or(config_.default_max_retries);
    task.timeout = request.timeout.value_or(Duration{config_.default_timeout_ms});

    switch (initial) {
        case TaskState::Failed:
            task.error = Error{ErrorCode::DependencyFailed, "dependency_failed"};
            task.completed_at = now;
            break;
        case TaskState::Cancelled:
            task.error = Error{ErrorCode::Cancelled, "dependency_cancelled"};
            task.completed_at = now;
            break;
        case TaskState::Queued:
            task.queued_at = now;
            break;
        default:
            break;
    }

    graph_.add_node(id);
    for (const auto& dep : deps) {
        graph_.add_edge(dep, id);
    }

    events_.record_task_created(id, task.context_id, task.capability_id, task.priority, initial);
    logger_.debug("Created " + id + " (" + task.capability_id + ", "
                  + std::string{to_string(task.priority)} + ", "
                  + std::string{to_string(initial)} + ")");

    creation_order_.push_back(id);
    by_context_[task.context_id].push_back(id);
    auto priority = task.priority;
    tasks_.emplace(id, std::move(entry));

    if (initial == TaskState::Queued) {
        lanes_.push(priority, id);
        post_event_locked(WakeEvent{.kind = WakeEvent::Kind::TaskCreated, .task_id = id});
    }
    return id;
}

Result<TaskId> TaskManager::create_task(const CapabilityId& capability_id,
                                        const ContextId& context_id,
                                        Priority priority,
                                        std::vector<TaskId> dependencies,
                                        std::optional<Duration> timeout,
                                        std::optional<uint32_t> max_retries) {
    return create_task(TaskRequest{
        .capability_id = capability_id,
        .context_id = context_id,
        .priority = priority,
        .dependencies = std::move(dependencies),
        .timeout = timeout,
        .max_retries = max_retries
    });
}

Result<void> TaskManager::add_dependency(const TaskId& task_id, const TaskId& depends_on) {
    std::lock_guard lock(mutex_);

    auto it = tasks_.find(task_id);
    if (it == tasks_.end()) {
        return Error{ErrorCode::NotFound, "unknown task: " + task_id};
    }
    auto dep_it = tasks_.find(depends_on);
    if (dep_it == tasks_.end()) {
        return Error{ErrorCode::Validation, "unknown dependency: " + depends_on};
    }

    auto& entry = it->second;
    bool not_started = entry.attempt == 0 && entry.task.retry_count == 0
        && (entry.task.state == TaskState::Queued || entry.task.state == TaskState::Blocked);
    if (!not_started) {
        return Error{ErrorCode::Validation, task_id + " has already started ("
                     + std::string{to_string(entry.task.state)} + ")"};
    }

    if (graph_.has_edge(depends_on, task_id)) {
        return {};
    }
    if (graph_.would_create_cycle(task_id, {depends_on})) {
        return Error{ErrorCode::Cycle, task_id + " depending on " + depends_on + " would form a cycle"};
    }

    graph_.add_edge(depends_on, task_id);
    entry.task.dependencies.push_back(depends_on);

    switch (dep_it->second.task.state) {
        case TaskState::Completed:
            break;
        case TaskState::Failed: {
            Error cause{ErrorCode::DependencyFailed, "dependency_failed"};
            if (entry.task.state == TaskState::Queued) lanes_.remove(task_id);
            finish_locked(entry, TaskState::Failed, cause);
            cascade_locked(task_id, TaskState::Failed, cause);
            break;
        }
        case TaskState::Cancelled: {
            Error cause{ErrorCode::Cancelled, "dependency_cancelled"};
            if (entry.task.state == TaskState::Queued) lanes_.remove(task_id);
            finish_locked(entry, TaskState::Cancelled, cause);
            cascade_locked(task_id, TaskState::Cancelled, cause);
            break;
        }
        default:
            if (entry.task.state == TaskState::Queued) {
                lanes_.remove(task_id);
                transition_locked(entry, TaskState::Blocked, "dependency_added");
            }
            break;
    }
    return {};
}

// ─────────────────────────────────────────────
// Cancellation & Queries
// ─────────────────────────────────────────────

Result<void> TaskManager::cancel_task(const TaskId& task_id) {
    std::lock_guard lock(mutex_);

    auto it = tasks_.find(task_id);
    if (it == tasks_.end()) {
        return Error{ErrorCode::NotFound, "unknown task: " + task_id};
    }

    auto& entry = it->second;
    if (is_terminal(entry.task.state)) {
        logger_.debug("Cancel of " + task_id + " ignored: already "
                      + std::string{to_string(entry.task.state)});
        return {};
    }

    if (entry.task.state == TaskState::Queued) {
        lanes_.remove(task_id);
    } else if (entry.task.state == TaskState::Running) {
        entry.stop->request_stop();
        release_running_locked(entry);
    }

    finish_locked(entry, TaskState::Cancelled, Error{ErrorCode::Cancelled, "cancelled"});
    cascade_locked(task_id, TaskState::Cancelled,
                   Error{ErrorCode::Cancelled, "dependency_cancelled"});
    post_event_locked(WakeEvent{.kind = WakeEvent::Kind::Cancelled, .task_id = task_id});

    logger_.info("Cancelled " + task_id);
    return {};
}

Result<Task> TaskManager::get_task(const TaskId& task_id) const {
    std::lock_guard lock(mutex_);
    auto it = tasks_.find(task_id);
    if (it == tasks_.end()) {
        return Error{ErrorCode::NotFound, "unknown task: " + task_id};
    }
    return it->second.task;
}

Result<StatusStream> TaskManager::stream_status(const TaskId& task_id) {
    std::lock_guard lock(mutex_);
    auto it = tasks_.find(task_id);
    if (it == tasks_.end()) {
        return Error{ErrorCode::NotFound, "unknown task: " + task_id};
    }

    const auto& task = it->second.task;
    auto channel = std::make_shared<StatusChannel>();
    channel->push(TaskEvent{
        .task_id = task_id,
        .from = task.state,
        .to = task.state,
        .reason = "current",
        .retry_count = task.retry_count,
        .timestamp = clock_.wall_now()
    });

    prune_subscribers_locked();
    if (is_terminal(task.state)) {
        channel->close();
    } else {
        subscribers_[task_id].push_back(channel);
    }
    return StatusStream{task_id, channel};
}

size_t TaskManager::subscriber_count() const {
    std::lock_guard lock(mutex_);
    size_t count = 0;
    for (const auto& [id, channels] : subscribers_) count += channels.size();
    return count;
}

ManagerStats TaskManager::manager_stats() const {
    std::lock_guard lock(mutex_);

    ManagerStats stats;
    stats.total_tasks = tasks_.size();
    stats.running = running_;

    size_t retried = 0;
    size_t completed_samples = 0;
    double queue_to_complete_ms = 0.0;

    for (const auto& [id, entry] : tasks_) {
        const auto& task = entry.task;
        ++stats.by_state[static_cast<size_t>(task.state)];
        ++stats.by_priority[lane_index(task.priority)];
        if (task.retry_count > 0) ++retried;

        if (task.state == TaskState::Completed && task.queued_at && task.completed_at) {
            queue_to_complete_ms += std::chrono::duration<double, std::milli>(
                *task.completed_at - *task.queued_at).count();
            ++completed_samples;
        }
    }

    for (auto p : kAllPriorities) {
        stats.lane_depths[lane_index(p)] = lanes_.size(p);
    }
    if (completed_samples > 0) {
        stats.mean_queue_to_complete_ms = queue_to_complete_ms / static_cast<double>(completed_samples);
    }
    if (stats.total_tasks > 0) {
        stats.retry_rate = static_cast<double>(retried) / static_cast<double>(stats.total_tasks);
    }
    return stats;
}

std::vector<Task> TaskManager::tasks_in_context(const ContextId& context_id) const {
    std::lock_guard lock(mutex_);
    std::vector<Task> result;
    auto it = by_context_.find(context_id);
    if (it == by_context_.end()) return result;

    result.reserve(it->second.size());
    for (const auto& id : it->second) {
        result.push_back(tasks_.at(id).task);
    }
    return result;
}

Duration TaskManager::backoff_delay(uint32_t retry_count) const {
    const uint64_t cap = config_.retry_max_delay_ms;
    uint64_t delay = config_.retry_base_delay_ms;
    for (uint32_t i = 0; i < retry_count && delay < cap; ++i) {
        delay *= 2;
    }
    return Duration{static_cast<Duration::rep>(std::min(delay, cap))};
}

// ─────────────────────────────────────────────
// Scheduler Thread
// ─────────────────────────────────────────────

void TaskManager::scheduler_loop(std::stop_token stop) {
    std::unique_lock lock(mutex_);
    auto has_event = [this] { return !wake_events_.empty(); };

    while (!stop.stop_requested()) {
        while (!wake_events_.empty()) {
            auto event = std::move(wake_events_.front());
            wake_events_.pop_front();
            handle_event_locked(event);
        }

        fire_due_timers_locked();
        dispatch_ready_locked();

        if (!wake_events_.empty()) continue;

        if (timers_.empty()) {
            wake_cv_.wait(lock, stop, has_event);
        } else {
            auto deadline = timers_.top().due;
            wake_cv_.wait_until(lock, stop, deadline, has_event);
        }
    }
}

void TaskManager::handle_event_locked(WakeEvent& event) {
    if (event.kind != WakeEvent::Kind::TaskCompleted) {
        // Other kinds only wake the loop; their state change is already applied.
        return;
    }

    auto it = tasks_.find(event.task_id);
    if (it == tasks_.end()) {
        events_.record_anomaly("unknown_completion", event.task_id, "no such task");
        return;
    }

    auto& entry = it->second;
    auto& outcome = *event.outcome;

    if (entry.task.state != TaskState::Running || entry.attempt != event.attempt) {
        if (!outcome.has_value() && outcome.error().code == ErrorCode::Cancelled) {
            logger_.debug("Attempt " + std::to_string(event.attempt) + " of " + event.task_id
                          + " acknowledged cancellation");
            return;
        }
        events_.record_anomaly("late_completion", event.task_id,
                               "attempt " + std::to_string(event.attempt) + " reported after the task became "
                               + std::string{to_string(entry.task.state)}
                               + " (current attempt " + std::to_string(entry.attempt) + ")");
        logger_.warn("Discarded late result for " + event.task_id);
        return;
    }

    entry.resolved_at = clock_.now();
    release_running_locked(entry);
    if (outcome.has_value()) {
        complete_locked(entry, std::move(outcome).value());
    } else {
        handle_failure_locked(entry, outcome.error());
    }
}

void TaskManager::fire_due_timers_locked() {
    auto now = clock_.now();

    while (!timers_.empty() && timers_.top().due <= now) {
        Timer timer = timers_.top();
        timers_.pop();

        auto it = tasks_.find(timer.task_id);
        if (it == tasks_.end()) continue;
        auto& entry = it->second;

        if (timer.kind == Timer::Kind::Timeout) {
            // Obsolete once the attempt has finished, been cancelled or been superseded.
            if (entry.attempt != timer.attempt) continue;
            if (entry.task.state != TaskState::Running) {
                // The report was applied after this deadline had already passed.
                if (entry.resolved_at && timer.due <= *entry.resolved_at) {
                    auto overdue = std::chrono::duration_cast<Duration>(*entry.resolved_at - timer.due);
                    events_.record_anomaly("late_timeout", timer.task_id,
                                           "attempt " + std::to_string(timer.attempt) + " reported "
                                           + std::to_string(overdue.count()) + "ms after its deadline");
                    logger_.warn("Timeout of " + timer.task_id + " lost the race to its result");
                }
                continue;
            }

            entry.stop->request_stop();
            release_running_locked(entry);
            logger_.warn(timer.task_id + " timed out after "
                         + std::to_string(entry.task.timeout.count()) + "ms");
            handle_failure_locked(entry, Error{ErrorCode::Timeout, "no result within "
                                  + std::to_string(entry.task.timeout.count()) + "ms"});
        } else {
            if (!entry.retry_pending || entry.task.state != TaskState::Queued
                || entry.attempt != timer.attempt) continue;

            entry.retry_pending = false;
            lanes_.push(entry.task.priority, timer.task_id);
            logger_.debug(timer.task_id + " re-enqueued (retry "
                          + std::to_string(entry.task.retry_count) + ")");
        }
    }
}

void TaskManager::dispatch_ready_locked() {
    if (!pool_) return;

    while (running_ < config_.max_concurrent_tasks) {
        auto next = lanes_.pop_next();
        if (!next) break;

        auto it = tasks_.find(*next);
        if (it == tasks_.end() || it->second.task.state != TaskState::Queued) continue;
        auto& entry = it->second;

        auto route = router_.route(entry.task.capability_id);
        if (!route) {
            logger_.warn("No agent for " + entry.task.id + ": " + route.error().message);
            handle_failure_locked(entry, route.error());
            continue;
        }
        start_attempt_locked(entry, route.value());
    }
}

// ─────────────────────────────────────────────
// Transitions
// ─────────────────────────────────────────────

void TaskManager::start_attempt_locked(Entry& entry, const AgentDescriptor& agent) {
    auto& task = entry.task;
    ++entry.attempt;
    entry.stop.emplace();
    entry.resolved_at.reset();
    task.assigned_agent = agent.agent_id;
    task.started_at = clock_.wall_now();
    ++running_;

    transition_locked(entry, TaskState::Running, "dispatched to " + agent.agent_id);
    timers_.push(Timer{clock_.now() + task.timeout, Timer::Kind::Timeout, task.id, entry.attempt});
    events_.record_dispatch(task.id, agent.agent_id, entry.attempt);

    Invocation call{
        .task_id = task.id,
        .attempt = entry.attempt,
        .agent = agent,
        .capability_id = task.capability_id,
        .payload = task.payload,
        .timeout = task.timeout,
        .stop = entry.stop->get_token()
    };

    pool_->post([this, call = std::move(call)] {
        on_invocation_finished(call.task_id, call.attempt, invoke_guarded(invoker_, call));
    });
}

void TaskManager::complete_locked(Entry& entry, Payload result) {
    entry.task.result = std::move(result);
    entry.task.error.reset();
    entry.task.completed_at = clock_.wall_now();
    transition_locked(entry, TaskState::Completed, "completed");
    logger_.info(entry.task.id + " completed by " + entry.task.assigned_agent.value_or("?"));

    promote_dependents_locked(entry.task.id);
}

void TaskManager::handle_failure_locked(Entry& entry, Error error) {
    auto& task = entry.task;
    task.error = error;

    if (task.retry_count < task.max_retries) {
        ++task.retry_count;
        auto delay = backoff_delay(task.retry_count);
        entry.retry_pending = true;
        timers_.push(Timer{clock_.now() + delay, Timer::Kind::RetryDue, task.id, entry.attempt});
        events_.record_retry(task.id, task.retry_count, delay, error);
        logger_.warn(task.id + " failed (" + describe(error) + "), retry "
                     + std::to_string(task.retry_count) + "/" + std::to_string(task.max_retries)
                     + " in " + std::to_string(delay.count()) + "ms");
        transition_locked(entry, TaskState::Queued, "retry_scheduled");
        return;
    }

    logger_.error(task.id + " failed permanently after " + std::to_string(task.retry_count)
                  + " retries: " + describe(error));
    auto id = task.id;
    finish_locked(entry, TaskState::Failed, std::move(error));
    cascade_locked(id, TaskState::Failed, Error{ErrorCode::DependencyFailed, "dependency_failed"});
}

void TaskManager::finish_locked(Entry& entry, TaskState terminal, Error error) {
    auto reason = error.message;
    entry.task.error = std::move(error);
    entry.task.completed_at = clock_.wall_now();
    entry.retry_pending = false;
    transition_locked(entry, terminal, reason);
}

void TaskManager::cascade_locked(const TaskId& root, TaskState terminal, const Error& error) {
    size_t affected = 0;

    for (const auto& id : graph_.transitive_dependents(root)) {
        auto& entry = tasks_.at(id);
        if (is_terminal(entry.task.state)) continue;

        if (entry.task.state == TaskState::Queued) {
            lanes_.remove(id);
        } else if (entry.task.state == TaskState::Running) {
            entry.stop->request_stop();
            release_running_locked(entry);
        }
        finish_locked(entry, terminal, error);
        ++affected;
    }

    if (affected > 0) {
        events_.record_cascade(root, terminal, affected);
        logger_.warn(std::to_string(affected) + " dependent(s) of " + root + " marked "
                     + std::string{to_string(terminal)});
    }
}

void TaskManager::promote_dependents_locked(const TaskId& completed) {
    for (const auto& dep_id : graph_.dependents(completed)) {
        auto& dependent = tasks_.at(dep_id);
        if (dependent.task.state != TaskState::Blocked) continue;
        if (!dependencies_completed_locked(dependent.task)) continue;

        enqueue_locked(dependent, "dependencies_met");
        post_event_locked(WakeEvent{.kind = WakeEvent::Kind::DependencyUnblocked, .task_id = dep_id});
    }
}

void TaskManager::enqueue_locked(Entry& entry, std::string_view reason) {
    lanes_.push(entry.task.priority, entry.task.id);
    transition_locked(entry, TaskState::Queued, reason);
}

bool TaskManager::dependencies_completed_locked(const Task& task) const {
    return std::all_of(task.dependencies.begin(), task.dependencies.end(),
        [this](const TaskId& dep) { return tasks_.at(dep).task.state == TaskState::Completed; });
}

void TaskManager::transition_locked(Entry& entry, TaskState to, std::string_view reason) {
    auto from = entry.task.state;
    if (from == to) return;

    entry.task.state = to;
    if (to == TaskState::Queued && !entry.task.queued_at) {
        entry.task.queued_at = clock_.wall_now();
    }

    events_.record_task_transition(entry.task.id, entry.task.context_id, from, to, reason);
    publish_locked(entry, from, reason);
}

void TaskManager::publish_locked(const Entry& entry, TaskState from, std::string_view reason) {
    auto it = subscribers_.find(entry.task.id);
    if (it == subscribers_.end()) return;

    TaskEvent event{
        .task_id = entry.task.id,
        .from = from,
        .to = entry.task.state,
        .reason = std::string{reason},
        .retry_count = entry.task.retry_count,
        .timestamp = clock_.wall_now()
    };
    bool terminal = is_terminal(entry.task.state);

    std::erase_if(it->second, [&](const std::weak_ptr<StatusChannel>& weak) {
        auto channel = weak.lock();
        if (!channel) return true;
        channel->push(event);
        if (terminal) channel->close();
        return terminal;
    });
    if (it->second.empty()) {
        subscribers_.erase(it);
    }
}

// Streams on tasks that never transition again are only released here.
void TaskManager::prune_subscribers_locked() {
    for (auto item = subscribers_.begin(); item != subscribers_.end();) {
        std::erase_if(item->second, [](const std::weak_ptr<StatusChannel>& weak) { return weak.expired(); });
        if (item->second.empty()) {
            item = subscribers_.erase(item);
        } else {
            ++item;
        }
    }
}

void TaskManager::release_running_locked(Entry& entry) {
    entry.stop.reset();
    if (running_ > 0) --running_;
}

void TaskManager::post_event_locked(WakeEvent event) {
    wake_events_.push_back(std::move(event));
    wake_cv_.notify_all();
}

void TaskManager::on_invocation_finished(const TaskId& task_id, uint32_t attempt, Result<Payload> outcome) {
    std::lock_guard lock(mutex_);
    post_event_locked(WakeEvent{
        .kind = WakeEvent::Kind::TaskCompleted,
        .task_id = task_id,
        .attempt = attempt,
        .outcome = std::move(outcome)
    });
}

}  // namespace agent_dispatch
