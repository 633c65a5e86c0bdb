/**
 * @file status_stream.hpp
 * @brief Per-subscriber feed of a task's state changes.
 */

#pragma once

#include "scheduler/task.hpp"

#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>

namespace agent_dispatch {

/**
 * @brief Shared buffer between the TaskManager (producer) and one
 *        StatusStream (consumer).
 *
 * The manager pushes under its own lock; the consumer never calls back into
 * the manager while holding the channel lock.
 */
class StatusChannel {
public:
    void push(TaskEvent event);
    void close();

    /// Wait up to `timeout` for the next event. nullopt on timeout or end of stream.
    std::optional<TaskEvent> pop(Duration timeout);

    [[nodiscard]] bool closed() const;
    [[nodiscard]] bool drained() const;

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<TaskEvent> events_;
    bool closed_{false};
};

/**
 * @brief Sequence of state changes for one task, ending at a terminal state.
 *
 * Starts at the state current when subscribing; there is no rewind. Dropping
 * the stream unsubscribes it.
 */
class StatusStream {
public:
    StatusStream(TaskId task_id, std::shared_ptr<StatusChannel> channel)
        : task_id_(std::move(task_id)), channel_(std::move(channel)) {}

    [[nodiscard]] std::optional<TaskEvent> next(Duration timeout) { return channel_->pop(timeout); }

    /// True once the terminal event has been delivered.
    [[nodiscard]] bool finished() const { return channel_->drained(); }

    [[nodiscard]] const TaskId& task_id() const noexcept { return task_id_; }

private:
    TaskId task_id_;
    std::shared_ptr<StatusChannel> channel_;
};

}  // namespace agent_dispatch
