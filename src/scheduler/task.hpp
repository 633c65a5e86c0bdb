/**
 * @file task.hpp
 * @brief Task records, creation requests, state events and manager stats.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <array>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace agent_dispatch {

using Metadata = std::map<std::string, std::string>;

/**
 * @brief Snapshot of a task as returned by TaskManager::get_task().
 *
 * `error` holds the most recent failure, including failures that were
 * retried, so a QUEUED task with retry_count > 0 and an error is
 * "still retrying". A FAILED task whose error code is DependencyFailed
 * never ran.
 */
struct Task {
    TaskId id;
    ContextId context_id;
    CapabilityId capability_id;
    Priority priority = Priority::Medium;
    std::vector<TaskId> dependencies;
    TaskState state = TaskState::Queued;

    Payload payload;
    Metadata metadata;

    Timestamp created_at{};
    std::optional<Timestamp> queued_at;      ///< First time the task became QUEUED
    std::optional<Timestamp> started_at;     ///< Latest dispatch
    std::optional<Timestamp> completed_at;   ///< Entry into a terminal state

    uint32_t retry_count = 0;
    uint32_t max_retries = 3;
    Duration timeout{0};

    std::optional<Payload> result;
    std::optional<Error> error;
    std::optional<AgentId> assigned_agent;
};

/**
 * @brief Parameters for TaskManager::create_task().
 *
 * Unset timeout and max_retries fall back to the scheduler configuration.
 */
struct TaskRequest {
    CapabilityId capability_id;
    ContextId context_id;
    Priority priority = Priority::Medium;
    std::vector<TaskId> dependencies;
    std::optional<Duration> timeout;
    std::optional<uint32_t> max_retries;
    Payload payload;
    Metadata metadata;
};

/**
 * @brief One state change, as delivered by a StatusStream.
 *
 * The first event of every stream has from == to and describes the
 * state at subscription time.
 */
struct TaskEvent {
    TaskId task_id;
    TaskState from = TaskState::Queued;
    TaskState to = TaskState::Queued;
    std::string reason;
    uint32_t retry_count = 0;
    Timestamp timestamp{};
};

struct ManagerStats {
    size_t total_tasks = 0;
    size_t running = 0;
    std::array<size_t, kTaskStateCount> by_state{};
    std::array<size_t, kPriorityCount> by_priority{};
    std::array<size_t, kPriorityCount> lane_depths{};
    double mean_queue_to_complete_ms = 0.0;   ///< Over COMPLETED tasks
    double retry_rate = 0.0;                  ///< Tasks with retry_count > 0 / total

    [[nodiscard]] size_t count(TaskState state) const {
        return by_state[static_cast<size_t>(state)];
    }
    [[nodiscard]] size_t count(Priority priority) const {
        return by_priority[lane_index(priority)];
    }
};

}  // namespace agent_dispatch
