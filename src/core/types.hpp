/**
 * @file types.hpp
 * @brief Fundamental types used throughout AgentDispatch.
 *
 * Defines identity aliases, task priority/state, agent health status and
 * their string conversions. All types are plain values.
 */

#pragma once

#include <array>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace agent_dispatch {

// ─────────────────────────────────────────────
// Identity Types
// ─────────────────────────────────────────────

using AgentId = std::string;
using TaskId = std::string;
using ContextId = std::string;
using CapabilityId = std::string;
using Payload = std::string;

using Timestamp = std::chrono::system_clock::time_point;
using SteadyTime = std::chrono::steady_clock::time_point;
using Duration = std::chrono::milliseconds;

// ─────────────────────────────────────────────
// Task Priority
// ─────────────────────────────────────────────

/**
 * @brief Priority lanes, in dispatch order.
 *
 * The numeric value doubles as the lane index: lower values are served first.
 */
enum class Priority : uint8_t {
    Urgent = 0,
    High   = 1,
    Medium = 2,
    Low    = 3
};

inline constexpr size_t kPriorityCount = 4;

inline constexpr std::array<Priority, kPriorityCount> kAllPriorities{
    Priority::Urgent, Priority::High, Priority::Medium, Priority::Low};

[[nodiscard]] constexpr size_t lane_index(Priority p) noexcept {
    return static_cast<size_t>(p);
}

[[nodiscard]] constexpr bool is_valid(Priority p) noexcept {
    return static_cast<size_t>(p) < kPriorityCount;
}

[[nodiscard]] constexpr std::string_view to_string(Priority p) noexcept {
    switch (p) {
        case Priority::Urgent: return "urgent";
        case Priority::High:   return "high";
        case Priority::Medium: return "medium";
        case Priority::Low:    return "low";
    }
    return "unknown";
}

[[nodiscard]] std::optional<Priority> parse_priority(std::string_view text) noexcept;

// ─────────────────────────────────────────────
// Task State
// ─────────────────────────────────────────────

enum class TaskState : uint8_t {
    Queued,        ///< Dependencies met, waiting for a lane slot or a retry delay
    Blocked,       ///< Waiting for dependencies
    Running,       ///< Dispatched to an agent
    Completed,     ///< Finished successfully
    Failed,        ///< Retries exhausted or a dependency failed
    Cancelled      ///< Cancelled by the caller or by a cancelled dependency
};

inline constexpr size_t kTaskStateCount = 6;

[[nodiscard]] constexpr bool is_terminal(TaskState state) noexcept {
    return state == TaskState::Completed
        || state == TaskState::Failed
        || state == TaskState::Cancelled;
}

/**
 * @brief Convert TaskState to string representation.
 */
[[nodiscard]] constexpr std::string_view to_string(TaskState state) noexcept {
    switch (state) {
        case TaskState::Queued:    return "queued";
        case TaskState::Blocked:   return "blocked";
        case TaskState::Running:   return "running";
        case TaskState::Completed: return "completed";
        case TaskState::Failed:    return "failed";
        case TaskState::Cancelled: return "cancelled";
    }
    return "unknown";
}

// ─────────────────────────────────────────────
// Agent Health
// ─────────────────────────────────────────────

enum class HealthStatus : uint8_t {
    Unknown,       ///< Registered, not yet probed
    Healthy,
    Degraded,      ///< Recent probe failures, below the unreachable threshold
    Unreachable
};

[[nodiscard]] constexpr std::string_view to_string(HealthStatus status) noexcept {
    switch (status) {
        case HealthStatus::Unknown:     return "unknown";
        case HealthStatus::Healthy:     return "healthy";
        case HealthStatus::Degraded:    return "degraded";
        case HealthStatus::Unreachable: return "unreachable";
    }
    return "unknown";
}

}  // namespace agent_dispatch
