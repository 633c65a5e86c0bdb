/**
 * @file priority_lanes.hpp
 * @brief One FIFO per priority, served in strict priority order.
 */

#pragma once

#include "core/types.hpp"

#include <array>
#include <deque>
#include <optional>

namespace agent_dispatch {

/**
 * @brief Four lanes of QUEUED task ids.
 *
 * A task id lives in at most one lane. The depth limit is only enforced
 * when the caller asks for it (new submissions); promoted and retried
 * tasks are always accepted. Not thread-safe.
 */
class PriorityLanes {
public:
    explicit PriorityLanes(size_t depth_limit = 1000) : depth_limit_(depth_limit) {}

    /// Append to the tail of the lane. Returns false if the lane is full and `enforce_limit` is set.
    bool push(Priority priority, const TaskId& id, bool enforce_limit = false);

    /// Head of the highest non-empty lane.
    [[nodiscard]] std::optional<TaskId> pop_next();

    /// Remove `id` from whichever lane holds it.
    bool remove(const TaskId& id);

    [[nodiscard]] bool is_full(Priority priority) const;
    [[nodiscard]] size_t size(Priority priority) const;
    [[nodiscard]] size_t total() const noexcept;
    [[nodiscard]] bool empty() const noexcept { return total() == 0; }
    [[nodiscard]] size_t depth_limit() const noexcept { return depth_limit_; }

private:
    std::array<std::deque<TaskId>, kPriorityCount> lanes_;
    size_t depth_limit_;
};

}  // namespace agent_dispatch
