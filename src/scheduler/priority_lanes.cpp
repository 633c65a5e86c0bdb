/**
 * @file priority_lanes.cpp
 * @brief PriorityLanes implementation.
 */

#include "scheduler/priority_lanes.hpp"

#include <algorithm>

namespace agent_dispatch {

bool PriorityLanes::push(Priority priority, const TaskId& id, bool enforce_limit) {
    auto& lane = lanes_[lane_index(priority)];
    if (enforce_limit && lane.size() >= depth_limit_) {
        return false;
    }
    lane.push_back(id);
    return true;
}

std::optional<TaskId> PriorityLanes::pop_next() {
    for (auto& lane : lanes_) {
        if (!lane.empty()) {
            TaskId id = std::move(lane.front());
            lane.pop_front();
            return id;
        }
    }
    return std::nullopt;
}

bool PriorityLanes::remove(const TaskId& id) {
    for (auto& lane : lanes_) {
        auto it = std::find(lane.begin(), lane.end(), id);
        if (it != lane.end()) {
            lane.erase(it);
            return true;
        }
    }
    return false;
}

bool PriorityLanes::is_full(Priority priority) const {
    return lanes_[lane_index(priority)].size() >= depth_limit_;
}

size_t PriorityLanes::size(Priority priority) const {
    return lanes_[lane_index(priority)].size();
}

size_t PriorityLanes::total() const noexcept {
    size_t sum = 0;
    for (const auto& lane : lanes_) sum += lane.size();
    return sum;
}

}  // namespace agent_dispatch
