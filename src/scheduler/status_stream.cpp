/**
 * @file status_stream.cpp
 * @brief StatusChannel implementation.
 */

#include "scheduler/status_stream.hpp"

namespace agent_dispatch {

void StatusChannel::push(TaskEvent event) {
    {
        std::lock_guard lock(mutex_);
        if (closed_) return;
        events_.push_back(std::move(event));
    }
    cv_.notify_all();
}

void StatusChannel::close() {
    {
        std::lock_guard lock(mutex_);
        closed_ = true;
    }
    cv_.notify_all();
}

std::optional<TaskEvent> StatusChannel::pop(Duration timeout) {
    std::unique_lock lock(mutex_);
    cv_.wait_for(lock, timeout, [this] { return !events_.empty() || closed_; });
    if (events_.empty()) return std::nullopt;

    TaskEvent event = std::move(events_.front());
    events_.pop_front();
    return event;
}

bool StatusChannel::closed() const {
    std::lock_guard lock(mutex_);
    return closed_;
}

bool StatusChannel::drained() const {
    std::lock_guard lock(mutex_);
    return closed_ && events_.empty();
}

}  // namespace agent_dispatch
