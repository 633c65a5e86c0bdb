/**
 * @file clock.hpp
 * @brief Time source for the task manager and the capability registry.
 *
 * Deadlines and backoff timers use the monotonic clock; task timestamps
 * reported to callers use wall-clock time.
 */

#pragma once

#include "core/types.hpp"

namespace agent_dispatch {

class IClock {
public:
    virtual ~IClock() = default;

    [[nodiscard]] virtual SteadyTime now() const = 0;
    [[nodiscard]] virtual Timestamp wall_now() const = 0;
};

class SteadyClock : public IClock {
public:
    [[nodiscard]] SteadyTime now() const override {
        return std::chrono::steady_clock::now();
    }

    [[nodiscard]] Timestamp wall_now() const override {
        return std::chrono::system_clock::now();
    }
};

}  // namespace agent_dispatch
