#pragma once

#include <chrono>
#include <cstdint>

namespace WaterClock {

/**
 * Fixed-rate step pacing for the front-end loops.
 *
 * A step is due once at least one interval has passed since the time base;
 * polling then moves the base forward by every whole interval that elapsed,
 * so a slow frame is not followed by a burst of catch-up steps.
 */
class TickScheduler {
public:
    using Clock = std::chrono::steady_clock;

    static constexpr double kBaseTicksPerSecond = 20.0;

    explicit TickScheduler(double ticksPerSecond, Clock::time_point start = Clock::now());

    // Returns the number of intervals consumed (0 when no step is due).
    int64_t poll(Clock::time_point now = Clock::now());

    Clock::time_point nextDue() const { return base_ + interval_; }
    Clock::duration getInterval() const { return interval_; }

private:
    Clock::duration interval_;
    Clock::time_point base_;
};

} // namespace WaterClock
