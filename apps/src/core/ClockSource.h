#pragma once

#include "core/clock/ClockTime.h"

#include <chrono>
#include <ctime>
#include <optional>

namespace WaterClock {

/**
 * Local wall-clock time, optionally running faster than real time.
 *
 * With acceleration `a`, the reported time is start + elapsed * a, where
 * elapsed is measured on the monotonic clock since construction. The factor
 * is clamped to [1, kMaxAcceleration].
 */
class ClockSource {
public:
    // One simulated hour per real second.
    static constexpr int kMaxAcceleration = 3600;

    explicit ClockSource(int acceleration = 1);

    ClockTime now() const;

    // Fixed time returned by now() while set (for testing).
    void setOverride(std::optional<ClockTime> time) { override_ = time; }

    int getAcceleration() const { return acceleration_; }

    static std::optional<ClockTime> toLocalTime(std::chrono::system_clock::time_point point);
    static std::optional<ClockTime> toLocalTime(std::time_t timeValue);

private:
    int acceleration_;
    std::chrono::system_clock::time_point wallStart_;
    std::chrono::steady_clock::time_point steadyStart_;
    std::optional<ClockTime> override_;
};

} // namespace WaterClock
