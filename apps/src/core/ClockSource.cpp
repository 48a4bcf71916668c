#include "ClockSource.h"
#include "core/LoggingChannels.h"

#include <algorithm>

namespace WaterClock {

ClockSource::ClockSource(int acceleration)
    : acceleration_(std::clamp(acceleration, 1, kMaxAcceleration)),
      wallStart_(std::chrono::system_clock::now()),
      steadyStart_(std::chrono::steady_clock::now())
{
    if (acceleration < 1) {
        LOG_WARN(State, "Acceleration {} is below 1, running in real time", acceleration);
    }
    else if (acceleration > kMaxAcceleration) {
        LOG_WARN(State, "Acceleration {} is above {}, clamping", acceleration, kMaxAcceleration);
    }
}

ClockTime ClockSource::now() const
{
    if (override_) {
        return *override_;
    }

    // Millisecond resolution; elapsedMs * kMaxAcceleration stays well inside int64.
    const auto elapsedMs = std::chrono::duration_cast<std::chrono::milliseconds>(
                               std::chrono::steady_clock::now() - steadyStart_)
                               .count();
    const std::time_t simulated = std::chrono::system_clock::to_time_t(wallStart_)
        + static_cast<std::time_t>(elapsedMs * acceleration_ / 1000);

    auto local = toLocalTime(simulated);
    if (!local) {
        LOG_ERROR(State, "Failed to convert time to local time, showing midnight");
        return ClockTime{};
    }
    return *local;
}

std::optional<ClockTime> ClockSource::toLocalTime(std::chrono::system_clock::time_point point)
{
    return toLocalTime(std::chrono::system_clock::to_time_t(point));
}

std::optional<ClockTime> ClockSource::toLocalTime(std::time_t timeValue)
{
    std::tm localTime{};
    if (localtime_r(&timeValue, &localTime) == nullptr) {
        return std::nullopt;
    }

    // tm_sec can read 60 on a leap second.
    const int second = localTime.tm_sec > 59 ? 59 : localTime.tm_sec;
    return ClockTime{ localTime.tm_hour, localTime.tm_min, second };
}

} // namespace WaterClock
