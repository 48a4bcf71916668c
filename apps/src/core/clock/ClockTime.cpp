#include "ClockTime.h"
#include "core/Assert.h"

#include <spdlog/fmt/fmt.h>

namespace WaterClock {

DigitValues digitsFromTime(const ClockTime& time)
{
    WATERCLOCK_ASSERT(time.hour >= 0 && time.hour < 24, "Hour must be in 0-23");
    WATERCLOCK_ASSERT(time.minute >= 0 && time.minute < 60, "Minute must be in 0-59");
    return { time.hour / 10, time.hour % 10, time.minute / 10, time.minute % 10 };
}

std::string toString(const ClockTime& time)
{
    return fmt::format("{:02}:{:02}:{:02}", time.hour, time.minute, time.second);
}

} // namespace WaterClock
