#pragma once

#include "ClockGeometry.h"

#include <array>
#include <string>

namespace WaterClock {

// Wall-clock reading handed to the session each tick.
struct ClockTime {
    int hour = 0;
    int minute = 0;
    int second = 0;

    bool operator==(const ClockTime& other) const = default;
};

// HH:MM split into the four displayed digits, slot order left to right.
using DigitValues = std::array<int, ClockGeometry::kSlotCount>;

DigitValues digitsFromTime(const ClockTime& time);

// "HH:MM:SS", for logging.
std::string toString(const ClockTime& time);

} // namespace WaterClock
