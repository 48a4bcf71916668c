#include "ClockGeometry.h"
#include "core/Assert.h"

namespace WaterClock {

ClockGeometry::ClockGeometry(int digitZoom)
    : zoom(digitZoom), width(kFaceColumns * digitZoom), height(kFaceRows * digitZoom)
{
    WATERCLOCK_ASSERT(digitZoom >= 1 && digitZoom <= kMaxZoom, "Digit zoom out of range");
}

} // namespace WaterClock
