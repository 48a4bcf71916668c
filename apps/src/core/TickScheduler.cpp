#include "TickScheduler.h"
#include "Assert.h"

#include <cmath>

namespace WaterClock {

TickScheduler::TickScheduler(double ticksPerSecond, Clock::time_point start) : base_(start)
{
    WATERCLOCK_ASSERT(ticksPerSecond > 0.0, "Tick rate must be positive");
    interval_ = std::chrono::duration_cast<Clock::duration>(
        std::chrono::nanoseconds(std::llround(1e9 / ticksPerSecond)));
    if (interval_ <= Clock::duration::zero()) {
        interval_ = Clock::duration(1);
    }
}

int64_t TickScheduler::poll(Clock::time_point now)
{
    if (now - base_ < interval_) {
        return 0;
    }

    const int64_t elapsed = (now - base_) / interval_;
    base_ += interval_ * elapsed;
    return elapsed;
}

} // namespace WaterClock
