#include "PickQueue.h"
#include "core/Assert.h"
#include "core/LoggingChannels.h"

#include <algorithm>

namespace WaterClock {

PickQueue::PickQueue(const char* name, int interval, int repeats)
    : name_(name), interval_(interval), repeats_(repeats)
{
    WATERCLOCK_ASSERT(interval_ >= 1, "Pick interval must be at least 1");
    WATERCLOCK_ASSERT(repeats_ >= 1, "Pick repeats must be at least 1");
}

int PickQueue::next(std::mt19937& rng)
{
    if (picks_.empty()) {
        refill(rng);
    }
    const int pick = picks_.back();
    picks_.pop_back();
    return pick;
}

void PickQueue::refill(std::mt19937& rng)
{
    picks_.clear();
    picks_.reserve(fillSize());
    for (int residue = 0; residue < interval_; ++residue) {
        picks_.insert(picks_.end(), repeats_, residue);
    }
    std::shuffle(picks_.begin(), picks_.end(), rng);

    LOG_TRACE(Simulation, "Refilled {} picks with {} entries", name_, picks_.size());
}

} // namespace WaterClock
