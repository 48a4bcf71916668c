#include "ColorQueue.h"
#include "core/Assert.h"
#include "core/LoggingChannels.h"

#include <algorithm>

namespace WaterClock {

ColorQueue::ColorQueue(const std::vector<Config::ColorWeight>& population, std::mt19937& rng)
{
    for (const auto& entry : population) {
        WATERCLOCK_ASSERT(
            entry.color > 0 && entry.color <= 255
                && Cell::isLiquid(static_cast<CellValue>(entry.color)),
            "Queue colors must be liquid ids");
        entries_.insert(
            entries_.end(),
            static_cast<size_t>(std::max(entry.weight, 0)),
            static_cast<CellValue>(entry.color));
    }
    WATERCLOCK_ASSERT(!entries_.empty(), "Color population must not be empty");

    std::shuffle(entries_.begin(), entries_.end(), rng);
    LOG_DEBUG(Spawner, "Color queue built with {} entries", entries_.size());
}

CellValue ColorQueue::advance()
{
    index_ = (index_ + 1) % entries_.size();
    return entries_[index_];
}

} // namespace WaterClock
