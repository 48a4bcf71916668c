#include "DropSpawner.h"
#include "ColorQueue.h"
#include "core/Grid.h"
#include "core/LoggingChannels.h"

#include <algorithm>

namespace WaterClock {

DropSpawner::DropSpawner(const Config::Clock& config, const ClockGeometry& geometry)
    : geometry_(geometry),
      dropSize_(config.liquidDropSize),
      dropInterval_(config.liquidDropInterval),
      dropColumn_(geometry.width - 2)
{
    setAcceleration(config.dropAcceleration);
}

void DropSpawner::setAcceleration(int acceleration)
{
    const int clamped = std::clamp(acceleration, 0, dropInterval_ - 1);
    if (clamped != acceleration) {
        LOG_WARN(Spawner, "Drop acceleration {} clamped to {}", acceleration, clamped);
    }
    acceleration_ = clamped;
}

int DropSpawner::minDropColumn() const
{
    return geometry_.width - 2 - (ClockGeometry::kSlotPitch * geometry_.zoom - 1);
}

int DropSpawner::maxDropColumn() const
{
    return geometry_.width - 2;
}

void DropSpawner::tick(Grid& grid, ColorQueue& colors, std::mt19937& rng)
{
    const int phase = static_cast<int>(tickCount_ % static_cast<uint64_t>(cycleLength()));
    tickCount_++;

    if (phase >= dropSize_) {
        return;
    }

    if (phase == 0) {
        std::uniform_int_distribution<int> columnDist(minDropColumn(), maxDropColumn());
        dropColumn_ = columnDist(rng);
        colors.advance();
        LOG_DEBUG(Spawner, "Drop of color {} at column {}", colors.current(), dropColumn_);
    }

    // A user-drawn wall across the inlet blocks the stream.
    if (Cell::isWall(grid.get(dropColumn_, 0))) {
        LOG_TRACE(Spawner, "Inlet at column {} is walled off", dropColumn_);
        return;
    }
    grid.set(dropColumn_, 0, colors.current());
}

} // namespace WaterClock
