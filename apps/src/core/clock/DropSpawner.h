#pragma once

#include "ClockConfig.h"
#include "ClockGeometry.h"

#include <cstdint>
#include <random>

namespace WaterClock {

class ColorQueue;
class Grid;

/**
 * Feeds liquid in at the top edge above the rightmost digit.
 *
 * Runs a cycle of dropSize * (dropInterval - acceleration) ticks. The first
 * tick of a cycle picks a column and advances the color queue; the first
 * dropSize ticks each write the current color into row 0 of that column, so a
 * drop arrives as a short stream.
 */
class DropSpawner {
public:
    DropSpawner(const Config::Clock& config, const ClockGeometry& geometry);

    void tick(Grid& grid, ColorQueue& colors, std::mt19937& rng);

    // Clamped to [0, dropInterval - 1].
    void setAcceleration(int acceleration);
    int getAcceleration() const { return acceleration_; }

    int cycleLength() const { return dropSize_ * (dropInterval_ - acceleration_); }
    int getDropColumn() const { return dropColumn_; }
    uint64_t getTickCount() const { return tickCount_; }

    // Inclusive column range a drop can start in.
    int minDropColumn() const;
    int maxDropColumn() const;

private:
    ClockGeometry geometry_;
    int dropSize_;
    int dropInterval_;
    int acceleration_ = 0;
    int dropColumn_ = 0;
    uint64_t tickCount_ = 0;
};

} // namespace WaterClock
