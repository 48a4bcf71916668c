#pragma once

#include "ClockConfig.h"
#include "ClockGeometry.h"
#include "ClockTime.h"
#include "ColorQueue.h"
#include "DropSpawner.h"
#include "LiquidSimulator.h"
#include "SinkholeController.h"
#include "TrailHistory.h"
#include "core/Grid.h"

#include <cstdint>
#include <random>

namespace WaterClock {

enum class EditIntent { Wall, Background };

/**
 * One running water clock: the grid plus every controller that evolves it.
 *
 * Owns all mutable state, including the single random source, so two sessions
 * built from the same config and seed evolve identically.
 */
class ClockSession {
public:
    // `config` must already pass Config::Clock::validate().
    ClockSession(const Config::Clock& config, const ClockTime& initialTime);

    /**
     * Advances one tick: snapshot for the trail, digit-change handling
     * (sinkhole open or countdown), liquid step, drop spawn, colon blink.
     */
    void step(const ClockTime& now);

    // Manual wall editing. Coordinates outside the visible rows are ignored.
    bool editCell(int x, int y, EditIntent intent);

    // Cell value as a renderer should draw it, with the liquid trail applied.
    CellValue displayValueAt(int x, int y) const { return trail_.displayValue(grid_, x, y); }

    const Grid& getGrid() const { return grid_; }
    const TrailHistory& getTrail() const { return trail_; }
    const ClockGeometry& getGeometry() const { return geometry_; }
    const Config::Clock& getConfig() const { return config_; }
    const DigitValues& getDisplayedDigits() const { return digits_; }
    const SinkholeController& getSinkhole() const { return sinkhole_; }
    const ColorQueue& getColorQueue() const { return colors_; }
    DropSpawner& getSpawner() { return spawner_; }
    uint64_t getTickCount() const { return tickCount_; }
    uint32_t getSeed() const { return seed_; }

private:
    Config::Clock config_;
    ClockGeometry geometry_;
    uint32_t seed_;
    std::mt19937 rng_;
    DigitValues digits_;
    Grid grid_;
    ColorQueue colors_;
    SinkholeController sinkhole_;
    LiquidSimulator simulator_;
    DropSpawner spawner_;
    TrailHistory trail_;
    uint64_t tickCount_ = 0;
};

} // namespace WaterClock
