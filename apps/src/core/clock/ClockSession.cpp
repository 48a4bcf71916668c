#include "ClockSession.h"
#include "DigitPatterns.h"
#include "core/Assert.h"
#include "core/LoggingChannels.h"

#include <vector>

namespace WaterClock {

namespace {

const Config::Clock& requireValid(const Config::Clock& config)
{
    auto result = config.validate();
    WATERCLOCK_ASSERT(result.isValue(), "ClockSession requires a validated config");
    return config;
}

} // namespace

ClockSession::ClockSession(const Config::Clock& config, const ClockTime& initialTime)
    : config_(requireValid(config)),
      geometry_(config.digitZoom),
      seed_(config.seed.value_or(std::random_device{}())),
      rng_(seed_),
      digits_(digitsFromTime(initialTime)),
      grid_(DigitPatterns::createFace(geometry_, digits_)),
      colors_(config.liquidColorPopulation, rng_),
      sinkhole_(geometry_, config.sinkholeOpeningPeriod),
      simulator_(config),
      spawner_(config, geometry_),
      trail_(static_cast<size_t>(config.trailDepth))
{
    LOG_INFO(
        State,
        "Clock session {}x{} (zoom {}) seed {} showing {}",
        geometry_.width,
        geometry_.height,
        geometry_.zoom,
        seed_,
        toString(initialTime));
}

void ClockSession::step(const ClockTime& now)
{
    trail_.push(grid_);
    tickCount_++;

    const DigitValues digits = digitsFromTime(now);
    std::vector<int> changed;
    for (int slot = 0; slot < ClockGeometry::kSlotCount; ++slot) {
        if (digits[slot] != digits_[slot]) {
            changed.push_back(slot);
        }
    }

    if (!changed.empty()) {
        LOG_INFO(State, "Time is now {}", toString(now));
        digits_ = digits;
        sinkhole_.open(grid_, changed);
    }
    else {
        sinkhole_.tick(grid_, digits_);
    }

    simulator_.step(grid_, rng_);

    if (config_.spawnEnabled) {
        spawner_.tick(grid_, colors_, rng_);
    }

    if (config_.colonBlink) {
        DigitPatterns::applyColon(grid_, geometry_, now.second % 6 >= 3);
    }
}

bool ClockSession::editCell(int x, int y, EditIntent intent)
{
    if (!grid_.inVisibleBounds(x, y)) {
        LOG_TRACE(Input, "Ignoring edit outside the face at ({}, {})", x, y);
        return false;
    }

    const CellValue value = intent == EditIntent::Wall ? Cell::Wall : Cell::Background;
    grid_.set(x, y, value);
    LOG_DEBUG(
        Input,
        "Cell ({}, {}) set to {}",
        x,
        y,
        Cell::toString(Cell::classify(value)));
    return true;
}

} // namespace WaterClock
