#include "SinkholeController.h"
#include "DigitPatterns.h"
#include "core/Assert.h"
#include "core/Grid.h"
#include "core/LoggingChannels.h"

#include <algorithm>
#include <spdlog/fmt/ranges.h>

namespace WaterClock {

SinkholeController::SinkholeController(const ClockGeometry& geometry, int openingPeriod)
    : geometry_(geometry), openingPeriod_(openingPeriod)
{
    WATERCLOCK_ASSERT(openingPeriod_ >= 1, "Sinkhole opening period must be at least 1 tick");
}

void SinkholeController::carve(Grid& grid, const ClockGeometry& geometry, int slot)
{
    WATERCLOCK_ASSERT(slot >= 0 && slot < ClockGeometry::kSlotCount, "Slot must be in 0-3");

    for (int dx : { 0, ClockGeometry::kDigitColumns - 1 }) {
        const int x = geometry.sinkholeColumn(slot, dx);
        for (int y = geometry.floorTop(); y < geometry.floorBottom(); ++y) {
            if (Cell::isWall(grid.get(x, y))) {
                grid.set(x, y, Cell::Background);
            }
        }
    }
}

void SinkholeController::open(Grid& grid, const std::vector<int>& changedSlots)
{
    if (changedSlots.empty()) {
        return;
    }

    std::vector<int> positions;
    if (auto* opening = std::get_if<Sinkhole::Opening>(&state_)) {
        positions = opening->positions;
    }

    for (int slot : changedSlots) {
        carve(grid, geometry_, slot);
        if (std::find(positions.begin(), positions.end(), slot) == positions.end()) {
            positions.push_back(slot);
        }
    }
    std::sort(positions.begin(), positions.end());

    const bool restarted = isOpening();
    state_ = Sinkhole::Opening{ .countdown = openingPeriod_, .positions = positions };

    LOG_INFO(
        Sinkhole,
        "{} sinkholes under slots [{}], redraw in {} ticks",
        restarted ? "Extended" : "Opened",
        fmt::join(positions, ", "),
        openingPeriod_);
}

void SinkholeController::tick(Grid& grid, const DigitValues& digits)
{
    auto* opening = std::get_if<Sinkhole::Opening>(&state_);
    if (!opening) {
        return;
    }

    opening->countdown--;
    LOG_TRACE(Sinkhole, "Countdown {}", opening->countdown);
    if (opening->countdown > 0) {
        return;
    }

    for (int slot : opening->positions) {
        DigitPatterns::project(grid, geometry_, slot, digits[slot]);
        LOG_DEBUG(Sinkhole, "Redrew slot {} as {}", slot, digits[slot]);
    }

    LOG_INFO(Sinkhole, "Sinkholes closed, {} -> {}", Sinkhole::Opening::name(), Sinkhole::Idle::name());
    state_ = Sinkhole::Idle{};
}

} // namespace WaterClock
