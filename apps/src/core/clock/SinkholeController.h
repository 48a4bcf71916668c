#pragma once

#include "ClockGeometry.h"
#include "ClockTime.h"

#include <string>
#include <variant>
#include <vector>

namespace WaterClock {

class Grid;

namespace Sinkhole {

struct Idle {
    static constexpr const char* name() { return "Idle"; }
};

// Floors of `positions` are drained; digits are redrawn when countdown hits 0.
struct Opening {
    int countdown = 0;
    std::vector<int> positions;

    static constexpr const char* name() { return "Opening"; }
};

using State = std::variant<Idle, Opening>;

inline std::string getCurrentStateName(const State& state)
{
    return std::visit([](const auto& s) { return std::string(s.name()); }, state);
}

} // namespace Sinkhole

/**
 * Drains a digit before its shape changes.
 *
 * open() punches two narrow holes through the floor of each changed slot and
 * starts the countdown. tick() counts down and, on reaching zero, re-projects
 * every pending slot with the digit currently displayed there.
 */
class SinkholeController {
public:
    SinkholeController(const ClockGeometry& geometry, int openingPeriod);

    // Idle -> Opening, or restarts an Opening and merges the new slots into it.
    void open(Grid& grid, const std::vector<int>& changedSlots);

    // Advances an Opening by one tick; no-op while Idle.
    void tick(Grid& grid, const DigitValues& digits);

    bool isOpening() const { return std::holds_alternative<Sinkhole::Opening>(state_); }
    const Sinkhole::State& getState() const { return state_; }
    int getOpeningPeriod() const { return openingPeriod_; }

    // Carves the two drain columns of one slot, wall cells only.
    static void carve(Grid& grid, const ClockGeometry& geometry, int slot);

private:
    ClockGeometry geometry_;
    int openingPeriod_;
    Sinkhole::State state_ = Sinkhole::Idle{};
};

} // namespace WaterClock
