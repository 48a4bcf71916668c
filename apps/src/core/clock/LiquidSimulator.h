#pragma once

#include "ClockConfig.h"
#include "PickQueue.h"

#include <cstddef>
#include <random>

namespace WaterClock {

class Grid;

// Values drawn once per tick and shared by every cell in the scan.
struct TickPicks {
    int move = 0;
    int separation = 0;
    bool preferX = false;
};

// Sign-clamped pull toward same-colored neighbours; each component is -1, 0 or 1.
struct SeparationForce {
    int x = 0;
    int y = 0;

    bool isZero() const { return x == 0 && y == 0; }
};

/**
 * One cellular-automaton tick over the clock face.
 *
 * Order per tick: boundary removal, then a bottom-up, left-to-right scan of
 * columns 1..width-2 applying gravity, diagonal slide, lateral migration and
 * separation. Liquid only ever moves into background (or trades places with
 * another liquid color during separation), so wall is never overwritten.
 */
class LiquidSimulator {
public:
    static constexpr int kSeparationRadius = 3;

    explicit LiquidSimulator(const Config::Clock& config);

    void step(Grid& grid, std::mt19937& rng);

    // Deterministic variant for callers that supply their own picks.
    void step(Grid& grid, const TickPicks& picks);

    TickPicks drawPicks(std::mt19937& rng);

    // Clears liquid in the outer columns and unsupported liquid in the last row.
    // Returns the number of cells removed.
    static size_t removeBoundaryLiquid(Grid& grid);

    static SeparationForce separationForce(const Grid& grid, int x, int y);

    // Swaps (x, y) with a differently colored neighbour along the force; true if swapped.
    static bool separate(Grid& grid, int x, int y, bool preferX);

    const PickQueue& getMovePicks() const { return movePicks_; }
    const PickQueue& getSeparationPicks() const { return separationPicks_; }

private:
    void scan(Grid& grid, const TickPicks& picks) const;
    static void fall(Grid& grid, int x, int y, bool preferX);
    static bool migrate(Grid& grid, int x, int y);

    int moveInterval_;
    int separationInterval_;
    PickQueue movePicks_;
    PickQueue separationPicks_;
};

} // namespace WaterClock
