#include "LiquidSimulator.h"
#include "core/Grid.h"
#include "core/LoggingChannels.h"

#include <algorithm>
#include <cstdlib>

namespace WaterClock {

namespace {

int clampUnit(int value)
{
    return std::clamp(value, -1, 1);
}

} // namespace

LiquidSimulator::LiquidSimulator(const Config::Clock& config)
    : moveInterval_(config.liquidMoveInterval),
      separationInterval_(config.liquidSepInterval),
      movePicks_("move", config.liquidMoveInterval, config.pickRepeats),
      separationPicks_("separation", config.liquidSepInterval, config.pickRepeats)
{}

TickPicks LiquidSimulator::drawPicks(std::mt19937& rng)
{
    std::bernoulli_distribution coin(0.5);

    TickPicks picks;
    picks.move = movePicks_.next(rng);
    picks.separation = separationPicks_.next(rng);
    picks.preferX = coin(rng);
    return picks;
}

void LiquidSimulator::step(Grid& grid, std::mt19937& rng)
{
    const size_t removed = removeBoundaryLiquid(grid);
    const TickPicks picks = drawPicks(rng);

    LOG_TRACE(
        Simulation,
        "Tick picks: move={} separation={} preferX={} (removed {})",
        picks.move,
        picks.separation,
        picks.preferX,
        removed);

    scan(grid, picks);
}

void LiquidSimulator::step(Grid& grid, const TickPicks& picks)
{
    removeBoundaryLiquid(grid);
    scan(grid, picks);
}

size_t LiquidSimulator::removeBoundaryLiquid(Grid& grid)
{
    size_t removed = 0;
    const int right = grid.getWidth() - 1;

    for (int y = 0; y < grid.getHeight(); ++y) {
        for (int x : { 0, right }) {
            if (grid.isLiquidAt(x, y)) {
                grid.set(x, y, Cell::Background);
                removed++;
            }
        }
    }

    // Liquid drains out of the bottom once nothing holds it up.
    const int lastRow = grid.getHeight() - 1;
    for (int x = 0; x < grid.getWidth(); ++x) {
        if (grid.isBackgroundAt(x, grid.getSentinelRow()) && grid.isLiquidAt(x, lastRow)) {
            grid.set(x, lastRow, Cell::Background);
            removed++;
        }
    }

    return removed;
}

void LiquidSimulator::scan(Grid& grid, const TickPicks& picks) const
{
    for (int y = grid.getHeight() - 1; y >= 0; --y) {
        for (int x = 1; x < grid.getWidth() - 1; ++x) {
            if (!grid.isLiquidAt(x, y)) {
                continue;
            }

            fall(grid, x, y, picks.preferX);

            // The cell may have just left; only a liquid that stayed drifts sideways.
            if (!grid.isLiquidAt(x, y)) {
                continue;
            }

            const int phase = x + y;
            if (phase % moveInterval_ == picks.move) {
                migrate(grid, x, y);
            }
            else if (phase % separationInterval_ == picks.separation) {
                separate(grid, x, y, picks.preferX);
            }
        }
    }
}

void LiquidSimulator::fall(Grid& grid, int x, int y, bool preferX)
{
    // Never fall into the sentinel row.
    if (y + 1 >= grid.getHeight()) {
        return;
    }

    const CellValue below = grid.get(x, y + 1);
    if (Cell::isBackground(below)) {
        grid.move(x, y, x, y + 1);
        return;
    }

    if (Cell::isLiquid(below)) {
        const int targetX = preferX ? x + 1 : x - 1;
        if (grid.isBackgroundAt(targetX, y + 1)) {
            grid.move(x, y, targetX, y + 1);
        }
    }
}

bool LiquidSimulator::migrate(Grid& grid, int x, int y)
{
    const CellValue left = grid.get(x - 1, y);
    const CellValue right = grid.get(x + 1, y);

    if (Cell::isLiquid(left) && Cell::isBackground(right)) {
        return grid.move(x, y, x + 1, y);
    }
    if (Cell::isLiquid(right) && Cell::isBackground(left)) {
        return grid.move(x, y, x - 1, y);
    }
    return false;
}

SeparationForce LiquidSimulator::separationForce(const Grid& grid, int x, int y)
{
    const CellValue color = grid.get(x, y);
    if (!Cell::isLiquid(color)) {
        return {};
    }

    int sumX = 0;
    int sumY = 0;
    for (int dy = -kSeparationRadius; dy <= kSeparationRadius; ++dy) {
        for (int dx = -kSeparationRadius; dx <= kSeparationRadius; ++dx) {
            const int distance = std::abs(dx) + std::abs(dy);
            if (distance < 1 || distance > kSeparationRadius) {
                continue;
            }
            if (grid.inBounds(x + dx, y + dy) && grid.get(x + dx, y + dy) == color) {
                sumX += dx;
                sumY += dy;
            }
        }
    }

    return { clampUnit(sumX), clampUnit(sumY) };
}

bool LiquidSimulator::separate(Grid& grid, int x, int y, bool preferX)
{
    const CellValue color = grid.get(x, y);
    if (!Cell::isLiquid(color)) {
        return false;
    }

    const SeparationForce force = separationForce(grid, x, y);
    if (force.isZero()) {
        return false;
    }

    // Only trade places with a different liquid color; empty space is gravity's job.
    auto trySwap = [&](int targetX, int targetY) {
        if (targetX == x && targetY == y) {
            return false;
        }
        if (!grid.inBounds(targetX, targetY)) {
            return false;
        }
        const CellValue target = grid.get(targetX, targetY);
        if (!Cell::isLiquid(target) || target == color) {
            return false;
        }
        return grid.swap(x, y, targetX, targetY);
    };

    if (preferX) {
        return trySwap(x + force.x, y) || trySwap(x, y + force.y);
    }
    return trySwap(x, y + force.y) || trySwap(x + force.x, y);
}

} // namespace WaterClock
