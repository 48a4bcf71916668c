#pragma once

#include "core/CellType.h"
#include "core/GridBuffer.h"

#include <cstddef>
#include <deque>

namespace WaterClock {

class Grid;

/**
 * Keeps the last few pre-step grids so a renderer can let liquid linger for a
 * frame after it moves. Read-only with respect to the simulation.
 */
class TrailHistory {
public:
    explicit TrailHistory(size_t depth = 2);

    // Stores a copy of `grid`, evicting the oldest snapshot beyond the depth.
    void push(const Grid& grid);
    void clear() { snapshots_.clear(); }

    /**
     * Display value for (x, y): the live value, unless it is background and a
     * snapshot still shows liquid there, in which case the newest such liquid
     * color is returned.
     */
    CellValue displayValue(const Grid& current, int x, int y) const;

    size_t getDepth() const { return depth_; }
    size_t size() const { return snapshots_.size(); }

    // Oldest first.
    const std::deque<GridBuffer<CellValue>>& getSnapshots() const { return snapshots_; }

private:
    size_t depth_;
    std::deque<GridBuffer<CellValue>> snapshots_;
};

} // namespace WaterClock
