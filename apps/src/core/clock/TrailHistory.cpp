#include "TrailHistory.h"
#include "core/Grid.h"

namespace WaterClock {

TrailHistory::TrailHistory(size_t depth) : depth_(depth)
{}

void TrailHistory::push(const Grid& grid)
{
    if (depth_ == 0) {
        return;
    }
    snapshots_.push_back(grid.getBuffer());
    while (snapshots_.size() > depth_) {
        snapshots_.pop_front();
    }
}

CellValue TrailHistory::displayValue(const Grid& current, int x, int y) const
{
    const CellValue value = current.get(x, y);
    if (!Cell::isBackground(value) || !current.inBounds(x, y)) {
        return value;
    }

    for (auto it = snapshots_.rbegin(); it != snapshots_.rend(); ++it) {
        if (!it->contains(x, y)) {
            continue;
        }
        const CellValue previous = it->at(x, y);
        if (Cell::isLiquid(previous)) {
            return previous;
        }
    }
    return value;
}

} // namespace WaterClock
