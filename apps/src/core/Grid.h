#pragma once

#include "CellType.h"
#include "GridBuffer.h"

#include <cstddef>
#include <functional>

namespace WaterClock {

/**
 * The cell array shared by every clock component.
 *
 * Holds `height` visible rows plus one sentinel row below them (row index
 * `height`). All range checks live here: reads outside the array return
 * Cell::Wall so that neighbour probes treat the outside as solid, and writes
 * outside the array are dropped.
 */
class Grid {
public:
    Grid() = default;
    Grid(int width, int height);

    int getWidth() const { return buffer_.width; }

    // Visible rows only; the sentinel row is getSentinelRow().
    int getHeight() const { return height_; }
    int getSentinelRow() const { return height_; }

    // True for visible rows and the sentinel row.
    bool inBounds(int x, int y) const { return buffer_.contains(x, y); }
    bool inVisibleBounds(int x, int y) const { return inBounds(x, y) && y < height_; }

    CellValue get(int x, int y) const;
    Cell::Kind kindAt(int x, int y) const { return Cell::classify(get(x, y)); }
    bool isLiquidAt(int x, int y) const { return Cell::isLiquid(get(x, y)); }
    bool isBackgroundAt(int x, int y) const;

    // Returns false (and changes nothing) when (x, y) is outside the grid.
    bool set(int x, int y, CellValue value);

    // Moves the value at `from` to `to`, leaving background behind.
    bool move(int fromX, int fromY, int toX, int toY);
    bool swap(int ax, int ay, int bx, int by);

    void fill(CellValue value) { buffer_.clear(value); }
    void fillRect(int left, int top, int right, int bottom, CellValue value);

    // Visits every cell including the sentinel row.
    void forEach(const std::function<void(int x, int y, CellValue value)>& visitor) const;
    size_t count(const std::function<bool(CellValue)>& predicate) const;
    size_t countLiquid() const;
    size_t countWall() const;

    const GridBuffer<CellValue>& getBuffer() const { return buffer_; }

    bool operator==(const Grid& other) const
    {
        return height_ == other.height_ && buffer_ == other.buffer_;
    }

private:
    int height_ = 0;
    GridBuffer<CellValue> buffer_;
};

} // namespace WaterClock
