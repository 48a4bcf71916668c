#include "Grid.h"
#include "Assert.h"

#include <algorithm>

namespace WaterClock {

Grid::Grid(int width, int height) : height_(height)
{
    WATERCLOCK_ASSERT(width > 0 && height > 0, "Grid dimensions must be positive");
    WATERCLOCK_ASSERT(
        width <= GridBuffer<CellValue>::kMaxExtent && height < GridBuffer<CellValue>::kMaxExtent,
        "Grid dimensions exceed the buffer extent");
    buffer_.resize(width, height + 1, Cell::Background);
}

CellValue Grid::get(int x, int y) const
{
    if (!inBounds(x, y)) {
        return Cell::Wall;
    }
    return buffer_.at(x, y);
}

bool Grid::isBackgroundAt(int x, int y) const
{
    return inBounds(x, y) && Cell::isBackground(buffer_.at(x, y));
}

bool Grid::set(int x, int y, CellValue value)
{
    if (!inBounds(x, y)) {
        return false;
    }
    buffer_.set(x, y, value);
    return true;
}

bool Grid::move(int fromX, int fromY, int toX, int toY)
{
    if (!inBounds(fromX, fromY) || !inBounds(toX, toY)) {
        return false;
    }
    buffer_.set(toX, toY, buffer_.at(fromX, fromY));
    buffer_.set(fromX, fromY, Cell::Background);
    return true;
}

bool Grid::swap(int ax, int ay, int bx, int by)
{
    if (!inBounds(ax, ay) || !inBounds(bx, by)) {
        return false;
    }
    std::swap(buffer_.at(ax, ay), buffer_.at(bx, by));
    return true;
}

void Grid::fillRect(int left, int top, int right, int bottom, CellValue value)
{
    const int x0 = std::max(left, 0);
    const int y0 = std::max(top, 0);
    const int x1 = std::min(right, static_cast<int>(buffer_.width));
    const int y1 = std::min(bottom, static_cast<int>(buffer_.height));

    for (int y = y0; y < y1; ++y) {
        CellValue* row = buffer_.row(y);
        std::fill(row + x0, row + std::max(x0, x1), value);
    }
}

void Grid::forEach(const std::function<void(int x, int y, CellValue value)>& visitor) const
{
    for (int y = 0; y < buffer_.height; ++y) {
        const CellValue* row = buffer_.row(y);
        for (int x = 0; x < buffer_.width; ++x) {
            visitor(x, y, row[x]);
        }
    }
}

size_t Grid::count(const std::function<bool(CellValue)>& predicate) const
{
    return static_cast<size_t>(std::count_if(buffer_.data.begin(), buffer_.data.end(), predicate));
}

size_t Grid::countLiquid() const
{
    return count([](CellValue v) { return Cell::isLiquid(v); });
}

size_t Grid::countWall() const
{
    return count([](CellValue v) { return Cell::isWall(v); });
}

} // namespace WaterClock
