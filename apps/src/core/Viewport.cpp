#include "Viewport.h"

#include <algorithm>

namespace WaterClock {

Viewport Viewport::fit(int gridWidth, int gridHeight, int windowWidth, int windowHeight)
{
    Viewport viewport;
    viewport.gridWidth = gridWidth;
    viewport.gridHeight = gridHeight;
    if (gridWidth <= 0 || gridHeight <= 0 || windowWidth <= 0 || windowHeight <= 0) {
        return viewport;
    }

    viewport.scale = std::min(
        static_cast<double>(windowWidth) / gridWidth,
        static_cast<double>(windowHeight) / gridHeight);
    viewport.destWidth = static_cast<int>(gridWidth * viewport.scale);
    viewport.destHeight = static_cast<int>(gridHeight * viewport.scale);
    viewport.destX = (windowWidth - viewport.destWidth) / 2;
    viewport.destY = (windowHeight - viewport.destHeight) / 2;
    return viewport;
}

std::optional<GridPoint> Viewport::toGrid(int px, int py) const
{
    if (scale <= 0.0) {
        return std::nullopt;
    }
    if (px < destX || py < destY || px >= destX + destWidth || py >= destY + destHeight) {
        return std::nullopt;
    }

    const int x = static_cast<int>((px - destX) / scale);
    const int y = static_cast<int>((py - destY) / scale);
    if (x < 0 || y < 0 || x >= gridWidth || y >= gridHeight) {
        return std::nullopt;
    }
    return GridPoint{ x, y };
}

} // namespace WaterClock
