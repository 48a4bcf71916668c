#pragma once

#include <optional>

namespace WaterClock {

struct GridPoint {
    int x = 0;
    int y = 0;

    bool operator==(const GridPoint&) const = default;
};

/**
 * Letterboxed placement of the grid inside a window: uniform scale, centred,
 * with whole-pixel destination size.
 */
struct Viewport {
    int gridWidth = 0;
    int gridHeight = 0;
    double scale = 0.0;
    int destX = 0;
    int destY = 0;
    int destWidth = 0;
    int destHeight = 0;

    static Viewport fit(int gridWidth, int gridHeight, int windowWidth, int windowHeight);

    // Grid cell under window pixel (px, py), if any.
    std::optional<GridPoint> toGrid(int px, int py) const;
};

} // namespace WaterClock
