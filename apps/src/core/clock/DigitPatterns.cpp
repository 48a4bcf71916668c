#include "DigitPatterns.h"
#include "core/Assert.h"
#include "core/Grid.h"

namespace WaterClock {
namespace DigitPatterns {

namespace {

void validateDigit(int digit)
{
    WATERCLOCK_ASSERT(digit >= 0 && digit <= 9, "Digit must be in 0-9");
}

void validateSlot(int slot)
{
    WATERCLOCK_ASSERT(slot >= 0 && slot < ClockGeometry::kSlotCount, "Slot must be in 0-3");
}

} // namespace

bool isStroke(int digit, int dx, int dy)
{
    validateDigit(digit);
    WATERCLOCK_ASSERT(
        dx >= 0 && dx < ClockGeometry::kDigitColumns && dy >= 0 && dy < ClockGeometry::kDigitRows,
        "Pattern block out of range");
    return kStrokes[digit][dy][dx];
}

void project(Grid& grid, const ClockGeometry& geometry, int slot, int digit)
{
    validateSlot(slot);
    validateDigit(digit);

    const int left = geometry.slotLeft(slot);
    const int right = geometry.slotRight(slot);

    // Open everything above the floor that is currently wall; liquid stays.
    for (int y = 0; y < geometry.floorTop(); ++y) {
        for (int x = left; x < right; ++x) {
            if (Cell::isWall(grid.get(x, y))) {
                grid.set(x, y, Cell::Background);
            }
        }
    }

    // Floor band is solid again (closes any sinkhole).
    grid.fillRect(left, geometry.floorTop(), right, geometry.floorBottom(), Cell::Wall);

    const Pattern& pattern = kStrokes[digit];
    const int zoom = geometry.zoom;
    for (int dy = 0; dy < ClockGeometry::kDigitRows; ++dy) {
        for (int dx = 0; dx < ClockGeometry::kDigitColumns; ++dx) {
            if (pattern[dy][dx]) {
                continue;
            }
            const int blockLeft = geometry.digitColumnLeft(slot, dx);
            const int blockTop = geometry.digitRowTop(dy);
            grid.fillRect(blockLeft, blockTop, blockLeft + zoom, blockTop + zoom, Cell::Wall);
        }
    }
}

Grid createFace(const ClockGeometry& geometry, const DigitValues& digits)
{
    Grid grid(geometry.width, geometry.height);
    grid.fillRect(0, geometry.openTopRows(), geometry.width, geometry.height, Cell::Wall);
    applyColon(grid, geometry, true);

    for (int slot = 0; slot < ClockGeometry::kSlotCount; ++slot) {
        project(grid, geometry, slot, digits[slot]);
    }
    return grid;
}

void applyColon(Grid& grid, const ClockGeometry& geometry, bool open)
{
    for (int y : { geometry.colonUpperY(), geometry.colonLowerY() }) {
        const CellValue current = grid.get(geometry.colonX(), y);
        if (open && Cell::isWall(current)) {
            grid.set(geometry.colonX(), y, Cell::Background);
        }
        else if (!open && Cell::isBackground(current)) {
            grid.set(geometry.colonX(), y, Cell::Wall);
        }
    }
}

} // namespace DigitPatterns
} // namespace WaterClock
