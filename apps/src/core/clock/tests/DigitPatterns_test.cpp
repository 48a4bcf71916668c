#include "core/Grid.h"
#include "core/clock/ClockGeometry.h"
#include "core/clock/ClockDiagram.h"
#include "core/clock/DigitPatterns.h"
#include <gtest/gtest.h>

using namespace WaterClock;

class DigitPatternsTest : public ::testing::Test {
protected:
    Grid createFace(const DigitValues& digits = { 0, 0, 0, 0 })
    {
        return DigitPatterns::createFace(geometry_, digits);
    }

    ClockGeometry geometry_{ 3 };
};

TEST_F(DigitPatternsTest, GeometryMatchesZoom)
{
    EXPECT_EQ(geometry_.width, 51);
    EXPECT_EQ(geometry_.height, 21);
    EXPECT_EQ(geometry_.slotLeft(0), 3);
    EXPECT_EQ(geometry_.slotRight(0), 12);
    EXPECT_EQ(geometry_.slotLeft(3), 39);
    EXPECT_EQ(geometry_.floorTop(), 18);
    EXPECT_EQ(geometry_.floorBottom(), 21);
}

TEST_F(DigitPatternsTest, ZoomBeyondGridExtentAsserts)
{
    const ClockGeometry largest(ClockGeometry::kMaxZoom);
    EXPECT_LE(largest.width, GridBuffer<CellValue>::kMaxExtent);
    EXPECT_LT(largest.height, GridBuffer<CellValue>::kMaxExtent);

    EXPECT_DEATH({ ClockGeometry geometry(ClockGeometry::kMaxZoom + 1); }, "");
    EXPECT_DEATH({ ClockGeometry geometry(2000); }, "");
}

TEST_F(DigitPatternsTest, OneInFirstSlotLeavesOnlyRightStrokeOpen)
{
    Grid grid = createFace({ 1, 0, 0, 0 });
    std::cout << ClockDiagram::generateAsciiDiagram(grid);

    for (int y = 0; y < geometry_.height; ++y) {
        for (int x = geometry_.slotLeft(0); x < geometry_.slotRight(0); ++x) {
            const bool open = y < 3 || (y < 18 && x >= 9 && x <= 11);
            EXPECT_EQ(grid.get(x, y), open ? Cell::Background : Cell::Wall)
                << "at (" << x << ", " << y << ")";
        }
    }
}

TEST_F(DigitPatternsTest, EveryDigitInEverySlotMatchesItsStrokes)
{
    Grid grid = createFace();
    const int zoom = geometry_.zoom;

    for (int slot = 0; slot < ClockGeometry::kSlotCount; ++slot) {
        for (int digit = 0; digit <= 9; ++digit) {
            DigitPatterns::project(grid, geometry_, slot, digit);

            for (int dy = 0; dy < ClockGeometry::kDigitRows; ++dy) {
                for (int dx = 0; dx < ClockGeometry::kDigitColumns; ++dx) {
                    const CellValue expected =
                        DigitPatterns::isStroke(digit, dx, dy) ? Cell::Background : Cell::Wall;
                    for (int oy = 0; oy < zoom; ++oy) {
                        for (int ox = 0; ox < zoom; ++ox) {
                            const int x = geometry_.digitColumnLeft(slot, dx) + ox;
                            const int y = geometry_.digitRowTop(dy) + oy;
                            ASSERT_EQ(grid.get(x, y), expected)
                                << "slot " << slot << " digit " << digit << " block (" << dx
                                << ", " << dy << ")";
                        }
                    }
                }
            }

            for (int y = geometry_.floorTop(); y < geometry_.floorBottom(); ++y) {
                for (int x = geometry_.slotLeft(slot); x < geometry_.slotRight(slot); ++x) {
                    ASSERT_EQ(grid.get(x, y), Cell::Wall) << "floor at (" << x << ", " << y << ")";
                }
            }
        }
    }
}

TEST_F(DigitPatternsTest, ProjectionIsIdempotent)
{
    Grid grid = createFace({ 2, 3, 5, 9 });
    DigitPatterns::project(grid, geometry_, 1, 7);
    const Grid once = grid;

    DigitPatterns::project(grid, geometry_, 1, 7);
    EXPECT_EQ(grid, once);
}

TEST_F(DigitPatternsTest, ProjectionTouchesOnlyItsSlot)
{
    Grid grid = createFace({ 8, 8, 8, 8 });
    const Grid before = grid;

    DigitPatterns::project(grid, geometry_, 2, 1);

    grid.forEach([&](int x, int y, CellValue value) {
        if (x < geometry_.slotLeft(2) || x >= geometry_.slotRight(2)) {
            EXPECT_EQ(value, before.get(x, y)) << "at (" << x << ", " << y << ")";
        }
    });
}

TEST_F(DigitPatternsTest, ProjectionKeepsLiquidInOpenCells)
{
    Grid grid = createFace({ 8, 0, 0, 0 });
    // Middle bar of an 8.
    const int x = geometry_.digitColumnLeft(0, 1);
    const int y = geometry_.digitRowTop(2);
    grid.set(x, y, 10);

    DigitPatterns::project(grid, geometry_, 0, 0);
    // A 0 has no middle bar.
    EXPECT_EQ(grid.get(x, y), Cell::Wall);

    DigitPatterns::project(grid, geometry_, 0, 8);
    grid.set(x, y, 10);
    DigitPatterns::project(grid, geometry_, 0, 8);
    EXPECT_EQ(grid.get(x, y), 10);
}

TEST_F(DigitPatternsTest, FaceHasOpenTopColonAndSentinel)
{
    Grid grid = createFace({ 1, 2, 3, 4 });

    for (int x = 0; x < geometry_.width; ++x) {
        for (int y = 0; y < geometry_.openTopRows(); ++y) {
            EXPECT_EQ(grid.get(x, y), Cell::Background);
        }
        EXPECT_EQ(grid.get(x, geometry_.height - 1), Cell::Wall);
        EXPECT_EQ(grid.get(x, grid.getSentinelRow()), Cell::Background);
    }

    EXPECT_EQ(grid.get(geometry_.colonX(), geometry_.colonUpperY()), Cell::Background);
    EXPECT_EQ(grid.get(geometry_.colonX(), geometry_.colonLowerY()), Cell::Background);
    EXPECT_EQ(grid.get(geometry_.colonX(), geometry_.colonUpperY() + 1), Cell::Wall);
}

TEST_F(DigitPatternsTest, ColonClosesAndReopens)
{
    Grid grid = createFace();

    DigitPatterns::applyColon(grid, geometry_, false);
    EXPECT_EQ(grid.get(geometry_.colonX(), geometry_.colonUpperY()), Cell::Wall);
    EXPECT_EQ(grid.get(geometry_.colonX(), geometry_.colonLowerY()), Cell::Wall);

    DigitPatterns::applyColon(grid, geometry_, true);
    EXPECT_EQ(grid.get(geometry_.colonX(), geometry_.colonUpperY()), Cell::Background);
    EXPECT_EQ(grid.get(geometry_.colonX(), geometry_.colonLowerY()), Cell::Background);
}

TEST_F(DigitPatternsTest, InvalidDigitOrSlotAsserts)
{
    Grid grid = createFace();

    EXPECT_DEATH(DigitPatterns::project(grid, geometry_, 0, 10), "");
    EXPECT_DEATH(DigitPatterns::project(grid, geometry_, 0, -1), "");
    EXPECT_DEATH(DigitPatterns::project(grid, geometry_, 4, 1), "");
    EXPECT_DEATH(DigitPatterns::isStroke(11, 0, 0), "");
}
