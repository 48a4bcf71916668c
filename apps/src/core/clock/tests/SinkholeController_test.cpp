#include "core/Grid.h"
#include "core/clock/DigitPatterns.h"
#include "core/clock/SinkholeController.h"
#include <gtest/gtest.h>

using namespace WaterClock;

class SinkholeControllerTest : public ::testing::Test {
protected:
    void SetUp() override { grid_ = DigitPatterns::createFace(geometry_, digits_); }

    bool floorIsSolid(int slot) const
    {
        for (int y = geometry_.floorTop(); y < geometry_.floorBottom(); ++y) {
            for (int x = geometry_.slotLeft(slot); x < geometry_.slotRight(slot); ++x) {
                if (!Cell::isWall(grid_.get(x, y))) {
                    return false;
                }
            }
        }
        return true;
    }

    bool drainOpen(int slot) const
    {
        for (int dx : { 0, ClockGeometry::kDigitColumns - 1 }) {
            const int x = geometry_.sinkholeColumn(slot, dx);
            for (int y = geometry_.floorTop(); y < geometry_.floorBottom(); ++y) {
                if (!Cell::isBackground(grid_.get(x, y))) {
                    return false;
                }
            }
        }
        return true;
    }

    ClockGeometry geometry_{ 3 };
    DigitValues digits_{ 1, 2, 5, 9 };
    Grid grid_;
};

TEST_F(SinkholeControllerTest, OpensForPeriodThenRedraws)
{
    SinkholeController sinkhole(geometry_, 30);
    EXPECT_EQ(Sinkhole::getCurrentStateName(sinkhole.getState()), "Idle");

    // Change tick.
    digits_[3] = 0;
    sinkhole.open(grid_, { 3 });
    ASSERT_TRUE(sinkhole.isOpening());
    EXPECT_TRUE(drainOpen(3));
    EXPECT_TRUE(floorIsSolid(2));

    for (int tick = 1; tick < 30; ++tick) {
        sinkhole.tick(grid_, digits_);
        ASSERT_TRUE(sinkhole.isOpening()) << "closed early on tick " << tick;
        ASSERT_TRUE(drainOpen(3)) << "drain closed early on tick " << tick;
    }

    sinkhole.tick(grid_, digits_);
    EXPECT_FALSE(sinkhole.isOpening());
    EXPECT_TRUE(floorIsSolid(3));

    Grid expected = DigitPatterns::createFace(geometry_, digits_);
    EXPECT_EQ(grid_, expected);
}

TEST_F(SinkholeControllerTest, DrainsAreTwoNarrowColumns)
{
    SinkholeController sinkhole(geometry_, 5);
    sinkhole.open(grid_, { 0 });

    int openFloorCells = 0;
    for (int y = geometry_.floorTop(); y < geometry_.floorBottom(); ++y) {
        for (int x = geometry_.slotLeft(0); x < geometry_.slotRight(0); ++x) {
            if (Cell::isBackground(grid_.get(x, y))) {
                openFloorCells++;
            }
        }
    }
    EXPECT_EQ(openFloorCells, 2 * geometry_.zoom);
    EXPECT_EQ(geometry_.sinkholeColumn(0, 0), 4);
    EXPECT_EQ(geometry_.sinkholeColumn(0, 2), 10);
}

TEST_F(SinkholeControllerTest, ReopenMergesSlotsAndRestartsCountdown)
{
    SinkholeController sinkhole(geometry_, 10);
    sinkhole.open(grid_, { 3 });
    for (int tick = 0; tick < 6; ++tick) {
        sinkhole.tick(grid_, digits_);
    }

    sinkhole.open(grid_, { 2, 3 });
    const auto* opening = std::get_if<Sinkhole::Opening>(&sinkhole.getState());
    ASSERT_NE(opening, nullptr);
    EXPECT_EQ(sinkhole.getOpeningPeriod(), 10);
    EXPECT_EQ(opening->countdown, sinkhole.getOpeningPeriod());
    EXPECT_EQ(opening->positions, (std::vector<int>{ 2, 3 }));

    for (int tick = 1; tick < 10; ++tick) {
        sinkhole.tick(grid_, digits_);
    }
    EXPECT_TRUE(sinkhole.isOpening());
    sinkhole.tick(grid_, digits_);
    EXPECT_FALSE(sinkhole.isOpening());
    EXPECT_TRUE(floorIsSolid(2));
    EXPECT_TRUE(floorIsSolid(3));
}

TEST_F(SinkholeControllerTest, TickWhileIdleChangesNothing)
{
    SinkholeController sinkhole(geometry_, 3);
    const Grid before = grid_;

    sinkhole.tick(grid_, digits_);
    EXPECT_EQ(grid_, before);
    EXPECT_FALSE(sinkhole.isOpening());
}

TEST_F(SinkholeControllerTest, CarveLeavesLiquidInPlace)
{
    const int x = geometry_.sinkholeColumn(1, 0);
    grid_.set(x, geometry_.floorTop(), 8);

    SinkholeController::carve(grid_, geometry_, 1);
    EXPECT_EQ(grid_.get(x, geometry_.floorTop()), 8);
    EXPECT_EQ(grid_.get(x, geometry_.floorTop() + 1), Cell::Background);
}
