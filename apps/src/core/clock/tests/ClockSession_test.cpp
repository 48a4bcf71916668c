#include "core/clock/ClockSession.h"
#include "core/clock/DigitPatterns.h"
#include <gtest/gtest.h>

using namespace WaterClock;

class ClockSessionTest : public ::testing::Test {
protected:
    void SetUp() override
    {
        config_.seed = 2024;
        config_.sinkholeOpeningPeriod = 5;
    }

    Config::Clock config_;
    const ClockTime start_{ 12, 34, 0 };
};

TEST_F(ClockSessionTest, StartsWithProjectedFace)
{
    ClockSession session(config_, start_);

    EXPECT_EQ(session.getDisplayedDigits(), (DigitValues{ 1, 2, 3, 4 }));
    EXPECT_EQ(session.getTickCount(), 0u);
    EXPECT_EQ(session.getSeed(), 2024u);
    EXPECT_EQ(session.getGrid(), DigitPatterns::createFace(session.getGeometry(), { 1, 2, 3, 4 }));
    EXPECT_FALSE(session.getSinkhole().isOpening());
}

TEST_F(ClockSessionTest, SameSeedEvolvesIdentically)
{
    ClockSession first(config_, start_);
    ClockSession second(config_, start_);

    for (int tick = 0; tick < 400; ++tick) {
        const ClockTime now{ 12, 34 + tick / 200, (tick / 20) % 60 };
        first.step(now);
        second.step(now);
    }
    EXPECT_GT(first.getGrid().countLiquid(), 0u);
    EXPECT_EQ(first.getGrid(), second.getGrid());
}

TEST_F(ClockSessionTest, DigitChangeDrainsThenRedraws)
{
    config_.spawnEnabled = false;
    ClockSession session(config_, start_);
    const ClockGeometry& geometry = session.getGeometry();

    session.step({ 12, 34, 1 });
    EXPECT_FALSE(session.getSinkhole().isOpening());

    session.step({ 12, 35, 0 });
    EXPECT_TRUE(session.getSinkhole().isOpening());
    EXPECT_EQ(session.getDisplayedDigits(), (DigitValues{ 1, 2, 3, 5 }));
    EXPECT_EQ(
        session.getGrid().get(geometry.sinkholeColumn(3, 0), geometry.floorTop()),
        Cell::Background);

    for (int tick = 1; tick < 5; ++tick) {
        session.step({ 12, 35, 0 });
        ASSERT_TRUE(session.getSinkhole().isOpening()) << "tick " << tick;
    }
    session.step({ 12, 35, 1 });
    EXPECT_FALSE(session.getSinkhole().isOpening());
    EXPECT_EQ(session.getGrid(), DigitPatterns::createFace(geometry, { 1, 2, 3, 5 }));
}

TEST_F(ClockSessionTest, WallsAndSentinelHoldWithoutDigitChanges)
{
    ClockSession session(config_, start_);
    const size_t walls = session.getGrid().countWall();
    const Grid& grid = session.getGrid();

    for (int tick = 0; tick < 600; ++tick) {
        session.step({ 12, 34, (tick / 20) % 60 });
        ASSERT_EQ(grid.countWall(), walls) << "tick " << tick;
        for (int x = 0; x < grid.getWidth(); ++x) {
            ASSERT_EQ(grid.get(x, grid.getSentinelRow()), Cell::Background)
                << "sentinel at x=" << x << " tick " << tick;
        }
    }
    EXPECT_GT(grid.countLiquid(), 0u);
}

TEST_F(ClockSessionTest, TrailKeepsDropVisibleAfterItFalls)
{
    ClockSession session(config_, start_);

    session.step(start_);
    const int column = session.getSpawner().getDropColumn();
    EXPECT_TRUE(session.getGrid().isLiquidAt(column, 0));

    session.step(start_);
    session.step(start_);

    EXPECT_EQ(session.getGrid().get(column, 0), Cell::Background);
    EXPECT_TRUE(Cell::isLiquid(session.displayValueAt(column, 0)));
    EXPECT_EQ(session.getTrail().size(), 2u);
}

TEST_F(ClockSessionTest, EditsApplyOnlyInsideVisibleRows)
{
    ClockSession session(config_, start_);
    const Grid& grid = session.getGrid();

    EXPECT_TRUE(session.editCell(0, 0, EditIntent::Wall));
    EXPECT_EQ(grid.get(0, 0), Cell::Wall);

    EXPECT_TRUE(session.editCell(0, grid.getHeight() - 1, EditIntent::Background));
    EXPECT_EQ(grid.get(0, grid.getHeight() - 1), Cell::Background);

    EXPECT_FALSE(session.editCell(-1, 0, EditIntent::Wall));
    EXPECT_FALSE(session.editCell(grid.getWidth(), 0, EditIntent::Wall));
    EXPECT_FALSE(session.editCell(0, grid.getSentinelRow(), EditIntent::Wall));
    EXPECT_EQ(grid.get(0, grid.getSentinelRow()), Cell::Background);
}

TEST_F(ClockSessionTest, ColonBlinksWhenEnabled)
{
    config_.colonBlink = true;
    ClockSession session(config_, start_);
    const ClockGeometry& geometry = session.getGeometry();
    const Grid& grid = session.getGrid();

    session.step({ 12, 34, 1 });
    EXPECT_EQ(grid.get(geometry.colonX(), geometry.colonUpperY()), Cell::Wall);
    EXPECT_EQ(grid.get(geometry.colonX(), geometry.colonLowerY()), Cell::Wall);

    session.step({ 12, 34, 4 });
    EXPECT_EQ(grid.get(geometry.colonX(), geometry.colonUpperY()), Cell::Background);
    EXPECT_EQ(grid.get(geometry.colonX(), geometry.colonLowerY()), Cell::Background);
}

TEST_F(ClockSessionTest, ColonStaysOpenWithoutBlink)
{
    ClockSession session(config_, start_);
    const ClockGeometry& geometry = session.getGeometry();

    session.step({ 12, 34, 1 });
    EXPECT_EQ(
        session.getGrid().get(geometry.colonX(), geometry.colonUpperY()), Cell::Background);
}

TEST_F(ClockSessionTest, InvalidConfigAsserts)
{
    config_.digitZoom = 0;
    EXPECT_DEATH({ ClockSession session(config_, start_); }, "");
}
