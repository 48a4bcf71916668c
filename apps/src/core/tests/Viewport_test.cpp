#include "core/Viewport.h"
#include <gtest/gtest.h>

using namespace WaterClock;

TEST(ViewportTest, ExactMultipleFillsWindow)
{
    const Viewport viewport = Viewport::fit(51, 21, 510, 210);

    EXPECT_DOUBLE_EQ(viewport.scale, 10.0);
    EXPECT_EQ(viewport.destX, 0);
    EXPECT_EQ(viewport.destY, 0);
    EXPECT_EQ(viewport.destWidth, 510);
    EXPECT_EQ(viewport.destHeight, 210);
}

TEST(ViewportTest, WideWindowIsPillarboxed)
{
    const Viewport viewport = Viewport::fit(51, 21, 1000, 210);

    EXPECT_DOUBLE_EQ(viewport.scale, 10.0);
    EXPECT_EQ(viewport.destWidth, 510);
    EXPECT_EQ(viewport.destX, (1000 - 510) / 2);
    EXPECT_EQ(viewport.destY, 0);
}

TEST(ViewportTest, TallWindowIsLetterboxed)
{
    const Viewport viewport = Viewport::fit(51, 21, 102, 400);

    EXPECT_DOUBLE_EQ(viewport.scale, 2.0);
    EXPECT_EQ(viewport.destHeight, 42);
    EXPECT_EQ(viewport.destX, 0);
    EXPECT_EQ(viewport.destY, (400 - 42) / 2);
}

TEST(ViewportTest, ToGridMapsInsideAndRejectsBars)
{
    const Viewport viewport = Viewport::fit(51, 21, 1000, 210);
    const int left = viewport.destX;

    EXPECT_EQ(viewport.toGrid(left, 0), (GridPoint{ 0, 0 }));
    EXPECT_EQ(viewport.toGrid(left + 19, 35), (GridPoint{ 1, 3 }));
    EXPECT_EQ(viewport.toGrid(left + 509, 209), (GridPoint{ 50, 20 }));

    EXPECT_FALSE(viewport.toGrid(left - 1, 10).has_value());
    EXPECT_FALSE(viewport.toGrid(left + 510, 10).has_value());
    EXPECT_FALSE(viewport.toGrid(left, 210).has_value());
    EXPECT_FALSE(viewport.toGrid(-5, -5).has_value());
}

TEST(ViewportTest, EmptyWindowMapsNothing)
{
    const Viewport viewport = Viewport::fit(51, 21, 0, 0);

    EXPECT_EQ(viewport.destWidth, 0);
    EXPECT_FALSE(viewport.toGrid(0, 0).has_value());
}
