#include <gtest/gtest.h>

#include "model.hpp"
#include "time_axis.hpp"

using namespace axis;

TEST(TimeAxis, LadderIsAscending)
{
    const auto ladder = tickLadder();
    ASSERT_FALSE(ladder.empty());
    EXPECT_EQ(ladder.front(), 10);
    EXPECT_EQ(ladder.back(), 2500 * kYearMs);
    for (std::size_t i = 1; i < ladder.size(); ++i)
        EXPECT_LT(ladder[i - 1], ladder[i]);
}

TEST(TimeAxis, PicksSmallestStepWideEnough)
{
    // 120 px / 0.02 px/ms = 6 s
    EXPECT_EQ(pickTickInterval(kMaxZoom), 10 * kSecondMs);
    // 120 ms
    EXPECT_EQ(pickTickInterval(1.0), 200);
    // 1.2 years
    EXPECT_EQ(pickTickInterval(kMinZoom), 2 * kYearMs);
    EXPECT_EQ(pickTickInterval(1e-15), 2500 * kYearMs);
    EXPECT_EQ(pickTickInterval(0.0), 2500 * kYearMs);

    for (double zoom : { 0.02, 0.003, 0.0001, 1e-6, 1e-8 })
    {
        const int64_t step = pickTickInterval(zoom);
        EXPECT_GE(double(step) * zoom, kMinTickSpacingPx);
    }
}

TEST(TimeAxis, TickLabelsFollowStep)
{
    EXPECT_EQ(formatTick(0.0, kYearMs, true), "1970");
    EXPECT_EQ(formatTick(0.0, 30 * kDayMs, true), "Jan 1970");
    EXPECT_EQ(formatTick(0.0, kDayMs, true), "Jan 1");
    EXPECT_EQ(formatTick(0.0, kHourMs, true), "0:00");

    const double t = double(kHourMs + 2 * kMinuteMs + 3 * kSecondMs);
    EXPECT_EQ(formatTick(t, kMinuteMs, true), "1:02");
    EXPECT_EQ(formatTick(t, kSecondMs, true), "1:02:03");
    EXPECT_EQ(formatTick(t + 45.0, 100, true), "1:02:03.045");
}

TEST(TimeAxis, FormatDateTimeUtc)
{
    EXPECT_EQ(formatDateTime(0.0, true), "1970-01-01 00:00:00");
    // 2024-02-29T12:34:56Z
    EXPECT_EQ(formatDateTime(1709210096000.0, true), "2024-02-29 12:34:56");
}

TEST(TimeAxis, TicksAreAlignedAndPositioned)
{
    // x == t with center 500, zoom 1, width 1000
    const auto ticks = ticksFor(0.0, 1000.0, 100, 500.0, 1.0, 1000.0);
    ASSERT_EQ(ticks.size(), 10u);
    for (std::size_t i = 0; i < ticks.size(); ++i)
    {
        EXPECT_DOUBLE_EQ(ticks[i].timeMs, double(i) * 100.0);
        EXPECT_DOUBLE_EQ(ticks[i].x, double(i) * 100.0);
    }

    const auto shifted = ticksFor(150.0, 400.0, 100, 500.0, 1.0, 1000.0);
    ASSERT_FALSE(shifted.empty());
    EXPECT_DOUBLE_EQ(shifted.front().timeMs, 100.0);
}

TEST(TimeAxis, TicksAreBounded)
{
    EXPECT_TRUE(ticksFor(0.0, 1000.0, 0, 500.0, 1.0, 1000.0).empty());
    EXPECT_TRUE(ticksFor(1000.0, 0.0, 100, 500.0, 1.0, 1000.0).empty());
    EXPECT_LE(ticksFor(0.0, 1e9, 10, 500.0, 1.0, 1e9, 100).size(), 100u);
}
