#include <gtest/gtest.h>

#include "activity_bars.hpp"

namespace
{
    EventRecord rec(int64_t id, int64_t ts, const char* app, const char* win = "w")
    {
        EventRecord e;
        e.id = id;
        e.timestamp = ts;
        e.appName = app;
        e.windowTitle = win;
        return e;
    }

    // x = 500 + (t - 1000) / 8
    const Geometry kGeo(1000.0, 0.125, 1000.0);
}

TEST(ActivityBars, ConsecutiveSameActivityMergesIntoOneBar)
{
    std::vector<EventRecord> events{ rec(1, 0, "Code"), rec(2, 1000, "Code"), rec(3, 2000, "Code") };
    const auto bars = layoutActivityBars(events, { 0, 3 }, kGeo);

    ASSERT_EQ(bars.size(), 1u);
    EXPECT_EQ(bars[0].firstIndex, 0u);
    EXPECT_EQ(bars[0].lastIndex, 2u);
    EXPECT_DOUBLE_EQ(bars[0].x0, 375.0);
    // last event: default width past its own position
    EXPECT_DOUBLE_EQ(bars[0].x1, 625.0 + 100.0);
    EXPECT_TRUE(bars[0].arrow);
}

TEST(ActivityBars, ActivityChangeStartsNewSegment)
{
    std::vector<EventRecord> events{ rec(1, 0, "A"), rec(2, 800, "A"), rec(3, 1600, "B"), rec(4, 2400, "A", "other") };
    const auto bars = layoutActivityBars(events, { 0, 4 }, kGeo);

    ASSERT_EQ(bars.size(), 3u);
    EXPECT_EQ(bars[0].lastIndex, 1u);
    // a segment ends where the next one starts
    EXPECT_DOUBLE_EQ(bars[0].x1, bars[1].x0);
    EXPECT_DOUBLE_EQ(bars[1].x1, bars[2].x0);
    for (const auto& b : bars)
        EXPECT_TRUE(b.arrow);
}

TEST(ActivityBars, SegmentContinuingPastTheSliceHasNoArrow)
{
    std::vector<EventRecord> events{ rec(1, 0, "A"), rec(2, 1000, "A"), rec(3, 90000, "A") };
    const auto bars = layoutActivityBars(events, { 0, 2 }, kGeo);
    ASSERT_EQ(bars.size(), 1u);
    EXPECT_FALSE(bars[0].arrow);
    EXPECT_DOUBLE_EQ(bars[0].x1, kGeo.toPixel(90000.0));
}

TEST(ActivityBars, ColorIsStableAcrossTheRun)
{
    std::vector<EventRecord> events{ rec(1, 0, "B"), rec(2, 500, "A"), rec(3, 1000, "A"), rec(4, 1500, "A") };
    const auto expected = segmentColor(events, 1);
    EXPECT_EQ(segmentColor(events, 2), expected);
    EXPECT_EQ(segmentColor(events, 3), expected);

    // slice starting mid-run keeps the run's color
    const auto bars = layoutActivityBars(events, { 2, 4 }, kGeo);
    ASSERT_EQ(bars.size(), 1u);
    EXPECT_EQ(bars[0].color, expected);
}

TEST(ActivityBars, MissingAppRendersNeutral)
{
    EventRecord e;
    e.timestamp = 1000;
    std::vector<EventRecord> events{ e };
    const auto bars = layoutActivityBars(events, { 0, 1 }, kGeo);
    ASSERT_EQ(bars.size(), 1u);
    EXPECT_TRUE(bars[0].color.neutral);
}

TEST(ActivityBars, OffscreenBarsAreCulled)
{
    std::vector<EventRecord> events{ rec(1, -100000, "A"), rec(2, -90000, "B"), rec(3, 1000, "C") };
    const auto bars = layoutActivityBars(events, { 0, 3 }, kGeo);
    ASSERT_EQ(bars.size(), 2u);
    EXPECT_EQ(bars[0].firstIndex, 1u);
}

TEST(ActivityBars, ArrowPath)
{
    BarStyle style;
    ActivityBar bar;
    bar.x0 = 10.0;
    bar.x1 = 110.0;
    const auto p = arrowPath(bar, style);
    EXPECT_DOUBLE_EQ(p[0].x, 10.0);
    EXPECT_DOUBLE_EQ(p[1].x, 102.0);
    EXPECT_DOUBLE_EQ(p[2].x, 110.0);
    EXPECT_DOUBLE_EQ(p[2].y, style.top + style.height / 2.0);
    EXPECT_DOUBLE_EQ(p[3].y, style.top + style.height);

    // shorter than the arrow depth: the shoulder stays at the start
    bar.x1 = 14.0;
    EXPECT_DOUBLE_EQ(arrowPath(bar, style)[1].x, 10.0);
}

TEST(ActivityBars, FirstBarTakesColorFromRunStart)
{
    std::vector<EventRecord> events{ rec(1, -4000, "X"), rec(2, -3000, "A"), rec(3, -2000, "A"), rec(4, 500, "A"),
        rec(5, 1500, "B"), rec(6, 2500, "A") };
    const auto bars = layoutActivityBars(events, { 3, 6 }, kGeo);

    ASSERT_EQ(bars.size(), 3u);
    EXPECT_EQ(bars[0].color, runColor(events[1], &events[0]));
    EXPECT_EQ(bars[1].color, runColor(events[4], &events[3]));
    EXPECT_EQ(bars[2].color, runColor(events[5], &events[4]));
    for (const ActivityBar& bar : bars)
        EXPECT_EQ(bar.color, segmentColor(events, bar.firstIndex));
}

TEST(ActivityBars, MissingAndEmptyNamesAreTheSameActivity)
{
    EventRecord a;
    EventRecord b;
    b.appName = "";
    b.windowTitle = "";
    EXPECT_TRUE(sameActivity(a, b));

    b.windowTitle = "w";
    EXPECT_FALSE(sameActivity(a, b));
}
