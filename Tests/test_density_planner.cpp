#include <gtest/gtest.h>

#include "activity_bars.hpp"
#include "density_planner.hpp"
#include "time_axis.hpp"

#include <cmath>
#include <set>

namespace
{
    EventRecord rec(int64_t id, int64_t ts, std::string app, std::string win = "w")
    {
        EventRecord e;
        e.id = id;
        e.timestamp = ts;
        e.appName = std::move(app);
        e.windowTitle = std::move(win);
        return e;
    }

    // x = 500 + (t - 4000) / 8, visible [0, 8000]
    const Geometry kGeo(4000.0, 0.125, 1000.0);

    IndexRange all(const std::vector<EventRecord>& events) { return { 0, events.size() }; }
}

TEST(DensityPlanner, LabelGapLadder)
{
    DensityPlanner planner;
    EXPECT_DOUBLE_EQ(planner.labelGap(10 * axis::kSecondMs), 0.0);
    EXPECT_DOUBLE_EQ(planner.labelGap(axis::kMinuteMs), 180.0);
    EXPECT_DOUBLE_EQ(planner.labelGap(15 * axis::kMinuteMs), 30.0);
    EXPECT_FALSE(planner.isMacroScale(2 * axis::kMinuteMs));
    EXPECT_TRUE(planner.isMacroScale(5 * axis::kMinuteMs));
    EXPECT_DOUBLE_EQ(planner.sampleInterval(axis::kMinuteMs, 1e6, 1000.0), 0.0);
}

TEST(DensityPlanner, EmptyInput)
{
    DensityPlanner planner;
    std::vector<EventRecord> events;
    EXPECT_TRUE(planner.plan(events, {}, kGeo, 1000, std::nullopt).empty());

    events.push_back(rec(1, 100, "a"));
    EXPECT_TRUE(planner.plan(events, all(events), Geometry(0.0, 0.1, 0.0), 1000, std::nullopt).empty());
}

TEST(DensityPlanner, ThumbnailsKeepMinimumGap)
{
    // one activity, an event every 10 px
    std::vector<EventRecord> events;
    for (int64_t i = 0; i < 100; ++i)
        events.push_back(rec(i, i * 80, "app"));

    DensityPlanner planner;
    const auto nodes = planner.plan(events, all(events), kGeo, 1000, std::nullopt);
    ASSERT_EQ(nodes.size(), 50u);

    double lastX = -1e9;
    for (const NodePlan& n : nodes)
    {
        EXPECT_TRUE(n.showImage);
        EXPECT_GE(n.x - lastX, planner.rules().minImageGap);
        lastX = n.x;
    }
    // a single segment: only its start is labeled
    EXPECT_TRUE(nodes.front().showLabel);
    for (std::size_t i = 1; i < nodes.size(); ++i)
    {
        EXPECT_FALSE(nodes[i].showLabel);
        EXPECT_TRUE(nodes[i].sameActivityAsPrev);
    }
    // 98 -> 99
    EXPECT_DOUBLE_EQ(nodes.back().segmentWidth, 10.0);
}

TEST(DensityPlanner, LastEventUsesDefaultWidth)
{
    std::vector<EventRecord> events{ rec(1, 4000, "a") };
    DensityPlanner planner;
    const auto nodes = planner.plan(events, all(events), kGeo, 1000, std::nullopt);
    ASSERT_EQ(nodes.size(), 1u);
    EXPECT_DOUBLE_EQ(nodes[0].x, 500.0);
    EXPECT_DOUBLE_EQ(nodes[0].segmentWidth, planner.rules().defaultSegmentWidth);
}

TEST(DensityPlanner, LabelSpacingDependsOnTick)
{
    // alternating activities every 100 px
    std::vector<EventRecord> events;
    for (int64_t i = 0; i < 10; ++i)
        events.push_back(rec(i, i * 800, i % 2 ? "odd" : "even"));

    DensityPlanner planner;
    auto countLabels = [&](int64_t tick)
    {
        int labels = 0;
        for (const NodePlan& n : planner.plan(events, all(events), kGeo, tick, std::nullopt))
            labels += n.showLabel ? 1 : 0;
        return labels;
    };

    // fine: every segment start
    EXPECT_EQ(countLabels(10 * axis::kSecondMs), 10);
    // 180 px apart
    EXPECT_EQ(countLabels(axis::kMinuteMs), 5);
    // icons, 30 px apart
    EXPECT_EQ(countLabels(15 * axis::kMinuteMs), 10);

    for (const NodePlan& n : planner.plan(events, all(events), kGeo, axis::kMinuteMs, std::nullopt))
        EXPECT_TRUE(n.showText);
    for (const NodePlan& n : planner.plan(events, all(events), kGeo, 15 * axis::kMinuteMs, std::nullopt))
        EXPECT_FALSE(n.showText);
}

TEST(DensityPlanner, HighlightForcesThumbnail)
{
    std::vector<EventRecord> events;
    for (int64_t i = 0; i < 100; ++i)
        events.push_back(rec(i, i * 80, "app"));

    DensityPlanner planner;
    // id 33 sits 10 px after an accepted thumbnail
    const auto nodes = planner.plan(events, all(events), kGeo, 1000, int64_t(33));
    int highlighted = 0;
    for (const NodePlan& n : nodes)
    {
        if (!n.highlighted)
            continue;
        ++highlighted;
        EXPECT_EQ(n.index, 33u);
        EXPECT_TRUE(n.showImage);
    }
    EXPECT_EQ(highlighted, 1);
}

TEST(DensityPlanner, NoThumbnailsWhenZoomedFarOut)
{
    std::vector<EventRecord> events{ rec(1, 0, "a"), rec(2, 1000, "b") };
    DensityPlanner planner;
    const Geometry far(500.0, 1e-6, 1000.0);
    const auto nodes = planner.plan(events, all(events), far, axis::pickTickInterval(far.zoom), std::nullopt);
    ASSERT_FALSE(nodes.empty());
    for (const NodePlan& n : nodes)
    {
        EXPECT_FALSE(n.showImage);
        EXPECT_TRUE(n.showLabel);
    }
}

TEST(DensityPlanner, MacroScaleSamplesOnePerBucket)
{
    const Geometry geo(6'000'000.0, 0.0001, 1200.0);
    const int64_t tick = axis::pickTickInterval(geo.zoom);
    DensityPlanner planner;
    ASSERT_TRUE(planner.isMacroScale(tick));

    std::vector<EventRecord> events;
    for (int64_t i = 0; i < 5000; ++i)
        events.push_back(rec(i, i * 2400, "app"));

    const double bucketMs = planner.sampleInterval(tick, geo.visibleSpan(), geo.width);
    ASSERT_GT(bucketMs, 0.0);

    std::set<int64_t> buckets;
    int images = 0;
    for (const NodePlan& n : planner.plan(events, all(events), geo, tick, std::nullopt))
    {
        if (!n.showImage)
            continue;
        ++images;
        const int64_t b = int64_t(std::floor(double(events[n.index].timestamp) / bucketMs));
        EXPECT_TRUE(buckets.insert(b).second);
    }
    EXPECT_GT(images, 0);
    // far fewer than the 60 a 20 px gap alone would allow
    EXPECT_LE(images, int(geo.visibleSpan() / bucketMs) + 2);
}

TEST(DensityPlanner, CullsOffscreenEvents)
{
    // 1 ends before the view, 2 starts before it but its segment reaches in, 4 is past the right edge
    std::vector<EventRecord> events{ rec(1, -20000, "a"), rec(2, -10000, "b"), rec(3, 4000, "c"), rec(4, 100000, "d") };
    DensityPlanner planner;
    const auto nodes = planner.plan(events, all(events), kGeo, 1000, std::nullopt);
    ASSERT_EQ(nodes.size(), 2u);
    EXPECT_EQ(events[nodes[0].index].id, 2);
    EXPECT_EQ(events[nodes[1].index].id, 3);
}

TEST(DensityPlanner, NodesCarryTheirSegmentColor)
{
    // the A run starts left of the visible slice, A comes back after C
    std::vector<EventRecord> events{ rec(1, -3000, "A"), rec(2, -2000, "A"), rec(3, -1000, "A"), rec(4, 500, "A"),
        rec(5, 1000, "A"), rec(6, 2000, "B"), rec(7, 3000, "C"), rec(8, 5000, "A"), rec(9, 6000, "A") };
    DensityPlanner planner;
    const auto nodes = planner.plan(events, { 3, events.size() }, kGeo, 1000, std::nullopt);
    ASSERT_EQ(nodes.size(), 6u);

    for (const NodePlan& n : nodes)
        EXPECT_EQ(n.color, segmentColor(events, n.index)) << "event " << n.index;
    EXPECT_EQ(nodes[0].color, segmentColor(events, 0));
    EXPECT_EQ(nodes[4].color, runColor(events[7], &events[6]));
    EXPECT_EQ(nodes[5].color, nodes[4].color);
}

TEST(DensityPlanner, LongRunKeepsOneColor)
{
    // a single activity far longer than the visible slice
    std::vector<EventRecord> events;
    for (int64_t i = 0; i < 200'000; ++i)
        events.push_back(rec(i, i * 80 - 200'000 * 80 + 8000, "app"));

    DensityPlanner planner;
    const IndexRange tail{ events.size() - 100, events.size() };
    const auto nodes = planner.plan(events, tail, kGeo, 1000, std::nullopt);
    ASSERT_FALSE(nodes.empty());
    const color::Hsl expected = runColor(events.front(), nullptr);
    for (const NodePlan& n : nodes)
        EXPECT_EQ(n.color, expected);
}
