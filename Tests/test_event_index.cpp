#include <gtest/gtest.h>

#include "event_index.hpp"

#include <random>
#include <string>

namespace
{
    EventRecord rec(int64_t id, int64_t ts, const char* app = "app", const char* win = "win")
    {
        EventRecord e;
        e.id = id;
        e.timestamp = ts;
        e.appName = app;
        e.windowTitle = win;
        return e;
    }

    std::vector<int64_t> timestamps(const EventIndex& index, const IndexRange& r)
    {
        std::vector<int64_t> out;
        for (const auto& e : index.slice(r))
            out.push_back(e.timestamp);
        return out;
    }
}

TEST(EventIndex, RangeQueryIncludesPrecedingEvent)
{
    EventIndex index;
    index.merge({ rec(1, 1000), rec(2, 4000), rec(3, 5500), rec(4, 7000) });

    const IndexRange r = index.rangeQuery(5000, 6000);
    EXPECT_EQ(timestamps(index, r), (std::vector<int64_t>{ 4000, 5500 }));
}

TEST(EventIndex, RangeQueryEdges)
{
    EventIndex index;
    EXPECT_TRUE(index.rangeQuery(0, 100).empty());

    index.merge({ rec(1, 1000), rec(2, 2000) });
    // window before everything
    EXPECT_TRUE(index.rangeQuery(0, 500).empty());
    // window after everything: only the last event, its bar extends
    EXPECT_EQ(timestamps(index, index.rangeQuery(5000, 6000)), (std::vector<int64_t>{ 2000 }));
    // inclusive bounds
    EXPECT_EQ(timestamps(index, index.rangeQuery(1000, 2000)), (std::vector<int64_t>{ 1000, 2000 }));
    // inverted window
    EXPECT_TRUE(index.rangeQuery(3000, 1000).empty());
}

TEST(EventIndex, MergeSortsAndDeduplicates)
{
    EventIndex index;
    EXPECT_EQ(index.merge({ rec(3, 300), rec(1, 100) }), 2u);
    EXPECT_EQ(index.merge({ rec(2, 200), rec(1, 100) }), 1u);

    ASSERT_EQ(index.size(), 3u);
    EXPECT_EQ(index.events()[0].timestamp, 100);
    EXPECT_EQ(index.events()[1].timestamp, 200);
    EXPECT_EQ(index.events()[2].timestamp, 300);
}

TEST(EventIndex, IncomingRecordWins)
{
    EventIndex index;
    index.merge({ rec(7, 100, "old") });
    index.merge({ rec(7, 100, "new") });
    ASSERT_EQ(index.size(), 1u);
    EXPECT_EQ(index.events()[0].appName, "new");
}

TEST(EventIndex, DropsNegativeTimestamps)
{
    EventIndex index;
    EXPECT_EQ(index.merge({ rec(1, -5), rec(2, 10) }), 1u);
    ASSERT_EQ(index.size(), 1u);
    EXPECT_EQ(index.events()[0].timestamp, 10);
}

TEST(EventIndex, IdentityFallsBackToPathThenComposite)
{
    EventIndex index;
    EventRecord a;
    a.timestamp = 50;
    a.imagePath = "shots/a.png";
    EventRecord b = a;
    b.appName = "other";
    index.merge({ a, b });
    EXPECT_EQ(index.size(), 1u);

    EventRecord c;
    c.timestamp = 60;
    c.appName = "x";
    EventRecord d = c;
    d.windowTitle = "y";
    index.merge({ c, d });
    EXPECT_EQ(index.size(), 3u);
}

TEST(EventIndex, EqualTimestampsKeepStableOrder)
{
    EventIndex index;
    index.merge({ rec(1, 100, "a"), rec(2, 100, "b"), rec(3, 100, "c") });
    ASSERT_EQ(index.size(), 3u);
    EXPECT_EQ(index.events()[0].appName, "a");
    EXPECT_EQ(index.events()[1].appName, "b");
    EXPECT_EQ(index.events()[2].appName, "c");
}

TEST(EventIndex, RevisionChangesOnMergeAndClear)
{
    EventIndex index;
    const auto r0 = index.revision();
    index.merge({ rec(1, 1) });
    const auto r1 = index.revision();
    EXPECT_NE(r0, r1);
    index.merge({});
    EXPECT_EQ(index.revision(), r1);
    index.clear();
    EXPECT_NE(index.revision(), r1);
    EXPECT_TRUE(index.empty());
}

TEST(EventIndex, RangeQueryMatchesLinearScan)
{
    std::mt19937 rng(1234);
    std::uniform_int_distribution<int64_t> ts(0, 100'000);
    std::vector<EventRecord> records;
    for (int64_t i = 0; i < 500; ++i)
        records.push_back(rec(i, ts(rng)));

    EventIndex index;
    index.merge(records);
    const auto& ev = index.events();
    for (std::size_t i = 1; i < ev.size(); ++i)
        ASSERT_LE(ev[i - 1].timestamp, ev[i].timestamp);

    for (int q = 0; q < 200; ++q)
    {
        int64_t a = ts(rng), b = ts(rng);
        if (a > b) std::swap(a, b);

        std::size_t first = ev.size(), last = 0;
        for (std::size_t i = 0; i < ev.size(); ++i)
        {
            if (ev[i].timestamp >= a && ev[i].timestamp <= b)
            {
                first = std::min(first, i);
                last = i + 1;
            }
        }
        const IndexRange r = index.rangeQuery(double(a), double(b));
        if (first == ev.size())
        {
            // nothing inside: at most the preceding event
            std::size_t before = 0;
            while (before < ev.size() && ev[before].timestamp < a) ++before;
            if (before == 0)
                EXPECT_TRUE(r.empty());
            else
                EXPECT_EQ(r.first, before - 1);
            continue;
        }
        EXPECT_EQ(r.first, first > 0 ? first - 1 : 0);
        EXPECT_EQ(r.last, last);
    }
}
