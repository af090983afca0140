#include <gtest/gtest.h>

#include "fetch_scheduler.hpp"
#include "test_support.hpp"

#include <cmath>
#include <limits>
#include <memory>

namespace
{
    EventRecord rec(int64_t id, int64_t ts)
    {
        EventRecord e;
        e.id = id;
        e.timestamp = ts;
        e.appName = "app";
        return e;
    }

    QueryResult okResult(std::vector<EventRecord> records)
    {
        QueryResult r;
        r.ok = true;
        r.records = std::move(records);
        return r;
    }

    ControllerOptions exactZoom()
    {
        ControllerOptions o;
        o.initialZoom = 0.015625; // 1000 px cover 64 s
        return o;
    }

    struct FetchFixture : public ::testing::Test
    {
        ManualClock steady;
        ManualClock wall;
        TaskScheduler scheduler{ steady.clock() };
        ViewportController controller{ scheduler, wall.clock(), exactZoom() };
        EventIndex index;
        FakeStore store;

        void SetUp() override
        {
            controller.setCenter(1'000'000.0);
            controller.setWidth(1000.0);
        }
    };
}

TEST_F(FetchFixture, StartQueriesTwiceTheVisibleSpan)
{
    FetchScheduler fetcher(controller, store, index, scheduler);
    fetcher.start();
    ASSERT_EQ(store.queries.size(), 1u);
    EXPECT_EQ(store.queries[0].start, 1'000'000 - 64'000);
    EXPECT_EQ(store.queries[0].end, 1'000'000 + 64'000);
    EXPECT_EQ(fetcher.queriesIssued(), 1u);

    store.answerQuery(0, okResult({ rec(1, 990'000), rec(2, 1'010'000) }));
    EXPECT_EQ(index.size(), 2u);
}

TEST_F(FetchFixture, ZeroWidthDoesNotQuery)
{
    FetchScheduler fetcher(controller, store, index, scheduler);
    fetcher.query(1000.0, 0.01, 0.0);
    EXPECT_TRUE(store.queries.empty());
}

TEST_F(FetchFixture, JumpPastTheEndOfTimeStillQueriesAValidRange)
{
    FetchScheduler fetcher(controller, store, index, scheduler);
    controller.jumpTo(double(std::numeric_limits<int64_t>::max()), 1);
    runFor(scheduler, steady, 600);

    ASSERT_EQ(store.queries.size(), 1u);
    const int64_t end = int64_t(kMaxTimeMs);
    EXPECT_EQ(store.queries[0].start, end - 64'000);
    EXPECT_EQ(store.queries[0].end, end + 64'000);
}

TEST_F(FetchFixture, HugeCenterSaturatesQueryBounds)
{
    FetchScheduler fetcher(controller, store, index, scheduler);
    fetcher.query(1e30, 0.01, 1000.0);
    ASSERT_EQ(store.queries.size(), 1u);
    EXPECT_GT(store.queries[0].start, 0);
    EXPECT_LE(store.queries[0].start, store.queries[0].end);
}

TEST_F(FetchFixture, DragIsDebounced)
{
    FetchScheduler fetcher(controller, store, index, scheduler);
    controller.pointerDown(500.0);
    controller.pointerMove(510.0);
    runFor(scheduler, steady, 200);
    controller.pointerMove(500.0 + 64.0);
    controller.pointerUp();
    EXPECT_TRUE(store.queries.empty());
    EXPECT_TRUE(fetcher.debouncePending());

    runFor(scheduler, steady, 490);
    EXPECT_TRUE(store.queries.empty());
    runFor(scheduler, steady, 10);
    ASSERT_EQ(store.queries.size(), 1u);
    // 64 px left-drag at 1/64 px per ms: 4 s back
    EXPECT_EQ(store.queries[0].start, 1'000'000 - 4'096 - 64'000);
}

TEST_F(FetchFixture, FollowNowIsThrottled)
{
    FetchScheduler fetcher(controller, store, index, scheduler);
    controller.startFollowNow();
    EXPECT_EQ(store.queries.size(), 1u);

    // the follow task publishes a viewport every frame
    for (int i = 0; i < 300; ++i)
    {
        steady.advance(10);
        wall.advance(10);
        scheduler.tick();
    }
    EXPECT_EQ(store.queries.size(), 4u);
    EXPECT_FALSE(fetcher.debouncePending());
}

TEST_F(FetchFixture, PeriodicRefreshWhenIdle)
{
    FetchScheduler fetcher(controller, store, index, scheduler);
    fetcher.start();
    runFor(scheduler, steady, 5490);
    EXPECT_EQ(store.queries.size(), 1u);
    runFor(scheduler, steady, 10);
    EXPECT_EQ(store.queries.size(), 2u);
}

TEST_F(FetchFixture, NoRefreshWhileDragging)
{
    FetchScheduler fetcher(controller, store, index, scheduler);
    fetcher.start();
    controller.pointerDown(100.0);
    runFor(scheduler, steady, 12000);
    EXPECT_EQ(store.queries.size(), 1u);
}

TEST_F(FetchFixture, FailedQueryLeavesIndexAlone)
{
    FetchScheduler fetcher(controller, store, index, scheduler);
    index.merge({ rec(1, 1'000'000) });
    fetcher.start();

    QueryResult failed;
    failed.error = "disk on fire";
    store.answerQuery(0, failed);
    EXPECT_EQ(fetcher.queriesFailed(), 1u);
    EXPECT_EQ(index.size(), 1u);
}

TEST_F(FetchFixture, ForceRefreshDropsStaleResponses)
{
    FetchScheduler fetcher(controller, store, index, scheduler);
    fetcher.start();
    index.merge({ rec(1, 1'000'000) });

    const uint64_t epoch = controller.epoch();
    fetcher.forceRefresh();
    EXPECT_TRUE(index.empty());
    EXPECT_EQ(controller.epoch(), epoch + 1);
    ASSERT_EQ(store.queries.size(), 2u);

    // answered after the refresh: would resurrect a deleted record
    store.answerQuery(0, okResult({ rec(1, 1'000'000) }));
    EXPECT_TRUE(index.empty());

    store.answerQuery(1, okResult({ rec(2, 1'000'500) }));
    ASSERT_EQ(index.size(), 1u);
    EXPECT_EQ(index.events()[0].id, 2);
}

TEST_F(FetchFixture, CallbacksAfterDestructionAreIgnored)
{
    auto fetcher = std::make_unique<FetchScheduler>(controller, store, index, scheduler);
    fetcher->start();
    fetcher.reset();

    store.answerQuery(0, okResult({ rec(1, 1'000'000) }));
    EXPECT_TRUE(index.empty());

    // no longer observing the controller
    controller.setCenter(0.0);
    runFor(scheduler, steady, 6000);
    EXPECT_EQ(store.queries.size(), 1u);
}
