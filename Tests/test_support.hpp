#pragma once
#include "record_store.hpp"
#include "task_scheduler.hpp"

#include <cstdint>
#include <deque>
#include <memory>
#include <utility>
#include <vector>

// Hand-driven time source shared by a scheduler and the code under test
struct ManualClock
{
    std::shared_ptr<int64_t> now = std::make_shared<int64_t>(1'000'000);

    MsClock clock() const
    {
        auto n = now;
        return [n]() { return *n; };
    }
    void advance(int64_t ms) { *now += ms; }
};

// Moves the clock in small steps, ticking the scheduler at each one
inline void runFor(TaskScheduler& scheduler, ManualClock& clock, int64_t ms, int64_t stepMs = 10)
{
    for (int64_t t = 0; t < ms; t += stepMs)
    {
        clock.advance(stepMs);
        scheduler.tick();
    }
}

// Store whose answers are released by the test
class FakeStore : public RecordStore
{
public:
    struct Query
    {
        int64_t start;
        int64_t end;
        QueryCallback done;
    };
    struct Fetch
    {
        ThumbnailRef ref;
        ThumbnailCallback done;
    };

    void queryTimeline(int64_t startTimeMs, int64_t endTimeMs, QueryCallback done) override
    {
        queries.push_back({ startTimeMs, endTimeMs, std::move(done) });
    }

    void fetchThumbnail(const ThumbnailRef& ref, ThumbnailCallback done) override
    {
        ++fetchCount;
        fetches.push_back({ ref, std::move(done) });
    }

    void answerQuery(std::size_t i, QueryResult result)
    {
        auto cb = std::move(queries.at(i).done);
        cb(std::move(result));
    }

    void answerNextFetch(ThumbnailResult result)
    {
        Fetch f = std::move(fetches.front());
        fetches.pop_front();
        f.done(std::move(result));
    }

    static ThumbnailResult ok(std::string data)
    {
        ThumbnailResult r;
        r.status = ThumbnailResult::Status::Ok;
        r.mimeType = "image/png";
        r.base64Data = std::move(data);
        return r;
    }

    std::vector<Query> queries;
    std::deque<Fetch> fetches;
    int fetchCount = 0;
};
