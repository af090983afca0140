#include "fetch_scheduler.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <utility>

// double -> ms without leaving int64 range
static int64_t saturatingMs(double v)
{
    constexpr double kLimit = 9.0e18;
    return int64_t(std::clamp(v, -kLimit, kLimit));
}

FetchScheduler::FetchScheduler(ViewportController& controller, RecordStore& store, EventIndex& index, TaskScheduler& scheduler, FetchOptions options)
    : _controller{ controller }
    , _store{ store }
    , _index{ index }
    , _scheduler{ scheduler }
    , _options{ options }
    , _debouncer{ scheduler, options.debounceMs }
    , _throttler{ scheduler, options.throttleMs }
    , _refreshTimer{ 0 }
    , _resetGeneration{ 0 }
    , _issued{ 0 }
    , _failed{ 0 }
    , _self{ std::make_shared<FetchScheduler*>(this) }
{
    _controller.addObserver(this);
}

FetchScheduler::~FetchScheduler()
{
    _controller.removeObserver(this);
    _scheduler.cancel(_refreshTimer);
    _debouncer.cancel();
}

void FetchScheduler::start()
{
    queryCurrent();
    _scheduler.cancel(_refreshTimer);
    _refreshTimer = _scheduler.scheduleRepeating(_options.refreshIntervalMs, [this]()
    {
        if (_controller.isDragging() || _controller.isFollowingNow())
            return;
        _debouncer.submit([this]() { queryCurrent(); });
    });
}

void FetchScheduler::query(double centerTime, double zoom, double width)
{
    if (width <= 0.0 || zoom <= 0.0)
        return;

    const double span = width / zoom;
    const int64_t startMs = saturatingMs(std::floor(centerTime - span));
    const int64_t endMs = saturatingMs(std::ceil(centerTime + span));

    ++_issued;
    const uint64_t gen = _resetGeneration;
    std::weak_ptr<FetchScheduler*> weak = _self;
    _store.queryTimeline(startMs, endMs, [weak, gen](QueryResult result)
    {
        if (auto self = weak.lock())
            (*self)->onResult(gen, std::move(result));
    });
}

void FetchScheduler::forceRefresh()
{
    ++_resetGeneration;
    _debouncer.cancel();
    _throttler.reset();
    _index.clear();
    _controller.invalidate();
    queryCurrent();
}

void FetchScheduler::viewportChanged(const ViewportState& vp)
{
    if (vp.followingNow)
    {
        _debouncer.cancel();
        _throttler.submit([this]() { queryCurrent(); });
        return;
    }
    _debouncer.submit([this]() { queryCurrent(); });
}

void FetchScheduler::queryCurrent()
{
    const ViewportState& vp = _controller.viewport();
    query(vp.centerTime, vp.zoom, vp.width);
}

void FetchScheduler::onResult(uint64_t resetGeneration, QueryResult result)
{
    // issued before the last forced refresh: may resurrect deleted records
    if (resetGeneration != _resetGeneration)
        return;

    if (!result.ok)
    {
        ++_failed;
        std::cerr << "[timeline] query failed: " << result.error << "\n";
        return;
    }

    const std::size_t added = _index.merge(std::move(result.records));
    if (added > 0)
        std::cerr << "[timeline] +" << added << " records (" << _index.size() << " indexed)\n";
}
