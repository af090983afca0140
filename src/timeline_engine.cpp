#include "timeline_engine.hpp"
#include "time_axis.hpp"

#include <utility>

TimelineEngine::TimelineEngine(RecordStore& store, TaskScheduler& scheduler, MsClock wallClock, EngineOptions options)
    : _options{ std::move(options) }
    , _scheduler{ scheduler }
    , _index{}
    , _queue{ _options.maxConcurrent, _options.maxPending }
    , _cache{ _options.cacheCapacity }
    , _loader{ store, _queue, _cache, scheduler, _options.retry }
    , _controller{ scheduler, std::move(wallClock), _options.viewport }
    , _fetch{ _controller, store, _index, scheduler, _options.fetch }
    , _planner{ _options.density }
    , _highlighted{}
    , _refreshKey{}
    , _plan{}
    , _dirty{ true }
    , _planRevision{ 0 }
    , _planViewport{}
    , _planHighlighted{}
    , _planBuilds{ 0 }
{
    _controller.addObserver(this);
}

TimelineEngine::~TimelineEngine()
{
    _controller.removeObserver(this);
}

void TimelineEngine::start()
{
    _fetch.start();
}

void TimelineEngine::setJumpTimestamp(double timeMs, uint64_t requestId)
{
    _controller.jumpTo(timeMs, requestId);
}

void TimelineEngine::setHighlightedEventId(std::optional<int64_t> id)
{
    if (_highlighted == id)
        return;
    _highlighted = id;
    _dirty = true;
}

void TimelineEngine::setRefreshKey(uint64_t token)
{
    if (!_refreshKey)
    {
        _refreshKey = token;
        return;
    }
    if (*_refreshKey == token)
        return;
    _refreshKey = token;
    _fetch.forceRefresh();
    _dirty = true;
}

bool TimelineEngine::planDirty() const
{
    const ViewportState& vp = _controller.viewport();
    return _dirty
        || _planRevision != _index.revision()
        || _planViewport.centerTime != vp.centerTime
        || _planViewport.zoom != vp.zoom
        || _planViewport.width != vp.width
        || _planHighlighted != _highlighted;
}

const FramePlan& TimelineEngine::plan()
{
    if (!planDirty())
        return _plan;

    const ViewportState& vp = _controller.viewport();
    const Geometry geo{ vp };

    _plan.tickIntervalMs = axis::pickTickInterval(vp.zoom);
    _plan.visible = _index.rangeQuery(geo.visibleStart(), geo.visibleEnd());
    _plan.bars = layoutActivityBars(_index.events(), _plan.visible, geo, _options.bars);
    _plan.nodes = _planner.plan(_index.events(), _plan.visible, geo, _plan.tickIntervalMs, _highlighted);

    _dirty = false;
    _planRevision = _index.revision();
    _planViewport = vp;
    _planHighlighted = _highlighted;
    ++_planBuilds;
    return _plan;
}

void TimelineEngine::syncThumbnails()
{
    const FramePlan& p = plan();
    const auto& events = _index.events();

    std::vector<std::pair<std::string, ThumbnailRef>> wanted;
    wanted.reserve(p.nodes.size());
    for (const auto& node : p.nodes)
    {
        if (!node.showImage || node.index >= events.size())
            continue;
        const EventRecord& e = events[node.index];
        wanted.emplace_back(identityKey(e), thumbnailRef(e));
    }
    _loader.sync(wanted);
}

const std::string* TimelineEngine::thumbnail(const EventRecord& e)
{
    return _loader.request(identityKey(e), thumbnailRef(e));
}

void TimelineEngine::viewportChanged(const ViewportState& vp)
{
    (void)vp;
    _dirty = true;
}

void TimelineEngine::epochChanged(uint64_t epoch)
{
    (void)epoch;
    _loader.onEpochChanged();
}

void TimelineEngine::interactionStarted()
{
    _queue.clearPending();
}
