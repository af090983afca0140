#pragma once
#include "activity_bars.hpp"
#include "density_planner.hpp"
#include "event_index.hpp"
#include "fetch_scheduler.hpp"
#include "image_cache.hpp"
#include "record_store.hpp"
#include "request_queue.hpp"
#include "task_scheduler.hpp"
#include "thumbnail_loader.hpp"
#include "viewport_controller.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

/// @brief EngineOptions: every tunable of the engine, filled from the config file.
struct EngineOptions
{
    ControllerOptions viewport{};
    DensityRules      density{};
    BarStyle          bars{};
    FetchOptions      fetch{};
    RetryPolicy       retry{};
    std::size_t cacheCapacity = kImageCacheCapacity;
    std::size_t maxConcurrent = 3;
    std::size_t maxPending = 800;
};

/// @brief FramePlan: what the renderer draws for the current inputs.
struct FramePlan
{
    int64_t tickIntervalMs = 0;
    IndexRange visible{};
    std::vector<ActivityBar> bars;
    std::vector<NodePlan> nodes;
};

/// @brief TimelineEngine: the non-visual part of the timeline, driven from the UI thread.
class TimelineEngine : public ViewportObserver
{
public:
    TimelineEngine(RecordStore& store, TaskScheduler& scheduler, MsClock wallClock = wallNowMs, EngineOptions options = {});
    ~TimelineEngine() override;
    TimelineEngine(const TimelineEngine&) = delete;
    TimelineEngine& operator=(const TimelineEngine&) = delete;

    void start();

    // ---- host inputs ----
    void setJumpTimestamp(double timeMs, uint64_t requestId);
    void setHighlightedEventId(std::optional<int64_t> id);
    // A different token than the last one resets the index and refetches
    void setRefreshKey(uint64_t token);

    // Recomputed only when the index revision, viewport or highlight changed
    const FramePlan& plan();
    bool planDirty() const;
    uint64_t planBuilds() const { return _planBuilds; }

    // Mounts the thumbnails of the planned image nodes, unmounts the rest
    void syncThumbnails();
    const std::string* thumbnail(const EventRecord& e);

    // ---- ViewportObserver ----
    void viewportChanged(const ViewportState& vp) override;
    void epochChanged(uint64_t epoch) override;
    void interactionStarted() override;

    ViewportController& controller() { return _controller; }
    const ViewportController& controller() const { return _controller; }
    EventIndex& index() { return _index; }
    const EventIndex& index() const { return _index; }
    FetchScheduler& fetcher() { return _fetch; }
    RequestQueue& queue() { return _queue; }
    ImageCache& cache() { return _cache; }
    ThumbnailLoader& loader() { return _loader; }
    const DensityPlanner& planner() const { return _planner; }
    const EngineOptions& options() const { return _options; }
    std::optional<int64_t> highlightedEventId() const { return _highlighted; }

private:
    EngineOptions      _options;
    TaskScheduler&     _scheduler;
    EventIndex         _index;
    RequestQueue       _queue;
    ImageCache         _cache;
    ThumbnailLoader    _loader;
    ViewportController _controller;
    FetchScheduler     _fetch;
    DensityPlanner     _planner;

    std::optional<int64_t>  _highlighted;
    std::optional<uint64_t> _refreshKey;

    // dirty tracking
    FramePlan _plan;
    bool      _dirty;
    uint64_t  _planRevision;
    ViewportState _planViewport;
    std::optional<int64_t> _planHighlighted;
    uint64_t  _planBuilds;
};
