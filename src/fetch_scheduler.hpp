#pragma once
#include "event_index.hpp"
#include "record_store.hpp"
#include "task_scheduler.hpp"
#include "viewport_controller.hpp"

#include <cstdint>
#include <memory>

struct FetchOptions
{
    int64_t debounceMs = 500;
    int64_t throttleMs = 1000;        // while following now
    int64_t refreshIntervalMs = 5000; // periodic refetch when idle
};

/// @brief FetchScheduler: keeps the index filled around the viewport.
/// Queries twice the visible span, centered on the viewport.
class FetchScheduler : public ViewportObserver
{
public:
    FetchScheduler(ViewportController& controller, RecordStore& store, EventIndex& index, TaskScheduler& scheduler, FetchOptions options = {});
    ~FetchScheduler() override;
    FetchScheduler(const FetchScheduler&) = delete;
    FetchScheduler& operator=(const FetchScheduler&) = delete;

    // Issues the first query and arms the periodic refresh
    void start();

    // Immediate query of [center - width/zoom, center + width/zoom]. No-op when width <= 0.
    void query(double centerTime, double zoom, double width);

    // Drops the index and anything in flight, then refetches now
    void forceRefresh();

    void viewportChanged(const ViewportState& vp) override;

    uint64_t queriesIssued() const { return _issued; }
    uint64_t queriesFailed() const { return _failed; }
    bool debouncePending() const { return _debouncer.pending(); }

private:
    void queryCurrent();
    void onResult(uint64_t resetGeneration, QueryResult result);

    ViewportController& _controller;
    RecordStore&        _store;
    EventIndex&         _index;
    TaskScheduler&      _scheduler;
    FetchOptions        _options;
    Debouncer           _debouncer;
    Throttler           _throttler;
    TaskScheduler::TaskId _refreshTimer;
    uint64_t _resetGeneration;
    uint64_t _issued;
    uint64_t _failed;
    // store callbacks hold a weak reference to it
    std::shared_ptr<FetchScheduler*> _self;
};
