#pragma once
#include "geometry.hpp"
#include "model.hpp"
#include "task_scheduler.hpp"

#include <cstdint>
#include <vector>

/// @brief ViewportObserver: notified synchronously on every controller mutation.
class ViewportObserver
{
public:
    virtual ~ViewportObserver() = default;

    virtual void viewportChanged(const ViewportState& vp) { (void)vp; }
    // the viewport settled somewhere new: work tagged with an older epoch is stale
    virtual void epochChanged(uint64_t epoch) { (void)epoch; }
    // user took over (drag, wheel, jump, follow-now): queued thumbnail requests are stale
    virtual void interactionStarted() {}
};

struct ControllerOptions
{
    double  initialZoom = 0.001;
    double  clearZoom = 0.005;   // minimum zoom after a jump
    double  zoomStep = 1.2;
    int64_t wheelIdleMs = 160;
    double  clickSlopPx = 3.0;   // pointer travel below which a press is a click
};

/// @brief ViewportController: owns the viewport state, the epoch and the interaction mode.
class ViewportController
{
public:
    enum class Mode { Idle, Dragging, FollowingNow };

    // wallClock gives absolute ms since epoch (follow-now target)
    explicit ViewportController(TaskScheduler& scheduler, MsClock wallClock = wallNowMs, ControllerOptions options = {});
    ~ViewportController();
    ViewportController(const ViewportController&) = delete;
    ViewportController& operator=(const ViewportController&) = delete;

    void addObserver(ViewportObserver* observer);
    void removeObserver(ViewportObserver* observer);

    // ---- drag ----
    void pointerDown(double x);
    void pointerMove(double x);
    // Back to idle. Returns true when the press never moved past the click slop.
    bool pointerUp();
    void pointerLeave() { pointerUp(); }

    // wheelSteps > 0 zooms in around cursorX, < 0 zooms out
    void wheel(double cursorX, double wheelSteps);

    // Jumps when requestId differs from the last one seen
    bool jumpTo(double timeMs, uint64_t requestId);
    void startFollowNow();
    void stopFollowNow();

    void setWidth(double widthPx);
    void setCenter(double timeMs);

    // Clears queued thumbnail work and advances the epoch (forced refresh)
    void invalidate();
    void bumpEpoch();

    const ViewportState& viewport() const { return _vp; }
    Geometry geometry() const { return Geometry{ _vp }; }
    Mode mode() const { return _mode; }
    uint64_t epoch() const { return _epoch; }
    bool isDragging() const { return _mode == Mode::Dragging; }
    bool isFollowingNow() const { return _mode == Mode::FollowingNow; }
    const ControllerOptions& options() const { return _options; }

private:
    void leaveFollowNow();
    void notifyViewport();
    void notifyInteraction();

    TaskScheduler&    _scheduler;
    MsClock           _wallClock;
    ControllerOptions _options;
    ViewportState     _vp;
    Mode              _mode;
    uint64_t          _epoch;

    double _dragLastX;
    double _dragTravel;
    bool   _pressed;

    TaskScheduler::TaskId _followTask;
    TaskScheduler::TaskId _wheelIdleTimer;
    bool     _hasRequestId;
    uint64_t _lastRequestId;

    std::vector<ViewportObserver*> _observers;
};
