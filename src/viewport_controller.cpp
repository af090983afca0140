#include "viewport_controller.hpp"

#include <algorithm>
#include <cmath>
#include <utility>

ViewportController::ViewportController(TaskScheduler& scheduler, MsClock wallClock, ControllerOptions options)
    : _scheduler{ scheduler }
    , _wallClock{ std::move(wallClock) }
    , _options{ options }
    , _vp{}
    , _mode{ Mode::Idle }
    , _epoch{ 0 }
    , _dragLastX{ 0.0 }
    , _dragTravel{ 0.0 }
    , _pressed{ false }
    , _followTask{ 0 }
    , _wheelIdleTimer{ 0 }
    , _hasRequestId{ false }
    , _lastRequestId{ 0 }
    , _observers{}
{
    _vp.centerTime = double(_wallClock());
    _vp.zoom = clampZoom(_options.initialZoom);
}

ViewportController::~ViewportController()
{
    _scheduler.cancel(_followTask);
    _scheduler.cancel(_wheelIdleTimer);
}

void ViewportController::addObserver(ViewportObserver* observer)
{
    if (observer && std::find(_observers.begin(), _observers.end(), observer) == _observers.end())
        _observers.push_back(observer);
}

void ViewportController::removeObserver(ViewportObserver* observer)
{
    std::erase(_observers, observer);
}

void ViewportController::pointerDown(double x)
{
    leaveFollowNow();
    _mode = Mode::Dragging;
    _pressed = true;
    _dragLastX = x;
    _dragTravel = 0.0;
    notifyInteraction();
}

void ViewportController::pointerMove(double x)
{
    if (_mode != Mode::Dragging)
        return;
    const double dx = x - _dragLastX;
    _dragLastX = x;
    if (dx == 0.0)
        return;
    _dragTravel += std::abs(dx);
    _vp.centerTime = clampTime(_vp.centerTime - dx / _vp.zoom);
    notifyViewport();
}

bool ViewportController::pointerUp()
{
    if (!_pressed)
        return false;
    _pressed = false;
    const bool click = _dragTravel < _options.clickSlopPx;
    if (_mode == Mode::Dragging)
        _mode = Mode::Idle;
    bumpEpoch();
    return click;
}

void ViewportController::wheel(double cursorX, double wheelSteps)
{
    if (wheelSteps == 0.0 || _vp.width <= 0.0)
        return;

    leaveFollowNow();
    notifyInteraction();

    const double timeAtCursor = geometry().toTime(cursorX);
    const double factor = wheelSteps > 0.0 ? _options.zoomStep : 1.0 / _options.zoomStep;
    const double newZoom = clampZoom(_vp.zoom * factor);

    _vp.zoom = newZoom;
    _vp.centerTime = clampTime(timeAtCursor - (cursorX - _vp.width / 2.0) / newZoom);
    notifyViewport();

    // epoch moves once the wheel goes quiet
    _scheduler.cancel(_wheelIdleTimer);
    _wheelIdleTimer = _scheduler.schedule(_options.wheelIdleMs, [this]()
    {
        _wheelIdleTimer = 0;
        bumpEpoch();
    });
}

bool ViewportController::jumpTo(double timeMs, uint64_t requestId)
{
    if (_hasRequestId && requestId == _lastRequestId)
        return false;
    _hasRequestId = true;
    _lastRequestId = requestId;

    leaveFollowNow();
    _vp.centerTime = clampTime(timeMs);
    _vp.zoom = clampZoom(std::max(_vp.zoom, _options.clearZoom));
    notifyInteraction();
    notifyViewport();
    bumpEpoch();
    return true;
}

void ViewportController::startFollowNow()
{
    _scheduler.cancel(_followTask);
    _mode = Mode::FollowingNow;
    _pressed = false;
    _vp.followingNow = true;
    _vp.centerTime = double(_wallClock());
    _vp.zoom = kMaxZoom;
    notifyInteraction();
    notifyViewport();
    bumpEpoch();

    _followTask = _scheduler.addFrameTask([this]()
    {
        _vp.centerTime = double(_wallClock());
        notifyViewport();
    });
}

void ViewportController::stopFollowNow()
{
    if (_mode != Mode::FollowingNow)
        return;
    leaveFollowNow();
    notifyViewport();
}

void ViewportController::setWidth(double widthPx)
{
    widthPx = std::max(0.0, widthPx);
    if (widthPx == _vp.width)
        return;
    _vp.width = widthPx;
    notifyViewport();
}

void ViewportController::setCenter(double timeMs)
{
    _vp.centerTime = clampTime(timeMs);
    notifyViewport();
}

void ViewportController::invalidate()
{
    notifyInteraction();
    bumpEpoch();
}

void ViewportController::bumpEpoch()
{
    ++_epoch;
    // observers may unregister themselves while being notified
    const auto observers = _observers;
    for (auto* o : observers)
        o->epochChanged(_epoch);
}

void ViewportController::leaveFollowNow()
{
    if (_followTask != 0)
    {
        _scheduler.cancel(_followTask);
        _followTask = 0;
    }
    _vp.followingNow = false;
    if (_mode == Mode::FollowingNow)
        _mode = Mode::Idle;
}

void ViewportController::notifyViewport()
{
    const auto observers = _observers;
    for (auto* o : observers)
        o->viewportChanged(_vp);
}

void ViewportController::notifyInteraction()
{
    const auto observers = _observers;
    for (auto* o : observers)
        o->interactionStarted();
}
