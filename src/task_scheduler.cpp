#include "task_scheduler.hpp"

#include <algorithm>
#include <chrono>
#include <utility>

int64_t steadyNowMs()
{
    using namespace std::chrono;
    return duration_cast<milliseconds>(steady_clock::now().time_since_epoch()).count();
}

int64_t wallNowMs()
{
    using namespace std::chrono;
    return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

// ===== TaskScheduler =====
TaskScheduler::TaskScheduler(MsClock clock)
    : _clock{ std::move(clock) }
    , _nextId{ 1 }
    , _timers{}
    , _frameTasks{}
{
}

TaskScheduler::TaskId TaskScheduler::schedule(int64_t delayMs, Task task)
{
    const TaskId id = _nextId++;
    _timers.emplace(id, Timer{ now() + std::max<int64_t>(0, delayMs), 0, std::move(task) });
    return id;
}

TaskScheduler::TaskId TaskScheduler::scheduleRepeating(int64_t intervalMs, Task task)
{
    const TaskId id = _nextId++;
    const int64_t interval = std::max<int64_t>(1, intervalMs);
    _timers.emplace(id, Timer{ now() + interval, interval, std::move(task) });
    return id;
}

TaskScheduler::TaskId TaskScheduler::addFrameTask(Task task)
{
    const TaskId id = _nextId++;
    _frameTasks.emplace(id, std::move(task));
    return id;
}

bool TaskScheduler::cancel(TaskId id)
{
    if (id == 0)
        return false;
    return _timers.erase(id) > 0 || _frameTasks.erase(id) > 0;
}

bool TaskScheduler::isScheduled(TaskId id) const
{
    return _timers.contains(id) || _frameTasks.contains(id);
}

void TaskScheduler::tick()
{
    // snapshot ids: tasks are free to add/cancel while we iterate
    std::vector<TaskId> frameIds;
    frameIds.reserve(_frameTasks.size());
    for (const auto& kv : _frameTasks)
        frameIds.push_back(kv.first);
    for (TaskId id : frameIds)
    {
        auto it = _frameTasks.find(id);
        if (it == _frameTasks.end())
            continue;
        Task copy = it->second;
        copy();
    }

    const int64_t t = now();
    // timers run in due order; ids break ties so equal deadlines keep submission order
    for (;;)
    {
        auto best = _timers.end();
        for (auto it = _timers.begin(); it != _timers.end(); ++it)
        {
            if (it->second.dueMs > t)
                continue;
            if (best == _timers.end() || it->second.dueMs < best->second.dueMs)
                best = it;
        }
        if (best == _timers.end())
            break;

        Task task = best->second.task;
        if (best->second.intervalMs > 0)
        {
            // catch up without replaying every missed interval
            while (best->second.dueMs <= t)
                best->second.dueMs += best->second.intervalMs;
        }
        else
        {
            _timers.erase(best);
        }
        task();
    }
}

// ===== Debouncer =====
Debouncer::Debouncer(TaskScheduler& scheduler, int64_t waitMs)
    : _scheduler{ scheduler }
    , _waitMs{ waitMs }
    , _timer{ 0 }
{
}

Debouncer::~Debouncer()
{
    cancel();
}

void Debouncer::submit(TaskScheduler::Task call)
{
    _scheduler.cancel(_timer);
    _timer = _scheduler.schedule(_waitMs, [this, call = std::move(call)]()
    {
        _timer = 0;
        call();
    });
}

void Debouncer::cancel()
{
    _scheduler.cancel(_timer);
    _timer = 0;
}

bool Debouncer::pending() const
{
    return _timer != 0 && _scheduler.isScheduled(_timer);
}

// ===== Throttler =====
Throttler::Throttler(TaskScheduler& scheduler, int64_t limitMs)
    : _scheduler{ scheduler }
    , _limitMs{ limitMs }
    , _lastRunMs{ 0 }
    , _hasRun{ false }
{
}

bool Throttler::submit(const TaskScheduler::Task& call)
{
    const int64_t t = _scheduler.now();
    if (_hasRun && t - _lastRunMs < _limitMs)
        return false;
    _hasRun = true;
    _lastRunMs = t;
    call();
    return true;
}
