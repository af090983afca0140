#pragma once
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <vector>

// Monotonic ms clock. Production passes a steady_clock reader, tests a manual one.
using MsClock = std::function<int64_t()>;

int64_t steadyNowMs();
int64_t wallNowMs();

/// @brief TaskScheduler: timers and per-frame tasks driven from the UI thread.
/// Nothing runs on its own: tick() executes whatever is due, once per frame.
class TaskScheduler
{
public:
    using TaskId = uint64_t;
    using Task = std::function<void()>;

    explicit TaskScheduler(MsClock clock = steadyNowMs);
    TaskScheduler(const TaskScheduler&) = delete;
    TaskScheduler& operator=(const TaskScheduler&) = delete;

    // One-shot after delayMs
    TaskId schedule(int64_t delayMs, Task task);
    // Every intervalMs, first run one interval from now
    TaskId scheduleRepeating(int64_t intervalMs, Task task);
    // Runs on every tick() until cancelled
    TaskId addFrameTask(Task task);

    bool cancel(TaskId id);
    bool isScheduled(TaskId id) const;

    // Run frame tasks, then every timer due at now(). Tasks may schedule or cancel others.
    void tick();

    int64_t now() const { return _clock(); }
    std::size_t pendingTimers() const { return _timers.size(); }

private:
    struct Timer
    {
        int64_t dueMs;
        int64_t intervalMs; // 0 = one-shot
        Task    task;
    };

    MsClock _clock;
    TaskId  _nextId;
    std::map<TaskId, Timer> _timers;
    std::map<TaskId, Task>  _frameTasks;
};

/// @brief Debouncer: runs the last submitted call after a quiet period.
class Debouncer
{
public:
    Debouncer(TaskScheduler& scheduler, int64_t waitMs);
    ~Debouncer();

    void submit(TaskScheduler::Task call);
    void cancel();
    bool pending() const;

private:
    TaskScheduler& _scheduler;
    int64_t _waitMs;
    TaskScheduler::TaskId _timer;
};

/// @brief Throttler: leading edge only: runs at most once per limit, drops the rest.
class Throttler
{
public:
    Throttler(TaskScheduler& scheduler, int64_t limitMs);

    bool submit(const TaskScheduler::Task& call);
    void reset() { _hasRun = false; }

private:
    TaskScheduler& _scheduler;
    int64_t _limitMs;
    int64_t _lastRunMs;
    bool    _hasRun;
};
