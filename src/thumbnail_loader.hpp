#pragma once
#include "image_cache.hpp"
#include "record_store.hpp"
#include "request_queue.hpp"
#include "task_scheduler.hpp"

#include <cstdint>
#include <functional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

/// @brief RetryPolicy: how transient thumbnail failures are retried.
struct RetryPolicy
{
    using Backoff = std::function<int64_t(int attempt, int64_t baseDelayMs)>;

    int     maxAttempts = 5;
    int64_t baseDelayMs = 400;
    int64_t cancelDelayMs = 200; // cancelled while still wanted: try again shortly
    Backoff backoff = linear;

    static int64_t linear(int attempt, int64_t baseDelayMs) { return baseDelayMs * attempt; }

    int64_t delayFor(int attempt) const { return backoff ? backoff(attempt, baseDelayMs) : baseDelayMs; }
};

/// @brief ThumbnailLoader: per-node thumbnail fetch state on top of the shared queue and cache.
/// A node is "mounted" while the renderer wants its image; everything else is cancelled.
class ThumbnailLoader
{
public:
    enum class State { Idle, Loading, RetryWait, Ready, Missing, GaveUp };

    ThumbnailLoader(RecordStore& store, RequestQueue& queue, ImageCache& cache, TaskScheduler& scheduler, RetryPolicy policy = {});
    ~ThumbnailLoader();
    ThumbnailLoader(const ThumbnailLoader&) = delete;
    ThumbnailLoader& operator=(const ThumbnailLoader&) = delete;

    // Mounts the node if needed and starts a fetch when nothing is cached or in flight.
    // Returns the cached data url, or nullptr while it is not available.
    const std::string* request(const std::string& key, const ThumbnailRef& ref);

    // Unmount: cancels the pending fetch and retry timer of the key.
    void release(const std::string& key);

    // Keeps exactly the listed nodes mounted.
    void sync(const std::vector<std::pair<std::string, ThumbnailRef>>& wanted);

    // Viewport settled elsewhere: in-flight work of every node is superseded.
    void onEpochChanged();

    State state(const std::string& key) const;
    int retries(const std::string& key) const;
    std::size_t mounted() const { return _slots.size(); }

private:
    struct Slot
    {
        ThumbnailRef ref;
        State state = State::Idle;
        uint64_t generation = 0;  // completion tag of the request in flight
        int attempt = 0;          // consecutive transient failures
        int retries = 0;          // retry fetches issued
        TaskScheduler::TaskId retryTimer = 0;
    };

    void issue(const std::string& key, Slot& slot);
    void onResult(const std::string& key, uint64_t generation, ThumbnailResult result);
    void scheduleRetry(const std::string& key, Slot& slot, int64_t delayMs);
    void cancelInFlight(const std::string& key, Slot& slot);

    RecordStore&   _store;
    RequestQueue&  _queue;
    ImageCache&    _cache;
    TaskScheduler& _scheduler;
    RetryPolicy    _policy;
    uint64_t       _generation;
    std::unordered_map<std::string, Slot> _slots;
};
