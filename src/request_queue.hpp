#pragma once
#include "record_store.hpp"

#include <cstddef>
#include <deque>
#include <functional>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

/// @brief RequestQueue: bounded-concurrency FIFO admission for thumbnail fetches.
/// Requests are keyed: a second request for a pending/running key joins the first one.
class RequestQueue
{
public:
    enum class Priority { Normal, High };
    using Done = std::function<void(ThumbnailResult)>;
    // Starts the work; must call the given completion exactly once
    using Job = std::function<void(Done)>;

    explicit RequestQueue(std::size_t maxConcurrent = 3, std::size_t maxPending = 800);
    RequestQueue(const RequestQueue&) = delete;
    RequestQueue& operator=(const RequestQueue&) = delete;

    void enqueue(const std::string& key, Priority priority, Job job, Done done);

    // Settles the key's request as cancelled, pending or running. Returns false if unknown.
    bool cancelByKey(const std::string& key);
    // Cancels everything not yet started
    void clearPending();

    std::size_t running() const { return _running; }
    std::size_t pending() const { return _queue.size(); }
    bool isPending(const std::string& key) const { return _pendingByKey.contains(key); }
    bool isRunning(const std::string& key) const { return _runningByKey.contains(key); }

private:
    struct Entry
    {
        std::string key;
        Priority priority = Priority::Normal;
        Job job;
        std::vector<Done> waiters;
        bool cancelled = false;
        bool settled = false;
        bool finished = false;
    };
    using EntryPtr = std::shared_ptr<Entry>;

    void settle(const EntryPtr& entry, ThumbnailResult result);
    void cancelEntry(const EntryPtr& entry);
    void forgetKey(const EntryPtr& entry);
    void start(const EntryPtr& entry);
    void processNext();

    std::size_t _maxConcurrent;
    std::size_t _maxPending;
    std::size_t _running;
    std::deque<EntryPtr> _queue;
    std::unordered_map<std::string, EntryPtr> _pendingByKey;
    std::unordered_map<std::string, EntryPtr> _runningByKey;
};
