#include "request_queue.hpp"

#include <algorithm>
#include <utility>

RequestQueue::RequestQueue(std::size_t maxConcurrent, std::size_t maxPending)
    : _maxConcurrent{ std::max<std::size_t>(1, maxConcurrent) }
    , _maxPending{ std::max<std::size_t>(1, maxPending) }
    , _running{ 0 }
    , _queue{}
    , _pendingByKey{}
    , _runningByKey{}
{
}

void RequestQueue::enqueue(const std::string& key, Priority priority, Job job, Done done)
{
    if (!key.empty())
    {
        EntryPtr existing;
        if (auto it = _pendingByKey.find(key); it != _pendingByKey.end())
            existing = it->second;
        else if (auto rt = _runningByKey.find(key); rt != _runningByKey.end())
            existing = rt->second;

        if (existing)
        {
            if (priority == Priority::High && existing->priority != Priority::High)
            {
                existing->priority = Priority::High;
                auto qt = std::find(_queue.begin(), _queue.end(), existing);
                if (qt != _queue.end())
                {
                    _queue.erase(qt);
                    _queue.push_front(existing);
                }
            }
            if (done)
                existing->waiters.push_back(std::move(done));
            return;
        }
    }

    auto entry = std::make_shared<Entry>();
    entry->key = key;
    entry->priority = priority;
    entry->job = std::move(job);
    if (done)
        entry->waiters.push_back(std::move(done));

    if (_queue.size() >= _maxPending)
    {
        // high priority sheds the newest waiting request, normal the oldest
        EntryPtr dropped;
        if (priority == Priority::High)
        {
            dropped = _queue.back();
            _queue.pop_back();
        }
        else
        {
            dropped = _queue.front();
            _queue.pop_front();
        }
        cancelEntry(dropped);
    }

    if (priority == Priority::High)
        _queue.push_front(entry);
    else
        _queue.push_back(entry);
    if (!key.empty())
        _pendingByKey[key] = entry;

    processNext();
}

bool RequestQueue::cancelByKey(const std::string& key)
{
    if (key.empty())
        return false;

    EntryPtr entry;
    if (auto it = _pendingByKey.find(key); it != _pendingByKey.end())
        entry = it->second;
    else if (auto rt = _runningByKey.find(key); rt != _runningByKey.end())
        entry = rt->second;
    if (!entry)
        return false;

    auto qt = std::find(_queue.begin(), _queue.end(), entry);
    if (qt != _queue.end())
        _queue.erase(qt);
    cancelEntry(entry);
    return true;
}

void RequestQueue::clearPending()
{
    std::deque<EntryPtr> dropped;
    dropped.swap(_queue);
    _pendingByKey.clear();
    for (const auto& entry : dropped)
        cancelEntry(entry);
}

void RequestQueue::settle(const EntryPtr& entry, ThumbnailResult result)
{
    if (entry->settled)
        return;
    entry->settled = true;
    // waiters may enqueue again; detach them first
    std::vector<Done> waiters;
    waiters.swap(entry->waiters);
    for (auto& w : waiters)
        w(result);
}

void RequestQueue::forgetKey(const EntryPtr& entry)
{
    if (entry->key.empty())
        return;
    if (auto it = _pendingByKey.find(entry->key); it != _pendingByKey.end() && it->second == entry)
        _pendingByKey.erase(it);
    if (auto rt = _runningByKey.find(entry->key); rt != _runningByKey.end() && rt->second == entry)
        _runningByKey.erase(rt);
}

void RequestQueue::cancelEntry(const EntryPtr& entry)
{
    entry->cancelled = true;
    forgetKey(entry);
    settle(entry, ThumbnailResult::cancelled());
}

void RequestQueue::start(const EntryPtr& entry)
{
    ++_running;
    if (!entry->key.empty())
    {
        if (auto it = _pendingByKey.find(entry->key); it != _pendingByKey.end() && it->second == entry)
            _pendingByKey.erase(it);
        _runningByKey[entry->key] = entry;
    }

    // the concurrency slot stays taken until the job reports back, even when cancelled meanwhile
    Job job = std::move(entry->job);
    job([this, e = entry](ThumbnailResult result)
    {
        if (e->finished)
            return;
        e->finished = true;
        --_running;
        forgetKey(e);
        if (!e->cancelled)
            settle(e, std::move(result));
        processNext();
    });
}

void RequestQueue::processNext()
{
    while (_running < _maxConcurrent && !_queue.empty())
    {
        EntryPtr entry = _queue.front();
        _queue.pop_front();
        if (entry->cancelled)
            continue;
        start(entry);
    }
}
