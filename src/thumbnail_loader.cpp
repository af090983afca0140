#include "thumbnail_loader.hpp"

#include <unordered_set>

ThumbnailLoader::ThumbnailLoader(RecordStore& store, RequestQueue& queue, ImageCache& cache, TaskScheduler& scheduler, RetryPolicy policy)
    : _store{ store }
    , _queue{ queue }
    , _cache{ cache }
    , _scheduler{ scheduler }
    , _policy{ std::move(policy) }
    , _generation{ 0 }
    , _slots{}
{
}

ThumbnailLoader::~ThumbnailLoader()
{
    for (auto& kv : _slots)
        _scheduler.cancel(kv.second.retryTimer);
}

const std::string* ThumbnailLoader::request(const std::string& key, const ThumbnailRef& ref)
{
    if (key.empty())
        return nullptr;

    if (const std::string* cached = _cache.find(key))
    {
        auto& slot = _slots[key];
        slot.ref = ref;
        slot.state = State::Ready;
        return cached;
    }

    auto [it, inserted] = _slots.try_emplace(key);
    Slot& slot = it->second;
    if (inserted)
        slot.ref = ref;
    // the loading flag: one fetch per node at a time
    if (slot.state == State::Idle || slot.state == State::Ready)
        issue(key, slot);
    return nullptr;
}

void ThumbnailLoader::release(const std::string& key)
{
    auto it = _slots.find(key);
    if (it == _slots.end())
        return;
    Slot slot = it->second;
    _slots.erase(it);
    _scheduler.cancel(slot.retryTimer);
    if (slot.state == State::Loading)
        _queue.cancelByKey(key);
}

void ThumbnailLoader::sync(const std::vector<std::pair<std::string, ThumbnailRef>>& wanted)
{
    std::unordered_set<std::string> keep;
    keep.reserve(wanted.size());
    for (const auto& w : wanted)
        keep.insert(w.first);

    std::vector<std::string> drop;
    for (const auto& kv : _slots)
    {
        if (!keep.contains(kv.first))
            drop.push_back(kv.first);
    }
    for (const auto& key : drop)
        release(key);

    for (const auto& w : wanted)
        request(w.first, w.second);
}

void ThumbnailLoader::onEpochChanged()
{
    for (auto& kv : _slots)
    {
        Slot& slot = kv.second;
        if (slot.state == State::Loading || slot.state == State::RetryWait)
        {
            cancelInFlight(kv.first, slot);
            slot.state = State::Idle;
        }
    }
}

ThumbnailLoader::State ThumbnailLoader::state(const std::string& key) const
{
    auto it = _slots.find(key);
    return it == _slots.end() ? State::Idle : it->second.state;
}

int ThumbnailLoader::retries(const std::string& key) const
{
    auto it = _slots.find(key);
    return it == _slots.end() ? 0 : it->second.retries;
}

void ThumbnailLoader::cancelInFlight(const std::string& key, Slot& slot)
{
    _scheduler.cancel(slot.retryTimer);
    slot.retryTimer = 0;
    if (slot.state == State::Loading)
    {
        // the completion carries the old generation and is dropped
        slot.generation = 0;
        _queue.cancelByKey(key);
    }
}

void ThumbnailLoader::issue(const std::string& key, Slot& slot)
{
    slot.state = State::Loading;
    slot.generation = ++_generation;
    const uint64_t gen = slot.generation;
    const ThumbnailRef ref = slot.ref;

    _queue.enqueue(key, RequestQueue::Priority::High,
        [this, ref](RequestQueue::Done done)
        {
            _store.fetchThumbnail(ref, std::move(done));
        },
        [this, key, gen](ThumbnailResult result)
        {
            onResult(key, gen, std::move(result));
        });
}

void ThumbnailLoader::onResult(const std::string& key, uint64_t generation, ThumbnailResult result)
{
    auto it = _slots.find(key);
    if (it == _slots.end() || it->second.generation != generation || it->second.state != State::Loading)
        return;
    Slot& slot = it->second;

    switch (result.status)
    {
    case ThumbnailResult::Status::Ok:
        if (result.base64Data.empty())
        {
            slot.state = State::Missing;
            break;
        }
        _cache.put(key, makeDataUrl(result.mimeType, result.base64Data));
        slot.state = State::Ready;
        slot.attempt = 0;
        break;

    case ThumbnailResult::Status::NotFound:
        // the record has no image: nothing to retry
        slot.state = State::Missing;
        break;

    case ThumbnailResult::Status::Cancelled:
        scheduleRetry(key, slot, _policy.cancelDelayMs);
        break;

    case ThumbnailResult::Status::Failed:
        slot.attempt += 1;
        if (slot.attempt > _policy.maxAttempts)
        {
            slot.state = State::GaveUp;
            break;
        }
        scheduleRetry(key, slot, _policy.delayFor(slot.attempt));
        break;
    }
}

void ThumbnailLoader::scheduleRetry(const std::string& key, Slot& slot, int64_t delayMs)
{
    slot.state = State::RetryWait;
    if (slot.retryTimer != 0 && _scheduler.isScheduled(slot.retryTimer))
        return;
    slot.retryTimer = _scheduler.schedule(delayMs, [this, key]()
    {
        auto it = _slots.find(key);
        if (it == _slots.end())
            return;
        Slot& s = it->second;
        s.retryTimer = 0;
        if (s.state != State::RetryWait)
            return;
        if (_cache.contains(key))
        {
            s.state = State::Ready;
            return;
        }
        s.retries += 1;
        issue(key, s);
    });
}
