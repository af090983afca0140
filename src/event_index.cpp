#include "event_index.hpp"

#include <algorithm>
#include <string>
#include <unordered_map>
#include <unordered_set>

EventIndex::EventIndex()
    : _events{}
    , _revision{ 0 }
{
}

std::size_t EventIndex::merge(std::vector<EventRecord> records)
{
    std::erase_if(records, [](const EventRecord& e) { return e.timestamp < 0; });
    if (records.empty())
        return 0;

    std::unordered_set<std::string> known;
    known.reserve(_events.size());
    for (const auto& e : _events)
        known.insert(identityKey(e));

    // incoming first, then previous content: first seen wins
    std::vector<EventRecord> combined;
    combined.reserve(records.size() + _events.size());
    std::unordered_set<std::string> seen;
    seen.reserve(records.size() + _events.size());
    std::size_t added = 0;
    for (auto& e : records)
    {
        std::string key = identityKey(e);
        if (!seen.insert(key).second)
            continue;
        if (!known.contains(key))
            ++added;
        combined.push_back(std::move(e));
    }
    for (auto& e : _events)
    {
        if (seen.insert(identityKey(e)).second)
            combined.push_back(std::move(e));
    }

    std::stable_sort(combined.begin(), combined.end(), [](const EventRecord& a, const EventRecord& b)
    {
        return a.timestamp < b.timestamp;
    });
    _events.swap(combined);
    ++_revision;
    return added;
}

IndexRange EventIndex::rangeQuery(double startTime, double endTime) const
{
    if (_events.empty() || endTime < startTime)
        return {};

    // first ts >= start
    auto lo = std::lower_bound(_events.begin(), _events.end(), startTime, [](const EventRecord& e, double t)
    {
        return double(e.timestamp) < t;
    });
    // first ts > end
    auto hi = std::upper_bound(_events.begin(), _events.end(), endTime, [](double t, const EventRecord& e)
    {
        return t < double(e.timestamp);
    });

    std::size_t first = std::size_t(lo - _events.begin());
    std::size_t last = std::size_t(hi - _events.begin());
    if (first > 0)
        --first;
    return { first, last };
}

std::span<const EventRecord> EventIndex::slice(const IndexRange& r) const
{
    if (r.empty() || r.last > _events.size())
        return {};
    return std::span<const EventRecord>(_events.data() + r.first, r.size());
}

void EventIndex::clear()
{
    _events.clear();
    ++_revision;
}
