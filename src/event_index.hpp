#pragma once
#include "model.hpp"

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

/// @brief IndexRange: half-open [first, last) slice into EventIndex::events().
struct IndexRange
{
    std::size_t first = 0;
    std::size_t last = 0;

    bool empty() const noexcept { return first >= last; }
    std::size_t size() const noexcept { return empty() ? 0 : last - first; }
};

/// @brief EventIndex: sorted, deduplicated set of records. Merge-only, reset by clear().
class EventIndex
{
public:
    EventIndex();

    // Union by identity key (incoming wins), drop negative timestamps, keep ascending order.
    // Returns the number of keys that were not present before.
    std::size_t merge(std::vector<EventRecord> records);

    // Events with ts in [startTime, endTime], plus the one right before startTime if any:
    // its bar may extend into the window.
    IndexRange rangeQuery(double startTime, double endTime) const;
    std::span<const EventRecord> slice(const IndexRange& r) const;

    void clear();

    const std::vector<EventRecord>& events() const { return _events; }
    std::size_t size() const { return _events.size(); }
    bool empty() const { return _events.empty(); }
    // changes whenever the content changes, lets the renderer skip recomputation
    uint64_t revision() const { return _revision; }

private:
    std::vector<EventRecord> _events;
    uint64_t _revision;
};
