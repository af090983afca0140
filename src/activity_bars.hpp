#pragma once
#include "color_helper.hpp"
#include "event_index.hpp"
#include "geometry.hpp"

#include <array>
#include <cstddef>
#include <vector>

/// @brief ActivityBar: one merged bar per visible activity segment.
struct ActivityBar
{
    std::size_t firstIndex = 0; // first event of the segment inside the slice
    std::size_t lastIndex = 0;  // last event of the segment inside the slice
    double x0 = 0.0;
    double x1 = 0.0;
    bool arrow = false;         // segment ends here: draw a chevron
    color::Hsl color{};
};

struct BarStyle
{
    double top = 16.0;
    double height = 6.0;
    double arrowDepth = 8.0;
    double defaultSegmentWidth = 100.0;
};

struct Point2
{
    double x;
    double y;
};

// Color of a run starting at head, given the event just before it (if any)
color::Hsl runColor(const EventRecord& head, const EventRecord* prev);

// Color of the segment holding events[index], the same for every event of the run.
// Walks back to the run start: call it once per plan, then follow runs forward.
color::Hsl segmentColor(const std::vector<EventRecord>& events, std::size_t index);

// Groups consecutive events of the visible slice into segments. A segment's color is
// assigned once, from its own key and the previous segment's key.
std::vector<ActivityBar> layoutActivityBars(const std::vector<EventRecord>& events, const IndexRange& visible,
    const Geometry& geo, const BarStyle& style = {});

// Outline of a terminating bar: (x0,top) (x1-d,top) (x1,mid) (x1-d,bottom) (x0,bottom)
std::array<Point2, 5> arrowPath(const ActivityBar& bar, const BarStyle& style);
