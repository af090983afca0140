#include "activity_bars.hpp"

#include <algorithm>

color::Hsl runColor(const EventRecord& head, const EventRecord* prev)
{
    if (!prev)
        return color::colorFor(head.appName, head.windowTitle, std::nullopt, std::nullopt, false);
    return color::colorFor(head.appName, head.windowTitle, prev->appName, prev->windowTitle, true);
}

color::Hsl segmentColor(const std::vector<EventRecord>& events, std::size_t index)
{
    if (index >= events.size())
        return {};
    // a run entering from the left takes its color from its true start
    const EventRecord& head = events[index];
    std::size_t runStart = index;
    while (runStart > 0 && sameActivity(events[runStart - 1], head))
        --runStart;
    return runColor(head, runStart > 0 ? &events[runStart - 1] : nullptr);
}

std::vector<ActivityBar> layoutActivityBars(const std::vector<EventRecord>& events, const IndexRange& visible,
    const Geometry& geo, const BarStyle& style)
{
    std::vector<ActivityBar> bars;
    const std::size_t last = std::min(visible.last, events.size());
    if (visible.first >= last || geo.width <= 0.0)
        return bars;

    std::size_t i = visible.first;
    // only the first bar can start inside a run
    color::Hsl color = segmentColor(events, i);
    while (i < last)
    {
        // extend the run while the next indexed event shares the activity
        std::size_t j = i;
        while (j + 1 < last && sameActivity(events[j + 1], events[i]))
            ++j;

        const EventRecord& head = events[i];
        const bool hasNext = j + 1 < events.size();
        const bool continues = hasNext && sameActivity(events[j + 1], head);

        ActivityBar bar;
        bar.firstIndex = i;
        bar.lastIndex = j;
        bar.x0 = geo.toPixel(double(head.timestamp));
        const double tailX = geo.toPixel(double(events[j].timestamp));
        bar.x1 = hasNext ? std::max(tailX, geo.toPixel(double(events[j + 1].timestamp)))
                         : tailX + style.defaultSegmentWidth;
        bar.arrow = !continues;

        if (i != visible.first)
            color = runColor(head, &events[i - 1]);
        bar.color = color;

        // culling: nothing of this bar is on screen
        if (!(bar.x0 > geo.width || bar.x1 < 0.0))
            bars.push_back(bar);
        i = j + 1;
    }
    return bars;
}

std::array<Point2, 5> arrowPath(const ActivityBar& bar, const BarStyle& style)
{
    const double top = style.top;
    const double bottom = style.top + style.height;
    const double tip = bar.x1;
    // short bars keep a tip without folding back past their start
    const double shoulder = std::max(bar.x0, bar.x1 - style.arrowDepth);
    return { Point2{ bar.x0, top }, Point2{ shoulder, top }, Point2{ tip, top + style.height / 2.0 },
        Point2{ shoulder, bottom }, Point2{ bar.x0, bottom } };
}
