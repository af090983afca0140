#include "density_planner.hpp"
#include "activity_bars.hpp"

#include <algorithm>
#include <cmath>
#include <unordered_set>

DensityPlanner::DensityPlanner()
    : _rules{}
{
}

DensityPlanner::DensityPlanner(DensityRules rules)
    : _rules{ rules }
{
}

double DensityPlanner::labelGap(int64_t tickIntervalMs) const
{
    if (tickIntervalMs < _rules.fineTickMs)
        return _rules.labelGapFine;
    if (tickIntervalMs < _rules.textTickMs)
        return _rules.labelGapText;
    return _rules.labelGapIcons;
}

double DensityPlanner::sampleInterval(int64_t tickIntervalMs, double visibleSpanMs, double width) const
{
    if (!isMacroScale(tickIntervalMs))
        return 0.0;
    const int maxImages = std::clamp(int(std::floor(width / _rules.pxPerImageSlot)),
        _rules.minImagesPerView, _rules.maxImagesPerView);
    return std::max(double(tickIntervalMs) * 1.5, std::floor(std::max(1.0, visibleSpanMs) / double(maxImages)));
}

std::vector<NodePlan> DensityPlanner::plan(const std::vector<EventRecord>& events, const IndexRange& visible,
    const Geometry& geo, int64_t tickIntervalMs, std::optional<int64_t> highlightedId) const
{
    std::vector<NodePlan> out;
    if (visible.empty() || geo.width <= 0.0)
        return out;

    const bool showText = tickIntervalMs < _rules.textTickMs;
    const double minLabelGap = labelGap(tickIntervalMs);
    const bool zoomedEnough = geo.zoom > _rules.zoomedEnough;

    // sparse sampling at macro scale caps the node count regardless of event density
    const double bucketMs = sampleInterval(tickIntervalMs, geo.visibleSpan(), geo.width);
    std::unordered_set<int64_t> claimedBuckets;

    double lastImageX = -9999.0;
    double lastLabelX = -9999.0;

    const std::size_t last = std::min(visible.last, events.size());
    // one walk back for a run entering from the left, then follow run starts
    color::Hsl color = segmentColor(events, visible.first);
    for (std::size_t i = visible.first; i < last; ++i)
    {
        const EventRecord& e = events[i];
        const EventRecord* next = (i + 1 < events.size()) ? &events[i + 1] : nullptr;
        const EventRecord* prev = (i > 0) ? &events[i - 1] : nullptr;
        const bool sameAsPrev = prev && sameActivity(*prev, e);
        if (i != visible.first && !sameAsPrev)
            color = runColor(e, prev);

        const double x = geo.toPixel(double(e.timestamp));
        double segmentWidth = _rules.defaultSegmentWidth;
        if (next)
            segmentWidth = std::max(0.0, geo.toPixel(double(next->timestamp)) - x);

        if (x > geo.width + _rules.cullMargin)
            break;
        if (x + segmentWidth < -_rules.cullMargin)
            continue;

        const bool sameAsNext = next && sameActivity(*next, e);

        bool showImage = false;
        std::optional<int64_t> bucket;
        bool sampled = true;
        if (bucketMs > 0.0)
        {
            bucket = int64_t(std::floor(double(e.timestamp) / bucketMs));
            sampled = !claimedBuckets.contains(*bucket);
        }
        if (zoomedEnough && sampled && x - lastImageX >= _rules.minImageGap)
        {
            showImage = true;
            lastImageX = x;
            if (bucket)
                claimedBuckets.insert(*bucket);
        }

        bool showLabel = false;
        if (!sameAsPrev && x - lastLabelX >= minLabelGap)
        {
            showLabel = true;
            lastLabelX = x;
        }

        const bool highlighted = highlightedId && e.id && *e.id == *highlightedId;
        if (highlighted)
            showImage = true;

        if (!showImage && !showLabel)
            continue;

        NodePlan node;
        node.index = i;
        node.x = x;
        node.segmentWidth = segmentWidth;
        node.showImage = showImage;
        node.showLabel = showLabel;
        node.showText = showText;
        node.highlighted = highlighted;
        node.sameActivityAsPrev = sameAsPrev;
        node.sameActivityAsNext = sameAsNext;
        node.color = color;
        out.push_back(node);
    }
    return out;
}
