#pragma once
#include "color_helper.hpp"
#include "event_index.hpp"
#include "geometry.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

/// @brief DensityRules: pixel spacing rules for thumbnails and labels.
struct DensityRules
{
    double  minImageGap = 20.0;     // px between accepted thumbnails
    double  labelGapText = 180.0;   // app + window text shown
    double  labelGapIcons = 30.0;   // icon only (tick >= 15 min)
    double  labelGapFine = 0.0;     // tick < 30 s: label every segment start
    double  zoomedEnough = 0.00001; // px per ms below which no thumbnail is drawn
    int64_t macroTickMs = 120000;   // coarser ticks switch to bucket sampling
    int64_t textTickMs = 900000;    // names only when finer than 15 min per tick
    int64_t fineTickMs = 30000;
    int     minImagesPerView = 14;
    int     maxImagesPerView = 60;
    double  pxPerImageSlot = 60.0;
    double  defaultSegmentWidth = 100.0; // last event has no successor
    double  cullMargin = 50.0;
};

/// @brief NodePlan: one overlay node (thumbnail and/or label) to render.
struct NodePlan
{
    std::size_t index = 0;   // into EventIndex::events()
    double x = 0.0;
    double segmentWidth = 0.0;
    bool showImage = false;
    bool showLabel = false;
    bool showText = false;
    bool highlighted = false;
    bool sameActivityAsPrev = false;
    bool sameActivityAsNext = false;
    color::Hsl color{};      // color of the segment holding the event
};

/// @brief DensityPlanner: decimates the visible slice into the nodes worth drawing.
class DensityPlanner
{
public:
    DensityPlanner();
    explicit DensityPlanner(DensityRules rules);

    std::vector<NodePlan> plan(const std::vector<EventRecord>& events, const IndexRange& visible,
        const Geometry& geo, int64_t tickIntervalMs, std::optional<int64_t> highlightedId) const;

    // pixel gap required between two labels for this tick interval
    double labelGap(int64_t tickIntervalMs) const;
    bool isMacroScale(int64_t tickIntervalMs) const { return tickIntervalMs > _rules.macroTickMs; }
    // bucket width used at macro scale, 0 when not sampling
    double sampleInterval(int64_t tickIntervalMs, double visibleSpanMs, double width) const;

    const DensityRules& rules() const { return _rules; }

private:
    DensityRules _rules;
};
