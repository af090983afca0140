#pragma once
#include "model.hpp"

#include <algorithm>
#include <cmath>

// Pure time <-> pixel mapping of the visible window.
// Nothing here clamps: callers clamp zoom before building a Geometry.
struct Geometry
{
    double centerTime = 0.0; // ms
    double zoom = 0.001;     // px per ms
    double width = 0.0;      // px

    Geometry() = default;
    Geometry(double center, double z, double w)
        : centerTime{ center }
        , zoom{ z }
        , width{ w }
    {
    }
    explicit Geometry(const ViewportState& vp)
        : centerTime{ vp.centerTime }
        , zoom{ vp.zoom }
        , width{ vp.width }
    {
    }

    double toPixel(double ts) const { return width / 2.0 + (ts - centerTime) * zoom; }
    double toTime(double px) const { return centerTime + (px - width / 2.0) / zoom; }

    double visibleStart() const { return centerTime - (width / 2.0) / zoom; }
    double visibleEnd() const { return centerTime + (width / 2.0) / zoom; }
    double visibleSpan() const { return width / zoom; }
};

inline double clampZoom(double zoom)
{
    return std::clamp(zoom, kMinZoom, kMaxZoom);
}

inline double clampTime(double ms)
{
    if (std::isnan(ms))
        return 0.0;
    return std::clamp(ms, 0.0, kMaxTimeMs);
}
