#pragma once
#include <imgui.h>

#include "geometry.hpp"

/// @brief ViewerTimeAxis: wall-clock ruler along the bottom of the timeline canvas.
class ViewerTimeAxis
{
public:
    // Draws major ticks + labels for the visible window of `geo`.
    // Returns the tick interval used, the density planner keys off it.
    int64_t draw(ImDrawList* dl, const ImVec2& canvasMin, const ImVec2& canvasMax, const Geometry& geo) const;

    static constexpr float kHeight = 28.0f;

private:
    // minor ticks between two majors
    static int minorCountFor(int64_t stepMs);
};
