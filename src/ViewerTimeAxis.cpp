#include "ViewerTimeAxis.hpp"
#include "time_axis.hpp"

#include <string>

int ViewerTimeAxis::minorCountFor(int64_t stepMs)
{
    if (stepMs % (5 * axis::kMinuteMs) == 0 && stepMs < axis::kHourMs) return 5;
    if (stepMs == axis::kHourMs || stepMs == 6 * axis::kHourMs || stepMs == 12 * axis::kHourMs) return 6;
    if (stepMs == axis::kDayMs) return 4;
    return 5;
}

int64_t ViewerTimeAxis::draw(ImDrawList* dl, const ImVec2& canvasMin, const ImVec2& canvasMax, const Geometry& geo) const
{
    const int64_t step = axis::pickTickInterval(geo.zoom);
    if (geo.width <= 0.0)
        return step;

    // Style
    const float rulerTop = canvasMax.y - kHeight;
    const float majorH = 8.0f;
    const float minorH = 4.0f;
    const ImU32 tickCol = IM_COL32(150, 150, 150, 180);
    const ImU32 textCol = IM_COL32(200, 200, 200, 210);

    dl->AddRectFilled(ImVec2(canvasMin.x, rulerTop), canvasMax, IM_COL32(14, 20, 26, 255));
    dl->AddLine(ImVec2(canvasMin.x, rulerTop), ImVec2(canvasMax.x, rulerTop), IM_COL32(70, 80, 90, 120), 1.0f);

    const auto ticks = axis::ticksFor(geo.visibleStart(), geo.visibleEnd(), step, geo.centerTime, geo.zoom, geo.width);

    // Ticks minor, skipped when they would crowd
    const int minorCnt = minorCountFor(step);
    const double minorPx = double(step) * geo.zoom / minorCnt;
    if (minorPx >= 8.0)
    {
        for (const auto& t : ticks)
        {
            for (int i = 1; i < minorCnt; ++i)
            {
                const float mx = canvasMin.x + float(t.x + i * minorPx);
                if (mx < canvasMin.x || mx > canvasMax.x)
                    continue;
                dl->AddLine(ImVec2(mx, rulerTop), ImVec2(mx, rulerTop + minorH), tickCol);
            }
        }
    }

    for (const auto& t : ticks)
    {
        const float x = canvasMin.x + float(t.x);
        if (x < canvasMin.x - 1.0f || x > canvasMax.x + 1.0f)
            continue;
        dl->AddLine(ImVec2(x, rulerTop), ImVec2(x, rulerTop + majorH), tickCol);
        // faint grid line through the event area
        dl->AddLine(ImVec2(x, canvasMin.y), ImVec2(x, rulerTop), IM_COL32(255, 255, 255, 14));

        const std::string label = axis::formatTick(t.timeMs, step);
        const float tw = ImGui::CalcTextSize(label.c_str()).x;
        dl->AddText(ImVec2(x - tw * 0.5f, rulerTop + majorH + 1.0f), textCol, label.c_str());
    }
    return step;
}
