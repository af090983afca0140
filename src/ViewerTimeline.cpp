#include "ViewerTimeline.hpp"
#include "activity_bars.hpp"
#include "color_helper.hpp"
#include "time_axis.hpp"
#include "utils.hpp"

#include <algorithm>
#include <cstdio>

ViewerTimeline::ViewerTimeline(TimelineEngine& engine)
    : _engine{ engine }
    , _axis{}
    , _textures{}
    , _pressedOnCanvas{ false }
{
}

void ViewerTimeline::drawToolbar()
{
    ViewportController& ctl = _engine.controller();
    const bool following = ctl.isFollowingNow();
    if (following)
        ImGui::PushStyleColor(ImGuiCol_Button, ImVec4(0.42f, 0.80f, 0.58f, 0.55f));
    if (ImGui::Button("Now"))
        ctl.startFollowNow();
    if (following)
        ImGui::PopStyleColor();

    ImGui::SameLine();
    const char* mode = following ? "following now" : ctl.isDragging() ? "dragging" : "idle";
    ImGui::TextDisabled("%s  |  %s", mode, axis::formatDateTime(ctl.viewport().centerTime).c_str());
}

void ViewerTimeline::draw(ImDrawList* dl, const ImVec2& canvasMin, const ImVec2& canvasMax, const Callbacks& cb)
{
    const ImVec2 size(canvasMax.x - canvasMin.x, canvasMax.y - canvasMin.y);
    if (size.x <= 1.0f || size.y <= 1.0f)
        return;

    ViewportController& ctl = _engine.controller();
    ctl.setWidth(size.x);

    ImGui::SetCursorScreenPos(canvasMin);
    ImGui::InvisibleButton("timeline_canvas", size);
    CanvasInput input;
    input.hovered = ImGui::IsItemHovered();
    input.active = ImGui::IsItemActive();
    input.activated = ImGui::IsItemActivated();
    input.deactivated = ImGui::IsItemDeactivated();

    dl->PushClipRect(canvasMin, canvasMax, true);

    const Geometry geo = ctl.geometry();
    _axis.draw(dl, canvasMin, canvasMax, geo);

    const FramePlan& plan = _engine.plan();
    _engine.syncThumbnails();

    const BarStyle& bs = _engine.options().bars;
    Layout lay;
    lay.barTop = canvasMin.y + float(bs.top);
    lay.cardTop = lay.barTop + float(bs.height) + 26.0f;
    lay.labelTop = lay.cardTop + kCard + 8.0f;

    drawBars(dl, canvasMin, canvasMax, plan);
    const int hoveredNode = drawNodes(dl, canvasMin, canvasMax, plan, lay);
    drawCenterLine(dl, canvasMin, canvasMax);
    drawStatusBar(dl, canvasMin, canvasMax, plan);

    dl->PopClipRect();

    handleInput(canvasMin, input, hoveredNode, cb);
    _textures.collect();
}

void ViewerTimeline::handleInput(const ImVec2& canvasMin, const CanvasInput& input, int hoveredNode, const Callbacks& cb)
{
    ImGuiIO& io = ImGui::GetIO();
    ViewportController& ctl = _engine.controller();
    const double mx = double(io.MousePos.x - canvasMin.x);

    if (input.activated)
    {
        _pressedOnCanvas = true;
        ctl.pointerDown(mx);
    }
    else if (input.active && _pressedOnCanvas)
    {
        ctl.pointerMove(mx);
    }

    if (_pressedOnCanvas && input.deactivated)
    {
        _pressedOnCanvas = false;
        const bool click = ctl.pointerUp();
        if (click)
        {
            const FramePlan& plan = _engine.plan();
            const auto& events = _engine.index().events();
            if (hoveredNode >= 0 && std::size_t(hoveredNode) < plan.nodes.size()
                && plan.nodes[hoveredNode].index < events.size())
            {
                if (cb.onSelectEvent)
                    cb.onSelectEvent(events[plan.nodes[hoveredNode].index]);
            }
            else
            {
                ctl.stopFollowNow();
                if (cb.onClearHighlight)
                    cb.onClearHighlight();
            }
        }
    }

    if (input.hovered && io.MouseWheel != 0.0f)
        ctl.wheel(mx, double(io.MouseWheel));
}

void ViewerTimeline::drawBars(ImDrawList* dl, const ImVec2& canvasMin, const ImVec2& canvasMax, const FramePlan& plan) const
{
    const BarStyle& bs = _engine.options().bars;
    const float top = canvasMin.y + float(bs.top);
    const float bottom = top + float(bs.height);
    const float left = canvasMin.x - 2.0f;
    const float right = canvasMax.x + 2.0f;

    for (const auto& bar : plan.bars)
    {
        const ImU32 col = color::toRGBA(bar.color);
        if (!bar.arrow)
        {
            const float x0 = std::max(left, canvasMin.x + float(bar.x0));
            const float x1 = std::min(right, canvasMin.x + float(bar.x1));
            if (x1 > x0)
                dl->AddRectFilled(ImVec2(x0, top), ImVec2(x1, bottom), col);
            continue;
        }

        const auto pts = arrowPath(bar, bs);
        ImVec2 poly[5];
        for (int i = 0; i < 5; ++i)
            poly[i] = ImVec2(std::clamp(canvasMin.x + float(pts[i].x), left, right + float(bs.arrowDepth)),
                canvasMin.y + float(pts[i].y));
        dl->AddConvexPolyFilled(poly, 5, col);
    }
}

int ViewerTimeline::drawNodes(ImDrawList* dl, const ImVec2& canvasMin, const ImVec2& canvasMax, const FramePlan& plan, const Layout& lay)
{
    const auto& events = _engine.index().events();
    const ImVec2 mouse = ImGui::GetIO().MousePos;
    const bool mouseInCanvas = pointInRect(mouse, canvasMin, canvasMax);

    // hit test first so the hovered node can be lifted
    int hovered = -1;
    for (int i = int(plan.nodes.size()) - 1; i >= 0 && mouseInCanvas; --i)
    {
        const NodePlan& n = plan.nodes[i];
        const float x = canvasMin.x + float(n.x);
        const float bottom = n.showLabel ? lay.labelTop + ImGui::GetTextLineHeight() * 2.0f + 4.0f : lay.cardTop + kCard;
        const float top = n.showImage ? lay.cardTop : lay.labelTop;
        const float halfW = n.showImage ? kCard * 0.5f : 10.0f;
        if (!pointInRect(mouse, ImVec2(x - halfW, top), ImVec2(x + halfW, bottom)))
            continue;
        // highlighted is drawn on top, it wins the overlap
        if (hovered < 0 || n.highlighted)
            hovered = i;
        if (n.highlighted)
            break;
    }

    int highlightedIdx = -1;
    for (int i = 0; i < int(plan.nodes.size()); ++i)
    {
        if (plan.nodes[i].highlighted)
        {
            highlightedIdx = i;
            continue;
        }
        drawNode(dl, canvasMin, plan.nodes[i], lay, i == hovered);
    }
    if (highlightedIdx >= 0)
        drawNode(dl, canvasMin, plan.nodes[highlightedIdx], lay, highlightedIdx == hovered);

    if (hovered >= 0 && plan.nodes[hovered].index < events.size())
        drawTooltip(events[plan.nodes[hovered].index]);
    return hovered;
}

void ViewerTimeline::drawNode(ImDrawList* dl, const ImVec2& canvasMin, const NodePlan& node, const Layout& lay, bool hovered)
{
    const auto& events = _engine.index().events();
    if (node.index >= events.size())
        return;
    const EventRecord& e = events[node.index];
    const ImU32 col = color::toRGBA(node.color);
    const float x = canvasMin.x + float(node.x);
    const float stemTop = lay.barTop + float(_engine.options().bars.height);

    if (node.showImage)
    {
        dl->AddLine(ImVec2(x, stemTop), ImVec2(x, lay.cardTop), color::withAlpha(col, 200), 1.5f);

        const ImVec2 p1(x - kCard * 0.5f, lay.cardTop);
        const ImVec2 p2(x + kCard * 0.5f, lay.cardTop + kCard);
        dl->AddRectFilled(p1, p2, IM_COL32(24, 30, 36, 255), 4.0f);

        const std::string* url = _engine.thumbnail(e);
        const ThumbnailTextures::Texture* tex = url ? _textures.get(identityKey(e), *url) : nullptr;
        if (tex)
        {
            // letterbox into the square card
            const float aspect = tex->height > 0 ? float(tex->width) / float(tex->height) : 1.0f;
            float w = kCard - 4.0f, h = kCard - 4.0f;
            if (aspect > 1.0f) h = w / aspect; else w = h * aspect;
            const ImVec2 c((p1.x + p2.x) * 0.5f, (p1.y + p2.y) * 0.5f);
            dl->AddImage(ThumbnailTextures::toImTexture(*tex), ImVec2(c.x - w * 0.5f, c.y - h * 0.5f), ImVec2(c.x + w * 0.5f, c.y + h * 0.5f));
        }
        else
        {
            const char* dots = "...";
            const ImVec2 ts = ImGui::CalcTextSize(dots);
            dl->AddText(ImVec2(x - ts.x * 0.5f, lay.cardTop + (kCard - ts.y) * 0.5f), IM_COL32(160, 160, 160, 200), dots);
        }

        ImU32 border = hovered ? color::lighten(col, 40) : IM_COL32(0, 0, 0, 140);
        float thick = 1.0f;
        if (node.highlighted)
        {
            border = IM_COL32(255, 214, 10, 255);
            thick = 2.5f;
        }
        dl->AddRect(p1, p2, border, 4.0f, 0, thick);
    }

    if (node.showLabel)
        drawLabel(dl, x, lay.labelTop, e, node.showText, col);
}

void ViewerTimeline::drawLabel(ImDrawList* dl, float x, float y, const EventRecord& e, bool withText, ImU32 accent)
{
    const float icon = 16.0f;
    const ImVec2 i1(x - icon * 0.5f, y);
    const ImVec2 i2(x + icon * 0.5f, y + icon);

    const ThumbnailTextures::Texture* tex = nullptr;
    if (e.processIcon && !e.processIcon->empty())
        tex = _textures.get("icon:" + e.appName.value_or(*e.processIcon), *e.processIcon);

    if (tex)
        dl->AddImage(ThumbnailTextures::toImTexture(*tex), i1, i2);
    else
    {
        const ImVec2 c(x, y + icon * 0.5f);
        dl->AddCircleFilled(c, icon * 0.5f, accent);
        const std::string letter = initialOf(e.appName.value_or(""));
        const ImVec2 ts = ImGui::CalcTextSize(letter.c_str());
        dl->AddText(ImVec2(c.x - ts.x * 0.5f, c.y - ts.y * 0.5f), IM_COL32(255, 255, 255, 230), letter.c_str());
    }

    if (!withText)
        return;

    const float lineH = ImGui::GetTextLineHeight();
    const std::string app = elideToWidth(e.appName.value_or("Unknown"), kLabelTextPx);
    const std::string win = elideToWidth(e.windowTitle.value_or(""), kLabelTextPx);
    const float tx = x + icon * 0.5f + 4.0f;
    dl->AddText(ImVec2(tx, y), IM_COL32(230, 235, 240, 240), app.c_str());
    if (!win.empty())
        dl->AddText(ImVec2(tx, y + lineH), IM_COL32(160, 170, 180, 220), win.c_str());
}

void ViewerTimeline::drawCenterLine(ImDrawList* dl, const ImVec2& canvasMin, const ImVec2& canvasMax) const
{
    const float cx = canvasMin.x + (canvasMax.x - canvasMin.x) * 0.5f;
    const ImU32 col = _engine.controller().isFollowingNow() ? IM_COL32(107, 204, 148, 200) : IM_COL32(255, 156, 74, 170);
    dl->AddLine(ImVec2(cx, canvasMin.y), ImVec2(cx, canvasMax.y - ViewerTimeAxis::kHeight), col, 1.0f);
    dl->AddTriangleFilled(ImVec2(cx - 5.0f, canvasMin.y), ImVec2(cx + 5.0f, canvasMin.y), ImVec2(cx, canvasMin.y + 6.0f), col);
}

void ViewerTimeline::drawStatusBar(ImDrawList* dl, const ImVec2& canvasMin, const ImVec2& canvasMax, const FramePlan& plan) const
{
    const float y = canvasMax.y - ViewerTimeAxis::kHeight - 20.0f;
    const ImVec2 sMin(canvasMin.x, y), sMax(canvasMax.x, y + 20.0f);
    dl->AddRectFilled(sMin, sMax, IM_COL32(18, 23, 28, 220));

    const ViewportState& vp = _engine.controller().viewport();
    char left[200];
    std::snprintf(left, sizeof(left), "Zoom: %.3g px/ms  |  Span: %s  |  Tick: %s",
        vp.zoom, fmtSpanMs(vp.width / vp.zoom).c_str(), fmtSpanMs(double(plan.tickIntervalMs)).c_str());
    char right[200];
    std::snprintf(right, sizeof(right), "Visible: %zu  |  Nodes: %zu  |  Indexed: %zu  |  Thumbs: %zu (%zu running, %zu queued)",
        plan.visible.size(), plan.nodes.size(), _engine.index().size(), _engine.cache().size(),
        _engine.queue().running(), _engine.queue().pending());

    dl->AddText(ImVec2(sMin.x + 8, sMin.y + 3), IM_COL32(200, 200, 200, 255), left);
    const float rw = ImGui::CalcTextSize(right).x;
    dl->AddText(ImVec2(sMax.x - rw - 8, sMin.y + 3), IM_COL32(200, 200, 200, 255), right);
}

void ViewerTimeline::drawTooltip(const EventRecord& e) const
{
    ImGui::BeginTooltip();
    ImGui::Text("%s", e.appName.value_or("Unknown").c_str());
    ImGui::Separator();
    if (e.windowTitle && !e.windowTitle->empty())
        ImGui::Text("Window: %s", e.windowTitle->c_str());
    ImGui::Text("Time:   %s", axis::formatDateTime(double(e.timestamp)).c_str());
    if (e.id)
        ImGui::Text("Id:     %lld", (long long)*e.id);
    ImGui::EndTooltip();
}
