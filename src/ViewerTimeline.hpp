#pragma once
#include <imgui.h>

#include <functional>
#include <string>

#include "ThumbnailTextures.hpp"
#include "ViewerTimeAxis.hpp"
#include "timeline_engine.hpp"

/// @brief ViewerTimeline: draws the engine's frame plan and feeds pointer input back to it.
class ViewerTimeline
{
public:
    /// @brief Callbacks: host notifications.
    struct Callbacks
    {
        std::function<void(const EventRecord&)> onSelectEvent;
        std::function<void()> onClearHighlight;
    };

    explicit ViewerTimeline(TimelineEngine& engine);

    void draw(ImDrawList* dl, const ImVec2& canvasMin, const ImVec2& canvasMax, const Callbacks& cb);

    // toolbar row above the canvas ("Now" button + mode)
    void drawToolbar();

    ThumbnailTextures& textures() { return _textures; }

private:
    /// @brief Layout: vertical placement inside the canvas.
    struct Layout
    {
        float barTop;
        float cardTop;
        float labelTop;
    };

    // item state of the canvas button, read right after it is submitted
    struct CanvasInput
    {
        bool hovered = false;
        bool active = false;
        bool activated = false;
        bool deactivated = false;
    };

    void handleInput(const ImVec2& canvasMin, const CanvasInput& input, int hoveredNode, const Callbacks& cb);
    void drawBars(ImDrawList* dl, const ImVec2& canvasMin, const ImVec2& canvasMax, const FramePlan& plan) const;
    int  drawNodes(ImDrawList* dl, const ImVec2& canvasMin, const ImVec2& canvasMax, const FramePlan& plan, const Layout& lay);
    void drawNode(ImDrawList* dl, const ImVec2& canvasMin, const NodePlan& node, const Layout& lay, bool hovered);
    void drawLabel(ImDrawList* dl, float x, float y, const EventRecord& e, bool withText, ImU32 accent);
    void drawCenterLine(ImDrawList* dl, const ImVec2& canvasMin, const ImVec2& canvasMax) const;
    void drawStatusBar(ImDrawList* dl, const ImVec2& canvasMin, const ImVec2& canvasMax, const FramePlan& plan) const;
    void drawTooltip(const EventRecord& e) const;

    TimelineEngine&   _engine;
    ViewerTimeAxis    _axis;
    ThumbnailTextures _textures;
    bool _pressedOnCanvas;

    static constexpr float kCard = 48.0f;
    static constexpr float kLabelTextPx = 150.0f;
};
