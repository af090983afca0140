#pragma once
#include <vector>
#include <string>
#include <functional>
#include <algorithm>
#include <cstdint>

#include <imgui.h>

#include "model.hpp"
#include "color_helper.hpp"
#include "ThumbnailTextures.hpp"

/// @brief ViewerSelectedPanel: "Event info" window for the record picked on the timeline.
class ViewerSelectedPanel
{
public:
    /// @brief Actions: buttons of the panel, forwarded to the host.
    struct Actions
    {
        std::function<void(int64_t timestamp)> jumpTo;
        std::function<void(std::optional<int64_t> id)> highlight;
    };

    // Draws the info window for `sel`.
    // - events: indexed records (sorted), used for the per-window breakdown of the app
    // - preview: decoded thumbnail if already available
    void draw(const EventRecord& sel, const std::vector<EventRecord>& events, const ThumbnailTextures::Texture* preview, bool& p_open, const Actions& actions);

private:
    /// @brief Row: one window title of the selected app.
    struct Row
    {
        std::string key;
        uint64_t count;
        double activeMs;
        int64_t firstTs;
        ImU32 col_u32;

        Row()
            : key{ }
            , count{ 0 }
            , activeMs{ 0 }
            , firstTs{ INT64_MAX }
            , col_u32{ 0 }
        {

        }
    };

    // gap to the next event counts as active time up to this
    static constexpr double kMaxActiveGapMs = 5.0 * 60.0 * 1000.0;

    // Small helper to draw a nice bar with overlay text
    static void drawBar(float fraction01, const char* rightLabel, float width = 260.f, float height = 10.f, ImU32 fill = 0);

    std::string _lastKey;
};
