#include "ViewerSelectedPanel.hpp"
#include "time_axis.hpp"
#include "utils.hpp"
#include <unordered_map>
#include <algorithm>

// -------------------------------------------------------------
// Small bar filled with text overlay (percentages)
// -------------------------------------------------------------
/*static*/ void ViewerSelectedPanel::drawBar(float fraction01, const char* rightLabel, float width, float height, ImU32 fill)
{
    fraction01 = std::clamp(fraction01, 0.0f, 1.0f);
    ImDrawList* dl = ImGui::GetWindowDrawList();
    ImVec2 p1 = ImGui::GetCursorScreenPos();
    ImVec2 p2 = ImVec2(p1.x + width, p1.y + height);

    dl->AddRectFilled(p1, p2, IM_COL32(35, 40, 45, 255), 3.0f);

    float w = width * fraction01;
    if (w > 1.0f) {
        dl->AddRectFilled(p1, ImVec2(p1.x + w, p2.y), fill ? fill : IM_COL32(255, 156, 74, 220), 3.0f);
    }
    dl->AddRect(p1, p2, IM_COL32(0, 0, 0, 140), 3.0f, 0, 1.0f);

    ImGui::SetCursorScreenPos(ImVec2(p2.x + 8, p1.y - 2));
    ImGui::TextUnformatted(rightLabel);

    ImGui::SetCursorScreenPos(ImVec2(p1.x, p2.y + 6));
}

// -------------------------------------------------------------
// Selected record information screen
// -------------------------------------------------------------
void ViewerSelectedPanel::draw(const EventRecord& sel, const std::vector<EventRecord>& events, const ThumbnailTextures::Texture* preview, bool& p_open, const Actions& actions)
{
    // --- Focus auto ---
    const std::string key = identityKey(sel);
    if (key != _lastKey) { _lastKey = key; ImGui::SetNextWindowFocus(); }

    ImGui::SetNextWindowSize(ImVec2(530, 560), ImGuiCond_FirstUseEver);
    ImGui::SetNextWindowPos(ImVec2(40, 40), ImGuiCond_FirstUseEver);

    ImGuiWindowFlags flags =
        ImGuiWindowFlags_NoCollapse |
        ImGuiWindowFlags_NoSavedSettings;

    if (!ImGui::Begin("Event info", &p_open, flags)) {
        ImGui::End();
        return;
    }

    // Title in the activity color (no neighbor context here)
    const ImU32 titleCol = color::toRGBA(color::colorFor(sel.appName, sel.windowTitle, std::nullopt, std::nullopt, false));
    ImGui::PushStyleColor(ImGuiCol_Text, color::lighten(titleCol, 60));
    ImGui::Text("%s", sel.appName.value_or("Unknown").c_str());
    ImGui::PopStyleColor();
    ImGui::Separator();

    ImGui::Text("Window   : %s", sel.windowTitle.value_or("-").c_str());
    ImGui::Text("Time     : %s", axis::formatDateTime(double(sel.timestamp)).c_str());
    if (sel.id) ImGui::Text("Id       : %lld", (long long)*sel.id);
    else        ImGui::TextDisabled("Id       : -");
    ImGui::Text("Image    : %s", sel.imagePath.value_or("-").c_str());
    ImGui::Text("Process  : %s", sel.processPath.value_or("-").c_str());

    if (ImGui::SmallButton("Center here") && actions.jumpTo)
        actions.jumpTo(sel.timestamp);
    ImGui::SameLine();
    if (sel.id && ImGui::SmallButton("Highlight") && actions.highlight)
        actions.highlight(sel.id);
    ImGui::Spacing();

    if (preview && preview->width > 0 && preview->height > 0)
    {
        const float maxW = std::max(64.0f, ImGui::GetContentRegionAvail().x);
        const float scale = std::min(1.0f, maxW / float(preview->width));
        ImGui::Image(ThumbnailTextures::toImTexture(*preview), ImVec2(float(preview->width) * scale, float(preview->height) * scale));
    }
    else
    {
        ImGui::TextDisabled("(no preview)");
    }
    ImGui::Spacing();

    // ================== Aggregate ==================
    // -> all indexed events of the same app, grouped by window title
    std::unordered_map<std::string, Row> byWindow;
    uint64_t appCount = 0;
    double appActiveMs = 0.0;

    if (sel.appName)
    {
        for (std::size_t i = 0; i < events.size(); ++i)
        {
            const EventRecord& e = events[i];
            if (e.appName != sel.appName)
                continue;

            // time until the next capture, capped
            double active = 0.0;
            if (i + 1 < events.size())
                active = std::min(kMaxActiveGapMs, double(events[i + 1].timestamp - e.timestamp));

            const std::string title = e.windowTitle.value_or("");
            auto& row = byWindow[title];
            if (row.count == 0)
            {
                row.key = title.empty() ? std::string("(untitled)") : title;
                row.col_u32 = color::toRGBA(color::colorFor(e.appName, e.windowTitle, std::nullopt, std::nullopt, false));
            }
            row.count += 1;
            row.activeMs += active;
            row.firstTs = std::min(row.firstTs, e.timestamp);

            appCount += 1;
            appActiveMs += active;
        }
    }

    if (ImGui::CollapsingHeader("Same app (indexed range)", ImGuiTreeNodeFlags_DefaultOpen))
    {
        if (appCount == 0) {
            ImGui::TextDisabled("No other capture of this app is loaded.");
        }
        else {
            ImGui::Text("captures = %llu", (unsigned long long)appCount);
            ImGui::Text("active   ~ %s", fmtSpanMs(appActiveMs).c_str());
        }
    }

    ImGui::Spacing();

    if (!byWindow.empty() && ImGui::CollapsingHeader("By window", ImGuiTreeNodeFlags_DefaultOpen))
    {
        std::vector<Row> rows; rows.reserve(byWindow.size());
        for (const auto& kv : byWindow)
            rows.push_back(kv.second);

        // most active first
        std::stable_sort(rows.begin(), rows.end(), [](const Row& a, const Row& b)
        {
                if (a.activeMs != b.activeMs) return a.activeMs > b.activeMs;
                return a.firstTs < b.firstTs;
        });

        for (const Row& r : rows)
        {
            const float fract = (appActiveMs > 0.0) ? float(r.activeMs / appActiveMs) : 0.0f;
            ImGui::TextUnformatted(elideToWidth(r.key, 360.0f).c_str());
            ImGui::SameLine();
            ImGui::TextDisabled("(%llu)", (unsigned long long)r.count);

            char right[128];
            std::snprintf(right, sizeof(right), "%.1f%%  (%s)", 100.0 * double(fract), fmtSpanMs(r.activeMs).c_str());
            drawBar(fract, right, 260.0f, 10.0f, r.col_u32);
            ImGui::Spacing();
        }
    }

    ImGui::End();
}
