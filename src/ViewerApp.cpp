#include "ViewerApp.hpp"
#include "parser.hpp"
#include "time_axis.hpp"
#include "utils.hpp"
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <iostream>

ViewerApp::ViewerApp(const TimelineConfig& cfg)
    : _cfg{ cfg }
    , _scheduler{}
    , _store{ cfg.store.path, cfg.store.thumbnailRoot }
    , _engine{ _store, _scheduler, wallNowMs, cfg.engine }
    , _timeline{ _engine }
    , _selectedPanel{}
    , _selected{}
    , _showSelectedPanel{ false }
    , _storePath{ 0 }
    , _jumpInput{ 0 }
    , _highlightInput{ 0 }
    , _jumpRequestId{ 0 }
    , _autoReload{ cfg.store.autoReload }
    , _autoReloadInterval{ float(cfg.store.autoReloadIntervalS) }
    , _lastError{}
{
    std::snprintf(_storePath, sizeof(_storePath), "%s", cfg.store.path.c_str());
    _store.setAutoReload(_autoReload, _autoReloadInterval);
}

ViewerApp::~ViewerApp() {}

bool ViewerApp::start(std::string* outError)
{
    std::string err;
    const bool ok = _store.load(&err);
    if (!ok)
    {
        _lastError = err;
        std::cerr << "[timeline] " << err << "\n";
        if (outError) *outError = err;
    }
    else
    {
        std::cerr << "[timeline] loaded " << _store.recordCount() << " records from " << _store.path() << "\n";
    }
    _engine.setRefreshKey(_store.refreshKey());
    _engine.start();
    return ok;
}

void ViewerApp::onSelectEvent(const EventRecord& e)
{
    _selected = e;
    _showSelectedPanel = true;
    _engine.setHighlightedEventId(e.id);
}

void ViewerApp::onClearHighlight()
{
    _engine.setHighlightedEventId(std::nullopt);
}

void ViewerApp::requestJump(double timeMs)
{
    _engine.setJumpTimestamp(timeMs, ++_jumpRequestId);
}

// epoch ms, or an ISO date-time (UTC unless an offset is given)
bool ViewerApp::parseJumpInput(const char* text, double& outMs) const
{
    std::string s(text);
    while (!s.empty() && std::isspace((unsigned char)s.front())) s.erase(s.begin());
    while (!s.empty() && std::isspace((unsigned char)s.back())) s.pop_back();
    if (s.empty())
        return false;

    if (std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isdigit(c); }))
    {
        errno = 0;
        const long long v = std::strtoll(s.c_str(), nullptr, 10);
        if (errno == ERANGE || double(v) > kMaxTimeMs)
            return false;
        outMs = double(v);
        return true;
    }
    int64_t ms = 0;
    if (!parse_iso8601_ms(s, ms) || ms < 0 || double(ms) > kMaxTimeMs)
        return false;
    outMs = double(ms);
    return true;
}

void ViewerApp::drawControls()
{
    ImGui::Begin("Controls");

    ImGui::InputText("Records", _storePath, sizeof(_storePath), ImGuiInputTextFlags_ReadOnly);
    ImGui::Text("Loaded: %zu records  |  Indexed: %zu", _store.recordCount(), _engine.index().size());

    if (ImGui::Button("Refresh"))
    {
        std::string err;
        if (_store.load(&err))
            _lastError.clear();
        else
            _lastError = err;
        // a reload bumps the key; a failed one still forces a refetch
        if (!err.empty())
            _engine.fetcher().forceRefresh();
    }
    ImGui::SameLine();
    if (ImGui::Checkbox("Auto-reload", &_autoReload))
        _store.setAutoReload(_autoReload, _autoReloadInterval);
    ImGui::SameLine();
    ImGui::SetNextItemWidth(120.0f);
    if (ImGui::SliderFloat("Interval (s)", &_autoReloadInterval, 0.2f, 5.0f, "%.1f"))
        _store.setAutoReload(_autoReload, _autoReloadInterval);

    ImGui::SeparatorText("Navigate");
    ImGui::SetNextItemWidth(260.f);
    const bool enter = ImGui::InputTextWithHint("##jump", "2024-05-01T12:00:00Z or epoch ms", _jumpInput, sizeof(_jumpInput), ImGuiInputTextFlags_EnterReturnsTrue);
    ImGui::SameLine();
    if (ImGui::Button("Jump") || enter)
    {
        double t = 0.0;
        if (parseJumpInput(_jumpInput, t))
        {
            requestJump(t);
            _lastError.clear();
        }
        else
            _lastError = std::string("Cannot parse jump target: ") + _jumpInput;
    }

    ImGui::SetNextItemWidth(160.f);
    ImGui::InputScalar("Highlight id", ImGuiDataType_S64, &_highlightInput);
    ImGui::SameLine();
    if (ImGui::Button("Set"))
        _engine.setHighlightedEventId(_highlightInput);
    ImGui::SameLine();
    if (ImGui::Button("Clear"))
        onClearHighlight();
    if (auto hl = _engine.highlightedEventId())
        ImGui::Text("Highlighted: %lld", (long long)*hl);
    else
        ImGui::TextDisabled("Highlighted: none");

    ImGui::SeparatorText("Thumbnails");
    ImGui::Text("Cache: %zu / %zu", _engine.cache().size(), _engine.cache().capacity());
    ImGui::Text("Requests: %zu running, %zu queued", _engine.queue().running(), _engine.queue().pending());
    ImGui::Text("Epoch: %llu", (unsigned long long)_engine.controller().epoch());

    const std::string& storeErr = _store.lastError();
    if (!_lastError.empty())
        ImGui::TextColored(ImVec4(1, 0.4f, 0.4f, 1), "Error: %s", _lastError.c_str());
    else if (!storeErr.empty())
        ImGui::TextColored(ImVec4(1, 0.4f, 0.4f, 1), "Error: %s", storeErr.c_str());
    ImGui::End();
}

void ViewerApp::drawTimelineWindow()
{
    ImGui::Begin("Timeline", nullptr, ImGuiWindowFlags_NoBringToFrontOnFocus | ImGuiWindowFlags_NoScrollWithMouse | ImGuiWindowFlags_NoScrollbar);
    _timeline.drawToolbar();

    ImDrawList* dl = ImGui::GetWindowDrawList();
    ImVec2 canvasMin = ImGui::GetCursorScreenPos();
    ImVec2 availCR = ImGui::GetContentRegionAvail();
    ImVec2 canvasMax(canvasMin.x + availCR.x, canvasMin.y + availCR.y);
    dl->AddRectFilled(canvasMin, canvasMax, IM_COL32(10, 18, 24, 255));

    ViewerTimeline::Callbacks cb;
    cb.onSelectEvent = [this](const EventRecord& e) { onSelectEvent(e); };
    cb.onClearHighlight = [this]() { onClearHighlight(); };
    _timeline.draw(dl, canvasMin, canvasMax, cb);

    if (_showSelectedPanel && _selected)
    {
        const ThumbnailTextures::Texture* preview = nullptr;
        if (const std::string* url = _engine.cache().find(identityKey(*_selected)))
            preview = _timeline.textures().get(identityKey(*_selected), *url);

        ViewerSelectedPanel::Actions actions;
        actions.jumpTo = [this](int64_t ts) { requestJump(double(ts)); };
        actions.highlight = [this](std::optional<int64_t> id) { _engine.setHighlightedEventId(id); };
        _selectedPanel.draw(*_selected, _engine.index().events(), preview, _showSelectedPanel, actions);
    }
    ImGui::End();
}

// --- drawUI (controls + timeline host) ---
void ViewerApp::drawUI()
{
    // results from the store worker, then timers and frame tasks
    _store.poll();
    _engine.setRefreshKey(_store.refreshKey());
    _scheduler.tick();

    drawControls();
    drawTimelineWindow();
}
