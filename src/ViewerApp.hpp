#pragma once
#include "ViewerTimeline.hpp"
#include "ViewerSelectedPanel.hpp"
#include "config.hpp"
#include "json_record_store.hpp"
#include "task_scheduler.hpp"
#include "timeline_engine.hpp"

#include <cstdint>
#include <optional>
#include <string>

/// @brief ViewerApp: host of the timeline: controls, timeline window and selection panel.
class ViewerApp
{
public:
    explicit ViewerApp(const TimelineConfig& cfg);
    ~ViewerApp();
    ViewerApp(const ViewerApp&) = delete;
    ViewerApp& operator=(const ViewerApp&) = delete;

    // Loads the records file and starts fetching. A failed load is reported but not fatal.
    bool start(std::string* outError = nullptr);

    // Once per frame, between ImGui::NewFrame() and ImGui::Render()
    void drawUI();

private:
    void drawControls();
    void drawTimelineWindow();

    // host callbacks
    void onSelectEvent(const EventRecord& e);
    void onClearHighlight();

    void requestJump(double timeMs);
    bool parseJumpInput(const char* text, double& outMs) const;

private:
    TimelineConfig  _cfg;
    // declaration order = teardown order in reverse: scheduler and store outlive the engine
    TaskScheduler   _scheduler;
    JsonRecordStore _store;
    TimelineEngine  _engine;
    ViewerTimeline  _timeline;

    ViewerSelectedPanel _selectedPanel;
    std::optional<EventRecord> _selected;
    bool _showSelectedPanel;

    // UI
    char _storePath[1024];
    char _jumpInput[64];
    int64_t _highlightInput;
    uint64_t _jumpRequestId;
    bool _autoReload;
    // seconds
    float _autoReloadInterval;
    std::string _lastError;
};
