#pragma once
#include "timeline_engine.hpp"

#include <string>

struct StoreConfig
{
    std::string path = "records.json";
    std::string thumbnailRoot;          // empty = relative to the records file
    bool        autoReload = true;
    double      autoReloadIntervalS = 1.0;
};

struct WindowConfig
{
    int         width = 1600;
    int         height = 900;
    std::string title = "Activity Timeline";
};

/// @brief TimelineConfig: everything read from the optional config file.
struct TimelineConfig
{
    StoreConfig   store{};
    WindowConfig  window{};
    EngineOptions engine{};
};

// Missing keys keep their defaults, unknown keys are ignored.
// False when the file can't be read, isn't JSON, or a value is out of range.
bool load_config(const std::string& path, TimelineConfig& cfg, std::string* outError = nullptr);
bool parse_config(const std::string& jsonText, TimelineConfig& cfg, std::string* outError = nullptr);
bool validate_config(const TimelineConfig& cfg, std::string* outError = nullptr);
