#pragma once
#include <string>
#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

// =============== Zoom bounds ===============
// zoom is expressed in pixels per millisecond
constexpr double kMinZoom = 100.0 / (365.0 * 24.0 * 3600000.0); // ~100px per year
constexpr double kMaxZoom = 20.0 / 1000.0;                      // 20px per second

// =============== Time bounds ===============
// the view center stays within [epoch, 9999-12-31T23:59:59.999Z]
constexpr double kMaxTimeMs = 253402300799999.0;

// =============== Event ===============
// store row: { id, timestamp, image_path, process_name, window_title, process_icon, process_path }
// timestamp is normalized to absolute ms at decode time.
struct EventRecord
{
    std::optional<int64_t>     id;          // "id"
    int64_t                    timestamp = 0; // ms since epoch, never negative once indexed
    std::optional<std::string> imagePath;   // "image_path"
    std::optional<std::string> appName;     // "process_name"
    std::optional<std::string> windowTitle; // "window_title"
    std::optional<std::string> processIcon; // base64 png (or data url)
    std::optional<std::string> processPath; // "process_path"
};

// Identity used for dedup and for the thumbnail cache:
// id, else image path, else "<ts>-<app>-<window>".
inline std::string identityKey(const EventRecord& e)
{
    if (e.id)
        return std::to_string(*e.id);
    if (e.imagePath && !e.imagePath->empty())
        return *e.imagePath;
    return std::to_string(e.timestamp) + "-" + e.appName.value_or("") + "-" + e.windowTitle.value_or("");
}

// Key "app::window" shared by all events of one activity segment
inline std::string activityKey(const std::optional<std::string>& appName, const std::optional<std::string>& windowTitle)
{
    return appName.value_or("") + "::" + windowTitle.value_or("");
}

inline std::string activityKey(const EventRecord& e)
{
    return activityKey(e.appName, e.windowTitle);
}

// missing and empty compare equal
inline std::string_view fieldView(const std::optional<std::string>& field)
{
    return field ? std::string_view(*field) : std::string_view();
}

inline bool sameActivity(const EventRecord& a, const EventRecord& b)
{
    return fieldView(a.appName) == fieldView(b.appName)
        && fieldView(a.windowTitle) == fieldView(b.windowTitle);
}

// =============== Viewport ===============
struct ViewportState
{
    double centerTime = 0.0;   // ms
    double zoom = 0.001;       // px per ms
    double width = 0.0;        // px
    bool   followingNow = false;
};

// =============== Thumbnails ===============
// Reference handed to the record store; either field may be empty.
struct ThumbnailRef
{
    std::optional<int64_t>     id;
    std::optional<std::string> path;
};

inline ThumbnailRef thumbnailRef(const EventRecord& e)
{
    return ThumbnailRef{ e.id, e.imagePath };
}

// "data:<mime>;base64,<payload>", what the image cache stores
inline std::string makeDataUrl(const std::string& mimeType, const std::string& base64Data)
{
    return "data:" + (mimeType.empty() ? std::string("image/png") : mimeType) + ";base64," + base64Data;
}
