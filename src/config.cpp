#include "config.hpp"
#include "parser.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <stdexcept>

using json = nlohmann::json;

namespace
{
    // section["key"] when present and of the same json kind as the default
    template <class T>
    void read_value(const json& section, const char* key, T& inOut)
    {
        auto it = section.find(key);
        if (it == section.end() || it->is_null())
            return;
        inOut = it->get<T>();
    }

    // Counts are read signed and checked before narrowing: a negative value
    // must not wrap around to a huge std::size_t.
    void read_count(const json& section, const char* sectionName, const char* key, std::size_t& inOut)
    {
        auto it = section.find(key);
        if (it == section.end() || it->is_null())
            return;
        const int64_t v = it->get<int64_t>();
        if (v < 1)
            throw std::out_of_range(std::string(sectionName) + "." + key + " must be >= 1");
        inOut = std::size_t(v);
    }

    const json& section_of(const json& root, const char* name)
    {
        static const json empty = json::object();
        auto it = root.find(name);
        return (it != root.end() && it->is_object()) ? *it : empty;
    }
}

bool parse_config(const std::string& jsonText, TimelineConfig& cfg, std::string* outError)
{
    json root;
    try
    {
        root = json::parse(jsonText);
    }
    catch (const std::exception& e)
    {
        if (outError)
            *outError = e.what();
        return false;
    }
    if (!root.is_object())
    {
        if (outError) *outError = "config root must be an object";
        return false;
    }

    try
    {
        const json& store = section_of(root, "store");
        read_value(store, "path", cfg.store.path);
        read_value(store, "thumbnail_root", cfg.store.thumbnailRoot);
        read_value(store, "auto_reload", cfg.store.autoReload);
        read_value(store, "auto_reload_interval_s", cfg.store.autoReloadIntervalS);

        const json& window = section_of(root, "window");
        read_value(window, "width", cfg.window.width);
        read_value(window, "height", cfg.window.height);
        read_value(window, "title", cfg.window.title);

        EngineOptions& eng = cfg.engine;
        const json& viewport = section_of(root, "viewport");
        read_value(viewport, "initial_zoom", eng.viewport.initialZoom);
        read_value(viewport, "clear_zoom", eng.viewport.clearZoom);
        read_value(viewport, "zoom_step", eng.viewport.zoomStep);
        read_value(viewport, "wheel_idle_ms", eng.viewport.wheelIdleMs);

        const json& density = section_of(root, "density");
        read_value(density, "min_image_gap", eng.density.minImageGap);
        read_value(density, "label_gap_text", eng.density.labelGapText);
        read_value(density, "label_gap_icons", eng.density.labelGapIcons);
        read_value(density, "label_gap_fine", eng.density.labelGapFine);
        read_value(density, "macro_tick_ms", eng.density.macroTickMs);

        const json& fetch = section_of(root, "fetch");
        read_value(fetch, "debounce_ms", eng.fetch.debounceMs);
        read_value(fetch, "throttle_ms", eng.fetch.throttleMs);
        read_value(fetch, "refresh_interval_ms", eng.fetch.refreshIntervalMs);

        const json& thumbs = section_of(root, "thumbnails");
        read_count(thumbs, "thumbnails", "cache_capacity", eng.cacheCapacity);
        read_count(thumbs, "thumbnails", "max_concurrent", eng.maxConcurrent);
        read_count(thumbs, "thumbnails", "max_pending", eng.maxPending);

        const json& retry = section_of(thumbs, "retry");
        read_value(retry, "max_attempts", eng.retry.maxAttempts);
        read_value(retry, "base_delay_ms", eng.retry.baseDelayMs);
        read_value(retry, "cancel_delay_ms", eng.retry.cancelDelayMs);
    }
    catch (const json::exception& e)
    {
        // type_error: a key holds the wrong kind of value
        if (outError)
            *outError = e.what();
        return false;
    }
    catch (const std::out_of_range& e)
    {
        if (outError)
            *outError = e.what();
        return false;
    }

    return validate_config(cfg, outError);
}

bool validate_config(const TimelineConfig& cfg, std::string* outError)
{
    auto fail = [outError](const char* msg)
    {
        if (outError)
            *outError = msg;
        return false;
    };

    const EngineOptions& eng = cfg.engine;
    if (eng.cacheCapacity < 1)
        return fail("thumbnails.cache_capacity must be >= 1");
    if (eng.maxConcurrent < 1)
        return fail("thumbnails.max_concurrent must be >= 1");
    if (eng.maxPending < 1)
        return fail("thumbnails.max_pending must be >= 1");
    if (eng.retry.maxAttempts < 0)
        return fail("thumbnails.retry.max_attempts must be >= 0");
    if (eng.retry.baseDelayMs < 0 || eng.retry.cancelDelayMs < 0)
        return fail("thumbnails.retry delays must be >= 0");
    if (!(eng.viewport.initialZoom > 0.0) || !(eng.viewport.clearZoom > 0.0))
        return fail("viewport zoom values must be > 0");
    if (!(eng.viewport.zoomStep > 1.0))
        return fail("viewport.zoom_step must be > 1");
    if (eng.viewport.wheelIdleMs < 0)
        return fail("viewport.wheel_idle_ms must be >= 0");
    if (eng.fetch.debounceMs < 0 || eng.fetch.throttleMs < 0)
        return fail("fetch delays must be >= 0");
    if (eng.fetch.refreshIntervalMs < 1)
        return fail("fetch.refresh_interval_ms must be >= 1");
    if (eng.density.minImageGap < 0.0)
        return fail("density.min_image_gap must be >= 0");
    if (cfg.window.width < 1 || cfg.window.height < 1)
        return fail("window size must be >= 1");
    if (!(cfg.store.autoReloadIntervalS > 0.0))
        return fail("store.auto_reload_interval_s must be > 0");
    return true;
}

bool load_config(const std::string& path, TimelineConfig& cfg, std::string* outError)
{
    std::string text;
    if (!read_file(path, text))
    {
        if (outError)
            *outError = "cannot read " + path;
        return false;
    }
    return parse_config(text, cfg, outError);
}
