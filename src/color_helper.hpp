// ColorHelpers.hpp
#pragma once
#include <algorithm>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <optional>
#include <string>
#include <string_view>

namespace color
{
    // Same bit layout as IM_COL32 (R in the low byte)
    constexpr uint32_t packRGBA(uint8_t r, uint8_t g, uint8_t b, uint8_t a = 255)
    {
        return (uint32_t(a) << 24) | (uint32_t(b) << 16) | (uint32_t(g) << 8) | uint32_t(r);
    }

    constexpr uint32_t kNeutralGray = packRGBA(0x88, 0x88, 0x88);

    /// @brief Hsl: hue in degrees, saturation/lightness in percent.
    struct Hsl
    {
        int    hue = 0;
        double saturation = 65.0;
        double lightness = 40.0;
        bool   neutral = false; // no app name: render gray

        bool operator==(const Hsl&) const = default;
    };

    // hash = c + (hash << 5) - hash over the UTF-8 bytes, wrapped to 32 bits at every step.
    // Hues differ from a UTF-16 based hash for non-ASCII keys; stored colors rely on this form.
    inline int32_t activityHash(std::string_view key)
    {
        uint32_t h = 0;
        for (unsigned char c : key)
            h = uint32_t(c) + ((h << 5) - h);
        return static_cast<int32_t>(h);
    }

    inline int hueOf(int32_t hash)
    {
        return std::abs(hash % 360);
    }

    // circular distance on the hue wheel, [0, 180]
    inline int hueDistance(int a, int b)
    {
        const int d = std::abs(a - b) % 360;
        return d > 180 ? 360 - d : d;
    }

    // Neighbor-aware activity color. Adjacent segments with different keys never share
    // a hue closer than 40 degrees to the previous segment's base hue.
    inline Hsl colorFor(const std::optional<std::string>& appName, const std::optional<std::string>& windowTitle,
        const std::optional<std::string>& prevAppName, const std::optional<std::string>& prevWindowTitle, bool hasPrev)
    {
        Hsl out;
        if (!appName || appName->empty())
        {
            out.neutral = true;
            return out;
        }

        const std::string key = *appName + "::" + windowTitle.value_or("");
        const int32_t hash = activityHash(key);
        int hue = hueOf(hash);

        if (hasPrev)
        {
            const std::string prevKey = prevAppName.value_or("") + "::" + prevWindowTitle.value_or("");
            if (prevKey != key)
            {
                const int prevHue = hueOf(activityHash(prevKey));
                const int diff = std::abs(hue - prevHue);
                if (diff < 40 || diff > 320)
                    hue = (prevHue + 60 + std::abs(hash % 120)) % 360;
            }
        }
        out.hue = hue;
        return out;
    }

    inline uint32_t toRGBA(const Hsl& c, uint8_t alpha = 255)
    {
        if (c.neutral)
            return (kNeutralGray & 0x00FFFFFFu) | (uint32_t(alpha) << 24);

        const double s = std::clamp(c.saturation, 0.0, 100.0) / 100.0;
        const double l = std::clamp(c.lightness, 0.0, 100.0) / 100.0;
        const double h = double(((c.hue % 360) + 360) % 360);

        const double chroma = (1.0 - std::abs(2.0 * l - 1.0)) * s;
        const double hp = h / 60.0;
        const double x = chroma * (1.0 - std::abs(std::fmod(hp, 2.0) - 1.0));
        double r = 0, g = 0, b = 0;
        if      (hp < 1.0) { r = chroma; g = x; }
        else if (hp < 2.0) { r = x; g = chroma; }
        else if (hp < 3.0) { g = chroma; b = x; }
        else if (hp < 4.0) { g = x; b = chroma; }
        else if (hp < 5.0) { r = x; b = chroma; }
        else               { r = chroma; b = x; }
        const double m = l - chroma / 2.0;

        auto ch = [&](double v) { return uint8_t(std::clamp(std::lround((v + m) * 255.0), 0L, 255L)); };
        return packRGBA(ch(r), ch(g), ch(b), alpha);
    }

    inline uint32_t withAlpha(uint32_t c, uint8_t alpha)
    {
        return (c & 0x00FFFFFFu) | (uint32_t(alpha) << 24);
    }

    inline uint32_t lighten(uint32_t c, int delta)
    {
        const int r = std::clamp(int((c >> 0) & 255) + delta, 0, 255);
        const int g = std::clamp(int((c >> 8) & 255) + delta, 0, 255);
        const int b = std::clamp(int((c >> 16) & 255) + delta, 0, 255);
        return packRGBA(uint8_t(r), uint8_t(g), uint8_t(b), uint8_t((c >> 24) & 255));
    }
}
