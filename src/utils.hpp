#pragma once

#include <imgui.h>

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <cstdio>
#include <string>

// Human span for the status bar: "850 ms", "12.5 s", "3 min 20 s", "5 h 02 min", "12.3 d"
inline std::string fmtSpanMs(double ms)
{
    // safe entry
    if (!std::isfinite(ms) || ms < 0.0) ms = 0.0;

    char buf[64];
    if (ms < 1e3)
    {
        std::snprintf(buf, sizeof(buf), "%.0f ms", ms);
        return buf;
    }
    const double s = ms / 1e3;
    if (s < 60.0)
    {
        if (s >= 10.0) std::snprintf(buf, sizeof(buf), "%.1f s", s);
        else           std::snprintf(buf, sizeof(buf), "%.2f s", s);
        return buf;
    }
    if (s < 3600.0)
    {
        const uint64_t total = uint64_t(std::llround(s));
        std::snprintf(buf, sizeof(buf), "%llu min %02llu s",
            (unsigned long long)(total / 60), (unsigned long long)(total % 60));
        return buf;
    }
    if (s < 86400.0)
    {
        const uint64_t total = uint64_t(std::llround(s / 60.0));
        std::snprintf(buf, sizeof(buf), "%llu h %02llu min",
            (unsigned long long)(total / 60), (unsigned long long)(total % 60));
        return buf;
    }
    std::snprintf(buf, sizeof(buf), "%.1f d", s / 86400.0);
    return buf;
}

inline std::string elideToWidth(const std::string& s, float maxPx)
{
    if (maxPx <= 0.f || s.empty()) return {};
    if (ImGui::CalcTextSize(s.c_str()).x <= maxPx) return s;
    static constexpr const char* dots = "...";
    float wd = ImGui::CalcTextSize(dots).x;
    if (wd >= maxPx) return {};
    int lo = 0, hi = int(s.size());
    while (lo < hi) {
        int mid = (lo + hi + 1) / 2;
        // never cut inside a UTF-8 sequence
        while (mid > 0 && mid < int(s.size()) && (static_cast<unsigned char>(s[mid]) & 0xC0) == 0x80) --mid;
        if (mid <= lo) break;
        std::string st = s.substr(0, mid) + dots;
        if (ImGui::CalcTextSize(st.c_str()).x <= maxPx) lo = mid; else hi = mid - 1;
    }
    return s.substr(0, lo) + dots;
}

// First UTF-8 character of `s`, uppercased when ASCII. "?" when empty.
inline std::string initialOf(const std::string& s)
{
    if (s.empty()) return "?";
    const unsigned char c0 = static_cast<unsigned char>(s[0]);
    std::size_t n = 1;
    if      ((c0 & 0xE0) == 0xC0) n = 2;
    else if ((c0 & 0xF0) == 0xE0) n = 3;
    else if ((c0 & 0xF8) == 0xF0) n = 4;
    if (n == 1)
        return std::string(1, (c0 >= 'a' && c0 <= 'z') ? char(c0 - 'a' + 'A') : char(c0));
    return s.substr(0, std::min(n, s.size()));
}

inline bool pointInRect(const ImVec2& p, const ImVec2& a, const ImVec2& b)
{
    return p.x >= a.x && p.x < b.x && p.y >= a.y && p.y < b.y;
}
