#pragma once
#include <cstdint>
#include <span>
#include <string>
#include <vector>

namespace axis
{
    constexpr double kMinTickSpacingPx = 120.0;
    constexpr int64_t kSecondMs = 1000;
    constexpr int64_t kMinuteMs = 60 * kSecondMs;
    constexpr int64_t kHourMs = 60 * kMinuteMs;
    constexpr int64_t kDayMs = 24 * kHourMs;
    constexpr int64_t kYearMs = 365 * kDayMs;

    // Fixed interval ladder, 10 ms up to 2500 years
    std::span<const int64_t> tickLadder();

    // Smallest ladder step with step * zoom >= kMinTickSpacingPx (largest step otherwise)
    int64_t pickTickInterval(double zoom);

    // Label for a tick at `timeMs` given the chosen step. Local time unless utc.
    std::string formatTick(double timeMs, int64_t stepMs, bool utc = false);

    // Full local date-time, used by hover tooltips and the info panel
    std::string formatDateTime(double timeMs, bool utc = false);

    struct Tick
    {
        double timeMs;
        double x;
    };

    // Step-aligned ticks covering [startMs, endMs), at most maxTicks
    std::vector<Tick> ticksFor(double startMs, double endMs, int64_t stepMs, double centerTime, double zoom, double width, int maxTicks = 100);
}
