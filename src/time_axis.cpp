#include "time_axis.hpp"

#include <array>
#include <cmath>
#include <cstdio>
#include <ctime>

namespace axis
{
    namespace
    {
        constexpr std::array<int64_t, 38> kLadder = {
            10, 20, 50, 100, 200, 500,                                              // ms
            kSecondMs, 2 * kSecondMs, 5 * kSecondMs, 10 * kSecondMs, 15 * kSecondMs, 30 * kSecondMs,
            kMinuteMs, 2 * kMinuteMs, 5 * kMinuteMs, 15 * kMinuteMs, 30 * kMinuteMs,
            kHourMs, 2 * kHourMs, 6 * kHourMs, 12 * kHourMs,
            kDayMs, 2 * kDayMs, 7 * kDayMs, 30 * kDayMs, 90 * kDayMs, 180 * kDayMs,
            kYearMs, 2 * kYearMs, 5 * kYearMs, 10 * kYearMs,
            25 * kYearMs, 50 * kYearMs, 100 * kYearMs, 250 * kYearMs, 500 * kYearMs, 1000 * kYearMs, 2500 * kYearMs
        };

        constexpr const char* kMonths[12] = {
            "Jan", "Feb", "Mar", "Apr", "May", "Jun", "Jul", "Aug", "Sep", "Oct", "Nov", "Dec"
        };

        bool toCalendar(double timeMs, bool utc, std::tm& out, int& millis)
        {
            if (!std::isfinite(timeMs))
                return false;
            const double secs = std::floor(timeMs / 1000.0);
            millis = int(std::llround(timeMs - secs * 1000.0));
            if (millis >= 1000) millis = 999;
            const std::time_t t = static_cast<std::time_t>(secs);
            return (utc ? gmtime_r(&t, &out) : localtime_r(&t, &out)) != nullptr;
        }
    }

    std::span<const int64_t> tickLadder()
    {
        return kLadder;
    }

    int64_t pickTickInterval(double zoom)
    {
        if (!(zoom > 0.0))
            return kLadder.back();
        const double targetMs = kMinTickSpacingPx / zoom;
        for (int64_t step : kLadder)
        {
            if (double(step) >= targetMs)
                return step;
        }
        return kLadder.back();
    }

    std::string formatTick(double timeMs, int64_t stepMs, bool utc)
    {
        std::tm tm{};
        int ms = 0;
        if (!toCalendar(timeMs, utc, tm, ms))
            return {};

        char buf[64];
        if (stepMs >= kYearMs)
            std::snprintf(buf, sizeof(buf), "%d", tm.tm_year + 1900);
        else if (stepMs >= 28 * kDayMs)
            std::snprintf(buf, sizeof(buf), "%s %d", kMonths[tm.tm_mon], tm.tm_year + 1900);
        else if (stepMs >= kDayMs)
            std::snprintf(buf, sizeof(buf), "%s %d", kMonths[tm.tm_mon], tm.tm_mday);
        else if (stepMs >= kHourMs)
            std::snprintf(buf, sizeof(buf), "%d:00", tm.tm_hour);
        else if (stepMs >= kMinuteMs)
            std::snprintf(buf, sizeof(buf), "%d:%02d", tm.tm_hour, tm.tm_min);
        else if (stepMs >= kSecondMs)
            std::snprintf(buf, sizeof(buf), "%d:%02d:%02d", tm.tm_hour, tm.tm_min, tm.tm_sec);
        else
            std::snprintf(buf, sizeof(buf), "%d:%02d:%02d.%03d", tm.tm_hour, tm.tm_min, tm.tm_sec, ms);
        return buf;
    }

    std::string formatDateTime(double timeMs, bool utc)
    {
        std::tm tm{};
        int ms = 0;
        if (!toCalendar(timeMs, utc, tm, ms))
            return {};
        char buf[64];
        std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d %02d:%02d:%02d",
            tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday, tm.tm_hour, tm.tm_min, tm.tm_sec);
        return buf;
    }

    std::vector<Tick> ticksFor(double startMs, double endMs, int64_t stepMs, double centerTime, double zoom, double width, int maxTicks)
    {
        std::vector<Tick> out;
        if (stepMs <= 0 || !(endMs > startMs))
            return out;

        const double step = double(stepMs);
        double t = std::floor(startMs / step) * step;
        for (int count = 0; t < endMs && count < maxTicks; ++count, t += step)
        {
            const double x = width / 2.0 + (t - centerTime) * zoom;
            // slight buffer so labels slide in from the edges
            if (x > -50.0 && x < width + 50.0)
                out.push_back({ t, x });
        }
        return out;
    }
}
