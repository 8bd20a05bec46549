#pragma once
#include <chrono>
#include <optional>
#include <string>
#include <date/tz.h>

// "now" plus the zone clock strings are displayed in. Views are pure
// functions of (departures, TimeContext).
struct TimeContext
{
    std::chrono::system_clock::time_point now;
    date::time_zone const* zone = nullptr;   // nullptr displays UTC

    static TimeContext current(date::time_zone const* zone);
};

// A parsed ISO-8601 instant. Without a "Z" or numeric offset the upstream
// value is naive wall-clock time and stays that way.
struct Timestamp
{
    date::local_time<std::chrono::milliseconds> wallClock;
    std::optional<std::chrono::minutes> utcOffset;

    [[nodiscard]] bool isZoned() const noexcept { return utcOffset.has_value(); }
    [[nodiscard]] date::sys_time<std::chrono::milliseconds> utc() const;
};

// None of these throw: unparsable input degrades to absent (or 0 minutes).
class TimeMath
{
public:
    static std::optional<Timestamp> parse(std::string const& text);

    static std::optional<int> delayMinutes(std::optional<std::string> const& scheduled,
                                           std::optional<std::string> const& expected);

    static int minutesUntil(std::optional<std::string> const& expected, TimeContext const& time);

    static std::optional<std::string> formatClock(std::optional<std::string> const& timestamp,
                                                  date::time_zone const* zone);

private:
    static bool readOffset(std::string const& rest, std::chrono::minutes& offset);
    static date::local_time<std::chrono::milliseconds> localNow(TimeContext const& time);
};
