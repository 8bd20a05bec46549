#include <algorithm>
#include <cctype>
#include <limits>
#include <sstream>
#include "TimeMath.hpp"
#include "VirtualClock.hpp"

using namespace date;
using std::chrono::milliseconds;
using std::chrono::minutes;

namespace
{
int clampToInt(minutes value)
{
    auto count = std::clamp<minutes::rep>(value.count(), std::numeric_limits<int>::min(),
                                          std::numeric_limits<int>::max());
    return static_cast<int>(count);
}
}

TimeContext TimeContext::current(date::time_zone const* zone)
{
    return TimeContext{VirtualClock::now(), zone};
}

sys_time<milliseconds> Timestamp::utc() const
{
    return sys_time<milliseconds>{wallClock.time_since_epoch() - utcOffset.value_or(minutes{0})};
}

bool TimeMath::readOffset(std::string const& rest, minutes& offset)
{
    if (rest == "Z" || rest == "z")
    {
        offset = minutes{0};
        return true;
    }

    if (rest.size() < 3 || (rest[0] != '+' && rest[0] != '-'))
        return false;

    std::string digits;
    for (std::size_t i = 1; i < rest.size(); ++i)
    {
        if (rest[i] == ':' && i == 3)
            continue;
        if (!std::isdigit(static_cast<unsigned char>(rest[i])))
            return false;
        digits += rest[i];
    }

    if (digits.size() != 2 && digits.size() != 4)
        return false;

    int hh = std::stoi(digits.substr(0, 2));
    int mm = digits.size() == 4 ? std::stoi(digits.substr(2, 2)) : 0;
    if (hh > 23 || mm > 59)
        return false;

    offset = minutes{hh * 60 + mm};
    if (rest[0] == '-')
        offset = -offset;
    return true;
}

std::optional<Timestamp> TimeMath::parse(std::string const& text)
{
    if (text.size() < 19)
        return std::nullopt;

    std::string head = text.substr(0, 19);
    if (head[10] == ' ')
        head[10] = 'T';

    local_seconds wall;
    std::istringstream in(head);
    in >> date::parse("%FT%T", wall);
    if (in.fail() || in.peek() != std::istringstream::traits_type::eof())
        return std::nullopt;

    std::size_t pos = 19;
    milliseconds fraction{0};
    if (pos < text.size() && text[pos] == '.')
    {
        ++pos;
        int scale = 100;
        std::size_t digits = 0;
        while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos])))
        {
            if (scale > 0)
            {
                fraction += milliseconds{(text[pos] - '0') * scale};
                scale /= 10;
            }
            ++pos;
            ++digits;
        }
        if (digits == 0)
            return std::nullopt;
    }

    Timestamp ts;
    ts.wallClock = wall + fraction;

    std::string rest = text.substr(pos);
    if (!rest.empty())
    {
        minutes offset{0};
        if (!readOffset(rest, offset))
            return std::nullopt;
        ts.utcOffset = offset;
    }

    return ts;
}

std::optional<int> TimeMath::delayMinutes(std::optional<std::string> const& scheduled,
                                          std::optional<std::string> const& expected)
{
    if (!scheduled || !expected)
        return std::nullopt;

    auto from = parse(*scheduled);
    auto to = parse(*expected);
    if (!from || !to)
        return std::nullopt;

    // A naive and a zoned instant cannot be subtracted meaningfully.
    if (from->isZoned() != to->isZoned())
        return std::nullopt;

    milliseconds diff = from->isZoned()
        ? to->utc() - from->utc()
        : to->wallClock - from->wallClock;

    return clampToInt(std::chrono::duration_cast<minutes>(diff));
}

local_time<milliseconds> TimeMath::localNow(TimeContext const& time)
{
    auto now = date::floor<milliseconds>(time.now);
    if (time.zone == nullptr)
        return local_time<milliseconds>{now.time_since_epoch()};
    return time.zone->to_local(now);
}

int TimeMath::minutesUntil(std::optional<std::string> const& expected, TimeContext const& time)
{
    if (!expected)
        return 0;

    auto ts = parse(*expected);
    if (!ts)
        return 0;

    milliseconds delta = ts->isZoned()
        ? ts->utc() - date::floor<milliseconds>(time.now)
        : ts->wallClock - localNow(time);

    minutes mins = date::floor<minutes>(delta);
    if (mins <= minutes{0})
        return 0;
    return clampToInt(mins);
}

std::optional<std::string> TimeMath::formatClock(std::optional<std::string> const& timestamp,
                                                 date::time_zone const* zone)
{
    if (!timestamp)
        return std::nullopt;

    auto ts = parse(*timestamp);
    if (!ts)
        return std::nullopt;

    local_time<minutes> wall = date::floor<minutes>(ts->wallClock);
    if (ts->isZoned())
    {
        auto utc = date::floor<minutes>(ts->utc());
        if (zone)
            wall = date::floor<minutes>(zone->to_local(utc));
        else
            wall = local_time<minutes>{utc.time_since_epoch()};
    }

    return date::format("%H:%M", wall);
}
