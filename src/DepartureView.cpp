#include "DepartureView.hpp"

using nlohmann::json;

namespace
{
json orNull(std::optional<std::string> const& value)
{
    return value ? json(*value) : json(nullptr);
}
}

json DepartureAttributes::toJson() const
{
    json out = {
        {"line", orNull(line)},
        {"destination", orNull(destination)},
        {"scheduled_time", orNull(scheduledTime)},
        {"expected_time", orNull(expectedTime)},
        {"time_formatted", orNull(timeFormatted)},
        {"minutes_until", minutesUntil},
        {"transport_mode", orNull(transportMode)},
        {"real_time", realTime},
        {"delay_minutes", delayMinutes},
        {"canceled", canceled},
        {"platform", orNull(platform)},
        {"agency", agency},
        {"direction", orNull(direction)},
        {"state", orNull(state)},
        {"stop_area", orNull(stopArea)},
    };

    if (!deviations.empty())
        out["deviations"] = deviations;

    return out;
}

json Presentation::attributesJson() const
{
    if (attributes)
        return attributes->toJson();

    json list = json::array();
    for (auto const& a : upcoming)
        list.push_back(a.toJson());

    return json{{"upcoming", list}};
}

// The nested journey state is authoritative; the top-level state is only
// reported as an attribute.
bool DepartureView::isCancelled(Departure const& d)
{
    return d.journeyState && *d.journeyState == "CANCELLED";
}

bool DepartureView::isDelayed(Departure const& d)
{
    auto delay = TimeMath::delayMinutes(d.scheduled, d.expected);
    return delay && *delay > 0;
}

DepartureAttributes DepartureView::attributesOf(Departure const& d, TimeContext const& time)
{
    DepartureAttributes a;
    a.line          = d.line;
    a.destination   = d.destination;
    a.scheduledTime = d.scheduled;
    a.expectedTime  = d.expected;
    a.timeFormatted = TimeMath::formatClock(d.expected, time.zone);
    a.minutesUntil  = TimeMath::minutesUntil(d.expected, time);
    if (d.transportMode)
        a.transportMode = toString(*d.transportMode);
    a.realTime      = d.predictionState && *d.predictionState == "NORMAL";
    a.delayMinutes  = TimeMath::delayMinutes(d.scheduled, d.expected).value_or(0);
    a.canceled      = isCancelled(d);
    a.platform      = d.platform;
    a.agency        = AGENCY;
    a.direction     = d.direction;
    a.state         = d.state;
    a.stopArea      = d.stopArea;
    a.deviations    = d.deviations;
    return a;
}

std::string DepartureView::positionLabel(std::size_t index)
{
    switch (index)
    {
        case 0: return "Next";
        case 1: return "2nd";
        case 2: return "3rd";
        default: return std::to_string(index + 1) + "th";
    }
}

std::string DepartureView::policyName(ViewPolicy const& policy)
{
    if (std::holds_alternative<NextPolicy>(policy))
        return "next";
    if (std::holds_alternative<NextActivePolicy>(policy))
        return "next-active";
    return "slots";
}

std::optional<std::string> DepartureView::countdown(Departure const& d, TimeContext const& time)
{
    if (!d.expected || !TimeMath::parse(*d.expected))
        return d.display;

    int minutes = TimeMath::minutesUntil(d.expected, time);
    if (minutes == 0)
        return NOW_MARKER;
    if (minutes < 60)
        return std::to_string(minutes) + " min";
    return TimeMath::formatClock(d.expected, time.zone);
}

std::vector<Presentation> DepartureView::slots(std::vector<Departure> const& departures,
                                               std::size_t count,
                                               TimeContext const& time)
{
    std::vector<Presentation> out;
    out.reserve(count);

    for (std::size_t i = 0; i < count; ++i)
    {
        Presentation p;
        p.label = positionLabel(i);

        if (i < departures.size())
        {
            Departure const& d = departures[i];
            p.value      = d.display;
            p.available  = true;
            p.delayed    = isDelayed(d);
            p.attributes = attributesOf(d, time);
        }

        out.push_back(std::move(p));
    }

    return out;
}

Presentation DepartureView::next(std::vector<Departure> const& departures, TimeContext const& time)
{
    Presentation p;
    p.label = "Next";

    for (auto const& d : departures)
        p.upcoming.push_back(attributesOf(d, time));

    if (!departures.empty())
    {
        p.value     = departures.front().display;
        p.available = true;
        p.delayed   = isDelayed(departures.front());
    }

    return p;
}

Presentation DepartureView::nextActive(std::vector<Departure> const& departures, TimeContext const& time)
{
    Presentation p;
    p.label     = "Next active";
    p.available = !departures.empty();

    for (auto const& d : departures)
        p.upcoming.push_back(attributesOf(d, time));

    for (auto const& d : departures)
    {
        if (isCancelled(d))
            continue;

        p.value   = countdown(d, time);
        p.delayed = isDelayed(d);
        break;
    }

    return p;
}

std::vector<Presentation> DepartureView::derive(std::vector<Departure> const& departures,
                                                ViewPolicy const& policy,
                                                TimeContext const& time)
{
    if (auto const* s = std::get_if<SlotsPolicy>(&policy))
        return slots(departures, s->count, time);

    if (std::holds_alternative<NextPolicy>(policy))
        return {next(departures, time)};

    return {nextActive(departures, time)};
}

std::vector<Presentation> DepartureView::unavailable(ViewPolicy const& policy)
{
    std::vector<Presentation> out = derive({}, policy, TimeContext{});
    for (auto& p : out)
        p.available = false;
    return out;
}
