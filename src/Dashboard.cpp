#include <iomanip>
#include <sstream>
#include "Dashboard.hpp"

using namespace date;
using std::chrono::seconds;

std::string Dashboard::buildHeader(std::string const& title,
                                   std::shared_ptr<DepartureSnapshot const> const& snapshot,
                                   std::optional<std::string> const& lastError,
                                   date::time_zone const* zone)
{
    std::stringstream ss;
    ss << "=== " << title << " ===\n";

    if (snapshot)
    {
        auto fetched = date::floor<seconds>(snapshot->fetchedAt);
        ss << "Updated: ";
        if (zone)
            ss << date::format("%H:%M:%S", date::make_zoned(zone, fetched));
        else
            ss << date::format("%H:%M:%S UTC", fetched);
        ss << "\n";
    }
    else
    {
        ss << "Updated: never\n";
    }

    if (lastError)
        ss << "!! Last refresh failed: " << *lastError << " (showing previous data)\n";

    return ss.str();
}

std::string Dashboard::formatDelay(DepartureAttributes const& a)
{
    if (a.canceled)
        return "CANCELLED";
    if (a.delayMinutes > 0)
        return "+" + std::to_string(a.delayMinutes) + "m";
    if (a.delayMinutes < 0)
        return std::to_string(a.delayMinutes) + "m";
    return a.realTime ? "on time" : "";
}

std::string Dashboard::buildRow(std::string const& label, DepartureAttributes const& a)
{
    std::stringstream ss;
    ss << "  " << std::left << std::setw(12) << label
       << std::setw(6)  << a.line.value_or("?")
       << std::setw(28) << a.destination.value_or("?")
       << std::setw(7)  << a.timeFormatted.value_or("--:--")
       << std::setw(8)  << ("[" + a.platform.value_or("-") + "]")
       << formatDelay(a) << "\n";

    for (auto const& message : a.deviations)
        ss << "      ! " << message << "\n";

    return ss.str();
}

std::string Dashboard::buildPresentation(Presentation const& p)
{
    std::stringstream ss;

    if (!p.available)
    {
        ss << "  " << std::left << std::setw(12) << p.label << "(no departure)\n";
        return ss.str();
    }

    if (p.attributes)
    {
        std::string label = p.label + ": " + p.value.value_or("-");
        ss << buildRow(label, *p.attributes);
        return ss.str();
    }

    ss << "  " << p.label << ": " << p.value.value_or("no active departure")
       << (p.delayed ? " (delayed)" : "") << "\n";

    std::size_t index = 0;
    for (auto const& a : p.upcoming)
        ss << buildRow(DepartureView::positionLabel(index++), a);

    return ss.str();
}

std::string Dashboard::generate(std::string const& title,
                                std::vector<Presentation> const& presentations,
                                std::shared_ptr<DepartureSnapshot const> const& snapshot,
                                std::optional<std::string> const& lastError,
                                date::time_zone const* zone)
{
    std::stringstream ss;
    ss << buildHeader(title, snapshot, lastError, zone);

    for (auto const& p : presentations)
        ss << buildPresentation(p);

    return ss.str();
}

std::string Dashboard::generateJson(std::string const& title,
                                    std::vector<Presentation> const& presentations,
                                    std::optional<std::string> const& lastError)
{
    nlohmann::json entries = nlohmann::json::array();
    for (auto const& p : presentations)
    {
        entries.push_back({
            {"name", p.label},
            {"state", p.value ? nlohmann::json(*p.value) : nlohmann::json(nullptr)},
            {"available", p.available},
            {"delayed", p.delayed},
            {"attributes", p.attributesJson()},
        });
    }

    nlohmann::json doc = {
        {"target", title},
        {"last_error", lastError ? nlohmann::json(*lastError) : nlohmann::json(nullptr)},
        {"entities", entries},
    };

    return doc.dump(2);
}
