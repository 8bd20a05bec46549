#include <algorithm>
#include <iostream>
#include <sstream>
#include "DepartureFilter.hpp"
#include "Log.hpp"

std::vector<std::string> FilterSpec::parseLines(std::string const& text)
{
    std::vector<std::string> lines;
    std::stringstream ss(text);
    std::string entry;

    while (std::getline(ss, entry, ','))
    {
        auto first = entry.find_first_not_of(" \t\r\n");
        if (first == std::string::npos)
            continue;
        auto last = entry.find_last_not_of(" \t\r\n");
        lines.push_back(entry.substr(first, last - first + 1));
    }

    return lines;
}

bool DepartureFilter::modeMatches(Departure const& d, FilterSpec const& spec)
{
    return d.transportMode && spec.modes.count(*d.transportMode) > 0;
}

bool DepartureFilter::directionMatches(Departure const& d, std::string const& code)
{
    return d.directionCode && *d.directionCode == code;
}

bool DepartureFilter::lineMatches(Departure const& d, std::vector<std::string> const& lines)
{
    if (!d.line)
        return false;
    return std::find(lines.begin(), lines.end(), *d.line) != lines.end();
}

std::vector<Departure> DepartureFilter::apply(std::vector<Departure> const& raw, FilterSpec const& spec)
{
    std::vector<Departure> out;
    out.reserve(raw.size());

    for (auto const& d : raw)
    {
        if (modeMatches(d, spec))
            out.push_back(d);
    }

    if (Log::isVerbose())
        std::cout << "   [Filter] " << raw.size() << " raw -> " << out.size() << " after mode\n";

    if (!spec.directionCode.empty())
    {
        std::erase_if(out, [&](Departure const& d) { return !directionMatches(d, spec.directionCode); });

        if (Log::isVerbose())
            std::cout << "   [Filter] " << out.size() << " after direction " << spec.directionCode << "\n";
    }

    if (!spec.lines.empty())
    {
        std::erase_if(out, [&](Departure const& d) { return !lineMatches(d, spec.lines); });

        if (Log::isVerbose())
            std::cout << "   [Filter] " << out.size() << " after line filter\n";
    }

    return out;
}
