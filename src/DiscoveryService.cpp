#include <algorithm>
#include <locale>
#include <map>
#include <boost/locale/conversion.hpp>
#include <boost/locale/encoding_utf.hpp>
#include <boost/locale/generator.hpp>
#include "DiscoveryService.hpp"
#include "Errors.hpp"
#include "Parser.hpp"

namespace
{
// Stop names are UTF-8 and full of Å, Ä and Ö.
std::locale const& utf8Locale()
{
    static std::locale const locale = boost::locale::generator()("sv_SE.UTF-8");
    return locale;
}

std::string lowered(std::string const& text)
{
    return boost::locale::to_lower(text, utf8Locale());
}

std::size_t characterCount(std::string const& text)
{
    return boost::locale::conv::utf_to_utf<char32_t>(text).size();
}

std::string trimmed(std::string const& text)
{
    auto first = text.find_first_not_of(" \t\r\n");
    if (first == std::string::npos)
        return {};
    auto last = text.find_last_not_of(" \t\r\n");
    return text.substr(first, last - first + 1);
}
}

DiscoveryService::DiscoveryService(DepartureSource& src)
    : source(src)
{
}

boost::asio::awaitable<std::vector<Site>> DiscoveryService::listSites()
{
    if (!siteCache.empty())
        co_return siteCache;

    try
    {
        std::string data = co_await source.fetchSites();
        siteCache = Parser::extractSites(data);
    }
    catch (FetchError const& e)
    {
        throw DiscoveryError(DiscoveryError::Reason::CannotConnect, e.what());
    }
    catch (ParseError const& e)
    {
        throw DiscoveryError(DiscoveryError::Reason::CannotConnect, e.what());
    }

    co_return siteCache;
}

boost::asio::awaitable<std::vector<SiteChoice>> DiscoveryService::searchSites(std::string const& term)
{
    // Reject a short term before touching the network.
    if (characterCount(trimmed(term)) < 2)
        throw DiscoveryError(DiscoveryError::Reason::SearchTooShort, "Search term must be at least 2 characters");

    std::vector<Site> sites = co_await listSites();
    co_return matchSites(sites, term);
}

std::vector<SiteChoice> DiscoveryService::matchSites(std::vector<Site> const& sites, std::string const& term)
{
    std::string needle = lowered(trimmed(term));
    if (characterCount(needle) < 2)
        throw DiscoveryError(DiscoveryError::Reason::SearchTooShort, "Search term must be at least 2 characters");

    std::vector<Site> matches;
    for (auto const& site : sites)
    {
        if (lowered(site.name).find(needle) != std::string::npos)
            matches.push_back(site);
    }

    if (matches.empty())
        throw DiscoveryError(DiscoveryError::Reason::NoMatches, "No stops match '" + trimmed(term) + "'");

    std::stable_sort(matches.begin(), matches.end(),
                     [](Site const& a, Site const& b) { return a.name < b.name; });

    std::map<std::string, int> nameCounts;
    for (auto const& site : matches)
        ++nameCounts[site.name];

    std::vector<SiteChoice> out;
    out.reserve(matches.size());
    for (auto const& site : matches)
    {
        std::string label = nameCounts[site.name] > 1 ? site.name + " (" + site.id + ")" : site.name;
        out.push_back(SiteChoice{site, label});
    }

    return out;
}

boost::asio::awaitable<std::vector<Departure>> DiscoveryService::fetchPage(std::string const& siteId)
{
    std::vector<Departure> departures;

    try
    {
        std::string data = co_await source.fetchDepartures(siteId);
        departures = Parser::extractDepartures(data);
    }
    catch (FetchError const& e)
    {
        throw DiscoveryError(DiscoveryError::Reason::CannotConnect, e.what());
    }
    catch (ParseError const& e)
    {
        throw DiscoveryError(DiscoveryError::Reason::CannotConnect, e.what());
    }

    co_return departures;
}

boost::asio::awaitable<std::vector<LineOption>> DiscoveryService::discoverLines(std::string const& siteId, TransportMode mode)
{
    std::vector<Departure> departures = co_await fetchPage(siteId);
    co_return uniqueLines(departures, mode);
}

boost::asio::awaitable<std::vector<DirectionOption>> DiscoveryService::discoverDirections(std::string const& siteId,
                                                                                          TransportMode mode,
                                                                                          std::string const& line)
{
    std::vector<Departure> departures = co_await fetchPage(siteId);
    co_return uniqueDirections(departures, mode, line);
}

std::vector<LineOption> DiscoveryService::uniqueLines(std::vector<Departure> const& departures, TransportMode mode)
{
    std::vector<LineOption> lines;

    for (auto const& d : departures)
    {
        if (d.transportMode != mode || !d.line || d.line->empty())
            continue;

        bool seen = std::any_of(lines.begin(), lines.end(),
                                [&](LineOption const& l) { return l.designation == *d.line; });
        if (!seen)
            lines.push_back(LineOption{*d.line, d.groupOfLines.value_or("")});
    }

    return lines;
}

std::vector<DirectionOption> DiscoveryService::uniqueDirections(std::vector<Departure> const& departures,
                                                                TransportMode mode,
                                                                std::string const& line)
{
    std::vector<DirectionOption> directions;

    for (auto const& d : departures)
    {
        if (d.transportMode != mode)
            continue;
        if (!line.empty() && d.line != line)
            continue;
        if (!d.directionCode || d.directionCode->empty() || !d.destination || d.destination->empty())
            continue;

        bool seen = std::any_of(directions.begin(), directions.end(),
                                [&](DirectionOption const& o) { return o.code == *d.directionCode; });
        if (!seen)
            directions.push_back(DirectionOption{*d.directionCode, *d.destination});
    }

    return directions;
}
