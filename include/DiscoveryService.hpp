#pragma once
#include <string>
#include <vector>
#include <utility>
#include <boost/asio/awaitable.hpp>
#include "DepartureSource.hpp"
#include "Types.hpp"

struct SiteChoice
{
    Site site;
    std::string label;   // "name", or "name (id)" when the name is not unique
};

// Lookups used while configuring a target. Failures surface as
// DiscoveryError for the user to correct; nothing is retried.
class DiscoveryService
{
public:
    explicit DiscoveryService(DepartureSource& source);

    boost::asio::awaitable<std::vector<Site>> listSites();
    boost::asio::awaitable<std::vector<SiteChoice>> searchSites(std::string const& term);
    boost::asio::awaitable<std::vector<LineOption>> discoverLines(std::string const& siteId, TransportMode mode);
    boost::asio::awaitable<std::vector<DirectionOption>> discoverDirections(std::string const& siteId,
                                                                           TransportMode mode,
                                                                           std::string const& line = {});

    // Pure projections over an already fetched departures page.
    static std::vector<SiteChoice> matchSites(std::vector<Site> const& sites, std::string const& term);
    static std::vector<LineOption> uniqueLines(std::vector<Departure> const& departures, TransportMode mode);
    static std::vector<DirectionOption> uniqueDirections(std::vector<Departure> const& departures,
                                                         TransportMode mode,
                                                         std::string const& line);

private:
    boost::asio::awaitable<std::vector<Departure>> fetchPage(std::string const& siteId);

    DepartureSource& source;
    std::vector<Site> siteCache;
};
