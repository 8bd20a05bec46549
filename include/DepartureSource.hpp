#pragma once
#include <string>
#include <utility>
#include <boost/asio/awaitable.hpp>

// Supplies raw response bodies. Implementations throw FetchError on any
// transport failure or non-2xx status; the body is returned undecoded.
class DepartureSource
{
public:
    virtual ~DepartureSource() = default;

    virtual boost::asio::awaitable<std::string> fetchDepartures(std::string const& siteId) = 0;
    virtual boost::asio::awaitable<std::string> fetchSites() = 0;
};
