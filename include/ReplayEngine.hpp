#pragma once

#include <cstdint>
#include <deque>
#include <fstream>
#include <map>
#include <mutex>
#include <string>
#include "DepartureSource.hpp"

// Recording format, one chunk per fetched departures body:
//   uint64 unix time | uint32 site id size | uint32 body size | site id | body
// Integers are written in host byte order.

// Passes every call through to another source and appends each departures
// body to the recording file.
class Recorder : public DepartureSource
{
public:
    Recorder(DepartureSource& inner, std::string const& filename);

    boost::asio::awaitable<std::string> fetchDepartures(std::string const& siteId) override;
    boost::asio::awaitable<std::string> fetchSites() override;

private:
    void writeChunk(std::string const& siteId, std::string const& data);

    DepartureSource& inner;
    std::ofstream file;
    std::mutex mutex;
};

// Serves recorded bodies per site in recording order and pins VirtualClock
// to each chunk's timestamp. Throws FetchError once a site runs out.
class ReplaySource : public DepartureSource
{
public:
    explicit ReplaySource(std::string const& filename);

    boost::asio::awaitable<std::string> fetchDepartures(std::string const& siteId) override;
    boost::asio::awaitable<std::string> fetchSites() override;

    [[nodiscard]] std::size_t remaining(std::string const& siteId) const;
    [[nodiscard]] std::size_t chunkCount() const noexcept { return total; }

private:
    struct Chunk
    {
        std::uint64_t timestamp;
        std::string data;
    };

    static bool readChunkHeader(std::ifstream& file, std::uint64_t& timestamp, std::uint32_t& siteSize, std::uint32_t& size);

    std::map<std::string, std::deque<Chunk>> chunks;
    std::size_t total = 0;
};
