#include "ReplayEngine.hpp"
#include <iostream>
#include <ctime>
#include "Errors.hpp"
#include "VirtualClock.hpp"

Recorder::Recorder(DepartureSource& source, std::string const& filename)
    : inner(source)
    , file(filename, std::ios::binary | std::ios::app)
{
    if (!file.is_open())
        throw ConfigError("Failed to open recording file: " + filename);

    std::cout << "[System] Recording activated. Saving to " << filename << std::endl;
}

void Recorder::writeChunk(std::string const& siteId, std::string const& data)
{
    std::lock_guard<std::mutex> lock(mutex);

    std::uint64_t now = static_cast<std::uint64_t>(std::time(nullptr));
    std::uint32_t siteSize = static_cast<std::uint32_t>(siteId.size());
    std::uint32_t size = static_cast<std::uint32_t>(data.size());

    file.write(reinterpret_cast<const char*>(&now), sizeof(now));
    file.write(reinterpret_cast<const char*>(&siteSize), sizeof(siteSize));
    file.write(reinterpret_cast<const char*>(&size), sizeof(size));
    file.write(siteId.data(), siteSize);
    file.write(data.data(), size);
    file.flush();

    if (!file.good())
        std::cerr << "Recording write failed for site " << siteId << std::endl;
}

boost::asio::awaitable<std::string> Recorder::fetchDepartures(std::string const& siteId)
{
    std::string data = co_await inner.fetchDepartures(siteId);
    writeChunk(siteId, data);
    co_return data;
}

boost::asio::awaitable<std::string> Recorder::fetchSites()
{
    co_return co_await inner.fetchSites();
}

bool ReplaySource::readChunkHeader(std::ifstream& file, std::uint64_t& timestamp, std::uint32_t& siteSize, std::uint32_t& size)
{
    file.read(reinterpret_cast<char*>(&timestamp), sizeof(timestamp));
    file.read(reinterpret_cast<char*>(&siteSize), sizeof(siteSize));
    file.read(reinterpret_cast<char*>(&size), sizeof(size));

    if (file.eof() || !file.good())
        return false;

    return true;
}

ReplaySource::ReplaySource(std::string const& filename)
{
    std::ifstream file(filename, std::ios::binary);
    if (!file.is_open())
        throw ConfigError("Failed to open replay file: " + filename);

    while (file.peek() != EOF)
    {
        std::uint64_t timestamp = 0;
        std::uint32_t siteSize  = 0;
        std::uint32_t size      = 0;

        if (!readChunkHeader(file, timestamp, siteSize, size))
        {
            std::cerr << "[REPLAY] Truncated chunk header, ignoring the rest of " << filename << std::endl;
            break;
        }

        std::string siteId(siteSize, '\0');
        std::string data(size, '\0');
        file.read(siteId.data(), siteSize);
        file.read(data.data(), size);

        if (!file.good())
        {
            std::cerr << "[REPLAY] Truncated chunk body, ignoring the rest of " << filename << std::endl;
            break;
        }

        chunks[siteId].push_back(Chunk{timestamp, std::move(data)});
        ++total;
    }

    std::cout << "[REPLAY] Loaded " << total << " recorded responses for "
              << chunks.size() << " site(s)" << std::endl;
}

boost::asio::awaitable<std::string> ReplaySource::fetchDepartures(std::string const& siteId)
{
    auto it = chunks.find(siteId);
    if (it == chunks.end() || it->second.empty())
        throw FetchError("Replay has no more responses for site " + siteId);

    Chunk chunk = std::move(it->second.front());
    it->second.pop_front();

    std::cout << "[REPLAY] Serving site " << siteId << " (Recorded T=" << chunk.timestamp << ")" << std::endl;
    VirtualClock::set(static_cast<std::time_t>(chunk.timestamp));

    co_return chunk.data;
}

boost::asio::awaitable<std::string> ReplaySource::fetchSites()
{
    throw FetchError("Site lists are not part of a recording");
    co_return std::string{};
}

std::size_t ReplaySource::remaining(std::string const& siteId) const
{
    auto it = chunks.find(siteId);
    return it == chunks.end() ? 0 : it->second.size();
}
