#pragma once
#include <chrono>
#include <optional>
#include <string>
#include <vector>

enum class TransportMode
{
    Train,
    Metro,
    Bus,
    Tram,
    Ship,
    Ferry
};

std::string toString(TransportMode mode);
std::optional<TransportMode> transportModeFromString(std::string const& text);

// One upstream departure record. Every field is optional because the API
// omits keys freely between payload variants.
struct Departure
{
    std::optional<std::string> line;             // line.designation
    std::optional<TransportMode> transportMode;  // line.transport_mode
    std::optional<std::string> groupOfLines;     // line.group_of_lines
    std::optional<std::string> destination;
    std::optional<std::string> direction;
    std::optional<std::string> directionCode;    // numeric upstream, kept as text
    std::optional<std::string> scheduled;
    std::optional<std::string> expected;
    std::optional<std::string> display;
    std::optional<std::string> state;            // top-level lifecycle state
    std::optional<std::string> journeyState;
    std::optional<std::string> predictionState;
    std::optional<std::string> platform;         // stop_point.designation
    std::optional<std::string> stopArea;         // stop_area.name
    std::vector<std::string> deviations;
};

struct DepartureSnapshot
{
    std::vector<Departure> departures;
    std::chrono::system_clock::time_point fetchedAt;
};

struct Site
{
    std::string id;
    std::string name;
};

struct LineOption
{
    std::string designation;
    std::string groupOfLines;
};

struct DirectionOption
{
    std::string code;
    std::string destination;
};
