#include "Types.hpp"

std::string toString(TransportMode mode)
{
    switch (mode)
    {
        case TransportMode::Train: return "TRAIN";
        case TransportMode::Metro: return "METRO";
        case TransportMode::Bus:   return "BUS";
        case TransportMode::Tram:  return "TRAM";
        case TransportMode::Ship:  return "SHIP";
        case TransportMode::Ferry: return "FERRY";
    }
    return "UNKNOWN";
}

std::optional<TransportMode> transportModeFromString(std::string const& text)
{
    if (text == "TRAIN") return TransportMode::Train;
    if (text == "METRO") return TransportMode::Metro;
    if (text == "BUS")   return TransportMode::Bus;
    if (text == "TRAM")  return TransportMode::Tram;
    if (text == "SHIP")  return TransportMode::Ship;
    if (text == "FERRY") return TransportMode::Ferry;
    return std::nullopt;
}
