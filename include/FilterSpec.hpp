#pragma once
#include <set>
#include <string>
#include <vector>
#include "Types.hpp"

struct FilterSpec
{
    std::set<TransportMode> modes{TransportMode::Train};
    std::string directionCode;        // empty = every direction
    std::vector<std::string> lines;   // empty = every line

    // " 19, 19S " -> {"19", "19S"}. Blank entries are dropped.
    static std::vector<std::string> parseLines(std::string const& text);
};
