#pragma once
#include <vector>
#include "FilterSpec.hpp"
#include "Types.hpp"

// Narrows a departure list by mode, then direction, then line. Each pass
// keeps upstream order; records are copied, never modified.
class DepartureFilter
{
public:
    static std::vector<Departure> apply(std::vector<Departure> const& raw, FilterSpec const& spec);

private:
    static bool modeMatches(Departure const& d, FilterSpec const& spec);
    static bool directionMatches(Departure const& d, std::string const& code);
    static bool lineMatches(Departure const& d, std::vector<std::string> const& lines);
};
