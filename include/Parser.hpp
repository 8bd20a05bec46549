#pragma once
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "Types.hpp"

// Decodes SL Transport API bodies. Throws ParseError when the body is not
// JSON or the top level has the wrong shape; individual records with odd
// fields are kept with those fields absent.
class Parser
{
public:
    static std::vector<Departure> extractDepartures(std::string const& data);
    static std::vector<Site> extractSites(std::string const& data);

private:
    static nlohmann::json parseBody(std::string const& data);
    static Departure toDeparture(nlohmann::json const& item);
    static std::optional<std::string> text(nlohmann::json const& obj, char const* key);
    static nlohmann::json const* child(nlohmann::json const& obj, char const* key);
};
