#include "Parser.hpp"
#include "Errors.hpp"

using nlohmann::json;

json Parser::parseBody(std::string const& data)
{
    if (data.empty() || data[0] == '<')
        throw ParseError("Response is not JSON");

    try
    {
        return json::parse(data);
    }
    catch (json::parse_error const& e)
    {
        throw ParseError(std::string("Malformed JSON: ") + e.what());
    }
}

json const* Parser::child(json const& obj, char const* key)
{
    if (!obj.is_object())
        return nullptr;

    auto it = obj.find(key);
    if (it == obj.end() || it->is_null())
        return nullptr;

    return &*it;
}

std::optional<std::string> Parser::text(json const& obj, char const* key)
{
    json const* value = child(obj, key);
    if (!value)
        return std::nullopt;

    if (value->is_string())
        return value->get<std::string>();
    if (value->is_number_unsigned())
        return std::to_string(value->get<std::uint64_t>());
    if (value->is_number_integer())
        return std::to_string(value->get<std::int64_t>());

    return std::nullopt;
}

Departure Parser::toDeparture(json const& item)
{
    Departure d;

    if (json const* line = child(item, "line"))
    {
        d.line         = text(*line, "designation");
        d.groupOfLines = text(*line, "group_of_lines");
        if (auto mode = text(*line, "transport_mode"))
            d.transportMode = transportModeFromString(*mode);
    }

    d.destination   = text(item, "destination");
    d.direction     = text(item, "direction");
    d.directionCode = text(item, "direction_code");
    d.scheduled     = text(item, "scheduled");
    d.expected      = text(item, "expected");
    d.display       = text(item, "display");
    d.state         = text(item, "state");

    if (json const* journey = child(item, "journey"))
    {
        d.journeyState    = text(*journey, "state");
        d.predictionState = text(*journey, "prediction_state");
    }

    if (json const* stopPoint = child(item, "stop_point"))
        d.platform = text(*stopPoint, "designation");

    if (json const* stopArea = child(item, "stop_area"))
        d.stopArea = text(*stopArea, "name");

    if (json const* deviations = child(item, "deviations"); deviations && deviations->is_array())
    {
        for (auto const& dev : *deviations)
        {
            auto message = text(dev, "message");
            if (message && !message->empty())
                d.deviations.push_back(*message);
        }
    }

    return d;
}

std::vector<Departure> Parser::extractDepartures(std::string const& data)
{
    json body = parseBody(data);
    if (!body.is_object())
        throw ParseError("Departures response is not a JSON object");

    json const* list = child(body, "departures");
    if (!list)
        return {};
    if (!list->is_array())
        throw ParseError("'departures' is not an array");

    std::vector<Departure> out;
    out.reserve(list->size());

    for (auto const& item : *list)
    {
        if (!item.is_object())
            continue;
        out.push_back(toDeparture(item));
    }

    return out;
}

std::vector<Site> Parser::extractSites(std::string const& data)
{
    json body = parseBody(data);
    if (!body.is_array())
        throw ParseError("Sites response is not a JSON array");

    std::vector<Site> sites;
    sites.reserve(body.size());

    for (auto const& item : body)
    {
        auto id = text(item, "id");
        if (!id)
            continue;

        auto name = text(item, "name");
        sites.push_back(Site{*id, name ? *name : "Site " + *id});
    }

    return sites;
}
