#include <gtest/gtest.h>
#include "Errors.hpp"
#include "Parser.hpp"
#include "TestSupport.hpp"

TEST(ParserTest, ReadsFullRecord)
{
    std::string body = R"({
        "departures": [{
            "destination": "Södertälje centrum",
            "direction": "Södertälje centrum",
            "direction_code": 2,
            "state": "EXPECTED",
            "display": "3 min",
            "scheduled": "2024-01-15T10:00:00",
            "expected": "2024-01-15T10:03:00",
            "journey": {"id": 1, "state": "NORMALPROGRESS", "prediction_state": "NORMAL"},
            "stop_area": {"id": 5011, "name": "Stockholm City", "type": "RAILWSTN"},
            "stop_point": {"id": 5012, "name": "Stockholm City", "designation": "2"},
            "line": {"id": 40, "designation": "40", "transport_mode": "TRAIN", "group_of_lines": "Pendeltåg"},
            "deviations": [{"message": "Reduced service"}, {"importance_level": 2}, {"message": ""}]
        }]
    })";

    auto departures = Parser::extractDepartures(body);
    ASSERT_EQ(departures.size(), 1u);

    Departure const& d = departures.front();
    EXPECT_EQ(d.line, "40");
    EXPECT_EQ(d.transportMode, TransportMode::Train);
    EXPECT_EQ(d.groupOfLines, "Pendeltåg");
    EXPECT_EQ(d.destination, "Södertälje centrum");
    EXPECT_EQ(d.directionCode, "2");
    EXPECT_EQ(d.state, "EXPECTED");
    EXPECT_EQ(d.journeyState, "NORMALPROGRESS");
    EXPECT_EQ(d.predictionState, "NORMAL");
    EXPECT_EQ(d.platform, "2");
    EXPECT_EQ(d.stopArea, "Stockholm City");
    EXPECT_EQ(d.display, "3 min");
    EXPECT_EQ(d.deviations, (std::vector<std::string>{"Reduced service"}));
}

TEST(ParserTest, MissingDeparturesKeyIsEmpty)
{
    EXPECT_TRUE(Parser::extractDepartures(R"({"stop_deviations": []})").empty());
    EXPECT_TRUE(Parser::extractDepartures(R"({"departures": null})").empty());
}

TEST(ParserTest, KeepsUpstreamOrder)
{
    std::string body = departuresJson(
        departureItem("43", "TRAIN", 1, "Nynäshamn") + ","
        + departureItem("17", "METRO", 2, "Åkeshov") + ","
        + departureItem("41", "TRAIN", 1, "Märsta"));

    auto departures = Parser::extractDepartures(body);
    ASSERT_EQ(departures.size(), 3u);
    EXPECT_EQ(departures[0].line, "43");
    EXPECT_EQ(departures[1].line, "17");
    EXPECT_EQ(departures[2].line, "41");
}

TEST(ParserTest, OddFieldsBecomeAbsent)
{
    std::string body = R"({"departures": [
        {"line": {"designation": 19, "transport_mode": "HOVERCRAFT"}, "journey": "gone", "direction_code": "1"},
        42,
        {"line": null, "destination": ["a", "b"], "deviations": {"message": "x"}}
    ]})";

    auto departures = Parser::extractDepartures(body);
    ASSERT_EQ(departures.size(), 2u);

    EXPECT_EQ(departures[0].line, "19");
    EXPECT_FALSE(departures[0].transportMode);
    EXPECT_FALSE(departures[0].journeyState);
    EXPECT_EQ(departures[0].directionCode, "1");

    EXPECT_FALSE(departures[1].line);
    EXPECT_FALSE(departures[1].destination);
    EXPECT_TRUE(departures[1].deviations.empty());
}

TEST(ParserTest, MalformedBodiesThrow)
{
    EXPECT_THROW(Parser::extractDepartures(""), ParseError);
    EXPECT_THROW(Parser::extractDepartures("<html>502 Bad Gateway</html>"), ParseError);
    EXPECT_THROW(Parser::extractDepartures(R"({"departures": [)"), ParseError);
    EXPECT_THROW(Parser::extractDepartures("[]"), ParseError);
    EXPECT_THROW(Parser::extractDepartures(R"({"departures": {}})"), ParseError);
}

TEST(ParserTest, ReadsSites)
{
    auto sites = Parser::extractSites(R"([{"id": 9001, "name": "T-Centralen"}, {"id": 9192}, {"name": "no id"}])");
    ASSERT_EQ(sites.size(), 2u);
    EXPECT_EQ(sites[0].id, "9001");
    EXPECT_EQ(sites[0].name, "T-Centralen");
    EXPECT_EQ(sites[1].id, "9192");
    EXPECT_EQ(sites[1].name, "Site 9192");
}

TEST(ParserTest, SitesMustBeArray)
{
    EXPECT_THROW(Parser::extractSites(R"({"sites": []})"), ParseError);
}
