#pragma once
#include <cstddef>
#include <optional>
#include <string>
#include <variant>
#include <vector>
#include <nlohmann/json.hpp>
#include "TimeMath.hpp"
#include "Types.hpp"

// Card-compatible attributes derived from one departure.
struct DepartureAttributes
{
    std::optional<std::string> line;
    std::optional<std::string> destination;
    std::optional<std::string> scheduledTime;
    std::optional<std::string> expectedTime;
    std::optional<std::string> timeFormatted;
    int minutesUntil = 0;
    std::optional<std::string> transportMode;
    bool realTime = false;
    int delayMinutes = 0;
    bool canceled = false;
    std::optional<std::string> platform;
    std::string agency;
    std::optional<std::string> direction;
    std::optional<std::string> state;
    std::optional<std::string> stopArea;
    std::vector<std::string> deviations;

    [[nodiscard]] nlohmann::json toJson() const;
};

// What a consumer renders for one slot, or for the single next/next-active value.
struct Presentation
{
    std::string label;
    std::optional<std::string> value;
    bool available = false;
    bool delayed = false;
    std::optional<DepartureAttributes> attributes;    // slot policy
    std::vector<DepartureAttributes> upcoming;        // next / next-active policies

    [[nodiscard]] nlohmann::json attributesJson() const;
};

struct SlotsPolicy
{
    std::size_t count = 3;
};

struct NextPolicy {};

struct NextActivePolicy {};

using ViewPolicy = std::variant<SlotsPolicy, NextPolicy, NextActivePolicy>;

class DepartureView
{
public:
    static inline const std::string AGENCY     = "SL";
    static inline const std::string NOW_MARKER = "Nu";

    // Departures must already be filtered; upstream order is kept.
    // Slots yields `count` presentations, Next and NextActive yield one.
    static std::vector<Presentation> derive(std::vector<Departure> const& departures,
                                            ViewPolicy const& policy,
                                            TimeContext const& time);

    // Shape reported before any snapshot exists: everything unavailable.
    static std::vector<Presentation> unavailable(ViewPolicy const& policy);

    static bool isCancelled(Departure const& d);
    static DepartureAttributes attributesOf(Departure const& d, TimeContext const& time);
    static std::string positionLabel(std::size_t index);
    static std::string policyName(ViewPolicy const& policy);

private:
    static std::vector<Presentation> slots(std::vector<Departure> const& departures,
                                           std::size_t count,
                                           TimeContext const& time);
    static Presentation next(std::vector<Departure> const& departures, TimeContext const& time);
    static Presentation nextActive(std::vector<Departure> const& departures, TimeContext const& time);
    static std::optional<std::string> countdown(Departure const& d, TimeContext const& time);
    static bool isDelayed(Departure const& d);
};
