#pragma once
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <date/tz.h>
#include "DepartureView.hpp"
#include "Types.hpp"

// Renders one target's presentations as a plain-text board for the console.
class Dashboard
{
public:
    static std::string generate(std::string const& title,
                                std::vector<Presentation> const& presentations,
                                std::shared_ptr<DepartureSnapshot const> const& snapshot,
                                std::optional<std::string> const& lastError,
                                date::time_zone const* zone);

    // Attribute payloads as one JSON document per target.
    static std::string generateJson(std::string const& title,
                                    std::vector<Presentation> const& presentations,
                                    std::optional<std::string> const& lastError);

private:
    static std::string buildHeader(std::string const& title,
                                   std::shared_ptr<DepartureSnapshot const> const& snapshot,
                                   std::optional<std::string> const& lastError,
                                   date::time_zone const* zone);
    static std::string formatDelay(DepartureAttributes const& a);
    static std::string buildRow(std::string const& label, DepartureAttributes const& a);
    static std::string buildPresentation(Presentation const& p);
};
