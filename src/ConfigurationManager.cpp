#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <iostream>
#include <sstream>
#include "ConfigurationManager.hpp"
#include "Errors.hpp"

namespace
{
std::string envOr(char const* name, std::string const& fallback)
{
    const char* value = std::getenv(name);
    if (!value || !*value)
        return fallback;
    return value;
}

int parseInt(std::string const& text, std::string const& what)
{
    try
    {
        std::size_t used = 0;
        int value = std::stoi(text, &used);
        if (used != text.size())
            throw ConfigError(what + " is not a whole number: " + text);
        return value;
    }
    catch (std::invalid_argument const&)
    {
        throw ConfigError(what + " is not a number: " + text);
    }
    catch (std::out_of_range const&)
    {
        throw ConfigError(what + " is out of range: " + text);
    }
}
}

ViewPolicy TargetConfig::viewPolicy() const
{
    if (viewName == "next")
        return NextPolicy{};
    if (viewName == "next-active")
        return NextActivePolicy{};
    return SlotsPolicy{slotCount};
}

std::string TargetConfig::uniqueId() const
{
    std::string id = "sl_departures_" + siteId;
    for (auto mode : filter.modes)
        id += "_" + toString(mode);

    if (!filter.lines.empty())
    {
        id += "_line";
        for (std::size_t i = 0; i < filter.lines.size(); ++i)
            id += (i ? "," : "") + filter.lines[i];
    }

    if (!filter.directionCode.empty())
        id += "_dir" + filter.directionCode;

    return id;
}

std::string ConfigurationManager::sitesPath()
{
    return API_BASE + "/sites";
}

std::string ConfigurationManager::departuresPath(std::string const& siteId)
{
    return API_BASE + "/sites/" + siteId + "/departures";
}

std::set<TransportMode> ConfigurationManager::parseModes(std::string const& text)
{
    std::set<TransportMode> modes;
    std::stringstream ss(text);
    std::string entry;

    while (std::getline(ss, entry, ','))
    {
        entry.erase(std::remove_if(entry.begin(), entry.end(),
                                   [](unsigned char c) { return std::isspace(c); }),
                    entry.end());
        if (entry.empty())
            continue;

        std::transform(entry.begin(), entry.end(), entry.begin(),
                       [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

        auto mode = transportModeFromString(entry);
        if (!mode)
            throw ConfigError("Unknown transport mode: " + entry);
        modes.insert(*mode);
    }

    if (modes.empty())
        throw ConfigError("At least one transport mode is required");

    return modes;
}

std::chrono::seconds ConfigurationManager::parseInterval(std::string const& text)
{
    int seconds = parseInt(text, "Scan interval");
    int clamped = std::clamp(seconds, MIN_SCAN_INTERVAL, MAX_SCAN_INTERVAL);
    if (clamped != seconds)
    {
        std::cerr << "Warning: scan interval " << seconds << "s outside "
                  << MIN_SCAN_INTERVAL << "-" << MAX_SCAN_INTERVAL
                  << "s, using " << clamped << "s\n";
    }
    return std::chrono::seconds(clamped);
}

std::size_t ConfigurationManager::parseSlotCount(std::string const& text)
{
    int count = parseInt(text, "Number of departures");
    if (count < 1)
        throw ConfigError("Number of departures must be at least 1");
    return static_cast<std::size_t>(count);
}

std::string ConfigurationManager::parseViewName(std::string const& text)
{
    if (text == "slots" || text == "next" || text == "next-active")
        return text;
    throw ConfigError("Unknown view '" + text + "' (expected slots, next or next-active)");
}

TargetConfig ConfigurationManager::targetFromEnvironment() const
{
    TargetConfig t;
    t.siteId               = envOr("SL_SITE_ID", "");
    t.filter.modes         = parseModes(envOr("SL_TRANSPORT_MODES", "TRAIN"));
    t.filter.directionCode = envOr("SL_DIRECTION_CODE", "");
    t.filter.lines         = FilterSpec::parseLines(envOr("SL_LINES", ""));
    t.slotCount            = parseSlotCount(envOr("SL_NUM_DEPARTURES", std::to_string(DEFAULT_NUM_DEPARTURES)));
    t.scanInterval         = parseInterval(envOr("SL_SCAN_INTERVAL", std::to_string(DEFAULT_SCAN_INTERVAL)));
    t.viewName             = parseViewName(envOr("SL_VIEW", "slots"));
    return t;
}

TargetConfig& ConfigurationManager::currentTarget()
{
    if (targets.empty())
    {
        targets.push_back(targetFromEnvironment());
        leadingTarget = true;
    }
    return targets.back();
}

ConfigurationManager::ConfigurationManager(std::vector<std::string> const& args)
{
    displayZone = envOr("SL_DISPLAY_TZ", "");

    for (std::size_t i = 0; i < args.size(); ++i)
    {
        std::string const& arg = args[i];
        auto value = [&]() -> std::string
        {
            if (i + 1 >= args.size())
                throw ConfigError("Missing value for " + arg);
            return args[++i];
        };

        if (arg == "--site")
        {
            if (leadingTarget)
            {
                targets.back().siteId = value();
                leadingTarget = false;
            }
            else
            {
                TargetConfig t = targetFromEnvironment();
                t.siteId = value();
                targets.push_back(t);
            }
        }
        else if (arg == "--modes")
            currentTarget().filter.modes = parseModes(value());
        else if (arg == "--direction")
            currentTarget().filter.directionCode = value();
        else if (arg == "--lines")
            currentTarget().filter.lines = FilterSpec::parseLines(value());
        else if (arg == "--slots")
            currentTarget().slotCount = parseSlotCount(value());
        else if (arg == "--view")
            currentTarget().viewName = parseViewName(value());
        else if (arg == "--interval")
            currentTarget().scanInterval = parseInterval(value());
        else if (arg == "--tz")
            displayZone = value();
        else if (arg == "--record")
            recordFile = value();
        else if (arg == "--replay")
            replayFile = value();
        else if (arg == "--verbose")
            verbose = true;
        else if (arg == "--json")
            jsonOutput = true;
        else if (arg == "--search")
        {
            runMode = RunMode::SearchSites;
            discoveryArgument = value();
        }
        else if (arg == "--lines-of")
        {
            runMode = RunMode::ListLines;
            discoveryArgument = value();
        }
        else if (arg == "--directions-of")
        {
            runMode = RunMode::ListDirections;
            discoveryArgument = value();
        }
        else if (arg == "--mode")
        {
            std::string text = value();
            auto modes = parseModes(text);
            if (modes.size() != 1)
                throw ConfigError("--mode takes exactly one transport mode: " + text);
            discoveryMode = *modes.begin();
        }
        else if (arg == "--line")
            discoveryLine = value();
        else
            std::cerr << "Warning: ignoring unknown or malformed argument: " << arg << "\n";
    }

    finalize();
}

void ConfigurationManager::finalize()
{
    if (runMode != RunMode::Board)
        return;

    if (!recordFile.empty() && !replayFile.empty())
        throw ConfigError("--record and --replay cannot be combined");

    if (targets.empty())
        targets.push_back(targetFromEnvironment());

    for (auto const& t : targets)
    {
        if (t.siteId.empty())
            throw ConfigError("No site configured: pass --site <id> or set SL_SITE_ID");
    }
}

date::time_zone const* ConfigurationManager::resolveDisplayZone() const
{
    try
    {
        if (displayZone.empty())
            return date::current_zone();
        return date::locate_zone(displayZone);
    }
    catch (std::runtime_error const& e)
    {
        throw ConfigError("Unknown display time zone '" + displayZone + "': " + e.what());
    }
}

std::vector<TargetConfig> const& ConfigurationManager::getTargets() const noexcept { return targets; }
RunMode ConfigurationManager::getRunMode() const noexcept { return runMode; }
std::string const& ConfigurationManager::getDiscoveryArgument() const noexcept { return discoveryArgument; }
TransportMode ConfigurationManager::getDiscoveryMode() const noexcept { return discoveryMode; }
std::string const& ConfigurationManager::getDiscoveryLine() const noexcept { return discoveryLine; }
std::string const& ConfigurationManager::getRecordFile() const noexcept { return recordFile; }
std::string const& ConfigurationManager::getReplayFile() const noexcept { return replayFile; }
bool ConfigurationManager::isVerbose() const noexcept { return verbose; }
bool ConfigurationManager::isJsonOutput() const noexcept { return jsonOutput; }
