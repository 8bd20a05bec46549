#pragma once
#include <chrono>
#include <optional>
#include <set>
#include <string>
#include <vector>
#include <date/tz.h>
#include "DepartureView.hpp"
#include "FilterSpec.hpp"
#include "Types.hpp"

// One polled stop with its own filter, view policy and interval.
struct TargetConfig
{
    std::string siteId;
    FilterSpec filter;
    std::string viewName = "slots";
    std::size_t slotCount = 3;
    std::chrono::seconds scanInterval{60};

    [[nodiscard]] ViewPolicy viewPolicy() const;
    [[nodiscard]] std::string uniqueId() const;
};

enum class RunMode
{
    Board,
    SearchSites,
    ListLines,
    ListDirections
};

class ConfigurationManager
{
private:
    std::vector<TargetConfig> targets;
    RunMode runMode = RunMode::Board;
    std::string discoveryArgument;
    TransportMode discoveryMode = TransportMode::Train;
    std::string discoveryLine;
    std::string recordFile;
    std::string replayFile;
    std::string displayZone;
    bool verbose = false;
    bool jsonOutput = false;
    bool leadingTarget = false;   // opened by target options before any --site

    TargetConfig targetFromEnvironment() const;
    TargetConfig& currentTarget();
    void finalize();

public:
    static inline const std::string SL_HOST  = "transport.integration.sl.se";
    static inline const std::string SL_PORT  = "443";
    static inline const std::string API_BASE = "/v1";

    static constexpr int DEFAULT_SCAN_INTERVAL  = 60;
    static constexpr int MIN_SCAN_INTERVAL      = 30;
    static constexpr int MAX_SCAN_INTERVAL      = 300;
    static constexpr int DEFAULT_NUM_DEPARTURES = 3;

    explicit ConfigurationManager(std::vector<std::string> const& args);

    static std::string sitesPath();
    static std::string departuresPath(std::string const& siteId);

    static std::set<TransportMode> parseModes(std::string const& text);
    static std::chrono::seconds parseInterval(std::string const& text);
    static std::size_t parseSlotCount(std::string const& text);
    static std::string parseViewName(std::string const& text);

    [[nodiscard]] std::vector<TargetConfig> const& getTargets() const noexcept;
    [[nodiscard]] RunMode getRunMode() const noexcept;
    [[nodiscard]] std::string const& getDiscoveryArgument() const noexcept;
    [[nodiscard]] TransportMode getDiscoveryMode() const noexcept;
    [[nodiscard]] std::string const& getDiscoveryLine() const noexcept;
    [[nodiscard]] std::string const& getRecordFile() const noexcept;
    [[nodiscard]] std::string const& getReplayFile() const noexcept;
    [[nodiscard]] bool isVerbose() const noexcept;
    [[nodiscard]] bool isJsonOutput() const noexcept;

    // Throws ConfigError when the configured zone name is unknown.
    [[nodiscard]] date::time_zone const* resolveDisplayZone() const;
};
