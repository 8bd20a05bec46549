#include <cstdlib>
#include <gtest/gtest.h>
#include "ConfigurationManager.hpp"
#include "Errors.hpp"

using namespace std::chrono_literals;

class ConfigurationManagerTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        for (char const* name : {"SL_SITE_ID", "SL_TRANSPORT_MODES", "SL_DIRECTION_CODE", "SL_LINES",
                                 "SL_NUM_DEPARTURES", "SL_SCAN_INTERVAL", "SL_VIEW", "SL_DISPLAY_TZ"})
            unsetenv(name);
    }

    void TearDown() override { SetUp(); }
};

TEST_F(ConfigurationManagerTest, SiteIsRequired)
{
    EXPECT_THROW(ConfigurationManager(std::vector<std::string>{}), ConfigError);
    EXPECT_THROW(ConfigurationManager({"--verbose"}), ConfigError);
}

TEST_F(ConfigurationManagerTest, DefaultsForSingleSite)
{
    ConfigurationManager config({"--site", "9001"});

    EXPECT_EQ(config.getRunMode(), RunMode::Board);
    ASSERT_EQ(config.getTargets().size(), 1u);

    TargetConfig const& t = config.getTargets().front();
    EXPECT_EQ(t.siteId, "9001");
    EXPECT_EQ(t.filter.modes, (std::set<TransportMode>{TransportMode::Train}));
    EXPECT_TRUE(t.filter.directionCode.empty());
    EXPECT_TRUE(t.filter.lines.empty());
    EXPECT_EQ(t.slotCount, 3u);
    EXPECT_EQ(t.scanInterval, 60s);
    EXPECT_TRUE(std::holds_alternative<SlotsPolicy>(t.viewPolicy()));
    EXPECT_FALSE(config.isVerbose());
    EXPECT_FALSE(config.isJsonOutput());
}

TEST_F(ConfigurationManagerTest, TargetOptions)
{
    ConfigurationManager config({"--site", "9001", "--modes", "metro, Bus", "--direction", "1",
                                 "--lines", " 19, 17 ", "--slots", "5", "--interval", "120",
                                 "--view", "next-active", "--json"});

    TargetConfig const& t = config.getTargets().front();
    EXPECT_EQ(t.filter.modes, (std::set<TransportMode>{TransportMode::Metro, TransportMode::Bus}));
    EXPECT_EQ(t.filter.directionCode, "1");
    EXPECT_EQ(t.filter.lines, (std::vector<std::string>{"19", "17"}));
    EXPECT_EQ(t.slotCount, 5u);
    EXPECT_EQ(t.scanInterval, 120s);
    EXPECT_TRUE(std::holds_alternative<NextActivePolicy>(t.viewPolicy()));
    EXPECT_TRUE(config.isJsonOutput());
}

TEST_F(ConfigurationManagerTest, OptionsApplyToLatestSite)
{
    ConfigurationManager config({"--site", "9001", "--view", "next",
                                 "--site", "9192", "--modes", "METRO", "--slots", "2"});

    ASSERT_EQ(config.getTargets().size(), 2u);
    TargetConfig const& first = config.getTargets()[0];
    TargetConfig const& second = config.getTargets()[1];

    EXPECT_EQ(first.siteId, "9001");
    EXPECT_TRUE(std::holds_alternative<NextPolicy>(first.viewPolicy()));
    EXPECT_EQ(first.filter.modes, (std::set<TransportMode>{TransportMode::Train}));

    EXPECT_EQ(second.siteId, "9192");
    EXPECT_EQ(second.filter.modes, (std::set<TransportMode>{TransportMode::Metro}));
    auto policy = second.viewPolicy();
    ASSERT_TRUE(std::holds_alternative<SlotsPolicy>(policy));
    EXPECT_EQ(std::get<SlotsPolicy>(policy).count, 2u);
}

TEST_F(ConfigurationManagerTest, OptionsBeforeFirstSiteBelongToIt)
{
    ConfigurationManager config({"--slots", "5", "--view", "next", "--site", "1234", "--site", "9001"});

    ASSERT_EQ(config.getTargets().size(), 2u);
    EXPECT_EQ(config.getTargets()[0].siteId, "1234");
    EXPECT_EQ(config.getTargets()[0].slotCount, 5u);
    EXPECT_TRUE(std::holds_alternative<NextPolicy>(config.getTargets()[0].viewPolicy()));
    EXPECT_EQ(config.getTargets()[1].siteId, "9001");
    EXPECT_EQ(config.getTargets()[1].slotCount, 3u);

    setenv("SL_SITE_ID", "5011", 1);
    ConfigurationManager withEnvSite({"--modes", "metro", "--site", "1234"});
    ASSERT_EQ(withEnvSite.getTargets().size(), 1u);
    EXPECT_EQ(withEnvSite.getTargets()[0].siteId, "1234");
    EXPECT_EQ(withEnvSite.getTargets()[0].filter.modes, (std::set<TransportMode>{TransportMode::Metro}));

    ConfigurationManager envOnly({"--slots", "2"});
    ASSERT_EQ(envOnly.getTargets().size(), 1u);
    EXPECT_EQ(envOnly.getTargets()[0].siteId, "5011");
    EXPECT_EQ(envOnly.getTargets()[0].slotCount, 2u);
}

TEST_F(ConfigurationManagerTest, EnvironmentSuppliesDefaultsForEveryTarget)
{
    setenv("SL_SITE_ID", "9001", 1);
    setenv("SL_TRANSPORT_MODES", "bus,tram", 1);
    setenv("SL_NUM_DEPARTURES", "4", 1);

    ConfigurationManager fromEnv(std::vector<std::string>{});
    ASSERT_EQ(fromEnv.getTargets().size(), 1u);
    EXPECT_EQ(fromEnv.getTargets()[0].siteId, "9001");
    EXPECT_EQ(fromEnv.getTargets()[0].slotCount, 4u);

    ConfigurationManager config({"--site", "1002", "--site", "1003", "--slots", "1"});
    ASSERT_EQ(config.getTargets().size(), 2u);
    for (auto const& t : config.getTargets())
        EXPECT_EQ(t.filter.modes, (std::set<TransportMode>{TransportMode::Bus, TransportMode::Tram}));
    EXPECT_EQ(config.getTargets()[0].slotCount, 4u);
    EXPECT_EQ(config.getTargets()[1].slotCount, 1u);
}

TEST_F(ConfigurationManagerTest, IntervalIsClamped)
{
    EXPECT_EQ(ConfigurationManager::parseInterval("10"), 30s);
    EXPECT_EQ(ConfigurationManager::parseInterval("30"), 30s);
    EXPECT_EQ(ConfigurationManager::parseInterval("300"), 300s);
    EXPECT_EQ(ConfigurationManager::parseInterval("1000"), 300s);
    EXPECT_THROW(ConfigurationManager::parseInterval("soon"), ConfigError);
    EXPECT_THROW(ConfigurationManager::parseInterval("60s"), ConfigError);
}

TEST_F(ConfigurationManagerTest, InvalidValuesAreRejected)
{
    EXPECT_THROW(ConfigurationManager({"--site", "9001", "--modes", "HOVERCRAFT"}), ConfigError);
    EXPECT_THROW(ConfigurationManager({"--site", "9001", "--modes", " , "}), ConfigError);
    EXPECT_THROW(ConfigurationManager({"--site", "9001", "--slots", "0"}), ConfigError);
    EXPECT_THROW(ConfigurationManager({"--site", "9001", "--view", "table"}), ConfigError);
    EXPECT_THROW(ConfigurationManager({"--site"}), ConfigError);
    EXPECT_THROW(ConfigurationManager({"--site", "9001", "--record", "a.bin", "--replay", "b.bin"}), ConfigError);
}

TEST_F(ConfigurationManagerTest, UnknownArgumentsAreIgnored)
{
    ConfigurationManager config({"--site", "9001", "--colour"});
    EXPECT_EQ(config.getTargets().size(), 1u);
}

TEST_F(ConfigurationManagerTest, DiscoveryModesNeedNoSite)
{
    ConfigurationManager search({"--search", "slussen"});
    EXPECT_EQ(search.getRunMode(), RunMode::SearchSites);
    EXPECT_EQ(search.getDiscoveryArgument(), "slussen");

    ConfigurationManager lines({"--lines-of", "9001", "--mode", "metro"});
    EXPECT_EQ(lines.getRunMode(), RunMode::ListLines);
    EXPECT_EQ(lines.getDiscoveryArgument(), "9001");
    EXPECT_EQ(lines.getDiscoveryMode(), TransportMode::Metro);

    ConfigurationManager directions({"--directions-of", "9001", "--line", "43"});
    EXPECT_EQ(directions.getRunMode(), RunMode::ListDirections);
    EXPECT_EQ(directions.getDiscoveryMode(), TransportMode::Train);
    EXPECT_EQ(directions.getDiscoveryLine(), "43");

    EXPECT_THROW(ConfigurationManager({"--lines-of", "9001", "--mode", "train,bus"}), ConfigError);
}

TEST_F(ConfigurationManagerTest, UniqueIdEncodesFilter)
{
    ConfigurationManager plain({"--site", "9001"});
    EXPECT_EQ(plain.getTargets()[0].uniqueId(), "sl_departures_9001_TRAIN");

    ConfigurationManager full({"--site", "9001", "--modes", "metro,train", "--lines", "19,17", "--direction", "1"});
    EXPECT_EQ(full.getTargets()[0].uniqueId(), "sl_departures_9001_TRAIN_METRO_line19,17_dir1");
}

TEST_F(ConfigurationManagerTest, ApiPaths)
{
    EXPECT_EQ(ConfigurationManager::sitesPath(), "/v1/sites");
    EXPECT_EQ(ConfigurationManager::departuresPath("9001"), "/v1/sites/9001/departures");
}

TEST_F(ConfigurationManagerTest, DisplayZone)
{
    ConfigurationManager stockholm({"--site", "9001", "--tz", "Europe/Stockholm"});
    EXPECT_EQ(stockholm.resolveDisplayZone()->name(), "Europe/Stockholm");

    setenv("SL_DISPLAY_TZ", "Europe/Helsinki", 1);
    ConfigurationManager fromEnv({"--site", "9001"});
    EXPECT_EQ(fromEnv.resolveDisplayZone()->name(), "Europe/Helsinki");

    ConfigurationManager unknown({"--site", "9001", "--tz", "Mars/Olympus_Mons"});
    EXPECT_THROW(unknown.resolveDisplayZone(), ConfigError);
}
