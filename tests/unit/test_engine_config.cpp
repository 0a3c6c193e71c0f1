#include <gtest/gtest.h>
#include "engine_config.hpp"

#include <cstdio>
#include <cstdlib>
#include <fstream>

using json = nlohmann::json;

TEST(EngineConfigTest, DefaultsAreValid) {
    EngineConfig c;
    EXPECT_NO_THROW(c.validate());
    EXPECT_TRUE(c.dry_run);
    EXPECT_EQ(c.spread_bps, 50);
    EXPECT_EQ(c.min_edge_bps, 200);
    EXPECT_DOUBLE_EQ(c.quote_refresh_on_price_change, 0.001);
}

TEST(EngineConfigTest, FromJsonOverridesOnlyPresentKeys) {
    json j = {
        {"spread_bps", 80},
        {"max_position_size", 10.0},
        {"market_keywords", {"eth", "ethereum"}},
        {"symbol", "ETHUSDT"}
    };
    EngineConfig c = EngineConfig::from_json(j);
    EXPECT_EQ(c.spread_bps, 80);
    EXPECT_DOUBLE_EQ(c.max_position_size, 10.0);
    EXPECT_EQ(c.symbol, "ETHUSDT");
    ASSERT_EQ(c.market_keywords.size(), 2u);
    EXPECT_EQ(c.market_keywords[1], "ethereum");
    EXPECT_EQ(c.cancel_replace_interval_s, 2);
}

TEST(EngineConfigTest, WrongTypeIsConfigError) {
    json j = {{"spread_bps", "wide"}};
    EXPECT_THROW(EngineConfig::from_json(j), ConfigError);
    EXPECT_THROW(EngineConfig::from_json(json::array()), ConfigError);
}

TEST(EngineConfigTest, ValidationRejectsBadValues) {
    {
        EngineConfig c;
        c.spread_bps = 5;
        EXPECT_THROW(c.validate(), ConfigError);
    }
    {
        EngineConfig c;
        c.cancel_replace_interval_s = 0;
        EXPECT_THROW(c.validate(), ConfigError);
    }
    {
        EngineConfig c;
        c.max_position_size = 0.0;
        EXPECT_THROW(c.validate(), ConfigError);
    }
    {
        EngineConfig c;
        c.max_position_size = 150.0;   // > initial_capital
        EXPECT_THROW(c.validate(), ConfigError);
    }
    {
        EngineConfig c;
        c.quote_refresh_on_price_change = 0.0;
        EXPECT_THROW(c.validate(), ConfigError);
    }
    {
        EngineConfig c;
        c.min_edge_bps = -1;
        EXPECT_THROW(c.validate(), ConfigError);
    }
    {
        EngineConfig c;
        c.tick_interval_ms = 10;
        EXPECT_THROW(c.validate(), ConfigError);
    }
}

TEST(EngineConfigTest, LiveModeNeedsAllSecrets) {
    EngineConfig c;
    c.dry_run = false;
    EXPECT_THROW(c.validate(), ConfigError);

    c.creds.api_key = "k";
    c.creds.api_secret = "c2VjcmV0";
    c.creds.passphrase = "p";
    EXPECT_THROW(c.validate(), ConfigError);

    c.creds.address = "0x1234567890abcdef1234567890abcdef12345678";
    EXPECT_NO_THROW(c.validate());
}

TEST(EngineConfigTest, LoadReadsFileAndEnvironment) {
    const char* path = "engine_config_test.json";
    {
        std::ofstream f(path);
        f << R"({"spread_bps": 60, "dry_run": true})";
    }
    setenv("POLY_API_KEY", "key-from-env", 1);

    EngineConfig c = EngineConfig::load(path);
    EXPECT_EQ(c.spread_bps, 60);
    EXPECT_EQ(c.creds.api_key, "key-from-env");

    unsetenv("POLY_API_KEY");
    std::remove(path);
}

TEST(EngineConfigTest, LoadMissingOrBrokenFileIsConfigError) {
    EXPECT_THROW(EngineConfig::load("does/not/exist.json"), ConfigError);

    const char* path = "engine_config_broken.json";
    {
        std::ofstream f(path);
        f << "{ not json";
    }
    EXPECT_THROW(EngineConfig::load(path), ConfigError);
    std::remove(path);
}

TEST(EngineConfigTest, DescribeMasksWallet) {
    EngineConfig c;
    c.creds.address = "0x1234567890abcdef1234567890abcdef12345678";
    const std::string d = c.describe();
    EXPECT_NE(d.find("DRY-RUN"), std::string::npos);
    EXPECT_NE(d.find("0x1234...5678"), std::string::npos);
    EXPECT_EQ(d.find("567890abcdef1234"), std::string::npos);
}
