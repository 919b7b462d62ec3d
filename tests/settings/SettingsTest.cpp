#include <gtest/gtest.h>
#include "settings/LayoutSettings.hpp"
#include "settings/SelectionSettings.hpp"
#include "settings/SourceSettings.hpp"
#include <cstdlib>
#include <stdexcept>

using namespace holdings::settings;

class SettingsTest : public ::testing::Test {
protected:
    void TearDown() override {
        for (const char* name : {"LAYOUT_ANCHOR_RADIUS", "LAYOUT_SOURCE_LABEL", "LAYOUT_ZONE_MIN_SIZE",
                                 "SELECTED_ENTITIES", "SELECTED_ASSETS", "DEFAULT_ASSET_COUNT",
                                 "HOLDINGS_SNAPSHOT_PATH", "HOLDINGS_CACHE_TTL_SECONDS"}) {
            ::unsetenv(name);
        }
    }
};

// ============================================================================
// LayoutSettings
// ============================================================================

TEST_F(SettingsTest, LayoutSettings_Defaults) {
    LayoutSettings settings;

    EXPECT_DOUBLE_EQ(settings.getAnchorRadius(), 5.5);
    EXPECT_DOUBLE_EQ(settings.getZoneMinSize(), 40.0);
    EXPECT_DOUBLE_EQ(settings.getZoneLighten(), 0.8);
    EXPECT_DOUBLE_EQ(settings.getAssetScale(), 0.8);
    EXPECT_DOUBLE_EQ(settings.getMarkerScale(), 25.0);
    EXPECT_DOUBLE_EQ(settings.getOverlayMinSize(), 35.0);
    EXPECT_EQ(settings.getSourceLabel(), "CoinGecko API");
}

TEST_F(SettingsTest, LayoutSettings_FromEnv) {
    ::setenv("LAYOUT_ANCHOR_RADIUS", "4.25", 1);
    ::setenv("LAYOUT_SOURCE_LABEL", "Snapshot file", 1);

    LayoutSettings settings;

    EXPECT_DOUBLE_EQ(settings.getAnchorRadius(), 4.25);
    EXPECT_EQ(settings.getSourceLabel(), "Snapshot file");
}

TEST_F(SettingsTest, LayoutSettings_InvalidNumber_Throws) {
    ::setenv("LAYOUT_ZONE_MIN_SIZE", "big", 1);

    EXPECT_THROW(LayoutSettings(), std::invalid_argument);
}

// ============================================================================
// SelectionSettings
// ============================================================================

TEST_F(SettingsTest, SplitList_TrimsSeparatorsKeepsIdentifiers) {
    EXPECT_EQ(SelectionSettings::splitList("binance, okx ,\tkraken"),
              (std::vector<std::string>{"binance", "okx", "kraken"}));
    EXPECT_EQ(SelectionSettings::splitList("BTC,,ETH,"), (std::vector<std::string>{"BTC", "ETH"}));
    EXPECT_TRUE(SelectionSettings::splitList("").empty());
    EXPECT_EQ(SelectionSettings::splitList("Wrapped BTC"), (std::vector<std::string>{"Wrapped BTC"}));
}

TEST_F(SettingsTest, SelectionSettings_FromEnv) {
    ::setenv("SELECTED_ENTITIES", "binance,okx", 1);
    ::setenv("SELECTED_ASSETS", "BTC", 1);
    ::setenv("DEFAULT_ASSET_COUNT", "3", 1);

    SelectionSettings settings;

    EXPECT_EQ(settings.getEntities(), (std::vector<std::string>{"binance", "okx"}));
    EXPECT_EQ(settings.getAssets(), (std::vector<std::string>{"BTC"}));
    EXPECT_EQ(settings.getDefaultEntityCount(), 5u);
    EXPECT_EQ(settings.getDefaultAssetCount(), 3u);
}

// ============================================================================
// SourceSettings
// ============================================================================

TEST_F(SettingsTest, SourceSettings_Defaults) {
    SourceSettings settings;

    EXPECT_EQ(settings.getSnapshotPath(), "holdings.json");
    EXPECT_EQ(settings.getCacheTtlSeconds(), 3600);
    EXPECT_EQ(settings.getCacheCapacity(), 4u);
}

TEST_F(SettingsTest, SourceSettings_FromEnv) {
    ::setenv("HOLDINGS_SNAPSHOT_PATH", "/tmp/snapshot.json", 1);
    ::setenv("HOLDINGS_CACHE_TTL_SECONDS", "0", 1);

    SourceSettings settings;

    EXPECT_EQ(settings.getSnapshotPath(), "/tmp/snapshot.json");
    EXPECT_EQ(settings.getCacheTtlSeconds(), 0);
}
