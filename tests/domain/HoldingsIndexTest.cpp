#include <gtest/gtest.h>
#include "domain/HoldingsIndex.hpp"
#include "domain/Timestamp.hpp"

using namespace holdings::domain;

class HoldingsIndexTest : public ::testing::Test {
protected:
    void SetUp() override {
        Entity binance("binance");
        binance.add("BTC", Holding(2.0, 120000.0));
        binance.add("ETH", Holding(10.0, 30000.0));

        Entity okx("okx");
        okx.add("BTC", Holding(1.0, 60000.0));

        Asset btc("BTC", "Bitcoin");
        btc.entities = {"binance", "okx"};
        btc.totalQuantity = 3.0;
        btc.totalValue = 180000.0;

        Asset eth("ETH", "Ethereum");
        eth.entities = {"binance"};
        eth.totalQuantity = 10.0;
        eth.totalValue = 30000.0;

        index_ = HoldingsIndex({binance, okx}, {btc, eth});
    }

    HoldingsIndex index_;
};

// ============================================================================
// Lookups
// ============================================================================

TEST_F(HoldingsIndexTest, FindEntity_Existing_ReturnsEntity) {
    const Entity* entity = index_.findEntity("okx");

    ASSERT_NE(entity, nullptr);
    EXPECT_EQ(entity->name, "okx");
    EXPECT_DOUBLE_EQ(entity->totalValue, 60000.0);
}

TEST_F(HoldingsIndexTest, FindEntity_Unknown_ReturnsNull) {
    EXPECT_EQ(index_.findEntity("kraken"), nullptr);
}

TEST_F(HoldingsIndexTest, FindEntity_CaseSensitive) {
    EXPECT_EQ(index_.findEntity("Binance"), nullptr);
}

TEST_F(HoldingsIndexTest, FindAsset_Existing_ReturnsAsset) {
    const Asset* asset = index_.findAsset("BTC");

    ASSERT_NE(asset, nullptr);
    EXPECT_EQ(asset->name, "Bitcoin");
    EXPECT_TRUE(asset->isMultiHolder());
    EXPECT_TRUE(asset->heldBy("okx"));
}

TEST_F(HoldingsIndexTest, FindAsset_Unknown_ReturnsNull) {
    EXPECT_EQ(index_.findAsset("DOGE"), nullptr);
}

// ============================================================================
// Totals
// ============================================================================

TEST_F(HoldingsIndexTest, Totals_MatchOnBothSides) {
    EXPECT_DOUBLE_EQ(index_.totalEntityValue(), 210000.0);
    EXPECT_DOUBLE_EQ(index_.totalAssetValue(), 210000.0);
}

TEST_F(HoldingsIndexTest, Entity_ValueOf_MissingAssetIsZero) {
    const Entity* okx = index_.findEntity("okx");
    ASSERT_NE(okx, nullptr);

    EXPECT_DOUBLE_EQ(okx->valueOf("BTC"), 60000.0);
    EXPECT_DOUBLE_EQ(okx->valueOf("ETH"), 0.0);
    EXPECT_FALSE(okx->holding("ETH").has_value());
}

TEST_F(HoldingsIndexTest, Empty_DefaultConstructed) {
    HoldingsIndex empty;

    EXPECT_TRUE(empty.empty());
    EXPECT_FALSE(index_.empty());
    EXPECT_DOUBLE_EQ(empty.totalEntityValue(), 0.0);
}

TEST_F(HoldingsIndexTest, Equality_ComparesContent) {
    HoldingsIndex copy(index_.entities(), index_.assets());

    EXPECT_EQ(copy, index_);
    EXPECT_FALSE(copy == HoldingsIndex());
}

// ============================================================================
// Timestamp
// ============================================================================

TEST(TimestampTest, FromEpochMillis_RoundTrips) {
    Timestamp ts = Timestamp::fromEpochMillis(1700000000123);

    EXPECT_EQ(ts.epochMillis(), 1700000000123);
}

TEST(TimestampTest, ToString_IsoUtc) {
    EXPECT_EQ(Timestamp::fromEpochMillis(0).toString(), "1970-01-01T00:00:00Z");
}

TEST(TimestampTest, AgeAt_ReturnsSeconds) {
    Timestamp earlier = Timestamp::fromEpochMillis(1000000);
    Timestamp later = Timestamp::fromEpochMillis(1000000 + 90 * 1000);

    EXPECT_EQ(earlier.ageAt(later).count(), 90);
    EXPECT_TRUE(earlier < later);
}
