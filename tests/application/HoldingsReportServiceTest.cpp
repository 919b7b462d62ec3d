/**
 * @file HoldingsReportServiceTest.cpp
 * @brief Unit tests for HoldingsReportService
 */

#include <gtest/gtest.h>
#include "application/HoldingsReportService.hpp"
#include "application/HoldingsAggregator.hpp"

using namespace holdings;
using namespace holdings::application;

class HoldingsReportServiceTest : public ::testing::Test {
protected:
    void SetUp() override {
        reportService_ = std::make_shared<HoldingsReportService>();

        domain::RawHoldingsSnapshot raw;
        raw.add("binance", domain::RawEntityRecord()
            .add("ETH", holding(10.0, 30000.0))
            .add("BTC", holding(2.0, 120000.0)));
        raw.add("okx", domain::RawEntityRecord()
            .add("BTC", holding(1.0, 60000.0))
            .add("SOL", holding(50.0, 10000.0)));
        raw.add("kraken", domain::RawEntityRecord()
            .add("ETH", holding(2.0, 5000.0)));

        index_ = HoldingsAggregator().aggregate(raw);
    }

    static domain::RawAssetRecord holding(double quantity, double valueUsd) {
        domain::RawAssetRecord r;
        r.quantity = quantity;
        r.valueUsd = valueUsd;
        return r;
    }

    static domain::Selection select(std::vector<std::string> entities, std::vector<std::string> assets) {
        domain::Selection selection;
        selection.entities = std::move(entities);
        selection.assets = std::move(assets);
        return selection;
    }

    std::shared_ptr<HoldingsReportService> reportService_;
    domain::HoldingsIndex index_;
};

// ============================================================================
// OVERLAP MATRIX
// ============================================================================

TEST_F(HoldingsReportServiceTest, OverlapMatrix_RowsPerAssetColumnsPerEntity) {
    auto matrix = reportService_->overlapMatrix(index_, select({"okx", "binance"}, {"ETH", "BTC", "DOGE"}));

    EXPECT_EQ(matrix.entities, (std::vector<std::string>{"okx", "binance"}));
    EXPECT_EQ(matrix.assets, (std::vector<std::string>{"ETH", "BTC"}));

    EXPECT_DOUBLE_EQ(matrix.at(0, 0), 0.0);
    EXPECT_DOUBLE_EQ(matrix.at(0, 1), 30000.0);
    EXPECT_DOUBLE_EQ(matrix.at(1, 0), 60000.0);
    EXPECT_DOUBLE_EQ(matrix.at(1, 1), 120000.0);
}

TEST_F(HoldingsReportServiceTest, OverlapMatrix_EmptySelection_Empty) {
    auto matrix = reportService_->overlapMatrix(index_, select({}, {}));

    EXPECT_TRUE(matrix.assets.empty());
    EXPECT_TRUE(matrix.values.empty());
}

// ============================================================================
// HOLDINGS TABLE
// ============================================================================

TEST_F(HoldingsReportServiceTest, HoldingsTable_SortedByValueWithShareOfSelection) {
    auto table = reportService_->holdingsTable(index_, select({"binance", "okx"}, {"SOL", "BTC"}));

    ASSERT_EQ(table.size(), 2u);
    EXPECT_EQ(table[0].symbol, "BTC");
    EXPECT_DOUBLE_EQ(table[0].totalValue, 180000.0);
    EXPECT_DOUBLE_EQ(table[0].totalQuantity, 3.0);
    EXPECT_NEAR(table[0].marketShare, 180000.0 / 190000.0 * 100.0, 1e-9);
    EXPECT_EQ(table[0].holders, (std::vector<std::string>{"binance", "okx"}));

    EXPECT_EQ(table[1].symbol, "SOL");
    EXPECT_NEAR(table[1].marketShare, 10000.0 / 190000.0 * 100.0, 1e-9);
    EXPECT_EQ(table[1].holders, (std::vector<std::string>{"okx"}));
}

TEST_F(HoldingsReportServiceTest, HoldingsTable_HoldersRestrictedToSelection) {
    auto table = reportService_->holdingsTable(index_, select({"binance"}, {"ETH"}));

    ASSERT_EQ(table.size(), 1u);
    EXPECT_EQ(table[0].holders, (std::vector<std::string>{"binance"}));
    EXPECT_DOUBLE_EQ(table[0].totalValue, 35000.0);
    EXPECT_DOUBLE_EQ(table[0].marketShare, 100.0);
}

TEST_F(HoldingsReportServiceTest, HoldingsTable_UnknownAssets_Skipped) {
    auto table = reportService_->holdingsTable(index_, select({"binance"}, {"DOGE"}));

    EXPECT_TRUE(table.empty());
}

// ============================================================================
// SUMMARY
// ============================================================================

TEST_F(HoldingsReportServiceTest, Summary_CountsValueAndAverageHolders) {
    auto summary = reportService_->summary(index_, select({"binance"}, {"BTC", "ETH", "SOL"}));

    EXPECT_EQ(summary.assetCount, 3u);
    EXPECT_DOUBLE_EQ(summary.totalValue, 225000.0);
    EXPECT_NEAR(summary.averageHolders, 5.0 / 3.0, 1e-12);
}

TEST_F(HoldingsReportServiceTest, Summary_NoAssets_Zero) {
    auto summary = reportService_->summary(index_, select({"binance"}, {}));

    EXPECT_EQ(summary.assetCount, 0u);
    EXPECT_DOUBLE_EQ(summary.totalValue, 0.0);
    EXPECT_DOUBLE_EQ(summary.averageHolders, 0.0);
}

// ============================================================================
// DEFAULT SELECTION
// ============================================================================

TEST_F(HoldingsReportServiceTest, DefaultSelection_FirstEntitiesAndTopAssets) {
    auto selection = reportService_->defaultSelection(index_, 2, 2);

    EXPECT_EQ(selection.entities, (std::vector<std::string>{"binance", "okx"}));
    EXPECT_EQ(selection.assets, (std::vector<std::string>{"BTC", "ETH"}));
}

TEST_F(HoldingsReportServiceTest, DefaultSelection_CountsAboveSize_TakesAll) {
    auto selection = reportService_->defaultSelection(index_, 5, 10);

    EXPECT_EQ(selection.entities.size(), 3u);
    EXPECT_EQ(selection.assets, (std::vector<std::string>{"BTC", "ETH", "SOL"}));
}

TEST_F(HoldingsReportServiceTest, DefaultSelection_EmptyIndex_EmptySelection) {
    auto selection = reportService_->defaultSelection(domain::HoldingsIndex(), 5, 10);

    EXPECT_TRUE(selection.empty());
}
