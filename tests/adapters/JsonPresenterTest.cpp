#include <gtest/gtest.h>
#include "adapters/primary/IndexJsonPresenter.hpp"
#include "adapters/primary/SceneJsonPresenter.hpp"
#include "adapters/primary/ReportJsonPresenter.hpp"
#include "application/HoldingsAggregator.hpp"
#include "application/OverlapLayoutService.hpp"

using namespace holdings;
using namespace holdings::adapters::primary;

class JsonPresenterTest : public ::testing::Test {
protected:
    void SetUp() override {
        domain::RawHoldingsSnapshot raw;
        raw.add("A", domain::RawEntityRecord().add("X", value(100.0)));
        raw.add("B", domain::RawEntityRecord().add("X", value(300.0)).add("Y", value(50.0)));
        index_ = application::HoldingsAggregator().aggregate(raw);

        selection_.entities = {"A", "B"};
        selection_.assets = {"X", "Y"};
    }

    static domain::RawAssetRecord value(double valueUsd) {
        domain::RawAssetRecord r;
        r.quantity = 1.0;
        r.valueUsd = valueUsd;
        return r;
    }

    domain::HoldingsIndex index_;
    domain::Selection selection_;
};

// ============================================================================
// IndexJsonPresenter
// ============================================================================

TEST_F(JsonPresenterTest, Index_FieldNamesAndValues) {
    auto j = IndexJsonPresenter::toJson(index_);

    EXPECT_DOUBLE_EQ(j["entities"]["B"]["total_value"].get<double>(), 350.0);
    EXPECT_DOUBLE_EQ(j["entities"]["B"]["assets"]["Y"]["value_usd"].get<double>(), 50.0);
    EXPECT_DOUBLE_EQ(j["entities"]["B"]["assets"]["Y"]["quantity"].get<double>(), 1.0);

    EXPECT_EQ(j["assets"]["X"]["name"], "X");
    EXPECT_EQ(j["assets"]["X"]["entities"], nlohmann::ordered_json::array({"A", "B"}));
    EXPECT_DOUBLE_EQ(j["assets"]["X"]["total_value"].get<double>(), 400.0);
    EXPECT_DOUBLE_EQ(j["assets"]["X"]["total_quantity"].get<double>(), 2.0);
}

TEST_F(JsonPresenterTest, Index_AssetsKeepSortedOrder) {
    auto j = IndexJsonPresenter::toJson(index_);

    auto it = j["assets"].begin();
    EXPECT_EQ(it.key(), "X");
    ++it;
    EXPECT_EQ(it.key(), "Y");
}

TEST_F(JsonPresenterTest, Index_EntityHoldingsKeepSourceOrder) {
    domain::RawHoldingsSnapshot raw;
    raw.add("A", domain::RawEntityRecord()
                     .add("ETH", value(10.0))
                     .add("BTC", value(20.0))
                     .add("ADA", value(5.0)));
    auto j = IndexJsonPresenter::toJson(application::HoldingsAggregator().aggregate(raw));

    auto it = j["entities"]["A"]["assets"].begin();
    EXPECT_EQ(it.key(), "ETH");
    ++it;
    EXPECT_EQ(it.key(), "BTC");
    ++it;
    EXPECT_EQ(it.key(), "ADA");
}

TEST_F(JsonPresenterTest, Index_Empty_HasBothSections) {
    auto j = IndexJsonPresenter::toJson(domain::HoldingsIndex());

    EXPECT_TRUE(j["entities"].is_object());
    EXPECT_TRUE(j["assets"].is_object());
    EXPECT_TRUE(j["entities"].empty());
}

// ============================================================================
// SceneJsonPresenter
// ============================================================================

TEST_F(JsonPresenterTest, Scene_ElementsInDrawOrder) {
    application::OverlapLayoutService service(std::make_shared<settings::LayoutSettings>());
    auto scene = service.layout(index_, selection_);

    auto j = SceneJsonPresenter::toJson(scene);

    EXPECT_FALSE(j["empty"].get<bool>());
    ASSERT_EQ(j["elements"].size(), scene.elements.size());
    EXPECT_EQ(j["elements"][0]["kind"], "entity-zone");
    EXPECT_EQ(j["elements"][0]["id"], "B");
    EXPECT_EQ(j["legend"].size(), 6u);
    EXPECT_EQ(j["guides"].size(), 2u);
    EXPECT_EQ(j["annotations"].size(), 2u);
    EXPECT_EQ(j["view"]["x_range"], nlohmann::ordered_json::array({-7.0, 7.0}));
}

TEST_F(JsonPresenterTest, Scene_BubbleCarriesTierAndShare) {
    domain::SceneElement bubble;
    bubble.kind = domain::ElementKind::ASSET_BUBBLE;
    bubble.id = "X";
    bubble.position = utils::Point(2.75, 0.0);
    bubble.size = 52.0;
    bubble.color = "#FF0000";
    bubble.outlineColor = "rgba(0,0,0,0.5)";
    bubble.tier = domain::PercentageTier::FROM_20;
    bubble.percentage = 88.9;
    bubble.multiHolder = true;

    auto j = SceneJsonPresenter::elementToJson(bubble);

    EXPECT_EQ(j["kind"], "asset-bubble");
    EXPECT_DOUBLE_EQ(j["x"].get<double>(), 2.75);
    EXPECT_EQ(j["tier"], "20-plus");
    EXPECT_DOUBLE_EQ(j["percentage"].get<double>(), 88.9);
    EXPECT_TRUE(j["multi_holder"].get<bool>());
    EXPECT_EQ(j["outline_color"], "rgba(0,0,0,0.5)");
    EXPECT_FALSE(j.contains("tooltip"));
}

TEST_F(JsonPresenterTest, Scene_LabelOmitsBubbleFields) {
    domain::SceneElement label;
    label.kind = domain::ElementKind::ENTITY_LABEL;
    label.id = "A";
    label.text = "A";

    auto j = SceneJsonPresenter::elementToJson(label);

    EXPECT_EQ(j["text"], "A");
    EXPECT_FALSE(j.contains("percentage"));
    EXPECT_FALSE(j.contains("multi_holder"));
    EXPECT_FALSE(j.contains("outline_color"));
}

TEST_F(JsonPresenterTest, Scene_Empty_KeepsView) {
    auto j = SceneJsonPresenter::toJson(domain::LayoutScene());

    EXPECT_TRUE(j["empty"].get<bool>());
    EXPECT_TRUE(j["elements"].empty());
    EXPECT_DOUBLE_EQ(j["view"]["aspect_ratio"].get<double>(), 1.0);
}

// ============================================================================
// ReportJsonPresenter
// ============================================================================

TEST_F(JsonPresenterTest, Report_MatrixRowsKeyedByEntity) {
    domain::OverlapMatrix matrix;
    matrix.entities = {"A", "B"};
    matrix.assets = {"X"};
    matrix.values = {{100.0, 300.0}};

    auto rows = ReportJsonPresenter::matrixToJson(matrix);

    ASSERT_EQ(rows.size(), 1u);
    EXPECT_EQ(rows[0]["asset"], "X");
    EXPECT_DOUBLE_EQ(rows[0]["A"].get<double>(), 100.0);
    EXPECT_DOUBLE_EQ(rows[0]["B"].get<double>(), 300.0);
}

TEST_F(JsonPresenterTest, Report_TableAndSummary) {
    domain::HoldingsTableRow row;
    row.symbol = "X";
    row.name = "X";
    row.totalValue = 400.0;
    row.marketShare = 100.0;
    row.holders = {"B", "A"};

    domain::HoldingsSummary summary;
    summary.assetCount = 1;
    summary.totalValue = 400.0;
    summary.averageHolders = 2.0;

    auto j = ReportJsonPresenter::toJson(domain::OverlapMatrix(), {row}, summary);

    EXPECT_TRUE(j["overlap_matrix"].empty());
    ASSERT_EQ(j["table"].size(), 1u);
    EXPECT_EQ(j["table"][0]["asset"], "X");
    EXPECT_DOUBLE_EQ(j["table"][0]["market_share"].get<double>(), 100.0);
    EXPECT_EQ(j["summary"]["total_assets"], 1);
    EXPECT_DOUBLE_EQ(j["summary"]["avg_holders_per_asset"].get<double>(), 2.0);
}
