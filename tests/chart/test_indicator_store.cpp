#include <gtest/gtest.h>
#include "chart/ChartStore.hpp"
#include "chart/IndicatorStore.hpp"
#include "fixtures/bars.hpp"

class IndicatorStoreTest : public ::testing::Test {
protected:
    ChartStore store;
    IndicatorStore indicators{store};

    void SetUp() override {
        store.setIndicatorStore(&indicators);
        store.addData(fixtures::rising(12), LoadDataType::Init);
    }
};

// =============================================================================
// Templates
// =============================================================================

TEST_F(IndicatorStoreTest, BuiltinsAreRegistered) {
    EXPECT_TRUE(indicators.hasTemplate("MA"));
    EXPECT_TRUE(indicators.hasTemplate("VOL"));
    EXPECT_FALSE(indicators.hasTemplate("MACD"));
}

TEST_F(IndicatorStoreTest, TemplateNeedsNameAndCalc) {
    IndicatorTemplate unnamed = IndicatorStore::movingAverage();
    unnamed.name.clear();
    EXPECT_FALSE(indicators.registerTemplate(unnamed));

    IndicatorTemplate noCalc;
    noCalc.name = "EMPTY";
    EXPECT_FALSE(indicators.registerTemplate(noCalc));
    EXPECT_FALSE(indicators.hasTemplate("EMPTY"));
}

// =============================================================================
// Instances
// =============================================================================

TEST_F(IndicatorStoreTest, MovingAverageSkipsWarmUpRows) {
    ASSERT_TRUE(indicators.createInstance("MA", "candle_pane", std::vector<double>{3}));

    const Indicator* ma = indicators.instance("candle_pane", "MA");
    ASSERT_NE(ma, nullptr);
    ASSERT_EQ(ma->result.size(), 12u);
    EXPECT_EQ(ma->result[0].count("ma3"), 0u);
    EXPECT_EQ(ma->result[1].count("ma3"), 0u);
    // Closes 10, 11, 12
    EXPECT_DOUBLE_EQ(ma->result[2].at("ma3"), 11.0);
    EXPECT_DOUBLE_EQ(ma->result[11].at("ma3"), 20.0);
}

TEST_F(IndicatorStoreTest, VolumeCarriesRawVolumeAndAverages) {
    ASSERT_TRUE(indicators.createInstance("VOL", "vol_pane"));

    const Indicator* vol = indicators.instance("vol_pane", "VOL");
    ASSERT_NE(vol, nullptr);
    EXPECT_DOUBLE_EQ(vol->result[0].at("volume"), 100.0);
    EXPECT_EQ(vol->result[3].count("ma5"), 0u);
    EXPECT_DOUBLE_EQ(vol->result[4].at("ma5"), 102.0);
    EXPECT_DOUBLE_EQ(vol->result[9].at("ma10"), 104.5);
}

TEST_F(IndicatorStoreTest, UnknownOrDuplicateInstanceRejected) {
    EXPECT_FALSE(indicators.createInstance("MACD", "candle_pane"));
    EXPECT_TRUE(indicators.createInstance("MA", "candle_pane"));
    EXPECT_FALSE(indicators.createInstance("MA", "candle_pane"));
    EXPECT_TRUE(indicators.createInstance("MA", "other_pane"));
}

TEST_F(IndicatorStoreTest, RemoveByNameOrWholePane) {
    indicators.createInstance("MA", "pane_a");
    indicators.createInstance("VOL", "pane_a");
    indicators.createInstance("VOL", "pane_b");

    EXPECT_TRUE(indicators.removeInstance("pane_a", std::string("MA")));
    EXPECT_EQ(indicators.instances("pane_a").size(), 1u);

    EXPECT_TRUE(indicators.removeInstance("pane_a"));
    EXPECT_TRUE(indicators.instances("pane_a").empty());
    EXPECT_FALSE(indicators.removeInstance("pane_a"));
    EXPECT_EQ(indicators.instances("pane_b").size(), 1u);
}

// =============================================================================
// Recalculation
// =============================================================================

TEST_F(IndicatorStoreTest, AppendRecalculatesThroughStore) {
    indicators.createInstance("MA", "candle_pane", std::vector<double>{3});

    store.addData(fixtures::rising(1, fixtures::kBaseTime + 12 * fixtures::kMinute), LoadDataType::Backward);

    const Indicator* ma = indicators.instance("candle_pane", "MA");
    ASSERT_EQ(ma->result.size(), 13u);
    // Closes 20, 21, 10: the appended bar restarts the rising sequence
    EXPECT_DOUBLE_EQ(ma->result[12].at("ma3"), 17.0);
}

TEST_F(IndicatorStoreTest, FilterLimitsRecalculation) {
    indicators.createInstance("VOL", "pane_a");
    indicators.createInstance("VOL", "pane_b");

    // Grow the sequence without the store notifying
    store.setIndicatorStore(nullptr);
    store.addData(fixtures::rising(2, fixtures::kBaseTime + 12 * fixtures::kMinute), LoadDataType::Backward);

    indicators.calcInstance(LoadDataType::Update, IndicatorCalcFilter{std::string("pane_a"), std::nullopt});

    EXPECT_EQ(indicators.instance("pane_a", "VOL")->result.size(), 14u);
    EXPECT_EQ(indicators.instance("pane_b", "VOL")->result.size(), 12u);
}

TEST_F(IndicatorStoreTest, PrecisionFollowsSeriesKind) {
    IndicatorTemplate custom;
    custom.name = "SPREAD";
    custom.precision = 3;
    custom.calc = [](const std::vector<KLineData>& bars, const std::vector<double>&) {
        std::vector<IndicatorRow> rows;
        for (const auto& bar : bars) rows.push_back({{"spread", bar.high - bar.low}});
        return rows;
    };
    ASSERT_TRUE(indicators.registerTemplate(custom));
    indicators.createInstance("MA", "candle_pane");
    indicators.createInstance("VOL", "vol_pane");
    indicators.createInstance("SPREAD", "candle_pane");

    store.setPrecision(Precision{5, 2});

    EXPECT_EQ(indicators.instance("candle_pane", "MA")->precision, 5);
    EXPECT_EQ(indicators.instance("vol_pane", "VOL")->precision, 2);
    EXPECT_EQ(indicators.instance("candle_pane", "SPREAD")->precision, 3);
}
