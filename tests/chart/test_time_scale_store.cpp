/*
KlineCore — TimeScaleStore Tests
Role: Verify visible range math, coordinate mapping, zoom/scroll and the time tick labels
Testing Strategy: Real ChartStore + TimeScaleStore, signals observed through QSignalSpy
Coverage: Range clamping, index<->x round trips at known points, interaction signals, timezone, ticks
*/
#include <gtest/gtest.h>
#include <QSignalSpy>
#include "chart/ChartStore.hpp"
#include "chart/TimeScaleStore.hpp"
#include "fixtures/bars.hpp"
#include <algorithm>

// =============================================================================
// Test Fixture
// =============================================================================

class TimeScaleStoreTest : public ::testing::Test {
protected:
    ChartStore store;
    TimeScaleStore timeScale{store};

    void SetUp() override {
        store.setTimeScale(&timeScale);
    }

    // 100 one-minute bars, 400 px viewport, 10 px bars, 80 px right offset
    void loadDefault(double width = 400.0) {
        timeScale.setTotalBarSpace(width);
        store.addData(fixtures::rising(100), LoadDataType::Init);
    }
};

// =============================================================================
// Visible Range
// =============================================================================

TEST_F(TimeScaleStoreTest, InitialRangeLeavesRightOffset) {
    loadDefault();

    EXPECT_DOUBLE_EQ(timeScale.lastBarRightSideDiffBarCount(), 8.0);
    const VisibleRange range = timeScale.visibleRange();
    EXPECT_EQ(range.from, 59);
    EXPECT_EQ(range.to, 100);
    EXPECT_EQ(range.realFrom, 67);
    EXPECT_EQ(range.realTo, 109);
    EXPECT_EQ(store.visibleRangeDataList().size(), 42u);
}

TEST_F(TimeScaleStoreTest, EmptyStoreHasEmptyRange) {
    timeScale.setTotalBarSpace(400.0);
    timeScale.adjustVisibleRange();

    const VisibleRange range = timeScale.visibleRange();
    EXPECT_EQ(range.from, 0);
    EXPECT_EQ(range.to, 0);
}

TEST_F(TimeScaleStoreTest, ScrollIntoHistory) {
    loadDefault();
    QSignalSpy scrolled(&timeScale, &TimeScaleStore::scrolled);
    QSignalSpy changed(&timeScale, &TimeScaleStore::visibleRangeChanged);

    timeScale.startScroll();
    timeScale.scroll(100.0);

    EXPECT_DOUBLE_EQ(timeScale.lastBarRightSideDiffBarCount(), -2.0);
    const VisibleRange range = timeScale.visibleRange();
    EXPECT_EQ(range.from, 58);
    EXPECT_EQ(range.to, 99);
    EXPECT_EQ(range.realFrom, 58);
    EXPECT_EQ(range.realTo, 99);
    EXPECT_EQ(changed.count(), 1);
    ASSERT_EQ(scrolled.count(), 1);
    EXPECT_DOUBLE_EQ(scrolled.takeFirst().at(0).toDouble(), 100.0);
}

TEST_F(TimeScaleStoreTest, ScrollClampsAtOldestBars) {
    loadDefault();

    timeScale.startScroll();
    timeScale.scroll(100000.0);

    EXPECT_DOUBLE_EQ(timeScale.lastBarRightSideDiffBarCount(), -98.0);
    const VisibleRange range = timeScale.visibleRange();
    EXPECT_EQ(range.from, 0);
    EXPECT_EQ(range.to, 3);
}

TEST_F(TimeScaleStoreTest, ScrollClampsAtNewestBars) {
    loadDefault();

    timeScale.startScroll();
    timeScale.scroll(-100000.0);

    EXPECT_DOUBLE_EQ(timeScale.lastBarRightSideDiffBarCount(), 38.0);
    const VisibleRange range = timeScale.visibleRange();
    EXPECT_EQ(range.to, 100);
    EXPECT_EQ(range.realFrom, 97);
    EXPECT_EQ(range.realTo, 139);
}

TEST_F(TimeScaleStoreTest, ScrollWithoutMovementStaysQuiet) {
    loadDefault();
    QSignalSpy scrolled(&timeScale, &TimeScaleStore::scrolled);

    timeScale.startScroll();
    timeScale.scroll(0.0);

    EXPECT_EQ(scrolled.count(), 0);
}

TEST_F(TimeScaleStoreTest, OffsetRightDistanceResetsDiff) {
    loadDefault();

    timeScale.setOffsetRightDistance(40.0);

    EXPECT_DOUBLE_EQ(timeScale.lastBarRightSideDiffBarCount(), 4.0);
    EXPECT_EQ(timeScale.visibleRange().realTo, 105);
}

TEST_F(TimeScaleStoreTest, ClearResetsRangeAndTicks) {
    loadDefault();

    timeScale.clear();

    EXPECT_EQ(timeScale.visibleRange(), VisibleRange{});
    EXPECT_TRUE(timeScale.tickClassifier().buckets().empty());
}

// =============================================================================
// Coordinates
// =============================================================================

TEST_F(TimeScaleStoreTest, IndexToCoordinate) {
    loadDefault();

    EXPECT_DOUBLE_EQ(timeScale.dataIndexToCoordinate(99), 314.5);
    EXPECT_DOUBLE_EQ(timeScale.dataIndexToCoordinate(98), 304.5);
}

TEST_F(TimeScaleStoreTest, CoordinateToIndex) {
    loadDefault();

    EXPECT_NEAR(timeScale.coordinateToFloatIndex(314.5), 99.45, 1e-9);
    EXPECT_EQ(timeScale.coordinateToDataIndex(314.5), 99);
    // Bar 99 covers (310, 320]
    EXPECT_EQ(timeScale.coordinateToDataIndex(312.0), 99);
    EXPECT_EQ(timeScale.coordinateToDataIndex(320.0), 99);
    EXPECT_EQ(timeScale.coordinateToDataIndex(305.0), 98);
    // Blank space right of the newest bar
    EXPECT_GT(timeScale.coordinateToDataIndex(390.0), 99);
}

TEST_F(TimeScaleStoreTest, TimestampLookup) {
    EXPECT_FALSE(timeScale.timestampToDataIndex(fixtures::kBaseTime).has_value());

    loadDefault();
    const int64_t t0 = fixtures::kBaseTime;
    const int64_t minute = fixtures::kMinute;

    EXPECT_EQ(timeScale.timestampToDataIndex(t0 + 10 * minute), 10);
    EXPECT_EQ(timeScale.timestampToDataIndex(t0 + 10 * minute + 30000), 10);
    EXPECT_EQ(timeScale.timestampToDataIndex(t0 - minute), 0);
    EXPECT_EQ(timeScale.timestampToDataIndex(t0 + 500 * minute), 99);
    EXPECT_EQ(timeScale.dataIndexToTimestamp(10), t0 + 10 * minute);
    EXPECT_FALSE(timeScale.dataIndexToTimestamp(100).has_value());
}

// =============================================================================
// Zoom
// =============================================================================

TEST_F(TimeScaleStoreTest, ZoomKeepsBarUnderCursor) {
    loadDefault();
    QSignalSpy zoomed(&timeScale, &TimeScaleStore::zoomed);
    const double before = timeScale.coordinateToFloatIndex(200.0);

    timeScale.zoom(1.0, 200.0);

    EXPECT_DOUBLE_EQ(timeScale.barSpace(), 11.0);
    EXPECT_NEAR(timeScale.coordinateToFloatIndex(200.0), before, 1e-5);
    ASSERT_EQ(zoomed.count(), 1);
    EXPECT_NEAR(zoomed.takeFirst().at(0).toDouble(), 1.1, 1e-9);
}

TEST_F(TimeScaleStoreTest, ZoomOutsideLimitsIsIgnored) {
    loadDefault();
    timeScale.setBarSpace(TimeScaleStore::kMaxBarSpace);
    QSignalSpy zoomed(&timeScale, &TimeScaleStore::zoomed);

    timeScale.zoom(1.0);

    EXPECT_DOUBLE_EQ(timeScale.barSpace(), TimeScaleStore::kMaxBarSpace);
    EXPECT_EQ(zoomed.count(), 0);
}

TEST_F(TimeScaleStoreTest, BarSpaceOutsideLimitsIsIgnored) {
    loadDefault();
    QSignalSpy changed(&timeScale, &TimeScaleStore::visibleRangeChanged);

    timeScale.setBarSpace(0.5);
    timeScale.setBarSpace(60.0);
    timeScale.setBarSpace(10.0);
    EXPECT_DOUBLE_EQ(timeScale.barSpace(), 10.0);
    EXPECT_EQ(changed.count(), 0);

    timeScale.setBarSpace(20.0);
    EXPECT_DOUBLE_EQ(timeScale.barSpace(), 20.0);
    EXPECT_EQ(changed.count(), 1);
}

// =============================================================================
// Time Ticks
// =============================================================================

TEST_F(TimeScaleStoreTest, BackwardPageIsClassifiedAfterTheTail) {
    timeScale.setTotalBarSpace(400.0);
    store.addData(fixtures::rising(3), LoadDataType::Init);
    store.addData(fixtures::rising(2, fixtures::kBaseTime + 3 * fixtures::kMinute), LoadDataType::Backward);

    const auto& buckets = timeScale.tickClassifier().buckets();
    ASSERT_TRUE(buckets.count(TimeWeight::Minute));
    const auto& minutes = buckets.at(TimeWeight::Minute);
    EXPECT_TRUE(std::any_of(minutes.begin(), minutes.end(), [](const TimeTick& t) { return t.dataIndex == 4; }));
    ASSERT_EQ(buckets.at(TimeWeight::Year).size(), 1u);
    EXPECT_EQ(buckets.at(TimeWeight::Year).front().dataIndex, 0);
}

TEST_F(TimeScaleStoreTest, ForwardPageReclassifiesFromTheStart) {
    timeScale.setTotalBarSpace(400.0);
    store.addData(fixtures::rising(3, fixtures::kBaseTime + 10 * fixtures::kMinute), LoadDataType::Init);
    store.addData(fixtures::rising(3), LoadDataType::Forward);

    const auto& buckets = timeScale.tickClassifier().buckets();
    ASSERT_EQ(buckets.at(TimeWeight::Year).size(), 1u);
    EXPECT_EQ(buckets.at(TimeWeight::Year).front().timestamp, fixtures::kBaseTime);
    std::size_t total = 0;
    for (const auto& [weight, ticks] : buckets) total += ticks.size();
    EXPECT_EQ(total, 6u);
}

TEST_F(TimeScaleStoreTest, TickListLabelsVisibleBoundaries) {
    loadDefault(1000.0);
    const VisibleRange range = timeScale.visibleRange();
    ASSERT_EQ(range.realFrom, 7);
    ASSERT_EQ(range.realTo, 109);

    const auto ticks = timeScale.tickList();

    ASSERT_FALSE(ticks.empty());
    EXPECT_TRUE(std::is_sorted(ticks.begin(), ticks.end(),
                               [](const TimeTickLabel& a, const TimeTickLabel& b) { return a.dataIndex < b.dataIndex; }));
    for (const auto& tick : ticks) {
        EXPECT_GE(tick.dataIndex, range.realFrom);
        EXPECT_LT(tick.dataIndex, range.realTo);
    }
    for (std::size_t i = 1; i < ticks.size(); ++i) {
        EXPECT_GE(ticks[i].x - ticks[i - 1].x, TimeScaleStore::kMinTickSpacing);
    }
    auto hour = std::find_if(ticks.begin(), ticks.end(), [](const TimeTickLabel& t) { return t.dataIndex == 60; });
    ASSERT_NE(hour, ticks.end());
    EXPECT_EQ(hour->weight, TimeWeight::Hour);
    EXPECT_EQ(hour->text, QStringLiteral("01:00"));
    EXPECT_DOUBLE_EQ(hour->x, timeScale.dataIndexToCoordinate(60));
}

TEST_F(TimeScaleStoreTest, TimezoneShiftsLabels) {
    loadDefault(1000.0);

    EXPECT_TRUE(timeScale.setTimezone("UTC+08:00"));

    EXPECT_EQ(timeScale.timezoneId(), QStringLiteral("UTC+08:00"));
    const auto ticks = timeScale.tickList();
    auto hour = std::find_if(ticks.begin(), ticks.end(), [](const TimeTickLabel& t) { return t.dataIndex == 60; });
    ASSERT_NE(hour, ticks.end());
    EXPECT_EQ(hour->text, QStringLiteral("09:00"));
}

TEST_F(TimeScaleStoreTest, UnknownTimezoneIsIgnored) {
    loadDefault();
    const QString before = timeScale.timezoneId();

    EXPECT_FALSE(timeScale.setTimezone("Mars/Olympus_Mons"));

    EXPECT_EQ(timeScale.timezoneId(), before);
}

TEST_F(TimeScaleStoreTest, StoreKeepsLastAcceptedTimezone) {
    loadDefault();
    ChartOptions options;
    options.timezone = "UTC+08:00";
    store.applyOptions(options);

    options.timezone = "Mars/Olympus_Mons";
    store.applyOptions(options);

    EXPECT_EQ(store.timezone(), "UTC+08:00");
    EXPECT_EQ(timeScale.timezoneId(), QStringLiteral("UTC+08:00"));
}
