#include <gtest/gtest.h>
#include "chart/ChartStore.hpp"
#include "fixtures/bars.hpp"
#include "fixtures/spy_collaborators.hpp"
#include "models/HighLowPriceMarkModel.hpp"

class HighLowPriceMarkModelTest : public ::testing::Test {
protected:
    // 0..100 over 200 px
    LinearPriceAxis axis{0.0, 100.0, 200.0};
    PriceMarkStyles styles;
    PriceMarkFormatting formatting;

    static HighLowPrice summary(double highX, double highPrice, double lowX, double lowPrice) {
        HighLowPrice s;
        s.high = PriceMark{highX, highPrice};
        s.low = PriceMark{lowX, lowPrice};
        return s;
    }
};

// =============================================================================
// Geometry
// =============================================================================

TEST_F(HighLowPriceMarkModelTest, MarksPointAwayFromEachOther) {
    const HighLowMarks marks = HighLowPriceMarkModel::build(summary(300, 80, 100, 20), axis, 400, styles, formatting);

    ASSERT_TRUE(marks.high.has_value());
    ASSERT_TRUE(marks.low.has_value());

    // High at y 40: arrow and leader go up
    const PriceMarkGeometry& high = *marks.high;
    ASSERT_EQ(high.arrow.size(), 3);
    EXPECT_EQ(high.arrow[0], QPointF(298, 36));
    EXPECT_EQ(high.arrow[1], QPointF(300, 38));
    EXPECT_EQ(high.arrow[2], QPointF(302, 36));
    EXPECT_EQ(high.leader.back(), QPointF(295, 33));

    // Low at y 160: arrow and leader go down
    const PriceMarkGeometry& low = *marks.low;
    EXPECT_EQ(low.arrow[1], QPointF(100, 162));
    EXPECT_EQ(low.arrow[0], QPointF(98, 164));
    EXPECT_EQ(low.leader.back(), QPointF(105, 167));
}

TEST_F(HighLowPriceMarkModelTest, LabelFacesPaneCenter) {
    const HighLowMarks marks = HighLowPriceMarkModel::build(summary(300, 80, 100, 20), axis, 400, styles, formatting);

    EXPECT_TRUE(marks.high->textAlign.testFlag(Qt::AlignRight));
    EXPECT_EQ(marks.high->textAnchor, QPointF(290, 33));
    EXPECT_TRUE(marks.low->textAlign.testFlag(Qt::AlignLeft));
    EXPECT_EQ(marks.low->textAnchor, QPointF(110, 167));
    EXPECT_EQ(marks.high->text, QStringLiteral("80.00"));
    EXPECT_EQ(marks.low->color, QStringLiteral("#76808F"));
}

TEST_F(HighLowPriceMarkModelTest, HiddenOrMissingMarksAreSkipped) {
    styles.low.show = false;
    HighLowMarks marks = HighLowPriceMarkModel::build(summary(300, 80, 100, 20), axis, 400, styles, formatting);
    EXPECT_TRUE(marks.high.has_value());
    EXPECT_FALSE(marks.low.has_value());

    styles.show = false;
    marks = HighLowPriceMarkModel::build(summary(300, 80, 100, 20), axis, 400, styles, formatting);
    EXPECT_FALSE(marks.high.has_value());

    marks = HighLowPriceMarkModel::build(HighLowPrice{}, axis, 400, PriceMarkStyles{}, formatting);
    EXPECT_FALSE(marks.high.has_value());
    EXPECT_FALSE(marks.low.has_value());
}

// =============================================================================
// Labels
// =============================================================================

TEST_F(HighLowPriceMarkModelTest, PriceTextIsGroupedAndFolded) {
    EXPECT_EQ(HighLowPriceMarkModel::formatPrice(1234567.891, formatting), QStringLiteral("1,234,567.89"));

    formatting.pricePrecision = 8;
    EXPECT_EQ(HighLowPriceMarkModel::formatPrice(0.0000123, formatting), QStringLiteral("0.0{4}1230"));

    formatting.decimalFoldThreshold = 5;
    EXPECT_EQ(HighLowPriceMarkModel::formatPrice(0.0000123, formatting), QStringLiteral("0.00001230"));
}

TEST_F(HighLowPriceMarkModelTest, FlatAxisCentersMarks) {
    LinearPriceAxis flat{50.0, 50.0, 200.0};
    EXPECT_DOUBLE_EQ(flat.convertToPixel(50.0), 100.0);
}

// =============================================================================
// Store-driven
// =============================================================================

TEST_F(HighLowPriceMarkModelTest, BuildsFromStoreWindow) {
    CallLog log;
    SpyTimeScale timeScale{log};
    timeScale.setRangeAfterAdjust(VisibleRange{0, 5, 0, 5});
    ChartStore store;
    store.setTimeScale(&timeScale);
    store.addData(fixtures::rising(5), LoadDataType::Init);

    const HighLowMarks marks = HighLowPriceMarkModel::build(store, LinearPriceAxis{9.0, 15.0, 120.0}, 40.0);

    ASSERT_TRUE(marks.high.has_value());
    ASSERT_TRUE(marks.low.has_value());
    EXPECT_EQ(marks.high->text, QStringLiteral("14.50"));
    EXPECT_EQ(marks.high->arrow[1].x(), 45.0);
    EXPECT_TRUE(marks.high->textAlign.testFlag(Qt::AlignRight));
    EXPECT_EQ(marks.low->text, QStringLiteral("9.50"));
    EXPECT_TRUE(marks.low->textAlign.testFlag(Qt::AlignLeft));
}
