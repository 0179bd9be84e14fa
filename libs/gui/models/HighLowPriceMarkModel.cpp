#include "HighLowPriceMarkModel.hpp"
#include "chart/ChartStore.hpp"
#include "format/KlineFormat.hpp"
#include "KlineLogging.hpp"
#include <cmath>
#include <utility>

LinearPriceAxis::LinearPriceAxis(double min, double max, double height)
    : m_min(min), m_max(max), m_height(height) {}

double LinearPriceAxis::convertToPixel(double price) const {
    const double range = m_max - m_min;
    if (range <= 0) return m_height / 2.0;
    return m_height - (price - m_min) / range * m_height;
}

PriceMarkFormatting PriceMarkFormatting::fromStore(const ChartStore& store) {
    PriceMarkFormatting formatting;
    formatting.pricePrecision = store.precision().price;
    formatting.thousandsSeparator = store.thousandsSeparator();
    formatting.decimalFoldThreshold = static_cast<int>(std::floor(store.decimalFoldThreshold()));
    return formatting;
}

QString HighLowPriceMarkModel::formatPrice(double price, const PriceMarkFormatting& formatting) {
    const std::string fixed = KlineFormat::formatPrecision(price, formatting.pricePrecision);
    const std::string grouped = KlineFormat::formatThousands(fixed, formatting.thousandsSeparator);
    return QString::fromStdString(KlineFormat::formatFoldDecimal(grouped, formatting.decimalFoldThreshold));
}

PriceMarkGeometry HighLowPriceMarkModel::buildMark(const PriceMark& mark, double y, double offset0, double offset1,
                                                   double width, const PriceMarkStyle& style, QString text) {
    PriceMarkGeometry geometry;
    const double startX = mark.x;
    const double startY = y + offset0;

    geometry.arrow = {QPointF(startX - 2, startY + offset0),
                      QPointF(startX, startY),
                      QPointF(startX + 2, startY + offset0)};

    // Label goes towards the middle of the pane
    double lineEndX = 0.0;
    double textStartX = 0.0;
    if (startX > width / 2) {
        lineEndX = startX - 5;
        textStartX = lineEndX - style.textOffset;
        geometry.textAlign = Qt::AlignRight;
    } else {
        lineEndX = startX + 5;
        textStartX = lineEndX + style.textOffset;
        geometry.textAlign = Qt::AlignLeft;
    }

    const double leaderY = startY + offset1;
    geometry.leader = {QPointF(startX, startY), QPointF(startX, leaderY), QPointF(lineEndX, leaderY)};
    geometry.textAnchor = QPointF(textStartX, leaderY);
    geometry.text = std::move(text);
    geometry.color = QString::fromStdString(style.color);
    geometry.textSize = style.textSize;
    geometry.textFamily = QString::fromStdString(style.textFamily);
    geometry.textWeight = QString::fromStdString(style.textWeight);
    return geometry;
}

HighLowMarks HighLowPriceMarkModel::build(const HighLowPrice& summary, const IPriceAxis& axis, double width,
                                          const PriceMarkStyles& styles, const PriceMarkFormatting& formatting) {
    HighLowMarks marks;
    if (!styles.show || (!styles.high.show && !styles.low.show)) return marks;

    const double highY = axis.convertToPixel(summary.high.price);
    const double lowY = axis.convertToPixel(summary.low.price);
    // Each mark points away from the other one
    const bool highAbove = highY < lowY;

    if (styles.high.show && summary.hasHigh()) {
        marks.high = buildMark(summary.high, highY, highAbove ? -2 : 2, highAbove ? -5 : 5,
                               width, styles.high, formatPrice(summary.high.price, formatting));
    }
    if (styles.low.show && summary.hasLow()) {
        marks.low = buildMark(summary.low, lowY, highAbove ? 2 : -2, highAbove ? 5 : -5,
                              width, styles.low, formatPrice(summary.low.price, formatting));
    }
    kLog_Render("HighLowPriceMarkModel: high" << marks.high.has_value() << "low" << marks.low.has_value());
    return marks;
}

HighLowMarks HighLowPriceMarkModel::build(const ChartStore& store, const IPriceAxis& axis, double width) {
    return build(store.visibleRangeHighLowPrice(), axis, width,
                 PriceMarkStyles::fromStyles(store.styles()), PriceMarkFormatting::fromStore(store));
}
