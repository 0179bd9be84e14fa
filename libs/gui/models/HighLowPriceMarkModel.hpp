/*
KlineCore — HighLowPriceMarkModel
Role: Turns the visible high/low summary into mark geometry (arrow, leader line, label) for the candle pane.
Inputs/Outputs: HighLowPrice + price axis + pane width + styles in; per-mark polylines and text anchors out.
Threading: Main thread only; pure computation, no state.
Integration: Called by the painter after ChartStore has recomputed the visible window.
Related: HighLowPriceMarkModel.cpp, ChartStore.hpp, StyleTree.hpp, KlineFormat.hpp.
Assumptions: Screen y grows downwards.
*/
#pragma once
#include <QPointF>
#include <QString>
#include <QVector>
#include <optional>
#include <string>
#include "chart/KLineData.h"
#include "config/StyleTree.hpp"

class ChartStore;

class IPriceAxis {
public:
    virtual ~IPriceAxis() = default;
    virtual double convertToPixel(double price) const = 0;
};

// Linear mapping of [min, max] onto [height, 0]
class LinearPriceAxis : public IPriceAxis {
public:
    LinearPriceAxis(double min, double max, double height);
    double convertToPixel(double price) const override;

private:
    double m_min;
    double m_max;
    double m_height;
};

struct PriceMarkFormatting {
    int pricePrecision = 2;
    std::string thousandsSeparator = ",";
    int decimalFoldThreshold = 3;

    static PriceMarkFormatting fromStore(const ChartStore& store);
};

struct PriceMarkGeometry {
    QVector<QPointF> arrow;     // Three points, tip at the bar
    QVector<QPointF> leader;    // Vertical then horizontal segment towards the label
    QPointF textAnchor;         // Vertically centered
    Qt::Alignment textAlign = Qt::AlignLeft;
    QString text;
    QString color;
    int textSize = 10;
    QString textFamily;
    QString textWeight;
};

struct HighLowMarks {
    std::optional<PriceMarkGeometry> high;
    std::optional<PriceMarkGeometry> low;
};

class HighLowPriceMarkModel {
public:
    static HighLowMarks build(const HighLowPrice& summary, const IPriceAxis& axis, double width,
                              const PriceMarkStyles& styles, const PriceMarkFormatting& formatting);

    // Everything read from the store
    static HighLowMarks build(const ChartStore& store, const IPriceAxis& axis, double width);

    static QString formatPrice(double price, const PriceMarkFormatting& formatting);

private:
    static PriceMarkGeometry buildMark(const PriceMark& mark, double y, double offset0, double offset1,
                                       double width, const PriceMarkStyle& style, QString text);
};
