/*
KlineCore — TimeScaleStore
Role: Implements index<->coordinate math, visible range clamping, zoom-to-cursor and drag scrolling.
Threading: All code is designed to be executed on the main GUI thread.
Related: TimeScaleStore.hpp.
Assumptions: JS-style rounding (half up) so ranges match the reference chart behavior.
*/
#include "TimeScaleStore.hpp"
#include "ChartStore.hpp"
#include "../KlineLogging.hpp"
#include <QByteArray>
#include <algorithm>
#include <cmath>

namespace {
// Math.round: halves go towards +infinity
int roundHalfUp(double value) {
    return static_cast<int>(std::floor(value + 0.5));
}
}

TimeScaleStore::TimeScaleStore(const ChartStore& store, QObject* parent)
    : QObject(parent)
    , m_store(store) {
    resetOffsetRightDistance();
}

int TimeScaleStore::dataCount() const {
    return static_cast<int>(m_store.dataList().size());
}

// =============================================================================
// Coordinates
// =============================================================================

double TimeScaleStore::dataIndexToCoordinate(int dataIndex) const {
    const double deltaFromRight = dataCount() + m_lastBarRightSideDiffBarCount - dataIndex;
    return std::floor(m_totalBarSpace - (deltaFromRight - 0.5) * m_barSpace) - 0.5;
}

double TimeScaleStore::coordinateToFloatIndex(double x) const {
    const double deltaFromRight = (m_totalBarSpace - x) / m_barSpace;
    const double index = dataCount() + m_lastBarRightSideDiffBarCount - deltaFromRight;
    return std::round(index * 1000000.0) / 1000000.0;
}

int TimeScaleStore::coordinateToDataIndex(double x) const {
    return static_cast<int>(std::ceil(coordinateToFloatIndex(x))) - 1;
}

std::optional<int64_t> TimeScaleStore::dataIndexToTimestamp(int dataIndex) const {
    const auto& dataList = m_store.dataList();
    if (dataIndex < 0 || dataIndex >= static_cast<int>(dataList.size())) {
        return std::nullopt;
    }
    return dataList[static_cast<std::size_t>(dataIndex)].timestamp;
}

std::optional<int> TimeScaleStore::timestampToDataIndex(int64_t timestamp) const {
    const auto& dataList = m_store.dataList();
    if (dataList.empty()) return std::nullopt;

    // Last bar at or before timestamp; earlier than everything maps to 0
    auto it = std::upper_bound(dataList.begin(), dataList.end(), timestamp,
        [](int64_t value, const KLineData& bar) { return value < bar.timestamp; });
    if (it == dataList.begin()) return 0;
    return static_cast<int>(std::distance(dataList.begin(), it)) - 1;
}

// =============================================================================
// Visible range
// =============================================================================

void TimeScaleStore::resetOffsetRightDistance() {
    m_lastBarRightSideDiffBarCount = m_offsetRightDistance / m_barSpace;
}

void TimeScaleStore::adjustVisibleRange() {
    const int totalBarCount = dataCount();
    const double visibleBarCount = m_totalBarSpace / m_barSpace;

    // Keep at least a couple of bars on screen whichever way we scrolled
    const double maxRightOffsetBarCount = visibleBarCount - std::min(kMinVisibleBarCount, totalBarCount);
    if (m_lastBarRightSideDiffBarCount > maxRightOffsetBarCount) {
        m_lastBarRightSideDiffBarCount = maxRightOffsetBarCount;
    }
    const double minRightOffsetBarCount = -totalBarCount + std::min(kMinVisibleBarCount, totalBarCount);
    if (m_lastBarRightSideDiffBarCount < minRightOffsetBarCount) {
        m_lastBarRightSideDiffBarCount = minRightOffsetBarCount;
    }

    int to = roundHalfUp(m_lastBarRightSideDiffBarCount + totalBarCount + 0.5);
    const int realTo = to;
    if (to > totalBarCount) {
        to = totalBarCount;
    }
    int from = roundHalfUp(to - visibleBarCount) - 1;
    if (from < 0) {
        from = 0;
    }
    const int realFrom = m_lastBarRightSideDiffBarCount > 0
        ? roundHalfUp(totalBarCount + m_lastBarRightSideDiffBarCount - visibleBarCount) - 1
        : from;

    m_visibleRange = VisibleRange{from, to, realFrom, realTo};
    kLog_Render("TimeScaleStore: range" << from << to << "real" << realFrom << realTo
                << "barSpace" << m_barSpace << "diff" << m_lastBarRightSideDiffBarCount);
}

void TimeScaleStore::clear() {
    m_visibleRange = VisibleRange{};
    m_ticks.clear();
}

// =============================================================================
// Geometry & interaction
// =============================================================================

void TimeScaleStore::setBarSpace(double barSpace) {
    if (barSpace < kMinBarSpace || barSpace > kMaxBarSpace || barSpace == m_barSpace) {
        return;
    }
    m_barSpace = barSpace;
    adjustVisibleRange();
    emit visibleRangeChanged();
}

void TimeScaleStore::setTotalBarSpace(double totalBarSpace) {
    if (totalBarSpace < 0 || totalBarSpace == m_totalBarSpace) {
        return;
    }
    m_totalBarSpace = totalBarSpace;
    adjustVisibleRange();
    emit visibleRangeChanged();
}

void TimeScaleStore::setOffsetRightDistance(double distance) {
    m_offsetRightDistance = distance;
    resetOffsetRightDistance();
    adjustVisibleRange();
    emit visibleRangeChanged();
}

void TimeScaleStore::zoom(double scale, std::optional<double> x) {
    // Zoom around the cursor; default to the middle of the viewport
    const double anchorX = x.value_or(m_totalBarSpace / 2.0);
    const double floatIndex = coordinateToFloatIndex(anchorX);
    const double prevBarSpace = m_barSpace;
    const double barSpace = m_barSpace + scale * (m_barSpace / kZoomScaleMultiplier);

    if (barSpace < kMinBarSpace || barSpace > kMaxBarSpace || barSpace == m_barSpace) {
        return;
    }
    m_barSpace = barSpace;
    // Shift so the bar under the cursor stays under the cursor
    m_lastBarRightSideDiffBarCount += floatIndex - coordinateToFloatIndex(anchorX);
    adjustVisibleRange();
    emit visibleRangeChanged();

    const double realScale = m_barSpace / prevBarSpace;
    if (realScale != 1.0) {
        emit zoomed(realScale);
    }
}

void TimeScaleStore::startScroll() {
    m_startLastBarRightSideDiffBarCount = m_lastBarRightSideDiffBarCount;
}

void TimeScaleStore::scroll(double distance) {
    const double distanceBarCount = distance / m_barSpace;
    const double prevLastBarRightSideDistance = m_lastBarRightSideDiffBarCount * m_barSpace;
    m_lastBarRightSideDiffBarCount = m_startLastBarRightSideDiffBarCount - distanceBarCount;
    adjustVisibleRange();
    emit visibleRangeChanged();

    const double realDistance = std::round(prevLastBarRightSideDistance - m_lastBarRightSideDiffBarCount * m_barSpace);
    if (realDistance != 0.0) {
        emit scrolled(realDistance);
    }
}

// =============================================================================
// Time ticks
// =============================================================================

void TimeScaleStore::classifyTimeTicks(const std::vector<KLineData>& bars, bool isAppendTail) {
    if (!isAppendTail) {
        m_ticks.clear();
        m_ticks.classify(bars, 0, std::nullopt);
        return;
    }
    const auto& dataList = m_store.dataList();
    std::optional<int64_t> prevTimestamp;
    if (!dataList.empty()) {
        prevTimestamp = dataList.back().timestamp;
    }
    m_ticks.classify(bars, static_cast<int>(dataList.size()), prevTimestamp);
}

bool TimeScaleStore::setTimezone(const std::string& timezone) {
    const QTimeZone zone(QByteArray::fromStdString(timezone));
    if (!zone.isValid()) {
        kLog_Warning("TimeScaleStore: unknown timezone" << QString::fromStdString(timezone) << "ignored");
        return false;
    }
    if (zone == m_ticks.timezone()) return true;

    m_ticks.setTimezone(zone);
    // Calendar boundaries moved: reclassify everything
    m_ticks.clear();
    m_ticks.classify(m_store.dataList(), 0, std::nullopt);
    kLog_App("TimeScaleStore: timezone set to" << zone.id());
    return true;
}

QString TimeScaleStore::timezoneId() const {
    return QString::fromUtf8(m_ticks.timezone().id());
}

std::vector<TimeTickLabel> TimeScaleStore::tickList() const {
    std::vector<TimeTickLabel> labels;
    const auto& formatDate = m_store.customApi().formatDate;
    for (const TimeTick& tick : m_ticks.select(m_barSpace, kMinTickSpacing)) {
        if (tick.dataIndex < m_visibleRange.realFrom || tick.dataIndex >= m_visibleRange.realTo) continue;
        TimeTickLabel label;
        label.dataIndex = tick.dataIndex;
        label.x = dataIndexToCoordinate(tick.dataIndex);
        label.weight = tick.weight;
        if (formatDate) {
            label.text = formatDate(m_ticks.timezone(), tick.timestamp,
                                    TimeTickClassifier::labelFormat(tick.weight), FormatDateType::XAxis);
        }
        labels.push_back(std::move(label));
    }
    return labels;
}
