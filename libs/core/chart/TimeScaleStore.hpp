/*
KlineCore — TimeScaleStore
Role: Maps data indices to x coordinates and owns the visible index range, bar spacing and time tick classification.
Inputs/Outputs: Takes viewport width, zoom and scroll input; emits visibleRangeChanged after interactive changes.
Threading: Lives on the main GUI thread; all methods are executed on this thread.
Performance: Range recomputation is O(1); tick classification is O(new bars) when appending at the tail.
Integration: Owned by Chart; reads the bar sequence through a const ChartStore reference and is called back by ChartStore after mutations.
Observability: Logs range changes via kLog_Render, timezone problems via kLog_Warning.
Related: TimeScaleStore.cpp, TimeTickClassifier.hpp, ChartStore.hpp.
Assumptions: lastBarRightSideDiffBarCount > 0 means blank bars to the right of the newest bar.
*/
#pragma once
#include <QObject>
#include <QString>
#include <optional>
#include <string>
#include <vector>
#include "ChartCollaborators.hpp"
#include "TimeTickClassifier.hpp"

class ChartStore;

struct TimeTickLabel {
    int dataIndex = 0;
    double x = 0.0;
    TimeWeight weight = TimeWeight::Second;
    QString text;
};

class TimeScaleStore : public QObject, public ITimeScale {
    Q_OBJECT

public:
    explicit TimeScaleStore(const ChartStore& store, QObject* parent = nullptr);

    // ITimeScale
    VisibleRange visibleRange() const override { return m_visibleRange; }
    double dataIndexToCoordinate(int dataIndex) const override;
    int coordinateToDataIndex(double x) const override;
    std::optional<int> timestampToDataIndex(int64_t timestamp) const override;
    void classifyTimeTicks(const std::vector<KLineData>& bars, bool isAppendTail = false) override;
    void resetOffsetRightDistance() override;
    void adjustVisibleRange() override;
    bool setTimezone(const std::string& timezone) override;
    void clear() override;
    double lastBarRightSideDiffBarCount() const override { return m_lastBarRightSideDiffBarCount; }
    void setLastBarRightSideDiffBarCount(double count) override { m_lastBarRightSideDiffBarCount = count; }

    double coordinateToFloatIndex(double x) const;
    std::optional<int64_t> dataIndexToTimestamp(int dataIndex) const;

    // Geometry
    double barSpace() const { return m_barSpace; }
    void setBarSpace(double barSpace);
    double totalBarSpace() const { return m_totalBarSpace; }
    void setTotalBarSpace(double totalBarSpace);
    double offsetRightDistance() const { return m_offsetRightDistance; }
    void setOffsetRightDistance(double distance);

    // Interaction
    void zoom(double scale, std::optional<double> x = std::nullopt);
    void startScroll();
    void scroll(double distance);

    // Time axis
    QString timezoneId() const;
    std::vector<TimeTickLabel> tickList() const;
    const TimeTickClassifier& tickClassifier() const { return m_ticks; }

    static constexpr double kMinBarSpace = 1.0;
    static constexpr double kMaxBarSpace = 50.0;
    // Horizontal pixels between two tick labels
    static constexpr double kMinTickSpacing = 60.0;

signals:
    void visibleRangeChanged();
    void zoomed(double scale);
    void scrolled(double distance);

private:
    int dataCount() const;

    const ChartStore& m_store;

    double m_barSpace = 10.0;
    double m_totalBarSpace = 0.0;
    double m_offsetRightDistance = 80.0;
    double m_lastBarRightSideDiffBarCount = 0.0;
    double m_startLastBarRightSideDiffBarCount = 0.0;
    VisibleRange m_visibleRange;

    // Bars that must stay on screen at either edge
    static constexpr int kMinVisibleBarCount = 2;
    static constexpr double kZoomScaleMultiplier = 10.0;

    TimeTickClassifier m_ticks;
};
