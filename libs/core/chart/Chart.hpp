/*
KlineCore — Chart
Role: Composition root of one chart instance: owns the data core and every store that reads from it.
Inputs/Outputs: Public entry points for data (init, live updates, load-more source) and viewport width.
Threading: Main thread only; time scale signals are direct connections.
Integration: Constructs ChartStore first, hands each dependent a const reference to it, then injects the dependents back.
Observability: Lifecycle via kLog_App.
Related: Chart.cpp, ChartStore.hpp, TimeScaleStore.hpp.
*/
#pragma once
#include <QObject>
#include <memory>
#include <optional>
#include <vector>
#include "ChartStore.hpp"
#include "ActionStore.hpp"
#include "IndicatorStore.hpp"
#include "OverlayStore.hpp"
#include "TimeScaleStore.hpp"
#include "TooltipStore.hpp"

class Chart : public QObject, public IPaneViewport {
    Q_OBJECT

public:
    explicit Chart(const ChartOptions& options = {}, QObject* parent = nullptr);
    ~Chart() override;

    ChartStore& store() { return *m_store; }
    const ChartStore& store() const { return *m_store; }
    TimeScaleStore& timeScale() { return *m_timeScale; }
    const TimeScaleStore& timeScale() const { return *m_timeScale; }
    OverlayStore& overlays() { return *m_overlays; }
    IndicatorStore& indicators() { return *m_indicators; }
    TooltipStore& tooltip() { return *m_tooltip; }
    ActionStore& actions() { return m_actions; }

    // Data entry points
    AddDataResult applyNewData(std::vector<KLineData> bars, std::optional<bool> more = std::nullopt);
    AddDataResult updateData(const KLineData& bar);
    void setLoadMoreDataCallback(LoadDataCallback callback);

    // Viewport width in pixels
    void resize(double width);

    void adjustPaneViewport() override;

signals:
    void paneViewportAdjusted();

private:
    ActionStore m_actions;
    std::unique_ptr<ChartStore> m_store;
    std::unique_ptr<TimeScaleStore> m_timeScale;
    std::unique_ptr<OverlayStore> m_overlays;
    std::unique_ptr<IndicatorStore> m_indicators;
    std::unique_ptr<TooltipStore> m_tooltip;
};
