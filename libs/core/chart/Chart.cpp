/*
KlineCore — Chart
Role: Wires the stores together and routes time scale signals.
Related: Chart.hpp.
*/
#include "Chart.hpp"
#include "../KlineLogging.hpp"
#include <utility>

Chart::Chart(const ChartOptions& options, QObject* parent)
    : QObject(parent)
    , m_store(std::make_unique<ChartStore>(options)) {
    m_timeScale = std::make_unique<TimeScaleStore>(*m_store);
    m_overlays = std::make_unique<OverlayStore>(*m_store, *m_timeScale);
    m_indicators = std::make_unique<IndicatorStore>(*m_store);
    m_tooltip = std::make_unique<TooltipStore>(*m_store, *m_timeScale, &m_actions);

    m_store->setTimeScale(m_timeScale.get());
    m_store->setOverlayStore(m_overlays.get());
    m_store->setIndicatorStore(m_indicators.get());
    m_store->setTooltipStore(m_tooltip.get());
    m_store->setPaneViewport(this);
    m_store->setActionStore(&m_actions);

    connect(m_timeScale.get(), &TimeScaleStore::visibleRangeChanged, this, [this]() {
        m_store->handleVisibleRangeChange();
    });
    connect(m_timeScale.get(), &TimeScaleStore::zoomed, this, [this](double scale) {
        m_actions.execute(ActionType::OnZoom, ZoomAction{scale});
    });
    connect(m_timeScale.get(), &TimeScaleStore::scrolled, this, [this](double distance) {
        m_actions.execute(ActionType::OnScroll, ScrollAction{distance});
    });

    kLog_App("Chart created, locale" << QString::fromStdString(m_store->locale())
             << "timezone" << m_timeScale->timezoneId());
}

Chart::~Chart() {
    // Dependents go first; the core must not call into them afterwards
    m_store->setTimeScale(nullptr);
    m_store->setOverlayStore(nullptr);
    m_store->setIndicatorStore(nullptr);
    m_store->setTooltipStore(nullptr);
    m_store->setPaneViewport(nullptr);
    m_store->setActionStore(nullptr);
    m_timeScale->disconnect(this);
}

AddDataResult Chart::applyNewData(std::vector<KLineData> bars, std::optional<bool> more) {
    const bool hint = more.value_or(false);
    return m_store->addData(std::move(bars), LoadDataType::Init, LoadMoreState{hint, hint});
}

AddDataResult Chart::updateData(const KLineData& bar) {
    return m_store->addData(bar);
}

void Chart::setLoadMoreDataCallback(LoadDataCallback callback) {
    m_store->setLoadMoreDataCallback(std::move(callback));
}

void Chart::resize(double width) {
    m_timeScale->setTotalBarSpace(width);
}

void Chart::adjustPaneViewport() {
    emit paneViewportAdjusted();
}
