#include "TooltipStore.hpp"
#include "ChartStore.hpp"
#include "../KlineLogging.hpp"
#include <algorithm>
#include <utility>

TooltipStore::TooltipStore(const ChartStore& store, const ITimeScale& timeScale, ActionStore* actions)
    : m_store(store)
    , m_timeScale(timeScale)
    , m_actions(actions) {}

void TooltipStore::resolve(Crosshair& crosshair) const {
    crosshair.kLineData.reset();
    if (!crosshair.x) {
        crosshair.dataIndex = -1;
        crosshair.realDataIndex = -1;
        return;
    }

    const auto& dataList = m_store.dataList();
    const int realDataIndex = m_timeScale.coordinateToDataIndex(*crosshair.x);
    crosshair.realDataIndex = realDataIndex;
    crosshair.realX = m_timeScale.dataIndexToCoordinate(realDataIndex);
    if (dataList.empty()) {
        crosshair.dataIndex = -1;
        return;
    }
    // Past either end the tooltip shows the nearest real bar
    const int dataIndex = std::clamp(realDataIndex, 0, static_cast<int>(dataList.size()) - 1);
    crosshair.dataIndex = dataIndex;
    crosshair.kLineData = dataList[static_cast<std::size_t>(dataIndex)];
}

void TooltipStore::setCrosshair(Crosshair crosshair, bool notify, bool force) {
    resolve(crosshair);

    const bool changed = !m_crosshair ||
                         m_crosshair->dataIndex != crosshair.dataIndex ||
                         m_crosshair->paneId != crosshair.paneId ||
                         m_crosshair->kLineData != crosshair.kLineData;
    m_crosshair = std::move(crosshair);

    if (notify && (changed || force) && m_actions) {
        m_actions->execute(ActionType::OnCrosshairChange, *m_crosshair);
    }
}

void TooltipStore::recalculateCrosshair(bool force) {
    if (!m_crosshair) return;
    kLog_Debug("TooltipStore: recalculating crosshair at index" << m_crosshair->realDataIndex);
    setCrosshair(*m_crosshair, true, force);
}

void TooltipStore::clear() {
    m_crosshair.reset();
}
