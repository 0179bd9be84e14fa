#include "OverlayStore.hpp"
#include "ChartStore.hpp"
#include "../KlineLogging.hpp"
#include <algorithm>
#include <utility>

OverlayStore::OverlayStore(const ChartStore& store, const ITimeScale& timeScale)
    : m_store(store)
    , m_timeScale(timeScale) {}

bool OverlayStore::add(Overlay overlay) {
    if (overlay.id.empty() || this->overlay(overlay.id)) {
        kLog_Warning("OverlayStore: overlay id" << QString::fromStdString(overlay.id) << "rejected");
        return false;
    }
    kLog_App("OverlayStore: added" << QString::fromStdString(overlay.name)
             << "with" << overlay.points.size() << "points");
    m_overlays.push_back(std::move(overlay));
    return true;
}

bool OverlayStore::remove(const std::string& id) {
    auto it = std::find_if(m_overlays.begin(), m_overlays.end(),
                           [&id](const Overlay& o) { return o.id == id; });
    if (it == m_overlays.end()) return false;
    m_overlays.erase(it);
    return true;
}

const Overlay* OverlayStore::overlay(const std::string& id) const {
    for (const auto& o : m_overlays) {
        if (o.id == id) return &o;
    }
    return nullptr;
}

void OverlayStore::updatePointPosition(int indexDelta, LoadDataType type) {
    if (indexDelta <= 0) return;

    const auto& dataList = m_store.dataList();
    const int count = static_cast<int>(dataList.size());
    for (auto& o : m_overlays) {
        for (auto& point : o.points) {
            if (!point.timestamp) {
                if (!point.dataIndex) continue;
                // Prepend moved every existing bar right by indexDelta
                if (type == LoadDataType::Forward) {
                    *point.dataIndex += indexDelta;
                }
                const int index = *point.dataIndex;
                if (index >= 0 && index < count) {
                    point.timestamp = dataList[static_cast<std::size_t>(index)].timestamp;
                }
            } else if (auto index = m_timeScale.timestampToDataIndex(*point.timestamp)) {
                point.dataIndex = *index;
            }
        }
    }
    kLog_Data("OverlayStore: repositioned" << m_overlays.size() << "overlays after"
              << loadDataTypeName(type) << "+" << indexDelta);
}
