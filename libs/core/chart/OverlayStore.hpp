/*
KlineCore — OverlayStore
Role: Keeps user overlays (lines, marks) anchored to bars while the bar sequence grows at either end.
Inputs/Outputs: Overlays are added/removed by id; ChartStore calls updatePointPosition after each mutation.
Threading: Main thread only.
Integration: Owned by Chart; reads bars through a const ChartStore and resolves timestamps through ITimeScale.
Related: OverlayStore.cpp, ChartCollaborators.hpp.
Assumptions: A point anchored by timestamp is authoritative over its cached index.
*/
#pragma once
#include "ChartCollaborators.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

class ChartStore;

struct OverlayPoint {
    std::optional<int> dataIndex;
    std::optional<int64_t> timestamp;
    double value = 0.0;

    bool operator==(const OverlayPoint&) const = default;
};

struct Overlay {
    std::string id;
    std::string name;
    std::vector<OverlayPoint> points;
};

class OverlayStore : public IOverlayStore {
public:
    OverlayStore(const ChartStore& store, const ITimeScale& timeScale);

    // Returns false when the id is empty or already taken
    bool add(Overlay overlay);
    bool remove(const std::string& id);
    void clear() { m_overlays.clear(); }

    const Overlay* overlay(const std::string& id) const;
    const std::vector<Overlay>& overlays() const { return m_overlays; }

    void updatePointPosition(int indexDelta, LoadDataType type) override;

private:
    const ChartStore& m_store;
    const ITimeScale& m_timeScale;
    std::vector<Overlay> m_overlays;
};
