/*
KlineCore — Chart collaborator interfaces
Role: Narrow contracts the ChartStore calls into after a data mutation.
Inputs/Outputs: ChartStore pushes notifications; implementations recompute their derived state.
Threading: Main thread only; every call is synchronous.
Integration: Implemented by TimeScaleStore, OverlayStore, IndicatorStore, TooltipStore and Chart.
Related: ChartStore.hpp, TimeScaleStore.hpp, tests/fixtures/spy_collaborators.hpp.
*/
#pragma once
#include "KLineData.h"
#include <functional>
#include <optional>
#include <string>
#include <vector>

class ITimeScale {
public:
    virtual ~ITimeScale() = default;

    virtual VisibleRange visibleRange() const = 0;
    virtual double dataIndexToCoordinate(int dataIndex) const = 0;
    virtual int coordinateToDataIndex(double x) const = 0;
    virtual std::optional<int> timestampToDataIndex(int64_t timestamp) const = 0;

    // isAppendTail: bars are about to be appended after the current last bar
    virtual void classifyTimeTicks(const std::vector<KLineData>& bars, bool isAppendTail = false) = 0;
    virtual void resetOffsetRightDistance() = 0;
    virtual void adjustVisibleRange() = 0;
    // false: unknown zone id, the current zone stays
    virtual bool setTimezone(const std::string& timezone) = 0;
    virtual void clear() = 0;

    virtual double lastBarRightSideDiffBarCount() const = 0;
    virtual void setLastBarRightSideDiffBarCount(double count) = 0;
};

class IOverlayStore {
public:
    virtual ~IOverlayStore() = default;
    // Shift stored anchor indices after the sequence grew by indexDelta bars
    virtual void updatePointPosition(int indexDelta, LoadDataType type) = 0;
};

// Restricts a recalculation to one pane and/or one indicator
struct IndicatorCalcFilter {
    std::optional<std::string> paneId;
    std::optional<std::string> name;
};

class IIndicatorStore {
public:
    virtual ~IIndicatorStore() = default;
    virtual void calcInstance(LoadDataType type, const IndicatorCalcFilter& filter = {}) = 0;
    virtual void synchronizeSeriesPrecision() = 0;
};

class ITooltipStore {
public:
    virtual ~ITooltipStore() = default;
    virtual void recalculateCrosshair(bool force) = 0;
    virtual void clear() = 0;
};

class IPaneViewport {
public:
    virtual ~IPaneViewport() = default;
    virtual void adjustPaneViewport() = 0;
};

// =============================================================================
// Load-more collaborator
// =============================================================================

// Invoked by the data source with the fetched bars. more: whether the source
// holds further data in the same direction.
using LoadDataResponse = std::function<void(std::vector<KLineData> bars, std::optional<bool> more)>;

struct LoadDataParams {
    LoadDataType type = LoadDataType::Forward;
    std::optional<KLineData> data;  // Boundary bar: first for Forward, last for Backward
    LoadDataResponse callback;
};

using LoadDataCallback = std::function<void(const LoadDataParams& params)>;
