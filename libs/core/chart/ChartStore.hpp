/*
KlineCore — ChartStore
Role: Single source of truth for a chart's price bars, the visible window projected from them, and the visible high/low.
Inputs/Outputs: Ingests bars (init, pagination, live ticks); exposes read-only views; notifies collaborators after each mutation.
Threading: Main thread only. Load-more responses re-enter addData on a later turn of the event loop.
Performance: Window rebuild is one linear pass over the visible range, bounded by viewport width.
Integration: Owned by Chart; collaborators (time scale, overlays, indicators, tooltip, pane viewport) are injected by setter.
Observability: Ingestion and pagination via kLog_Data; dropped updates and late responses via kLog_Warning.
Related: ChartStore.cpp, ChartCollaborators.hpp, TimeScaleStore.hpp, Chart.hpp.
Assumptions: Bar timestamps strictly increase except for in-place replacement of the last bar.
*/
#pragma once
#include "KLineData.h"
#include "ChartCollaborators.hpp"
#include "../config/ChartOptions.hpp"
#include "../config/CustomApi.hpp"
#include "../config/themes/ThemeRegistry.hpp"
#include <QElapsedTimer>
#include <nlohmann/json.hpp>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

class ActionStore;

enum class AddDataResult {
    Accepted,       // Init / Forward / Backward payload installed
    Appended,       // Live bar newer than the last one
    ReplacedLast,   // Live bar with the same timestamp as the last one
    StaleDropped,   // Live bar older than the last one; nothing changed
    Rejected        // Batch payload with a mode only live bars use; nothing changed
};

enum class LoadMoreRequest {
    Requested,
    AlreadyLoading,
    NoMoreData,
    NoCallback
};

class ChartStore {
public:
    explicit ChartStore(const ChartOptions& options = {});
    ChartStore(const ChartStore&) = delete;
    ChartStore& operator=(const ChartStore&) = delete;

    // Collaborators (not owned)
    void setTimeScale(ITimeScale* timeScale);
    void setOverlayStore(IOverlayStore* overlayStore) { m_overlayStore = overlayStore; }
    void setIndicatorStore(IIndicatorStore* indicatorStore) { m_indicatorStore = indicatorStore; }
    void setTooltipStore(ITooltipStore* tooltipStore) { m_tooltipStore = tooltipStore; }
    void setPaneViewport(IPaneViewport* paneViewport) { m_paneViewport = paneViewport; }
    void setActionStore(ActionStore* actionStore) { m_actionStore = actionStore; }

    // Configuration
    void applyOptions(const ChartOptions& options);
    const nlohmann::json& styles() const { return m_styles; }
    const CustomApi& customApi() const { return m_customApi; }
    const std::string& locale() const { return m_locale; }
    const std::string& timezone() const { return m_timezone; }
    const std::string& thousandsSeparator() const { return m_thousandsSeparator; }
    double decimalFoldThreshold() const { return m_decimalFoldThreshold; }
    int64_t loadMoreTimeoutMs() const { return m_loadMoreTimeoutMs; }
    ThemeRegistry& themes() { return m_themes; }

    const Precision& precision() const { return m_precision; }
    void setPrecision(const Precision& precision);

    // Data
    const std::vector<KLineData>& dataList() const { return m_dataList; }
    const std::vector<VisibleRangeData>& visibleRangeDataList() const { return m_visibleRangeDataList; }
    const HighLowPrice& visibleRangeHighLowPrice() const { return m_visibleRangeHighLowPrice; }
    const LoadMoreState& loadMoreState() const { return m_loadDataMore; }
    bool isLoading() const { return m_loading; }

    /**
     * Install a batch of bars.
     * Init replaces everything, Forward prepends, Backward appends.
     * more: pagination hints from the source. Init reads both directions from more->forward.
     * Update is rejected here. Payloads out of ascending order are installed with a warning.
     * A Forward/Backward call made outside a load-more response keeps any pending request open.
     */
    AddDataResult addData(std::vector<KLineData> bars, LoadDataType type,
                          std::optional<LoadMoreState> more = std::nullopt);

    /**
     * Live update: appends a newer bar, replaces the last bar on an equal
     * timestamp, drops an older one.
     */
    AddDataResult addData(const KLineData& bar);

    // Rebuild the visible window and high/low from the time scale's range. No notifications.
    void recomputeVisibleWindow();

    // Scroll / zoom path: window, OnVisibleRangeChange, crosshair, pane viewport, edge pagination
    void handleVisibleRangeChange();

    void setLoadMoreDataCallback(LoadDataCallback callback) { m_loadMoreDataCallback = std::move(callback); }
    LoadMoreRequest requestMoreData(LoadDataType direction);

    void clear();

private:
    void resetVisibleWindow();
    void notifyAfterMutation(int indexDelta, LoadDataType type, bool adjust);
    void requestMoreAtEdges();
    void releaseTimedOutRequest();
    void warnIfMisordered(const std::vector<KLineData>& bars, LoadDataType type) const;
    void onLoadMoreResponse(uint64_t requestId, LoadDataType type,
                            std::vector<KLineData> bars, std::optional<bool> more);

    // Configuration
    nlohmann::json m_styles;
    CustomApi m_customApi;
    ThemeRegistry m_themes;
    std::string m_locale = "en-US";
    std::string m_timezone;
    std::string m_thousandsSeparator = ",";
    double m_decimalFoldThreshold = 3.0;
    int64_t m_loadMoreTimeoutMs = 0;
    Precision m_precision;

    // Data
    std::vector<KLineData> m_dataList;
    std::vector<VisibleRangeData> m_visibleRangeDataList;
    HighLowPrice m_visibleRangeHighLowPrice;

    // Pagination
    LoadDataCallback m_loadMoreDataCallback;
    LoadMoreState m_loadDataMore;
    bool m_loading = true;
    uint64_t m_nextRequestId = 1;
    uint64_t m_pendingRequestId = 0;   // 0: no request in flight
    QElapsedTimer m_loadingTimer;
    std::shared_ptr<int> m_aliveToken = std::make_shared<int>(0);

    // Collaborators
    ITimeScale* m_timeScale = nullptr;
    IOverlayStore* m_overlayStore = nullptr;
    IIndicatorStore* m_indicatorStore = nullptr;
    ITooltipStore* m_tooltipStore = nullptr;
    IPaneViewport* m_paneViewport = nullptr;
    ActionStore* m_actionStore = nullptr;
};

const char* addDataResultName(AddDataResult result);
const char* loadMoreRequestName(LoadMoreRequest request);
