/*
KlineCore — ChartStore
Role: Implements ingestion, visible-window/high-low recomputation and the load-more state machine.
Inputs/Outputs: See ChartStore.hpp.
Threading: Main thread only.
Related: ChartStore.hpp.
*/
#include "ChartStore.hpp"
#include "ActionStore.hpp"
#include "../config/StyleTree.hpp"
#include "../KlineLogging.hpp"
#include <utility>

const char* loadDataTypeName(LoadDataType type) {
    switch (type) {
        case LoadDataType::Init:     return "init";
        case LoadDataType::Forward:  return "forward";
        case LoadDataType::Backward: return "backward";
        case LoadDataType::Update:   return "update";
    }
    return "unknown";
}

const char* addDataResultName(AddDataResult result) {
    switch (result) {
        case AddDataResult::Accepted:     return "accepted";
        case AddDataResult::Appended:     return "appended";
        case AddDataResult::ReplacedLast: return "replaced-last";
        case AddDataResult::StaleDropped: return "stale-dropped";
        case AddDataResult::Rejected:     return "rejected";
    }
    return "unknown";
}

const char* loadMoreRequestName(LoadMoreRequest request) {
    switch (request) {
        case LoadMoreRequest::Requested:      return "requested";
        case LoadMoreRequest::AlreadyLoading: return "already-loading";
        case LoadMoreRequest::NoMoreData:     return "no-more-data";
        case LoadMoreRequest::NoCallback:     return "no-callback";
    }
    return "unknown";
}

ChartStore::ChartStore(const ChartOptions& options)
    : m_styles(StyleTree::defaultStyles())
    , m_customApi(CustomApi::defaults()) {
    m_themes.initializeDefaults();
    applyOptions(options);
}

// =============================================================================
// Configuration
// =============================================================================

void ChartStore::setTimeScale(ITimeScale* timeScale) {
    m_timeScale = timeScale;
    if (m_timeScale && !m_timezone.empty() && !m_timeScale->setTimezone(m_timezone)) {
        kLog_Warning("ChartStore: time scale refused timezone" << QString::fromStdString(m_timezone) << ", cleared");
        m_timezone.clear();
    }
}

void ChartStore::applyOptions(const ChartOptions& options) {
    if (options.locale) {
        m_locale = *options.locale;
    }
    if (options.timezone) {
        // Keep the previous zone when the time scale refuses the new one
        if (!m_timeScale || m_timeScale->setTimezone(*options.timezone)) {
            m_timezone = *options.timezone;
        }
    }
    if (options.styles) {
        if (const auto* themeId = std::get_if<std::string>(&*options.styles)) {
            if (auto themeStyles = m_themes.styles(*themeId)) {
                StyleTree::merge(m_styles, *themeStyles);
            } else {
                kLog_Warning("ChartStore: unknown styles" << QString::fromStdString(*themeId) << "ignored");
            }
        } else {
            StyleTree::merge(m_styles, std::get<nlohmann::json>(*options.styles));
        }
    }
    if (options.customApi) {
        m_customApi.merge(*options.customApi);
    }
    if (options.thousandsSeparator) {
        m_thousandsSeparator = *options.thousandsSeparator;
    }
    if (options.decimalFoldThreshold) {
        if (*options.decimalFoldThreshold > 0) {
            m_decimalFoldThreshold = *options.decimalFoldThreshold;
        } else {
            kLog_Warning("ChartStore: decimalFoldThreshold" << *options.decimalFoldThreshold << "ignored");
        }
    }
    if (options.loadMoreTimeoutMs) {
        if (*options.loadMoreTimeoutMs >= 0) {
            m_loadMoreTimeoutMs = *options.loadMoreTimeoutMs;
        } else {
            kLog_Warning("ChartStore: loadMoreTimeoutMs" << *options.loadMoreTimeoutMs << "ignored");
        }
    }
}

void ChartStore::setPrecision(const Precision& precision) {
    if (precision.price < 0 || precision.volume < 0) {
        kLog_Warning("ChartStore: negative precision" << precision.price << precision.volume << "ignored");
        return;
    }
    m_precision = precision;
    if (m_indicatorStore) {
        m_indicatorStore->synchronizeSeriesPrecision();
    }
}

// =============================================================================
// Visible window
// =============================================================================

void ChartStore::resetVisibleWindow() {
    m_visibleRangeDataList.clear();
    m_visibleRangeHighLowPrice = HighLowPrice{};
}

void ChartStore::recomputeVisibleWindow() {
    resetVisibleWindow();
    if (!m_timeScale) {
        kLog_Warning("ChartStore: no time scale attached, visible window left empty");
        return;
    }

    const VisibleRange range = m_timeScale->visibleRange();
    const int dataCount = static_cast<int>(m_dataList.size());
    if (range.realTo > range.realFrom) {
        m_visibleRangeDataList.reserve(static_cast<std::size_t>(range.realTo - range.realFrom));
    }

    auto& [high, low] = m_visibleRangeHighLowPrice;
    for (int i = range.realFrom; i < range.realTo; ++i) {
        const double x = m_timeScale->dataIndexToCoordinate(i);
        VisibleRangeData entry{i, x, std::nullopt};
        if (i >= 0 && i < dataCount) {
            const KLineData& bar = m_dataList[static_cast<std::size_t>(i)];
            entry.data = bar;
            // Strict comparisons: the earliest bar in scan order wins ties
            if (high.price < bar.high) {
                high.price = bar.high;
                high.x = x;
            }
            if (low.price > bar.low) {
                low.price = bar.low;
                low.x = x;
            }
        }
        m_visibleRangeDataList.push_back(std::move(entry));
    }

    kLog_Render("ChartStore: visible window [" << range.realFrom << "," << range.realTo
                << ") high" << high.price << "low" << low.price);
}

void ChartStore::handleVisibleRangeChange() {
    recomputeVisibleWindow();
    if (m_actionStore && m_timeScale) {
        m_actionStore->execute(ActionType::OnVisibleRangeChange, m_timeScale->visibleRange());
    }
    if (m_tooltipStore) {
        m_tooltipStore->recalculateCrosshair(true);
    }
    if (m_paneViewport) {
        m_paneViewport->adjustPaneViewport();
    }
    requestMoreAtEdges();
}

// =============================================================================
// Ingestion
// =============================================================================

AddDataResult ChartStore::addData(std::vector<KLineData> bars, LoadDataType type, std::optional<LoadMoreState> more) {
    if (type == LoadDataType::Update) {
        kLog_Warning("ChartStore: batch addData with mode update rejected, use addData(bar)");
        return AddDataResult::Rejected;
    }
    warnIfMisordered(bars, type);

    const int dataLengthChange = static_cast<int>(bars.size());
    bool adjustFlag = false;

    switch (type) {
        case LoadDataType::Init: {
            clear();
            m_dataList = std::move(bars);
            // Both directions follow the forward hint on init
            const bool hint = more ? more->forward : false;
            m_loadDataMore.backward = hint;
            m_loadDataMore.forward = hint;
            if (m_timeScale) {
                m_timeScale->classifyTimeTicks(m_dataList);
                m_timeScale->resetOffsetRightDistance();
            }
            adjustFlag = true;
            break;
        }
        case LoadDataType::Backward: {
            if (m_timeScale) {
                m_timeScale->classifyTimeTicks(bars, true);
            }
            m_dataList.insert(m_dataList.end(),
                              std::make_move_iterator(bars.begin()),
                              std::make_move_iterator(bars.end()));
            m_loadDataMore.backward = more ? more->backward : false;
            adjustFlag = dataLengthChange > 0;
            break;
        }
        case LoadDataType::Forward: {
            m_dataList.insert(m_dataList.begin(),
                              std::make_move_iterator(bars.begin()),
                              std::make_move_iterator(bars.end()));
            // Every index shifted: full reclassification
            if (m_timeScale) {
                m_timeScale->classifyTimeTicks(m_dataList);
            }
            m_loadDataMore.forward = more ? more->forward : false;
            adjustFlag = dataLengthChange > 0;
            break;
        }
        case LoadDataType::Update:
            break;
    }

    // A direct page leaves an in-flight request alone; its response still counts
    if (m_pendingRequestId == 0) {
        m_loading = false;
    }
    kLog_Data("ChartStore:" << loadDataTypeName(type) << "installed" << dataLengthChange
              << "bars, total" << m_dataList.size()
              << "more fwd/bwd" << m_loadDataMore.forward << m_loadDataMore.backward);

    notifyAfterMutation(dataLengthChange, type, adjustFlag);
    return AddDataResult::Accepted;
}

void ChartStore::warnIfMisordered(const std::vector<KLineData>& bars, LoadDataType type) const {
    if (bars.empty()) return;

    for (std::size_t i = 1; i < bars.size(); ++i) {
        if (bars[i].timestamp <= bars[i - 1].timestamp) {
            kLog_Warning("ChartStore:" << loadDataTypeName(type) << "payload not ascending at index" << i
                         << "timestamp" << bars[i].timestamp << "after" << bars[i - 1].timestamp);
            break;
        }
    }
    if (m_dataList.empty()) return;

    if (type == LoadDataType::Backward && bars.front().timestamp <= m_dataList.back().timestamp) {
        kLog_Warning("ChartStore: backward payload starts at" << bars.front().timestamp
                     << "not after the last bar" << m_dataList.back().timestamp);
    } else if (type == LoadDataType::Forward && bars.back().timestamp >= m_dataList.front().timestamp) {
        kLog_Warning("ChartStore: forward payload ends at" << bars.back().timestamp
                     << "not before the first bar" << m_dataList.front().timestamp);
    }
}

AddDataResult ChartStore::addData(const KLineData& bar) {
    AddDataResult result = AddDataResult::StaleDropped;
    int dataLengthChange = 0;

    if (m_dataList.empty() || bar.timestamp > m_dataList.back().timestamp) {
        if (m_timeScale) {
            m_timeScale->classifyTimeTicks({bar}, true);
        }
        m_dataList.push_back(bar);
        if (m_timeScale) {
            double diff = m_timeScale->lastBarRightSideDiffBarCount();
            // Scrolled into history: keep the same bars on screen
            if (diff < 0) {
                m_timeScale->setLastBarRightSideDiffBarCount(--diff);
            }
        }
        dataLengthChange = 1;
        result = AddDataResult::Appended;
    } else if (bar.timestamp == m_dataList.back().timestamp) {
        m_dataList.back() = bar;
        result = AddDataResult::ReplacedLast;
    } else {
        kLog_Data("ChartStore: stale bar" << bar.timestamp << "older than last"
                  << m_dataList.back().timestamp << "dropped");
        return result;
    }

    kLog_Data("ChartStore: live bar" << bar.timestamp << addDataResultName(result));
    notifyAfterMutation(dataLengthChange, LoadDataType::Update, true);
    return result;
}

void ChartStore::notifyAfterMutation(int indexDelta, LoadDataType type, bool adjust) {
    if (m_overlayStore) {
        m_overlayStore->updatePointPosition(indexDelta, type);
    }
    if (!adjust) return;

    // Axis range first: indicators and tooltip read it
    if (m_timeScale) {
        m_timeScale->adjustVisibleRange();
    }
    recomputeVisibleWindow();
    if (m_actionStore && m_timeScale) {
        m_actionStore->execute(ActionType::OnVisibleRangeChange, m_timeScale->visibleRange());
    }
    if (m_tooltipStore) {
        m_tooltipStore->recalculateCrosshair(true);
    }
    if (m_indicatorStore) {
        m_indicatorStore->calcInstance(type);
    }
    if (m_paneViewport) {
        m_paneViewport->adjustPaneViewport();
    }
    requestMoreAtEdges();
}

// =============================================================================
// Pagination
// =============================================================================

void ChartStore::requestMoreAtEdges() {
    if (!m_timeScale) return;

    if (m_timeScale->visibleRange().from == 0) {
        requestMoreData(LoadDataType::Forward);
    }
    // Re-read: a synchronous response may have changed the range
    if (m_timeScale->visibleRange().to == static_cast<int>(m_dataList.size())) {
        requestMoreData(LoadDataType::Backward);
    }
}

void ChartStore::releaseTimedOutRequest() {
    if (!m_loading || m_pendingRequestId == 0 || m_loadMoreTimeoutMs <= 0) return;
    if (!m_loadingTimer.isValid() || m_loadingTimer.elapsed() < m_loadMoreTimeoutMs) return;

    kLog_Warning("ChartStore: load-more request" << m_pendingRequestId << "timed out after"
                 << m_loadingTimer.elapsed() << "ms, releasing");
    m_loading = false;
    m_pendingRequestId = 0;
}

LoadMoreRequest ChartStore::requestMoreData(LoadDataType direction) {
    releaseTimedOutRequest();

    if (m_loading) {
        kLog_Data("ChartStore: load-more" << loadDataTypeName(direction) << "skipped, already loading");
        return LoadMoreRequest::AlreadyLoading;
    }

    const bool more = (direction == LoadDataType::Forward && m_loadDataMore.forward) ||
                      (direction == LoadDataType::Backward && m_loadDataMore.backward);
    if (!more) {
        return LoadMoreRequest::NoMoreData;
    }
    if (!m_loadMoreDataCallback) {
        return LoadMoreRequest::NoCallback;
    }

    const uint64_t requestId = m_nextRequestId++;
    m_loading = true;
    m_pendingRequestId = requestId;
    m_loadingTimer.start();

    LoadDataParams params;
    params.type = direction;
    if (!m_dataList.empty()) {
        params.data = direction == LoadDataType::Forward ? m_dataList.front() : m_dataList.back();
    }
    std::weak_ptr<int> alive = m_aliveToken;
    params.callback = [this, alive, requestId, direction](std::vector<KLineData> bars, std::optional<bool> hasMore) {
        if (alive.expired()) return;
        onLoadMoreResponse(requestId, direction, std::move(bars), hasMore);
    };

    kLog_Data("ChartStore: load-more" << loadDataTypeName(direction) << "request" << requestId);
    m_loadMoreDataCallback(params);
    return LoadMoreRequest::Requested;
}

void ChartStore::onLoadMoreResponse(uint64_t requestId, LoadDataType type,
                                    std::vector<KLineData> bars, std::optional<bool> more) {
    if (requestId != m_pendingRequestId) {
        kLog_Warning("ChartStore: load-more response" << requestId << "is stale or duplicated, dropped"
                     << bars.size() << "bars");
        return;
    }
    m_loading = false;
    m_pendingRequestId = 0;
    const bool hint = more.value_or(false);
    addData(std::move(bars), type, LoadMoreState{hint, hint});
}

void ChartStore::clear() {
    m_loadDataMore = LoadMoreState{};
    m_loading = true;
    m_pendingRequestId = 0;
    m_dataList.clear();
    resetVisibleWindow();
    if (m_timeScale) {
        m_timeScale->clear();
    }
    if (m_tooltipStore) {
        m_tooltipStore->clear();
    }
}
