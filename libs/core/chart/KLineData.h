#ifndef KLINEDATA_H
#define KLINEDATA_H

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

// One OHLCV observation. Identity is the timestamp.
struct KLineData
{
    int64_t timestamp = 0;   // ms since epoch
    double open = 0.0;
    double high = 0.0;
    double low = 0.0;
    double close = 0.0;
    double volume = 0.0;
    std::optional<double> turnover;
    std::map<std::string, double> extra; // Optional feed-specific fields

    bool operator==(const KLineData&) const = default;
};

// Pagination / ingestion mode. Update is the mode reported downstream for a
// single-bar (live) update.
enum class LoadDataType {
    Init,
    Forward,   // Bars prepended at index 0
    Backward,  // Bars appended after the last index
    Update
};

// Whether the external source is known to hold more data in each direction
struct LoadMoreState {
    bool forward = false;
    bool backward = false;

    bool operator==(const LoadMoreState&) const = default;
};

// Half-open index interval mapped onto the viewport.
// from/to are clamped to the data; realFrom/realTo may run past either end.
struct VisibleRange {
    int from = 0;
    int to = 0;
    int realFrom = 0;
    int realTo = 0;

    bool operator==(const VisibleRange&) const = default;
};

// One bar projected into the current coordinate space. data is empty for
// slots outside the sequence so x alignment is kept.
struct VisibleRangeData {
    int dataIndex = 0;
    double x = 0.0;
    std::optional<KLineData> data;

    bool operator==(const VisibleRangeData&) const = default;
};

struct PriceMark {
    double x = 0.0;
    double price = 0.0;

    bool operator==(const PriceMark&) const = default;
};

// Number.MIN_SAFE_INTEGER / MAX_SAFE_INTEGER: "no visible data" markers.
inline constexpr double kNoHighPrice = -9007199254740991.0;
inline constexpr double kNoLowPrice  =  9007199254740991.0;

struct HighLowPrice {
    PriceMark high{0.0, kNoHighPrice};
    PriceMark low{0.0, kNoLowPrice};

    // Consumers must check these before treating the prices as real
    bool hasHigh() const { return high.price != kNoHighPrice; }
    bool hasLow() const { return low.price != kNoLowPrice; }

    bool operator==(const HighLowPrice&) const = default;
};

struct Precision {
    int price = 2;
    int volume = 0;

    bool operator==(const Precision&) const = default;
};

const char* loadDataTypeName(LoadDataType type);

#endif // KLINEDATA_H
