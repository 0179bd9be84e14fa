#pragma once
#include "KLineData.h"
#include <QDateTime>
#include <QString>
#include <QTimeZone>
#include <map>
#include <optional>
#include <vector>

/**
 * TimeTickClassifier - weights each bar by the calendar boundary it crosses
 *
 * A bar that starts a new year gets Year, one that starts a new day gets Day,
 * and so on down to Second. The x-axis picks labels from the heaviest weights
 * first so that year/month/day boundaries win over intraday ones.
 */
enum class TimeWeight : int {
    Second = 1,
    Minute,
    FiveMinutes,
    FifteenMinutes,
    HalfHour,
    Hour,
    Day,
    Month,
    Year
};

struct TimeTick {
    int dataIndex = 0;
    TimeWeight weight = TimeWeight::Second;
    int64_t timestamp = 0;

    bool operator==(const TimeTick&) const = default;
};

class TimeTickClassifier {
public:
    void setTimezone(const QTimeZone& timezone) { m_timezone = timezone; }
    const QTimeZone& timezone() const { return m_timezone; }

    // Classify bars as indices baseIndex.. following prevTimestamp (none: first bar is Year)
    void classify(const std::vector<KLineData>& bars, int baseIndex, std::optional<int64_t> prevTimestamp);
    void clear() { m_ticks.clear(); }

    const std::map<TimeWeight, std::vector<TimeTick>>& buckets() const { return m_ticks; }

    // Heaviest-first selection keeping ceil(minSpacing / barSpace) bars between ticks, ordered by index
    std::vector<TimeTick> select(double barSpace, double minSpacing) const;

    TimeWeight weightBetween(int64_t prevTimestamp, int64_t timestamp) const;
    static QString labelFormat(TimeWeight weight);

private:
    QTimeZone m_timezone = QTimeZone::utc();
    std::map<TimeWeight, std::vector<TimeTick>> m_ticks;
};
