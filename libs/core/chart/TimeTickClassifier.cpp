#include "TimeTickClassifier.hpp"
#include <algorithm>
#include <iterator>
#include <cmath>
#include <set>

TimeWeight TimeTickClassifier::weightBetween(int64_t prevTimestamp, int64_t timestamp) const {
    const QDateTime prev = QDateTime::fromMSecsSinceEpoch(prevTimestamp, m_timezone);
    const QDateTime cur = QDateTime::fromMSecsSinceEpoch(timestamp, m_timezone);
    const QDate prevDate = prev.date();
    const QDate curDate = cur.date();
    const QTime prevTime = prev.time();
    const QTime curTime = cur.time();

    if (curDate.year() != prevDate.year()) return TimeWeight::Year;
    if (curDate.month() != prevDate.month()) return TimeWeight::Month;
    if (curDate.day() != prevDate.day()) return TimeWeight::Day;
    if (curTime.hour() != prevTime.hour()) return TimeWeight::Hour;
    if (curTime.minute() / 30 != prevTime.minute() / 30) return TimeWeight::HalfHour;
    if (curTime.minute() / 15 != prevTime.minute() / 15) return TimeWeight::FifteenMinutes;
    if (curTime.minute() / 5 != prevTime.minute() / 5) return TimeWeight::FiveMinutes;
    if (curTime.minute() != prevTime.minute()) return TimeWeight::Minute;
    return TimeWeight::Second;
}

void TimeTickClassifier::classify(const std::vector<KLineData>& bars, int baseIndex, std::optional<int64_t> prevTimestamp) {
    for (std::size_t i = 0; i < bars.size(); ++i) {
        const int64_t timestamp = bars[i].timestamp;
        const TimeWeight weight = prevTimestamp ? weightBetween(*prevTimestamp, timestamp) : TimeWeight::Year;
        m_ticks[weight].push_back(TimeTick{baseIndex + static_cast<int>(i), weight, timestamp});
        prevTimestamp = timestamp;
    }
}

std::vector<TimeTick> TimeTickClassifier::select(double barSpace, double minSpacing) const {
    std::vector<TimeTick> selected;
    if (barSpace <= 0) return selected;

    const int minGapBars = std::max(1, static_cast<int>(std::ceil(minSpacing / barSpace)));
    std::set<int> taken;

    for (auto it = m_ticks.rbegin(); it != m_ticks.rend(); ++it) {
        for (const TimeTick& tick : it->second) {
            auto next = taken.lower_bound(tick.dataIndex);
            if (next != taken.end() && *next - tick.dataIndex < minGapBars) continue;
            if (next != taken.begin() && tick.dataIndex - *std::prev(next) < minGapBars) continue;
            taken.insert(tick.dataIndex);
            selected.push_back(tick);
        }
    }

    std::sort(selected.begin(), selected.end(),
              [](const TimeTick& a, const TimeTick& b) { return a.dataIndex < b.dataIndex; });
    return selected;
}

QString TimeTickClassifier::labelFormat(TimeWeight weight) {
    switch (weight) {
        case TimeWeight::Year:   return QStringLiteral("yyyy");
        case TimeWeight::Month:  return QStringLiteral("yyyy-MM");
        case TimeWeight::Day:    return QStringLiteral("MM-dd");
        case TimeWeight::Second: return QStringLiteral("hh:mm:ss");
        default:                 return QStringLiteral("hh:mm");
    }
}
