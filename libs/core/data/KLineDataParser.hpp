#pragma once
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <optional>
#include <string>
#include <vector>
#include <QDateTime>
#include <QString>
#include <nlohmann/json.hpp>
#include "../chart/KLineData.h"

struct ParseResult {
    std::vector<KLineData> bars;
    int skipped = 0;
};

/**
 * Converts a JSON array of bar objects into KLineData.
 * Accepts numbers or numeric strings, "timestamp" or "time" (ms since epoch or ISO8601).
 * Rows missing a required field are skipped and counted.
 */
class KLineDataParser {
public:
    static ParseResult parse(const nlohmann::json& j) {
        ParseResult out;
        if (!j.is_array()) return out;

        for (const auto& row : j) {
            if (auto bar = parseRow(row)) {
                out.bars.push_back(std::move(*bar));
            } else {
                ++out.skipped;
            }
        }
        return out;
    }

    static std::optional<KLineData> parseRow(const nlohmann::json& row) {
        if (!row.is_object()) return std::nullopt;

        auto tsField = row.find("timestamp");
        if (tsField == row.end()) tsField = row.find("time");
        const auto timestamp = tsField != row.end() ? parseTimestamp(*tsField) : std::optional<int64_t>{};
        const auto open = number(row, "open");
        const auto high = number(row, "high");
        const auto low = number(row, "low");
        const auto close = number(row, "close");
        if (!timestamp || !open || !high || !low || !close) return std::nullopt;

        KLineData bar;
        bar.timestamp = *timestamp;
        bar.open = *open;
        bar.high = *high;
        bar.low = *low;
        bar.close = *close;
        bar.volume = number(row, "volume").value_or(0.0);
        bar.turnover = number(row, "turnover");

        for (const auto& [key, value] : row.items()) {
            if (isKnownField(key)) continue;
            if (auto extra = toNumber(value)) {
                bar.extra[key] = *extra;
            }
        }
        return bar;
    }

private:
    static bool isKnownField(const std::string& key) {
        return key == "timestamp" || key == "time" || key == "open" || key == "high" ||
               key == "low" || key == "close" || key == "volume" || key == "turnover";
    }

    // Largest millisecond count a double holds exactly
    static constexpr double kMaxTimestampMs = 9007199254740991.0;

    static std::optional<double> toNumber(const nlohmann::json& value) {
        if (value.is_number()) {
            const double parsed = value.get<double>();
            if (!std::isfinite(parsed)) return std::nullopt;
            return parsed;
        }
        if (!value.is_string()) return std::nullopt;

        const std::string& text = value.get_ref<const std::string&>();
        if (text.empty()) return std::nullopt;
        char* end = nullptr;
        const double parsed = std::strtod(text.c_str(), &end);
        if (end != text.c_str() + text.size()) return std::nullopt;  // Trailing garbage
        if (!std::isfinite(parsed)) return std::nullopt;             // nan, inf, overflow
        return parsed;
    }

    static std::optional<double> number(const nlohmann::json& row, const char* key) {
        auto it = row.find(key);
        if (it == row.end()) return std::nullopt;
        return toNumber(*it);
    }

    static std::optional<int64_t> parseTimestamp(const nlohmann::json& value) {
        if (auto ms = toNumber(value)) {
            if (std::fabs(*ms) > kMaxTimestampMs) return std::nullopt;
            return static_cast<int64_t>(*ms);
        }
        if (value.is_string()) {
            const QDateTime dt = QDateTime::fromString(QString::fromStdString(value.get<std::string>()),
                                                       Qt::ISODateWithMs);
            if (dt.isValid()) return dt.toMSecsSinceEpoch();
        }
        return std::nullopt;
    }
};
