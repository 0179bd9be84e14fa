#pragma once
#include <QString>
#include <QTimeZone>
#include <cstdint>
#include <functional>
#include <string>

enum class FormatDateType {
    Tooltip,
    Crosshair,
    XAxis
};

// User-replaceable formatters. An empty member in an override keeps the
// current formatter.
struct CustomApi {
    // format uses QDateTime::toString syntax
    std::function<QString(const QTimeZone& timezone, int64_t timestamp, const QString& format, FormatDateType type)> formatDate;
    std::function<std::string(double value)> formatBigNumber;

    static CustomApi defaults();
    void merge(const CustomApi& other);
};
