#include "CustomApi.hpp"
#include "../format/KlineFormat.hpp"
#include <QDateTime>

CustomApi CustomApi::defaults() {
    CustomApi api;
    api.formatDate = [](const QTimeZone& timezone, int64_t timestamp, const QString& format, FormatDateType) {
        return QDateTime::fromMSecsSinceEpoch(timestamp, timezone).toString(format);
    };
    api.formatBigNumber = [](double value) {
        return KlineFormat::formatBigNumber(value);
    };
    return api;
}

void CustomApi::merge(const CustomApi& other) {
    if (other.formatDate) formatDate = other.formatDate;
    if (other.formatBigNumber) formatBigNumber = other.formatBigNumber;
}
