#include "KlineFormat.hpp"
#include <fmt/format.h>
#include <cctype>
#include <cmath>

namespace {

bool isDigit(char c) {
    return std::isdigit(static_cast<unsigned char>(c)) != 0;
}

// "1.500" -> "1.5", "2.000" -> "2"
std::string trimTrailingZeros(std::string text) {
    if (text.find('.') == std::string::npos) return text;
    while (!text.empty() && text.back() == '0') text.pop_back();
    if (!text.empty() && text.back() == '.') text.pop_back();
    return text;
}

std::string groupDigits(std::string_view integerPart, std::string_view sign) {
    // Only the trailing run of digits is grouped ("-1234" keeps its sign)
    std::size_t digitsStart = integerPart.size();
    while (digitsStart > 0 && isDigit(integerPart[digitsStart - 1])) {
        --digitsStart;
    }
    const std::string_view prefix = integerPart.substr(0, digitsStart);
    const std::string_view digits = integerPart.substr(digitsStart);

    std::string out(prefix);
    for (std::size_t i = 0; i < digits.size(); ++i) {
        out.push_back(digits[i]);
        const std::size_t remaining = digits.size() - i - 1;
        if (remaining > 0 && remaining % 3 == 0) {
            out.append(sign);
        }
    }
    return out;
}

} // namespace

namespace KlineFormat {

std::string formatPrecision(double value, int digits) {
    if (!std::isfinite(value)) return "--";
    return fmt::format("{:.{}f}", value, digits < 0 ? 0 : digits);
}

std::string formatThousands(std::string_view text, std::string_view sign) {
    if (sign.empty()) return std::string(text);
    const auto dot = text.find('.');
    if (dot == std::string_view::npos) {
        return groupDigits(text, sign);
    }
    std::string out = groupDigits(text.substr(0, dot), sign);
    out.append(text.substr(dot));
    return out;
}

std::string formatFoldDecimal(std::string_view text, int threshold) {
    const auto dot = text.rfind('.');
    if (dot == std::string_view::npos || threshold < 0) return std::string(text);

    const std::string_view decimals = text.substr(dot + 1);
    std::size_t zeros = 0;
    while (zeros < decimals.size() && decimals[zeros] == '0') ++zeros;

    const std::string_view rest = decimals.substr(zeros);
    if (zeros == 0 || zeros < static_cast<std::size_t>(threshold) || rest.empty()) {
        return std::string(text);
    }
    for (char c : rest) {
        if (!isDigit(c)) return std::string(text);
    }

    std::string out(text.substr(0, dot + 1));
    out.append(fmt::format("0{{{}}}", zeros));
    out.append(rest);
    return out;
}

std::string formatBigNumber(double value) {
    if (std::isfinite(value)) {
        if (value > 1000000000.0) return trimTrailingZeros(fmt::format("{:.3f}", value / 1000000000.0)) + "B";
        if (value > 1000000.0) return trimTrailingZeros(fmt::format("{:.3f}", value / 1000000.0)) + "M";
        if (value > 1000.0) return trimTrailingZeros(fmt::format("{:.3f}", value / 1000.0)) + "K";
    }
    return fmt::format("{}", value);
}

}
