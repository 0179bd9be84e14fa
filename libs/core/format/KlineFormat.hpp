#pragma once

// Display-string helpers for prices and volumes.
//
// - formatPrecision: fixed decimal digits
// - formatThousands: thousands grouping of the integer part
// - formatFoldDecimal: folds long zero runs after the decimal point ("0.0{5}123")
// - formatBigNumber: K / M / B suffixes

#include <string>
#include <string_view>

namespace KlineFormat {

/**
 * Fixed-point rendering of value.
 * @param digits Number of decimals; negative counts are treated as 0
 * @return "--" for NaN or infinite values
 */
std::string formatPrecision(double value, int digits = 2);

/**
 * Insert sign between every three digits of the integer part.
 * An empty sign returns text unchanged.
 */
std::string formatThousands(std::string_view text, std::string_view sign);

/**
 * Replace a run of at least threshold zeros right after the decimal point,
 * followed only by significant digits, with "0{count}".
 */
std::string formatFoldDecimal(std::string_view text, int threshold);

/**
 * 1234567 -> "1.235M". Values up to 1000 are printed as-is.
 */
std::string formatBigNumber(double value);

}
