// money_util.h
#ifndef MONEX_MONEY_UTIL_H
#define MONEX_MONEY_UTIL_H

#include <string>
#include "bigint.h"
#include "errors.h"

namespace Monex {

// Largest scale a currency or token may declare (10^18 minor units per major unit)
const int MAX_DECIMALS = 18;

/**
 * @brief A decimal literal split into its parts, before any scaling
 *
 * "-12.340" -> { negative = true, integerDigits = "12", fractionDigits = "340" }
 */
struct DecimalLiteral {
    bool negative = false;
    std::string integerDigits;
    std::string fractionDigits;
};

/**
 * @brief Validate and split a decimal literal
 *
 * Accepts an optional leading '-', digits and at most one '.', with at least
 * one digit overall. Rejects exponents, grouping separators, '+' and any
 * other character with a Format error.
 */
Result<DecimalLiteral> splitDecimalLiteral(const std::string& literal);

/**
 * @brief Convert a major-unit literal ("10.5") to minor units at the given scale
 * @param decimals Currency scale, 0..MAX_DECIMALS
 * @return Format for malformed text, PrecisionExceeded when the literal has
 *         more fractional digits than decimals, InvalidArgument for a bad scale
 */
Result<BigInt> parseScaledAmount(const std::string& literal, int decimals);

/**
 * @brief Canonical decimal rendering of a minor-unit amount ("-12.30" for -1230 at 2 decimals)
 *
 * Inverse of parseScaledAmount: the fractional part is always zero-padded to decimals digits.
 */
std::string formatScaledAmount(const BigInt& minor, int decimals);

} // namespace Monex

#endif // MONEX_MONEY_UTIL_H
