#ifndef MONEX_ARITHMETIC_H
#define MONEX_ARITHMETIC_H

#include <optional>
#include <string>
#include "bigint.h"
#include "errors.h"
#include "ratio.h"
#include "rounding.h"

namespace Monex {

BigInt add(const BigInt& a, const BigInt& b);
BigInt subtract(const BigInt& a, const BigInt& b);

/**
 * @brief amount * multiplier, in minor units
 *
 * An exact product never needs a rounding mode. An inexact one fails with
 * RoundingRequired unless a mode is supplied, in which case it is rounded
 * by roundedDivide.
 */
Result<BigInt> multiply(const BigInt& amount, const Ratio& multiplier,
                        std::optional<RoundingMode> rounding = std::nullopt);

/**
 * @brief multiply() with the multiplier given as a decimal literal ("1.5")
 */
Result<BigInt> multiply(const BigInt& amount, const std::string& multiplier,
                        std::optional<RoundingMode> rounding = std::nullopt);

/**
 * @brief amount / divisor, in minor units
 *
 * A zero divisor fails with DivisionByZero before any rounding decision.
 */
Result<BigInt> divide(const BigInt& amount, const Ratio& divisor,
                      std::optional<RoundingMode> rounding = std::nullopt);

Result<BigInt> divide(const BigInt& amount, const std::string& divisor,
                      std::optional<RoundingMode> rounding = std::nullopt);

/**
 * @brief percent% of amount ("12.5" -> amount * 12.5 / 100)
 */
Result<BigInt> percentage(const BigInt& amount, const std::string& percent,
                          RoundingMode rounding = RoundingMode::HalfEven);

} // namespace Monex

#endif // MONEX_ARITHMETIC_H
