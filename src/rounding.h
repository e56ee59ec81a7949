#ifndef MONEX_ROUNDING_H
#define MONEX_ROUNDING_H

#include <string>
#include "bigint.h"
#include "errors.h"

namespace Monex {

/**
 * @brief How an inexact quotient is turned into an integer
 */
enum class RoundingMode {
    HalfUp,    // nearest, ties away from zero: 2.5 -> 3, -2.5 -> -3
    HalfDown,  // nearest, ties toward zero: 2.5 -> 2, -2.5 -> -2
    HalfEven,  // nearest, ties to the even neighbour (banker's rounding): 2.5 -> 2, 3.5 -> 4
    Floor,     // toward negative infinity: -2.1 -> -3
    Ceil,      // toward positive infinity: -2.9 -> -2
    Truncate   // toward zero: -2.9 -> -2
};

/**
 * @brief Canonical name of a mode ("HALF_UP", "FLOOR", ...)
 */
std::string roundingModeName(RoundingMode mode);

/**
 * @brief Parse a mode name, case-insensitively
 * @return The mode, or UnsupportedPolicy naming the rejected text
 */
Result<RoundingMode> parseRoundingMode(const std::string& name);

/**
 * @brief numerator / denominator rounded to an integer according to mode
 *
 * An exact quotient is returned unchanged whatever the mode.
 * @return DivisionByZero if denominator is zero, UnsupportedPolicy for a
 *         mode value outside the enumeration
 */
Result<BigInt> roundedDivide(const BigInt& numerator, const BigInt& denominator, RoundingMode mode);

} // namespace Monex

#endif // MONEX_ROUNDING_H
