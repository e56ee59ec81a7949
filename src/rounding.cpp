#include "rounding.h"
#include "logger.h"
#include <algorithm>
#include <cctype>

namespace Monex {

std::string roundingModeName(RoundingMode mode) {
    switch (mode) {
        case RoundingMode::HalfUp: return "HALF_UP";
        case RoundingMode::HalfDown: return "HALF_DOWN";
        case RoundingMode::HalfEven: return "HALF_EVEN";
        case RoundingMode::Floor: return "FLOOR";
        case RoundingMode::Ceil: return "CEIL";
        case RoundingMode::Truncate: return "TRUNCATE";
    }
    return std::to_string(static_cast<int>(mode));
}

Result<RoundingMode> parseRoundingMode(const std::string& name) {
    std::string upper = name;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    if (upper == "HALF_UP") return RoundingMode::HalfUp;
    if (upper == "HALF_DOWN") return RoundingMode::HalfDown;
    if (upper == "HALF_EVEN") return RoundingMode::HalfEven;
    if (upper == "FLOOR") return RoundingMode::Floor;
    if (upper == "CEIL") return RoundingMode::Ceil;
    if (upper == "TRUNCATE") return RoundingMode::Truncate;

    return Error::unsupportedPolicy(name);
}

Result<BigInt> roundedDivide(const BigInt& numerator, const BigInt& denominator, RoundingMode mode) {
    if (denominator.isZero()) {
        LOG_DEBUG(Logger::core(), "roundedDivide: {} / 0 rejected", numerator.toString());
        return Error::divisionByZero();
    }

    BigInt quotient;
    BigInt remainder;
    BigInt::divMod(numerator, denominator, quotient, remainder);

    if (remainder.isZero()) {
        return quotient;
    }

    // quotient is truncated toward zero; decide how far it sits from the exact value
    const bool positiveResult = numerator.isNegative() == denominator.isNegative();
    const BigInt twiceRemainder = remainder.abs() * BigInt(2);
    const int half = twiceRemainder.compare(denominator.abs()); // <0 below, 0 at, >0 above half

    const BigInt awayFromZero = positiveResult ? quotient + BigInt(1) : quotient - BigInt(1);

    switch (mode) {
        case RoundingMode::Floor:
            return positiveResult ? quotient : quotient - BigInt(1);
        case RoundingMode::Ceil:
            return positiveResult ? quotient + BigInt(1) : quotient;
        case RoundingMode::Truncate:
            return quotient;
        case RoundingMode::HalfUp:
            return half >= 0 ? awayFromZero : quotient;
        case RoundingMode::HalfDown:
            return half > 0 ? awayFromZero : quotient;
        case RoundingMode::HalfEven:
            if (half > 0) {
                return awayFromZero;
            }
            if (half == 0 && quotient.isOdd()) {
                return awayFromZero;
            }
            return quotient;
    }

    LOG_DEBUG(Logger::core(), "roundedDivide: unsupported rounding mode {}", static_cast<int>(mode));
    return Error::unsupportedPolicy(std::to_string(static_cast<int>(mode)));
}

} // namespace Monex
