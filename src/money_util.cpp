// money_util.cpp
#include "money_util.h"
#include "logger.h"
#include <sstream>
#include <iomanip>
#include <stdexcept>

namespace Monex {

Result<DecimalLiteral> splitDecimalLiteral(const std::string& literal) {
    if (literal.find_first_of("eE") != std::string::npos) {
        return Error::format("Scientific notation not supported: '" + literal + "'");
    }

    // Reject ambiguous separators (commas, spaces, '+', ...)
    if (literal.find_first_not_of("0123456789.-") != std::string::npos) {
        return Error::format("Invalid characters in amount: '" + literal + "'");
    }

    // Reject inputs with no digits ("", "-", ".")
    if (literal.find_first_of("0123456789") == std::string::npos) {
        return Error::format("Invalid format: no digits in '" + literal + "'");
    }

    size_t start = 0;
    DecimalLiteral parts;
    if (literal[0] == '-') {
        parts.negative = true;
        start = 1;
    }
    if (literal.find('-', start) != std::string::npos) {
        return Error::format("Invalid format: misplaced sign in '" + literal + "'");
    }

    size_t point = literal.find('.', start);
    if (point == std::string::npos) {
        parts.integerDigits = literal.substr(start);
        return parts;
    }
    if (literal.find('.', point + 1) != std::string::npos) {
        return Error::format("Invalid format: multiple decimal points in '" + literal + "'");
    }

    parts.integerDigits = literal.substr(start, point - start);
    parts.fractionDigits = literal.substr(point + 1);
    return parts;
}

Result<BigInt> parseScaledAmount(const std::string& literal, int decimals) {
    if (decimals < 0 || decimals > MAX_DECIMALS) {
        return Error::invalidArgument("Currency decimals must be between 0 and 18, got " + std::to_string(decimals));
    }

    Result<DecimalLiteral> split = splitDecimalLiteral(literal);
    if (!split) {
        LOG_DEBUG(Logger::core(), "parseScaledAmount: rejected '{}': {}", literal, split.error().message);
        return split.error();
    }
    const DecimalLiteral& parts = split.value();

    const int fractionLength = static_cast<int>(parts.fractionDigits.size());
    if (fractionLength > decimals) {
        LOG_DEBUG(Logger::core(), "parseScaledAmount: '{}' has {} fractional digits, limit {}",
                  literal, fractionLength, decimals);
        return Error::precisionExceeded(fractionLength, decimals);
    }

    // Pad the fraction to the currency scale, then read all digits as one integer
    std::string digits = parts.integerDigits + parts.fractionDigits +
                         std::string(static_cast<size_t>(decimals - fractionLength), '0');
    BigInt minor = BigInt::fromString(digits);
    return parts.negative ? -minor : minor;
}

std::string formatScaledAmount(const BigInt& minor, int decimals) {
    if (decimals < 0 || decimals > MAX_DECIMALS) {
        throw std::invalid_argument("Currency decimals must be between 0 and 18, got " + std::to_string(decimals));
    }

    BigInt magnitude = minor.abs();
    std::stringstream ss;
    if (minor.isNegative()) {
        ss << "-";
    }

    if (decimals == 0) {
        ss << magnitude;
        return ss.str();
    }

    BigInt integerPart;
    BigInt fractionalPart;
    BigInt::divMod(magnitude, BigInt::pow10(static_cast<unsigned int>(decimals)), integerPart, fractionalPart);

    // Fractional part keeps its leading zeros: 5 at 2 decimals is ".05"
    ss << integerPart << "." << std::setfill('0') << std::setw(decimals) << fractionalPart.toString();
    return ss.str();
}

} // namespace Monex
