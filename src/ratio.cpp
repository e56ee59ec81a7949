#include "ratio.h"
#include "money_util.h"
#include <utility>

namespace Monex {

Ratio::Ratio(BigInt numerator, BigInt denominator)
    : num(std::move(numerator)), den(std::move(denominator)) {}

Result<Ratio> Ratio::make(const BigInt& numerator, const BigInt& denominator) {
    if (denominator.isZero()) {
        return Error::divisionByZero();
    }
    if (denominator.isNegative()) {
        return Ratio(-numerator, -denominator);
    }
    return Ratio(numerator, denominator);
}

Ratio Ratio::fromInteger(long long value) {
    return Ratio(BigInt(value), BigInt(1));
}

Ratio Ratio::fromInteger(const BigInt& value) {
    return Ratio(value, BigInt(1));
}

Result<Ratio> Ratio::fromLiteral(const std::string& literal) {
    Result<DecimalLiteral> split = splitDecimalLiteral(literal);
    if (!split) {
        return split.error();
    }
    const DecimalLiteral& parts = split.value();

    BigInt numerator = BigInt::fromString(parts.integerDigits + parts.fractionDigits);
    if (parts.negative) {
        numerator = -numerator;
    }
    return Ratio(std::move(numerator), BigInt::pow10(static_cast<unsigned int>(parts.fractionDigits.size())));
}

std::string Ratio::toString() const {
    return num.toString() + "/" + den.toString();
}

std::ostream& operator<<(std::ostream& os, const Ratio& ratio) {
    return os << ratio.toString();
}

} // namespace Monex
