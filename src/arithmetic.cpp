#include "arithmetic.h"
#include "logger.h"

namespace Monex {

namespace {

// product / divisor (divisor > 0): exact, rounded, or RoundingRequired naming the operation
Result<BigInt> finishQuotient(const char* operation, const BigInt& product, const BigInt& divisor,
                              std::optional<RoundingMode> rounding) {
    BigInt quotient;
    BigInt remainder;
    BigInt::divMod(product, divisor, quotient, remainder);
    if (remainder.isZero()) {
        return quotient;
    }

    if (!rounding) {
        LOG_DEBUG(Logger::core(), "{}: inexact result {}/{} without rounding mode",
                  operation, product.toString(), divisor.toString());
        return Error::roundingRequired(operation, product.toString(), divisor.toString());
    }

    LOG_DEBUG(Logger::core(), "{}: rounding {}/{} with {}",
              operation, product.toString(), divisor.toString(), roundingModeName(*rounding));
    return roundedDivide(product, divisor, *rounding);
}

} // namespace

BigInt add(const BigInt& a, const BigInt& b) {
    return a + b;
}

BigInt subtract(const BigInt& a, const BigInt& b) {
    return a - b;
}

Result<BigInt> multiply(const BigInt& amount, const Ratio& multiplier, std::optional<RoundingMode> rounding) {
    // amount * (n / d) = (amount * n) / d
    const BigInt product = amount * multiplier.numerator();
    return finishQuotient("multiply", product, multiplier.denominator(), rounding);
}

Result<BigInt> multiply(const BigInt& amount, const std::string& multiplier, std::optional<RoundingMode> rounding) {
    Result<Ratio> ratio = Ratio::fromLiteral(multiplier);
    if (!ratio) {
        return ratio.error();
    }
    return multiply(amount, ratio.value(), rounding);
}

Result<BigInt> divide(const BigInt& amount, const Ratio& divisor, std::optional<RoundingMode> rounding) {
    if (divisor.isZero()) {
        LOG_DEBUG(Logger::core(), "divide: {} by zero rejected", amount.toString());
        return Error::divisionByZero();
    }

    // amount / (n / d) = (amount * d) / n; keep the divisor positive so the
    // sign of the rational lives in the numerator
    BigInt product = amount * divisor.denominator();
    BigInt denominator = divisor.numerator();
    if (denominator.isNegative()) {
        product = -product;
        denominator = -denominator;
    }
    return finishQuotient("divide", product, denominator, rounding);
}

Result<BigInt> divide(const BigInt& amount, const std::string& divisor, std::optional<RoundingMode> rounding) {
    Result<Ratio> ratio = Ratio::fromLiteral(divisor);
    if (!ratio) {
        return ratio.error();
    }
    return divide(amount, ratio.value(), rounding);
}

Result<BigInt> percentage(const BigInt& amount, const std::string& percent, RoundingMode rounding) {
    Result<Ratio> pct = Ratio::fromLiteral(percent);
    if (!pct) {
        return pct.error();
    }
    Result<Ratio> fraction = Ratio::make(pct.value().numerator(), pct.value().denominator() * BigInt(100));
    if (!fraction) {
        return fraction.error();
    }
    return multiply(amount, fraction.value(), rounding);
}

} // namespace Monex
