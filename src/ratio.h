#ifndef MONEX_RATIO_H
#define MONEX_RATIO_H

#include <string>
#include <ostream>
#include "bigint.h"
#include "errors.h"

namespace Monex {

/**
 * @brief Exact fraction used as a multiplier, divisor or allocation weight
 *
 * The denominator is always positive. Ratios built from decimal literals are
 * not reduced: "1.50" is 150/100.
 */
class Ratio {
public:
    /**
     * @brief numerator / denominator with the sign moved onto the numerator
     * @return DivisionByZero if denominator is zero
     */
    static Result<Ratio> make(const BigInt& numerator, const BigInt& denominator);

    static Ratio fromInteger(long long value);
    static Ratio fromInteger(const BigInt& value);

    /**
     * @brief Exact ratio for a decimal literal: all digits over 10^(fractional digits)
     *
     * "0.555" -> 555/1000, "-2" -> -2/1
     * @return Format for anything splitDecimalLiteral rejects
     */
    static Result<Ratio> fromLiteral(const std::string& literal);

    const BigInt& numerator() const { return num; }
    const BigInt& denominator() const { return den; }

    bool isZero() const { return num.isZero(); }
    bool isNegative() const { return num.isNegative(); }

    std::string toString() const;

private:
    Ratio(BigInt numerator, BigInt denominator);

    BigInt num;
    BigInt den;
};

std::ostream& operator<<(std::ostream& os, const Ratio& ratio);

} // namespace Monex

#endif // MONEX_RATIO_H
