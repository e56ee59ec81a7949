#ifndef MONEX_BIGINT_H
#define MONEX_BIGINT_H

#include <string>
#include <ostream>
#include <cstdint>
#include <openssl/bn.h>

namespace Monex {

/**
 * @brief Arbitrary-precision signed integer backed by an OpenSSL BIGNUM
 *
 * Owns its BIGNUM. Copies are deep; a move hands the value over and leaves
 * the source holding zero.
 * Division truncates toward zero and the remainder takes the sign of
 * the dividend (same as the built-in integer operators).
 */
class BigInt {
public:
    BigInt();
    BigInt(long long value);
    BigInt(const BigInt& other);
    BigInt(BigInt&& other);
    BigInt& operator=(const BigInt& other);
    BigInt& operator=(BigInt&& other) noexcept;
    ~BigInt();

    /**
     * @brief Parse a base-10 integer ("-123", "0042")
     * @throws std::invalid_argument if the text is not an optional '-' followed by digits
     */
    static BigInt fromString(const std::string& text);

    /**
     * @brief 10^exponent
     */
    static BigInt pow10(unsigned int exponent);

    /**
     * @brief Quotient and remainder in one BN_div call
     * @throws std::domain_error if divisor is zero
     */
    static void divMod(const BigInt& dividend, const BigInt& divisor, BigInt& quotient, BigInt& remainder);

    /**
     * @brief Greatest common divisor, always non-negative
     */
    static BigInt gcd(const BigInt& a, const BigInt& b);

    std::string toString() const;

    /**
     * @brief Value as an unsigned 64-bit integer
     * @throws std::out_of_range if negative or wider than 64 bits
     */
    uint64_t toUnsigned() const;

    bool isZero() const;
    bool isNegative() const;
    bool isOdd() const;
    int sign() const;
    int compare(const BigInt& other) const;

    BigInt abs() const;
    BigInt operator-() const;

    BigInt& operator+=(const BigInt& rhs);
    BigInt& operator-=(const BigInt& rhs);
    BigInt& operator*=(const BigInt& rhs);

    friend BigInt operator+(const BigInt& lhs, const BigInt& rhs);
    friend BigInt operator-(const BigInt& lhs, const BigInt& rhs);
    friend BigInt operator*(const BigInt& lhs, const BigInt& rhs);
    friend BigInt operator/(const BigInt& lhs, const BigInt& rhs);
    friend BigInt operator%(const BigInt& lhs, const BigInt& rhs);

    friend bool operator==(const BigInt& lhs, const BigInt& rhs) { return lhs.compare(rhs) == 0; }
    friend bool operator!=(const BigInt& lhs, const BigInt& rhs) { return lhs.compare(rhs) != 0; }
    friend bool operator<(const BigInt& lhs, const BigInt& rhs) { return lhs.compare(rhs) < 0; }
    friend bool operator>(const BigInt& lhs, const BigInt& rhs) { return lhs.compare(rhs) > 0; }
    friend bool operator<=(const BigInt& lhs, const BigInt& rhs) { return lhs.compare(rhs) <= 0; }
    friend bool operator>=(const BigInt& lhs, const BigInt& rhs) { return lhs.compare(rhs) >= 0; }

    friend std::ostream& operator<<(std::ostream& os, const BigInt& value);

private:
    // Takes ownership of an already allocated BIGNUM
    struct Adopt {};
    BigInt(Adopt, BIGNUM* owned);

    BIGNUM* bn;
};

} // namespace Monex

#endif // MONEX_BIGINT_H
