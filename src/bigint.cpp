#include "bigint.h"
#include <stdexcept>
#include <utility>
#include <memory>
#include <openssl/crypto.h>

namespace Monex {

namespace {

struct CtxDeleter {
    void operator()(BN_CTX* ctx) const { BN_CTX_free(ctx); }
};

using CtxPtr = std::unique_ptr<BN_CTX, CtxDeleter>;

CtxPtr newContext() {
    CtxPtr ctx(BN_CTX_new());
    if (!ctx) {
        throw std::runtime_error("Error creating BN_CTX.");
    }
    return ctx;
}

BIGNUM* newBignum() {
    BIGNUM* bn = BN_new();
    if (!bn) {
        throw std::runtime_error("Error allocating BIGNUM.");
    }
    return bn;
}

void check(int rc, const char* what) {
    if (!rc) {
        throw std::runtime_error(std::string("BIGNUM operation failed: ") + what);
    }
}

} // namespace

BigInt::BigInt() : bn(newBignum()) {}

BigInt::BigInt(long long value) : bn(newBignum()) {
    // Magnitude computed in unsigned arithmetic so LLONG_MIN does not overflow
    uint64_t magnitude = value < 0
        ? static_cast<uint64_t>(-(value + 1)) + 1ULL
        : static_cast<uint64_t>(value);

    // Big-endian bytes, independent of the width of BN_ULONG
    unsigned char bytes[8];
    for (int i = 7; i >= 0; --i) {
        bytes[i] = static_cast<unsigned char>(magnitude & 0xFF);
        magnitude >>= 8;
    }
    if (!BN_bin2bn(bytes, sizeof(bytes), bn)) {
        BN_free(bn);
        throw std::runtime_error("Error converting integer to BIGNUM.");
    }
    BN_set_negative(bn, value < 0 ? 1 : 0);
}

BigInt::BigInt(Adopt, BIGNUM* owned) : bn(owned) {}

BigInt::BigInt(const BigInt& other) : bn(BN_dup(other.bn)) {
    if (!bn) {
        throw std::runtime_error("Error copying BIGNUM.");
    }
}

BigInt::BigInt(BigInt&& other) : bn(newBignum()) {
    std::swap(bn, other.bn);
}

BigInt& BigInt::operator=(const BigInt& other) {
    if (this != &other) {
        BigInt copy(other);
        std::swap(bn, copy.bn);
    }
    return *this;
}

BigInt& BigInt::operator=(BigInt&& other) noexcept {
    std::swap(bn, other.bn);
    return *this;
}

BigInt::~BigInt() {
    BN_free(bn);
}

BigInt BigInt::fromString(const std::string& text) {
    size_t start = (!text.empty() && text[0] == '-') ? 1 : 0;
    if (start == text.size()) {
        throw std::invalid_argument("Invalid integer literal: '" + text + "'");
    }
    for (size_t i = start; i < text.size(); ++i) {
        if (text[i] < '0' || text[i] > '9') {
            throw std::invalid_argument("Invalid integer literal: '" + text + "'");
        }
    }

    BIGNUM* parsed = nullptr;
    if (BN_dec2bn(&parsed, text.c_str()) != static_cast<int>(text.size())) {
        BN_free(parsed);
        throw std::invalid_argument("Invalid integer literal: '" + text + "'");
    }
    // "-0" must not produce a negative zero
    if (BN_is_zero(parsed)) {
        BN_set_negative(parsed, 0);
    }
    return BigInt(Adopt{}, parsed);
}

BigInt BigInt::pow10(unsigned int exponent) {
    BigInt result(1);
    for (unsigned int i = 0; i < exponent; ++i) {
        check(BN_mul_word(result.bn, 10), "mul_word");
    }
    return result;
}

void BigInt::divMod(const BigInt& dividend, const BigInt& divisor, BigInt& quotient, BigInt& remainder) {
    if (divisor.isZero()) {
        throw std::domain_error("BigInt division by zero");
    }
    CtxPtr ctx = newContext();
    BigInt q;
    BigInt r;
    check(BN_div(q.bn, r.bn, dividend.bn, divisor.bn, ctx.get()), "div");
    quotient = std::move(q);
    remainder = std::move(r);
}

BigInt BigInt::gcd(const BigInt& a, const BigInt& b) {
    CtxPtr ctx = newContext();
    BigInt result;
    check(BN_gcd(result.bn, a.bn, b.bn, ctx.get()), "gcd");
    return result;
}

std::string BigInt::toString() const {
    char* text = BN_bn2dec(bn);
    if (!text) {
        throw std::runtime_error("Error converting BIGNUM to decimal.");
    }
    std::string result(text);
    OPENSSL_free(text);
    return result;
}

uint64_t BigInt::toUnsigned() const {
    if (isNegative() || BN_num_bits(bn) > 64) {
        throw std::out_of_range("BigInt value does not fit in 64 bits: " + toString());
    }
    unsigned char bytes[8];
    check(BN_bn2binpad(bn, bytes, sizeof(bytes)) == static_cast<int>(sizeof(bytes)), "bn2binpad");
    uint64_t result = 0;
    for (unsigned char byte : bytes) {
        result = (result << 8) | byte;
    }
    return result;
}

bool BigInt::isZero() const {
    return BN_is_zero(bn);
}

bool BigInt::isNegative() const {
    return BN_is_negative(bn) && !BN_is_zero(bn);
}

bool BigInt::isOdd() const {
    return BN_is_odd(bn);
}

int BigInt::sign() const {
    if (isZero()) return 0;
    return isNegative() ? -1 : 1;
}

int BigInt::compare(const BigInt& other) const {
    return BN_cmp(bn, other.bn);
}

BigInt BigInt::abs() const {
    BigInt result(*this);
    BN_set_negative(result.bn, 0);
    return result;
}

BigInt BigInt::operator-() const {
    BigInt result(*this);
    BN_set_negative(result.bn, isNegative() ? 0 : 1);
    return result;
}

BigInt& BigInt::operator+=(const BigInt& rhs) {
    check(BN_add(bn, bn, rhs.bn), "add");
    return *this;
}

BigInt& BigInt::operator-=(const BigInt& rhs) {
    check(BN_sub(bn, bn, rhs.bn), "sub");
    return *this;
}

BigInt& BigInt::operator*=(const BigInt& rhs) {
    CtxPtr ctx = newContext();
    check(BN_mul(bn, bn, rhs.bn, ctx.get()), "mul");
    return *this;
}

BigInt operator+(const BigInt& lhs, const BigInt& rhs) {
    BigInt result(lhs);
    result += rhs;
    return result;
}

BigInt operator-(const BigInt& lhs, const BigInt& rhs) {
    BigInt result(lhs);
    result -= rhs;
    return result;
}

BigInt operator*(const BigInt& lhs, const BigInt& rhs) {
    BigInt result(lhs);
    result *= rhs;
    return result;
}

BigInt operator/(const BigInt& lhs, const BigInt& rhs) {
    BigInt quotient;
    BigInt remainder;
    BigInt::divMod(lhs, rhs, quotient, remainder);
    return quotient;
}

BigInt operator%(const BigInt& lhs, const BigInt& rhs) {
    BigInt quotient;
    BigInt remainder;
    BigInt::divMod(lhs, rhs, quotient, remainder);
    return remainder;
}

std::ostream& operator<<(std::ostream& os, const BigInt& value) {
    return os << value.toString();
}

} // namespace Monex
