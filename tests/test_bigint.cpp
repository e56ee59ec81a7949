#include <gtest/gtest.h>
#include "bigint.h"
#include <climits>
#include <sstream>
#include <stdexcept>

using Monex::BigInt;

// Test: Construction from integers and strings
TEST(BigIntTest, ConstructAndRender) {
    EXPECT_EQ(BigInt().toString(), "0");
    EXPECT_EQ(BigInt(42).toString(), "42");
    EXPECT_EQ(BigInt(-42).toString(), "-42");
    EXPECT_EQ(BigInt(LLONG_MIN).toString(), "-9223372036854775808");
    EXPECT_EQ(BigInt(LLONG_MAX).toString(), "9223372036854775807");

    EXPECT_EQ(BigInt::fromString("0042").toString(), "42");
    EXPECT_EQ(BigInt::fromString("-0").toString(), "0");
    EXPECT_FALSE(BigInt::fromString("-0").isNegative());
}

// Test: Malformed strings are rejected
TEST(BigIntTest, FromStringRejectsGarbage) {
    EXPECT_THROW(BigInt::fromString(""), std::invalid_argument);
    EXPECT_THROW(BigInt::fromString("-"), std::invalid_argument);
    EXPECT_THROW(BigInt::fromString("12a"), std::invalid_argument);
    EXPECT_THROW(BigInt::fromString("1.5"), std::invalid_argument);
    EXPECT_THROW(BigInt::fromString("+5"), std::invalid_argument);
}

// Test: Products wider than 64 bits stay exact
TEST(BigIntTest, LargeProducts) {
    BigInt a = BigInt::fromString("123456789012345678901234567890");
    BigInt b = BigInt::fromString("987654321098765432109876543210");
    EXPECT_EQ((a * b).toString(), "121932631137021795226185032733622923332237463801111263526900");

    EXPECT_EQ(BigInt::pow10(0).toString(), "1");
    EXPECT_EQ(BigInt::pow10(18).toString(), "1000000000000000000");
    EXPECT_EQ(BigInt::pow10(30) / BigInt::pow10(12), BigInt::pow10(18));
}

// Test: Division truncates toward zero, remainder follows the dividend
TEST(BigIntTest, TruncatingDivision) {
    EXPECT_EQ(BigInt(7) / BigInt(2), BigInt(3));
    EXPECT_EQ(BigInt(-7) / BigInt(2), BigInt(-3));
    EXPECT_EQ(BigInt(7) / BigInt(-2), BigInt(-3));
    EXPECT_EQ(BigInt(7) % BigInt(2), BigInt(1));
    EXPECT_EQ(BigInt(-7) % BigInt(2), BigInt(-1));
    EXPECT_EQ(BigInt(7) % BigInt(-2), BigInt(1));

    BigInt q;
    BigInt r;
    BigInt::divMod(BigInt(-35), BigInt(10), q, r);
    EXPECT_EQ(q, BigInt(-3));
    EXPECT_EQ(r, BigInt(-5));

    EXPECT_THROW(BigInt::divMod(BigInt(1), BigInt(0), q, r), std::domain_error);
}

// Test: Sign helpers and comparisons
TEST(BigIntTest, SignAndCompare) {
    EXPECT_EQ(BigInt(0).sign(), 0);
    EXPECT_EQ(BigInt(-3).sign(), -1);
    EXPECT_EQ(BigInt(3).sign(), 1);
    EXPECT_TRUE(BigInt(3).isOdd());
    EXPECT_FALSE(BigInt(-4).isOdd());
    EXPECT_EQ(BigInt(-9).abs(), BigInt(9));
    EXPECT_EQ(-BigInt(9), BigInt(-9));
    EXPECT_EQ((-BigInt(0)).toString(), "0");

    EXPECT_LT(BigInt(-10), BigInt(2));
    EXPECT_GT(BigInt::pow10(20), BigInt(LLONG_MAX));
    EXPECT_LE(BigInt(5), BigInt(5));
    EXPECT_NE(BigInt(5), BigInt(-5));
    EXPECT_EQ(BigInt::gcd(BigInt(12), BigInt(18)), BigInt(6));
}

// Test: Copies are independent, moves leave a usable target
TEST(BigIntTest, ValueSemantics) {
    BigInt a(10);
    BigInt b = a;
    b += BigInt(5);
    EXPECT_EQ(a, BigInt(10));
    EXPECT_EQ(b, BigInt(15));

    BigInt c = std::move(b);
    EXPECT_EQ(c, BigInt(15));

    // The moved-from value is still a usable zero
    EXPECT_EQ(b.toString(), "0");
    EXPECT_TRUE(b.isZero());
    b += BigInt(2);
    EXPECT_EQ(b, BigInt(2));
    b = BigInt(-7);
    EXPECT_EQ(b.toString(), "-7");
    BigInt copyOfMovedFrom(std::move(b));
    EXPECT_EQ(copyOfMovedFrom, BigInt(-7));
    EXPECT_EQ(BigInt(b).toString(), "0");

    BigInt d;
    d = c;
    d -= BigInt(20);
    EXPECT_EQ(d, BigInt(-5));
    EXPECT_EQ(c, BigInt(15));

    d *= BigInt(-3);
    EXPECT_EQ(d, BigInt(15));
}

// Test: Literal zero picks the integer constructor
TEST(BigIntTest, ZeroLiteral) {
    BigInt zero = BigInt(0);
    EXPECT_TRUE(zero.isZero());
    EXPECT_EQ(zero, BigInt());
    EXPECT_EQ(BigInt(0) + BigInt(0), BigInt(0));
}

// Test: Values above 2^32 keep every bit
TEST(BigIntTest, WideIntegers) {
    EXPECT_EQ(BigInt(5000000000LL).toString(), "5000000000");
    EXPECT_EQ(BigInt(-1099511627776LL).toString(), "-1099511627776");
    EXPECT_EQ(BigInt(4294967296LL) * BigInt(4294967296LL), BigInt::fromString("18446744073709551616"));
    EXPECT_EQ(BigInt(1099511627776LL).toUnsigned(), 1099511627776ULL);
    EXPECT_EQ(BigInt(LLONG_MAX).toUnsigned(), static_cast<uint64_t>(LLONG_MAX));
}

// Test: Narrowing to uint64_t
TEST(BigIntTest, ToUnsigned) {
    EXPECT_EQ(BigInt(0).toUnsigned(), 0u);
    EXPECT_EQ(BigInt(3).toUnsigned(), 3u);
    EXPECT_EQ(BigInt::fromString("18446744073709551615").toUnsigned(), 18446744073709551615ULL);
    EXPECT_THROW(BigInt(-1).toUnsigned(), std::out_of_range);
    EXPECT_THROW(BigInt::pow10(20).toUnsigned(), std::out_of_range);
}

TEST(BigIntTest, StreamInsertion) {
    std::stringstream ss;
    ss << BigInt(-1230);
    EXPECT_EQ(ss.str(), "-1230");
}
