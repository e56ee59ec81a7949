#include <gtest/gtest.h>
#include "arithmetic.h"

using namespace Monex;

// Test: Exact products need no rounding mode
TEST(ArithmeticTest, ExactMultiply) {
    Result<BigInt> result = multiply(BigInt(1000), "1.5");
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.value(), BigInt(1500));

    result = multiply(BigInt(100), "0.25");
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.value(), BigInt(25));

    result = multiply(BigInt(100), "-3");
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.value(), BigInt(-300));
}

// Test: 100 x 0.555 = 55.5 must be rounded explicitly
TEST(ArithmeticTest, RoundingRequiredGate) {
    Result<BigInt> result = multiply(BigInt(100), "0.555");
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error().code, ErrorCode::RoundingRequired);
    EXPECT_EQ(result.error().operation, "multiply");
    EXPECT_EQ(result.error().numerator, "55500");
    EXPECT_EQ(result.error().denominator, "1000");

    EXPECT_EQ(multiply(BigInt(100), "0.555", RoundingMode::HalfUp).value(), BigInt(56));
    EXPECT_EQ(multiply(BigInt(100), "0.555", RoundingMode::Floor).value(), BigInt(55));
    EXPECT_EQ(multiply(BigInt(100), "0.555", RoundingMode::HalfEven).value(), BigInt(56));
    EXPECT_EQ(multiply(BigInt(100), "0.545", RoundingMode::HalfEven).value(), BigInt(54));
}

// Test: Multiplier given as an explicit Ratio
TEST(ArithmeticTest, MultiplyByRatio) {
    Ratio third = Ratio::make(BigInt(1), BigInt(3)).value();
    EXPECT_EQ(multiply(BigInt(100), third).error().code, ErrorCode::RoundingRequired);
    EXPECT_EQ(multiply(BigInt(100), third, RoundingMode::HalfUp).value(), BigInt(33));
    EXPECT_EQ(multiply(BigInt(100), third, RoundingMode::Ceil).value(), BigInt(34));
    EXPECT_EQ(multiply(BigInt(300), third).value(), BigInt(100));
}

// Test: Division, exact and rounded
TEST(ArithmeticTest, Divide) {
    EXPECT_EQ(divide(BigInt(1000), "4").value(), BigInt(250));
    EXPECT_EQ(divide(BigInt(1000), "0.5").value(), BigInt(2000));
    EXPECT_EQ(divide(BigInt(1000), "-4").value(), BigInt(-250));

    Result<BigInt> result = divide(BigInt(1000), "3");
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error().code, ErrorCode::RoundingRequired);
    EXPECT_EQ(result.error().operation, "divide");

    EXPECT_EQ(divide(BigInt(1000), "3", RoundingMode::HalfUp).value(), BigInt(333));
    EXPECT_EQ(divide(BigInt(1000), "-3", RoundingMode::Floor).value(), BigInt(-334));
    EXPECT_EQ(divide(BigInt(1000), "-3", RoundingMode::Truncate).value(), BigInt(-333));
}

// Test: Zero divisor fails before any rounding decision
TEST(ArithmeticTest, DivideByZero) {
    EXPECT_EQ(divide(BigInt(1000), "0").error().code, ErrorCode::DivisionByZero);
    EXPECT_EQ(divide(BigInt(1000), "0.00", RoundingMode::HalfUp).error().code, ErrorCode::DivisionByZero);
    EXPECT_EQ(divide(BigInt(0), Ratio::fromInteger(0)).error().code, ErrorCode::DivisionByZero);
}

// Test: Malformed scalars are Format errors
TEST(ArithmeticTest, MalformedScalar) {
    EXPECT_EQ(multiply(BigInt(100), "1e2").error().code, ErrorCode::Format);
    EXPECT_EQ(divide(BigInt(100), "1,5", RoundingMode::HalfUp).error().code, ErrorCode::Format);
}

// Test: Percentages of an amount
TEST(ArithmeticTest, Percentage) {
    EXPECT_EQ(percentage(BigInt(10000), "15").value(), BigInt(1500));
    EXPECT_EQ(percentage(BigInt(10000), "12.5").value(), BigInt(1250));
    // 1050 * 7.5% = 78.75
    EXPECT_EQ(percentage(BigInt(1050), "7.5").value(), BigInt(79));
    EXPECT_EQ(percentage(BigInt(1050), "7.5", RoundingMode::Floor).value(), BigInt(78));
    // 250 * 1% = 2.5, banker's rounding by default
    EXPECT_EQ(percentage(BigInt(250), "1").value(), BigInt(2));
}

// Test: Ten rounded multiplies undone by ten rounded divides
TEST(ArithmeticTest, ChainedMultiplyDivide) {
    BigInt value(100000);
    for (int i = 0; i < 10; ++i) {
        value = multiply(value, "1.1", RoundingMode::HalfEven).value();
    }
    EXPECT_EQ(value, BigInt(259374));
    for (int i = 0; i < 10; ++i) {
        value = divide(value, "1.1", RoundingMode::HalfEven).value();
    }
    EXPECT_EQ(value, BigInt(100000));

    EXPECT_EQ(add(BigInt(5), BigInt(-7)), BigInt(-2));
    EXPECT_EQ(subtract(BigInt(5), BigInt(-7)), BigInt(12));
}
