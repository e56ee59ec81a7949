#include <gtest/gtest.h>
#include "errors.h"
#include <string>

using namespace Monex;

// Test: Stable code names
TEST(ErrorsTest, CodeNames) {
    EXPECT_STREQ(errorCodeName(ErrorCode::Format), "MONEX_FORMAT");
    EXPECT_STREQ(errorCodeName(ErrorCode::PrecisionExceeded), "MONEX_PRECISION_EXCEEDED");
    EXPECT_STREQ(errorCodeName(ErrorCode::DivisionByZero), "MONEX_DIVISION_BY_ZERO");
    EXPECT_STREQ(errorCodeName(ErrorCode::RoundingRequired), "MONEX_ROUNDING_REQUIRED");
    EXPECT_STREQ(errorCodeName(ErrorCode::UnsupportedPolicy), "MONEX_UNSUPPORTED_POLICY");
    EXPECT_STREQ(errorCodeName(ErrorCode::EmptyWeights), "MONEX_EMPTY_WEIGHTS");
    EXPECT_STREQ(errorCodeName(ErrorCode::ZeroTotalWeight), "MONEX_ZERO_TOTAL_WEIGHT");
    EXPECT_STREQ(errorCodeName(ErrorCode::CurrencyMismatch), "MONEX_CURRENCY_MISMATCH");
    EXPECT_STREQ(errorCodeName(ErrorCode::InvalidArgument), "MONEX_INVALID_ARGUMENT");
    EXPECT_STREQ(errorCodeName(ErrorCode::UnknownCurrency), "MONEX_UNKNOWN_CURRENCY");
}

// Test: Factories fill in the context of their kind
TEST(ErrorsTest, FactoryContext) {
    Error precision = Error::precisionExceeded(3, 2);
    EXPECT_EQ(precision.code, ErrorCode::PrecisionExceeded);
    EXPECT_EQ(precision.digits, 3);
    EXPECT_EQ(precision.limit, 2);

    Error rounding = Error::roundingRequired("multiply", "5550", "100");
    EXPECT_EQ(rounding.code, ErrorCode::RoundingRequired);
    EXPECT_EQ(rounding.operation, "multiply");
    EXPECT_EQ(rounding.numerator, "5550");
    EXPECT_EQ(rounding.denominator, "100");
    EXPECT_NE(rounding.message.find("5550/100"), std::string::npos);

    Error mismatch = Error::currencyMismatch("USD", "EUR");
    EXPECT_EQ(mismatch.expected, "USD");
    EXPECT_EQ(mismatch.received, "EUR");

    Error policy = Error::unsupportedPolicy("BANKERS");
    EXPECT_EQ(policy.value, "BANKERS");
}

// Test: Result holds either a value or an error
TEST(ErrorsTest, ResultAccess) {
    Result<int> good(7);
    EXPECT_TRUE(good.ok());
    EXPECT_TRUE(static_cast<bool>(good));
    EXPECT_EQ(good.value(), 7);
    EXPECT_THROW(good.error(), std::logic_error);

    Result<int> bad(Error::divisionByZero());
    EXPECT_FALSE(bad.ok());
    EXPECT_EQ(bad.error().code, ErrorCode::DivisionByZero);
}

// Test: Asking a failed Result for its value throws MoneyError
TEST(ErrorsTest, ValueOnFailureThrows) {
    Result<std::string> bad(Error::emptyWeights());
    try {
        (void)bad.value();
        FAIL() << "Expected MoneyError";
    } catch (const MoneyError& e) {
        EXPECT_EQ(e.code(), ErrorCode::EmptyWeights);
        EXPECT_NE(std::string(e.what()).find("MONEX_EMPTY_WEIGHTS"), std::string::npos);
    }

    EXPECT_THROW(Result<std::string>(Error::zeroTotalWeight()).value(), MoneyError);
}
