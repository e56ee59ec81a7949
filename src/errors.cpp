#include "errors.h"

namespace Monex {

const char* errorCodeName(ErrorCode code) {
    switch (code) {
        case ErrorCode::Format: return "MONEX_FORMAT";
        case ErrorCode::PrecisionExceeded: return "MONEX_PRECISION_EXCEEDED";
        case ErrorCode::DivisionByZero: return "MONEX_DIVISION_BY_ZERO";
        case ErrorCode::RoundingRequired: return "MONEX_ROUNDING_REQUIRED";
        case ErrorCode::UnsupportedPolicy: return "MONEX_UNSUPPORTED_POLICY";
        case ErrorCode::EmptyWeights: return "MONEX_EMPTY_WEIGHTS";
        case ErrorCode::ZeroTotalWeight: return "MONEX_ZERO_TOTAL_WEIGHT";
        case ErrorCode::CurrencyMismatch: return "MONEX_CURRENCY_MISMATCH";
        case ErrorCode::InvalidArgument: return "MONEX_INVALID_ARGUMENT";
        case ErrorCode::UnknownCurrency: return "MONEX_UNKNOWN_CURRENCY";
    }
    return "MONEX_UNKNOWN";
}

Error Error::format(const std::string& message) {
    Error e;
    e.code = ErrorCode::Format;
    e.message = message;
    return e;
}

Error Error::precisionExceeded(int digits, int limit) {
    Error e;
    e.code = ErrorCode::PrecisionExceeded;
    e.message = "Precision " + std::to_string(digits) + " exceeds currency decimals " + std::to_string(limit);
    e.digits = digits;
    e.limit = limit;
    return e;
}

Error Error::divisionByZero() {
    Error e;
    e.code = ErrorCode::DivisionByZero;
    e.message = "Division by zero";
    return e;
}

Error Error::roundingRequired(const std::string& operation, const std::string& numerator, const std::string& denominator) {
    Error e;
    e.code = ErrorCode::RoundingRequired;
    e.message = "Rounding required for " + operation + ": result " + numerator + "/" + denominator +
                " is not an integer. Provide one of HALF_UP, HALF_DOWN, HALF_EVEN, FLOOR, CEIL, TRUNCATE";
    e.operation = operation;
    e.numerator = numerator;
    e.denominator = denominator;
    return e;
}

Error Error::unsupportedPolicy(const std::string& value) {
    Error e;
    e.code = ErrorCode::UnsupportedPolicy;
    e.message = "Unsupported rounding mode: " + value;
    e.value = value;
    return e;
}

Error Error::emptyWeights() {
    Error e;
    e.code = ErrorCode::EmptyWeights;
    e.message = "Cannot allocate to empty ratios";
    return e;
}

Error Error::zeroTotalWeight() {
    Error e;
    e.code = ErrorCode::ZeroTotalWeight;
    e.message = "Total ratio must be greater than zero";
    return e;
}

Error Error::currencyMismatch(const std::string& expected, const std::string& received) {
    Error e;
    e.code = ErrorCode::CurrencyMismatch;
    e.message = "Currency mismatch: expected " + expected + ", received " + received;
    e.expected = expected;
    e.received = received;
    return e;
}

Error Error::invalidArgument(const std::string& message) {
    Error e;
    e.code = ErrorCode::InvalidArgument;
    e.message = message;
    return e;
}

Error Error::unknownCurrency(const std::string& code) {
    Error e;
    e.code = ErrorCode::UnknownCurrency;
    e.message = "Currency '" + code + "' not found in registry";
    e.value = code;
    return e;
}

} // namespace Monex
