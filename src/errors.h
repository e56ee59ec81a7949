#ifndef MONEX_ERRORS_H
#define MONEX_ERRORS_H

#include <string>
#include <stdexcept>
#include <utility>
#include <variant>

namespace Monex {

/**
 * @brief Categories of failure reported by the arithmetic core
 */
enum class ErrorCode {
    Format,             // malformed decimal literal
    PrecisionExceeded,  // more fractional digits than the currency allows
    DivisionByZero,
    RoundingRequired,   // inexact result and no rounding mode supplied
    UnsupportedPolicy,  // unknown rounding mode
    EmptyWeights,
    ZeroTotalWeight,
    CurrencyMismatch,
    InvalidArgument,
    UnknownCurrency
};

/**
 * @brief Stable machine-readable name, e.g. "MONEX_ROUNDING_REQUIRED"
 */
const char* errorCodeName(ErrorCode code);

/**
 * @brief A failed operation: its category, a message and kind-specific context
 *
 * Only the context fields relevant to `code` are filled in.
 */
struct Error {
    ErrorCode code = ErrorCode::InvalidArgument;
    std::string message;

    // RoundingRequired
    std::string operation;
    std::string numerator;
    std::string denominator;

    // PrecisionExceeded
    int digits = 0;
    int limit = 0;

    // CurrencyMismatch
    std::string expected;
    std::string received;

    // UnsupportedPolicy
    std::string value;

    static Error format(const std::string& message);
    static Error precisionExceeded(int digits, int limit);
    static Error divisionByZero();
    static Error roundingRequired(const std::string& operation, const std::string& numerator, const std::string& denominator);
    static Error unsupportedPolicy(const std::string& value);
    static Error emptyWeights();
    static Error zeroTotalWeight();
    static Error currencyMismatch(const std::string& expected, const std::string& received);
    static Error invalidArgument(const std::string& message);
    static Error unknownCurrency(const std::string& code);
};

/**
 * @brief Exception thrown when the value of a failed Result is requested
 */
class MoneyError : public std::runtime_error {
public:
    explicit MoneyError(Error error)
        : std::runtime_error(std::string(errorCodeName(error.code)) + ": " + error.message),
          err(std::move(error)) {}

    const Error& error() const noexcept { return err; }
    ErrorCode code() const noexcept { return err.code; }

private:
    Error err;
};

/**
 * @brief Either a value of type T or an Error
 *
 * Every core operation returns one of these, so an inexact multiply or an
 * over-precise literal has to be handled at the call site.
 */
template <typename T>
class Result {
public:
    Result(const T& value) : state(value) {}
    Result(T&& value) : state(std::move(value)) {}
    Result(const Error& error) : state(error) {}
    Result(Error&& error) : state(std::move(error)) {}

    bool ok() const noexcept { return state.index() == 0; }
    explicit operator bool() const noexcept { return ok(); }

    /**
     * @brief The contained value
     * @throws MoneyError carrying the error if the operation failed
     */
    const T& value() const& {
        if (!ok()) {
            throw MoneyError(std::get<1>(state));
        }
        return std::get<0>(state);
    }

    T&& value() && {
        if (!ok()) {
            throw MoneyError(std::get<1>(state));
        }
        return std::get<0>(std::move(state));
    }

    /**
     * @brief The contained error; throws std::logic_error on a successful result
     */
    const Error& error() const {
        if (ok()) {
            throw std::logic_error("Result holds a value, not an error");
        }
        return std::get<1>(state);
    }

private:
    std::variant<T, Error> state;
};

} // namespace Monex

#endif // MONEX_ERRORS_H
