#ifndef MONEX_MONEY_H
#define MONEX_MONEY_H

#include <optional>
#include <ostream>
#include <string>
#include <vector>
#include "nlohmann/json.hpp"
#include "bigint.h"
#include "currency.h"
#include "errors.h"
#include "ratio.h"
#include "rounding.h"

namespace Monex {

/**
 * @brief An immutable amount of minor units in one currency
 *
 * Every operation returns a new Money. Operations combining two values
 * fail with CurrencyMismatch when their currency codes differ.
 */
class Money {
public:
    /**
     * @brief Money from minor units (cents for USD)
     */
    static Money fromMinor(const BigInt& minor, const Currency& currency);

    /**
     * @brief Money from a major-unit literal ("10.50")
     * @return Format or PrecisionExceeded from parseScaledAmount
     */
    static Result<Money> fromMajor(const std::string& amount, const Currency& currency);

    static Money zero(const Currency& currency);

    /**
     * @brief Smallest / largest of values, all of which must share a currency
     * @return InvalidArgument for an empty list, CurrencyMismatch otherwise on mixed currencies
     */
    static Result<Money> min(const std::vector<Money>& values);
    static Result<Money> max(const std::vector<Money>& values);

    /**
     * @brief Reverse of toJson(); the currency code is resolved through registry
     * @return UnknownCurrency, InvalidArgument for a malformed document or a
     *         precision different from the registered currency's decimals
     */
    static Result<Money> fromJson(const nlohmann::json& j, const CurrencyRegistry& registry);

    const BigInt& minor() const { return amount; }
    const Currency& currency() const { return cur; }

    Result<Money> add(const Money& other) const;
    Result<Money> subtract(const Money& other) const;

    Result<Money> multiply(const Ratio& multiplier, std::optional<RoundingMode> rounding = std::nullopt) const;
    Result<Money> multiply(const std::string& multiplier, std::optional<RoundingMode> rounding = std::nullopt) const;
    Result<Money> divide(const Ratio& divisor, std::optional<RoundingMode> rounding = std::nullopt) const;
    Result<Money> divide(const std::string& divisor, std::optional<RoundingMode> rounding = std::nullopt) const;

    /**
     * @brief percent% of this value ("15" -> 15%)
     */
    Result<Money> percentage(const std::string& percent, RoundingMode rounding = RoundingMode::HalfEven) const;
    Result<Money> addPercent(const std::string& percent, RoundingMode rounding = RoundingMode::HalfEven) const;
    Result<Money> subtractPercent(const std::string& percent, RoundingMode rounding = RoundingMode::HalfEven) const;

    /**
     * @brief Parts that sum exactly to this value, in the order of weights
     */
    Result<std::vector<Money>> allocate(const std::vector<Ratio>& weights) const;
    Result<std::vector<Money>> allocate(const std::vector<std::string>& weights) const;
    Result<std::vector<Money>> allocate(const std::vector<long long>& weights) const;
    Result<std::vector<Money>> split(size_t parts) const;

    Money abs() const;
    Money negate() const;

    bool isZero() const { return amount.isZero(); }
    bool isNegative() const { return amount.isNegative(); }
    bool isPositive() const { return amount.sign() > 0; }

    /**
     * @brief -1, 0 or 1
     */
    Result<int> compare(const Money& other) const;
    Result<bool> lessThan(const Money& other) const;
    Result<bool> greaterThan(const Money& other) const;
    Result<bool> lessThanOrEqual(const Money& other) const;
    Result<bool> greaterThanOrEqual(const Money& other) const;

    /**
     * @brief This value limited to [lower, upper]
     * @return InvalidArgument if lower > upper
     */
    Result<Money> clamp(const Money& lower, const Money& upper) const;

    /**
     * @brief Canonical decimal string, e.g. "1234.50" or "-5.25"
     */
    std::string toDecimalString() const;

    /**
     * @brief {"amount": "<minor units>", "currency": "<code>", "precision": <decimals>}
     */
    nlohmann::json toJson() const;

    // Structural: same minor units and same currency code
    bool operator==(const Money& other) const;
    bool operator!=(const Money& other) const;

private:
    Money(BigInt minor, Currency currency);

    Result<Money> withAmount(const Result<BigInt>& result) const;
    Result<std::vector<Money>> withParts(const Result<std::vector<BigInt>>& parts) const;

    BigInt amount;
    Currency cur;
};

std::ostream& operator<<(std::ostream& os, const Money& money);

} // namespace Monex

#endif // MONEX_MONEY_H
