#include "money.h"
#include "allocation.h"
#include "arithmetic.h"
#include "money_util.h"
#include <cstdint>
#include <stdexcept>
#include <utility>

using json = nlohmann::json;

namespace Monex {

namespace {

std::optional<Error> checkSameCurrency(const Money& a, const Money& b) {
    if (a.currency().code != b.currency().code) {
        return Error::currencyMismatch(a.currency().code, b.currency().code);
    }
    return std::nullopt;
}

Result<Money> pick(const std::vector<Money>& values, int wanted) {
    if (values.empty()) {
        return Error::invalidArgument("At least one Money value required");
    }
    size_t best = 0;
    for (size_t i = 1; i < values.size(); ++i) {
        Result<int> cmp = values[i].compare(values[best]);
        if (!cmp) {
            return cmp.error();
        }
        if (cmp.value() == wanted) {
            best = i;
        }
    }
    return values[best];
}

} // namespace

Money::Money(BigInt minor, Currency currency) : amount(std::move(minor)), cur(std::move(currency)) {}

Money Money::fromMinor(const BigInt& minor, const Currency& currency) {
    return Money(minor, currency);
}

Result<Money> Money::fromMajor(const std::string& amount, const Currency& currency) {
    Result<BigInt> minor = parseScaledAmount(amount, currency.decimals);
    if (!minor) {
        return minor.error();
    }
    return Money(minor.value(), currency);
}

Money Money::zero(const Currency& currency) {
    return Money(BigInt(), currency);
}

Result<Money> Money::min(const std::vector<Money>& values) {
    return pick(values, -1);
}

Result<Money> Money::max(const std::vector<Money>& values) {
    return pick(values, 1);
}

Result<Money> Money::fromJson(const json& j, const CurrencyRegistry& registry) {
    if (!j.is_object() || !j.contains("amount") || !j.contains("currency") || !j.contains("precision") ||
        !j["amount"].is_string() || !j["currency"].is_string() || !j["precision"].is_number_integer()) {
        return Error::invalidArgument("Money JSON requires string 'amount', string 'currency' and integer 'precision'");
    }

    Result<Currency> currency = registry.find(j["currency"].get<std::string>());
    if (!currency) {
        return currency.error();
    }

    // Range-check before narrowing: 2^32 + 2 must not pass as 2
    const json& precisionField = j["precision"];
    const bool inRange = precisionField.is_number_unsigned()
        ? precisionField.get<uint64_t>() <= static_cast<uint64_t>(MAX_DECIMALS)
        : (precisionField.get<long long>() >= 0 && precisionField.get<long long>() <= MAX_DECIMALS);
    if (!inRange) {
        return Error::invalidArgument("Money JSON precision " + precisionField.dump() +
                                      " is outside 0.." + std::to_string(MAX_DECIMALS));
    }

    const int precision = static_cast<int>(precisionField.get<long long>());
    if (precision != currency.value().decimals) {
        return Error::invalidArgument("Money JSON precision " + std::to_string(precision) +
                                      " does not match " + currency.value().code + " decimals " +
                                      std::to_string(currency.value().decimals));
    }

    const std::string minor = j["amount"].get<std::string>();
    try {
        return Money(BigInt::fromString(minor), currency.value());
    } catch (const std::invalid_argument& e) {
        return Error::format(e.what());
    }
}

Result<Money> Money::withAmount(const Result<BigInt>& result) const {
    if (!result) {
        return result.error();
    }
    return Money(result.value(), cur);
}

Result<std::vector<Money>> Money::withParts(const Result<std::vector<BigInt>>& parts) const {
    if (!parts) {
        return parts.error();
    }
    std::vector<Money> result;
    result.reserve(parts.value().size());
    for (const BigInt& part : parts.value()) {
        result.push_back(Money(part, cur));
    }
    return result;
}

Result<Money> Money::add(const Money& other) const {
    if (auto mismatch = checkSameCurrency(*this, other)) {
        return *mismatch;
    }
    return Money(Monex::add(amount, other.amount), cur);
}

Result<Money> Money::subtract(const Money& other) const {
    if (auto mismatch = checkSameCurrency(*this, other)) {
        return *mismatch;
    }
    return Money(Monex::subtract(amount, other.amount), cur);
}

Result<Money> Money::multiply(const Ratio& multiplier, std::optional<RoundingMode> rounding) const {
    return withAmount(Monex::multiply(amount, multiplier, rounding));
}

Result<Money> Money::multiply(const std::string& multiplier, std::optional<RoundingMode> rounding) const {
    return withAmount(Monex::multiply(amount, multiplier, rounding));
}

Result<Money> Money::divide(const Ratio& divisor, std::optional<RoundingMode> rounding) const {
    return withAmount(Monex::divide(amount, divisor, rounding));
}

Result<Money> Money::divide(const std::string& divisor, std::optional<RoundingMode> rounding) const {
    return withAmount(Monex::divide(amount, divisor, rounding));
}

Result<Money> Money::percentage(const std::string& percent, RoundingMode rounding) const {
    return withAmount(Monex::percentage(amount, percent, rounding));
}

Result<Money> Money::addPercent(const std::string& percent, RoundingMode rounding) const {
    Result<Money> part = percentage(percent, rounding);
    if (!part) {
        return part;
    }
    return add(part.value());
}

Result<Money> Money::subtractPercent(const std::string& percent, RoundingMode rounding) const {
    Result<Money> part = percentage(percent, rounding);
    if (!part) {
        return part;
    }
    return subtract(part.value());
}

Result<std::vector<Money>> Money::allocate(const std::vector<Ratio>& weights) const {
    return withParts(Monex::allocate(amount, weights));
}

Result<std::vector<Money>> Money::allocate(const std::vector<std::string>& weights) const {
    return withParts(Monex::allocate(amount, weights));
}

Result<std::vector<Money>> Money::allocate(const std::vector<long long>& weights) const {
    return withParts(Monex::allocate(amount, weights));
}

Result<std::vector<Money>> Money::split(size_t parts) const {
    return withParts(Monex::split(amount, parts));
}

Money Money::abs() const {
    return Money(amount.abs(), cur);
}

Money Money::negate() const {
    return Money(-amount, cur);
}

Result<int> Money::compare(const Money& other) const {
    if (auto mismatch = checkSameCurrency(*this, other)) {
        return *mismatch;
    }
    const int cmp = amount.compare(other.amount);
    return cmp < 0 ? -1 : (cmp > 0 ? 1 : 0);
}

Result<bool> Money::lessThan(const Money& other) const {
    Result<int> cmp = compare(other);
    if (!cmp) {
        return cmp.error();
    }
    return cmp.value() < 0;
}

Result<bool> Money::greaterThan(const Money& other) const {
    Result<int> cmp = compare(other);
    if (!cmp) {
        return cmp.error();
    }
    return cmp.value() > 0;
}

Result<bool> Money::lessThanOrEqual(const Money& other) const {
    Result<int> cmp = compare(other);
    if (!cmp) {
        return cmp.error();
    }
    return cmp.value() <= 0;
}

Result<bool> Money::greaterThanOrEqual(const Money& other) const {
    Result<int> cmp = compare(other);
    if (!cmp) {
        return cmp.error();
    }
    return cmp.value() >= 0;
}

Result<Money> Money::clamp(const Money& lower, const Money& upper) const {
    if (auto mismatch = checkSameCurrency(*this, lower)) {
        return *mismatch;
    }
    if (auto mismatch = checkSameCurrency(*this, upper)) {
        return *mismatch;
    }
    if (lower.amount > upper.amount) {
        return Error::invalidArgument("Clamp min cannot be greater than max");
    }

    if (amount < lower.amount) {
        return Money(lower.amount, cur);
    }
    if (amount > upper.amount) {
        return Money(upper.amount, cur);
    }
    return *this;
}

std::string Money::toDecimalString() const {
    return formatScaledAmount(amount, cur.decimals);
}

json Money::toJson() const {
    return json{
        {"amount", amount.toString()},
        {"currency", cur.code},
        {"precision", cur.decimals}
    };
}

bool Money::operator==(const Money& other) const {
    return cur.code == other.cur.code && amount == other.amount;
}

bool Money::operator!=(const Money& other) const {
    return !(*this == other);
}

std::ostream& operator<<(std::ostream& os, const Money& money) {
    return os << money.toDecimalString() << " " << money.currency().code;
}

} // namespace Monex
