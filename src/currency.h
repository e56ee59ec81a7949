#ifndef MONEX_CURRENCY_H
#define MONEX_CURRENCY_H

#include <map>
#include <string>
#include <vector>
#include "errors.h"

namespace Monex {

/**
 * @brief Currency or token metadata
 *
 * Only `decimals` takes part in arithmetic; it fixes the scale 10^decimals
 * between major and minor units. Currencies compare equal by code.
 */
struct Currency {
    std::string code;    // ISO 4217 code or token ticker ("USD", "ETH")
    int decimals = 2;    // 0..18
    std::string symbol;
    std::string locale;  // default display locale, may be empty

    /**
     * @brief Validated construction
     * @return InvalidArgument for an empty code or decimals outside 0..18
     */
    static Result<Currency> make(const std::string& code, int decimals,
                                 const std::string& symbol = "", const std::string& locale = "");

    bool operator==(const Currency& other) const { return code == other.code; }
    bool operator!=(const Currency& other) const { return code != other.code; }
};

/**
 * @brief Lookup table of currencies by code
 *
 * An ordinary object owned by the caller; nothing in the arithmetic core
 * reads it. Populate it at start-up and share it read-only afterwards.
 */
class CurrencyRegistry {
public:
    CurrencyRegistry() = default;

    /**
     * @brief Registry pre-loaded with the ISO 4217 table and the predefined crypto tokens
     */
    static CurrencyRegistry withDefaults();

    /**
     * @brief Add or replace a currency
     */
    void registerCurrency(const Currency& currency);

    /**
     * @brief Look a currency up by code
     * @return UnknownCurrency if the code was never registered
     */
    Result<Currency> find(const std::string& code) const;

    bool contains(const std::string& code) const;
    std::vector<std::string> codes() const;
    size_t size() const { return currencies.size(); }

private:
    std::map<std::string, Currency> currencies;
};

/**
 * @brief The built-in ISO 4217 currencies (USD, EUR, JPY, KWD, ...)
 */
const std::vector<Currency>& iso4217Currencies();

} // namespace Monex

#endif // MONEX_CURRENCY_H
