#include "currency.h"
#include "money_util.h"
#include "token.h"

namespace Monex {

Result<Currency> Currency::make(const std::string& code, int decimals,
                                const std::string& symbol, const std::string& locale) {
    if (code.empty()) {
        return Error::invalidArgument("Currency code must not be empty");
    }
    if (decimals < 0 || decimals > MAX_DECIMALS) {
        return Error::invalidArgument("Currency " + code + ": decimals must be between 0 and 18, got " +
                                      std::to_string(decimals));
    }
    Currency currency;
    currency.code = code;
    currency.decimals = decimals;
    currency.symbol = symbol.empty() ? code : symbol;
    currency.locale = locale;
    return currency;
}

const std::vector<Currency>& iso4217Currencies() {
    static const std::vector<Currency> table = {
        // Major world currencies
        {"USD", 2, "$", "en-US"},
        {"EUR", 2, "€", "de-DE"},
        {"GBP", 2, "£", "en-GB"},
        {"JPY", 0, "¥", "ja-JP"},
        {"CHF", 2, "CHF", "de-CH"},
        {"CAD", 2, "CA$", "en-CA"},
        {"AUD", 2, "A$", "en-AU"},
        {"NZD", 2, "NZ$", "en-NZ"},
        // Asia-Pacific
        {"CNY", 2, "¥", "zh-CN"},
        {"HKD", 2, "HK$", "zh-HK"},
        {"SGD", 2, "S$", "en-SG"},
        {"KRW", 0, "₩", "ko-KR"},
        {"INR", 2, "₹", "en-IN"},
        {"THB", 2, "฿", "th-TH"},
        {"MYR", 2, "RM", "ms-MY"},
        {"IDR", 2, "Rp", "id-ID"},
        {"PHP", 2, "₱", "en-PH"},
        {"VND", 0, "₫", "vi-VN"},
        {"TWD", 2, "NT$", "zh-TW"},
        {"PKR", 2, "₨", "ur-PK"},
        {"BDT", 2, "৳", "bn-BD"},
        {"LKR", 2, "Rs", "si-LK"},
        // Europe
        {"SEK", 2, "kr", "sv-SE"},
        {"NOK", 2, "kr", "nb-NO"},
        {"DKK", 2, "kr", "da-DK"},
        {"ISK", 0, "kr", "is-IS"},
        {"PLN", 2, "zł", "pl-PL"},
        {"CZK", 2, "Kč", "cs-CZ"},
        {"HUF", 2, "Ft", "hu-HU"},
        {"RON", 2, "lei", "ro-RO"},
        {"BGN", 2, "лв", "bg-BG"},
        {"TRY", 2, "₺", "tr-TR"},
        {"RUB", 2, "₽", "ru-RU"},
        {"UAH", 2, "₴", "uk-UA"},
        // Americas
        {"MXN", 2, "MX$", "es-MX"},
        {"BRL", 2, "R$", "pt-BR"},
        {"ARS", 2, "AR$", "es-AR"},
        {"CLP", 0, "CL$", "es-CL"},
        {"COP", 2, "CO$", "es-CO"},
        {"PEN", 2, "S/", "es-PE"},
        // Africa
        {"ZAR", 2, "R", "en-ZA"},
        {"NGN", 2, "₦", "en-NG"},
        {"KES", 2, "KSh", "en-KE"},
        {"EGP", 2, "E£", "ar-EG"},
        {"GHS", 2, "GH₵", "en-GH"},
        {"TZS", 2, "TSh", "sw-TZ"},
        {"UGX", 0, "USh", "en-UG"},
        {"MRU", 2, "UM", "ar-MR"},
        // Middle East (three-decimal dinars included)
        {"ILS", 2, "₪", "he-IL"},
        {"AED", 2, "AED", "ar-AE"},
        {"SAR", 2, "SAR", "ar-SA"},
        {"QAR", 2, "QAR", "ar-QA"},
        {"KWD", 3, "KD", "ar-KW"},
        {"BHD", 3, "BD", "ar-BH"},
        {"OMR", 3, "OMR", "ar-OM"},
        {"JOD", 3, "JD", "ar-JO"},
    };
    return table;
}

CurrencyRegistry CurrencyRegistry::withDefaults() {
    CurrencyRegistry registry;
    for (const Currency& currency : iso4217Currencies()) {
        registry.registerCurrency(currency);
    }
    for (const TokenDefinition& token : predefinedTokens()) {
        registry.registerCurrency(token.currency);
    }
    return registry;
}

void CurrencyRegistry::registerCurrency(const Currency& currency) {
    currencies[currency.code] = currency;
}

Result<Currency> CurrencyRegistry::find(const std::string& code) const {
    auto it = currencies.find(code);
    if (it == currencies.end()) {
        return Error::unknownCurrency(code);
    }
    return it->second;
}

bool CurrencyRegistry::contains(const std::string& code) const {
    return currencies.count(code) > 0;
}

std::vector<std::string> CurrencyRegistry::codes() const {
    std::vector<std::string> result;
    result.reserve(currencies.size());
    for (const auto& entry : currencies) {
        result.push_back(entry.first);
    }
    return result;
}

} // namespace Monex
