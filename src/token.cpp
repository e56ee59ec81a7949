#include "token.h"
#include "logger.h"
#include <algorithm>
#include <cctype>

namespace Monex {

std::string tokenKindName(TokenKind kind) {
    switch (kind) {
        case TokenKind::Fiat: return "fiat";
        case TokenKind::Crypto: return "crypto";
        case TokenKind::Commodity: return "commodity";
        case TokenKind::Custom: return "custom";
    }
    return "custom";
}

Result<TokenDefinition> defineToken(CurrencyRegistry& registry, const TokenDefinition& definition) {
    if (definition.currency.symbol.empty()) {
        return Error::invalidArgument("Token definition requires a symbol");
    }

    std::string code = definition.currency.code;
    std::transform(code.begin(), code.end(), code.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    Result<Currency> currency = Currency::make(code, definition.currency.decimals,
                                               definition.currency.symbol, definition.currency.locale);
    if (!currency) {
        return currency.error();
    }

    TokenDefinition token = definition;
    token.currency = currency.value();
    registry.registerCurrency(token.currency);

    LOG_DEBUG(Logger::core(), "Registered {} token {} with {} decimals",
              tokenKindName(token.kind), token.currency.code, token.currency.decimals);
    return token;
}

namespace {

TokenDefinition makeToken(const std::string& code, const std::string& symbol, int decimals,
                          std::optional<uint64_t> chainId, const std::string& contractAddress,
                          const std::string& standard, const std::string& coingeckoId) {
    TokenDefinition token;
    token.currency = {code, decimals, symbol, ""};
    token.kind = TokenKind::Crypto;
    token.chainId = chainId;
    token.contractAddress = contractAddress;
    token.standard = standard;
    token.coingeckoId = coingeckoId;
    return token;
}

} // namespace

const std::vector<TokenDefinition>& predefinedTokens() {
    static const std::vector<TokenDefinition> tokens = {
        makeToken("ETH", "Ξ", 18, 1, "", "", "ethereum"),
        makeToken("BTC", "₿", 8, std::nullopt, "", "", "bitcoin"),
        makeToken("USDC", "USDC", 6, 1, "0xa0b86991c6218b36c1d19d4a2e9eb0ce3606eb48", "ERC-20", "usd-coin"),
        makeToken("USDT", "₮", 6, 1, "0xdac17f958d2ee523a2206206994597c13d831ec7", "ERC-20", "tether"),
    };
    return tokens;
}

} // namespace Monex
