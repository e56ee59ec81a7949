#ifndef MONEX_TOKEN_H
#define MONEX_TOKEN_H

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "currency.h"
#include "errors.h"

namespace Monex {

enum class TokenKind {
    Fiat,
    Crypto,
    Commodity,
    Custom
};

std::string tokenKindName(TokenKind kind);

/**
 * @brief A custom currency (typically a crypto asset) plus its chain metadata
 */
struct TokenDefinition {
    Currency currency;
    TokenKind kind = TokenKind::Custom;
    std::optional<uint64_t> chainId;
    std::string contractAddress;
    std::string standard;     // "ERC-20", "BEP-20", ...
    std::string coingeckoId;
};

/**
 * @brief Validate a token, upper-case its code and register it
 * @return InvalidArgument for a missing code or symbol, or decimals outside 0..18
 */
Result<TokenDefinition> defineToken(CurrencyRegistry& registry, const TokenDefinition& definition);

/**
 * @brief ETH (18 decimals), BTC (8), USDC (6) and USDT (6)
 */
const std::vector<TokenDefinition>& predefinedTokens();

} // namespace Monex

#endif // MONEX_TOKEN_H
