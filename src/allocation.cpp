#include "allocation.h"
#include "logger.h"
#include <algorithm>
#include <numeric>

namespace Monex {

Result<std::vector<BigInt>> allocate(const BigInt& amount, const std::vector<Ratio>& weights) {
    if (weights.empty()) {
        return Error::emptyWeights();
    }

    // Bring every weight onto the least common denominator so they become integers
    BigInt commonDenominator(1);
    for (size_t i = 0; i < weights.size(); ++i) {
        if (weights[i].isNegative()) {
            return Error::invalidArgument("Allocation weight " + std::to_string(i) +
                                          " is negative: " + weights[i].toString());
        }
        const BigInt& den = weights[i].denominator();
        commonDenominator = commonDenominator / BigInt::gcd(commonDenominator, den) * den;
    }

    std::vector<BigInt> normalized;
    normalized.reserve(weights.size());
    BigInt total;
    for (const Ratio& weight : weights) {
        normalized.push_back(weight.numerator() * (commonDenominator / weight.denominator()));
        total += normalized.back();
    }

    if (total.isZero()) {
        return Error::zeroTotalWeight();
    }

    std::vector<BigInt> shares(weights.size());
    std::vector<BigInt> remainders(weights.size());
    BigInt allocated;
    for (size_t i = 0; i < normalized.size(); ++i) {
        BigInt::divMod(amount * normalized[i], total, shares[i], remainders[i]);
        // Floor rather than truncate, so remainders are never negative
        if (remainders[i].isNegative()) {
            shares[i] -= BigInt(1);
            remainders[i] += total;
        }
        allocated += shares[i];
    }

    // 0 <= leftover < weights.size()
    const uint64_t leftover = (amount - allocated).toUnsigned();

    std::vector<size_t> order(weights.size());
    std::iota(order.begin(), order.end(), 0);
    std::stable_sort(order.begin(), order.end(), [&remainders](size_t a, size_t b) {
        return remainders[a] > remainders[b];
    });

    for (uint64_t k = 0; k < leftover; ++k) {
        shares[order[k]] += BigInt(1);
    }

    LOG_DEBUG(Logger::core(), "allocate: {} across {} weights (total {}), {} leftover unit(s)",
              amount.toString(), weights.size(), total.toString(), leftover);
    return shares;
}

Result<std::vector<BigInt>> allocate(const BigInt& amount, const std::vector<std::string>& weights) {
    std::vector<Ratio> ratios;
    ratios.reserve(weights.size());
    for (const std::string& weight : weights) {
        Result<Ratio> ratio = Ratio::fromLiteral(weight);
        if (!ratio) {
            return ratio.error();
        }
        ratios.push_back(ratio.value());
    }
    return allocate(amount, ratios);
}

Result<std::vector<BigInt>> allocate(const BigInt& amount, const std::vector<long long>& weights) {
    std::vector<Ratio> ratios;
    ratios.reserve(weights.size());
    for (long long weight : weights) {
        ratios.push_back(Ratio::fromInteger(weight));
    }
    return allocate(amount, ratios);
}

Result<std::vector<BigInt>> split(const BigInt& amount, size_t parts) {
    if (parts == 0) {
        return Error::emptyWeights();
    }
    return allocate(amount, std::vector<long long>(parts, 1));
}

} // namespace Monex
