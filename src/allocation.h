#ifndef MONEX_ALLOCATION_H
#define MONEX_ALLOCATION_H

#include <string>
#include <vector>
#include "bigint.h"
#include "errors.h"
#include "ratio.h"

namespace Monex {

/**
 * @brief Split amount by weights using the largest remainder method
 *
 * Every part is floor(amount * w / total); the units left over go, one each,
 * to the parts with the largest remainders (ties to the lower index).
 * The parts always sum to amount and are returned in the order of weights.
 *
 * @return EmptyWeights for no weights, ZeroTotalWeight when they sum to zero,
 *         InvalidArgument for a negative weight
 */
Result<std::vector<BigInt>> allocate(const BigInt& amount, const std::vector<Ratio>& weights);

/**
 * @brief allocate() with decimal-literal weights ("1", "0.5", "2.25")
 */
Result<std::vector<BigInt>> allocate(const BigInt& amount, const std::vector<std::string>& weights);

/**
 * @brief allocate() with integer weights
 */
Result<std::vector<BigInt>> allocate(const BigInt& amount, const std::vector<long long>& weights);

/**
 * @brief amount split into `parts` near-equal shares
 */
Result<std::vector<BigInt>> split(const BigInt& amount, size_t parts);

} // namespace Monex

#endif // MONEX_ALLOCATION_H
