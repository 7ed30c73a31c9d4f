#ifndef CLMATH_AMOUNT_HPP
#define CLMATH_AMOUNT_HPP

#include "types.hpp"

namespace clmath {

// =============================================================================
// Amount Delta (token amounts from a liquidity change)
//
// Prices are Q64.64 square roots and may be passed in either order. Results
// are u64 token amounts; failures come back in AmountDeltaResult::error:
//   ARITHMETIC_OVERFLOW    - an intermediate exceeded 256 bits, or the lower
//                            price is zero
//   AMOUNT_EXCEEDS_MAX_U64 - the exact result does not fit in 64 bits
// =============================================================================

// Token A: liquidity * (upper - lower) * 2^64 / (lower * upper)
AmountDeltaResult try_get_amount_delta(U128 sqrt_price_1, U128 sqrt_price_2,
                                       U128 liquidity, bool round_up);

inline AmountDeltaResult try_get_amount_delta_a(U128 sqrt_price_1, U128 sqrt_price_2,
                                                U128 liquidity, bool round_up) {
    return try_get_amount_delta(sqrt_price_1, sqrt_price_2, liquidity, round_up);
}

// Token B: liquidity * (upper - lower) / 2^64
AmountDeltaResult try_get_amount_delta_b(U128 sqrt_price_1, U128 sqrt_price_2,
                                         U128 liquidity, bool round_up);

} // namespace clmath

#endif // CLMATH_AMOUNT_HPP
