// =============================================================================
// amount.cpp - Token amount deltas between two Q64.64 sqrt prices
// 256-bit intermediates with explicit overflow reporting
// =============================================================================

#include "clmath/amount.hpp"
#include "clmath/u256.hpp"

#include <utility>

namespace clmath {

namespace {

inline std::pair<U128, U128> order_prices(U128 a, U128 b) {
    return a < b ? std::make_pair(a, b) : std::make_pair(b, a);
}

inline AmountDeltaResult narrow_amount(const U256& value) {
    auto amount = u256::try_to_u64(value);
    if (!amount) return AmountDeltaResult::failure(errors::AMOUNT_EXCEEDS_MAX_U64);
    return AmountDeltaResult::success(*amount);
}

} // anonymous namespace

// =============================================================================
// Token A
// =============================================================================

AmountDeltaResult try_get_amount_delta(U128 sqrt_price_1, U128 sqrt_price_2,
                                       U128 liquidity, bool round_up) {
    auto [sqrt_price_lower, sqrt_price_upper] = order_prices(sqrt_price_1, sqrt_price_2);
    U128 sqrt_price_diff = sqrt_price_upper - sqrt_price_lower;

    auto product = u256::checked_mul(U256(liquidity), U256(sqrt_price_diff));
    if (!product) return AmountDeltaResult::failure(errors::ARITHMETIC_OVERFLOW);

    auto numerator = u256::checked_shl(*product, Q64_RESOLUTION);
    if (!numerator) return AmountDeltaResult::failure(errors::ARITHMETIC_OVERFLOW);

    auto denominator = u256::checked_mul(U256(sqrt_price_lower), U256(sqrt_price_upper));
    if (!denominator) return AmountDeltaResult::failure(errors::ARITHMETIC_OVERFLOW);

    // Zero lower price: the amount is unbounded
    auto division = u256::checked_divmod(*numerator, *denominator);
    if (!division) return AmountDeltaResult::failure(errors::ARITHMETIC_OVERFLOW);

    U256 result = division->quotient;
    if (round_up && !division->remainder.is_zero()) {
        auto rounded = u256::checked_add(result, U256(1));
        if (!rounded) return AmountDeltaResult::failure(errors::ARITHMETIC_OVERFLOW);
        result = *rounded;
    }

    return narrow_amount(result);
}

// =============================================================================
// Token B
// =============================================================================

AmountDeltaResult try_get_amount_delta_b(U128 sqrt_price_1, U128 sqrt_price_2,
                                         U128 liquidity, bool round_up) {
    auto [sqrt_price_lower, sqrt_price_upper] = order_prices(sqrt_price_1, sqrt_price_2);
    U128 sqrt_price_diff = sqrt_price_upper - sqrt_price_lower;

    // 128x128 always fits in 256 bits
    U256 product = u256::mul(liquidity, sqrt_price_diff);
    U256 result = u256::shr(product, Q64_RESOLUTION);

    constexpr U128 FRACTION_MASK = Q64_ONE - 1;
    if (round_up && (product.lo & FRACTION_MASK) != 0) {
        auto rounded = u256::checked_add(result, U256(1));
        if (!rounded) return AmountDeltaResult::failure(errors::ARITHMETIC_OVERFLOW);
        result = *rounded;
    }

    return narrow_amount(result);
}

} // namespace clmath
