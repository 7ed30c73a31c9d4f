/**
 * clmath_c.cpp - C Bindings Implementation
 */

#include "clmath_c.h"
#include "clmath/clmath.hpp"

/* =============================================================================
 * 128-bit Integer Conversion Helpers
 * ============================================================================= */

static inline clmath::U128 to_cpp_u128(clm_u128_t v) {
    return (static_cast<clmath::U128>(v.hi) << 64) | static_cast<clmath::U128>(v.lo);
}

static inline clmath::TickRounding to_cpp_rounding(uint8_t rounding) {
    switch (rounding) {
        case CLM_ROUND_DOWN: return clmath::TickRounding::Down;
        case CLM_ROUND_UP: return clmath::TickRounding::Up;
        default: return clmath::TickRounding::Nearest;
    }
}

static inline int32_t to_c_result(const clmath::AmountDeltaResult& result,
                                  uint64_t* out_amount) {
    if (!result.ok()) return static_cast<int32_t>(result.error);
    *out_amount = result.amount;
    return CLM_OK;
}

/* =============================================================================
 * Errors
 * ============================================================================= */

const char* clm_error_message(int32_t code) {
    if (code == CLM_ERR_NULL_POINTER) return "NULL_POINTER";
    if (code < 0 || code > UINT16_MAX) return "UNKNOWN_ERROR";
    return clmath::error_message(static_cast<clmath::ErrorCode>(code));
}

/* =============================================================================
 * Tick Grid
 * ============================================================================= */

int32_t clm_get_initializable_tick_index(int32_t tick_index, uint16_t tick_spacing,
                                         uint8_t rounding) {
    return clmath::get_initializable_tick_index(tick_index, tick_spacing,
                                                to_cpp_rounding(rounding));
}

bool clm_is_tick_initializable(int32_t tick_index, uint16_t tick_spacing) {
    return clmath::is_tick_initializable(tick_index, tick_spacing);
}

bool clm_is_tick_index_in_bounds(int32_t tick_index) {
    return clmath::is_tick_index_in_bounds(tick_index);
}

int32_t clm_get_prev_initializable_tick_index(int32_t tick_index, uint16_t tick_spacing) {
    return clmath::get_prev_initializable_tick_index(tick_index, tick_spacing);
}

int32_t clm_get_next_initializable_tick_index(int32_t tick_index, uint16_t tick_spacing) {
    return clmath::get_next_initializable_tick_index(tick_index, tick_spacing);
}

/* =============================================================================
 * Amount Deltas
 * ============================================================================= */

int32_t clm_try_get_amount_delta(clm_u128_t sqrt_price_1, clm_u128_t sqrt_price_2,
                                 clm_u128_t liquidity, bool round_up,
                                 uint64_t* out_amount) {
    if (!out_amount) return CLM_ERR_NULL_POINTER;
    auto result = clmath::try_get_amount_delta(to_cpp_u128(sqrt_price_1),
                                               to_cpp_u128(sqrt_price_2),
                                               to_cpp_u128(liquidity), round_up);
    return to_c_result(result, out_amount);
}

int32_t clm_try_get_amount_delta_b(clm_u128_t sqrt_price_1, clm_u128_t sqrt_price_2,
                                   clm_u128_t liquidity, bool round_up,
                                   uint64_t* out_amount) {
    if (!out_amount) return CLM_ERR_NULL_POINTER;
    auto result = clmath::try_get_amount_delta_b(to_cpp_u128(sqrt_price_1),
                                                 to_cpp_u128(sqrt_price_2),
                                                 to_cpp_u128(liquidity), round_up);
    return to_c_result(result, out_amount);
}

/* =============================================================================
 * Version
 * ============================================================================= */

const char* clm_version(void) {
    return clmath::version();
}
