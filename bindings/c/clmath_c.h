/**
 * clmath_c.h - C Bindings for Concentrated Liquidity Math
 *
 * Pure functions; safe to call from any thread.
 */

#ifndef CLMATH_C_H
#define CLMATH_C_H

#include <stdint.h>
#include <stdbool.h>

#ifdef __cplusplus
extern "C" {
#endif

/* =============================================================================
 * 128-bit Integer Representation (hi/lo pairs for C compatibility)
 * ============================================================================= */

typedef struct {
    uint64_t hi;   /* High 64 bits */
    uint64_t lo;   /* Low 64 bits */
} clm_u128_t;

static inline clm_u128_t clm_u128_from_u64(uint64_t v) {
    clm_u128_t r;
    r.hi = 0;
    r.lo = v;
    return r;
}

/* Q64.64 one (sqrt price of 1.0) */
#define CLM_Q64_ONE_HI 1
#define CLM_Q64_ONE_LO 0

/* =============================================================================
 * Error Codes
 * ============================================================================= */

#define CLM_OK                          0
#define CLM_ERR_NULL_POINTER           -1
#define CLM_ERR_ARITHMETIC_OVERFLOW     9003
#define CLM_ERR_AMOUNT_EXCEEDS_MAX_U64  9004

const char* clm_error_message(int32_t code);

/* =============================================================================
 * Tick Grid
 * ============================================================================= */

#define CLM_MIN_TICK_INDEX  (-443636)
#define CLM_MAX_TICK_INDEX  443636

/* Rounding modes; any other value rounds to nearest */
#define CLM_ROUND_DOWN     0
#define CLM_ROUND_UP       1
#define CLM_ROUND_NEAREST  2

/* tick_spacing must be non-zero */
int32_t clm_get_initializable_tick_index(int32_t tick_index, uint16_t tick_spacing,
                                         uint8_t rounding);
bool clm_is_tick_initializable(int32_t tick_index, uint16_t tick_spacing);
bool clm_is_tick_index_in_bounds(int32_t tick_index);
int32_t clm_get_prev_initializable_tick_index(int32_t tick_index, uint16_t tick_spacing);
int32_t clm_get_next_initializable_tick_index(int32_t tick_index, uint16_t tick_spacing);

/* =============================================================================
 * Amount Deltas
 *
 * Returns CLM_OK and writes *out_amount, or an error code and leaves
 * *out_amount untouched.
 * ============================================================================= */

int32_t clm_try_get_amount_delta(clm_u128_t sqrt_price_1, clm_u128_t sqrt_price_2,
                                 clm_u128_t liquidity, bool round_up,
                                 uint64_t* out_amount);

int32_t clm_try_get_amount_delta_b(clm_u128_t sqrt_price_1, clm_u128_t sqrt_price_2,
                                   clm_u128_t liquidity, bool round_up,
                                   uint64_t* out_amount);

/* =============================================================================
 * Version
 * ============================================================================= */

const char* clm_version(void);

#ifdef __cplusplus
}
#endif

#endif /* CLMATH_C_H */
