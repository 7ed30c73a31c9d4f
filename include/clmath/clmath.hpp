#ifndef CLMATH_CLMATH_HPP
#define CLMATH_CLMATH_HPP

// =============================================================================
// clmath - Concentrated Liquidity Fixed-Point Math
//
//   tick.hpp   : tick grid resolution and bounds
//   amount.hpp : token amount deltas between sqrt prices
//   u256.hpp   : checked 256-bit intermediate arithmetic
//
// =============================================================================

#include "types.hpp"
#include "u256.hpp"
#include "tick.hpp"
#include "amount.hpp"

#endif // CLMATH_CLMATH_HPP
