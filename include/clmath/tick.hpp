#ifndef CLMATH_TICK_HPP
#define CLMATH_TICK_HPP

#include <cstdint>

#include "types.hpp"

namespace clmath {

// =============================================================================
// Tick Bounds
// =============================================================================

// Ticks whose sqrt prices stay inside the Q64.64 range (2^-64 .. 2^64)
constexpr int32_t MIN_TICK_INDEX = -443636;
constexpr int32_t MAX_TICK_INDEX = 443636;

bool is_tick_index_in_bounds(int32_t tick_index);

// =============================================================================
// Tick Grid Resolution
// =============================================================================

enum class TickRounding : uint8_t {
    Down = 0,     // Keep the truncated grid point
    Up = 1,       // Next grid point when the remainder is positive
    Nearest = 2   // Round half up on the truncated remainder
};

// Snap a tick onto the tick-spacing grid.
//
// Division truncates toward zero, so for negative ticks the remainder is
// zero or negative and both Down and Up resolve toward zero. Nearest rounds
// up once the remainder reaches tick_spacing / 2 (integer division), which
// sends midpoints of odd spacings upward. An already aligned tick is
// returned unchanged in every mode.
//
// tick_spacing must be non-zero.
int32_t get_initializable_tick_index(int32_t tick_index, uint16_t tick_spacing,
                                     TickRounding rounding = TickRounding::Nearest);

// True when tick_index is a multiple of tick_spacing
bool is_tick_initializable(int32_t tick_index, uint16_t tick_spacing);

// Largest initializable tick strictly below tick_index
int32_t get_prev_initializable_tick_index(int32_t tick_index, uint16_t tick_spacing);

// Smallest initializable tick strictly above tick_index
int32_t get_next_initializable_tick_index(int32_t tick_index, uint16_t tick_spacing);

} // namespace clmath

#endif // CLMATH_TICK_HPP
