// =============================================================================
// tick.cpp - Tick grid resolution for concentrated liquidity pools
// =============================================================================

#include "clmath/tick.hpp"

namespace clmath {

bool is_tick_index_in_bounds(int32_t tick_index) {
    return tick_index >= MIN_TICK_INDEX && tick_index <= MAX_TICK_INDEX;
}

int32_t get_initializable_tick_index(int32_t tick_index, uint16_t tick_spacing,
                                     TickRounding rounding) {
    const int32_t spacing = static_cast<int32_t>(tick_spacing);
    const int32_t remainder = tick_index % spacing;
    const int32_t base = tick_index / spacing * spacing;

    bool round_up = false;
    switch (rounding) {
        case TickRounding::Down:
            round_up = false;
            break;
        case TickRounding::Up:
            round_up = remainder > 0;
            break;
        case TickRounding::Nearest:
            // Aligned ticks stay put, including for a spacing of 1
            round_up = remainder != 0 && remainder >= spacing / 2;
            break;
    }

    return round_up ? base + spacing : base;
}

bool is_tick_initializable(int32_t tick_index, uint16_t tick_spacing) {
    return tick_index % static_cast<int32_t>(tick_spacing) == 0;
}

int32_t get_prev_initializable_tick_index(int32_t tick_index, uint16_t tick_spacing) {
    const int32_t spacing = static_cast<int32_t>(tick_spacing);
    const int32_t remainder = tick_index % spacing;

    if (remainder == 0) return tick_index - spacing;
    if (remainder > 0) return tick_index - remainder;
    return tick_index - remainder - spacing;
}

int32_t get_next_initializable_tick_index(int32_t tick_index, uint16_t tick_spacing) {
    const int32_t spacing = static_cast<int32_t>(tick_spacing);
    const int32_t remainder = tick_index % spacing;

    if (remainder == 0) return tick_index + spacing;
    if (remainder > 0) return tick_index - remainder + spacing;
    return tick_index - remainder;
}

} // namespace clmath
