#ifndef CLMATH_TYPES_HPP
#define CLMATH_TYPES_HPP

#include <cstdint>

#define CLMATH_VERSION_MAJOR 1
#define CLMATH_VERSION_MINOR 0
#define CLMATH_VERSION_PATCH 0

namespace clmath {

// "MAJOR.MINOR.PATCH"
const char* version();

// =============================================================================
// Fixed-Point Arithmetic (Q64.64)
// =============================================================================

using I128 = __int128;
using U128 = unsigned __int128;

// Square-root prices are Q64.64: 64 integer bits, 64 fractional bits
constexpr unsigned Q64_RESOLUTION = 64;
constexpr U128 Q64_ONE = U128(1) << Q64_RESOLUTION;  // sqrt(price) == 1.0

constexpr U128 U128_MAX = ~U128(0);

// Standard tick spacings
namespace tick_spacings {
constexpr uint16_t TICK_SPACING_001 = 1;
constexpr uint16_t TICK_SPACING_005 = 10;
constexpr uint16_t TICK_SPACING_030 = 60;
constexpr uint16_t TICK_SPACING_100 = 200;
}

// =============================================================================
// Error Codes
// =============================================================================

using ErrorCode = uint16_t;

namespace errors {
constexpr ErrorCode OK = 0;
constexpr ErrorCode ARITHMETIC_OVERFLOW = 9003;     // Intermediate exceeded 256 bits
constexpr ErrorCode AMOUNT_EXCEEDS_MAX_U64 = 9004;  // Result does not fit in u64
}

// Human readable name for an error code, "UNKNOWN_ERROR" for foreign codes
const char* error_message(ErrorCode code);

// =============================================================================
// Amount Delta Result
// =============================================================================

struct AmountDeltaResult {
    uint64_t amount;   // Valid only when error == errors::OK
    ErrorCode error;

    bool ok() const { return error == errors::OK; }

    static AmountDeltaResult success(uint64_t amount) { return {amount, errors::OK}; }
    static AmountDeltaResult failure(ErrorCode code) { return {0, code}; }
};

} // namespace clmath

#endif // CLMATH_TYPES_HPP
