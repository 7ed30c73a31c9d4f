#ifndef CLMATH_U256_HPP
#define CLMATH_U256_HPP

#include <optional>
#include <cstdint>

#include "types.hpp"

namespace clmath {

// =============================================================================
// 256-bit Unsigned Integer (two U128 limbs)
//
// Every operation that can exceed 256 bits has a checked_ variant returning
// std::nullopt instead of wrapping. Plain comparison and division cannot
// overflow and are provided directly.
// =============================================================================

struct U256 {
    U128 lo;  // Low 128 bits
    U128 hi;  // High 128 bits

    U256() : lo(0), hi(0) {}
    U256(U128 l) : lo(l), hi(0) {}
    U256(U128 l, U128 h) : lo(l), hi(h) {}

    bool operator==(const U256& other) const {
        return lo == other.lo && hi == other.hi;
    }
    bool operator!=(const U256& other) const { return !(*this == other); }
    bool operator<(const U256& other) const {
        return hi < other.hi || (hi == other.hi && lo < other.lo);
    }
    bool operator>(const U256& other) const { return other < *this; }
    bool operator<=(const U256& other) const { return !(other < *this); }
    bool operator>=(const U256& other) const { return !(*this < other); }

    bool is_zero() const { return lo == 0 && hi == 0; }

    // Number of significant bits (0 for zero)
    unsigned bit_length() const;
};

struct U256DivMod {
    U256 quotient;
    U256 remainder;
};

namespace u256 {

// Full 128x128 product, always representable in 256 bits
U256 mul(U128 a, U128 b);

std::optional<U256> checked_mul(const U256& a, const U256& b);
std::optional<U256> checked_add(const U256& a, const U256& b);
std::optional<U256> checked_shl(const U256& a, unsigned shift);

U256 shr(const U256& a, unsigned shift);

// Quotient and remainder; std::nullopt on a zero divisor
std::optional<U256DivMod> checked_divmod(const U256& num, const U256& denom);

// Narrowing conversions; std::nullopt when the value does not fit
std::optional<uint64_t> try_to_u64(const U256& v);
std::optional<U128> try_to_u128(const U256& v);

} // namespace u256

} // namespace clmath

#endif // CLMATH_U256_HPP
