// =============================================================================
// u256.cpp - Checked 256-bit unsigned arithmetic
// Two U128 limbs; every widening step reports overflow instead of wrapping
// =============================================================================

#include "clmath/u256.hpp"

namespace clmath {

namespace {

constexpr U128 MASK64 = (U128(1) << 64) - 1;

inline unsigned bit_length_u128(U128 v) {
    uint64_t high = static_cast<uint64_t>(v >> 64);
    if (high != 0) return 128 - static_cast<unsigned>(__builtin_clzll(high));
    uint64_t low = static_cast<uint64_t>(v);
    if (low != 0) return 64 - static_cast<unsigned>(__builtin_clzll(low));
    return 0;
}

// a - b, requires a >= b
inline U256 sub(const U256& a, const U256& b) {
    U256 r;
    r.lo = a.lo - b.lo;
    U128 borrow = a.lo < b.lo ? 1 : 0;
    r.hi = a.hi - b.hi - borrow;
    return r;
}

inline void set_bit(U256& v, unsigned bit) {
    if (bit >= 128) {
        v.hi |= U128(1) << (bit - 128);
    } else {
        v.lo |= U128(1) << bit;
    }
}

} // anonymous namespace

unsigned U256::bit_length() const {
    if (hi != 0) return 128 + bit_length_u128(hi);
    return bit_length_u128(lo);
}

namespace u256 {

U256 mul(U128 a, U128 b) {
    // Split into 64-bit halves so no partial product overflows
    U128 a_lo = a & MASK64;
    U128 a_hi = a >> 64;
    U128 b_lo = b & MASK64;
    U128 b_hi = b >> 64;

    U128 p0 = a_lo * b_lo;
    U128 p1 = a_lo * b_hi;
    U128 p2 = a_hi * b_lo;
    U128 p3 = a_hi * b_hi;

    // At most 3 * (2^64 - 1), fits in 128 bits
    U128 mid = (p0 >> 64) + (p1 & MASK64) + (p2 & MASK64);

    U256 result;
    result.lo = (p0 & MASK64) | (mid << 64);
    result.hi = p3 + (p1 >> 64) + (p2 >> 64) + (mid >> 64);
    return result;
}

std::optional<U256> checked_mul(const U256& a, const U256& b) {
    // Both high limbs set means the product is at least 2^256
    if (a.hi != 0 && b.hi != 0) return std::nullopt;

    U256 low = mul(a.lo, b.lo);
    U256 cross = a.hi != 0 ? mul(a.hi, b.lo) : mul(a.lo, b.hi);

    // cross is shifted left by 128, so its high limb must be empty
    if (cross.hi != 0) return std::nullopt;

    U128 hi = low.hi + cross.lo;
    if (hi < low.hi) return std::nullopt;

    return U256(low.lo, hi);
}

std::optional<U256> checked_add(const U256& a, const U256& b) {
    U128 lo = a.lo + b.lo;
    U128 carry = lo < a.lo ? 1 : 0;

    U128 hi = a.hi + b.hi;
    if (hi < a.hi) return std::nullopt;
    if (carry != 0 && hi == U128_MAX) return std::nullopt;

    return U256(lo, hi + carry);
}

std::optional<U256> checked_shl(const U256& a, unsigned shift) {
    if (a.is_zero() || shift == 0) return a;
    if (shift >= 256 || a.bit_length() + shift > 256) return std::nullopt;

    if (shift >= 128) {
        return U256(0, a.lo << (shift - 128));
    }
    return U256(a.lo << shift, (a.hi << shift) | (a.lo >> (128 - shift)));
}

U256 shr(const U256& a, unsigned shift) {
    if (shift == 0) return a;
    if (shift >= 256) return U256();

    if (shift >= 128) {
        return U256(a.hi >> (shift - 128), 0);
    }
    return U256((a.lo >> shift) | (a.hi << (128 - shift)), a.hi >> shift);
}

std::optional<U256DivMod> checked_divmod(const U256& num, const U256& denom) {
    if (denom.is_zero()) return std::nullopt;

    if (num < denom) return U256DivMod{U256(), num};

    if (num.hi == 0 && denom.hi == 0) {
        return U256DivMod{U256(num.lo / denom.lo), U256(num.lo % denom.lo)};
    }

    // Shift-subtract long division, at most 256 rounds
    unsigned shift = num.bit_length() - denom.bit_length();
    U256 divisor = *checked_shl(denom, shift);
    U256 rem = num;
    U256 quot;

    for (unsigned i = shift + 1; i-- > 0;) {
        if (rem >= divisor) {
            rem = sub(rem, divisor);
            set_bit(quot, i);
        }
        divisor = shr(divisor, 1);
    }

    return U256DivMod{quot, rem};
}

std::optional<uint64_t> try_to_u64(const U256& v) {
    if (v.hi != 0 || v.lo > MASK64) return std::nullopt;
    return static_cast<uint64_t>(v.lo);
}

std::optional<U128> try_to_u128(const U256& v) {
    if (v.hi != 0) return std::nullopt;
    return v.lo;
}

} // namespace u256

} // namespace clmath
