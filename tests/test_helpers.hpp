// clmath tests - shared helpers

#pragma once

#include <catch2/catch_tostring.hpp>
#include <clmath/u256.hpp>

#include <algorithm>
#include <stdexcept>
#include <string>
#include <string_view>

namespace clmath::test {

inline U128 parse_u128(std::string_view text) {
    if (text.empty()) throw std::invalid_argument("empty u128 literal");
    U128 value = 0;
    for (char c : text) {
        if (c < '0' || c > '9') {
            throw std::invalid_argument("bad u128 literal: " + std::string(text));
        }
        U128 digit = static_cast<U128>(c - '0');
        if (value > (U128_MAX - digit) / 10) {
            throw std::out_of_range("u128 literal overflows: " + std::string(text));
        }
        value = value * 10 + digit;
    }
    return value;
}

inline std::string to_decimal(U256 value) {
    if (value.is_zero()) return "0";
    std::string digits;
    while (!value.is_zero()) {
        auto step = u256::checked_divmod(value, U256(10));
        digits.push_back(static_cast<char>('0' + static_cast<int>(step->remainder.lo)));
        value = step->quotient;
    }
    std::reverse(digits.begin(), digits.end());
    return digits;
}

} // namespace clmath::test

namespace Catch {

template <>
struct StringMaker<clmath::U256> {
    static std::string convert(const clmath::U256& value) {
        return clmath::test::to_decimal(value);
    }
};

} // namespace Catch
