// clmath - Amount Delta Tests

#include <catch2/catch_test_macros.hpp>
#include <catch2/generators/catch_generators.hpp>
#include <clmath/amount.hpp>

#include <string>
#include <tuple>

using namespace clmath;

namespace {

const U128 Q = Q64_ONE;

bool same(const AmountDeltaResult& a, const AmountDeltaResult& b) {
    return a.error == b.error && (!a.ok() || a.amount == b.amount);
}

} // namespace

TEST_CASE("Token A delta", "[amount]") {
    SECTION("Exact division") {
        // 1e9 * (2 - 1) / (1 * 2)
        auto r = try_get_amount_delta(Q, 2 * Q, 1000000000, false);
        REQUIRE(r.ok());
        REQUIRE(r.amount == 500000000);
        REQUIRE(try_get_amount_delta(Q, 2 * Q, 1000000000, true).amount == 500000000);
    }

    SECTION("Inexact division rounds by request") {
        // 1000 * 2 / 3
        REQUIRE(try_get_amount_delta(Q, 3 * Q, 1000, false).amount == 666);
        REQUIRE(try_get_amount_delta(Q, 3 * Q, 1000, true).amount == 667);
        REQUIRE(try_get_amount_delta(Q, 4 * Q, 7, false).amount == 5);
        REQUIRE(try_get_amount_delta(Q, 4 * Q, 7, true).amount == 6);
    }

    SECTION("Equal prices give zero") {
        auto r = try_get_amount_delta(5 * Q, 5 * Q, 12345, true);
        REQUIRE(r.ok());
        REQUIRE(r.amount == 0);
    }

    SECTION("Zero liquidity gives zero") {
        auto r = try_get_amount_delta(Q, 2 * Q, 0, true);
        REQUIRE(r.ok());
        REQUIRE(r.amount == 0);
    }

    SECTION("One basis point range") {
        const U128 upper = 18447666387855959850ULL;
        REQUIRE(try_get_amount_delta(Q, upper, 1000000000000ULL, false).amount == 49996250);
        REQUIRE(try_get_amount_delta(Q, upper, 1000000000000ULL, true).amount == 49996251);
    }
}

TEST_CASE("Token A delta with wide intermediates", "[amount]") {
    SECTION("Product past 128 bits still resolves") {
        // liquidity * diff = 2^144, too wide for native u128
        auto r = try_get_amount_delta(U128(1) << 74, U128(1) << 75, U128(1) << 70, false);
        REQUIRE(r.ok());
        REQUIRE(r.amount == (uint64_t(1) << 59));
    }

    SECTION("Max liquidity with a shift that still fits") {
        auto r = try_get_amount_delta(Q, 2 * Q, U128_MAX, false);
        REQUIRE(r.error == errors::AMOUNT_EXCEEDS_MAX_U64);
    }

    SECTION("Max liquidity with a shift past 256 bits") {
        auto r = try_get_amount_delta(Q, 2 * Q + 1, U128_MAX, false);
        REQUIRE(r.error == errors::ARITHMETIC_OVERFLOW);
    }

    SECTION("Extreme price spread") {
        auto r = try_get_amount_delta(1, U128_MAX, U128_MAX, true);
        REQUIRE_FALSE(r.ok());
        REQUIRE(r.error == errors::ARITHMETIC_OVERFLOW);
    }

    SECTION("Single unit range at max liquidity") {
        auto r = try_get_amount_delta(Q, Q + 1, U128_MAX, true);
        REQUIRE(r.ok());
        REQUIRE(r.amount == UINT64_MAX);
    }
}

TEST_CASE("Token A delta at the u64 boundary", "[amount]") {
    SECTION("Exactly u64 max") {
        auto r = try_get_amount_delta(Q, 2 * Q, (U128(1) << 65) - 2, true);
        REQUIRE(r.ok());
        REQUIRE(r.amount == UINT64_MAX);
    }

    SECTION("Rounding up crosses u64 max") {
        const U128 liquidity = (U128(1) << 65) - 1;
        auto down = try_get_amount_delta(Q, 2 * Q, liquidity, false);
        REQUIRE(down.ok());
        REQUIRE(down.amount == UINT64_MAX);

        auto up = try_get_amount_delta(Q, 2 * Q, liquidity, true);
        REQUIRE(up.error == errors::AMOUNT_EXCEEDS_MAX_U64);
    }

    SECTION("Result of 2^64") {
        auto r = try_get_amount_delta(Q, 2 * Q, U128(1) << 65, false);
        REQUIRE(r.error == errors::AMOUNT_EXCEEDS_MAX_U64);
        REQUIRE(r.amount == 0);
    }
}

TEST_CASE("Token A delta with a zero price", "[amount]") {
    auto r = try_get_amount_delta(0, Q, 5, false);
    REQUIRE(r.error == errors::ARITHMETIC_OVERFLOW);

    auto both = try_get_amount_delta(0, 0, 5, true);
    REQUIRE(both.error == errors::ARITHMETIC_OVERFLOW);
}

TEST_CASE("Token A delta properties", "[amount]") {
    auto [a, b, liquidity] = GENERATE(table<U128, U128, U128>({
        {Q, 2 * Q, 1000000000},
        {Q, 3 * Q, 1000},
        {U128(1) << 40, U128(1) << 100, U128(1) << 20},
        {Q, Q + 1, U128_MAX},
        {7 * Q / 3, 11 * Q / 5, 123456789},
        {Q, 2 * Q, U128_MAX},
        {1, U128_MAX, U128_MAX},
    }));

    SECTION("Order independent") {
        REQUIRE(same(try_get_amount_delta(a, b, liquidity, false),
                     try_get_amount_delta(b, a, liquidity, false)));
        REQUIRE(same(try_get_amount_delta(a, b, liquidity, true),
                     try_get_amount_delta(b, a, liquidity, true)));
    }

    SECTION("Rounding up never loses to rounding down") {
        auto down = try_get_amount_delta(a, b, liquidity, false);
        auto up = try_get_amount_delta(a, b, liquidity, true);
        if (down.ok() && up.ok()) {
            REQUIRE(up.amount >= down.amount);
            REQUIRE(up.amount - down.amount <= 1);
        }
    }

    SECTION("Equal prices") {
        REQUIRE(try_get_amount_delta(a, a, liquidity, true).amount == 0);
        REQUIRE(try_get_amount_delta(b, b, liquidity, false).ok());
    }
}

TEST_CASE("Token A rounding equality tracks exactness", "[amount]") {
    // 1e9 / 2 is exact, 1000 * 2 / 3 is not
    auto exact_down = try_get_amount_delta(Q, 2 * Q, 1000000000, false);
    auto exact_up = try_get_amount_delta(Q, 2 * Q, 1000000000, true);
    REQUIRE(exact_down.amount == exact_up.amount);

    auto inexact_down = try_get_amount_delta(Q, 3 * Q, 1000, false);
    auto inexact_up = try_get_amount_delta(Q, 3 * Q, 1000, true);
    REQUIRE(inexact_up.amount == inexact_down.amount + 1);
}

TEST_CASE("Token B delta", "[amount]") {
    SECTION("Whole price units") {
        REQUIRE(try_get_amount_delta_b(Q, 3 * Q, 1000, false).amount == 2000);
        REQUIRE(try_get_amount_delta_b(4 * Q, Q, 7, true).amount == 21);
    }

    SECTION("Fractional product rounds by request") {
        const U128 upper = 18447666387855959850ULL;
        REQUIRE(try_get_amount_delta_b(Q, upper, 1000000000000ULL, false).amount == 49998750);
        REQUIRE(try_get_amount_delta_b(Q, upper, 1000000000000ULL, true).amount == 49998751);
    }

    SECTION("Wide price range") {
        auto down = try_get_amount_delta_b(U128(1) << 40, U128(1) << 100, U128(1) << 20, false);
        auto up = try_get_amount_delta_b(U128(1) << 40, U128(1) << 100, U128(1) << 20, true);
        REQUIRE(down.amount == 72057594037927935ULL);
        REQUIRE(up.amount == 72057594037927936ULL);
    }

    SECTION("Rounding up crosses u64 max") {
        auto down = try_get_amount_delta_b(Q, Q + 1, U128_MAX, false);
        REQUIRE(down.ok());
        REQUIRE(down.amount == UINT64_MAX);

        auto up = try_get_amount_delta_b(Q, Q + 1, U128_MAX, true);
        REQUIRE(up.error == errors::AMOUNT_EXCEEDS_MAX_U64);
    }

    SECTION("Zero lower price is well defined") {
        REQUIRE(try_get_amount_delta_b(0, Q, 5, false).amount == 5);
    }

    SECTION("Never reports arithmetic overflow") {
        auto r = try_get_amount_delta_b(1, U128_MAX, U128_MAX, true);
        REQUIRE(r.error == errors::AMOUNT_EXCEEDS_MAX_U64);
    }

    SECTION("Order independent and zero on equal prices") {
        REQUIRE(try_get_amount_delta_b(2 * Q, Q, 1000, false).amount ==
                try_get_amount_delta_b(Q, 2 * Q, 1000, false).amount);
        REQUIRE(try_get_amount_delta_b(Q, Q, U128_MAX, true).amount == 0);
    }
}

TEST_CASE("Token A alias", "[amount]") {
    REQUIRE(same(try_get_amount_delta_a(Q, 3 * Q, 1000, true),
                 try_get_amount_delta(Q, 3 * Q, 1000, true)));
}

TEST_CASE("Error names", "[amount]") {
    REQUIRE(std::string(error_message(errors::OK)) == "OK");
    REQUIRE(std::string(error_message(errors::ARITHMETIC_OVERFLOW)) == "ARITHMETIC_OVERFLOW");
    REQUIRE(std::string(error_message(errors::AMOUNT_EXCEEDS_MAX_U64)) == "AMOUNT_EXCEEDS_MAX_U64");
    REQUIRE(std::string(error_message(1)) == "UNKNOWN_ERROR");
}
