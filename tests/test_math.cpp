// Coral - Fixed-Point Math Tests

#include "test_helpers.hpp"

#include <coral/math.hpp>

using namespace coral;
using namespace coral::fixed_point;

TEST_CASE("mul_div rounding", "[math]") {
    SECTION("Floor and ceil differ on a remainder") {
        REQUIRE(mul_div(10, 20, 3) == 66);
        REQUIRE(mul_div_up(10, 20, 3) == 67);
    }

    SECTION("Exact division rounds neither way") {
        REQUIRE(mul_div(10, 30, 3) == 100);
        REQUIRE(mul_div_up(10, 30, 3) == 100);
    }

    SECTION("Zero numerator") {
        REQUIRE(mul_div(0, 12345, 7) == 0);
        REQUIRE(mul_div_up(0, 12345, 7) == 0);
    }
}

TEST_CASE("mul_div widens past 128 bits", "[math]") {
    I128 big = I128(1) << 100;

    SECTION("Product needs 200 bits, quotient fits") {
        REQUIRE(mul_div(big, big, I128(1) << 90) == (I128(1) << 110));
    }

    SECTION("Unsigned variant on the full range") {
        REQUIRE(mul_div_u(U128_MAX, U128_MAX, U128_MAX) == U128_MAX);
        REQUIRE(mul_div_u(U128_MAX, 2, 3) == (U128_MAX / 3) * 2);
        REQUIRE(mul_div_up_u(U128_MAX, 1, 2) == (U128(1) << 127));
    }

    SECTION("X18 scaling of large amounts") {
        I128 amount = MAX_RESERVE;
        REQUIRE(mul_div(amount, X18_ONE, X18_ONE) == amount);
    }
}

TEST_CASE("mul_div errors", "[math]") {
    SECTION("Division by zero") {
        REQUIRE_AMM_ERROR(mul_div(1, 1, 0), errors::DIVISION_BY_ZERO);
        REQUIRE_AMM_ERROR(mul_div_up_u(1, 1, 0), errors::DIVISION_BY_ZERO);
    }

    SECTION("Quotient beyond 128 bits") {
        REQUIRE_AMM_ERROR(mul_div_u(U128_MAX, U128_MAX, 1), errors::ARITHMETIC_OVERFLOW);
    }

    SECTION("Quotient beyond signed range") {
        REQUIRE_AMM_ERROR(mul_div(I128_MAX, 2, 1), errors::ARITHMETIC_OVERFLOW);
    }

    SECTION("Negative operand") {
        REQUIRE_THROWS_AS(mul_div(-1, 1, 1), std::invalid_argument);
    }
}

TEST_CASE("Checked arithmetic", "[math]") {
    SECTION("In range") {
        REQUIRE(checked_add(2, 3) == 5);
        REQUIRE(checked_sub(5, 3) == 2);
        REQUIRE(checked_mul(I128(1) << 60, I128(1) << 60) == (I128(1) << 120));
    }

    SECTION("Overflow") {
        REQUIRE_AMM_ERROR(checked_add(I128_MAX, 1), errors::ARITHMETIC_OVERFLOW);
        REQUIRE_AMM_ERROR(checked_mul(I128(1) << 64, I128(1) << 64),
                          errors::ARITHMETIC_OVERFLOW);
    }

    SECTION("Underflow below zero") {
        REQUIRE_AMM_ERROR(checked_sub(1, 2), errors::ARITHMETIC_OVERFLOW);
    }
}

TEST_CASE("Integer square root", "[math]") {
    SECTION("Perfect squares") {
        REQUIRE(sqrt(U256(0)) == 0);
        REQUIRE(sqrt(U256(1)) == 1);
        REQUIRE(sqrt(U256(144)) == 12);
    }

    SECTION("Floors non-squares") {
        REQUIRE(sqrt(U256(2)) == 1);
        REQUIRE(sqrt(U256(99)) == 9);
        REQUIRE(sqrt_product(2, 3) == 2);
    }

    SECTION("Geometric mean of a first deposit") {
        REQUIRE(sqrt_product(10000000, 40000000) == 20000000);
    }

    SECTION("Full reserve range") {
        REQUIRE(sqrt_product(MAX_RESERVE, MAX_RESERVE) == MAX_RESERVE);
        REQUIRE(sqrt(U256(0, 1)) == (U128(1) << 64));
    }
}

TEST_CASE("Wide product comparison", "[math]") {
    I128 r = MAX_RESERVE;

    REQUIRE(product_gte(r, r, r, r));
    REQUIRE(product_gte(r, r, r - 1, r));
    REQUIRE_FALSE(product_gte(r - 1, r, r, r));
    REQUIRE(product_gte(4, 9, 6, 6));
}
