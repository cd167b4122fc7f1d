#ifndef CORAL_MATH_HPP
#define CORAL_MATH_HPP

#include "types.hpp"

namespace coral {

// =============================================================================
// 256-bit Unsigned (two U128 limbs)
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
    bool operator<=(const U256& other) const { return !(other < *this); }
    bool operator>=(const U256& other) const { return !(*this < other); }
    bool is_zero() const { return lo == 0 && hi == 0; }
};

// =============================================================================
// Fixed-Point Primitives
//
// Every amount the pool pays out is floored and every amount owed to the pool
// is ceiled, so truncation dust stays with existing reserves. All formulas in
// the core route through these functions.
// =============================================================================

namespace fixed_point {

constexpr U128 U128_MAX = ~U128(0);
constexpr I128 I128_MAX = static_cast<I128>(U128_MAX >> 1);

// Full 128x128 -> 256-bit product
U256 mul_wide(U128 a, U128 b);

// floor(a * b / denom) over a 256-bit intermediate.
// Throws AmmError{DIVISION_BY_ZERO} when denom == 0 and
// AmmError{ARITHMETIC_OVERFLOW} when the quotient exceeds 128 bits.
U128 mul_div_u(U128 a, U128 b, U128 denom);

// ceil(a * b / denom)
U128 mul_div_up_u(U128 a, U128 b, U128 denom);

// Signed-width variants for amounts. Operands must be non-negative
// (std::invalid_argument otherwise); the result must fit I128.
I128 mul_div(I128 a, I128 b, I128 denom);
I128 mul_div_up(I128 a, I128 b, I128 denom);

// Overflow-checked arithmetic on amounts; checked_sub also rejects a
// negative result.
I128 checked_add(I128 a, I128 b);
I128 checked_sub(I128 a, I128 b);
I128 checked_mul(I128 a, I128 b);

// floor(sqrt(n)) of a 256-bit value
U128 sqrt(const U256& n);

// floor(sqrt(a * b)) without intermediate overflow
I128 sqrt_product(I128 a, I128 b);

// a0 * a1 >= b0 * b1, compared at full width
bool product_gte(I128 a0, I128 a1, I128 b0, I128 b1);

} // namespace fixed_point

} // namespace coral

#endif // CORAL_MATH_HPP
