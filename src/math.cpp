// =============================================================================
// math.cpp - Overflow-checked fixed-point primitives
// =============================================================================

#include "coral/math.hpp"
#include "coral/units.hpp"

namespace coral {
namespace fixed_point {

namespace {

void require_non_negative(I128 a, I128 b, I128 denom) {
    if (a < 0 || b < 0 || denom < 0) {
        throw std::invalid_argument("mul_div: negative operand");
    }
}

// Divide num by denom. Caller guarantees num.hi < denom so the quotient fits.
U128 div_u256_u128(const U256& num, U128 denom, U128& rem) {
    if (num.hi == 0) {
        rem = num.lo % denom;
        return num.lo / denom;
    }

    // Shift-subtract long division over the low limb. The remainder starts as
    // the high limb (already < denom); a bit shifted out of the top means the
    // true remainder is >= 2^128 > denom.
    U128 r = num.hi;
    U128 quot = 0;
    for (int i = 127; i >= 0; --i) {
        bool carry = (r >> 127) != 0;
        r = (r << 1) | ((num.lo >> i) & 1);
        quot <<= 1;
        if (carry || r >= denom) {
            r -= denom;
            quot |= 1;
        }
    }
    rem = r;
    return quot;
}

U128 mul_div_impl(U128 a, U128 b, U128 denom, bool round_up) {
    if (denom == 0) {
        throw AmmError(errors::DIVISION_BY_ZERO, "mul_div denominator is zero");
    }

    U256 product = mul_wide(a, b);
    if (product.hi >= denom) {
        throw AmmError(errors::ARITHMETIC_OVERFLOW,
                       "mul_div quotient exceeds 128 bits");
    }

    U128 rem = 0;
    U128 quot = div_u256_u128(product, denom, rem);
    if (round_up && rem != 0) {
        if (quot == U128_MAX) {
            throw AmmError(errors::ARITHMETIC_OVERFLOW,
                           "mul_div_up quotient exceeds 128 bits");
        }
        ++quot;
    }
    return quot;
}

I128 narrow(U128 v) {
    if (v > static_cast<U128>(I128_MAX)) {
        throw AmmError(errors::ARITHMETIC_OVERFLOW, "result exceeds signed 128 bits");
    }
    return static_cast<I128>(v);
}

} // anonymous namespace

// =============================================================================
// Wide Multiplication
// =============================================================================

U256 mul_wide(U128 a, U128 b) {
    // Split into 64-bit halves to avoid overflow
    constexpr U128 MASK64 = (U128(1) << 64) - 1;
    U128 a_lo = a & MASK64;
    U128 a_hi = a >> 64;
    U128 b_lo = b & MASK64;
    U128 b_hi = b >> 64;

    // Cross products
    U128 p0 = a_lo * b_lo;
    U128 p1 = a_lo * b_hi;
    U128 p2 = a_hi * b_lo;
    U128 p3 = a_hi * b_hi;

    // Accumulate with carry
    U128 mid = (p0 >> 64) + (p1 & MASK64) + (p2 & MASK64);
    U128 carry = mid >> 64;

    U256 result;
    result.lo = (p0 & MASK64) | (mid << 64);
    result.hi = p3 + (p1 >> 64) + (p2 >> 64) + carry;
    return result;
}

// =============================================================================
// mul_div
// =============================================================================

U128 mul_div_u(U128 a, U128 b, U128 denom) {
    return mul_div_impl(a, b, denom, false);
}

U128 mul_div_up_u(U128 a, U128 b, U128 denom) {
    return mul_div_impl(a, b, denom, true);
}

I128 mul_div(I128 a, I128 b, I128 denom) {
    require_non_negative(a, b, denom);
    return narrow(mul_div_impl(static_cast<U128>(a), static_cast<U128>(b),
                               static_cast<U128>(denom), false));
}

I128 mul_div_up(I128 a, I128 b, I128 denom) {
    require_non_negative(a, b, denom);
    return narrow(mul_div_impl(static_cast<U128>(a), static_cast<U128>(b),
                               static_cast<U128>(denom), true));
}

// =============================================================================
// Checked Arithmetic
// =============================================================================

I128 checked_add(I128 a, I128 b) {
    I128 r;
    if (__builtin_add_overflow(a, b, &r)) {
        throw AmmError(errors::ARITHMETIC_OVERFLOW,
                       "add overflow: " + to_string(a) + " + " + to_string(b));
    }
    return r;
}

I128 checked_sub(I128 a, I128 b) {
    I128 r;
    if (__builtin_sub_overflow(a, b, &r) || r < 0) {
        throw AmmError(errors::ARITHMETIC_OVERFLOW,
                       "sub underflow: " + to_string(a) + " - " + to_string(b));
    }
    return r;
}

I128 checked_mul(I128 a, I128 b) {
    I128 r;
    if (__builtin_mul_overflow(a, b, &r)) {
        throw AmmError(errors::ARITHMETIC_OVERFLOW,
                       "mul overflow: " + to_string(a) + " * " + to_string(b));
    }
    return r;
}

// =============================================================================
// Square Root
// =============================================================================

U128 sqrt(const U256& n) {
    // Bitwise: the root of a 256-bit value has at most 128 bits
    U128 root = 0;
    for (int bit = 127; bit >= 0; --bit) {
        U128 candidate = root | (U128(1) << bit);
        if (mul_wide(candidate, candidate) <= n) {
            root = candidate;
        }
    }
    return root;
}

I128 sqrt_product(I128 a, I128 b) {
    if (a < 0 || b < 0) {
        throw std::invalid_argument("sqrt_product: negative operand");
    }
    return narrow(sqrt(mul_wide(static_cast<U128>(a), static_cast<U128>(b))));
}

bool product_gte(I128 a0, I128 a1, I128 b0, I128 b1) {
    if (a0 < 0 || a1 < 0 || b0 < 0 || b1 < 0) {
        throw std::invalid_argument("product_gte: negative operand");
    }
    return mul_wide(static_cast<U128>(a0), static_cast<U128>(a1)) >=
           mul_wide(static_cast<U128>(b0), static_cast<U128>(b1));
}

} // namespace fixed_point
} // namespace coral
