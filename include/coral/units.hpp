#ifndef CORAL_UNITS_HPP
#define CORAL_UNITS_HPP

#include <string>
#include <string_view>

#include "types.hpp"

namespace coral {

// =============================================================================
// Presentation Boundary
//
// Conversions between human-readable decimal strings and atomic integer units.
// Nothing here touches floating point; the core's decision path only ever
// sees the integer side.
// =============================================================================

// Default token precision (7 fractional digits)
constexpr int DEFAULT_DECIMALS = 7;

// Decimal rendering of a 128-bit integer
std::string to_string(I128 v);
std::string to_string(U128 v);

// "10.5" with 7 decimals -> 105000000.
// Throws AmmError{INVALID_ARGUMENT} on signs, stray characters, more
// fractional digits than `decimals`, or empty input; ARITHMETIC_OVERFLOW when
// the value does not fit.
I128 to_atomic(std::string_view decimal, int decimals = DEFAULT_DECIMALS);

// 105000000 with 7 decimals -> "10.5" (trailing zeros trimmed)
std::string from_atomic(I128 amount, int decimals = DEFAULT_DECIMALS);

// Parse a decimal fraction such as "0.2" into X18 (2e17)
inline I128 to_x18(std::string_view decimal) {
    return to_atomic(decimal, 18);
}

} // namespace coral

#endif // CORAL_UNITS_HPP
