// =============================================================================
// units.cpp - Decimal string <-> atomic unit conversion
// =============================================================================

#include "coral/units.hpp"
#include "coral/math.hpp"

#include <algorithm>

namespace coral {

std::string to_string(U128 v) {
    if (v == 0) return "0";
    std::string out;
    while (v != 0) {
        out.push_back(static_cast<char>('0' + static_cast<int>(v % 10)));
        v /= 10;
    }
    std::reverse(out.begin(), out.end());
    return out;
}

std::string to_string(I128 v) {
    if (v >= 0) return to_string(static_cast<U128>(v));
    // Negate in unsigned space so I128 minimum does not overflow
    return "-" + to_string(U128(0) - static_cast<U128>(v));
}

I128 to_atomic(std::string_view decimal, int decimals) {
    if (decimals < 0 || decimals > 38) {
        throw AmmError(errors::INVALID_ARGUMENT, "unsupported decimals");
    }
    if (decimal.empty()) {
        throw AmmError(errors::INVALID_ARGUMENT, "empty amount");
    }

    auto dot = decimal.find('.');
    std::string_view whole = decimal.substr(0, dot);
    std::string_view frac = dot == std::string_view::npos
        ? std::string_view{} : decimal.substr(dot + 1);

    if (whole.empty() && frac.empty()) {
        throw AmmError(errors::INVALID_ARGUMENT,
                       "malformed amount: " + std::string(decimal));
    }
    if (frac.size() > static_cast<size_t>(decimals)) {
        throw AmmError(errors::INVALID_ARGUMENT,
                       "too many fractional digits: " + std::string(decimal));
    }

    I128 value = 0;
    auto accumulate = [&](std::string_view digits) {
        for (char c : digits) {
            if (c < '0' || c > '9') {
                throw AmmError(errors::INVALID_ARGUMENT,
                               "malformed amount: " + std::string(decimal));
            }
            value = fixed_point::checked_add(fixed_point::checked_mul(value, 10), c - '0');
        }
    };

    accumulate(whole);
    accumulate(frac);
    for (size_t i = frac.size(); i < static_cast<size_t>(decimals); ++i) {
        value = fixed_point::checked_mul(value, 10);
    }
    return value;
}

std::string from_atomic(I128 amount, int decimals) {
    if (decimals < 0 || decimals > 38) {
        throw AmmError(errors::INVALID_ARGUMENT, "unsupported decimals");
    }

    bool negative = amount < 0;
    std::string digits = to_string(negative ? U128(0) - static_cast<U128>(amount)
                                            : static_cast<U128>(amount));
    if (digits.size() <= static_cast<size_t>(decimals)) {
        digits.insert(0, static_cast<size_t>(decimals) - digits.size() + 1, '0');
    }

    std::string whole = digits.substr(0, digits.size() - decimals);
    std::string frac = digits.substr(digits.size() - decimals);
    while (!frac.empty() && frac.back() == '0') frac.pop_back();

    std::string out = negative ? "-" + whole : whole;
    if (!frac.empty()) out += "." + frac;
    return out;
}

} // namespace coral
