// =============================================================================
// flash.cpp - Flash loan fee policy
// =============================================================================

#include "coral/flash.hpp"
#include "coral/math.hpp"

#include <algorithm>

namespace coral {

I128 FlashLoanConfig::fee_for(I128 amount) const {
    I128 proportional = fixed_point::mul_div_up(amount, fee_bps, BPS_DENOMINATOR);
    return std::max(proportional, fee_floor);
}

void FlashLoanConfig::check_borrow() const {
    if (locked) {
        throw AmmError(errors::FLASH_LOANS_DISABLED, "flash loans are locked for this pair");
    }
}

void FlashLoanConfig::validate() const {
    if (fee_bps >= BPS_DENOMINATOR) {
        throw AmmError(errors::INVALID_CONFIG, "flash fee must be below 10000 bps");
    }
    if (fee_floor < 0) {
        throw AmmError(errors::INVALID_CONFIG, "flash fee floor must be non-negative");
    }
}

} // namespace coral
