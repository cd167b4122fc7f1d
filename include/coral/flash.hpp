#ifndef CORAL_FLASH_HPP
#define CORAL_FLASH_HPP

#include <functional>

#include "types.hpp"

namespace coral {

// =============================================================================
// Flash Loan Policy
// =============================================================================

struct FlashLoanConfig {
    uint32_t fee_bps = 9;     // Charged on the borrowed amount
    I128 fee_floor = 1;       // Minimum fee in atomic units
    bool locked = false;      // Disables new flash borrows

    // max(ceil(amount * fee_bps / 10000), fee_floor)
    I128 fee_for(I128 amount) const;

    // Throws AmmError{FLASH_LOANS_DISABLED} while locked
    void check_borrow() const;

    // Throws AmmError{INVALID_CONFIG} for fee_bps >= 10000 or a negative floor
    void validate() const;
};

// Borrow handed to the flash-loan callback
struct FlashLoan {
    PairId pair_id;
    Side side;
    TokenId token;
    I128 amount;
    I128 fee;

    I128 amount_owed() const { return amount + fee; }
};

// Runs between borrow and repay; returns the amount paid back. Must not
// re-enter the lending pair.
using FlashCallback = std::function<I128(const FlashLoan&)>;

struct FlashLoanResult {
    I128 amount;
    I128 fee;
    I128 repaid;
    I128 reserve0;
    I128 reserve1;
};

} // namespace coral

#endif // CORAL_FLASH_HPP
