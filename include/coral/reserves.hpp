#ifndef CORAL_RESERVES_HPP
#define CORAL_RESERVES_HPP

#include "types.hpp"

namespace coral {

// =============================================================================
// Reserve State
// =============================================================================

struct Reserves {
    I128 reserve0 = 0;
    I128 reserve1 = 0;
    I128 total_supply = 0;   // Minted LP shares

    I128 reserve(Side s) const { return s == Side::Zero ? reserve0 : reserve1; }
    bool initialized() const { return total_supply > 0; }
};

// =============================================================================
// Constant-Product Math
// =============================================================================

namespace cp_math {

// Exact-input output amount with the fee taken from the input leg:
//   in_with_fee = amount_in * (10000 - fee_bps)
//   out = floor(in_with_fee * reserve_out / (reserve_in * 10000 + in_with_fee))
I128 get_amount_out(I128 amount_in, I128 reserve_in, I128 reserve_out,
                    uint32_t fee_bps);

// Exact-output input amount, rounded up:
//   in = ceil(reserve_in * amount_out * 10000 /
//             ((reserve_out - amount_out) * (10000 - fee_bps)))
I128 get_amount_in(I128 amount_out, I128 reserve_in, I128 reserve_out,
                   uint32_t fee_bps);

// Amount of B equal in value to amount_a at the pool ratio (floor)
I128 quote(I128 amount_a, I128 reserve_a, I128 reserve_b);

} // namespace cp_math

// =============================================================================
// ReserveLedger
//
// Reserve and LP-supply bookkeeping for one pair. Each apply_* call computes
// the full next state before writing, so a throwing call leaves the ledger
// untouched.
// =============================================================================

class ReserveLedger {
public:
    ReserveLedger() = default;

    // Restore a committed state; validates the both-zero-or-both-positive rule
    explicit ReserveLedger(const Reserves& state);

    const Reserves& state() const { return state_; }
    I128 reserve(Side s) const { return state_.reserve(s); }
    I128 total_supply() const { return state_.total_supply; }
    bool initialized() const { return state_.initialized(); }

    // Exact-input swap; returns amount out. Post-condition: the reserve
    // product does not decrease.
    I128 apply_swap(I128 amount_in, Side side_in, uint32_t fee_bps);

    // Exact-output swap; returns amount in
    I128 apply_swap_exact_out(I128 amount_out, Side side_in, uint32_t fee_bps);

    void apply_deposit(I128 amount0, I128 amount1, I128 lp_minted);
    void apply_withdraw(I128 amount0, I128 amount1, I128 lp_burned);

    // Flash-loan settlement: the borrowed side keeps everything repaid above
    // the principal
    void apply_flash_repay(Side side, I128 surplus);

private:
    void commit_swap(Side side_in, I128 amount_in, I128 amount_out);

    Reserves state_;
};

} // namespace coral

#endif // CORAL_RESERVES_HPP
