// =============================================================================
// reserves.cpp - Constant-product reserve ledger
// =============================================================================

#include "coral/reserves.hpp"
#include "coral/math.hpp"
#include "coral/units.hpp"

namespace coral {

using fixed_point::checked_add;
using fixed_point::checked_mul;
using fixed_point::checked_sub;

namespace {

void check_fee(uint32_t fee_bps) {
    if (fee_bps >= BPS_DENOMINATOR) {
        throw AmmError(errors::INVALID_ARGUMENT,
                       "fee " + std::to_string(fee_bps) + " bps leaves no input");
    }
}

void check_bound(I128 reserve) {
    if (reserve > MAX_RESERVE) {
        throw AmmError(errors::ARITHMETIC_OVERFLOW,
                       "reserve " + to_string(reserve) + " exceeds maximum");
    }
}

} // anonymous namespace

// =============================================================================
// Constant-Product Math
// =============================================================================

namespace cp_math {

I128 get_amount_out(I128 amount_in, I128 reserve_in, I128 reserve_out,
                    uint32_t fee_bps) {
    if (amount_in <= 0) {
        throw AmmError(errors::INSUFFICIENT_INPUT_AMOUNT, "amount in must be positive");
    }
    if (reserve_in <= 0 || reserve_out <= 0) {
        throw AmmError(errors::INSUFFICIENT_LIQUIDITY, "empty reserves");
    }
    check_fee(fee_bps);

    I128 in_with_fee = checked_mul(amount_in, BPS_DENOMINATOR - fee_bps);
    I128 denominator = checked_add(checked_mul(reserve_in, BPS_DENOMINATOR), in_with_fee);
    I128 amount_out = fixed_point::mul_div(in_with_fee, reserve_out, denominator);

    if (amount_out == 0) {
        throw AmmError(errors::INSUFFICIENT_LIQUIDITY,
                       "input " + to_string(amount_in) + " yields no output");
    }
    return amount_out;
}

I128 get_amount_in(I128 amount_out, I128 reserve_in, I128 reserve_out,
                   uint32_t fee_bps) {
    if (amount_out <= 0) {
        throw AmmError(errors::INSUFFICIENT_INPUT_AMOUNT, "amount out must be positive");
    }
    if (reserve_in <= 0 || reserve_out <= 0) {
        throw AmmError(errors::INSUFFICIENT_LIQUIDITY, "empty reserves");
    }
    if (amount_out >= reserve_out) {
        throw AmmError(errors::INSUFFICIENT_LIQUIDITY,
                       "output " + to_string(amount_out) + " exceeds reserve " +
                       to_string(reserve_out));
    }
    check_fee(fee_bps);

    I128 scaled_out = checked_mul(amount_out, BPS_DENOMINATOR);
    I128 denominator = checked_mul(reserve_out - amount_out, BPS_DENOMINATOR - fee_bps);
    return fixed_point::mul_div_up(reserve_in, scaled_out, denominator);
}

I128 quote(I128 amount_a, I128 reserve_a, I128 reserve_b) {
    if (amount_a <= 0) {
        throw AmmError(errors::INSUFFICIENT_INPUT_AMOUNT, "amount must be positive");
    }
    if (reserve_a <= 0 || reserve_b <= 0) {
        throw AmmError(errors::INSUFFICIENT_LIQUIDITY, "empty reserves");
    }
    return fixed_point::mul_div(amount_a, reserve_b, reserve_a);
}

} // namespace cp_math

// =============================================================================
// ReserveLedger
// =============================================================================

ReserveLedger::ReserveLedger(const Reserves& state) {
    if (state.reserve0 < 0 || state.reserve1 < 0 || state.total_supply < 0) {
        throw std::invalid_argument("ReserveLedger: negative state");
    }
    if ((state.reserve0 == 0) != (state.reserve1 == 0) ||
        (state.total_supply == 0) != (state.reserve0 == 0)) {
        throw std::invalid_argument("ReserveLedger: partially initialized state");
    }
    check_bound(state.reserve0);
    check_bound(state.reserve1);
    state_ = state;
}

I128 ReserveLedger::apply_swap(I128 amount_in, Side side_in, uint32_t fee_bps) {
    I128 amount_out = cp_math::get_amount_out(
        amount_in, reserve(side_in), reserve(opposite(side_in)), fee_bps);
    commit_swap(side_in, amount_in, amount_out);
    return amount_out;
}

I128 ReserveLedger::apply_swap_exact_out(I128 amount_out, Side side_in, uint32_t fee_bps) {
    I128 amount_in = cp_math::get_amount_in(
        amount_out, reserve(side_in), reserve(opposite(side_in)), fee_bps);
    commit_swap(side_in, amount_in, amount_out);
    return amount_in;
}

void ReserveLedger::commit_swap(Side side_in, I128 amount_in, I128 amount_out) {
    I128 old_in = reserve(side_in);
    I128 old_out = reserve(opposite(side_in));

    I128 new_in = checked_add(old_in, amount_in);
    check_bound(new_in);
    I128 new_out = checked_sub(old_out, amount_out);
    if (new_out == 0) {
        throw AmmError(errors::INSUFFICIENT_LIQUIDITY, "swap would drain reserve");
    }

    if (!fixed_point::product_gte(new_in, new_out, old_in, old_out)) {
        throw std::logic_error("ReserveLedger: constant product decreased");
    }

    if (side_in == Side::Zero) {
        state_.reserve0 = new_in;
        state_.reserve1 = new_out;
    } else {
        state_.reserve1 = new_in;
        state_.reserve0 = new_out;
    }
}

void ReserveLedger::apply_deposit(I128 amount0, I128 amount1, I128 lp_minted) {
    if (amount0 <= 0 || amount1 <= 0) {
        throw AmmError(errors::INSUFFICIENT_INPUT_AMOUNT,
                       "deposit must add both tokens");
    }
    if (lp_minted <= 0) {
        throw AmmError(errors::INSUFFICIENT_INPUT_AMOUNT, "deposit mints no shares");
    }

    Reserves next = state_;
    next.reserve0 = checked_add(state_.reserve0, amount0);
    next.reserve1 = checked_add(state_.reserve1, amount1);
    next.total_supply = checked_add(state_.total_supply, lp_minted);
    check_bound(next.reserve0);
    check_bound(next.reserve1);

    state_ = next;
}

void ReserveLedger::apply_withdraw(I128 amount0, I128 amount1, I128 lp_burned) {
    if (lp_burned <= 0 || amount0 < 0 || amount1 < 0) {
        throw AmmError(errors::INSUFFICIENT_INPUT_AMOUNT, "nothing to withdraw");
    }
    if (lp_burned > state_.total_supply) {
        throw AmmError(errors::INSUFFICIENT_BALANCE,
                       "burn " + to_string(lp_burned) + " exceeds supply " +
                       to_string(state_.total_supply));
    }
    if (amount0 > state_.reserve0 || amount1 > state_.reserve1) {
        throw AmmError(errors::INSUFFICIENT_LIQUIDITY, "withdraw exceeds reserves");
    }

    Reserves next = state_;
    next.reserve0 = state_.reserve0 - amount0;
    next.reserve1 = state_.reserve1 - amount1;
    next.total_supply = state_.total_supply - lp_burned;

    // Either fully drained back to uninitialized or both sides still funded
    bool drained = next.total_supply == 0;
    if (drained != (next.reserve0 == 0) || drained != (next.reserve1 == 0)) {
        throw AmmError(errors::INSUFFICIENT_LIQUIDITY,
                       "withdraw would leave a one-sided pool");
    }

    state_ = next;
}

void ReserveLedger::apply_flash_repay(Side side, I128 surplus) {
    if (surplus < 0) {
        throw AmmError(errors::INSUFFICIENT_INPUT_AMOUNT, "flash loan not repaid");
    }
    I128 next = checked_add(reserve(side), surplus);
    check_bound(next);
    if (side == Side::Zero) {
        state_.reserve0 = next;
    } else {
        state_.reserve1 = next;
    }
}

} // namespace coral
