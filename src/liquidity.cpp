// =============================================================================
// liquidity.cpp - Deposit and withdrawal planning
// =============================================================================

#include "coral/liquidity.hpp"
#include "coral/math.hpp"
#include "coral/units.hpp"

#include <algorithm>

namespace coral {
namespace liquidity_engine {

namespace {

void check_floor(I128 minimum_liquidity) {
    if (minimum_liquidity < 0) {
        throw AmmError(errors::INVALID_ARGUMENT, "minimum liquidity must be non-negative");
    }
}

I128 share_after(I128 minted, I128 total_supply) {
    I128 supply = fixed_point::checked_add(total_supply, minted);
    if (supply == 0) {
        return 0;
    }
    return fixed_point::mul_div(minted, X18_ONE, supply);
}

} // anonymous namespace

I128 initial_shares(I128 amount0, I128 amount1, I128 minimum_liquidity) {
    check_floor(minimum_liquidity);
    if (amount0 <= 0 || amount1 <= 0) {
        throw AmmError(errors::INSUFFICIENT_INPUT_AMOUNT,
                       "first deposit needs both tokens");
    }
    I128 shares = fixed_point::sqrt_product(amount0, amount1);
    if (shares == 0 || shares < minimum_liquidity) {
        throw AmmError(errors::INSUFFICIENT_INITIAL_LIQUIDITY,
                       "first deposit mints " + to_string(shares) +
                       " shares, floor is " + to_string(minimum_liquidity));
    }
    return shares;
}

I128 shares_for_deposit(const Reserves& reserves, I128 amount0, I128 amount1) {
    if (!reserves.initialized() || reserves.reserve0 <= 0 || reserves.reserve1 <= 0) {
        throw AmmError(errors::INSUFFICIENT_LIQUIDITY, "pool has no reserves");
    }
    if (amount0 <= 0 || amount1 <= 0) {
        throw AmmError(errors::INSUFFICIENT_INPUT_AMOUNT, "deposit needs both tokens");
    }
    I128 by0 = fixed_point::mul_div(amount0, reserves.total_supply, reserves.reserve0);
    I128 by1 = fixed_point::mul_div(amount1, reserves.total_supply, reserves.reserve1);
    I128 shares = std::min(by0, by1);
    if (shares <= 0) {
        throw AmmError(errors::INSUFFICIENT_INPUT_AMOUNT, "deposit mints no shares");
    }
    return shares;
}

LiquidityQuote quote_add_liquidity(const PairSnapshot& snapshot, Side side_a,
                                   I128 amount_a_desired,
                                   std::optional<I128> amount_b_desired,
                                   I128 minimum_liquidity) {
    if (amount_a_desired <= 0) {
        throw AmmError(errors::INSUFFICIENT_INPUT_AMOUNT, "amount A must be positive");
    }

    const Reserves& r = snapshot.reserves;
    LiquidityQuote q{};
    q.side_a = side_a;
    q.amount_a = amount_a_desired;
    q.initializes_pool = !r.initialized();

    if (q.initializes_pool) {
        if (!amount_b_desired) {
            throw AmmError(errors::INVALID_ARGUMENT,
                           "amount B is required to price a new pool");
        }
        q.amount_b = *amount_b_desired;
        I128 a0 = side_a == Side::Zero ? q.amount_a : q.amount_b;
        I128 a1 = side_a == Side::Zero ? q.amount_b : q.amount_a;
        q.estimated_lp_tokens = initial_shares(a0, a1, minimum_liquidity);
        q.share_of_pool_x18 = X18_ONE;
        return q;
    }

    q.amount_b = cp_math::quote(amount_a_desired, r.reserve(side_a),
                                r.reserve(opposite(side_a)));
    I128 a0 = side_a == Side::Zero ? q.amount_a : q.amount_b;
    I128 a1 = side_a == Side::Zero ? q.amount_b : q.amount_a;
    q.estimated_lp_tokens = shares_for_deposit(r, a0, a1);
    q.share_of_pool_x18 = share_after(q.estimated_lp_tokens, r.total_supply);
    return q;
}

AddLiquidityPlan plan_add_liquidity(const PairSnapshot& snapshot, Side side_a,
                                    I128 amount_a_desired, I128 amount_b_desired,
                                    I128 amount_a_min, I128 amount_b_min,
                                    I128 minimum_liquidity) {
    if (amount_a_desired <= 0 || amount_b_desired <= 0) {
        throw AmmError(errors::INSUFFICIENT_INPUT_AMOUNT, "deposit needs both tokens");
    }
    if (amount_a_min < 0 || amount_b_min < 0) {
        throw AmmError(errors::INVALID_ARGUMENT, "minimums must be non-negative");
    }

    const Reserves& r = snapshot.reserves;
    AddLiquidityPlan plan{};
    plan.side_a = side_a;

    if (!r.initialized()) {
        plan.amount_a = amount_a_desired;
        plan.amount_b = amount_b_desired;
    } else {
        I128 reserve_a = r.reserve(side_a);
        I128 reserve_b = r.reserve(opposite(side_a));
        I128 b_optimal = cp_math::quote(amount_a_desired, reserve_a, reserve_b);
        if (b_optimal <= amount_b_desired) {
            plan.amount_a = amount_a_desired;
            plan.amount_b = b_optimal;
        } else {
            // b_optimal overshoots, so a_optimal <= amount_a_desired
            plan.amount_a = cp_math::quote(amount_b_desired, reserve_b, reserve_a);
            plan.amount_b = amount_b_desired;
        }
    }

    if (plan.amount_a < amount_a_min || plan.amount_b < amount_b_min) {
        throw AmmError(errors::SLIPPAGE_EXCEEDED,
                       "deposit (" + to_string(plan.amount_a) + ", " +
                       to_string(plan.amount_b) + ") below minimums (" +
                       to_string(amount_a_min) + ", " + to_string(amount_b_min) + ")");
    }

    plan.lp_minted = r.initialized()
        ? shares_for_deposit(r, plan.amount0(), plan.amount1())
        : initial_shares(plan.amount0(), plan.amount1(), minimum_liquidity);
    return plan;
}

RemoveLiquidityPlan plan_remove_liquidity(const PairSnapshot& snapshot, Side side_a,
                                          I128 lp_amount, I128 amount_a_min,
                                          I128 amount_b_min, I128 holder_balance) {
    if (lp_amount <= 0) {
        throw AmmError(errors::INSUFFICIENT_INPUT_AMOUNT, "lp amount must be positive");
    }
    if (lp_amount > holder_balance) {
        throw AmmError(errors::INSUFFICIENT_BALANCE,
                       "burning " + to_string(lp_amount) + " shares, holder has " +
                       to_string(holder_balance));
    }

    const Reserves& r = snapshot.reserves;
    if (!r.initialized()) {
        throw AmmError(errors::INSUFFICIENT_LIQUIDITY, "pool has no shares");
    }
    if (lp_amount > r.total_supply) {
        throw AmmError(errors::INSUFFICIENT_BALANCE,
                       "burning " + to_string(lp_amount) + " of " +
                       to_string(r.total_supply) + " total shares");
    }

    RemoveLiquidityPlan plan{};
    plan.side_a = side_a;
    plan.lp_burned = lp_amount;
    plan.amount_a = fixed_point::mul_div(lp_amount, r.reserve(side_a), r.total_supply);
    plan.amount_b = fixed_point::mul_div(lp_amount, r.reserve(opposite(side_a)),
                                         r.total_supply);
    if (plan.amount_a == 0 || plan.amount_b == 0) {
        throw AmmError(errors::INSUFFICIENT_LIQUIDITY, "withdrawal rounds to zero");
    }
    if (plan.amount_a < amount_a_min || plan.amount_b < amount_b_min) {
        throw AmmError(errors::SLIPPAGE_EXCEEDED,
                       "withdrawal (" + to_string(plan.amount_a) + ", " +
                       to_string(plan.amount_b) + ") below minimums (" +
                       to_string(amount_a_min) + ", " + to_string(amount_b_min) + ")");
    }
    return plan;
}

LiquidityPosition position(const Reserves& reserves, I128 balance) {
    if (balance < 0) {
        throw AmmError(errors::INVALID_ARGUMENT, "negative share balance");
    }
    LiquidityPosition pos{};
    pos.balance = balance;
    if (!reserves.initialized() || balance == 0) {
        return pos;
    }
    if (balance > reserves.total_supply) {
        throw AmmError(errors::INVALID_ARGUMENT,
                       "balance " + to_string(balance) + " exceeds " +
                       to_string(reserves.total_supply) + " total shares");
    }
    pos.share_x18 = fixed_point::mul_div(balance, X18_ONE, reserves.total_supply);
    pos.token0_amount = fixed_point::mul_div(balance, reserves.reserve0, reserves.total_supply);
    pos.token1_amount = fixed_point::mul_div(balance, reserves.reserve1, reserves.total_supply);
    return pos;
}

} // namespace liquidity_engine
} // namespace coral
