#ifndef CORAL_LIQUIDITY_HPP
#define CORAL_LIQUIDITY_HPP

#include <optional>

#include "types.hpp"
#include "snapshot.hpp"

namespace coral {

// Default first-deposit floor; configurable per pair
constexpr I128 DEFAULT_MINIMUM_LIQUIDITY = 1000;

// =============================================================================
// Liquidity Quotes & Plans
//
// "A" is the token the caller leads with, "B" its counterpart. amount0() and
// amount1() map back onto the canonical reserve order.
// =============================================================================

struct LiquidityQuote {
    Side side_a;
    I128 amount_a;
    I128 amount_b;
    I128 estimated_lp_tokens;
    I128 share_of_pool_x18;     // Holder's share after the deposit, X18
    bool initializes_pool;
};

struct AddLiquidityPlan {
    Side side_a;
    I128 amount_a;
    I128 amount_b;
    I128 lp_minted;

    I128 amount0() const { return side_a == Side::Zero ? amount_a : amount_b; }
    I128 amount1() const { return side_a == Side::Zero ? amount_b : amount_a; }
};

struct RemoveLiquidityPlan {
    Side side_a;
    I128 amount_a;
    I128 amount_b;
    I128 lp_burned;

    I128 amount0() const { return side_a == Side::Zero ? amount_a : amount_b; }
    I128 amount1() const { return side_a == Side::Zero ? amount_b : amount_a; }
};

// Derived view of one holder's shares; nothing here is persisted
struct LiquidityPosition {
    I128 balance;
    I128 share_x18;             // balance / total_supply, X18
    I128 token0_amount;
    I128 token1_amount;
};

// =============================================================================
// LiquidityEngine
// =============================================================================

namespace liquidity_engine {

// Shares minted by the first deposit: floor(sqrt(amount0 * amount1)).
// Throws AmmError{INSUFFICIENT_INITIAL_LIQUIDITY} below minimum_liquidity.
I128 initial_shares(I128 amount0, I128 amount1, I128 minimum_liquidity);

// Shares minted into an initialized pool: the smaller of the two pro-rata
// amounts, so an unbalanced deposit donates its excess
I128 shares_for_deposit(const Reserves& reserves, I128 amount0, I128 amount1);

// Estimate for a deposit led by amount_a_desired. An uninitialized pool takes
// amount_b_desired as given (required); an initialized pool prices B at the
// reserve ratio and ignores amount_b_desired.
LiquidityQuote quote_add_liquidity(const PairSnapshot& snapshot, Side side_a,
                                   I128 amount_a_desired,
                                   std::optional<I128> amount_b_desired,
                                   I128 minimum_liquidity);

// Binding amounts for a deposit: uses (a_desired, b_optimal) when b_optimal
// fits within b_desired, otherwise (a_optimal, b_desired). Throws
// SLIPPAGE_EXCEEDED when either amount lands below its minimum.
AddLiquidityPlan plan_add_liquidity(const PairSnapshot& snapshot, Side side_a,
                                    I128 amount_a_desired, I128 amount_b_desired,
                                    I128 amount_a_min, I128 amount_b_min,
                                    I128 minimum_liquidity);

// Pro-rata withdrawal of lp_amount shares. Throws INSUFFICIENT_BALANCE when
// lp_amount exceeds the holder's balance, SLIPPAGE_EXCEEDED below minimums.
RemoveLiquidityPlan plan_remove_liquidity(const PairSnapshot& snapshot, Side side_a,
                                          I128 lp_amount, I128 amount_a_min,
                                          I128 amount_b_min, I128 holder_balance);

// Zero amounts on an empty pool. Throws INVALID_ARGUMENT for a negative
// balance or one above the total supply.
LiquidityPosition position(const Reserves& reserves, I128 balance);

} // namespace liquidity_engine

} // namespace coral

#endif // CORAL_LIQUIDITY_HPP
