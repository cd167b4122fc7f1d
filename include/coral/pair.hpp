#ifndef CORAL_PAIR_HPP
#define CORAL_PAIR_HPP

#include <atomic>
#include <limits>
#include <shared_mutex>
#include <thread>

#include "types.hpp"
#include "config.hpp"
#include "reserves.hpp"
#include "oracle.hpp"
#include "fee.hpp"
#include "flash.hpp"
#include "snapshot.hpp"
#include "liquidity.hpp"

namespace coral {

// Deadline value meaning "no deadline"
constexpr Timestamp NO_DEADLINE = std::numeric_limits<Timestamp>::max();

// =============================================================================
// Settlement Results
// =============================================================================

struct SwapResult {
    Side side_in;
    I128 amount_in;
    I128 amount_out;
    uint32_t fee_bps;         // Fee charged on this swap
    I128 fee_amount;          // Portion of amount_in retained as fee
    I128 reserve0;            // Reserves after the swap
    I128 reserve1;
};

struct LiquidityResult {
    I128 amount0;
    I128 amount1;
    I128 lp_amount;           // Minted on deposit, burned on withdrawal
    I128 reserve0;
    I128 reserve1;
    I128 total_supply;
};

// =============================================================================
// Pair - One Constant-Product Pool
//
// All mutations run read-compute-commit under the pair's unique lock. The next
// ledger, oracle and fee state are computed on copies; a check that fails
// throws before anything is written, so no partial state is ever visible.
// Order within a commit: the oracle accumulates the pre-mutation reserves,
// then the reserves change, then the fee takes one EMA step.
// =============================================================================

class Pair {
public:
    Pair(PairId id, TokenPair tokens, const PairConfig& config);
    ~Pair() = default;

    // Non-copyable
    Pair(const Pair&) = delete;
    Pair& operator=(const Pair&) = delete;

    const PairId& id() const { return id_; }
    const TokenPair& tokens() const { return tokens_; }
    I128 minimum_liquidity() const { return minimum_liquidity_; }

    // =========================================================================
    // Reads (shared lock)
    // =========================================================================

    PairSnapshot snapshot() const;

    // Counterfactual cumulatives as of `now`; does not advance the oracle
    Observation observe(Timestamp now) const;

    // =========================================================================
    // Settlement (unique lock)
    // =========================================================================

    // Exact-in: amount is the input, limit the minimum output.
    // Exact-out: amount is the output, limit the maximum input.
    SwapResult swap(Side side_in, TradeType type, I128 amount, I128 limit,
                    Timestamp deadline, const SettlementContext& ctx);

    LiquidityResult add_liquidity(Side side_a, I128 amount_a_desired,
                                  I128 amount_b_desired, I128 amount_a_min,
                                  I128 amount_b_min, Timestamp deadline,
                                  const SettlementContext& ctx);

    // holder_balance is the caller's LP balance from the share ledger
    LiquidityResult remove_liquidity(Side side_a, I128 lp_amount,
                                     I128 amount_a_min, I128 amount_b_min,
                                     I128 holder_balance, Timestamp deadline,
                                     const SettlementContext& ctx);

    // Lends `amount` of one side for the duration of `callback`. The pair
    // stays locked until the callback returns; calling back into this pair
    // from the callback's thread fails with AmmError{REENTRANCY}.
    FlashLoanResult flash_loan(Side side, I128 amount, const SettlementContext& ctx,
                               const FlashCallback& callback);

    // =========================================================================
    // Administration
    // =========================================================================

    void set_flash_loan_config(const FlashLoanConfig& config);

private:
    PairId id_;
    TokenPair tokens_;
    I128 minimum_liquidity_;

    mutable std::shared_mutex mutex_;
    ReserveLedger ledger_;
    PriceOracle oracle_;
    FeeState fee_;
    FlashLoanConfig flash_;

    // Thread running a flash callback, if any
    std::atomic<std::thread::id> flash_owner_{};

    void check_reentry() const;
    PairSnapshot snapshot_locked() const;
    void commit(const ReserveLedger& ledger, const PriceOracle& oracle,
                const FeeState& fee) noexcept;
};

} // namespace coral

#endif // CORAL_PAIR_HPP
