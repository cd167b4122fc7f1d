#ifndef CORAL_MANAGER_HPP
#define CORAL_MANAGER_HPP

#include <atomic>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>

#include "types.hpp"
#include "config.hpp"
#include "pair.hpp"
#include "quote.hpp"
#include "liquidity.hpp"

namespace coral {

// =============================================================================
// Injected Collaborators
// =============================================================================

// Maps pair ids to their tokens. Queried on every call, never cached.
class IPairDirectory {
public:
    virtual ~IPairDirectory() = default;

    // Tokens of a pair in canonical order, or nullopt for an unknown id
    virtual std::optional<TokenPair> tokens_of(const PairId& pair_id) const = 0;

    // Pair id for a canonically ordered token pair
    virtual std::optional<PairId> find_pair(const TokenId& token0,
                                            const TokenId& token1) const = 0;
};

// External LP share balances; read, never written
class IShareLedger {
public:
    virtual ~IShareLedger() = default;
    virtual I128 balance_of(const PairId& pair_id, const std::string& holder) const = 0;
};

// =============================================================================
// Requests
// =============================================================================

struct SwapRequest {
    TokenId token_in;
    TradeType trade_type = TradeType::EXACT_IN;
    I128 amount = 0;              // Input for EXACT_IN, output for EXACT_OUT
    I128 limit = 0;               // Minimum out for EXACT_IN, maximum in for EXACT_OUT
    Timestamp deadline = NO_DEADLINE;
};

struct AddLiquidityRequest {
    TokenId token_a;
    I128 amount_a_desired = 0;
    I128 amount_b_desired = 0;
    I128 amount_a_min = 0;
    I128 amount_b_min = 0;
    Timestamp deadline = NO_DEADLINE;
};

struct RemoveLiquidityRequest {
    std::string holder;
    TokenId token_a;
    I128 lp_amount = 0;
    I128 amount_a_min = 0;
    I128 amount_b_min = 0;
    Timestamp deadline = NO_DEADLINE;
};

// =============================================================================
// PairManager - External Interface
//
// Routes calls to per-pair state. The pair map has its own lock, held only
// to look up or insert a pair; pairs are never removed, so a looked-up pair
// stays valid after the map lock is released and different pairs settle in
// parallel.
// =============================================================================

class PairManager {
public:
    PairManager(CoreConfig config, const IPairDirectory& directory,
                const IShareLedger& shares);
    ~PairManager() = default;

    // Non-copyable
    PairManager(const PairManager&) = delete;
    PairManager& operator=(const PairManager&) = delete;

    // =========================================================================
    // Directory
    // =========================================================================

    // Throws TOKENS_NOT_SORTED unless token0 < token1, PAIR_NOT_FOUND when
    // the directory has no such pair
    PairId find_pair(const TokenId& token0, const TokenId& token1) const;

    // True once the pair's first deposit has settled
    bool pair_exists(const PairId& pair_id) const;

    // =========================================================================
    // Reads
    //
    // A pair known to the directory but not yet created reads as empty, with
    // the configured fee and flash settings.
    // =========================================================================

    Reserves get_reserves(const PairId& pair_id) const;
    FeeState get_fee_state(const PairId& pair_id) const;
    FlashLoanConfig get_flash_loan_config(const PairId& pair_id) const;
    Observation get_cumulative_prices(const PairId& pair_id) const;

    // Cumulatives as they would read at `now`
    Observation observe(const PairId& pair_id, Timestamp now) const;

    LiquidityPosition get_position(const PairId& pair_id, const std::string& holder) const;

    // =========================================================================
    // Quotes (advisory)
    // =========================================================================

    SwapQuote quote_swap(const PairId& pair_id, const TokenId& token_in,
                         I128 amount_in, uint32_t slippage_bps,
                         uint64_t ttl_seconds, Timestamp now) const;

    SwapQuote quote_swap_exact_out(const PairId& pair_id, const TokenId& token_in,
                                   I128 amount_out, uint32_t slippage_bps,
                                   uint64_t ttl_seconds, Timestamp now) const;

    LiquidityQuote quote_add_liquidity(const PairId& pair_id, const TokenId& token_a,
                                       I128 amount_a_desired,
                                       std::optional<I128> amount_b_desired) const;

    // =========================================================================
    // Settlement
    // =========================================================================

    SwapResult execute_swap(const PairId& pair_id, const SwapRequest& request,
                            const SettlementContext& ctx);

    // Creates the pair on its first successful deposit
    LiquidityResult add_liquidity(const PairId& pair_id, const AddLiquidityRequest& request,
                                  const SettlementContext& ctx);

    LiquidityResult remove_liquidity(const PairId& pair_id,
                                     const RemoveLiquidityRequest& request,
                                     const SettlementContext& ctx);

    FlashLoanResult flash_loan(const PairId& pair_id, const TokenId& token, I128 amount,
                               const SettlementContext& ctx, const FlashCallback& callback);

    // Throws PAIR_NOT_FOUND before the pair's first deposit
    void set_flash_loan_config(const PairId& pair_id, const FlashLoanConfig& config);

    // =========================================================================
    // Statistics
    // =========================================================================

    struct Stats {
        uint64_t total_pairs;
        uint64_t total_swaps;
        uint64_t total_liquidity_ops;
        uint64_t total_flash_loans;
        uint64_t total_rejected;
    };
    Stats get_stats() const;

    const CoreConfig& config() const { return config_; }

private:
    CoreConfig config_;
    const IPairDirectory& directory_;
    const IShareLedger& shares_;

    std::unordered_map<PairId, std::unique_ptr<Pair>> pairs_;
    mutable std::shared_mutex pairs_mutex_;

    std::atomic<uint64_t> total_swaps_{0};
    std::atomic<uint64_t> total_liquidity_ops_{0};
    std::atomic<uint64_t> total_flash_loans_{0};
    mutable std::atomic<uint64_t> total_rejected_{0};

    TokenPair resolve(const PairId& pair_id) const;
    static Side side_for(const PairId& pair_id, const TokenPair& tokens, const TokenId& token);

    Pair* get_pair(const PairId& pair_id) const;
    Pair& require_pair(const PairId& pair_id) const;
    PairSnapshot snapshot(const PairId& pair_id) const;

    template <typename Fn>
    auto guarded(const char* op, const PairId& pair_id, Fn&& fn) const -> decltype(fn());
};

} // namespace coral

#endif // CORAL_MANAGER_HPP
