// =============================================================================
// manager.cpp - Pair routing and lazy pair creation
// =============================================================================

#include "coral/manager.hpp"
#include "coral/log.hpp"
#include "coral/units.hpp"

#include <mutex>

namespace coral {

PairManager::PairManager(CoreConfig config, const IPairDirectory& directory,
                         const IShareLedger& shares)
    : config_(std::move(config)),
      directory_(directory),
      shares_(shares) {
    config_.validate();
    config_.apply_logging();
    log::logger()->info("pair manager ready: {} pair overrides, minimum liquidity {}",
                        config_.pairs.size(), to_string(config_.minimum_liquidity));
}

// =============================================================================
// Internal Helpers
// =============================================================================

template <typename Fn>
auto PairManager::guarded(const char* op, const PairId& pair_id, Fn&& fn) const
    -> decltype(fn()) {
    try {
        return fn();
    } catch (const AmmError& e) {
        total_rejected_.fetch_add(1, std::memory_order_relaxed);
        log::logger()->warn("{} {} rejected: {}", pair_id, op, e.what());
        throw;
    }
}

TokenPair PairManager::resolve(const PairId& pair_id) const {
    auto tokens = directory_.tokens_of(pair_id);
    if (!tokens) {
        throw AmmError(errors::PAIR_NOT_FOUND, "unknown pair " + pair_id);
    }
    if (!tokens->is_canonical()) {
        throw AmmError(errors::TOKENS_NOT_SORTED,
                       "directory returned " + tokens->token0.id + ", " +
                       tokens->token1.id + " for " + pair_id);
    }
    return *tokens;
}

Side PairManager::side_for(const PairId& pair_id, const TokenPair& tokens,
                           const TokenId& token) {
    auto side = tokens.side_of(token);
    if (!side) {
        throw AmmError(errors::INVALID_TOKEN,
                       token.id + " is not a token of pair " + pair_id);
    }
    return *side;
}

Pair* PairManager::get_pair(const PairId& pair_id) const {
    std::shared_lock lock(pairs_mutex_);
    auto it = pairs_.find(pair_id);
    return it == pairs_.end() ? nullptr : it->second.get();
}

Pair& PairManager::require_pair(const PairId& pair_id) const {
    Pair* pair = get_pair(pair_id);
    if (!pair) {
        throw AmmError(errors::PAIR_NOT_FOUND, "pair " + pair_id + " has no reserves");
    }
    return *pair;
}

PairSnapshot PairManager::snapshot(const PairId& pair_id) const {
    TokenPair tokens = resolve(pair_id);
    if (Pair* pair = get_pair(pair_id)) {
        return pair->snapshot();
    }
    PairConfig cfg = config_.for_pair(pair_id);
    return PairSnapshot{pair_id, std::move(tokens), Reserves{},
                        fee_engine::initial_state(cfg.fee), cfg.flash,
                        Observation{0, 0, 0}};
}

// =============================================================================
// Directory
// =============================================================================

PairId PairManager::find_pair(const TokenId& token0, const TokenId& token1) const {
    if (token0 == token1) {
        throw AmmError(errors::INVALID_TOKEN, "pair needs two distinct tokens");
    }
    if (!(token0 < token1)) {
        throw AmmError(errors::TOKENS_NOT_SORTED,
                       token0.id + " must sort before " + token1.id);
    }
    auto id = directory_.find_pair(token0, token1);
    if (!id) {
        throw AmmError(errors::PAIR_NOT_FOUND,
                       "no pair for " + token0.id + ", " + token1.id);
    }
    return *id;
}

bool PairManager::pair_exists(const PairId& pair_id) const {
    return get_pair(pair_id) != nullptr;
}

// =============================================================================
// Reads
// =============================================================================

Reserves PairManager::get_reserves(const PairId& pair_id) const {
    return snapshot(pair_id).reserves;
}

FeeState PairManager::get_fee_state(const PairId& pair_id) const {
    return snapshot(pair_id).fee;
}

FlashLoanConfig PairManager::get_flash_loan_config(const PairId& pair_id) const {
    return snapshot(pair_id).flash;
}

Observation PairManager::get_cumulative_prices(const PairId& pair_id) const {
    return snapshot(pair_id).oracle;
}

Observation PairManager::observe(const PairId& pair_id, Timestamp now) const {
    resolve(pair_id);
    if (Pair* pair = get_pair(pair_id)) {
        return pair->observe(now);
    }
    return PriceOracle{}.observe(0, 0, now);
}

LiquidityPosition PairManager::get_position(const PairId& pair_id,
                                            const std::string& holder) const {
    PairSnapshot snap = snapshot(pair_id);
    return liquidity_engine::position(snap.reserves, shares_.balance_of(pair_id, holder));
}

// =============================================================================
// Quotes
// =============================================================================

SwapQuote PairManager::quote_swap(const PairId& pair_id, const TokenId& token_in,
                                  I128 amount_in, uint32_t slippage_bps,
                                  uint64_t ttl_seconds, Timestamp now) const {
    PairSnapshot snap = snapshot(pair_id);
    Side side_in = side_for(pair_id, snap.tokens, token_in);
    return quote_engine::quote_exact_in(snap, side_in, amount_in, slippage_bps, now, ttl_seconds);
}

SwapQuote PairManager::quote_swap_exact_out(const PairId& pair_id, const TokenId& token_in,
                                            I128 amount_out, uint32_t slippage_bps,
                                            uint64_t ttl_seconds, Timestamp now) const {
    PairSnapshot snap = snapshot(pair_id);
    Side side_in = side_for(pair_id, snap.tokens, token_in);
    return quote_engine::quote_exact_out(snap, side_in, amount_out, slippage_bps, now, ttl_seconds);
}

LiquidityQuote PairManager::quote_add_liquidity(const PairId& pair_id, const TokenId& token_a,
                                                I128 amount_a_desired,
                                                std::optional<I128> amount_b_desired) const {
    PairSnapshot snap = snapshot(pair_id);
    Side side_a = side_for(pair_id, snap.tokens, token_a);
    I128 floor = config_.for_pair(pair_id).minimum_liquidity;
    return liquidity_engine::quote_add_liquidity(snap, side_a, amount_a_desired,
                                                 amount_b_desired, floor);
}

// =============================================================================
// Settlement
// =============================================================================

SwapResult PairManager::execute_swap(const PairId& pair_id, const SwapRequest& request,
                                     const SettlementContext& ctx) {
    return guarded("swap", pair_id, [&] {
        TokenPair tokens = resolve(pair_id);
        Side side_in = side_for(pair_id, tokens, request.token_in);
        SwapResult result = require_pair(pair_id).swap(
            side_in, request.trade_type, request.amount, request.limit,
            request.deadline, ctx);
        total_swaps_.fetch_add(1, std::memory_order_relaxed);
        return result;
    });
}

LiquidityResult PairManager::add_liquidity(const PairId& pair_id,
                                           const AddLiquidityRequest& request,
                                           const SettlementContext& ctx) {
    return guarded("add_liquidity", pair_id, [&] {
        TokenPair tokens = resolve(pair_id);
        Side side_a = side_for(pair_id, tokens, request.token_a);

        Pair* pair = get_pair(pair_id);
        if (!pair) {
            auto fresh = std::make_unique<Pair>(pair_id, tokens, config_.for_pair(pair_id));

            std::unique_lock lock(pairs_mutex_);
            auto it = pairs_.find(pair_id);
            if (it == pairs_.end()) {
                // First deposit settles before the pair becomes visible
                LiquidityResult result = fresh->add_liquidity(
                    side_a, request.amount_a_desired, request.amount_b_desired,
                    request.amount_a_min, request.amount_b_min, request.deadline, ctx);
                pairs_.emplace(pair_id, std::move(fresh));
                total_liquidity_ops_.fetch_add(1, std::memory_order_relaxed);
                log::logger()->info("created pair {} ({}, {}) with {} shares",
                                    pair_id, tokens.token0.id, tokens.token1.id,
                                    to_string(result.lp_amount));
                return result;
            }
            pair = it->second.get();
        }

        LiquidityResult result = pair->add_liquidity(
            side_a, request.amount_a_desired, request.amount_b_desired,
            request.amount_a_min, request.amount_b_min, request.deadline, ctx);
        total_liquidity_ops_.fetch_add(1, std::memory_order_relaxed);
        return result;
    });
}

LiquidityResult PairManager::remove_liquidity(const PairId& pair_id,
                                              const RemoveLiquidityRequest& request,
                                              const SettlementContext& ctx) {
    return guarded("remove_liquidity", pair_id, [&] {
        TokenPair tokens = resolve(pair_id);
        Side side_a = side_for(pair_id, tokens, request.token_a);
        Pair& pair = require_pair(pair_id);
        I128 balance = shares_.balance_of(pair_id, request.holder);
        LiquidityResult result = pair.remove_liquidity(
            side_a, request.lp_amount, request.amount_a_min, request.amount_b_min,
            balance, request.deadline, ctx);
        total_liquidity_ops_.fetch_add(1, std::memory_order_relaxed);
        return result;
    });
}

FlashLoanResult PairManager::flash_loan(const PairId& pair_id, const TokenId& token,
                                        I128 amount, const SettlementContext& ctx,
                                        const FlashCallback& callback) {
    return guarded("flash_loan", pair_id, [&] {
        TokenPair tokens = resolve(pair_id);
        Side side = side_for(pair_id, tokens, token);
        FlashLoanResult result = require_pair(pair_id).flash_loan(side, amount, ctx, callback);
        total_flash_loans_.fetch_add(1, std::memory_order_relaxed);
        return result;
    });
}

void PairManager::set_flash_loan_config(const PairId& pair_id,
                                        const FlashLoanConfig& config) {
    resolve(pair_id);
    require_pair(pair_id).set_flash_loan_config(config);
}

// =============================================================================
// Statistics
// =============================================================================

PairManager::Stats PairManager::get_stats() const {
    Stats stats{};
    {
        std::shared_lock lock(pairs_mutex_);
        stats.total_pairs = pairs_.size();
    }
    stats.total_swaps = total_swaps_.load(std::memory_order_relaxed);
    stats.total_liquidity_ops = total_liquidity_ops_.load(std::memory_order_relaxed);
    stats.total_flash_loans = total_flash_loans_.load(std::memory_order_relaxed);
    stats.total_rejected = total_rejected_.load(std::memory_order_relaxed);
    return stats;
}

} // namespace coral
