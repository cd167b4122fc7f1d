// =============================================================================
// pair.cpp - Per-pair settlement
// =============================================================================

#include "coral/pair.hpp"
#include "coral/quote.hpp"
#include "coral/log.hpp"
#include "coral/math.hpp"
#include "coral/units.hpp"

#include <mutex>

namespace coral {

namespace {

void check_limit(I128 limit) {
    if (limit < 0) {
        throw AmmError(errors::INVALID_ARGUMENT, "limit must be non-negative");
    }
}

} // anonymous namespace

Pair::Pair(PairId id, TokenPair tokens, const PairConfig& config)
    : id_(std::move(id)),
      tokens_(std::move(tokens)),
      minimum_liquidity_(config.minimum_liquidity),
      fee_(fee_engine::initial_state(config.fee)),
      flash_(config.flash) {
    if (!tokens_.is_canonical()) {
        throw AmmError(errors::TOKENS_NOT_SORTED,
                       "pair " + id_ + ": " + tokens_.token0.id + " !< " + tokens_.token1.id);
    }
    config.validate();
}

// =============================================================================
// Reads
// =============================================================================

void Pair::check_reentry() const {
    if (flash_owner_.load(std::memory_order_acquire) == std::this_thread::get_id()) {
        throw AmmError(errors::REENTRANCY,
                       "pair " + id_ + " is inside a flash loan on this thread");
    }
}

PairSnapshot Pair::snapshot_locked() const {
    return PairSnapshot{id_, tokens_, ledger_.state(), fee_, flash_, oracle_.last()};
}

PairSnapshot Pair::snapshot() const {
    check_reentry();
    std::shared_lock lock(mutex_);
    return snapshot_locked();
}

Observation Pair::observe(Timestamp now) const {
    check_reentry();
    std::shared_lock lock(mutex_);
    const Reserves& r = ledger_.state();
    return oracle_.observe(r.reserve0, r.reserve1, now);
}

void Pair::commit(const ReserveLedger& ledger, const PriceOracle& oracle,
                  const FeeState& fee) noexcept {
    ledger_ = ledger;
    oracle_ = oracle;
    fee_ = fee;
}

// =============================================================================
// Swap
// =============================================================================

SwapResult Pair::swap(Side side_in, TradeType type, I128 amount, I128 limit,
                      Timestamp deadline, const SettlementContext& ctx) {
    check_reentry();
    check_limit(limit);
    std::unique_lock lock(mutex_);

    quote_engine::check_deadline(deadline, ctx.timestamp);
    if (!ledger_.initialized()) {
        throw AmmError(errors::PAIR_NOT_FOUND, "pair " + id_ + " has no reserves");
    }

    ReserveLedger ledger = ledger_;
    PriceOracle oracle = oracle_;
    oracle.update(ledger.state().reserve0, ledger.state().reserve1, ctx.timestamp);

    SwapResult result{};
    result.side_in = side_in;
    result.fee_bps = fee_.current_fee_bps;

    if (type == TradeType::EXACT_IN) {
        result.amount_in = amount;
        result.amount_out = ledger.apply_swap(amount, side_in, result.fee_bps);
        if (result.amount_out < limit) {
            throw AmmError(errors::SLIPPAGE_EXCEEDED,
                           "output " + to_string(result.amount_out) +
                           " below minimum " + to_string(limit));
        }
    } else {
        result.amount_out = amount;
        result.amount_in = ledger.apply_swap_exact_out(amount, side_in, result.fee_bps);
        if (result.amount_in > limit) {
            throw AmmError(errors::SLIPPAGE_EXCEEDED,
                           "input " + to_string(result.amount_in) +
                           " above maximum " + to_string(limit));
        }
    }

    result.fee_amount = fixed_point::mul_div(result.amount_in, result.fee_bps,
                                             BPS_DENOMINATOR);

    FeeState fee = fee_engine::step(fee_, ctx.fee_signal_bps);
    commit(ledger, oracle, fee);

    result.reserve0 = ledger_.state().reserve0;
    result.reserve1 = ledger_.state().reserve1;

    log::logger()->debug("{} swap {} in={} out={} fee={} ({}bps) next_fee={}bps",
                         id_, to_string(side_in), to_string(result.amount_in),
                         to_string(result.amount_out), to_string(result.fee_amount),
                         result.fee_bps,
                         fee_.current_fee_bps);
    return result;
}

// =============================================================================
// Liquidity
// =============================================================================

LiquidityResult Pair::add_liquidity(Side side_a, I128 amount_a_desired,
                                    I128 amount_b_desired, I128 amount_a_min,
                                    I128 amount_b_min, Timestamp deadline,
                                    const SettlementContext& ctx) {
    check_reentry();
    std::unique_lock lock(mutex_);

    quote_engine::check_deadline(deadline, ctx.timestamp);
    AddLiquidityPlan plan = liquidity_engine::plan_add_liquidity(
        snapshot_locked(), side_a, amount_a_desired, amount_b_desired,
        amount_a_min, amount_b_min, minimum_liquidity_);

    ReserveLedger ledger = ledger_;
    PriceOracle oracle = oracle_;
    oracle.update(ledger.state().reserve0, ledger.state().reserve1, ctx.timestamp);
    ledger.apply_deposit(plan.amount0(), plan.amount1(), plan.lp_minted);

    FeeState fee = fee_engine::step(fee_, ctx.fee_signal_bps);
    commit(ledger, oracle, fee);

    const Reserves& r = ledger_.state();
    log::logger()->debug("{} deposit amount0={} amount1={} minted={} supply={}",
                         id_, to_string(plan.amount0()), to_string(plan.amount1()),
                         to_string(plan.lp_minted), to_string(r.total_supply));
    return LiquidityResult{plan.amount0(), plan.amount1(), plan.lp_minted,
                           r.reserve0, r.reserve1, r.total_supply};
}

LiquidityResult Pair::remove_liquidity(Side side_a, I128 lp_amount,
                                       I128 amount_a_min, I128 amount_b_min,
                                       I128 holder_balance, Timestamp deadline,
                                       const SettlementContext& ctx) {
    check_reentry();
    std::unique_lock lock(mutex_);

    quote_engine::check_deadline(deadline, ctx.timestamp);
    RemoveLiquidityPlan plan = liquidity_engine::plan_remove_liquidity(
        snapshot_locked(), side_a, lp_amount, amount_a_min, amount_b_min,
        holder_balance);

    ReserveLedger ledger = ledger_;
    PriceOracle oracle = oracle_;
    oracle.update(ledger.state().reserve0, ledger.state().reserve1, ctx.timestamp);
    ledger.apply_withdraw(plan.amount0(), plan.amount1(), plan.lp_burned);

    FeeState fee = fee_engine::step(fee_, ctx.fee_signal_bps);
    commit(ledger, oracle, fee);

    const Reserves& r = ledger_.state();
    log::logger()->debug("{} withdraw amount0={} amount1={} burned={} supply={}",
                         id_, to_string(plan.amount0()), to_string(plan.amount1()),
                         to_string(plan.lp_burned), to_string(r.total_supply));
    return LiquidityResult{plan.amount0(), plan.amount1(), plan.lp_burned,
                           r.reserve0, r.reserve1, r.total_supply};
}

// =============================================================================
// Flash Loans
// =============================================================================

FlashLoanResult Pair::flash_loan(Side side, I128 amount, const SettlementContext& ctx,
                                 const FlashCallback& callback) {
    check_reentry();
    if (!callback) {
        throw AmmError(errors::INVALID_ARGUMENT, "flash loan needs a callback");
    }
    std::unique_lock lock(mutex_);

    flash_.check_borrow();
    if (amount <= 0) {
        throw AmmError(errors::INSUFFICIENT_INPUT_AMOUNT, "flash amount must be positive");
    }
    if (amount >= ledger_.reserve(side)) {
        throw AmmError(errors::INSUFFICIENT_LIQUIDITY,
                       "flash amount " + to_string(amount) + " exceeds " +
                       to_string(side) + " reserve");
    }

    FlashLoan loan{id_, side, tokens_.token(side), amount, flash_.fee_for(amount)};

    flash_owner_.store(std::this_thread::get_id(), std::memory_order_release);
    I128 repaid;
    try {
        repaid = callback(loan);
    } catch (...) {
        flash_owner_.store(std::thread::id{}, std::memory_order_release);
        throw;
    }
    flash_owner_.store(std::thread::id{}, std::memory_order_release);

    if (repaid < loan.amount_owed()) {
        throw AmmError(errors::INSUFFICIENT_INPUT_AMOUNT,
                       "repaid " + to_string(repaid) + " of " +
                       to_string(loan.amount_owed()) + " owed");
    }

    ReserveLedger ledger = ledger_;
    PriceOracle oracle = oracle_;
    oracle.update(ledger.state().reserve0, ledger.state().reserve1, ctx.timestamp);
    ledger.apply_flash_repay(side, repaid - amount);

    FeeState fee = fee_engine::step(fee_, ctx.fee_signal_bps);
    commit(ledger, oracle, fee);

    log::logger()->debug("{} flash {} amount={} fee={} repaid={}",
                         id_, to_string(side), to_string(amount),
                         to_string(loan.fee), to_string(repaid));
    return FlashLoanResult{amount, loan.fee, repaid,
                           ledger_.state().reserve0, ledger_.state().reserve1};
}

void Pair::set_flash_loan_config(const FlashLoanConfig& config) {
    check_reentry();
    config.validate();
    std::unique_lock lock(mutex_);
    flash_ = config;
    log::logger()->info("{} flash config fee={}bps floor={} locked={}",
                        id_, config.fee_bps, to_string(config.fee_floor), config.locked);
}

} // namespace coral
