// =============================================================================
// quote.cpp - Exact-in / exact-out swap quotes
// =============================================================================

#include "coral/quote.hpp"
#include "coral/math.hpp"

namespace coral {
namespace quote_engine {

namespace {

void check_quotable(const PairSnapshot& snapshot, uint32_t slippage_bps) {
    if (!snapshot.has_liquidity()) {
        throw AmmError(errors::PAIR_NOT_FOUND,
                       "pair " + snapshot.pair_id + " has no reserves");
    }
    if (slippage_bps > BPS_DENOMINATOR) {
        throw AmmError(errors::INVALID_ARGUMENT,
                       "slippage " + std::to_string(slippage_bps) + " bps above 100%");
    }
}

} // anonymous namespace

Timestamp deadline_after(Timestamp now, uint64_t ttl_seconds) {
    Timestamp deadline;
    if (__builtin_add_overflow(now, ttl_seconds, &deadline)) {
        throw AmmError(errors::ARITHMETIC_OVERFLOW, "deadline overflows");
    }
    return deadline;
}

void check_deadline(Timestamp deadline, Timestamp now) {
    if (now > deadline) {
        throw AmmError(errors::DEADLINE_EXCEEDED,
                       "executed at " + std::to_string(now) + " after deadline " +
                       std::to_string(deadline));
    }
}

uint32_t price_impact_bps(I128 amount_in, I128 amount_out,
                          I128 reserve_in, I128 reserve_out) {
    if (reserve_in <= 0 || reserve_out <= 0 || amount_in <= 0) {
        return 0;
    }
    I128 ideal = fixed_point::mul_div(amount_in, reserve_out, reserve_in);
    if (ideal == 0 || amount_out >= ideal) {
        return 0;
    }
    return static_cast<uint32_t>(
        fixed_point::mul_div(ideal - amount_out, BPS_DENOMINATOR, ideal));
}

SwapQuote quote_exact_in(const PairSnapshot& snapshot, Side side_in, I128 amount_in,
                         uint32_t slippage_bps, Timestamp now, uint64_t ttl_seconds) {
    check_quotable(snapshot, slippage_bps);

    I128 reserve_in = snapshot.reserves.reserve(side_in);
    I128 reserve_out = snapshot.reserves.reserve(opposite(side_in));
    uint32_t fee_bps = snapshot.fee.current_fee_bps;

    SwapQuote quote{};
    quote.trade_type = TradeType::EXACT_IN;
    quote.side_in = side_in;
    quote.amount_in = amount_in;
    quote.amount_out = cp_math::get_amount_out(amount_in, reserve_in, reserve_out, fee_bps);
    quote.amount_out_min = fixed_point::mul_div(
        quote.amount_out, BPS_DENOMINATOR - slippage_bps, BPS_DENOMINATOR);
    quote.amount_in_max = amount_in;
    quote.fee_bps = fee_bps;
    quote.fee_amount = fixed_point::mul_div(amount_in, fee_bps, BPS_DENOMINATOR);
    quote.price_impact_bps = price_impact_bps(amount_in, quote.amount_out,
                                              reserve_in, reserve_out);
    quote.deadline = deadline_after(now, ttl_seconds);
    return quote;
}

SwapQuote quote_exact_out(const PairSnapshot& snapshot, Side side_in, I128 amount_out,
                          uint32_t slippage_bps, Timestamp now, uint64_t ttl_seconds) {
    check_quotable(snapshot, slippage_bps);

    I128 reserve_in = snapshot.reserves.reserve(side_in);
    I128 reserve_out = snapshot.reserves.reserve(opposite(side_in));
    uint32_t fee_bps = snapshot.fee.current_fee_bps;

    SwapQuote quote{};
    quote.trade_type = TradeType::EXACT_OUT;
    quote.side_in = side_in;
    quote.amount_in = cp_math::get_amount_in(amount_out, reserve_in, reserve_out, fee_bps);
    quote.amount_out = amount_out;
    quote.amount_out_min = amount_out;
    quote.amount_in_max = fixed_point::mul_div_up(
        quote.amount_in, BPS_DENOMINATOR + slippage_bps, BPS_DENOMINATOR);
    quote.fee_bps = fee_bps;
    quote.fee_amount = fixed_point::mul_div(quote.amount_in, fee_bps, BPS_DENOMINATOR);
    quote.price_impact_bps = price_impact_bps(quote.amount_in, amount_out,
                                              reserve_in, reserve_out);
    quote.deadline = deadline_after(now, ttl_seconds);
    return quote;
}

} // namespace quote_engine
} // namespace coral
