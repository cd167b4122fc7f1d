#ifndef CORAL_QUOTE_HPP
#define CORAL_QUOTE_HPP

#include "types.hpp"
#include "snapshot.hpp"

namespace coral {

// =============================================================================
// Swap Quote
// =============================================================================

struct SwapQuote {
    TradeType trade_type;
    Side side_in;
    I128 amount_in;
    I128 amount_out;
    I128 amount_out_min;      // Exact-in guard: floor(out * (10000 - slippage) / 10000)
    I128 amount_in_max;       // Exact-out guard: ceil(in * (10000 + slippage) / 10000)
    uint32_t fee_bps;         // Fee in effect for the snapshot
    I128 fee_amount;          // Portion of amount_in retained as fee
    uint32_t price_impact_bps;
    Timestamp deadline;       // Settlement rejects execution after this
};

// =============================================================================
// SwapQuoteEngine
// =============================================================================

namespace quote_engine {

// Quote a fixed input. Throws AmmError{PAIR_NOT_FOUND} for a pair without
// reserves, INSUFFICIENT_LIQUIDITY when no positive output is possible and
// INVALID_ARGUMENT for slippage above 10000 bps.
SwapQuote quote_exact_in(const PairSnapshot& snapshot, Side side_in, I128 amount_in,
                         uint32_t slippage_bps, Timestamp now, uint64_t ttl_seconds);

// Quote a fixed output
SwapQuote quote_exact_out(const PairSnapshot& snapshot, Side side_in, I128 amount_out,
                          uint32_t slippage_bps, Timestamp now, uint64_t ttl_seconds);

// (ideal - out) * 10000 / ideal with ideal = amount_in * reserve_out / reserve_in.
// Zero when either reserve or the ideal amount is zero.
uint32_t price_impact_bps(I128 amount_in, I128 amount_out,
                          I128 reserve_in, I128 reserve_out);

// now + ttl, overflow-checked
Timestamp deadline_after(Timestamp now, uint64_t ttl_seconds);

// Throws AmmError{DEADLINE_EXCEEDED} when now > deadline
void check_deadline(Timestamp deadline, Timestamp now);

} // namespace quote_engine

} // namespace coral

#endif // CORAL_QUOTE_HPP
