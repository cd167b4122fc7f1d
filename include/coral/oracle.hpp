#ifndef CORAL_ORACLE_HPP
#define CORAL_ORACLE_HPP

#include "types.hpp"

namespace coral {

// UQ64.64 scale for oracle prices
constexpr U128 Q64 = U128(1) << 64;

// =============================================================================
// Cumulative Price Observation
// =============================================================================

struct Observation {
    U128 price0_cumulative;   // Sum of UQ64.64 (reserve1/reserve0) * seconds, mod 2^128
    U128 price1_cumulative;   // Sum of UQ64.64 (reserve0/reserve1) * seconds, mod 2^128
    Timestamp timestamp;
};

struct TwapPrice {
    U128 price0_q64;          // Average token1 per token0
    U128 price1_q64;          // Average token0 per token1
};

// =============================================================================
// PriceOracle - TWAP Accumulator
//
// Consumption pattern: take two observations at t1 < t2 and call
// twap(o1, o2). The difference of the cumulatives divided by t2 - t1 is the
// time-weighted average price over that window. A single cumulative value is
// not a price. The accumulators wrap modulo 2^128; differencing in unsigned
// arithmetic stays correct across a wrap.
// =============================================================================

class PriceOracle {
public:
    PriceOracle() = default;
    explicit PriceOracle(const Observation& last) : last_(last) {}

    // Accumulate the spot price of the reserves in effect since the last
    // update. Runs before new reserves are applied. A repeat or earlier
    // timestamp is a no-op: time never moves backwards and each second is
    // counted once.
    void update(I128 reserve0, I128 reserve1, Timestamp now);

    // Counterfactual cumulatives as of `now`, without mutating state
    Observation observe(I128 reserve0, I128 reserve1, Timestamp now) const;

    const Observation& last() const { return last_; }

    // UQ64.64 spot prices; both zero when either reserve is empty
    static TwapPrice spot_price(I128 reserve0, I128 reserve1);

    // Time-weighted average between two observations.
    // Throws AmmError{DIVISION_BY_ZERO} when no time elapsed and
    // AmmError{INVALID_ARGUMENT} when `newer` precedes `older`.
    static TwapPrice twap(const Observation& older, const Observation& newer);

private:
    Observation last_{0, 0, 0};
};

} // namespace coral

#endif // CORAL_ORACLE_HPP
