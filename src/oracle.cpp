// =============================================================================
// oracle.cpp - Cumulative-price TWAP accumulator
// =============================================================================

#include "coral/oracle.hpp"
#include "coral/math.hpp"

namespace coral {

TwapPrice PriceOracle::spot_price(I128 reserve0, I128 reserve1) {
    if (reserve0 <= 0 || reserve1 <= 0) {
        return {0, 0};
    }
    // Reserves are capped at 2^64 - 1, so both quotients fit 128 bits
    return {
        fixed_point::mul_div_u(static_cast<U128>(reserve1), Q64, static_cast<U128>(reserve0)),
        fixed_point::mul_div_u(static_cast<U128>(reserve0), Q64, static_cast<U128>(reserve1))
    };
}

Observation PriceOracle::observe(I128 reserve0, I128 reserve1, Timestamp now) const {
    Observation obs = last_;
    if (now <= last_.timestamp) {
        return obs;
    }

    U128 elapsed = now - last_.timestamp;
    TwapPrice spot = spot_price(reserve0, reserve1);

    // Accumulators wrap modulo 2^128
    obs.price0_cumulative += spot.price0_q64 * elapsed;
    obs.price1_cumulative += spot.price1_q64 * elapsed;
    obs.timestamp = now;
    return obs;
}

void PriceOracle::update(I128 reserve0, I128 reserve1, Timestamp now) {
    last_ = observe(reserve0, reserve1, now);
}

TwapPrice PriceOracle::twap(const Observation& older, const Observation& newer) {
    if (newer.timestamp < older.timestamp) {
        throw AmmError(errors::INVALID_ARGUMENT, "observations out of order");
    }
    if (newer.timestamp == older.timestamp) {
        throw AmmError(errors::DIVISION_BY_ZERO, "no time elapsed between observations");
    }

    U128 elapsed = newer.timestamp - older.timestamp;
    return {
        (newer.price0_cumulative - older.price0_cumulative) / elapsed,
        (newer.price1_cumulative - older.price1_cumulative) / elapsed
    };
}

} // namespace coral
