// =============================================================================
// fee.cpp - EMA-driven dynamic fee
// =============================================================================

#include "coral/fee.hpp"
#include "coral/units.hpp"

#include <algorithm>

namespace coral {
namespace fee_engine {

void validate(const FeeConfig& config) {
    if (config.fee_min_bps > config.fee_max_bps) {
        throw AmmError(errors::INVALID_FEE_CONFIG,
                       "fee_min " + std::to_string(config.fee_min_bps) +
                       " > fee_max " + std::to_string(config.fee_max_bps));
    }
    if (config.fee_max_bps >= BPS_DENOMINATOR) {
        throw AmmError(errors::INVALID_FEE_CONFIG,
                       "fee_max must be below " + std::to_string(BPS_DENOMINATOR));
    }
    if (config.baseline_fee_bps < config.fee_min_bps ||
        config.baseline_fee_bps > config.fee_max_bps) {
        throw AmmError(errors::INVALID_FEE_CONFIG, "baseline outside fee bounds");
    }
    if (config.ema_alpha_x18 <= 0 || config.ema_alpha_x18 > X18_ONE) {
        throw AmmError(errors::INVALID_FEE_CONFIG,
                       "ema_alpha " + from_atomic(config.ema_alpha_x18, 18) +
                       " outside (0, 1]");
    }
}

FeeState initial_state(const FeeConfig& config) {
    validate(config);
    return FeeState{
        config.baseline_fee_bps,
        config.fee_min_bps,
        config.fee_max_bps,
        config.baseline_fee_bps,
        config.ema_alpha_x18
    };
}

uint32_t next_fee(uint32_t prev_fee_bps, int32_t signal_bps, const FeeState& state) {
    int64_t target = static_cast<int64_t>(state.baseline_fee_bps) + signal_bps;
    target = std::clamp<int64_t>(target, 0, BPS_DENOMINATOR);

    // Bounded: target, prev <= 10000 and alpha <= 1e18, so this fits I128
    I128 blended = static_cast<I128>(target) * state.ema_alpha_x18 +
                   static_cast<I128>(prev_fee_bps) * (X18_ONE - state.ema_alpha_x18);
    // Round toward the target
    I128 fee = blended / X18_ONE;
    if (target > prev_fee_bps && fee * X18_ONE < blended) {
        ++fee;
    }

    fee = std::clamp<I128>(fee, state.fee_min_bps, state.fee_max_bps);
    return static_cast<uint32_t>(fee);
}

FeeState step(const FeeState& state, int32_t signal_bps) {
    FeeState next = state;
    next.current_fee_bps = next_fee(state.current_fee_bps, signal_bps, state);
    return next;
}

} // namespace fee_engine
} // namespace coral
