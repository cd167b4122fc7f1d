#ifndef CORAL_FEE_HPP
#define CORAL_FEE_HPP

#include "types.hpp"

namespace coral {

// =============================================================================
// Fee Configuration & State
// =============================================================================

struct FeeConfig {
    uint32_t fee_min_bps = 5;
    uint32_t fee_max_bps = 100;
    uint32_t baseline_fee_bps = 30;
    I128 ema_alpha_x18 = X18_ONE / 5;   // Weight of the new target, (0, 1]
};

struct FeeState {
    uint32_t current_fee_bps;
    uint32_t fee_min_bps;
    uint32_t fee_max_bps;
    uint32_t baseline_fee_bps;
    I128 ema_alpha_x18;
};

// =============================================================================
// DynamicFeeEngine
//
// Pure EMA step. The signal is an externally metered scalar in basis points
// (positive when the pair is stressed, negative when calm); it shifts the
// target away from the baseline. With a zero signal the fee decays toward
// the baseline at rate alpha. The result is always clamped to [min, max].
// =============================================================================

namespace fee_engine {

// Throws AmmError{INVALID_FEE_CONFIG} when min > max, max >= 10000, the
// baseline lies outside [min, max], or alpha is outside (0, 1e18].
void validate(const FeeConfig& config);

// Validated initial state; the fee starts at the baseline
FeeState initial_state(const FeeConfig& config);

// fee = clamp(target * alpha + prev * (1 - alpha), min, max), rounded up
// when the fee rises and down when it falls
// with target = clamp(baseline + signal, 0, 10000)
uint32_t next_fee(uint32_t prev_fee_bps, int32_t signal_bps, const FeeState& state);

// State after one mutation
FeeState step(const FeeState& state, int32_t signal_bps);

} // namespace fee_engine

} // namespace coral

#endif // CORAL_FEE_HPP
