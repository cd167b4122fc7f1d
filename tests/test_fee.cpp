// Coral - Dynamic Fee Tests

#include "test_helpers.hpp"

#include <coral/fee.hpp>

using namespace coral;

TEST_CASE("Fee configuration validation", "[fee]") {
    FeeConfig cfg;
    REQUIRE_NOTHROW(fee_engine::validate(cfg));

    SECTION("min above max") {
        cfg.fee_min_bps = 200;
        REQUIRE_AMM_ERROR(fee_engine::validate(cfg), errors::INVALID_FEE_CONFIG);
    }

    SECTION("max at 100%") {
        cfg.fee_max_bps = 10000;
        REQUIRE_AMM_ERROR(fee_engine::validate(cfg), errors::INVALID_FEE_CONFIG);
    }

    SECTION("baseline outside bounds") {
        cfg.baseline_fee_bps = 1;
        REQUIRE_AMM_ERROR(fee_engine::validate(cfg), errors::INVALID_FEE_CONFIG);
    }

    SECTION("alpha outside (0, 1]") {
        cfg.ema_alpha_x18 = 0;
        REQUIRE_AMM_ERROR(fee_engine::validate(cfg), errors::INVALID_FEE_CONFIG);
        cfg.ema_alpha_x18 = X18_ONE + 1;
        REQUIRE_AMM_ERROR(fee_engine::validate(cfg), errors::INVALID_FEE_CONFIG);
    }

    SECTION("alpha of exactly one") {
        cfg.ema_alpha_x18 = X18_ONE;
        REQUIRE_NOTHROW(fee_engine::validate(cfg));
    }
}

TEST_CASE("EMA fee step", "[fee]") {
    FeeState state = fee_engine::initial_state(FeeConfig{});
    REQUIRE(state.current_fee_bps == 30);

    SECTION("Zero signal holds the baseline") {
        REQUIRE(fee_engine::next_fee(30, 0, state) == 30);
    }

    SECTION("Decays toward the baseline") {
        // 0.2 * 30 + 0.8 * 100
        REQUIRE(fee_engine::next_fee(100, 0, state) == 86);
    }

    SECTION("Rising fee rounds up") {
        // 0.2 * 30 + 0.8 * 26 = 26.8
        REQUIRE(fee_engine::next_fee(26, 0, state) == 27);
        // 0.2 * 30 + 0.8 * 29 = 29.2
        REQUIRE(fee_engine::next_fee(29, 0, state) == 30);
    }

    SECTION("Falling fee rounds down") {
        // 0.2 * 30 + 0.8 * 31 = 30.8
        REQUIRE(fee_engine::next_fee(31, 0, state) == 30);
    }

    SECTION("Positive signal raises the fee") {
        // 0.2 * 80 + 0.8 * 30
        REQUIRE(fee_engine::next_fee(30, 50, state) == 40);
    }

    SECTION("Full weight jumps to the target") {
        state.ema_alpha_x18 = X18_ONE;
        REQUIRE(fee_engine::next_fee(30, 20, state) == 50);
    }
}

TEST_CASE("Fee stays within bounds under extreme signals", "[fee]") {
    FeeState state = fee_engine::initial_state(FeeConfig{});

    SECTION("Far above baseline") {
        for (int i = 0; i < 50; ++i) {
            state = fee_engine::step(state, 1000000);
            REQUIRE(state.current_fee_bps <= state.fee_max_bps);
            REQUIRE(state.current_fee_bps >= state.fee_min_bps);
        }
        REQUIRE(state.current_fee_bps == 100);
    }

    SECTION("Far below baseline") {
        for (int i = 0; i < 50; ++i) {
            state = fee_engine::step(state, -1000000);
            REQUIRE(state.current_fee_bps >= state.fee_min_bps);
        }
        REQUIRE(state.current_fee_bps == 5);
    }

    SECTION("Zero signal returns to the baseline from the minimum") {
        state.current_fee_bps = state.fee_min_bps;
        for (int i = 0; i < 100; ++i) {
            state = fee_engine::step(state, 0);
        }
        REQUIRE(state.current_fee_bps == state.baseline_fee_bps);
    }

    SECTION("Zero signal returns to the baseline from the maximum") {
        state.current_fee_bps = state.fee_max_bps;
        for (int i = 0; i < 100; ++i) {
            state = fee_engine::step(state, 0);
        }
        REQUIRE(state.current_fee_bps == state.baseline_fee_bps);
    }

    SECTION("Bounds and alpha carry through a step") {
        FeeState next = fee_engine::step(state, 0);
        REQUIRE(next.fee_min_bps == state.fee_min_bps);
        REQUIRE(next.fee_max_bps == state.fee_max_bps);
        REQUIRE(next.ema_alpha_x18 == state.ema_alpha_x18);
    }
}
