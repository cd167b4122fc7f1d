// Coral - Swap Quote Tests

#include "test_helpers.hpp"

#include <coral/quote.hpp>

#include <limits>

using namespace coral;
using coral_test::make_snapshot;

namespace {
constexpr I128 E10 = 10000000000LL;
}

TEST_CASE("Exact-in quote", "[quote]") {
    PairSnapshot snap = make_snapshot(E10, E10, E10);

    SwapQuote q = quote_engine::quote_exact_in(snap, Side::Zero, 1000000, 50, 1000, 60);

    SECTION("Amounts") {
        REQUIRE(q.trade_type == TradeType::EXACT_IN);
        REQUIRE(q.amount_in == 1000000);
        REQUIRE(q.amount_out == 996900);
        REQUIRE(q.amount_out_min == 991915);
        REQUIRE(q.amount_in_max == 1000000);
    }

    SECTION("Fee") {
        REQUIRE(q.fee_bps == 30);
        REQUIRE(q.fee_amount == 3000);
    }

    SECTION("Price impact includes the fee") {
        REQUIRE(q.price_impact_bps == 31);
        REQUIRE(q.price_impact_bps > 0);
        REQUIRE(q.price_impact_bps - q.fee_bps < q.fee_bps);
    }

    SECTION("Deadline") {
        REQUIRE(q.deadline == 1060);
    }

    SECTION("Zero slippage keeps the full output") {
        SwapQuote tight = quote_engine::quote_exact_in(snap, Side::Zero, 1000000, 0, 1000, 60);
        REQUIRE(tight.amount_out_min == tight.amount_out);
    }
}

TEST_CASE("Exact-out quote", "[quote]") {
    PairSnapshot snap = make_snapshot(E10, E10, E10);

    SwapQuote q = quote_engine::quote_exact_out(snap, Side::One, 996900, 50, 1000, 60);
    REQUIRE(q.trade_type == TradeType::EXACT_OUT);
    REQUIRE(q.side_in == Side::One);
    REQUIRE(q.amount_in == 1000000);
    REQUIRE(q.amount_out_min == 996900);
    REQUIRE(q.amount_in_max == 1005000);
}

TEST_CASE("Quote failures", "[quote]") {
    SECTION("Pair without reserves") {
        PairSnapshot empty = make_snapshot(0, 0, 0);
        REQUIRE_AMM_ERROR(quote_engine::quote_exact_in(empty, Side::Zero, 1000, 50, 0, 60),
                          errors::PAIR_NOT_FOUND);
    }

    SECTION("Output rounds to zero") {
        PairSnapshot snap = make_snapshot(E10, E10, E10);
        REQUIRE_AMM_ERROR(quote_engine::quote_exact_in(snap, Side::Zero, 1, 50, 0, 60),
                          errors::INSUFFICIENT_LIQUIDITY);
    }

    SECTION("Slippage above 100%") {
        PairSnapshot snap = make_snapshot(E10, E10, E10);
        REQUIRE_AMM_ERROR(quote_engine::quote_exact_in(snap, Side::Zero, 1000000, 10001, 0, 60),
                          errors::INVALID_ARGUMENT);
    }

    SECTION("Deadline overflow") {
        PairSnapshot snap = make_snapshot(E10, E10, E10);
        Timestamp now = std::numeric_limits<Timestamp>::max();
        REQUIRE_AMM_ERROR(quote_engine::quote_exact_in(snap, Side::Zero, 1000000, 50, now, 1),
                          errors::ARITHMETIC_OVERFLOW);
    }
}

TEST_CASE("Price impact", "[quote]") {
    REQUIRE(quote_engine::price_impact_bps(1000000, 996900, E10, E10) == 31);
    REQUIRE(quote_engine::price_impact_bps(1000, 900, 0, E10) == 0);
    REQUIRE(quote_engine::price_impact_bps(1000, 1000, E10, E10) == 0);
}

TEST_CASE("Deadline check", "[quote]") {
    REQUIRE_NOTHROW(quote_engine::check_deadline(1060, 1060));
    REQUIRE_AMM_ERROR(quote_engine::check_deadline(1060, 1061), errors::DEADLINE_EXCEEDED);
    REQUIRE(errors::should_requote(errors::DEADLINE_EXCEEDED));
    REQUIRE(errors::should_requote(errors::SLIPPAGE_EXCEEDED));
    REQUIRE_FALSE(errors::should_requote(errors::PAIR_NOT_FOUND));
}
