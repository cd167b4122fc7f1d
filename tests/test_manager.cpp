// Coral - Pair Manager Tests

#include "test_helpers.hpp"

#include <coral/manager.hpp>

#include <map>

using namespace coral;

namespace {

constexpr I128 E10 = 10000000000LL;

class MockDirectory : public IPairDirectory {
public:
    void add(const PairId& id, TokenPair tokens) { pairs_[id] = std::move(tokens); }

    std::optional<TokenPair> tokens_of(const PairId& pair_id) const override {
        auto it = pairs_.find(pair_id);
        if (it == pairs_.end()) return std::nullopt;
        return it->second;
    }

    std::optional<PairId> find_pair(const TokenId& token0,
                                    const TokenId& token1) const override {
        for (const auto& [id, tokens] : pairs_) {
            if (tokens.token0 == token0 && tokens.token1 == token1) return id;
        }
        return std::nullopt;
    }

private:
    std::map<PairId, TokenPair> pairs_;
};

class MockShares : public IShareLedger {
public:
    void set(const PairId& pair_id, const std::string& holder, I128 balance) {
        balances_[pair_id + "/" + holder] = balance;
    }

    I128 balance_of(const PairId& pair_id, const std::string& holder) const override {
        auto it = balances_.find(pair_id + "/" + holder);
        return it == balances_.end() ? 0 : it->second;
    }

private:
    std::map<std::string, I128> balances_;
};

struct Fixture {
    MockDirectory directory;
    MockShares shares;
    TokenId xlm{"XLM"};
    TokenId usdc{"USDC"};

    Fixture() {
        directory.add("USDC:XLM", TokenPair{usdc, xlm});
        directory.add("BAD", TokenPair{xlm, usdc});
    }
};

AddLiquidityRequest deposit(const TokenId& token_a, I128 a, I128 b) {
    AddLiquidityRequest req;
    req.token_a = token_a;
    req.amount_a_desired = a;
    req.amount_b_desired = b;
    return req;
}

} // namespace

TEST_CASE("Directory lookups", "[manager]") {
    Fixture f;
    PairManager manager(CoreConfig{}, f.directory, f.shares);

    SECTION("Sorted tokens resolve") {
        REQUIRE(manager.find_pair(f.usdc, f.xlm) == "USDC:XLM");
    }

    SECTION("Unsorted tokens") {
        REQUIRE_AMM_ERROR(manager.find_pair(f.xlm, f.usdc), errors::TOKENS_NOT_SORTED);
    }

    SECTION("Same token twice") {
        REQUIRE_AMM_ERROR(manager.find_pair(f.xlm, f.xlm), errors::INVALID_TOKEN);
    }

    SECTION("Unknown pair") {
        REQUIRE_AMM_ERROR(manager.find_pair(f.usdc, TokenId("ZZZ")), errors::PAIR_NOT_FOUND);
        REQUIRE_AMM_ERROR(manager.get_reserves("nope"), errors::PAIR_NOT_FOUND);
    }

    SECTION("Directory with unsorted tokens") {
        REQUIRE_AMM_ERROR(manager.get_reserves("BAD"), errors::TOKENS_NOT_SORTED);
    }
}

TEST_CASE("Pairs are created by their first deposit", "[manager]") {
    Fixture f;
    PairManager manager(CoreConfig{}, f.directory, f.shares);
    const PairId id = "USDC:XLM";

    SECTION("Known but empty pair reads as defaults") {
        REQUIRE_FALSE(manager.pair_exists(id));
        REQUIRE(manager.get_reserves(id).reserve0 == 0);
        REQUIRE(manager.get_fee_state(id).current_fee_bps == 30);
        REQUIRE(manager.get_flash_loan_config(id).fee_bps == 9);
        REQUIRE_AMM_ERROR(manager.quote_swap(id, f.xlm, 1000000, 50, 60, 0),
                          errors::PAIR_NOT_FOUND);
    }

    SECTION("Successful deposit creates the pair") {
        LiquidityResult r = manager.add_liquidity(id, deposit(f.usdc, 10000000, 40000000),
                                                  SettlementContext{100});
        REQUIRE(r.lp_amount == 20000000);
        REQUIRE(manager.pair_exists(id));
        REQUIRE(manager.get_reserves(id).reserve0 == 10000000);
        REQUIRE(manager.get_stats().total_pairs == 1);
    }

    SECTION("Deposit led by token1 lands on canonical sides") {
        manager.add_liquidity(id, deposit(f.xlm, 40000000, 10000000), SettlementContext{100});
        Reserves r = manager.get_reserves(id);
        REQUIRE(r.reserve0 == 10000000);
        REQUIRE(r.reserve1 == 40000000);
    }

    SECTION("Failed first deposit creates nothing") {
        REQUIRE_AMM_ERROR(manager.add_liquidity(id, deposit(f.usdc, 100, 100),
                                                SettlementContext{100}),
                          errors::INSUFFICIENT_INITIAL_LIQUIDITY);
        REQUIRE_FALSE(manager.pair_exists(id));
        REQUIRE(manager.get_stats().total_pairs == 0);
        REQUIRE(manager.get_stats().total_rejected == 1);
    }

    SECTION("Token outside the pair") {
        REQUIRE_AMM_ERROR(manager.add_liquidity(id, deposit(TokenId("BTC"), E10, E10),
                                                SettlementContext{100}),
                          errors::INVALID_TOKEN);
    }

    SECTION("Flash config needs a created pair") {
        REQUIRE_AMM_ERROR(manager.set_flash_loan_config(id, FlashLoanConfig{}),
                          errors::PAIR_NOT_FOUND);
    }
}

TEST_CASE("Quote then settle", "[manager]") {
    Fixture f;
    PairManager manager(CoreConfig{}, f.directory, f.shares);
    const PairId id = "USDC:XLM";
    manager.add_liquidity(id, deposit(f.usdc, E10, E10), SettlementContext{100});

    SwapQuote q = manager.quote_swap(id, f.usdc, 1000000, 50, 60, 1000);
    REQUIRE(q.amount_out == 996900);
    REQUIRE(q.amount_out_min == 991915);

    SwapRequest req;
    req.token_in = f.usdc;
    req.amount = q.amount_in;
    req.limit = q.amount_out_min;
    req.deadline = q.deadline;

    SECTION("Unchanged pool settles the quote") {
        SwapResult r = manager.execute_swap(id, req, SettlementContext{1010});
        REQUIRE(r.amount_out == q.amount_out);
        REQUIRE(manager.get_stats().total_swaps == 1);
    }

    SECTION("Moved pool breaks the minimum") {
        SwapRequest big;
        big.token_in = f.usdc;
        big.amount = 100000000;
        manager.execute_swap(id, big, SettlementContext{1005});

        bool requote = false;
        try {
            manager.execute_swap(id, req, SettlementContext{1010});
        } catch (const AmmError& e) {
            requote = errors::should_requote(e.code());
            REQUIRE(e.code() == errors::SLIPPAGE_EXCEEDED);
        }
        REQUIRE(requote);
    }

    SECTION("Executed after the deadline") {
        REQUIRE_AMM_ERROR(manager.execute_swap(id, req, SettlementContext{1061}),
                          errors::DEADLINE_EXCEEDED);
    }

    SECTION("Exact-out quote settles within its maximum") {
        SwapQuote out = manager.quote_swap_exact_out(id, f.xlm, 996900, 50, 60, 1000);
        REQUIRE(out.amount_in == 1000000);

        SwapRequest exact;
        exact.token_in = f.xlm;
        exact.trade_type = TradeType::EXACT_OUT;
        exact.amount = out.amount_out;
        exact.limit = out.amount_in_max;
        SwapResult r = manager.execute_swap(id, exact, SettlementContext{1010});
        REQUIRE(r.amount_in == 1000000);
    }

    SECTION("Cumulative prices advance") {
        manager.execute_swap(id, req, SettlementContext{1010});
        Observation obs = manager.get_cumulative_prices(id);
        REQUIRE(obs.timestamp == 1010);
        REQUIRE(obs.price0_cumulative == Q64 * 910);

        Observation later = manager.observe(id, 1020);
        REQUIRE(later.timestamp == 1020);
        REQUIRE(later.price0_cumulative > obs.price0_cumulative);
    }
}

TEST_CASE("Liquidity through the manager", "[manager]") {
    Fixture f;
    PairManager manager(CoreConfig{}, f.directory, f.shares);
    const PairId id = "USDC:XLM";
    manager.add_liquidity(id, deposit(f.usdc, 10000000, 40000000), SettlementContext{100});
    f.shares.set(id, "alice", 20000000);

    SECTION("Quote for a funded pool") {
        LiquidityQuote q = manager.quote_add_liquidity(id, f.usdc, 1000000, std::nullopt);
        REQUIRE(q.amount_b == 4000000);
        REQUIRE(q.estimated_lp_tokens == 2000000);
    }

    SECTION("Position from the share ledger") {
        f.shares.set(id, "bob", 5000000);
        LiquidityPosition pos = manager.get_position(id, "bob");
        REQUIRE(pos.share_x18 == X18_ONE / 4);
        REQUIRE(pos.token1_amount == 10000000);
    }

    SECTION("Withdrawal checks the holder's balance") {
        RemoveLiquidityRequest req;
        req.holder = "mallory";
        req.token_a = f.usdc;
        req.lp_amount = 1000000;
        REQUIRE_AMM_ERROR(manager.remove_liquidity(id, req, SettlementContext{200}),
                          errors::INSUFFICIENT_BALANCE);

        req.holder = "alice";
        LiquidityResult r = manager.remove_liquidity(id, req, SettlementContext{200});
        REQUIRE(r.amount0 == 500000);
        REQUIRE(r.amount1 == 2000000);
        REQUIRE(manager.get_stats().total_liquidity_ops == 2);
    }
}

TEST_CASE("Flash loans through the manager", "[manager]") {
    Fixture f;
    PairManager manager(CoreConfig{}, f.directory, f.shares);
    const PairId id = "USDC:XLM";
    manager.add_liquidity(id, deposit(f.usdc, E10, E10), SettlementContext{100});

    SECTION("Borrow and repay") {
        FlashLoanResult r = manager.flash_loan(id, f.xlm, 1000000, SettlementContext{200},
                                               [](const FlashLoan& loan) {
                                                   return loan.amount_owed();
                                               });
        REQUIRE(r.fee == 900);
        REQUIRE(manager.get_reserves(id).reserve1 == E10 + 900);
        REQUIRE(manager.get_stats().total_flash_loans == 1);
    }

    SECTION("Callback may not read the lending pair") {
        REQUIRE_AMM_ERROR(manager.flash_loan(id, f.xlm, 1000000, SettlementContext{200},
                                             [&](const FlashLoan& loan) {
                                                 manager.get_reserves(id);
                                                 return loan.amount_owed();
                                             }),
                          errors::REENTRANCY);
    }

    SECTION("Locked by configuration") {
        FlashLoanConfig locked;
        locked.locked = true;
        manager.set_flash_loan_config(id, locked);
        REQUIRE(manager.get_flash_loan_config(id).locked);
        REQUIRE_AMM_ERROR(manager.flash_loan(id, f.xlm, 1000, SettlementContext{200},
                                             [](const FlashLoan& loan) {
                                                 return loan.amount_owed();
                                             }),
                          errors::FLASH_LOANS_DISABLED);
    }
}

TEST_CASE("Per-pair configuration", "[manager]") {
    Fixture f;
    PairConfig tuned;
    tuned.fee.baseline_fee_bps = 10;
    tuned.minimum_liquidity = 10;
    CoreConfig config;
    config.with_pair("USDC:XLM", tuned);

    PairManager manager(config, f.directory, f.shares);
    const PairId id = "USDC:XLM";

    REQUIRE(manager.get_fee_state(id).current_fee_bps == 10);
    LiquidityResult r = manager.add_liquidity(id, deposit(f.usdc, 100, 100),
                                              SettlementContext{100});
    REQUIRE(r.lp_amount == 100);
}
