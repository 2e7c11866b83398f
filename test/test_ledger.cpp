// xlend - Collateral ledger tests

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "mocks.hpp"

using namespace xlend;
using namespace xlend::test;
using Catch::Approx;

namespace {

void require_solvent(const CollateralLedger& ledger) {
    for (const auto& asset : ledger.assets()) {
        REQUIRE(ledger.total_borrowed(asset) <= ledger.total_deposited(asset));
    }
}

} // namespace

TEST_CASE("Deposit validation", "[ledger]") {
    LedgerFixture f;

    REQUIRE(f.ledger.deposit(ALICE, WETH, 0) == errors::ZERO_AMOUNT);
    REQUIRE(f.ledger.deposit(ALICE, WETH, -5) == errors::ZERO_AMOUNT);
    REQUIRE(f.ledger.deposit(ALICE, Currency{make_address(0xDEAD)}, tokens(1)) == errors::UNSUPPORTED_ASSET);
    REQUIRE(f.ledger.register_asset(WETH) == errors::ALREADY_REGISTERED);
    REQUIRE(f.ledger.register_asset(Currency{make_address(0xDEAD)}, 10001) == errors::INVALID_CONFIG);
}

TEST_CASE("Deposit then withdraw leaves state unchanged", "[ledger]") {
    LedgerFixture f;
    REQUIRE(f.ledger.deposit(BOB, WETH, tokens(3)) == errors::OK);

    I128 total_before = f.ledger.total_deposited(WETH);
    auto balance_before = f.ledger.token_collateral(ALICE, WETH).deposited;

    REQUIRE(f.ledger.deposit(ALICE, WETH, tokens(7)) == errors::OK);
    REQUIRE(f.ledger.token_collateral(ALICE, WETH).deposited == tokens(7));
    REQUIRE(f.ledger.withdraw(ALICE, WETH, tokens(7)) == errors::OK);

    REQUIRE(f.ledger.total_deposited(WETH) == total_before);
    REQUIRE(f.ledger.token_collateral(ALICE, WETH).deposited == balance_before);
    REQUIRE(f.ledger.withdraw(ALICE, WETH, 1) == errors::INSUFFICIENT_BALANCE);
}

TEST_CASE("Native asset position", "[ledger]") {
    LedgerFixture f;
    f.oracle.set_price(NATIVE, x18::from_int(2000));
    REQUIRE(f.ledger.register_asset(NATIVE) == errors::OK);

    REQUIRE(f.ledger.deposit(ALICE, NATIVE, tokens(4)) == errors::OK);
    REQUIRE(f.ledger.borrow(ALICE, NATIVE, tokens(1)) == errors::OK);

    Position p = f.ledger.position(ALICE);
    REQUIRE(p.collateral == tokens(4));
    REQUIRE(p.debt == tokens(1));
    REQUIRE(p.borrowed_usd == x18::from_int(2000));
    REQUIRE(p.last_update == *f.time.now);
}

TEST_CASE("Borrow limited by health factor", "[ledger]") {
    LedgerFixture f;
    REQUIRE(f.ledger.deposit(BOB, USDC, tokens(50000)) == errors::OK);

    // 10 WETH at $2000 = $20,000 of collateral
    REQUIRE(f.ledger.deposit(ALICE, WETH, tokens(10)) == errors::OK);
    REQUIRE(f.ledger.health_factor(ALICE) == UNBOUNDED_HEALTH);

    SECTION("Borrow above break-even fails") {
        REQUIRE(f.ledger.borrow(ALICE, USDC, tokens(10001)) == errors::UNDERCOLLATERALIZED);
        REQUIRE(f.ledger.token_collateral(ALICE, USDC).borrowed == 0);
        REQUIRE(f.ledger.total_borrowed(USDC) == 0);
    }

    SECTION("Borrow to exactly health factor 100 succeeds") {
        REQUIRE(f.ledger.borrow(ALICE, USDC, tokens(10000)) == errors::OK);
        REQUIRE(f.ledger.health_factor(ALICE) == uint64_t{100});
        REQUIRE(f.ledger.position(ALICE).borrowed_usd == x18::from_int(10000));

        // Any further debt drops below 100
        REQUIRE(f.ledger.borrow(ALICE, USDC, tokens(1)) == errors::UNDERCOLLATERALIZED);
        require_solvent(f.ledger);
    }

    SECTION("Collateral factor scales borrowing power") {
        REQUIRE(f.ledger.set_collateral_factor(WETH, 5000) == errors::OK);
        REQUIRE(f.ledger.borrow(ALICE, USDC, tokens(5001)) == errors::UNDERCOLLATERALIZED);
        REQUIRE(f.ledger.borrow(ALICE, USDC, tokens(5000)) == errors::OK);
    }

    SECTION("Missing price blocks the borrow") {
        Currency dai{make_address(0xDA1)};
        REQUIRE(f.ledger.register_asset(dai) == errors::OK);
        REQUIRE(f.ledger.deposit(BOB, dai, tokens(1000)) == errors::OK);
        REQUIRE(f.ledger.borrow(ALICE, dai, tokens(1)) == errors::ORACLE_UNAVAILABLE);
    }
}

TEST_CASE("Borrow limited by pool liquidity", "[ledger]") {
    LedgerFixture f;
    REQUIRE(f.ledger.deposit(BOB, USDC, tokens(100)) == errors::OK);
    REQUIRE(f.ledger.deposit(ALICE, WETH, tokens(10)) == errors::OK);

    REQUIRE(f.ledger.available_liquidity(USDC) == tokens(100));
    REQUIRE(f.ledger.borrow(ALICE, USDC, tokens(101)) == errors::INSUFFICIENT_LIQUIDITY);
    REQUIRE(f.ledger.borrow(ALICE, USDC, tokens(100)) == errors::OK);
    REQUIRE(f.ledger.available_liquidity(USDC) == 0);
    require_solvent(f.ledger);
}

TEST_CASE("Interest accrual", "[ledger]") {
    LedgerFixture f;
    REQUIRE(f.ledger.deposit(BOB, USDC, tokens(50000)) == errors::OK);
    REQUIRE(f.ledger.deposit(ALICE, WETH, tokens(10)) == errors::OK);
    REQUIRE(f.ledger.borrow(ALICE, USDC, tokens(10000)) == errors::OK);

    SECTION("Twice in the same instant changes nothing") {
        f.time.advance(3600);
        f.ledger.accrue_interest(ALICE, USDC);
        I128 borrowed = f.ledger.token_collateral(ALICE, USDC).borrowed;

        REQUIRE(f.ledger.accrue_interest(ALICE, USDC) == 0);
        REQUIRE(f.ledger.token_collateral(ALICE, USDC).borrowed == borrowed);
    }

    SECTION("One year at 20% utilization") {
        // 200 + 400 * 0.2 / 0.8 = 300 bps
        REQUIRE(f.ledger.current_rate_bps(USDC) == 300);

        f.time.advance(SECONDS_PER_YEAR);
        I128 interest = f.ledger.accrue_interest(ALICE, USDC);
        REQUIRE(x18::to_double(interest) == Approx(300.0).epsilon(1e-6));

        // Interest is owed to the pool and keeps it solvent
        REQUIRE(f.ledger.total_borrowed(USDC) == tokens(10000) + interest);
        REQUIRE(f.ledger.total_deposited(USDC) == tokens(50000) + interest);
        require_solvent(f.ledger);
    }

    SECTION("Repay accrues first") {
        f.time.advance(SECONDS_PER_YEAR);
        RepayResult r = f.ledger.repay(ALICE, USDC, tokens(10000));
        REQUIRE(r.code == errors::OK);
        REQUIRE(r.repaid == tokens(10000));
        REQUIRE(f.ledger.token_collateral(ALICE, USDC).borrowed > 0);
    }
}

TEST_CASE("Repay refunds overpayment", "[ledger]") {
    LedgerFixture f;
    REQUIRE(f.ledger.deposit(BOB, USDC, tokens(1000)) == errors::OK);
    REQUIRE(f.ledger.deposit(ALICE, WETH, tokens(1)) == errors::OK);
    REQUIRE(f.ledger.borrow(ALICE, USDC, tokens(500)) == errors::OK);

    RepayResult r = f.ledger.repay(ALICE, USDC, tokens(800));
    REQUIRE(r.code == errors::OK);
    REQUIRE(r.repaid == tokens(500));
    REQUIRE(r.refund == tokens(300));
    REQUIRE(f.ledger.token_collateral(ALICE, USDC).borrowed == 0);
    REQUIRE(f.ledger.total_borrowed(USDC) == 0);
    REQUIRE(f.ledger.reserves(USDC) == tokens(1000));
    REQUIRE(f.ledger.position(ALICE).borrowed_usd == 0);

    REQUIRE(f.ledger.repay(ALICE, USDC, 0).code == errors::ZERO_AMOUNT);
}

TEST_CASE("Withdraw keeps the position healthy", "[ledger]") {
    LedgerFixture f;
    REQUIRE(f.ledger.deposit(BOB, USDC, tokens(50000)) == errors::OK);
    REQUIRE(f.ledger.deposit(ALICE, WETH, tokens(10)) == errors::OK);
    REQUIRE(f.ledger.borrow(ALICE, USDC, tokens(5000)) == errors::OK);

    // $20,000 - 6 WETH = $8,000 against $5,000 of debt: HF 60
    REQUIRE(f.ledger.withdraw(ALICE, WETH, tokens(6)) == errors::UNDERCOLLATERALIZED);
    // $20,000 - 5 WETH = $10,000: HF 100
    REQUIRE(f.ledger.withdraw(ALICE, WETH, tokens(5)) == errors::OK);

    SECTION("Lent-out funds cannot be withdrawn") {
        REQUIRE(f.ledger.withdraw(BOB, USDC, tokens(45001)) == errors::INSUFFICIENT_LIQUIDITY);
        REQUIRE(f.ledger.withdraw(BOB, USDC, tokens(45000)) == errors::OK);
    }
}

TEST_CASE("Liquidation", "[ledger]") {
    LedgerFixture f;
    REQUIRE(f.ledger.deposit(BOB, USDC, tokens(50000)) == errors::OK);
    REQUIRE(f.ledger.deposit(ALICE, WETH, tokens(10)) == errors::OK);
    REQUIRE(f.ledger.borrow(ALICE, USDC, tokens(10000)) == errors::OK);

    SECTION("Healthy positions cannot be liquidated") {
        auto r = f.ledger.liquidate(CAROL, ALICE, USDC, tokens(1000), WETH);
        REQUIRE(r.code == errors::NOT_LIQUIDATABLE);
    }

    SECTION("Price drop opens the position") {
        f.oracle.set_price(WETH, x18::from_int(1500));
        REQUIRE(f.ledger.health_factor(ALICE) == uint64_t{50});

        // Capped at 50% of the debt; 5% bonus paid in collateral
        auto r = f.ledger.liquidate(CAROL, ALICE, USDC, tokens(8000), WETH);
        REQUIRE(r.code == errors::OK);
        REQUIRE(r.repaid == tokens(5000));
        REQUIRE(r.seized == x18::from_double(3.5));

        REQUIRE(f.ledger.token_collateral(ALICE, USDC).borrowed == tokens(5000));
        REQUIRE(f.ledger.token_collateral(ALICE, WETH).deposited == x18::from_double(6.5));
        REQUIRE(f.ledger.token_collateral(CAROL, WETH).deposited == x18::from_double(3.5));
        require_solvent(f.ledger);
    }

    SECTION("Self-liquidation rejected") {
        f.oracle.set_price(WETH, x18::from_int(1500));
        REQUIRE(f.ledger.liquidate(ALICE, ALICE, USDC, tokens(100), WETH).code == errors::UNAUTHORIZED);
    }
}

TEST_CASE("Rate modes", "[ledger]") {
    LedgerFixture f;
    REQUIRE(f.ledger.deposit(BOB, USDC, tokens(50000)) == errors::OK);
    REQUIRE(f.ledger.deposit(ALICE, WETH, tokens(10)) == errors::OK);
    REQUIRE(f.ledger.borrow(ALICE, USDC, tokens(1000)) == errors::OK);

    REQUIRE(f.ledger.set_rate_mode(ALICE, USDC, RateMode::STABLE) == errors::OK);
    auto tc = f.ledger.token_collateral(ALICE, USDC);
    REQUIRE(tc.rate_mode == RateMode::STABLE);
    REQUIRE(tc.stable_rate_x18 ==
            f.ledger.current_rate(USDC) + InterestRateModel::from_annual_bps(200));
    REQUIRE(tc.stable_locked_until == *f.time.now + 30 * 86400);

    SECTION("Locked for 30 days") {
        REQUIRE(f.ledger.set_rate_mode(ALICE, USDC, RateMode::VARIABLE) == errors::STABLE_RATE_LOCKED);
        REQUIRE(f.ledger.rebalance_stable_rate(ALICE, USDC) == errors::STABLE_RATE_LOCKED);

        f.time.advance(30 * 86400);
        REQUIRE(f.ledger.rebalance_stable_rate(ALICE, USDC) == errors::OK);
        REQUIRE(f.ledger.token_collateral(ALICE, USDC).stable_locked_until == *f.time.now + 30 * 86400);
    }

    SECTION("Stable debt accrues at the snapshot rate") {
        I128 snapshot = tc.stable_rate_x18;
        REQUIRE(f.ledger.deposit(CAROL, USDC, tokens(1)) == errors::OK);
        f.time.advance(86400);
        I128 interest = f.ledger.accrue_interest(ALICE, USDC);
        REQUIRE(interest == InterestRateModel::interest(tokens(1000), snapshot, 86400));
    }

    SECTION("Variable positions cannot rebalance") {
        REQUIRE(f.ledger.rebalance_stable_rate(BOB, USDC) == errors::INVALID_STATE);
    }
}

TEST_CASE("External debt bookkeeping", "[ledger]") {
    LedgerFixture f;
    REQUIRE(f.ledger.deposit(ALICE, WETH, tokens(10)) == errors::OK);

    const FundingSource market{1, 11155111};
    REQUIRE(f.ledger.record_external_debt(ALICE, USDC, market, tokens(4000), 500) == errors::OK);

    auto tc = f.ledger.token_collateral(ALICE, USDC);
    REQUIRE(tc.borrowed == tokens(4000));
    REQUIRE(tc.external_borrowed() == tokens(4000));
    REQUIRE(tc.local_borrowed() == 0);
    REQUIRE(f.ledger.health_factor(ALICE) == uint64_t{400});

    // The local pool never lent anything
    REQUIRE(f.ledger.total_borrowed(USDC) == 0);
    REQUIRE(f.ledger.total_deposited(USDC) == 0);

    SECTION("Accrues at the quoted rate, owed to the lender") {
        f.time.advance(SECONDS_PER_YEAR);
        I128 interest = f.ledger.accrue_interest(ALICE, USDC);
        REQUIRE(interest == InterestRateModel::interest(tokens(4000), InterestRateModel::from_annual_bps(500),
                                                        SECONDS_PER_YEAR));
        REQUIRE(f.ledger.token_collateral(ALICE, USDC).external.at(market).amount == tokens(4000) + interest);
        REQUIRE(f.ledger.total_borrowed(USDC) == 0);
        REQUIRE(f.ledger.total_deposited(USDC) == 0);
    }

    SECTION("Local repay leaves it alone") {
        RepayResult r = f.ledger.repay(ALICE, USDC, tokens(100));
        REQUIRE(r.code == errors::OK);
        REQUIRE(r.repaid == 0);
        REQUIRE(r.refund == tokens(100));
        REQUIRE(f.ledger.reserves(USDC) == 0);
        REQUIRE(f.ledger.token_collateral(ALICE, USDC).borrowed == tokens(4000));
    }

    SECTION("Settling pays the lender down") {
        REQUIRE(f.ledger.settle_external_debt(ALICE, USDC, market, tokens(1000)) == errors::OK);
        auto debt = f.ledger.token_collateral(ALICE, USDC).external.at(market);
        REQUIRE(debt.amount == tokens(3000));
        REQUIRE(debt.principal == tokens(3000));

        REQUIRE(f.ledger.settle_external_debt(ALICE, USDC, market, tokens(5000)) == errors::OK);
        REQUIRE(f.ledger.token_collateral(ALICE, USDC).external.empty());
        REQUIRE(f.ledger.health_factor(ALICE) == UNBOUNDED_HEALTH);
        REQUIRE(f.ledger.settle_external_debt(ALICE, USDC, market, tokens(1)) == errors::INVALID_STATE);
    }

    SECTION("Release undoes a failed transfer once") {
        REQUIRE(f.ledger.release_external_debt(ALICE, USDC, market, tokens(4000)) == errors::OK);
        REQUIRE(f.ledger.token_collateral(ALICE, USDC).borrowed == 0);
        REQUIRE(f.ledger.health_factor(ALICE) == UNBOUNDED_HEALTH);

        REQUIRE(f.ledger.release_external_debt(ALICE, USDC, market, tokens(4000)) == errors::OK);
        REQUIRE(f.ledger.token_collateral(ALICE, USDC).borrowed == 0);
    }

    SECTION("Lenders are tracked apart; the same lender blends its rate") {
        const FundingSource bridge{2, 80002};
        REQUIRE(f.ledger.record_external_debt(ALICE, USDC, bridge, tokens(1000), 300) == errors::OK);
        REQUIRE(f.ledger.record_external_debt(ALICE, USDC, market, tokens(4000), 300) == errors::OK);

        tc = f.ledger.token_collateral(ALICE, USDC);
        REQUIRE(tc.external.size() == 2);
        REQUIRE(tc.external.at(market).rate_bps == 400);
        REQUIRE(tc.external.at(bridge).amount == tokens(1000));
        REQUIRE(tc.borrowed == tokens(9000));
    }
}

TEST_CASE("Suppliers earn the interest borrowers pay", "[ledger]") {
    LedgerFixture f;
    REQUIRE(f.ledger.deposit(BOB, USDC, tokens(10000)) == errors::OK);
    REQUIRE(f.ledger.deposit(ALICE, WETH, tokens(10)) == errors::OK);
    REQUIRE(f.ledger.borrow(ALICE, USDC, tokens(5000)) == errors::OK);

    f.time.advance(SECONDS_PER_YEAR);
    RepayResult r = f.ledger.repay(ALICE, USDC, tokens(6000));
    REQUIRE(r.code == errors::OK);
    REQUIRE(f.ledger.token_collateral(ALICE, USDC).borrowed == 0);

    I128 interest = r.repaid - tokens(5000);
    REQUIRE(interest > 0);

    // Index rounding only ever shorts the supplier, and by dust
    I128 balance = f.ledger.token_collateral(BOB, USDC).deposited;
    REQUIRE(balance > tokens(10000));
    REQUIRE(tokens(10000) + interest - balance >= 0);
    REQUIRE(tokens(10000) + interest - balance < 10000);

    REQUIRE(f.ledger.withdraw(BOB, USDC, balance) == errors::OK);
    REQUIRE(f.ledger.token_collateral(BOB, USDC).deposited == 0);
    REQUIRE(f.ledger.reserves(USDC) < 10000);
    require_solvent(f.ledger);
}

TEST_CASE("Interest accrues from time zero", "[ledger]") {
    LedgerFixture f;
    *f.time.now = 0;
    f.oracle.set_price(WETH, x18::from_int(2000));
    f.oracle.set_price(USDC, x18::from_int(1));

    REQUIRE(f.ledger.deposit(BOB, USDC, tokens(50000)) == errors::OK);
    REQUIRE(f.ledger.deposit(ALICE, WETH, tokens(10)) == errors::OK);
    REQUIRE(f.ledger.borrow(ALICE, USDC, tokens(10000)) == errors::OK);

    f.time.advance(SECONDS_PER_YEAR);
    I128 interest = f.ledger.accrue_interest(ALICE, USDC);
    REQUIRE(x18::to_double(interest) == Approx(300.0).epsilon(1e-6));
    REQUIRE(f.ledger.token_collateral(ALICE, USDC).borrowed == tokens(10000) + interest);
}
