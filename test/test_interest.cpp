// xlend - Interest rate model tests

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <xlend/interest.hpp>

using namespace xlend;
using Catch::Approx;

TEST_CASE("Utilization", "[interest]") {
    REQUIRE(InterestRateModel::utilization(0, x18::from_int(100)) == 0);
    REQUIRE(InterestRateModel::utilization(x18::from_int(10), 0) == 0);
    REQUIRE(InterestRateModel::utilization(x18::from_int(50), x18::from_int(100)) == X18_ONE / 2);
    REQUIRE(InterestRateModel::utilization(x18::from_int(150), x18::from_int(100)) == X18_ONE);
}

TEST_CASE("Two-slope annual rate", "[interest]") {
    InterestRateModel model{RateModelConfig{}};

    SECTION("Base rate at zero utilization") {
        REQUIRE(model.annual_rate_bps(0) == 200);
    }

    SECTION("Kink at optimal utilization") {
        REQUIRE(model.annual_rate_bps(x18::from_double(0.8)) == 600);
    }

    SECTION("Steep slope above the kink") {
        REQUIRE(model.annual_rate_bps(X18_ONE) == 6600);
        REQUIRE(model.annual_rate_bps(x18::from_double(0.9)) == 3600);
    }

    SECTION("Monotonic non-decreasing") {
        uint32_t previous = 0;
        for (int pct = 0; pct <= 100; ++pct) {
            uint32_t r = model.annual_rate_bps(x18::mul_div(X18_ONE, pct, 100));
            REQUIRE(r >= previous);
            previous = r;
        }
    }
}

TEST_CASE("Per-second and annual conversion", "[interest]") {
    SECTION("Round trip in basis points") {
        for (uint32_t bps : {0u, 1u, 200u, 600u, 6600u, 10000u}) {
            REQUIRE(InterestRateModel::to_annual_bps(InterestRateModel::from_annual_bps(bps)) == bps);
        }
    }

    SECTION("Rate is per second") {
        InterestRateModel model{RateModelConfig{}};
        I128 per_second = model.rate(0);
        REQUIRE(per_second == InterestRateModel::from_annual_bps(200));
        REQUIRE(per_second > 0);
    }
}

TEST_CASE("Simple interest", "[interest]") {
    I128 principal = x18::from_int(1000);
    I128 rate = InterestRateModel::from_annual_bps(1000);  // 10%

    SECTION("One year at 10%") {
        I128 owed = InterestRateModel::interest(principal, rate, SECONDS_PER_YEAR);
        REQUIRE(x18::to_double(owed) == Approx(100.0).epsilon(1e-6));
    }

    SECTION("No elapsed time, no interest") {
        REQUIRE(InterestRateModel::interest(principal, rate, 0) == 0);
    }

    SECTION("No principal, no interest") {
        REQUIRE(InterestRateModel::interest(0, rate, SECONDS_PER_YEAR) == 0);
    }
}
