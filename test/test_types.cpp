// xlend - Identifier and fixed-point tests

#include <catch2/catch_test_macros.hpp>
#include <xlend/types.hpp>
#include <xlend/chains.hpp>

using namespace xlend;

TEST_CASE("Address parsing", "[types]") {
    SECTION("Round trip through hex") {
        auto addr = parse_address("0x00000000000000000000000000000000000a11ce");
        REQUIRE(addr.has_value());
        REQUIRE(*addr == make_address(0xA11CE));
        REQUIRE(to_hex(*addr) == "0x00000000000000000000000000000000000a11ce");
    }

    SECTION("Mixed case accepted") {
        auto addr = parse_address("0x00000000000000000000000000000000000A11CE");
        REQUIRE(addr.has_value());
        REQUIRE(*addr == make_address(0xA11CE));
    }

    SECTION("Malformed input rejected") {
        REQUIRE_FALSE(parse_address("").has_value());
        REQUIRE_FALSE(parse_address("0x1234").has_value());
        REQUIRE_FALSE(parse_address("0xzz000000000000000000000000000000000a11ce").has_value());
    }
}

TEST_CASE("Fixed-point arithmetic", "[types]") {
    SECTION("mul and div") {
        REQUIRE(x18::mul(x18::from_int(3), x18::from_int(4)) == x18::from_int(12));
        REQUIRE(x18::div(x18::from_int(10), x18::from_int(4)) == x18::from_double(2.5));
    }

    SECTION("mul_div survives intermediates beyond 128 bits") {
        I128 usd = x18::from_int(20000000);  // 2e25
        I128 price = x18::from_int(2000);
        REQUIRE(x18::div(usd, price) == x18::from_int(10000));
    }

    SECTION("Division by zero yields zero") {
        REQUIRE(x18::mul_div(5, 5, 0) == 0);
    }

    SECTION("Basis points") {
        REQUIRE(x18::bps(x18::from_int(1000), 9) == x18::from_int(9) / 10);
        REQUIRE(x18::bps(x18::from_int(1000), 10000) == x18::from_int(1000));
    }

    SECTION("Decimal rendering") {
        REQUIRE(x18::to_string(0) == "0");
        REQUIRE(x18::to_string(-42) == "-42");
        REQUIRE(x18::to_string(X18_ONE) == "1000000000000000000");
    }
}

TEST_CASE("Pool counters never underflow", "[types]") {
    REQUIRE(safe::sub(5, 10) == 0);
    REQUIRE(safe::sub(10, 5) == 5);
    REQUIRE(safe::add(5, 10) == 15);

    I128 max = static_cast<I128>(~U128(0) >> 1);
    REQUIRE(safe::add(max, 1) == max);
}

TEST_CASE("Error names", "[types]") {
    REQUIRE(std::string(errors::name(errors::UNDERCOLLATERALIZED)) == "Undercollateralized");
    REQUIRE(std::string(errors::name(errors::ALREADY_REGISTERED)) == "AlreadyRegistered");
    REQUIRE(std::string(errors::name(errors::PAUSED)) == "PausedState");
    REQUIRE(std::string(errors::name(12345)) == "Unknown");
}

TEST_CASE("Known chains", "[types]") {
    REQUIRE(chain_id("sepolia") == ChainId{11155111});
    REQUIRE(chain_id("amoy") == ChainId{80002});
    REQUIRE(chain_name(137) == std::optional<std::string>("polygon"));
    REQUIRE_FALSE(chain_id("solana").has_value());
    REQUIRE_FALSE(chain_name(999999).has_value());
}
