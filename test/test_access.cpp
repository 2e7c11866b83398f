// xlend - Access control, compliance and oracle tests

#include <catch2/catch_test_macros.hpp>
#include "mocks.hpp"

using namespace xlend;
using namespace xlend::test;

TEST_CASE("Roles", "[access]") {
    AccessControl access(OWNER);

    REQUIRE(access.owner() == OWNER);
    REQUIRE(access.has_role(OWNER, Role::OWNER));
    REQUIRE(access.require(ALICE, Role::OWNER) == errors::UNAUTHORIZED);
    REQUIRE_FALSE(access.has_role(RELAYER, Role::ADAPTER_CALLER));

    SECTION("Only the owner grants") {
        REQUIRE(access.grant_role(ALICE, RELAYER, Role::ADAPTER_CALLER) == errors::UNAUTHORIZED);
        REQUIRE(access.grant_role(OWNER, RELAYER, Role::ADAPTER_CALLER) == errors::OK);
        REQUIRE(access.require(RELAYER, Role::ADAPTER_CALLER) == errors::OK);
        REQUIRE(access.grant_role(OWNER, RELAYER, Role::ADAPTER_CALLER) == errors::ALREADY_REGISTERED);
        REQUIRE(access.grant_role(OWNER, ZERO_ADDRESS, Role::ADAPTER_CALLER) == errors::INVALID_ADDRESS);
    }

    SECTION("Ownership moves, it is not granted") {
        REQUIRE(access.grant_role(OWNER, ALICE, Role::OWNER) == errors::UNAUTHORIZED);
        REQUIRE(access.transfer_ownership(ALICE, ALICE) == errors::UNAUTHORIZED);
        REQUIRE(access.transfer_ownership(OWNER, ZERO_ADDRESS) == errors::INVALID_ADDRESS);
        REQUIRE(access.transfer_ownership(OWNER, ALICE) == errors::OK);
        REQUIRE(access.owner() == ALICE);
        REQUIRE_FALSE(access.has_role(OWNER, Role::OWNER));
        REQUIRE(access.pause(OWNER) == errors::UNAUTHORIZED);
        REQUIRE(access.pause(ALICE) == errors::OK);
    }

    SECTION("Revocation") {
        REQUIRE(access.grant_role(OWNER, RELAYER, Role::ADAPTER_CALLER) == errors::OK);
        REQUIRE(access.revoke_role(BOB, RELAYER, Role::ADAPTER_CALLER) == errors::UNAUTHORIZED);
        REQUIRE(access.revoke_role(OWNER, RELAYER, Role::ADAPTER_CALLER) == errors::OK);
        REQUIRE_FALSE(access.has_role(RELAYER, Role::ADAPTER_CALLER));
        REQUIRE(access.revoke_role(OWNER, RELAYER, Role::ADAPTER_CALLER) == errors::INVALID_STATE);
    }
}

TEST_CASE("Pause state", "[access]") {
    AccessControl access(OWNER);

    REQUIRE(access.state() == SystemState::ACTIVE);
    REQUIRE(access.unpause(OWNER) == errors::INVALID_STATE);
    REQUIRE(access.pause(OWNER) == errors::OK);
    REQUIRE(access.paused());
    REQUIRE(access.unpause(BOB) == errors::UNAUTHORIZED);
    REQUIRE(access.unpause(OWNER) == errors::OK);
    REQUIRE_FALSE(access.paused());
}

TEST_CASE("Compliance modes", "[compliance]") {
    AllowListGate gate;

    REQUIRE(passes_compliance(nullptr, ComplianceMode::NONE, ALICE, 1));
    REQUIRE_FALSE(passes_compliance(nullptr, ComplianceMode::VERIFIED, ALICE, 1));

    REQUIRE(gate.add_claim(ALICE, 1) == errors::COMPLIANCE_REQUIRED);
    REQUIRE(gate.verify(ZERO_ADDRESS) == errors::INVALID_ADDRESS);
    REQUIRE(gate.verify(ALICE) == errors::OK);
    REQUIRE(gate.verify(ALICE) == errors::ALREADY_REGISTERED);

    REQUIRE(passes_compliance(&gate, ComplianceMode::VERIFIED, ALICE, 1));
    REQUIRE_FALSE(passes_compliance(&gate, ComplianceMode::CLAIM, ALICE, 1));
    REQUIRE(gate.add_claim(ALICE, 1) == errors::OK);
    REQUIRE(passes_compliance(&gate, ComplianceMode::CLAIM, ALICE, 1));
    REQUIRE_FALSE(passes_compliance(&gate, ComplianceMode::CLAIM, ALICE, 2));

    // Revocation drops claims with the identity
    REQUIRE(gate.revoke(ALICE) == errors::OK);
    REQUIRE_FALSE(gate.has_claim(ALICE, 1));
    REQUIRE(gate.revoke(ALICE) == errors::INVALID_STATE);
}

TEST_CASE("Price oracle", "[oracle]") {
    ManualClock time;
    PriceOracle oracle(time.clock(), 3600);

    REQUIRE_FALSE(oracle.convert_to_usd(WETH, tokens(1)));
    REQUIRE(oracle.set_price(WETH, 0) == errors::ORACLE_UNAVAILABLE);
    REQUIRE(oracle.set_price(WETH, x18::from_int(2000)) == errors::OK);

    REQUIRE(oracle.convert_to_usd(WETH, x18::from_int(3) / 2) == x18::from_int(3000));
    REQUIRE(oracle.convert_usd_to_asset(x18::from_int(500), WETH) == x18::from_int(1) / 4);
    REQUIRE(oracle.get_price(WETH)->timestamp == *time.now);

    SECTION("Stale prices are unusable") {
        time.advance(3600);
        REQUIRE(oracle.convert_to_usd(WETH, tokens(1)));
        time.advance(1);
        REQUIRE_FALSE(oracle.convert_to_usd(WETH, tokens(1)));
        REQUIRE_FALSE(oracle.convert_usd_to_asset(tokens(1), WETH));

        oracle.set_max_staleness(0);
        REQUIRE(oracle.convert_to_usd(WETH, tokens(1)));
    }
}
