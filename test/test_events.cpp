// xlend - Event record tests

#include <catch2/catch_test_macros.hpp>
#include <algorithm>
#include <nlohmann/json.hpp>
#include "mocks.hpp"

using namespace xlend;
using namespace xlend::test;
using json = nlohmann::json;

TEST_CASE("Event names", "[events]") {
    REQUIRE(std::string(event_name(DepositRecord{ALICE, WETH, tokens(1), 10})) == "Deposit");
    REQUIRE(std::string(event_name(FlashLoanRecord{BOB, USDC, tokens(1), 0, 10})) == "FlashLoan");
    REQUIRE(std::string(event_name(PreferredProtocolRecord{"base", "", "ccip"})) ==
            "PreferredProtocolChanged");
    REQUIRE(std::string(event_name(TransferCompletedRecord{RequestId{}, TransferStatus::FAILED, 0, 1, 2, 3})) ==
            "TransferCompleted");
}

TEST_CASE("Events serialize to JSON", "[events]") {
    SECTION("Amounts are decimal strings of base units") {
        json j = to_json(BorrowRecord{ALICE, USDC, tokens(5), SourceType::CROSS_CHAIN_BRIDGE, 1700000000});
        REQUIRE(j["event"] == "Borrow");
        REQUIRE(j["user"] == to_hex(ALICE));
        REQUIRE(j["asset"] == to_hex(USDC.addr));
        REQUIRE(j["amount"] == "5000000000000000000");
        REQUIRE(j["source"] == "CROSS_CHAIN_BRIDGE");
        REQUIRE(j["timestamp"] == 1700000000);
    }

    SECTION("Transfer records carry the request id") {
        RequestId id{};
        id[0] = 0xAB;
        json j = to_json(TransferCompletedRecord{id, TransferStatus::COMPLETED, tokens(2), 80002, 11155111, 5});
        REQUIRE(j["requestId"] == to_hex(id));
        REQUIRE(j["status"] == "COMPLETED");
        REQUIRE(j["sourceChain"] == 80002);
        REQUIRE(j["destinationChain"] == 11155111);
    }

    SECTION("Liquidation") {
        json j = to_json(LiquidationRecord{CAROL, ALICE, USDC, WETH, tokens(1), tokens(2), 9});
        REQUIRE(j["liquidator"] == to_hex(CAROL));
        REQUIRE(j["debtAsset"] == to_hex(USDC.addr));
        REQUIRE(j["collateralAsset"] == to_hex(WETH.addr));
        REQUIRE(j["seized"] == "2000000000000000000");
    }

    SECTION("Adapter registration lists chains") {
        json j = to_json(AdapterRegisteredRecord{"ccip", {"base", "amoy"}});
        REQUIRE(j["protocol"] == "ccip");
        REQUIRE(j["chains"].size() == 2);
        REQUIRE(j["chains"][1] == "amoy");
    }
}

TEST_CASE("Event log", "[events]") {
    EventLog log;
    EventSink sink = log.sink();

    sink(DepositRecord{ALICE, WETH, tokens(1), 1});
    sink(WithdrawRecord{ALICE, WETH, tokens(1), 2});
    sink(DepositRecord{BOB, USDC, tokens(3), 3});

    REQUIRE(log.size() == 3);
    auto deposits = log.of_type<DepositRecord>();
    REQUIRE(deposits.size() == 2);
    REQUIRE(deposits[1].user == BOB);
    REQUIRE(log.of_type<RepayRecord>().empty());

    std::string lines = log.to_json_lines();
    REQUIRE(std::count(lines.begin(), lines.end(), '\n') == 3);
    json first = json::parse(lines.substr(0, lines.find('\n')));
    REQUIRE(first["event"] == "Deposit");
    REQUIRE(first["timestamp"] == 1);

    log.clear();
    REQUIRE(log.size() == 0);
    REQUIRE(log.to_json_lines().empty());
}
