// xlend - Configuration tests

#include <catch2/catch_test_macros.hpp>
#include <filesystem>
#include <fstream>
#include "mocks.hpp"

using namespace xlend;
using namespace xlend::test;

TEST_CASE("Defaults", "[config]") {
    Config config;
    REQUIRE(config.chain.id == 11155111);
    REQUIRE(config.chain.name == "sepolia");
    REQUIRE(config.vault.flash_loan_fee_bps == 9);
    REQUIRE(config.vault.liquidation_threshold == 100);
    REQUIRE(config.vault.liquidation_bonus_bps == 500);
    REQUIRE(config.vault.close_factor_bps == 5000);
    REQUIRE(config.vault.compliance_mode == ComplianceMode::NONE);
    REQUIRE(config.router.request_timeout_seconds == 86400);
    REQUIRE(config.bridge.max_attempts == 3);
    REQUIRE_FALSE(config.bridge.relayer_url);
    REQUIRE_NOTHROW(config.validate());
}

TEST_CASE("Load from JSON", "[config]") {
    Config config = Config::from_json(R"({
        "log_level": "debug",
        "chain": {"id": 80002, "name": "amoy"},
        "vault": {
            "flash_loan_fee_bps": 5,
            "liquidation_bonus_bps": 800,
            "compliance_mode": "claim",
            "required_claim_topic": 42
        },
        "rate_model": {"base_rate_bps": 100, "optimal_utilization_bps": 9000},
        "router": {"request_timeout_seconds": 3600},
        "bridge": {"max_attempts": 5, "exponential_backoff": false,
                   "relayer_url": "https://relayer.example.org"},
        "assets": [
            {"symbol": "WETH", "address": "0x00000000000000000000000000000000000000e7",
             "collateral_factor_bps": 8000},
            {"symbol": "USDC", "address": "0x00000000000000000000000000000000000005DC"}
        ]
    })");

    REQUIRE(config.log_level == "debug");
    REQUIRE(config.chain.id == 80002);
    REQUIRE(config.chain.name == "amoy");
    REQUIRE(config.vault.flash_loan_fee_bps == 5);
    REQUIRE(config.vault.liquidation_bonus_bps == 800);
    REQUIRE(config.vault.close_factor_bps == 5000);
    REQUIRE(config.vault.compliance_mode == ComplianceMode::CLAIM);
    REQUIRE(config.vault.required_claim_topic == 42);
    REQUIRE(config.rate_model.base_rate_bps == 100);
    REQUIRE(config.rate_model.slope1_bps == 400);
    REQUIRE(config.rate_model.optimal_utilization_bps == 9000);
    REQUIRE(config.router.request_timeout_seconds == 3600);
    REQUIRE(config.bridge.max_attempts == 5);
    REQUIRE_FALSE(config.bridge.exponential_backoff);
    REQUIRE(config.bridge.relayer_url == "https://relayer.example.org");

    REQUIRE(config.assets.size() == 2);
    REQUIRE(config.assets[0].symbol == "WETH");
    REQUIRE(config.assets[0].asset == WETH);
    REQUIRE(config.assets[0].collateral_factor_bps == 8000);
    REQUIRE(config.assets[1].asset == USDC);
    REQUIRE(config.assets[1].collateral_factor_bps == 10000);
}

TEST_CASE("Malformed configuration is rejected", "[config]") {
    REQUIRE_THROWS_AS(Config::from_json("{not json"), ConfigError);
    REQUIRE_THROWS_AS(Config::from_json("[1, 2]"), ConfigError);
    REQUIRE_THROWS_AS(Config::from_json(R"({"vault": {"compliance_mode": "strict"}})"), ConfigError);
    REQUIRE_THROWS_AS(Config::from_json(R"({"vault": {"flash_loan_fee_bps": "nine"}})"), ConfigError);
    REQUIRE_THROWS_AS(Config::from_json(R"({"vault": {"close_factor_bps": 0}})"), ConfigError);
    REQUIRE_THROWS_AS(Config::from_json(R"({"assets": {"symbol": "WETH"}})"), ConfigError);
    REQUIRE_THROWS_AS(Config::from_json(R"({"assets": [{"symbol": "WETH"}]})"), ConfigError);
    REQUIRE_THROWS_AS(Config::from_json(R"({"assets": [{"symbol": "WETH", "address": "0x12"}]})"), ConfigError);
    REQUIRE_THROWS_AS(Config::from_json(R"({"bridge": {"max_attempts": 0}})"), ConfigError);
}

TEST_CASE("Validation", "[config]") {
    Config config;

    SECTION("Fee above 100%") {
        config.set_flash_loan_fee(10001);
        REQUIRE_THROWS_AS(config.validate(), ConfigError);
    }

    SECTION("Zero liquidation threshold") {
        config.set_liquidation(0, 500, 5000);
        REQUIRE_THROWS_AS(config.validate(), ConfigError);
    }

    SECTION("Collateral factor above 100%") {
        config.with_asset("WETH", WETH, 10001);
        REQUIRE_THROWS_AS(config.validate(), ConfigError);
    }

    SECTION("Engine refuses an invalid config") {
        config.set_retry(0, 1000);
        REQUIRE_THROWS_AS(Engine(config, OWNER), ConfigError);
    }
}

TEST_CASE("Builder", "[config]") {
    Config config;
    config.with_chain(137, "polygon")
          .with_asset("WETH", WETH, 7500)
          .set_flash_loan_fee(30)
          .set_liquidation(110, 1000, 4000)
          .set_compliance(ComplianceMode::VERIFIED)
          .set_request_timeout(7200)
          .set_retry(2, 500, false)
          .with_relayer("http://localhost:9000");

    REQUIRE(config.chain.id == 137);
    REQUIRE(config.assets.size() == 1);
    REQUIRE(config.assets[0].collateral_factor_bps == 7500);
    REQUIRE(config.vault.flash_loan_fee_bps == 30);
    REQUIRE(config.vault.liquidation_threshold == 110);
    REQUIRE(config.vault.close_factor_bps == 4000);
    REQUIRE(config.vault.compliance_mode == ComplianceMode::VERIFIED);
    REQUIRE(config.router.request_timeout_seconds == 7200);
    REQUIRE(config.bridge.retry_delay_ms == 500);
    REQUIRE(config.bridge.relayer_url == "http://localhost:9000");
    REQUIRE_NOTHROW(config.validate());
}

TEST_CASE("Load from file", "[config]") {
    REQUIRE_THROWS_AS(Config::from_file("/nonexistent/xlend.json"), ConfigError);

    auto path = std::filesystem::temp_directory_path() / "xlend_config_test.json";
    {
        std::ofstream out(path);
        out << R"({"chain": {"id": 8453, "name": "base"}, "log_level": "warn"})";
    }
    Config config = Config::from_file(path.string());
    REQUIRE(config.chain.name == "base");
    REQUIRE(config.log_level == "warn");
    std::filesystem::remove(path);
}

TEST_CASE("Engine wiring from config", "[config][engine]") {
    ManualClock time;
    Config config = engine_config();

    SECTION("Loopback adapter only") {
        Engine engine(config, OWNER, time.clock());
        REQUIRE(engine.bridge().protocols() == std::vector<std::string>{"local"});
        REQUIRE(engine.ledger().is_supported(WETH));
        REQUIRE(engine.ledger().is_supported(USDC));
        REQUIRE(engine.router().source_count() == 2);
        REQUIRE(engine.access().owner() == OWNER);
    }

    SECTION("Relayer enables the remote protocols") {
        config.with_relayer("http://127.0.0.1:1");
        Engine engine(config, OWNER, time.clock());
        REQUIRE(engine.bridge().protocols() ==
                std::vector<std::string>{"local", "ccip", "axelar", "relay"});
        REQUIRE(engine.bridge().resolve("amoy")->protocol_name() == "ccip");
        REQUIRE(engine.bridge().resolve("avalanche")->protocol_name() == "axelar");
        REQUIRE(engine.events().of_type<AdapterRegisteredRecord>().size() == 4);
    }

    SECTION("Duplicate asset") {
        config.with_asset("WETH again", WETH);
        REQUIRE_THROWS_AS(Engine(config, OWNER, time.clock()), ConfigError);
    }
}

TEST_CASE("Log level names", "[config][log]") {
    REQUIRE(parse_log_level("trace") == LogLevel::TRACE);
    REQUIRE(parse_log_level("debug") == LogLevel::DEBUG);
    REQUIRE(parse_log_level("warning") == LogLevel::WARN);
    REQUIRE(parse_log_level("error") == LogLevel::ERROR);
    REQUIRE(parse_log_level("off") == LogLevel::OFF);
    REQUIRE(parse_log_level("loud") == LogLevel::INFO);

    LogLevel previous = log::level();
    log::set_level(LogLevel::WARN);
    REQUIRE_FALSE(log::enabled(LogLevel::INFO));
    REQUIRE(log::enabled(LogLevel::ERROR));
    log::set_level(previous);
}
