#ifndef XLEND_CONFIG_HPP
#define XLEND_CONFIG_HPP

#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include "types.hpp"
#include "interest.hpp"

namespace xlend {

class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& msg) : std::runtime_error(msg) {}
};

// =============================================================================
// Configuration Sections
// =============================================================================

// This chain
struct ChainConfig {
    ChainId id = 11155111;
    std::string name = "sepolia";
};

// Collateral ledger and vault parameters
struct VaultConfig {
    uint32_t flash_loan_fee_bps = 9;                 // 0.09%
    uint64_t liquidation_threshold = 100;            // health factor, percentage points
    uint32_t liquidation_bonus_bps = 500;            // 5% collateral bonus to liquidator
    uint32_t close_factor_bps = 5000;                // max 50% of debt per liquidation
    uint64_t stable_rate_lock_seconds = 30 * 86400;  // 30 days
    uint32_t stable_rate_premium_bps = 200;          // stable = variable + 2%
    ComplianceMode compliance_mode = ComplianceMode::NONE;
    uint64_t required_claim_topic = 1;
};

// Liquidity routing
struct RouterConfig {
    uint64_t holding_period_seconds = 30 * 86400;    // expected borrow duration for cost
    uint64_t request_timeout_seconds = 86400;        // PENDING -> FAILED after this
};

// Bridge delivery
struct BridgeConfig {
    uint32_t max_attempts = 3;
    uint64_t retry_delay_ms = 60000;
    bool exponential_backoff = true;
    std::optional<std::string> relayer_url;
};

struct AssetConfig {
    std::string symbol;
    Currency asset;
    uint32_t collateral_factor_bps = 10000;
};

// =============================================================================
// Config - builder-style, loadable from JSON
// =============================================================================

class Config {
public:
    std::string log_level = "info";
    ChainConfig chain;
    VaultConfig vault;
    RateModelConfig rate_model;
    RouterConfig router;
    BridgeConfig bridge;
    std::vector<AssetConfig> assets;

    Config() = default;

    // Load from JSON file; throws ConfigError
    static Config from_file(std::string_view path);

    // Load from JSON string; throws ConfigError
    static Config from_json(std::string_view content);

    // Throws ConfigError on out-of-range values
    void validate() const;

    Config& with_chain(ChainId id, std::string_view name) {
        chain.id = id;
        chain.name = std::string(name);
        return *this;
    }

    Config& with_asset(std::string_view symbol, const Currency& asset,
                       uint32_t collateral_factor_bps = 10000) {
        assets.push_back(AssetConfig{std::string(symbol), asset, collateral_factor_bps});
        return *this;
    }

    Config& set_flash_loan_fee(uint32_t bps) {
        vault.flash_loan_fee_bps = bps;
        return *this;
    }

    Config& set_liquidation(uint64_t threshold, uint32_t bonus_bps, uint32_t close_factor_bps) {
        vault.liquidation_threshold = threshold;
        vault.liquidation_bonus_bps = bonus_bps;
        vault.close_factor_bps = close_factor_bps;
        return *this;
    }

    Config& set_compliance(ComplianceMode mode, uint64_t claim_topic = 1) {
        vault.compliance_mode = mode;
        vault.required_claim_topic = claim_topic;
        return *this;
    }

    Config& set_rate_model(const RateModelConfig& model) {
        rate_model = model;
        return *this;
    }

    Config& set_request_timeout(uint64_t seconds) {
        router.request_timeout_seconds = seconds;
        return *this;
    }

    Config& set_retry(uint32_t attempts, uint64_t delay_ms, bool exponential = true) {
        bridge.max_attempts = attempts;
        bridge.retry_delay_ms = delay_ms;
        bridge.exponential_backoff = exponential;
        return *this;
    }

    Config& with_relayer(std::string_view url) {
        bridge.relayer_url = std::string(url);
        return *this;
    }
};

ComplianceMode parse_compliance_mode(std::string_view name);

} // namespace xlend

#endif // XLEND_CONFIG_HPP
