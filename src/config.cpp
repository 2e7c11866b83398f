// =============================================================================
// config.cpp - JSON configuration loading
// =============================================================================

#include "xlend/config.hpp"
#include <nlohmann/json.hpp>
#include <fstream>
#include <sstream>

namespace xlend {

using json = nlohmann::json;

namespace {

template <typename T>
void read(const json& section, const char* key, T& out) {
    if (!section.contains(key)) return;
    try {
        out = section.at(key).get<T>();
    } catch (const json::exception& e) {
        throw ConfigError(std::string("Invalid value for '") + key + "': " + e.what());
    }
}

Currency read_asset_address(const json& entry) {
    if (!entry.contains("address") || !entry["address"].is_string()) {
        throw ConfigError("Asset entry missing 'address'");
    }
    auto addr = parse_address(entry["address"].get<std::string>());
    if (!addr) {
        throw ConfigError("Malformed asset address: " + entry["address"].get<std::string>());
    }
    return Currency{*addr};
}

} // namespace

ComplianceMode parse_compliance_mode(std::string_view name) {
    if (name == "none") return ComplianceMode::NONE;
    if (name == "verified") return ComplianceMode::VERIFIED;
    if (name == "claim") return ComplianceMode::CLAIM;
    throw ConfigError("Unknown compliance mode: " + std::string(name));
}

Config Config::from_file(std::string_view path) {
    std::string path_str{path};
    std::ifstream file{path_str};
    if (!file.is_open()) {
        throw ConfigError("Cannot open config file: " + path_str);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return from_json(buffer.str());
}

Config Config::from_json(std::string_view content) {
    json root;
    try {
        root = json::parse(content);
    } catch (const json::parse_error& e) {
        throw ConfigError(std::string("Config parse error: ") + e.what());
    }
    if (!root.is_object()) {
        throw ConfigError("Config root must be an object");
    }

    Config config;
    read(root, "log_level", config.log_level);

    if (root.contains("chain")) {
        const auto& c = root["chain"];
        read(c, "id", config.chain.id);
        read(c, "name", config.chain.name);
    }

    if (root.contains("vault")) {
        const auto& v = root["vault"];
        read(v, "flash_loan_fee_bps", config.vault.flash_loan_fee_bps);
        read(v, "liquidation_threshold", config.vault.liquidation_threshold);
        read(v, "liquidation_bonus_bps", config.vault.liquidation_bonus_bps);
        read(v, "close_factor_bps", config.vault.close_factor_bps);
        read(v, "stable_rate_lock_seconds", config.vault.stable_rate_lock_seconds);
        read(v, "stable_rate_premium_bps", config.vault.stable_rate_premium_bps);
        read(v, "required_claim_topic", config.vault.required_claim_topic);
        if (v.contains("compliance_mode")) {
            std::string mode;
            read(v, "compliance_mode", mode);
            config.vault.compliance_mode = parse_compliance_mode(mode);
        }
    }

    if (root.contains("rate_model")) {
        const auto& r = root["rate_model"];
        read(r, "base_rate_bps", config.rate_model.base_rate_bps);
        read(r, "slope1_bps", config.rate_model.slope1_bps);
        read(r, "slope2_bps", config.rate_model.slope2_bps);
        read(r, "optimal_utilization_bps", config.rate_model.optimal_utilization_bps);
    }

    if (root.contains("router")) {
        const auto& r = root["router"];
        read(r, "holding_period_seconds", config.router.holding_period_seconds);
        read(r, "request_timeout_seconds", config.router.request_timeout_seconds);
    }

    if (root.contains("bridge")) {
        const auto& b = root["bridge"];
        read(b, "max_attempts", config.bridge.max_attempts);
        read(b, "retry_delay_ms", config.bridge.retry_delay_ms);
        read(b, "exponential_backoff", config.bridge.exponential_backoff);
        if (b.contains("relayer_url") && b["relayer_url"].is_string()) {
            config.bridge.relayer_url = b["relayer_url"].get<std::string>();
        }
    }

    if (root.contains("assets")) {
        if (!root["assets"].is_array()) {
            throw ConfigError("'assets' must be an array");
        }
        for (const auto& entry : root["assets"]) {
            AssetConfig asset;
            read(entry, "symbol", asset.symbol);
            asset.asset = read_asset_address(entry);
            read(entry, "collateral_factor_bps", asset.collateral_factor_bps);
            config.assets.push_back(std::move(asset));
        }
    }

    config.validate();
    return config;
}

void Config::validate() const {
    if (vault.flash_loan_fee_bps > BPS_ONE) {
        throw ConfigError("flash_loan_fee_bps exceeds 10000");
    }
    if (vault.close_factor_bps == 0 || vault.close_factor_bps > BPS_ONE) {
        throw ConfigError("close_factor_bps must be in (0, 10000]");
    }
    if (vault.liquidation_threshold == 0) {
        throw ConfigError("liquidation_threshold must be positive");
    }
    if (rate_model.optimal_utilization_bps == 0 || rate_model.optimal_utilization_bps > BPS_ONE) {
        throw ConfigError("optimal_utilization_bps must be in (0, 10000]");
    }
    if (bridge.max_attempts == 0) {
        throw ConfigError("max_attempts must be at least 1");
    }
    for (const auto& a : assets) {
        if (a.collateral_factor_bps > BPS_ONE) {
            throw ConfigError("collateral_factor_bps exceeds 10000 for " + a.symbol);
        }
    }
}

} // namespace xlend
