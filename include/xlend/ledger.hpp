#ifndef XLEND_LEDGER_HPP
#define XLEND_LEDGER_HPP

#include <map>
#include <unordered_map>
#include <shared_mutex>
#include <optional>
#include <vector>

#include "types.hpp"
#include "config.hpp"
#include "interest.hpp"
#include "oracle.hpp"

namespace xlend {

// =============================================================================
// Per-user, per-asset balance
// =============================================================================

// Router source (and the chain it drew from) that funded part of a debt
struct FundingSource {
    size_t source_index = 0;
    ChainId chain_id = 0;

    bool operator==(const FundingSource& other) const {
        return source_index == other.source_index && chain_id == other.chain_id;
    }
    bool operator<(const FundingSource& other) const {
        if (source_index != other.source_index) return source_index < other.source_index;
        return chain_id < other.chain_id;
    }
};

// Debt owed to a non-local lender, accruing at the rate it was quoted
struct ExternalDebt {
    I128 principal = 0;
    I128 amount = 0;                 // principal + accrued interest
    uint32_t rate_bps = 0;
};

struct TokenCollateral {
    I128 deposited = 0;              // includes earned supply interest
    I128 borrowed = 0;               // local + external, with accrued interest
    std::map<FundingSource, ExternalDebt> external;
    RateMode rate_mode = RateMode::VARIABLE;
    I128 stable_rate_x18 = 0;        // per-second, STABLE only
    uint64_t stable_locked_until = 0;
    uint64_t last_update = 0;
    bool accruing = false;           // last_update marks the start of the accrual window
    I128 supply_index = X18_ONE;     // pool supply index deposited was scaled to

    I128 external_borrowed() const {
        I128 total = 0;
        for (const auto& [source, debt] : external) total += debt.amount;
        return total;
    }

    // Debt funded from this ledger's reserves
    I128 local_borrowed() const { return borrowed - external_borrowed(); }
};

// =============================================================================
// Per-user aggregate (native asset + USD debt)
// =============================================================================

struct Position {
    I128 collateral = 0;             // native asset deposited
    I128 debt = 0;                   // native asset borrowed
    I128 borrowed_usd = 0;           // all assets, revalued on every debt mutation
    uint64_t last_update = 0;
};

// =============================================================================
// Pool-wide per-asset state
// =============================================================================

// Totals cover locally funded loans only; external debt lives on positions
struct AssetState {
    I128 total_deposited = 0;        // supplier balances, interest included
    I128 total_borrowed = 0;         // invariant: <= total_deposited
    I128 reserves = 0;               // cash held by the vault
    I128 protocol_revenue = 0;       // flash loan fees
    I128 supply_index = X18_ONE;     // grows by interest / total_deposited on accrual
    uint32_t collateral_factor_bps = 10000;
};

struct RepayResult {
    int32_t code = errors::OK;
    I128 repaid = 0;
    I128 refund = 0;                 // excess returned to the payer
};

struct LiquidationResult {
    int32_t code = errors::OK;
    I128 repaid = 0;                 // debt asset units
    I128 seized = 0;                 // collateral asset units
};

// =============================================================================
// CollateralLedger - positions, pool totals, interest accrual
// =============================================================================

class CollateralLedger {
public:
    CollateralLedger(const IPriceOracle& oracle, const InterestRateModel& model,
                     const VaultConfig& config, Clock clock = system_clock());
    ~CollateralLedger() = default;

    // Non-copyable
    CollateralLedger(const CollateralLedger&) = delete;
    CollateralLedger& operator=(const CollateralLedger&) = delete;

    // =========================================================================
    // Asset Registry
    // =========================================================================

    int32_t register_asset(const Currency& asset, uint32_t collateral_factor_bps = 10000);
    int32_t set_collateral_factor(const Currency& asset, uint32_t collateral_factor_bps);
    bool is_supported(const Currency& asset) const;
    std::vector<Currency> assets() const;

    // =========================================================================
    // Position Mutations (callers enforce pause/compliance/reentrancy)
    // =========================================================================

    int32_t deposit(const Address& user, const Currency& asset, I128 amount);
    int32_t withdraw(const Address& user, const Currency& asset, I128 amount);
    int32_t borrow(const Address& user, const Currency& asset, I128 amount);

    // Repays locally funded debt only; the rest of amount comes back as refund
    RepayResult repay(const Address& user, const Currency& asset, I128 amount);

    // Accrue to now; returns interest added. Zero elapsed is a no-op.
    I128 accrue_interest(const Address& user, const Currency& asset);

    // Debt funded by a non-local source. Counts toward the health factor but
    // never touches the pool totals.
    int32_t record_external_debt(const Address& user, const Currency& asset,
                                 const FundingSource& source, I128 amount, uint32_t rate_bps);

    // Drops `principal` and the interest it accrued (failed transfer)
    int32_t release_external_debt(const Address& user, const Currency& asset,
                                  const FundingSource& source, I128 principal);

    // Removes amount of owed balance after it was paid to the lender
    int32_t settle_external_debt(const Address& user, const Currency& asset,
                                 const FundingSource& source, I128 amount);

    int32_t set_rate_mode(const Address& user, const Currency& asset, RateMode mode);
    int32_t rebalance_stable_rate(const Address& user, const Currency& asset);

    // Repays locally funded debt only, capped by the close factor
    LiquidationResult liquidate(const Address& liquidator, const Address& user,
                                const Currency& debt_asset, I128 amount,
                                const Currency& collateral_asset);

    // =========================================================================
    // Reserve Movements (flash loans)
    // =========================================================================

    std::optional<AssetState> asset_state(const Currency& asset) const;
    int32_t restore_asset_state(const Currency& asset, const AssetState& state);
    int32_t draw_reserves(const Currency& asset, I128 amount);
    int32_t credit_reserves(const Currency& asset, I128 amount);
    int32_t book_revenue(const Currency& asset, I128 fee);

    // =========================================================================
    // Queries
    // =========================================================================

    Position position(const Address& user) const;
    TokenCollateral token_collateral(const Address& user, const Currency& asset) const;

    I128 total_deposited(const Currency& asset) const;
    I128 total_borrowed(const Currency& asset) const;
    I128 reserves(const Currency& asset) const;

    // min(total_deposited - total_borrowed, reserves)
    I128 available_liquidity(const Currency& asset) const;

    // Variable borrow rate at current utilization
    I128 current_rate(const Currency& asset) const;
    uint32_t current_rate_bps(const Currency& asset) const;

    // (collateral - debt) / debt * 100; UNBOUNDED_HEALTH with no debt;
    // nullopt when a price is unavailable
    std::optional<uint64_t> health_factor(const Address& user) const;

    // Health factor if the user's debt in asset grew by extra_debt
    std::optional<uint64_t> health_factor_after(const Address& user, const Currency& asset,
                                                I128 extra_debt) const;

    std::optional<I128> collateral_value_usd(const Address& user) const;
    std::optional<I128> debt_value_usd(const Address& user) const;

    static uint64_t health_factor_from(I128 collateral_usd, I128 debt_usd);

    const VaultConfig& config() const { return config_; }
    const InterestRateModel& rate_model() const { return model_; }
    uint64_t now() const { return clock_(); }

private:
    struct UserAccount {
        Position position;
        std::map<Currency, TokenCollateral> tokens;
    };

    struct Valuation {
        I128 collateral_usd;
        I128 debt_usd;
    };

    UserAccount& get_or_create_account(const Address& user);
    const UserAccount* get_account(const Address& user) const;
    AssetState* get_asset(const Currency& asset);
    const AssetState* get_asset(const Currency& asset) const;

    I128 accrue_locked(UserAccount& account, const Currency& asset, AssetState& pool, uint64_t now);
    static void refresh_supply(TokenCollateral& tc, const AssetState& pool);
    static I128 current_deposit(const TokenCollateral& tc, const AssetState& pool);
    I128 variable_rate_locked(const AssetState& pool) const;

    std::optional<Valuation> valuation_locked(const UserAccount& account,
                                              const Currency& asset,
                                              I128 collateral_delta,
                                              I128 debt_delta) const;

    void sync_position_locked(UserAccount& account, uint64_t now);

    const IPriceOracle& oracle_;
    InterestRateModel model_;
    VaultConfig config_;
    Clock clock_;

    std::unordered_map<Address, UserAccount, AddressHash> accounts_;
    std::map<Currency, AssetState> assets_;
    mutable std::shared_mutex mutex_;
};

} // namespace xlend

#endif // XLEND_LEDGER_HPP
