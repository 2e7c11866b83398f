#ifndef XLEND_VAULT_HPP
#define XLEND_VAULT_HPP

#include <string>
#include <vector>

#include "types.hpp"
#include "access.hpp"
#include "compliance.hpp"
#include "config.hpp"
#include "events.hpp"
#include "ledger.hpp"
#include "router.hpp"

namespace xlend {

// =============================================================================
// Flash Loans
// =============================================================================

// Handed to the receiver for the duration of one flash loan
class FlashContext {
public:
    FlashContext(CollateralLedger& ledger, const Currency& asset, I128 amount, I128 fee)
        : ledger_(ledger), asset_(asset), amount_(amount), fee_(fee) {}

    const Currency& asset() const { return asset_; }
    I128 amount() const { return amount_; }
    I128 fee() const { return fee_; }
    I128 amount_owed() const { return amount_ + fee_; }
    I128 repaid() const { return repaid_; }

    // Returns funds to the vault reserves
    int32_t repay(I128 amount);

private:
    CollateralLedger& ledger_;
    Currency asset_;
    I128 amount_;
    I128 fee_;
    I128 repaid_ = 0;
};

class FlashLoanReceiver {
public:
    virtual ~FlashLoanReceiver() = default;

    // Must repay amount_owed() through ctx before returning. Throwing aborts
    // the loan.
    virtual void execute_operation(FlashContext& ctx, const std::string& params) = 0;
};

// Per-item outcome of a timeout sweep
struct SweepResult {
    RequestId request_id{};
    int32_t code = errors::OK;
};

// =============================================================================
// Vault - user-facing lending entry points
//
// Every mutating call checks, in order: pause state, reentrancy, role or
// compliance, then delegates to the ledger or router. Events are published
// only on success.
// =============================================================================

class Vault {
public:
    Vault(CollateralLedger& ledger, LiquidityRouter& router, AccessControl& access,
          const IComplianceGate* compliance, const VaultConfig& config,
          EventSink sink = nullptr);

    Vault(const Vault&) = delete;
    Vault& operator=(const Vault&) = delete;

    // =========================================================================
    // Administration (owner)
    // =========================================================================

    int32_t register_asset(const Address& caller, const Currency& asset,
                           uint32_t collateral_factor_bps = 10000);
    int32_t set_collateral_factor(const Address& caller, const Currency& asset,
                                  uint32_t collateral_factor_bps);
    int32_t pause(const Address& caller) { return access_.pause(caller); }
    int32_t unpause(const Address& caller) { return access_.unpause(caller); }

    // =========================================================================
    // Positions
    // =========================================================================

    int32_t deposit(const Address& caller, const Currency& asset, I128 amount);
    int32_t withdraw(const Address& caller, const Currency& asset, I128 amount);

    // Borrow from local reserves. on_behalf_of must be the caller unless the
    // caller holds ADAPTER_CALLER.
    int32_t borrow(const Address& caller, const Currency& asset, I128 amount,
                   const Address& on_behalf_of);
    int32_t borrow(const Address& caller, const Currency& asset, I128 amount) {
        return borrow(caller, asset, amount, caller);
    }

    // Borrow through the router's best source. Non-local debt is recorded
    // optimistically; a pending request id is returned for bridge sources.
    BorrowResult borrow_routed(const Address& caller, const Currency& asset, I128 amount);

    // Never compliance-gated. Locally funded debt is paid first, then each
    // external lender in funding order; lenders with a transfer still
    // PENDING for this user are skipped. Excess is refunded.
    RepayResult repay(const Address& caller, const Currency& asset, I128 amount,
                      const Address& on_behalf_of);
    RepayResult repay(const Address& caller, const Currency& asset, I128 amount) {
        return repay(caller, asset, amount, caller);
    }

    LiquidationResult liquidate(const Address& caller, const Currency& debt_asset, I128 amount,
                                const Address& user, const Currency& collateral_asset);

    int32_t set_rate_mode(const Address& caller, const Currency& asset, RateMode mode);
    int32_t rebalance_stable_rate(const Address& caller, const Address& user, const Currency& asset);

    // =========================================================================
    // Flash Loans
    // =========================================================================

    // Atomic: on any shortfall or receiver exception the asset state is
    // restored exactly and FLASH_LOAN_NOT_REPAID returned
    int32_t flash_loan(const Address& caller, FlashLoanReceiver& receiver, const Currency& asset,
                       I128 amount, const std::string& params = {});

    I128 flash_loan_fee(I128 amount) const { return x18::bps(amount, config_.flash_loan_fee_bps); }

    // =========================================================================
    // Cross-chain completion (ADAPTER_CALLER)
    // =========================================================================

    // FAILED rolls back the optimistic debt
    int32_t on_transfer_completed(const Address& caller, const RequestId& request_id, bool success);

    // Forces expired PENDING requests to FAILED; one result per request
    std::vector<SweepResult> sweep_expired_transfers();

    // =========================================================================
    // Queries
    // =========================================================================

    std::optional<uint64_t> health_factor(const Address& user) const { return ledger_.health_factor(user); }
    Position position(const Address& user) const { return ledger_.position(user); }
    bool paused() const { return access_.paused(); }

    CollateralLedger& ledger() { return ledger_; }
    LiquidityRouter& router() { return router_; }

private:
    // Scoped non-reentrancy lock
    class Guard {
    public:
        explicit Guard(bool& flag) : flag_(flag), acquired_(!flag) {
            if (acquired_) flag_ = true;
        }
        ~Guard() {
            if (acquired_) flag_ = false;
        }
        bool acquired() const { return acquired_; }

    private:
        bool& flag_;
        bool acquired_;
    };

    bool compliant(const Address& account) const;
    void emit(const Event& event) const;
    void rollback_debt(const PendingTransfer& transfer);
    bool in_flight(const Address& user, const Currency& asset, const FundingSource& lender) const;
    int32_t abort_flash_loan(const Currency& asset, const AssetState& before);

    CollateralLedger& ledger_;
    LiquidityRouter& router_;
    AccessControl& access_;
    const IComplianceGate* compliance_;
    VaultConfig config_;
    EventSink sink_;

    bool entered_ = false;
};

} // namespace xlend

#endif // XLEND_VAULT_HPP
