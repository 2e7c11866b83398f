// =============================================================================
// vault.cpp - Lending entry points, flash loans, cross-chain completion
// =============================================================================

#include "xlend/vault.hpp"
#include "xlend/log.hpp"
#include <algorithm>

namespace xlend {

namespace {
constexpr std::string_view COMPONENT = "vault";
}

// =============================================================================
// FlashContext
// =============================================================================

int32_t FlashContext::repay(I128 amount) {
    int32_t rc = ledger_.credit_reserves(asset_, amount);
    if (rc == errors::OK) {
        repaid_ += amount;
    }
    return rc;
}

// =============================================================================
// Vault
// =============================================================================

Vault::Vault(CollateralLedger& ledger, LiquidityRouter& router, AccessControl& access,
             const IComplianceGate* compliance, const VaultConfig& config, EventSink sink)
    : ledger_(ledger),
      router_(router),
      access_(access),
      compliance_(compliance),
      config_(config),
      sink_(std::move(sink)) {}

bool Vault::compliant(const Address& account) const {
    return passes_compliance(compliance_, config_.compliance_mode, account, config_.required_claim_topic);
}

void Vault::emit(const Event& event) const {
    if (sink_) sink_(event);
}

int32_t Vault::register_asset(const Address& caller, const Currency& asset, uint32_t collateral_factor_bps) {
    if (int32_t rc = access_.require(caller, Role::OWNER); rc != errors::OK) {
        return rc;
    }
    int32_t rc = ledger_.register_asset(asset, collateral_factor_bps);
    if (rc == errors::OK) {
        log::info(COMPONENT, "registered asset ", to_hex(asset.addr), " factor=", collateral_factor_bps);
    }
    return rc;
}

int32_t Vault::set_collateral_factor(const Address& caller, const Currency& asset,
                                     uint32_t collateral_factor_bps) {
    if (int32_t rc = access_.require(caller, Role::OWNER); rc != errors::OK) {
        return rc;
    }
    return ledger_.set_collateral_factor(asset, collateral_factor_bps);
}

// =============================================================================
// Positions
// =============================================================================

int32_t Vault::deposit(const Address& caller, const Currency& asset, I128 amount) {
    if (access_.paused()) return errors::PAUSED;
    Guard guard(entered_);
    if (!guard.acquired()) return errors::REENTRANCY;
    if (!compliant(caller)) return errors::COMPLIANCE_REQUIRED;

    int32_t rc = ledger_.deposit(caller, asset, amount);
    if (rc == errors::OK) {
        emit(DepositRecord{caller, asset, amount, ledger_.now()});
    }
    return rc;
}

int32_t Vault::withdraw(const Address& caller, const Currency& asset, I128 amount) {
    if (access_.paused()) return errors::PAUSED;
    Guard guard(entered_);
    if (!guard.acquired()) return errors::REENTRANCY;

    int32_t rc = ledger_.withdraw(caller, asset, amount);
    if (rc == errors::OK) {
        emit(WithdrawRecord{caller, asset, amount, ledger_.now()});
    }
    return rc;
}

int32_t Vault::borrow(const Address& caller, const Currency& asset, I128 amount,
                      const Address& on_behalf_of) {
    if (access_.paused()) return errors::PAUSED;
    Guard guard(entered_);
    if (!guard.acquired()) return errors::REENTRANCY;
    if (on_behalf_of != caller && !access_.has_role(caller, Role::ADAPTER_CALLER)) {
        return errors::UNAUTHORIZED;
    }
    if (!compliant(on_behalf_of)) return errors::COMPLIANCE_REQUIRED;

    int32_t rc = ledger_.borrow(on_behalf_of, asset, amount);
    if (rc == errors::OK) {
        emit(BorrowRecord{on_behalf_of, asset, amount, SourceType::LOCAL_VAULT, ledger_.now()});
    }
    return rc;
}

BorrowResult Vault::borrow_routed(const Address& caller, const Currency& asset, I128 amount) {
    BorrowResult result;
    if (access_.paused()) {
        result.code = errors::PAUSED;
        return result;
    }
    Guard guard(entered_);
    if (!guard.acquired()) {
        result.code = errors::REENTRANCY;
        return result;
    }
    if (!compliant(caller)) {
        result.code = errors::COMPLIANCE_REQUIRED;
        return result;
    }
    if (amount <= 0) {
        result.code = errors::ZERO_AMOUNT;
        return result;
    }
    if (!ledger_.is_supported(asset)) {
        result.code = errors::UNSUPPORTED_ASSET;
        return result;
    }

    auto quote = router_.route(asset, amount);
    if (!quote) {
        result.code = errors::NO_LIQUIDITY_SOURCE;
        return result;
    }
    if (quote->available < amount) {
        result.code = errors::INSUFFICIENT_LIQUIDITY;
        return result;
    }

    // The local source runs the ledger's own checked borrow; others are
    // checked here before funds move
    bool local = quote->source_type == SourceType::LOCAL_VAULT;
    if (!local) {
        auto hf = ledger_.health_factor_after(caller, asset, amount);
        if (!hf) {
            result.code = errors::ORACLE_UNAVAILABLE;
            return result;
        }
        if (*hf < config_.liquidation_threshold) {
            result.code = errors::UNDERCOLLATERALIZED;
            return result;
        }
    }

    result = router_.execute(*quote, caller, BorrowContext{caller});
    if (!result.ok()) {
        log::warn(COMPONENT, "routed borrow via ", to_string(quote->source_type), " failed: ",
                  errors::name(result.code));
        return result;
    }

    if (!local) {
        FundingSource lender{quote->source_index, result.chain_id};
        int32_t rc = ledger_.record_external_debt(caller, asset, lender, amount, quote->rate_bps);
        if (rc != errors::OK) {
            log::error(COMPONENT, "debt not recorded for ", to_hex(caller), ": ", errors::name(rc));
            result.code = rc;
            return result;
        }
    }

    emit(BorrowRecord{caller, asset, amount, quote->source_type, ledger_.now()});
    return result;
}

RepayResult Vault::repay(const Address&, const Currency& asset, I128 amount,
                         const Address& on_behalf_of) {
    RepayResult result;
    if (access_.paused()) {
        result.code = errors::PAUSED;
        return result;
    }
    Guard guard(entered_);
    if (!guard.acquired()) {
        result.code = errors::REENTRANCY;
        return result;
    }

    result = ledger_.repay(on_behalf_of, asset, amount);
    if (result.code != errors::OK) {
        return result;
    }

    // Whatever the local pool did not take goes to external lenders in
    // funding order
    auto tc = ledger_.token_collateral(on_behalf_of, asset);
    for (const auto& [lender, debt] : tc.external) {
        if (result.refund <= 0) break;
        if (debt.amount <= 0 || in_flight(on_behalf_of, asset, lender)) continue;

        I128 pay = std::min(result.refund, debt.amount);
        int32_t rc = router_.repay(lender.source_index, asset, pay, on_behalf_of, lender.chain_id);
        if (rc != errors::OK) {
            result.code = rc;
            break;
        }
        result.repaid += pay;
        result.refund -= pay;

        rc = ledger_.settle_external_debt(on_behalf_of, asset, lender, pay);
        if (rc != errors::OK) {
            log::error(COMPONENT, "repayment to source ", lender.source_index, " not settled: ",
                       errors::name(rc));
            result.code = rc;
            break;
        }
    }

    if (result.repaid > 0) {
        emit(RepayRecord{on_behalf_of, asset, result.repaid, ledger_.now()});
    }
    return result;
}

bool Vault::in_flight(const Address& user, const Currency& asset, const FundingSource& lender) const {
    for (const auto& t : router_.pending_transfers()) {
        if (t.user == user && t.asset == asset && t.source_index == lender.source_index &&
            t.chain_id == lender.chain_id) {
            return true;
        }
    }
    return false;
}

LiquidationResult Vault::liquidate(const Address& caller, const Currency& debt_asset, I128 amount,
                                   const Address& user, const Currency& collateral_asset) {
    LiquidationResult result;
    if (access_.paused()) {
        result.code = errors::PAUSED;
        return result;
    }
    Guard guard(entered_);
    if (!guard.acquired()) {
        result.code = errors::REENTRANCY;
        return result;
    }

    result = ledger_.liquidate(caller, user, debt_asset, amount, collateral_asset);
    if (result.code == errors::OK) {
        emit(LiquidationRecord{caller, user, debt_asset, collateral_asset,
                               result.repaid, result.seized, ledger_.now()});
    }
    return result;
}

int32_t Vault::set_rate_mode(const Address& caller, const Currency& asset, RateMode mode) {
    if (access_.paused()) return errors::PAUSED;
    Guard guard(entered_);
    if (!guard.acquired()) return errors::REENTRANCY;
    return ledger_.set_rate_mode(caller, asset, mode);
}

int32_t Vault::rebalance_stable_rate(const Address&, const Address& user, const Currency& asset) {
    if (access_.paused()) return errors::PAUSED;
    Guard guard(entered_);
    if (!guard.acquired()) return errors::REENTRANCY;
    return ledger_.rebalance_stable_rate(user, asset);
}

// =============================================================================
// Flash Loans
// =============================================================================

int32_t Vault::abort_flash_loan(const Currency& asset, const AssetState& before) {
    if (int32_t rc = ledger_.restore_asset_state(asset, before); rc != errors::OK) {
        log::error(COMPONENT, "flash loan rollback failed: ", errors::name(rc));
    }
    return errors::FLASH_LOAN_NOT_REPAID;
}

int32_t Vault::flash_loan(const Address& caller, FlashLoanReceiver& receiver, const Currency& asset,
                          I128 amount, const std::string& params) {
    if (access_.paused()) return errors::PAUSED;
    Guard guard(entered_);
    if (!guard.acquired()) return errors::REENTRANCY;
    if (amount <= 0) return errors::ZERO_AMOUNT;

    auto before = ledger_.asset_state(asset);
    if (!before) return errors::UNSUPPORTED_ASSET;
    if (before->reserves < amount) return errors::INSUFFICIENT_LIQUIDITY;

    I128 fee = flash_loan_fee(amount);
    if (int32_t rc = ledger_.draw_reserves(asset, amount); rc != errors::OK) {
        return rc;
    }

    FlashContext ctx(ledger_, asset, amount, fee);
    try {
        receiver.execute_operation(ctx, params);
    } catch (const std::exception& e) {
        log::warn(COMPONENT, "flash loan receiver aborted: ", e.what());
        return abort_flash_loan(asset, *before);
    } catch (...) {
        abort_flash_loan(asset, *before);
        throw;
    }

    auto after = ledger_.asset_state(asset);
    if (!after || after->reserves < before->reserves + fee) {
        log::warn(COMPONENT, "flash loan of ", x18::to_string(amount), " not repaid (returned ",
                  x18::to_string(ctx.repaid()), ")");
        return abort_flash_loan(asset, *before);
    }

    if (int32_t rc = ledger_.book_revenue(asset, after->reserves - before->reserves); rc != errors::OK) {
        log::error(COMPONENT, "flash loan fee not booked: ", errors::name(rc));
    }
    emit(FlashLoanRecord{caller, asset, amount, fee, ledger_.now()});
    return errors::OK;
}

// =============================================================================
// Cross-chain completion
// =============================================================================

void Vault::rollback_debt(const PendingTransfer& transfer) {
    FundingSource lender{transfer.source_index, transfer.chain_id};
    int32_t rc = ledger_.release_external_debt(transfer.user, transfer.asset, lender, transfer.amount);
    if (rc != errors::OK) {
        log::error(COMPONENT, "debt rollback for ", to_hex(transfer.request_id), " failed: ",
                   errors::name(rc));
    }
}

int32_t Vault::on_transfer_completed(const Address& caller, const RequestId& request_id, bool success) {
    if (int32_t rc = access_.require(caller, Role::ADAPTER_CALLER); rc != errors::OK) {
        return rc;
    }
    Guard guard(entered_);
    if (!guard.acquired()) return errors::REENTRANCY;

    auto result = router_.complete(request_id, success);
    if (result.code != errors::OK) {
        log::warn(COMPONENT, "completion of ", to_hex(request_id), " rejected: ", errors::name(result.code));
        return result.code;
    }
    if (result.transfer && result.transfer->status == TransferStatus::FAILED) {
        rollback_debt(*result.transfer);
    }
    return errors::OK;
}

std::vector<SweepResult> Vault::sweep_expired_transfers() {
    std::vector<SweepResult> out;
    for (const auto& r : router_.sweep_expired()) {
        if (r.code == errors::OK && r.transfer && r.transfer->status == TransferStatus::FAILED) {
            rollback_debt(*r.transfer);
        }
        out.push_back(SweepResult{r.request_id, r.code});
    }
    return out;
}

} // namespace xlend
