// =============================================================================
// ledger.cpp - Collateral Ledger Implementation
// =============================================================================

#include "xlend/ledger.hpp"
#include "xlend/log.hpp"
#include <algorithm>
#include <mutex>

namespace xlend {

namespace {
constexpr std::string_view COMPONENT = "ledger";
}

CollateralLedger::CollateralLedger(const IPriceOracle& oracle, const InterestRateModel& model,
                                   const VaultConfig& config, Clock clock)
    : oracle_(oracle), model_(model), config_(config), clock_(std::move(clock)) {}

// =============================================================================
// Asset Registry
// =============================================================================

int32_t CollateralLedger::register_asset(const Currency& asset, uint32_t collateral_factor_bps) {
    if (collateral_factor_bps > BPS_ONE) {
        return errors::INVALID_CONFIG;
    }

    std::unique_lock lock(mutex_);
    if (assets_.find(asset) != assets_.end()) {
        return errors::ALREADY_REGISTERED;
    }

    AssetState state;
    state.collateral_factor_bps = collateral_factor_bps;
    assets_[asset] = state;
    return errors::OK;
}

int32_t CollateralLedger::set_collateral_factor(const Currency& asset, uint32_t collateral_factor_bps) {
    if (collateral_factor_bps > BPS_ONE) {
        return errors::INVALID_CONFIG;
    }

    std::unique_lock lock(mutex_);
    AssetState* pool = get_asset(asset);
    if (!pool) return errors::UNSUPPORTED_ASSET;
    pool->collateral_factor_bps = collateral_factor_bps;
    return errors::OK;
}

bool CollateralLedger::is_supported(const Currency& asset) const {
    std::shared_lock lock(mutex_);
    return assets_.find(asset) != assets_.end();
}

std::vector<Currency> CollateralLedger::assets() const {
    std::shared_lock lock(mutex_);
    std::vector<Currency> out;
    out.reserve(assets_.size());
    for (const auto& [asset, state] : assets_) out.push_back(asset);
    return out;
}

// =============================================================================
// Deposit/Withdraw
// =============================================================================

int32_t CollateralLedger::deposit(const Address& user, const Currency& asset, I128 amount) {
    if (amount <= 0) {
        return errors::ZERO_AMOUNT;
    }

    std::unique_lock lock(mutex_);
    AssetState* pool = get_asset(asset);
    if (!pool) return errors::UNSUPPORTED_ASSET;

    uint64_t now = clock_();
    UserAccount& account = get_or_create_account(user);
    accrue_locked(account, asset, *pool, now);

    TokenCollateral& tc = account.tokens[asset];
    tc.deposited = safe::add(tc.deposited, amount);
    pool->total_deposited = safe::add(pool->total_deposited, amount);
    pool->reserves = safe::add(pool->reserves, amount);

    sync_position_locked(account, now);
    return errors::OK;
}

int32_t CollateralLedger::withdraw(const Address& user, const Currency& asset, I128 amount) {
    if (amount <= 0) {
        return errors::ZERO_AMOUNT;
    }

    std::unique_lock lock(mutex_);
    AssetState* pool = get_asset(asset);
    if (!pool) return errors::UNSUPPORTED_ASSET;

    uint64_t now = clock_();
    UserAccount& account = get_or_create_account(user);
    accrue_locked(account, asset, *pool, now);

    TokenCollateral& tc = account.tokens[asset];
    if (tc.deposited < amount) {
        return errors::INSUFFICIENT_BALANCE;
    }

    I128 cash = std::min(pool->total_deposited - pool->total_borrowed, pool->reserves);
    if (amount > cash) {
        return errors::INSUFFICIENT_LIQUIDITY;
    }

    // Removing collateral must keep an indebted position healthy
    auto current = valuation_locked(account, asset, 0, 0);
    if (!current) return errors::ORACLE_UNAVAILABLE;
    if (current->debt_usd > 0) {
        auto after = valuation_locked(account, asset, -amount, 0);
        if (!after) return errors::ORACLE_UNAVAILABLE;
        if (health_factor_from(after->collateral_usd, after->debt_usd) < config_.liquidation_threshold) {
            return errors::UNDERCOLLATERALIZED;
        }
    }

    tc.deposited -= amount;
    pool->total_deposited = safe::sub(pool->total_deposited, amount);
    pool->reserves = safe::sub(pool->reserves, amount);

    sync_position_locked(account, now);
    return errors::OK;
}

// =============================================================================
// Borrow/Repay
// =============================================================================

int32_t CollateralLedger::borrow(const Address& user, const Currency& asset, I128 amount) {
    if (amount <= 0) {
        return errors::ZERO_AMOUNT;
    }

    std::unique_lock lock(mutex_);
    AssetState* pool = get_asset(asset);
    if (!pool) return errors::UNSUPPORTED_ASSET;

    uint64_t now = clock_();
    UserAccount& account = get_or_create_account(user);
    accrue_locked(account, asset, *pool, now);

    I128 cash = std::min(pool->total_deposited - pool->total_borrowed, pool->reserves);
    if (amount > cash) {
        return errors::INSUFFICIENT_LIQUIDITY;
    }

    auto after = valuation_locked(account, asset, 0, amount);
    if (!after) return errors::ORACLE_UNAVAILABLE;
    if (health_factor_from(after->collateral_usd, after->debt_usd) < config_.liquidation_threshold) {
        return errors::UNDERCOLLATERALIZED;
    }

    TokenCollateral& tc = account.tokens[asset];
    if (tc.rate_mode == RateMode::STABLE && tc.stable_rate_x18 == 0) {
        tc.stable_rate_x18 = variable_rate_locked(*pool) +
                             InterestRateModel::from_annual_bps(config_.stable_rate_premium_bps);
        tc.stable_locked_until = now + config_.stable_rate_lock_seconds;
    }
    tc.borrowed = safe::add(tc.borrowed, amount);
    pool->total_borrowed = safe::add(pool->total_borrowed, amount);
    pool->reserves = safe::sub(pool->reserves, amount);

    sync_position_locked(account, now);
    return errors::OK;
}

RepayResult CollateralLedger::repay(const Address& user, const Currency& asset, I128 amount) {
    RepayResult result;
    if (amount <= 0) {
        result.code = errors::ZERO_AMOUNT;
        return result;
    }

    std::unique_lock lock(mutex_);
    AssetState* pool = get_asset(asset);
    if (!pool) {
        result.code = errors::UNSUPPORTED_ASSET;
        return result;
    }

    uint64_t now = clock_();
    UserAccount& account = get_or_create_account(user);
    accrue_locked(account, asset, *pool, now);

    TokenCollateral& tc = account.tokens[asset];
    result.repaid = std::min(amount, std::max<I128>(0, tc.local_borrowed()));
    result.refund = amount - result.repaid;

    tc.borrowed -= result.repaid;
    pool->total_borrowed = safe::sub(pool->total_borrowed, result.repaid);
    pool->reserves = safe::add(pool->reserves, result.repaid);

    sync_position_locked(account, now);
    return result;
}

I128 CollateralLedger::accrue_interest(const Address& user, const Currency& asset) {
    std::unique_lock lock(mutex_);
    AssetState* pool = get_asset(asset);
    if (!pool) return 0;

    auto it = accounts_.find(user);
    if (it == accounts_.end()) return 0;

    uint64_t now = clock_();
    I128 interest = accrue_locked(it->second, asset, *pool, now);
    if (interest > 0) {
        sync_position_locked(it->second, now);
    }
    return interest;
}

int32_t CollateralLedger::record_external_debt(const Address& user, const Currency& asset,
                                               const FundingSource& source, I128 amount,
                                               uint32_t rate_bps) {
    if (amount <= 0) {
        return errors::ZERO_AMOUNT;
    }

    std::unique_lock lock(mutex_);
    AssetState* pool = get_asset(asset);
    if (!pool) return errors::UNSUPPORTED_ASSET;

    uint64_t now = clock_();
    UserAccount& account = get_or_create_account(user);
    accrue_locked(account, asset, *pool, now);

    TokenCollateral& tc = account.tokens[asset];
    ExternalDebt& debt = tc.external[source];
    // Blend the rate by owed balance when the same lender funds again
    I128 owed = debt.amount + amount;
    debt.rate_bps = static_cast<uint32_t>(
        (debt.amount * debt.rate_bps + amount * static_cast<I128>(rate_bps)) / owed);
    debt.principal = safe::add(debt.principal, amount);
    debt.amount = safe::add(debt.amount, amount);
    tc.borrowed = safe::add(tc.borrowed, amount);

    sync_position_locked(account, now);
    return errors::OK;
}

int32_t CollateralLedger::release_external_debt(const Address& user, const Currency& asset,
                                                const FundingSource& source, I128 principal) {
    if (principal <= 0) {
        return errors::ZERO_AMOUNT;
    }

    std::unique_lock lock(mutex_);
    AssetState* pool = get_asset(asset);
    if (!pool) return errors::UNSUPPORTED_ASSET;

    auto it = accounts_.find(user);
    if (it == accounts_.end()) return errors::INVALID_STATE;

    uint64_t now = clock_();
    UserAccount& account = it->second;
    accrue_locked(account, asset, *pool, now);

    TokenCollateral& tc = account.tokens[asset];
    auto debt = tc.external.find(source);
    if (debt == tc.external.end()) {
        // Already repaid to the lender
        return errors::OK;
    }

    I128 released = std::min(principal, debt->second.principal);
    I128 owed = released == debt->second.principal
                    ? debt->second.amount
                    : x18::mul_div(debt->second.amount, released, debt->second.principal);
    debt->second.principal -= released;
    debt->second.amount -= owed;
    tc.borrowed = safe::sub(tc.borrowed, owed);
    if (debt->second.principal <= 0) {
        tc.external.erase(debt);
    }

    sync_position_locked(account, now);
    return errors::OK;
}

int32_t CollateralLedger::settle_external_debt(const Address& user, const Currency& asset,
                                               const FundingSource& source, I128 amount) {
    if (amount <= 0) {
        return errors::ZERO_AMOUNT;
    }

    std::unique_lock lock(mutex_);
    AssetState* pool = get_asset(asset);
    if (!pool) return errors::UNSUPPORTED_ASSET;

    auto it = accounts_.find(user);
    if (it == accounts_.end()) return errors::INVALID_STATE;

    uint64_t now = clock_();
    UserAccount& account = it->second;
    accrue_locked(account, asset, *pool, now);

    TokenCollateral& tc = account.tokens[asset];
    auto debt = tc.external.find(source);
    if (debt == tc.external.end()) return errors::INVALID_STATE;

    I128 paid = std::min(amount, debt->second.amount);
    I128 principal_paid = paid == debt->second.amount
                              ? debt->second.principal
                              : x18::mul_div(debt->second.principal, paid, debt->second.amount);
    debt->second.amount -= paid;
    debt->second.principal -= principal_paid;
    tc.borrowed = safe::sub(tc.borrowed, paid);
    if (debt->second.amount <= 0) {
        tc.external.erase(debt);
    }

    sync_position_locked(account, now);
    return errors::OK;
}

// =============================================================================
// Rate Modes
// =============================================================================

int32_t CollateralLedger::set_rate_mode(const Address& user, const Currency& asset, RateMode mode) {
    std::unique_lock lock(mutex_);
    AssetState* pool = get_asset(asset);
    if (!pool) return errors::UNSUPPORTED_ASSET;

    uint64_t now = clock_();
    UserAccount& account = get_or_create_account(user);
    TokenCollateral& tc = account.tokens[asset];

    if (tc.rate_mode == mode) {
        return errors::OK;
    }
    if (tc.rate_mode == RateMode::STABLE && now < tc.stable_locked_until) {
        return errors::STABLE_RATE_LOCKED;
    }

    accrue_locked(account, asset, *pool, now);

    tc.rate_mode = mode;
    if (mode == RateMode::STABLE) {
        tc.stable_rate_x18 = variable_rate_locked(*pool) +
                             InterestRateModel::from_annual_bps(config_.stable_rate_premium_bps);
        tc.stable_locked_until = now + config_.stable_rate_lock_seconds;
    } else {
        tc.stable_rate_x18 = 0;
        tc.stable_locked_until = 0;
    }

    sync_position_locked(account, now);
    return errors::OK;
}

int32_t CollateralLedger::rebalance_stable_rate(const Address& user, const Currency& asset) {
    std::unique_lock lock(mutex_);
    AssetState* pool = get_asset(asset);
    if (!pool) return errors::UNSUPPORTED_ASSET;

    auto it = accounts_.find(user);
    if (it == accounts_.end()) return errors::INVALID_STATE;

    auto tc_it = it->second.tokens.find(asset);
    if (tc_it == it->second.tokens.end() || tc_it->second.rate_mode != RateMode::STABLE) {
        return errors::INVALID_STATE;
    }

    uint64_t now = clock_();
    if (now < tc_it->second.stable_locked_until) {
        return errors::STABLE_RATE_LOCKED;
    }

    accrue_locked(it->second, asset, *pool, now);

    TokenCollateral& tc = tc_it->second;
    tc.stable_rate_x18 = variable_rate_locked(*pool) +
                         InterestRateModel::from_annual_bps(config_.stable_rate_premium_bps);
    tc.stable_locked_until = now + config_.stable_rate_lock_seconds;
    return errors::OK;
}

// =============================================================================
// Liquidation
// =============================================================================

LiquidationResult CollateralLedger::liquidate(const Address& liquidator, const Address& user,
                                              const Currency& debt_asset, I128 amount,
                                              const Currency& collateral_asset) {
    LiquidationResult result;
    if (amount <= 0) {
        result.code = errors::ZERO_AMOUNT;
        return result;
    }
    if (liquidator == user) {
        result.code = errors::UNAUTHORIZED;
        return result;
    }

    std::unique_lock lock(mutex_);
    AssetState* debt_pool = get_asset(debt_asset);
    AssetState* coll_pool = get_asset(collateral_asset);
    if (!debt_pool || !coll_pool) {
        result.code = errors::UNSUPPORTED_ASSET;
        return result;
    }

    auto it = accounts_.find(user);
    if (it == accounts_.end()) {
        result.code = errors::NOT_LIQUIDATABLE;
        return result;
    }
    UserAccount& account = it->second;

    uint64_t now = clock_();
    accrue_locked(account, debt_asset, *debt_pool, now);
    if (collateral_asset != debt_asset) {
        accrue_locked(account, collateral_asset, *coll_pool, now);
    }

    auto value = valuation_locked(account, debt_asset, 0, 0);
    if (!value) {
        result.code = errors::ORACLE_UNAVAILABLE;
        return result;
    }
    if (health_factor_from(value->collateral_usd, value->debt_usd) >= config_.liquidation_threshold) {
        result.code = errors::NOT_LIQUIDATABLE;
        return result;
    }

    TokenCollateral& debt_tc = account.tokens[debt_asset];
    TokenCollateral& coll_tc = account.tokens[collateral_asset];
    I128 max_repay = std::min(x18::bps(debt_tc.borrowed, config_.close_factor_bps),
                              debt_tc.local_borrowed());
    I128 repay = std::min(amount, max_repay);
    if (repay <= 0 || coll_tc.deposited <= 0) {
        result.code = errors::NOT_LIQUIDATABLE;
        return result;
    }

    auto repay_usd = oracle_.convert_to_usd(debt_asset, repay);
    if (!repay_usd) {
        result.code = errors::ORACLE_UNAVAILABLE;
        return result;
    }
    I128 seize_usd = *repay_usd + x18::bps(*repay_usd, config_.liquidation_bonus_bps);
    auto seize = oracle_.convert_usd_to_asset(seize_usd, collateral_asset);
    if (!seize) {
        result.code = errors::ORACLE_UNAVAILABLE;
        return result;
    }

    result.repaid = repay;
    result.seized = std::min(*seize, coll_tc.deposited);

    debt_tc.borrowed -= repay;
    debt_pool->total_borrowed = safe::sub(debt_pool->total_borrowed, repay);
    debt_pool->reserves = safe::add(debt_pool->reserves, repay);

    // Seized collateral moves to the liquidator's position; pool totals unchanged
    coll_tc.deposited -= result.seized;
    UserAccount& liq_account = get_or_create_account(liquidator);
    accrue_locked(liq_account, collateral_asset, *coll_pool, now);
    TokenCollateral& liq_tc = liq_account.tokens[collateral_asset];
    liq_tc.deposited = safe::add(liq_tc.deposited, result.seized);

    sync_position_locked(account, now);
    sync_position_locked(liq_account, now);

    log::info(COMPONENT, "liquidated ", to_hex(user), " repaid=", x18::to_string(repay),
              " seized=", x18::to_string(result.seized));
    return result;
}

// =============================================================================
// Reserve Movements
// =============================================================================

std::optional<AssetState> CollateralLedger::asset_state(const Currency& asset) const {
    std::shared_lock lock(mutex_);
    const AssetState* pool = get_asset(asset);
    if (!pool) return std::nullopt;
    return *pool;
}

int32_t CollateralLedger::restore_asset_state(const Currency& asset, const AssetState& state) {
    std::unique_lock lock(mutex_);
    AssetState* pool = get_asset(asset);
    if (!pool) return errors::UNSUPPORTED_ASSET;
    *pool = state;
    return errors::OK;
}

int32_t CollateralLedger::draw_reserves(const Currency& asset, I128 amount) {
    if (amount <= 0) {
        return errors::ZERO_AMOUNT;
    }

    std::unique_lock lock(mutex_);
    AssetState* pool = get_asset(asset);
    if (!pool) return errors::UNSUPPORTED_ASSET;
    if (pool->reserves < amount) {
        return errors::INSUFFICIENT_LIQUIDITY;
    }
    pool->reserves -= amount;
    return errors::OK;
}

int32_t CollateralLedger::credit_reserves(const Currency& asset, I128 amount) {
    if (amount <= 0) {
        return errors::ZERO_AMOUNT;
    }

    std::unique_lock lock(mutex_);
    AssetState* pool = get_asset(asset);
    if (!pool) return errors::UNSUPPORTED_ASSET;
    pool->reserves = safe::add(pool->reserves, amount);
    return errors::OK;
}

int32_t CollateralLedger::book_revenue(const Currency& asset, I128 fee) {
    std::unique_lock lock(mutex_);
    AssetState* pool = get_asset(asset);
    if (!pool) return errors::UNSUPPORTED_ASSET;
    pool->protocol_revenue = safe::add(pool->protocol_revenue, fee);
    return errors::OK;
}

// =============================================================================
// Queries
// =============================================================================

Position CollateralLedger::position(const Address& user) const {
    std::shared_lock lock(mutex_);
    const UserAccount* account = get_account(user);
    return account ? account->position : Position{};
}

TokenCollateral CollateralLedger::token_collateral(const Address& user, const Currency& asset) const {
    std::shared_lock lock(mutex_);
    const UserAccount* account = get_account(user);
    if (!account) return TokenCollateral{};
    auto it = account->tokens.find(asset);
    if (it == account->tokens.end()) return TokenCollateral{};

    TokenCollateral tc = it->second;
    if (const AssetState* pool = get_asset(asset)) refresh_supply(tc, *pool);
    return tc;
}

I128 CollateralLedger::total_deposited(const Currency& asset) const {
    std::shared_lock lock(mutex_);
    const AssetState* pool = get_asset(asset);
    return pool ? pool->total_deposited : 0;
}

I128 CollateralLedger::total_borrowed(const Currency& asset) const {
    std::shared_lock lock(mutex_);
    const AssetState* pool = get_asset(asset);
    return pool ? pool->total_borrowed : 0;
}

I128 CollateralLedger::reserves(const Currency& asset) const {
    std::shared_lock lock(mutex_);
    const AssetState* pool = get_asset(asset);
    return pool ? pool->reserves : 0;
}

I128 CollateralLedger::available_liquidity(const Currency& asset) const {
    std::shared_lock lock(mutex_);
    const AssetState* pool = get_asset(asset);
    if (!pool) return 0;
    return std::max<I128>(0, std::min(pool->total_deposited - pool->total_borrowed, pool->reserves));
}

I128 CollateralLedger::current_rate(const Currency& asset) const {
    std::shared_lock lock(mutex_);
    const AssetState* pool = get_asset(asset);
    return pool ? variable_rate_locked(*pool) : 0;
}

uint32_t CollateralLedger::current_rate_bps(const Currency& asset) const {
    std::shared_lock lock(mutex_);
    const AssetState* pool = get_asset(asset);
    if (!pool) return 0;
    return model_.annual_rate_bps(
        InterestRateModel::utilization(pool->total_borrowed, pool->total_deposited));
}

std::optional<uint64_t> CollateralLedger::health_factor(const Address& user) const {
    std::shared_lock lock(mutex_);
    const UserAccount* account = get_account(user);
    if (!account) return UNBOUNDED_HEALTH;

    auto value = valuation_locked(*account, NATIVE, 0, 0);
    if (!value) return std::nullopt;
    return health_factor_from(value->collateral_usd, value->debt_usd);
}

std::optional<uint64_t> CollateralLedger::health_factor_after(const Address& user, const Currency& asset,
                                                              I128 extra_debt) const {
    std::shared_lock lock(mutex_);
    const UserAccount* account = get_account(user);
    UserAccount empty;
    auto value = valuation_locked(account ? *account : empty, asset, 0, extra_debt);
    if (!value) return std::nullopt;
    return health_factor_from(value->collateral_usd, value->debt_usd);
}

std::optional<I128> CollateralLedger::collateral_value_usd(const Address& user) const {
    std::shared_lock lock(mutex_);
    const UserAccount* account = get_account(user);
    if (!account) return I128{0};
    auto value = valuation_locked(*account, NATIVE, 0, 0);
    if (!value) return std::nullopt;
    return value->collateral_usd;
}

std::optional<I128> CollateralLedger::debt_value_usd(const Address& user) const {
    std::shared_lock lock(mutex_);
    const UserAccount* account = get_account(user);
    if (!account) return I128{0};
    auto value = valuation_locked(*account, NATIVE, 0, 0);
    if (!value) return std::nullopt;
    return value->debt_usd;
}

uint64_t CollateralLedger::health_factor_from(I128 collateral_usd, I128 debt_usd) {
    if (debt_usd <= 0) return UNBOUNDED_HEALTH;
    if (collateral_usd <= debt_usd) return 0;
    I128 hf = x18::mul_div(collateral_usd - debt_usd, 100, debt_usd);
    if (hf >= static_cast<I128>(UNBOUNDED_HEALTH)) return UNBOUNDED_HEALTH - 1;
    return static_cast<uint64_t>(hf);
}

// =============================================================================
// Internal Helpers
// =============================================================================

CollateralLedger::UserAccount& CollateralLedger::get_or_create_account(const Address& user) {
    return accounts_[user];
}

const CollateralLedger::UserAccount* CollateralLedger::get_account(const Address& user) const {
    auto it = accounts_.find(user);
    return (it != accounts_.end()) ? &it->second : nullptr;
}

AssetState* CollateralLedger::get_asset(const Currency& asset) {
    auto it = assets_.find(asset);
    return (it != assets_.end()) ? &it->second : nullptr;
}

const AssetState* CollateralLedger::get_asset(const Currency& asset) const {
    auto it = assets_.find(asset);
    return (it != assets_.end()) ? &it->second : nullptr;
}

I128 CollateralLedger::variable_rate_locked(const AssetState& pool) const {
    return model_.rate(InterestRateModel::utilization(pool.total_borrowed, pool.total_deposited));
}

void CollateralLedger::refresh_supply(TokenCollateral& tc, const AssetState& pool) {
    tc.deposited = current_deposit(tc, pool);
    tc.supply_index = pool.supply_index;
}

I128 CollateralLedger::current_deposit(const TokenCollateral& tc, const AssetState& pool) {
    if (tc.deposited <= 0 || tc.supply_index == pool.supply_index || tc.supply_index <= 0) {
        return tc.deposited;
    }
    return x18::mul_div(tc.deposited, pool.supply_index, tc.supply_index);
}

I128 CollateralLedger::accrue_locked(UserAccount& account, const Currency& asset,
                                     AssetState& pool, uint64_t now) {
    TokenCollateral& tc = account.tokens[asset];
    refresh_supply(tc, pool);

    if (!tc.accruing) {
        tc.accruing = true;
        tc.last_update = now;
        return 0;
    }
    if (now <= tc.last_update) {
        return 0;
    }

    uint64_t elapsed = now - tc.last_update;
    I128 rate = tc.rate_mode == RateMode::STABLE ? tc.stable_rate_x18 : variable_rate_locked(pool);
    I128 interest = InterestRateModel::interest(tc.local_borrowed(), rate, elapsed);

    if (interest > 0) {
        tc.borrowed = safe::add(tc.borrowed, interest);
        pool.total_borrowed = safe::add(pool.total_borrowed, interest);
        // Suppliers earn it pro rata through the supply index
        if (pool.total_deposited > 0) {
            pool.supply_index = safe::add(pool.supply_index,
                                          x18::mul_div(pool.supply_index, interest, pool.total_deposited));
        }
        pool.total_deposited = safe::add(pool.total_deposited, interest);
        refresh_supply(tc, pool);
    }

    // External lenders charge the rate they quoted; owed to them, not the pool
    for (auto& [source, debt] : tc.external) {
        I128 owed = InterestRateModel::interest(
            debt.amount, InterestRateModel::from_annual_bps(debt.rate_bps), elapsed);
        if (owed <= 0) continue;
        debt.amount = safe::add(debt.amount, owed);
        tc.borrowed = safe::add(tc.borrowed, owed);
        interest += owed;
    }

    tc.last_update = now;
    return interest;
}

std::optional<CollateralLedger::Valuation> CollateralLedger::valuation_locked(
        const UserAccount& account, const Currency& asset,
        I128 collateral_delta, I128 debt_delta) const {
    Valuation value{0, 0};

    auto add_asset = [&](const Currency& a, I128 deposited, I128 borrowed) -> bool {
        const AssetState* pool = get_asset(a);
        uint32_t factor = pool ? pool->collateral_factor_bps : 0;
        if (deposited > 0 && factor > 0) {
            auto usd = oracle_.convert_to_usd(a, deposited);
            if (!usd) return false;
            value.collateral_usd += x18::bps(*usd, factor);
        }
        if (borrowed > 0) {
            auto usd = oracle_.convert_to_usd(a, borrowed);
            if (!usd) return false;
            value.debt_usd += *usd;
        }
        return true;
    };

    bool seen = false;
    for (const auto& [a, tc] : account.tokens) {
        const AssetState* pool = get_asset(a);
        I128 deposited = pool ? current_deposit(tc, *pool) : tc.deposited;
        I128 borrowed = tc.borrowed;
        if (a == asset) {
            deposited += collateral_delta;
            borrowed += debt_delta;
            seen = true;
        }
        if (!add_asset(a, deposited, borrowed)) return std::nullopt;
    }
    if (!seen && (collateral_delta > 0 || debt_delta > 0)) {
        if (!add_asset(asset, std::max<I128>(collateral_delta, 0), std::max<I128>(debt_delta, 0))) {
            return std::nullopt;
        }
    }

    return value;
}

void CollateralLedger::sync_position_locked(UserAccount& account, uint64_t now) {
    auto native = account.tokens.find(NATIVE);
    if (native != account.tokens.end()) {
        account.position.collateral = native->second.deposited;
        account.position.debt = native->second.borrowed;
    }

    I128 borrowed_usd = 0;
    for (const auto& [a, tc] : account.tokens) {
        if (tc.borrowed <= 0) continue;
        auto usd = oracle_.convert_to_usd(a, tc.borrowed);
        if (!usd) {
            log::warn(COMPONENT, "no price for ", to_hex(a.addr), "; borrowed_usd left at last valuation");
            borrowed_usd = account.position.borrowed_usd;
            break;
        }
        borrowed_usd += *usd;
    }
    account.position.borrowed_usd = borrowed_usd;
    account.position.last_update = now;
}

} // namespace xlend
