// =============================================================================
// liquidity.cpp - Local, external money market and cross-chain sources
// =============================================================================

#include "xlend/liquidity.hpp"
#include "xlend/chains.hpp"
#include "xlend/log.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <mutex>

namespace xlend {

using json = nlohmann::json;

namespace {

constexpr std::string_view COMPONENT = "liquidity";

void put_be64(RequestId& id, size_t offset, uint64_t v) {
    for (size_t i = 0; i < 8; ++i) {
        id[offset + 7 - i] = static_cast<uint8_t>(v & 0xFF);
        v >>= 8;
    }
}

// FNV-1a over raw bytes
uint64_t fnv1a(uint64_t h, const uint8_t* data, size_t len) {
    for (size_t i = 0; i < len; ++i) {
        h ^= data[i];
        h *= 1099511628211ULL;
    }
    return h;
}

} // namespace

// =============================================================================
// LocalVaultSource
// =============================================================================

LocalVaultSource::LocalVaultSource(CollateralLedger& ledger, const Address& vault_address, ChainId chain)
    : ledger_(ledger), address_(vault_address), chain_(chain) {}

bool LocalVaultSource::supports_asset(const Currency& asset) const {
    return ledger_.is_supported(asset);
}

I128 LocalVaultSource::available_liquidity(const Currency& asset) const {
    return ledger_.available_liquidity(asset);
}

std::optional<LiquidityQuote> LocalVaultSource::quote(const Currency& asset, I128 amount) const {
    if (!supports_asset(asset)) return std::nullopt;

    LiquidityQuote q;
    q.source_type = SourceType::LOCAL_VAULT;
    q.source = address_;
    q.chain_id = chain_;
    q.asset = asset;
    q.available = std::min(amount, ledger_.available_liquidity(asset));
    q.fee_bps = 0;
    q.settlement_seconds = 0;
    q.rate_bps = ledger_.current_rate_bps(asset);
    return q;
}

BorrowResult LocalVaultSource::borrow(const Currency& asset, I128 amount, const Address&,
                                      const BorrowContext& context) {
    BorrowResult result;
    result.code = ledger_.borrow(context.user, asset, amount);
    result.chain_id = chain_;
    return result;
}

// =============================================================================
// ExternalMoneyMarketSource
// =============================================================================

ExternalMoneyMarketSource::ExternalMoneyMarketSource(std::shared_ptr<IMoneyMarket> market, ChainId chain)
    : market_(std::move(market)), chain_(chain) {}

bool ExternalMoneyMarketSource::supports_asset(const Currency& asset) const {
    return market_->supports(asset);
}

I128 ExternalMoneyMarketSource::available_liquidity(const Currency& asset) const {
    if (!market_->supports(asset)) return 0;
    return std::max<I128>(0, market_->available(asset));
}

std::optional<LiquidityQuote> ExternalMoneyMarketSource::quote(const Currency& asset, I128 amount) const {
    if (!supports_asset(asset)) return std::nullopt;

    LiquidityQuote q;
    q.source_type = SourceType::EXTERNAL_MONEY_MARKET;
    q.source = market_->address();
    q.chain_id = chain_;
    q.asset = asset;
    q.available = std::min(amount, available_liquidity(asset));
    q.fee_bps = 0;
    q.settlement_seconds = 0;
    q.rate_bps = market_->borrow_rate_bps(asset);
    return q;
}

BorrowResult ExternalMoneyMarketSource::borrow(const Currency& asset, I128 amount, const Address&,
                                               const BorrowContext& context) {
    BorrowResult result;
    if (amount <= 0) {
        result.code = errors::ZERO_AMOUNT;
        return result;
    }
    if (!supports_asset(asset)) {
        result.code = errors::UNSUPPORTED_ASSET;
        return result;
    }
    if (available_liquidity(asset) < amount) {
        result.code = errors::INSUFFICIENT_LIQUIDITY;
        return result;
    }

    try {
        market_->borrow(asset, amount, context.user);
        result.chain_id = chain_;
    } catch (const AdapterError& e) {
        log::error(COMPONENT, "money market borrow failed: ", e.what());
        result.code = errors::ADAPTER_FAILED;
    }
    return result;
}

int32_t ExternalMoneyMarketSource::repay(const Currency& asset, I128 amount, const Address& on_behalf_of,
                                         ChainId) {
    if (amount <= 0) return errors::ZERO_AMOUNT;
    if (!supports_asset(asset)) return errors::UNSUPPORTED_ASSET;
    try {
        market_->repay(asset, amount, on_behalf_of);
    } catch (const AdapterError& e) {
        log::error(COMPONENT, "money market repay failed: ", e.what());
        return errors::ADAPTER_FAILED;
    }
    return errors::OK;
}

// =============================================================================
// CrossChainBridgeSource
// =============================================================================

CrossChainBridgeSource::CrossChainBridgeSource(BridgeManager& bridge, const AccessControl& access,
                                               const Address& address, ChainId local_chain,
                                               BridgeSourceParams params, Clock clock, EventSink sink)
    : bridge_(bridge),
      access_(access),
      address_(address),
      local_chain_(local_chain),
      params_(params),
      clock_(std::move(clock)),
      sink_(std::move(sink)) {}

RequestId CrossChainBridgeSource::make_request_id(ChainId chain, ChainId source_chain,
                                                  const Address& requester, const Currency& asset,
                                                  I128 amount, uint64_t nonce) {
    RequestId id{};
    put_be64(id, 0, chain);
    put_be64(id, 8, source_chain);
    put_be64(id, 16, nonce);

    uint64_t h = 14695981039346656037ULL;
    h = fnv1a(h, requester.data(), requester.size());
    h = fnv1a(h, asset.addr.data(), asset.addr.size());
    U128 raw = static_cast<U128>(amount);
    uint8_t amount_bytes[16];
    for (size_t i = 0; i < 16; ++i) {
        amount_bytes[i] = static_cast<uint8_t>(raw >> (8 * i));
    }
    h = fnv1a(h, amount_bytes, sizeof(amount_bytes));
    put_be64(id, 24, h);
    return id;
}

bool CrossChainBridgeSource::authorized(const Address& caller) const {
    return access_.has_role(caller, Role::OWNER) || access_.has_role(caller, Role::ADAPTER_CALLER);
}

int32_t CrossChainBridgeSource::set_remote_vault(const Address& caller, ChainId chain, const Address& vault) {
    if (!authorized(caller)) return errors::UNAUTHORIZED;
    if (chain == local_chain_ || !chain_name(chain)) return errors::UNSUPPORTED_CHAIN;
    if (vault == ZERO_ADDRESS) return errors::INVALID_ADDRESS;

    std::unique_lock lock(mutex_);
    remote_vaults_[chain] = vault;
    return errors::OK;
}

int32_t CrossChainBridgeSource::sync_remote_liquidity(const Address& caller, ChainId chain,
                                                      const Currency& asset, I128 available,
                                                      uint32_t rate_bps) {
    if (!authorized(caller)) return errors::UNAUTHORIZED;
    if (chain == local_chain_ || !chain_name(chain)) return errors::UNSUPPORTED_CHAIN;

    std::unique_lock lock(mutex_);
    remote_[{chain, asset}] = RemoteLiquidity{std::max<I128>(0, available), rate_bps};
    log::debug(COMPONENT, "remote liquidity chain=", chain, " available=", x18::to_string(available),
               " rate_bps=", rate_bps);
    return errors::OK;
}

std::optional<RemoteLiquidity> CrossChainBridgeSource::remote_liquidity(ChainId chain,
                                                                        const Currency& asset) const {
    std::shared_lock lock(mutex_);
    auto it = remote_.find({chain, asset});
    if (it == remote_.end()) return std::nullopt;
    return it->second;
}

std::optional<std::pair<ChainId, RemoteLiquidity>>
CrossChainBridgeSource::best_remote_locked(const Currency& asset) const {
    std::optional<std::pair<ChainId, RemoteLiquidity>> best;
    for (const auto& [key, liquidity] : remote_) {
        if (key.second != asset || liquidity.available <= 0) continue;
        if (!remote_vaults_.count(key.first)) continue;
        auto name = chain_name(key.first);
        if (!name || !bridge_.is_chain_supported(*name)) continue;

        if (!best ||
            liquidity.rate_bps < best->second.rate_bps ||
            (liquidity.rate_bps == best->second.rate_bps &&
             liquidity.available > best->second.available)) {
            best = std::make_pair(key.first, liquidity);
        }
    }
    return best;
}

bool CrossChainBridgeSource::supports_asset(const Currency& asset) const {
    std::shared_lock lock(mutex_);
    for (const auto& [key, liquidity] : remote_) {
        if (key.second == asset) return true;
    }
    return false;
}

I128 CrossChainBridgeSource::available_liquidity(const Currency& asset) const {
    std::shared_lock lock(mutex_);
    auto best = best_remote_locked(asset);
    return best ? best->second.available : 0;
}

std::optional<LiquidityQuote> CrossChainBridgeSource::quote(const Currency& asset, I128 amount) const {
    if (!supports_asset(asset)) return std::nullopt;

    std::shared_lock lock(mutex_);
    LiquidityQuote q;
    q.source_type = SourceType::CROSS_CHAIN_BRIDGE;
    q.source = address_;
    q.asset = asset;
    q.fee_bps = params_.fee_bps;
    q.settlement_seconds = params_.settlement_seconds;

    if (auto best = best_remote_locked(asset)) {
        q.chain_id = best->first;
        q.available = std::min(amount, best->second.available);
        q.rate_bps = best->second.rate_bps;
    }
    return q;
}

BorrowResult CrossChainBridgeSource::borrow(const Currency& asset, I128 amount, const Address& recipient,
                                            const BorrowContext& context) {
    BorrowResult result;
    if (amount <= 0) {
        result.code = errors::ZERO_AMOUNT;
        return result;
    }
    if (recipient == ZERO_ADDRESS) {
        result.code = errors::INVALID_ADDRESS;
        return result;
    }

    LiquidityTransferRequest req;
    std::string chain;
    Address remote_vault{};
    {
        std::unique_lock lock(mutex_);
        auto best = best_remote_locked(asset);
        if (!best) {
            bool known = std::any_of(remote_.begin(), remote_.end(),
                                     [&](const auto& kv) { return kv.first.second == asset; });
            result.code = known ? errors::INSUFFICIENT_REMOTE_LIQUIDITY : errors::UNSUPPORTED_ASSET;
            return result;
        }
        if (best->second.available < amount) {
            result.code = errors::INSUFFICIENT_REMOTE_LIQUIDITY;
            return result;
        }

        req.source_chain = best->first;
        req.destination_chain = local_chain_;
        req.user = context.user;
        req.recipient = recipient;
        req.asset = asset;
        req.amount = amount;
        req.fee = x18::bps(amount, params_.fee_bps);
        req.created_at = clock_();
        req.id = make_request_id(local_chain_, req.source_chain, context.user, asset, amount, ++nonce_);

        // Optimistic reservation, restored if the send or the transfer fails
        remote_[{req.source_chain, asset}].available -= amount;
        chain = *chain_name(req.source_chain);
        remote_vault = remote_vaults_.at(req.source_chain);
    }

    json message = {
        {"type", "LIQUIDITY_REQUEST"},
        {"requestId", to_hex(req.id)},
        {"user", to_hex(req.user)},
        {"recipient", to_hex(req.recipient)},
        {"asset", to_hex(asset.addr)},
        {"amount", x18::to_string(amount)},
        {"fee", x18::to_string(req.fee)},
        {"sourceChain", req.source_chain},
        {"destinationChain", req.destination_chain}
    };

    DispatchResult dispatch = bridge_.send_message(chain, remote_vault, message.dump());

    std::unique_lock lock(mutex_);
    if (dispatch.code != errors::OK) {
        remote_[{req.source_chain, asset}].available += amount;
        log::warn(COMPONENT, "liquidity request to ", chain, " not sent: ", errors::name(dispatch.code));
        result.code = dispatch.code;
        return result;
    }

    req.message_id = dispatch.message_id;
    requests_.emplace(req.id, req);
    result.request_id = req.id;
    result.chain_id = req.source_chain;
    lock.unlock();

    log::info(COMPONENT, "request ", to_hex(req.id), " PENDING via ", dispatch.protocol);
    if (sink_) {
        sink_(TransferInitiatedRecord{req.id, req.user, asset, amount, req.source_chain,
                                      req.destination_chain, req.created_at});
    }
    return result;
}

int32_t CrossChainBridgeSource::complete(const RequestId& request_id, bool success) {
    std::unique_lock lock(mutex_);
    auto it = requests_.find(request_id);
    if (it == requests_.end()) {
        return errors::REQUEST_NOT_FOUND;
    }
    LiquidityTransferRequest& req = it->second;
    if (req.status != TransferStatus::PENDING) {
        return errors::INVALID_STATE;
    }

    req.status = success ? TransferStatus::COMPLETED : TransferStatus::FAILED;
    if (!success) {
        auto& remote = remote_[{req.source_chain, req.asset}];
        remote.available = safe::add(remote.available, req.amount);
    }
    TransferCompletedRecord record{req.id, req.status, req.amount, req.source_chain,
                                   req.destination_chain, clock_()};
    lock.unlock();

    log::info(COMPONENT, "request ", to_hex(request_id), " ", to_string(record.status));
    if (sink_) sink_(record);
    return errors::OK;
}

int32_t CrossChainBridgeSource::repay(const Currency& asset, I128 amount, const Address& on_behalf_of,
                                      ChainId chain) {
    if (amount <= 0) return errors::ZERO_AMOUNT;

    std::string name;
    Address remote_vault{};
    uint64_t nonce = 0;
    {
        std::unique_lock lock(mutex_);
        auto vault = remote_vaults_.find(chain);
        auto label = chain_name(chain);
        if (vault == remote_vaults_.end() || !label) return errors::UNSUPPORTED_CHAIN;
        name = *label;
        remote_vault = vault->second;
        nonce = ++nonce_;
    }

    json message = {
        {"type", "LIQUIDITY_REPAYMENT"},
        {"user", to_hex(on_behalf_of)},
        {"asset", to_hex(asset.addr)},
        {"amount", x18::to_string(amount)},
        {"sourceChain", local_chain_},
        {"destinationChain", chain},
        {"nonce", nonce}
    };

    DispatchResult dispatch = bridge_.send_message(name, remote_vault, message.dump());
    if (dispatch.code != errors::OK) {
        log::warn(COMPONENT, "repayment to ", name, " not sent: ", errors::name(dispatch.code));
        return dispatch.code;
    }

    std::unique_lock lock(mutex_);
    auto& remote = remote_[{chain, asset}];
    remote.available = safe::add(remote.available, amount);
    lock.unlock();

    log::info(COMPONENT, "repaid ", x18::to_string(amount), " to ", name, " via ", dispatch.protocol);
    return errors::OK;
}

std::optional<TransferStatus> CrossChainBridgeSource::transfer_status(const RequestId& request_id) const {
    std::shared_lock lock(mutex_);
    auto it = requests_.find(request_id);
    if (it == requests_.end()) return std::nullopt;
    return it->second.status;
}

std::optional<LiquidityTransferRequest> CrossChainBridgeSource::request(const RequestId& request_id) const {
    std::shared_lock lock(mutex_);
    auto it = requests_.find(request_id);
    if (it == requests_.end()) return std::nullopt;
    return it->second;
}

size_t CrossChainBridgeSource::pending_count() const {
    std::shared_lock lock(mutex_);
    return static_cast<size_t>(std::count_if(requests_.begin(), requests_.end(), [](const auto& kv) {
        return kv.second.status == TransferStatus::PENDING;
    }));
}

} // namespace xlend
