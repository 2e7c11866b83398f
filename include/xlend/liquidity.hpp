#ifndef XLEND_LIQUIDITY_HPP
#define XLEND_LIQUIDITY_HPP

#include <map>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <unordered_map>
#include <utility>

#include "types.hpp"
#include "access.hpp"
#include "bridge_manager.hpp"
#include "events.hpp"
#include "ledger.hpp"

namespace xlend {

// =============================================================================
// Quotes and borrow results
// =============================================================================

// Ephemeral; computed per request, never stored
struct LiquidityQuote {
    SourceType source_type = SourceType::LOCAL_VAULT;
    Address source{};
    ChainId chain_id = 0;             // chain the funds originate on
    Currency asset;
    I128 available = 0;               // capped at the requested amount
    uint32_t fee_bps = 0;
    uint64_t settlement_seconds = 0;
    uint32_t rate_bps = 0;            // annualized borrow rate
    size_t source_index = 0;          // router registration order
};

struct BorrowContext {
    Address user{};                   // whose position carries the debt
};

struct BorrowResult {
    int32_t code = errors::OK;
    RequestId request_id{};           // zero for synchronous sources
    ChainId chain_id = 0;             // chain the funds came from

    bool ok() const { return code == errors::OK; }
    bool pending() const { return code == errors::OK && request_id != ZERO_REQUEST_ID; }
};

// =============================================================================
// LiquiditySource - anything able to fund a borrow
// =============================================================================

class LiquiditySource {
public:
    virtual ~LiquiditySource() = default;

    virtual SourceType source_type() const = 0;
    virtual Address address() const = 0;
    virtual bool is_asynchronous() const = 0;
    virtual bool supports_asset(const Currency& asset) const = 0;

    virtual I128 available_liquidity(const Currency& asset) const = 0;

    // nullopt when the asset is unsupported
    virtual std::optional<LiquidityQuote> quote(const Currency& asset, I128 amount) const = 0;

    virtual BorrowResult borrow(const Currency& asset, I128 amount, const Address& recipient,
                                const BorrowContext& context) = 0;

    // Settled state of an asynchronous borrow; nullopt when unknown
    virtual std::optional<TransferStatus> transfer_status(const RequestId& request_id) const {
        (void)request_id;
        return std::nullopt;
    }

protected:
    // Settlement runs through the router only, which keeps its transfer table
    // and the borrower's debt in step with the source.
    friend class LiquidityRouter;

    // Completion of an asynchronous borrow. Synchronous sources have nothing
    // pending.
    virtual int32_t complete(const RequestId& request_id, bool success) {
        (void)request_id; (void)success;
        return errors::REQUEST_NOT_FOUND;
    }

    // Returns repaid funds to the lender that supplied them from `chain`
    virtual int32_t repay(const Currency& asset, I128 amount, const Address& on_behalf_of,
                          ChainId chain) {
        (void)asset; (void)amount; (void)on_behalf_of; (void)chain;
        return errors::NO_LIQUIDITY_SOURCE;
    }
};

// =============================================================================
// LocalVaultSource - the ledger's own reserves; instant, fee-free
// =============================================================================

class LocalVaultSource : public LiquiditySource {
public:
    LocalVaultSource(CollateralLedger& ledger, const Address& vault_address, ChainId chain);

    SourceType source_type() const override { return SourceType::LOCAL_VAULT; }
    Address address() const override { return address_; }
    bool is_asynchronous() const override { return false; }
    bool supports_asset(const Currency& asset) const override;

    I128 available_liquidity(const Currency& asset) const override;
    std::optional<LiquidityQuote> quote(const Currency& asset, I128 amount) const override;

    // Records the debt on context.user through the ledger's checked borrow
    BorrowResult borrow(const Currency& asset, I128 amount, const Address& recipient,
                        const BorrowContext& context) override;

private:
    CollateralLedger& ledger_;
    Address address_;
    ChainId chain_;
};

// =============================================================================
// External money market (third-party lending pool on this chain)
// =============================================================================

class IMoneyMarket {
public:
    virtual ~IMoneyMarket() = default;

    virtual Address address() const = 0;
    virtual bool supports(const Currency& asset) const = 0;
    virtual I128 available(const Currency& asset) const = 0;
    virtual uint32_t borrow_rate_bps(const Currency& asset) const = 0;

    // Throws AdapterError when the pool call reverts
    virtual void borrow(const Currency& asset, I128 amount, const Address& on_behalf_of) = 0;
    virtual void repay(const Currency& asset, I128 amount, const Address& on_behalf_of) = 0;
};

class ExternalMoneyMarketSource : public LiquiditySource {
public:
    ExternalMoneyMarketSource(std::shared_ptr<IMoneyMarket> market, ChainId chain);

    SourceType source_type() const override { return SourceType::EXTERNAL_MONEY_MARKET; }
    Address address() const override { return market_->address(); }
    bool is_asynchronous() const override { return false; }
    bool supports_asset(const Currency& asset) const override;

    I128 available_liquidity(const Currency& asset) const override;
    std::optional<LiquidityQuote> quote(const Currency& asset, I128 amount) const override;
    BorrowResult borrow(const Currency& asset, I128 amount, const Address& recipient,
                        const BorrowContext& context) override;

protected:
    int32_t repay(const Currency& asset, I128 amount, const Address& on_behalf_of,
                  ChainId chain) override;

private:
    std::shared_ptr<IMoneyMarket> market_;
    ChainId chain_;
};

// =============================================================================
// CrossChainBridgeSource - liquidity held by sibling vaults on other chains
//
// Borrowing reserves remote liquidity optimistically and sends a request over
// the bridge. The request stays PENDING until the router completes it exactly
// once to COMPLETED or FAILED; FAILED restores the reservation.
// =============================================================================

struct RemoteLiquidity {
    I128 available = 0;
    uint32_t rate_bps = 0;
};

struct LiquidityTransferRequest {
    RequestId id{};
    Address user{};
    Address recipient{};
    ChainId source_chain = 0;         // remote chain funding the loan
    ChainId destination_chain = 0;    // this chain
    Currency asset;
    I128 amount = 0;
    I128 fee = 0;
    uint64_t created_at = 0;
    TransferStatus status = TransferStatus::PENDING;
    std::string message_id;
};

struct BridgeSourceParams {
    uint32_t fee_bps = 10;
    uint64_t settlement_seconds = 180;
};

class CrossChainBridgeSource : public LiquiditySource {
public:
    CrossChainBridgeSource(BridgeManager& bridge, const AccessControl& access,
                           const Address& address, ChainId local_chain,
                           BridgeSourceParams params = BridgeSourceParams{},
                           Clock clock = system_clock(), EventSink sink = nullptr);

    SourceType source_type() const override { return SourceType::CROSS_CHAIN_BRIDGE; }
    Address address() const override { return address_; }
    bool is_asynchronous() const override { return true; }
    bool supports_asset(const Currency& asset) const override;

    I128 available_liquidity(const Currency& asset) const override;
    std::optional<LiquidityQuote> quote(const Currency& asset, I128 amount) const override;
    BorrowResult borrow(const Currency& asset, I128 amount, const Address& recipient,
                        const BorrowContext& context) override;
    std::optional<TransferStatus> transfer_status(const RequestId& request_id) const override;

    // ADAPTER_CALLER or owner. Remote vault that receives requests for a chain.
    int32_t set_remote_vault(const Address& caller, ChainId chain, const Address& vault);

    // ADAPTER_CALLER or owner. Replaces the view of a remote pool.
    int32_t sync_remote_liquidity(const Address& caller, ChainId chain, const Currency& asset,
                                  I128 available, uint32_t rate_bps);

    std::optional<RemoteLiquidity> remote_liquidity(ChainId chain, const Currency& asset) const;
    std::optional<LiquidityTransferRequest> request(const RequestId& request_id) const;
    size_t pending_count() const;

    // chain(8) | source chain(8) | nonce(8) | digest(requester, asset, amount)(8)
    static RequestId make_request_id(ChainId chain, ChainId source_chain, const Address& requester,
                                     const Currency& asset, I128 amount, uint64_t nonce);

protected:
    int32_t complete(const RequestId& request_id, bool success) override;

    // Sends the repayment to the remote vault and restores its liquidity
    int32_t repay(const Currency& asset, I128 amount, const Address& on_behalf_of,
                  ChainId chain) override;

private:
    using RemoteKey = std::pair<ChainId, Currency>;

    bool authorized(const Address& caller) const;

    // Cheapest remote chain with a vault, a bridge route and liquidity
    std::optional<std::pair<ChainId, RemoteLiquidity>> best_remote_locked(const Currency& asset) const;

    BridgeManager& bridge_;
    const AccessControl& access_;
    Address address_;
    ChainId local_chain_;
    BridgeSourceParams params_;
    Clock clock_;
    EventSink sink_;

    std::map<RemoteKey, RemoteLiquidity> remote_;
    std::map<ChainId, Address> remote_vaults_;
    std::unordered_map<RequestId, LiquidityTransferRequest, Hash32Hash> requests_;
    uint64_t nonce_ = 0;
    mutable std::shared_mutex mutex_;
};

} // namespace xlend

#endif // XLEND_LIQUIDITY_HPP
