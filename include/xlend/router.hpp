#ifndef XLEND_ROUTER_HPP
#define XLEND_ROUTER_HPP

#include <memory>
#include <optional>
#include <shared_mutex>
#include <unordered_map>
#include <vector>

#include "types.hpp"
#include "config.hpp"
#include "liquidity.hpp"

namespace xlend {

// Router-side record of an asynchronous borrow awaiting completion
struct PendingTransfer {
    RequestId request_id{};
    Address user{};
    Address recipient{};
    Currency asset;
    I128 amount = 0;
    SourceType source_type = SourceType::CROSS_CHAIN_BRIDGE;
    size_t source_index = 0;
    ChainId chain_id = 0;         // chain the funds come from
    uint64_t created_at = 0;
    TransferStatus status = TransferStatus::PENDING;
};

struct CompletionResult {
    int32_t code = errors::OK;
    RequestId request_id{};
    std::optional<PendingTransfer> transfer;  // set when code == OK
};

// =============================================================================
// LiquidityRouter - quote aggregation, selection and execution
//
// Selection order (pure, total):
//   1. quotes covering the full amount before partial ones
//   2. lowest cost = fee + rate * holding_period / year
//   3. shortest settlement
//   4. earliest registration
// =============================================================================

class LiquidityRouter {
public:
    explicit LiquidityRouter(const RouterConfig& config, Clock clock = system_clock());

    LiquidityRouter(const LiquidityRouter&) = delete;
    LiquidityRouter& operator=(const LiquidityRouter&) = delete;

    // Returns the source index (registration order)
    size_t add_source(std::shared_ptr<LiquiditySource> source);
    std::shared_ptr<LiquiditySource> source(size_t index) const;
    size_t source_count() const;

    // All non-empty quotes in selection order
    std::vector<LiquidityQuote> quotes(const Currency& asset, I128 amount) const;

    // Best quote; nullopt when no source can fund any of it
    std::optional<LiquidityQuote> route(const Currency& asset, I128 amount) const;

    // Borrows quote.available from the quoted source. Asynchronous sources
    // leave a PENDING record keyed by the returned request id.
    BorrowResult execute(const LiquidityQuote& quote, const Address& recipient,
                         const BorrowContext& context);

    // Moves a PENDING transfer to COMPLETED/FAILED exactly once. When the
    // source has already settled it, the source's state wins.
    CompletionResult complete(const RequestId& request_id, bool success);

    // Hands a repayment of externally funded debt back to the lending source
    int32_t repay(size_t source_index, const Currency& asset, I128 amount,
                  const Address& on_behalf_of, ChainId chain);

    // Fails every PENDING transfer older than the request timeout
    std::vector<CompletionResult> sweep_expired();

    std::optional<PendingTransfer> pending(const RequestId& request_id) const;
    std::vector<PendingTransfer> pending_transfers() const;

    const RouterConfig& config() const { return config_; }

    // fee_bps * year + rate_bps * holding_period; bps-seconds, exact
    static U128 cost_key(const LiquidityQuote& quote, uint64_t holding_period_seconds);

    // Strict weak order implementing the selection rules
    static bool better(const LiquidityQuote& a, const LiquidityQuote& b,
                       I128 requested, uint64_t holding_period_seconds);

private:
    RouterConfig config_;
    Clock clock_;

    std::vector<std::shared_ptr<LiquiditySource>> sources_;
    std::unordered_map<RequestId, PendingTransfer, Hash32Hash> transfers_;
    mutable std::shared_mutex mutex_;
};

} // namespace xlend

#endif // XLEND_ROUTER_HPP
