// =============================================================================
// router.cpp - Liquidity routing
// =============================================================================

#include "xlend/router.hpp"
#include "xlend/log.hpp"
#include <algorithm>
#include <mutex>

namespace xlend {

namespace {
constexpr std::string_view COMPONENT = "router";
}

LiquidityRouter::LiquidityRouter(const RouterConfig& config, Clock clock)
    : config_(config), clock_(std::move(clock)) {}

size_t LiquidityRouter::add_source(std::shared_ptr<LiquiditySource> source) {
    std::unique_lock lock(mutex_);
    sources_.push_back(std::move(source));
    return sources_.size() - 1;
}

std::shared_ptr<LiquiditySource> LiquidityRouter::source(size_t index) const {
    std::shared_lock lock(mutex_);
    return index < sources_.size() ? sources_[index] : nullptr;
}

size_t LiquidityRouter::source_count() const {
    std::shared_lock lock(mutex_);
    return sources_.size();
}

U128 LiquidityRouter::cost_key(const LiquidityQuote& quote, uint64_t holding_period_seconds) {
    return static_cast<U128>(quote.fee_bps) * SECONDS_PER_YEAR +
           static_cast<U128>(quote.rate_bps) * holding_period_seconds;
}

bool LiquidityRouter::better(const LiquidityQuote& a, const LiquidityQuote& b,
                             I128 requested, uint64_t holding_period_seconds) {
    bool a_full = a.available >= requested;
    bool b_full = b.available >= requested;
    if (a_full != b_full) return a_full;

    U128 a_cost = cost_key(a, holding_period_seconds);
    U128 b_cost = cost_key(b, holding_period_seconds);
    if (a_cost != b_cost) return a_cost < b_cost;

    if (a.settlement_seconds != b.settlement_seconds) {
        return a.settlement_seconds < b.settlement_seconds;
    }
    return a.source_index < b.source_index;
}

std::vector<LiquidityQuote> LiquidityRouter::quotes(const Currency& asset, I128 amount) const {
    std::vector<std::shared_ptr<LiquiditySource>> sources;
    {
        std::shared_lock lock(mutex_);
        sources = sources_;
    }

    std::vector<LiquidityQuote> out;
    if (amount <= 0) return out;

    for (size_t i = 0; i < sources.size(); ++i) {
        auto q = sources[i]->quote(asset, amount);
        if (!q || q->available <= 0) continue;
        q->source_index = i;
        out.push_back(*q);
    }

    uint64_t holding = config_.holding_period_seconds;
    std::sort(out.begin(), out.end(), [&](const LiquidityQuote& a, const LiquidityQuote& b) {
        return better(a, b, amount, holding);
    });
    return out;
}

std::optional<LiquidityQuote> LiquidityRouter::route(const Currency& asset, I128 amount) const {
    auto all = quotes(asset, amount);
    if (all.empty()) return std::nullopt;
    log::debug(COMPONENT, "route ", x18::to_string(amount), " -> ", to_string(all.front().source_type),
               " (", all.size(), " candidates)");
    return all.front();
}

BorrowResult LiquidityRouter::execute(const LiquidityQuote& quote, const Address& recipient,
                                      const BorrowContext& context) {
    BorrowResult result;
    auto src = source(quote.source_index);
    if (!src || src->source_type() != quote.source_type) {
        result.code = errors::NO_LIQUIDITY_SOURCE;
        return result;
    }
    if (quote.available <= 0) {
        result.code = errors::INSUFFICIENT_LIQUIDITY;
        return result;
    }

    result = src->borrow(quote.asset, quote.available, recipient, context);
    if (!result.ok() || !src->is_asynchronous()) {
        return result;
    }

    PendingTransfer pending;
    pending.request_id = result.request_id;
    pending.user = context.user;
    pending.recipient = recipient;
    pending.asset = quote.asset;
    pending.amount = quote.available;
    pending.source_type = quote.source_type;
    pending.source_index = quote.source_index;
    pending.chain_id = result.chain_id;
    pending.created_at = clock_();

    std::unique_lock lock(mutex_);
    transfers_.emplace(pending.request_id, pending);
    return result;
}

CompletionResult LiquidityRouter::complete(const RequestId& request_id, bool success) {
    CompletionResult result;
    result.request_id = request_id;

    std::shared_ptr<LiquiditySource> src;
    {
        std::shared_lock lock(mutex_);
        auto it = transfers_.find(request_id);
        if (it == transfers_.end()) {
            result.code = errors::REQUEST_NOT_FOUND;
            return result;
        }
        if (it->second.status != TransferStatus::PENDING) {
            result.code = errors::INVALID_STATE;
            return result;
        }
        src = sources_[it->second.source_index];
    }

    TransferStatus settled = success ? TransferStatus::COMPLETED : TransferStatus::FAILED;
    result.code = src->complete(request_id, success);
    if (result.code == errors::INVALID_STATE) {
        // Source already settled the request; follow its terminal state
        auto status = src->transfer_status(request_id);
        if (status && *status != TransferStatus::PENDING) {
            log::warn(COMPONENT, "request ", to_hex(request_id), " already ", to_string(*status),
                      " at source");
            settled = *status;
            result.code = errors::OK;
        }
    }
    if (result.code != errors::OK) {
        return result;
    }

    std::unique_lock lock(mutex_);
    auto& transfer = transfers_.at(request_id);
    if (transfer.status != TransferStatus::PENDING) {
        result.code = errors::INVALID_STATE;
        return result;
    }
    transfer.status = settled;
    result.transfer = transfer;
    return result;
}

int32_t LiquidityRouter::repay(size_t source_index, const Currency& asset, I128 amount,
                               const Address& on_behalf_of, ChainId chain) {
    auto src = source(source_index);
    if (!src) return errors::NO_LIQUIDITY_SOURCE;
    int32_t code = src->repay(asset, amount, on_behalf_of, chain);
    if (code != errors::OK) {
        log::warn(COMPONENT, "repay to source ", source_index, " failed: ", errors::name(code));
    }
    return code;
}

std::vector<CompletionResult> LiquidityRouter::sweep_expired() {
    uint64_t now = clock_();
    std::vector<RequestId> expired;
    {
        std::shared_lock lock(mutex_);
        for (const auto& [id, transfer] : transfers_) {
            if (transfer.status == TransferStatus::PENDING &&
                now >= transfer.created_at + config_.request_timeout_seconds) {
                expired.push_back(id);
            }
        }
    }
    std::sort(expired.begin(), expired.end());

    std::vector<CompletionResult> results;
    results.reserve(expired.size());
    for (const auto& id : expired) {
        auto r = complete(id, false);
        if (r.code == errors::OK) {
            log::warn(COMPONENT, "request ", to_hex(id), " timed out");
        } else {
            log::error(COMPONENT, "timeout of ", to_hex(id), " failed: ", errors::name(r.code));
        }
        results.push_back(std::move(r));
    }
    return results;
}

std::optional<PendingTransfer> LiquidityRouter::pending(const RequestId& request_id) const {
    std::shared_lock lock(mutex_);
    auto it = transfers_.find(request_id);
    if (it == transfers_.end()) return std::nullopt;
    return it->second;
}

std::vector<PendingTransfer> LiquidityRouter::pending_transfers() const {
    std::shared_lock lock(mutex_);
    std::vector<PendingTransfer> out;
    for (const auto& [id, transfer] : transfers_) {
        if (transfer.status == TransferStatus::PENDING) out.push_back(transfer);
    }
    std::sort(out.begin(), out.end(), [](const PendingTransfer& a, const PendingTransfer& b) {
        return a.created_at != b.created_at ? a.created_at < b.created_at : a.request_id < b.request_id;
    });
    return out;
}

} // namespace xlend
