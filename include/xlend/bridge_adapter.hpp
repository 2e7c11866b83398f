#ifndef XLEND_BRIDGE_ADAPTER_HPP
#define XLEND_BRIDGE_ADAPTER_HPP

#include <algorithm>
#include <cstdint>
#include <functional>
#include <initializer_list>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "types.hpp"
#include "config.hpp"

namespace xlend {

// Opaque message bytes carried across a bridge
using Payload = std::string;

// Transport or protocol failure; BridgeManager converts to ADAPTER_FAILED
class AdapterError : public std::runtime_error {
public:
    explicit AdapterError(const std::string& msg) : std::runtime_error(msg) {}
};

// =============================================================================
// BridgeTransport - the external messaging network
//
// Receives an adapter-encoded JSON envelope and returns the network's message
// id. Throws AdapterError on failure.
// =============================================================================

class BridgeTransport {
public:
    virtual ~BridgeTransport() = default;

    virtual std::string submit(std::string_view protocol, const std::string& envelope) = 0;
};

// =============================================================================
// SelectorTable - chain name <-> protocol-specific selector
// =============================================================================

template <typename Selector>
class SelectorTable {
public:
    SelectorTable() = default;
    SelectorTable(std::initializer_list<std::pair<std::string, Selector>> entries) {
        for (const auto& [name, selector] : entries) add(name, selector);
    }

    // Returns false if either side is already mapped
    bool add(const std::string& name, const Selector& selector) {
        if (by_name_.count(name) || by_selector_.count(selector)) return false;
        by_name_.emplace(name, selector);
        by_selector_.emplace(selector, name);
        order_.push_back(name);
        return true;
    }

    std::optional<Selector> selector(std::string_view name) const {
        auto it = by_name_.find(std::string(name));
        if (it == by_name_.end()) return std::nullopt;
        return it->second;
    }

    std::optional<std::string> name(const Selector& selector) const {
        auto it = by_selector_.find(selector);
        if (it == by_selector_.end()) return std::nullopt;
        return it->second;
    }

    bool contains(std::string_view name) const { return by_name_.count(std::string(name)) > 0; }
    const std::vector<std::string>& names() const { return order_; }
    size_t size() const { return order_.size(); }

private:
    std::map<std::string, Selector> by_name_;
    std::map<Selector, std::string> by_selector_;
    std::vector<std::string> order_;
};

// =============================================================================
// Delivery retry policy
// =============================================================================

struct RetryPolicy {
    uint32_t max_attempts = 3;
    uint64_t delay_ms = 60000;
    bool exponential = true;

    static RetryPolicy from(const BridgeConfig& config) {
        return RetryPolicy{config.max_attempts, config.retry_delay_ms, config.exponential_backoff};
    }

    // Delay before attempt n+1 after n failures (n >= 1)
    uint64_t delay_after(uint32_t failures) const {
        if (!exponential || failures <= 1) return delay_ms;
        uint32_t shift = std::min<uint32_t>(failures - 1, 16);
        return delay_ms << shift;
    }
};

using Sleeper = std::function<void(uint64_t ms)>;

Sleeper thread_sleeper();

// =============================================================================
// BridgeAdapter - one cross-chain messaging protocol behind a common contract
// =============================================================================

class BridgeAdapter {
public:
    explicit BridgeAdapter(std::shared_ptr<BridgeTransport> transport,
                           RetryPolicy retry = RetryPolicy{});
    virtual ~BridgeAdapter() = default;

    BridgeAdapter(const BridgeAdapter&) = delete;
    BridgeAdapter& operator=(const BridgeAdapter&) = delete;

    [[nodiscard]] virtual std::string_view protocol_name() const = 0;
    [[nodiscard]] virtual bool is_chain_supported(std::string_view chain) const = 0;
    [[nodiscard]] virtual std::vector<std::string> supported_chains() const = 0;

    // Fee in the native asset (X18). Throws AdapterError for unsupported chains.
    [[nodiscard]] virtual I128 estimate_gas(std::string_view chain, const Payload& payload) const = 0;

    // Encodes, delivers with retry, returns the message id. Re-sending an
    // identical instruction returns the original id without redelivery.
    // Throws AdapterError once retries are exhausted, or when the same
    // instruction is already being delivered. No lock is held while the
    // transport or the sleeper runs.
    std::string send_message(std::string_view chain, const Address& destination,
                             const Payload& payload, const Currency& fee_asset = NATIVE);

    void set_sleeper(Sleeper sleeper) { sleeper_ = std::move(sleeper); }
    const RetryPolicy& retry_policy() const { return retry_; }
    size_t delivered_count() const;

protected:
    // Protocol wire format. Throws AdapterError for unsupported chains.
    virtual std::string encode_envelope(std::string_view chain, const Address& destination,
                                        const Payload& payload, const Currency& fee_asset) const = 0;

    // Default hands the envelope to the transport
    virtual std::string deliver(const std::string& envelope);

    BridgeTransport* transport() const { return transport_.get(); }

private:
    std::shared_ptr<BridgeTransport> transport_;
    RetryPolicy retry_;
    Sleeper sleeper_;

    std::unordered_map<std::string, std::string> delivered_;  // delivery key -> message id
    std::unordered_set<std::string> in_flight_;               // keys being delivered
    mutable std::mutex mutex_;
};

// Lowercase hex of raw bytes with 0x prefix
std::string hex_bytes(std::string_view bytes);

} // namespace xlend

#endif // XLEND_BRIDGE_ADAPTER_HPP
