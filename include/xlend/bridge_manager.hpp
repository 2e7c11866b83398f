#ifndef XLEND_BRIDGE_MANAGER_HPP
#define XLEND_BRIDGE_MANAGER_HPP

#include <map>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <vector>

#include "types.hpp"
#include "access.hpp"
#include "bridge_adapter.hpp"
#include "events.hpp"

namespace xlend {

struct DispatchResult {
    int32_t code = errors::OK;
    std::string message_id;
    std::string protocol;         // adapter that handled it
};

struct BroadcastItem {
    std::string chain;
    Address destination;
    Payload payload;
};

// =============================================================================
// BridgeManager - adapter registry and dispatch facade
//
// Registration is append-only: a protocol name can never be re-bound. Upgrades
// register a versioned name ("ccip-v2") and re-point the chain preferences.
// =============================================================================

class BridgeManager {
public:
    explicit BridgeManager(const AccessControl& access, EventSink sink = nullptr);

    BridgeManager(const BridgeManager&) = delete;
    BridgeManager& operator=(const BridgeManager&) = delete;

    // Owner only. ALREADY_REGISTERED if the protocol name is taken.
    int32_t register_adapter(const Address& caller, std::shared_ptr<BridgeAdapter> adapter);

    // Owner only. ADAPTER_NOT_FOUND / UNSUPPORTED_CHAIN on bad input.
    int32_t set_preferred_protocol(const Address& caller, std::string_view chain,
                                   std::string_view protocol);
    std::optional<std::string> preferred_protocol(std::string_view chain) const;

    // Preferred adapter when it serves the chain, else the first registered
    // adapter that does, else nullptr
    std::shared_ptr<BridgeAdapter> resolve(std::string_view chain) const;
    std::shared_ptr<BridgeAdapter> adapter(std::string_view protocol) const;

    DispatchResult send_message(std::string_view chain, const Address& destination,
                                const Payload& payload, const Currency& fee_asset = NATIVE);

    // No side effects; nullopt if no adapter serves the chain or quoting fails
    std::optional<I128> estimate_gas(std::string_view chain, const Payload& payload) const;

    // One result per item; a failing item never stops the rest
    std::vector<DispatchResult> broadcast(const std::vector<BroadcastItem>& items);

    bool is_chain_supported(std::string_view chain) const;
    std::vector<std::string> protocols() const;

    // Highest registered "<base>-vN" (a bare "<base>" counts as v1)
    std::optional<std::string> latest_version(std::string_view base) const;

private:
    std::shared_ptr<BridgeAdapter> resolve_locked(std::string_view chain) const;

    const AccessControl& access_;
    EventSink sink_;

    std::map<std::string, std::shared_ptr<BridgeAdapter>, std::less<>> adapters_;
    std::vector<std::string> order_;                                   // registration order
    std::map<std::string, std::string, std::less<>> preferred_;        // chain -> protocol
    mutable std::shared_mutex mutex_;
};

} // namespace xlend

#endif // XLEND_BRIDGE_MANAGER_HPP
