// =============================================================================
// bridge_manager.cpp - Adapter registry and dispatch
// =============================================================================

#include "xlend/bridge_manager.hpp"
#include "xlend/log.hpp"
#include <cctype>
#include <mutex>

namespace xlend {

namespace {

constexpr std::string_view COMPONENT = "bridge-manager";

// "ccip" -> 1, "ccip-v3" -> 3; nullopt when name is not a version of base
std::optional<uint64_t> version_of(std::string_view name, std::string_view base) {
    if (name == base) return 1;
    if (name.size() <= base.size() + 2 || name.substr(0, base.size()) != base) {
        return std::nullopt;
    }
    auto suffix = name.substr(base.size());
    if (suffix.substr(0, 2) != "-v") return std::nullopt;
    uint64_t v = 0;
    for (char c : suffix.substr(2)) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return std::nullopt;
        v = v * 10 + static_cast<uint64_t>(c - '0');
    }
    return v;
}

} // namespace

BridgeManager::BridgeManager(const AccessControl& access, EventSink sink)
    : access_(access), sink_(std::move(sink)) {}

int32_t BridgeManager::register_adapter(const Address& caller, std::shared_ptr<BridgeAdapter> adapter) {
    if (int32_t rc = access_.require(caller, Role::OWNER); rc != errors::OK) {
        return rc;
    }
    if (!adapter) {
        return errors::ADAPTER_NOT_FOUND;
    }

    std::string name(adapter->protocol_name());
    std::vector<std::string> chains = adapter->supported_chains();
    {
        std::unique_lock lock(mutex_);
        if (adapters_.count(name)) {
            log::warn(COMPONENT, "refusing to re-register protocol ", name);
            return errors::ALREADY_REGISTERED;
        }
        adapters_.emplace(name, std::move(adapter));
        order_.push_back(name);
    }

    log::info(COMPONENT, "registered ", name, " (", chains.size(), " chains)");
    if (sink_) sink_(AdapterRegisteredRecord{name, std::move(chains)});
    return errors::OK;
}

int32_t BridgeManager::set_preferred_protocol(const Address& caller, std::string_view chain,
                                              std::string_view protocol) {
    if (int32_t rc = access_.require(caller, Role::OWNER); rc != errors::OK) {
        return rc;
    }

    std::string previous;
    {
        std::unique_lock lock(mutex_);
        auto it = adapters_.find(protocol);
        if (it == adapters_.end()) {
            return errors::ADAPTER_NOT_FOUND;
        }
        if (!it->second->is_chain_supported(chain)) {
            return errors::UNSUPPORTED_CHAIN;
        }
        auto pref = preferred_.find(chain);
        if (pref != preferred_.end()) {
            previous = pref->second;
            pref->second = std::string(protocol);
        } else {
            preferred_.emplace(std::string(chain), std::string(protocol));
        }
    }

    log::info(COMPONENT, "preferred protocol for ", chain, ": ",
              previous.empty() ? "<none>" : previous, " -> ", protocol);
    if (sink_) {
        sink_(PreferredProtocolRecord{std::string(chain), previous, std::string(protocol)});
    }
    return errors::OK;
}

std::optional<std::string> BridgeManager::preferred_protocol(std::string_view chain) const {
    std::shared_lock lock(mutex_);
    auto it = preferred_.find(chain);
    if (it == preferred_.end()) return std::nullopt;
    return it->second;
}

std::shared_ptr<BridgeAdapter> BridgeManager::resolve_locked(std::string_view chain) const {
    if (auto pref = preferred_.find(chain); pref != preferred_.end()) {
        auto it = adapters_.find(pref->second);
        if (it != adapters_.end() && it->second->is_chain_supported(chain)) {
            return it->second;
        }
    }
    for (const auto& name : order_) {
        const auto& adapter = adapters_.find(name)->second;
        if (adapter->is_chain_supported(chain)) return adapter;
    }
    return nullptr;
}

std::shared_ptr<BridgeAdapter> BridgeManager::resolve(std::string_view chain) const {
    std::shared_lock lock(mutex_);
    return resolve_locked(chain);
}

std::shared_ptr<BridgeAdapter> BridgeManager::adapter(std::string_view protocol) const {
    std::shared_lock lock(mutex_);
    auto it = adapters_.find(protocol);
    return it != adapters_.end() ? it->second : nullptr;
}

DispatchResult BridgeManager::send_message(std::string_view chain, const Address& destination,
                                           const Payload& payload, const Currency& fee_asset) {
    DispatchResult result;
    if (destination == ZERO_ADDRESS) {
        result.code = errors::INVALID_ADDRESS;
        return result;
    }

    auto adapter = resolve(chain);
    if (!adapter) {
        log::warn(COMPONENT, "no adapter serves ", chain);
        result.code = errors::UNSUPPORTED_CHAIN;
        return result;
    }

    result.protocol = std::string(adapter->protocol_name());
    try {
        result.message_id = adapter->send_message(chain, destination, payload, fee_asset);
    } catch (const AdapterError& e) {
        log::error(COMPONENT, result.protocol, " failed for ", chain, ": ", e.what());
        result.code = errors::ADAPTER_FAILED;
    }
    return result;
}

std::optional<I128> BridgeManager::estimate_gas(std::string_view chain, const Payload& payload) const {
    auto adapter = resolve(chain);
    if (!adapter) return std::nullopt;
    try {
        return adapter->estimate_gas(chain, payload);
    } catch (const AdapterError& e) {
        log::warn(COMPONENT, "fee quote failed for ", chain, ": ", e.what());
        return std::nullopt;
    }
}

std::vector<DispatchResult> BridgeManager::broadcast(const std::vector<BroadcastItem>& items) {
    std::vector<DispatchResult> results;
    results.reserve(items.size());
    for (const auto& item : items) {
        results.push_back(send_message(item.chain, item.destination, item.payload));
    }
    return results;
}

bool BridgeManager::is_chain_supported(std::string_view chain) const {
    return resolve(chain) != nullptr;
}

std::vector<std::string> BridgeManager::protocols() const {
    std::shared_lock lock(mutex_);
    return order_;
}

std::optional<std::string> BridgeManager::latest_version(std::string_view base) const {
    std::shared_lock lock(mutex_);
    std::optional<std::string> best;
    uint64_t best_version = 0;
    for (const auto& name : order_) {
        auto v = version_of(name, base);
        if (v && *v >= best_version) {
            best_version = *v;
            best = name;
        }
    }
    return best;
}

} // namespace xlend
