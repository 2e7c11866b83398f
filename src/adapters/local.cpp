#include "xlend/adapters/local.hpp"
#include <nlohmann/json.hpp>

namespace xlend {

using json = nlohmann::json;

LocalAdapter::LocalAdapter(std::string chain_name)
    : BridgeAdapter(nullptr, RetryPolicy{1, 0, false}), chain_name_(std::move(chain_name)) {}

bool LocalAdapter::is_chain_supported(std::string_view chain) const {
    return chain == chain_name_;
}

std::vector<std::string> LocalAdapter::supported_chains() const {
    return {chain_name_};
}

I128 LocalAdapter::estimate_gas(std::string_view chain, const Payload&) const {
    if (!is_chain_supported(chain)) {
        throw AdapterError("local: unsupported chain " + std::string(chain));
    }
    return 0;
}

std::vector<std::string> LocalAdapter::inbox() const {
    std::lock_guard lock(inbox_mutex_);
    return inbox_;
}

std::string LocalAdapter::encode_envelope(std::string_view chain, const Address& destination,
                                          const Payload& payload, const Currency&) const {
    json envelope = {
        {"chain", std::string(chain)},
        {"receiver", to_hex(destination)},
        {"data", hex_bytes(payload)}
    };
    return envelope.dump();
}

std::string LocalAdapter::deliver(const std::string& envelope) {
    std::lock_guard lock(inbox_mutex_);
    inbox_.push_back(envelope);
    return "local-" + std::to_string(++sequence_);
}

} // namespace xlend
