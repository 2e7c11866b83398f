#include "xlend/adapters/relay.hpp"
#include "xlend/chains.hpp"
#include "xlend/log.hpp"
#include <nlohmann/json.hpp>

namespace xlend {

using json = nlohmann::json;

namespace {
constexpr I128 BASE_FEE = 100000000000000LL;   // 0.0001 native
constexpr I128 FEE_PER_BYTE = 100000000000LL;
}

RelayAdapter::RelayAdapter(std::shared_ptr<BridgeTransport> transport, ChainId source_chain,
                           RetryPolicy retry, std::string name)
    : BridgeAdapter(std::move(transport), retry),
      name_(std::move(name)),
      source_chain_(source_chain) {
    for (const auto& c : known_chains()) {
        if (c.id != source_chain_) chains_.add(std::string(c.name), c.id);
    }
}

bool RelayAdapter::add_chain(const std::string& chain, ChainId id) {
    std::lock_guard lock(relay_mutex_);
    return chains_.add(chain, id);
}

bool RelayAdapter::is_chain_supported(std::string_view chain) const {
    std::lock_guard lock(relay_mutex_);
    return chains_.contains(chain);
}

std::vector<std::string> RelayAdapter::supported_chains() const {
    std::lock_guard lock(relay_mutex_);
    return chains_.names();
}

I128 RelayAdapter::estimate_gas(std::string_view chain, const Payload& payload) const {
    if (!is_chain_supported(chain)) {
        throw AdapterError(name_ + ": unsupported chain " + std::string(chain));
    }
    return BASE_FEE + FEE_PER_BYTE * static_cast<I128>(payload.size());
}

int32_t RelayAdapter::accept_inbound(const std::string& message_id) {
    if (message_id.empty()) {
        return errors::INVALID_STATE;
    }

    std::lock_guard lock(relay_mutex_);
    if (!processed_.insert(message_id).second) {
        log::warn("relay", name_, ": replayed message ", message_id);
        return errors::INVALID_STATE;
    }
    return errors::OK;
}

bool RelayAdapter::is_processed(const std::string& message_id) const {
    std::lock_guard lock(relay_mutex_);
    return processed_.count(message_id) > 0;
}

std::string RelayAdapter::encode_envelope(std::string_view chain, const Address& destination,
                                          const Payload& payload, const Currency& fee_asset) const {
    std::lock_guard lock(relay_mutex_);
    auto id = chains_.selector(chain);
    if (!id) {
        throw AdapterError(name_ + ": no chain id for " + std::string(chain));
    }

    json envelope = {
        {"sourceChainId", source_chain_},
        {"destinationChainId", *id},
        {"target", to_hex(destination)},
        {"data", hex_bytes(payload)},
        {"feeToken", to_hex(fee_asset.addr)},
        {"nonce", ++nonce_}
    };
    return envelope.dump();
}

} // namespace xlend
