#include "xlend/adapters/axelar.hpp"
#include <nlohmann/json.hpp>

namespace xlend {

using json = nlohmann::json;

namespace {
constexpr I128 BASE_FEE = 1000000000000000LL;  // 0.001 native
constexpr I128 FEE_PER_BYTE = 500000000000LL;
}

AxelarAdapter::AxelarAdapter(std::shared_ptr<BridgeTransport> transport, RetryPolicy retry,
                             std::string name)
    : BridgeAdapter(std::move(transport), retry),
      name_(std::move(name)),
      chains_{
          {"ethereum", "Ethereum"},
          {"sepolia", "ethereum-sepolia"},
          {"polygon", "Polygon"},
          {"amoy", "polygon-sepolia"},
          {"arbitrum", "arbitrum"},
          {"base", "base"},
          {"optimism", "optimism"},
          {"avalanche", "Avalanche"},
      } {}

bool AxelarAdapter::is_chain_supported(std::string_view chain) const {
    return chains_.contains(chain);
}

std::vector<std::string> AxelarAdapter::supported_chains() const {
    return chains_.names();
}

std::optional<std::string> AxelarAdapter::axelar_chain(std::string_view chain) const {
    return chains_.selector(chain);
}

I128 AxelarAdapter::estimate_gas(std::string_view chain, const Payload& payload) const {
    if (!is_chain_supported(chain)) {
        throw AdapterError(name_ + ": unsupported chain " + std::string(chain));
    }
    return BASE_FEE + FEE_PER_BYTE * static_cast<I128>(payload.size());
}

std::string AxelarAdapter::encode_envelope(std::string_view chain, const Address& destination,
                                           const Payload& payload, const Currency& fee_asset) const {
    auto axelar = chains_.selector(chain);
    if (!axelar) {
        throw AdapterError(name_ + ": no Axelar chain for " + std::string(chain));
    }

    json envelope = {
        {"destinationChain", *axelar},
        {"destinationAddress", to_hex(destination)},
        {"payload", hex_bytes(payload)},
        {"gasToken", to_hex(fee_asset.addr)}
    };
    return envelope.dump();
}

} // namespace xlend
