#include "xlend/adapters/ccip.hpp"
#include <nlohmann/json.hpp>

namespace xlend {

using json = nlohmann::json;

namespace {
constexpr I128 BASE_FEE = 500000000000000LL;   // 0.0005 native
constexpr I128 FEE_PER_BYTE = 1000000000000LL; // 1e-6 native
}

CcipAdapter::CcipAdapter(std::shared_ptr<BridgeTransport> transport, RetryPolicy retry,
                         std::string name)
    : BridgeAdapter(std::move(transport), retry),
      name_(std::move(name)),
      selectors_{
          {"ethereum", 5009297550715157269ULL},
          {"sepolia", 16015286601757825753ULL},
          {"polygon", 4051577828743386545ULL},
          {"amoy", 16281711391670634445ULL},
          {"arbitrum", 4949039107694359620ULL},
          {"arbitrum-sepolia", 3478487238524512106ULL},
          {"base", 15971525489660198786ULL},
          {"base-sepolia", 10344971235874465080ULL},
          {"optimism", 3734403246176062136ULL},
          {"optimism-sepolia", 5224473277236331295ULL},
      } {}

bool CcipAdapter::is_chain_supported(std::string_view chain) const {
    return selectors_.contains(chain);
}

std::vector<std::string> CcipAdapter::supported_chains() const {
    return selectors_.names();
}

std::optional<uint64_t> CcipAdapter::chain_selector(std::string_view chain) const {
    return selectors_.selector(chain);
}

std::optional<std::string> CcipAdapter::chain_for_selector(uint64_t selector) const {
    return selectors_.name(selector);
}

I128 CcipAdapter::estimate_gas(std::string_view chain, const Payload& payload) const {
    if (!is_chain_supported(chain)) {
        throw AdapterError(name_ + ": unsupported chain " + std::string(chain));
    }
    return BASE_FEE + FEE_PER_BYTE * static_cast<I128>(payload.size());
}

std::string CcipAdapter::encode_envelope(std::string_view chain, const Address& destination,
                                         const Payload& payload, const Currency& fee_asset) const {
    auto selector = selectors_.selector(chain);
    if (!selector) {
        throw AdapterError(name_ + ": no selector for " + std::string(chain));
    }

    // Selector exceeds 2^53; carried as a decimal string
    json envelope = {
        {"destinationChainSelector", std::to_string(*selector)},
        {"receiver", to_hex(destination)},
        {"data", hex_bytes(payload)},
        {"feeToken", to_hex(fee_asset.addr)},
        {"extraArgs", {{"gasLimit", gas_limit_}}}
    };
    return envelope.dump();
}

} // namespace xlend
