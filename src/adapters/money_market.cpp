#include "xlend/adapters/money_market.hpp"
#include "xlend/chains.hpp"
#include <nlohmann/json.hpp>

namespace xlend {

using json = nlohmann::json;

namespace {
constexpr I128 BASE_FEE = 200000000000000LL;   // 0.0002 native
}

MoneyMarketAdapter::MoneyMarketAdapter(std::shared_ptr<BridgeTransport> transport,
                                       RetryPolicy retry, std::string name)
    : BridgeAdapter(std::move(transport), retry), name_(std::move(name)) {}

int32_t MoneyMarketAdapter::set_pool(std::string_view chain, const Address& pool) {
    if (!chain_id(chain)) return errors::UNSUPPORTED_CHAIN;
    if (pool == ZERO_ADDRESS) return errors::INVALID_ADDRESS;

    std::lock_guard lock(pools_mutex_);
    pools_[std::string(chain)] = pool;
    return errors::OK;
}

std::optional<Address> MoneyMarketAdapter::pool(std::string_view chain) const {
    std::lock_guard lock(pools_mutex_);
    auto it = pools_.find(std::string(chain));
    if (it == pools_.end()) return std::nullopt;
    return it->second;
}

bool MoneyMarketAdapter::is_chain_supported(std::string_view chain) const {
    return pool(chain).has_value();
}

std::vector<std::string> MoneyMarketAdapter::supported_chains() const {
    std::lock_guard lock(pools_mutex_);
    std::vector<std::string> out;
    out.reserve(pools_.size());
    for (const auto& [chain, pool] : pools_) out.push_back(chain);
    return out;
}

I128 MoneyMarketAdapter::estimate_gas(std::string_view chain, const Payload&) const {
    if (!is_chain_supported(chain)) {
        throw AdapterError(name_ + ": no pool on " + std::string(chain));
    }
    return BASE_FEE;
}

std::string MoneyMarketAdapter::encode_envelope(std::string_view chain, const Address& destination,
                                                const Payload& payload, const Currency& fee_asset) const {
    auto p = pool(chain);
    auto id = chain_id(chain);
    if (!p || !id) {
        throw AdapterError(name_ + ": no pool on " + std::string(chain));
    }

    json envelope = {
        {"chainId", *id},
        {"pool", to_hex(*p)},
        {"onBehalfOf", to_hex(destination)},
        {"data", hex_bytes(payload)},
        {"feeToken", to_hex(fee_asset.addr)}
    };
    return envelope.dump();
}

} // namespace xlend
