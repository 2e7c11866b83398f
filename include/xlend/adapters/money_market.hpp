#ifndef XLEND_ADAPTERS_MONEY_MARKET_HPP
#define XLEND_ADAPTERS_MONEY_MARKET_HPP

#include "../bridge_adapter.hpp"

namespace xlend {

// Instructions to an external lending pool deployed per chain. A chain is
// supported only once its pool address is configured.
class MoneyMarketAdapter : public BridgeAdapter {
public:
    explicit MoneyMarketAdapter(std::shared_ptr<BridgeTransport> transport,
                                RetryPolicy retry = RetryPolicy{},
                                std::string name = "money-market");

    [[nodiscard]] std::string_view protocol_name() const override { return name_; }
    [[nodiscard]] bool is_chain_supported(std::string_view chain) const override;
    [[nodiscard]] std::vector<std::string> supported_chains() const override;
    [[nodiscard]] I128 estimate_gas(std::string_view chain, const Payload& payload) const override;

    // UNSUPPORTED_CHAIN for unknown chain names, INVALID_ADDRESS for zero pool
    int32_t set_pool(std::string_view chain, const Address& pool);
    std::optional<Address> pool(std::string_view chain) const;

protected:
    std::string encode_envelope(std::string_view chain, const Address& destination,
                                const Payload& payload, const Currency& fee_asset) const override;

private:
    std::string name_;
    std::map<std::string, Address> pools_;
    mutable std::mutex pools_mutex_;
};

} // namespace xlend

#endif // XLEND_ADAPTERS_MONEY_MARKET_HPP
