#ifndef XLEND_ADAPTERS_CCIP_HPP
#define XLEND_ADAPTERS_CCIP_HPP

#include "../bridge_adapter.hpp"

namespace xlend {

// Chainlink CCIP: chains are addressed by 64-bit chain selectors
class CcipAdapter : public BridgeAdapter {
public:
    static constexpr uint64_t DEFAULT_GAS_LIMIT = 200000;

    explicit CcipAdapter(std::shared_ptr<BridgeTransport> transport,
                         RetryPolicy retry = RetryPolicy{},
                         std::string name = "ccip");

    [[nodiscard]] std::string_view protocol_name() const override { return name_; }
    [[nodiscard]] bool is_chain_supported(std::string_view chain) const override;
    [[nodiscard]] std::vector<std::string> supported_chains() const override;
    [[nodiscard]] I128 estimate_gas(std::string_view chain, const Payload& payload) const override;

    std::optional<uint64_t> chain_selector(std::string_view chain) const;
    std::optional<std::string> chain_for_selector(uint64_t selector) const;

    void set_gas_limit(uint64_t gas_limit) { gas_limit_ = gas_limit; }

protected:
    std::string encode_envelope(std::string_view chain, const Address& destination,
                                const Payload& payload, const Currency& fee_asset) const override;

private:
    std::string name_;
    SelectorTable<uint64_t> selectors_;
    uint64_t gas_limit_ = DEFAULT_GAS_LIMIT;
};

} // namespace xlend

#endif // XLEND_ADAPTERS_CCIP_HPP
