#ifndef XLEND_ADAPTERS_AXELAR_HPP
#define XLEND_ADAPTERS_AXELAR_HPP

#include "../bridge_adapter.hpp"

namespace xlend {

// Axelar General Message Passing: chains are addressed by Axelar chain names,
// which differ in spelling and case from ours ("Ethereum", "polygon-sepolia")
class AxelarAdapter : public BridgeAdapter {
public:
    explicit AxelarAdapter(std::shared_ptr<BridgeTransport> transport,
                           RetryPolicy retry = RetryPolicy{},
                           std::string name = "axelar");

    [[nodiscard]] std::string_view protocol_name() const override { return name_; }
    [[nodiscard]] bool is_chain_supported(std::string_view chain) const override;
    [[nodiscard]] std::vector<std::string> supported_chains() const override;
    [[nodiscard]] I128 estimate_gas(std::string_view chain, const Payload& payload) const override;

    std::optional<std::string> axelar_chain(std::string_view chain) const;

protected:
    std::string encode_envelope(std::string_view chain, const Address& destination,
                                const Payload& payload, const Currency& fee_asset) const override;

private:
    std::string name_;
    SelectorTable<std::string> chains_;
};

} // namespace xlend

#endif // XLEND_ADAPTERS_AXELAR_HPP
