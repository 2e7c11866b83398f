#ifndef XLEND_ADAPTERS_LOCAL_HPP
#define XLEND_ADAPTERS_LOCAL_HPP

#include "../bridge_adapter.hpp"

namespace xlend {

// Loopback adapter for the engine's own chain. Messages never leave the
// process; they are queued in an inbox for the local consumer.
class LocalAdapter : public BridgeAdapter {
public:
    explicit LocalAdapter(std::string chain_name);

    [[nodiscard]] std::string_view protocol_name() const override { return "local"; }
    [[nodiscard]] bool is_chain_supported(std::string_view chain) const override;
    [[nodiscard]] std::vector<std::string> supported_chains() const override;
    [[nodiscard]] I128 estimate_gas(std::string_view chain, const Payload& payload) const override;

    std::vector<std::string> inbox() const;

protected:
    std::string encode_envelope(std::string_view chain, const Address& destination,
                                const Payload& payload, const Currency& fee_asset) const override;
    std::string deliver(const std::string& envelope) override;

private:
    std::string chain_name_;
    std::vector<std::string> inbox_;
    uint64_t sequence_ = 0;
    mutable std::mutex inbox_mutex_;
};

} // namespace xlend

#endif // XLEND_ADAPTERS_LOCAL_HPP
