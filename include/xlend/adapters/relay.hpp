#ifndef XLEND_ADAPTERS_RELAY_HPP
#define XLEND_ADAPTERS_RELAY_HPP

#include <unordered_set>

#include "../bridge_adapter.hpp"

namespace xlend {

// Generic message relay keyed by EVM chain id. Outbound messages carry a
// per-adapter nonce; inbound deliveries are accepted once per message id.
class RelayAdapter : public BridgeAdapter {
public:
    RelayAdapter(std::shared_ptr<BridgeTransport> transport, ChainId source_chain,
                 RetryPolicy retry = RetryPolicy{}, std::string name = "relay");

    [[nodiscard]] std::string_view protocol_name() const override { return name_; }
    [[nodiscard]] bool is_chain_supported(std::string_view chain) const override;
    [[nodiscard]] std::vector<std::string> supported_chains() const override;
    [[nodiscard]] I128 estimate_gas(std::string_view chain, const Payload& payload) const override;

    // Adds a chain reachable through the relayer; false if already mapped
    bool add_chain(const std::string& chain, ChainId id);

    // OK on first delivery of message_id, INVALID_STATE on replay
    int32_t accept_inbound(const std::string& message_id);
    bool is_processed(const std::string& message_id) const;

protected:
    std::string encode_envelope(std::string_view chain, const Address& destination,
                                const Payload& payload, const Currency& fee_asset) const override;

private:
    std::string name_;
    ChainId source_chain_;
    SelectorTable<ChainId> chains_;
    mutable uint64_t nonce_ = 0;

    std::unordered_set<std::string> processed_;
    mutable std::mutex relay_mutex_;
};

} // namespace xlend

#endif // XLEND_ADAPTERS_RELAY_HPP
