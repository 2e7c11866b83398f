#ifndef XLEND_HTTP_TRANSPORT_HPP
#define XLEND_HTTP_TRANSPORT_HPP

#include <string>

#include "bridge_adapter.hpp"

namespace xlend {

// =============================================================================
// HttpRelayTransport - POSTs envelopes to an off-chain relayer service
//
//   POST {base_url}/api/v1/messages
//   {"protocol": "<name>", "envelope": {...}}  ->  {"messageId": "..."}
// =============================================================================

class HttpRelayTransport : public BridgeTransport {
public:
    explicit HttpRelayTransport(std::string base_url, int32_t timeout_ms = 10000);

    std::string submit(std::string_view protocol, const std::string& envelope) override;

    const std::string& base_url() const { return base_url_; }
    void set_api_key(std::string api_key) { api_key_ = std::move(api_key); }

private:
    std::string base_url_;
    int32_t timeout_ms_;
    std::string api_key_;
};

} // namespace xlend

#endif // XLEND_HTTP_TRANSPORT_HPP
