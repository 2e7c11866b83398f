#include "xlend/http_transport.hpp"
#include <cpr/cpr.h>
#include <nlohmann/json.hpp>

namespace xlend {

using json = nlohmann::json;

HttpRelayTransport::HttpRelayTransport(std::string base_url, int32_t timeout_ms)
    : base_url_(std::move(base_url)), timeout_ms_(timeout_ms) {
    while (!base_url_.empty() && base_url_.back() == '/') {
        base_url_.pop_back();
    }
}

std::string HttpRelayTransport::submit(std::string_view protocol, const std::string& envelope) {
    json body;
    try {
        body = {
            {"protocol", std::string(protocol)},
            {"envelope", json::parse(envelope)}
        };
    } catch (const json::parse_error& e) {
        throw AdapterError(std::string("Malformed envelope: ") + e.what());
    }

    cpr::Header headers{{"Content-Type", "application/json"}};
    if (!api_key_.empty()) {
        headers["X-API-Key"] = api_key_;
    }

    auto response = cpr::Post(
        cpr::Url{base_url_ + "/api/v1/messages"},
        headers,
        cpr::Body{body.dump()},
        cpr::Timeout{timeout_ms_});

    if (response.error) {
        throw AdapterError("Relayer unreachable: " + response.error.message);
    }
    if (response.status_code < 200 || response.status_code >= 300) {
        throw AdapterError("Relayer rejected message (" + std::to_string(response.status_code) +
                           "): " + response.text);
    }

    try {
        auto data = json::parse(response.text);
        auto id = data.value("messageId", std::string{});
        if (id.empty()) {
            throw AdapterError("Relayer response missing messageId");
        }
        return id;
    } catch (const json::exception& e) {
        throw AdapterError(std::string("Malformed relayer response: ") + e.what());
    }
}

} // namespace xlend
