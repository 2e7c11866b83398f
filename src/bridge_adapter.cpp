// =============================================================================
// bridge_adapter.cpp - Idempotent, retrying delivery shared by all adapters
// =============================================================================

#include "xlend/bridge_adapter.hpp"
#include "xlend/log.hpp"
#include <chrono>
#include <thread>

namespace xlend {

namespace {
constexpr std::string_view COMPONENT = "bridge";
}

Sleeper thread_sleeper() {
    return [](uint64_t ms) {
        std::this_thread::sleep_for(std::chrono::milliseconds(ms));
    };
}

std::string hex_bytes(std::string_view bytes) {
    static constexpr char digits[] = "0123456789abcdef";
    std::string out = "0x";
    out.reserve(2 + bytes.size() * 2);
    for (unsigned char c : bytes) {
        out.push_back(digits[c >> 4]);
        out.push_back(digits[c & 0x0F]);
    }
    return out;
}

BridgeAdapter::BridgeAdapter(std::shared_ptr<BridgeTransport> transport, RetryPolicy retry)
    : transport_(std::move(transport)), retry_(retry), sleeper_(thread_sleeper()) {
    if (retry_.max_attempts == 0) retry_.max_attempts = 1;
}

size_t BridgeAdapter::delivered_count() const {
    std::lock_guard lock(mutex_);
    return delivered_.size();
}

std::string BridgeAdapter::deliver(const std::string& envelope) {
    if (!transport_) {
        throw AdapterError(std::string(protocol_name()) + ": no transport configured");
    }
    return transport_->submit(protocol_name(), envelope);
}

std::string BridgeAdapter::send_message(std::string_view chain, const Address& destination,
                                        const Payload& payload, const Currency& fee_asset) {
    if (!is_chain_supported(chain)) {
        throw AdapterError(std::string(protocol_name()) + ": unsupported chain " + std::string(chain));
    }
    if (destination == ZERO_ADDRESS) {
        throw AdapterError(std::string(protocol_name()) + ": zero destination");
    }

    std::string key;
    key.reserve(chain.size() + payload.size() + 96);
    key.append(chain).push_back('|');
    key.append(to_hex(destination)).push_back('|');
    key.append(to_hex(fee_asset.addr)).push_back('|');
    key.append(payload);

    {
        std::lock_guard lock(mutex_);
        if (auto it = delivered_.find(key); it != delivered_.end()) {
            log::debug(COMPONENT, protocol_name(), ": duplicate delivery to ", chain,
                       ", returning ", it->second);
            return it->second;
        }
        if (!in_flight_.insert(key).second) {
            throw AdapterError(std::string(protocol_name()) + ": delivery to " + std::string(chain) +
                               " already in flight");
        }
    }

    // Delivery and backoff run unlocked; the key stays in flight until we leave
    struct Release {
        BridgeAdapter& self;
        const std::string& key;
        ~Release() {
            std::lock_guard lock(self.mutex_);
            self.in_flight_.erase(key);
        }
    } release{*this, key};

    std::string envelope = encode_envelope(chain, destination, payload, fee_asset);

    std::string last_error;
    for (uint32_t attempt = 1; attempt <= retry_.max_attempts; ++attempt) {
        try {
            std::string message_id = deliver(envelope);
            {
                std::lock_guard lock(mutex_);
                delivered_.emplace(key, message_id);
            }
            log::info(COMPONENT, protocol_name(), ": sent ", message_id, " to ", chain,
                      " (attempt ", attempt, ")");
            return message_id;
        } catch (const AdapterError& e) {
            last_error = e.what();
            log::warn(COMPONENT, protocol_name(), ": attempt ", attempt, "/", retry_.max_attempts,
                      " to ", chain, " failed: ", last_error);
            if (attempt < retry_.max_attempts && sleeper_) {
                sleeper_(retry_.delay_after(attempt));
            }
        }
    }

    throw AdapterError(std::string(protocol_name()) + ": delivery to " + std::string(chain) +
                       " failed after " + std::to_string(retry_.max_attempts) +
                       " attempts: " + last_error);
}

} // namespace xlend
