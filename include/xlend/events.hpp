#ifndef XLEND_EVENTS_HPP
#define XLEND_EVENTS_HPP

#include <functional>
#include <mutex>
#include <string>
#include <variant>
#include <vector>

#include <nlohmann/json_fwd.hpp>

#include "types.hpp"

namespace xlend {

// =============================================================================
// Emitted Records
// =============================================================================

struct DepositRecord {
    Address user;
    Currency asset;
    I128 amount;
    uint64_t timestamp;
};

struct WithdrawRecord {
    Address user;
    Currency asset;
    I128 amount;
    uint64_t timestamp;
};

struct BorrowRecord {
    Address user;
    Currency asset;
    I128 amount;
    SourceType source;
    uint64_t timestamp;
};

struct RepayRecord {
    Address user;
    Currency asset;
    I128 amount;
    uint64_t timestamp;
};

struct LiquidationRecord {
    Address liquidator;
    Address user;
    Currency debt_asset;
    Currency collateral_asset;
    I128 repaid;
    I128 seized;
    uint64_t timestamp;
};

struct FlashLoanRecord {
    Address receiver;
    Currency asset;
    I128 amount;
    I128 fee;
    uint64_t timestamp;
};

struct TransferInitiatedRecord {
    RequestId request_id;
    Address user;
    Currency asset;
    I128 amount;
    ChainId source_chain;
    ChainId destination_chain;
    uint64_t timestamp;
};

struct TransferCompletedRecord {
    RequestId request_id;
    TransferStatus status;
    I128 amount;
    ChainId source_chain;
    ChainId destination_chain;
    uint64_t timestamp;
};

struct AdapterRegisteredRecord {
    std::string protocol;
    std::vector<std::string> chains;
};

struct PreferredProtocolRecord {
    std::string chain;
    std::string previous;
    std::string protocol;
};

using Event = std::variant<
    DepositRecord,
    WithdrawRecord,
    BorrowRecord,
    RepayRecord,
    LiquidationRecord,
    FlashLoanRecord,
    TransferInitiatedRecord,
    TransferCompletedRecord,
    AdapterRegisteredRecord,
    PreferredProtocolRecord>;

using EventSink = std::function<void(const Event&)>;

// Record type name, e.g. "Deposit", "TransferCompleted"
const char* event_name(const Event& event);

// {"event": "<name>", ...fields}; amounts rendered as decimal strings
nlohmann::json to_json(const Event& event);

// =============================================================================
// EventLog - in-memory sink
// =============================================================================

class EventLog {
public:
    EventSink sink();

    std::vector<Event> events() const;
    size_t size() const;
    void clear();

    template <typename T>
    std::vector<T> of_type() const {
        std::vector<T> out;
        std::lock_guard lock(mutex_);
        for (const auto& e : events_) {
            if (auto* rec = std::get_if<T>(&e)) out.push_back(*rec);
        }
        return out;
    }

    // One JSON document per line
    std::string to_json_lines() const;

private:
    std::vector<Event> events_;
    mutable std::mutex mutex_;
};

} // namespace xlend

#endif // XLEND_EVENTS_HPP
