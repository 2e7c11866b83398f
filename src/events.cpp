// =============================================================================
// events.cpp - Event record serialization
// =============================================================================

#include "xlend/events.hpp"
#include <nlohmann/json.hpp>

namespace xlend {

using json = nlohmann::json;

namespace {

template <class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
template <class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

std::string amount(I128 v) { return x18::to_string(v); }

} // namespace

const char* event_name(const Event& event) {
    return std::visit(overloaded{
        [](const DepositRecord&) { return "Deposit"; },
        [](const WithdrawRecord&) { return "Withdraw"; },
        [](const BorrowRecord&) { return "Borrow"; },
        [](const RepayRecord&) { return "Repay"; },
        [](const LiquidationRecord&) { return "Liquidation"; },
        [](const FlashLoanRecord&) { return "FlashLoan"; },
        [](const TransferInitiatedRecord&) { return "TransferInitiated"; },
        [](const TransferCompletedRecord&) { return "TransferCompleted"; },
        [](const AdapterRegisteredRecord&) { return "AdapterRegistered"; },
        [](const PreferredProtocolRecord&) { return "PreferredProtocolChanged"; },
    }, event);
}

json to_json(const Event& event) {
    json j = std::visit(overloaded{
        [](const DepositRecord& r) {
            return json{{"user", to_hex(r.user)}, {"asset", to_hex(r.asset.addr)},
                        {"amount", amount(r.amount)}, {"timestamp", r.timestamp}};
        },
        [](const WithdrawRecord& r) {
            return json{{"user", to_hex(r.user)}, {"asset", to_hex(r.asset.addr)},
                        {"amount", amount(r.amount)}, {"timestamp", r.timestamp}};
        },
        [](const BorrowRecord& r) {
            return json{{"user", to_hex(r.user)}, {"asset", to_hex(r.asset.addr)},
                        {"amount", amount(r.amount)}, {"source", to_string(r.source)},
                        {"timestamp", r.timestamp}};
        },
        [](const RepayRecord& r) {
            return json{{"user", to_hex(r.user)}, {"asset", to_hex(r.asset.addr)},
                        {"amount", amount(r.amount)}, {"timestamp", r.timestamp}};
        },
        [](const LiquidationRecord& r) {
            return json{{"liquidator", to_hex(r.liquidator)}, {"user", to_hex(r.user)},
                        {"debtAsset", to_hex(r.debt_asset.addr)},
                        {"collateralAsset", to_hex(r.collateral_asset.addr)},
                        {"repaid", amount(r.repaid)}, {"seized", amount(r.seized)},
                        {"timestamp", r.timestamp}};
        },
        [](const FlashLoanRecord& r) {
            return json{{"receiver", to_hex(r.receiver)}, {"asset", to_hex(r.asset.addr)},
                        {"amount", amount(r.amount)}, {"fee", amount(r.fee)},
                        {"timestamp", r.timestamp}};
        },
        [](const TransferInitiatedRecord& r) {
            return json{{"requestId", to_hex(r.request_id)}, {"user", to_hex(r.user)},
                        {"asset", to_hex(r.asset.addr)}, {"amount", amount(r.amount)},
                        {"sourceChain", r.source_chain},
                        {"destinationChain", r.destination_chain},
                        {"timestamp", r.timestamp}};
        },
        [](const TransferCompletedRecord& r) {
            return json{{"requestId", to_hex(r.request_id)}, {"status", to_string(r.status)},
                        {"amount", amount(r.amount)}, {"sourceChain", r.source_chain},
                        {"destinationChain", r.destination_chain},
                        {"timestamp", r.timestamp}};
        },
        [](const AdapterRegisteredRecord& r) {
            return json{{"protocol", r.protocol}, {"chains", r.chains}};
        },
        [](const PreferredProtocolRecord& r) {
            return json{{"chain", r.chain}, {"previous", r.previous}, {"protocol", r.protocol}};
        },
    }, event);

    j["event"] = event_name(event);
    return j;
}

EventSink EventLog::sink() {
    return [this](const Event& e) {
        std::lock_guard lock(mutex_);
        events_.push_back(e);
    };
}

std::vector<Event> EventLog::events() const {
    std::lock_guard lock(mutex_);
    return events_;
}

size_t EventLog::size() const {
    std::lock_guard lock(mutex_);
    return events_.size();
}

void EventLog::clear() {
    std::lock_guard lock(mutex_);
    events_.clear();
}

std::string EventLog::to_json_lines() const {
    std::lock_guard lock(mutex_);
    std::string out;
    for (const auto& e : events_) {
        out += to_json(e).dump();
        out += '\n';
    }
    return out;
}

} // namespace xlend
