// =============================================================================
// compliance.cpp - Compliance gate evaluation and allow-list registry
// =============================================================================

#include "xlend/compliance.hpp"
#include <mutex>

namespace xlend {

bool passes_compliance(const IComplianceGate* gate, ComplianceMode mode,
                       const Address& account, uint64_t required_topic) {
    switch (mode) {
        case ComplianceMode::NONE:
            return true;
        case ComplianceMode::VERIFIED:
            return gate && gate->is_verified(account);
        case ComplianceMode::CLAIM:
            return gate && gate->is_verified(account) &&
                   gate->has_claim(account, required_topic);
    }
    return false;
}

int32_t AllowListGate::verify(const Address& account) {
    if (account == ZERO_ADDRESS) {
        return errors::INVALID_ADDRESS;
    }

    std::unique_lock lock(mutex_);
    if (!verified_.insert(account).second) {
        return errors::ALREADY_REGISTERED;
    }
    return errors::OK;
}

int32_t AllowListGate::revoke(const Address& account) {
    std::unique_lock lock(mutex_);
    if (verified_.erase(account) == 0) {
        return errors::INVALID_STATE;
    }
    claims_.erase(account);
    return errors::OK;
}

int32_t AllowListGate::add_claim(const Address& account, uint64_t topic_id) {
    std::unique_lock lock(mutex_);
    if (verified_.find(account) == verified_.end()) {
        return errors::COMPLIANCE_REQUIRED;
    }
    claims_[account].insert(topic_id);
    return errors::OK;
}

bool AllowListGate::is_verified(const Address& account) const {
    std::shared_lock lock(mutex_);
    return verified_.find(account) != verified_.end();
}

bool AllowListGate::has_claim(const Address& account, uint64_t topic_id) const {
    std::shared_lock lock(mutex_);
    auto it = claims_.find(account);
    return it != claims_.end() && it->second.count(topic_id) > 0;
}

} // namespace xlend
