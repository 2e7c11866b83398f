#ifndef XLEND_COMPLIANCE_HPP
#define XLEND_COMPLIANCE_HPP

#include <unordered_map>
#include <unordered_set>
#include <shared_mutex>

#include "types.hpp"

namespace xlend {

// =============================================================================
// Compliance Gate (external identity / claim authority)
// =============================================================================

class IComplianceGate {
public:
    virtual ~IComplianceGate() = default;

    virtual bool is_verified(const Address& account) const = 0;
    virtual bool has_claim(const Address& account, uint64_t topic_id) const = 0;
};

// Evaluates a gate under a compliance mode. A null gate only passes NONE.
bool passes_compliance(const IComplianceGate* gate, ComplianceMode mode,
                       const Address& account, uint64_t required_topic);

// =============================================================================
// AllowListGate - in-process registry of verified identities and claims
// =============================================================================

class AllowListGate : public IComplianceGate {
public:
    AllowListGate() = default;

    // Fails with ALREADY_REGISTERED when the identity is already verified
    int32_t verify(const Address& account);
    int32_t revoke(const Address& account);
    int32_t add_claim(const Address& account, uint64_t topic_id);

    bool is_verified(const Address& account) const override;
    bool has_claim(const Address& account, uint64_t topic_id) const override;

private:
    std::unordered_set<Address, AddressHash> verified_;
    std::unordered_map<Address, std::unordered_set<uint64_t>, AddressHash> claims_;
    mutable std::shared_mutex mutex_;
};

} // namespace xlend

#endif // XLEND_COMPLIANCE_HPP
