#ifndef XLEND_ACCESS_HPP
#define XLEND_ACCESS_HPP

#include <unordered_set>
#include <shared_mutex>

#include "types.hpp"

namespace xlend {

// =============================================================================
// AccessControl - single owner, adapter-caller role set, global pause
// =============================================================================

class AccessControl {
public:
    explicit AccessControl(const Address& owner);

    AccessControl(const AccessControl&) = delete;
    AccessControl& operator=(const AccessControl&) = delete;

    Address owner() const;
    bool has_role(const Address& account, Role role) const;

    // OK or UNAUTHORIZED
    int32_t require(const Address& caller, Role role) const;

    // Owner only. OWNER is moved with transfer_ownership, not granted.
    int32_t grant_role(const Address& caller, const Address& account, Role role);
    int32_t revoke_role(const Address& caller, const Address& account, Role role);
    int32_t transfer_ownership(const Address& caller, const Address& new_owner);

    int32_t pause(const Address& caller);
    int32_t unpause(const Address& caller);
    SystemState state() const;
    bool paused() const { return state() == SystemState::PAUSED; }

private:
    Address owner_;
    std::unordered_set<Address, AddressHash> adapter_callers_;
    SystemState state_ = SystemState::ACTIVE;
    mutable std::shared_mutex mutex_;
};

} // namespace xlend

#endif // XLEND_ACCESS_HPP
