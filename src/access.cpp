#include "xlend/access.hpp"
#include "xlend/log.hpp"
#include <mutex>

namespace xlend {

namespace {
constexpr std::string_view COMPONENT = "access";
}

AccessControl::AccessControl(const Address& owner) : owner_(owner) {}

Address AccessControl::owner() const {
    std::shared_lock lock(mutex_);
    return owner_;
}

bool AccessControl::has_role(const Address& account, Role role) const {
    std::shared_lock lock(mutex_);
    switch (role) {
        case Role::OWNER:
            return account == owner_;
        case Role::ADAPTER_CALLER:
            return adapter_callers_.count(account) > 0;
    }
    return false;
}

int32_t AccessControl::require(const Address& caller, Role role) const {
    return has_role(caller, role) ? errors::OK : errors::UNAUTHORIZED;
}

int32_t AccessControl::grant_role(const Address& caller, const Address& account, Role role) {
    if (account == ZERO_ADDRESS) {
        return errors::INVALID_ADDRESS;
    }

    std::unique_lock lock(mutex_);
    if (caller != owner_ || role == Role::OWNER) {
        return errors::UNAUTHORIZED;
    }
    if (!adapter_callers_.insert(account).second) {
        return errors::ALREADY_REGISTERED;
    }
    log::info(COMPONENT, "granted ADAPTER_CALLER to ", to_hex(account));
    return errors::OK;
}

int32_t AccessControl::revoke_role(const Address& caller, const Address& account, Role role) {
    std::unique_lock lock(mutex_);
    if (caller != owner_ || role == Role::OWNER) {
        return errors::UNAUTHORIZED;
    }
    if (adapter_callers_.erase(account) == 0) {
        return errors::INVALID_STATE;
    }
    log::info(COMPONENT, "revoked ADAPTER_CALLER from ", to_hex(account));
    return errors::OK;
}

int32_t AccessControl::transfer_ownership(const Address& caller, const Address& new_owner) {
    if (new_owner == ZERO_ADDRESS) {
        return errors::INVALID_ADDRESS;
    }

    std::unique_lock lock(mutex_);
    if (caller != owner_) {
        return errors::UNAUTHORIZED;
    }
    owner_ = new_owner;
    log::info(COMPONENT, "ownership transferred to ", to_hex(new_owner));
    return errors::OK;
}

int32_t AccessControl::pause(const Address& caller) {
    std::unique_lock lock(mutex_);
    if (caller != owner_) return errors::UNAUTHORIZED;
    if (state_ == SystemState::PAUSED) return errors::INVALID_STATE;
    state_ = SystemState::PAUSED;
    log::warn(COMPONENT, "system paused");
    return errors::OK;
}

int32_t AccessControl::unpause(const Address& caller) {
    std::unique_lock lock(mutex_);
    if (caller != owner_) return errors::UNAUTHORIZED;
    if (state_ == SystemState::ACTIVE) return errors::INVALID_STATE;
    state_ = SystemState::ACTIVE;
    log::info(COMPONENT, "system unpaused");
    return errors::OK;
}

SystemState AccessControl::state() const {
    std::shared_lock lock(mutex_);
    return state_;
}

} // namespace xlend
