#ifndef XLEND_TYPES_HPP
#define XLEND_TYPES_HPP

#include <cstdint>
#include <array>
#include <string>
#include <string_view>
#include <optional>
#include <functional>
#include <limits>

namespace xlend {

// =============================================================================
// EVM-style identifiers
// =============================================================================

using Address = std::array<uint8_t, 20>;
using Hash32 = std::array<uint8_t, 32>;
using ChainId = uint64_t;

// Request ids for cross-chain liquidity transfers
using RequestId = Hash32;

inline constexpr Address ZERO_ADDRESS{};
inline constexpr RequestId ZERO_REQUEST_ID{};

// Parse "0x" + 40 hex digits. Returns nullopt on malformed input.
std::optional<Address> parse_address(std::string_view hex);

std::string to_hex(const Address& addr);
std::string to_hex(const Hash32& hash);

// Address with the given low 8 bytes, used for fixtures and well-known ids
constexpr Address make_address(uint64_t low) {
    Address addr = {};
    for (int i = 19; i >= 12; --i) {
        addr[i] = static_cast<uint8_t>(low & 0xFF);
        low >>= 8;
    }
    return addr;
}

// =============================================================================
// Fixed-Point Arithmetic (X18 = 18 decimal places)
// =============================================================================

using I128 = __int128;
using U128 = unsigned __int128;

constexpr I128 X18_ONE = 1000000000000000000LL;  // 1e18
constexpr I128 BPS_ONE = 10000;                  // 100% in basis points
constexpr uint64_t SECONDS_PER_YEAR = 31536000;  // 365 days

namespace x18 {

// a * b / d with a 256-bit intermediate, truncating toward zero.
// Returns 0 when d == 0; saturates when the quotient exceeds 127 bits.
I128 mul_div(I128 a, I128 b, I128 d);

inline I128 mul(I128 a, I128 b) {
    return mul_div(a, b, X18_ONE);
}

inline I128 div(I128 a, I128 b) {
    return mul_div(a, X18_ONE, b);
}

inline I128 from_double(double v) {
    return static_cast<I128>(v * static_cast<double>(X18_ONE));
}

inline double to_double(I128 v) {
    return static_cast<double>(v) / static_cast<double>(X18_ONE);
}

inline I128 from_int(int64_t v) {
    return static_cast<I128>(v) * X18_ONE;
}

inline int64_t to_int(I128 v) {
    return static_cast<int64_t>(v / X18_ONE);
}

// amount * bps / 10000
inline I128 bps(I128 amount, uint32_t bps_value) {
    return mul_div(amount, bps_value, BPS_ONE);
}

// Decimal integer rendering (iostreams have no __int128 overload)
std::string to_string(I128 v);

} // namespace x18

// Checked pool counter arithmetic: never below zero
namespace safe {

inline I128 add(I128 a, I128 b) {
    constexpr I128 max = static_cast<I128>(~U128(0) >> 1);
    if (b > 0 && a > max - b) return max;
    return a + b;
}

inline I128 sub(I128 a, I128 b) {
    return b >= a ? 0 : a - b;
}

} // namespace safe

// =============================================================================
// Asset (Token Address)
// =============================================================================

struct Currency {
    Address addr;

    Currency() : addr{} {}
    explicit Currency(const Address& a) : addr(a) {}

    bool is_native() const {
        for (auto b : addr) if (b != 0) return false;
        return true;
    }

    uint64_t hash() const {
        uint64_t h = 0;
        for (auto b : addr) h = h * 31 + b;
        return h;
    }

    bool operator==(const Currency& other) const { return addr == other.addr; }
    bool operator!=(const Currency& other) const { return addr != other.addr; }
    bool operator<(const Currency& other) const { return addr < other.addr; }
};

// Native chain asset (address(0))
inline const Currency NATIVE{};

struct CurrencyHash {
    size_t operator()(const Currency& c) const { return static_cast<size_t>(c.hash()); }
};

struct AddressHash {
    size_t operator()(const Address& a) const {
        uint64_t h = 0;
        for (auto b : a) h = h * 31 + b;
        return static_cast<size_t>(h);
    }
};

struct Hash32Hash {
    size_t operator()(const Hash32& a) const {
        uint64_t h = 0;
        for (auto b : a) h = h * 131 + b;
        return static_cast<size_t>(h);
    }
};

// =============================================================================
// Enumerations
// =============================================================================

enum class RateMode : uint8_t {
    VARIABLE = 0,
    STABLE = 1
};

enum class SourceType : uint8_t {
    LOCAL_VAULT = 0,
    CROSS_CHAIN_BRIDGE = 1,
    EXTERNAL_MONEY_MARKET = 2
};

enum class TransferStatus : uint8_t {
    PENDING = 0,
    COMPLETED = 1,
    FAILED = 2
};

enum class SystemState : uint8_t {
    ACTIVE = 0,
    PAUSED = 1
};

enum class Role : uint8_t {
    OWNER = 0,
    ADAPTER_CALLER = 1
};

enum class ComplianceMode : uint8_t {
    NONE = 0,      // ungated
    VERIFIED = 1,  // identity must be verified
    CLAIM = 2      // verified and holding the required claim topic
};

const char* to_string(RateMode mode);
const char* to_string(SourceType type);
const char* to_string(TransferStatus status);

// Chain time in seconds
using Clock = std::function<uint64_t()>;

Clock system_clock();

constexpr uint64_t UNBOUNDED_HEALTH = std::numeric_limits<uint64_t>::max();

// =============================================================================
// Error Codes
// =============================================================================

namespace errors {
constexpr int32_t OK = 0;

// Validation
constexpr int32_t ZERO_AMOUNT = -1;
constexpr int32_t UNSUPPORTED_ASSET = -2;
constexpr int32_t UNSUPPORTED_CHAIN = -3;
constexpr int32_t INVALID_ADDRESS = -4;
constexpr int32_t INVALID_CONFIG = -5;

// State
constexpr int32_t PAUSED = -10;
constexpr int32_t ALREADY_REGISTERED = -11;
constexpr int32_t ADAPTER_NOT_FOUND = -12;
constexpr int32_t INVALID_STATE = -13;
constexpr int32_t REQUEST_NOT_FOUND = -14;
constexpr int32_t REENTRANCY = -15;
constexpr int32_t STABLE_RATE_LOCKED = -16;

// Authorization
constexpr int32_t COMPLIANCE_REQUIRED = -20;
constexpr int32_t UNAUTHORIZED = -21;

// Liquidity
constexpr int32_t INSUFFICIENT_LIQUIDITY = -30;
constexpr int32_t INSUFFICIENT_REMOTE_LIQUIDITY = -31;
constexpr int32_t INSUFFICIENT_BALANCE = -32;
constexpr int32_t UNDERCOLLATERALIZED = -33;
constexpr int32_t NOT_LIQUIDATABLE = -34;
constexpr int32_t FLASH_LOAN_NOT_REPAID = -35;
constexpr int32_t NO_LIQUIDITY_SOURCE = -36;

// External dependencies
constexpr int32_t ADAPTER_FAILED = -40;
constexpr int32_t ORACLE_UNAVAILABLE = -41;

const char* name(int32_t code);
}

} // namespace xlend

#endif // XLEND_TYPES_HPP
