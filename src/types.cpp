// =============================================================================
// types.cpp - Identifier parsing, enum names, error names
// =============================================================================

#include "xlend/types.hpp"
#include <chrono>

namespace xlend {

namespace {

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

template <size_t N>
std::string bytes_to_hex(const std::array<uint8_t, N>& bytes) {
    static const char* digits = "0123456789abcdef";
    std::string out = "0x";
    out.reserve(2 + N * 2);
    for (auto b : bytes) {
        out.push_back(digits[b >> 4]);
        out.push_back(digits[b & 0x0F]);
    }
    return out;
}

} // namespace

std::optional<Address> parse_address(std::string_view hex) {
    if (hex.size() >= 2 && hex[0] == '0' && (hex[1] == 'x' || hex[1] == 'X')) {
        hex.remove_prefix(2);
    }
    if (hex.size() != 40) return std::nullopt;

    Address addr{};
    for (size_t i = 0; i < 20; ++i) {
        int hi = hex_value(hex[i * 2]);
        int lo = hex_value(hex[i * 2 + 1]);
        if (hi < 0 || lo < 0) return std::nullopt;
        addr[i] = static_cast<uint8_t>((hi << 4) | lo);
    }
    return addr;
}

std::string to_hex(const Address& addr) {
    return bytes_to_hex(addr);
}

std::string to_hex(const Hash32& hash) {
    return bytes_to_hex(hash);
}

namespace x18 {

I128 mul_div(I128 a, I128 b, I128 d) {
    if (d == 0 || a == 0 || b == 0) return 0;

    bool negative = (a < 0) != (b < 0);
    if (d < 0) negative = !negative;

    auto magnitude = [](I128 v) -> U128 {
        return v < 0 ? static_cast<U128>(-(v + 1)) + 1 : static_cast<U128>(v);
    };
    U128 ua = magnitude(a);
    U128 ub = magnitude(b);
    U128 ud = magnitude(d);

    // 128 x 128 -> 256 bit product as (hi, lo)
    constexpr U128 MASK64 = (U128(1) << 64) - 1;
    U128 a0 = ua & MASK64, a1 = ua >> 64;
    U128 b0 = ub & MASK64, b1 = ub >> 64;
    U128 p00 = a0 * b0;
    U128 p01 = a0 * b1;
    U128 p10 = a1 * b0;
    U128 p11 = a1 * b1;
    U128 mid = (p00 >> 64) + (p01 & MASK64) + (p10 & MASK64);
    U128 lo = (p00 & MASK64) | (mid << 64);
    U128 hi = p11 + (p01 >> 64) + (p10 >> 64) + (mid >> 64);

    constexpr U128 I128_MAX = ~U128(0) >> 1;
    U128 q = 0;
    if (hi == 0) {
        q = lo / ud;
    } else {
        if (hi >= ud) {
            q = I128_MAX;
        } else {
            // Shift-subtract long division of the 256-bit product
            U128 r = hi;
            for (int i = 127; i >= 0; --i) {
                bool carry = (r >> 127) != 0;
                r = (r << 1) | ((lo >> i) & 1);
                if (carry || r >= ud) {
                    r -= ud;
                    q |= U128(1) << i;
                }
            }
        }
    }

    if (q > I128_MAX) q = I128_MAX;
    I128 result = static_cast<I128>(q);
    return negative ? -result : result;
}

std::string to_string(I128 v) {
    if (v == 0) return "0";
    bool negative = v < 0;
    U128 u = negative ? static_cast<U128>(-(v + 1)) + 1 : static_cast<U128>(v);
    std::string out;
    while (u > 0) {
        out.insert(out.begin(), static_cast<char>('0' + static_cast<int>(u % 10)));
        u /= 10;
    }
    if (negative) out.insert(out.begin(), '-');
    return out;
}

} // namespace x18

const char* to_string(RateMode mode) {
    switch (mode) {
        case RateMode::VARIABLE: return "VARIABLE";
        case RateMode::STABLE: return "STABLE";
    }
    return "UNKNOWN";
}

const char* to_string(SourceType type) {
    switch (type) {
        case SourceType::LOCAL_VAULT: return "LOCAL_VAULT";
        case SourceType::CROSS_CHAIN_BRIDGE: return "CROSS_CHAIN_BRIDGE";
        case SourceType::EXTERNAL_MONEY_MARKET: return "EXTERNAL_MONEY_MARKET";
    }
    return "UNKNOWN";
}

const char* to_string(TransferStatus status) {
    switch (status) {
        case TransferStatus::PENDING: return "PENDING";
        case TransferStatus::COMPLETED: return "COMPLETED";
        case TransferStatus::FAILED: return "FAILED";
    }
    return "UNKNOWN";
}

Clock system_clock() {
    return []() {
        return static_cast<uint64_t>(
            std::chrono::duration_cast<std::chrono::seconds>(
                std::chrono::system_clock::now().time_since_epoch()
            ).count()
        );
    };
}

namespace errors {

const char* name(int32_t code) {
    switch (code) {
        case OK: return "OK";
        case ZERO_AMOUNT: return "ZeroAmount";
        case UNSUPPORTED_ASSET: return "UnsupportedAsset";
        case UNSUPPORTED_CHAIN: return "UnsupportedChain";
        case INVALID_ADDRESS: return "InvalidAddress";
        case INVALID_CONFIG: return "InvalidConfig";
        case PAUSED: return "PausedState";
        case ALREADY_REGISTERED: return "AlreadyRegistered";
        case ADAPTER_NOT_FOUND: return "AdapterNotFound";
        case INVALID_STATE: return "InvalidState";
        case REQUEST_NOT_FOUND: return "RequestNotFound";
        case REENTRANCY: return "Reentrancy";
        case STABLE_RATE_LOCKED: return "StableRateLocked";
        case COMPLIANCE_REQUIRED: return "ComplianceRequired";
        case UNAUTHORIZED: return "Unauthorized";
        case INSUFFICIENT_LIQUIDITY: return "InsufficientLiquidity";
        case INSUFFICIENT_REMOTE_LIQUIDITY: return "InsufficientRemoteLiquidity";
        case INSUFFICIENT_BALANCE: return "InsufficientBalance";
        case UNDERCOLLATERALIZED: return "Undercollateralized";
        case NOT_LIQUIDATABLE: return "NotLiquidatable";
        case FLASH_LOAN_NOT_REPAID: return "FlashLoanNotRepaid";
        case NO_LIQUIDITY_SOURCE: return "NoLiquiditySource";
        case ADAPTER_FAILED: return "AdapterFailed";
        case ORACLE_UNAVAILABLE: return "OracleUnavailable";
    }
    return "Unknown";
}

} // namespace errors

} // namespace xlend
