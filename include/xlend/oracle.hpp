#ifndef XLEND_ORACLE_HPP
#define XLEND_ORACLE_HPP

#include <unordered_map>
#include <shared_mutex>
#include <optional>

#include "types.hpp"

namespace xlend {

// =============================================================================
// Price Oracle Interface (external collaborator)
//
// Prices may be stale or manipulated; callers re-read on every valuation and
// never cache a conversion across calls.
// =============================================================================

class IPriceOracle {
public:
    virtual ~IPriceOracle() = default;

    // amount (X18 token units) -> USD value (X18). nullopt if no usable price.
    virtual std::optional<I128> convert_to_usd(const Currency& asset, I128 amount_x18) const = 0;

    // USD value (X18) -> amount of asset (X18)
    virtual std::optional<I128> convert_usd_to_asset(I128 usd_x18, const Currency& asset) const = 0;
};

// =============================================================================
// PriceOracle - push-updated price table with staleness bound
// =============================================================================

struct PricePoint {
    I128 price_x18;      // USD per whole token
    uint64_t timestamp;
};

class PriceOracle : public IPriceOracle {
public:
    explicit PriceOracle(Clock clock = system_clock(), uint64_t max_staleness = 3600);

    PriceOracle(const PriceOracle&) = delete;
    PriceOracle& operator=(const PriceOracle&) = delete;

    int32_t set_price(const Currency& asset, I128 price_x18);
    std::optional<PricePoint> get_price(const Currency& asset) const;

    void set_max_staleness(uint64_t seconds) { max_staleness_ = seconds; }
    uint64_t max_staleness() const { return max_staleness_; }

    std::optional<I128> convert_to_usd(const Currency& asset, I128 amount_x18) const override;
    std::optional<I128> convert_usd_to_asset(I128 usd_x18, const Currency& asset) const override;

private:
    std::optional<I128> fresh_price(const Currency& asset) const;

    Clock clock_;
    uint64_t max_staleness_;
    std::unordered_map<Currency, PricePoint, CurrencyHash> prices_;
    mutable std::shared_mutex mutex_;
};

} // namespace xlend

#endif // XLEND_ORACLE_HPP
