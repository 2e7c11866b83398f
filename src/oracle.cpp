// =============================================================================
// oracle.cpp - Price table with staleness checks
// =============================================================================

#include "xlend/oracle.hpp"
#include <mutex>

namespace xlend {

PriceOracle::PriceOracle(Clock clock, uint64_t max_staleness)
    : clock_(std::move(clock)), max_staleness_(max_staleness) {}

int32_t PriceOracle::set_price(const Currency& asset, I128 price_x18) {
    if (price_x18 <= 0) {
        return errors::ORACLE_UNAVAILABLE;
    }

    std::unique_lock lock(mutex_);
    prices_[asset] = PricePoint{price_x18, clock_()};
    return errors::OK;
}

std::optional<PricePoint> PriceOracle::get_price(const Currency& asset) const {
    std::shared_lock lock(mutex_);
    auto it = prices_.find(asset);
    if (it == prices_.end()) return std::nullopt;
    return it->second;
}

std::optional<I128> PriceOracle::fresh_price(const Currency& asset) const {
    auto point = get_price(asset);
    if (!point) return std::nullopt;

    uint64_t now = clock_();
    if (max_staleness_ > 0 && now > point->timestamp &&
        now - point->timestamp > max_staleness_) {
        return std::nullopt;
    }
    return point->price_x18;
}

std::optional<I128> PriceOracle::convert_to_usd(const Currency& asset, I128 amount_x18) const {
    auto price = fresh_price(asset);
    if (!price) return std::nullopt;
    return x18::mul(amount_x18, *price);
}

std::optional<I128> PriceOracle::convert_usd_to_asset(I128 usd_x18, const Currency& asset) const {
    auto price = fresh_price(asset);
    if (!price) return std::nullopt;
    return x18::div(usd_x18, *price);
}

} // namespace xlend
