// =============================================================================
// interest.cpp - Two-slope interest rate model
// =============================================================================

#include "xlend/interest.hpp"
#include <algorithm>

namespace xlend {

InterestRateModel::InterestRateModel(const RateModelConfig& config) : config_(config) {
    config_.optimal_utilization_bps = std::clamp<uint32_t>(config_.optimal_utilization_bps, 1, 10000);
}

I128 InterestRateModel::utilization(I128 total_borrowed, I128 total_deposited) {
    if (total_deposited <= 0 || total_borrowed <= 0) return 0;
    if (total_borrowed >= total_deposited) return X18_ONE;
    return x18::div(total_borrowed, total_deposited);
}

I128 InterestRateModel::rate(I128 utilization_x18) const {
    return from_annual_bps(annual_rate_bps(utilization_x18));
}

uint32_t InterestRateModel::annual_rate_bps(I128 utilization_x18) const {
    I128 u = std::clamp<I128>(utilization_x18, 0, X18_ONE);
    I128 optimal = x18::bps(X18_ONE, config_.optimal_utilization_bps);

    // Work in bps * 1e18 to keep the slope interpolation exact
    I128 annual = static_cast<I128>(config_.base_rate_bps) * X18_ONE;

    I128 below = std::min(u, optimal);
    annual += x18::mul_div(static_cast<I128>(config_.slope1_bps) * X18_ONE, below, optimal);

    if (u > optimal && optimal < X18_ONE) {
        annual += x18::mul_div(static_cast<I128>(config_.slope2_bps) * X18_ONE,
                               u - optimal, X18_ONE - optimal);
    }

    return static_cast<uint32_t>(annual / X18_ONE);
}

uint32_t InterestRateModel::to_annual_bps(I128 per_second_x18) {
    if (per_second_x18 <= 0) return 0;
    I128 annual_x18 = per_second_x18 * static_cast<I128>(SECONDS_PER_YEAR);
    // Round to nearest bp so from_annual_bps/to_annual_bps agree
    return static_cast<uint32_t>((annual_x18 * BPS_ONE + X18_ONE / 2) / X18_ONE);
}

I128 InterestRateModel::from_annual_bps(uint32_t annual_bps) {
    return x18::bps(X18_ONE, annual_bps) / static_cast<I128>(SECONDS_PER_YEAR);
}

I128 InterestRateModel::interest(I128 principal, I128 per_second_x18, uint64_t elapsed) {
    if (principal <= 0 || per_second_x18 <= 0 || elapsed == 0) return 0;
    return x18::mul(principal, per_second_x18 * static_cast<I128>(elapsed));
}

} // namespace xlend
