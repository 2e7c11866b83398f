#ifndef XLEND_INTEREST_HPP
#define XLEND_INTEREST_HPP

#include "types.hpp"

namespace xlend {

// =============================================================================
// Rate Model Parameters (annualized, basis points)
// =============================================================================

struct RateModelConfig {
    uint32_t base_rate_bps = 200;              // 2% at zero utilization
    uint32_t slope1_bps = 400;                 // +4% up to the kink
    uint32_t slope2_bps = 6000;                // +60% from the kink to 100%
    uint32_t optimal_utilization_bps = 8000;   // kink at 80%
};

// =============================================================================
// InterestRateModel - utilization -> per-second borrow rate
//
// Two-slope model. Stateless beyond its configuration; monotonic
// non-decreasing in utilization.
// =============================================================================

class InterestRateModel {
public:
    InterestRateModel() = default;
    explicit InterestRateModel(const RateModelConfig& config);

    const RateModelConfig& config() const { return config_; }

    // utilization = total_borrowed / total_deposited, X18 (clamped to [0, 1])
    static I128 utilization(I128 total_borrowed, I128 total_deposited);

    // Per-second borrow rate, X18
    I128 rate(I128 utilization_x18) const;

    // Annualized rate for a utilization, basis points
    uint32_t annual_rate_bps(I128 utilization_x18) const;

    // Per-second X18 rate -> annualized basis points
    static uint32_t to_annual_bps(I128 per_second_x18);

    // Annualized basis points -> per-second X18 rate
    static I128 from_annual_bps(uint32_t annual_bps);

    // Simple interest owed on principal over elapsed seconds
    static I128 interest(I128 principal, I128 per_second_x18, uint64_t elapsed);

private:
    RateModelConfig config_;
};

} // namespace xlend

#endif // XLEND_INTEREST_HPP
