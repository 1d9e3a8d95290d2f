#pragma once

#include <allocsim/core/backlog.hpp>
#include <allocsim/core/period_summary.hpp>
#include <allocsim/core/types.hpp>

#include <vector>

namespace allocsim::algo {

/// @brief Distributes a Global Build Limit across tiers in strict priority order.
/// @ingroup algo_allocators
///
/// Tiers are visited highest precedence first. Each tier receives
/// min(tier demand, remaining limit) and the remaining limit shrinks
/// accordingly, so a lower tier only receives units once every higher tier
/// is served up to its demand. Every tier is visited, including those that
/// end up with nothing, so the output always covers all tiers.
///
/// @see FifoDistributor, AllocationEngine
class WaterfallAllocator {
public:
    /// @brief Split @p global_limit across tiers.
    /// @param global_limit Units available this period.
    /// @param demand       Unmet demand per tier (carried backlog included).
    /// @return One TierAllocation per tier, highest precedence first.
    [[nodiscard]] std::vector<core::TierAllocation> allocate(core::Quantity global_limit,
                                                             const core::TierDemand& demand) const;
};

} // namespace allocsim::algo
