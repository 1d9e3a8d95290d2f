#include <allocsim/algo/waterfall_allocator.hpp>

#include <algorithm>

namespace allocsim::algo {

using namespace allocsim::core;

std::vector<TierAllocation> WaterfallAllocator::allocate(Quantity global_limit,
                                                         const TierDemand& demand) const {
    std::vector<TierAllocation> result;
    result.reserve(ALL_TIERS.size());

    Quantity remaining_limit = global_limit;
    for (PriorityTier tier : ALL_TIERS) {
        Quantity tier_demand = demand[tier_index(tier)];
        Quantity tier_allocation = std::min(tier_demand, remaining_limit);
        remaining_limit -= tier_allocation;
        result.push_back(TierAllocation{tier, tier_demand, tier_allocation});
    }
    return result;
}

} // namespace allocsim::algo
