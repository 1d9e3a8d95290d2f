#pragma once

#include <allocsim/core/demand_order.hpp>
#include <allocsim/core/types.hpp>

#include <vector>

namespace allocsim::algo {

/// @brief Distributes a tier's allocation across its orders, oldest first.
/// @ingroup algo_allocators
///
/// Orders are served in (period_requested, order_id) order. Each order is
/// granted min(qty_remaining, what is left of the tier allocation); once
/// the allocation is exhausted, later orders are left untouched. Partial
/// fulfilment is a normal outcome.
///
/// @see WaterfallAllocator, DemandOrder::grant
class FifoDistributor {
public:
    /// @brief Sort @p orders into FIFO service order.
    ///
    /// Oldest period first; order_id breaks ties so the order is total and
    /// reproducible.
    static void sort_fifo(std::vector<core::DemandOrder*>& orders);

    /// @brief Grant @p tier_allocation units to @p orders.
    ///
    /// @p orders is sorted in place into FIFO order before granting.
    ///
    /// @param tier_allocation Units the waterfall gave to the tier.
    /// @param orders          The tier's orders (backlog and new).
    /// @param period          Period in which the grants are made.
    /// @return Units actually distributed. Less than @p tier_allocation only
    ///         if the orders could not absorb it.
    /// @throws InvalidStateError propagated from DemandOrder::grant.
    [[nodiscard]] core::Quantity distribute(core::Quantity tier_allocation,
                                            std::vector<core::DemandOrder*>& orders,
                                            core::Period period) const;
};

} // namespace allocsim::algo
