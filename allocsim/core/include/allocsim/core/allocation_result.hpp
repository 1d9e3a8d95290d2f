#pragma once

#include <allocsim/core/order_status.hpp>
#include <allocsim/core/priority_tier.hpp>
#include <allocsim/core/types.hpp>

#include <string>

namespace allocsim::core {

class DemandOrder;

/// @brief Immutable snapshot of one order at the end of one period.
/// @ingroup core
///
/// The engine emits one row for every order that was in the period's
/// backlog, including orders that received nothing.
///
/// @see ReportSink::write_result
struct AllocationResult {
    Period period{0};
    std::string order_id;
    std::string customer_id;
    std::string segment;
    PriorityTier priority_tier{PriorityTier::P1};
    Period period_requested{0};
    Quantity qty_ordered{0};
    Quantity qty_allocated{0};              ///< Cumulative, after this period.
    Quantity qty_allocated_this_period{0};
    OrderStatus status{OrderStatus::Unfulfilled};

    bool operator==(const AllocationResult& rhs) const = default;
};

/// @brief Build the snapshot row of @p order for @p period.
/// @param period          Period being reported.
/// @param order           Order after this period's grant.
/// @param this_period_qty Units granted to the order in @p period.
/// @return The result row.
[[nodiscard]] AllocationResult make_result(Period period, const DemandOrder& order,
                                           Quantity this_period_qty);

} // namespace allocsim::core
