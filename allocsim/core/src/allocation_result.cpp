#include <allocsim/core/allocation_result.hpp>
#include <allocsim/core/demand_order.hpp>

namespace allocsim::core {

AllocationResult make_result(Period period, const DemandOrder& order, Quantity this_period_qty) {
    AllocationResult result;
    result.period = period;
    result.order_id = order.order_id();
    result.customer_id = order.customer_id();
    result.segment = order.segment();
    result.priority_tier = order.priority_tier();
    result.period_requested = order.period_requested();
    result.qty_ordered = order.qty_ordered();
    result.qty_allocated = order.qty_allocated();
    result.qty_allocated_this_period = this_period_qty;
    result.status = order.status();
    return result;
}

} // namespace allocsim::core
