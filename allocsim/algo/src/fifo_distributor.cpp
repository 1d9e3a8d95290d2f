#include <allocsim/algo/fifo_distributor.hpp>

#include <algorithm>

namespace allocsim::algo {

using namespace allocsim::core;

void FifoDistributor::sort_fifo(std::vector<DemandOrder*>& orders) {
    std::sort(orders.begin(), orders.end(), [](const DemandOrder* lhs, const DemandOrder* rhs) {
        if (lhs->period_requested() != rhs->period_requested()) {
            return lhs->period_requested() < rhs->period_requested();
        }
        return lhs->order_id() < rhs->order_id();
    });
}

Quantity FifoDistributor::distribute(Quantity tier_allocation, std::vector<DemandOrder*>& orders,
                                     Period period) const {
    sort_fifo(orders);

    Quantity tier_remaining = tier_allocation;
    for (DemandOrder* order : orders) {
        if (tier_remaining == 0) {
            break;
        }
        Quantity grant = std::min(order->qty_remaining(), tier_remaining);
        order->grant(grant, period);
        tier_remaining -= grant;
    }
    return tier_allocation - tier_remaining;
}

} // namespace allocsim::algo
