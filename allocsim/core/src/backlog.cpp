#include <allocsim/core/backlog.hpp>
#include <allocsim/core/error.hpp>

#include <utility>

namespace allocsim::core {

void Backlog::add(DemandOrder order) {
    if (order.qty_remaining() == 0) {
        throw ValidationError("order " + order.order_id() + " has nothing left to allocate");
    }
    if (!ids_.insert(order.order_id()).second) {
        throw ValidationError("duplicate order_id " + order.order_id());
    }
    orders_.push_back(std::move(order));
}

bool Backlog::contains(std::string_view order_id) const {
    return ids_.find(std::string(order_id)) != ids_.end();
}

std::vector<DemandOrder*> Backlog::tier_orders(PriorityTier tier) {
    std::vector<DemandOrder*> result;
    for (auto& order : orders_) {
        if (order.priority_tier() == tier) {
            result.push_back(&order);
        }
    }
    return result;
}

TierDemand Backlog::demand_by_tier() const {
    TierDemand demand{};
    for (const auto& order : orders_) {
        auto& slot = demand[tier_index(order.priority_tier())];
        slot = checked_add(slot, order.qty_remaining());
    }
    return demand;
}

Quantity Backlog::total_demand() const {
    Quantity total = 0;
    for (const auto& order : orders_) {
        total = checked_add(total, order.qty_remaining());
    }
    return total;
}

std::vector<DemandOrder> Backlog::release() {
    ids_.clear();
    return std::exchange(orders_, {});
}

} // namespace allocsim::core
