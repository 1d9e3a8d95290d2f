#include <allocsim/core/demand_order.hpp>
#include <allocsim/core/error.hpp>

#include <string>
#include <utility>

namespace allocsim::core {

DemandOrder::DemandOrder(std::string order_id, std::string customer_id, std::string segment,
                         PriorityTier tier, Period period_requested, Quantity qty_ordered,
                         Quantity qty_allocated)
    : order_id_(std::move(order_id))
    , customer_id_(std::move(customer_id))
    , segment_(std::move(segment))
    , tier_(tier)
    , period_requested_(period_requested)
    , qty_ordered_(qty_ordered)
    , qty_allocated_(qty_allocated) {
    if (order_id_.empty()) {
        throw ValidationError("order_id must not be empty");
    }
    if (qty_ordered_ == 0) {
        throw ValidationError("order " + order_id_ + ": qty_ordered must be positive");
    }
    if (qty_allocated_ > qty_ordered_) {
        throw ValidationError("order " + order_id_ + ": qty_allocated exceeds qty_ordered");
    }
}

void DemandOrder::grant(Quantity qty, Period period) {
    if (qty == 0) {
        return;
    }
    OrderStatus next = qty >= qty_remaining() ? OrderStatus::Full : OrderStatus::Partial;
    if (!is_valid_transition(status(), next)) {
        throw InvalidStateError("order " + order_id_ + " cannot move from " +
                                std::string(to_string(status())) + " to " +
                                std::string(to_string(next)));
    }
    if (qty > qty_remaining()) {
        throw InvalidStateError("order " + order_id_ + ": grant of " + std::to_string(qty) +
                                " exceeds remaining " + std::to_string(qty_remaining()));
    }
    if (last_grant_period_ && *last_grant_period_ >= period) {
        throw InvalidStateError("order " + order_id_ + " already granted in period " +
                                std::to_string(*last_grant_period_));
    }
    qty_allocated_ += qty;
    last_grant_period_ = period;
}

} // namespace allocsim::core
