#pragma once

#include <allocsim/core/demand_order.hpp>
#include <allocsim/core/priority_tier.hpp>
#include <allocsim/core/types.hpp>

#include <array>
#include <cstddef>
#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

namespace allocsim::core {

/// @brief Unmet demand per tier, indexed by tier_index().
/// @ingroup core
using TierDemand = std::array<Quantity, TIER_COUNT>;

/// @brief The set of open orders competing for one period's supply.
/// @ingroup core
///
/// A Backlog is an explicit value passed into a period and returned out of
/// it; there is no shared "current backlog". It owns its orders and keeps
/// them in insertion order. Identifiers are unique within a backlog.
///
/// Pointers returned by tier_orders() stay valid until the next
/// call to add() or release().
///
/// @see PeriodState, DemandOrder
class Backlog {
public:
    Backlog() = default;

    /// @brief Add an order to the backlog.
    /// @param order Order with a non-zero remaining quantity.
    /// @throws ValidationError if an order with the same id is present, or
    ///         if @p order has nothing left to allocate.
    void add(DemandOrder order);

    /// @brief Number of orders in the backlog.
    [[nodiscard]] std::size_t size() const noexcept { return orders_.size(); }

    /// @brief True if no order is waiting.
    [[nodiscard]] bool empty() const noexcept { return orders_.empty(); }

    /// @brief Whether an order with @p order_id is present.
    [[nodiscard]] bool contains(std::string_view order_id) const;

    /// @brief Orders of one tier, in insertion order.
    [[nodiscard]] std::vector<DemandOrder*> tier_orders(PriorityTier tier);

    /// @brief Sum of qty_remaining per tier.
    /// @throws OverflowError if a sum does not fit in a Quantity.
    [[nodiscard]] TierDemand demand_by_tier() const;

    /// @brief Sum of qty_remaining over the whole backlog.
    /// @throws OverflowError if the sum does not fit in a Quantity.
    [[nodiscard]] Quantity total_demand() const;

    /// @brief All orders, in insertion order.
    [[nodiscard]] const std::vector<DemandOrder>& orders() const noexcept { return orders_; }

    /// @brief Move every order out, leaving the backlog empty.
    [[nodiscard]] std::vector<DemandOrder> release();

private:
    std::vector<DemandOrder> orders_;
    std::unordered_set<std::string> ids_;
};

/// @brief Working state of the engine for one period.
/// @ingroup core
///
/// Created when a period starts, with the backlog carried in from the
/// previous period plus the orders requested in this one.
struct PeriodState {
    Period period{0};
    Quantity global_limit{0};     ///< Computed by the constraint resolver.
    Quantity remaining_limit{0};  ///< Decreases as tiers are served.
    Backlog backlog;
};

} // namespace allocsim::core
