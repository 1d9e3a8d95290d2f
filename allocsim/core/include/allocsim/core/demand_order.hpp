#pragma once

#include <allocsim/core/order_status.hpp>
#include <allocsim/core/priority_tier.hpp>
#include <allocsim/core/types.hpp>

#include <optional>
#include <string>

namespace allocsim::core {

/// @brief A customer order competing for constrained supply.
/// @ingroup core
///
/// Identity, tier, age and ordered quantity are fixed at construction. The
/// allocated quantity only grows, and only through grant(), which the FIFO
/// distributor calls at most once per order per period.
///
/// Orders are plain values: the engine copies its inputs, so running it
/// twice on the same orders yields the same allocations.
///
/// @see OrderStatus, Backlog
class DemandOrder {
public:
    /// @brief Construct a new order.
    /// @param order_id         Globally unique, non-empty identifier.
    /// @param customer_id      Customer placing the order.
    /// @param segment          Market segment of the customer.
    /// @param tier             Priority tier used by the waterfall.
    /// @param period_requested Period in which the order originated (FIFO age key).
    /// @param qty_ordered      Ordered quantity (must be positive).
    /// @param qty_allocated    Quantity already allocated, for orders restored
    ///                         from a saved backlog (default 0).
    /// @throws ValidationError if @p order_id is empty, @p qty_ordered is zero,
    ///         or @p qty_allocated exceeds @p qty_ordered.
    DemandOrder(std::string order_id, std::string customer_id, std::string segment,
                PriorityTier tier, Period period_requested, Quantity qty_ordered,
                Quantity qty_allocated = 0);

    [[nodiscard]] const std::string& order_id() const noexcept { return order_id_; }
    [[nodiscard]] const std::string& customer_id() const noexcept { return customer_id_; }
    [[nodiscard]] const std::string& segment() const noexcept { return segment_; }
    [[nodiscard]] PriorityTier priority_tier() const noexcept { return tier_; }
    [[nodiscard]] Period period_requested() const noexcept { return period_requested_; }
    [[nodiscard]] Quantity qty_ordered() const noexcept { return qty_ordered_; }
    [[nodiscard]] Quantity qty_allocated() const noexcept { return qty_allocated_; }

    /// @brief Units still owed to the customer.
    [[nodiscard]] Quantity qty_remaining() const noexcept { return qty_ordered_ - qty_allocated_; }

    /// @brief Current fulfilment state.
    [[nodiscard]] OrderStatus status() const noexcept {
        return status_for(qty_allocated_, qty_ordered_);
    }

    /// @brief Whether the order is Full and therefore inert.
    [[nodiscard]] bool is_full() const noexcept { return qty_allocated_ == qty_ordered_; }

    /// @brief Period of the most recent non-zero grant, if any.
    [[nodiscard]] std::optional<Period> last_grant_period() const noexcept {
        return last_grant_period_;
    }

    /// @brief Allocate @p qty more units to this order in @p period.
    ///
    /// A zero grant leaves the order untouched. The resulting status change
    /// must satisfy is_valid_transition(), so a Full order takes no grant.
    ///
    /// @param qty    Units to allocate.
    /// @param period Period in which the grant is made.
    /// @throws InvalidStateError if the order is Full, if @p qty exceeds
    ///         qty_remaining(), or if the order was already granted units in
    ///         @p period or a later one.
    void grant(Quantity qty, Period period);

private:
    std::string order_id_;
    std::string customer_id_;
    std::string segment_;
    PriorityTier tier_;
    Period period_requested_;
    Quantity qty_ordered_;
    Quantity qty_allocated_;
    std::optional<Period> last_grant_period_;
};

} // namespace allocsim::core
