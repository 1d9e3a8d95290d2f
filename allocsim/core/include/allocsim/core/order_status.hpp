#pragma once

#include <allocsim/core/types.hpp>

#include <string_view>

namespace allocsim::core {

/// @brief Fulfilment state of a DemandOrder.
/// @ingroup core
///
/// Transitions only move forward: Unfulfilled -> Partial -> Full, with
/// Unfulfilled -> Full allowed when a single grant covers the whole order.
/// Full is terminal.
///
/// @see status_for, is_valid_transition
enum class OrderStatus {
    Unfulfilled,  ///< Nothing allocated yet.
    Partial,      ///< Some, but not all, units allocated.
    Full          ///< Every ordered unit allocated (terminal).
};

/// @brief Derive the status from allocated and ordered quantities.
/// @param allocated Cumulative allocated quantity (must be <= @p ordered).
/// @param ordered   Ordered quantity.
/// @return The status matching the quantities.
[[nodiscard]] constexpr OrderStatus status_for(Quantity allocated, Quantity ordered) noexcept {
    if (allocated == 0) {
        return OrderStatus::Unfulfilled;
    }
    return allocated >= ordered ? OrderStatus::Full : OrderStatus::Partial;
}

/// @brief Whether an order may move from @p from to @p to.
///
/// Staying in a non-terminal state is valid (an order may receive nothing,
/// or a partial grant, in a period). Regressions and any move out of Full
/// are invalid.
[[nodiscard]] constexpr bool is_valid_transition(OrderStatus from, OrderStatus to) noexcept {
    if (from == OrderStatus::Full) {
        return false;
    }
    return static_cast<int>(to) >= static_cast<int>(from);
}

/// @brief Label of a status ("Unfulfilled", "Partial", "Full").
[[nodiscard]] constexpr std::string_view to_string(OrderStatus status) noexcept {
    switch (status) {
        case OrderStatus::Unfulfilled: return "Unfulfilled";
        case OrderStatus::Partial:     return "Partial";
        case OrderStatus::Full:        return "Full";
    }
    return "Unknown";
}

} // namespace allocsim::core
