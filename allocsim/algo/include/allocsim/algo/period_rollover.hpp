#pragma once

#include <allocsim/core/backlog.hpp>
#include <allocsim/core/demand_order.hpp>

#include <vector>

namespace allocsim::algo {

/// @brief Outcome of closing a period.
/// @ingroup algo_engine
struct RolloverResult {
    core::Backlog carried;                  ///< Orders still owed units, unchanged.
    std::vector<core::DemandOrder> closed;  ///< Orders that reached Full.
};

/// @brief Carries unmet orders from one period into the next.
/// @ingroup algo_engine
///
/// Every order with a remaining quantity moves into the next period's
/// backlog with its identity, age and allocation untouched; Full orders
/// leave the backlog. Nothing is dropped and nothing is created.
///
/// @see AllocationEngine
class PeriodRollover {
public:
    /// @brief Split a finished period's backlog.
    /// @param backlog The backlog after this period's grants.
    /// @return The carried backlog and the closed orders, both in the
    ///         backlog's original order.
    [[nodiscard]] RolloverResult roll_over(core::Backlog backlog) const;
};

} // namespace allocsim::algo
