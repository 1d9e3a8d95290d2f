#pragma once

#include <allocsim/core/types.hpp>

#include <algorithm>

namespace allocsim::core {

/// @brief Subcomponent supply available in one period.
/// @ingroup core
///
/// A finished unit needs one of each subcomponent, so the weaker of the two
/// quantities bounds what can be built.
struct SupplyRecord {
    Period period{0};                ///< Period the supply lands in.
    Quantity subcomponent_a_qty{0};  ///< Units of subcomponent A.
    Quantity subcomponent_b_qty{0};  ///< Units of subcomponent B.

    /// @brief Finished units buildable from this supply alone.
    [[nodiscard]] constexpr Quantity base_limit() const noexcept {
        return std::min(subcomponent_a_qty, subcomponent_b_qty);
    }

    constexpr bool operator==(const SupplyRecord& rhs) const noexcept = default;
};

} // namespace allocsim::core
