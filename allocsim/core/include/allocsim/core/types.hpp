#pragma once

#include <allocsim/core/error.hpp>

#include <cstdint>
#include <limits>
#include <string>

namespace allocsim::core {

/// @brief Ordered period key (week index, or YYYYWW for ISO week labels).
///
/// Periods are only ever compared and sorted; the engine never computes
/// `period + 1`. The period that follows another is the next key present
/// in the run's schedule.
///
/// @ingroup core_types
using Period = int64_t;

/// @brief Count of finished-goods or subcomponent units.
/// @ingroup core_types
using Quantity = uint64_t;

/// @brief Add two quantities, throwing instead of wrapping.
/// @param lhs First operand.
/// @param rhs Second operand.
/// @return `lhs + rhs`.
/// @throws OverflowError if the sum does not fit in a Quantity.
/// @ingroup core_types
inline Quantity checked_add(Quantity lhs, Quantity rhs) {
    if (rhs > std::numeric_limits<Quantity>::max() - lhs) {
        throw OverflowError("quantity overflow: " + std::to_string(lhs) +
                            " + " + std::to_string(rhs));
    }
    return lhs + rhs;
}

/// @brief Subtract two quantities, throwing instead of wrapping below zero.
/// @param lhs Minuend.
/// @param rhs Subtrahend.
/// @return `lhs - rhs`.
/// @throws OverflowError if `rhs > lhs`.
/// @ingroup core_types
inline Quantity checked_sub(Quantity lhs, Quantity rhs) {
    if (rhs > lhs) {
        throw OverflowError("quantity underflow: " + std::to_string(lhs) +
                            " - " + std::to_string(rhs));
    }
    return lhs - rhs;
}

} // namespace allocsim::core
