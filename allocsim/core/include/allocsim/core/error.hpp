#pragma once

#include <stdexcept>
#include <string>

namespace allocsim::core {

/// @brief Base exception for all allocation errors.
///
/// All exceptions thrown by the core and algo libraries derive from this
/// class, allowing callers to catch allocation-specific errors separately
/// from other `std::runtime_error` exceptions.
///
/// @see ValidationError, InvalidStateError, OverflowError
/// @ingroup core
class AllocationError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// @brief Thrown when a record violates its construction invariants.
///
/// For example, a DemandOrder with an empty identifier or a zero ordered
/// quantity, or a second order reusing an identifier already present in a
/// Backlog.
///
/// @see AllocationError
/// @ingroup core
class ValidationError : public AllocationError {
public:
    using AllocationError::AllocationError;
};

/// @brief Thrown when an operation is invalid for the current object state.
///
/// For example, granting units to an order that is already Full, granting
/// more than the remaining quantity, or granting twice in the same period.
///
/// @see AllocationError
/// @ingroup core
class InvalidStateError : public AllocationError {
public:
    using AllocationError::AllocationError;
};

/// @brief Thrown when a running quantity sum would wrap.
///
/// Overflow is a fatal computation error: the engine never truncates or
/// wraps a quantity.
///
/// @see checked_add, checked_sub
/// @ingroup core
class OverflowError : public AllocationError {
public:
    using AllocationError::AllocationError;
};

} // namespace allocsim::core
