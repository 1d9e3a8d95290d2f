#pragma once

/// @file error.hpp
/// @brief IO-specific exception types for the allocsim I/O library.
/// @ingroup io

#include <stdexcept>
#include <string>

namespace allocsim::io {

/// @brief Exception for I/O errors (loading, parsing, validation).
///
/// Thrown by loader functions when input is malformed, required fields are
/// missing, or values fail validation (negative or fractional quantities,
/// duplicate order ids, unknown priority tiers). Invalid input never
/// reaches the allocation engine.
///
/// @ingroup io
/// @see load_scenario, load_snapshot, load_engine_config
class LoaderError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;

    /// @brief Construct a LoaderError with a contextual prefix.
    ///
    /// The resulting message is formatted as `"context: message"`.
    ///
    /// @param message  Human-readable description of the error.
    /// @param context  Additional context such as the file path or record index.
    LoaderError(const std::string& message, const std::string& context)
        : std::runtime_error(context + ": " + message) {}
};

} // namespace allocsim::io
