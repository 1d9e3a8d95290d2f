#pragma once

/// @file engine_config.hpp
/// @brief Loading of the optional JSON engine configuration file.
/// @ingroup io_loaders

#include <allocsim/io/customer_master.hpp>

#include <filesystem>
#include <optional>
#include <string_view>

namespace allocsim::io {

/// @brief Settings read from an engine configuration file.
///
/// Every field is optional in the file; absent booleans keep the defaults
/// shown here and an absent `customers` array leaves @ref customers empty.
///
/// @ingroup io_loaders
/// @see load_engine_config
struct EngineConfig {
    bool lookahead{true};
    bool carry_reservation{false};
    std::optional<CustomerMaster> customers;
};

/// @brief Load an engine configuration from a JSON file.
///
/// Format:
/// @code{.json}
/// {"lookahead": true, "carry_reservation": false,
///  "customers": [{"customer": "Tesla", "priority_tier": "P2", "segment": "Automotive"}]}
/// @endcode
///
/// @throws LoaderError  If the file cannot be read or a field has the wrong type.
[[nodiscard]] EngineConfig load_engine_config(const std::filesystem::path& path);

/// @brief Load an engine configuration from a JSON string.
/// @throws LoaderError  If the JSON is malformed or a field has the wrong type.
[[nodiscard]] EngineConfig load_engine_config_from_string(std::string_view json);

} // namespace allocsim::io
