#pragma once

/// @file scenario_loader.hpp
/// @brief Functions and data structures for loading and writing JSON scenario files.
/// @ingroup io_loaders

#include <allocsim/core/demand_order.hpp>
#include <allocsim/core/supply_record.hpp>

#include <filesystem>
#include <ostream>
#include <string_view>
#include <vector>

namespace allocsim::io {

class CustomerMaster;

/// @brief Validated allocation input: supply per period and customer orders.
///
/// Loaded from JSON via @ref load_scenario, from CSV snapshots via
/// @ref load_snapshot, or built programmatically with @ref generate_scenario.
/// Every record in it has passed validation.
///
/// @ingroup io_loaders
/// @see load_scenario, load_snapshot, generate_scenario
struct ScenarioData {
    std::vector<core::SupplyRecord> supply;  ///< Sorted by period, one per period.
    std::vector<core::DemandOrder> orders;   ///< In input order, unique ids.
};

/// @brief Load a scenario from a JSON file.
///
/// Orders without a `priority_tier` (or `segment`) are classified through
/// @p master. Quantities must be non-negative integers (`qty_ordered`
/// positive), order ids and supply periods unique, and every order must end
/// up with a known tier.
///
/// @param path    Filesystem path to the JSON scenario file.
/// @param master  Customer master used for orders without a tier, or nullptr.
/// @return Parsed and validated scenario data.
///
/// @throws LoaderError  If the file cannot be read, contains invalid JSON, or
///                      fails validation.
///
/// @see load_scenario_from_string
ScenarioData load_scenario(const std::filesystem::path& path,
                           const CustomerMaster* master = nullptr);

/// @brief Load a scenario from a JSON string.
///
/// @param json    JSON content describing the scenario.
/// @param master  Customer master used for orders without a tier, or nullptr.
/// @return Parsed and validated scenario data.
///
/// @throws LoaderError  If the JSON is malformed or fails validation.
///
/// @see load_scenario
ScenarioData load_scenario_from_string(std::string_view json,
                                       const CustomerMaster* master = nullptr);

/// @brief Write a scenario to a JSON file.
/// @param scenario  The scenario data to serialise.
/// @param path      Destination file path.
/// @throws LoaderError  If the file cannot be opened.
/// @see write_scenario_to_stream
void write_scenario(const ScenarioData& scenario, const std::filesystem::path& path);

/// @brief Write a scenario to an output stream.
///
/// The output is accepted by @ref load_scenario_from_string; orders that
/// already received units keep them through `qty_allocated`.
///
/// @param scenario  The scenario data to serialise.
/// @param out       Output stream (file, stringstream, stdout, etc.).
void write_scenario_to_stream(const ScenarioData& scenario, std::ostream& out);

/// @brief Check cross-record rules on an assembled scenario.
///
/// Sorts supply by period and rejects duplicate supply periods and
/// duplicate order ids.
///
/// @param scenario  Scenario to check (supply is sorted in place).
/// @throws LoaderError  On the first violation.
void validate_scenario(ScenarioData& scenario);

} // namespace allocsim::io
