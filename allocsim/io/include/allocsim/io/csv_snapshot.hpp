#pragma once

/// @file csv_snapshot.hpp
/// @brief Reading and writing the CSV snapshot exports (supply, demand, master).
/// @ingroup io_loaders

#include <allocsim/io/customer_master.hpp>
#include <allocsim/io/scenario_loader.hpp>

#include <allocsim/core/demand_order.hpp>
#include <allocsim/core/supply_record.hpp>
#include <allocsim/core/types.hpp>

#include <filesystem>
#include <istream>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace allocsim::io {

/// @name Snapshot file conventions
/// @{
inline constexpr std::string_view SUPPLY_SNAPSHOT_PREFIX = "supply_data_";
inline constexpr std::string_view DEMAND_SNAPSHOT_PREFIX = "demand_data_";
inline constexpr std::string_view MASTER_FILE_NAME = "master_customer_tiers.csv";
/// @}

/// @name Product types of the exports
/// @{
inline constexpr std::string_view SUBCOMPONENT_A_PRODUCT = "Subcomponent_1";
inline constexpr std::string_view SUBCOMPONENT_B_PRODUCT = "Subcomponent_2";
inline constexpr std::string_view FINISHED_PRODUCT = "Advanced_Chip";
/// @}

/// @brief One row of a supply export: a delivery of one subcomponent.
/// @ingroup io_loaders
struct SupplyDelivery {
    core::Period week{0};
    std::string delivery_date;
    std::string product_type;
    core::Quantity quantity{0};

    bool operator==(const SupplyDelivery& rhs) const = default;
};

/// @brief One row of a demand export: a customer order line.
/// @ingroup io_loaders
struct DemandLine {
    core::Period week{0};
    std::string delivery_date;
    std::string order_id;
    std::string customer;
    std::string product_type;
    core::Quantity quantity{0};

    bool operator==(const DemandLine& rhs) const = default;
};

/// @brief Raw contents of a supply and a demand export.
/// @ingroup io_loaders
struct Snapshot {
    std::vector<SupplyDelivery> supply;
    std::vector<DemandLine> demand;
};

/// @brief Parse a supply export (`week,delivery_date,product_type,quantity`).
/// @throws LoaderError on a missing column, bad week label or bad quantity.
[[nodiscard]] std::vector<SupplyDelivery> read_supply_csv(std::istream& input,
                                                          const std::string& context);

/// @brief Parse a demand export
///        (`week,delivery_date,order_id,Customer,product_type,quantity`).
/// @throws LoaderError on a missing column, bad week label or bad quantity.
[[nodiscard]] std::vector<DemandLine> read_demand_csv(std::istream& input,
                                                      const std::string& context);

/// @brief Write a supply export in the upstream column order.
void write_supply_csv(const std::vector<SupplyDelivery>& rows, std::ostream& out);

/// @brief Write a demand export in the upstream column order.
void write_demand_csv(const std::vector<DemandLine>& rows, std::ostream& out);

/// @brief Sum deliveries per week into supply records.
///
/// Subcomponent_1 counts as subcomponent A and Subcomponent_2 as B; other
/// product types are ignored. A week with deliveries of only one
/// subcomponent gets zero of the other.
///
/// @throws OverflowError if a weekly sum overflows.
[[nodiscard]] std::vector<core::SupplyRecord> aggregate_supply(const std::vector<SupplyDelivery>& rows);

/// @brief Turn the finished-product lines of a demand export into orders.
///
/// Tier and segment come from @p master. Lines of other product types are
/// skipped.
///
/// @throws LoaderError if a customer is not in @p master or a quantity is zero.
[[nodiscard]] std::vector<core::DemandOrder> demand_orders(const std::vector<DemandLine>& rows,
                                                           const CustomerMaster& master);

/// @brief Build a validated scenario from raw exports.
/// @throws LoaderError on any validation failure.
[[nodiscard]] ScenarioData build_scenario(const Snapshot& snapshot, const CustomerMaster& master);

/// @brief Load a scenario from a supply export and a demand export.
/// @throws LoaderError if a file cannot be read or fails validation.
[[nodiscard]] ScenarioData load_snapshot(const std::filesystem::path& supply_path,
                                         const std::filesystem::path& demand_path,
                                         const CustomerMaster& master);

/// @brief Most recently written `<prefix>*.csv` file in @p directory.
///
/// Ties on modification time are broken by file name, later name wins.
///
/// @throws LoaderError if the directory cannot be listed or holds no match.
[[nodiscard]] std::filesystem::path find_latest_snapshot(const std::filesystem::path& directory,
                                                         std::string_view prefix);

/// @brief Write a snapshot as `supply_data_<stamp>.csv`,
///        `demand_data_<stamp>.csv` and the master file into @p directory.
/// @throws LoaderError if a file cannot be written.
void write_snapshot(const Snapshot& snapshot, const CustomerMaster& master,
                    const std::filesystem::path& directory, std::string_view stamp);

} // namespace allocsim::io
