#pragma once

/// @file customer_master.hpp
/// @brief Customer-to-tier master data used to classify incoming orders.
/// @ingroup io_loaders

#include <allocsim/core/priority_tier.hpp>

#include <cstddef>
#include <filesystem>
#include <istream>
#include <map>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace allocsim::io {

/// @brief Master data of one customer.
/// @ingroup io_loaders
struct CustomerEntry {
    std::string customer;                           ///< Customer name (lookup key).
    core::PriorityTier tier{core::PriorityTier::P1};  ///< Fixed priority tier.
    std::string segment;                            ///< Market segment.

    bool operator==(const CustomerEntry& rhs) const = default;
};

/// @brief Lookup table from customer name to tier and segment.
///
/// Orders that do not carry their own tier are classified through this
/// table. A customer missing from it is a validation error, never a
/// default tier.
///
/// @ingroup io_loaders
/// @see load_customer_master, default_customer_master
class CustomerMaster {
public:
    CustomerMaster() = default;

    /// @brief Construct from a list of entries.
    /// @throws LoaderError on a duplicate customer name.
    explicit CustomerMaster(const std::vector<CustomerEntry>& entries);

    /// @brief Add one customer.
    /// @throws LoaderError if the customer is already present.
    void add(CustomerEntry entry);

    /// @brief Find a customer by name.
    /// @return Pointer to the entry, or nullptr if unknown.
    [[nodiscard]] const CustomerEntry* find(std::string_view customer) const;

    /// @brief Number of customers.
    [[nodiscard]] std::size_t size() const noexcept { return entries_.size(); }

    /// @brief True if the table is empty.
    [[nodiscard]] bool empty() const noexcept { return entries_.empty(); }

    /// @brief All entries, sorted by customer name.
    [[nodiscard]] std::vector<CustomerEntry> entries() const;

private:
    std::map<std::string, CustomerEntry, std::less<>> entries_;
};

/// @brief The eight-customer reference table used by the mock data generator.
/// @ingroup io_loaders
[[nodiscard]] CustomerMaster default_customer_master();

/// @brief Load a customer master from a CSV file.
///
/// Expects a header with the columns `Customer`, `Priority` and `Segment`
/// (in any order); Priority is the numeric tier rank or a tier label.
///
/// @param path  Path to the CSV file.
/// @return The loaded table.
/// @throws LoaderError if the file cannot be read, a column is missing, a
///         priority is not a tier, or a customer appears twice.
/// @ingroup io_loaders
[[nodiscard]] CustomerMaster load_customer_master(const std::filesystem::path& path);

/// @brief Load a customer master from a CSV stream.
/// @copydetails load_customer_master
[[nodiscard]] CustomerMaster load_customer_master_from_stream(std::istream& input);

/// @brief Write a customer master as CSV (`Customer,Priority,Segment`).
/// @ingroup io_loaders
void write_customer_master(const CustomerMaster& master, std::ostream& out);

} // namespace allocsim::io
