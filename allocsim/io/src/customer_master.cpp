#include <allocsim/io/customer_master.hpp>
#include <allocsim/io/csv.hpp>
#include <allocsim/io/error.hpp>

#include <fstream>

namespace allocsim::io {

using core::PriorityTier;

CustomerMaster::CustomerMaster(const std::vector<CustomerEntry>& entries) {
    for (const auto& entry : entries) {
        add(entry);
    }
}

void CustomerMaster::add(CustomerEntry entry) {
    std::string key = entry.customer;
    if (key.empty()) {
        throw LoaderError("customer name must not be empty", "customer master");
    }
    if (!entries_.emplace(key, std::move(entry)).second) {
        throw LoaderError("duplicate customer '" + key + "'", "customer master");
    }
}

const CustomerEntry* CustomerMaster::find(std::string_view customer) const {
    auto iter = entries_.find(customer);
    return iter == entries_.end() ? nullptr : &iter->second;
}

std::vector<CustomerEntry> CustomerMaster::entries() const {
    std::vector<CustomerEntry> result;
    result.reserve(entries_.size());
    for (const auto& [name, entry] : entries_) {
        result.push_back(entry);
    }
    return result;
}

CustomerMaster default_customer_master() {
    return CustomerMaster({
        {"Microsoft", PriorityTier::P1, "Data Center"},
        {"Meta",      PriorityTier::P1, "Data Center"},
        {"Tesla",     PriorityTier::P2, "Automotive"},
        {"Siemens",   PriorityTier::P3, "Healthcare"},
        {"Foxconn",   PriorityTier::P4, "Industrial"},
        {"Dell",      PriorityTier::P5, "Pro Viz"},
        {"ASUS",      PriorityTier::P7, "Gaming OEM"},
        {"Best Buy",  PriorityTier::P9, "Gaming Retail"},
    });
}

CustomerMaster load_customer_master_from_stream(std::istream& input) {
    CsvTable table(input, "customer master");
    auto col_customer = table.column("Customer");
    auto col_priority = table.column("Priority");
    auto col_segment = table.column("Segment");

    CustomerMaster master;
    for (std::size_t idx = 0; idx < table.rows().size(); ++idx) {
        const auto& row = table.rows()[idx];
        auto tier = core::parse_priority_tier(row[col_priority]);
        if (!tier) {
            throw LoaderError("unknown priority tier '" + row[col_priority] + "'",
                              table.row_context(idx));
        }
        master.add(CustomerEntry{row[col_customer], *tier, row[col_segment]});
    }
    return master;
}

CustomerMaster load_customer_master(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) {
        throw LoaderError("cannot open file", path.string());
    }
    return load_customer_master_from_stream(file);
}

void write_customer_master(const CustomerMaster& master, std::ostream& out) {
    out << "Customer,Priority,Segment\n";
    for (const auto& entry : master.entries()) {
        out << csv_escape(entry.customer) << ',' << core::tier_rank(entry.tier) << ','
            << csv_escape(entry.segment) << '\n';
    }
}

} // namespace allocsim::io
