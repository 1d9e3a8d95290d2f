#include <allocsim/io/csv_snapshot.hpp>
#include <allocsim/io/csv.hpp>
#include <allocsim/io/error.hpp>
#include <allocsim/io/period_label.hpp>

#include <allocsim/core/error.hpp>

#include <fstream>
#include <map>
#include <optional>
#include <system_error>
#include <utility>

namespace allocsim::io {

using namespace allocsim::core;

namespace {

Period parse_week(const std::string& text, const std::string& context) {
    auto period = parse_period(text);
    if (!period) {
        throw LoaderError("invalid week '" + text + "'", context);
    }
    return *period;
}

std::ofstream open_for_writing(const std::filesystem::path& path) {
    std::ofstream file(path);
    if (!file) {
        throw LoaderError("cannot open file for writing", path.string());
    }
    return file;
}

std::ifstream open_for_reading(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) {
        throw LoaderError("cannot open file", path.string());
    }
    return file;
}

} // anonymous namespace

std::vector<SupplyDelivery> read_supply_csv(std::istream& input, const std::string& context) {
    CsvTable table(input, context);
    auto col_week = table.column("week");
    auto col_date = table.column("delivery_date");
    auto col_product = table.column("product_type");
    auto col_quantity = table.column("quantity");

    std::vector<SupplyDelivery> result;
    result.reserve(table.rows().size());
    for (std::size_t idx = 0; idx < table.rows().size(); ++idx) {
        const auto& row = table.rows()[idx];
        auto ctx = table.row_context(idx);
        result.push_back(SupplyDelivery{
            parse_week(row[col_week], ctx),
            row[col_date],
            row[col_product],
            parse_quantity(row[col_quantity], "quantity", ctx),
        });
    }
    return result;
}

std::vector<DemandLine> read_demand_csv(std::istream& input, const std::string& context) {
    CsvTable table(input, context);
    auto col_week = table.column("week");
    auto col_date = table.column("delivery_date");
    auto col_order = table.column("order_id");
    auto col_customer = table.column("Customer");
    auto col_product = table.column("product_type");
    auto col_quantity = table.column("quantity");

    std::vector<DemandLine> result;
    result.reserve(table.rows().size());
    for (std::size_t idx = 0; idx < table.rows().size(); ++idx) {
        const auto& row = table.rows()[idx];
        auto ctx = table.row_context(idx);
        result.push_back(DemandLine{
            parse_week(row[col_week], ctx),
            row[col_date],
            row[col_order],
            row[col_customer],
            row[col_product],
            parse_quantity(row[col_quantity], "quantity", ctx),
        });
    }
    return result;
}

void write_supply_csv(const std::vector<SupplyDelivery>& rows, std::ostream& out) {
    out << "week,delivery_date,product_type,quantity\n";
    for (const auto& row : rows) {
        out << format_period(row.week) << ',' << csv_escape(row.delivery_date) << ','
            << csv_escape(row.product_type) << ',' << row.quantity << '\n';
    }
}

void write_demand_csv(const std::vector<DemandLine>& rows, std::ostream& out) {
    out << "week,delivery_date,order_id,Customer,product_type,quantity\n";
    for (const auto& row : rows) {
        out << format_period(row.week) << ',' << csv_escape(row.delivery_date) << ','
            << csv_escape(row.order_id) << ',' << csv_escape(row.customer) << ','
            << csv_escape(row.product_type) << ',' << row.quantity << '\n';
    }
}

std::vector<SupplyRecord> aggregate_supply(const std::vector<SupplyDelivery>& rows) {
    std::map<Period, SupplyRecord> weeks;
    for (const auto& row : rows) {
        bool is_a = row.product_type == SUBCOMPONENT_A_PRODUCT;
        bool is_b = row.product_type == SUBCOMPONENT_B_PRODUCT;
        if (!is_a && !is_b) {
            continue;
        }
        auto& record = weeks[row.week];
        record.period = row.week;
        if (is_a) {
            record.subcomponent_a_qty = checked_add(record.subcomponent_a_qty, row.quantity);
        } else {
            record.subcomponent_b_qty = checked_add(record.subcomponent_b_qty, row.quantity);
        }
    }

    std::vector<SupplyRecord> result;
    result.reserve(weeks.size());
    for (const auto& [week, record] : weeks) {
        result.push_back(record);
    }
    return result;
}

std::vector<DemandOrder> demand_orders(const std::vector<DemandLine>& rows,
                                       const CustomerMaster& master) {
    std::vector<DemandOrder> result;
    for (std::size_t idx = 0; idx < rows.size(); ++idx) {
        const auto& row = rows[idx];
        if (row.product_type != FINISHED_PRODUCT) {
            continue;
        }
        std::string ctx = "demand[" + std::to_string(idx) + "]";
        const auto* entry = master.find(row.customer);
        if (entry == nullptr) {
            throw LoaderError("customer '" + row.customer + "' is not in the customer master", ctx);
        }
        try {
            result.emplace_back(row.order_id, row.customer, entry->segment, entry->tier,
                                row.week, row.quantity);
        } catch (const ValidationError& e) {
            throw LoaderError(e.what(), ctx);
        }
    }
    return result;
}

ScenarioData build_scenario(const Snapshot& snapshot, const CustomerMaster& master) {
    ScenarioData result;
    try {
        result.supply = aggregate_supply(snapshot.supply);
    } catch (const OverflowError& e) {
        throw LoaderError(e.what(), "supply");
    }
    result.orders = demand_orders(snapshot.demand, master);
    validate_scenario(result);
    return result;
}

ScenarioData load_snapshot(const std::filesystem::path& supply_path,
                           const std::filesystem::path& demand_path,
                           const CustomerMaster& master) {
    Snapshot snapshot;
    {
        auto file = open_for_reading(supply_path);
        snapshot.supply = read_supply_csv(file, supply_path.string());
    }
    {
        auto file = open_for_reading(demand_path);
        snapshot.demand = read_demand_csv(file, demand_path.string());
    }
    return build_scenario(snapshot, master);
}

std::filesystem::path find_latest_snapshot(const std::filesystem::path& directory,
                                           std::string_view prefix) {
    std::error_code ec;
    std::filesystem::directory_iterator iter(directory, ec);
    if (ec) {
        throw LoaderError("cannot list directory: " + ec.message(), directory.string());
    }

    std::optional<std::pair<std::filesystem::file_time_type, std::filesystem::path>> latest;
    for (const auto& entry : iter) {
        if (!entry.is_regular_file()) {
            continue;
        }
        auto name = entry.path().filename().string();
        if (!name.starts_with(prefix) || entry.path().extension() != ".csv") {
            continue;
        }
        auto candidate = std::make_pair(entry.last_write_time(), entry.path());
        if (!latest || *latest < candidate) {
            latest = std::move(candidate);
        }
    }

    if (!latest) {
        throw LoaderError("no '" + std::string(prefix) + "*.csv' file found", directory.string());
    }
    return latest->second;
}

void write_snapshot(const Snapshot& snapshot, const CustomerMaster& master,
                    const std::filesystem::path& directory, std::string_view stamp) {
    std::error_code ec;
    std::filesystem::create_directories(directory, ec);
    if (ec) {
        throw LoaderError("cannot create directory: " + ec.message(), directory.string());
    }

    std::string suffix = std::string(stamp) + ".csv";
    {
        auto file = open_for_writing(directory / (std::string(SUPPLY_SNAPSHOT_PREFIX) + suffix));
        write_supply_csv(snapshot.supply, file);
    }
    {
        auto file = open_for_writing(directory / (std::string(DEMAND_SNAPSHOT_PREFIX) + suffix));
        write_demand_csv(snapshot.demand, file);
    }
    {
        auto file = open_for_writing(directory / std::string(MASTER_FILE_NAME));
        write_customer_master(master, file);
    }
}

} // namespace allocsim::io
