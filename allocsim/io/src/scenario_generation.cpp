#include <allocsim/io/scenario_generation.hpp>

#include <allocsim/core/error.hpp>

#include <cstdint>
#include <cstdio>
#include <string>
#include <unordered_set>
#include <utility>
#include <vector>

namespace allocsim::io {

using namespace std::chrono;
using core::Period;
using core::Quantity;

namespace {

constexpr Period WEEK_KEY_FACTOR = 100;
constexpr uint32_t ORDER_ID_SPACE = 0xFFFFFF;

Quantity draw_quantity(Quantity min_val, Quantity max_val, std::mt19937& rng) {
    std::uniform_int_distribution<Quantity> dist(min_val, max_val - 1);
    return dist(rng);
}

std::string unique_order_id(std::unordered_set<uint32_t>& used, std::mt19937& rng) {
    std::uniform_int_distribution<uint32_t> dist(0, ORDER_ID_SPACE);
    uint32_t value = dist(rng);
    while (!used.insert(value).second) {
        value = dist(rng);
    }
    char buffer[16];
    std::snprintf(buffer, sizeof(buffer), "ORD-%06X", static_cast<unsigned>(value));
    return buffer;
}

} // anonymous namespace

sys_days iso_week_monday(Period week_key) {
    auto iso_year = static_cast<int>(week_key / WEEK_KEY_FACTOR);
    auto week = static_cast<int>(week_key % WEEK_KEY_FACTOR);
    if (week < 1 || week > 53 || iso_year < 1000 || iso_year > 9999) {
        throw core::ValidationError("not an ISO week key: " + std::to_string(week_key));
    }

    // January 4th always lies in ISO week 1.
    sys_days jan4{year{iso_year} / January / 4};
    sys_days monday = jan4 - days{weekday{jan4}.iso_encoding() - 1} + weeks{week - 1};
    if (iso_week_key(monday) != week_key) {
        throw core::ValidationError("ISO year " + std::to_string(iso_year) + " has no week " +
                                    std::to_string(week));
    }
    return monday;
}

Period iso_week_key(sys_days day) {
    // The ISO year is the year of the week's Thursday.
    sys_days thursday = day + days{4 - static_cast<int>(weekday{day}.iso_encoding())};
    year_month_day ymd{thursday};
    sys_days jan1{ymd.year() / January / 1};
    Period week = (thursday - jan1).count() / 7 + 1;
    return static_cast<Period>(static_cast<int>(ymd.year())) * WEEK_KEY_FACTOR + week;
}

std::string format_date(sys_days day) {
    year_month_day ymd{day};
    char buffer[16];
    std::snprintf(buffer, sizeof(buffer), "%04d-%02u-%02u", static_cast<int>(ymd.year()),
                  static_cast<unsigned>(ymd.month()), static_cast<unsigned>(ymd.day()));
    return buffer;
}

Snapshot generate_snapshot(const GenerationParams& params, std::mt19937& rng) {
    if (params.master.empty()) {
        throw core::ValidationError("customer master is empty");
    }
    if (params.daily_probability < 0.0 || params.daily_probability > 1.0) {
        throw core::ValidationError("daily probability must lie in [0, 1]");
    }

    sys_days first_day = iso_week_monday(params.first_week);
    std::vector<CustomerEntry> customers = params.master.entries();

    std::uniform_real_distribution<double> chance(0.0, 1.0);
    std::uniform_int_distribution<std::size_t> pick_customer(0, customers.size() - 1);
    std::unordered_set<uint32_t> used_ids;

    Snapshot snapshot;
    auto total_days = static_cast<int>(params.weeks * 7);
    for (int offset = 0; offset < total_days; ++offset) {
        sys_days day = first_day + days{offset};
        Period week = iso_week_key(day);
        std::string date = format_date(day);

        if (chance(rng) < params.daily_probability) {
            snapshot.supply.push_back(SupplyDelivery{
                week, date, std::string(SUBCOMPONENT_A_PRODUCT),
                draw_quantity(SUBCOMPONENT_A_MIN, SUBCOMPONENT_A_MAX, rng)});
        }
        if (chance(rng) < params.daily_probability) {
            snapshot.supply.push_back(SupplyDelivery{
                week, date, std::string(SUBCOMPONENT_B_PRODUCT),
                draw_quantity(SUBCOMPONENT_B_MIN, SUBCOMPONENT_B_MAX, rng)});
        }
        if (chance(rng) < params.daily_probability) {
            const auto& customer = customers[pick_customer(rng)];
            std::string order_id = unique_order_id(used_ids, rng);
            snapshot.demand.push_back(DemandLine{
                week, date, std::move(order_id), customer.customer,
                std::string(FINISHED_PRODUCT),
                draw_quantity(ORDER_MIN, ORDER_MAX, rng)});
        }
    }
    return snapshot;
}

ScenarioData generate_scenario(const GenerationParams& params, std::mt19937& rng) {
    return build_scenario(generate_snapshot(params, rng), params.master);
}

} // namespace allocsim::io
