#include <allocsim/io/scenario_loader.hpp>
#include <allocsim/io/customer_master.hpp>
#include <allocsim/io/error.hpp>
#include <allocsim/io/period_label.hpp>

#include <allocsim/core/error.hpp>

#include <rapidjson/document.h>
#include <rapidjson/error/en.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#include <algorithm>
#include <fstream>
#include <optional>
#include <sstream>
#include <string>
#include <unordered_set>

namespace allocsim::io {

using namespace allocsim::core;

namespace {

// Helper to get required member with error context
template<typename T>
const T& get_member(const rapidjson::Value& obj, const char* name, const std::string& context) {
    if (!obj.HasMember(name)) {
        throw LoaderError(std::string("missing required field '") + name + "'", context);
    }
    return obj[name];
}

uint64_t get_uint64(const rapidjson::Value& val, const char* name, const std::string& context) {
    const auto& member = get_member<rapidjson::Value>(val, name, context);
    if (!member.IsUint64()) {
        throw LoaderError(std::string("field '") + name + "' must be a non-negative integer", context);
    }
    return member.GetUint64();
}

std::string get_string(const rapidjson::Value& val, const char* name, const std::string& context) {
    const auto& member = get_member<rapidjson::Value>(val, name, context);
    if (!member.IsString()) {
        throw LoaderError(std::string("field '") + name + "' must be a string", context);
    }
    return {member.GetString(), member.GetStringLength()};
}

Period get_period(const rapidjson::Value& val, const char* name, const std::string& context) {
    const auto& member = get_member<rapidjson::Value>(val, name, context);
    if (member.IsInt64()) {
        return member.GetInt64();
    }
    if (member.IsString()) {
        if (auto period = parse_period({member.GetString(), member.GetStringLength()})) {
            return *period;
        }
    }
    throw LoaderError(std::string("field '") + name + "' must be an integer or a week label", context);
}

std::optional<PriorityTier> get_tier_or_none(const rapidjson::Value& val, const std::string& context) {
    if (!val.HasMember("priority_tier")) {
        return std::nullopt;
    }
    const auto& member = val["priority_tier"];
    std::optional<PriorityTier> tier;
    if (member.IsInt64()) {
        tier = tier_from_rank(member.GetInt64());
    } else if (member.IsString()) {
        tier = parse_priority_tier({member.GetString(), member.GetStringLength()});
    }
    if (!tier) {
        throw LoaderError("unknown priority_tier", context);
    }
    return tier;
}

void parse_supply(ScenarioData& result, const rapidjson::Document& doc) {
    if (!doc.HasMember("supply")) {
        return;
    }
    const auto& supply = doc["supply"];
    if (!supply.IsArray()) {
        throw LoaderError("field 'supply' must be an array", "scenario");
    }

    for (rapidjson::SizeType idx = 0; idx < supply.Size(); ++idx) {
        const auto& obj = supply[idx];
        std::string ctx = "supply[" + std::to_string(idx) + "]";
        if (!obj.IsObject()) {
            throw LoaderError("must be an object", ctx);
        }
        SupplyRecord record;
        record.period = get_period(obj, "period", ctx);
        record.subcomponent_a_qty = get_uint64(obj, "subcomponent_a", ctx);
        record.subcomponent_b_qty = get_uint64(obj, "subcomponent_b", ctx);
        result.supply.push_back(record);
    }
}

void parse_orders(ScenarioData& result, const rapidjson::Document& doc, const CustomerMaster* master) {
    if (!doc.HasMember("orders")) {
        return;
    }
    const auto& orders = doc["orders"];
    if (!orders.IsArray()) {
        throw LoaderError("field 'orders' must be an array", "scenario");
    }

    for (rapidjson::SizeType idx = 0; idx < orders.Size(); ++idx) {
        const auto& obj = orders[idx];
        std::string ctx = "orders[" + std::to_string(idx) + "]";
        if (!obj.IsObject()) {
            throw LoaderError("must be an object", ctx);
        }

        std::string order_id = get_string(obj, "order_id", ctx);
        std::string customer = get_string(obj, "customer_id", ctx);
        Period period = get_period(obj, "period_requested", ctx);
        Quantity qty_ordered = get_uint64(obj, "qty_ordered", ctx);
        Quantity qty_allocated = obj.HasMember("qty_allocated")
            ? get_uint64(obj, "qty_allocated", ctx) : 0;

        const CustomerEntry* entry = master != nullptr ? master->find(customer) : nullptr;

        auto tier = get_tier_or_none(obj, ctx);
        if (!tier) {
            if (entry == nullptr) {
                throw LoaderError("no priority_tier and customer '" + customer +
                                      "' is not in the customer master", ctx);
            }
            tier = entry->tier;
        }

        std::string segment;
        if (obj.HasMember("segment")) {
            segment = get_string(obj, "segment", ctx);
        } else if (entry != nullptr) {
            segment = entry->segment;
        }

        try {
            result.orders.emplace_back(std::move(order_id), std::move(customer), std::move(segment),
                                       *tier, period, qty_ordered, qty_allocated);
        } catch (const ValidationError& e) {
            throw LoaderError(e.what(), ctx);
        }
    }
}

} // anonymous namespace

void validate_scenario(ScenarioData& scenario) {
    std::sort(scenario.supply.begin(), scenario.supply.end(),
        [](const SupplyRecord& lhs, const SupplyRecord& rhs) {
            return lhs.period < rhs.period;
        });
    for (std::size_t idx = 1; idx < scenario.supply.size(); ++idx) {
        if (scenario.supply[idx].period == scenario.supply[idx - 1].period) {
            throw LoaderError("duplicate supply record for period " +
                                  std::to_string(scenario.supply[idx].period), "supply");
        }
    }

    std::unordered_set<std::string> ids;
    for (const auto& order : scenario.orders) {
        if (!ids.insert(order.order_id()).second) {
            throw LoaderError("duplicate order_id '" + order.order_id() + "'", "orders");
        }
    }
}

ScenarioData load_scenario(const std::filesystem::path& path, const CustomerMaster* master) {
    std::ifstream file(path);
    if (!file) {
        throw LoaderError("cannot open file", path.string());
    }

    std::ostringstream oss;
    oss << file.rdbuf();
    return load_scenario_from_string(oss.str(), master);
}

ScenarioData load_scenario_from_string(std::string_view json, const CustomerMaster* master) {
    rapidjson::Document doc;
    doc.Parse(json.data(), json.size());

    if (doc.HasParseError()) {
        throw LoaderError(
            std::string("JSON parse error: ") + rapidjson::GetParseError_En(doc.GetParseError()),
            "at offset " + std::to_string(doc.GetErrorOffset()));
    }

    if (!doc.IsObject()) {
        throw LoaderError("root must be an object", "scenario");
    }

    ScenarioData result;
    parse_supply(result, doc);
    parse_orders(result, doc, master);
    validate_scenario(result);
    return result;
}

void write_scenario_to_stream(const ScenarioData& scenario, std::ostream& out) {
    rapidjson::StringBuffer buffer;
    rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);

    writer.StartObject();

    writer.Key("supply");
    writer.StartArray();
    for (const auto& record : scenario.supply) {
        writer.StartObject();
        writer.Key("period");
        writer.Int64(record.period);
        writer.Key("subcomponent_a");
        writer.Uint64(record.subcomponent_a_qty);
        writer.Key("subcomponent_b");
        writer.Uint64(record.subcomponent_b_qty);
        writer.EndObject();
    }
    writer.EndArray();

    writer.Key("orders");
    writer.StartArray();
    for (const auto& order : scenario.orders) {
        writer.StartObject();
        writer.Key("order_id");
        writer.String(order.order_id().c_str(),
                      static_cast<rapidjson::SizeType>(order.order_id().size()));
        writer.Key("customer_id");
        writer.String(order.customer_id().c_str(),
                      static_cast<rapidjson::SizeType>(order.customer_id().size()));
        writer.Key("segment");
        writer.String(order.segment().c_str(),
                      static_cast<rapidjson::SizeType>(order.segment().size()));
        writer.Key("priority_tier");
        auto tier = to_string(order.priority_tier());
        writer.String(tier.data(), static_cast<rapidjson::SizeType>(tier.size()));
        writer.Key("period_requested");
        writer.Int64(order.period_requested());
        writer.Key("qty_ordered");
        writer.Uint64(order.qty_ordered());
        if (order.qty_allocated() > 0) {
            writer.Key("qty_allocated");
            writer.Uint64(order.qty_allocated());
        }
        writer.EndObject();
    }
    writer.EndArray();

    writer.EndObject();

    out << buffer.GetString();
}

void write_scenario(const ScenarioData& scenario, const std::filesystem::path& path) {
    std::ofstream file(path);
    if (!file) {
        throw LoaderError("cannot open file for writing", path.string());
    }
    write_scenario_to_stream(scenario, file);
}

} // namespace allocsim::io
