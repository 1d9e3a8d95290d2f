#include <allocsim/io/engine_config.hpp>
#include <allocsim/io/error.hpp>

#include <rapidjson/document.h>
#include <rapidjson/error/en.h>

#include <fstream>
#include <optional>
#include <sstream>
#include <string>
#include <utility>

namespace allocsim::io {

namespace {

bool get_bool_or(const rapidjson::Value& obj, const char* name, bool fallback) {
    if (!obj.HasMember(name)) {
        return fallback;
    }
    const auto& member = obj[name];
    if (!member.IsBool()) {
        throw LoaderError(std::string("field '") + name + "' must be a boolean", "config");
    }
    return member.GetBool();
}

std::string get_string(const rapidjson::Value& obj, const char* name, const std::string& context) {
    if (!obj.HasMember(name)) {
        throw LoaderError(std::string("missing required field '") + name + "'", context);
    }
    const auto& member = obj[name];
    if (!member.IsString()) {
        throw LoaderError(std::string("field '") + name + "' must be a string", context);
    }
    return {member.GetString(), member.GetStringLength()};
}

CustomerEntry parse_customer(const rapidjson::Value& obj, const std::string& context) {
    if (!obj.IsObject()) {
        throw LoaderError("must be an object", context);
    }
    CustomerEntry entry;
    entry.customer = get_string(obj, "customer", context);

    if (!obj.HasMember("priority_tier")) {
        throw LoaderError("missing required field 'priority_tier'", context);
    }
    const auto& tier = obj["priority_tier"];
    std::optional<core::PriorityTier> parsed;
    if (tier.IsInt64()) {
        parsed = core::tier_from_rank(tier.GetInt64());
    } else if (tier.IsString()) {
        parsed = core::parse_priority_tier({tier.GetString(), tier.GetStringLength()});
    }
    if (!parsed) {
        throw LoaderError("unknown priority_tier", context);
    }
    entry.tier = *parsed;

    if (obj.HasMember("segment")) {
        entry.segment = get_string(obj, "segment", context);
    }
    return entry;
}

} // anonymous namespace

EngineConfig load_engine_config_from_string(std::string_view json) {
    rapidjson::Document doc;
    doc.Parse(json.data(), json.size());

    if (doc.HasParseError()) {
        throw LoaderError(
            std::string("JSON parse error: ") + rapidjson::GetParseError_En(doc.GetParseError()),
            "at offset " + std::to_string(doc.GetErrorOffset()));
    }
    if (!doc.IsObject()) {
        throw LoaderError("root must be an object", "config");
    }

    EngineConfig config;
    config.lookahead = get_bool_or(doc, "lookahead", config.lookahead);
    config.carry_reservation = get_bool_or(doc, "carry_reservation", config.carry_reservation);

    if (doc.HasMember("customers")) {
        const auto& customers = doc["customers"];
        if (!customers.IsArray()) {
            throw LoaderError("field 'customers' must be an array", "config");
        }
        CustomerMaster master;
        for (rapidjson::SizeType idx = 0; idx < customers.Size(); ++idx) {
            master.add(parse_customer(customers[idx], "customers[" + std::to_string(idx) + "]"));
        }
        config.customers = std::move(master);
    }
    return config;
}

EngineConfig load_engine_config(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) {
        throw LoaderError("cannot open file", path.string());
    }

    std::ostringstream oss;
    oss << file.rdbuf();
    return load_engine_config_from_string(oss.str());
}

} // namespace allocsim::io
