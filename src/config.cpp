#include "config.hpp"
#include "util.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>

namespace msgstream {

nlohmann::json StreamConfig::defaults_json() {
    return {
        {"log_skipped_events", false},
        {"max_tool_input_bytes", 0},
        {"server_tools", nlohmann::json::object()}
    };
}

static nlohmann::json merge_defaults(const nlohmann::json& existing,
                                      const nlohmann::json& defaults) {
    nlohmann::json merged = existing;
    for (auto& [key, value] : defaults.items()) {
        if (!merged.contains(key)) {
            merged[key] = value;
        } else if (value.is_object() && merged[key].is_object()) {
            merged[key] = merge_defaults(merged[key], value);
        }
    }
    return merged;
}

StreamConfig StreamConfig::from_json(const nlohmann::json& input) {
    StreamConfig cfg;
    if (!input.is_object()) return cfg;

    nlohmann::json j = merge_defaults(input, defaults_json());

    if (j["log_skipped_events"].is_boolean())
        cfg.log_skipped_events = j["log_skipped_events"].get<bool>();
    const auto& max_bytes = j["max_tool_input_bytes"];
    if (max_bytes.is_number_unsigned() ||
        (max_bytes.is_number_integer() && max_bytes.get<int64_t>() >= 0))
        cfg.max_tool_input_bytes = max_bytes.get<uint64_t>();

    // Configured rules extend or override the built-in table
    if (j["server_tools"].is_object()) {
        for (auto& [raw_name, obj] : j["server_tools"].items()) {
            if (!obj.is_object()) continue;
            ServerToolRule rule;
            rule.display_name = raw_name;
            if (obj.contains("display_name") && obj["display_name"].is_string())
                rule.display_name = obj["display_name"].get<std::string>();
            if (obj.contains("inject_type") && obj["inject_type"].is_boolean())
                rule.inject_type = obj["inject_type"].get<bool>();
            cfg.server_tools.set_rule(raw_name, std::move(rule));
        }
    }

    return cfg;
}

StreamConfig StreamConfig::load() {
    return load(expand_home("~/.msgstream/config.json"));
}

StreamConfig StreamConfig::load(const std::string& path) {
    StreamConfig cfg;

    std::ifstream file(path);
    if (file.is_open()) {
        try {
            cfg = from_json(nlohmann::json::parse(file));
        } catch (const nlohmann::json::exception& e) {
            std::cerr << "[config] Ignoring malformed config " << path
                      << ": " << e.what() << "\n";
        }
    }

    cfg.apply_env_overrides();
    return cfg;
}

void StreamConfig::apply_env_overrides() {
    if (const char* v = std::getenv("MSGSTREAM_LOG_SKIPPED")) {
        std::string s = trim(v);
        log_skipped_events = (s == "1" || s == "true" || s == "yes");
    }
    if (const char* v = std::getenv("MSGSTREAM_MAX_TOOL_INPUT_BYTES")) {
        try {
            max_tool_input_bytes = std::stoull(trim(v));
        } catch (const std::exception&) {
            std::cerr << "[config] Ignoring invalid MSGSTREAM_MAX_TOOL_INPUT_BYTES: "
                      << v << "\n";
        }
    }
}

} // namespace msgstream
