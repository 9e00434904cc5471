#pragma once
#include "providers/server_tools.hpp"
#include <string>
#include <cstdint>
#include <nlohmann/json.hpp>

namespace msgstream {

struct StreamConfig {
    // Log unknown events, unknown kinds and dropped fragments to stderr
    bool log_skipped_events = false;

    // Upper bound on one tool call's accumulated arguments (0 = unlimited)
    uint64_t max_tool_input_bytes = 0;

    // Provider tool rules; built-ins plus any configured "server_tools"
    ServerToolTable server_tools = ServerToolTable::with_builtins();

    // Load from ~/.msgstream/config.json + env vars
    static StreamConfig load();

    // Load from an explicit path + env vars. A missing or malformed file
    // falls back to defaults.
    static StreamConfig load(const std::string& path);

    // Build from parsed JSON; missing keys take defaults, wrong types are ignored
    static StreamConfig from_json(const nlohmann::json& j);

    // Default config JSON (used by from_json() and tests)
    static nlohmann::json defaults_json();

    // MSGSTREAM_LOG_SKIPPED, MSGSTREAM_MAX_TOOL_INPUT_BYTES
    void apply_env_overrides();
};

} // namespace msgstream
