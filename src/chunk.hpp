#pragma once
#include "usage.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <variant>

namespace msgstream {

enum class FinishReason { Stop, LengthLimit, ToolCalls, Other };

struct TextDelta {
    std::string text;
};

struct ReasoningDelta {
    std::string text;
};

struct ToolCallComplete {
    std::string id;
    std::string name;
    nlohmann::json arguments = nlohmann::json::object(); // always an object
};

struct FinishSummary {
    FinishReason reason = FinishReason::Other;
    Usage usage;
};

// One semantic unit decoded from the stream
using Chunk = std::variant<TextDelta, ReasoningDelta, ToolCallComplete, FinishSummary>;

// Map a provider stop_reason to the canonical set
FinishReason map_stop_reason(const std::string& raw);

const char* finish_reason_to_string(FinishReason reason);

// Debug/CLI rendering of a chunk, e.g. {"type":"text","text":"hi"}
nlohmann::json chunk_to_json(const Chunk& chunk);

} // namespace msgstream
