#include "chunk.hpp"

using json = nlohmann::json;

namespace msgstream {

FinishReason map_stop_reason(const std::string& raw) {
    if (raw == "end_turn" || raw == "stop_sequence") return FinishReason::Stop;
    if (raw == "max_tokens") return FinishReason::LengthLimit;
    if (raw == "tool_use") return FinishReason::ToolCalls;
    return FinishReason::Other;
}

const char* finish_reason_to_string(FinishReason reason) {
    switch (reason) {
        case FinishReason::Stop: return "stop";
        case FinishReason::LengthLimit: return "length";
        case FinishReason::ToolCalls: return "tool-calls";
        case FinishReason::Other: return "other";
    }
    return "other";
}

namespace {

struct ChunkRenderer {
    json operator()(const TextDelta& c) const {
        return {{"type", "text"}, {"text", c.text}};
    }
    json operator()(const ReasoningDelta& c) const {
        return {{"type", "reasoning"}, {"text", c.text}};
    }
    json operator()(const ToolCallComplete& c) const {
        return {{"type", "tool-call"}, {"id", c.id}, {"name", c.name},
                {"arguments", c.arguments}};
    }
    json operator()(const FinishSummary& c) const {
        return {{"type", "finish"},
                {"reason", finish_reason_to_string(c.reason)},
                {"usage", usage_to_json(c.usage)}};
    }
};

} // namespace

json chunk_to_json(const Chunk& chunk) {
    return std::visit(ChunkRenderer{}, chunk);
}

} // namespace msgstream
