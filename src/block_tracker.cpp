#include "block_tracker.hpp"
#include "stream_error.hpp"

using json = nlohmann::json;

namespace msgstream {

BlockKind block_kind_from_string(const std::string& type) {
    if (type == "text") return BlockKind::Text;
    if (type == "thinking") return BlockKind::Reasoning;
    if (type == "redacted_thinking") return BlockKind::RedactedReasoning;
    if (type == "tool_use") return BlockKind::ToolCall;
    if (type == "server_tool_use") return BlockKind::ProviderToolCall;
    if (type == "mcp_tool_use") return BlockKind::McpToolUse;
    if (type == "mcp_tool_result") return BlockKind::McpToolResult;
    return BlockKind::Opaque;
}

const char* block_kind_to_string(BlockKind kind) {
    switch (kind) {
        case BlockKind::Text: return "text";
        case BlockKind::Reasoning: return "reasoning";
        case BlockKind::RedactedReasoning: return "redacted-reasoning";
        case BlockKind::ToolCall: return "tool-call";
        case BlockKind::ProviderToolCall: return "provider-tool-call";
        case BlockKind::McpToolUse: return "mcp-tool-use";
        case BlockKind::McpToolResult: return "mcp-tool-result";
        case BlockKind::Opaque: return "opaque";
    }
    return "opaque";
}

// ── BlockState ──────────────────────────────────────────────────

BlockState BlockState::tool_call(std::string id, std::string name,
                                 const json& initial_input) {
    BlockState block(BlockKind::ToolCall);
    block.tool_call_id_ = std::move(id);
    block.emitted_tool_name_ = std::move(name);
    if (initial_input.is_object() && !initial_input.empty()) {
        block.buffer_ = initial_input.dump();
        block.first_fragment_ = false;
        block.prepopulated_ = true;
    }
    return block;
}

BlockState BlockState::provider_tool_call(std::string id, std::string display_name,
                                          std::string raw_name, bool inject_type) {
    BlockState block(BlockKind::ProviderToolCall);
    block.tool_call_id_ = std::move(id);
    block.emitted_tool_name_ = std::move(display_name);
    block.provider_tool_name_ = std::move(raw_name);
    block.inject_type_ = inject_type;
    return block;
}

static bool is_json_space(char c) {
    return c == ' ' || c == '\t' || c == '\r' || c == '\n';
}

bool BlockState::append_fragment(const std::string& fragment, size_t max_bytes) {
    // Some providers split the opening character into its own otherwise
    // empty delta; empty fragments must never consume the first-fragment slot.
    if (fragment.empty() || prepopulated_) return false;

    std::string piece;
    if (first_fragment_ && inject_type_ && fragment[0] == '{') {
        piece = "{\"type\":" + json(provider_tool_name_).dump();
        std::string rest = fragment.substr(1);
        size_t first = rest.find_first_not_of(" \t\r\n");
        if (first == std::string::npos) {
            // Nothing after the brace yet: the separator depends on what follows
            separator_pending_ = true;
        } else if (rest[first] != '}') {
            piece += ',';
        }
        piece += rest;
    } else if (separator_pending_) {
        size_t first = 0;
        while (first < fragment.size() && is_json_space(fragment[first])) ++first;
        if (first < fragment.size()) {
            if (fragment[first] != '}') piece += ',';
            separator_pending_ = false;
        }
        piece += fragment;
    } else {
        piece = fragment;
    }
    first_fragment_ = false;

    if (max_bytes > 0 && buffer_.size() + piece.size() > max_bytes) {
        throw StreamError(StreamError::Kind::MalformedToolArguments,
                          "tool call arguments for \"" + emitted_tool_name_ +
                          "\" exceed " + std::to_string(max_bytes) + " bytes",
                          "", emitted_tool_name_);
    }
    buffer_ += piece;
    return true;
}

json BlockState::finalize_arguments() const {
    if (buffer_.empty()) return json::object();

    json args;
    try {
        args = json::parse(buffer_);
    } catch (const json::parse_error& e) {
        throw StreamError(StreamError::Kind::MalformedToolArguments,
                          "failed to parse tool call arguments for \"" +
                          emitted_tool_name_ + "\": " + e.what(),
                          "", emitted_tool_name_);
    }
    if (!args.is_object()) {
        throw StreamError(StreamError::Kind::MalformedToolArguments,
                          "tool call arguments for \"" + emitted_tool_name_ +
                          "\" are not a JSON object",
                          "", emitted_tool_name_);
    }
    return args;
}

// ── BlockTracker ────────────────────────────────────────────────

BlockState& BlockTracker::open(int64_t index, BlockState state) {
    auto& slot = blocks_[index];
    slot = std::move(state);
    return slot;
}

BlockState* BlockTracker::find(int64_t index) {
    auto it = blocks_.find(index);
    if (it == blocks_.end()) return nullptr;
    return &it->second;
}

std::optional<BlockState> BlockTracker::close(int64_t index) {
    auto it = blocks_.find(index);
    if (it == blocks_.end()) return std::nullopt;
    BlockState state = std::move(it->second);
    blocks_.erase(it);
    return state;
}

} // namespace msgstream
