#pragma once
#include <nlohmann/json.hpp>
#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>

namespace msgstream {

enum class BlockKind {
    Text,
    Reasoning,
    RedactedReasoning,
    ToolCall,
    ProviderToolCall,
    McpToolUse,
    McpToolResult,
    Opaque
};

// Map a content_block.type string to a kind; unknown types are Opaque
BlockKind block_kind_from_string(const std::string& type);

const char* block_kind_to_string(BlockKind kind);

// Accumulation state for one open content block.
class BlockState {
public:
    BlockState() = default;
    explicit BlockState(BlockKind kind) : kind_(kind) {}

    // Client tool call. A non-empty initial input means the call arrived
    // whole and no argument fragments follow.
    static BlockState tool_call(std::string id, std::string name,
                                const nlohmann::json& initial_input);

    // Provider-executed tool call. display_name is surfaced; raw_name is kept
    // for the first-fragment framing fix.
    static BlockState provider_tool_call(std::string id, std::string display_name,
                                         std::string raw_name, bool inject_type);

    BlockKind kind() const { return kind_; }
    bool buffers_arguments() const {
        return kind_ == BlockKind::ToolCall || kind_ == BlockKind::ProviderToolCall;
    }
    bool prepopulated() const { return prepopulated_; }

    const std::string& tool_call_id() const { return tool_call_id_; }
    const std::string& emitted_tool_name() const { return emitted_tool_name_; }
    const std::string& provider_tool_name() const { return provider_tool_name_; }
    const std::string& buffer() const { return buffer_; }
    bool is_first_fragment() const { return first_fragment_; }

    // Append one argument fragment. Empty fragments are skipped and do not
    // count as the first fragment. Returns false if the fragment was skipped.
    // Throws StreamError when the buffer would exceed max_bytes (0 = no limit).
    bool append_fragment(const std::string& fragment, size_t max_bytes = 0);

    // Parse the accumulated buffer. Empty buffer yields {}. Throws
    // StreamError(MalformedToolArguments) naming the tool otherwise.
    nlohmann::json finalize_arguments() const;

private:
    BlockKind kind_ = BlockKind::Opaque;
    std::string tool_call_id_;
    std::string emitted_tool_name_;
    std::string provider_tool_name_;
    std::string buffer_;
    bool first_fragment_ = true;
    bool inject_type_ = false;
    bool separator_pending_ = false;
    bool prepopulated_ = false;
};

// Open blocks keyed by stream index. Each entry is owned by the tracker and
// mutated in place until its stop event removes it.
class BlockTracker {
public:
    // Opening an index that is already open replaces the old entry
    BlockState& open(int64_t index, BlockState state);

    BlockState* find(int64_t index);

    // Remove and return the entry; nullopt if the index was never opened
    std::optional<BlockState> close(int64_t index);

    size_t size() const { return blocks_.size(); }
    bool empty() const { return blocks_.empty(); }
    void clear() { blocks_.clear(); }

private:
    std::map<int64_t, BlockState> blocks_;
};

} // namespace msgstream
