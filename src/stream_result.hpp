#pragma once
#include "chunk.hpp"
#include "usage.hpp"
#include <functional>
#include <string>
#include <vector>

namespace msgstream {

class StreamSession;

// Everything a drained session produced, in emission order per category
struct StreamResult {
    std::string text;
    std::string reasoning;
    std::vector<ToolCallComplete> tool_calls;
    FinishReason finish_reason = FinishReason::Other;
    Usage usage;
    bool finished = false; // a FinishSummary was received

    bool has_tool_calls() const { return !tool_calls.empty(); }
};

// Observes each chunk as it is decoded. Return false to stop draining.
using ChunkCallback = std::function<bool(const Chunk& chunk)>;

// Drain a session to end of stream (or until the callback returns false).
// Stream errors propagate to the caller.
StreamResult collect_stream(StreamSession& session, const ChunkCallback& on_chunk = {});

} // namespace msgstream
