#include "stream_result.hpp"
#include "stream_session.hpp"

namespace msgstream {

namespace {

struct ResultAppender {
    StreamResult& result;

    void operator()(const TextDelta& c) const { result.text += c.text; }
    void operator()(const ReasoningDelta& c) const { result.reasoning += c.text; }
    void operator()(const ToolCallComplete& c) const { result.tool_calls.push_back(c); }
    void operator()(const FinishSummary& c) const {
        result.finish_reason = c.reason;
        result.usage = c.usage;
        result.finished = true;
    }
};

} // namespace

StreamResult collect_stream(StreamSession& session, const ChunkCallback& on_chunk) {
    StreamResult result;
    while (auto chunk = session.next()) {
        std::visit(ResultAppender{result}, *chunk);
        if (on_chunk && !on_chunk(*chunk)) break;
    }
    return result;
}

} // namespace msgstream
