#pragma once
#include "block_tracker.hpp"
#include "chunk.hpp"
#include "config.hpp"
#include "event_source.hpp"
#include "usage.hpp"
#include <nlohmann/json.hpp>
#include <deque>
#include <exception>
#include <optional>
#include <string>
#include <unordered_set>

namespace msgstream {

// Pull-driven decoder for one streamed completion.
//
// Each next() call either pops a chunk queued by an earlier event or pulls
// events from the source until one of them yields a chunk. Skippable events
// (ping, interim deltas, unknown types) are consumed in a loop, never by
// recursion. Not safe for concurrent next() calls; one consumer per session.
class StreamSession {
public:
    enum class State { Idle, AwaitingEvent, Finalizing, Eof, Error };

    explicit StreamSession(EventSource& source, StreamConfig config = {});

    // Next chunk, or nullopt once the stream has ended cleanly.
    // Throws StreamError on malformed input, or rethrows whatever the source
    // threw. Eof and Error are absorbing: later calls repeat the same outcome
    // without touching the source.
    std::optional<Chunk> next();

    State state() const { return state_; }
    size_t open_blocks() const { return blocks_.size(); }
    size_t pending_chunks() const { return pending_.size(); }
    const UsageAccumulator& usage() const { return usage_; }

private:
    // Each handler returns the chunk to emit, or nullopt to keep pulling
    std::optional<Chunk> dispatch(const RawEvent& ev);
    void on_message_start(const nlohmann::json& payload);
    std::optional<Chunk> on_block_start(const nlohmann::json& payload);
    std::optional<Chunk> on_block_delta(const nlohmann::json& payload);
    std::optional<Chunk> on_block_stop(const nlohmann::json& payload);
    std::optional<Chunk> on_message_delta(const nlohmann::json& payload);
    [[noreturn]] void on_error_event(const nlohmann::json& payload);

    // Applies the exactly-once rule per tool call id
    std::optional<Chunk> emit_tool_call(const std::string& id, const std::string& name,
                                        nlohmann::json arguments);

    void log_skip(const std::string& what) const;

    EventSource& source_;
    StreamConfig config_;
    BlockTracker blocks_;
    UsageAccumulator usage_;
    std::deque<Chunk> pending_;
    std::unordered_set<std::string> emitted_tool_ids_;
    State state_ = State::Idle;
    std::exception_ptr error_;
};

const char* session_state_to_string(StreamSession::State state);

} // namespace msgstream
