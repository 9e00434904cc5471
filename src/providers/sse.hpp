#pragma once
#include <string>
#include <functional>

namespace msgstream {

struct SSEEvent {
    std::string event; // event type (e.g., "message_start", "content_block_delta")
    std::string data;  // raw JSON data
};

// Callback receives each parsed SSE event. Return false to stop parsing.
using SSECallback = std::function<bool(const SSEEvent& event)>;

// Incremental SSE framer. Bytes may be split anywhere, including inside a
// line or between the fields of one event.
class SSEParser {
public:
    // Feed raw data chunk, triggers callback for complete events
    void feed(const std::string& chunk, const SSECallback& callback);

    // End of input: deliver a trailing event that lacks its blank line
    void finish(const SSECallback& callback);

    // Reset parser state
    void reset();

private:
    // Returns false if the callback asked to stop
    bool process_line(const std::string& line, const SSECallback& callback);

    std::string buffer_;
    std::string current_event_;
    std::string current_data_;
    bool has_data_ = false;
};

} // namespace msgstream
