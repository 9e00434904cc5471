#pragma once
#include <stdexcept>
#include <string>

namespace msgstream {

// Fatal stream failure. Once thrown by a session, the session stays in the
// Error state and rethrows the same exception on every later call.
class StreamError : public std::runtime_error {
public:
    enum class Kind {
        Transport,              // byte/event source failed or was cancelled
        MalformedEvent,         // recognized event type with an undecodable payload
        MalformedToolArguments, // accumulated tool input is not a JSON object
        Provider                // provider sent an explicit error event
    };

    StreamError(Kind kind, const std::string& message,
                std::string event_type = "", std::string tool_name = "")
        : std::runtime_error(message), kind_(kind),
          event_type_(std::move(event_type)), tool_name_(std::move(tool_name)) {}

    Kind kind() const { return kind_; }
    const std::string& event_type() const { return event_type_; }
    const std::string& tool_name() const { return tool_name_; }

private:
    Kind kind_;
    std::string event_type_;
    std::string tool_name_;
};

inline const char* error_kind_to_string(StreamError::Kind kind) {
    switch (kind) {
        case StreamError::Kind::Transport: return "transport";
        case StreamError::Kind::MalformedEvent: return "malformed_event";
        case StreamError::Kind::MalformedToolArguments: return "malformed_tool_arguments";
        case StreamError::Kind::Provider: return "provider";
    }
    return "transport";
}

} // namespace msgstream
