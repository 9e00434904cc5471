#include "sse.hpp"

namespace msgstream {

void SSEParser::feed(const std::string& chunk, const SSECallback& callback) {
    buffer_ += chunk;

    size_t pos = 0;
    while (pos < buffer_.size()) {
        size_t newline = buffer_.find('\n', pos);
        if (newline == std::string::npos) break; // incomplete line stays buffered

        std::string line = buffer_.substr(pos, newline - pos);
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        pos = newline + 1;

        if (!process_line(line, callback)) {
            buffer_.erase(0, pos);
            return;
        }
    }
    buffer_.erase(0, pos);
}

void SSEParser::finish(const SSECallback& callback) {
    if (!buffer_.empty()) {
        std::string line;
        line.swap(buffer_);
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (!process_line(line, callback)) return;
    }
    process_line("", callback);
}

bool SSEParser::process_line(const std::string& line, const SSECallback& callback) {
    if (line.empty()) {
        // Empty line = dispatch event
        bool keep_going = true;
        if (has_data_ || !current_event_.empty()) {
            SSEEvent event{current_event_, current_data_};
            current_event_.clear();
            current_data_.clear();
            has_data_ = false;
            keep_going = callback(event);
        }
        return keep_going;
    }

    if (line[0] == ':') return true; // comment

    size_t colon = line.find(':');
    std::string field = line.substr(0, colon);
    std::string value;
    if (colon != std::string::npos) {
        value = line.substr(colon + 1);
        // Handle both "data: payload" (with space) and "data:payload" (without)
        if (!value.empty() && value[0] == ' ') value.erase(0, 1);
    }

    if (field == "event") {
        current_event_ = value;
    } else if (field == "data") {
        if (has_data_) current_data_ += '\n';
        current_data_ += value;
        has_data_ = true;
    }
    // id, retry and unknown fields are ignored
    return true;
}

void SSEParser::reset() {
    buffer_.clear();
    current_event_.clear();
    current_data_.clear();
    has_data_ = false;
}

} // namespace msgstream
