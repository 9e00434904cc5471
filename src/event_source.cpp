#include "event_source.hpp"
#include "stream_error.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <poll.h>
#include <unistd.h>

namespace msgstream {

// ── StringByteSource ────────────────────────────────────────────

StringByteSource::StringByteSource(std::string data, size_t chunk_size)
    : data_(std::move(data)), chunk_size_(chunk_size == 0 ? 1 : chunk_size) {}

bool StringByteSource::read(std::string& chunk) {
    if (pos_ >= data_.size()) return false;
    size_t len = std::min(chunk_size_, data_.size() - pos_);
    chunk.assign(data_, pos_, len);
    pos_ += len;
    return true;
}

// ── IstreamByteSource ───────────────────────────────────────────

IstreamByteSource::IstreamByteSource(std::istream& in, size_t chunk_size)
    : in_(in), chunk_size_(chunk_size == 0 ? 1 : chunk_size) {}

bool IstreamByteSource::read(std::string& chunk) {
    chunk.clear();
    int first = in_.get();
    if (in_.bad()) {
        throw StreamError(StreamError::Kind::Transport, "input stream read failed");
    }
    if (first == std::char_traits<char>::eof()) return false;

    chunk.resize(chunk_size_);
    chunk[0] = static_cast<char>(first);
    std::streamsize more = 0;
    if (chunk_size_ > 1) {
        more = in_.readsome(&chunk[1], static_cast<std::streamsize>(chunk_size_ - 1));
        if (in_.bad()) {
            throw StreamError(StreamError::Kind::Transport, "input stream read failed");
        }
    }
    chunk.resize(1 + static_cast<size_t>(more));
    return true;
}

// ── FdByteSource ────────────────────────────────────────────────

FdByteSource::FdByteSource(int fd, const std::atomic<bool>* abort_flag,
                           size_t chunk_size, int poll_interval_ms)
    : fd_(fd), abort_flag_(abort_flag),
      chunk_size_(chunk_size == 0 ? 1 : chunk_size),
      poll_interval_ms_(poll_interval_ms <= 0 ? 100 : poll_interval_ms) {}

void FdByteSource::check_abort() const {
    if (abort_flag_ && abort_flag_->load()) {
        throw StreamError(StreamError::Kind::Transport, "stream cancelled");
    }
}

bool FdByteSource::read(std::string& chunk) {
    chunk.clear();
    while (true) {
        check_abort();

        struct pollfd pfd;
        pfd.fd = fd_;
        pfd.events = POLLIN;
        pfd.revents = 0;

        int timeout = abort_flag_ ? poll_interval_ms_ : -1;
        int ret = ::poll(&pfd, 1, timeout);
        if (ret < 0) {
            if (errno == EINTR) continue; // signal arrived; recheck the flag
            throw StreamError(StreamError::Kind::Transport,
                              std::string("poll failed: ") + std::strerror(errno));
        }
        if (ret == 0) continue; // idle

        if ((pfd.revents & POLLNVAL) != 0) {
            throw StreamError(StreamError::Kind::Transport, "invalid input descriptor");
        }

        // POLLHUP with no data left reads as EOF below
        chunk.resize(chunk_size_);
        ssize_t n = ::read(fd_, &chunk[0], chunk_size_);
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN) continue;
            throw StreamError(StreamError::Kind::Transport,
                              std::string("read failed: ") + std::strerror(errno));
        }
        chunk.resize(static_cast<size_t>(n));
        return n > 0;
    }
}

// ── CancellableByteSource ───────────────────────────────────────

CancellableByteSource::CancellableByteSource(ByteSource& inner,
                                             const std::atomic<bool>& abort_flag)
    : inner_(inner), abort_flag_(abort_flag) {}

bool CancellableByteSource::read(std::string& chunk) {
    if (abort_flag_.load()) {
        throw StreamError(StreamError::Kind::Transport, "stream cancelled");
    }
    return inner_.read(chunk);
}

// ── SseEventSource ──────────────────────────────────────────────

SseEventSource::SseEventSource(ByteSource& bytes) : bytes_(bytes) {}

void SseEventSource::enqueue(const SSEEvent& sse) {
    if (sentinel_seen_) return;

    RawEvent ev{sse.event, sse.data};
    if (ev.event_type.empty()) {
        if (ev.payload == "[DONE]") {
            sentinel_seen_ = true;
            return;
        }
        auto payload = nlohmann::json::parse(ev.payload, nullptr, false);
        if (payload.is_object() && payload.contains("type") && payload["type"].is_string()) {
            ev.event_type = payload["type"].get<std::string>();
        }
    }
    ready_.push_back(std::move(ev));
}

std::optional<RawEvent> SseEventSource::next() {
    auto push = [this](const SSEEvent& sse) {
        enqueue(sse);
        return true;
    };

    while (ready_.empty()) {
        if (input_done_ || sentinel_seen_) return std::nullopt;

        std::string chunk;
        if (!bytes_.read(chunk)) {
            parser_.finish(push);
            input_done_ = true;
            continue;
        }
        parser_.feed(chunk, push);
    }

    RawEvent ev = std::move(ready_.front());
    ready_.pop_front();
    return ev;
}

} // namespace msgstream
