#pragma once
#include "providers/sse.hpp"
#include <atomic>
#include <cstddef>
#include <deque>
#include <istream>
#include <optional>
#include <string>

namespace msgstream {

// One framed record from the transport, consumed within a single step
struct RawEvent {
    std::string event_type;
    std::string payload;
};

// Blocking pull source of framed events.
// Returns nullopt at end of stream; throws on transport failure.
class EventSource {
public:
    virtual ~EventSource() = default;
    virtual std::optional<RawEvent> next() = 0;
};

// Blocking pull source of raw bytes.
// Returns false at end of input; throws on read failure.
class ByteSource {
public:
    virtual ~ByteSource() = default;
    virtual bool read(std::string& chunk) = 0;
};

// Serves an in-memory buffer in fixed-size pieces
class StringByteSource : public ByteSource {
public:
    explicit StringByteSource(std::string data, size_t chunk_size = 4096);
    bool read(std::string& chunk) override;

private:
    std::string data_;
    size_t chunk_size_;
    size_t pos_ = 0;
};

// Blocks for the first byte only, then takes whatever the stream already
// has buffered, up to chunk_size.
class IstreamByteSource : public ByteSource {
public:
    explicit IstreamByteSource(std::istream& in, size_t chunk_size = 4096);
    bool read(std::string& chunk) override;

private:
    std::istream& in_;
    size_t chunk_size_;
};

// Reads a file descriptor (pipe, FIFO, socket, file) with poll(), returning
// as soon as any bytes are available. With an abort flag, a read waiting on
// an idle descriptor wakes every poll_interval_ms and throws a transport
// StreamError once the flag is set. Does not own the descriptor.
class FdByteSource : public ByteSource {
public:
    explicit FdByteSource(int fd, const std::atomic<bool>* abort_flag = nullptr,
                          size_t chunk_size = 4096, int poll_interval_ms = 100);
    bool read(std::string& chunk) override;

private:
    void check_abort() const;

    int fd_;
    const std::atomic<bool>* abort_flag_;
    size_t chunk_size_;
    int poll_interval_ms_;
};

// Fails the next read once the abort flag is set, so a consumer blocked on
// the stream sees a transport error instead of waiting for more data.
class CancellableByteSource : public ByteSource {
public:
    CancellableByteSource(ByteSource& inner, const std::atomic<bool>& abort_flag);
    bool read(std::string& chunk) override;

private:
    ByteSource& inner_;
    const std::atomic<bool>& abort_flag_;
};

// Frames a byte stream as server-sent events.
// Events without an "event:" line take their type from the payload's
// "type" field. A bare "data: [DONE]" ends the stream.
class SseEventSource : public EventSource {
public:
    explicit SseEventSource(ByteSource& bytes);
    std::optional<RawEvent> next() override;

private:
    void enqueue(const SSEEvent& sse);

    ByteSource& bytes_;
    SSEParser parser_;
    std::deque<RawEvent> ready_;
    bool input_done_ = false;
    bool sentinel_seen_ = false;
};

} // namespace msgstream
