#include <catch2/catch_test_macros.hpp>
#include "event_source.hpp"
#include "stream_error.hpp"
#include "stream_session.hpp"
#include <atomic>
#include <chrono>
#include <sstream>
#include <thread>
#include <unistd.h>
#include <vector>

using namespace msgstream;

static std::vector<RawEvent> read_all(EventSource& source) {
    std::vector<RawEvent> events;
    while (auto ev = source.next()) events.push_back(std::move(*ev));
    return events;
}

// Fails on the first read
class FailingByteSource : public ByteSource {
public:
    bool read(std::string&) override {
        throw StreamError(StreamError::Kind::Transport, "socket closed");
    }
};

// ── StringByteSource ─────────────────────────────────────────────

TEST_CASE("StringByteSource: serves fixed-size pieces", "[event_source]") {
    StringByteSource bytes("abcdefg", 3);
    std::string chunk;

    REQUIRE(bytes.read(chunk));
    REQUIRE(chunk == "abc");
    REQUIRE(bytes.read(chunk));
    REQUIRE(chunk == "def");
    REQUIRE(bytes.read(chunk));
    REQUIRE(chunk == "g");
    REQUIRE_FALSE(bytes.read(chunk));
}

TEST_CASE("StringByteSource: zero chunk size reads one byte at a time", "[event_source]") {
    StringByteSource bytes("ab", 0);
    std::string chunk;
    REQUIRE(bytes.read(chunk));
    REQUIRE(chunk == "a");
}

// ── IstreamByteSource ────────────────────────────────────────────

TEST_CASE("IstreamByteSource: reads until end of stream", "[event_source]") {
    std::istringstream in("hello world");
    IstreamByteSource bytes(in, 4);

    std::string all;
    std::string chunk;
    while (bytes.read(chunk)) all += chunk;
    REQUIRE(all == "hello world");
}

TEST_CASE("IstreamByteSource: returns buffered bytes without filling the chunk", "[event_source]") {
    std::istringstream in("event: ping\n\n");
    IstreamByteSource bytes(in, 4096);

    std::string chunk;
    REQUIRE(bytes.read(chunk));
    REQUIRE(chunk == "event: ping\n\n");
    REQUIRE_FALSE(bytes.read(chunk));
}

// ── FdByteSource ─────────────────────────────────────────────────

// RAII pipe; either end can be closed early
struct TestPipe {
    int fds[2] = {-1, -1};

    TestPipe() { REQUIRE(::pipe(fds) == 0); }
    ~TestPipe() {
        close_read();
        close_write();
    }

    TestPipe(const TestPipe&) = delete;
    TestPipe& operator=(const TestPipe&) = delete;

    int read_fd() const { return fds[0]; }
    void write(const std::string& s) {
        REQUIRE(::write(fds[1], s.data(), s.size()) == static_cast<ssize_t>(s.size()));
    }
    void close_read() { if (fds[0] >= 0) { ::close(fds[0]); fds[0] = -1; } }
    void close_write() { if (fds[1] >= 0) { ::close(fds[1]); fds[1] = -1; } }
};

TEST_CASE("FdByteSource: returns available bytes while the writer stays open", "[event_source]") {
    TestPipe p;
    p.write("event: ping\ndata: {}\n\n");

    FdByteSource bytes(p.read_fd(), nullptr, 4096);
    std::string chunk;
    REQUIRE(bytes.read(chunk));
    REQUIRE(chunk == "event: ping\ndata: {}\n\n");
}

TEST_CASE("FdByteSource: end of input once the writer closes", "[event_source]") {
    TestPipe p;
    p.write("abc");
    p.close_write();

    FdByteSource bytes(p.read_fd(), nullptr, 2);
    std::string chunk;
    REQUIRE(bytes.read(chunk));
    REQUIRE(chunk == "ab");
    REQUIRE(bytes.read(chunk));
    REQUIRE(chunk == "c");
    REQUIRE_FALSE(bytes.read(chunk));
}

TEST_CASE("FdByteSource: abort wakes a read blocked on an idle writer", "[event_source]") {
    TestPipe p;
    std::atomic<bool> abort{false};
    FdByteSource bytes(p.read_fd(), &abort, 4096, 10);

    std::thread canceller([&] {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        abort.store(true);
    });

    std::string chunk;
    bool cancelled = false;
    try {
        bytes.read(chunk);
    } catch (const StreamError& e) {
        cancelled = e.kind() == StreamError::Kind::Transport;
    }
    canceller.join();
    REQUIRE(cancelled);
}

TEST_CASE("FdByteSource: invalid descriptor is a transport error", "[event_source]") {
    TestPipe p;
    int fd = p.read_fd();
    p.close_read();

    FdByteSource bytes(fd, nullptr);
    std::string chunk;
    REQUIRE_THROWS_AS(bytes.read(chunk), StreamError);
}

// ── CancellableByteSource ────────────────────────────────────────

TEST_CASE("CancellableByteSource: passes reads through until aborted", "[event_source]") {
    StringByteSource inner("abcdef", 2);
    std::atomic<bool> abort{false};
    CancellableByteSource bytes(inner, abort);

    std::string chunk;
    REQUIRE(bytes.read(chunk));
    REQUIRE(chunk == "ab");

    abort.store(true);
    try {
        bytes.read(chunk);
        FAIL("expected cancellation");
    } catch (const StreamError& e) {
        REQUIRE(e.kind() == StreamError::Kind::Transport);
    }
}

// ── SseEventSource ───────────────────────────────────────────────

TEST_CASE("SseEventSource: named events pass through", "[event_source]") {
    StringByteSource bytes(
        "event: message_start\ndata: {\"type\":\"message_start\"}\n\n"
        "event: ping\ndata: {\"type\": \"ping\"}\n\n");
    SseEventSource source(bytes);

    auto events = read_all(source);
    REQUIRE(events.size() == 2);
    REQUIRE(events[0].event_type == "message_start");
    REQUIRE(events[0].payload == "{\"type\":\"message_start\"}");
    REQUIRE(events[1].event_type == "ping");
}

TEST_CASE("SseEventSource: unnamed events take their type from the payload", "[event_source]") {
    StringByteSource bytes("data: {\"type\":\"content_block_stop\",\"index\":0}\n\n"
                           "data: not json\n\n");
    SseEventSource source(bytes);

    auto events = read_all(source);
    REQUIRE(events.size() == 2);
    REQUIRE(events[0].event_type == "content_block_stop");
    // Undecodable payloads keep an empty type; the session skips them
    REQUIRE(events[1].event_type.empty());
    REQUIRE(events[1].payload == "not json");
}

TEST_CASE("SseEventSource: [DONE] sentinel ends the stream", "[event_source]") {
    StringByteSource bytes("event: ping\ndata: {}\n\n"
                           "data: [DONE]\n\n"
                           "event: ping\ndata: {}\n\n");
    SseEventSource source(bytes);

    auto events = read_all(source);
    REQUIRE(events.size() == 1);
    REQUIRE_FALSE(source.next().has_value());
}

TEST_CASE("SseEventSource: trailing event without blank line is delivered", "[event_source]") {
    StringByteSource bytes("event: message_stop\ndata: {\"type\":\"message_stop\"}");
    SseEventSource source(bytes);

    auto events = read_all(source);
    REQUIRE(events.size() == 1);
    REQUIRE(events[0].event_type == "message_stop");
}

TEST_CASE("SseEventSource: identical events at every chunk size", "[event_source]") {
    const std::string wire =
        ": keep-alive\r\n"
        "event: content_block_delta\r\n"
        "data: {\"type\":\"content_block_delta\",\"index\":0,"
        "\"delta\":{\"type\":\"text_delta\",\"text\":\"h\\u00e9llo\"}}\r\n\r\n"
        "event: content_block_stop\n"
        "data: {\"type\":\"content_block_stop\",\"index\":0}\n\n";

    StringByteSource whole_bytes(wire, wire.size());
    SseEventSource whole(whole_bytes);
    auto expected = read_all(whole);
    REQUIRE(expected.size() == 2);

    for (size_t size : {1u, 2u, 5u, 17u}) {
        StringByteSource bytes(wire, size);
        SseEventSource source(bytes);
        auto got = read_all(source);
        REQUIRE(got.size() == expected.size());
        for (size_t i = 0; i < got.size(); ++i) {
            REQUIRE(got[i].event_type == expected[i].event_type);
            REQUIRE(got[i].payload == expected[i].payload);
        }
    }
}

TEST_CASE("SseEventSource: read failures propagate", "[event_source]") {
    FailingByteSource bytes;
    SseEventSource source(bytes);
    REQUIRE_THROWS_AS(source.next(), StreamError);
}

TEST_CASE("SseEventSource: empty input is an empty stream", "[event_source]") {
    StringByteSource bytes("");
    SseEventSource source(bytes);
    REQUIRE_FALSE(source.next().has_value());
    REQUIRE_FALSE(source.next().has_value());
}

// ── Cancellation through a session ───────────────────────────────

TEST_CASE("StreamSession: cancellation surfaces as a sticky transport error", "[event_source][session]") {
    StringByteSource inner(
        "event: content_block_start\n"
        "data: {\"type\":\"content_block_start\",\"index\":0,\"content_block\":{\"type\":\"text\"}}\n\n"
        "event: content_block_delta\n"
        "data: {\"type\":\"content_block_delta\",\"index\":0,\"delta\":{\"type\":\"text_delta\",\"text\":\"hi\"}}\n\n"
        "event: content_block_delta\n"
        "data: {\"type\":\"content_block_delta\",\"index\":0,\"delta\":{\"type\":\"text_delta\",\"text\":\"late\"}}\n\n",
        64);
    std::atomic<bool> abort{false};
    CancellableByteSource bytes(inner, abort);
    SseEventSource events(bytes);
    StreamSession session(events);

    auto first = session.next();
    REQUIRE(first.has_value());
    REQUIRE(std::get<TextDelta>(*first).text == "hi");

    abort.store(true);
    for (int i = 0; i < 2; ++i) {
        try {
            session.next();
            FAIL("expected cancellation");
        } catch (const StreamError& e) {
            REQUIRE(e.kind() == StreamError::Kind::Transport);
        }
    }
    REQUIRE(session.state() == StreamSession::State::Error);
}

TEST_CASE("StreamSession: live pipe delivers chunks before the writer closes", "[event_source][session]") {
    TestPipe p;
    std::atomic<bool> abort{false};
    FdByteSource bytes(p.read_fd(), &abort, 4096, 10);
    SseEventSource events(bytes);
    StreamSession session(events);

    p.write("event: content_block_start\n"
            "data: {\"type\":\"content_block_start\",\"index\":0,\"content_block\":{\"type\":\"text\"}}\n\n"
            "event: content_block_delta\n"
            "data: {\"type\":\"content_block_delta\",\"index\":0,\"delta\":{\"type\":\"text_delta\",\"text\":\"hi\"}}\n\n");

    auto first = session.next();
    REQUIRE(first.has_value());
    REQUIRE(std::get<TextDelta>(*first).text == "hi");

    // Writer still open and idle: the next call waits until cancelled
    std::thread canceller([&] {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        abort.store(true);
    });
    std::optional<StreamError> err;
    try {
        session.next();
    } catch (const StreamError& e) {
        err = e;
    }
    canceller.join();
    REQUIRE(err.has_value());
    REQUIRE(err->kind() == StreamError::Kind::Transport);
    REQUIRE_THROWS_AS(session.next(), StreamError);
}
