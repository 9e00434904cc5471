#include "config.hpp"
#include "event_source.hpp"
#include "stream_error.hpp"
#include "stream_result.hpp"
#include "stream_session.hpp"
#include <nlohmann/json.hpp>
#include <atomic>
#include <csignal>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <iostream>
#include <string>
#include <unistd.h>

static std::atomic<bool> g_abort{false};

static void signal_handler(int /*sig*/) {
    g_abort.store(true);
}

static void print_usage() {
    std::cout << "Usage: msgstream [options] [FILE]\n"
              << "\n"
              << "Decode a captured Messages SSE stream (FILE or stdin) and print\n"
              << "one JSON object per decoded chunk, followed by a summary line.\n"
              << "\n"
              << "Options:\n"
              << "  --config PATH        Config file (default: ~/.msgstream/config.json)\n"
              << "  --chunk-size N       Read size in bytes (default: 4096)\n"
              << "  -h, --help           Show this help\n"
              << "\n"
              << "Environment variables:\n"
              << "  MSGSTREAM_LOG_SKIPPED            Log skipped events to stderr (1/0)\n"
              << "  MSGSTREAM_MAX_TOOL_INPUT_BYTES   Limit on one tool call's arguments\n";
}

int main(int argc, char* argv[]) {
    std::string config_path;
    std::string input_path;
    size_t chunk_size = 4096;

    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "-h") == 0 || std::strcmp(argv[i], "--help") == 0) {
            print_usage();
            return 0;
        } else if (std::strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
            config_path = argv[++i];
        } else if (std::strcmp(argv[i], "--chunk-size") == 0 && i + 1 < argc) {
            try {
                chunk_size = std::stoul(argv[++i]);
            } catch (const std::exception&) {
                std::cerr << "Error: invalid --chunk-size: " << argv[i] << "\n";
                return 2;
            }
        } else if (argv[i][0] == '-' && argv[i][1] != '\0') {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage();
            return 2;
        } else {
            input_path = argv[i];
        }
    }

    msgstream::StreamConfig config = config_path.empty()
        ? msgstream::StreamConfig::load()
        : msgstream::StreamConfig::load(config_path);

    int fd = STDIN_FILENO;
    if (!input_path.empty()) {
        fd = ::open(input_path.c_str(), O_RDONLY);
        if (fd < 0) {
            std::cerr << "Error: cannot open " << input_path << ": "
                      << std::strerror(errno) << "\n";
            return 2;
        }
    }

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    // Returns each read as soon as bytes arrive, and wakes periodically to
    // notice a signal while the producer is idle.
    msgstream::FdByteSource bytes(fd, &g_abort, chunk_size);
    msgstream::SseEventSource events(bytes);
    msgstream::StreamSession session(events, config);

    int status = 0;
    try {
        auto result = msgstream::collect_stream(session,
            [](const msgstream::Chunk& chunk) {
                std::cout << msgstream::chunk_to_json(chunk).dump() << "\n" << std::flush;
                return true;
            });

        nlohmann::json summary = {
            {"type", "summary"},
            {"finished", result.finished},
            {"text_bytes", result.text.size()},
            {"reasoning_bytes", result.reasoning.size()},
            {"tool_calls", result.tool_calls.size()}
        };
        if (result.finished) {
            summary["reason"] = msgstream::finish_reason_to_string(result.finish_reason);
            summary["usage"] = msgstream::usage_to_json(result.usage);
        }
        std::cout << summary.dump() << "\n";
    } catch (const msgstream::StreamError& e) {
        std::cerr << "Error (" << msgstream::error_kind_to_string(e.kind()) << "): "
                  << e.what() << "\n";
        status = 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        status = 1;
    }

    if (fd != STDIN_FILENO) ::close(fd);
    return status;
}
