#include "stream_session.hpp"
#include "stream_error.hpp"
#include <iostream>
#include <limits>
#include <stdexcept>

using json = nlohmann::json;

namespace msgstream {

namespace {

// Payload does not have the shape its event type requires
struct ShapeError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

// Field lookup treating an explicit null like an absent key
const json* field(const json& obj, const char* key) {
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null()) return nullptr;
    return &*it;
}

const json& require_object(const json& value, const char* name) {
    if (!value.is_object()) {
        throw ShapeError(std::string("\"") + name + "\" is not an object");
    }
    return value;
}

std::string string_field(const json& obj, const char* key) {
    const json* v = field(obj, key);
    return v ? v->get<std::string>() : std::string();
}

// Token counts must be non-negative integers; get<uint64_t>() would wrap
// negatives and truncate fractions.
std::optional<uint64_t> count_field(const json& obj, const char* key) {
    const json* v = field(obj, key);
    if (!v) return std::nullopt;
    if (v->is_number_unsigned()) return v->get<uint64_t>();
    if (v->is_number_integer() && v->get<int64_t>() >= 0) {
        return static_cast<uint64_t>(v->get<int64_t>());
    }
    throw ShapeError(std::string("\"") + key + "\" is not a non-negative integer");
}

int64_t block_index(const json& payload) {
    const json& index = payload.at("index");
    if (!index.is_number_integer() ||
        (index.is_number_unsigned() &&
         index.get<uint64_t>() > static_cast<uint64_t>(std::numeric_limits<int64_t>::max()))) {
        throw ShapeError("\"index\" is not an integer");
    }
    return index.get<int64_t>();
}

bool emits_content(BlockKind kind) {
    return kind == BlockKind::Text || kind == BlockKind::Reasoning ||
           kind == BlockKind::Opaque;
}

} // namespace

const char* session_state_to_string(StreamSession::State state) {
    switch (state) {
        case StreamSession::State::Idle: return "idle";
        case StreamSession::State::AwaitingEvent: return "awaiting-event";
        case StreamSession::State::Finalizing: return "finalizing";
        case StreamSession::State::Eof: return "eof";
        case StreamSession::State::Error: return "error";
    }
    return "idle";
}

StreamSession::StreamSession(EventSource& source, StreamConfig config)
    : source_(source), config_(std::move(config)) {}

std::optional<Chunk> StreamSession::next() {
    if (state_ == State::Eof) return std::nullopt;
    if (state_ == State::Error) std::rethrow_exception(error_);

    try {
        for (;;) {
            // Chunks queued by an earlier event go out before the source is read
            if (!pending_.empty()) {
                Chunk chunk = std::move(pending_.front());
                pending_.pop_front();
                state_ = State::Idle;
                return chunk;
            }

            state_ = State::AwaitingEvent;
            std::optional<RawEvent> ev = source_.next();
            if (!ev || ev->event_type == "message_stop") {
                if (!blocks_.empty()) {
                    log_skip(std::to_string(blocks_.size()) + " unterminated block(s) at end of stream");
                    blocks_.clear();
                }
                state_ = State::Eof;
                return std::nullopt;
            }

            std::optional<Chunk> chunk = dispatch(*ev);
            if (chunk) {
                state_ = State::Idle;
                return chunk;
            }
        }
    } catch (const std::exception& e) {
        error_ = std::current_exception();
        state_ = State::Error;
        std::cerr << "[stream] Stream failed: " << e.what() << "\n";
        throw;
    } catch (...) {
        error_ = std::current_exception();
        state_ = State::Error;
        std::cerr << "[stream] Stream failed with a non-standard exception\n";
        throw;
    }
}

std::optional<Chunk> StreamSession::dispatch(const RawEvent& ev) {
    const std::string& type = ev.event_type;

    if (type == "ping") return std::nullopt;

    bool recognized = type == "message_start" || type == "content_block_start" ||
                      type == "content_block_delta" || type == "content_block_stop" ||
                      type == "message_delta" || type == "error";
    if (!recognized) {
        log_skip("event type \"" + type + "\"");
        return std::nullopt;
    }

    try {
        json payload = json::parse(ev.payload);
        if (!payload.is_object()) {
            throw ShapeError("payload is not a JSON object");
        }

        if (type == "message_start") {
            on_message_start(payload);
            return std::nullopt;
        }
        if (type == "content_block_start") return on_block_start(payload);
        if (type == "content_block_delta") return on_block_delta(payload);
        if (type == "content_block_stop") return on_block_stop(payload);
        if (type == "message_delta") return on_message_delta(payload);
        on_error_event(payload);
    } catch (const json::exception& e) {
        throw StreamError(StreamError::Kind::MalformedEvent,
                          "failed to parse " + type + " event: " + e.what(), type);
    } catch (const ShapeError& e) {
        throw StreamError(StreamError::Kind::MalformedEvent,
                          "failed to parse " + type + " event: " + e.what(), type);
    }
}

void StreamSession::on_message_start(const json& payload) {
    const json* msg = field(payload, "message");
    if (!msg) return;
    require_object(*msg, "message");

    // Input and cache figures are only reported here
    if (const json* u = field(*msg, "usage")) {
        require_object(*u, "usage");
        usage_.record_start(count_field(*u, "input_tokens").value_or(0),
                            count_field(*u, "cache_read_input_tokens").value_or(0),
                            count_field(*u, "cache_creation_input_tokens").value_or(0));
    }

    // Deferred tool calls can arrive whole in the start message, with no
    // block events of their own.
    if (const json* content = field(*msg, "content")) {
        if (!content->is_array()) throw ShapeError("\"content\" is not an array");
        for (const auto& part : *content) {
            if (!part.is_object() || string_field(part, "type") != "tool_use") continue;
            json args = json::object();
            if (const json* input = field(part, "input")) {
                args = require_object(*input, "input");
            }
            auto chunk = emit_tool_call(string_field(part, "id"),
                                        string_field(part, "name"), std::move(args));
            if (chunk) pending_.push_back(std::move(*chunk));
        }
    }
}

std::optional<Chunk> StreamSession::on_block_start(const json& payload) {
    int64_t index = block_index(payload);
    const json& block = require_object(payload.at("content_block"), "content_block");
    std::string type = string_field(block, "type");
    BlockKind kind = block_kind_from_string(type);

    switch (kind) {
        case BlockKind::ToolCall: {
            json input = json::object();
            if (const json* in = field(block, "input")) {
                input = require_object(*in, "input");
            }
            blocks_.open(index, BlockState::tool_call(string_field(block, "id"),
                                                      string_field(block, "name"), input));
            return std::nullopt;
        }

        case BlockKind::ProviderToolCall: {
            std::string raw_name = string_field(block, "name");
            blocks_.open(index, BlockState::provider_tool_call(
                string_field(block, "id"),
                config_.server_tools.display_name(raw_name),
                raw_name,
                config_.server_tools.injects_type(raw_name)));
            return std::nullopt;
        }

        case BlockKind::McpToolUse: {
            // Arguments are complete at start; the stop event is a no-op
            blocks_.open(index, BlockState(kind));
            json args = json::object();
            if (const json* in = field(block, "input")) {
                args = require_object(*in, "input");
            }
            return emit_tool_call(string_field(block, "id"), string_field(block, "name"),
                                  std::move(args));
        }

        case BlockKind::Opaque:
            if (type != "compaction") {
                log_skip("content of block type \"" + type + "\"");
            }
            blocks_.open(index, BlockState(kind));
            return std::nullopt;

        default:
            blocks_.open(index, BlockState(kind));
            return std::nullopt;
    }
}

std::optional<Chunk> StreamSession::on_block_delta(const json& payload) {
    int64_t index = block_index(payload);
    const json& delta = require_object(payload.at("delta"), "delta");
    std::string delta_type = string_field(delta, "type");

    BlockState* block = blocks_.find(index);
    if (block == nullptr) {
        log_skip(delta_type + " for unopened block " + std::to_string(index));
        return std::nullopt;
    }

    if (delta_type == "input_json_delta") {
        std::string fragment = string_field(delta, "partial_json");
        if (fragment.empty()) return std::nullopt;
        if (!block->buffers_arguments()) {
            log_skip(std::string("argument fragment for ") +
                     block_kind_to_string(block->kind()) + " block " + std::to_string(index));
            return std::nullopt;
        }
        if (!block->append_fragment(fragment, config_.max_tool_input_bytes)) {
            log_skip("argument fragment after pre-populated input for block " +
                     std::to_string(index));
        }
        return std::nullopt;
    }

    // Cryptographic attestation of a thinking block, not user-visible
    if (delta_type == "signature_delta") return std::nullopt;

    if (!emits_content(block->kind())) {
        log_skip(delta_type + " for " + block_kind_to_string(block->kind()) +
                 " block " + std::to_string(index));
        return std::nullopt;
    }

    if (delta_type == "text_delta") {
        return Chunk{TextDelta{string_field(delta, "text")}};
    }
    if (delta_type == "thinking_delta") {
        return Chunk{ReasoningDelta{string_field(delta, "thinking")}};
    }
    if (delta_type == "compaction_delta") {
        // content is null while the summary is still being produced
        if (const json* content = field(delta, "content")) {
            return Chunk{TextDelta{content->get<std::string>()}};
        }
        return std::nullopt;
    }

    log_skip("delta type \"" + delta_type + "\"");
    return std::nullopt;
}

std::optional<Chunk> StreamSession::on_block_stop(const json& payload) {
    int64_t index = block_index(payload);
    std::optional<BlockState> block = blocks_.close(index);
    if (!block) {
        log_skip("stop for unopened block " + std::to_string(index));
        return std::nullopt;
    }
    if (!block->buffers_arguments()) return std::nullopt;

    state_ = State::Finalizing;
    json args = block->finalize_arguments();
    return emit_tool_call(block->tool_call_id(), block->emitted_tool_name(), std::move(args));
}

std::optional<Chunk> StreamSession::on_message_delta(const json& payload) {
    std::string stop_reason;
    if (const json* d = field(payload, "delta")) {
        stop_reason = string_field(require_object(*d, "delta"), "stop_reason");
    }

    if (const json* u = field(payload, "usage")) {
        require_object(*u, "usage");

        // Non-zero cumulative input figures supersede the start-of-message ones
        auto input = count_field(*u, "input_tokens");
        if (input && *input > 0) usage_.override_input(*input);
        auto cache_read = count_field(*u, "cache_read_input_tokens");
        if (cache_read && *cache_read > 0) usage_.override_cache_read(*cache_read);
        auto cache_write = count_field(*u, "cache_creation_input_tokens");
        if (cache_write && *cache_write > 0) usage_.override_cache_write(*cache_write);

        std::vector<UsageIteration> iterations;
        if (const json* iters = field(*u, "iterations")) {
            if (!iters->is_array()) throw ShapeError("\"iterations\" is not an array");
            for (const auto& it : *iters) {
                require_object(it, "iterations[]");
                iterations.push_back({string_field(it, "type"),
                                      count_field(it, "input_tokens").value_or(0),
                                      count_field(it, "output_tokens").value_or(0)});
            }
        }
        usage_.record_end(count_field(*u, "output_tokens"), std::move(iterations));
    }

    if (stop_reason.empty()) return std::nullopt;

    state_ = State::Finalizing;
    return Chunk{FinishSummary{map_stop_reason(stop_reason), usage_.finalize()}};
}

void StreamSession::on_error_event(const json& payload) {
    std::string error_type;
    std::string message;
    if (const json* e = field(payload, "error")) {
        require_object(*e, "error");
        error_type = string_field(*e, "type");
        message = string_field(*e, "message");
    }
    std::string what = "provider stream error";
    if (!error_type.empty()) what += " (" + error_type + ")";
    if (!message.empty()) what += ": " + message;
    throw StreamError(StreamError::Kind::Provider, what, "error");
}

std::optional<Chunk> StreamSession::emit_tool_call(const std::string& id,
                                                   const std::string& name,
                                                   json arguments) {
    if (!id.empty() && !emitted_tool_ids_.insert(id).second) {
        log_skip("duplicate tool call " + id);
        return std::nullopt;
    }
    return Chunk{ToolCallComplete{id, name, std::move(arguments)}};
}

void StreamSession::log_skip(const std::string& what) const {
    if (config_.log_skipped_events) {
        std::cerr << "[stream] Skipping " << what << "\n";
    }
}

} // namespace msgstream
