#pragma once
#include <nlohmann/json.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace msgstream {

struct InputTokenDetails {
    uint64_t no_cache_tokens = 0;
    uint64_t cache_read_tokens = 0;
    uint64_t cache_write_tokens = 0;
};

// Final token usage for one completion
struct Usage {
    uint64_t input_tokens = 0;  // no_cache + cache_read + cache_write
    uint64_t output_tokens = 0;
    uint64_t total_tokens = 0;  // input_tokens + output_tokens
    InputTokenDetails input_details;
};

// One sampling phase of a multi-phase generation ("compaction", "message")
struct UsageIteration {
    std::string kind;
    uint64_t input_tokens = 0;
    uint64_t output_tokens = 0;
};

// Merges token counts reported at message start and message end.
class UsageAccumulator {
public:
    void record_start(uint64_t input_tokens, uint64_t cache_read_tokens,
                      uint64_t cache_write_tokens);

    // Cumulative input figures repeated in a later event replace earlier ones
    void override_input(uint64_t input_tokens);
    void override_cache_read(uint64_t cache_read_tokens);
    void override_cache_write(uint64_t cache_write_tokens);

    void record_output(uint64_t output_tokens);

    // An empty iteration list keeps any previously recorded breakdown
    void record_iterations(std::vector<UsageIteration> iterations);

    // End-of-message figures. An absent output count keeps the previous one,
    // so interim deltas can report iterations alone.
    void record_end(std::optional<uint64_t> output_tokens,
                    std::vector<UsageIteration> iterations);

    Usage finalize() const;

    const std::vector<UsageIteration>& iterations() const { return iterations_; }

private:
    uint64_t input_tokens_ = 0;
    uint64_t cache_read_tokens_ = 0;
    uint64_t cache_write_tokens_ = 0;
    uint64_t output_tokens_ = 0;
    std::vector<UsageIteration> iterations_;
};

nlohmann::json usage_to_json(const Usage& usage);

} // namespace msgstream
