#include "usage.hpp"

namespace msgstream {

void UsageAccumulator::record_start(uint64_t input_tokens, uint64_t cache_read_tokens,
                                    uint64_t cache_write_tokens) {
    input_tokens_ = input_tokens;
    cache_read_tokens_ = cache_read_tokens;
    cache_write_tokens_ = cache_write_tokens;
}

void UsageAccumulator::override_input(uint64_t input_tokens) {
    input_tokens_ = input_tokens;
}

void UsageAccumulator::override_cache_read(uint64_t cache_read_tokens) {
    cache_read_tokens_ = cache_read_tokens;
}

void UsageAccumulator::override_cache_write(uint64_t cache_write_tokens) {
    cache_write_tokens_ = cache_write_tokens;
}

void UsageAccumulator::record_output(uint64_t output_tokens) {
    output_tokens_ = output_tokens;
}

void UsageAccumulator::record_iterations(std::vector<UsageIteration> iterations) {
    if (!iterations.empty()) {
        iterations_ = std::move(iterations);
    }
}

void UsageAccumulator::record_end(std::optional<uint64_t> output_tokens,
                                  std::vector<UsageIteration> iterations) {
    if (output_tokens) record_output(*output_tokens);
    record_iterations(std::move(iterations));
}

Usage UsageAccumulator::finalize() const {
    uint64_t input = input_tokens_;
    uint64_t output = output_tokens_;

    // The top-level counters exclude compaction phases; when the provider
    // reports a per-iteration breakdown, its sums are the billed figures.
    if (!iterations_.empty()) {
        input = 0;
        output = 0;
        for (const auto& iter : iterations_) {
            input += iter.input_tokens;
            output += iter.output_tokens;
        }
    }

    Usage usage;
    usage.input_details.no_cache_tokens = input;
    usage.input_details.cache_read_tokens = cache_read_tokens_;
    usage.input_details.cache_write_tokens = cache_write_tokens_;
    usage.input_tokens = input + cache_read_tokens_ + cache_write_tokens_;
    usage.output_tokens = output;
    usage.total_tokens = usage.input_tokens + usage.output_tokens;
    return usage;
}

nlohmann::json usage_to_json(const Usage& usage) {
    return {
        {"input_tokens", usage.input_tokens},
        {"output_tokens", usage.output_tokens},
        {"total_tokens", usage.total_tokens},
        {"input_details", {
            {"no_cache", usage.input_details.no_cache_tokens},
            {"cache_read", usage.input_details.cache_read_tokens},
            {"cache_write", usage.input_details.cache_write_tokens}
        }}
    };
}

} // namespace msgstream
