#include <catch2/catch_test_macros.hpp>
#include "usage.hpp"

using namespace msgstream;

TEST_CASE("UsageAccumulator: nothing recorded finalizes to zeros", "[usage]") {
    UsageAccumulator acc;
    Usage u = acc.finalize();
    REQUIRE(u.input_tokens == 0);
    REQUIRE(u.output_tokens == 0);
    REQUIRE(u.total_tokens == 0);
}

TEST_CASE("UsageAccumulator: cache figures count toward input", "[usage]") {
    UsageAccumulator acc;
    acc.record_start(100, 30, 7);
    acc.record_output(40);

    Usage u = acc.finalize();
    REQUIRE(u.input_details.no_cache_tokens == 100);
    REQUIRE(u.input_details.cache_read_tokens == 30);
    REQUIRE(u.input_details.cache_write_tokens == 7);
    REQUIRE(u.input_tokens == 137);
    REQUIRE(u.output_tokens == 40);
    REQUIRE(u.total_tokens == 177);
}

TEST_CASE("UsageAccumulator: overrides replace start figures", "[usage]") {
    UsageAccumulator acc;
    acc.record_start(10, 1, 2);
    acc.override_input(50);
    acc.override_cache_read(5);
    acc.override_cache_write(6);

    Usage u = acc.finalize();
    REQUIRE(u.input_details.no_cache_tokens == 50);
    REQUIRE(u.input_tokens == 61);
}

TEST_CASE("UsageAccumulator: iterations replace flat input and output", "[usage]") {
    UsageAccumulator acc;
    acc.record_start(300, 10, 0);
    acc.record_end(30, {{"compaction", 1000, 200}, {"message", 300, 30}});

    Usage u = acc.finalize();
    REQUIRE(u.input_details.no_cache_tokens == 1300);
    REQUIRE(u.input_tokens == 1310);
    REQUIRE(u.output_tokens == 230);
    REQUIRE(u.total_tokens == 1540);
    REQUIRE(acc.iterations().size() == 2);
    REQUIRE(acc.iterations()[0].kind == "compaction");
}

TEST_CASE("UsageAccumulator: empty iteration list keeps the previous one", "[usage]") {
    UsageAccumulator acc;
    acc.record_iterations({{"message", 5, 6}});
    acc.record_iterations({});
    REQUIRE(acc.iterations().size() == 1);
    REQUIRE(acc.finalize().total_tokens == 11);
}

TEST_CASE("UsageAccumulator: record_end without output keeps the earlier count", "[usage]") {
    UsageAccumulator acc;
    acc.record_end(12, {});
    acc.record_end(std::nullopt, {{"message", 4, 12}});

    Usage u = acc.finalize();
    REQUIRE(u.output_tokens == 12);
    REQUIRE(u.input_tokens == 4);
    REQUIRE(acc.iterations().size() == 1);

    acc.record_end(std::nullopt, {});
    REQUIRE(acc.finalize().output_tokens == 12);
    REQUIRE(acc.iterations().size() == 1);
}

TEST_CASE("UsageAccumulator: later output figure wins", "[usage]") {
    UsageAccumulator acc;
    acc.record_output(3);
    acc.record_output(9);
    REQUIRE(acc.finalize().output_tokens == 9);
}

TEST_CASE("UsageAccumulator: finalize does not consume state", "[usage]") {
    UsageAccumulator acc;
    acc.record_start(4, 0, 0);
    acc.record_output(2);
    REQUIRE(acc.finalize().total_tokens == acc.finalize().total_tokens);
}

TEST_CASE("usage_to_json: renders details", "[usage]") {
    UsageAccumulator acc;
    acc.record_start(8, 2, 1);
    acc.record_output(5);

    auto j = usage_to_json(acc.finalize());
    REQUIRE(j["input_tokens"] == 11);
    REQUIRE(j["output_tokens"] == 5);
    REQUIRE(j["total_tokens"] == 16);
    REQUIRE(j["input_details"]["no_cache"] == 8);
    REQUIRE(j["input_details"]["cache_read"] == 2);
    REQUIRE(j["input_details"]["cache_write"] == 1);
}
