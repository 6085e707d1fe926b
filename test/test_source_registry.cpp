#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "lanflow/p2p/byte_range.h"
#include "lanflow/p2p/source_registry.h"

using namespace lanflow;
using Catch::Approx;

namespace {

SourceDescriptor make_source(const std::string& id) {
    SourceDescriptor desc;
    desc.source_id = id;
    desc.address = "10.0.0.1";
    return desc;
}

TimePoint at(int seconds) {
    return TimePoint{} + std::chrono::seconds(seconds);
}

} // namespace

// ============================================================================
// ByteRangeSet
// ============================================================================

TEST_CASE("ByteRangeSet - Adjacent and overlapping ranges merge", "[source][range]") {
    ByteRangeSet set;
    set.add({100, 50});
    set.add({0, 50});
    set.add({50, 50});

    REQUIRE(set.ranges().size() == 1);
    REQUIRE(set.ranges()[0] == ByteRange{0, 150});

    set.add({300, 10});
    set.add({120, 200});
    REQUIRE(set.ranges().size() == 1);
    REQUIRE(set.total_bytes() == 320);
}

TEST_CASE("ByteRangeSet - Coverage needs one contiguous range", "[source][range]") {
    ByteRangeSet set{{0, 100}, {200, 100}};

    REQUIRE(set.covers({0, 100}));
    REQUIRE(set.covers({210, 50}));
    REQUIRE_FALSE(set.covers({50, 200}));
    REQUIRE_FALSE(set.covers({150, 10}));
    REQUIRE(set.covers({150, 0}));
    REQUIRE(set.to_string() == "[0-100, 200-300]");

    REQUIRE(ByteRangeSet::full(64).covers({0, 64}));
    REQUIRE(ByteRangeSet::full(0).empty());
}

// ============================================================================
// SourceRegistry
// ============================================================================

TEST_CASE("SourceRegistry - Register and update", "[source][registry]") {
    SourceRegistry registry(SourceConfig{});

    REQUIRE(registry.register_source(make_source("a"), at(0)));
    REQUIRE(registry.size() == 1);

    // Known source keeps its statistics
    registry.record_outcome("a", true);
    auto again = make_source("a");
    again.address = "10.0.0.2";
    REQUIRE_FALSE(registry.register_source(again, at(1)));

    auto desc = registry.get("a");
    REQUIRE(desc.has_value());
    REQUIRE(desc->address == "10.0.0.2");
    REQUIRE(desc->attempts == 1);
    REQUIRE(desc->reliability_score == Approx(1.0));

    REQUIRE(registry.remove_source("a"));
    REQUIRE_FALSE(registry.remove_source("a"));
    REQUIRE_FALSE(registry.get("a").has_value());
}

TEST_CASE("SourceRegistry - Reliability decays with failures", "[source][registry]") {
    SourceConfig config;
    config.reliability_alpha = 0.3;
    config.max_consecutive_failures = 0;
    SourceRegistry registry(config);
    registry.register_source(make_source("a"), at(0));

    REQUIRE(registry.record_outcome("a", false) == SourceVerdict::Kept);
    REQUIRE(registry.get("a")->reliability_score == Approx(0.7));

    registry.record_outcome("a", true);
    REQUIRE(registry.get("a")->reliability_score == Approx(0.79));

    // Many failures never push the score below zero
    for (int i = 0; i < 50; ++i) registry.record_outcome("a", false);
    auto desc = registry.get("a");
    REQUIRE(desc->reliability_score >= 0.0);
    REQUIRE(desc->reliability_score < 0.01);
    REQUIRE(desc->consecutive_failures == 50);

    REQUIRE(registry.record_outcome("ghost", true) == SourceVerdict::Unknown);
}

TEST_CASE("SourceRegistry - Repeated failures remove a source", "[source][registry]") {
    SourceConfig config;
    config.max_consecutive_failures = 3;
    SourceRegistry registry(config);
    registry.register_source(make_source("a"), at(0));

    REQUIRE(registry.record_outcome("a", false) == SourceVerdict::Kept);
    REQUIRE(registry.record_outcome("a", true) == SourceVerdict::Kept);
    REQUIRE(registry.record_outcome("a", false) == SourceVerdict::Kept);
    REQUIRE(registry.record_outcome("a", false) == SourceVerdict::Kept);
    REQUIRE(registry.record_outcome("a", false) == SourceVerdict::Removed);
    REQUIRE_FALSE(registry.contains("a"));
}

TEST_CASE("SourceRegistry - Bandwidth smoothing", "[source][registry]") {
    SourceConfig config;
    config.bandwidth_alpha = 0.5;
    SourceRegistry registry(config);
    registry.register_source(make_source("a"), at(0));

    // First sample is taken as is
    REQUIRE(registry.record_bandwidth("a", 10.0));
    REQUIRE(registry.get("a")->measured_bandwidth_mbps == Approx(10.0));

    REQUIRE(registry.record_bandwidth("a", 20.0));
    REQUIRE(registry.get("a")->measured_bandwidth_mbps == Approx(15.0));

    REQUIRE_FALSE(registry.record_bandwidth("a", -1.0));
    REQUIRE_FALSE(registry.record_bandwidth("ghost", 1.0));
}

TEST_CASE("SourceRegistry - Availability and holders", "[source][registry]") {
    SourceRegistry registry(SourceConfig{});
    registry.register_source(make_source("b"), at(0));
    registry.register_source(make_source("a"), at(0));

    REQUIRE(registry.update_availability("a", "movie", ByteRangeSet::full(1000), at(1)));
    REQUIRE(registry.update_availability("b", "movie", ByteRangeSet{{0, 500}}, at(1)));
    REQUIRE_FALSE(registry.update_availability("ghost", "movie", ByteRangeSet::full(1), at(1)));

    REQUIRE(registry.holders_of("movie", {0, 100}) == std::vector<std::string>{"a", "b"});
    REQUIRE(registry.holders_of("movie", {600, 100}) == std::vector<std::string>{"a"});
    REQUIRE(registry.holders_of("other", {0, 1}).empty());

    // Empty set withdraws the content
    registry.update_availability("a", "movie", ByteRangeSet{}, at(2));
    REQUIRE(registry.holders_of("movie", {600, 100}).empty());
    REQUIRE_FALSE(registry.get("a")->has_range("movie", {0, 1}));
}

TEST_CASE("SourceRegistry - Stale sources are evicted", "[source][registry]") {
    SourceConfig config;
    config.stale_timeout_sec = 30;
    SourceRegistry registry(config);
    registry.register_source(make_source("a"), at(0));
    registry.register_source(make_source("b"), at(0));

    REQUIRE(registry.touch("b", at(20)));
    REQUIRE(registry.evict_stale(at(30)).empty());

    auto evicted = registry.evict_stale(at(31));
    REQUIRE(evicted == std::vector<std::string>{"a"});
    REQUIRE(registry.contains("b"));
    REQUIRE(registry.size() == 1);
}

TEST_CASE("SourceRegistry - In-flight accounting", "[source][registry]") {
    SourceRegistry registry(SourceConfig{});
    registry.register_source(make_source("a"), at(0));

    REQUIRE(registry.acquire("a"));
    REQUIRE(registry.acquire("a"));
    REQUIRE(registry.get("a")->in_flight == 2);

    registry.release("a");
    registry.release("a");
    registry.release("a");
    REQUIRE(registry.get("a")->in_flight == 0);

    REQUIRE_FALSE(registry.acquire("ghost"));
    REQUIRE(registry.snapshot().size() == 1);
}
