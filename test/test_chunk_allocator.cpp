#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "lanflow/p2p/chunk_allocator.h"
#include <algorithm>

using namespace lanflow;
using Catch::Approx;

namespace {

const std::string CONTENT = "disk.img";

SourceDescriptor holder(const std::string& id, ByteRangeSet ranges, double bandwidth = 0.0) {
    SourceDescriptor desc;
    desc.source_id = id;
    desc.measured_bandwidth_mbps = bandwidth;
    desc.available[CONTENT] = std::move(ranges);
    return desc;
}

// 100-byte chunks so tests can reason in small numbers
ChunkConfig small_chunks(uint32_t endgame_threshold = 0) {
    ChunkConfig config;
    config.small_chunk_bytes = 100;
    config.max_inflight_per_source = 2;
    config.endgame_threshold = endgame_threshold;
    config.endgame_max_sources = 2;
    return config;
}

size_t count_for_chunk(const std::vector<ChunkCheckout>& checkouts, uint32_t index) {
    return std::count_if(checkouts.begin(), checkouts.end(),
                         [index](const ChunkCheckout& c) { return c.chunk_index == index; });
}

} // namespace

TEST_CASE("ChunkAllocator - Chunk size grows with item size", "[chunk][size]") {
    ChunkAllocator allocator{ChunkConfig{}};

    REQUIRE(allocator.chunk_size_for(5ULL * 1024 * 1024) == 1ULL * 1024 * 1024);
    REQUIRE(allocator.chunk_size_for(50ULL * 1024 * 1024) == 8ULL * 1024 * 1024);
    REQUIRE(allocator.chunk_size_for(200ULL * 1024 * 1024) == 32ULL * 1024 * 1024);

    // Monotone across the boundaries
    REQUIRE(allocator.chunk_size_for(10ULL * 1024 * 1024 - 1) <= allocator.chunk_size_for(10ULL * 1024 * 1024));
    REQUIRE(allocator.chunk_size_for(100ULL * 1024 * 1024 - 1) <= allocator.chunk_size_for(100ULL * 1024 * 1024));
}

TEST_CASE("ChunkAllocator - Plan covers the item exactly", "[chunk][plan]") {
    ChunkAllocator allocator(small_chunks());
    std::vector<SourceDescriptor> sources = {holder("a", ByteRangeSet::full(250))};

    auto plan = allocator.plan_chunks(CONTENT, 250, sources);

    REQUIRE(plan.chunks.size() == 3);
    REQUIRE(plan.chunks[0].range == ByteRange{0, 100});
    REQUIRE(plan.chunks[2].range == ByteRange{200, 50});
    REQUIRE(plan.remaining() == 3);
    REQUIRE(plan.pending() == 3);
    REQUIRE(plan.bytes_done() == 0);
    for (const auto& chunk : plan.chunks) {
        REQUIRE(chunk.assigned_source == "a");
    }
}

TEST_CASE("ChunkAllocator - Rarest chunks placed first", "[chunk][plan]") {
    ChunkAllocator allocator(small_chunks());

    // x holds chunks 0-1, y holds chunks 1-2
    std::vector<SourceDescriptor> sources = {
        holder("x", ByteRangeSet{{0, 200}}),
        holder("y", ByteRangeSet{{100, 200}}),
    };

    auto plan = allocator.plan_chunks(CONTENT, 300, sources);

    REQUIRE(plan.chunks[0].assigned_source == "x");
    REQUIRE(plan.chunks[2].assigned_source == "y");
    // Shared chunk: equal load and weight, lowest id wins
    REQUIRE(plan.chunks[1].assigned_source == "x");
}

TEST_CASE("ChunkAllocator - Faster sources take more chunks", "[chunk][plan]") {
    ChunkAllocator allocator(small_chunks());
    std::vector<SourceDescriptor> sources = {
        holder("fast", ByteRangeSet::full(400), 30.0),
        holder("slow", ByteRangeSet::full(400), 10.0),
    };

    auto plan = allocator.plan_chunks(CONTENT, 400, sources);

    size_t fast = std::count_if(plan.chunks.begin(), plan.chunks.end(),
                                [](const Chunk& c) { return c.assigned_source == "fast"; });
    REQUIRE(fast == 3);

    SourceDescriptor flaky = holder("flaky", ByteRangeSet::full(1), 10.0);
    flaky.reliability_score = 0.5;
    REQUIRE(ChunkAllocator::source_weight(flaky) == Approx(5.0));
}

TEST_CASE("ChunkAllocator - Chunks without a holder stay unassigned", "[chunk][plan]") {
    ChunkAllocator allocator(small_chunks());
    std::vector<SourceDescriptor> sources = {holder("a", ByteRangeSet{{0, 100}})};

    auto plan = allocator.plan_chunks(CONTENT, 200, sources);
    REQUIRE(plan.chunks[0].assigned_source == "a");
    REQUIRE(plan.chunks[1].assigned_source.empty());
    REQUIRE_FALSE(allocator.has_eligible_source(plan, 1, sources));

    auto checkouts = allocator.dispatch(plan, sources);
    REQUIRE(checkouts.size() == 1);
    REQUIRE(plan.chunks[1].status == ChunkStatus::Pending);
}

TEST_CASE("ChunkAllocator - Dispatch respects per-source capacity", "[chunk][dispatch]") {
    ChunkAllocator allocator(small_chunks());
    std::vector<SourceDescriptor> sources = {holder("a", ByteRangeSet::full(500))};

    auto plan = allocator.plan_chunks(CONTENT, 500, sources);
    auto checkouts = allocator.dispatch(plan, sources);

    // Verify only max_inflight_per_source chunks go out
    REQUIRE(checkouts.size() == 2);
    REQUIRE(plan.in_flight() == 2);
    REQUIRE(plan.pending() == 3);

    // Source already at capacity gets nothing more
    sources[0].in_flight = 2;
    REQUIRE(allocator.dispatch(plan, sources).empty());
}

TEST_CASE("ChunkAllocator - Failed chunk moves to the other holder", "[chunk][failover]") {
    ChunkAllocator allocator(small_chunks());
    std::vector<SourceDescriptor> sources = {
        holder("x", ByteRangeSet{{0, 200}}),
        holder("y", ByteRangeSet{{100, 200}}),
    };

    auto plan = allocator.plan_chunks(CONTENT, 300, sources);
    auto first = allocator.dispatch(plan, sources);
    REQUIRE(first.size() == 3);

    REQUIRE(allocator.complete_chunk(plan, 0, "x").accepted);

    // x drops chunk 1; y is the only other holder
    auto next = allocator.fail_chunk(plan, 1, "x", sources);
    REQUIRE(next == std::optional<std::string>("y"));
    REQUIRE(plan.chunks[1].status == ChunkStatus::Pending);
    REQUIRE(plan.chunks[1].excluded.count("x") == 1);

    sources[1].in_flight = 1;   // still serving chunk 2
    auto second = allocator.dispatch(plan, sources);
    REQUIRE(second.size() == 1);
    REQUIRE(second[0].chunk_index == 1);
    REQUIRE(second[0].source_id == "y");

    // Verify completed chunk 0 was never requested again
    REQUIRE(count_for_chunk(first, 0) + count_for_chunk(second, 0) == 1);
}

TEST_CASE("ChunkAllocator - No holder left after failure", "[chunk][failover]") {
    ChunkAllocator allocator(small_chunks());
    std::vector<SourceDescriptor> sources = {holder("a", ByteRangeSet::full(100))};

    auto plan = allocator.plan_chunks(CONTENT, 100, sources);
    allocator.dispatch(plan, sources);

    REQUIRE_FALSE(allocator.fail_chunk(plan, 0, "a", sources).has_value());
    REQUIRE(plan.chunks[0].assigned_source.empty());
    REQUIRE(plan.chunks[0].failures == 1);
    REQUIRE_FALSE(allocator.has_eligible_source(plan, 0, sources));

    // Exclusions can be forgiven
    allocator.clear_exclusions(plan);
    REQUIRE(allocator.has_eligible_source(plan, 0, sources));
}

TEST_CASE("ChunkAllocator - Resumed chunk continues from recorded progress", "[chunk][progress]") {
    ChunkAllocator allocator(small_chunks());
    std::vector<SourceDescriptor> sources = {
        holder("a", ByteRangeSet::full(100)),
        holder("b", ByteRangeSet::full(100)),
    };

    auto plan = allocator.plan_chunks(CONTENT, 100, sources);
    allocator.dispatch(plan, sources);
    allocator.record_progress(plan, 0, 40);
    allocator.record_progress(plan, 0, 10);   // never goes backwards
    REQUIRE(plan.bytes_done() == 40);

    allocator.fail_chunk(plan, 0, "a", sources);
    auto checkouts = allocator.dispatch(plan, sources);
    REQUIRE(checkouts.size() == 1);
    REQUIRE(checkouts[0].source_id == "b");
    REQUIRE(checkouts[0].base == 40);
    REQUIRE(checkouts[0].range == ByteRange{40, 60});
}

TEST_CASE("ChunkAllocator - Stalled chunk reassigned only when capacity exists", "[chunk][stall]") {
    ChunkAllocator allocator(small_chunks());
    std::vector<SourceDescriptor> sources = {
        holder("a", ByteRangeSet::full(100)),
        holder("b", ByteRangeSet::full(100)),
    };

    auto plan = allocator.plan_chunks(CONTENT, 100, sources);
    auto checkouts = allocator.dispatch(plan, sources);
    REQUIRE(checkouts[0].source_id == "a");
    sources[0].in_flight = 1;

    // b is saturated: nothing moves
    sources[1].in_flight = 2;
    REQUIRE_FALSE(allocator.reassign_stalled(plan, 0, "a", sources).has_value());
    REQUIRE(plan.chunks[0].status == ChunkStatus::InFlight);

    sources[1].in_flight = 0;
    REQUIRE(allocator.reassign_stalled(plan, 0, "a", sources) == std::optional<std::string>("b"));
    REQUIRE(plan.chunks[0].status == ChunkStatus::Pending);
    REQUIRE(plan.chunks[0].excluded.count("a") == 1);
}

TEST_CASE("ChunkAllocator - Endgame duplicates the last chunks", "[chunk][endgame]") {
    ChunkAllocator allocator(small_chunks(3));
    std::vector<SourceDescriptor> sources = {
        holder("a", ByteRangeSet::full(200)),
        holder("b", ByteRangeSet::full(200)),
    };

    auto plan = allocator.plan_chunks(CONTENT, 200, sources);
    auto checkouts = allocator.dispatch(plan, sources);

    // Two primaries plus one duplicate per chunk
    REQUIRE(checkouts.size() == 4);
    REQUIRE(allocator.in_endgame(plan));
    REQUIRE(count_for_chunk(checkouts, 0) == 2);
    REQUIRE(plan.chunks[0].active_sources.size() == 2);

    // First finisher wins, the other copy is a loser
    auto won = allocator.complete_chunk(plan, 0, "b");
    REQUIRE(won.accepted);
    REQUIRE(won.losers == std::vector<std::string>{"a"});
    REQUIRE(plan.chunks[0].completed_by == "b");

    REQUIRE_FALSE(allocator.complete_chunk(plan, 0, "a").accepted);
}

TEST_CASE("ChunkAllocator - Endgame waits for pending chunks", "[chunk][endgame]") {
    ChunkAllocator allocator(small_chunks(3));
    std::vector<SourceDescriptor> sources = {holder("a", ByteRangeSet::full(300))};

    auto plan = allocator.plan_chunks(CONTENT, 300, sources);
    allocator.dispatch(plan, sources);

    // One chunk still pending behind the capacity limit
    REQUIRE(plan.pending() == 1);
    REQUIRE_FALSE(allocator.in_endgame(plan));
}

TEST_CASE("ChunkAllocator - Release returns every checkout", "[chunk]") {
    ChunkAllocator allocator(small_chunks(3));
    std::vector<SourceDescriptor> sources = {
        holder("a", ByteRangeSet::full(200)),
        holder("b", ByteRangeSet::full(200)),
    };

    auto plan = allocator.plan_chunks(CONTENT, 200, sources);
    allocator.dispatch(plan, sources);

    auto released = allocator.release_all(plan);
    REQUIRE(released.size() == 4);
    REQUIRE(plan.pending() == 2);
    REQUIRE(plan.in_flight() == 0);

    REQUIRE(chunk_status_from_string("in_flight") == ChunkStatus::InFlight);
    REQUIRE(std::string(to_string(ChunkStatus::Completed)) == "completed");
}
