#ifndef LANFLOW_P2P_CHUNK_ALLOCATOR_H
#define LANFLOW_P2P_CHUNK_ALLOCATOR_H

#include "lanflow/base/config.h"
#include "lanflow/p2p/byte_range.h"
#include "lanflow/p2p/source_registry.h"
#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace lanflow {

enum class ChunkStatus {
    Pending,
    InFlight,
    Completed
};

const char* to_string(ChunkStatus status);
std::optional<ChunkStatus> chunk_status_from_string(std::string_view name);

struct Chunk {
    uint32_t index = 0;
    ByteRange range;
    ChunkStatus status = ChunkStatus::Pending;
    std::string assigned_source;             // next source to check the chunk out to
    std::vector<std::string> active_sources; // one, or up to endgame_max_sources in endgame
    std::set<std::string> excluded;          // sources that failed or stalled on this chunk
    uint64_t bytes_done = 0;                 // contiguous bytes from the chunk start
    uint32_t failures = 0;
    std::string completed_by;

    bool is_active_on(const std::string& source_id) const;
};

struct ChunkPlan {
    std::string content_id;
    uint64_t total_bytes = 0;
    uint64_t chunk_size = 0;
    std::vector<Chunk> chunks;

    size_t remaining() const;   // chunks not Completed
    size_t pending() const;
    size_t in_flight() const;
    bool complete() const;
    uint64_t bytes_done() const;
};

// One chunk handed to one source
struct ChunkCheckout {
    uint32_t chunk_index = 0;
    std::string source_id;
    ByteRange range;        // the part of the chunk still missing
    uint64_t base = 0;      // bytes of the chunk already done when checked out
    bool endgame = false;
};

struct ChunkCompletion {
    bool accepted = false;
    std::vector<std::string> losers;   // duplicate checkouts to cancel
};

// Splits an item into chunks and decides which source serves each one.
// Stateless apart from configuration; all state lives in the ChunkPlan.
class ChunkAllocator {
public:
    explicit ChunkAllocator(const ChunkConfig& config);

    // Monotone step function of the item size
    uint64_t chunk_size_for(uint64_t total_bytes) const;

    // Rarest chunk first, each given to the holder minimizing
    // (load + 1) / weight with weight = bandwidth * reliability
    ChunkPlan plan_chunks(const std::string& content_id, uint64_t total_bytes,
                          const std::vector<SourceDescriptor>& sources) const;

    // Checks out Pending chunks and, in endgame, duplicates in-flight chunks
    // onto idle holders
    std::vector<ChunkCheckout> dispatch(ChunkPlan& plan, const std::vector<SourceDescriptor>& sources) const;

    // First completion wins
    ChunkCompletion complete_chunk(ChunkPlan& plan, uint32_t index, const std::string& source_id) const;

    void record_progress(ChunkPlan& plan, uint32_t index, uint64_t bytes_in_chunk) const;

    // Drops `source_id` from the chunk and excludes it there. Returns the
    // source now responsible for the chunk, nullopt when no holder is left.
    std::optional<std::string> fail_chunk(ChunkPlan& plan, uint32_t index, const std::string& source_id,
                                          const std::vector<SourceDescriptor>& sources) const;

    // Moves a stalled chunk away from `from` when another holder has spare
    // capacity. nullopt leaves the chunk where it is.
    std::optional<std::string> reassign_stalled(ChunkPlan& plan, uint32_t index, const std::string& from,
                                                const std::vector<SourceDescriptor>& sources) const;

    // Every (chunk, source) checkout, all returned to Pending
    std::vector<std::pair<uint32_t, std::string>> release_all(ChunkPlan& plan) const;

    void clear_exclusions(ChunkPlan& plan) const;

    bool has_eligible_source(const ChunkPlan& plan, uint32_t index,
                             const std::vector<SourceDescriptor>& sources) const;

    bool in_endgame(const ChunkPlan& plan) const;

    static double source_weight(const SourceDescriptor& source);

private:
    std::vector<const SourceDescriptor*> eligible(const ChunkPlan& plan, const Chunk& chunk,
                                                  const std::vector<SourceDescriptor>& sources) const;

    ChunkConfig config_;
};

} // namespace lanflow

#endif // LANFLOW_P2P_CHUNK_ALLOCATOR_H
