#include "lanflow/p2p/chunk_allocator.h"
#include "lanflow/base/logger.h"
#include <algorithm>
#include <map>
#include <numeric>

namespace lanflow {

namespace {

constexpr double MIN_WEIGHT_BANDWIDTH_MBPS = 0.1;
constexpr double MIN_WEIGHT_RELIABILITY = 0.01;

// Lowest (load + 1) / weight, ties broken by source id
const SourceDescriptor* pick_least_loaded(const std::vector<const SourceDescriptor*>& candidates,
                                          const std::map<std::string, uint32_t>& load) {
    const SourceDescriptor* best = nullptr;
    double best_score = 0.0;
    for (const auto* source : candidates) {
        auto it = load.find(source->source_id);
        const double current = it == load.end() ? 0.0 : static_cast<double>(it->second);
        const double score = (current + 1.0) / ChunkAllocator::source_weight(*source);
        if (!best || score < best_score ||
            (score == best_score && source->source_id < best->source_id)) {
            best = source;
            best_score = score;
        }
    }
    return best;
}

void drop_active(Chunk& chunk, const std::string& source_id) {
    chunk.active_sources.erase(std::remove(chunk.active_sources.begin(), chunk.active_sources.end(), source_id),
                               chunk.active_sources.end());
}

} // namespace

const char* to_string(ChunkStatus status) {
    switch (status) {
        case ChunkStatus::Pending: return "pending";
        case ChunkStatus::InFlight: return "in_flight";
        case ChunkStatus::Completed: return "completed";
    }
    return "unknown";
}

std::optional<ChunkStatus> chunk_status_from_string(std::string_view name) {
    if (name == "pending") return ChunkStatus::Pending;
    if (name == "in_flight") return ChunkStatus::InFlight;
    if (name == "completed") return ChunkStatus::Completed;
    return std::nullopt;
}

bool Chunk::is_active_on(const std::string& source_id) const {
    return std::find(active_sources.begin(), active_sources.end(), source_id) != active_sources.end();
}

size_t ChunkPlan::remaining() const {
    return std::count_if(chunks.begin(), chunks.end(),
                         [](const Chunk& c) { return c.status != ChunkStatus::Completed; });
}

size_t ChunkPlan::pending() const {
    return std::count_if(chunks.begin(), chunks.end(),
                         [](const Chunk& c) { return c.status == ChunkStatus::Pending; });
}

size_t ChunkPlan::in_flight() const {
    return std::count_if(chunks.begin(), chunks.end(),
                         [](const Chunk& c) { return c.status == ChunkStatus::InFlight; });
}

bool ChunkPlan::complete() const {
    return remaining() == 0;
}

uint64_t ChunkPlan::bytes_done() const {
    return std::accumulate(chunks.begin(), chunks.end(), uint64_t{0}, [](uint64_t sum, const Chunk& c) {
        return sum + (c.status == ChunkStatus::Completed ? c.range.length : c.bytes_done);
    });
}

ChunkAllocator::ChunkAllocator(const ChunkConfig& config) : config_(config) {}

double ChunkAllocator::source_weight(const SourceDescriptor& source) {
    return std::max(source.measured_bandwidth_mbps, MIN_WEIGHT_BANDWIDTH_MBPS) *
           std::max(source.reliability_score, MIN_WEIGHT_RELIABILITY);
}

uint64_t ChunkAllocator::chunk_size_for(uint64_t total_bytes) const {
    if (total_bytes < config_.small_item_bytes) {
        return config_.small_chunk_bytes;
    }
    if (total_bytes < config_.large_item_bytes) {
        return config_.medium_chunk_bytes;
    }
    return config_.large_chunk_bytes;
}

std::vector<const SourceDescriptor*> ChunkAllocator::eligible(const ChunkPlan& plan, const Chunk& chunk,
                                                             const std::vector<SourceDescriptor>& sources) const {
    std::vector<const SourceDescriptor*> result;
    for (const auto& source : sources) {
        if (chunk.excluded.count(source.source_id) == 0 && source.has_range(plan.content_id, chunk.range)) {
            result.push_back(&source);
        }
    }
    return result;
}

bool ChunkAllocator::has_eligible_source(const ChunkPlan& plan, uint32_t index,
                                         const std::vector<SourceDescriptor>& sources) const {
    if (index >= plan.chunks.size()) {
        return false;
    }
    return !eligible(plan, plan.chunks[index], sources).empty();
}

bool ChunkAllocator::in_endgame(const ChunkPlan& plan) const {
    const size_t remaining = plan.remaining();
    return config_.endgame_threshold > 0 && remaining > 0 &&
           remaining <= config_.endgame_threshold && plan.pending() == 0;
}

ChunkPlan ChunkAllocator::plan_chunks(const std::string& content_id, uint64_t total_bytes,
                                      const std::vector<SourceDescriptor>& sources) const {
    ChunkPlan plan;
    plan.content_id = content_id;
    plan.total_bytes = total_bytes;
    plan.chunk_size = std::max<uint64_t>(chunk_size_for(total_bytes), 1);

    for (uint64_t offset = 0; offset < total_bytes; offset += plan.chunk_size) {
        Chunk chunk;
        chunk.index = static_cast<uint32_t>(plan.chunks.size());
        chunk.range = {offset, std::min(plan.chunk_size, total_bytes - offset)};
        plan.chunks.push_back(std::move(chunk));
    }

    // Rarest first: fewest holders, then lowest index
    std::vector<std::pair<size_t, uint32_t>> order;
    std::vector<std::vector<const SourceDescriptor*>> holders(plan.chunks.size());
    for (const auto& chunk : plan.chunks) {
        holders[chunk.index] = eligible(plan, chunk, sources);
        order.emplace_back(holders[chunk.index].size(), chunk.index);
    }
    std::sort(order.begin(), order.end());

    std::map<std::string, uint32_t> load;
    size_t unassigned = 0;
    for (const auto& [count, index] : order) {
        const auto* source = pick_least_loaded(holders[index], load);
        if (!source) {
            unassigned++;
            continue;
        }
        plan.chunks[index].assigned_source = source->source_id;
        load[source->source_id]++;
    }

    Logger::instance().debug("Planned {} chunks of {} bytes for {} across {} sources ({} without a holder)",
                             plan.chunks.size(), plan.chunk_size, content_id, load.size(), unassigned);
    return plan;
}

std::vector<ChunkCheckout> ChunkAllocator::dispatch(ChunkPlan& plan,
                                                    const std::vector<SourceDescriptor>& sources) const {
    std::vector<ChunkCheckout> checkouts;

    std::map<std::string, uint32_t> in_flight;
    for (const auto& source : sources) {
        in_flight[source.source_id] = source.in_flight;
    }
    auto has_capacity = [&](const SourceDescriptor* source) {
        return in_flight[source->source_id] < config_.max_inflight_per_source;
    };

    // Pending chunks, rarest first
    std::vector<std::pair<size_t, uint32_t>> order;
    std::vector<std::vector<const SourceDescriptor*>> holders(plan.chunks.size());
    for (const auto& chunk : plan.chunks) {
        if (chunk.status != ChunkStatus::Pending) {
            continue;
        }
        holders[chunk.index] = eligible(plan, chunk, sources);
        order.emplace_back(holders[chunk.index].size(), chunk.index);
    }
    std::sort(order.begin(), order.end());

    for (const auto& [count, index] : order) {
        Chunk& chunk = plan.chunks[index];
        if (count == 0) {
            chunk.assigned_source.clear();
            continue;
        }

        std::vector<const SourceDescriptor*> free;
        const SourceDescriptor* chosen = nullptr;
        for (const auto* source : holders[index]) {
            if (!has_capacity(source)) {
                continue;
            }
            if (source->source_id == chunk.assigned_source) {
                chosen = source;
            }
            free.push_back(source);
        }
        if (!chosen) {
            chosen = pick_least_loaded(free, in_flight);
        }
        if (!chosen) {
            continue;   // every holder busy
        }

        chunk.assigned_source = chosen->source_id;
        chunk.status = ChunkStatus::InFlight;
        chunk.active_sources = {chosen->source_id};
        in_flight[chosen->source_id]++;

        checkouts.push_back({chunk.index, chosen->source_id,
                             {chunk.range.offset + chunk.bytes_done, chunk.range.length - chunk.bytes_done},
                             chunk.bytes_done, false});
    }

    if (!in_endgame(plan)) {
        return checkouts;
    }

    for (auto& chunk : plan.chunks) {
        if (chunk.status != ChunkStatus::InFlight) {
            continue;
        }
        while (chunk.active_sources.size() < std::max<uint32_t>(config_.endgame_max_sources, 1)) {
            std::vector<const SourceDescriptor*> idle;
            for (const auto* source : eligible(plan, chunk, sources)) {
                if (!chunk.is_active_on(source->source_id) && has_capacity(source)) {
                    idle.push_back(source);
                }
            }
            const auto* extra = pick_least_loaded(idle, in_flight);
            if (!extra) {
                break;
            }
            chunk.active_sources.push_back(extra->source_id);
            in_flight[extra->source_id]++;
            checkouts.push_back({chunk.index, extra->source_id,
                                 {chunk.range.offset + chunk.bytes_done, chunk.range.length - chunk.bytes_done},
                                 chunk.bytes_done, true});
            Logger::instance().debug("Endgame: chunk {} of {} duplicated onto {}",
                                     chunk.index, plan.content_id, extra->source_id);
        }
    }
    return checkouts;
}

ChunkCompletion ChunkAllocator::complete_chunk(ChunkPlan& plan, uint32_t index,
                                               const std::string& source_id) const {
    ChunkCompletion result;
    if (index >= plan.chunks.size()) {
        return result;
    }
    Chunk& chunk = plan.chunks[index];
    if (chunk.status == ChunkStatus::Completed || !chunk.is_active_on(source_id)) {
        return result;
    }

    result.accepted = true;
    for (const auto& other : chunk.active_sources) {
        if (other != source_id) {
            result.losers.push_back(other);
        }
    }
    chunk.status = ChunkStatus::Completed;
    chunk.completed_by = source_id;
    chunk.bytes_done = chunk.range.length;
    chunk.active_sources.clear();
    return result;
}

void ChunkAllocator::record_progress(ChunkPlan& plan, uint32_t index, uint64_t bytes_in_chunk) const {
    if (index >= plan.chunks.size()) {
        return;
    }
    Chunk& chunk = plan.chunks[index];
    if (chunk.status == ChunkStatus::Completed) {
        return;
    }
    chunk.bytes_done = std::max(chunk.bytes_done, std::min(bytes_in_chunk, chunk.range.length));
}

std::optional<std::string> ChunkAllocator::fail_chunk(ChunkPlan& plan, uint32_t index, const std::string& source_id,
                                                      const std::vector<SourceDescriptor>& sources) const {
    if (index >= plan.chunks.size()) {
        return std::nullopt;
    }
    Chunk& chunk = plan.chunks[index];
    if (chunk.status == ChunkStatus::Completed) {
        return chunk.completed_by;
    }

    drop_active(chunk, source_id);
    chunk.excluded.insert(source_id);
    chunk.failures++;

    if (!chunk.active_sources.empty()) {
        // An endgame duplicate is still working on it
        chunk.assigned_source = chunk.active_sources.front();
        return chunk.assigned_source;
    }

    chunk.status = ChunkStatus::Pending;
    std::map<std::string, uint32_t> load;
    for (const auto& source : sources) {
        load[source.source_id] = source.in_flight;
    }
    const auto* next = pick_least_loaded(eligible(plan, chunk, sources), load);
    if (!next) {
        chunk.assigned_source.clear();
        Logger::instance().warning("Chunk {} of {} has no source left after {} failed",
                                   index, plan.content_id, source_id);
        return std::nullopt;
    }
    chunk.assigned_source = next->source_id;
    Logger::instance().info("Chunk {} of {} reassigned from {} to {}",
                            index, plan.content_id, source_id, next->source_id);
    return chunk.assigned_source;
}

std::optional<std::string> ChunkAllocator::reassign_stalled(ChunkPlan& plan, uint32_t index, const std::string& from,
                                                            const std::vector<SourceDescriptor>& sources) const {
    if (index >= plan.chunks.size()) {
        return std::nullopt;
    }
    Chunk& chunk = plan.chunks[index];
    if (chunk.status != ChunkStatus::InFlight || !chunk.is_active_on(from)) {
        return std::nullopt;
    }

    if (chunk.active_sources.size() > 1) {
        drop_active(chunk, from);
        chunk.excluded.insert(from);
        chunk.assigned_source = chunk.active_sources.front();
        return chunk.assigned_source;
    }

    std::map<std::string, uint32_t> load;
    std::vector<const SourceDescriptor*> free;
    for (const auto& source : sources) {
        load[source.source_id] = source.in_flight;
    }
    for (const auto* source : eligible(plan, chunk, sources)) {
        if (source->source_id != from && source->in_flight < config_.max_inflight_per_source) {
            free.push_back(source);
        }
    }
    const auto* next = pick_least_loaded(free, load);
    if (!next) {
        return std::nullopt;
    }

    drop_active(chunk, from);
    chunk.excluded.insert(from);
    chunk.status = ChunkStatus::Pending;
    chunk.assigned_source = next->source_id;
    Logger::instance().info("Stalled chunk {} of {} moved from {} to {}",
                            index, plan.content_id, from, next->source_id);
    return chunk.assigned_source;
}

std::vector<std::pair<uint32_t, std::string>> ChunkAllocator::release_all(ChunkPlan& plan) const {
    std::vector<std::pair<uint32_t, std::string>> released;
    for (auto& chunk : plan.chunks) {
        if (chunk.status != ChunkStatus::InFlight) {
            continue;
        }
        for (const auto& source : chunk.active_sources) {
            released.emplace_back(chunk.index, source);
        }
        chunk.active_sources.clear();
        chunk.status = ChunkStatus::Pending;
    }
    return released;
}

void ChunkAllocator::clear_exclusions(ChunkPlan& plan) const {
    for (auto& chunk : plan.chunks) {
        chunk.excluded.clear();
    }
}

} // namespace lanflow
