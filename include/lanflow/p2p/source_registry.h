#ifndef LANFLOW_P2P_SOURCE_REGISTRY_H
#define LANFLOW_P2P_SOURCE_REGISTRY_H

#include "lanflow/base/clock.h"
#include "lanflow/base/config.h"
#include "lanflow/p2p/byte_range.h"
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace lanflow {

// A peer able to serve byte ranges of one or more items
struct SourceDescriptor {
    std::string source_id;
    std::string address;
    double measured_bandwidth_mbps = 0.0;   // EWMA of observed chunk throughput
    double reliability_score = 1.0;         // decayed success ratio, always in [0, 1]

    // content id -> ranges this source can serve
    std::unordered_map<std::string, ByteRangeSet> available;

    uint32_t attempts = 0;
    uint32_t successes = 0;
    uint32_t consecutive_failures = 0;
    uint32_t in_flight = 0;
    TimePoint last_seen{};

    bool has_range(const std::string& content_id, const ByteRange& range) const;
};

// Outcome of record_outcome()
enum class SourceVerdict {
    Kept,
    Removed,   // hit max_consecutive_failures
    Unknown
};

// Bookkeeping for every source the scheduler may pull chunks from.
// Not thread-safe: owned by the scheduler and used under its lock.
class SourceRegistry {
public:
    explicit SourceRegistry(const SourceConfig& config);
    ~SourceRegistry();

    SourceRegistry(SourceRegistry&&) noexcept;
    SourceRegistry& operator=(SourceRegistry&&) noexcept;

    // Returns true for a new source. A known source keeps its statistics and
    // takes the new address, bandwidth hint and availability.
    bool register_source(const SourceDescriptor& desc, TimePoint now);

    bool remove_source(const std::string& source_id);

    // Replaces the ranges the source serves for `content_id`
    bool update_availability(const std::string& source_id, const std::string& content_id,
                             const ByteRangeSet& ranges, TimePoint now);

    SourceVerdict record_outcome(const std::string& source_id, bool success);

    bool record_bandwidth(const std::string& source_id, double mbps);

    bool touch(const std::string& source_id, TimePoint now);

    // Drops sources not seen for stale_timeout_sec, returns their ids
    std::vector<std::string> evict_stale(TimePoint now);

    bool acquire(const std::string& source_id);
    void release(const std::string& source_id);

    std::optional<SourceDescriptor> get(const std::string& source_id) const;
    bool contains(const std::string& source_id) const;

    // All sources ordered by id
    std::vector<SourceDescriptor> snapshot() const;

    // Ids of sources that can serve `range` of `content_id`, ordered by id
    std::vector<std::string> holders_of(const std::string& content_id, const ByteRange& range) const;

    size_t size() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace lanflow

#endif // LANFLOW_P2P_SOURCE_REGISTRY_H
