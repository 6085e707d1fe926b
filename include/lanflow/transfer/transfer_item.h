#ifndef LANFLOW_TRANSFER_TRANSFER_ITEM_H
#define LANFLOW_TRANSFER_TRANSFER_ITEM_H

#include "lanflow/base/clock.h"
#include "lanflow/base/error_code.h"
#include "lanflow/p2p/chunk_allocator.h"
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace lanflow {

using TransferId = uint64_t;

enum class TransferStatus {
    Queued,
    Active,
    Stalled,
    Completed,
    Failed,
    Cancelled
};

const char* to_string(TransferStatus status);
std::optional<TransferStatus> transfer_status_from_string(std::string_view name);

// Completed, Failed and Cancelled accept no further transitions
bool is_terminal(TransferStatus status);

// Input to TransferScheduler::submit
struct TransferSpec {
    std::string display_name;
    uint64_t total_bytes = 0;
    bool encrypted = false;
    std::string content_id;             // defaults to display_name
    std::vector<std::string> sources;   // non-empty: multi-source transfer
};

struct TransferItem {
    TransferId id = 0;
    std::string display_name;
    std::string content_id;
    uint64_t total_bytes = 0;
    bool encrypted = false;

    TransferStatus status = TransferStatus::Queued;
    uint64_t bytes_transferred = 0;
    TimePoint last_progress_at{};
    bool retry_priority = false;
    bool paused = false;   // queued but held back from admission
    uint32_t attempts = 0;

    // Watchdog bookkeeping
    uint32_t stall_polls = 0;
    TimePoint stalled_since{};

    ErrorCode last_error = ErrorCode::Success;
    std::string error_message;

    std::vector<std::string> sources;
    std::optional<ChunkPlan> chunk_plan;

    TimePoint created_at{};
    TimePoint started_at{};
    TimePoint finished_at{};

    bool multi_source() const { return !sources.empty(); }
    double progress_percent() const;
};

} // namespace lanflow

#endif // LANFLOW_TRANSFER_TRANSFER_ITEM_H
