#ifndef LANFLOW_TRANSFER_STATE_CODEC_H
#define LANFLOW_TRANSFER_STATE_CODEC_H

#include "lanflow/transfer/transfer_item.h"
#include <cstdint>
#include <string>
#include <vector>

namespace lanflow {

constexpr int STATE_FORMAT_VERSION = 1;

// Persistent part of the scheduler. Timestamps and open checkouts are not
// carried over; in-flight chunks come back as Pending.
struct SchedulerSnapshot {
    TransferId next_id = 1;
    uint32_t concurrency_limit = 0;
    std::vector<TransferItem> items;
    std::vector<TransferId> queue_order;
};

// JSON document
std::string encode_state(const SchedulerSnapshot& snapshot);

// Throws LanflowError: SerializationError for malformed input,
// InvalidState for a document that contradicts itself
SchedulerSnapshot decode_state(const std::string& data);

} // namespace lanflow

#endif // LANFLOW_TRANSFER_STATE_CODEC_H
