#ifndef LANFLOW_TRANSFER_TRANSPORT_H
#define LANFLOW_TRANSFER_TRANSPORT_H

#include "lanflow/transfer/progress_channel.h"
#include "lanflow/transfer/transfer_item.h"
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace lanflow {

using TransferHandle = uint64_t;

// One byte range of one item, from one source
struct TransferRequest {
    TransferId item_id = 0;
    std::string display_name;
    std::string content_id;
    bool encrypted = false;
    uint64_t offset = 0;
    uint64_t length = 0;
    std::string source_id;                 // empty: the item's origin
    std::optional<uint32_t> chunk_index;
    std::shared_ptr<ProgressChannel> channel;
};

// Moves bytes. Implementations report through request.channel from any
// thread and must not call back into the scheduler.
class Transport {
public:
    virtual ~Transport() = default;

    // May throw; the scheduler counts that as a failed attempt
    virtual TransferHandle start_transfer(const TransferRequest& request) = 0;

    virtual void cancel_transfer(TransferHandle handle) = 0;

    // Ask for a fresh progress report
    virtual void poll_progress(TransferHandle handle) = 0;
};

} // namespace lanflow

#endif // LANFLOW_TRANSFER_TRANSPORT_H
