#include "lanflow/transfer/transfer_item.h"

namespace lanflow {

const char* to_string(TransferStatus status) {
    switch (status) {
        case TransferStatus::Queued: return "queued";
        case TransferStatus::Active: return "active";
        case TransferStatus::Stalled: return "stalled";
        case TransferStatus::Completed: return "completed";
        case TransferStatus::Failed: return "failed";
        case TransferStatus::Cancelled: return "cancelled";
    }
    return "unknown";
}

std::optional<TransferStatus> transfer_status_from_string(std::string_view name) {
    if (name == "queued") return TransferStatus::Queued;
    if (name == "active") return TransferStatus::Active;
    if (name == "stalled") return TransferStatus::Stalled;
    if (name == "completed") return TransferStatus::Completed;
    if (name == "failed") return TransferStatus::Failed;
    if (name == "cancelled") return TransferStatus::Cancelled;
    return std::nullopt;
}

bool is_terminal(TransferStatus status) {
    switch (status) {
        case TransferStatus::Completed:
        case TransferStatus::Failed:
        case TransferStatus::Cancelled:
            return true;
        case TransferStatus::Queued:
        case TransferStatus::Active:
        case TransferStatus::Stalled:
            return false;
    }
    return false;
}

double TransferItem::progress_percent() const {
    if (total_bytes == 0) {
        return 0.0;
    }
    return static_cast<double>(bytes_transferred) * 100.0 / static_cast<double>(total_bytes);
}

} // namespace lanflow
