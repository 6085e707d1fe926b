#ifndef LANFLOW_TRANSFER_TRANSFER_QUEUE_H
#define LANFLOW_TRANSFER_TRANSFER_QUEUE_H

#include "lanflow/transfer/transfer_item.h"
#include <cstdint>
#include <optional>
#include <set>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace lanflow {

struct QueueEntry {
    TransferId id = 0;
    bool retry_priority = false;
    bool encrypted = false;
    uint64_t total_bytes = 0;
    uint64_t sequence = 0;   // insertion order, assigned by the queue
};

// Staged ordering: retry-priority, then encrypted, then smaller size, then FIFO
struct QueueOrder {
    bool operator()(const QueueEntry& a, const QueueEntry& b) const;
};

// Items waiting for an Active slot. Held (paused) entries keep their place
// but are skipped by pop_next(). Pure data structure, no locking.
class TransferQueue {
public:
    // Re-inserting a queued id moves it to its new position
    void insert(const TransferItem& item);

    std::optional<QueueEntry> pop_next();
    std::optional<QueueEntry> peek() const;

    bool remove(TransferId id);
    bool contains(TransferId id) const;

    bool set_held(TransferId id, bool held);
    bool held(TransferId id) const { return held_.count(id) > 0; }

    size_t size() const { return entries_.size(); }
    size_t ready_count() const { return entries_.size() - held_.size(); }
    bool empty() const { return entries_.empty(); }
    void clear();

    // Ids in pop order
    std::vector<TransferId> ordered_ids() const;

private:
    std::set<QueueEntry, QueueOrder> entries_;
    std::unordered_map<TransferId, QueueEntry> index_;
    std::unordered_set<TransferId> held_;
    uint64_t next_sequence_ = 0;
};

} // namespace lanflow

#endif // LANFLOW_TRANSFER_TRANSFER_QUEUE_H
