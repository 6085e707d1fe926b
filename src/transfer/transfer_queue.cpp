#include "lanflow/transfer/transfer_queue.h"

namespace lanflow {

bool QueueOrder::operator()(const QueueEntry& a, const QueueEntry& b) const {
    if (a.retry_priority != b.retry_priority) {
        return a.retry_priority;
    }
    if (a.encrypted != b.encrypted) {
        return a.encrypted;
    }
    if (a.total_bytes != b.total_bytes) {
        return a.total_bytes < b.total_bytes;
    }
    return a.sequence < b.sequence;
}

void TransferQueue::insert(const TransferItem& item) {
    remove(item.id);

    QueueEntry entry;
    entry.id = item.id;
    entry.retry_priority = item.retry_priority;
    entry.encrypted = item.encrypted;
    entry.total_bytes = item.total_bytes;
    entry.sequence = next_sequence_++;

    entries_.insert(entry);
    index_[item.id] = entry;
}

std::optional<QueueEntry> TransferQueue::pop_next() {
    for (auto it = entries_.begin(); it != entries_.end(); ++it) {
        if (held_.count(it->id)) {
            continue;
        }
        QueueEntry entry = *it;
        entries_.erase(it);
        index_.erase(entry.id);
        return entry;
    }
    return std::nullopt;
}

std::optional<QueueEntry> TransferQueue::peek() const {
    for (const auto& entry : entries_) {
        if (!held_.count(entry.id)) {
            return entry;
        }
    }
    return std::nullopt;
}

bool TransferQueue::remove(TransferId id) {
    auto it = index_.find(id);
    if (it == index_.end()) {
        return false;
    }
    entries_.erase(it->second);
    index_.erase(it);
    held_.erase(id);
    return true;
}

bool TransferQueue::contains(TransferId id) const {
    return index_.count(id) > 0;
}

bool TransferQueue::set_held(TransferId id, bool held) {
    if (!contains(id)) {
        return false;
    }
    if (held) {
        held_.insert(id);
    } else {
        held_.erase(id);
    }
    return true;
}

void TransferQueue::clear() {
    entries_.clear();
    index_.clear();
    held_.clear();
}

std::vector<TransferId> TransferQueue::ordered_ids() const {
    std::vector<TransferId> ids;
    ids.reserve(entries_.size());
    for (const auto& entry : entries_) {
        ids.push_back(entry.id);
    }
    return ids;
}

} // namespace lanflow
