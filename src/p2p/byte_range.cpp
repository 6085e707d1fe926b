#include "lanflow/p2p/byte_range.h"
#include <algorithm>
#include <sstream>

namespace lanflow {

ByteRangeSet::ByteRangeSet(std::initializer_list<ByteRange> ranges) {
    for (const auto& range : ranges) {
        add(range);
    }
}

ByteRangeSet ByteRangeSet::full(uint64_t size) {
    ByteRangeSet set;
    set.add({0, size});
    return set;
}

void ByteRangeSet::add(const ByteRange& range) {
    if (range.empty()) {
        return;
    }

    auto pos = std::lower_bound(ranges_.begin(), ranges_.end(), range,
                                [](const ByteRange& a, const ByteRange& b) { return a.offset < b.offset; });
    pos = ranges_.insert(pos, range);

    // Merge with the previous range when touching or overlapping
    if (pos != ranges_.begin()) {
        auto prev = std::prev(pos);
        if (prev->end() >= pos->offset) {
            uint64_t end = std::max(prev->end(), pos->end());
            prev->length = end - prev->offset;
            pos = std::prev(ranges_.erase(pos));
        }
    }

    // Absorb following ranges
    auto next = std::next(pos);
    while (next != ranges_.end() && pos->end() >= next->offset) {
        uint64_t end = std::max(pos->end(), next->end());
        pos->length = end - pos->offset;
        next = ranges_.erase(next);
        pos = std::prev(next);
    }
}

bool ByteRangeSet::covers(const ByteRange& range) const {
    if (range.empty()) {
        return true;
    }
    // Last stored range starting at or before range.offset
    auto it = std::upper_bound(ranges_.begin(), ranges_.end(), range.offset,
                               [](uint64_t offset, const ByteRange& r) { return offset < r.offset; });
    if (it == ranges_.begin()) {
        return false;
    }
    return std::prev(it)->contains(range);
}

uint64_t ByteRangeSet::total_bytes() const {
    uint64_t total = 0;
    for (const auto& range : ranges_) {
        total += range.length;
    }
    return total;
}

std::string ByteRangeSet::to_string() const {
    std::ostringstream ss;
    ss << "[";
    for (size_t i = 0; i < ranges_.size(); ++i) {
        if (i > 0) ss << ", ";
        ss << ranges_[i].offset << "-" << ranges_[i].end();
    }
    ss << "]";
    return ss.str();
}

} // namespace lanflow
