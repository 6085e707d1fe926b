#ifndef LANFLOW_P2P_BYTE_RANGE_H
#define LANFLOW_P2P_BYTE_RANGE_H

#include <cstdint>
#include <string>
#include <vector>

namespace lanflow {

// Half-open byte interval [offset, offset + length)
struct ByteRange {
    uint64_t offset = 0;
    uint64_t length = 0;

    uint64_t end() const { return offset + length; }
    bool empty() const { return length == 0; }
    bool contains(const ByteRange& other) const {
        return other.offset >= offset && other.end() <= end();
    }
    bool overlaps(const ByteRange& other) const {
        return offset < other.end() && other.offset < end();
    }
    bool operator==(const ByteRange& other) const {
        return offset == other.offset && length == other.length;
    }
};

// Sorted, merged set of ranges a source can serve for one piece of content
class ByteRangeSet {
public:
    ByteRangeSet() = default;
    ByteRangeSet(std::initializer_list<ByteRange> ranges);

    static ByteRangeSet full(uint64_t size);

    void add(const ByteRange& range);
    void clear() { ranges_.clear(); }

    // True when a single stored range contains all of `range`
    bool covers(const ByteRange& range) const;

    bool empty() const { return ranges_.empty(); }
    uint64_t total_bytes() const;
    const std::vector<ByteRange>& ranges() const { return ranges_; }

    std::string to_string() const;

private:
    std::vector<ByteRange> ranges_;
};

} // namespace lanflow

#endif // LANFLOW_P2P_BYTE_RANGE_H
