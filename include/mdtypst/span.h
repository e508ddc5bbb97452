#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace mdtypst {

enum class SpanKind : uint8_t {
    Inline = 0,       // $...$
    Display = 1,      // $$...$$
    TaggedBlock = 2   // fenced block whose info string is the code tag
};

inline const char* spanKindName(SpanKind kind) {
    switch (kind) {
    case SpanKind::Inline:      return "inline";
    case SpanKind::Display:     return "display";
    case SpanKind::TaggedBlock: return "tagged-block";
    }
    return "unknown";
}

// Half-open byte range [start, end) into the original document.
struct ByteRange {
    size_t start = 0;
    size_t end = 0;

    size_t size() const { return end - start; }
    bool empty() const { return end == start; }
    bool overlaps(const ByteRange& other) const {
        return start < other.end && other.start < end;
    }
    bool operator==(const ByteRange& other) const {
        return start == other.start && end == other.end;
    }
};

struct Span {
    SpanKind kind = SpanKind::Inline;
    ByteRange range;
    std::string rawContent;
};

} // namespace mdtypst
