#pragma once
#include <cstddef>
#include <cstdint>

enum class RangeUnit {
    Characters,
    Lines
};

struct ResolvedRange {
    size_t begin;
    size_t end;
};

// Resolves a (begin, end) request against 'total' units, end exclusive.
//  - a negative value counts back from the end: total + value
//  - end == 0 means total, so (0,0) is the whole document and (-10,0) its last 10 units
//  - values resolving outside [0, total] throw OffsetOutOfBoundsError, or
//    LineOutOfBoundsError for RangeUnit::Lines; nothing is clamped
//  - begin > end after resolution throws InvertedRangeError
ResolvedRange resolve_range(int64_t begin, int64_t end, size_t total, RangeUnit unit = RangeUnit::Characters);
