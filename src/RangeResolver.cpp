#include "RangeResolver.hpp"
#include "TextFrameErrors.hpp"

namespace {

[[noreturn]] void out_of_bounds(int64_t requested, size_t total, RangeUnit unit) {
    if (unit == RangeUnit::Lines) throw LineOutOfBoundsError(requested, total);
    throw OffsetOutOfBoundsError(requested, total);
}

size_t resolve_one(int64_t value, size_t total, RangeUnit unit) {
    if (value >= 0) {
        if (static_cast<uint64_t>(value) > total) out_of_bounds(value, total, unit);
        return static_cast<size_t>(value);
    }
    // -value cannot overflow for anything above INT64_MIN
    if (value == INT64_MIN || static_cast<uint64_t>(-value) > total) out_of_bounds(value, total, unit);
    return total - static_cast<size_t>(-value);
}

}

ResolvedRange resolve_range(int64_t begin, int64_t end, size_t total, RangeUnit unit) {
    ResolvedRange range;
    range.begin = resolve_one(begin, total, unit);
    range.end = end == 0 ? total : resolve_one(end, total, unit);
    if (range.begin > range.end) {
        throw InvertedRangeError(range.begin, range.end);
    }
    return range;
}
