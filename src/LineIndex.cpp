#include "LineIndex.hpp"
#include "TextFrameErrors.hpp"
#include <string>

LineIndex::LineIndex(std::vector<LineEntry> entries) : entries_(std::move(entries)) {}

ResolvedRange LineIndex::resolveLineRange(int64_t begin, int64_t end) const {
    return resolve_range(begin, end, entries_.size(), RangeUnit::Lines);
}

ResolvedRange LineIndex::toCharRange(int64_t begin, int64_t end) const {
    ResolvedRange lines = resolveLineRange(begin, end);
    // line i starts where line i-1 ends; line == count is the end of the text
    auto boundary = [this](size_t line) -> size_t {
        return line == 0 ? 0 : static_cast<size_t>(entries_[line - 1].endChar);
    };
    return ResolvedRange{boundary(lines.begin), boundary(lines.end)};
}

ResolvedRange LineIndex::toByteRange(int64_t begin, int64_t end) const {
    ResolvedRange lines = resolveLineRange(begin, end);
    auto boundary = [this](size_t line) -> size_t {
        return line == 0 ? 0 : static_cast<size_t>(entries_[line - 1].endByte);
    };
    return ResolvedRange{boundary(lines.begin), boundary(lines.end)};
}

void LineIndex::validate(size_t totalChars, size_t totalBytes) const {
    if (entries_.empty()) throw DecodeError("empty line index");
    uint64_t prevChar = 0, prevByte = 0;
    for (size_t i = 0; i < entries_.size(); ++i) {
        const LineEntry& e = entries_[i];
        if (e.lineNumber != i || e.startChar != prevChar || e.startByte != prevByte ||
            e.endChar <= e.startChar || e.endByte <= e.startByte) {
            throw DecodeError("line " + std::to_string(i) + " is not contiguous");
        }
        prevChar = e.endChar;
        prevByte = e.endByte;
    }
    if (prevChar != totalChars || prevByte != totalBytes) {
        throw DecodeError("line index does not cover the text");
    }
}

void LineIndexBuilder::addChar(size_t charOffset, size_t byteOffset, unsigned width, bool terminator) {
    if (!open_) {
        current_.lineNumber = entries_.size();
        current_.startChar = charOffset;
        current_.startByte = byteOffset;
        open_ = true;
    }
    if (terminator) {
        current_.endChar = charOffset + 1;
        current_.endByte = byteOffset + width;
        entries_.push_back(current_);
        open_ = false;
    }
}

LineIndex LineIndexBuilder::finish(size_t totalChars, size_t totalBytes) {
    if (open_) {
        current_.endChar = totalChars;
        current_.endByte = totalBytes;
        entries_.push_back(current_);
        open_ = false;
    }
    return LineIndex(std::move(entries_));
}
