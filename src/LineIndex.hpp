#pragma once
#include <cstddef>
#include <cstdint>
#include <vector>
#include <boost/serialization/access.hpp>
#include <boost/serialization/vector.hpp>
#include "RangeResolver.hpp"

// One line of the text, end offsets exclusive. A line owns the '\n' that ends it.
struct LineEntry {
    uint64_t lineNumber = 0;
    uint64_t startChar = 0;
    uint64_t endChar = 0;
    uint64_t startByte = 0;
    uint64_t endByte = 0;

    template <class Archive>
    void serialize(Archive& ar, const unsigned int /*version*/) {
        ar & lineNumber;
        ar & startChar;
        ar & endChar;
        ar & startByte;
        ar & endByte;
    }
};

class LineIndex {
public:
    LineIndex() = default;
    explicit LineIndex(std::vector<LineEntry> entries);

    size_t lineCount() const { return entries_.size(); }
    const std::vector<LineEntry>& entries() const { return entries_; }

    // Line numbers after negative/zero-end resolution; throws LineOutOfBoundsError.
    ResolvedRange resolveLineRange(int64_t begin, int64_t end) const;

    ResolvedRange toCharRange(int64_t begin, int64_t end) const;
    ResolvedRange toByteRange(int64_t begin, int64_t end) const;

    void validate(size_t totalChars, size_t totalBytes) const;

private:
    friend class boost::serialization::access;

    template <class Archive>
    void serialize(Archive& ar, const unsigned int /*version*/) {
        ar & entries_;
    }

    std::vector<LineEntry> entries_;
};

class LineIndexBuilder {
public:
    void addChar(size_t charOffset, size_t byteOffset, unsigned width, bool terminator);
    LineIndex finish(size_t totalChars, size_t totalBytes);

private:
    bool open_ = false;
    LineEntry current_;
    std::vector<LineEntry> entries_;
};
