#pragma once
#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>

// Base for every error raised by a TextFile and its indices.
class TextFrameError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class EmptyTextError : public TextFrameError {
public:
    EmptyTextError() : TextFrameError("text is empty") {}
};

class InvalidEncodingError : public TextFrameError {
public:
    explicit InvalidEncodingError(size_t offset)
        : TextFrameError("invalid UTF-8 at byte offset " + std::to_string(offset)), offset_(offset) {}
    size_t offset() const { return offset_; }
private:
    size_t offset_;
};

class OffsetOutOfBoundsError : public TextFrameError {
public:
    OffsetOutOfBoundsError(int64_t requested, size_t total)
        : TextFrameError("offset " + std::to_string(requested) + " out of bounds (total " + std::to_string(total) + ")"),
          requested_(requested), total_(total) {}
    int64_t requested() const { return requested_; }
    size_t total() const { return total_; }
private:
    int64_t requested_;
    size_t total_;
};

class InvertedRangeError : public TextFrameError {
public:
    InvertedRangeError(size_t begin, size_t end)
        : TextFrameError("inverted range (" + std::to_string(begin) + "," + std::to_string(end) + ")"),
          begin_(begin), end_(end) {}
    size_t begin() const { return begin_; }
    size_t end() const { return end_; }
private:
    size_t begin_;
    size_t end_;
};

class LineOutOfBoundsError : public TextFrameError {
public:
    LineOutOfBoundsError(int64_t requested, size_t total)
        : TextFrameError("line " + std::to_string(requested) + " out of bounds (total " + std::to_string(total) + ")"),
          requested_(requested), total_(total) {}
    int64_t requested() const { return requested_; }
    size_t total() const { return total_; }
private:
    int64_t requested_;
    size_t total_;
};

class LineIndexDisabledError : public TextFrameError {
public:
    LineIndexDisabledError() : TextFrameError("no line index enabled") {}
};

class MisalignedByteOffsetError : public TextFrameError {
public:
    explicit MisalignedByteOffsetError(size_t offset)
        : TextFrameError("byte offset " + std::to_string(offset) + " is not on a character boundary"), offset_(offset) {}
    size_t offset() const { return offset_; }
private:
    size_t offset_;
};

class FrameNotLoadedError : public TextFrameError {
public:
    FrameNotLoadedError(size_t beginByte, size_t endByte)
        : TextFrameError("text not loaded (bytes " + std::to_string(beginByte) + "-" + std::to_string(endByte) + ")") {}
};

// Raised while validating a cached index; TextFile recovers by rebuilding.
class StaleCacheError : public TextFrameError {
public:
    explicit StaleCacheError(const std::string& reason) : TextFrameError("stale index cache: " + reason) {}
};

class DecodeError : public TextFrameError {
public:
    explicit DecodeError(const std::string& reason) : TextFrameError("cannot decode index cache: " + reason) {}
};

class IoError : public TextFrameError {
public:
    using TextFrameError::TextFrameError;
};
