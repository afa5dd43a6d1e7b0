#pragma once
#include <cstddef>
#include <cstdint>
#include <string_view>
#include <vector>
#include <boost/serialization/access.hpp>
#include <boost/serialization/vector.hpp>

class SourceFile;

constexpr size_t kDefaultCheckpointInterval = 4096;

// A sampled (character offset, byte offset) pair. 'width' is the byte width shared by
// every character up to the next checkpoint, or 0 when widths are mixed.
struct Checkpoint {
    uint64_t charOffset = 0;
    uint64_t byteOffset = 0;
    uint8_t width = 0;

    template <class Archive>
    void serialize(Archive& ar, const unsigned int /*version*/) {
        ar & charOffset;
        ar & byteOffset;
        ar & width;
    }
};

class CheckpointIndex {
public:
    CheckpointIndex() = default;
    CheckpointIndex(std::vector<Checkpoint> checkpoints, size_t totalChars, size_t totalBytes);

    // Exact byte offset of a character offset. Decodes at most one checkpoint
    // interval of the source when the covering block has mixed widths.
    size_t resolve(size_t charOffset, const SourceFile& source) const;

    // Same result without I/O: 'text' holds the source from (textChar, textByte) onwards
    // and must reach charOffset.
    size_t resolveInMemory(size_t charOffset, size_t textChar, size_t textByte, std::string_view text) const;

    // Character offset of a byte offset that lies on a character boundary.
    size_t charOffsetOf(size_t byteOffset, const SourceFile& source) const;

    const std::vector<Checkpoint>& checkpoints() const { return checkpoints_; }
    size_t totalChars() const { return totalChars_; }
    size_t totalBytes() const { return totalBytes_; }

    // Structural sanity of a decoded index; throws DecodeError.
    void validate() const;

private:
    friend class boost::serialization::access;

    // Checkpoint covering charOffset; blockEnd receives the byte offset where its block ends.
    const Checkpoint& locate(size_t charOffset, size_t& blockEnd) const;

    template <class Archive>
    void serialize(Archive& ar, const unsigned int /*version*/) {
        ar & totalChars_;
        ar & totalBytes_;
        ar & checkpoints_;
    }

    std::vector<Checkpoint> checkpoints_;
    uint64_t totalChars_ = 0;
    uint64_t totalBytes_ = 0;
};

// Fed one character at a time by the scan.
class CheckpointBuilder {
public:
    explicit CheckpointBuilder(size_t interval = kDefaultCheckpointInterval);

    void addChar(size_t byteOffset, unsigned width);
    CheckpointIndex finish(size_t totalBytes);

private:
    size_t interval_;
    size_t chars_ = 0;
    std::vector<Checkpoint> checkpoints_;
};
