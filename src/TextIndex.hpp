#pragma once
#include <cstddef>
#include <string>
#include <boost/serialization/access.hpp>
#include <boost/serialization/array.hpp>
#include "CheckpointIndex.hpp"
#include "ContentDigest.hpp"
#include "LineIndex.hpp"

enum class TextFileMode {
    // cheapest: character and byte queries only
    NoLineIndex,
    // also record every line, enabling line-based queries
    WithLineIndex
};

// Everything learned from the one streaming scan of a source file. This is the
// unit persisted to an index cache.
class TextIndex {
public:
    TextIndex() = default;

    // Decodes the file once, building checkpoints, lines and the SHA-256 digest.
    // Throws EmptyTextError, InvalidEncodingError or IoError.
    static TextIndex build(const std::string& path, TextFileMode mode,
                           size_t checkpointInterval = kDefaultCheckpointInterval);

    size_t totalChars() const { return checkpoints_.totalChars(); }
    size_t totalBytes() const { return checkpoints_.totalBytes(); }
    const Digest& digest() const { return digest_; }
    const CheckpointIndex& checkpoints() const { return checkpoints_; }

    bool hasLineIndex() const { return hasLines_; }
    // Throws LineIndexDisabledError when lines were not indexed.
    const LineIndex& lines() const;
    void dropLineIndex();

    // Structural checks on a decoded index; throws DecodeError.
    void validate() const;

private:
    friend class boost::serialization::access;

    template <class Archive>
    void serialize(Archive& ar, const unsigned int /*version*/) {
        ar & digest_;
        ar & checkpoints_;
        ar & hasLines_;
        ar & lines_;
    }

    Digest digest_{};
    CheckpointIndex checkpoints_;
    bool hasLines_ = false;
    LineIndex lines_;
};
