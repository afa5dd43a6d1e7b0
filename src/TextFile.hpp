#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include "FrameStore.hpp"
#include "RangeResolver.hpp"
#include "SourceFile.hpp"
#include "TextIndex.hpp"

// A UTF-8 text file on disk, queried by character, line or byte range.
//
// Construction indexes the file (or reuses a verified cache), so every TextFile is
// ready to serve reads. Excerpts are loaded into frames on demand; the returned
// string_views point into those frames and stay valid until the TextFile is destroyed.
//
// Non-const members may load frames; const members only read what is already loaded
// and throw FrameNotLoadedError otherwise. There is no internal locking.
// The file must not change on disk while a TextFile refers to it.
class TextFile {
public:
    // cachePath, if given, is used to skip the scan when its digest matches the
    // file, and is (re)written whenever the index had to be built.
    explicit TextFile(const std::string& path,
                      const std::optional<std::string>& cachePath = std::nullopt,
                      TextFileMode mode = TextFileMode::WithLineIndex,
                      size_t checkpointInterval = kDefaultCheckpointInterval);

    TextFile(const TextFile&) = delete;
    TextFile& operator=(const TextFile&) = delete;

    // Character ranges: negative values count from the end, end == 0 means the end.
    std::string_view getOrLoad(int64_t begin, int64_t end);
    std::string_view get(int64_t begin, int64_t end) const;
    void load(int64_t begin, int64_t end);

    // Line ranges (0-based, end exclusive); terminators are part of their line.
    std::string_view getOrLoadLines(int64_t begin, int64_t end);
    std::string_view getLines(int64_t begin, int64_t end) const;

    // Byte ranges; both ends must fall on character boundaries.
    std::string_view getOrLoadBytes(size_t begin, size_t end);
    std::string_view getBytes(size_t begin, size_t end) const;

    size_t length() const { return index_.totalChars(); }
    size_t byteLength() const { return index_.totalBytes(); }
    size_t lineCount() const { return index_.lines().lineCount(); }
    bool hasLineIndex() const { return index_.hasLineIndex(); }

    size_t charToByte(size_t charOffset) const;
    ResolvedRange lineRangeToCharRange(int64_t begin, int64_t end) const;
    ResolvedRange lineRangeToByteRange(int64_t begin, int64_t end) const;

    void saveIndex(const std::string& cachePath) const;

    const std::string& path() const { return source_.path(); }
    // Unix timestamp of the last modification at open time.
    int64_t mtime() const { return mtime_; }
    const Digest& checksum() const { return index_.digest(); }
    std::string checksumHex() const { return digest_to_hex(index_.digest()); }

    size_t frameCount() const { return frames_.size(); }
    bool indexLoadedFromCache() const { return fromCache_; }
    // Why an existing cache file was not used; empty if none was rejected.
    const std::string& cacheRejectionReason() const { return cacheRejection_; }

private:
    ResolvedRange charRangeToBytes(const ResolvedRange& chars) const;
    void checkByteRange(size_t begin, size_t end) const;
    void checkBoundaryOnDisk(size_t offset) const;
    std::string_view getOrLoadByteRange(size_t beginByte, size_t endByte);

    SourceFile source_;
    TextIndex index_;
    FrameStore frames_;
    int64_t mtime_ = 0;
    bool fromCache_ = false;
    std::string cacheRejection_;
};
