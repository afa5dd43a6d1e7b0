#include "TextFile.hpp"
#include "IndexCache.hpp"
#include "TextFrameErrors.hpp"
#include "Utf8.hpp"
#include <chrono>
#include <filesystem>

namespace {

int64_t modification_time(const std::string& path) {
    std::error_code ec;
    auto written = std::filesystem::last_write_time(path, ec);
    if (ec) {
        throw IoError("cannot read modification time of " + path + ": " + ec.message());
    }
    // file_time_type has no portable epoch before C++20; rebase it on system_clock
    auto sinceNow = written - std::filesystem::file_time_type::clock::now();
    auto asSystem = std::chrono::system_clock::now() +
                    std::chrono::duration_cast<std::chrono::system_clock::duration>(sinceNow);
    return std::chrono::duration_cast<std::chrono::seconds>(asSystem.time_since_epoch()).count();
}

}

TextFile::TextFile(const std::string& path, const std::optional<std::string>& cachePath,
                   TextFileMode mode, size_t checkpointInterval)
    : source_(path) {
    if (source_.size() == 0) {
        throw EmptyTextError();
    }
    mtime_ = modification_time(path);

    if (cachePath) {
        try {
            std::optional<TextIndex> cached = load_index(*cachePath);
            if (cached) {
                if (cached->totalBytes() != source_.size()) {
                    throw StaleCacheError("size mismatch");
                }
                if (mode == TextFileMode::WithLineIndex && !cached->hasLineIndex()) {
                    throw StaleCacheError("cache has no line index");
                }
                // the digest is authoritative; no timestamp shortcut
                if (digest_file(path) != cached->digest()) {
                    throw StaleCacheError("digest mismatch");
                }
                if (mode == TextFileMode::NoLineIndex) {
                    cached->dropLineIndex();
                }
                index_ = std::move(*cached);
                fromCache_ = true;
            }
        } catch (const StaleCacheError& e) {
            cacheRejection_ = e.what();
        } catch (const DecodeError& e) {
            cacheRejection_ = e.what();
        }
    }

    if (!fromCache_) {
        index_ = TextIndex::build(path, mode, checkpointInterval);
        if (cachePath) {
            save_index(index_, *cachePath);
        }
    }
}

ResolvedRange TextFile::charRangeToBytes(const ResolvedRange& chars) const {
    const CheckpointIndex& checkpoints = index_.checkpoints();
    return ResolvedRange{checkpoints.resolve(chars.begin, source_), checkpoints.resolve(chars.end, source_)};
}

size_t TextFile::charToByte(size_t charOffset) const {
    return index_.checkpoints().resolve(charOffset, source_);
}

std::string_view TextFile::getOrLoad(int64_t begin, int64_t end) {
    ResolvedRange chars = resolve_range(begin, end, index_.totalChars());
    if (frames_.findCoveringChars(chars.begin, chars.end)) {
        return get(begin, end);
    }
    ResolvedRange bytes = charRangeToBytes(chars);
    return frames_.load(source_, bytes.begin, bytes.end, chars.begin, chars.end);
}

std::string_view TextFile::get(int64_t begin, int64_t end) const {
    ResolvedRange chars = resolve_range(begin, end, index_.totalChars());
    const Frame* frame = frames_.findCoveringChars(chars.begin, chars.end);
    if (!frame) {
        throw FrameNotLoadedError(chars.begin, chars.end);
    }
    // resolve against the frame's own bytes so a loaded excerpt never touches the disk
    const CheckpointIndex& checkpoints = index_.checkpoints();
    size_t beginByte = checkpoints.resolveInMemory(chars.begin, frame->beginChar, frame->beginByte, frame->text);
    size_t endByte = checkpoints.resolveInMemory(chars.end, frame->beginChar, frame->beginByte, frame->text);
    return std::string_view(frame->text).substr(beginByte - frame->beginByte, endByte - beginByte);
}

void TextFile::load(int64_t begin, int64_t end) {
    ResolvedRange chars = resolve_range(begin, end, index_.totalChars());
    ResolvedRange bytes = charRangeToBytes(chars);
    frames_.load(source_, bytes.begin, bytes.end, chars.begin, chars.end);
}

ResolvedRange TextFile::lineRangeToCharRange(int64_t begin, int64_t end) const {
    return index_.lines().toCharRange(begin, end);
}

ResolvedRange TextFile::lineRangeToByteRange(int64_t begin, int64_t end) const {
    return index_.lines().toByteRange(begin, end);
}

std::string_view TextFile::getOrLoadLines(int64_t begin, int64_t end) {
    const LineIndex& lines = index_.lines();
    ResolvedRange bytes = lines.toByteRange(begin, end);
    if (auto view = frames_.findCovering(bytes.begin, bytes.end)) {
        return *view;
    }
    ResolvedRange chars = lines.toCharRange(begin, end);
    return frames_.load(source_, bytes.begin, bytes.end, chars.begin, chars.end);
}

std::string_view TextFile::getLines(int64_t begin, int64_t end) const {
    ResolvedRange bytes = index_.lines().toByteRange(begin, end);
    return frames_.get(bytes.begin, bytes.end);
}

void TextFile::checkByteRange(size_t begin, size_t end) const {
    size_t total = index_.totalBytes();
    if (begin > total) throw OffsetOutOfBoundsError(static_cast<int64_t>(begin), total);
    if (end > total) throw OffsetOutOfBoundsError(static_cast<int64_t>(end), total);
    if (begin > end) throw InvertedRangeError(begin, end);
}

void TextFile::checkBoundaryOnDisk(size_t offset) const {
    if (offset < index_.totalBytes() && utf8_is_continuation(source_.byteAt(offset))) {
        throw MisalignedByteOffsetError(offset);
    }
}

std::string_view TextFile::getBytes(size_t begin, size_t end) const {
    checkByteRange(begin, end);
    auto view = frames_.findCovering(begin, end);
    if (!view) {
        // report misalignment in preference to a miss
        checkBoundaryOnDisk(begin);
        checkBoundaryOnDisk(end);
        throw FrameNotLoadedError(begin, end);
    }
    // Frames start and end on boundaries: byte 'end' is either inside some frame that
    // also covers the range, or the covering frame stops right there.
    if (begin < end && utf8_is_continuation(static_cast<unsigned char>(view->front()))) {
        throw MisalignedByteOffsetError(begin);
    }
    if (end < index_.totalBytes()) {
        auto extended = frames_.findCovering(begin, end + 1);
        if (extended && utf8_is_continuation(static_cast<unsigned char>(extended->back()))) {
            throw MisalignedByteOffsetError(end);
        }
    }
    return *view;
}

std::string_view TextFile::getOrLoadBytes(size_t begin, size_t end) {
    checkByteRange(begin, end);
    checkBoundaryOnDisk(begin);
    checkBoundaryOnDisk(end);
    if (auto view = frames_.findCovering(begin, end)) {
        return *view;
    }
    return getOrLoadByteRange(begin, end);
}

std::string_view TextFile::getOrLoadByteRange(size_t beginByte, size_t endByte) {
    const CheckpointIndex& checkpoints = index_.checkpoints();
    size_t beginChar = checkpoints.charOffsetOf(beginByte, source_);
    size_t endChar = checkpoints.charOffsetOf(endByte, source_);
    return frames_.load(source_, beginByte, endByte, beginChar, endChar);
}

void TextFile::saveIndex(const std::string& cachePath) const {
    save_index(index_, cachePath);
}
