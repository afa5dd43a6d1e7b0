#pragma once
#include <cstddef>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

class SourceFile;

// An immutable excerpt of the source, validated as UTF-8. Covers bytes
// [beginByte, endByte), which are characters [beginChar, endChar).
struct Frame {
    size_t beginByte;
    size_t endByte;
    size_t beginChar;
    size_t endChar;
    std::string text;
};

// Append-only store of frames. Each frame is a separate heap allocation that is
// never modified or released before the store, so views handed out stay valid
// for the life of the store.
class FrameStore {
public:
    // View of [beginByte, endByte) if some loaded frame covers it. No I/O.
    std::optional<std::string_view> findCovering(size_t beginByte, size_t endByte) const;

    // Like findCovering, but throws FrameNotLoadedError on a miss.
    std::string_view get(size_t beginByte, size_t endByte) const;

    // A frame holding characters [beginChar, endChar), or nullptr.
    const Frame* findCoveringChars(size_t beginChar, size_t endChar) const;

    // Reads exactly [beginByte, endByte) from the source, validates it and registers
    // a new frame. The caller vouches for the matching character range.
    std::string_view load(const SourceFile& source, size_t beginByte, size_t endByte,
                          size_t beginChar, size_t endChar);

    size_t size() const { return frames.size(); }

private:
    std::vector<std::unique_ptr<const Frame>> frames;
    // begin offset -> frame index, in load order
    std::multimap<size_t, size_t> byBeginByte;
    std::multimap<size_t, size_t> byBeginChar;
};
