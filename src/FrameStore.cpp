#include "FrameStore.hpp"
#include "SourceFile.hpp"
#include "TextFrameErrors.hpp"
#include "Utf8.hpp"

std::optional<std::string_view> FrameStore::findCovering(size_t beginByte, size_t endByte) const {
    // walk backwards over frames starting at or before beginByte
    auto it = byBeginByte.upper_bound(beginByte);
    while (it != byBeginByte.begin()) {
        --it;
        const Frame& frame = *frames[it->second];
        if (frame.endByte >= endByte) {
            return std::string_view(frame.text).substr(beginByte - frame.beginByte, endByte - beginByte);
        }
    }
    return std::nullopt;
}

std::string_view FrameStore::get(size_t beginByte, size_t endByte) const {
    auto view = findCovering(beginByte, endByte);
    if (!view) throw FrameNotLoadedError(beginByte, endByte);
    return *view;
}

const Frame* FrameStore::findCoveringChars(size_t beginChar, size_t endChar) const {
    auto it = byBeginChar.upper_bound(beginChar);
    while (it != byBeginChar.begin()) {
        --it;
        const Frame* frame = frames[it->second].get();
        if (frame->endChar >= endChar) return frame;
    }
    return nullptr;
}

std::string_view FrameStore::load(const SourceFile& source, size_t beginByte, size_t endByte,
                                  size_t beginChar, size_t endChar) {
    if (beginByte > endByte) throw InvertedRangeError(beginByte, endByte);
    std::string bytes = source.read(beginByte, endByte - beginByte);
    utf8_validate(bytes.data(), bytes.size(), beginByte);

    auto frame = std::make_unique<Frame>();
    frame->beginByte = beginByte;
    frame->endByte = endByte;
    frame->beginChar = beginChar;
    frame->endChar = endChar;
    frame->text = std::move(bytes);
    std::string_view view(frame->text);

    frames.push_back(std::move(frame));
    byBeginByte.emplace(beginByte, frames.size() - 1);
    byBeginChar.emplace(beginChar, frames.size() - 1);
    return view;
}
