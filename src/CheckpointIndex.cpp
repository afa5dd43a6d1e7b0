#include "CheckpointIndex.hpp"
#include "SourceFile.hpp"
#include "TextFrameErrors.hpp"
#include "Utf8.hpp"
#include <algorithm>

CheckpointIndex::CheckpointIndex(std::vector<Checkpoint> checkpoints, size_t totalChars, size_t totalBytes)
    : checkpoints_(std::move(checkpoints)), totalChars_(totalChars), totalBytes_(totalBytes) {}

const Checkpoint& CheckpointIndex::locate(size_t charOffset, size_t& blockEnd) const {
    if (checkpoints_.empty()) throw EmptyTextError();
    // greatest checkpoint with charOffset <= requested
    auto it = std::upper_bound(checkpoints_.begin(), checkpoints_.end(), charOffset,
        [](size_t offset, const Checkpoint& cp) { return offset < cp.charOffset; });
    blockEnd = it != checkpoints_.end() ? static_cast<size_t>(it->byteOffset) : static_cast<size_t>(totalBytes_);
    return *(it - 1);
}

size_t CheckpointIndex::resolve(size_t charOffset, const SourceFile& source) const {
    if (charOffset > totalChars_) {
        throw OffsetOutOfBoundsError(static_cast<int64_t>(charOffset), totalChars_);
    }
    if (charOffset == totalChars_) return totalBytes_;

    size_t blockEnd = 0;
    const Checkpoint& cp = locate(charOffset, blockEnd);
    size_t delta = charOffset - cp.charOffset;
    if (delta == 0) return cp.byteOffset;
    if (cp.width != 0) return cp.byteOffset + delta * cp.width;

    size_t window = std::min(delta * 4, blockEnd - static_cast<size_t>(cp.byteOffset));
    std::string bytes = source.read(cp.byteOffset, window);
    return cp.byteOffset + utf8_advance(bytes.data(), bytes.size(), delta, cp.byteOffset);
}

size_t CheckpointIndex::resolveInMemory(size_t charOffset, size_t textChar, size_t textByte, std::string_view text) const {
    if (charOffset > totalChars_) {
        throw OffsetOutOfBoundsError(static_cast<int64_t>(charOffset), totalChars_);
    }
    if (charOffset == totalChars_) return totalBytes_;

    size_t blockEnd = 0;
    const Checkpoint& cp = locate(charOffset, blockEnd);
    size_t delta = charOffset - cp.charOffset;
    if (cp.width != 0) return cp.byteOffset + delta * cp.width;

    // start from whichever known position is closer: the checkpoint or the start of text
    size_t baseChar = textChar;
    size_t baseByte = textByte;
    if (cp.charOffset >= textChar) {
        baseChar = cp.charOffset;
        baseByte = cp.byteOffset;
    }
    if (charOffset < baseChar || baseByte - textByte > text.size()) {
        throw std::logic_error("text does not reach the requested character");
    }
    std::string_view rest = text.substr(baseByte - textByte);
    return baseByte + utf8_advance(rest.data(), rest.size(), charOffset - baseChar, baseByte);
}

size_t CheckpointIndex::charOffsetOf(size_t byteOffset, const SourceFile& source) const {
    if (byteOffset > totalBytes_) {
        throw OffsetOutOfBoundsError(static_cast<int64_t>(byteOffset), totalBytes_);
    }
    if (byteOffset == totalBytes_) return totalChars_;
    if (checkpoints_.empty()) throw EmptyTextError();
    if (utf8_is_continuation(source.byteAt(byteOffset))) throw MisalignedByteOffsetError(byteOffset);

    auto it = std::upper_bound(checkpoints_.begin(), checkpoints_.end(), byteOffset,
        [](size_t offset, const Checkpoint& cp) { return offset < cp.byteOffset; });
    const Checkpoint& cp = *(it - 1);
    size_t delta = byteOffset - cp.byteOffset;
    if (delta == 0) return cp.charOffset;
    if (cp.width != 0) {
        if (delta % cp.width != 0) throw MisalignedByteOffsetError(byteOffset);
        return cp.charOffset + delta / cp.width;
    }
    std::string bytes = source.read(cp.byteOffset, delta);
    return cp.charOffset + utf8_validate(bytes.data(), bytes.size(), cp.byteOffset);
}

void CheckpointIndex::validate() const {
    if (totalChars_ == 0 || totalBytes_ < totalChars_) {
        throw DecodeError("inconsistent totals");
    }
    if (checkpoints_.empty() || checkpoints_.front().charOffset != 0 || checkpoints_.front().byteOffset != 0) {
        throw DecodeError("checkpoints must start at the origin");
    }
    for (size_t i = 0; i < checkpoints_.size(); ++i) {
        const Checkpoint& cp = checkpoints_[i];
        if (cp.width > 4 || cp.charOffset >= totalChars_ || cp.byteOffset >= totalBytes_) {
            throw DecodeError("checkpoint " + std::to_string(i) + " out of range");
        }
        if (i > 0 && (cp.charOffset <= checkpoints_[i - 1].charOffset || cp.byteOffset <= checkpoints_[i - 1].byteOffset)) {
            throw DecodeError("checkpoints not strictly increasing");
        }
    }
}

CheckpointBuilder::CheckpointBuilder(size_t interval) : interval_(interval == 0 ? 1 : interval) {}

void CheckpointBuilder::addChar(size_t byteOffset, unsigned width) {
    if (chars_ % interval_ == 0) {
        Checkpoint cp;
        cp.charOffset = chars_;
        cp.byteOffset = byteOffset;
        cp.width = static_cast<uint8_t>(width);
        checkpoints_.push_back(cp);
    } else if (checkpoints_.back().width != width) {
        checkpoints_.back().width = 0;
    }
    ++chars_;
}

CheckpointIndex CheckpointBuilder::finish(size_t totalBytes) {
    return CheckpointIndex(std::move(checkpoints_), chars_, totalBytes);
}
