#include "TextIndex.hpp"
#include "TextFrameErrors.hpp"
#include "Utf8.hpp"
#include <fstream>
#include <vector>

TextIndex TextIndex::build(const std::string& path, TextFileMode mode, size_t checkpointInterval) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw IoError("cannot open " + path);
    }

    const bool withLines = mode == TextFileMode::WithLineIndex;
    ContentDigest digest;
    Utf8StreamDecoder decoder;
    CheckpointBuilder checkpoints(checkpointInterval);
    LineIndexBuilder lines;

    size_t byteOffset = 0;
    size_t charOffset = 0;
    std::vector<char> buffer(65536);
    while (file) {
        file.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        std::streamsize count = file.gcount();
        if (count <= 0) break;
        digest.update(buffer.data(), static_cast<size_t>(count));
        for (std::streamsize i = 0; i < count; ++i, ++byteOffset) {
            unsigned char byte = static_cast<unsigned char>(buffer[static_cast<size_t>(i)]);
            if (!decoder.push(byte, byteOffset)) continue;
            unsigned width = decoder.width();
            size_t charStart = byteOffset + 1 - width;
            checkpoints.addChar(charStart, width);
            if (withLines) {
                lines.addChar(charOffset, charStart, width, byte == '\n');
            }
            ++charOffset;
        }
    }
    if (file.bad()) {
        throw IoError("read error while indexing " + path);
    }
    decoder.finish();
    if (byteOffset == 0) {
        throw EmptyTextError();
    }

    TextIndex index;
    index.digest_ = digest.finalize();
    index.checkpoints_ = checkpoints.finish(byteOffset);
    index.hasLines_ = withLines;
    if (withLines) {
        index.lines_ = lines.finish(charOffset, byteOffset);
    }
    return index;
}

const LineIndex& TextIndex::lines() const {
    if (!hasLines_) throw LineIndexDisabledError();
    return lines_;
}

void TextIndex::dropLineIndex() {
    hasLines_ = false;
    lines_ = LineIndex();
}

void TextIndex::validate() const {
    checkpoints_.validate();
    if (hasLines_) {
        lines_.validate(totalChars(), totalBytes());
    }
}
