#include <iostream>
#include <fstream>
#include <filesystem>
#include <string>
#include <vector>
#include "../src/CheckpointIndex.hpp"
#include "../src/SourceFile.hpp"
#include "../src/TextIndex.hpp"
#include "../src/TextFrameErrors.hpp"
#include "../src/Utf8.hpp"

#define ASSERT_TRUE(cond) if(!(cond)) { std::cerr << "Assertion failed: " << #cond << " at " << __FILE__ << ":" << __LINE__ << std::endl; return 1; }

static void write_file(const std::filesystem::path& path, const std::string& content) {
    std::ofstream ofs(path, std::ios::binary);
    ofs.write(content.data(), content.size());
}

// Byte offset of every character, plus the end of the text.
static std::vector<size_t> reference_offsets(const std::string& s) {
    std::vector<size_t> offsets;
    size_t pos = 0;
    while (pos < s.size()) {
        offsets.push_back(pos);
        pos += utf8_sequence_length(static_cast<unsigned char>(s[pos]));
    }
    offsets.push_back(s.size());
    return offsets;
}

// Checks resolve() and charOffsetOf() against the reference for every offset.
static int check_all_offsets(const std::filesystem::path& path, const std::string& content, size_t interval) {
    write_file(path, content);
    TextIndex index = TextIndex::build(path.string(), TextFileMode::NoLineIndex, interval);
    SourceFile source(path.string());
    const CheckpointIndex& checkpoints = index.checkpoints();
    auto offsets = reference_offsets(content);

    ASSERT_TRUE(checkpoints.totalChars() == offsets.size() - 1);
    ASSERT_TRUE(checkpoints.totalBytes() == content.size());
    ASSERT_TRUE(checkpoints.checkpoints().size() == (offsets.size() - 1 + interval - 1) / interval);

    for (size_t c = 0; c < offsets.size(); ++c) {
        if (checkpoints.resolve(c, source) != offsets[c]) {
            std::cerr << "resolve(" << c << ") = " << checkpoints.resolve(c, source)
                      << ", expected " << offsets[c] << " (interval " << interval << ")" << std::endl;
            return 1;
        }
        ASSERT_TRUE(checkpoints.charOffsetOf(offsets[c], source) == c);
        // same answer from an in-memory copy of the whole text
        ASSERT_TRUE(checkpoints.resolveInMemory(c, 0, 0, content) == offsets[c]);
    }

    // every byte inside a multi-byte character is misaligned
    for (size_t c = 0; c + 1 < offsets.size(); ++c) {
        for (size_t b = offsets[c] + 1; b < offsets[c + 1]; ++b) {
            bool threw = false;
            try {
                checkpoints.charOffsetOf(b, source);
            } catch (const MisalignedByteOffsetError& e) {
                threw = e.offset() == b;
            }
            ASSERT_TRUE(threw);
        }
    }

    bool threw = false;
    try {
        checkpoints.resolve(offsets.size(), source);
    } catch (const OffsetOutOfBoundsError&) {
        threw = true;
    }
    ASSERT_TRUE(threw);
    return 0;
}

int main() {
    try {
        auto tmpDir = std::filesystem::temp_directory_path();
        auto tmpFile = tmpDir / "textframe_checkpoint_test.txt";

        // uniform blocks of each width, then mixed blocks
        std::string ascii = "The quick brown fox jumps over the lazy dog.\n";
        std::string twoByte = "\xC3\xA9\xC3\xA8\xC3\xAA\xC3\xAB\xC3\xA0\xC3\xA2";          // éèêëàâ
        std::string threeByte = "\xE7\xAC\xAC\xE4\xB8\x80\xE6\x9D\xA1";                     // 第一条
        std::string fourByte = "\xF0\x9F\x98\x80\xF0\x9F\x98\x81\xF0\x9F\x98\x82";          // three emoji
        std::string text = ascii + twoByte + threeByte + fourByte + ascii + "\xE6\xAD\xA2\xE3\x80\x82\n";

        for (size_t interval : {1u, 2u, 3u, 4u, 5u, 7u, 16u, 4096u}) {
            if (check_all_offsets(tmpFile, text, interval) != 0) return 1;
        }
        if (check_all_offsets(tmpFile, ascii, 4) != 0) return 1;
        if (check_all_offsets(tmpFile, fourByte, 2) != 0) return 1;
        if (check_all_offsets(tmpFile, "x", 4096) != 0) return 1;

        // uniform blocks record their width, mixed ones record 0
        write_file(tmpFile, std::string("abcd") + "\xE7\xAC\xAC" "a" "\xE4\xB8\x80" "b");
        TextIndex index = TextIndex::build(tmpFile.string(), TextFileMode::NoLineIndex, 4);
        const auto& cps = index.checkpoints().checkpoints();
        ASSERT_TRUE(cps.size() == 2);
        ASSERT_TRUE(cps[0].width == 1);
        ASSERT_TRUE(cps[1].charOffset == 4 && cps[1].byteOffset == 4);
        ASSERT_TRUE(cps[1].width == 0);

        // a decoded index with a hole in it is rejected
        CheckpointIndex broken({Checkpoint{0, 0, 1}, Checkpoint{0, 5, 1}}, 10, 10);
        bool threw = false;
        try {
            broken.validate();
        } catch (const DecodeError&) {
            threw = true;
        }
        ASSERT_TRUE(threw);

        std::filesystem::remove(tmpFile);
    } catch (const std::exception& e) {
        std::cerr << "Exception: " << e.what() << std::endl;
        return 1;
    }
    std::cout << "Checkpoint index tests passed" << std::endl;
    return 0;
}
