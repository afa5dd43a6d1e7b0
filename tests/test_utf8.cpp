#include <iostream>
#include <string>
#include "../src/Utf8.hpp"
#include "../src/TextFrameErrors.hpp"

#define ASSERT_TRUE(cond) if(!(cond)) { std::cerr << "Assertion failed: " << #cond << " at " << __FILE__ << ":" << __LINE__ << std::endl; return 1; }

// Offset reported for s, or -1 if it validates.
static long long invalid_offset(const std::string& s, size_t base = 0) {
    try {
        utf8_validate(s.data(), s.size(), base);
    } catch (const InvalidEncodingError& e) {
        return static_cast<long long>(e.offset());
    }
    return -1;
}

// Same check through the streaming decoder.
static long long stream_invalid_offset(const std::string& s) {
    try {
        Utf8StreamDecoder decoder;
        for (size_t i = 0; i < s.size(); ++i) {
            decoder.push(static_cast<unsigned char>(s[i]), i);
        }
        decoder.finish();
    } catch (const InvalidEncodingError& e) {
        return static_cast<long long>(e.offset());
    }
    return -1;
}

int main() {
    try {
        ASSERT_TRUE(utf8_sequence_length('a') == 1);
        ASSERT_TRUE(utf8_sequence_length(0xC3) == 2);
        ASSERT_TRUE(utf8_sequence_length(0xE7) == 3);
        ASSERT_TRUE(utf8_sequence_length(0xF0) == 4);
        ASSERT_TRUE(utf8_sequence_length(0x80) == 0);
        ASSERT_TRUE(utf8_sequence_length(0xC0) == 0);
        ASSERT_TRUE(utf8_sequence_length(0xFF) == 0);

        // 1, 2, 3 and 4 byte characters
        std::string mixed = "a\xC3\xA9\xE7\xAC\xAC\xF0\x9F\x98\x80";
        ASSERT_TRUE(utf8_validate(mixed.data(), mixed.size()) == 4);
        ASSERT_TRUE(utf8_advance(mixed.data(), mixed.size(), 0) == 0);
        ASSERT_TRUE(utf8_advance(mixed.data(), mixed.size(), 2) == 3);
        ASSERT_TRUE(utf8_advance(mixed.data(), mixed.size(), 4) == mixed.size());

        // running past the end is an error, not a clamp
        bool threw = false;
        try {
            utf8_advance(mixed.data(), mixed.size(), 5, 100);
        } catch (const InvalidEncodingError& e) {
            threw = true;
            ASSERT_TRUE(e.offset() == 100 + mixed.size());
        }
        ASSERT_TRUE(threw);

        // malformed input reports the offset of the offending sequence
        ASSERT_TRUE(invalid_offset("ab\xFF" "cd") == 2);
        ASSERT_TRUE(invalid_offset("ab\xFF" "cd", 1000) == 1002);
        ASSERT_TRUE(invalid_offset("abc\xE4\xB8") == 3);            // truncated
        ASSERT_TRUE(invalid_offset("\xC0\xAF") == 0);               // overlong
        ASSERT_TRUE(invalid_offset("x\xE0\x80\xAF") == 1);          // overlong 3-byte
        ASSERT_TRUE(invalid_offset("xy\xED\xA0\x80") == 2);         // surrogate
        ASSERT_TRUE(invalid_offset("\xF4\x90\x80\x80") == 0);       // above U+10FFFF
        ASSERT_TRUE(invalid_offset("a\x80") == 1);                  // stray continuation
        ASSERT_TRUE(invalid_offset("\xE4\xB8" "a") == 0);           // interrupted sequence
        ASSERT_TRUE(invalid_offset(mixed) == -1);

        // the streaming decoder agrees with the buffer validator
        const char* samples[] = {
            "ab\xFF" "cd", "abc\xE4\xB8", "\xC0\xAF", "x\xE0\x80\xAF", "xy\xED\xA0\x80",
            "\xF4\x90\x80\x80", "a\x80", "\xE4\xB8" "a", "a\xC3\xA9\xE7\xAC\xAC\xF0\x9F\x98\x80"
        };
        for (const char* sample : samples) {
            std::string s(sample);
            ASSERT_TRUE(stream_invalid_offset(s) == invalid_offset(s));
        }

        // widths reported as characters complete
        Utf8StreamDecoder decoder;
        ASSERT_TRUE(decoder.push('a', 0));
        ASSERT_TRUE(decoder.width() == 1);
        ASSERT_TRUE(!decoder.push(0xE7, 1));
        ASSERT_TRUE(!decoder.push(0xAC, 2));
        ASSERT_TRUE(decoder.push(0xAC, 3));
        ASSERT_TRUE(decoder.width() == 3);
        decoder.finish();
    } catch (const std::exception& e) {
        std::cerr << "Exception: " << e.what() << std::endl;
        return 1;
    }
    std::cout << "UTF-8 tests passed" << std::endl;
    return 0;
}
