#pragma once
#include <cstddef>

// Length of the sequence introduced by a lead byte, 0 if the byte cannot start one.
size_t utf8_sequence_length(unsigned char lead);

inline bool utf8_is_continuation(unsigned char byte) {
    return (byte & 0xC0) == 0x80;
}

// Validates a complete buffer and returns its length in characters.
// Throws InvalidEncodingError with offset base_offset + position of the bad sequence.
size_t utf8_validate(const char* data, size_t size, size_t base_offset = 0);

// Number of bytes taken by the first 'chars' characters of data.
// Throws InvalidEncodingError if the buffer is malformed or ends early.
size_t utf8_advance(const char* data, size_t size, size_t chars, size_t base_offset = 0);

// Byte-at-a-time decoder for the streaming scan; sequences may straddle read buffers.
class Utf8StreamDecoder {
public:
    // Feeds the byte found at absolute 'offset'. Returns true when it completes a character.
    bool push(unsigned char byte, size_t offset);

    // Width in bytes of the character completed by the last successful push.
    unsigned width() const { return width_; }

    // Throws if the stream ended inside a sequence.
    void finish() const;

private:
    unsigned need_ = 0;
    unsigned width_ = 0;
    unsigned char lo_ = 0x80;
    unsigned char hi_ = 0xBF;
    size_t seqStart_ = 0;
};
