#include "Utf8.hpp"
#include "TextFrameErrors.hpp"

namespace {

// Allowed range of the second byte for a given lead; excludes overlong forms,
// surrogates and code points above U+10FFFF.
void second_byte_range(unsigned char lead, unsigned char &lo, unsigned char &hi) {
    lo = 0x80;
    hi = 0xBF;
    if (lead == 0xE0) lo = 0xA0;
    else if (lead == 0xED) hi = 0x9F;
    else if (lead == 0xF0) lo = 0x90;
    else if (lead == 0xF4) hi = 0x8F;
}

// Decodes one character at data[pos]; returns its width or 0 if malformed/truncated.
size_t decode_one(const char* data, size_t size, size_t pos) {
    unsigned char lead = static_cast<unsigned char>(data[pos]);
    size_t len = utf8_sequence_length(lead);
    if (len == 0 || pos + len > size) return 0;
    if (len == 1) return 1;
    unsigned char lo, hi;
    second_byte_range(lead, lo, hi);
    unsigned char second = static_cast<unsigned char>(data[pos + 1]);
    if (second < lo || second > hi) return 0;
    for (size_t i = 2; i < len; ++i) {
        if (!utf8_is_continuation(static_cast<unsigned char>(data[pos + i]))) return 0;
    }
    return len;
}

}

size_t utf8_sequence_length(unsigned char lead) {
    if (lead < 0x80) return 1;
    if (lead >= 0xC2 && lead <= 0xDF) return 2;
    if (lead >= 0xE0 && lead <= 0xEF) return 3;
    if (lead >= 0xF0 && lead <= 0xF4) return 4;
    return 0;
}

size_t utf8_validate(const char* data, size_t size, size_t base_offset) {
    size_t pos = 0;
    size_t chars = 0;
    while (pos < size) {
        // ASCII fast path
        if (static_cast<unsigned char>(data[pos]) < 0x80) {
            ++pos;
            ++chars;
            continue;
        }
        size_t len = decode_one(data, size, pos);
        if (len == 0) throw InvalidEncodingError(base_offset + pos);
        pos += len;
        ++chars;
    }
    return chars;
}

size_t utf8_advance(const char* data, size_t size, size_t chars, size_t base_offset) {
    size_t pos = 0;
    for (size_t n = 0; n < chars; ++n) {
        if (pos >= size) throw InvalidEncodingError(base_offset + pos);
        size_t len = decode_one(data, size, pos);
        if (len == 0) throw InvalidEncodingError(base_offset + pos);
        pos += len;
    }
    return pos;
}

bool Utf8StreamDecoder::push(unsigned char byte, size_t offset) {
    if (need_ == 0) {
        size_t len = utf8_sequence_length(byte);
        if (len == 0) throw InvalidEncodingError(offset);
        seqStart_ = offset;
        if (len == 1) {
            width_ = 1;
            return true;
        }
        width_ = static_cast<unsigned>(len);
        need_ = width_ - 1;
        second_byte_range(byte, lo_, hi_);
        return false;
    }
    if (byte < lo_ || byte > hi_) throw InvalidEncodingError(seqStart_);
    lo_ = 0x80;
    hi_ = 0xBF;
    return --need_ == 0;
}

void Utf8StreamDecoder::finish() const {
    if (need_ != 0) throw InvalidEncodingError(seqStart_);
}
