#include "ContentDigest.hpp"
#include "TextFrameErrors.hpp"
#include <fstream>
#include <vector>

ContentDigest::ContentDigest() : ctx(EVP_MD_CTX_new()) {
    if (!ctx || EVP_DigestInit_ex(ctx, EVP_sha256(), nullptr) != 1) {
        EVP_MD_CTX_free(ctx);
        throw std::runtime_error("SHA-256 digest initialisation failed");
    }
}

ContentDigest::~ContentDigest() {
    EVP_MD_CTX_free(ctx);
}

void ContentDigest::update(const void* data, size_t size) {
    if (finalized) throw std::logic_error("digest already finalized");
    if (size == 0) return;
    if (EVP_DigestUpdate(ctx, data, size) != 1) {
        throw std::runtime_error("SHA-256 digest update failed");
    }
}

Digest ContentDigest::finalize() {
    if (finalized) throw std::logic_error("digest already finalized");
    Digest out{};
    unsigned int outLen = 0;
    if (EVP_DigestFinal_ex(ctx, out.data(), &outLen) != 1 || outLen != out.size()) {
        throw std::runtime_error("SHA-256 digest finalisation failed");
    }
    finalized = true;
    return out;
}

Digest digest_file(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw IoError("cannot open " + path + " for hashing");
    }
    ContentDigest digest;
    std::vector<char> buffer(65536);
    while (file) {
        file.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        std::streamsize count = file.gcount();
        if (count > 0) digest.update(buffer.data(), static_cast<size_t>(count));
    }
    if (file.bad()) {
        throw IoError("read error while hashing " + path);
    }
    return digest.finalize();
}

std::string digest_to_hex(const Digest& digest) {
    static const char hexChars[] = "0123456789abcdef";
    std::string out;
    out.resize(digest.size() * 2);
    for (size_t i = 0; i < digest.size(); ++i) {
        out[i * 2] = hexChars[digest[i] >> 4];
        out[i * 2 + 1] = hexChars[digest[i] & 0x0f];
    }
    return out;
}
