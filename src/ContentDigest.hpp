#pragma once
#include <array>
#include <cstddef>
#include <string>
#include <openssl/evp.h>

using Digest = std::array<unsigned char, 32>;

// Incremental SHA-256 over raw bytes.
class ContentDigest {
public:
    ContentDigest();
    ~ContentDigest();
    ContentDigest(const ContentDigest&) = delete;
    ContentDigest& operator=(const ContentDigest&) = delete;

    void update(const void* data, size_t size);
    Digest finalize();

private:
    EVP_MD_CTX* ctx;
    bool finalized = false;
};

// Streams the whole file through SHA-256 using a fixed read buffer.
Digest digest_file(const std::string& path);

std::string digest_to_hex(const Digest& digest);
