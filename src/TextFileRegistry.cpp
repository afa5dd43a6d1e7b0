#include "TextFileRegistry.hpp"
#include "ContentDigest.hpp"
#include "TextFrameErrors.hpp"
#include <filesystem>
#include <stdexcept>
#include <algorithm>
#include <mutex>

SharedTextFile::SharedTextFile(std::unique_ptr<TextFile> text)
    : text(std::move(text)), refcount(1) {}

std::string SharedTextFile::readChars(int64_t begin, int64_t end) {
    {
        std::shared_lock readLock(lock);
        try {
            return std::string(text->get(begin, end));
        } catch (const FrameNotLoadedError&) {
            // fall through to the loading path
        }
    }
    std::unique_lock writeLock(lock);
    return std::string(text->getOrLoad(begin, end));
}

std::string SharedTextFile::readLines(int64_t begin, int64_t end) {
    {
        std::shared_lock readLock(lock);
        try {
            return std::string(text->getLines(begin, end));
        } catch (const FrameNotLoadedError&) {
            // fall through to the loading path
        }
    }
    std::unique_lock writeLock(lock);
    return std::string(text->getOrLoadLines(begin, end));
}

std::string SharedTextFile::readBytes(size_t begin, size_t end) {
    {
        std::shared_lock readLock(lock);
        try {
            return std::string(text->getBytes(begin, end));
        } catch (const FrameNotLoadedError&) {
            // fall through to the loading path
        }
    }
    std::unique_lock writeLock(lock);
    return std::string(text->getOrLoadBytes(begin, end));
}

size_t SharedTextFile::length() const {
    return text->length();
}

size_t SharedTextFile::byteLength() const {
    return text->byteLength();
}

std::optional<size_t> SharedTextFile::lineCount() const {
    if (!text->hasLineIndex()) return std::nullopt;
    return text->lineCount();
}

std::string SharedTextFile::checksumHex() const {
    return text->checksumHex();
}

bool SharedTextFile::indexLoadedFromCache() const {
    return text->indexLoadedFromCache();
}

size_t SharedTextFile::frameCount() const {
    std::shared_lock readLock(lock);
    return text->frameCount();
}

void SharedTextFile::saveIndex(const std::string& cachePath) const {
    text->saveIndex(cachePath);
}

void SharedTextFile::incRef() {
    refcount++;
}

void SharedTextFile::decRef() {
    refcount--;
}

int SharedTextFile::refCount() const {
    return refcount.load();
}

void TextFileRegistry::setAllowedPaths(const std::vector<std::string>& paths) {
    std::unique_lock lock(mutex);
    allowedPaths.clear();
    for (const auto& path : paths) {
        try {
            allowedPaths.push_back(std::filesystem::canonical(path).string());
        } catch (const std::filesystem::filesystem_error&) {
            // Skip invalid paths
        }
    }
}

bool TextFileRegistry::isPathAllowed(const std::string& path) const {
    std::shared_lock lock(mutex);
    return isPathAllowedLocked(path);
}

bool TextFileRegistry::isPathAllowedLocked(const std::string& path) const {
    if (allowedPaths.empty()) {
        return true; // If no restrictions configured, allow all
    }

    std::string canonical;
    try {
        canonical = std::filesystem::canonical(path).string();
    } catch (const std::filesystem::filesystem_error&) {
        return false;
    }

    // Check if path is under any allowed path
    for (const auto& allowed : allowedPaths) {
        if (canonical == allowed ||
            canonical.substr(0, allowed.length() + 1) == allowed + "/") {
            return true;
        }
    }
    return false;
}

void TextFileRegistry::setOptions(const RegistryOptions& options) {
    std::unique_lock lock(mutex);
    options_ = options;
}

std::string TextFileRegistry::cachePathFor(const std::string& handler) const {
    std::shared_lock lock(mutex);
    return sideCarPath(options_, handler);
}

std::string TextFileRegistry::sideCarPath(const RegistryOptions& options, const std::string& handler) {
    if (options.cacheDir.empty()) return std::string();
    // one side-car per canonical source path
    ContentDigest digest;
    digest.update(handler.data(), handler.size());
    return (std::filesystem::path(options.cacheDir) / (digest_to_hex(digest.finalize()) + ".tfidx")).string();
}

std::shared_ptr<SharedTextFile> TextFileRegistry::open(const std::string& path) {
    std::string canonical;
    RegistryOptions options;
    {
        std::unique_lock lock(mutex);

        // Check if path is allowed
        if (!isPathAllowedLocked(path)) {
            throw std::runtime_error("Access denied: path not in allowed list");
        }

        canonical = std::filesystem::canonical(path).string();
        auto it = pathMap.find(canonical);
        if (it != pathMap.end()) {
            it->second->incRef();
            return it->second;
        }
        options = options_;
    }

    // Indexing scans the whole file; other texts stay readable meanwhile.
    std::optional<std::string> cachePath;
    std::string sideCar = sideCarPath(options, canonical);
    if (!sideCar.empty()) {
        std::filesystem::create_directories(options.cacheDir);
        cachePath = sideCar;
    }
    auto text = std::make_unique<TextFile>(canonical, cachePath, options.mode, options.checkpointInterval);
    auto shared = std::make_shared<SharedTextFile>(std::move(text));

    std::unique_lock lock(mutex);
    auto [it, inserted] = pathMap.emplace(canonical, shared);
    if (!inserted) {
        // another caller opened the same text while this one was indexing
        it->second->incRef();
    }
    return it->second;
}

std::shared_ptr<SharedTextFile> TextFileRegistry::getByHandler(const std::string& handler) {
    std::shared_lock lock(mutex);
    auto it = pathMap.find(handler);
    if (it != pathMap.end()) {
        return it->second;
    }
    return nullptr;
}

void TextFileRegistry::close(const std::string& handler) {
    std::unique_lock lock(mutex);
    auto it = pathMap.find(handler);
    if (it != pathMap.end()) {
        it->second->decRef();
        if (it->second->refCount() <= 0) {
            // Outstanding shared_ptrs keep the TextFile alive until their reads finish
            pathMap.erase(it);
        }
    }
}

std::vector<std::string> TextFileRegistry::listHandlers() const {
    std::shared_lock lock(mutex);
    std::vector<std::string> handlers;
    handlers.reserve(pathMap.size());
    for (const auto& [handler, text] : pathMap) {
        handlers.push_back(handler);
    }
    std::sort(handlers.begin(), handlers.end());
    return handlers;
}
