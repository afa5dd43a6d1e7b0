#pragma once
#include <atomic>
#include <cstdint>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>
#include "TextFile.hpp"

struct RegistryOptions {
    // directory for index side-car files; no caching when empty
    std::string cacheDir;
    TextFileMode mode = TextFileMode::WithLineIndex;
    size_t checkpointInterval = kDefaultCheckpointInterval;
};

// A TextFile shared between request handlers. Reads of already loaded excerpts run
// under a shared lock; loading a new frame takes the lock exclusively.
class SharedTextFile {
public:
    explicit SharedTextFile(std::unique_ptr<TextFile> text);

    std::string readChars(int64_t begin, int64_t end);
    std::string readLines(int64_t begin, int64_t end);
    std::string readBytes(size_t begin, size_t end);

    size_t length() const;
    size_t byteLength() const;
    std::optional<size_t> lineCount() const;
    std::string checksumHex() const;
    bool indexLoadedFromCache() const;
    size_t frameCount() const;
    void saveIndex(const std::string& cachePath) const;

    void incRef();
    void decRef();
    int refCount() const;

private:
    std::unique_ptr<TextFile> text;
    mutable std::shared_mutex lock;
    std::atomic<int> refcount;
};

class TextFileRegistry {
public:
    // Opens (or re-references) the text at path; the canonical path is its handler.
    std::shared_ptr<SharedTextFile> open(const std::string& path);
    std::shared_ptr<SharedTextFile> getByHandler(const std::string& handler);
    void close(const std::string& handler);
    std::vector<std::string> listHandlers() const;
    void setAllowedPaths(const std::vector<std::string>& paths);
    bool isPathAllowed(const std::string& path) const;
    void setOptions(const RegistryOptions& options);
    // Side-car path used for a handler, empty without a cache directory.
    std::string cachePathFor(const std::string& handler) const;

private:
    bool isPathAllowedLocked(const std::string& path) const;
    static std::string sideCarPath(const RegistryOptions& options, const std::string& handler);

    std::unordered_map<std::string, std::shared_ptr<SharedTextFile>> pathMap;
    std::vector<std::string> allowedPaths;
    RegistryOptions options_;
    mutable std::shared_mutex mutex;
};
