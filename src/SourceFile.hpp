#pragma once
#include <cstddef>
#include <string>
#include <boost/interprocess/file_mapping.hpp>

// Read-only view of a source text on disk. Bytes are served through short-lived
// mapped windows, so the file is never resident as a whole.
class SourceFile {
public:
    explicit SourceFile(const std::string& path);

    const std::string& path() const { return path_; }
    size_t size() const { return size_; }

    // Copies [offset, offset + length) out of the file.
    std::string read(size_t offset, size_t length) const;

    unsigned char byteAt(size_t offset) const;

private:
    std::string path_;
    size_t size_;
    boost::interprocess::file_mapping fileMapping;
};
