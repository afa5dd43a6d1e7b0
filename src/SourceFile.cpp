#include "SourceFile.hpp"
#include "TextFrameErrors.hpp"
#include <filesystem>
#include <boost/interprocess/exceptions.hpp>
#include <boost/interprocess/mapped_region.hpp>

namespace {

size_t file_size_of(const std::string& path) {
    std::error_code ec;
    auto size = std::filesystem::file_size(path, ec);
    if (ec) {
        throw IoError("cannot stat " + path + ": " + ec.message());
    }
    return static_cast<size_t>(size);
}

boost::interprocess::file_mapping open_mapping(const std::string& path) {
    try {
        return boost::interprocess::file_mapping(path.c_str(), boost::interprocess::read_only);
    } catch (const boost::interprocess::interprocess_exception& e) {
        throw IoError("cannot open " + path + ": " + e.what());
    }
}

}

SourceFile::SourceFile(const std::string& path)
    : path_(path),
      size_(file_size_of(path)),
      fileMapping(open_mapping(path)) {}

std::string SourceFile::read(size_t offset, size_t length) const {
    if (offset > size_ || length > size_ - offset) {
        throw IoError("read of " + std::to_string(length) + " bytes at " + std::to_string(offset) +
                      " beyond end of " + path_);
    }
    if (length == 0) return std::string();
    try {
        boost::interprocess::mapped_region region(fileMapping, boost::interprocess::read_only,
                                                  static_cast<boost::interprocess::offset_t>(offset), length);
        return std::string(static_cast<const char*>(region.get_address()), length);
    } catch (const boost::interprocess::interprocess_exception& e) {
        throw IoError("cannot map " + path_ + ": " + e.what());
    }
}

unsigned char SourceFile::byteAt(size_t offset) const {
    std::string byte = read(offset, 1);
    return static_cast<unsigned char>(byte[0]);
}
