#include "IndexCache.hpp"
#include "TextFrameErrors.hpp"
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <sstream>
#include <boost/archive/archive_exception.hpp>
#include <boost/archive/binary_iarchive.hpp>
#include <boost/archive/binary_oarchive.hpp>

namespace {

constexpr uint32_t kIndexMagic = 0x58444954; // "TIDX"
constexpr uint32_t kIndexFormatVersion = 1;

}

std::string encode_index(const TextIndex& index) {
    std::ostringstream out(std::ios::binary);
    {
        boost::archive::binary_oarchive archive(out);
        archive << kIndexMagic << kIndexFormatVersion << index;
    }
    return out.str();
}

TextIndex decode_index(const std::string& bytes) {
    TextIndex index;
    try {
        std::istringstream in(bytes, std::ios::binary);
        boost::archive::binary_iarchive archive(in);
        uint32_t magic = 0;
        uint32_t version = 0;
        archive >> magic >> version;
        if (magic != kIndexMagic) throw DecodeError("not an index file");
        if (version != kIndexFormatVersion) throw DecodeError("unsupported format version " + std::to_string(version));
        archive >> index;
    } catch (const DecodeError&) {
        throw;
    } catch (const boost::archive::archive_exception& e) {
        throw DecodeError(e.what());
    } catch (const std::exception& e) {
        // corrupt length prefixes surface as allocation or length errors
        throw DecodeError(e.what());
    }
    index.validate();
    return index;
}

void save_index(const TextIndex& index, const std::string& path) {
    std::string payload = encode_index(index);
    std::string tmpPath = path + ".tmp";
    {
        std::ofstream out(tmpPath, std::ios::binary | std::ios::trunc);
        if (!out) throw IoError("cannot write index cache " + tmpPath);
        out.write(payload.data(), static_cast<std::streamsize>(payload.size()));
        out.flush();
        if (!out) throw IoError("write failed for index cache " + tmpPath);
    }
    std::error_code ec;
    std::filesystem::rename(tmpPath, path, ec);
    if (ec) {
        std::string reason = ec.message();
        std::filesystem::remove(tmpPath, ec);
        throw IoError("cannot move index cache into place at " + path + ": " + reason);
    }
}

std::optional<TextIndex> load_index(const std::string& path) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) return std::nullopt;
    std::ifstream in(path, std::ios::binary);
    if (!in) throw DecodeError("cannot open " + path);
    std::string bytes((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (in.bad()) throw DecodeError("read error on " + path);
    return decode_index(bytes);
}
