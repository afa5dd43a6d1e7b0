#pragma once
#include <optional>
#include <string>
#include "TextIndex.hpp"

// Binary side-car codec for TextIndex (Boost.Serialization binary archive,
// prefixed with a magic number and a format version).
std::string encode_index(const TextIndex& index);

// Throws DecodeError on any malformed, truncated or foreign payload.
TextIndex decode_index(const std::string& bytes);

// Writes through a temporary file and renames it into place. Throws IoError.
void save_index(const TextIndex& index, const std::string& path);

// std::nullopt when no cache file exists; DecodeError when it cannot be used.
std::optional<TextIndex> load_index(const std::string& path);
