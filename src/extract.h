#pragma once

#include <cstdint>
#include <filesystem>

namespace quire {

struct extract_options {
  int strip_components{ 0 };
};

// Removes any compression filter libarchive recognizes (gzip, bzip2, xz, zstd, ...)
// and writes the payload to output as-is. An uncompressed input is copied through.
// Returns the number of bytes written.
std::uint64_t decompress(std::filesystem::path const &archive_path,
                         std::filesystem::path const &output);

// Extracts a tar into destination, dropping the leading strip_components path
// components of every entry. Entries that would land outside destination are an error.
// Returns the number of regular files written.
std::uint64_t extract(std::filesystem::path const &archive_path,
                      std::filesystem::path const &destination,
                      extract_options const &options = {});

}  // namespace quire
