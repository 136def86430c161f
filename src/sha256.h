#pragma once

#include <array>
#include <filesystem>
#include <string>
#include <string_view>

namespace quire {

using sha256_t = std::array<unsigned char, 32>;

// Digest of a file's contents. Throws std::runtime_error if it cannot be read.
sha256_t sha256(std::filesystem::path const &file_path);

// Digest of an in-memory byte string.
sha256_t sha256_string(std::string_view data);

// Throws std::runtime_error naming both digests when actual differs from expected_hex
// (64 hex characters, either case).
void sha256_verify(std::string_view expected_hex, sha256_t const &actual_hash);

}  // namespace quire
