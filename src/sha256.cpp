#include "sha256.h"

#include "mbedtls/sha256.h"
#include "util.h"

#include <cstdio>
#include <cstring>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace quire {

sha256_t sha256(std::filesystem::path const &file_path) {
  file_ptr_t file{ util_open_file(file_path, "rb") };
  if (!file) {
    throw std::runtime_error("sha256: failed to open file: " + file_path.string());
  }

  mbedtls_sha256_context ctx;
  mbedtls_sha256_init(&ctx);
  std::unique_ptr<decltype(ctx), decltype(&mbedtls_sha256_free)> ctx_scope(
      &ctx,
      &mbedtls_sha256_free);

  if (mbedtls_sha256_starts(&ctx, 0)) {
    throw std::runtime_error("sha256: mbedtls_sha256_starts failed");
  }

  std::vector<unsigned char> buffer(256 * 1024);
  for (;;) {
    auto const n{ std::fread(buffer.data(), 1, buffer.size(), file.get()) };
    if (n > 0 && mbedtls_sha256_update(&ctx, buffer.data(), n)) {
      throw std::runtime_error("sha256: mbedtls_sha256_update failed");
    }
    if (n < buffer.size()) {
      if (std::ferror(file.get())) {
        throw std::runtime_error("sha256: read failed: " + file_path.string());
      }
      break;
    }
  }

  sha256_t digest{};
  if (mbedtls_sha256_finish(&ctx, digest.data())) {
    throw std::runtime_error("sha256: mbedtls_sha256_finish failed");
  }
  return digest;
}

sha256_t sha256_string(std::string_view data) {
  sha256_t digest{};
  if (mbedtls_sha256(reinterpret_cast<unsigned char const *>(data.data()),
                     data.size(),
                     digest.data(),
                     0)) {
    throw std::runtime_error("sha256: mbedtls_sha256 failed");
  }
  return digest;
}

void sha256_verify(std::string_view expected_hex, sha256_t const &actual_hash) {
  if (expected_hex.size() != 64) {
    throw std::runtime_error("sha256_verify: expected digest must be 64 hex characters, got " +
                             std::to_string(expected_hex.size()));
  }

  auto const expected{ util_hex_to_bytes(std::string{ expected_hex }) };
  if (expected.size() != actual_hash.size()) {
    throw std::runtime_error("sha256_verify: malformed expected digest: " +
                             std::string{ expected_hex });
  }

  if (std::memcmp(expected.data(), actual_hash.data(), actual_hash.size()) != 0) {
    throw std::runtime_error("SHA256 mismatch: expected " + std::string{ expected_hex } +
                             " but got " +
                             util_bytes_to_hex(actual_hash.data(), actual_hash.size()));
  }
}

}  // namespace quire
