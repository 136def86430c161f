#pragma once

#include <cstdint>
#include <filesystem>
#include <string_view>

namespace quire {

void libcurl_ensure_initialized();

// Downloads url (http, https, ftp or ftps) to destination, replacing any existing file.
// Returns the number of bytes written. On failure the partial file is removed and
// std::runtime_error is thrown.
std::uint64_t libcurl_download(std::string_view url,
                               std::filesystem::path const &destination);

}  // namespace quire
