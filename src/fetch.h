#pragma once

#include "uri.h"

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>

namespace quire {

struct fetch_result {
  uri_scheme scheme;
  std::filesystem::path resolved_source;
  std::filesystem::path resolved_destination;
  std::uint64_t bytes{ 0 };
};

// Retrieves source into destination (a file path; parent directories are created).
// Remote URLs go through libcurl; file: URIs and paths are copied, relative ones
// anchored at file_root. Throws std::runtime_error on any failure, or
// std::invalid_argument for an empty or unsupported source.
fetch_result fetch(std::string_view source,
                   std::filesystem::path const &destination,
                   std::filesystem::path const &file_root = {});

}  // namespace quire
