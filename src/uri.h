#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace quire {

enum class uri_scheme {
  HTTP,
  HTTPS,
  FTP,
  FTPS,
  LOCAL_FILE_ABSOLUTE,
  LOCAL_FILE_RELATIVE,
  UNKNOWN
};

struct uri_info {
  uri_scheme scheme;
  std::string canonical;  // file: URIs are reduced to their path
};

uri_info uri_classify(std::string_view value);

bool uri_is_remote(uri_scheme scheme);

// Absolute, normalized path for a local-file value; relative values are anchored at
// anchor (or the current directory). Throws std::invalid_argument for remote values.
std::filesystem::path uri_resolve_local_file_relative(
    std::string_view local_file,
    std::optional<std::filesystem::path> const &anchor);

// Filename component of a URI or path, with any query string or fragment removed.
// Returns an empty string if there is none.
std::string uri_extract_filename(std::string_view uri);

}  // namespace quire
