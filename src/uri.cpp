#include "uri.h"

#include "util.h"

#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace quire {
namespace {

std::string_view trim(std::string_view value) {
  auto const first{ value.find_first_not_of(" \t\n\r\f\v") };
  if (first == std::string_view::npos) { return {}; }

  auto const last{ value.find_last_not_of(" \t\n\r\f\v") };
  return value.substr(first, last - first + 1);
}

bool istarts_with(std::string_view value, std::string_view prefix) {
  if (prefix.size() > value.size()) { return false; }
  return util_iequals(value.substr(0, prefix.size()), prefix);
}

std::string_view strip_query_and_fragment(std::string_view uri) {
  auto const pos{ uri.find_first_of("?#") };
  return pos == std::string_view::npos ? uri : uri.substr(0, pos);
}

// file://host/path -> //host/path, file://localhost/path and file:///path -> /path
std::string strip_file_scheme(std::string_view uri) {
  std::string cand{ uri.substr(7) };

  if (!cand.empty() && cand[0] == '/') { return cand; }

  auto const slash{ cand.find('/') };
  if (slash == std::string::npos) { return cand; }

  std::string_view const host{ std::string_view{ cand }.substr(0, slash) };
  std::string_view const tail{ std::string_view{ cand }.substr(slash) };

  if (host.empty() || util_iequals(host, "localhost")) { return std::string{ tail }; }
  return std::string{ "//" }.append(host).append(tail);
}

}  // namespace

uri_info uri_classify(std::string_view value) {
  auto canonical{ std::string{ trim(value) } };
  if (canonical.empty()) { return uri_info{ uri_scheme::UNKNOWN, std::move(canonical) }; }

  if (istarts_with(canonical, "https://")) {
    return uri_info{ uri_scheme::HTTPS, std::move(canonical) };
  }
  if (istarts_with(canonical, "http://")) {
    return uri_info{ uri_scheme::HTTP, std::move(canonical) };
  }
  if (istarts_with(canonical, "ftps://")) {
    return uri_info{ uri_scheme::FTPS, std::move(canonical) };
  }
  if (istarts_with(canonical, "ftp://")) {
    return uri_info{ uri_scheme::FTP, std::move(canonical) };
  }

  std::string local_source;
  if (istarts_with(canonical, "file://")) {
    local_source = strip_file_scheme(canonical);
  } else {
    if (canonical.find("://") != std::string::npos) {
      return uri_info{ uri_scheme::UNKNOWN, std::move(canonical) };
    }
    local_source = canonical;
  }

  uri_scheme const scheme{ std::filesystem::path{ local_source }.is_absolute()
                               ? uri_scheme::LOCAL_FILE_ABSOLUTE
                               : uri_scheme::LOCAL_FILE_RELATIVE };
  return uri_info{ scheme, std::move(local_source) };
}

bool uri_is_remote(uri_scheme scheme) {
  switch (scheme) {
    case uri_scheme::HTTP:
    case uri_scheme::HTTPS:
    case uri_scheme::FTP:
    case uri_scheme::FTPS: return true;
    default: return false;
  }
}

std::filesystem::path uri_resolve_local_file_relative(
    std::string_view local_file,
    std::optional<std::filesystem::path> const &anchor) {
  auto const trimmed{ trim(local_file) };
  if (trimmed.empty()) { throw std::invalid_argument("resolve_local_uri: empty value"); }

  auto const info{ uri_classify(trimmed) };
  if (info.scheme != uri_scheme::LOCAL_FILE_ABSOLUTE &&
      info.scheme != uri_scheme::LOCAL_FILE_RELATIVE) {
    throw std::invalid_argument("resolve_local_uri: value is not a local file: " +
                                std::string{ trimmed });
  }

  std::filesystem::path resolved{ info.canonical };
  if (info.scheme == uri_scheme::LOCAL_FILE_RELATIVE) {
    auto const base{ anchor && !anchor->empty() ? std::filesystem::absolute(*anchor)
                                                : std::filesystem::current_path() };
    resolved = base / resolved;
  }

  return resolved.lexically_normal();
}

std::string uri_extract_filename(std::string_view uri) {
  auto const path{ strip_query_and_fragment(trim(uri)) };
  if (path.empty() || path.back() == '/') { return {}; }

  auto const slash{ path.find_last_of('/') };
  auto const name{ slash == std::string_view::npos ? path : path.substr(slash + 1) };

  // Bare host after a scheme ("https://example.com") has no filename.
  if (slash != std::string_view::npos && slash >= 2 && path.substr(slash - 2, 3) == "://") {
    return {};
  }
  return std::string{ name };
}

}  // namespace quire
