#include "fetch.h"

#include "libcurl_util.h"

#include <optional>
#include <stdexcept>
#include <string>
#include <system_error>

namespace quire {

namespace {

std::filesystem::path prepare_destination(std::filesystem::path destination) {
  if (destination.empty()) { throw std::invalid_argument("fetch: destination path is empty"); }

  if (!destination.is_absolute()) { destination = std::filesystem::absolute(destination); }
  destination = destination.lexically_normal();

  if (auto const parent{ destination.parent_path() }; !parent.empty()) {
    std::error_code ec;
    std::filesystem::create_directories(parent, ec);
    if (ec) {
      throw std::runtime_error("fetch: failed to create destination parent: " +
                               parent.string() + ": " + ec.message());
    }
  }

  return destination;
}

fetch_result fetch_local_file(uri_info const &info,
                              std::filesystem::path const &destination,
                              std::filesystem::path const &file_root) {
  auto const source{ uri_resolve_local_file_relative(
      info.canonical,
      file_root.empty() ? std::nullopt : std::optional{ file_root }) };

  std::error_code ec;
  if (!std::filesystem::is_regular_file(source, ec)) {
    throw std::runtime_error("fetch: source file does not exist: " + source.string());
  }

  auto const dest{ prepare_destination(destination) };
  std::filesystem::copy_file(source,
                             dest,
                             std::filesystem::copy_options::overwrite_existing,
                             ec);
  if (ec) {
    throw std::runtime_error("fetch: failed to copy file: " + source.string() + " -> " +
                             dest.string() + ": " + ec.message());
  }

  auto const size{ std::filesystem::file_size(dest, ec) };
  return fetch_result{ .scheme = info.scheme,
                       .resolved_source = source,
                       .resolved_destination = dest,
                       .bytes = ec ? 0 : static_cast<std::uint64_t>(size) };
}

}  // namespace

fetch_result fetch(std::string_view source,
                   std::filesystem::path const &destination,
                   std::filesystem::path const &file_root) {
  auto const info{ uri_classify(source) };
  if (info.canonical.empty()) { throw std::invalid_argument("fetch: source URI is empty"); }

  switch (info.scheme) {
    case uri_scheme::HTTP:
    case uri_scheme::HTTPS:
    case uri_scheme::FTP:
    case uri_scheme::FTPS: {
      auto const dest{ prepare_destination(destination) };
      auto const bytes{ libcurl_download(info.canonical, dest) };
      return fetch_result{ .scheme = info.scheme,
                           .resolved_source = std::filesystem::path{ info.canonical },
                           .resolved_destination = dest,
                           .bytes = bytes };
    }
    case uri_scheme::LOCAL_FILE_ABSOLUTE:
    case uri_scheme::LOCAL_FILE_RELATIVE:
      return fetch_local_file(info, destination, file_root);
    case uri_scheme::UNKNOWN: break;
  }

  throw std::invalid_argument("fetch: unsupported source: " + info.canonical);
}

}  // namespace quire
