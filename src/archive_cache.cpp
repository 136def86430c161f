#include "archive_cache.h"

#include "extract.h"
#include "fetch.h"
#include "platform.h"
#include "sha256.h"
#include "trace.h"
#include "tui.h"
#include "uri.h"

#include <chrono>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>

using path = std::filesystem::path;

namespace quire {

namespace {

// Release names become single directory names inside the cache.
std::string entry_name(std::string_view release_name) {
  std::string name{ release_name };
  for (char &c : name) {
    if (c == '/' || c == '\\' || c == ':') { c = '_'; }
  }
  if (name.empty() || name == "." || name == "..") { name.insert(0, "_"); }
  return name;
}

// Distinguishes releases that share a name but come from different archives.
std::string url_tag(std::string_view archive_url) {
  auto const digest{ sha256_string(archive_url) };
  return util_bytes_to_hex(digest.data(), 8);
}

std::string archive_filename(release_info const &release) {
  auto name{ uri_extract_filename(release.archive_url) };
  return name.empty() ? entry_name(release.name) + ".archive" : name;
}

void remove_noexcept(path const &target) {
  std::error_code ec;
  std::filesystem::remove(target, ec);
  if (ec) { tui::warn("Failed to remove %s: %s", target.string().c_str(), ec.message().c_str()); }
}

std::int64_t elapsed_ms(std::chrono::steady_clock::time_point since) {
  return static_cast<std::int64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(
                                       std::chrono::steady_clock::now() - since)
                                       .count());
}

}  // namespace

archive_cache::archive_cache(path root) : root_{ std::move(root) } {}

std::string archive_cache::entry_key(release_info const &release) {
  return entry_name(release.name) + "-" + url_tag(release.archive_url);
}

path archive_cache::entry_dir(release_info const &release) const {
  return root_ / "archives" / entry_key(release);
}

bool archive_cache::is_entry_complete(path const &entry_dir) {
  std::error_code ec;
  return std::filesystem::exists(entry_dir / kCompleteMarker, ec);
}

path archive_cache::fetch_to_cache(release_info const &release) {
  auto const entry{ entry_dir(release) };
  auto const archive_path{ entry / archive_filename(release) };

  auto const usable = [&] {
    if (!is_entry_complete(entry) || !std::filesystem::exists(archive_path)) {
      return false;
    }
    if (release.sha256.empty()) { return true; }
    try {
      sha256_verify(release.sha256, sha256(archive_path));
      return true;
    } catch (std::runtime_error const &e) {
      tui::warn("Discarding cached archive for %s: %s", release.name.c_str(), e.what());
      return false;
    }
  };

  if (usable()) {
    QUIRE_TRACE_ARCHIVE_CACHE_HIT(release.name, archive_path.string());
    return archive_path;
  }

  auto const locks_dir{ root_ / "locks" };
  std::filesystem::create_directories(locks_dir);
  std::filesystem::create_directories(entry);

  platform::file_lock const lock{ locks_dir / ("archive." + entry_key(release) + ".lock") };

  if (usable()) {  // another process filled the entry while this one waited
    QUIRE_TRACE_ARCHIVE_CACHE_HIT(release.name, archive_path.string());
    return archive_path;
  }

  remove_noexcept(entry / kCompleteMarker);

  auto const partial{ path{ archive_path }.concat(".part") };
  scoped_path_cleanup partial_cleanup{ partial };

  auto const start{ std::chrono::steady_clock::now() };
  QUIRE_TRACE_ARCHIVE_FETCH_START(release.name, release.archive_url, archive_path.string());
  tui::info("Fetching %s", release.archive_url.c_str());

  auto const result{ fetch(release.archive_url, partial) };

  QUIRE_TRACE_ARCHIVE_FETCH_COMPLETE(release.name,
                                     release.archive_url,
                                     static_cast<std::int64_t>(result.bytes),
                                     elapsed_ms(start));
  tui::debug("Fetched %s (%s)",
             release.name.c_str(),
             util_format_bytes(result.bytes).c_str());

  if (!release.sha256.empty()) { sha256_verify(release.sha256, sha256(partial)); }

  platform::atomic_rename(partial, archive_path);
  partial_cleanup.reset();
  platform::touch_file(entry / kCompleteMarker);

  return archive_path;
}

void archive_cache::decompress(path const &local_archive, path const &intermediate) {
  auto const bytes{ quire::decompress(local_archive, intermediate) };
  tui::debug("Decompressed %s (%s)",
             local_archive.filename().string().c_str(),
             util_format_bytes(bytes).c_str());
}

std::uint64_t archive_cache::extract_tar(path const &intermediate,
                                         path const &destination_dir,
                                         int strip_components) {
  return extract(intermediate,
                 destination_dir,
                 extract_options{ .strip_components = strip_components });
}

}  // namespace quire
