#pragma once

#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace quire {

// A named unit of loadable source code provided by a release.
struct system_info {
  std::string name;
  std::string release;                    // name of the providing release
  std::vector<std::string> source_files;  // relative to the release prefix
  std::vector<std::string> depends_on;    // direct requirements, declaration order
};

// A distributable archive providing one or more systems.
struct release_info {
  std::string name;
  std::string archive_url;  // http(s)/ftp(s) URL, file: URI, or local path
  std::string prefix;       // directory name under software/ once unpacked
  std::string sha256;       // optional; empty when the catalog does not publish one
  std::vector<system_info> systems;  // declaration order
};

// Read-only view of a package distribution. Names compare case-insensitively.
class catalog {
 public:
  virtual ~catalog() = default;

  virtual std::optional<system_info> lookup_system(std::string_view name) = 0;
  virtual std::optional<release_info> lookup_release(std::string_view name) = 0;

  // Runs body with every lookup observing one consistent state of the catalog. The
  // snapshot is released on every exit path. Nested calls reuse the held snapshot.
  virtual void with_consistent_snapshot(std::function<void()> const &body) = 0;
};

}  // namespace quire
