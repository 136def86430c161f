#pragma once

#include "catalog.h"
#include "util.h"

#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace quire {

// Parsed quire-dist.lua: the releases a distribution publishes and which release
// provides each system.
//
//   DIST = "example-2024-01"
//   RELEASES = {
//     ["alpha-1.0"] = {
//       archive = "archives/alpha-1.0.tgz",  -- URL, file: URI, or path relative to dist
//       prefix = "alpha-1.0",                -- optional, defaults to the release name
//       sha256 = "...",                      -- optional
//       systems = { { name = "alpha", files = { "alpha.src" }, depends = {} } },
//     },
//   }
struct dist_description {
  std::string identity;
  std::filesystem::path root;
  std::map<std::string, release_info, name_less> releases;
  std::map<std::string, std::string, name_less> system_to_release;

  static dist_description from_path(std::filesystem::path const &description_path);

  // chunk_name labels Lua errors and validation failures.
  static dist_description parse(std::string const &script,
                                std::filesystem::path const &root,
                                std::string const &chunk_name);
};

// Catalog backed by a distribution directory containing quire-dist.lua.
class lua_catalog : public catalog, unmovable {
 public:
  static constexpr char const *kDescriptionFilename{ "quire-dist.lua" };
  static constexpr char const *kLockFilename{ "quire-dist.lock" };

  explicit lua_catalog(std::filesystem::path root);
  ~lua_catalog() override;

  std::filesystem::path const &root() const { return root_; }

  std::optional<system_info> lookup_system(std::string_view name) override;
  std::optional<release_info> lookup_release(std::string_view name) override;

  // Holds a shared lock on the distribution's lock file, if one exists, and parses the
  // description once; every lookup inside body reads that parse. Publishers take the
  // exclusive lock while rewriting the distribution. Never writes to the distribution.
  void with_consistent_snapshot(std::function<void()> const &body) override;

 private:
  std::filesystem::path root_;
  std::shared_ptr<dist_description const> current_;
};

}  // namespace quire
