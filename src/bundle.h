#pragma once

#include "catalog.h"
#include "util.h"

#include <cstddef>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace quire {

// Working set of releases and systems gathered for one bundling operation.
//
// The two mappings are kept mutually consistent: every registered system belongs to a
// registered release, and registering a release registers all the systems it provides.
// Entries are never removed, and references handed out stay valid for the bundle's
// lifetime. Not thread-safe; a bundle is owned by the operation that created it.
class bundle : unmovable {
 public:
  explicit bundle(catalog &source);

  catalog &source() const { return catalog_; }

  system_info const *find_system(std::string_view name) const;
  release_info const *find_release(std::string_view name) const;

  // Return the registered entry, consulting the catalog on a miss. Throw bundle_error
  // (SYSTEM_NOT_FOUND / RELEASE_NOT_FOUND) when the catalog does not know the name.
  system_info const &ensure_system(std::string_view name);
  release_info const &ensure_release(std::string_view name);

  // Sorted by name (case-insensitive), independent of registration order.
  std::vector<release_info const *> provided_releases() const;
  std::vector<system_info const *> provided_systems() const;

  std::size_t release_count() const { return releases_.size(); }
  std::size_t system_count() const { return systems_.size(); }

  // Closure bookkeeping: flags a registered system as having had its dependencies
  // walked. Returns false if it was already flagged. Throws std::logic_error if the
  // system is not registered.
  bool mark_expanded(std::string_view name);

 private:
  struct system_entry {
    system_info info;
    bool expanded{ false };
  };

  release_info const &add_release(release_info info);
  system_info const &add_system(system_info info);

  catalog &catalog_;
  std::map<std::string, release_info, name_less> releases_;
  std::map<std::string, system_entry, name_less> systems_;
};

}  // namespace quire
