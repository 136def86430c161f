#pragma once

#include "archive_source.h"
#include "util.h"

#include <filesystem>
#include <string>

namespace quire {

// archive_source backed by a download cache:
//
//   <root>/archives/<key>/<archive filename>
//   <root>/archives/<key>/quire-complete
//   <root>/locks/archive.<key>.lock
//
// where <key> is <release>-<16 hex digits of sha256(archive url)>, so distributions
// that reuse a release name for a different archive keep separate entries.
//
// An entry is usable only once its marker exists. Filling an entry happens under the
// entry's lock so concurrent quire processes download each archive once.
class archive_cache : public archive_source, unmovable {
 public:
  static constexpr char const *kCompleteMarker{ "quire-complete" };

  explicit archive_cache(std::filesystem::path root);

  std::filesystem::path const &root() const { return root_; }
  std::filesystem::path entry_dir(release_info const &release) const;

  static std::string entry_key(release_info const &release);

  std::filesystem::path fetch_to_cache(release_info const &release) override;
  void decompress(std::filesystem::path const &local_archive,
                  std::filesystem::path const &intermediate) override;
  std::uint64_t extract_tar(std::filesystem::path const &intermediate,
                            std::filesystem::path const &destination_dir,
                            int strip_components) override;

  static bool is_entry_complete(std::filesystem::path const &entry_dir);

 private:
  std::filesystem::path root_;
};

}  // namespace quire
