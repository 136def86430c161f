#pragma once

#include "catalog.h"

#include <cstdint>
#include <filesystem>

namespace quire {

// Where release archives come from and how they are unpacked. Implementations throw
// std::runtime_error on failure; the materializer attributes it to the release.
class archive_source {
 public:
  virtual ~archive_source() = default;

  // Local copy of the release's archive, retrieving it if needed.
  virtual std::filesystem::path fetch_to_cache(release_info const &release) = 0;

  // Writes the plain tar inside local_archive to intermediate.
  virtual void decompress(std::filesystem::path const &local_archive,
                          std::filesystem::path const &intermediate) = 0;

  // Unpacks intermediate into destination_dir and returns the number of files written.
  // The caller owns and deletes intermediate.
  virtual std::uint64_t extract_tar(std::filesystem::path const &intermediate,
                                    std::filesystem::path const &destination_dir,
                                    int strip_components) = 0;
};

}  // namespace quire
