#pragma once

#include "archive_source.h"
#include "bundle.h"

#include <filesystem>
#include <string>

namespace quire {

inline constexpr char kSoftwareDir[]{ "software" };
inline constexpr char kSystemIndexFilename[]{ "system-index.txt" };
inline constexpr char kLoaderFilename[]{ "bundle-loader.lua" };
inline constexpr char kStagingDir[]{ ".quire-tmp" };

// Unpacks every release of b into target/software/<prefix>/, dropping each archive's
// top-level directory. Each decompressed tar is staged in target/.quire-tmp/ and removed
// once extracted. Throws bundle_error ARCHIVE_ERROR naming the failed release.
void unpack_releases(bundle const &b, archive_source &source, std::filesystem::path const &target);

// Text of system-index.txt: "software/<prefix>/<file>\n" per source file, ordered by
// release name, then each release's system order, then each system's file order.
std::string render_system_index(bundle const &b);

// Lua chunk that reads the index next to it and returns { root, files, load }.
std::string render_loader_script();

// Throw bundle_error IO_ERROR naming the file they could not write.
void write_system_index(bundle const &b, std::filesystem::path const &target);
void write_loader_script(std::filesystem::path const &target);

// All three stages into target, which is created if needed. Safe to repeat over a
// previous run; not transactional.
void materialize(bundle const &b, archive_source &source, std::filesystem::path const &target);

}  // namespace quire
