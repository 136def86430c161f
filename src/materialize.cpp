#include "materialize.h"

#include "bundle_error.h"
#include "trace.h"
#include "tui.h"
#include "util.h"

#include <chrono>
#include <cstdint>
#include <stdexcept>
#include <system_error>

namespace quire {

namespace {

constexpr char kLoaderScript[]{ R"lua(-- Generated by quire. Lists the source files of this bundle, in index order.
local source = debug.getinfo(1, "S").source
local root = "."
if source:sub(1, 1) == "@" then
  root = source:sub(2):match("^(.*)[/\\]") or "."
end

local files = {}
local index = assert(io.open(root .. "/system-index.txt", "r"))
for line in index:lines() do
  if line ~= "" then files[#files + 1] = root .. "/" .. line end
end
index:close()

return {
  root = root,
  files = files,
  load = function()
    for _, file in ipairs(files) do dofile(file) end
  end,
}
)lua" };

void write_artifact(std::filesystem::path const &path, std::string const &contents) {
  try {
    util_write_file_atomic(path, contents);
  } catch (std::runtime_error const &e) {
    throw bundle_error{ error_kind::IO_ERROR, path.string(), e.what() };
  }
  QUIRE_TRACE_ARTIFACT_WRITTEN(path.string(), static_cast<std::int64_t>(contents.size()));
}

void ensure_target_directory(std::filesystem::path const &dir) {
  std::error_code ec;
  std::filesystem::create_directories(dir, ec);
  if (ec) { throw bundle_error{ error_kind::IO_ERROR, dir.string(), ec.message() }; }
}

void unpack_release(release_info const &release,
                    archive_source &source,
                    std::filesystem::path const &software_dir,
                    std::filesystem::path const &staging_dir) {
  auto const destination{ software_dir / release.prefix };

  try {
    auto const local_archive{ source.fetch_to_cache(release) };

    scoped_path_cleanup intermediate{ staging_dir / (release.prefix + ".tar") };
    source.decompress(local_archive, intermediate.path());

    auto const start{ std::chrono::steady_clock::now() };
    QUIRE_TRACE_EXTRACT_START(release.name, intermediate.path().string(), destination.string());

    std::filesystem::create_directories(destination);
    auto const files{ source.extract_tar(intermediate.path(), destination, 1) };

    QUIRE_TRACE_EXTRACT_COMPLETE(
        release.name,
        static_cast<std::int64_t>(files),
        static_cast<std::int64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(
                                      std::chrono::steady_clock::now() - start)
                                      .count()));
    tui::debug("Unpacked %s: %llu files",
               release.name.c_str(),
               static_cast<unsigned long long>(files));
  } catch (bundle_error const &) {
    throw;
  } catch (std::exception const &e) {
    throw bundle_error{ error_kind::ARCHIVE_ERROR, release.name, e.what() };
  }
}

}  // namespace

void unpack_releases(bundle const &b,
                     archive_source &source,
                     std::filesystem::path const &target) {
  auto const software_dir{ target / kSoftwareDir };
  ensure_target_directory(software_dir);

  // Intermediate tars live outside software/ so they never collide with a prefix.
  auto const staging_dir{ target / kStagingDir };
  ensure_target_directory(staging_dir);
  // Removed at the end; each tar is gone by then, leaving the directory empty.
  scoped_path_cleanup const staging_cleanup{ staging_dir };

  for (release_info const *release : b.provided_releases()) {
    tui::info("Unpacking %s", release->name.c_str());
    unpack_release(*release, source, software_dir, staging_dir);
  }
}

std::string render_system_index(bundle const &b) {
  std::string out;
  for (release_info const *release : b.provided_releases()) {
    for (system_info const &declared : release->systems) {
      system_info const *sys{ b.find_system(declared.name) };
      if (!sys || !util_iequals(sys->release, release->name)) { continue; }

      for (std::string const &file : sys->source_files) {
        out.append(kSoftwareDir).append("/").append(release->prefix).append("/");
        out.append(file).append("\n");
      }
    }
  }
  return out;
}

std::string render_loader_script() { return kLoaderScript; }

void write_system_index(bundle const &b, std::filesystem::path const &target) {
  write_artifact(target / kSystemIndexFilename, render_system_index(b));
}

void write_loader_script(std::filesystem::path const &target) {
  write_artifact(target / kLoaderFilename, render_loader_script());
}

void materialize(bundle const &b, archive_source &source, std::filesystem::path const &target) {
  ensure_target_directory(target);
  unpack_releases(b, source, target);
  write_system_index(b, target);
  write_loader_script(target);
  tui::debug("Materialized %zu releases into %s", b.release_count(), target.string().c_str());
}

}  // namespace quire
