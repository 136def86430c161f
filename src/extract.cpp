#include "extract.h"

#include "util.h"

#include "archive.h"
#include "archive_entry.h"

#include <fstream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace quire {
namespace {

constexpr std::size_t kBlockSize{ 10240 };

struct archive_reader : unmovable {
  archive_reader() : handle(archive_read_new()) {
    if (!handle) { throw std::runtime_error("archive_read_new failed"); }
    archive_read_support_filter_all(handle);
  }

  ~archive_reader() {
    if (handle) {
      archive_read_close(handle);
      archive_read_free(handle);
    }
  }

  void open(std::filesystem::path const &path) {
    if (archive_read_open_filename(handle, path.string().c_str(), kBlockSize) !=
        ARCHIVE_OK) {
      throw std::runtime_error("Failed to open archive " + path.string() + ": " +
                               archive_error_string(handle));
    }
  }

  archive *handle{ nullptr };
};

struct archive_writer : unmovable {
  archive_writer() : handle(archive_write_disk_new()) {
    if (!handle) { throw std::runtime_error("archive_write_disk_new failed"); }
    archive_write_disk_set_options(handle,
                                   ARCHIVE_EXTRACT_TIME | ARCHIVE_EXTRACT_PERM |
                                       ARCHIVE_EXTRACT_SECURE_NODOTDOT |
                                       ARCHIVE_EXTRACT_SECURE_SYMLINKS);
    archive_write_disk_set_standard_lookup(handle);
  }

  ~archive_writer() {
    if (handle) {
      archive_write_close(handle);
      archive_write_free(handle);
    }
  }

  archive *handle{ nullptr };
};

void ensure_directory(std::filesystem::path const &path) {
  auto const dir{ path.parent_path() };
  if (dir.empty()) { return; }
  std::error_code ec;
  std::filesystem::create_directories(dir, ec);
  if (ec) {
    throw std::runtime_error(std::string("Failed to create directory ") + dir.string() +
                             ": " + ec.message());
  }
}

// Remaining path after dropping strip_count leading components, or nullopt when
// nothing is left.
std::optional<std::string> strip_path_components(char const *path, int strip_count) {
  if (!path) { return std::nullopt; }
  if (strip_count <= 0) { return std::string(path); }

  char const *p{ path };
  int components_stripped{ 0 };

  while (*p == '/') { ++p; }

  while (components_stripped < strip_count) {
    if (*p == '\0') { return std::nullopt; }
    if (*p == '/') {
      ++components_stripped;
      while (*p == '/') { ++p; }
    } else {
      ++p;
    }
  }

  if (*p == '\0') { return std::nullopt; }
  return std::string(p);
}

// Entry paths are joined onto the destination, so they must stay relative and
// must not climb out of it.
std::filesystem::path contained_path(std::filesystem::path const &destination,
                                     std::string const &entry_path) {
  std::filesystem::path const rel{ entry_path };
  if (rel.is_absolute() || rel.has_root_name()) {
    throw std::runtime_error("Archive entry has absolute path: " + entry_path);
  }
  for (auto const &part : rel) {
    if (part == "..") {
      throw std::runtime_error("Archive entry escapes destination: " + entry_path);
    }
  }
  return destination / rel;
}

}  // namespace

std::uint64_t decompress(std::filesystem::path const &archive_path,
                         std::filesystem::path const &output) {
  archive_reader reader;
  archive_read_support_format_raw(reader.handle);
  reader.open(archive_path);

  archive_entry *entry{ nullptr };
  if (int const r{ archive_read_next_header(reader.handle, &entry) }; r != ARCHIVE_OK) {
    throw std::runtime_error("Failed to read " + archive_path.string() + ": " +
                             (r == ARCHIVE_EOF ? std::string{ "empty input" }
                                               : archive_error_string(reader.handle)));
  }

  ensure_directory(output);
  std::ofstream out{ output, std::ios::binary | std::ios::trunc };
  if (!out) { throw std::runtime_error("Failed to open " + output.string()); }

  std::vector<char> buffer(1024 * 1024);
  std::uint64_t written{ 0 };
  la_ssize_t bytes_read{ 0 };
  while ((bytes_read = archive_read_data(reader.handle, buffer.data(), buffer.size())) >
         0) {
    out.write(buffer.data(), static_cast<std::streamsize>(bytes_read));
    if (!out) { throw std::runtime_error("Failed to write " + output.string()); }
    written += static_cast<std::uint64_t>(bytes_read);
  }

  if (bytes_read < 0) {
    throw std::runtime_error("Failed to decompress " + archive_path.string() + ": " +
                             archive_error_string(reader.handle));
  }

  out.close();
  if (!out) { throw std::runtime_error("Failed to close " + output.string()); }
  return written;
}

std::uint64_t extract(std::filesystem::path const &archive_path,
                      std::filesystem::path const &destination,
                      extract_options const &options) {
  archive_reader reader;
  archive_read_support_format_tar(reader.handle);
  archive_writer writer;
  reader.open(archive_path);

  archive_entry *entry{ nullptr };
  std::uint64_t files_extracted{ 0 };

  while (true) {
    int const r{ archive_read_next_header(reader.handle, &entry) };
    if (r == ARCHIVE_EOF) { break; }

    if (r != ARCHIVE_OK) {
      throw std::runtime_error(std::string("Failed to read archive header: ") +
                               archive_error_string(reader.handle));
    }

    auto const stripped{ strip_path_components(archive_entry_pathname(entry),
                                               options.strip_components) };
    if (!stripped) { continue; }  // a stripped-away leading directory

    bool const is_regular_file{ archive_entry_filetype(entry) == AE_IFREG };

    std::filesystem::path const full_path{ contained_path(destination, *stripped) };
    ensure_directory(full_path);
    archive_entry_copy_pathname(entry, full_path.string().c_str());

    if (char const *hardlink{ archive_entry_hardlink(entry) }) {
      auto const target{ strip_path_components(hardlink, options.strip_components) };
      if (!target) {
        throw std::runtime_error(std::string("Archive hardlink target stripped away: ") +
                                 hardlink);
      }
      archive_entry_copy_hardlink(entry,
                                  contained_path(destination, *target).string().c_str());
    }

    if (int const write_header_result{ archive_write_header(writer.handle, entry) };
        write_header_result != ARCHIVE_OK && write_header_result != ARCHIVE_WARN) {
      throw std::runtime_error(std::string("Failed to write entry header: ") +
                               archive_error_string(writer.handle));
    }

    if (archive_entry_size(entry) > 0) {
      std::vector<char> buffer(1024 * 1024);

      la_ssize_t bytes_read{ 0 };
      while ((bytes_read =
                  archive_read_data(reader.handle, buffer.data(), buffer.size())) > 0) {
        if (la_ssize_t const bytes_written{
                archive_write_data(writer.handle,
                                   buffer.data(),
                                   static_cast<size_t>(bytes_read)) };
            bytes_written < 0) {
          throw std::runtime_error(std::string("Failed to write entry data: ") +
                                   archive_error_string(writer.handle));
        }
      }

      if (bytes_read < 0) {
        throw std::runtime_error(std::string("Failed to read entry data: ") +
                                 archive_error_string(reader.handle));
      }
    }

    if (archive_write_finish_entry(writer.handle) != ARCHIVE_OK) {
      throw std::runtime_error(std::string("Failed to finish entry: ") +
                               archive_error_string(writer.handle));
    }

    if (is_regular_file) { ++files_extracted; }
  }

  if (files_extracted == 0) {
    std::string msg{ "Archive extraction failed: 0 files extracted from " +
                     archive_path.filename().string() };
    if (options.strip_components > 0) {
      msg += " with strip=" + std::to_string(options.strip_components);
    }
    throw std::runtime_error(msg);
  }

  return files_extracted;
}

}  // namespace quire
