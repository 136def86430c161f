#pragma once

#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace quire {

struct uncopyable {
  uncopyable() = default;
  uncopyable(uncopyable &&) = default;
  uncopyable &operator=(uncopyable &&) = default;
};

struct unmovable {
  unmovable() = default;
  unmovable(unmovable const &) = delete;
  unmovable &operator=(unmovable const &) = delete;
};

template <typename... Ts>
struct match : Ts... {
  using Ts::operator()...;
};

template <typename... Ts>
match(Ts...) -> match<Ts...>;

// Convert bytes to lowercase hex string
std::string util_bytes_to_hex(void const *data, size_t length);

// Convert hex string to bytes (case-insensitive)
std::vector<unsigned char> util_hex_to_bytes(std::string const &hex);

// Convert single hex character to value (0-15). Returns -1 if invalid.
int util_hex_char_to_int(char c);

// ASCII case-insensitive comparisons. System and release names compare this way.
bool util_iequals(std::string_view lhs, std::string_view rhs);
bool util_iless(std::string_view lhs, std::string_view rhs);

// Ordering for name-keyed maps; names differing only in case are the same key.
struct name_less {
  using is_transparent = void;
  bool operator()(std::string_view lhs, std::string_view rhs) const {
    return util_iless(lhs, rhs);
  }
};

// RAII file pointer with custom deleter
struct file_deleter {
  void operator()(std::FILE *file) const noexcept;
};
using file_ptr_t = std::unique_ptr<std::FILE, file_deleter>;

// Open file with RAII wrapper. Returns nullptr on failure.
file_ptr_t util_open_file(std::filesystem::path const &path, char const *mode);

// Entire file contents. Throws std::runtime_error if the file cannot be read.
std::string util_load_file(std::filesystem::path const &path);

// Replace the contents of path: writes a temporary sibling, then renames it over path.
// Readers never observe a half-written file. Throws std::runtime_error on failure.
void util_write_file_atomic(std::filesystem::path const &path, std::string_view contents);

// Human-readable byte formatter (B, KB, MB, GB, TB).
std::string util_format_bytes(std::uint64_t bytes);

// Removes the file at path() on destruction or reset().
class scoped_path_cleanup : public unmovable {
 public:
  explicit scoped_path_cleanup(std::filesystem::path path);
  ~scoped_path_cleanup();

  void reset(std::filesystem::path path = {});
  std::filesystem::path const &path() const { return path_; }

 private:
  void cleanup();

  std::filesystem::path path_;
};

}  // namespace quire
