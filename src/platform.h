#pragma once

#include "util.h"

#include <filesystem>
#include <memory>
#include <optional>

namespace quire::platform {

// Advisory lock on a lock file, held for the object's lifetime. Blocks until acquired.
// Also serializes threads of this process that lock the same path.
class file_lock : uncopyable {
 public:
  // Exclusive lock. Creates the lock file if it does not exist.
  explicit file_lock(std::filesystem::path const &path);

  // Shared lock that never writes: nullopt when the lock file is absent or cannot be
  // opened for reading, in which case no writer can hold it either.
  static std::optional<file_lock> try_shared(std::filesystem::path const &path);

  ~file_lock();
  file_lock(file_lock &&) noexcept;
  file_lock &operator=(file_lock &&) noexcept;

  explicit operator bool() const;

 private:
  file_lock() = default;

  struct impl;
  std::unique_ptr<impl> impl_;
};

void atomic_rename(std::filesystem::path const &from, std::filesystem::path const &to);
void touch_file(std::filesystem::path const &path);

std::optional<std::filesystem::path> get_default_cache_root();
char const *get_default_cache_root_env_vars();

bool is_tty();

}  // namespace quire::platform
