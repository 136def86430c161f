#include "platform.h"

#include <fcntl.h>
#include <unistd.h>

#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <stdexcept>
#include <string>
#include <system_error>
#include <unordered_map>

namespace quire::platform {

struct file_lock::impl {
  int fd;
  std::shared_mutex *path_mutex;  // owned by the s_lock_mutexes map
  bool shared;

  // fcntl locks are per-process, so threads of one process would share the lock.
  // An in-process mutex per path restores mutual exclusion between them. Closing any
  // descriptor drops every fcntl lock the process holds on that file, so concurrent
  // shared holders within one process are only ordered against this process's writers.
  static std::mutex s_lock_map_mutex;
  static std::unordered_map<std::string, std::unique_ptr<std::shared_mutex> > s_lock_mutexes;

  static std::shared_mutex &mutex_for(std::filesystem::path const &path) {
    std::string const canonical_key{
      std::filesystem::absolute(path).lexically_normal().string()
    };
    std::lock_guard<std::mutex> lock(s_lock_map_mutex);
    auto &mutex_ptr{ s_lock_mutexes[canonical_key] };
    if (!mutex_ptr) { mutex_ptr = std::make_unique<std::shared_mutex>(); }
    return *mutex_ptr;
  }

  // Takes the fcntl lock on fd and adopts it; closes fd on failure.
  static std::unique_ptr<impl> adopt(int fd,
                                     std::shared_mutex &path_mutex,
                                     bool shared,
                                     std::filesystem::path const &path) {
    struct flock fl{ .l_type = static_cast<short>(shared ? F_RDLCK : F_WRLCK),
                     .l_whence = SEEK_SET,
                     .l_start = 0,
                     .l_len = 0,
                     .l_pid = 0 };

    if (::fcntl(fd, F_SETLKW, &fl) == -1) {
      int const err{ errno };
      ::close(fd);
      throw std::system_error(err,
                              std::system_category(),
                              std::string{ "Failed to acquire " } +
                                  (shared ? "shared" : "exclusive") +
                                  " lock: " + path.string());
    }

    return std::make_unique<impl>(
        impl{ .fd = fd, .path_mutex = &path_mutex, .shared = shared });
  }
};

std::mutex file_lock::impl::s_lock_map_mutex;
std::unordered_map<std::string, std::unique_ptr<std::shared_mutex> >
    file_lock::impl::s_lock_mutexes;

file_lock::file_lock(std::filesystem::path const &path) {
  auto &path_mutex{ impl::mutex_for(path) };
  std::unique_lock<std::shared_mutex> path_lock{ path_mutex };

  int const fd{ ::open(path.c_str(), O_CREAT | O_RDWR, 0666) };
  if (fd == -1) {
    throw std::system_error(errno,
                            std::system_category(),
                            "Failed to open lock file: " + path.string());
  }

  impl_ = impl::adopt(fd, path_mutex, false, path);
  path_lock.release();  // stays locked until the destructor
}

std::optional<file_lock> file_lock::try_shared(std::filesystem::path const &path) {
  int const fd{ ::open(path.c_str(), O_RDONLY) };
  if (fd == -1) {
    if (errno == ENOENT || errno == EACCES || errno == EROFS) { return std::nullopt; }
    throw std::system_error(errno,
                            std::system_category(),
                            "Failed to open lock file: " + path.string());
  }

  auto &path_mutex{ impl::mutex_for(path) };
  std::shared_lock<std::shared_mutex> path_lock{ path_mutex };

  file_lock lock;
  lock.impl_ = impl::adopt(fd, path_mutex, true, path);
  path_lock.release();  // stays locked until the destructor
  return lock;
}

file_lock::~file_lock() {
  if (impl_) {
    ::close(impl_->fd);
    if (impl_->shared) {
      impl_->path_mutex->unlock_shared();
    } else {
      impl_->path_mutex->unlock();
    }
  }
}

file_lock::file_lock(file_lock &&) noexcept = default;
file_lock &file_lock::operator=(file_lock &&) noexcept = default;

file_lock::operator bool() const { return impl_ != nullptr; }

void atomic_rename(std::filesystem::path const &from, std::filesystem::path const &to) {
  if (::rename(from.c_str(), to.c_str()) != 0) {
    throw std::system_error(errno,
                            std::system_category(),
                            "Failed to rename " + from.string() + " to " + to.string());
  }
}

void touch_file(std::filesystem::path const &path) {
  int const fd{ ::open(path.c_str(), O_CREAT | O_WRONLY, 0644) };
  if (fd == -1) {
    throw std::system_error(errno,
                            std::system_category(),
                            "Failed to touch file: " + path.string());
  }
  ::close(fd);
}

std::optional<std::filesystem::path> get_default_cache_root() {
  if (char const *env_root{ std::getenv("QUIRE_CACHE_ROOT") }) {
    return std::filesystem::path{ env_root };
  }

#ifdef __APPLE__
  if (char const *home{ std::getenv("HOME") }) {
    return std::filesystem::path{ home } / "Library" / "Caches" / "quire";
  }
#else
  if (char const *xdg_cache{ std::getenv("XDG_CACHE_HOME") }) {
    return std::filesystem::path{ xdg_cache } / "quire";
  }

  if (char const *home{ std::getenv("HOME") }) {
    return std::filesystem::path{ home } / ".cache" / "quire";
  }
#endif

  return std::nullopt;
}

char const *get_default_cache_root_env_vars() {
#ifdef __APPLE__
  return "QUIRE_CACHE_ROOT or HOME";
#else
  return "QUIRE_CACHE_ROOT, XDG_CACHE_HOME or HOME";
#endif
}

bool is_tty() { return ::isatty(::fileno(stderr)) != 0; }

}  // namespace quire::platform
