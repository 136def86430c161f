#include "cmd_common.h"

#include "platform.h"

#include <stdexcept>
#include <string>

namespace quire {

std::filesystem::path cmd_resolve_dist_root(
    std::optional<std::filesystem::path> const &dist) {
  return std::filesystem::absolute(dist.value_or(std::filesystem::current_path()))
      .lexically_normal();
}

std::filesystem::path cmd_resolve_cache_root(
    std::optional<std::filesystem::path> const &cache_root) {
  if (cache_root) { return std::filesystem::absolute(*cache_root).lexically_normal(); }

  if (auto root{ platform::get_default_cache_root() }) { return *root; }

  throw std::runtime_error(std::string("Cannot determine cache root; pass --cache-root or set ") +
                           platform::get_default_cache_root_env_vars());
}

}  // namespace quire
