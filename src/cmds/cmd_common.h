#pragma once

#include <filesystem>
#include <optional>

namespace quire {

// Distribution directory to read: the --dist value, else the current directory.
std::filesystem::path cmd_resolve_dist_root(std::optional<std::filesystem::path> const &dist);

// Archive cache root: the --cache-root value, else the platform default. Throws
// std::runtime_error if neither is available.
std::filesystem::path cmd_resolve_cache_root(
    std::optional<std::filesystem::path> const &cache_root);

}  // namespace quire
