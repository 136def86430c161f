#include "cmd_bundle.h"

#include "archive_cache.h"
#include "bundle.h"
#include "cmd_common.h"
#include "lua_catalog.h"
#include "materialize.h"
#include "resolve.h"
#include "tui.h"

#include <utility>

namespace quire {

cmd_bundle::cmd_bundle(cmd_bundle::cfg cfg) : cfg_{ std::move(cfg) } {}

void cmd_bundle::execute() {
  lua_catalog catalog{ cmd_resolve_dist_root(cfg_.dist) };
  archive_cache archives{ cmd_resolve_cache_root(cfg_.cache_root) };
  tui::debug("Distribution: %s", catalog.root().string().c_str());
  tui::debug("Cache root: %s", archives.root().string().c_str());

  bundle b{ catalog };
  resolve_closure(cfg_.systems, b);

  auto const target{ std::filesystem::absolute(cfg_.target).lexically_normal() };
  materialize(b, archives, target);

  tui::info("Bundled %zu releases, %zu systems into %s",
            b.release_count(),
            b.system_count(),
            target.string().c_str());
}

}  // namespace quire
