#include "cmd_resolve.h"

#include "bundle.h"
#include "cmd_common.h"
#include "lua_catalog.h"
#include "resolve.h"
#include "tui.h"

#include <utility>

namespace quire {

cmd_resolve::cmd_resolve(cmd_resolve::cfg cfg) : cfg_{ std::move(cfg) } {}

void cmd_resolve::execute() {
  lua_catalog catalog{ cmd_resolve_dist_root(cfg_.dist) };
  bundle b{ catalog };
  resolve_closure(cfg_.systems, b);

  tui::print_stdout("releases:\n");
  for (release_info const *release : b.provided_releases()) {
    tui::print_stdout("  %s (%s)\n", release->name.c_str(), release->prefix.c_str());
  }

  tui::print_stdout("systems:\n");
  for (system_info const *sys : b.provided_systems()) {
    tui::print_stdout("  %s [%s]\n", sys->name.c_str(), sys->release.c_str());
  }
}

}  // namespace quire
