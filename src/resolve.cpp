#include "resolve.h"

#include "trace.h"
#include "tui.h"

#include <string_view>

namespace quire {

namespace {

void expand(bundle &b, std::string_view name) {
  system_info const &sys{ b.ensure_system(name) };

  // Registered and already walked (or being walked further up the stack).
  if (!b.mark_expanded(sys.name)) { return; }

  for (std::string const &dep : sys.depends_on) {
    QUIRE_TRACE_DEPENDENCY_ADDED(sys.name, dep);
    expand(b, dep);
  }

  release_info const *owner{ b.find_release(sys.release) };
  if (!owner) { return; }
  for (system_info const &sibling : owner->systems) { expand(b, sibling.name); }
}

}  // namespace

void resolve_closure(std::vector<std::string> const &names, bundle &b) {
  b.source().with_consistent_snapshot([&] {
    for (std::string const &name : names) { expand(b, name); }
  });

  tui::debug("resolve_closure: %zu requested, %zu releases, %zu systems",
             names.size(),
             b.release_count(),
             b.system_count());
}

}  // namespace quire
