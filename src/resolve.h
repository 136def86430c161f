#pragma once

#include "bundle.h"

#include <string>
#include <vector>

namespace quire {

// Grow b until it holds every system in names plus everything those systems require,
// directly or transitively. Systems that arrive as siblings of a newly registered
// release are expanded as well, so every registered system has its dependencies
// registered on return. Dependency cycles are fine.
//
// All catalog reads happen inside one consistent snapshot of b's catalog. Throws
// bundle_error (SYSTEM_NOT_FOUND / RELEASE_NOT_FOUND) on the first unknown name; b is
// then partially grown and should be discarded.
void resolve_closure(std::vector<std::string> const &names, bundle &b);

}  // namespace quire
