#include "bundle_error.h"

#include <utility>

namespace quire {

namespace {

std::string format_message(error_kind kind,
                           std::string const &name,
                           std::string const &detail) {
  std::string msg{ error_kind_label(kind) };
  msg += ": ";
  msg += name;
  if (!detail.empty()) {
    msg += ": ";
    msg += detail;
  }
  return msg;
}

}  // namespace

std::string_view error_kind_label(error_kind kind) {
  switch (kind) {
    case error_kind::SYSTEM_NOT_FOUND: return "System not found";
    case error_kind::RELEASE_NOT_FOUND: return "Release not found";
    case error_kind::ARCHIVE_ERROR: return "Archive error";
    case error_kind::IO_ERROR: return "I/O error";
  }
  return "Unknown error";
}

bundle_error::bundle_error(error_kind kind, std::string name, std::string detail)
    : std::runtime_error{ format_message(kind, name, detail) },
      kind_{ kind },
      name_{ std::move(name) },
      detail_{ std::move(detail) } {}

}  // namespace quire
