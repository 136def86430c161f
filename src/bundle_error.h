#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

namespace quire {

enum class error_kind { SYSTEM_NOT_FOUND, RELEASE_NOT_FOUND, ARCHIVE_ERROR, IO_ERROR };

std::string_view error_kind_label(error_kind kind);

// Every bundling failure. what() is "<label>: <name>" plus ": <detail>" when a
// lower-level cause is attached.
class bundle_error : public std::runtime_error {
 public:
  bundle_error(error_kind kind, std::string name, std::string detail = {});

  error_kind kind() const { return kind_; }
  std::string const &name() const { return name_; }
  std::string const &detail() const { return detail_; }

 private:
  error_kind kind_;
  std::string name_;
  std::string detail_;
};

}  // namespace quire
