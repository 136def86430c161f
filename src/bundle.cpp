#include "bundle.h"

#include "bundle_error.h"
#include "trace.h"
#include "tui.h"

#include <cstdint>
#include <stdexcept>
#include <utility>

namespace quire {

bundle::bundle(catalog &source) : catalog_{ source } {}

system_info const *bundle::find_system(std::string_view name) const {
  auto const it{ systems_.find(name) };
  return it == systems_.end() ? nullptr : &it->second.info;
}

release_info const *bundle::find_release(std::string_view name) const {
  auto const it{ releases_.find(name) };
  return it == releases_.end() ? nullptr : &it->second;
}

system_info const &bundle::ensure_system(std::string_view name) {
  if (auto const *existing{ find_system(name) }) { return *existing; }

  auto info{ catalog_.lookup_system(name) };
  QUIRE_TRACE_CATALOG_LOOKUP("system", std::string{ name }, info.has_value());
  if (!info) { throw bundle_error{ error_kind::SYSTEM_NOT_FOUND, std::string{ name } }; }
  if (info->name.empty()) { info->name = name; }

  release_info const &owner{ ensure_release(info->release) };

  if (auto const *registered{ find_system(name) }) { return *registered; }

  // The catalog attributes the system to a release that does not list it; keep the
  // lookup result so the bundle still holds what was asked for.
  tui::warn("System %s is not listed by its release %s",
            info->name.c_str(),
            owner.name.c_str());
  info->release = owner.name;
  return add_system(std::move(*info));
}

release_info const &bundle::ensure_release(std::string_view name) {
  if (auto const *existing{ find_release(name) }) { return *existing; }

  auto info{ catalog_.lookup_release(name) };
  QUIRE_TRACE_CATALOG_LOOKUP("release", std::string{ name }, info.has_value());
  if (!info) { throw bundle_error{ error_kind::RELEASE_NOT_FOUND, std::string{ name } }; }
  if (info->name.empty()) { info->name = name; }
  if (info->prefix.empty()) { info->prefix = info->name; }

  return add_release(std::move(*info));
}

std::vector<release_info const *> bundle::provided_releases() const {
  std::vector<release_info const *> result;
  result.reserve(releases_.size());
  for (auto const &[key, release] : releases_) { result.push_back(&release); }
  return result;
}

std::vector<system_info const *> bundle::provided_systems() const {
  std::vector<system_info const *> result;
  result.reserve(systems_.size());
  for (auto const &[key, entry] : systems_) { result.push_back(&entry.info); }
  return result;
}

bool bundle::mark_expanded(std::string_view name) {
  auto const it{ systems_.find(name) };
  if (it == systems_.end()) {
    throw std::logic_error("bundle::mark_expanded: system not registered: " +
                           std::string{ name });
  }
  if (it->second.expanded) { return false; }
  it->second.expanded = true;
  return true;
}

release_info const &bundle::add_release(release_info info) {
  std::string key{ info.name };
  auto const [it, inserted]{ releases_.emplace(std::move(key), std::move(info)) };
  release_info &release{ it->second };
  if (!inserted) { return release; }

  QUIRE_TRACE_RELEASE_REGISTERED(release.name,
                                 static_cast<std::int64_t>(release.systems.size()));

  for (system_info &sys : release.systems) {
    sys.release = release.name;

    if (auto const *other{ find_system(sys.name) }) {
      tui::warn("System %s is provided by both %s and %s; keeping %s",
                sys.name.c_str(),
                other->release.c_str(),
                release.name.c_str(),
                other->release.c_str());
      continue;
    }

    add_system(sys);
  }

  return release;
}

system_info const &bundle::add_system(system_info info) {
  std::string key{ info.name };
  auto const [it, inserted]{ systems_.emplace(std::move(key),
                                              system_entry{ .info = std::move(info) }) };
  if (inserted) {
    QUIRE_TRACE_SYSTEM_REGISTERED(it->second.info.name, it->second.info.release);
  }
  return it->second.info;
}

}  // namespace quire
