#include "lua_catalog.h"

#include "platform.h"
#include "sol_util.h"
#include "trace.h"
#include "tui.h"
#include "uri.h"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdint>
#include <exception>
#include <set>
#include <stdexcept>
#include <utility>

namespace quire {

namespace {

std::string normalize_sha256(std::string value, std::string const &context) {
  if (value.size() != 64 ||
      !std::ranges::all_of(value, [](char c) { return util_hex_char_to_int(c) >= 0; })) {
    throw std::runtime_error(context + ": sha256 must be 64 hex characters");
  }
  std::ranges::transform(value, value.begin(), [](char c) {
    return static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  });
  return value;
}

// A prefix becomes one directory under software/, so it must be a single path
// component.
void validate_prefix(std::string const &prefix, std::string const &context) {
  if (prefix.empty() || prefix == "." || prefix == ".." ||
      prefix.find_first_of("/\\") != std::string::npos) {
    throw std::runtime_error(context + ": invalid prefix '" + prefix + "'");
  }
}

std::string resolve_archive(std::string const &archive,
                            std::filesystem::path const &root,
                            std::string const &context) {
  auto const info{ uri_classify(archive) };
  switch (info.scheme) {
    case uri_scheme::HTTP:
    case uri_scheme::HTTPS:
    case uri_scheme::FTP:
    case uri_scheme::FTPS: return info.canonical;
    case uri_scheme::LOCAL_FILE_ABSOLUTE:
    case uri_scheme::LOCAL_FILE_RELATIVE:
      return uri_resolve_local_file_relative(info.canonical, root).string();
    case uri_scheme::UNKNOWN: break;
  }
  throw std::runtime_error(context + ": unsupported archive location '" + archive + "'");
}

system_info parse_system(sol::object const &obj,
                         std::string const &release_name,
                         std::string const &context) {
  if (!obj.is<sol::table>()) {
    throw std::runtime_error(context + ": systems entries must be tables");
  }
  sol::table const table{ obj.as<sol::table>() };

  system_info sys;
  sys.name = sol_util_get_required<std::string>(table, "name", context);
  if (sys.name.empty()) { throw std::runtime_error(context + ": empty system name"); }

  std::string const sys_context{ context + " system " + sys.name };
  sys.release = release_name;
  sys.source_files = sol_util_get_string_array(table, "files", sys_context);
  sys.depends_on = sol_util_get_string_array(table, "depends", sys_context);
  return sys;
}

release_info parse_release(std::string const &name,
                           sol::table const &table,
                           std::filesystem::path const &root,
                           std::string const &context) {
  release_info release;
  release.name = name;
  release.archive_url =
      resolve_archive(sol_util_get_required<std::string>(table, "archive", context),
                      root,
                      context);
  release.prefix = sol_util_get_optional<std::string>(table, "prefix", context).value_or(name);
  validate_prefix(release.prefix, context);

  if (auto sha{ sol_util_get_optional<std::string>(table, "sha256", context) }) {
    release.sha256 = normalize_sha256(std::move(*sha), context);
  }

  if (auto const systems{ sol_util_get_optional<sol::table>(table, "systems", context) }) {
    for (size_t i{ 1 }, n{ systems->size() }; i <= n; ++i) {
      release.systems.push_back(parse_system((*systems)[i], name, context));
    }
  }

  return release;
}

}  // namespace

dist_description dist_description::from_path(std::filesystem::path const &description_path) {
  tui::debug("Loading distribution description: %s", description_path.string().c_str());
  if (!std::filesystem::exists(description_path)) {
    throw std::runtime_error("distribution description not found: " +
                             description_path.string());
  }
  return parse(util_load_file(description_path),
               description_path.parent_path(),
               description_path.string());
}

dist_description dist_description::parse(std::string const &script,
                                         std::filesystem::path const &root,
                                         std::string const &chunk_name) {
  auto state{ sol_util_make_lua_state() };

  if (sol::protected_function_result const result{
          state->safe_script(script, sol::script_pass_on_error, "@" + chunk_name) };
      !result.valid()) {
    sol::error err = result;
    throw std::runtime_error("Failed to execute distribution description " + chunk_name +
                             ": " + err.what());
  }

  dist_description desc;
  desc.root = root;

  sol::object const dist_obj{ (*state)["DIST"] };
  if (dist_obj.valid() && dist_obj.get_type() != sol::type::lua_nil) {
    if (!dist_obj.is<std::string>()) {
      throw std::runtime_error(chunk_name + ": DIST must be a string");
    }
    desc.identity = dist_obj.as<std::string>();
  }

  sol::object const releases_obj{ (*state)["RELEASES"] };
  if (!releases_obj.valid() || releases_obj.get_type() != sol::type::table) {
    throw std::runtime_error(chunk_name + ": RELEASES must be defined as a table");
  }

  std::set<std::string, name_less> prefixes;
  for (auto const &[key, value] : releases_obj.as<sol::table>()) {
    if (!key.is<std::string>() || key.as<std::string>().empty()) {
      throw std::runtime_error(chunk_name + ": RELEASES keys must be release names");
    }
    std::string const name{ key.as<std::string>() };
    std::string const context{ chunk_name + ": release " + name };
    if (!value.is<sol::table>()) { throw std::runtime_error(context + " must be a table"); }

    release_info release{ parse_release(name, value.as<sol::table>(), root, context) };

    if (!prefixes.insert(release.prefix).second) {
      throw std::runtime_error(context + ": prefix '" + release.prefix +
                               "' is used by another release");
    }
    if (desc.releases.contains(name)) {
      throw std::runtime_error(context + ": release name differs from another only by case");
    }

    for (system_info const &sys : release.systems) {
      auto const [it, inserted]{ desc.system_to_release.emplace(sys.name, name) };
      if (!inserted) {
        throw std::runtime_error(context + ": system " + sys.name +
                                 " is already provided by " + it->second);
      }
    }

    desc.releases.emplace(name, std::move(release));
  }

  tui::debug("Distribution %s: %zu releases, %zu systems",
             desc.identity.empty() ? chunk_name.c_str() : desc.identity.c_str(),
             desc.releases.size(),
             desc.system_to_release.size());
  return desc;
}

lua_catalog::lua_catalog(std::filesystem::path root) : root_{ std::move(root) } {}

lua_catalog::~lua_catalog() = default;

std::optional<system_info> lua_catalog::lookup_system(std::string_view name) {
  std::optional<system_info> result;
  with_consistent_snapshot([&] {
    auto const owner{ current_->system_to_release.find(name) };
    if (owner == current_->system_to_release.end()) { return; }

    release_info const &release{ current_->releases.at(owner->second) };
    auto const it{ std::ranges::find_if(release.systems, [&](system_info const &sys) {
      return util_iequals(sys.name, name);
    }) };
    if (it != release.systems.end()) { result = *it; }
  });
  return result;
}

std::optional<release_info> lua_catalog::lookup_release(std::string_view name) {
  std::optional<release_info> result;
  with_consistent_snapshot([&] {
    auto const it{ current_->releases.find(name) };
    if (it != current_->releases.end()) { result = it->second; }
  });
  return result;
}

void lua_catalog::with_consistent_snapshot(std::function<void()> const &body) {
  if (current_) {  // nested: the outer scope already holds the snapshot
    body();
    return;
  }

  auto const lock_path{ root_ / kLockFilename };
  auto const wait_start{ std::chrono::steady_clock::now() };
  auto const lock{ platform::file_lock::try_shared(lock_path) };
  auto const acquired_at{ std::chrono::steady_clock::now() };
  if (!lock) {
    tui::debug("No readable lock file at %s; reading unlocked", lock_path.string().c_str());
  }

  QUIRE_TRACE_SNAPSHOT_ACQUIRED(
      root_.string(),
      lock_path.string(),
      static_cast<std::int64_t>(
          std::chrono::duration_cast<std::chrono::milliseconds>(acquired_at - wait_start)
              .count()));

  auto const emit_released = [&] {
    QUIRE_TRACE_SNAPSHOT_RELEASED(
        root_.string(),
        static_cast<std::int64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(
                                      std::chrono::steady_clock::now() - acquired_at)
                                      .count()));
  };

  struct reset_on_exit {
    lua_catalog &self;
    ~reset_on_exit() { self.current_.reset(); }
  } const reset{ *this };

  try {
    current_ = std::make_shared<dist_description const>(
        dist_description::from_path(root_ / kDescriptionFilename));
    body();
  } catch (std::exception const &) {
    emit_released();
    throw;
  }
  emit_released();
}

}  // namespace quire
