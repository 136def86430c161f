#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

namespace quire {

namespace trace_events {

struct catalog_lookup {
  std::string kind;  // "system" or "release"
  std::string name;
  bool found;
};

struct snapshot_acquired {
  std::string catalog;
  std::string lock_path;
  std::int64_t wait_duration_ms;
};

struct snapshot_released {
  std::string catalog;
  std::int64_t hold_duration_ms;
};

struct release_registered {
  std::string release;
  std::int64_t system_count;
};

struct system_registered {
  std::string system;
  std::string release;
};

struct dependency_added {
  std::string parent;
  std::string dependency;
};

struct archive_cache_hit {
  std::string release;
  std::string archive_path;
};

struct archive_fetch_start {
  std::string release;
  std::string url;
  std::string destination;
};

struct archive_fetch_complete {
  std::string release;
  std::string url;
  std::int64_t bytes_downloaded;
  std::int64_t duration_ms;
};

struct extract_start {
  std::string release;
  std::string archive_path;
  std::string destination;
};

struct extract_complete {
  std::string release;
  std::int64_t files_extracted;
  std::int64_t duration_ms;
};

struct artifact_written {
  std::string path;
  std::int64_t bytes;
};

}  // namespace trace_events

using trace_event_t = std::variant<trace_events::catalog_lookup,
                                   trace_events::snapshot_acquired,
                                   trace_events::snapshot_released,
                                   trace_events::release_registered,
                                   trace_events::system_registered,
                                   trace_events::dependency_added,
                                   trace_events::archive_cache_hit,
                                   trace_events::archive_fetch_start,
                                   trace_events::archive_fetch_complete,
                                   trace_events::extract_start,
                                   trace_events::extract_complete,
                                   trace_events::artifact_written>;

std::string_view trace_event_name(trace_event_t const &event);
std::string trace_event_to_string(trace_event_t const &event);
std::string trace_event_to_json(trace_event_t const &event);

namespace tui {
extern bool g_trace_enabled;
void trace(trace_event_t event);

inline bool trace_enabled() { return g_trace_enabled; }
}  // namespace tui

}  // namespace quire

#define QUIRE_TRACE_UNLIKELY [[unlikely]]

#define QUIRE_TRACE_EMIT(event_expr) \
  do { \
    if (::quire::tui::g_trace_enabled) QUIRE_TRACE_UNLIKELY { \
        ::quire::tui::trace event_expr; \
      } \
  } while (0)

#define QUIRE_TRACE_CATALOG_LOOKUP(kind_value, name_value, found_value) \
  QUIRE_TRACE_EMIT((::quire::trace_events::catalog_lookup{ \
      .kind = (kind_value), \
      .name = (name_value), \
      .found = (found_value), \
  }))

#define QUIRE_TRACE_SNAPSHOT_ACQUIRED(catalog_value, lock_path_value, wait_value) \
  QUIRE_TRACE_EMIT((::quire::trace_events::snapshot_acquired{ \
      .catalog = (catalog_value), \
      .lock_path = (lock_path_value), \
      .wait_duration_ms = (wait_value), \
  }))

#define QUIRE_TRACE_SNAPSHOT_RELEASED(catalog_value, hold_value) \
  QUIRE_TRACE_EMIT((::quire::trace_events::snapshot_released{ \
      .catalog = (catalog_value), \
      .hold_duration_ms = (hold_value), \
  }))

#define QUIRE_TRACE_RELEASE_REGISTERED(release_value, system_count_value) \
  QUIRE_TRACE_EMIT((::quire::trace_events::release_registered{ \
      .release = (release_value), \
      .system_count = (system_count_value), \
  }))

#define QUIRE_TRACE_SYSTEM_REGISTERED(system_value, release_value) \
  QUIRE_TRACE_EMIT((::quire::trace_events::system_registered{ \
      .system = (system_value), \
      .release = (release_value), \
  }))

#define QUIRE_TRACE_DEPENDENCY_ADDED(parent_value, dependency_value) \
  QUIRE_TRACE_EMIT((::quire::trace_events::dependency_added{ \
      .parent = (parent_value), \
      .dependency = (dependency_value), \
  }))

#define QUIRE_TRACE_ARCHIVE_CACHE_HIT(release_value, archive_path_value) \
  QUIRE_TRACE_EMIT((::quire::trace_events::archive_cache_hit{ \
      .release = (release_value), \
      .archive_path = (archive_path_value), \
  }))

#define QUIRE_TRACE_ARCHIVE_FETCH_START(release_value, url_value, destination_value) \
  QUIRE_TRACE_EMIT((::quire::trace_events::archive_fetch_start{ \
      .release = (release_value), \
      .url = (url_value), \
      .destination = (destination_value), \
  }))

#define QUIRE_TRACE_ARCHIVE_FETCH_COMPLETE(release_value, \
                                           url_value, \
                                           bytes_downloaded_value, \
                                           duration_value) \
  QUIRE_TRACE_EMIT((::quire::trace_events::archive_fetch_complete{ \
      .release = (release_value), \
      .url = (url_value), \
      .bytes_downloaded = (bytes_downloaded_value), \
      .duration_ms = (duration_value), \
  }))

#define QUIRE_TRACE_EXTRACT_START(release_value, archive_path_value, destination_value) \
  QUIRE_TRACE_EMIT((::quire::trace_events::extract_start{ \
      .release = (release_value), \
      .archive_path = (archive_path_value), \
      .destination = (destination_value), \
  }))

#define QUIRE_TRACE_EXTRACT_COMPLETE(release_value, files_extracted_value, duration_value) \
  QUIRE_TRACE_EMIT((::quire::trace_events::extract_complete{ \
      .release = (release_value), \
      .files_extracted = (files_extracted_value), \
      .duration_ms = (duration_value), \
  }))

#define QUIRE_TRACE_ARTIFACT_WRITTEN(path_value, bytes_value) \
  QUIRE_TRACE_EMIT((::quire::trace_events::artifact_written{ \
      .path = (path_value), \
      .bytes = (bytes_value), \
  }))
