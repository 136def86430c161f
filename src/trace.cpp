#include "trace.h"

#include "util.h"

#include <chrono>
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <sstream>
#include <string>

namespace quire {

namespace {

std::string_view bool_string(bool value) { return value ? "true" : "false"; }

std::string format_timestamp(std::chrono::system_clock::time_point tp) {
  auto const seconds{ std::chrono::time_point_cast<std::chrono::seconds>(tp) };
  auto const millis{
    std::chrono::duration_cast<std::chrono::milliseconds>(tp - seconds).count()
  };

  std::time_t const timestamp{ std::chrono::system_clock::to_time_t(seconds) };
  std::tm utc_tm{};
  gmtime_r(&timestamp, &utc_tm);

  char base[32]{};
  if (std::strftime(base, sizeof base, "%Y-%m-%dT%H:%M:%S", &utc_tm) == 0) { return {}; }

  char buffer[64]{};
  int const written{ std::snprintf(buffer,
                                   sizeof buffer,
                                   "%s.%03lldZ",
                                   base,
                                   static_cast<long long>(millis)) };
  if (written <= 0) { return {}; }

  return std::string{ buffer, static_cast<std::size_t>(written) };
}

void append_json_string(std::string &out, std::string_view value) {
  for (char const ch : value) {
    switch (ch) {
      case '\\': out.append("\\\\"); break;
      case '"': out.append("\\\""); break;
      case '\b': out.append("\\b"); break;
      case '\f': out.append("\\f"); break;
      case '\n': out.append("\\n"); break;
      case '\r': out.append("\\r"); break;
      case '\t': out.append("\\t"); break;
      default:
        if (static_cast<unsigned char>(ch) < 0x20) {
          char escape[7]{};
          std::snprintf(escape,
                        sizeof escape,
                        "\\u%04x",
                        static_cast<unsigned int>(static_cast<unsigned char>(ch)));
          out.append(escape);
        } else {
          out.push_back(ch);
        }
        break;
    }
  }
}

void append_kv(std::string &out, char const *key, std::string_view value) {
  out.push_back(',');
  out.push_back('"');
  out.append(key);
  out.append("\":\"");
  append_json_string(out, value);
  out.push_back('"');
}

void append_kv(std::string &out, char const *key, std::int64_t value) {
  out.push_back(',');
  out.push_back('"');
  out.append(key);
  out.append("\":");
  out.append(std::to_string(value));
}

void append_kv(std::string &out, char const *key, bool value) {
  out.push_back(',');
  out.push_back('"');
  out.append(key);
  out.append("\":");
  out.append(bool_string(value));
}

}  // namespace

#define TRACE_NAME(type) \
  [](trace_events::type const &) -> std::string_view { return #type; }

std::string_view trace_event_name(trace_event_t const &event) {
  return std::visit(match{
                        TRACE_NAME(catalog_lookup),
                        TRACE_NAME(snapshot_acquired),
                        TRACE_NAME(snapshot_released),
                        TRACE_NAME(release_registered),
                        TRACE_NAME(system_registered),
                        TRACE_NAME(dependency_added),
                        TRACE_NAME(archive_cache_hit),
                        TRACE_NAME(archive_fetch_start),
                        TRACE_NAME(archive_fetch_complete),
                        TRACE_NAME(extract_start),
                        TRACE_NAME(extract_complete),
                        TRACE_NAME(artifact_written),
                    },
                    event);
}

#undef TRACE_NAME

std::string trace_event_to_string(trace_event_t const &event) {
  std::ostringstream oss;
  oss << trace_event_name(event);

  std::visit(
      match{
          [&](trace_events::catalog_lookup const &value) {
            oss << " kind=" << value.kind << " name=" << value.name
                << " found=" << bool_string(value.found);
          },
          [&](trace_events::snapshot_acquired const &value) {
            oss << " catalog=" << value.catalog << " lock_path=" << value.lock_path
                << " wait_ms=" << value.wait_duration_ms;
          },
          [&](trace_events::snapshot_released const &value) {
            oss << " catalog=" << value.catalog << " hold_ms=" << value.hold_duration_ms;
          },
          [&](trace_events::release_registered const &value) {
            oss << " release=" << value.release << " systems=" << value.system_count;
          },
          [&](trace_events::system_registered const &value) {
            oss << " system=" << value.system << " release=" << value.release;
          },
          [&](trace_events::dependency_added const &value) {
            oss << " parent=" << value.parent << " dependency=" << value.dependency;
          },
          [&](trace_events::archive_cache_hit const &value) {
            oss << " release=" << value.release << " archive=" << value.archive_path;
          },
          [&](trace_events::archive_fetch_start const &value) {
            oss << " release=" << value.release << " url=" << value.url
                << " destination=" << value.destination;
          },
          [&](trace_events::archive_fetch_complete const &value) {
            oss << " release=" << value.release << " url=" << value.url
                << " bytes=" << value.bytes_downloaded
                << " duration_ms=" << value.duration_ms;
          },
          [&](trace_events::extract_start const &value) {
            oss << " release=" << value.release << " archive=" << value.archive_path
                << " destination=" << value.destination;
          },
          [&](trace_events::extract_complete const &value) {
            oss << " release=" << value.release << " files=" << value.files_extracted
                << " duration_ms=" << value.duration_ms;
          },
          [&](trace_events::artifact_written const &value) {
            oss << " path=" << value.path << " bytes=" << value.bytes;
          },
      },
      event);

  return oss.str();
}

std::string trace_event_to_json(trace_event_t const &event) {
  std::string output;
  output.reserve(192);
  output.append("{\"ts\":\"");
  output.append(format_timestamp(std::chrono::system_clock::now()));
  output.append("\",\"event\":\"");
  append_json_string(output, trace_event_name(event));
  output.push_back('"');

  std::visit(
      match{
          [&](trace_events::catalog_lookup const &value) {
            append_kv(output, "kind", value.kind);
            append_kv(output, "name", value.name);
            append_kv(output, "found", value.found);
          },
          [&](trace_events::snapshot_acquired const &value) {
            append_kv(output, "catalog", value.catalog);
            append_kv(output, "lock_path", value.lock_path);
            append_kv(output, "wait_duration_ms", value.wait_duration_ms);
          },
          [&](trace_events::snapshot_released const &value) {
            append_kv(output, "catalog", value.catalog);
            append_kv(output, "hold_duration_ms", value.hold_duration_ms);
          },
          [&](trace_events::release_registered const &value) {
            append_kv(output, "release", value.release);
            append_kv(output, "system_count", value.system_count);
          },
          [&](trace_events::system_registered const &value) {
            append_kv(output, "system", value.system);
            append_kv(output, "release", value.release);
          },
          [&](trace_events::dependency_added const &value) {
            append_kv(output, "parent", value.parent);
            append_kv(output, "dependency", value.dependency);
          },
          [&](trace_events::archive_cache_hit const &value) {
            append_kv(output, "release", value.release);
            append_kv(output, "archive_path", value.archive_path);
          },
          [&](trace_events::archive_fetch_start const &value) {
            append_kv(output, "release", value.release);
            append_kv(output, "url", value.url);
            append_kv(output, "destination", value.destination);
          },
          [&](trace_events::archive_fetch_complete const &value) {
            append_kv(output, "release", value.release);
            append_kv(output, "url", value.url);
            append_kv(output, "bytes_downloaded", value.bytes_downloaded);
            append_kv(output, "duration_ms", value.duration_ms);
          },
          [&](trace_events::extract_start const &value) {
            append_kv(output, "release", value.release);
            append_kv(output, "archive_path", value.archive_path);
            append_kv(output, "destination", value.destination);
          },
          [&](trace_events::extract_complete const &value) {
            append_kv(output, "release", value.release);
            append_kv(output, "files_extracted", value.files_extracted);
            append_kv(output, "duration_ms", value.duration_ms);
          },
          [&](trace_events::artifact_written const &value) {
            append_kv(output, "path", value.path);
            append_kv(output, "bytes", value.bytes);
          },
      },
      event);

  output.push_back('}');
  return output;
}

}  // namespace quire
