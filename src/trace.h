#pragma once

#include "install_phase.h"

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

namespace gdenv {

namespace trace_events {

struct phase_start {
  std::string version;
  install_phase phase;
};

struct phase_complete {
  std::string version;
  install_phase phase;
  std::int64_t duration_ms;
};

struct cache_hit {
  std::string version;
  std::string archive_path;
  bool verified;  // sidecar digest present and matched
};

struct cache_miss {
  std::string version;
  std::string archive_path;
};

struct fetch_file_start {
  std::string version;
  std::string url;
  std::string destination;
};

struct fetch_file_complete {
  std::string version;
  std::string url;
  std::int64_t bytes_downloaded;
  std::int64_t duration_ms;
};

struct extract_start {
  std::string version;
  std::string source;  // archive path, or "<memory>" for in-memory bytes
  std::string destination;
};

struct extract_complete {
  std::string version;
  std::int64_t files_extracted;
  std::int64_t duration_ms;
};

struct file_touched {
  std::string version;
  std::string file_path;
};

struct process_spawned {
  std::string binary;
  std::int64_t pid;
  bool detached;
};

}  // namespace trace_events

using trace_event_t = std::variant<trace_events::phase_start,
                                   trace_events::phase_complete,
                                   trace_events::cache_hit,
                                   trace_events::cache_miss,
                                   trace_events::fetch_file_start,
                                   trace_events::fetch_file_complete,
                                   trace_events::extract_start,
                                   trace_events::extract_complete,
                                   trace_events::file_touched,
                                   trace_events::process_spawned>;

std::string_view trace_event_name(trace_event_t const &event);
std::string trace_event_to_string(trace_event_t const &event);
std::string trace_event_to_json(trace_event_t const &event);

namespace tui {
extern bool g_trace_enabled;
void trace(trace_event_t event);

inline bool trace_enabled() { return g_trace_enabled; }
}  // namespace tui

struct phase_trace_scope {
  std::string version;
  install_phase phase;
  std::chrono::steady_clock::time_point start;

  phase_trace_scope(std::string canonical_version,
                    install_phase phase_value,
                    std::chrono::steady_clock::time_point start_time);
  ~phase_trace_scope();
};

}  // namespace gdenv

#define GDENV_TRACE_UNLIKELY [[unlikely]]

#define GDENV_TRACE_EMIT(event_expr) \
  do { \
    if (::gdenv::tui::g_trace_enabled) GDENV_TRACE_UNLIKELY { \
        ::gdenv::tui::trace event_expr; \
      } \
  } while (0)

#define GDENV_TRACE_PHASE_START(version_value, phase_value) \
  GDENV_TRACE_EMIT((::gdenv::trace_events::phase_start{ \
      .version = (version_value), \
      .phase = (phase_value), \
  }))

#define GDENV_TRACE_PHASE_COMPLETE(version_value, phase_value, duration_value) \
  GDENV_TRACE_EMIT((::gdenv::trace_events::phase_complete{ \
      .version = (version_value), \
      .phase = (phase_value), \
      .duration_ms = (duration_value), \
  }))

#define GDENV_TRACE_CACHE_HIT(version_value, archive_path_value, verified_value) \
  GDENV_TRACE_EMIT((::gdenv::trace_events::cache_hit{ \
      .version = (version_value), \
      .archive_path = (archive_path_value), \
      .verified = (verified_value), \
  }))

#define GDENV_TRACE_CACHE_MISS(version_value, archive_path_value) \
  GDENV_TRACE_EMIT((::gdenv::trace_events::cache_miss{ \
      .version = (version_value), \
      .archive_path = (archive_path_value), \
  }))

#define GDENV_TRACE_FETCH_FILE_START(version_value, url_value, destination_value) \
  GDENV_TRACE_EMIT((::gdenv::trace_events::fetch_file_start{ \
      .version = (version_value), \
      .url = (url_value), \
      .destination = (destination_value), \
  }))

#define GDENV_TRACE_FETCH_FILE_COMPLETE(version_value, \
                                        url_value, \
                                        bytes_downloaded_value, \
                                        duration_value) \
  GDENV_TRACE_EMIT((::gdenv::trace_events::fetch_file_complete{ \
      .version = (version_value), \
      .url = (url_value), \
      .bytes_downloaded = (bytes_downloaded_value), \
      .duration_ms = (duration_value), \
  }))

#define GDENV_TRACE_EXTRACT_START(version_value, source_value, destination_value) \
  GDENV_TRACE_EMIT((::gdenv::trace_events::extract_start{ \
      .version = (version_value), \
      .source = (source_value), \
      .destination = (destination_value), \
  }))

#define GDENV_TRACE_EXTRACT_COMPLETE(version_value, files_value, duration_value) \
  GDENV_TRACE_EMIT((::gdenv::trace_events::extract_complete{ \
      .version = (version_value), \
      .files_extracted = (files_value), \
      .duration_ms = (duration_value), \
  }))

#define GDENV_TRACE_FILE_TOUCHED(version_value, file_path_value) \
  GDENV_TRACE_EMIT((::gdenv::trace_events::file_touched{ \
      .version = (version_value), \
      .file_path = (file_path_value), \
  }))

#define GDENV_TRACE_PROCESS_SPAWNED(binary_value, pid_value, detached_value) \
  GDENV_TRACE_EMIT((::gdenv::trace_events::process_spawned{ \
      .binary = (binary_value), \
      .pid = (pid_value), \
      .detached = (detached_value), \
  }))
