#include "trace.h"

#include "install_phase.h"
#include "util.h"

#include <chrono>
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <iterator>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace gdenv {

namespace {

struct field {
  char const *key;
  std::variant<std::string_view, std::int64_t, bool> value;
  bool json_only{ false };
};

using fields_t = std::vector<field>;

fields_t phase_fields(std::string_view version, install_phase phase) {
  return { { "version", version },
           { "phase", install_phase_name(phase) },
           { "phase_num", static_cast<std::int64_t>(static_cast<int>(phase)), true } };
}

// Key/value payload of an event, in output order.
fields_t event_fields(trace_event_t const &event) {
  return std::visit(
      match{
          [](trace_events::phase_start const &e) { return phase_fields(e.version, e.phase); },
          [](trace_events::phase_complete const &e) {
            auto fields{ phase_fields(e.version, e.phase) };
            fields.push_back({ "duration_ms", e.duration_ms });
            return fields;
          },
          [](trace_events::cache_hit const &e) -> fields_t {
            return { { "version", e.version },
                     { "archive_path", e.archive_path },
                     { "verified", e.verified } };
          },
          [](trace_events::cache_miss const &e) -> fields_t {
            return { { "version", e.version }, { "archive_path", e.archive_path } };
          },
          [](trace_events::fetch_file_start const &e) -> fields_t {
            return { { "version", e.version },
                     { "url", e.url },
                     { "destination", e.destination } };
          },
          [](trace_events::fetch_file_complete const &e) -> fields_t {
            return { { "version", e.version },
                     { "url", e.url },
                     { "bytes_downloaded", e.bytes_downloaded },
                     { "duration_ms", e.duration_ms } };
          },
          [](trace_events::extract_start const &e) -> fields_t {
            return { { "version", e.version },
                     { "source", e.source },
                     { "destination", e.destination } };
          },
          [](trace_events::extract_complete const &e) -> fields_t {
            return { { "version", e.version },
                     { "files_extracted", e.files_extracted },
                     { "duration_ms", e.duration_ms } };
          },
          [](trace_events::file_touched const &e) -> fields_t {
            return { { "version", e.version }, { "file_path", e.file_path } };
          },
          [](trace_events::process_spawned const &e) -> fields_t {
            return { { "binary", e.binary }, { "pid", e.pid }, { "detached", e.detached } };
          },
      },
      event);
}

// ISO 8601 UTC with milliseconds: 2026-01-31T12:00:00.042Z
std::string utc_timestamp(std::chrono::system_clock::time_point tp) {
  auto const whole{ std::chrono::time_point_cast<std::chrono::seconds>(tp) };
  auto const ms{ std::chrono::duration_cast<std::chrono::milliseconds>(tp - whole) };
  std::time_t const t{ std::chrono::system_clock::to_time_t(whole) };

  std::tm utc{};
#if defined(_WIN32)
  gmtime_s(&utc, &t);
#else
  gmtime_r(&t, &utc);
#endif

  char stamp[32]{};
  if (std::strftime(stamp, sizeof stamp, "%Y-%m-%dT%H:%M:%S", &utc) == 0) { return {}; }

  char out[48]{};
  int const n{
    std::snprintf(out, sizeof out, "%s.%03dZ", stamp, static_cast<int>(ms.count()))
  };
  return n > 0 ? std::string{ out, static_cast<std::size_t>(n) } : std::string{};
}

void append_json_escaped(std::string &out, std::string_view value) {
  for (char const ch : value) {
    switch (ch) {
      case '\\': out += "\\\\"; break;
      case '"': out += "\\\""; break;
      case '\b': out += "\\b"; break;
      case '\f': out += "\\f"; break;
      case '\n': out += "\\n"; break;
      case '\r': out += "\\r"; break;
      case '\t': out += "\\t"; break;
      default:
        if (static_cast<unsigned char>(ch) >= 0x20) {
          out.push_back(ch);
        } else {
          char esc[8]{};
          std::snprintf(esc, sizeof esc, "\\u%04x", static_cast<unsigned>(ch));
          out += esc;
        }
    }
  }
}

void append_text_value(std::string &out, field const &f) {
  std::visit(match{
                 [&](std::string_view v) { out.append(v); },
                 [&](std::int64_t v) { out += std::to_string(v); },
                 [&](bool v) { out += v ? "true" : "false"; },
             },
             f.value);
}

void append_json_value(std::string &out, field const &f) {
  std::visit(match{
                 [&](std::string_view v) {
                   out.push_back('"');
                   append_json_escaped(out, v);
                   out.push_back('"');
                 },
                 [&](std::int64_t v) { out += std::to_string(v); },
                 [&](bool v) { out += v ? "true" : "false"; },
             },
             f.value);
}

}  // namespace

phase_trace_scope::phase_trace_scope(std::string canonical_version,
                                     install_phase phase_value,
                                     std::chrono::steady_clock::time_point start_time)
    : version{ std::move(canonical_version) }, phase{ phase_value }, start{ start_time } {
  GDENV_TRACE_PHASE_START(version, phase);
}

phase_trace_scope::~phase_trace_scope() {
  auto const elapsed{ std::chrono::steady_clock::now() - start };
  GDENV_TRACE_PHASE_COMPLETE(
      version,
      phase,
      static_cast<std::int64_t>(
          std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count()));
}

std::string_view trace_event_name(trace_event_t const &event) {
  static constexpr std::string_view kNames[]{
    "phase_start",      "phase_complete",      "cache_hit",     "cache_miss",
    "fetch_file_start", "fetch_file_complete", "extract_start", "extract_complete",
    "file_touched",     "process_spawned",
  };
  static_assert(std::size(kNames) == std::variant_size_v<trace_event_t>);
  return kNames[event.index()];
}

std::string trace_event_to_string(trace_event_t const &event) {
  std::string out{ trace_event_name(event) };
  for (auto const &f : event_fields(event)) {
    if (f.json_only) { continue; }
    out.push_back(' ');
    out.append(f.key).push_back('=');
    append_text_value(out, f);
  }
  return out;
}

std::string trace_event_to_json(trace_event_t const &event) {
  std::string out;
  out.reserve(256);
  out += "{\"ts\":\"";
  out += utc_timestamp(std::chrono::system_clock::now());
  out += "\",\"event\":\"";
  out += trace_event_name(event);
  out.push_back('"');

  for (auto const &f : event_fields(event)) {
    out += ",\"";
    out += f.key;
    out += "\":";
    append_json_value(out, f);
  }

  out.push_back('}');
  return out;
}

}  // namespace gdenv
