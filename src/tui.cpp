#include "tui.h"

#include "util.h"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdarg>
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <exception>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>
#include <variant>
#include <vector>

namespace gdenv::tui {

bool g_trace_enabled{ false };

}  // namespace gdenv::tui

namespace {

using gdenv::tui::level;
using sink_t = std::function<void(std::string_view)>;

constexpr std::chrono::milliseconds kDrainInterval{ 33 };

struct log_line {
  level severity;
  std::chrono::system_clock::time_point when;
  std::string text;
};

using queued_t = std::variant<log_line, gdenv::trace_event_t>;

struct logger_state {
  std::mutex mutex;  // pending, counters
  std::mutex stdout_mutex;
  std::condition_variable wake;
  std::condition_variable drained;
  std::vector<queued_t> pending;
  std::uint64_t queued{ 0 };
  std::uint64_t written{ 0 };
  std::thread worker;
  std::atomic_bool stopping{ false };
  sink_t sink;  // only replaced while the worker is stopped
  std::optional<level> threshold;
  bool decorated{ false };
  bool initialized{ false };
  bool trace_to_stderr{ false };
  gdenv::file_ptr_t trace_file;
};

logger_state &state() {
  static logger_state s;
  return s;
}

char const *severity_label(level severity) {
  switch (severity) {
    case level::TUI_TRACE: return "TRC";
    case level::TUI_DEBUG: return "DBG";
    case level::TUI_INFO: return "INF";
    case level::TUI_WARN: return "WRN";
    case level::TUI_ERROR: return "ERR";
  }
  return "???";
}

// "[2026-01-31 12:00:00.042] [INF] "
std::string decoration(level severity, std::chrono::system_clock::time_point when) {
  auto const whole{ std::chrono::time_point_cast<std::chrono::seconds>(when) };
  auto const ms{ std::chrono::duration_cast<std::chrono::milliseconds>(when - whole) };
  std::time_t const t{ std::chrono::system_clock::to_time_t(when) };

  std::tm local{};
#if defined(_WIN32)
  localtime_s(&local, &t);
#else
  localtime_r(&t, &local);
#endif

  char stamp[32]{};
  if (std::strftime(stamp, sizeof stamp, "%Y-%m-%d %H:%M:%S", &local) == 0) { return {}; }

  char out[64]{};
  std::snprintf(out,
                sizeof out,
                "[%s.%03d] [%s] ",
                stamp,
                static_cast<int>(ms.count()),
                severity_label(severity));
  return out;
}

// True when the line went to stderr.
bool emit(sink_t const &sink, std::string const &line) {
  if (sink) {
    sink(line);
    return false;
  }
  std::fwrite(line.data(), 1, line.size(), stderr);
  return true;
}

void write_trace_json(gdenv::trace_event_t const &event) {
  auto &s{ state() };
  if (!s.trace_file) { return; }

  auto const json{ gdenv::trace_event_to_json(event) + "\n" };
  if (std::fwrite(json.data(), 1, json.size(), s.trace_file.get()) == json.size() &&
      std::fflush(s.trace_file.get()) == 0) {
    return;
  }

  s.trace_file.reset();
  gdenv::tui::g_trace_enabled = s.trace_to_stderr;
  std::fprintf(stderr, "gdenv: failed to write trace file, file tracing disabled\n");
}

void write_batch(std::vector<queued_t> const &batch, sink_t const &sink) {
  auto &s{ state() };
  bool used_stderr{ false };

  for (auto const &entry : batch) {
    std::visit(gdenv::match{
                   [&](log_line const &line) {
                     std::string out{ s.decorated ? decoration(line.severity, line.when)
                                                  : std::string{} };
                     out.append(line.text).push_back('\n');
                     if (emit(sink, out)) { used_stderr = true; }
                   },
                   [&](gdenv::trace_event_t const &event) {
                     if (s.trace_to_stderr) {
                       std::string out{ s.decorated
                                            ? decoration(level::TUI_TRACE,
                                                         std::chrono::system_clock::now())
                                            : std::string{} };
                       out.append(gdenv::trace_event_to_string(event)).push_back('\n');
                       if (emit(sink, out)) { used_stderr = true; }
                     }
                     write_trace_json(event);
                   },
               },
               entry);
  }

  if (used_stderr) { std::fflush(stderr); }
}

void write_batch_guarded(std::vector<queued_t> const &batch, sink_t const &sink) {
  try {
    write_batch(batch, sink);
  } catch (std::exception const &e) {
    std::fprintf(stderr, "[gdenv log writer failed: %s]\n", e.what());
    std::fflush(stderr);
  }
}

void drain(std::unique_lock<std::mutex> &lock) {
  auto &s{ state() };
  std::vector<queued_t> batch;
  batch.swap(s.pending);

  lock.unlock();
  write_batch_guarded(batch, s.sink);
  lock.lock();

  s.written += batch.size();
  s.drained.notify_all();
}

void worker_main() {
  auto &s{ state() };
  std::unique_lock<std::mutex> lock{ s.mutex };

  for (;;) {
    bool const last_pass{ s.stopping.load() };
    drain(lock);
    if (last_pass) { break; }

    s.wake.wait_for(lock, kDrainInterval, [&s] {
      return s.stopping.load() || !s.pending.empty();
    });
  }
}

void enqueue(queued_t entry) {
  auto &s{ state() };
  std::unique_lock<std::mutex> lock{ s.mutex };

  if (!s.worker.joinable()) {  // idle: write inline
    std::vector<queued_t> batch;
    batch.push_back(std::move(entry));
    lock.unlock();
    write_batch_guarded(batch, s.sink);
    return;
  }

  s.pending.push_back(std::move(entry));
  ++s.queued;
  lock.unlock();
  s.wake.notify_one();
}

std::string vformat(char const *fmt, va_list args) {
  va_list sizing;
  va_copy(sizing, args);
  int const needed{ std::vsnprintf(nullptr, 0, fmt, sizing) };
  va_end(sizing);
  if (needed <= 0) { return {}; }

  std::string text(static_cast<std::size_t>(needed), '\0');
  std::vsnprintf(text.data(), text.size() + 1, fmt, args);
  return text;
}

void log_v(level severity, char const *fmt, va_list args) {
  auto &s{ state() };
  if (!s.initialized || fmt == nullptr) { return; }
  if (s.threshold && severity < *s.threshold) { return; }

  auto text{ vformat(fmt, args) };
  if (text.empty()) { return; }

  enqueue(log_line{ .severity = severity,
                    .when = std::chrono::system_clock::now(),
                    .text = std::move(text) });
}

void require_idle(char const *what) {
  auto &s{ state() };
  if (!s.initialized) {
    throw std::logic_error{ std::string{ what } + " called before init" };
  }
  if (s.worker.joinable()) {
    throw std::logic_error{ std::string{ what } + " called while running" };
  }
}

}  // namespace

namespace gdenv::tui {

void init() {
  auto &s{ state() };
  if (s.initialized) { throw std::logic_error{ "tui::init called more than once" }; }

  s.threshold = std::nullopt;
  s.decorated = false;
  s.initialized = true;
  g_trace_enabled = false;
}

void configure_trace_outputs(std::vector<trace_output_spec> outputs) {
  require_idle("tui::configure_trace_outputs");

  auto &s{ state() };
  s.trace_file.reset();
  s.trace_to_stderr = false;
  g_trace_enabled = false;

  for (auto const &output : outputs) {
    switch (output.type) {
      case trace_output_type::std_err: s.trace_to_stderr = true; break;
      case trace_output_type::file:
        if (!output.file_path) { break; }
        if (s.trace_file) {
          throw std::logic_error{ "Only one trace file output supported" };
        }
        s.trace_file = util_open_file(*output.file_path, "w");
        if (!s.trace_file) {
          throw std::runtime_error("Failed to open trace file: " +
                                   output.file_path->string());
        }
        break;
    }
  }

  g_trace_enabled = s.trace_to_stderr || s.trace_file != nullptr;
}

void set_output_handler(std::function<void(std::string_view)> handler) {
  require_idle("tui::set_output_handler");

  auto &s{ state() };
  std::lock_guard<std::mutex> lock{ s.mutex };
  s.sink = std::move(handler);
}

void run(std::optional<level> threshold, bool decorated_logging) {
  require_idle("tui::run");

  auto &s{ state() };
  s.threshold = threshold;
  s.decorated = decorated_logging;
  s.stopping = false;
  s.worker = std::thread{ worker_main };
}

void shutdown() {
  auto &s{ state() };
  if (!s.worker.joinable()) {
    throw std::logic_error{ "tui::shutdown called while not running" };
  }

  s.stopping = true;
  s.wake.notify_all();
  s.worker.join();
  s.worker = std::thread{};
  s.stopping = false;

  s.trace_file.reset();
  s.trace_to_stderr = false;
  g_trace_enabled = false;
}

void flush() {
  auto &s{ state() };
  std::unique_lock<std::mutex> lock{ s.mutex };
  if (!s.worker.joinable()) { return; }

  auto const target{ s.queued };
  s.wake.notify_one();
  s.drained.wait(lock, [&s, target] { return s.written >= target; });
}

void trace(trace_event_t event) {
  if (g_trace_enabled) { enqueue(queued_t{ std::move(event) }); }
}

void debug(char const *fmt, ...) {
  va_list args;
  va_start(args, fmt);
  log_v(level::TUI_DEBUG, fmt, args);
  va_end(args);
}

void info(char const *fmt, ...) {
  va_list args;
  va_start(args, fmt);
  log_v(level::TUI_INFO, fmt, args);
  va_end(args);
}

void warn(char const *fmt, ...) {
  va_list args;
  va_start(args, fmt);
  log_v(level::TUI_WARN, fmt, args);
  va_end(args);
}

void error(char const *fmt, ...) {
  va_list args;
  va_start(args, fmt);
  log_v(level::TUI_ERROR, fmt, args);
  va_end(args);
}

void print_stdout(char const *fmt, ...) {
  if (fmt == nullptr) { return; }

  std::lock_guard<std::mutex> lock{ state().stdout_mutex };
  va_list args;
  va_start(args, fmt);
  int const n{ std::vprintf(fmt, args) };
  va_end(args);
  if (n > 0) { std::fflush(stdout); }
}

scope::scope(std::optional<level> threshold, bool decorated_logging) {
  if (!state().initialized) { return; }
  run(threshold, decorated_logging);
  active = true;
}

scope::~scope() {
  if (active) { shutdown(); }
}

}  // namespace gdenv::tui
