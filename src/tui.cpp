#include "tui.h"

#include "platform.h"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdarg>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <iomanip>
#include <mutex>
#include <queue>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>
#include <variant>

using quire::tui::level;

constexpr std::size_t kSeverityLabelWidth{ 3 };
constexpr std::chrono::milliseconds kFlushInterval{ 50 };

struct log_event {
  std::chrono::system_clock::time_point timestamp;
  quire::tui::level severity;
  std::string message;
};

using log_entry = std::variant<log_event, quire::trace_event_t>;

struct tui {
  std::queue<log_entry> messages;
  std::function<void(std::string_view)> output_handler;
  std::thread worker;
  std::mutex mutex;         // protects messages queue and cv
  std::mutex stdout_mutex;  // protects raw stdout writes in print_stdout()
  std::condition_variable cv;
  std::atomic_bool stop_requested{ false };
  std::optional<quire::tui::level> level_threshold;
  bool decorated{ false };
  bool initialized{ false };
  bool trace_stderr{ false };
  std::FILE *trace_file{ nullptr };
} s_tui{};

bool quire::tui::g_trace_enabled{ false };

namespace {

std::string_view level_to_string(level value) {
  switch (value) {
    case level::TUI_TRACE: return "TRC";
    case level::TUI_DEBUG: return "DBG";
    case level::TUI_INFO: return "INF";
    case level::TUI_WARN: return "WRN";
    case level::TUI_ERROR: return "ERR";
  }
  return "UNKNOWN";
}

std::string format_prefix(level severity, std::chrono::system_clock::time_point now) {
  if (!s_tui.decorated) { return {}; }

  auto const seconds{ std::chrono::time_point_cast<std::chrono::seconds>(now) };
  auto const millis{
    std::chrono::duration_cast<std::chrono::milliseconds>(now - seconds).count()
  };

  std::time_t const timestamp{ std::chrono::system_clock::to_time_t(now) };
  std::tm local_tm{};
  localtime_r(&timestamp, &local_tm);

  char timestamp_buf[32]{};
  if (std::strftime(timestamp_buf, sizeof timestamp_buf, "%Y-%m-%d %H:%M:%S", &local_tm) ==
      0) {
    return {};
  }

  std::ostringstream oss;
  oss << '[' << timestamp_buf << '.' << std::setfill('0') << std::setw(3) << millis
      << "] [" << std::left << std::setfill(' ') << std::setw(kSeverityLabelWidth)
      << level_to_string(severity) << "] ";
  return oss.str();
}

void emit(std::string const &output,
          std::function<void(std::string_view)> const &handler,
          bool &wrote_to_stderr) {
  if (handler) {
    handler(output);
  } else {
    std::fwrite(output.data(), 1, output.size(), stderr);
    wrote_to_stderr = true;
  }
}

void flush_messages(std::queue<log_entry> &pending,
                    std::function<void(std::string_view)> const &handler) {
  bool wrote_to_stderr{ false };

  while (!pending.empty()) {
    auto entry{ std::move(pending.front()) };
    pending.pop();

    if (auto *log_ptr{ std::get_if<log_event>(&entry) }) {
      std::string output{ format_prefix(log_ptr->severity, log_ptr->timestamp) };
      output.append(log_ptr->message);
      output.push_back('\n');
      emit(output, handler, wrote_to_stderr);
    } else if (auto *trace_ptr{ std::get_if<quire::trace_event_t>(&entry) }) {
      if (s_tui.trace_stderr) {
        std::string output{ format_prefix(level::TUI_TRACE,
                                          std::chrono::system_clock::now()) };
        output.append(quire::trace_event_to_string(*trace_ptr));
        output.push_back('\n');
        emit(output, handler, wrote_to_stderr);
      }

      if (s_tui.trace_file) {
        auto const json{ quire::trace_event_to_json(*trace_ptr) + "\n" };
        if (std::fwrite(json.data(), 1, json.size(), s_tui.trace_file) != json.size() ||
            std::fflush(s_tui.trace_file) != 0) {
          std::fflush(stderr);
          std::fprintf(stderr, "Fatal: failed to write trace file\n");
          std::fflush(stderr);
          std::abort();
        }
      }
    }
  }

  if (wrote_to_stderr) { std::fflush(stderr); }
}

void worker_thread() {
  std::unique_lock<std::mutex> lock{ s_tui.mutex };

  while (!s_tui.stop_requested) {
    std::queue<log_entry> pending;
    pending.swap(s_tui.messages);
    lock.unlock();

    try {
      flush_messages(pending, s_tui.output_handler);
    } catch (std::exception const &e) {
      std::fprintf(stderr, "[TUI worker thread exception: %s]\n", e.what());
      std::fflush(stderr);
    }

    lock.lock();
    s_tui.cv.wait_for(lock, kFlushInterval, [] {
      return s_tui.stop_requested.load() || !s_tui.messages.empty();
    });
  }

  std::queue<log_entry> pending;
  pending.swap(s_tui.messages);
  lock.unlock();

  try {
    flush_messages(pending, s_tui.output_handler);
  } catch (std::exception const &e) {
    std::fprintf(stderr, "[TUI final flush exception: %s]\n", e.what());
    std::fflush(stderr);
  }
}

void log_formatted(level severity, char const *fmt, va_list args) {
  if (!s_tui.initialized || fmt == nullptr) { return; }
  if (s_tui.level_threshold && severity < *s_tui.level_threshold) { return; }

  std::string buffer(512, '\0');

  va_list args_copy;
  va_copy(args_copy, args);
  int written{ std::vsnprintf(buffer.data(), buffer.size(), fmt, args) };
  if (written <= 0) {
    va_end(args_copy);
    return;
  }

  if (static_cast<std::size_t>(written) >= buffer.size()) {
    buffer.resize(static_cast<std::size_t>(written) + 1);
    written = std::vsnprintf(buffer.data(), buffer.size(), fmt, args_copy);
  }
  va_end(args_copy);

  if (written <= 0) { return; }
  buffer.resize(static_cast<std::size_t>(written));

  log_event ev{ .timestamp = std::chrono::system_clock::now(),
                .severity = severity,
                .message = std::move(buffer) };

  if (!s_tui.worker.joinable()) {  // not running: write synchronously
    std::queue<log_entry> single;
    single.push(log_entry{ std::move(ev) });
    std::lock_guard<std::mutex> lock{ s_tui.mutex };
    flush_messages(single, s_tui.output_handler);
    return;
  }

  {
    std::lock_guard<std::mutex> lock{ s_tui.mutex };
    s_tui.messages.push(log_entry{ std::move(ev) });
  }

  s_tui.cv.notify_one();
}

}  // namespace

namespace quire::tui {

void init() {
  if (s_tui.initialized) {
    throw std::logic_error{ "quire::tui::init called more than once" };
  }

  s_tui.level_threshold = level::TUI_INFO;
  s_tui.decorated = false;
  s_tui.initialized = true;
  g_trace_enabled = false;
}

void configure_trace_outputs(std::vector<trace_output_spec> outputs) {
  if (!s_tui.initialized) {
    throw std::logic_error{ "quire::tui::configure_trace_outputs called before init" };
  }

  if (s_tui.worker.joinable()) {
    throw std::logic_error{ "quire::tui::configure_trace_outputs called while running" };
  }

  if (s_tui.trace_file) {
    std::fclose(s_tui.trace_file);
    s_tui.trace_file = nullptr;
  }

  s_tui.trace_stderr = false;

  for (auto const &spec : outputs) {
    if (spec.type == trace_output_type::std_err) {
      s_tui.trace_stderr = true;
    } else if (spec.type == trace_output_type::file && spec.file_path) {
      if (s_tui.trace_file) {
        throw std::logic_error{ "Only one trace file output supported" };
      }
      s_tui.trace_file = std::fopen(spec.file_path->string().c_str(), "w");
      if (!s_tui.trace_file) {
        throw std::runtime_error("Failed to open trace file: " + spec.file_path->string());
      }
    }
  }

  g_trace_enabled = s_tui.trace_stderr || s_tui.trace_file;
}

void set_output_handler(std::function<void(std::string_view)> handler) {
  if (!s_tui.initialized) {
    throw std::logic_error{ "quire::tui::set_output_handler called before init" };
  }

  if (s_tui.worker.joinable()) {
    throw std::logic_error{ "quire::tui::set_output_handler called while running" };
  }

  std::lock_guard<std::mutex> lock{ s_tui.mutex };
  s_tui.output_handler = std::move(handler);
}

void run(std::optional<level> threshold, bool decorated_logging) {
  if (!s_tui.initialized) {
    throw std::logic_error{ "quire::tui::run called before init" };
  }

  if (s_tui.worker.joinable()) {
    throw std::logic_error{ "quire::tui::run called while already running" };
  }

  s_tui.level_threshold = threshold.value_or(level::TUI_INFO);
  s_tui.decorated = decorated_logging;
  s_tui.stop_requested = false;
  s_tui.worker = std::thread{ worker_thread };
}

void shutdown() {
  if (!s_tui.worker.joinable()) {
    throw std::logic_error{ "quire::tui::shutdown called while not running" };
  }

  s_tui.stop_requested = true;
  s_tui.cv.notify_all();
  s_tui.worker.join();
  s_tui.worker = std::thread{};
  s_tui.stop_requested = false;
  g_trace_enabled = false;
  if (s_tui.trace_file) {
    std::fclose(s_tui.trace_file);
    s_tui.trace_file = nullptr;
  }
}

bool is_tty() { return platform::is_tty(); }

void trace(trace_event_t event) {
  if (!g_trace_enabled) { return; }

  if (!s_tui.worker.joinable()) {
    std::queue<log_entry> single;
    single.push(log_entry{ std::move(event) });
    std::lock_guard<std::mutex> lock{ s_tui.mutex };
    flush_messages(single, s_tui.output_handler);
    return;
  }

  {
    std::lock_guard<std::mutex> lock{ s_tui.mutex };
    s_tui.messages.push(log_entry{ std::move(event) });
  }
  s_tui.cv.notify_one();
}

void debug(char const *fmt, ...) {
  va_list args;
  va_start(args, fmt);
  log_formatted(level::TUI_DEBUG, fmt, args);
  va_end(args);
}

void info(char const *fmt, ...) {
  va_list args;
  va_start(args, fmt);
  log_formatted(level::TUI_INFO, fmt, args);
  va_end(args);
}

void warn(char const *fmt, ...) {
  va_list args;
  va_start(args, fmt);
  log_formatted(level::TUI_WARN, fmt, args);
  va_end(args);
}

void error(char const *fmt, ...) {
  va_list args;
  va_start(args, fmt);
  log_formatted(level::TUI_ERROR, fmt, args);
  va_end(args);
}

void print_stdout(char const *fmt, ...) {
  if (!fmt) { return; }

  std::lock_guard<std::mutex> lock{ s_tui.stdout_mutex };

  va_list args;
  va_start(args, fmt);
  int const written{ std::vprintf(fmt, args) };
  va_end(args);

  if (written > 0) { std::fflush(stdout); }
}

scope::scope(std::optional<level> threshold, bool decorated_logging) {
  if (!s_tui.initialized) { return; }
  run(std::move(threshold), decorated_logging);
  active = true;
}

scope::~scope() {
  if (active) { shutdown(); }
}

}  // namespace quire::tui
