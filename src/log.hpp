#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>

#include <atomic>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <utility>

// Output channels. Debug..Error are timestamped log lines; Print and PrintErr
// are plain console output for the interactive front end.
enum class LogChannel { Debug, Info, Warn, Error, Print, PrintErr };

const char* log_channel_name(LogChannel channel);
spdlog::level::level_enum log_channel_level(LogChannel channel);

struct LogOptions {
  bool verbose = false;
  // Rotating file that receives the timestamped channels as well; empty for none.
  std::string file;
  std::size_t file_max_bytes = 1024 * 1024;
  std::size_t file_count = 3;
};

void init(const LogOptions& options);
inline void init(bool verbose = false) {
  LogOptions options;
  options.verbose = verbose;
  init(options);
}

// When off, messages no listener claimed are dropped instead of printed.
void set_log_passthrough(bool enabled);
bool log_passthrough();

struct LogRecord {
  LogChannel channel;
  std::string source;   // "<logger name>:<channel>"
  std::string message;
};

using LogListenerHandle = std::size_t;

class Logger : public std::enable_shared_from_this<Logger> {
public:
  // Returns true to claim the record; unclaimed records go to the parent, then
  // to the console.
  using Listener = std::function<bool(const LogRecord&)>;

  Logger() = default;
  explicit Logger(std::string name) : name_(std::move(name)) {}

  std::string name() const;

  // Logger named "<name>/<suffix>" forwarding unclaimed records here. Only
  // valid on a logger owned by a shared_ptr.
  std::shared_ptr<Logger> child(const std::string& suffix);

  LogListenerHandle add_listener(Listener listener);
  void remove_listener(LogListenerHandle handle);

  template<typename... Args>
  void write(LogChannel channel, spdlog::format_string_t<Args...> fmt, Args&&... args) {
    emit(channel, fmt::format(fmt, std::forward<Args>(args)...));
  }

  template<typename... Args>
  void debug(spdlog::format_string_t<Args...> fmt, Args&&... args) { write(LogChannel::Debug, fmt, std::forward<Args>(args)...); }
  template<typename... Args>
  void info(spdlog::format_string_t<Args...> fmt, Args&&... args) { write(LogChannel::Info, fmt, std::forward<Args>(args)...); }
  template<typename... Args>
  void warn(spdlog::format_string_t<Args...> fmt, Args&&... args) { write(LogChannel::Warn, fmt, std::forward<Args>(args)...); }
  template<typename... Args>
  void error(spdlog::format_string_t<Args...> fmt, Args&&... args) { write(LogChannel::Error, fmt, std::forward<Args>(args)...); }
  template<typename... Args>
  void print(spdlog::format_string_t<Args...> fmt, Args&&... args) { write(LogChannel::Print, fmt, std::forward<Args>(args)...); }
  template<typename... Args>
  void print_err(spdlog::format_string_t<Args...> fmt, Args&&... args) { write(LogChannel::PrintErr, fmt, std::forward<Args>(args)...); }

  void emit(LogChannel channel, const std::string& message);

private:
  bool offer(const LogRecord& record);

  std::string name_;
  std::shared_ptr<Logger> parent_;
  std::mutex listener_mutex_;
  std::unordered_map<LogListenerHandle, Listener> listeners_;
  std::atomic<LogListenerHandle> next_listener_id_{1};
};

namespace detail {
void emit_to_console(LogChannel channel, const std::string& source, const std::string& message);
} // namespace detail

// Logs through `logger`, or straight to the console when it is null.
template<typename... Args>
inline void log_to(Logger* logger, LogChannel channel,
                   spdlog::format_string_t<Args...> fmt, Args&&... args) {
  auto message = fmt::format(fmt, std::forward<Args>(args)...);
  if(logger) {
    logger->emit(channel, message);
  } else {
    detail::emit_to_console(channel, log_channel_name(channel), message);
  }
}

template<typename... Args>
inline void log_debug(Logger* logger, spdlog::format_string_t<Args...> fmt, Args&&... args) {
  log_to(logger, LogChannel::Debug, fmt, std::forward<Args>(args)...);
}

template<typename... Args>
inline void log_info(Logger* logger, spdlog::format_string_t<Args...> fmt, Args&&... args) {
  log_to(logger, LogChannel::Info, fmt, std::forward<Args>(args)...);
}

template<typename... Args>
inline void log_warn(Logger* logger, spdlog::format_string_t<Args...> fmt, Args&&... args) {
  log_to(logger, LogChannel::Warn, fmt, std::forward<Args>(args)...);
}

template<typename... Args>
inline void log_error(Logger* logger, spdlog::format_string_t<Args...> fmt, Args&&... args) {
  log_to(logger, LogChannel::Error, fmt, std::forward<Args>(args)...);
}

template<typename... Args>
inline void print_out(Logger* logger, spdlog::format_string_t<Args...> fmt, Args&&... args) {
  log_to(logger, LogChannel::Print, fmt, std::forward<Args>(args)...);
}

template<typename... Args>
inline void print_err(Logger* logger, spdlog::format_string_t<Args...> fmt, Args&&... args) {
  log_to(logger, LogChannel::PrintErr, fmt, std::forward<Args>(args)...);
}
