#include "log.hpp"

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <exception>
#include <vector>

namespace {

constexpr const char* kStampedPattern = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v";

struct ConsoleLoggers {
  std::shared_ptr<spdlog::logger> log;     // debug..warn, stdout
  std::shared_ptr<spdlog::logger> error;   // error, stderr
  std::shared_ptr<spdlog::logger> print;
  std::shared_ptr<spdlog::logger> print_err;
};

std::mutex g_loggers_mutex;
ConsoleLoggers g_loggers;
std::atomic<bool> g_passthrough{true};

std::shared_ptr<spdlog::logger> make_logger(const std::string& name,
                                            std::vector<spdlog::sink_ptr> sinks,
                                            spdlog::level::level_enum flush_level) {
  spdlog::drop(name);
  auto logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
  logger->flush_on(flush_level);
  spdlog::register_logger(logger);
  return logger;
}

template<typename Sink>
spdlog::sink_ptr console_sink(const char* pattern) {
  auto sink = std::make_shared<Sink>();
  sink->set_pattern(pattern);
  return sink;
}

// Caller holds g_loggers_mutex.
void build_loggers(const LogOptions& options) {
  std::vector<spdlog::sink_ptr> log_sinks{console_sink<spdlog::sinks::stdout_color_sink_mt>(kStampedPattern)};
  std::vector<spdlog::sink_ptr> error_sinks{console_sink<spdlog::sinks::stderr_color_sink_mt>(kStampedPattern)};

  std::string file_error;
  if(!options.file.empty()) {
    try {
      auto file = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
        options.file, options.file_max_bytes, options.file_count);
      file->set_pattern(kStampedPattern);
      log_sinks.push_back(file);
      error_sinks.push_back(file);
    } catch(const spdlog::spdlog_ex& e) {
      file_error = e.what();
    }
  }

  g_loggers.log = make_logger("clipsync.log", std::move(log_sinks), spdlog::level::warn);
  g_loggers.error = make_logger("clipsync.error", std::move(error_sinks), spdlog::level::err);
  g_loggers.print = make_logger("clipsync.print",
                                {console_sink<spdlog::sinks::stdout_color_sink_mt>("%v")},
                                spdlog::level::info);
  g_loggers.print_err = make_logger("clipsync.print_err",
                                    {console_sink<spdlog::sinks::stderr_color_sink_mt>("%v")},
                                    spdlog::level::err);

  const auto level = options.verbose ? spdlog::level::debug : spdlog::level::info;
  g_loggers.log->set_level(level);
  g_loggers.error->set_level(spdlog::level::err);
  g_loggers.print->set_level(spdlog::level::info);
  g_loggers.print_err->set_level(spdlog::level::info);
  spdlog::set_default_logger(g_loggers.log);
  if(!file_error.empty()) {
    g_loggers.error->error("cannot open log file {}: {}", options.file, file_error);
  }
}

spdlog::logger* console_for(LogChannel channel) {
  std::lock_guard lg(g_loggers_mutex);
  if(!g_loggers.log) build_loggers(LogOptions{});
  switch(channel) {
    case LogChannel::Print:    return g_loggers.print.get();
    case LogChannel::PrintErr: return g_loggers.print_err.get();
    case LogChannel::Error:    return g_loggers.error.get();
    default:                   return g_loggers.log.get();
  }
}

} // namespace

const char* log_channel_name(LogChannel channel) {
  switch(channel) {
    case LogChannel::Debug:    return "debug";
    case LogChannel::Info:     return "info";
    case LogChannel::Warn:     return "warn";
    case LogChannel::Error:    return "error";
    case LogChannel::Print:    return "print";
    case LogChannel::PrintErr: return "print_err";
  }
  return "info";
}

spdlog::level::level_enum log_channel_level(LogChannel channel) {
  switch(channel) {
    case LogChannel::Debug:    return spdlog::level::debug;
    case LogChannel::Warn:     return spdlog::level::warn;
    case LogChannel::Error:
    case LogChannel::PrintErr: return spdlog::level::err;
    default:                   return spdlog::level::info;
  }
}

void init(const LogOptions& options) {
  std::lock_guard lg(g_loggers_mutex);
  build_loggers(options);
}

void set_log_passthrough(bool enabled) {
  g_passthrough.store(enabled);
}

bool log_passthrough() {
  return g_passthrough.load();
}

std::string Logger::name() const {
  return name_;
}

std::shared_ptr<Logger> Logger::child(const std::string& suffix) {
  auto out = std::make_shared<Logger>(name_.empty() ? suffix : name_ + "/" + suffix);
  out->parent_ = shared_from_this();
  return out;
}

LogListenerHandle Logger::add_listener(Listener listener) {
  if(!listener) return 0;
  std::lock_guard lg(listener_mutex_);
  const auto id = next_listener_id_++;
  listeners_.emplace(id, std::move(listener));
  return id;
}

void Logger::remove_listener(LogListenerHandle handle) {
  std::lock_guard lg(listener_mutex_);
  listeners_.erase(handle);
}

void Logger::emit(LogChannel channel, const std::string& message) {
  LogRecord record{channel,
                   name_.empty() ? std::string(log_channel_name(channel))
                                 : name_ + ":" + log_channel_name(channel),
                   message};
  if(offer(record)) return;
  detail::emit_to_console(channel, record.source, message);
}

bool Logger::offer(const LogRecord& record) {
  std::vector<Listener> snapshot;
  {
    std::lock_guard lg(listener_mutex_);
    snapshot.reserve(listeners_.size());
    for(const auto& entry : listeners_) snapshot.push_back(entry.second);
  }
  bool claimed = false;
  for(auto& listener : snapshot) {
    try {
      if(listener(record)) claimed = true;
    } catch(const std::exception& e) {
      detail::emit_to_console(LogChannel::Error, record.source,
                              std::string("log listener threw: ") + e.what());
    } catch(...) {
      detail::emit_to_console(LogChannel::Error, record.source, "log listener threw unknown exception");
    }
  }
  if(!claimed && parent_) claimed = parent_->offer(record);
  return claimed;
}

namespace detail {

void emit_to_console(LogChannel channel, const std::string& source, const std::string& message) {
  if(!log_passthrough()) return;
  spdlog::logger* sink = console_for(channel);
  const auto level = log_channel_level(channel);
  if(channel == LogChannel::Print || channel == LogChannel::PrintErr ||
     source.empty() || source == log_channel_name(channel)) {
    sink->log(level, message);
  } else {
    sink->log(level, fmt::format("[{}] {}", source, message));
  }
}

} // namespace detail
