#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>

#include <cstddef>
#include <functional>
#include <string>
#include <utility>
#include <vector>

void init(bool verbose = false);
void set_log_passthrough(bool enabled);

// Print and PrintErr are the plain user-facing lines; the rest are
// timestamped diagnostics prefixed with the logger name.
enum class LogChannel { Info, Warn, Error, Debug, Print, PrintErr };

using LogListenerHandle = std::size_t;

class Logger {
public:
  // Return true to consume the message; otherwise it still reaches spdlog.
  using Listener = std::function<bool(const std::string& channel,
                                      spdlog::level::level_enum level,
                                      const std::string& message)>;

  Logger() = default;
  explicit Logger(std::string name) : name_(std::move(name)) {}

  LogListenerHandle add_listener(Listener listener);
  void remove_listener(LogListenerHandle handle);

  void write(LogChannel channel, const std::string& message);

  template<typename... Args>
  void info(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    write(LogChannel::Info, fmt::format(fmt, std::forward<Args>(args)...));
  }

  template<typename... Args>
  void warn(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    write(LogChannel::Warn, fmt::format(fmt, std::forward<Args>(args)...));
  }

  template<typename... Args>
  void error(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    write(LogChannel::Error, fmt::format(fmt, std::forward<Args>(args)...));
  }

  template<typename... Args>
  void debug(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    write(LogChannel::Debug, fmt::format(fmt, std::forward<Args>(args)...));
  }

  template<typename... Args>
  void print(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    write(LogChannel::Print, fmt::format(fmt, std::forward<Args>(args)...));
  }

private:
  struct ListenerBinding {
    LogListenerHandle handle = 0;
    Listener callback;
  };

  std::string name_;
  std::vector<ListenerBinding> listeners_;
  LogListenerHandle next_listener_id_ = 1;
};

// Straight to the process-wide sinks, for code running without a Logger.
void write_default(LogChannel channel, const std::string& prefix, const std::string& message);

inline void write_log(Logger* logger, LogChannel channel, const std::string& message) {
  if(logger) {
    logger->write(channel, message);
  } else {
    write_default(channel, std::string(), message);
  }
}

template<typename... Args>
void log_debug(Logger* logger, spdlog::format_string_t<Args...> fmt, Args&&... args) {
  write_log(logger, LogChannel::Debug, fmt::format(fmt, std::forward<Args>(args)...));
}

template<typename... Args>
void log_warn(Logger* logger, spdlog::format_string_t<Args...> fmt, Args&&... args) {
  write_log(logger, LogChannel::Warn, fmt::format(fmt, std::forward<Args>(args)...));
}

template<typename... Args>
void print_out(Logger* logger, spdlog::format_string_t<Args...> fmt, Args&&... args) {
  write_log(logger, LogChannel::Print, fmt::format(fmt, std::forward<Args>(args)...));
}

template<typename... Args>
void print_err(Logger* logger, spdlog::format_string_t<Args...> fmt, Args&&... args) {
  write_log(logger, LogChannel::PrintErr, fmt::format(fmt, std::forward<Args>(args)...));
}
