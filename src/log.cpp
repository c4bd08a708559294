#include "log.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

#include <algorithm>
#include <memory>

namespace {

struct ChannelInfo {
  const char* name;
  spdlog::level::level_enum level;
  bool plain;     // no timestamp, no logger prefix
  bool to_stderr;
};

constexpr ChannelInfo kChannels[] = {
  {"info",      spdlog::level::info,  false, false},
  {"warn",      spdlog::level::warn,  false, true},
  {"error",     spdlog::level::err,   false, true},
  {"debug",     spdlog::level::debug, false, false},
  {"print",     spdlog::level::info,  true,  false},
  {"print_err", spdlog::level::err,   true,  true},
};

const ChannelInfo& info_for(LogChannel channel) {
  return kChannels[static_cast<std::size_t>(channel)];
}

struct Sinks {
  std::shared_ptr<spdlog::logger> diag_out;
  std::shared_ptr<spdlog::logger> diag_err;
  std::shared_ptr<spdlog::logger> plain_out;
  std::shared_ptr<spdlog::logger> plain_err;
};

bool g_log_passthrough = true;

std::shared_ptr<spdlog::logger> make_logger(const char* name,
                                            spdlog::sink_ptr sink,
                                            const char* pattern) {
  sink->set_pattern(pattern);
  auto logger = std::make_shared<spdlog::logger>(name, std::move(sink));
  logger->set_level(spdlog::level::info);
  logger->flush_on(spdlog::level::info);
  return logger;
}

Sinks& sinks() {
  static Sinks s = []{
    constexpr const char* kDiagPattern = "[%H:%M:%S.%e] [%^%l%$] %v";
    Sinks out;
    out.diag_out = make_logger("media_sync.info",
                               std::make_shared<spdlog::sinks::stdout_color_sink_st>(), kDiagPattern);
    out.diag_err = make_logger("media_sync.error",
                               std::make_shared<spdlog::sinks::stderr_color_sink_st>(), kDiagPattern);
    out.plain_out = make_logger("media_sync.print",
                                std::make_shared<spdlog::sinks::stdout_color_sink_st>(), "%v");
    out.plain_err = make_logger("media_sync.print_err",
                                std::make_shared<spdlog::sinks::stderr_color_sink_st>(), "%v");
    return out;
  }();
  return s;
}

spdlog::logger& sink_for(const ChannelInfo& info) {
  auto& s = sinks();
  if(info.plain) return info.to_stderr ? *s.plain_err : *s.plain_out;
  return info.to_stderr ? *s.diag_err : *s.diag_out;
}

} // namespace

void set_log_passthrough(bool enabled) {
  g_log_passthrough = enabled;
}

void init(bool verbose) {
  auto& s = sinks();
  s.diag_out->set_level(verbose ? spdlog::level::debug : spdlog::level::info);
  s.diag_err->set_level(verbose ? spdlog::level::debug : spdlog::level::info);
  spdlog::set_default_logger(s.diag_out);
}

LogListenerHandle Logger::add_listener(Listener listener) {
  if(!listener) return 0;
  const auto id = next_listener_id_++;
  listeners_.push_back(ListenerBinding{id, std::move(listener)});
  return id;
}

void Logger::remove_listener(LogListenerHandle handle) {
  listeners_.erase(std::remove_if(listeners_.begin(), listeners_.end(),
                                  [handle](const ListenerBinding& b){ return b.handle == handle; }),
                   listeners_.end());
}

void Logger::write(LogChannel channel, const std::string& message) {
  const auto& info = info_for(channel);
  // Listeners may detach themselves while being called.
  auto snapshot = listeners_;
  bool consumed = false;
  for(auto& binding : snapshot) {
    if(binding.callback(info.name, info.level, message)) consumed = true;
  }
  if(!consumed) write_default(channel, name_, message);
}

void write_default(LogChannel channel, const std::string& prefix, const std::string& message) {
  if(!g_log_passthrough) return;
  const auto& info = info_for(channel);
  auto& sink = sink_for(info);
  if(!info.plain && !prefix.empty()) {
    sink.log(info.level, "[{}] {}", prefix, message);
  } else {
    sink.log(info.level, "{}", message);
  }
}
