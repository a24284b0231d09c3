#include "log.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

#include <cstring>
#include <memory>
#include <vector>

namespace {

constexpr const char* kStampedPattern = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v";

struct Sinks {
  std::shared_ptr<spdlog::logger> info;
  std::shared_ptr<spdlog::logger> error;
  std::shared_ptr<spdlog::logger> print;
  std::shared_ptr<spdlog::logger> print_err;
};

std::once_flag g_sinks_once;
Sinks g_sinks;
std::atomic<bool> g_log_passthrough{true};

std::shared_ptr<spdlog::logger> make_stdout_logger(const std::string& name, const char* pattern) {
  auto sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
  sink->set_pattern(pattern);
  auto logger = std::make_shared<spdlog::logger>(name, std::move(sink));
  spdlog::register_logger(logger);
  return logger;
}

std::shared_ptr<spdlog::logger> make_stderr_logger(const std::string& name, const char* pattern) {
  auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  sink->set_pattern(pattern);
  auto logger = std::make_shared<spdlog::logger>(name, std::move(sink));
  spdlog::register_logger(logger);
  return logger;
}

const Sinks& sinks() {
  std::call_once(g_sinks_once, [](){
    g_sinks.info = make_stdout_logger("pairsync.info", kStampedPattern);
    g_sinks.error = make_stderr_logger("pairsync.error", kStampedPattern);
    g_sinks.print = make_stdout_logger("pairsync.print", "%v");
    g_sinks.print_err = make_stderr_logger("pairsync.print_err", "%v");

    g_sinks.info->flush_on(spdlog::level::warn);
    g_sinks.error->flush_on(spdlog::level::err);
    g_sinks.print->flush_on(spdlog::level::info);
    g_sinks.print_err->flush_on(spdlog::level::err);
  });
  return g_sinks;
}

} // namespace

void set_log_passthrough(bool enabled) {
  g_log_passthrough.store(enabled, std::memory_order_release);
}

bool log_passthrough() {
  return g_log_passthrough.load(std::memory_order_acquire);
}

Logger::Logger(std::string name) : name_(std::move(name)) {}

void Logger::set_name(std::string name) {
  name_ = std::move(name);
}

LogListenerHandle Logger::add_listener(Listener listener, void* user_data) {
  if(!listener) return 0;
  std::lock_guard<std::mutex> lock(listener_mutex_);
  const auto id = next_listener_id_++;
  listeners_.emplace(id, ListenerBinding{user_data, std::move(listener)});
  return id;
}

void Logger::remove_listener(LogListenerHandle handle) {
  std::lock_guard<std::mutex> lock(listener_mutex_);
  listeners_.erase(handle);
}

void Logger::clear_listeners() {
  std::lock_guard<std::mutex> lock(listener_mutex_);
  listeners_.clear();
}

void Logger::write(const char* base_channel,
                   spdlog::level::level_enum level,
                   const std::string& message) {
  std::string channel_name = name_.empty()
    ? std::string(base_channel)
    : name_ + ":" + base_channel;
  if(dispatch(channel_name, level, message)) return;
  detail::emit_to_default(base_channel, channel_name, level, message);
}

bool Logger::dispatch(const std::string& channel,
                      spdlog::level::level_enum level,
                      const std::string& message) {
  std::vector<ListenerBinding> snapshot;
  {
    std::lock_guard<std::mutex> lock(listener_mutex_);
    snapshot.reserve(listeners_.size());
    for(const auto& entry : listeners_) {
      snapshot.push_back(entry.second);
    }
  }
  bool handled = false;
  for(auto& binding : snapshot) {
    try {
      if(binding.callback && binding.callback(binding.user_data, channel, level, message)) {
        handled = true;
      }
    } catch(const std::exception& e) {
      detail::emit_to_default("error", "log", spdlog::level::err,
                              fmt::format("log listener threw: {}", e.what()));
    }
  }
  return handled;
}

void init(bool verbose) {
  const auto& s = sinks();
  auto level = verbose ? spdlog::level::debug : spdlog::level::info;
  s.info->set_level(level);
  s.error->set_level(spdlog::level::info);
  s.print->set_level(spdlog::level::info);
  s.print_err->set_level(spdlog::level::info);

  spdlog::set_default_logger(s.info);
  spdlog::set_level(level);
}

namespace detail {

void emit_to_default(const char* base_channel,
                     const std::string& channel_name,
                     spdlog::level::level_enum level,
                     const std::string& message) {
  const auto& s = sinks();
  if(!log_passthrough()) return;

  spdlog::logger* sink = s.info.get();
  if(std::strcmp(base_channel, "print") == 0) {
    sink = s.print.get();
  } else if(std::strcmp(base_channel, "print_err") == 0) {
    sink = s.print_err.get();
  } else if(std::strcmp(base_channel, "error") == 0) {
    sink = s.error.get();
  }

  if(!channel_name.empty() && channel_name != base_channel) {
    sink->log(level, fmt::format("[{}] {}", channel_name, message));
  } else {
    sink->log(level, message);
  }
}

} // namespace detail
