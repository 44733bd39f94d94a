#include "log.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <algorithm>
#include <array>
#include <vector>

namespace {

constexpr const char* kTimestampPattern = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v";

// Default loggers by base channel. "info" also carries warn and debug.
struct DefaultSinks {
  std::shared_ptr<spdlog::logger> info;
  std::shared_ptr<spdlog::logger> error;
  std::shared_ptr<spdlog::logger> print;
  std::shared_ptr<spdlog::logger> print_err;
  std::shared_ptr<spdlog::sinks::basic_file_sink_mt> file;

  std::array<spdlog::logger*, 4> all() const {
    return {info.get(), error.get(), print.get(), print_err.get()};
  }
};

DefaultSinks g_sinks;
std::mutex g_sinks_mutex;
std::atomic<bool> g_log_passthrough{true};

std::shared_ptr<spdlog::logger> make_logger(const std::string& name,
                                            spdlog::sink_ptr sink,
                                            const char* pattern) {
  sink->set_pattern(pattern);
  auto logger = std::make_shared<spdlog::logger>(name, std::move(sink));
  spdlog::register_logger(logger);
  return logger;
}

void ensure_loggers_locked() {
  if(g_sinks.info) return;
  g_sinks.info = make_logger("snapsend.info",
                             std::make_shared<spdlog::sinks::stdout_color_sink_mt>(),
                             kTimestampPattern);
  g_sinks.error = make_logger("snapsend.error",
                              std::make_shared<spdlog::sinks::stderr_color_sink_mt>(),
                              kTimestampPattern);
  g_sinks.print = make_logger("snapsend.print",
                              std::make_shared<spdlog::sinks::stdout_color_sink_mt>(),
                              "%v");
  g_sinks.print_err = make_logger("snapsend.print_err",
                                  std::make_shared<spdlog::sinks::stderr_color_sink_mt>(),
                                  "%v");

  g_sinks.info->flush_on(spdlog::level::warn);
  g_sinks.error->flush_on(spdlog::level::err);
  g_sinks.print->flush_on(spdlog::level::info);
  g_sinks.print_err->flush_on(spdlog::level::err);
}

spdlog::logger* sink_for(LogChannel channel) {
  std::lock_guard lg(g_sinks_mutex);
  ensure_loggers_locked();
  switch(channel) {
    case LogChannel::Print: return g_sinks.print.get();
    case LogChannel::PrintErr: return g_sinks.print_err.get();
    case LogChannel::Error: return g_sinks.error.get();
    default: return g_sinks.info.get();
  }
}

} // namespace

void init(bool verbose) {
  std::lock_guard lg(g_sinks_mutex);
  ensure_loggers_locked();
  auto level = verbose ? spdlog::level::debug : spdlog::level::info;
  g_sinks.info->set_level(level);
  g_sinks.error->set_level(spdlog::level::info);
  g_sinks.print->set_level(spdlog::level::info);
  g_sinks.print_err->set_level(spdlog::level::info);

  spdlog::set_default_logger(g_sinks.info);
  spdlog::set_level(level);
}

bool set_log_file(const std::filesystem::path& path) {
  std::lock_guard lg(g_sinks_mutex);
  ensure_loggers_locked();

  if(g_sinks.file) {
    for(auto* logger : g_sinks.all()) {
      auto& sinks = logger->sinks();
      sinks.erase(std::remove(sinks.begin(), sinks.end(), g_sinks.file), sinks.end());
    }
    g_sinks.file.reset();
  }
  if(path.empty()) return true;

  try {
    if(path.has_parent_path()) {
      std::error_code ec;
      std::filesystem::create_directories(path.parent_path(), ec);
    }
    g_sinks.file = std::make_shared<spdlog::sinks::basic_file_sink_mt>(path.string(), false);
    g_sinks.file->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");
  } catch(const spdlog::spdlog_ex& e) {
    g_sinks.error->error("Unable to open log file {}: {}", path.string(), e.what());
    return false;
  }
  for(auto* logger : g_sinks.all()) {
    logger->sinks().push_back(g_sinks.file);
  }
  return true;
}

void set_log_passthrough(bool enabled) {
  g_log_passthrough.store(enabled, std::memory_order_release);
}

bool log_passthrough() {
  return g_log_passthrough.load(std::memory_order_acquire);
}

const char* to_string(LogChannel channel) {
  switch(channel) {
    case LogChannel::Debug: return "debug";
    case LogChannel::Info: return "info";
    case LogChannel::Warn: return "warn";
    case LogChannel::Error: return "error";
    case LogChannel::Print: return "print";
    case LogChannel::PrintErr: return "print_err";
  }
  return "info";
}

spdlog::level::level_enum level_of(LogChannel channel) {
  switch(channel) {
    case LogChannel::Debug: return spdlog::level::debug;
    case LogChannel::Warn: return spdlog::level::warn;
    case LogChannel::Error:
    case LogChannel::PrintErr: return spdlog::level::err;
    default: return spdlog::level::info;
  }
}

void emit_unnamed(LogChannel channel, const std::string& message) {
  if(!log_passthrough()) return;
  if(auto* sink = sink_for(channel)) sink->log(level_of(channel), message);
}

void Logger::set_name(std::string name) {
  std::lock_guard lock(name_mutex_);
  name_ = std::move(name);
}

std::string Logger::name() const {
  std::lock_guard lock(name_mutex_);
  return name_;
}

LogListenerHandle Logger::add_listener(Listener listener, void* user_data) {
  if(!listener) return 0;
  std::lock_guard lock(listener_mutex_);
  const auto id = next_listener_id_++;
  listeners_.emplace(id, ListenerBinding{user_data, std::move(listener)});
  return id;
}

void Logger::remove_listener(LogListenerHandle handle) {
  std::lock_guard lock(listener_mutex_);
  listeners_.erase(handle);
}

void Logger::clear_listeners() {
  std::lock_guard lock(listener_mutex_);
  listeners_.clear();
}

void Logger::emit(LogChannel channel, const std::string& message) {
  const auto level = level_of(channel);
  const auto prefix = name();
  const std::string channel_name = prefix.empty() ? to_string(channel) : prefix + ":" + to_string(channel);
  if(dispatch(channel_name, level, message)) return;
  if(!log_passthrough()) return;

  auto* sink = sink_for(channel);
  if(!sink) return;
  if(prefix.empty() || channel == LogChannel::Print || channel == LogChannel::PrintErr) {
    sink->log(level, message);
  } else {
    sink->log(level, fmt::format("[{}] {}", channel_name, message));
  }
}

bool Logger::dispatch(const std::string& channel,
                      spdlog::level::level_enum level,
                      const std::string& message) {
  std::vector<ListenerBinding> snapshot;
  {
    std::lock_guard lock(listener_mutex_);
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
      emit_unnamed(LogChannel::Error, fmt::format("log listener threw: {}", e.what()));
    }
  }
  return handled;
}
