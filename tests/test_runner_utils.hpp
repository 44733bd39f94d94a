#pragma once

#include "event_bus.hpp"
#include "log.hpp"
#include "snap_engine.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace snapsend::test {

inline std::filesystem::path prepare_workspace(const std::string& name) {
  auto root = std::filesystem::temp_directory_path() / ("snapsend_" + name);
  std::error_code ec;
  std::filesystem::remove_all(root, ec);
  std::filesystem::create_directories(root, ec);
  return root;
}

inline void write_config_before_start(const std::filesystem::path& workspace,
                                      const std::string& filename,
                                      const nlohmann::json& content) {
  auto config_dir = workspace / ".config";
  std::error_code ec;
  std::filesystem::create_directories(config_dir, ec);
  std::ofstream out(config_dir / filename, std::ios::trunc);
  if(out) {
    out << content.dump(2);
  }
}

inline std::string read_file(const std::filesystem::path& path) {
  std::ifstream in(path, std::ios::binary);
  return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

class LogCapture {
public:
  LogCapture() = default;

  ~LogCapture() {
    detach_all();
  }

  void attach(const std::shared_ptr<Logger>& logger,
              const std::string& label = std::string()) {
    if(!logger) return;
    auto handle = logger->add_listener(make_listener(label), nullptr);
    std::lock_guard<std::mutex> lock(attachments_mutex_);
    attachments_.push_back({logger, handle});
  }

  // Holds the engine's logger, so the engine may be destroyed first.
  void attach(SnapEngine& engine, const std::string& label = std::string()) {
    attach(engine.logger(), label);
  }

  void detach_all() {
    std::vector<Attachment> pending;
    {
      std::lock_guard<std::mutex> lock(attachments_mutex_);
      pending.swap(attachments_);
    }
    for(auto& attachment : pending) {
      if(attachment.logger && attachment.handle != 0) {
        attachment.logger->remove_listener(attachment.handle);
      }
    }
  }

  void clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    lines_.clear();
  }

  std::vector<std::string> snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lines_;
  }

  bool wait_for_substring(const std::string& needle,
                          std::chrono::milliseconds timeout) {
    auto predicate = [&]{
      return std::any_of(lines_.begin(), lines_.end(),
        [&](const std::string& line){ return line.find(needle) != std::string::npos; });
    };
    std::unique_lock<std::mutex> lock(mutex_);
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while(!predicate()) {
      if(cv_.wait_until(lock, deadline) == std::cv_status::timeout) break;
    }
    return predicate();
  }

private:
  Logger::Listener make_listener(const std::string& label) {
    return [this, label](void*,
                         const std::string& channel,
                         spdlog::level::level_enum,
                         const std::string& message) {
      std::lock_guard<std::mutex> lock(mutex_);
      if(!label.empty()) {
        lines_.emplace_back(label + ": " + message);
      } else {
        lines_.emplace_back(channel + ": " + message);
      }
      cv_.notify_all();
      return false;
    };
  }

  struct Attachment {
    std::shared_ptr<Logger> logger;
    LogListenerHandle handle = 0;
  };

  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::vector<std::string> lines_;
  std::mutex attachments_mutex_;
  std::vector<Attachment> attachments_;
};

// Records every event published on a bus, from any thread.
class EventRecorder {
public:
  explicit EventRecorder(EventBus& bus) : bus_(bus) {
    handle_ = bus_.subscribe([this](const Event& ev){
      std::lock_guard<std::mutex> lock(mutex_);
      events_.push_back(ev);
      cv_.notify_all();
    });
  }

  ~EventRecorder() {
    bus_.unsubscribe(handle_);
  }

  EventRecorder(const EventRecorder&) = delete;
  EventRecorder& operator=(const EventRecorder&) = delete;

  template<typename T>
  std::vector<T> all() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<T> out;
    for(const auto& ev : events_) {
      if(auto* e = std::get_if<T>(&ev)) out.push_back(*e);
    }
    return out;
  }

  template<typename T>
  std::size_t count() const {
    return all<T>().size();
  }

  template<typename T>
  std::optional<T> wait_for(std::function<bool(const T&)> predicate,
                            std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    auto deadline = std::chrono::steady_clock::now() + timeout;
    for(;;) {
      for(const auto& ev : events_) {
        if(auto* e = std::get_if<T>(&ev)) {
          if(!predicate || predicate(*e)) return *e;
        }
      }
      if(cv_.wait_until(lock, deadline) == std::cv_status::timeout) break;
    }
    for(const auto& ev : events_) {
      if(auto* e = std::get_if<T>(&ev)) {
        if(!predicate || predicate(*e)) return *e;
      }
    }
    return std::nullopt;
  }

  template<typename T>
  std::optional<T> wait_for(std::chrono::milliseconds timeout) {
    return wait_for<T>(nullptr, timeout);
  }

  void clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    events_.clear();
  }

private:
  EventBus& bus_;
  SubscriptionHandle handle_ = 0;
  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::vector<Event> events_;
};

inline bool wait_for_condition(std::function<bool()> predicate,
                               std::chrono::milliseconds timeout,
                               std::chrono::milliseconds interval = std::chrono::milliseconds(50)) {
  auto deadline = std::chrono::steady_clock::now() + timeout;
  while(std::chrono::steady_clock::now() < deadline) {
    if(predicate()) return true;
    std::this_thread::sleep_for(interval);
  }
  return predicate();
}

struct TestContext {
  LogCapture& logs;
  bool verbose = false;
};

struct TestCase {
  const char* name;
  std::function<bool(TestContext&)> fn;
};

// Shared main loop: "." per pass, "F (name)" plus captured logs per failure.
inline int run_tests(const char* suite, int argc, char** argv, const std::vector<TestCase>& tests) {
  bool verbose = (std::getenv("SNAPSEND_TEST_VERBOSE") != nullptr);
  for(int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if(arg == "-v" || arg == "--verbose") {
      verbose = true;
    }
  }

  bool show_logs = (std::getenv("SNAPSEND_TEST_LOGS") != nullptr) || verbose;
  const bool suppress_logs = !show_logs;
  init(verbose);
  if(suppress_logs) {
    set_log_passthrough(false);
  }
  LogCapture logs;
  TestContext ctx{logs, verbose};

  std::size_t failures = 0;
  std::cout << "Running " << tests.size() << " " << suite << " tests: " << std::flush;

  for(std::size_t idx = 0; idx < tests.size(); ++idx) {
    const auto& test = tests[idx];
    logs.clear();
    bool passed = false;
    try {
      passed = test.fn(ctx);
    } catch(const std::exception& e) {
      passed = false;
      std::cerr << "Exception in test " << test.name << ": " << e.what() << "\n";
    }
    logs.detach_all();
    if(passed) {
      std::cout << '.' << std::flush;
    } else {
      std::cout << 'F' << " (" << test.name << ")\n";
      failures++;
      for(const auto& line : logs.snapshot()) {
        std::cout << "    " << line << "\n";
      }
      if(idx + 1 < tests.size()) {
        std::cout << "Running " << tests.size() << " " << suite << " tests: " << std::flush;
      }
    }
  }
  std::cout << "\n";
  if(suppress_logs) {
    set_log_passthrough(true);
  }
  if(failures == 0) {
    std::cout << "PASS (" << tests.size() << " tests)\n";
    return 0;
  }
  std::cout << "FAIL (" << failures << "/" << tests.size() << " failed)\n";
  return 1;
}

#define SNAPSEND_CHECK(cond) \
  do { \
    if(!(cond)) { \
      std::cerr << "  check failed: " #cond " (" << __FILE__ << ":" << __LINE__ << ")\n"; \
      return false; \
    } \
  } while(0)

} // namespace snapsend::test
