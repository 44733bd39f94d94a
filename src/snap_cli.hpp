#pragma once

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

#include "event_bus.hpp"
#include "log.hpp"

class RelayServer;
class SettingsManager;
class TransferNode;

// Interactive console. Runs on its own thread; bus events are printed as
// they arrive on the io thread.
class SnapCLI {
public:
  using QuitCallback = std::function<void()>;

  SnapCLI(std::shared_ptr<TransferNode> node,
          std::shared_ptr<RelayServer> relay_server,
          std::shared_ptr<SettingsManager> settings,
          std::shared_ptr<Logger> logger,
          QuitCallback on_quit);
  ~SnapCLI();

  void start();
  void stop();

  // Returns false once the command asks to quit.
  bool execute_command(const std::string& line);

private:
  void run_loop();
  std::optional<std::string> read_command_line(const char* prompt);
#if !defined(HAVE_READLINE)
  std::optional<std::string> read_command_line_simple(const char* prompt);
  void append_history_entry(const std::string& line);
#endif

  EventBus* bus() const;
  void on_event(const Event& event);

  void print_help();
  void list_devices();
  void list_pairings();
  void list_queue();
  void list_transfers();
  void remove_transfer(const std::string& id);
  void pair_command(const std::string& handle);
  void unpair_command(const std::string& pairing_id);
  void send_command(const std::string& args);
  void clip_command(const std::string& target, const std::string& text);
  void rename_command(const std::string& name);
  void print_stats();
  void handle_settings_command(const std::string& args);
  void list_settings();

  template<typename... Args>
  void out(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    std::lock_guard lg(output_mutex_);
    print_out(logger_.get(), fmt, std::forward<Args>(args)...);
  }

  std::shared_ptr<TransferNode> node_;
  std::shared_ptr<RelayServer> relay_server_;
  std::shared_ptr<SettingsManager> settings_;
  std::shared_ptr<Logger> logger_;
  QuitCallback on_quit_;
  SubscriptionHandle subscription_ = 0;
  std::thread cli_thread_;
  std::atomic<bool> running_{true};
  std::atomic<bool> finished_{false};
  std::mutex output_mutex_;
  std::unordered_map<std::string, int> progress_shown_;
#if !defined(HAVE_READLINE)
  std::vector<std::string> cli_history_;
  static constexpr std::size_t history_limit_ = 200;
#endif
};
