#pragma once

#include <asio.hpp>

#include <cstddef>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <thread>

#include "log.hpp"

class SnapCLI;
class SettingsManager;
class TransferNode;
class RelayServer;
class DirectNode;
class RelayClient;

// Owns the io_context and whichever node the "mode" setting selects.
class SnapEngine {
public:
  enum class Mode { Direct, RelayServer, RelayClient };

  struct Options {
    std::string display_name;         // used when device_name is empty
    bool start_cli_thread = false;
    bool handle_signals = false;
    std::filesystem::path workspace_root = std::filesystem::current_path();
  };

  SnapEngine(std::shared_ptr<SettingsManager> settings, Options options);
  ~SnapEngine();

  // Throws std::runtime_error for unusable settings and std::system_error
  // when the listen port cannot be bound.
  void start();
  void run();
  void start_background();
  void stop();

  void execute_command(const std::string& line);

  std::shared_ptr<SettingsManager> settings() const { return settings_; }
  std::shared_ptr<Logger> logger() const { return logger_; }

  LogListenerHandle add_log_listener(Logger::Listener listener, void* user_data = nullptr);
  void remove_log_listener(LogListenerHandle handle);
  void clear_log_listeners();

  struct Stats {
    Mode mode = Mode::Direct;
    std::size_t devices = 0;
    std::size_t pairings = 0;
    std::size_t pending = 0;
    std::size_t connections = 0;
  };

  Stats stats() const;

  Mode mode() const { return mode_; }
  std::shared_ptr<TransferNode> node() const { return node_; }
  std::shared_ptr<RelayServer> relay_server() const { return relay_server_; }
  uint16_t listen_port() const;
  const std::string& stable_id() const { return stable_id_; }
  const std::string& display_name() const { return display_name_; }
  const std::filesystem::path& workspace_root() const { return options_.workspace_root; }

  static std::optional<Mode> parse_mode(const std::string& text);
  static const char* to_string(Mode mode);

private:
  void ensure_workspace() const;
  std::filesystem::path workspace_path(const std::string& value) const;
  void start_relay_server();
  void start_relay_client();
  void start_direct();
  void start_cli();

  Options options_;
  std::shared_ptr<SettingsManager> settings_;
  std::shared_ptr<Logger> logger_;
  asio::io_context io_;
  std::optional<asio::executor_work_guard<asio::io_context::executor_type>> work_;
  std::unique_ptr<asio::signal_set> signals_;
  std::thread io_thread_;
  Mode mode_ = Mode::Direct;
  std::string stable_id_;
  std::string display_name_;
  std::shared_ptr<RelayServer> relay_server_;
  std::shared_ptr<DirectNode> direct_;
  std::shared_ptr<RelayClient> relay_client_;
  std::shared_ptr<TransferNode> node_;
  std::unique_ptr<SnapCLI> cli_;
  bool started_ = false;
  bool cli_thread_running_ = false;
};
