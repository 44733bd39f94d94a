#pragma once
#include <asio.hpp>
#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

#include "connection.hpp"
#include "log.hpp"
#include "relay_hub.hpp"

// TCP front end for RelayHub. Each accepted socket gets a "conn-<n>" handle.
class RelayServer : public ConnectionHandler,
                    public Outbox,
                    public std::enable_shared_from_this<RelayServer> {
public:
  struct Options {
    std::string listen_ip = "0.0.0.0";
    uint16_t listen_port = 7420;
    std::chrono::milliseconds sweep_interval{5000};
    RelayHub::Options hub;
  };

  static std::shared_ptr<RelayServer> create(asio::io_context& io,
                                             Options options,
                                             std::shared_ptr<Logger> logger = nullptr);
  ~RelayServer() override;

  // Binds and starts accepting. Throws std::system_error if the port is taken.
  void start();
  void stop();

  uint16_t port() const { return bound_port_; }
  RelayHub& hub() { return hub_; }
  std::size_t connection_count() const;

  void on_message(const std::shared_ptr<Connection>& conn, const nlohmann::json& message) override;
  void on_closed(const std::shared_ptr<Connection>& conn) override;

  void send(const std::string& handle, const nlohmann::json& message, WriteCallback on_written = nullptr) override;
  void close(const std::string& handle) override;

private:
  RelayServer(asio::io_context& io, Options options, std::shared_ptr<Logger> logger);

  void do_accept();
  void schedule_sweep();
  std::shared_ptr<Connection> find(const std::string& handle) const;

  asio::io_context& io_;
  Options options_;
  std::shared_ptr<Logger> logger_;
  std::unique_ptr<asio::ip::tcp::acceptor> acceptor_;
  std::unique_ptr<asio::steady_timer> sweep_timer_;
  std::atomic<bool> started_{false};
  uint16_t bound_port_ = 0;

  mutable std::mutex connections_mutex_;
  std::unordered_map<std::string, std::shared_ptr<Connection>> connections_;
  uint64_t next_connection_ = 1;

  RelayHub hub_;
};
