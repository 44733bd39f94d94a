#pragma once
#include <asio.hpp>
#include <deque>
#include <functional>
#include <memory>
#include <string>
#include <nlohmann/json.hpp>

#include "log.hpp"

class Connection;

class ConnectionHandler {
public:
  virtual ~ConnectionHandler() = default;
  virtual void on_message(const std::shared_ptr<Connection>& conn, const nlohmann::json& message) = 0;
  virtual void on_closed(const std::shared_ptr<Connection>& conn) = 0;
};

// One newline-delimited JSON document per message. Writes are queued and
// issued one at a time on the socket's executor, so async_send_json may be
// called from any thread.
class Connection : public std::enable_shared_from_this<Connection> {
public:
  using WriteCallback = std::function<void(bool ok)>;
  using ConnectedCallback = std::function<void(std::shared_ptr<Connection>)>;
  using FailedCallback = std::function<void(const std::string& error)>;

  static std::shared_ptr<Connection> create(asio::ip::tcp::socket sock,
                                            std::weak_ptr<ConnectionHandler> handler,
                                            std::shared_ptr<Logger> logger = nullptr);

  // Resolve and connect; on success the connection is created and started
  // before on_connected runs.
  static void connect_outgoing(asio::io_context& io,
                               const std::string& host,
                               uint16_t port,
                               std::weak_ptr<ConnectionHandler> handler,
                               ConnectedCallback on_connected,
                               FailedCallback on_failed,
                               std::shared_ptr<Logger> logger = nullptr);

  ~Connection();

  void start();
  void async_send_json(const nlohmann::json& j, WriteCallback on_written = nullptr);
  void close();

  bool is_open() const { return !closed_; }
  const std::string& handle() const { return handle_; }
  void set_handle(const std::string& handle) { handle_ = handle; }
  const std::string& remote_address() const { return remote_address_; }
  uint16_t remote_port() const { return remote_port_; }

private:
  Connection(asio::ip::tcp::socket sock, std::weak_ptr<ConnectionHandler> handler, std::shared_ptr<Logger> logger);

  struct PendingWrite {
    std::string line;
    WriteCallback on_written;
  };

  void do_read();
  void handle_line(const std::string& line);
  void do_write();
  void close_on_executor();

  asio::ip::tcp::socket socket_;
  std::weak_ptr<ConnectionHandler> handler_;
  std::shared_ptr<Logger> logger_;
  asio::streambuf read_buf_;
  std::deque<PendingWrite> write_queue_;
  std::string handle_;
  std::string remote_address_;
  uint16_t remote_port_ = 0;
  bool closed_ = false;
};
