#include "relay_server.hpp"

using asio::ip::tcp;

std::shared_ptr<RelayServer> RelayServer::create(asio::io_context& io,
                                                 Options options,
                                                 std::shared_ptr<Logger> logger) {
  return std::shared_ptr<RelayServer>(new RelayServer(io, std::move(options), std::move(logger)));
}

RelayServer::RelayServer(asio::io_context& io, Options options, std::shared_ptr<Logger> logger)
  : io_(io),
    options_(std::move(options)),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("relay")),
    hub_(*this, options_.hub, logger_) {}

RelayServer::~RelayServer() {
  std::error_code ec;
  if(acceptor_) acceptor_->close(ec);
}

void RelayServer::start() {
  if(started_) return;
  asio::ip::address listen_address = asio::ip::make_address(options_.listen_ip);

  acceptor_ = std::make_unique<tcp::acceptor>(io_);
  tcp::endpoint endpoint(listen_address, options_.listen_port);
  acceptor_->open(endpoint.protocol());
  acceptor_->set_option(tcp::acceptor::reuse_address(true));
  acceptor_->bind(endpoint);
  acceptor_->listen();
  bound_port_ = acceptor_->local_endpoint().port();
  started_ = true;

  log_info(logger_.get(), "Relay listening on {}:{}", options_.listen_ip, bound_port_);
  do_accept();

  sweep_timer_ = std::make_unique<asio::steady_timer>(io_);
  schedule_sweep();
}

void RelayServer::stop() {
  if(!started_.exchange(false)) return;
  std::error_code ec;
  if(sweep_timer_) sweep_timer_->cancel();
  if(acceptor_) acceptor_->close(ec);

  std::unordered_map<std::string, std::shared_ptr<Connection>> open;
  {
    std::lock_guard lg(connections_mutex_);
    open = connections_;
  }
  for(auto& [handle, conn] : open) conn->close();
  log_info(logger_.get(), "Relay stopped");
}

void RelayServer::do_accept() {
  if(!acceptor_) return;
  auto self = shared_from_this();
  acceptor_->async_accept(
    [this, self](std::error_code ec, tcp::socket socket){
      if(ec) {
        if(ec != asio::error::operation_aborted) {
          log_error(logger_.get(), "Accept error: {}", ec.message());
        }
      } else {
        auto conn = Connection::create(std::move(socket), weak_from_this(), logger_);
        std::string handle;
        {
          std::lock_guard lg(connections_mutex_);
          handle = "conn-" + std::to_string(next_connection_++);
          connections_[handle] = conn;
        }
        conn->set_handle(handle);
        log_info(logger_.get(), "Accepted {} from {}:{}", handle, conn->remote_address(), conn->remote_port());
        hub_.on_connected(handle);
        conn->start();
      }
      if(started_) do_accept();
    });
}

void RelayServer::schedule_sweep() {
  if(!sweep_timer_) return;
  sweep_timer_->expires_after(options_.sweep_interval);
  auto self = shared_from_this();
  sweep_timer_->async_wait([this, self](const std::error_code& ec){
    if(ec || !started_) return;
    hub_.expire_assemblies();
    schedule_sweep();
  });
}

std::shared_ptr<Connection> RelayServer::find(const std::string& handle) const {
  std::lock_guard lg(connections_mutex_);
  auto it = connections_.find(handle);
  return it == connections_.end() ? nullptr : it->second;
}

std::size_t RelayServer::connection_count() const {
  std::lock_guard lg(connections_mutex_);
  return connections_.size();
}

void RelayServer::on_message(const std::shared_ptr<Connection>& conn, const nlohmann::json& message) {
  hub_.on_message(conn->handle(), message);
}

void RelayServer::on_closed(const std::shared_ptr<Connection>& conn) {
  {
    std::lock_guard lg(connections_mutex_);
    connections_.erase(conn->handle());
  }
  hub_.on_disconnected(conn->handle());
}

void RelayServer::send(const std::string& handle, const nlohmann::json& message, WriteCallback on_written) {
  auto conn = find(handle);
  if(!conn) {
    log_debug(logger_.get(), "Dropping {} for closed connection {}", message.value("type", "?"), handle);
    if(on_written) on_written(false);
    return;
  }
  conn->async_send_json(message, std::move(on_written));
}

void RelayServer::close(const std::string& handle) {
  if(auto conn = find(handle)) conn->close();
}
