#include "connection.hpp"
#include "protocol.hpp"

#include <istream>

using json = nlohmann::json;

std::shared_ptr<Connection> Connection::create(asio::ip::tcp::socket sock,
                                               std::weak_ptr<ConnectionHandler> handler,
                                               std::shared_ptr<Logger> logger) {
  return std::shared_ptr<Connection>(new Connection(std::move(sock), std::move(handler), std::move(logger)));
}

Connection::Connection(asio::ip::tcp::socket sock,
                       std::weak_ptr<ConnectionHandler> handler,
                       std::shared_ptr<Logger> logger)
  : socket_(std::move(sock)),
    handler_(std::move(handler)),
    logger_(std::move(logger)),
    read_buf_(kMaxLineBytes) {
  std::error_code ec;
  auto ep = socket_.remote_endpoint(ec);
  if(!ec) {
    remote_address_ = ep.address().to_string();
    remote_port_ = ep.port();
  }
}

Connection::~Connection() {
  std::error_code ec;
  socket_.close(ec);
}

void Connection::start() {
  do_read();
}

void Connection::do_read() {
  auto self = shared_from_this();
  asio::async_read_until(socket_, read_buf_, '\n',
    [this, self](std::error_code ec, std::size_t){
      if(ec) {
        if(ec == asio::error::not_found) {
          log_warn(logger_.get(), "Connection {}: line exceeds {} bytes", handle_, kMaxLineBytes);
        } else if(ec != asio::error::operation_aborted && ec != asio::error::eof) {
          log_info(logger_.get(), "Connection {} read error: {}", handle_, ec.message());
        }
        close_on_executor();
        return;
      }
      std::istream is(&read_buf_);
      std::string line;
      std::getline(is, line);
      if(!line.empty() && line.back() == '\r') line.pop_back();
      if(!line.empty()) handle_line(line);
      if(!closed_) do_read();
    });
}

void Connection::handle_line(const std::string& line) {
  json j;
  try {
    j = json::parse(line);
  } catch(const json::parse_error& e) {
    log_warn(logger_.get(), "Connection {}: dropping malformed line: {}", handle_, e.what());
    async_send_json(make_error(std::string("malformed JSON: ") + e.what()));
    return;
  }
  if(auto handler = handler_.lock()) {
    handler->on_message(shared_from_this(), j);
  }
}

void Connection::async_send_json(const json& j, WriteCallback on_written) {
  std::string line = j.dump(-1, ' ', false, json::error_handler_t::replace);
  line.push_back('\n');
  auto self = shared_from_this();
  asio::post(socket_.get_executor(),
    [self, line = std::move(line), cb = std::move(on_written)]() mutable {
      if(self->closed_) {
        if(cb) cb(false);
        return;
      }
      const bool idle = self->write_queue_.empty();
      self->write_queue_.push_back(PendingWrite{std::move(line), std::move(cb)});
      if(idle) self->do_write();
    });
}

void Connection::do_write() {
  if(write_queue_.empty() || closed_) return;
  auto self = shared_from_this();
  asio::async_write(socket_, asio::buffer(write_queue_.front().line),
    [this, self](std::error_code ec, std::size_t){
      if(write_queue_.empty()) return;
      auto done = std::move(write_queue_.front().on_written);
      write_queue_.pop_front();
      if(ec) {
        if(ec != asio::error::operation_aborted) {
          log_info(logger_.get(), "Connection {} write error: {}", handle_, ec.message());
        }
        if(done) done(false);
        close_on_executor();
        return;
      }
      if(done) done(true);
      if(!write_queue_.empty()) do_write();
    });
}

void Connection::close() {
  auto self = shared_from_this();
  asio::post(socket_.get_executor(), [self]{ self->close_on_executor(); });
}

void Connection::close_on_executor() {
  if(closed_) return;
  closed_ = true;
  std::error_code ec;
  socket_.shutdown(asio::ip::tcp::socket::shutdown_both, ec);
  socket_.close(ec);

  auto pending = std::move(write_queue_);
  write_queue_.clear();
  for(auto& w : pending) {
    if(w.on_written) w.on_written(false);
  }
  if(auto handler = handler_.lock()) {
    handler->on_closed(shared_from_this());
  }
}

void Connection::connect_outgoing(asio::io_context& io,
                                  const std::string& host,
                                  uint16_t port,
                                  std::weak_ptr<ConnectionHandler> handler,
                                  ConnectedCallback on_connected,
                                  FailedCallback on_failed,
                                  std::shared_ptr<Logger> logger) {
  auto resolver = std::make_shared<asio::ip::tcp::resolver>(io);
  resolver->async_resolve(host, std::to_string(port),
    [resolver, &io, handler, host, port, on_connected, on_failed, logger]
    (std::error_code ec, asio::ip::tcp::resolver::results_type results) {
      if(ec) {
        log_info(logger.get(), "Resolve failed for {}:{}: {}", host, port, ec.message());
        if(on_failed) on_failed(ec.message());
        return;
      }
      auto sock = std::make_shared<asio::ip::tcp::socket>(io);
      asio::async_connect(*sock, results,
        [sock, handler, host, port, on_connected, on_failed, logger]
        (std::error_code ec, const asio::ip::tcp::endpoint&) {
          if(ec) {
            log_info(logger.get(), "Connect to {}:{} failed: {}", host, port, ec.message());
            if(on_failed) on_failed(ec.message());
            return;
          }
          log_debug(logger.get(), "Connected to {}:{}", host, port);
          auto conn = Connection::create(std::move(*sock), handler, logger);
          conn->start();
          if(on_connected) on_connected(conn);
        });
    });
}
