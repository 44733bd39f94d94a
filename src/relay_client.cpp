#include "relay_client.hpp"
#include "utils.hpp"

#include <algorithm>

std::shared_ptr<RelayClient> RelayClient::create(asio::io_context& io,
                                                 Options options,
                                                 std::shared_ptr<FileStore> files,
                                                 std::shared_ptr<TransferStore> store,
                                                 std::shared_ptr<Logger> logger) {
  return std::shared_ptr<RelayClient>(new RelayClient(io, std::move(options), std::move(files),
                                                      std::move(store), std::move(logger)));
}

RelayClient::RelayClient(asio::io_context& io, Options options, std::shared_ptr<FileStore> files,
                         std::shared_ptr<TransferStore> store, std::shared_ptr<Logger> logger)
  : io_(io),
    options_(std::move(options)),
    files_(std::move(files)),
    store_(std::move(store)),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("relay-client")),
    bus_(logger_),
    inbox_(bus_, *files_, store_, options_.limits, options_.assembly_timeout, logger_),
    reconnect_timer_(io),
    sweep_timer_(io) {}

RelayClient::~RelayClient() = default;

void RelayClient::start() {
  if(started_.exchange(true)) return;
  log_info(logger_.get(), "Connecting to relay {}:{} as {}", options_.relay_host, options_.relay_port,
           options_.display_name);
  auto self = shared_from_this();
  asio::post(io_, [self]{
    self->connect_to_relay();
    self->schedule_sweep();
  });
}

void RelayClient::stop() {
  if(!started_.exchange(false)) return;
  std::shared_ptr<Connection> conn;
  {
    std::lock_guard lg(mutex_);
    conn = conn_;
    discovery_listener_ = nullptr;
  }
  auto self = shared_from_this();
  asio::post(io_, [self]{
    self->reconnect_timer_.cancel();
    self->sweep_timer_.cancel();
  });
  if(conn) conn->close();
}

void RelayClient::connect_to_relay() {
  {
    std::lock_guard lg(mutex_);
    if(!started_ || conn_ || connecting_) return;
    connecting_ = true;
  }
  auto self = shared_from_this();
  Connection::connect_outgoing(io_, options_.relay_host, options_.relay_port, weak_from_this(),
    [self](std::shared_ptr<Connection> conn){
      {
        std::lock_guard lg(self->mutex_);
        self->connecting_ = false;
        self->conn_ = conn;
      }
      conn->set_handle("relay");
      log_info(self->logger_.get(), "Connected to relay {}:{}", self->options_.relay_host, self->options_.relay_port);
      if(!self->started_) conn->close();
    },
    [self](const std::string& error){
      {
        std::lock_guard lg(self->mutex_);
        self->connecting_ = false;
      }
      log_info(self->logger_.get(), "Relay unreachable ({}); retrying in {} ms", error,
               self->options_.reconnect_delay.count());
      self->schedule_reconnect();
    },
    logger_);
}

void RelayClient::schedule_reconnect() {
  if(!started_) return;
  reconnect_timer_.expires_after(options_.reconnect_delay);
  auto self = shared_from_this();
  reconnect_timer_.async_wait([self](const std::error_code& ec){
    if(ec || !self->started_) return;
    self->connect_to_relay();
  });
}

void RelayClient::schedule_sweep() {
  sweep_timer_.expires_after(options_.sweep_interval);
  auto self = shared_from_this();
  sweep_timer_.async_wait([self](const std::error_code& ec){
    if(ec || !self->started_) return;
    self->inbox_.expire();
    self->schedule_sweep();
  });
}

bool RelayClient::connected() const {
  std::lock_guard lg(mutex_);
  return conn_ && !handle_.empty();
}

std::size_t RelayClient::sends_in_flight() const {
  std::lock_guard lg(mutex_);
  return senders_.size();
}

bool RelayClient::send_message(const Message& message, Connection::WriteCallback on_written) {
  std::shared_ptr<Connection> conn;
  {
    std::lock_guard lg(mutex_);
    conn = conn_;
  }
  if(!conn) {
    if(on_written) on_written(false);
    return false;
  }
  conn->async_send_json(encode_message(message), std::move(on_written));
  return true;
}

void RelayClient::emit(const DiscoveryEvent& event) {
  Listener listener;
  {
    std::lock_guard lg(mutex_);
    listener = discovery_listener_;
  }
  if(listener) listener(event);
}

// ---------------------------------------------------------------------------
// connection

void RelayClient::on_message(const std::shared_ptr<Connection>& conn, const nlohmann::json& message) {
  try {
    auto decoded = decode_message(message);
    std::visit([&](const auto& m){ handle_message(m); }, decoded);
  } catch(const ProtocolError& e) {
    log_warn(logger_.get(), "Protocol error from relay: {}", e.what());
    conn->async_send_json(make_error(e.what()));
    bus_.publish(Event{PeerError{"relay", ErrorKind::Protocol, e.what()}});
  }
}

void RelayClient::on_closed(const std::shared_ptr<Connection>& conn) {
  std::vector<std::shared_ptr<ChunkSender>> senders;
  std::vector<Device> lost;
  std::vector<Pairing> ended;
  std::vector<std::string> unconfirmed;
  {
    std::lock_guard lg(mutex_);
    if(conn_ != conn) return;
    conn_.reset();
    handle_.clear();
    for(auto& [id, s] : senders_) senders.push_back(s);
    for(const auto& [id, t] : outgoing_) {
      if(!senders_.count(id)) unconfirmed.push_back(id);
    }
    lost.swap(devices_);
    ended.swap(pairings_);
  }
  log_warn(logger_.get(), "Relay connection lost");

  for(auto& s : senders) s->cancel("relay connection lost");
  for(const auto& id : unconfirmed) fail_send(id, ErrorKind::ChannelLost, "relay connection lost");
  inbox_.abort_from("relay", "relay connection lost");
  for(auto& p : ended) {
    p.status = PairingStatus::Terminated;
    p.terminated_at = SystemClock::now();
    bus_.publish(Event{PairingEnded{p, std::string(), "relay connection lost"}});
  }
  for(const auto& d : lost) emit(DiscoveryEvent{DeviceLost{d.handle, "relay connection lost"}});
  bus_.publish(Event{DeviceListUpdated{{}}});
  schedule_reconnect();
}

template<typename T>
void RelayClient::handle_message(const T& m) {
  log_debug(logger_.get(), "Ignoring '{}' from relay", message_type(Message{m}));
}

void RelayClient::handle_message(const SetupRequired&) {
  std::string name;
  {
    std::lock_guard lg(mutex_);
    name = options_.display_name;
  }
  send_message(DeviceSetup{name, options_.stable_id});
}

void RelayClient::upsert_device(const Device& device) {
  std::optional<std::string> replaced;
  bool fresh = false;
  {
    std::lock_guard lg(mutex_);
    auto it = std::find_if(devices_.begin(), devices_.end(), [&](const Device& d){
      return d.stable_id == device.stable_id || d.handle == device.handle;
    });
    if(it == devices_.end()) {
      devices_.push_back(device);
      fresh = true;
    } else {
      if(it->handle != device.handle) {
        replaced = it->handle;
        fresh = true;
      }
      *it = device;
    }
  }
  if(replaced) emit(DiscoveryEvent{DeviceLost{*replaced, "handle replaced"}});
  if(fresh) emit(DiscoveryEvent{DeviceAppeared{device, options_.relay_host, options_.relay_port}});
}

void RelayClient::remove_device(const std::string& handle) {
  bool removed = false;
  {
    std::lock_guard lg(mutex_);
    auto it = std::remove_if(devices_.begin(), devices_.end(), [&](const Device& d){ return d.handle == handle; });
    removed = it != devices_.end();
    devices_.erase(it, devices_.end());
  }
  if(removed) emit(DiscoveryEvent{DeviceLost{handle, "device disconnected"}});
}

void RelayClient::handle_message(const DeviceListMessage& m) {
  std::string self;
  {
    std::lock_guard lg(mutex_);
    if(m.kind == DeviceListMessage::Kind::SetupComplete) {
      handle_ = m.device.handle;
      log_info(logger_.get(), "Registered with relay as {} ({} online)", handle_, m.online.size());
    }
    self = handle_;
  }

  std::vector<Device> online;
  for(const auto& d : m.online) {
    if(d.handle != self && d.stable_id != options_.stable_id) online.push_back(d);
  }

  if(m.kind == DeviceListMessage::Kind::Disconnected) {
    remove_device(m.device.handle);
  }
  // The list is authoritative; anything missing from it is gone.
  std::vector<std::string> missing;
  {
    std::lock_guard lg(mutex_);
    for(const auto& d : devices_) {
      auto found = std::find_if(online.begin(), online.end(), [&](const Device& o){ return o.handle == d.handle; });
      if(found == online.end()) missing.push_back(d.handle);
    }
  }
  for(const auto& h : missing) remove_device(h);
  for(const auto& d : online) upsert_device(d);

  bus_.publish(Event{DeviceListUpdated{devices()}});
}

void RelayClient::handle_message(const PairAccepted& m) {
  {
    std::lock_guard lg(mutex_);
    auto it = std::find_if(pairings_.begin(), pairings_.end(), [&](const Pairing& p){ return p.id == m.pairing.id; });
    if(it != pairings_.end()) return;
    pairings_.push_back(m.pairing);
  }
  log_info(logger_.get(), "{} with {} ({})", m.automatic ? "Auto-paired" : "Paired",
           m.partner.display_name, m.partner.handle);
  bus_.publish(Event{PairingEstablished{m.pairing, m.automatic ? PairOrigin::Automatic : PairOrigin::Requested}});
}

void RelayClient::handle_message(const ConnectionTerminated& m) {
  std::optional<Pairing> ended;
  {
    std::lock_guard lg(mutex_);
    auto it = std::find_if(pairings_.begin(), pairings_.end(), [&](const Pairing& p){ return p.id == m.pairing_id; });
    if(it == pairings_.end()) return;
    ended = *it;
    pairings_.erase(it);
  }
  ended->status = PairingStatus::Terminated;
  ended->terminated_at = SystemClock::now();
  log_info(logger_.get(), "Pairing {} terminated by {}", m.pairing_id, m.terminated_by);
  bus_.publish(Event{PairingEnded{*ended, m.terminated_by, "terminated"}});
}

void RelayClient::handle_message(const FileReceived& m) {
  std::string bytes;
  try {
    bytes = decode_inline_content(m.content, m.encoding);
  } catch(const std::invalid_argument& e) {
    throw ProtocolError(std::string("bad file content: ") + e.what());
  }
  auto meta = m.meta;
  if(!m.from_device.empty()) meta.from_device = m.from_device;
  inbox_.accept_inline(meta, bytes);
  send_message(FileReceivedAck{meta.id, meta.filename});
}

void RelayClient::handle_message(const ClipboardSync& m) {
  TransferMeta meta;
  meta.id = m.transfer_id.empty() ? random_id("xfer") : m.transfer_id;
  meta.filename = "clipboard.txt";
  meta.original_name = meta.filename;
  meta.mime_type = "text/plain";
  meta.is_clipboard = true;
  meta.from_device = m.from_device;
  inbox_.accept_inline(meta, m.content);
}

void RelayClient::handle_message(const ChunkFrame& m) {
  inbox_.accept_chunk("relay", m);
}

void RelayClient::handle_message(const FileSentConfirmation& m) {
  std::optional<Transfer> sent;
  {
    std::lock_guard lg(mutex_);
    auto it = outgoing_.find(m.transfer_id);
    if(it != outgoing_.end()) {
      sent = it->second;
      outgoing_.erase(it);
    }
    queued_.erase(std::remove_if(queued_.begin(), queued_.end(),
                                 [&](const PendingTransfer& p){ return p.transfer.meta.id == m.transfer_id; }),
                  queued_.end());
  }
  if(!sent) {
    sent = Transfer{};
    sent->meta.id = m.transfer_id;
    sent->meta.filename = m.filename;
    sent->meta.is_clipboard = m.is_clipboard;
  }
  sent->meta.direction = TransferDirection::Sent;
  log_info(logger_.get(), "{} delivered to {} device(s)", m.filename, m.recipient_count);
  inbox_.record_sent(*sent, TransferDirection::Sent);
  bus_.publish(Event{TransferSent{sent->meta, m.recipient_count}});
}

void RelayClient::handle_message(const FileQueued& m) {
  PendingTransfer entry;
  {
    std::lock_guard lg(mutex_);
    auto it = outgoing_.find(m.transfer_id);
    if(it == outgoing_.end()) {
      entry.transfer.meta.id = m.transfer_id;
      entry.transfer.meta.filename = m.filename;
      entry.transfer.meta.target = TargetDescriptor::device(m.target_handle);
    } else {
      entry.transfer = it->second;
    }
    entry.transfer.meta.direction = TransferDirection::Queued;
    entry.origin_handle = handle_;
    entry.origin_stable_id = options_.stable_id;
    entry.target_key = m.target_handle;
    entry.queued_at = SystemClock::now();
    entry.sequence = next_sequence_++;
    queued_.push_back(entry);
  }
  log_info(logger_.get(), "{} queued for {}", m.filename, m.target_handle);
  inbox_.record_sent(entry.transfer, TransferDirection::Queued);
  bus_.publish(Event{TransferQueued{entry.transfer.meta, m.target_handle}});
}

void RelayClient::handle_message(const FileSaved& m) {
  std::optional<Transfer> saved;
  {
    std::lock_guard lg(mutex_);
    auto it = outgoing_.find(m.transfer_id);
    if(it != outgoing_.end()) {
      saved = it->second;
      outgoing_.erase(it);
    }
  }
  if(!saved) {
    log_debug(logger_.get(), "file-saved for unknown transfer {}", m.transfer_id);
    return;
  }
  log_info(logger_.get(), "No paired device for {}; keeping it locally", m.filename);
  inbox_.save_local(*saved);
}

void RelayClient::fail_send(const std::string& transfer_id, ErrorKind kind, const std::string& reason) {
  {
    std::lock_guard lg(mutex_);
    outgoing_.erase(transfer_id);
  }
  log_warn(logger_.get(), "Transfer {} failed: {}", transfer_id, reason);
  bus_.publish(Event{TransferFailed{transfer_id, kind, reason}});
}

void RelayClient::handle_message(const TransferFailedMessage& m) {
  std::shared_ptr<ChunkSender> sender;
  {
    std::lock_guard lg(mutex_);
    auto it = senders_.find(m.transfer_id);
    if(it != senders_.end()) sender = it->second;
  }
  // The sender's completion reports the failure; otherwise report it here.
  if(sender && !sender->finished()) {
    sender->cancel(m.reason);
    return;
  }
  fail_send(m.transfer_id, ErrorKind::ChannelLost, m.reason);
}

void RelayClient::handle_message(const TransferAbort& m) {
  inbox_.abort(m.transfer_id, m.reason);
}

void RelayClient::handle_message(const NameUpdated& m) {
  if(m.device.stable_id == options_.stable_id) {
    std::lock_guard lg(mutex_);
    options_.display_name = m.device.display_name;
  } else {
    upsert_device(m.device);
  }
  bus_.publish(Event{DeviceListUpdated{devices()}});
}

void RelayClient::handle_message(const ErrorMessage& m) {
  log_warn(logger_.get(), "Relay error: {}", m.message);
  bus_.publish(Event{PeerError{"relay", ErrorKind::Protocol, m.message}});
}

// ---------------------------------------------------------------------------
// TransferNode

std::string RelayClient::local_handle() const {
  std::lock_guard lg(mutex_);
  return handle_;
}

std::vector<Device> RelayClient::devices() const {
  std::lock_guard lg(mutex_);
  return devices_;
}

std::vector<Pairing> RelayClient::pairings() const {
  std::lock_guard lg(mutex_);
  return pairings_;
}

std::vector<PendingTransfer> RelayClient::pending() const {
  std::lock_guard lg(mutex_);
  return queued_;
}

bool RelayClient::request_pair(const std::string& handle) {
  return send_message(PairRequest{handle});
}

bool RelayClient::end_pairing(const std::string& pairing_id) {
  {
    std::lock_guard lg(mutex_);
    auto it = std::find_if(pairings_.begin(), pairings_.end(), [&](const Pairing& p){ return p.id == pairing_id; });
    if(it == pairings_.end()) return false;
  }
  return send_message(TerminateConnection{pairing_id});
}

void RelayClient::rename(const std::string& name) {
  {
    std::lock_guard lg(mutex_);
    options_.display_name = name;
  }
  send_message(DeviceNameUpdate{name});
}

std::string RelayClient::send(Transfer transfer) {
  if(transfer.meta.id.empty()) transfer.meta.id = random_id("xfer");
  const std::string id = transfer.meta.id;
  {
    std::lock_guard lg(mutex_);
    transfer.meta.from_device = options_.display_name;
  }

  if(transfer.meta.target.kind == TargetDescriptor::Kind::Local) {
    inbox_.save_local(transfer);
    return id;
  }
  if(!connected()) {
    fail_send(id, ErrorKind::ChannelLost, "not connected to relay");
    return id;
  }
  if(!transfer.payload) {
    fail_send(id, ErrorKind::Protocol, "transfer has no payload");
    return id;
  }
  transfer.meta.size = transfer.payload->size();
  {
    std::lock_guard lg(mutex_);
    outgoing_[id] = transfer;
  }

  if(!needs_chunking(transfer.meta.size, options_.limits)) {
    std::string bytes;
    try {
      bytes = transfer.payload->read_all();
    } catch(const std::exception& e) {
      fail_send(id, ErrorKind::Protocol, std::string("read failed: ") + e.what());
      return id;
    }
    log_info(logger_.get(), "Sending {} ({} bytes) to {}", transfer.meta.filename, bytes.size(),
             transfer.meta.target.to_string());
    auto self = shared_from_this();
    send_message(make_inline_transfer(transfer.meta, bytes), [self, id](bool ok){
      if(!ok) self->fail_send(id, ErrorKind::ChannelLost, "relay connection lost");
    });
    return id;
  }

  std::weak_ptr<RelayClient> weak = weak_from_this();
  auto writer = [weak](const json& frame, ChunkSender::WriteCallback cb) {
    auto self = weak.lock();
    std::shared_ptr<Connection> conn;
    if(self) {
      std::lock_guard lg(self->mutex_);
      conn = self->conn_;
    }
    if(!conn) {
      cb(false);
      return;
    }
    conn->async_send_json(frame, std::move(cb));
  };
  auto sender = ChunkSender::create(transfer, options_.limits, writer, &inbox_.progress(),
    [weak, id](const SendReport& report){
      auto self = weak.lock();
      if(!self) return;
      {
        std::lock_guard lg(self->mutex_);
        self->senders_.erase(id);
      }
      if(!report.completed) self->fail_send(id, ErrorKind::ChannelLost, report.error);
    },
    std::string(), logger_);
  {
    std::lock_guard lg(mutex_);
    senders_[id] = sender;
  }
  log_info(logger_.get(), "Streaming {} ({} bytes, {} frames) to {}", transfer.meta.filename, transfer.meta.size,
           sender->total_chunks(), transfer.meta.target.to_string());
  sender->start();
  return id;
}

// ---------------------------------------------------------------------------
// DiscoveryProvider

void RelayClient::discover(Listener listener) {
  std::vector<Device> current;
  {
    std::lock_guard lg(mutex_);
    discovery_listener_ = std::move(listener);
    current = devices_;
  }
  for(const auto& d : current) emit(DiscoveryEvent{DeviceAppeared{d, options_.relay_host, options_.relay_port}});
  start();
}

void RelayClient::connect(const std::string& handle) {
  request_pair(handle);
}

void RelayClient::disconnect(const std::string& handle) {
  for(const auto& p : pairings()) {
    if(p.involves(handle)) send_message(TerminateConnection{p.id});
  }
}
