#include "direct_node.hpp"
#include "utils.hpp"

#include <algorithm>

using asio::ip::tcp;

std::shared_ptr<DirectNode> DirectNode::create(asio::io_context& io,
                                               Options options,
                                               std::shared_ptr<FileStore> files,
                                               std::shared_ptr<TransferStore> store,
                                               std::shared_ptr<Logger> logger) {
  auto node = std::shared_ptr<DirectNode>(new DirectNode(io, std::move(options), std::move(files),
                                                         std::move(store), std::move(logger)));
  std::weak_ptr<DirectNode> weak = node;
  node->subscription_ = node->bus_.subscribe([weak](const Event& event){
    if(auto self = weak.lock()) self->on_event(event);
  });
  return node;
}

DirectNode::DirectNode(asio::io_context& io, Options options, std::shared_ptr<FileStore> files,
                       std::shared_ptr<TransferStore> store, std::shared_ptr<Logger> logger)
  : io_(io),
    options_(std::move(options)),
    files_(std::move(files)),
    store_(std::move(store)),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("direct")),
    bus_(logger_),
    registry_(&bus_, logger_),
    coordinator_(registry_, bus_, logger_),
    resolver_(registry_, coordinator_, logger_),
    inbox_(bus_, *files_, store_, options_.limits, options_.assembly_timeout, logger_),
    sweep_timer_(io) {
  // Links pair explicitly; two online devices here means self plus one peer.
  coordinator_.set_auto_pair(false);
  registry_.set_pairing_probe([this](const std::string& handle){ return coordinator_.has_active(handle); });
}

DirectNode::~DirectNode() {
  bus_.unsubscribe(subscription_);
}

Device DirectNode::self_device() const {
  Device d;
  d.handle = kSelfHandle;
  d.stable_id = options_.stable_id;
  d.display_name = options_.display_name;
  d.online = true;
  d.last_seen = SystemClock::now();
  return d;
}

// ---------------------------------------------------------------------------
// lifecycle

void DirectNode::attach_discovery(std::shared_ptr<NetworkDiscovery> discovery) {
  {
    std::lock_guard lg(state_mutex_);
    discovery_ = std::move(discovery);
  }
  discovery_->set_dialer(weak_from_this());
  if(started_) {
    std::weak_ptr<DirectNode> weak = weak_from_this();
    discovery_->discover([weak](const DiscoveryEvent& ev){
      if(auto self = weak.lock()) self->on_discovery(ev);
    });
  }
}

void DirectNode::start() {
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

  registry_.register_device(options_.stable_id, options_.display_name, kSelfHandle);
  log_info(logger_.get(), "{} listening on {}:{}", options_.display_name, options_.listen_ip, bound_port_);

  do_accept();
  schedule_sweep();
  std::shared_ptr<NetworkDiscovery> discovery;
  {
    std::lock_guard lg(state_mutex_);
    discovery = discovery_;
  }
  if(discovery) {
    std::weak_ptr<DirectNode> weak = weak_from_this();
    discovery->discover([weak](const DiscoveryEvent& ev){
      if(auto self = weak.lock()) self->on_discovery(ev);
    });
  }
}

void DirectNode::stop() {
  if(!started_.exchange(false)) return;
  std::vector<std::shared_ptr<Connection>> open;
  std::shared_ptr<NetworkDiscovery> discovery;
  {
    std::lock_guard lg(state_mutex_);
    for(auto& [ptr, peer] : peers_) open.push_back(peer.conn);
    for(auto& [handle, timer] : redials_) timer->cancel();
    redials_.clear();
    discovery = discovery_;
  }
  if(discovery) discovery->stop();
  auto self = shared_from_this();
  asio::post(io_, [self]{
    std::error_code ec;
    self->sweep_timer_.cancel();
    if(self->acceptor_) self->acceptor_->close(ec);
  });
  for(auto& conn : open) conn->close();
  log_info(logger_.get(), "{} stopped", options_.display_name);
}

void DirectNode::do_accept() {
  if(!acceptor_) return;
  auto self = shared_from_this();
  acceptor_->async_accept([this, self](std::error_code ec, tcp::socket socket){
    if(ec) {
      if(ec != asio::error::operation_aborted) {
        log_error(logger_.get(), "Accept error: {}", ec.message());
      }
    } else {
      auto conn = Connection::create(std::move(socket), weak_from_this(), logger_);
      {
        std::lock_guard lg(state_mutex_);
        Peer peer;
        peer.conn = conn;
        peers_[conn.get()] = peer;
      }
      log_debug(logger_.get(), "Accepted connection from {}:{}", conn->remote_address(), conn->remote_port());
      conn->start();
      // Thin clients wait for this; peers ignore it.
      conn->async_send_json(encode_message(SetupRequired{}));
    }
    if(started_) do_accept();
  });
}

void DirectNode::schedule_sweep() {
  sweep_timer_.expires_after(options_.sweep_interval);
  auto self = shared_from_this();
  sweep_timer_.async_wait([self](const std::error_code& ec){
    if(ec || !self->started_) return;
    self->inbox_.expire();
    self->schedule_sweep();
  });
}

// ---------------------------------------------------------------------------
// links

void DirectNode::dial(const std::string& handle, const std::string& host, uint16_t port) {
  auto self = shared_from_this();
  asio::post(io_, [self, handle, host, port]{
    {
      std::lock_guard lg(self->state_mutex_);
      if(!self->started_ || self->links_.count(handle) || self->dialing_.count(handle)) return;
      for(const auto& [ptr, peer] : self->peers_) {
        if(peer.kind == PeerKind::Link && peer.dialed_as == handle) return;
      }
      self->dialing_.insert(handle);
    }
    log_debug(self->logger_.get(), "Dialing {} ({}:{})", handle, host, port);
    Connection::connect_outgoing(self->io_, host, port, self->weak_from_this(),
      [self, handle](std::shared_ptr<Connection> conn){
        std::lock_guard lg(self->state_mutex_);
        self->dialing_.erase(handle);
        Peer peer;
        peer.conn = conn;
        peer.outgoing = true;
        peer.dialed_as = handle;
        self->peers_[conn.get()] = peer;
        conn->set_handle(handle);
        conn->async_send_json(encode_message(PeerHandshake{self->options_.stable_id, self->options_.display_name,
                                                           self->bound_port_, false}));
      },
      [self, handle](const std::string&){
        {
          std::lock_guard lg(self->state_mutex_);
          self->dialing_.erase(handle);
        }
        self->schedule_redial(handle);
      },
      self->logger_);
  });
}

void DirectNode::hang_up(const std::string& handle) {
  if(auto conn = connection_for(handle)) conn->close();
}

void DirectNode::schedule_redial(const std::string& handle) {
  std::shared_ptr<NetworkDiscovery> discovery;
  {
    std::lock_guard lg(state_mutex_);
    discovery = discovery_;
    if(!started_ || !discovery || redials_.count(handle)) return;
  }
  if(!discovery->auto_connect() || !discovery->lookup(handle)) return;

  auto timer = std::make_shared<asio::steady_timer>(io_);
  {
    std::lock_guard lg(state_mutex_);
    redials_[handle] = timer;
  }
  timer->expires_after(options_.reconnect_delay);
  std::weak_ptr<DirectNode> weak = weak_from_this();
  timer->async_wait([weak, handle](const std::error_code& ec){
    auto self = weak.lock();
    if(!self) return;
    std::shared_ptr<NetworkDiscovery> discovery;
    {
      std::lock_guard lg(self->state_mutex_);
      self->redials_.erase(handle);
      discovery = self->discovery_;
    }
    if(ec || !self->started_ || !discovery) return;
    if(auto known = discovery->lookup(handle)) {
      self->dial(handle, known->host, known->port);
    }
  });
}

DirectNode::Peer* DirectNode::find_peer(const Connection* conn) {
  auto it = peers_.find(conn);
  return it == peers_.end() ? nullptr : &it->second;
}

DirectNode::Peer* DirectNode::find_link_by_stable_id(const std::string& stable_id) {
  for(auto& [ptr, peer] : peers_) {
    if(peer.kind == PeerKind::Link && peer.stable_id == stable_id) return &peer;
  }
  return nullptr;
}

std::shared_ptr<Connection> DirectNode::connection_for(const std::string& handle) const {
  std::lock_guard lg(state_mutex_);
  auto it = links_.find(handle);
  if(it != links_.end()) return it->second;
  it = clients_.find(handle);
  if(it != clients_.end()) return it->second;
  return nullptr;
}

bool DirectNode::send_to(const std::string& handle, const Message& message, Connection::WriteCallback on_written) {
  auto conn = connection_for(handle);
  if(!conn) {
    if(on_written) on_written(false);
    return false;
  }
  conn->async_send_json(encode_message(message), std::move(on_written));
  return true;
}

bool DirectNode::linked(const std::string& handle) const {
  std::lock_guard lg(state_mutex_);
  return links_.count(handle) > 0;
}

void DirectNode::on_message(const std::shared_ptr<Connection>& conn, const nlohmann::json& message) {
  std::lock_guard lg(state_mutex_);
  Peer* peer = find_peer(conn.get());
  if(!peer || peer->kind == PeerKind::Dropped) return;
  try {
    auto decoded = decode_message(message);
    switch(peer->kind) {
      case PeerKind::Pending:
        if(auto* hs = std::get_if<PeerHandshake>(&decoded)) {
          on_handshake(*peer, *hs);
        } else if(auto* setup = std::get_if<DeviceSetup>(&decoded)) {
          on_client_setup(*peer, *setup);
        } else if(!std::holds_alternative<SetupRequired>(decoded)) {
          throw ProtocolError("handshake required before '" + message_type(decoded) + "'");
        }
        break;
      case PeerKind::Link:
        handle_link_message(*peer, decoded, message);
        break;
      case PeerKind::Client:
        handle_client_message(*peer, decoded);
        break;
      case PeerKind::Dropped:
        break;
    }
  } catch(const ProtocolError& e) {
    const auto who = conn->handle().empty() ? conn->remote_address() : conn->handle();
    log_warn(logger_.get(), "Protocol error from {}: {}", who, e.what());
    conn->async_send_json(make_error(e.what()));
    bus_.publish(Event{PeerError{who, ErrorKind::Protocol, e.what()}});
  }
}

void DirectNode::on_handshake(Peer& peer, const PeerHandshake& m) {
  if(m.id.empty()) throw ProtocolError("peer-handshake without an id");
  if(m.ack != peer.outgoing) throw ProtocolError("unexpected peer-handshake");
  if(m.id == options_.stable_id) {
    log_debug(logger_.get(), "Dropping connection to self");
    peer.kind = PeerKind::Dropped;
    peer.conn->close();
    return;
  }
  const std::string handle = peer.outgoing
    ? peer.dialed_as
    : NetworkDiscovery::make_handle(peer.conn->remote_address(), m.port);
  const std::string initiator = peer.outgoing ? options_.stable_id : m.id;

  // Two links to one device: the one dialed by the smaller stable id wins.
  if(Peer* existing = find_link_by_stable_id(m.id)) {
    const std::string& preferred = std::min(options_.stable_id, m.id);
    if(existing->initiator == preferred && initiator != preferred) {
      log_info(logger_.get(), "Duplicate link to {}; keeping {}", m.name, existing->handle);
      peer.kind = PeerKind::Dropped;
      peer.conn->close();
      return;
    }
    log_info(logger_.get(), "Duplicate link to {}; replacing {} with {}", m.name, existing->handle, handle);
    const std::string old_handle = existing->handle;
    auto old_conn = existing->conn;
    existing->kind = PeerKind::Dropped;
    old_conn->close();
    if(!peer.outgoing) {
      peer.conn->async_send_json(encode_message(PeerHandshake{options_.stable_id, options_.display_name,
                                                              bound_port_, true}));
    }
    establish_link(peer, m, handle);
    if(old_handle != handle) {
      teardown_link(old_handle, "replaced by a newer link");
    }
    return;
  }

  if(!peer.outgoing) {
    peer.conn->async_send_json(encode_message(PeerHandshake{options_.stable_id, options_.display_name,
                                                            bound_port_, true}));
  }
  establish_link(peer, m, handle);
}

void DirectNode::establish_link(Peer& peer, const PeerHandshake& m, const std::string& handle) {
  peer.kind = PeerKind::Link;
  peer.handle = handle;
  peer.stable_id = m.id;
  peer.name = m.name.empty() ? handle : m.name;
  peer.initiator = peer.outgoing ? options_.stable_id : m.id;
  peer.conn->set_handle(handle);
  links_[handle] = peer.conn;
  log_info(logger_.get(), "Linked with {} ({}) at {}", peer.name, m.id, handle);

  registry_.register_device(m.id, peer.name, handle);
  coordinator_.pair(kSelfHandle, handle, PairOrigin::Link);
}

void DirectNode::teardown_link(const std::string& handle, const std::string& reason) {
  auto it = links_.find(handle);
  if(it != links_.end()) links_.erase(it);

  inbox_.abort_from(handle, reason);
  std::vector<std::shared_ptr<ChunkSender>> cut;
  for(const auto& [key, out] : outgoing_) {
    if(out.channel == handle) cut.push_back(out.sender);
  }
  for(auto& s : cut) s->cancel(reason);

  for(auto rs = relayed_streams_.begin(); rs != relayed_streams_.end();) {
    if(rs->second.origin == handle) {
      send_to(rs->second.client, TransferAbort{rs->first, reason});
      rs = relayed_streams_.erase(rs);
    } else {
      ++rs;
    }
  }
  resolver_.detach_host(handle);
  remote_clients_.erase(handle);
  registry_.mark_offline(handle);
}

void DirectNode::on_closed(const std::shared_ptr<Connection>& conn) {
  std::string redial;
  {
    std::lock_guard lg(state_mutex_);
    auto it = peers_.find(conn.get());
    if(it == peers_.end()) return;
    Peer peer = it->second;
    peers_.erase(it);
    switch(peer.kind) {
      case PeerKind::Pending:
        if(peer.outgoing) redial = peer.dialed_as;
        break;
      case PeerKind::Link: {
        auto link = links_.find(peer.handle);
        if(link != links_.end() && link->second == conn) {
          log_info(logger_.get(), "Link to {} ({}) closed", peer.name, peer.handle);
          teardown_link(peer.handle, "link closed");
          redial = peer.dialed_as.empty() ? peer.handle : peer.dialed_as;
        }
        break;
      }
      case PeerKind::Client:
        drop_client(peer);
        break;
      case PeerKind::Dropped:
        break;
    }
  }
  if(!redial.empty()) schedule_redial(redial);
}

void DirectNode::on_discovery(const DiscoveryEvent& event) {
  std::visit(overloaded{
    [&](const DeviceAppeared& e){
      log_debug(logger_.get(), "{} appeared at {}", e.device.display_name, e.device.handle);
    },
    [&](const DeviceLost& e){
      std::vector<std::shared_ptr<Connection>> doomed;
      {
        std::lock_guard lg(state_mutex_);
        for(const auto& [ptr, peer] : peers_) {
          if(peer.kind == PeerKind::Link && (peer.handle == e.handle || peer.dialed_as == e.handle)) {
            doomed.push_back(peer.conn);
          }
        }
      }
      for(auto& c : doomed) {
        log_info(logger_.get(), "{} lost ({}); closing link", e.handle, e.reason);
        c->close();
      }
    }
  }, event);
}

// ---------------------------------------------------------------------------
// hosted clients

void DirectNode::on_client_setup(Peer& peer, const DeviceSetup& m) {
  peer.kind = PeerKind::Client;
  peer.handle = random_id("rc");
  peer.stable_id = m.stable_id;
  peer.name = trim(m.name).empty() ? "Client " + peer.handle.substr(3, 6) : trim(m.name);
  peer.conn->set_handle(peer.handle);
  clients_[peer.handle] = peer.conn;

  Device device;
  device.handle = peer.handle;
  device.stable_id = m.stable_id;
  device.display_name = peer.name;
  device.online = true;
  device.last_seen = SystemClock::now();
  hosted_[peer.handle] = device;
  resolver_.attach_relayed_client(peer.handle, kSelfHandle);
  log_info(logger_.get(), "Hosting client {} as {}", peer.name, peer.handle);

  const auto self = self_device();
  send_to(peer.handle, DeviceListMessage{DeviceListMessage::Kind::SetupComplete, device, {self, device}});
  Pairing host_pairing;
  host_pairing.id = random_id("pair");
  host_pairing.device_a = kSelfHandle;
  host_pairing.device_b = peer.handle;
  host_pairing.status = PairingStatus::Active;
  host_pairing.created_at = SystemClock::now();
  send_to(peer.handle, PairAccepted{host_pairing, self, true});

  announce_clients();
  for(auto& flushed : resolver_.take_ready_relayed(peer.handle)) {
    deliver_all(flushed.pending.transfer, {flushed.route});
  }
}

void DirectNode::drop_client(const Peer& peer) {
  log_info(logger_.get(), "Hosted client {} ({}) left", peer.name, peer.handle);
  clients_.erase(peer.handle);
  hosted_.erase(peer.handle);
  resolver_.detach_relayed_client(peer.handle);
  inbox_.abort_from(peer.handle, "client disconnected");
  for(auto rs = relayed_streams_.begin(); rs != relayed_streams_.end();) {
    if(rs->second.client == peer.handle) {
      send_to(rs->second.origin, TransferFailedMessage{rs->first, "relayed client disconnected"});
      rs = relayed_streams_.erase(rs);
    } else {
      ++rs;
    }
  }
  std::vector<std::shared_ptr<ChunkSender>> cut;
  for(const auto& [key, out] : outgoing_) {
    if(out.channel == peer.handle) cut.push_back(out.sender);
  }
  for(auto& s : cut) s->cancel("client disconnected");
  announce_clients();
}

void DirectNode::announce_clients() {
  RelayDevices announce;
  for(const auto& [handle, device] : hosted_) announce.devices.push_back(device);
  const auto encoded = encode_message(announce);
  for(const auto& [handle, conn] : links_) conn->async_send_json(encoded);
}

void DirectNode::handle_client_message(Peer& peer, const Message& message) {
  std::visit(overloaded{
    [&](const FileTransferMessage& m){
      std::string bytes;
      try {
        bytes = decode_inline_content(m.content, m.encoding);
      } catch(const std::invalid_argument& e) {
        throw ProtocolError(std::string("bad file content: ") + e.what());
      }
      auto meta = m.meta;
      if(meta.id.empty()) meta.id = random_id("xfer");
      meta.from_device = peer.name;
      inbox_.accept_inline(meta, bytes);
      send_to(peer.handle, FileSentConfirmation{meta.id, meta.filename, 1, meta.is_clipboard});
    },
    [&](const ChunkFrame& m){
      if(auto done = inbox_.accept_chunk(peer.handle, m)) {
        send_to(peer.handle, FileSentConfirmation{done->id, done->filename, 1, done->is_clipboard});
      }
    },
    [&](const DeviceNameUpdate& m){
      const auto name = trim(m.name);
      if(name.empty()) throw ProtocolError("device name must not be empty");
      peer.name = name;
      auto& device = hosted_[peer.handle];
      device.display_name = name;
      send_to(peer.handle, NameUpdated{device});
      announce_clients();
    },
    [&](const DeviceSetup& m){
      if(!trim(m.name).empty()) {
        peer.name = trim(m.name);
        hosted_[peer.handle].display_name = peer.name;
        announce_clients();
      }
    },
    [&](const TransferAbort& m){ inbox_.abort(m.transfer_id, m.reason); },
    [&](const FileReceivedAck& m){ log_debug(logger_.get(), "{} acknowledged {}", peer.handle, m.filename); },
    [&](const ErrorMessage& m){ log_warn(logger_.get(), "{} reported: {}", peer.handle, m.message); },
    [&](const auto& m){
      throw ProtocolError("'" + message_type(Message{m}) + "' is not supported by a host peer");
    }
  }, message);
}

// ---------------------------------------------------------------------------
// link messages

void DirectNode::handle_link_message(Peer& peer, const Message& message, const nlohmann::json& raw) {
  const std::string h = peer.handle;
  std::visit(overloaded{
    [&](const FileReceived& m){
      std::string bytes;
      try {
        bytes = decode_inline_content(m.content, m.encoding);
      } catch(const std::invalid_argument& e) {
        throw ProtocolError(std::string("bad file content: ") + e.what());
      }
      auto meta = m.meta;
      meta.from_device = m.from_device.empty() ? peer.name : m.from_device;
      inbox_.accept_inline(meta, bytes);
      send_to(h, FileReceivedAck{meta.id, meta.filename});
    },
    [&](const ClipboardSync& m){
      TransferMeta meta;
      meta.id = m.transfer_id.empty() ? random_id("xfer") : m.transfer_id;
      meta.filename = "clipboard.txt";
      meta.original_name = meta.filename;
      meta.mime_type = "text/plain";
      meta.is_clipboard = true;
      meta.from_device = m.from_device.empty() ? peer.name : m.from_device;
      inbox_.accept_inline(meta, m.content);
    },
    [&](const ChunkFrame& m){
      if(!m.relay_to.empty()) {
        forward_to_client(h, m, raw);
      } else if(auto done = inbox_.accept_chunk(h, m)) {
        send_to(h, FileReceivedAck{done->id, done->filename});
      }
    },
    [&](const FileTransferMessage& m){
      std::string bytes;
      try {
        bytes = decode_inline_content(m.content, m.encoding);
      } catch(const std::invalid_argument& e) {
        throw ProtocolError(std::string("bad file content: ") + e.what());
      }
      auto meta = m.meta;
      if(meta.from_device.empty()) meta.from_device = peer.name;
      if(meta.target.kind == TargetDescriptor::Kind::RelayedClient) {
        if(!clients_.count(meta.target.handle)) {
          send_to(h, TransferFailedMessage{meta.id, "relayed client " + meta.target.handle + " is gone"});
          return;
        }
        deliver_inline_to_client(meta.target.handle, meta, bytes);
        return;
      }
      inbox_.accept_inline(meta, bytes);
      send_to(h, FileReceivedAck{meta.id, meta.filename});
    },
    [&](const TransferAbort& m){
      auto rs = relayed_streams_.find(m.transfer_id);
      if(rs != relayed_streams_.end()) {
        send_to(rs->second.client, m);
        relayed_streams_.erase(rs);
        return;
      }
      inbox_.abort(m.transfer_id, m.reason);
    },
    [&](const TransferFailedMessage& m){
      log_warn(logger_.get(), "{} reports transfer {} failed: {}", h, m.transfer_id, m.reason);
      bus_.publish(Event{TransferFailed{m.transfer_id, ErrorKind::ChannelLost, m.reason}});
    },
    [&](const RelayDevices& m){
      for(const auto& [client, host] : resolver_.relayed_clients()) {
        if(host == h) resolver_.detach_relayed_client(client);
      }
      std::vector<Device> clients;
      for(const auto& d : m.devices) {
        if(d.handle.empty()) continue;
        resolver_.attach_relayed_client(d.handle, h);
        clients.push_back(d);
      }
      remote_clients_[h] = clients;
      for(const auto& d : clients) {
        for(auto& flushed : resolver_.take_ready_relayed(d.handle)) {
          deliver_all(flushed.pending.transfer, {flushed.route});
        }
      }
      bus_.publish(Event{DeviceListUpdated{devices()}});
    },
    [&](const ConnectionTerminated&){
      if(auto p = coordinator_.active_between(kSelfHandle, h)) {
        coordinator_.terminate(p->id, h, "ended by peer");
      }
    },
    [&](const PairAccepted&){
      coordinator_.pair(kSelfHandle, h, PairOrigin::Link);
    },
    [&](const NameUpdated& m){
      peer.name = m.device.display_name;
      registry_.rename(peer.stable_id, m.device.display_name);
    },
    [&](const FileReceivedAck& m){ log_debug(logger_.get(), "{} acknowledged {}", h, m.filename); },
    [&](const ErrorMessage& m){ log_warn(logger_.get(), "{} reported: {}", h, m.message); },
    [&](const PeerHandshake&){ log_debug(logger_.get(), "Repeated handshake from {}", h); },
    [&](const SetupRequired&){},
    [&](const auto& m){
      throw ProtocolError("unexpected '" + message_type(Message{m}) + "' on a peer link");
    }
  }, message);
}

void DirectNode::forward_to_client(const std::string& origin, const ChunkFrame& frame, const nlohmann::json& raw) {
  auto client = clients_.find(frame.relay_to);
  if(client == clients_.end()) {
    if(frame.index == 0 || relayed_streams_.count(frame.transfer_id)) {
      send_to(origin, TransferFailedMessage{frame.transfer_id, "relayed client " + frame.relay_to + " is gone"});
      relayed_streams_.erase(frame.transfer_id);
    }
    return;
  }
  auto forwarded = raw;
  forwarded["data"].erase("relayTo");
  client->second->async_send_json(forwarded);
  if(frame.index + 1 >= frame.total_chunks) {
    relayed_streams_.erase(frame.transfer_id);
  } else {
    relayed_streams_[frame.transfer_id] = RelayedStream{frame.relay_to, origin};
  }
}

void DirectNode::deliver_inline_to_client(const std::string& client, const TransferMeta& meta, const std::string& bytes) {
  if(meta.is_clipboard) {
    send_to(client, ClipboardSync{meta.id, bytes, meta.from_device});
    return;
  }
  auto received = meta;
  received.direction = TransferDirection::Received;
  auto inline_msg = make_inline_transfer(received, bytes);
  send_to(client, FileReceived{received, inline_msg.content, inline_msg.encoding, meta.from_device});
}

// ---------------------------------------------------------------------------
// bus

void DirectNode::on_event(const Event& event) {
  std::lock_guard lg(state_mutex_);
  std::visit(overloaded{
    [&](const RegistryChanged& e){
      coordinator_.on_registry_changed(e);
      bus_.publish(Event{DeviceListUpdated{devices()}});
    },
    [&](const PairingEstablished& e){
      const auto& partner = e.pairing.partner_of(kSelfHandle);
      RelayDevices announce;
      for(const auto& [handle, device] : hosted_) announce.devices.push_back(device);
      send_to(partner, announce);
      for(auto& flushed : resolver_.take_ready(e.pairing)) {
        deliver_all(flushed.pending.transfer, {flushed.route});
      }
    },
    [&](const PairingEnded& e){
      std::vector<std::shared_ptr<ChunkSender>> cut;
      for(const auto& [key, out] : outgoing_) {
        if(out.pairing_id == e.pairing.id) cut.push_back(out.sender);
      }
      for(auto& s : cut) s->cancel("pairing ended");
      if(e.terminated_by == kSelfHandle) {
        send_to(e.pairing.partner_of(kSelfHandle), ConnectionTerminated{e.pairing.id, options_.stable_id});
      }
    },
    [](const auto&){}
  }, event);
}

// ---------------------------------------------------------------------------
// sending

std::string DirectNode::send(Transfer transfer) {
  if(transfer.meta.id.empty()) transfer.meta.id = random_id("xfer");
  const std::string id = transfer.meta.id;
  std::lock_guard lg(state_mutex_);
  transfer.meta.from_device = options_.display_name;

  if(transfer.meta.target.kind == TargetDescriptor::Kind::Local) {
    inbox_.save_local(transfer);
    return id;
  }
  if(!transfer.payload) {
    bus_.publish(Event{TransferFailed{id, ErrorKind::Protocol, "transfer has no payload"}});
    return id;
  }
  transfer.meta.size = transfer.payload->size();

  auto resolution = resolver_.resolve(kSelfHandle, transfer);
  switch(resolution.outcome) {
    case Resolution::Outcome::DeliverNow:
      deliver_all(transfer, resolution.routes);
      break;
    case Resolution::Outcome::Queue: {
      auto meta = transfer.meta;
      meta.direction = TransferDirection::Queued;
      inbox_.record_sent(transfer, TransferDirection::Queued);
      bus_.publish(Event{TransferQueued{meta, resolution.queue_key}});
      break;
    }
    case Resolution::Outcome::SaveLocal:
      inbox_.save_local(transfer);
      break;
  }
  return id;
}

void DirectNode::deliver_all(const Transfer& transfer, const std::vector<Route>& routes) {
  struct Tally {
    std::size_t remaining = 0;
    std::size_t delivered = 0;
  };
  auto tally = std::make_shared<Tally>();
  tally->remaining = routes.size();
  std::weak_ptr<DirectNode> weak = weak_from_this();
  for(const auto& route : routes) {
    deliver(transfer, route, [weak, tally, transfer](bool ok){
      auto self = weak.lock();
      if(!self) return;
      std::lock_guard lg(self->state_mutex_);
      if(ok) ++tally->delivered;
      if(--tally->remaining > 0) return;
      auto meta = transfer.meta;
      if(tally->delivered == 0) {
        log_warn(self->logger_.get(), "Transfer {} reached no recipient", meta.id);
        self->bus_.publish(Event{TransferFailed{meta.id, ErrorKind::ChannelLost, "no recipient reachable"}});
        return;
      }
      meta.direction = TransferDirection::Sent;
      self->inbox_.record_sent(transfer, TransferDirection::Sent);
      self->bus_.publish(Event{TransferSent{meta, tally->delivered}});
    });
  }
}

void DirectNode::deliver(const Transfer& transfer, const Route& route, std::function<void(bool ok)> done) {
  const std::string channel = route.channel();
  const auto size = transfer.payload ? transfer.payload->size() : 0;
  std::weak_ptr<DirectNode> weak = weak_from_this();

  if(needs_chunking(size, options_.limits)) {
    const std::string key = transfer.meta.id + "@" + channel;
    auto writer = [weak, channel](const json& frame, ChunkSender::WriteCallback cb) {
      auto self = weak.lock();
      auto conn = self ? self->connection_for(channel) : nullptr;
      if(!conn) {
        cb(false);
        return;
      }
      conn->async_send_json(frame, std::move(cb));
    };
    auto sender = ChunkSender::create(transfer, options_.limits, writer, &inbox_.progress(),
      [weak, key, done](const SendReport& report){
        if(auto self = weak.lock()) {
          std::lock_guard lg(self->state_mutex_);
          self->outgoing_.erase(key);
          if(!report.completed) {
            log_warn(self->logger_.get(), "Chunked send {} stopped: {}", report.transfer_id, report.error);
          }
        }
        done(report.completed);
      },
      route.via.empty() ? std::string() : route.recipient, logger_);
    outgoing_[key] = Outgoing{sender, channel, route.pairing_id};
    log_info(logger_.get(), "Streaming {} to {} in {} frames", transfer.meta.filename, route.recipient,
             sender->total_chunks());
    sender->start();
    return;
  }

  std::string bytes;
  try {
    bytes = transfer.payload ? transfer.payload->read_all() : std::string();
  } catch(const std::exception& e) {
    log_error(logger_.get(), "Reading {} failed: {}", transfer.meta.filename, e.what());
    done(false);
    return;
  }
  auto on_written = [done](bool ok){ done(ok); };

  if(!route.via.empty()) {
    auto meta = transfer.meta;
    meta.target = TargetDescriptor::relayed(route.recipient);
    send_to(route.via, make_inline_transfer(meta, bytes), on_written);
  } else if(transfer.meta.is_clipboard) {
    send_to(route.recipient, ClipboardSync{transfer.meta.id, bytes, transfer.meta.from_device}, on_written);
  } else {
    auto meta = transfer.meta;
    meta.direction = TransferDirection::Received;
    auto inline_msg = make_inline_transfer(meta, bytes);
    send_to(route.recipient, FileReceived{meta, inline_msg.content, inline_msg.encoding, meta.from_device},
            on_written);
  }
}

// ---------------------------------------------------------------------------
// queries and commands

std::vector<Device> DirectNode::devices() const {
  std::vector<Device> out;
  for(auto& d : registry_.list_online()) {
    if(d.handle != kSelfHandle) out.push_back(std::move(d));
  }
  return out;
}

std::vector<Device> DirectNode::relayed_clients() const {
  std::lock_guard lg(state_mutex_);
  std::vector<Device> out;
  for(const auto& [handle, device] : hosted_) out.push_back(device);
  for(const auto& [host, clients] : remote_clients_) {
    out.insert(out.end(), clients.begin(), clients.end());
  }
  return out;
}

std::vector<Pairing> DirectNode::pairings() const {
  return coordinator_.active_pairings();
}

std::vector<PendingTransfer> DirectNode::pending() const {
  return resolver_.pending();
}

bool DirectNode::request_pair(const std::string& handle) {
  std::shared_ptr<NetworkDiscovery> discovery;
  {
    std::lock_guard lg(state_mutex_);
    if(links_.count(handle)) {
      auto outcome = coordinator_.pair(kSelfHandle, handle, PairOrigin::Requested);
      if(outcome.status == PairOutcome::Status::Created) {
        send_to(handle, PairAccepted{*outcome.pairing, self_device(), false});
      }
      return outcome.ok();
    }
    discovery = discovery_;
  }
  if(!discovery) return false;
  discovery->connect(handle);
  return true;
}

bool DirectNode::end_pairing(const std::string& pairing_id) {
  std::lock_guard lg(state_mutex_);
  return coordinator_.terminate(pairing_id, kSelfHandle, "requested").has_value();
}

void DirectNode::rename(const std::string& name) {
  std::shared_ptr<NetworkDiscovery> discovery;
  {
    std::lock_guard lg(state_mutex_);
    options_.display_name = name;
    registry_.rename(options_.stable_id, name);
    const auto encoded = encode_message(NameUpdated{self_device()});
    for(const auto& [handle, conn] : links_) conn->async_send_json(encoded);
    for(const auto& [handle, conn] : clients_) conn->async_send_json(encoded);
    discovery = discovery_;
  }
  if(discovery) discovery->set_display_name(name);
}

DirectNode::Stats DirectNode::stats() const {
  std::lock_guard lg(state_mutex_);
  Stats s;
  s.links = links_.size();
  s.clients = clients_.size();
  s.pairings = coordinator_.active_pairings().size();
  s.pending = resolver_.pending_count();
  s.sending = outgoing_.size();
  s.receiving = inbox_.receiving_count();
  return s;
}
