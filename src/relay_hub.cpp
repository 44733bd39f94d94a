#include "relay_hub.hpp"
#include "utils.hpp"

#include <algorithm>

RelayHub::RelayHub(Outbox& outbox, Options options, std::shared_ptr<Logger> logger)
  : outbox_(outbox),
    options_(options),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("relay-hub")),
    bus_(logger_),
    registry_(&bus_, logger_),
    coordinator_(registry_, bus_, logger_),
    resolver_(registry_, coordinator_, logger_),
    progress_(&bus_),
    assembler_(&progress_, options.assembly_timeout, logger_) {
  coordinator_.set_auto_pair(options_.auto_pair);
  registry_.set_pairing_probe([this](const std::string& handle){ return coordinator_.has_active(handle); });
  subscription_ = bus_.subscribe([this](const Event& event){ on_event(event); });
}

RelayHub::~RelayHub() {
  bus_.unsubscribe(subscription_);
  std::vector<std::shared_ptr<ChunkSender>> senders;
  {
    std::lock_guard lg(state_mutex_);
    for(auto& [id, send] : hub_sends_) senders.push_back(send.sender);
    hub_sends_.clear();
  }
  for(auto& s : senders) s->cancel("relay shutting down");
}

// ---------------------------------------------------------------------------
// transport edges

void RelayHub::on_connected(const std::string& handle) {
  std::lock_guard lg(state_mutex_);
  connections_.insert(handle);
  log_debug(logger_.get(), "Connection {} opened ({} total)", handle, connections_.size());
  send(handle, SetupRequired{});
}

void RelayHub::on_message(const std::string& handle, const nlohmann::json& message) {
  std::lock_guard lg(state_mutex_);
  try {
    auto decoded = decode_message(message);
    if(auto* frame = std::get_if<ChunkFrame>(&decoded)) {
      handle_chunk(handle, *frame, message);
    } else {
      std::visit([&](const auto& m){ handle_message(handle, m); }, decoded);
    }
  } catch(const ProtocolError& e) {
    log_warn(logger_.get(), "Protocol error from {}: {}", handle, e.what());
    outbox_.send(handle, make_error(e.what()));
    bus_.publish(Event{PeerError{handle, ErrorKind::Protocol, e.what()}});
  }
}

void RelayHub::on_disconnected(const std::string& handle) {
  std::lock_guard lg(state_mutex_);
  if(!connections_.erase(handle)) return;
  log_info(logger_.get(), "Connection {} closed", handle);

  for(auto it = streams_.begin(); it != streams_.end();) {
    auto& [id, stream] = *it;
    if(stream.origin == handle) {
      for(const auto& r : stream.routes) {
        send(r.channel(), TransferAbort{id, "sender disconnected"});
      }
      assembler_.abort(id);
      bus_.publish(Event{TransferFailed{id, ErrorKind::ChannelLost, "sender disconnected"}});
      it = streams_.erase(it);
      continue;
    }
    auto lost = std::remove_if(stream.routes.begin(), stream.routes.end(),
                               [&](const Route& r){ return r.channel() == handle; });
    if(lost != stream.routes.end()) {
      stream.routes.erase(lost, stream.routes.end());
      send(stream.origin, TransferFailedMessage{id, "recipient disconnected"});
      if(stream.routes.empty()) stream.dropped = true;
    }
    ++it;
  }

  std::vector<std::shared_ptr<ChunkSender>> lost_sends;
  for(const auto& [id, hs] : hub_sends_) {
    if(hs.channel == handle) lost_sends.push_back(hs.sender);
  }
  for(auto& s : lost_sends) s->cancel("recipient disconnected");

  for(const auto& client : resolver_.detach_host(handle)) {
    log_debug(logger_.get(), "Relayed client {} left with host {}", client, handle);
  }
  registry_.mark_offline(handle);
}

void RelayHub::expire_assemblies(std::chrono::steady_clock::time_point now) {
  std::lock_guard lg(state_mutex_);
  for(const auto& id : assembler_.expire(now)) {
    auto it = streams_.find(id);
    if(it == streams_.end()) continue;
    send(it->second.origin, TransferFailedMessage{id, "chunk assembly timed out"});
    bus_.publish(Event{TransferFailed{id, ErrorKind::ChunkAssemblyTimeout, "chunk assembly timed out"}});
    streams_.erase(it);
  }
}

// ---------------------------------------------------------------------------
// bus

void RelayHub::on_event(const Event& event) {
  std::lock_guard lg(state_mutex_);
  std::visit(overloaded{
    [&](const RegistryChanged& e){ on_registry_changed(e); },
    [&](const PairingEstablished& e){ on_pairing_established(e); },
    [&](const PairingEnded& e){ on_pairing_ended(e); },
    [](const auto&){}
  }, event);
}

void RelayHub::on_registry_changed(const RegistryChanged& event) {
  using Change = RegistryChanged::Change;
  switch(event.change) {
    case Change::Registered:
      send(event.device.handle, DeviceListMessage{DeviceListMessage::Kind::SetupComplete, event.device, event.online});
      broadcast_online(DeviceListMessage{DeviceListMessage::Kind::Connected, event.device, event.online},
                       event.device.handle);
      break;
    case Change::Offline:
      broadcast_online(DeviceListMessage{DeviceListMessage::Kind::Disconnected, event.device, event.online});
      break;
    case Change::HandleReplaced:
      broadcast_online(DeviceListMessage{DeviceListMessage::Kind::Connected, event.device, event.online});
      break;
    case Change::Renamed:
      broadcast_online(NameUpdated{event.device});
      break;
  }
  coordinator_.on_registry_changed(event);
}

void RelayHub::on_pairing_established(const PairingEstablished& event) {
  const auto& p = event.pairing;
  const bool automatic = event.origin == PairOrigin::Automatic;
  for(const auto& side : {p.device_a, p.device_b}) {
    const auto& partner = p.partner_of(side);
    Device partner_device;
    if(auto d = registry_.find_by_handle(partner)) partner_device = *d;
    partner_device.handle = partner;
    send(side, PairAccepted{p, partner_device, automatic});
  }
  for(auto& flushed : resolver_.take_ready(p)) {
    deliver_flushed(std::move(flushed));
  }
}

void RelayHub::on_pairing_ended(const PairingEnded& event) {
  const auto& p = event.pairing;
  for(const auto& side : {p.device_a, p.device_b}) {
    send(side, ConnectionTerminated{p.id, event.terminated_by});
  }

  for(auto& [id, stream] : streams_) {
    auto cut = std::remove_if(stream.routes.begin(), stream.routes.end(),
                              [&](const Route& r){ return r.pairing_id == p.id; });
    if(cut == stream.routes.end()) continue;
    for(auto r = cut; r != stream.routes.end(); ++r) {
      send(r->channel(), TransferAbort{id, "pairing ended"});
    }
    stream.routes.erase(cut, stream.routes.end());
    send(stream.origin, TransferFailedMessage{id, "pairing ended"});
    if(stream.routes.empty()) stream.dropped = true;
  }

  std::vector<std::shared_ptr<ChunkSender>> cut_sends;
  for(const auto& [id, hs] : hub_sends_) {
    if(hs.pairing_id == p.id) cut_sends.push_back(hs.sender);
  }
  for(auto& s : cut_sends) s->cancel("pairing ended");
}

// ---------------------------------------------------------------------------
// messages

template<typename T>
void RelayHub::handle_message(const std::string& handle, const T& m) {
  (void)handle;
  throw ProtocolError("unexpected message '" + message_type(Message{m}) + "'");
}

Device RelayHub::require_device(const std::string& handle) const {
  auto device = registry_.find_by_handle(handle);
  if(!device || !device->online) throw ProtocolError("device-setup required");
  return *device;
}

void RelayHub::handle_message(const std::string& handle, const DeviceSetup& m) {
  std::string stable_id = m.stable_id.empty() ? random_id("dev") : m.stable_id;
  std::string name = trim(m.name);
  if(name.empty()) name = "Device " + handle;
  registry_.register_device(stable_id, name, handle);
}

void RelayHub::handle_message(const std::string& handle, const PairRequest& m) {
  require_device(handle);
  auto outcome = coordinator_.pair(handle, m.target_handle, PairOrigin::Requested);
  switch(outcome.status) {
    case PairOutcome::Status::Created:
      break;
    case PairOutcome::Status::AlreadyActive: {
      const auto& p = *outcome.pairing;
      Device partner;
      if(auto d = registry_.find_by_handle(p.partner_of(handle))) partner = *d;
      partner.handle = p.partner_of(handle);
      send(handle, PairAccepted{p, partner, false});
      break;
    }
    case PairOutcome::Status::Rejected:
      outbox_.send(handle, make_error(outcome.error));
      break;
  }
}

void RelayHub::handle_message(const std::string& handle, const TerminateConnection& m) {
  require_device(handle);
  auto pairing = coordinator_.find(m.pairing_id);
  if(!pairing || !pairing->involves(handle)) {
    throw ProtocolError("unknown pairing " + m.pairing_id);
  }
  coordinator_.terminate(m.pairing_id, handle, "requested");
}

void RelayHub::handle_message(const std::string& handle, const DeviceNameUpdate& m) {
  auto device = require_device(handle);
  const auto name = trim(m.name);
  if(name.empty()) throw ProtocolError("device name must not be empty");
  registry_.rename(device.stable_id, name);
}

void RelayHub::handle_message(const std::string& handle, const RelayDevices& m) {
  require_device(handle);
  std::vector<std::string> listed;
  for(const auto& d : m.devices) {
    if(!d.handle.empty()) listed.push_back(d.handle);
  }
  for(const auto& [client, host] : resolver_.relayed_clients()) {
    if(host == handle && std::find(listed.begin(), listed.end(), client) == listed.end()) {
      resolver_.detach_relayed_client(client);
    }
  }
  for(const auto& client : listed) {
    resolver_.attach_relayed_client(client, handle);
  }
  for(const auto& client : listed) {
    for(auto& flushed : resolver_.take_ready_relayed(client)) {
      deliver_flushed(std::move(flushed));
    }
  }
}

void RelayHub::handle_message(const std::string& handle, const FileReceivedAck& m) {
  log_debug(logger_.get(), "{} acknowledged {} ({})", handle, m.transfer_id, m.filename);
}

void RelayHub::handle_message(const std::string& handle, const ErrorMessage& m) {
  log_warn(logger_.get(), "{} reported: {}", handle, m.message);
}

void RelayHub::handle_message(const std::string& handle, const FileTransferMessage& m) {
  auto origin = require_device(handle);
  std::string bytes;
  try {
    bytes = decode_inline_content(m.content, m.encoding);
  } catch(const std::invalid_argument& e) {
    throw ProtocolError(std::string("bad file content: ") + e.what());
  }

  Transfer transfer;
  transfer.meta = m.meta;
  if(transfer.meta.id.empty()) transfer.meta.id = random_id("xfer");
  if(transfer.meta.filename.empty()) transfer.meta.filename = transfer.meta.original_name;
  if(transfer.meta.filename.empty()) throw ProtocolError("file-transfer without a filename");
  transfer.meta.size = bytes.size();
  transfer.meta.from_device = origin.display_name;
  transfer.payload = std::make_shared<MemoryPayload>(std::move(bytes));

  auto resolution = resolver_.resolve(handle, transfer);
  switch(resolution.outcome) {
    case Resolution::Outcome::DeliverNow: {
      for(const auto& route : resolution.routes) {
        deliver(transfer, route, origin.display_name, nullptr);
      }
      send(handle, FileSentConfirmation{transfer.meta.id, transfer.meta.filename,
                                        resolution.routes.size(), transfer.meta.is_clipboard});
      bus_.publish(Event{TransferSent{transfer.meta, resolution.routes.size()}});
      break;
    }
    case Resolution::Outcome::Queue:
      send(handle, FileQueued{transfer.meta.id, transfer.meta.filename, transfer.meta.target.handle});
      bus_.publish(Event{TransferQueued{transfer.meta, resolution.queue_key}});
      break;
    case Resolution::Outcome::SaveLocal:
      send(handle, FileSaved{transfer.meta.id, transfer.meta.filename});
      bus_.publish(Event{TransferSavedLocal{transfer.meta}});
      break;
  }
}

// ---------------------------------------------------------------------------
// chunk streams

void RelayHub::open_stream(const std::string& handle, const ChunkFrame& frame) {
  if(!frame.meta) throw ProtocolError("file-chunk for unknown transfer " + frame.transfer_id);
  auto origin = require_device(handle);

  Stream stream;
  stream.origin = handle;
  stream.origin_name = origin.display_name;
  stream.meta = *frame.meta;
  stream.meta.id = frame.transfer_id;
  stream.meta.size = frame.total_size;
  stream.meta.from_device = origin.display_name;
  stream.total_chunks = frame.total_chunks;

  auto resolution = resolver_.route(handle, stream.meta.target);
  stream.outcome = resolution.outcome;
  stream.routes = resolution.routes;
  log_info(logger_.get(), "Chunked transfer {} ({}, {} frames) from {} to {}: {}",
           frame.transfer_id, stream.meta.filename, frame.total_chunks, handle,
           stream.meta.target.to_string(), to_string(resolution.outcome));

  switch(resolution.outcome) {
    case Resolution::Outcome::DeliverNow:
      break;
    case Resolution::Outcome::Queue:
      // Held in memory until complete, then queued like an inline transfer.
      send(handle, FileQueued{frame.transfer_id, stream.meta.filename, stream.meta.target.handle});
      break;
    case Resolution::Outcome::SaveLocal:
      stream.dropped = true;
      send(handle, FileSaved{frame.transfer_id, stream.meta.filename});
      bus_.publish(Event{TransferSavedLocal{stream.meta}});
      break;
  }
  streams_.emplace(frame.transfer_id, std::move(stream));
}

void RelayHub::handle_chunk(const std::string& handle, const ChunkFrame& frame, const nlohmann::json& raw) {
  auto it = streams_.find(frame.transfer_id);
  if(it == streams_.end()) {
    open_stream(handle, frame);
    it = streams_.find(frame.transfer_id);
  }
  auto& stream = it->second;
  if(stream.origin != handle) {
    throw ProtocolError("file-chunk for " + frame.transfer_id + " from a different sender");
  }
  if(frame.total_chunks != stream.total_chunks) {
    throw ProtocolError("file-chunk totals changed for " + frame.transfer_id);
  }

  if(stream.outcome == Resolution::Outcome::Queue && !stream.dropped) {
    auto payload = assembler_.accept(handle, frame);
    if(payload) {
      Stream done = std::move(stream);
      streams_.erase(it);
      finish_queued_stream(handle, std::move(done), std::move(*payload));
    }
    return;
  }

  if(!stream.dropped) {
    for(const auto& route : stream.routes) {
      auto forwarded = raw;
      auto& data = forwarded["data"];
      if(route.via.empty()) {
        data.erase("relayTo");
      } else {
        data["relayTo"] = route.recipient;
      }
      if(data.contains("meta") && data["meta"].is_object()) {
        data["meta"]["fromDevice"] = stream.origin_name;
      }
      outbox_.send(route.channel(), forwarded);
    }
  }

  if(++stream.frames_seen < stream.total_chunks) return;

  if(!stream.dropped && stream.outcome == Resolution::Outcome::DeliverNow) {
    send(handle, FileSentConfirmation{frame.transfer_id, stream.meta.filename,
                                      stream.routes.size(), stream.meta.is_clipboard});
    bus_.publish(Event{TransferSent{stream.meta, stream.routes.size()}});
  }
  streams_.erase(it);
}

void RelayHub::finish_queued_stream(const std::string& handle, Stream stream, AssembledPayload payload) {
  Transfer transfer;
  transfer.meta = stream.meta;
  transfer.payload = std::make_shared<MemoryPayload>(std::move(payload.bytes));

  // The target may have become reachable while the stream was arriving.
  auto resolution = resolver_.resolve(handle, transfer);
  switch(resolution.outcome) {
    case Resolution::Outcome::DeliverNow: {
      const auto origin = registry_.find_by_handle(handle);
      const std::string origin_stable = origin ? origin->stable_id : std::string();
      auto remaining = std::make_shared<std::size_t>(resolution.routes.size());
      for(const auto& route : resolution.routes) {
        deliver(transfer, route, stream.origin_name,
                [this, remaining, origin_stable, meta = transfer.meta, count = resolution.routes.size()](bool) {
                  if(--*remaining == 0) notify_sent(origin_stable, meta, count);
                });
      }
      break;
    }
    case Resolution::Outcome::Queue:
      bus_.publish(Event{TransferQueued{transfer.meta, resolution.queue_key}});
      break;
    case Resolution::Outcome::SaveLocal:
      send(handle, FileSaved{transfer.meta.id, transfer.meta.filename});
      bus_.publish(Event{TransferSavedLocal{transfer.meta}});
      break;
  }
}

// ---------------------------------------------------------------------------
// delivery

void RelayHub::send(const std::string& handle, const Message& message, Outbox::WriteCallback on_written) {
  outbox_.send(handle, encode_message(message), std::move(on_written));
}

void RelayHub::broadcast_online(const Message& message, const std::string& except) {
  const auto encoded = encode_message(message);
  for(const auto& d : registry_.list_online()) {
    if(d.handle == except) continue;
    outbox_.send(d.handle, encoded);
  }
}

void RelayHub::deliver(const Transfer& transfer, const Route& route, const std::string& origin_name,
                       std::function<void(bool ok)> on_done) {
  const auto size = transfer.payload ? transfer.payload->size() : 0;
  if(needs_chunking(size, options_.limits)) {
    const std::string channel = route.channel();
    auto writer = [this, channel](const json& frame, ChunkSender::WriteCallback cb) {
      outbox_.send(channel, frame, std::move(cb));
    };
    Transfer outgoing = transfer;
    outgoing.meta.from_device = origin_name;
    const std::string id = transfer.meta.id;
    auto sender = ChunkSender::create(
      outgoing, options_.limits, writer, &progress_,
      [this, id, channel, on_done](const SendReport& report) {
        std::lock_guard lg(state_mutex_);
        hub_sends_.erase(id);
        if(!report.completed) {
          log_warn(logger_.get(), "Forwarding {} to {} failed: {}", id, channel, report.error);
          send(channel, TransferAbort{id, report.error});
        }
        if(on_done) on_done(report.completed);
      },
      route.via.empty() ? std::string() : route.recipient, logger_);
    hub_sends_[id] = HubSend{sender, channel, route.pairing_id};
    sender->start();
    return;
  }

  const std::string bytes = transfer.payload ? transfer.payload->read_all() : std::string();
  if(!route.via.empty()) {
    auto meta = transfer.meta;
    meta.target = TargetDescriptor::relayed(route.recipient);
    meta.from_device = origin_name;
    send(route.via, make_inline_transfer(meta, bytes));
  } else if(transfer.meta.is_clipboard) {
    send(route.recipient, ClipboardSync{transfer.meta.id, bytes, origin_name});
  } else {
    auto meta = transfer.meta;
    meta.direction = TransferDirection::Received;
    meta.from_device = origin_name;
    auto inline_msg = make_inline_transfer(meta, bytes);
    send(route.recipient, FileReceived{meta, inline_msg.content, inline_msg.encoding, origin_name});
  }
  if(on_done) on_done(true);
}

void RelayHub::deliver_flushed(FlushedTransfer flushed) {
  auto& pending = flushed.pending;
  std::string origin_name = pending.transfer.meta.from_device;
  if(auto origin = registry_.find_by_stable_id(pending.origin_stable_id)) {
    origin_name = origin->display_name;
  }
  log_info(logger_.get(), "Delivering queued {} to {}", pending.transfer.meta.id, flushed.route.recipient);
  auto meta = pending.transfer.meta;
  meta.direction = TransferDirection::Sent;
  deliver(pending.transfer, flushed.route, origin_name,
          [this, stable = pending.origin_stable_id, meta](bool ok) {
            if(ok) notify_sent(stable, meta, 1);
          });
}

void RelayHub::notify_sent(const std::string& origin_stable_id, const TransferMeta& meta, std::size_t recipients) {
  if(auto origin = registry_.find_by_stable_id(origin_stable_id)) {
    if(origin->online) {
      send(origin->handle, FileSentConfirmation{meta.id, meta.filename, recipients, meta.is_clipboard});
    }
  }
  auto sent = meta;
  sent.direction = TransferDirection::Sent;
  bus_.publish(Event{TransferSent{sent, recipients}});
}

// ---------------------------------------------------------------------------
// queries

std::vector<Device> RelayHub::online_devices() const {
  return registry_.list_online();
}

std::vector<Pairing> RelayHub::pairings() const {
  return coordinator_.active_pairings();
}

std::vector<PendingTransfer> RelayHub::pending() const {
  return resolver_.pending();
}

std::vector<std::pair<std::string, std::string>> RelayHub::relayed_clients() const {
  return resolver_.relayed_clients();
}

RelayHub::Stats RelayHub::stats() const {
  std::lock_guard lg(state_mutex_);
  Stats s;
  s.connections = connections_.size();
  s.online_devices = registry_.online_count();
  s.active_pairings = coordinator_.active_pairings().size();
  s.pending_transfers = resolver_.pending_count();
  s.streams_in_flight = streams_.size() + hub_sends_.size();
  return s;
}
