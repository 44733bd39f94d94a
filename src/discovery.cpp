#include "discovery.hpp"
#include "utils.hpp"

NetworkDiscovery::NetworkDiscovery(bool auto_connect, std::shared_ptr<Logger> logger)
  : logger_(std::move(logger)), auto_connect_(auto_connect) {}

std::string NetworkDiscovery::make_handle(const std::string& host, uint16_t port) {
  return host + ":" + std::to_string(port);
}

void NetworkDiscovery::set_dialer(std::weak_ptr<LinkDialer> dialer) {
  std::lock_guard lg(mutex_);
  dialer_ = std::move(dialer);
}

std::shared_ptr<LinkDialer> NetworkDiscovery::dialer() const {
  std::lock_guard lg(mutex_);
  return dialer_.lock();
}

void NetworkDiscovery::set_listener(Listener listener) {
  std::lock_guard lg(mutex_);
  listener_ = std::move(listener);
}

void NetworkDiscovery::emit(const DiscoveryEvent& event) {
  Listener listener;
  {
    std::lock_guard lg(mutex_);
    listener = listener_;
  }
  if(listener) listener(event);
}

void NetworkDiscovery::appeared(DeviceAppeared event) {
  const auto handle = event.device.handle;
  bool first = false;
  {
    std::lock_guard lg(mutex_);
    auto it = peers_.find(handle);
    if(it == peers_.end()) {
      first = true;
      peers_.emplace(handle, Entry{event, Clock::now()});
    } else {
      if(it->second.event.device.stable_id != event.device.stable_id ||
         it->second.event.device.display_name != event.device.display_name) {
        first = true;
      }
      it->second.event = event;
      it->second.last_seen = Clock::now();
    }
  }
  if(!first) return;

  log_info(logger_.get(), "Discovered {} at {}", event.device.display_name, handle);
  emit(DiscoveryEvent{event});
  if(auto_connect_) {
    if(auto d = dialer()) d->dial(handle, event.host, event.port);
  }
}

void NetworkDiscovery::lost(const std::string& handle, const std::string& reason) {
  {
    std::lock_guard lg(mutex_);
    if(!peers_.erase(handle)) return;
  }
  log_info(logger_.get(), "Lost {} ({})", handle, reason);
  emit(DiscoveryEvent{DeviceLost{handle, reason}});
}

std::vector<std::string> NetworkDiscovery::seen_before(Clock::time_point cutoff) const {
  std::vector<std::string> out;
  std::lock_guard lg(mutex_);
  for(const auto& [handle, entry] : peers_) {
    if(entry.last_seen < cutoff) out.push_back(handle);
  }
  return out;
}

std::optional<DeviceAppeared> NetworkDiscovery::lookup(const std::string& handle) const {
  std::lock_guard lg(mutex_);
  auto it = peers_.find(handle);
  if(it == peers_.end()) return std::nullopt;
  return it->second.event;
}

std::vector<DeviceAppeared> NetworkDiscovery::known() const {
  std::vector<DeviceAppeared> out;
  std::lock_guard lg(mutex_);
  for(const auto& [handle, entry] : peers_) out.push_back(entry.event);
  return out;
}

void NetworkDiscovery::connect(const std::string& handle) {
  auto d = dialer();
  if(!d) {
    log_warn(logger_.get(), "No dialer attached; cannot connect to {}", handle);
    return;
  }
  if(auto known_peer = lookup(handle)) {
    d->dial(handle, known_peer->host, known_peer->port);
    return;
  }
  if(auto hp = parse_host_port(handle)) {
    d->dial(handle, hp->host, hp->port);
    return;
  }
  log_warn(logger_.get(), "Unknown peer {}", handle);
}

void NetworkDiscovery::disconnect(const std::string& handle) {
  if(auto d = dialer()) d->hang_up(handle);
}
