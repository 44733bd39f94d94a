#include "target_resolver.hpp"

#include <algorithm>

namespace {

const std::string kRelayKeyPrefix = "relay:";
const std::string kHandleKeyPrefix = "handle:";

} // namespace

const char* to_string(Resolution::Outcome outcome) {
  switch(outcome) {
    case Resolution::Outcome::DeliverNow: return "deliver";
    case Resolution::Outcome::Queue: return "queue";
    case Resolution::Outcome::SaveLocal: return "save-local";
  }
  return "save-local";
}

TargetResolver::TargetResolver(const DeviceRegistry& registry,
                               const PairingCoordinator& coordinator,
                               std::shared_ptr<Logger> logger)
  : registry_(registry), coordinator_(coordinator), logger_(std::move(logger)) {}

std::string TargetResolver::stable_key_for(const std::string& handle) const {
  if(auto device = registry_.find_by_handle(handle)) {
    if(!device->stable_id.empty()) return device->stable_id;
  }
  return kHandleKeyPrefix + handle;
}

std::string TargetResolver::current_handle_for(const std::string& stable_key,
                                               const std::string& fallback) const {
  if(stable_key.rfind(kHandleKeyPrefix, 0) == 0) return stable_key.substr(kHandleKeyPrefix.size());
  if(auto device = registry_.find_by_stable_id(stable_key)) {
    if(device->online) return device->handle;
  }
  return fallback;
}

Resolution TargetResolver::route(const std::string& origin, const TargetDescriptor& target) const {
  Resolution r;
  switch(target.kind) {
    case TargetDescriptor::Kind::Local:
      r.outcome = Resolution::Outcome::SaveLocal;
      return r;

    case TargetDescriptor::Kind::Device: {
      std::string recipient = target.handle;
      auto pairing = coordinator_.active_between(origin, recipient);
      if(!pairing) {
        // The target may have reconnected under a newer handle.
        if(auto device = registry_.find_by_handle(recipient)) {
          if(device->online && device->handle != recipient) {
            pairing = coordinator_.active_between(origin, device->handle);
            if(pairing) recipient = device->handle;
          }
        }
      }
      if(pairing) {
        r.outcome = Resolution::Outcome::DeliverNow;
        r.routes.push_back(Route{recipient, std::string(), pairing->id});
      } else {
        r.outcome = Resolution::Outcome::Queue;
        r.queue_key = stable_key_for(target.handle);
      }
      return r;
    }

    case TargetDescriptor::Kind::RelayedClient: {
      auto host = relay_host_for(target.handle);
      if(host) {
        if(*host == origin) {
          r.outcome = Resolution::Outcome::DeliverNow;
          r.routes.push_back(Route{target.handle, std::string(), std::string()});
          return r;
        }
        if(auto pairing = coordinator_.active_between(origin, *host)) {
          r.outcome = Resolution::Outcome::DeliverNow;
          r.routes.push_back(Route{target.handle, *host, pairing->id});
          return r;
        }
      }
      r.outcome = Resolution::Outcome::Queue;
      r.queue_key = kRelayKeyPrefix + target.handle;
      return r;
    }

    case TargetDescriptor::Kind::Broadcast: {
      for(const auto& p : coordinator_.active_for(origin)) {
        r.routes.push_back(Route{p.partner_of(origin), std::string(), p.id});
      }
      r.outcome = r.routes.empty() ? Resolution::Outcome::SaveLocal : Resolution::Outcome::DeliverNow;
      return r;
    }
  }
  return r;
}

Resolution TargetResolver::resolve(const std::string& origin, const Transfer& transfer) {
  auto r = route(origin, transfer.meta.target);
  log_info(logger_.get(), "Transfer {} ({}) from {} to {}: {}",
           transfer.meta.id, transfer.meta.filename, origin,
           transfer.meta.target.to_string(), to_string(r.outcome));
  if(r.outcome == Resolution::Outcome::Queue) {
    enqueue(origin, transfer, r.queue_key);
  }
  return r;
}

void TargetResolver::enqueue(const std::string& origin,
                             const Transfer& transfer,
                             const std::string& queue_key) {
  PendingTransfer entry;
  entry.transfer = transfer;
  entry.transfer.meta.direction = TransferDirection::Queued;
  entry.origin_handle = origin;
  entry.origin_stable_id = stable_key_for(origin);
  entry.target_key = queue_key;
  entry.queued_at = SystemClock::now();
  std::lock_guard lg(mutex_);
  entry.sequence = next_sequence_++;
  queue_.push_back(std::move(entry));
  log_info(logger_.get(), "Queued {} for {} ({} pending)", transfer.meta.id, queue_key, queue_.size());
}

std::vector<FlushedTransfer> TargetResolver::take_ready(const Pairing& pairing) {
  const std::string key_a = stable_key_for(pairing.device_a);
  const std::string key_b = stable_key_for(pairing.device_b);
  const std::string handle_key_a = kHandleKeyPrefix + pairing.device_a;
  const std::string handle_key_b = kHandleKeyPrefix + pairing.device_b;

  auto recipient_for = [&](const PendingTransfer& e) -> std::optional<std::string> {
    if((e.target_key == key_b || e.target_key == handle_key_b) &&
       (e.origin_stable_id == key_a || e.origin_handle == pairing.device_a)) {
      return pairing.device_b;
    }
    if((e.target_key == key_a || e.target_key == handle_key_a) &&
       (e.origin_stable_id == key_b || e.origin_handle == pairing.device_b)) {
      return pairing.device_a;
    }
    return std::nullopt;
  };

  std::vector<FlushedTransfer> out;
  {
    std::lock_guard lg(mutex_);
    for(auto it = queue_.begin(); it != queue_.end();) {
      std::optional<Route> route;
      if(auto recipient = recipient_for(*it)) {
        route = Route{*recipient, std::string(), pairing.id};
      } else if(it->target_key.rfind(kRelayKeyPrefix, 0) == 0) {
        const auto client = it->target_key.substr(kRelayKeyPrefix.size());
        auto host = relay_hosts_.find(client);
        if(host != relay_hosts_.end() && pairing.involves(host->second)) {
          const auto& other = pairing.partner_of(host->second);
          if(it->origin_stable_id == stable_key_for(other) || it->origin_handle == other) {
            route = Route{client, host->second, pairing.id};
          }
        }
      }
      if(route) {
        out.push_back(FlushedTransfer{std::move(*it), *route});
        it = queue_.erase(it);
      } else {
        ++it;
      }
    }
  }
  if(!out.empty()) {
    log_info(logger_.get(), "Flushing {} queued transfer(s) on pairing {}", out.size(), pairing.id);
  }
  return out;
}

std::vector<FlushedTransfer> TargetResolver::take_ready_relayed(const std::string& client_handle) {
  const std::string key = kRelayKeyPrefix + client_handle;
  std::vector<PendingTransfer> candidates;
  {
    std::lock_guard lg(mutex_);
    for(const auto& e : queue_) {
      if(e.target_key == key) candidates.push_back(e);
    }
  }
  std::vector<FlushedTransfer> out;
  for(auto& e : candidates) {
    const auto origin = current_handle_for(e.origin_stable_id, e.origin_handle);
    auto r = route(origin, TargetDescriptor::relayed(client_handle));
    if(r.outcome != Resolution::Outcome::DeliverNow) continue;
    std::lock_guard lg(mutex_);
    auto it = std::find_if(queue_.begin(), queue_.end(),
                           [&](const PendingTransfer& q){ return q.sequence == e.sequence; });
    if(it == queue_.end()) continue;
    queue_.erase(it);
    out.push_back(FlushedTransfer{std::move(e), r.routes.front()});
  }
  if(!out.empty()) {
    log_info(logger_.get(), "Flushing {} queued transfer(s) for relayed client {}", out.size(), client_handle);
  }
  return out;
}

std::vector<PendingTransfer> TargetResolver::pending() const {
  std::lock_guard lg(mutex_);
  return std::vector<PendingTransfer>(queue_.begin(), queue_.end());
}

std::size_t TargetResolver::pending_count() const {
  std::lock_guard lg(mutex_);
  return queue_.size();
}

bool TargetResolver::drop_pending(const std::string& transfer_id) {
  std::lock_guard lg(mutex_);
  auto it = std::find_if(queue_.begin(), queue_.end(),
                         [&](const PendingTransfer& e){ return e.transfer.meta.id == transfer_id; });
  if(it == queue_.end()) return false;
  queue_.erase(it);
  return true;
}

void TargetResolver::attach_relayed_client(const std::string& client_handle, const std::string& host_handle) {
  std::lock_guard lg(mutex_);
  relay_hosts_[client_handle] = host_handle;
  log_debug(logger_.get(), "Relayed client {} attached via {}", client_handle, host_handle);
}

void TargetResolver::detach_relayed_client(const std::string& client_handle) {
  std::lock_guard lg(mutex_);
  relay_hosts_.erase(client_handle);
}

std::vector<std::string> TargetResolver::detach_host(const std::string& host_handle) {
  std::vector<std::string> detached;
  std::lock_guard lg(mutex_);
  for(auto it = relay_hosts_.begin(); it != relay_hosts_.end();) {
    if(it->second == host_handle) {
      detached.push_back(it->first);
      it = relay_hosts_.erase(it);
    } else {
      ++it;
    }
  }
  return detached;
}

std::optional<std::string> TargetResolver::relay_host_for(const std::string& client_handle) const {
  std::lock_guard lg(mutex_);
  auto it = relay_hosts_.find(client_handle);
  if(it == relay_hosts_.end()) return std::nullopt;
  return it->second;
}

std::vector<std::pair<std::string, std::string>> TargetResolver::relayed_clients() const {
  std::lock_guard lg(mutex_);
  return std::vector<std::pair<std::string, std::string>>(relay_hosts_.begin(), relay_hosts_.end());
}
