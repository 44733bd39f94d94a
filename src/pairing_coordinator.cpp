#include "pairing_coordinator.hpp"
#include "utils.hpp"

#include <algorithm>

PairingCoordinator::PairingCoordinator(const DeviceRegistry& registry,
                                       EventBus& bus,
                                       std::shared_ptr<Logger> logger)
  : registry_(registry), bus_(bus), logger_(std::move(logger)) {}

void PairingCoordinator::set_auto_pair(bool enabled) {
  std::lock_guard lg(mutex_);
  auto_pair_ = enabled;
}

bool PairingCoordinator::auto_pair() const {
  std::lock_guard lg(mutex_);
  return auto_pair_;
}

PairOutcome PairingCoordinator::pair(const std::string& initiator,
                                     const std::string& target,
                                     PairOrigin origin) {
  PairOutcome outcome;
  if(initiator == target) {
    outcome.error = "cannot pair a device with itself";
    return outcome;
  }
  // Registry lookups happen before taking our own lock.
  if(!registry_.is_online_handle(initiator)) {
    outcome.error = "device " + initiator + " is not online";
    return outcome;
  }
  if(!registry_.is_online_handle(target)) {
    outcome.error = "device " + target + " is not online";
    return outcome;
  }

  {
    std::lock_guard lg(mutex_);
    if(auto existing = active_between_locked(initiator, target)) {
      log_debug(logger_.get(), "Pairing {} already active for {} <-> {}", existing->id, initiator, target);
      outcome.status = PairOutcome::Status::AlreadyActive;
      outcome.pairing = existing;
      return outcome;
    }
    Pairing p;
    p.id = random_id("pair");
    p.device_a = initiator;
    p.device_b = target;
    p.status = PairingStatus::Active;
    p.created_at = SystemClock::now();
    pairings_.push_back(p);
    outcome.status = PairOutcome::Status::Created;
    outcome.pairing = p;
  }

  log_info(logger_.get(), "{} pairing {} between {} and {}",
           origin == PairOrigin::Automatic ? "Auto-paired" : "Created",
           outcome.pairing->id, initiator, target);
  bus_.publish(Event{PairingEstablished{*outcome.pairing, origin}});
  return outcome;
}

std::optional<Pairing> PairingCoordinator::terminate(const std::string& pairing_id,
                                                     const std::string& terminated_by,
                                                     const std::string& reason) {
  Pairing ended;
  {
    std::lock_guard lg(mutex_);
    auto it = std::find_if(pairings_.begin(), pairings_.end(),
                           [&](const Pairing& p){ return p.id == pairing_id; });
    if(it == pairings_.end()) return std::nullopt;
    ended = *it;
    pairings_.erase(it);
  }
  ended.status = PairingStatus::Terminated;
  ended.terminated_at = SystemClock::now();
  log_info(logger_.get(), "Terminated pairing {} ({}, by {})", ended.id, reason, terminated_by);
  bus_.publish(Event{PairingEnded{ended, terminated_by, reason}});
  return ended;
}

std::vector<Pairing> PairingCoordinator::terminate_all_for(const std::string& handle,
                                                           const std::string& reason) {
  std::vector<Pairing> ended;
  for(const auto& p : active_for(handle)) {
    if(auto done = terminate(p.id, handle, reason)) ended.push_back(*done);
  }
  return ended;
}

void PairingCoordinator::on_registry_changed(const RegistryChanged& event) {
  using Change = RegistryChanged::Change;
  const std::size_t count = event.online.size();
  std::size_t previous = 0;
  bool automatic = false;
  {
    std::lock_guard lg(mutex_);
    previous = last_online_count_;
    last_online_count_ = count;
    automatic = auto_pair_;
  }

  if(event.change == Change::Offline || event.change == Change::HandleReplaced) {
    terminate_all_for(event.retired_handle, "device lost");
  } else if(event.change == Change::Registered) {
    hand_over(event.device);
  }

  if(!automatic || count != 2 || previous == 2) return;
  const auto& first = event.online[0];
  const auto& second = event.online[1];
  if(active_between_devices(first.stable_id, second.stable_id)) return;
  // A newcomer initiates; otherwise the later arrival does.
  const bool first_new = event.change == Change::Registered && first.handle == event.device.handle;
  const auto& initiator = first_new ? first : second;
  const auto& partner = first_new ? second : first;
  pair(initiator.handle, partner.handle, PairOrigin::Automatic);
}

// Pairings still bound to an older handle of this device move to the new one,
// so the device pair keeps exactly one active pairing.
void PairingCoordinator::hand_over(const Device& device) {
  for(const auto& p : active_pairings()) {
    std::string stale;
    for(const auto& side : {p.device_a, p.device_b}) {
      if(side != device.handle && owner_of(side) == device.stable_id) stale = side;
    }
    if(stale.empty()) continue;
    const auto partner = p.partner_of(stale);
    if(partner == device.handle || owner_of(partner) == device.stable_id) continue;
    log_info(logger_.get(), "Moving pairing {} from {} to {}", p.id, stale, device.handle);
    terminate(p.id, stale, "handle replaced");
    pair(device.handle, partner, PairOrigin::Requested);
  }
}

std::string PairingCoordinator::owner_of(const std::string& handle) const {
  auto device = registry_.find_by_handle(handle);
  return device ? device->stable_id : std::string();
}

std::optional<Pairing> PairingCoordinator::active_between_devices(const std::string& stable_a,
                                                                  const std::string& stable_b) const {
  for(const auto& p : active_pairings()) {
    const auto a = owner_of(p.device_a);
    const auto b = owner_of(p.device_b);
    if((a == stable_a && b == stable_b) || (a == stable_b && b == stable_a)) return p;
  }
  return std::nullopt;
}

std::optional<Pairing> PairingCoordinator::active_between_locked(const std::string& a,
                                                                 const std::string& b) const {
  for(const auto& p : pairings_) {
    if((p.device_a == a && p.device_b == b) || (p.device_a == b && p.device_b == a)) return p;
  }
  return std::nullopt;
}

std::optional<Pairing> PairingCoordinator::active_between(const std::string& a, const std::string& b) const {
  std::lock_guard lg(mutex_);
  return active_between_locked(a, b);
}

std::optional<Pairing> PairingCoordinator::find(const std::string& pairing_id) const {
  std::lock_guard lg(mutex_);
  for(const auto& p : pairings_) {
    if(p.id == pairing_id) return p;
  }
  return std::nullopt;
}

std::vector<Pairing> PairingCoordinator::active_for(const std::string& handle) const {
  std::lock_guard lg(mutex_);
  std::vector<Pairing> out;
  for(const auto& p : pairings_) {
    if(p.involves(handle)) out.push_back(p);
  }
  return out;
}

std::vector<Pairing> PairingCoordinator::active_pairings() const {
  std::lock_guard lg(mutex_);
  return pairings_;
}

bool PairingCoordinator::has_active(const std::string& handle) const {
  std::lock_guard lg(mutex_);
  return std::any_of(pairings_.begin(), pairings_.end(),
                     [&](const Pairing& p){ return p.involves(handle); });
}
