#include "device_registry.hpp"

#include <algorithm>
#include <iterator>

DeviceRegistry::DeviceRegistry(EventBus* bus, std::shared_ptr<Logger> logger)
  : bus_(bus), logger_(std::move(logger)) {}

void DeviceRegistry::set_pairing_probe(PairingProbe probe) {
  std::lock_guard lg(mutex_);
  pairing_probe_ = std::move(probe);
}

Device DeviceRegistry::register_device(const std::string& stable_id,
                                       const std::string& display_name,
                                       const std::string& handle) {
  RegistryChanged event;
  event.change = RegistryChanged::Change::Registered;
  {
    std::lock_guard lg(mutex_);
    // A handle that used to belong to another identity is released first.
    auto prior = handle_index_.find(handle);
    if(prior != handle_index_.end() && prior->second != stable_id) {
      auto& old = records_[prior->second];
      old.aliases.erase(std::remove(old.aliases.begin(), old.aliases.end(), handle), old.aliases.end());
      if(old.device.handle == handle) old.device.online = false;
    }

    auto [it, inserted] = records_.try_emplace(stable_id);
    auto& record = it->second;
    if(inserted) {
      order_.push_back(stable_id);
    } else if(record.device.online && record.device.handle != handle) {
      record.aliases.push_back(record.device.handle);
      log_info(logger_.get(), "Device {} reconnected as {} (was {})", stable_id, handle, record.device.handle);
    } else if(record.device.handle != handle) {
      // Back from offline: only the handle it last went offline on stays indexed.
      if(record.previous_handle != handle) unindex_locked(record.previous_handle, stable_id);
      record.previous_handle = record.device.handle;
    }
    record.aliases.erase(std::remove(record.aliases.begin(), record.aliases.end(), handle), record.aliases.end());
    record.device.stable_id = stable_id;
    record.device.handle = handle;
    if(!display_name.empty()) record.device.display_name = display_name;
    if(record.device.display_name.empty()) record.device.display_name = stable_id;
    record.device.online = true;
    record.device.last_seen = SystemClock::now();
    handle_index_[handle] = stable_id;

    event.device = record.device;
    event.online = online_locked();
    log_info(logger_.get(), "Registered device {} ({}) as {}; {} online",
             record.device.display_name, stable_id, handle, event.online.size());
  }
  publish(event);
  return event.device;
}

std::optional<Device> DeviceRegistry::mark_offline(const std::string& handle) {
  RegistryChanged event;
  event.retired_handle = handle;
  {
    std::lock_guard lg(mutex_);
    auto idx = handle_index_.find(handle);
    if(idx == handle_index_.end()) return std::nullopt;
    auto rec_it = records_.find(idx->second);
    if(rec_it == records_.end()) {
      handle_index_.erase(idx);
      return std::nullopt;
    }
    auto& record = rec_it->second;

    auto alias = std::find(record.aliases.begin(), record.aliases.end(), handle);
    if(alias != record.aliases.end()) {
      // An older channel closed; the device itself is still reachable.
      record.aliases.erase(alias);
      handle_index_.erase(idx);
      log_debug(logger_.get(), "Retired alias {} of {}", handle, record.device.stable_id);
      event.change = RegistryChanged::Change::HandleReplaced;
    } else if(record.device.handle != handle) {
      handle_index_.erase(idx);
      return std::nullopt;
    } else if(!record.device.online) {
      return std::nullopt;
    } else if(!record.aliases.empty()) {
      handle_index_.erase(idx);
      auto chosen = record.aliases.end() - 1;
      if(pairing_probe_) {
        auto paired = std::find_if(record.aliases.rbegin(), record.aliases.rend(),
                                   [&](const std::string& h){ return pairing_probe_(h); });
        if(paired != record.aliases.rend()) chosen = std::prev(paired.base());
      }
      record.device.handle = *chosen;
      record.aliases.erase(chosen);
      log_info(logger_.get(), "Device {} fell back to handle {}", record.device.stable_id, record.device.handle);
      event.change = RegistryChanged::Change::HandleReplaced;
    } else {
      // The last handle stays indexed so sends addressed to it still map to this device.
      record.device.online = false;
      record.device.last_seen = SystemClock::now();
      event.change = RegistryChanged::Change::Offline;
      log_info(logger_.get(), "Device {} ({}) went offline", record.device.display_name, handle);
    }
    event.device = record.device;
    event.online = online_locked();
  }
  publish(event);
  return event.device;
}

bool DeviceRegistry::rename(const std::string& stable_id, const std::string& new_name) {
  if(new_name.empty()) return false;
  RegistryChanged event;
  event.change = RegistryChanged::Change::Renamed;
  {
    std::lock_guard lg(mutex_);
    auto it = records_.find(stable_id);
    if(it == records_.end()) return false;
    log_info(logger_.get(), "Renamed {} from '{}' to '{}'", stable_id, it->second.device.display_name, new_name);
    it->second.device.display_name = new_name;
    event.device = it->second.device;
    event.online = online_locked();
  }
  publish(event);
  return true;
}

std::vector<Device> DeviceRegistry::online_locked() const {
  std::vector<Device> out;
  for(const auto& id : order_) {
    const auto& record = records_.at(id);
    if(record.device.online) out.push_back(record.device);
  }
  return out;
}

std::vector<Device> DeviceRegistry::list_online() const {
  std::lock_guard lg(mutex_);
  return online_locked();
}

std::vector<Device> DeviceRegistry::list_known() const {
  std::lock_guard lg(mutex_);
  std::vector<Device> out;
  for(const auto& id : order_) out.push_back(records_.at(id).device);
  return out;
}

std::size_t DeviceRegistry::online_count() const {
  std::lock_guard lg(mutex_);
  return static_cast<std::size_t>(std::count_if(records_.begin(), records_.end(),
    [](const auto& entry){ return entry.second.device.online; }));
}

std::optional<Device> DeviceRegistry::find_by_handle(const std::string& handle) const {
  std::lock_guard lg(mutex_);
  auto idx = handle_index_.find(handle);
  if(idx == handle_index_.end()) return std::nullopt;
  auto it = records_.find(idx->second);
  if(it == records_.end()) return std::nullopt;
  return it->second.device;
}

std::optional<Device> DeviceRegistry::find_by_stable_id(const std::string& stable_id) const {
  std::lock_guard lg(mutex_);
  auto it = records_.find(stable_id);
  if(it == records_.end()) return std::nullopt;
  return it->second.device;
}

bool DeviceRegistry::is_online_handle(const std::string& handle) const {
  std::lock_guard lg(mutex_);
  auto idx = handle_index_.find(handle);
  if(idx == handle_index_.end()) return false;
  auto it = records_.find(idx->second);
  if(it == records_.end() || !it->second.device.online) return false;
  const auto& record = it->second;
  return record.device.handle == handle ||
         std::find(record.aliases.begin(), record.aliases.end(), handle) != record.aliases.end();
}

void DeviceRegistry::unindex_locked(const std::string& handle, const std::string& stable_id) {
  if(handle.empty()) return;
  auto idx = handle_index_.find(handle);
  if(idx == handle_index_.end() || idx->second != stable_id) return;
  const auto& record = records_.at(stable_id);
  if(record.device.handle == handle) return;
  if(std::find(record.aliases.begin(), record.aliases.end(), handle) != record.aliases.end()) return;
  handle_index_.erase(idx);
}

std::size_t DeviceRegistry::indexed_handles() const {
  std::lock_guard lg(mutex_);
  return handle_index_.size();
}

void DeviceRegistry::publish(RegistryChanged event) {
  if(bus_) bus_->publish(Event{std::move(event)});
}
