#pragma once
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "event_bus.hpp"
#include "log.hpp"
#include "model.hpp"

// One record per stable id. A device that reconnects under a new handle keeps
// its record; the previous handle stays as an alias until its channel closes.
class DeviceRegistry {
public:
  using PairingProbe = std::function<bool(const std::string& handle)>;

  explicit DeviceRegistry(EventBus* bus = nullptr, std::shared_ptr<Logger> logger = nullptr);

  Device register_device(const std::string& stable_id,
                         const std::string& display_name,
                         const std::string& handle);
  std::optional<Device> mark_offline(const std::string& handle);
  bool rename(const std::string& stable_id, const std::string& new_name);

  std::vector<Device> list_online() const;
  std::vector<Device> list_known() const;
  std::size_t online_count() const;

  // Resolves current handles and aliases.
  std::optional<Device> find_by_handle(const std::string& handle) const;
  std::optional<Device> find_by_stable_id(const std::string& stable_id) const;
  bool is_online_handle(const std::string& handle) const;
  std::size_t indexed_handles() const;

  // Consulted when the current handle drops and several aliases remain.
  void set_pairing_probe(PairingProbe probe);

private:
  struct Record {
    Device device;
    std::vector<std::string> aliases;
    std::string previous_handle;   // last handle of an offline spell, still indexed
  };

  std::vector<Device> online_locked() const;
  void unindex_locked(const std::string& handle, const std::string& stable_id);
  void publish(RegistryChanged event);

  EventBus* bus_ = nullptr;
  std::shared_ptr<Logger> logger_;
  mutable std::mutex mutex_;
  std::unordered_map<std::string, Record> records_;            // by stable id
  std::unordered_map<std::string, std::string> handle_index_;  // handle -> stable id
  std::vector<std::string> order_;                             // stable ids, first-seen order
  PairingProbe pairing_probe_;
};
