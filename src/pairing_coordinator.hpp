#pragma once
#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "device_registry.hpp"
#include "event_bus.hpp"
#include "log.hpp"
#include "model.hpp"

struct PairOutcome {
  enum class Status { Created, AlreadyActive, Rejected };
  Status status = Status::Rejected;
  std::optional<Pairing> pairing;
  std::string error;

  bool ok() const { return status != Status::Rejected; }
};

// Owns every Pairing record. Reads the registry, never writes it.
// Pairings are unordered: pair(A,B) and pair(B,A) name the same pairing.
class PairingCoordinator {
public:
  PairingCoordinator(const DeviceRegistry& registry,
                     EventBus& bus,
                     std::shared_ptr<Logger> logger = nullptr);

  PairOutcome pair(const std::string& initiator,
                   const std::string& target,
                   PairOrigin origin = PairOrigin::Requested);

  std::optional<Pairing> terminate(const std::string& pairing_id,
                                   const std::string& terminated_by,
                                   const std::string& reason = "requested");
  std::vector<Pairing> terminate_all_for(const std::string& handle,
                                         const std::string& reason);

  // Auto-pair when the online count lands on two, teardown when a handle is
  // retired, handover when a device re-registers under a new handle.
  void on_registry_changed(const RegistryChanged& event);

  std::optional<Pairing> find(const std::string& pairing_id) const;
  std::optional<Pairing> active_between(const std::string& a, const std::string& b) const;
  // Same, but by stable id, whatever handles the pairing was made on.
  std::optional<Pairing> active_between_devices(const std::string& stable_a,
                                                const std::string& stable_b) const;
  std::vector<Pairing> active_for(const std::string& handle) const;
  std::vector<Pairing> active_pairings() const;
  bool has_active(const std::string& handle) const;

  void set_auto_pair(bool enabled);
  bool auto_pair() const;

private:
  std::optional<Pairing> active_between_locked(const std::string& a, const std::string& b) const;
  std::string owner_of(const std::string& handle) const;
  void hand_over(const Device& device);

  const DeviceRegistry& registry_;
  EventBus& bus_;
  std::shared_ptr<Logger> logger_;
  mutable std::mutex mutex_;
  std::vector<Pairing> pairings_;   // active ones; terminated records are dropped
  bool auto_pair_ = true;
  std::size_t last_online_count_ = 0;
};
