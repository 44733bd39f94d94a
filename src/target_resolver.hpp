#pragma once
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "device_registry.hpp"
#include "log.hpp"
#include "model.hpp"
#include "pairing_coordinator.hpp"
#include "transfer.hpp"

struct Route {
  std::string recipient;   // device or relayed client handle
  std::string via;         // relay host for relayed clients
  std::string pairing_id;

  const std::string& channel() const { return via.empty() ? recipient : via; }
};

struct Resolution {
  enum class Outcome { DeliverNow, Queue, SaveLocal };
  Outcome outcome = Outcome::SaveLocal;
  std::vector<Route> routes;
  std::string queue_key;
};

const char* to_string(Resolution::Outcome outcome);

struct FlushedTransfer {
  PendingTransfer pending;
  Route route;
};

// Decides where a transfer goes and owns the pending queue. Pending entries
// are keyed by the target's stable id so they survive the target's handle
// changing across reconnects.
class TargetResolver {
public:
  TargetResolver(const DeviceRegistry& registry,
                 const PairingCoordinator& coordinator,
                 std::shared_ptr<Logger> logger = nullptr);

  // Pure routing decision; does not touch the queue.
  Resolution route(const std::string& origin, const TargetDescriptor& target) const;

  // route() plus enqueueing when the outcome is Queue.
  Resolution resolve(const std::string& origin, const Transfer& transfer);

  void enqueue(const std::string& origin, const Transfer& transfer, const std::string& queue_key);

  // Entries that became deliverable because this pairing went active, FIFO.
  std::vector<FlushedTransfer> take_ready(const Pairing& pairing);
  // Entries for a relayed client that just became reachable, FIFO.
  std::vector<FlushedTransfer> take_ready_relayed(const std::string& client_handle);

  std::vector<PendingTransfer> pending() const;
  std::size_t pending_count() const;
  bool drop_pending(const std::string& transfer_id);

  void attach_relayed_client(const std::string& client_handle, const std::string& host_handle);
  void detach_relayed_client(const std::string& client_handle);
  std::vector<std::string> detach_host(const std::string& host_handle);
  std::optional<std::string> relay_host_for(const std::string& client_handle) const;
  std::vector<std::pair<std::string, std::string>> relayed_clients() const;

private:
  std::string stable_key_for(const std::string& handle) const;
  std::string current_handle_for(const std::string& stable_key, const std::string& fallback) const;

  const DeviceRegistry& registry_;
  const PairingCoordinator& coordinator_;
  std::shared_ptr<Logger> logger_;

  mutable std::mutex mutex_;
  std::deque<PendingTransfer> queue_;
  uint64_t next_sequence_ = 1;
  std::unordered_map<std::string, std::string> relay_hosts_;   // client -> host
};
