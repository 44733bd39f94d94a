#pragma once
#include <memory>
#include <string>
#include <vector>

#include "event_bus.hpp"
#include "model.hpp"
#include "transfer.hpp"
#include "transfer_store.hpp"

// A device endpoint as seen by the engine and CLI: relay client or direct node.
class TransferNode {
public:
  virtual ~TransferNode() = default;

  virtual void start() = 0;
  virtual void stop() = 0;

  virtual EventBus& bus() = 0;
  virtual std::string local_handle() const = 0;
  virtual std::vector<Device> devices() const = 0;
  virtual std::vector<Device> relayed_clients() const = 0;
  virtual std::vector<Pairing> pairings() const = 0;
  virtual std::vector<PendingTransfer> pending() const = 0;

  virtual bool request_pair(const std::string& handle) = 0;
  virtual bool end_pairing(const std::string& pairing_id) = 0;
  // Returns the transfer id. The outcome arrives on the bus.
  virtual std::string send(Transfer transfer) = 0;
  virtual void rename(const std::string& name) = 0;

  virtual std::shared_ptr<TransferStore> store() const = 0;
};
