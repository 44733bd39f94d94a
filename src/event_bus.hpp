#pragma once
#include <cstddef>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include "errors.hpp"
#include "log.hpp"
#include "model.hpp"

struct RegistryChanged {
  enum class Change { Registered, Offline, HandleReplaced, Renamed };
  Change change = Change::Registered;
  Device device;
  std::string retired_handle;   // set for Offline and HandleReplaced
  std::vector<Device> online;
};

enum class PairOrigin { Requested, Automatic, Link };

struct PairingEstablished {
  Pairing pairing;
  PairOrigin origin = PairOrigin::Requested;
};

struct PairingEnded {
  Pairing pairing;
  std::string terminated_by;
  std::string reason;
};

struct TransferQueued {
  TransferMeta meta;
  std::string target_key;
};

struct TransferSavedLocal {
  TransferMeta meta;
};

struct TransferSent {
  TransferMeta meta;
  std::size_t recipient_count = 0;
};

struct TransferReceived {
  TransferMeta meta;
  std::filesystem::path stored_path;  // empty for clipboard text
  std::string text;                   // clipboard text only
};

struct TransferFailed {
  std::string transfer_id;
  ErrorKind kind = ErrorKind::ChannelLost;
  std::string reason;
};

struct ChunkProgressed {
  ChunkProgress progress;
  int percent = 0;
};

struct DeviceListUpdated {
  std::vector<Device> devices;
};

struct PeerError {
  std::string handle;
  ErrorKind kind = ErrorKind::Protocol;
  std::string message;
};

using Event = std::variant<RegistryChanged,
                           PairingEstablished,
                           PairingEnded,
                           TransferQueued,
                           TransferSavedLocal,
                           TransferSent,
                           TransferReceived,
                           TransferFailed,
                           ChunkProgressed,
                           DeviceListUpdated,
                           PeerError>;

using SubscriptionHandle = std::size_t;

// Listeners run synchronously on the publishing thread, in subscription order.
// A listener may publish further events; they are delivered depth first.
class EventBus {
public:
  using Listener = std::function<void(const Event&)>;

  explicit EventBus(std::shared_ptr<Logger> logger = nullptr);

  SubscriptionHandle subscribe(Listener listener);
  void unsubscribe(SubscriptionHandle handle);
  void publish(const Event& event);

  std::size_t subscriber_count() const;

private:
  std::shared_ptr<Logger> logger_;
  mutable std::mutex mutex_;
  std::vector<std::pair<SubscriptionHandle, std::shared_ptr<Listener>>> listeners_;
  SubscriptionHandle next_handle_ = 1;
};
