#pragma once
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include <nlohmann/json.hpp>

#include "chunk_engine.hpp"
#include "device_registry.hpp"
#include "event_bus.hpp"
#include "log.hpp"
#include "pairing_coordinator.hpp"
#include "protocol.hpp"
#include "target_resolver.hpp"

// Where the hub's outgoing messages go. Sends to an unknown or closed handle
// report on_written(false).
class Outbox {
public:
  using WriteCallback = std::function<void(bool ok)>;

  virtual ~Outbox() = default;
  virtual void send(const std::string& handle, const nlohmann::json& message, WriteCallback on_written = nullptr) = 0;
  virtual void close(const std::string& handle) = 0;
};

// Signaling state for relay mode: registry, pairings, routing and the
// pending queue behind one state mutex. Every connected socket is one handle.
// Events raised by hub operations are handled with the state mutex held.
class RelayHub {
public:
  struct Options {
    ChunkLimits limits;
    std::chrono::milliseconds assembly_timeout{120000};
    bool auto_pair = true;
  };

  struct Stats {
    std::size_t connections = 0;
    std::size_t online_devices = 0;
    std::size_t active_pairings = 0;
    std::size_t pending_transfers = 0;
    std::size_t streams_in_flight = 0;
  };

  RelayHub(Outbox& outbox, Options options, std::shared_ptr<Logger> logger = nullptr);
  ~RelayHub();

  RelayHub(const RelayHub&) = delete;
  RelayHub& operator=(const RelayHub&) = delete;

  void on_connected(const std::string& handle);
  void on_message(const std::string& handle, const nlohmann::json& message);
  void on_disconnected(const std::string& handle);
  void expire_assemblies(std::chrono::steady_clock::time_point now = std::chrono::steady_clock::now());

  EventBus& bus() { return bus_; }
  std::vector<Device> online_devices() const;
  std::vector<Pairing> pairings() const;
  std::vector<PendingTransfer> pending() const;
  std::vector<std::pair<std::string, std::string>> relayed_clients() const;
  Stats stats() const;

private:
  struct Stream {
    std::string origin;
    std::string origin_name;
    TransferMeta meta;
    Resolution::Outcome outcome = Resolution::Outcome::SaveLocal;
    std::vector<Route> routes;
    uint64_t total_chunks = 0;
    uint64_t frames_seen = 0;
    bool dropped = false;
  };

  struct HubSend {
    std::shared_ptr<ChunkSender> sender;
    std::string channel;
    std::string pairing_id;
  };

  void on_event(const Event& event);
  void on_registry_changed(const RegistryChanged& event);
  void on_pairing_established(const PairingEstablished& event);
  void on_pairing_ended(const PairingEnded& event);

  void handle_message(const std::string& handle, const DeviceSetup& m);
  void handle_message(const std::string& handle, const PairRequest& m);
  void handle_message(const std::string& handle, const TerminateConnection& m);
  void handle_message(const std::string& handle, const FileTransferMessage& m);
  void handle_message(const std::string& handle, const DeviceNameUpdate& m);
  void handle_message(const std::string& handle, const RelayDevices& m);
  void handle_message(const std::string& handle, const FileReceivedAck& m);
  void handle_message(const std::string& handle, const ErrorMessage& m);
  template<typename T>
  void handle_message(const std::string& handle, const T& m);

  void handle_chunk(const std::string& handle, const ChunkFrame& frame, const nlohmann::json& raw);
  void open_stream(const std::string& handle, const ChunkFrame& frame);
  void finish_queued_stream(const std::string& handle, Stream stream, AssembledPayload payload);

  Device require_device(const std::string& handle) const;
  void send(const std::string& handle, const Message& message, Outbox::WriteCallback on_written = nullptr);
  void broadcast_online(const Message& message, const std::string& except = std::string());

  // Hands a transfer to one route: inline message or a hub-driven chunk stream.
  void deliver(const Transfer& transfer, const Route& route, const std::string& origin_name,
               std::function<void(bool ok)> on_done);
  void deliver_flushed(FlushedTransfer flushed);
  void notify_sent(const std::string& origin_stable_id, const TransferMeta& meta, std::size_t recipients);

  Outbox& outbox_;
  Options options_;
  std::shared_ptr<Logger> logger_;

  mutable std::recursive_mutex state_mutex_;
  EventBus bus_;
  DeviceRegistry registry_;
  PairingCoordinator coordinator_;
  TargetResolver resolver_;
  ProgressTracker progress_;
  ChunkAssembler assembler_;
  SubscriptionHandle subscription_ = 0;

  std::unordered_set<std::string> connections_;
  std::unordered_map<std::string, Stream> streams_;
  std::unordered_map<std::string, HubSend> hub_sends_;
};
