#pragma once
#include <asio.hpp>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "chunk_engine.hpp"
#include "connection.hpp"
#include "discovery.hpp"
#include "event_bus.hpp"
#include "file_store.hpp"
#include "log.hpp"
#include "protocol.hpp"
#include "transfer_inbox.hpp"
#include "transfer_node.hpp"
#include "transfer_store.hpp"

// Relay discovery strategy: one persistent connection to the relay, whose
// device list is the set of discovered devices. Reconnects indefinitely.
class RelayClient : public ConnectionHandler,
                    public DiscoveryProvider,
                    public TransferNode,
                    public std::enable_shared_from_this<RelayClient> {
public:
  struct Options {
    std::string relay_host = "127.0.0.1";
    uint16_t relay_port = 7420;
    std::string stable_id;
    std::string display_name;
    std::chrono::milliseconds reconnect_delay{3000};
    std::chrono::milliseconds sweep_interval{5000};
    std::chrono::milliseconds assembly_timeout{120000};
    ChunkLimits limits;
  };

  static std::shared_ptr<RelayClient> create(asio::io_context& io,
                                             Options options,
                                             std::shared_ptr<FileStore> files,
                                             std::shared_ptr<TransferStore> store,
                                             std::shared_ptr<Logger> logger = nullptr);
  ~RelayClient() override;

  // TransferNode
  void start() override;
  void stop() override;
  EventBus& bus() override { return bus_; }
  std::string local_handle() const override;
  std::vector<Device> devices() const override;
  std::vector<Device> relayed_clients() const override { return {}; }
  std::vector<Pairing> pairings() const override;
  std::vector<PendingTransfer> pending() const override;
  bool request_pair(const std::string& handle) override;
  bool end_pairing(const std::string& pairing_id) override;
  std::string send(Transfer transfer) override;
  void rename(const std::string& name) override;
  std::shared_ptr<TransferStore> store() const override { return store_; }

  // DiscoveryProvider
  void discover(Listener listener) override;
  void connect(const std::string& handle) override;
  void disconnect(const std::string& handle) override;

  // ConnectionHandler
  void on_message(const std::shared_ptr<Connection>& conn, const nlohmann::json& message) override;
  void on_closed(const std::shared_ptr<Connection>& conn) override;

  bool connected() const;
  std::size_t sends_in_flight() const;

private:
  RelayClient(asio::io_context& io, Options options, std::shared_ptr<FileStore> files,
              std::shared_ptr<TransferStore> store, std::shared_ptr<Logger> logger);

  void connect_to_relay();
  void schedule_reconnect();
  void schedule_sweep();
  bool send_message(const Message& message, Connection::WriteCallback on_written = nullptr);
  void emit(const DiscoveryEvent& event);
  void upsert_device(const Device& device);
  void remove_device(const std::string& handle);
  void fail_send(const std::string& transfer_id, ErrorKind kind, const std::string& reason);

  void handle_message(const DeviceListMessage& m);
  void handle_message(const PairAccepted& m);
  void handle_message(const ConnectionTerminated& m);
  void handle_message(const FileReceived& m);
  void handle_message(const ClipboardSync& m);
  void handle_message(const ChunkFrame& m);
  void handle_message(const FileSentConfirmation& m);
  void handle_message(const FileQueued& m);
  void handle_message(const FileSaved& m);
  void handle_message(const TransferFailedMessage& m);
  void handle_message(const TransferAbort& m);
  void handle_message(const NameUpdated& m);
  void handle_message(const ErrorMessage& m);
  void handle_message(const SetupRequired& m);
  template<typename T>
  void handle_message(const T& m);

  asio::io_context& io_;
  Options options_;
  std::shared_ptr<FileStore> files_;
  std::shared_ptr<TransferStore> store_;
  std::shared_ptr<Logger> logger_;

  EventBus bus_;
  TransferInbox inbox_;
  asio::steady_timer reconnect_timer_;
  asio::steady_timer sweep_timer_;
  std::atomic<bool> started_{false};

  mutable std::recursive_mutex mutex_;
  std::shared_ptr<Connection> conn_;
  bool connecting_ = false;
  std::string handle_;
  std::vector<Device> devices_;
  std::vector<Pairing> pairings_;
  std::unordered_map<std::string, Transfer> outgoing_;            // awaiting the relay's verdict
  std::unordered_map<std::string, std::shared_ptr<ChunkSender>> senders_;
  std::vector<PendingTransfer> queued_;
  uint64_t next_sequence_ = 1;
  Listener discovery_listener_;
};
